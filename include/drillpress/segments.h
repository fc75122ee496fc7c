/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of drillpress.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the “Software”), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include <ranges>
#include <span>

#include <drillpress/segment.h>

namespace drillpress {

// Lazy views selecting segments of one type, in their original order.

inline auto hole_segments(std::span<segment const> segs) {
  return segs | std::views::filter([](segment const& s) { return s.is_hole(); });
}

inline auto data_segments(std::span<segment const> segs) {
  return segs | std::views::filter([](segment const& s) { return s.is_data(); });
}

inline auto segments_of_type(std::span<segment const> segs, segment_type type) {
  return segs | std::views::filter(
                    [type](segment const& s) { return s.type() == type; });
}

template <std::ranges::input_range R>
file_size_t total_size(R&& segs) {
  file_size_t total{0};
  for (segment const& s : segs) {
    total += s.size();
  }
  return total;
}

} // namespace drillpress
