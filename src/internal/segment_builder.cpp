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

#include <utility>

#include <fmt/format.h>

#include <drillpress/error.h>

#include <drillpress/internal/segment_builder.h>

namespace drillpress::internal {

void segment_builder::add(segment_type type, file_off_t start,
                          file_off_t end) {
  DRILLPRESS_CHECK(start <= end,
                   fmt::format("inverted segment [{}, {})", start, end));
  DRILLPRESS_CHECK(start == this->end(),
                   fmt::format("segment at {} does not continue at {}", start,
                               this->end()));

  if (start == end) {
    return;
  }

  if (!segments_.empty() && segments_.back().type() == type) {
    auto const& last = segments_.back();
    segments_.back() = segment{type, last.start(), end};
    return;
  }

  segments_.emplace_back(type, start, end);
}

file_off_t segment_builder::end() const noexcept {
  return segments_.empty() ? 0 : segments_.back().end();
}

std::vector<segment> segment_builder::build() && {
  return std::move(segments_);
}

} // namespace drillpress::internal
