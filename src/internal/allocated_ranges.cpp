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

#include <algorithm>
#include <utility>

#include <drillpress/internal/allocated_ranges.h>
#include <drillpress/internal/segment_builder.h>

namespace drillpress::internal {

std::vector<segment>
segments_from_allocated_ranges(std::span<allocated_range const> ranges,
                               file_size_t size) {
  segment_builder builder;
  file_off_t prev_end = 0;

  for (auto const& r : ranges) {
    if (prev_end >= size) {
      break;
    }

    auto const start = std::clamp<file_off_t>(r.offset, prev_end, size);
    auto const end = std::min<file_off_t>(r.offset + r.length, size);

    if (end <= start) {
      continue;
    }

    builder.add(segment_type::hole, prev_end, start);
    builder.add(segment_type::data, start, end);
    prev_end = end;
  }

  builder.add(segment_type::hole, prev_end, size);

  return std::move(builder).build();
}

} // namespace drillpress::internal
