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

#include <concepts>
#include <span>
#include <system_error>
#include <vector>

#include <drillpress/segment.h>

namespace drillpress::internal {

// an allocated byte range as reported by FSCTL_QUERY_ALLOCATED_RANGES
struct allocated_range {
  file_off_t offset{0};
  file_size_t length{0};
};

/**
 * Turn an ordered list of allocated ranges into the canonical segment
 * sequence covering `[0, size)`.
 *
 * Gaps between ranges become holes, adjacent or overlapping ranges are
 * merged and anything beyond `size` is clipped.
 */
std::vector<segment>
segments_from_allocated_ranges(std::span<allocated_range const> ranges,
                               file_size_t size);

/**
 * A single page query for the allocated ranges in `[start, start + length)`.
 *
 * Fills `page` with at most one page of ranges and returns `true` if the
 * page was truncated and more ranges follow (`ERROR_MORE_DATA`). On failure
 * it sets `ec`.
 */
template <typename T>
concept allocated_range_query =
    requires(T& q, file_off_t start, file_size_t length,
             std::vector<allocated_range>& page, std::error_code& ec) {
      { q(start, length, page, ec) } -> std::same_as<bool>;
    };

/**
 * Collect all allocated ranges in `[0, size)`, issuing further queries
 * after the end of the last range for as long as pages are truncated.
 *
 * Paging stops early if a truncated page is empty or does not advance
 * past the previous query offset.
 */
template <allocated_range_query Query>
std::vector<allocated_range>
collect_allocated_ranges(Query& query, file_size_t size, std::error_code& ec) {
  ec.clear();

  std::vector<allocated_range> result;
  std::vector<allocated_range> page;
  file_off_t next_start{0};

  while (next_start < size) {
    page.clear();

    bool const more = query(next_start, size - next_start, page, ec);

    if (ec) {
      return {};
    }

    result.insert(result.end(), page.begin(), page.end());

    if (!more || page.empty()) {
      break;
    }

    auto const& last = page.back();
    auto const last_end = last.offset + last.length;

    if (last_end <= next_start) {
      break;
    }

    next_start = last_end;
  }

  return result;
}

/**
 * Scan a file given its length, its sparse attribute and an allocated
 * range query. Files without the sparse attribute are reported as a
 * single data segment without querying.
 */
template <allocated_range_query Query>
std::vector<segment> scan_allocated_ranges(Query& query, file_size_t size,
                                           bool sparse, std::error_code& ec) {
  ec.clear();

  if (size == 0) {
    return {};
  }

  if (!sparse) {
    return {segment{segment_type::data, 0, size}};
  }

  auto const ranges = collect_allocated_ranges(query, size, ec);

  if (ec) {
    return {};
  }

  return segments_from_allocated_ranges(ranges, size);
}

} // namespace drillpress::internal
