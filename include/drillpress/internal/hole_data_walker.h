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

#include <algorithm>
#include <concepts>
#include <optional>
#include <utility>
#include <system_error>
#include <vector>

#include <drillpress/segment.h>

#include <drillpress/internal/segment_builder.h>

namespace drillpress::internal {

enum class seek_whence {
  hole,
  data,
};

/**
 * A cursor over a file that can find the next hole or data offset.
 *
 * `seek()` returns the first offset at or after `offset` where a region of
 * the requested kind starts. It returns `std::nullopt` with a clear error
 * code if there is no such region, and `std::nullopt` with `ec` set on
 * failure. `size()` returns the current length of the file.
 */
template <typename T>
concept hole_data_cursor =
    requires(T& cur, file_off_t off, seek_whence wh, std::error_code& ec) {
      { cur.seek(off, wh, ec) } -> std::same_as<std::optional<file_off_t>>;
      { cur.size(ec) } -> std::same_as<file_size_t>;
    };

/**
 * Reconstruct the canonical segment sequence of a file by alternately
 * seeking for holes and data.
 *
 * Transitions beyond the file length (the file grew while walking) are
 * clamped. A transition that does not advance means the region at the
 * current offset is of the opposite kind; two of those in a row mean the
 * cursor is not making progress and the walk fails with `io_error`.
 */
template <hole_data_cursor Cursor>
std::vector<segment> walk_holes_and_data(Cursor& cur, std::error_code& ec) {
  ec.clear();

  auto const end = cur.size(ec);

  if (ec || end == 0) {
    return {};
  }

  auto const first_hole = cur.seek(0, seek_whence::hole, ec);

  if (ec) {
    return {};
  }

  segment_builder builder;
  file_off_t offset = first_hole ? std::min<file_off_t>(*first_hole, end) : end;

  builder.add(segment_type::data, 0, offset);

  auto type = segment_type::hole;
  bool stalled = false;

  while (offset < end) {
    auto const next = cur.seek(
        offset,
        type == segment_type::hole ? seek_whence::data : seek_whence::hole, ec);

    if (ec) {
      return {};
    }

    if (!next) {
      builder.add(type, offset, end);
      break;
    }

    auto const pos = std::min<file_off_t>(*next, end);

    if (pos <= offset) {
      if (stalled) {
        ec = std::make_error_code(std::errc::io_error);
        return {};
      }
      stalled = true;
    } else {
      builder.add(type, offset, pos);
      offset = pos;
      stalled = false;
    }

    type = opposite(type);
  }

  return std::move(builder).build();
}

} // namespace drillpress::internal
