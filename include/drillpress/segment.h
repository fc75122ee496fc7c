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

#include <cassert>
#include <iosfwd>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <drillpress/types.h>

namespace drillpress {

enum class segment_type {
  hole, // guaranteed to read as zeroes, not allocated
  data, // allocated, may still contain zeroes
};

constexpr segment_type opposite(segment_type t) noexcept {
  return t == segment_type::hole ? segment_type::data : segment_type::hole;
}

std::string_view segment_type_name(segment_type t);

std::ostream& operator<<(std::ostream& os, segment_type t);

/**
 * A typed, half-open byte range `[start, end)` of a file.
 */
class segment {
 public:
  segment() = default;
  segment(segment_type type, file_off_t start, file_off_t end)
      : type_{type}
      , start_{start}
      , end_{end} {
    assert(start <= end);
  }

  segment_type type() const noexcept { return type_; }

  file_off_t start() const noexcept { return start_; }
  file_off_t end() const noexcept { return end_; }
  file_size_t size() const noexcept { return end_ - start_; }

  bool empty() const noexcept { return start_ == end_; }

  bool is_hole() const noexcept { return type_ == segment_type::hole; }
  bool is_data() const noexcept { return type_ == segment_type::data; }

  bool contains(file_off_t offset) const noexcept {
    return start_ <= offset && offset < end_;
  }

  std::string to_string() const;

  friend bool operator==(segment const&, segment const&) = default;

 private:
  segment_type type_{segment_type::hole};
  file_off_t start_{0};
  file_off_t end_{0};
};

std::ostream& operator<<(std::ostream& os, segment const& seg);

} // namespace drillpress

template <>
struct fmt::formatter<drillpress::segment_type>
    : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(drillpress::segment_type t, FormatContext& ctx) const {
    return formatter<std::string_view>::format(
        drillpress::segment_type_name(t), ctx);
  }
};

template <>
struct fmt::formatter<drillpress::segment> : formatter<std::string> {
  template <typename FormatContext>
  auto format(drillpress::segment const& seg, FormatContext& ctx) const {
    return formatter<std::string>::format(seg.to_string(), ctx);
  }
};
