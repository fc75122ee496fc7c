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

#include <iosfwd>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <drillpress/error.h>

namespace drillpress {

enum class scan_errc {
  unsupported_platform = 1,
  unsupported_filesystem,
};

enum class scan_error_kind {
  io,
  raw,
  unsupported_platform,
  unsupported_filesystem,
};

std::error_category const& scan_category() noexcept;

/**
 * Category for platform failures that did not leave a usable OS error
 * code behind. The value is whatever the platform returned.
 */
std::error_category const& raw_error_category() noexcept;

inline std::error_code make_error_code(scan_errc e) noexcept {
  return {static_cast<int>(e), scan_category()};
}

inline std::error_code make_raw_error_code(int value) noexcept {
  return {value, raw_error_category()};
}

// `ec` must hold an error
scan_error_kind classify(std::error_code const& ec) noexcept;

std::string_view scan_error_kind_name(scan_error_kind kind);

std::ostream& operator<<(std::ostream& os, scan_error_kind kind);

class scan_error : public error {
 public:
  scan_error(std::string_view s, std::error_code ec, source_location loc);

  char const* what() const noexcept override { return syserr_.what(); }
  std::error_code const& code() const noexcept { return syserr_.code(); }
  scan_error_kind kind() const noexcept { return classify(code()); }

 private:
  std::system_error syserr_;
};

} // namespace drillpress

template <>
struct std::is_error_code_enum<drillpress::scan_errc> : std::true_type {};
