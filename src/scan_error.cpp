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

#include <ostream>
#include <string>

#include <folly/lang/Assume.h>

#include <fmt/format.h>

#include <drillpress/scan_error.h>
#include <drillpress/util.h>

namespace drillpress {

namespace {

class scan_category_impl : public std::error_category {
 public:
  char const* name() const noexcept override { return "drillpress"; }

  std::string message(int ev) const override {
    switch (static_cast<scan_errc>(ev)) {
    case scan_errc::unsupported_platform:
      return "sparse files are not supported on this platform";
    case scan_errc::unsupported_filesystem:
      return "sparse files are not supported by this filesystem";
    }
    return fmt::format("unknown drillpress error {}", ev);
  }
};

class raw_error_category_impl : public std::error_category {
 public:
  char const* name() const noexcept override { return "drillpress.raw"; }

  std::string message(int ev) const override {
    return fmt::format("raw platform error {}", ev);
  }
};

} // namespace

std::error_category const& scan_category() noexcept {
  static scan_category_impl const cat;
  return cat;
}

std::error_category const& raw_error_category() noexcept {
  static raw_error_category_impl const cat;
  return cat;
}

scan_error_kind classify(std::error_code const& ec) noexcept {
  DRILLPRESS_CHECK(ec, "cannot classify a success code");

  if (ec.category() == scan_category()) {
    switch (static_cast<scan_errc>(ec.value())) {
    case scan_errc::unsupported_platform:
      return scan_error_kind::unsupported_platform;
    case scan_errc::unsupported_filesystem:
      return scan_error_kind::unsupported_filesystem;
    }
    // unknown values in our own category have no OS error behind them
    return scan_error_kind::raw;
  }

  if (ec.category() == raw_error_category()) {
    return scan_error_kind::raw;
  }

  return scan_error_kind::io;
}

std::string_view scan_error_kind_name(scan_error_kind kind) {
  switch (kind) {
  case scan_error_kind::io:
    return "io";
  case scan_error_kind::raw:
    return "raw";
  case scan_error_kind::unsupported_platform:
    return "unsupported_platform";
  case scan_error_kind::unsupported_filesystem:
    return "unsupported_filesystem";
  }
  folly::assume_unreachable();
}

std::ostream& operator<<(std::ostream& os, scan_error_kind kind) {
  return os << scan_error_kind_name(kind);
}

scan_error::scan_error(std::string_view s, std::error_code ec,
                       source_location loc)
    : error{loc}
    , syserr_{ec, fmt::format("[{}:{}] {}", basename(loc.file_name()),
                              loc.line(), s)} {}

} // namespace drillpress
