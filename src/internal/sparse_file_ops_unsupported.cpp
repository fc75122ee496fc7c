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

#include <drillpress/scan_error.h>

#include <drillpress/internal/sparse_file_ops.h>

namespace drillpress::internal {

namespace {

class sparse_file_ops_unsupported : public sparse_file_ops {
 public:
  // Files can still be opened, only the sparse operations fail.
  std::any open(std::filesystem::path const& path, file_access /*access*/,
                std::error_code& ec) const override {
    ec.clear();

    if (!std::filesystem::is_regular_file(path, ec)) {
      if (!ec) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
      }
      return {};
    }

    return path;
  }

  void close(std::any const& handle, std::error_code& ec) const override {
    ec.clear();

    if (!std::any_cast<std::filesystem::path>(&handle)) {
      ec = std::make_error_code(std::errc::bad_file_descriptor);
    }
  }

  std::vector<segment>
  scan_chunks(std::any const& /*handle*/, sparse_file_options const& /*opts*/,
              std::error_code& ec) const override {
    ec = make_error_code(scan_errc::unsupported_platform);
    return {};
  }

  void drill_hole(std::any const& /*handle*/, file_off_t /*start*/,
                  file_off_t /*end*/, std::error_code& ec) const override {
    ec = make_error_code(scan_errc::unsupported_platform);
  }
};

} // namespace

sparse_file_ops const& get_unsupported_sparse_file_ops() {
  static sparse_file_ops_unsupported const ops;
  return ops;
}

#ifdef DRILLPRESS_NO_NATIVE_BACKEND
sparse_file_ops const& get_native_sparse_file_ops() {
  return get_unsupported_sparse_file_ops();
}
#endif

} // namespace drillpress::internal
