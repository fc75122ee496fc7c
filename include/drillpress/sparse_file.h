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

#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

#include <drillpress/segment.h>
#include <drillpress/sparse_file_options.h>

namespace drillpress {

class logger;

namespace internal {

class sparse_file_ops;

}

/**
 * An open file whose hole/data layout can be scanned and modified.
 *
 * The file is opened on construction and closed on destruction. Opening
 * failures throw `scan_error`. All other operations come in two flavours:
 * one reporting errors through a `std::error_code` and one throwing
 * `scan_error`.
 */
class sparse_file {
 public:
  sparse_file(logger& lgr, std::filesystem::path const& path,
              file_access access = file_access::read_only,
              sparse_file_options const& opts = {});

  sparse_file(logger& lgr, internal::sparse_file_ops const& ops,
              std::filesystem::path const& path,
              file_access access = file_access::read_only,
              sparse_file_options const& opts = {});

  ~sparse_file();

  sparse_file(sparse_file&&) noexcept;
  sparse_file& operator=(sparse_file&&) noexcept;

  /**
   * Determine the layout of the file.
   *
   * Returns the segments ordered by offset, covering the whole file with
   * no two adjacent segments of the same type. An empty file has no
   * segments. Moves the file position.
   */
  std::vector<segment> scan_chunks(std::error_code& ec) const {
    return impl_->scan_chunks(&ec);
  }

  std::vector<segment> scan_chunks() const {
    return impl_->scan_chunks(nullptr);
  }

  /**
   * Deallocate `[start, end)` without changing the file length. The range
   * reads as zeroes afterwards. The filesystem may keep partial blocks at
   * either end allocated.
   */
  void drill_hole(file_off_t start, file_off_t end, std::error_code& ec) {
    impl_->drill_hole(start, end, &ec);
  }

  void drill_hole(file_off_t start, file_off_t end) {
    impl_->drill_hole(start, end, nullptr);
  }

  std::filesystem::path const& path() const { return impl_->path(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual std::vector<segment> scan_chunks(std::error_code* ec) const = 0;
    virtual void
    drill_hole(file_off_t start, file_off_t end, std::error_code* ec) = 0;
    virtual std::filesystem::path const& path() const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace drillpress
