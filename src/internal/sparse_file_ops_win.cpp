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

#include <cstdint>
#include <vector>

#include <folly/portability/Windows.h>
#include <winioctl.h>

#include <drillpress/error.h>
#include <drillpress/scan_error.h>

#include <drillpress/internal/allocated_ranges.h>
#include <drillpress/internal/sparse_file_ops.h>

namespace drillpress::internal {

namespace {

std::error_code last_error() {
  auto const err = ::GetLastError();

  // failed without setting the last error
  if (err == ERROR_SUCCESS) {
    return make_raw_error_code(-1);
  }

  return {static_cast<int>(err), std::system_category()};
}

file_size_t get_file_length(HANDLE h, std::error_code& ec) {
  LARGE_INTEGER zero{};
  LARGE_INTEGER len{};

  if (!::SetFilePointerEx(h, zero, &len, FILE_END)) {
    ec = last_error();
    return 0;
  }

  return static_cast<file_size_t>(len.QuadPart);
}

bool is_sparse(HANDLE h, std::error_code& ec) {
  BY_HANDLE_FILE_INFORMATION info{};

  if (!::GetFileInformationByHandle(h, &info)) {
    ec = last_error();
    return false;
  }

  return (info.dwFileAttributes & FILE_ATTRIBUTE_SPARSE_FILE) != 0;
}

class allocated_range_ioctl {
 public:
  allocated_range_ioctl(HANDLE h, size_t max_ranges)
      : h_{h}
      , buffer_(max_ranges) {}

  bool operator()(file_off_t start, file_size_t length,
                  std::vector<allocated_range>& page, std::error_code& ec) {
    FILE_ALLOCATED_RANGE_BUFFER in{};
    in.FileOffset.QuadPart = static_cast<LONGLONG>(start);
    in.Length.QuadPart = static_cast<LONGLONG>(length);

    DWORD bytes{0};

    BOOL ok = ::DeviceIoControl(
        h_, FSCTL_QUERY_ALLOCATED_RANGES, &in, sizeof(in), buffer_.data(),
        static_cast<DWORD>(buffer_.size() *
                           sizeof(FILE_ALLOCATED_RANGE_BUFFER)),
        &bytes, nullptr);

    bool more = false;

    if (!ok) {
      if (::GetLastError() != ERROR_MORE_DATA) {
        ec = last_error();
        return false;
      }
      more = true;
    }

    size_t const count = bytes / sizeof(FILE_ALLOCATED_RANGE_BUFFER);

    for (size_t i = 0; i < count; ++i) {
      page.push_back({static_cast<file_off_t>(buffer_[i].FileOffset.QuadPart),
                      static_cast<file_size_t>(buffer_[i].Length.QuadPart)});
    }

    return more;
  }

 private:
  HANDLE h_;
  std::vector<FILE_ALLOCATED_RANGE_BUFFER> buffer_;
};

class sparse_file_ops_win : public sparse_file_ops {
 public:
  std::any open(std::filesystem::path const& path, file_access access,
                std::error_code& ec) const override {
    ec.clear();

    DWORD const desired = access == file_access::read_write
                              ? GENERIC_READ | GENERIC_WRITE
                              : GENERIC_READ;

    HANDLE file =
        ::CreateFileW(path.c_str(), desired,
                      FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                      nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);

    if (file == INVALID_HANDLE_VALUE) {
      ec = last_error();
      return {};
    }

    return file;
  }

  void close(std::any const& handle, std::error_code& ec) const override {
    if (auto const h = get_handle(handle, ec)) {
      if (!::CloseHandle(h)) {
        ec = last_error();
      }
    }
  }

  std::vector<segment>
  scan_chunks(std::any const& handle, sparse_file_options const& opts,
              std::error_code& ec) const override {
    auto const h = get_handle(handle, ec);

    if (!h) {
      return {};
    }

    DRILLPRESS_CHECK(opts.max_ranges_per_query > 0,
                     "max_ranges_per_query must be positive");

    auto const size = get_file_length(h, ec);

    if (ec || size == 0) {
      return {};
    }

    auto const sparse = is_sparse(h, ec);

    if (ec) {
      return {};
    }

    allocated_range_ioctl query{h, opts.max_ranges_per_query};

    return scan_allocated_ranges(query, size, sparse, ec);
  }

  void drill_hole(std::any const& handle, file_off_t start, file_off_t end,
                  std::error_code& ec) const override {
    auto const h = get_handle(handle, ec);

    if (!h) {
      return;
    }

    if (start > end) {
      ec = std::make_error_code(std::errc::invalid_argument);
      return;
    }

    if (start == end) {
      return;
    }

    FILE_ZERO_DATA_INFORMATION info{};
    info.FileOffset.QuadPart = static_cast<LONGLONG>(start);
    info.BeyondFinalZero.QuadPart = static_cast<LONGLONG>(end);

    DWORD bytes{0};

    if (!::DeviceIoControl(h, FSCTL_SET_ZERO_DATA, &info, sizeof(info),
                           nullptr, 0, &bytes, nullptr)) {
      ec = last_error();
    }
  }

 private:
  HANDLE get_handle(std::any const& handle, std::error_code& ec) const {
    ec.clear();

    auto const* h = std::any_cast<HANDLE>(&handle);

    if (!h || *h == INVALID_HANDLE_VALUE) {
      ec = std::make_error_code(std::errc::bad_file_descriptor);
      return nullptr;
    }

    return *h;
  }
};

} // namespace

sparse_file_ops const& get_native_sparse_file_ops() {
  static sparse_file_ops_win const ops;
  return ops;
}

} // namespace drillpress::internal
