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

#include <cerrno>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

#include <drillpress/scan_error.h>

#include <drillpress/internal/hole_data_walker.h>
#include <drillpress/internal/seek_error.h>
#include <drillpress/internal/sparse_file_ops.h>

namespace drillpress::internal {

namespace {

class fd_cursor {
 public:
  explicit fd_cursor(int fd)
      : fd_{fd} {}

#if defined(SEEK_HOLE) && defined(SEEK_DATA)
  std::optional<file_off_t>
  seek(file_off_t offset, seek_whence whence, std::error_code& ec) {
    ec.clear();
    errno = 0;

    auto const rv = ::lseek(fd_, static_cast<off_t>(offset),
                            whence == seek_whence::hole ? SEEK_HOLE : SEEK_DATA);

    if (rv < 0) {
      ec = map_seek_errno(errno, static_cast<int>(rv));
      return std::nullopt;
    }

    return static_cast<file_off_t>(rv);
  }
#endif

  file_size_t size(std::error_code& ec) {
    ec.clear();
    errno = 0;

    auto const rv = ::lseek(fd_, 0, SEEK_END);

    if (rv < 0) {
      ec = map_errno(errno, static_cast<int>(rv));
      return 0;
    }

    return static_cast<file_size_t>(rv);
  }

 private:
  int fd_;
};

void punch_hole(int fd, file_off_t start, file_off_t end, std::error_code& ec) {
#if defined(__linux__)
  errno = 0;
  auto const rv = ::fallocate(fd, FALLOC_FL_PUNCH_HOLE | FALLOC_FL_KEEP_SIZE,
                              static_cast<off_t>(start),
                              static_cast<off_t>(end - start));
  if (rv != 0) {
    ec = map_errno(errno, rv);
  }
#elif defined(__APPLE__) && defined(F_PUNCHHOLE)
  ::fpunchhole_t args{};
  args.fp_offset = static_cast<off_t>(start);
  args.fp_length = static_cast<off_t>(end - start);
  errno = 0;
  // NOLINTNEXTLINE: cppcoreguidelines-pro-type-vararg
  auto const rv = ::fcntl(fd, F_PUNCHHOLE, &args);
  if (rv != 0) {
    ec = map_errno(errno, rv);
  }
#else
  (void)fd;
  (void)start;
  (void)end;
  ec = make_error_code(scan_errc::unsupported_platform);
#endif
}

class sparse_file_ops_posix : public sparse_file_ops {
 public:
  std::any open(std::filesystem::path const& path, file_access access,
                std::error_code& ec) const override {
    ec.clear();

    int const flags =
        (access == file_access::read_write ? O_RDWR : O_RDONLY) | O_CLOEXEC;

    // NOLINTNEXTLINE: cppcoreguidelines-pro-type-vararg
    int fd = ::open(path.c_str(), flags);

    if (fd == -1) {
      ec = std::error_code{errno, std::generic_category()};
      return {};
    }

    return fd;
  }

  void close(std::any const& handle, std::error_code& ec) const override {
    if (auto const* fd = get_handle(handle, ec)) {
      if (::close(*fd) != 0) {
        ec = std::error_code{errno, std::generic_category()};
      }
    }
  }

  std::vector<segment>
  scan_chunks(std::any const& handle, sparse_file_options const& /*opts*/,
              std::error_code& ec) const override {
    if (auto const* fd = get_handle(handle, ec)) {
#if defined(SEEK_HOLE) && defined(SEEK_DATA)
      fd_cursor cur{*fd};
      return walk_holes_and_data(cur, ec);
#else
      ec = make_error_code(scan_errc::unsupported_platform);
#endif
    }

    return {};
  }

  void drill_hole(std::any const& handle, file_off_t start, file_off_t end,
                  std::error_code& ec) const override {
    if (auto const* fd = get_handle(handle, ec)) {
      if (start > end) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return;
      }

      if (start < end) {
        punch_hole(*fd, start, end, ec);
      }
    }
  }

 private:
  int const* get_handle(std::any const& handle, std::error_code& ec) const {
    ec.clear();

    auto const* fd = std::any_cast<int>(&handle);

    if (!fd || *fd < 0) {
      ec = std::make_error_code(std::errc::bad_file_descriptor);
      return nullptr;
    }

    return fd;
  }
};

} // namespace

sparse_file_ops const& get_native_sparse_file_ops() {
  static sparse_file_ops_posix const ops;
  return ops;
}

} // namespace drillpress::internal
