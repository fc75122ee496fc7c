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

#include <any>
#include <utility>

#include <fmt/format.h>

#include <drillpress/logger.h>
#include <drillpress/scan_error.h>
#include <drillpress/sparse_file.h>

#include <drillpress/internal/sparse_file_ops.h>

namespace drillpress {

namespace {

void handle_error(std::string_view what, std::error_code* ec,
                  std::error_code const& error) {
  if (error) {
    if (ec) {
      *ec = error;
    } else {
      DRILLPRESS_THROW(scan_error, what, error);
    }
  }
}

template <typename LoggerPolicy>
class sparse_file_ final : public sparse_file::impl {
 public:
  sparse_file_(logger& lgr, internal::sparse_file_ops const& ops,
               std::filesystem::path const& path, file_access access,
               sparse_file_options const& opts)
      : LOG_PROXY_INIT(lgr)
      , ops_{ops}
      , path_{path}
      , opts_{opts} {
    std::error_code ec;

    handle_ = ops_.open(path_, access, ec);

    if (ec) {
      LOG_DEBUG << "failed to open " << path_ << ": " << ec.message();
      DRILLPRESS_THROW(scan_error,
                       fmt::format("cannot open {}", path_.string()), ec);
    }

    LOG_DEBUG << "opened " << path_
              << (access == file_access::read_write ? " (read-write)" : "");
  }

  sparse_file_(sparse_file_ const&) = delete;
  sparse_file_& operator=(sparse_file_ const&) = delete;

  ~sparse_file_() override {
    std::error_code ec;
    ops_.close(handle_, ec);
    if (ec) {
      LOG_WARN << "failed to close " << path_ << ": " << ec.message();
    }
  }

  std::vector<segment> scan_chunks(std::error_code* ec) const override {
    std::error_code local_ec;
    std::vector<segment> segments;

    {
      auto tt = LOG_CPU_TIMED_DEBUG;

      segments = ops_.scan_chunks(handle_, opts_, local_ec);

      if (!local_ec) {
        tt << "scanned " << path_ << ": " << segments.size() << " segments";
      }
    }

    if (local_ec) {
      LOG_DEBUG << "scanning " << path_ << " failed: " << local_ec.message()
                << " (" << classify(local_ec) << ")";
      handle_error(fmt::format("cannot scan {}", path_.string()), ec,
                   local_ec);
      return {};
    }

    for (auto const& seg : segments) {
      LOG_TRACE << "  " << seg;
    }

    if (ec) {
      ec->clear();
    }

    return segments;
  }

  void
  drill_hole(file_off_t start, file_off_t end, std::error_code* ec) override {
    std::error_code local_ec;

    LOG_DEBUG << "drilling [" << start << ", " << end << ") in " << path_;

    ops_.drill_hole(handle_, start, end, local_ec);

    if (local_ec) {
      LOG_DEBUG << "drilling [" << start << ", " << end << ") in " << path_
                << " failed: " << local_ec.message() << " ("
                << classify(local_ec) << ")";
      handle_error(fmt::format("cannot drill hole [{}, {}) in {}", start, end,
                               path_.string()),
                   ec, local_ec);
      return;
    }

    if (ec) {
      ec->clear();
    }
  }

  std::filesystem::path const& path() const override { return path_; }

 private:
  LOG_PROXY_DECL(LoggerPolicy);
  internal::sparse_file_ops const& ops_;
  std::filesystem::path const path_;
  sparse_file_options const opts_;
  std::any handle_;
};

} // namespace

sparse_file::sparse_file(logger& lgr, std::filesystem::path const& path,
                         file_access access, sparse_file_options const& opts)
    : sparse_file(lgr, internal::get_native_sparse_file_ops(), path, access,
                  opts) {}

sparse_file::sparse_file(logger& lgr, internal::sparse_file_ops const& ops,
                         std::filesystem::path const& path, file_access access,
                         sparse_file_options const& opts)
    : impl_{make_unique_logging_object<sparse_file::impl, sparse_file_,
                                       logger_policies>(lgr, ops, path, access,
                                                        opts)} {}

sparse_file::~sparse_file() = default;
sparse_file::sparse_file(sparse_file&&) noexcept = default;
sparse_file& sparse_file::operator=(sparse_file&&) noexcept = default;

} // namespace drillpress
