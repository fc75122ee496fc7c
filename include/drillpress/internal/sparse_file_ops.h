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

#include <any>
#include <filesystem>
#include <system_error>
#include <vector>

#include <drillpress/segment.h>
#include <drillpress/sparse_file_options.h>

namespace drillpress::internal {

class sparse_file_ops {
 public:
  virtual ~sparse_file_ops() = default;

  virtual std::any open(std::filesystem::path const& path, file_access access,
                        std::error_code& ec) const = 0;
  virtual void close(std::any const& handle, std::error_code& ec) const = 0;

  virtual std::vector<segment>
  scan_chunks(std::any const& handle, sparse_file_options const& opts,
              std::error_code& ec) const = 0;

  virtual void drill_hole(std::any const& handle, file_off_t start,
                          file_off_t end, std::error_code& ec) const = 0;
};

sparse_file_ops const& get_native_sparse_file_ops();
sparse_file_ops const& get_unsupported_sparse_file_ops();

} // namespace drillpress::internal
