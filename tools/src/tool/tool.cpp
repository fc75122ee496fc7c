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

#include <fmt/format.h>

#include <drillpress/logger.h>
#include <drillpress/tool/tool.h>

namespace drillpress::tool {

namespace po = boost::program_options;

std::string tool_header(std::string_view tool_name) {
  return fmt::format("{} (drillpress {})\n", tool_name, DRILLPRESS_VERSION);
}

void add_common_options(po::options_description& opts,
                        logger_options& logopts) {
  auto const log_level_desc =
      fmt::format("log level ({})", logger::all_level_names());

  // clang-format off
  opts.add_options()
    ("log-level",
        po::value<logger::level_type>(&logopts.threshold)
            ->default_value(logger::WARN),
        log_level_desc.c_str())
    ("log-with-context",
        po::bool_switch()->notifier([&logopts](bool enabled) {
          if (enabled) {
            logopts.with_context = true;
          }
        }),
        "include source locations in log output at any level")
    ("help,h",
        "output help message and exit")
    ;
  // clang-format on
}

} // namespace drillpress::tool
