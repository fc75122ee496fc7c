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

#include <iterator>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <drillpress/error.h>
#include <drillpress/logger.h>
#include <drillpress/scan_error.h>
#include <drillpress/segments.h>
#include <drillpress/sparse_file.h>
#include <drillpress/tool/iolayer.h>
#include <drillpress/tool/main_adapter.h>
#include <drillpress/tool/tool.h>
#include <drillpress/util.h>
#include <drillpress_tool_main.h>

namespace drillpress::tool {

namespace po = boost::program_options;

namespace {

struct drill_range {
  file_off_t start;
  file_off_t end;
};

drill_range parse_drill_range(std::string const& arg) {
  auto const pos = arg.find(':');

  if (pos == std::string::npos) {
    DRILLPRESS_THROW(runtime_error,
                     fmt::format("invalid drill range (START:END): {}", arg));
  }

  return {parse_size_with_unit(arg.substr(0, pos)),
          parse_size_with_unit(arg.substr(pos + 1))};
}

std::optional<segment_type> parse_segment_type(std::string_view type) {
  if (type == "hole") {
    return segment_type::hole;
  }
  if (type == "data") {
    return segment_type::data;
  }
  if (type != "all") {
    DRILLPRESS_THROW(runtime_error,
                     fmt::format("invalid segment type: {}", type));
  }
  return std::nullopt;
}

void print_summary(std::span<segment const> segs, iolayer const& iol) {
  auto holes = hole_segments(segs);
  auto data = data_segments(segs);

  iol.out << fmt::format(
      "  {} segments, {} holes ({}), {} data ({})\n", segs.size(),
      std::ranges::distance(holes), size_with_unit(total_size(holes)),
      std::ranges::distance(data), size_with_unit(total_size(data)));
}

} // namespace

int holeinfo_main(int argc, char** argv, iolayer const& iol) {
  std::vector<std::string> files;
  std::vector<std::string> drill_args;
  std::string type_str;
  bool summary{false};
  logger_options logopts;

  // clang-format off
  po::options_description opts("Command line options");
  opts.add_options()
    ("input",
        po::value<std::vector<std::string>>(&files),
        "files to inspect")
    ("type,t",
        po::value<std::string>(&type_str)->default_value("all"),
        "only list segments of this type (all, hole, data)")
    ("summary,s",
        po::value<bool>(&summary)->zero_tokens(),
        "print segment counts and sizes per file")
    ("drill,d",
        po::value<std::vector<std::string>>(&drill_args),
        "drill a hole START:END before scanning (repeatable)")
    ;
  // clang-format on

  add_common_options(opts, logopts);

  po::positional_options_description pos;
  pos.add("input", -1);

  po::variables_map vm;

  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(opts)
                  .positional(pos)
                  .run(),
              vm);
    po::notify(vm);
  } catch (po::error const& e) {
    iol.err << "error: " << e.what() << "\n";
    return 1;
  } catch (drillpress::error const& e) {
    // invalid --log-level
    iol.err << "error: " << e.what() << "\n";
    return 1;
  }

  auto constexpr usage = "Usage: holeinfo [OPTIONS...] FILE...\n";

  if (vm.contains("help") or files.empty()) {
    iol.out << tool_header("holeinfo") << usage << "\n" << opts << "\n";
    return 0;
  }

  std::optional<segment_type> type;
  std::vector<drill_range> drills;

  try {
    type = parse_segment_type(type_str);

    for (auto const& arg : drill_args) {
      drills.push_back(parse_drill_range(arg));
    }
  } catch (std::exception const& e) {
    iol.err << "error: " << exception_str(e) << "\n";
    return 1;
  }

  int retval{0};

  try {
    stream_logger lgr(iol.err, logopts);
    LOG_PROXY(debug_logger_policy, lgr);

    auto const access =
        drills.empty() ? file_access::read_only : file_access::read_write;

    for (auto const& file : files) {
      try {
        sparse_file sf(lgr, file, access);

        for (auto const& d : drills) {
          sf.drill_hole(d.start, d.end);
        }

        auto const segs = sf.scan_chunks();

        iol.out << file << ":\n";

        auto print = [&](auto&& view) {
          for (auto const& seg : view) {
            iol.out << "  " << seg << "\n";
          }
        };

        if (type) {
          print(segments_of_type(segs, *type));
        } else {
          print(segs);
        }

        if (summary) {
          print_summary(segs, iol);
        }
      } catch (scan_error const& e) {
        LOG_DEBUG << exception_str(e);
        iol.err << "error: " << file << ": " << e.code().message() << "\n";
        retval = 1;
      }
    }
  } catch (std::exception const& e) {
    iol.err << exception_str(e) << "\n";
    return 1;
  }

  return retval;
}

} // namespace drillpress::tool

namespace drillpress {

int holeinfo_main(int argc, char** argv) {
  return tool::main_adapter(tool::holeinfo_main).safe(argc, argv);
}

} // namespace drillpress
