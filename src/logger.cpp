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

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <ostream>

#include <folly/lang/Assume.h>
#include <folly/small_vector.h>

#include <boost/chrono/thread_clock.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <drillpress/error.h>
#include <drillpress/logger.h>
#include <drillpress/util.h>

namespace drillpress {

namespace {

// FATAL is not in here, it cannot be selected as a threshold
constexpr std::array<std::pair<std::string_view, logger::level_type>, 6>
    kLevelNames{{
        {"error", logger::ERROR},
        {"warn", logger::WARN},
        {"info", logger::INFO},
        {"verbose", logger::VERBOSE},
        {"debug", logger::DEBUG},
        {"trace", logger::TRACE},
    }};

} // namespace

char logger::level_char(level_type level) {
  switch (level) {
  case FATAL:
    return 'F';
  case ERROR:
    return 'E';
  case WARN:
    return 'W';
  case INFO:
    return 'I';
  case VERBOSE:
    return 'V';
  case DEBUG:
    return 'D';
  case TRACE:
    return 'T';
  }
  folly::assume_unreachable();
}

std::ostream& operator<<(std::ostream& os, logger::level_type const& optval) {
  return os << logger::level_name(optval);
}

std::istream& operator>>(std::istream& is, logger::level_type& optval) {
  std::string s;
  is >> s;
  optval = logger::parse_level(s);
  return is;
}

logger::level_type logger::parse_level(std::string_view level) {
  for (auto const& [name, lvl] : kLevelNames) {
    if (level == name) {
      return lvl;
    }
  }
  DRILLPRESS_THROW(runtime_error,
                   fmt::format("invalid logger level: {}", level));
}

std::string_view logger::level_name(level_type level) {
  for (auto const& [name, lvl] : kLevelNames) {
    if (level == lvl) {
      return name;
    }
  }
  return "fatal";
}

std::string logger::all_level_names() {
  std::string names;
  for (auto const& [name, lvl] : kLevelNames) {
    names += names.empty() ? "" : ", ";
    names += name;
  }
  return names;
}

stream_logger::stream_logger(std::ostream& os, logger_options const& options)
    : os_{os}
    , threshold_{options.threshold}
    , with_context_{options.with_context.value_or(options.threshold >=
                                                  logger::VERBOSE)} {
  if (threshold_ >= DEBUG) {
    set_policy<debug_logger_policy>();
  } else {
    set_policy<prod_logger_policy>();
  }
}

void stream_logger::write(level_type level, std::string_view output,
                          source_location loc) {
  if (level > threshold_) {
    return;
  }

  auto stamp = get_current_time_string();
  std::string context;

  if (with_context_) {
    context = fmt::format("[{}:{}] ", basename(loc.file_name()), loc.line());
  }

  folly::small_vector<std::string_view, 2> lines;
  split_to(output, '\n', lines);

  if (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }

  if (lines.empty()) {
    lines.push_back("<<< no log message >>>");
  }

  auto const lchar = level_char(level);
  std::string buf;

  for (std::size_t i = 0; i < lines.size(); ++i) {
    buf += fmt::format("{} {} {}{}\n", lchar, stamp, context, lines[i]);

    if (i == 0) {
      // continuation lines
      std::ranges::fill(stamp, '.');
      context.assign(context.size(), ' ');
    }
  }

  std::lock_guard lock(mx_);
  os_ << buf;
}

class cpu_timed_log_entry::timer {
 public:
  using thread_clock = boost::chrono::thread_clock;

  timer(logger& lgr, logger::level_type level, source_location loc)
      : lgr_{lgr}
      , level_{level}
      , loc_{loc} {}

  void log(std::ostringstream& oss) const {
    std::chrono::duration<double> const wall =
        std::chrono::steady_clock::now() - wall_start_;
    boost::chrono::duration<double> const cpu =
        thread_clock::now() - cpu_start_;

    oss << " [" << time_with_unit(wall.count()) << ", "
        << time_with_unit(cpu.count()) << " CPU]";

    lgr_.write(level_, oss.str(), loc_);
  }

 private:
  logger& lgr_;
  logger::level_type const level_;
  source_location const loc_;
  std::chrono::steady_clock::time_point const wall_start_{
      std::chrono::steady_clock::now()};
  thread_clock::time_point const cpu_start_{thread_clock::now()};
};

cpu_timed_log_entry::cpu_timed_log_entry(logger& lgr, logger::level_type level,
                                         source_location loc) {
  if (level <= lgr.threshold()) {
    timer_ = std::make_unique<timer>(lgr, level, loc);
  }
}

cpu_timed_log_entry::~cpu_timed_log_entry() {
  if (timer_ && oss_.tellp() > 0) {
    timer_->log(oss_);
  }
}

namespace detail {

void unknown_logger_policy(std::string_view name) {
  DRILLPRESS_THROW(runtime_error, fmt::format("no such logger policy: {}", name));
}

} // namespace detail

std::string get_current_time_string() {
  using namespace std::chrono;
  auto const now = floor<microseconds>(system_clock::now());
  auto const local = safe_localtime(system_clock::to_time_t(now));
  return fmt::format("{:%H:%M}:{:%S}", local, now);
}

} // namespace drillpress
