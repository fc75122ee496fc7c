/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of drillpress.
 *
 * drillpress is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * drillpress is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with drillpress.  If not, see <https://www.gnu.org/licenses/>.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <drillpress/logger.h>
#include <drillpress/util.h>

namespace drillpress::test {

/**
 * Records every entry up to its threshold (INFO unless given).
 *
 * With DRILLPRESS_TEST_LOGGER_OUTPUT set, entries up to
 * DRILLPRESS_TEST_LOGGER_LEVEL are also echoed to stderr.
 */
class test_logger : public logger {
 public:
  struct log_entry {
    level_type level;
    std::string output;
  };

  explicit test_logger(std::optional<level_type> threshold = std::nullopt)
      : threshold_{threshold.value_or(INFO)}
      , echo_threshold_{echo_threshold()} {
    if (std::max(threshold_, echo_threshold_.value_or(FATAL)) >= DEBUG) {
      set_policy<debug_logger_policy>();
    } else {
      set_policy<prod_logger_policy>();
    }
  }

  level_type threshold() const override { return threshold_; }

  void write(level_type level, std::string_view output,
             source_location loc) override {
    std::lock_guard lock(mx_);

    if (echo_threshold_ && level <= *echo_threshold_) {
      std::cerr << level_char(level) << ' ' << get_current_time_string()
                << " [" << basename(loc.file_name()) << ":" << loc.line()
                << "] " << output << "\n";
    }

    if (level <= threshold_) {
      log_.push_back({level, std::string(output)});
    }
  }

  std::vector<log_entry> const& get_log() const { return log_; }

  std::string as_string() const {
    std::ostringstream oss;
    for (auto const& e : log_) {
      oss << level_char(e.level) << " " << e.output << "\n";
    }
    return oss.str();
  }

 private:
  static std::optional<level_type> echo_threshold() {
    if (!getenv_is_enabled("DRILLPRESS_TEST_LOGGER_OUTPUT")) {
      return std::nullopt;
    }
    if (auto const* var = std::getenv("DRILLPRESS_TEST_LOGGER_LEVEL")) {
      return parse_level(var);
    }
    return INFO;
  }

  std::mutex mx_;
  std::vector<log_entry> log_;
  level_type const threshold_;
  std::optional<level_type> const echo_threshold_;
};

} // namespace drillpress::test
