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

#include <cstdint>
#include <filesystem>
#include <random>
#include <sstream>
#include <string>
#include <string_view>

#include <drillpress/tool/iolayer.h>

namespace drillpress::test {

#define EXPECT_NO_ERROR(ec) EXPECT_FALSE(ec) << (ec).message()
#define ASSERT_NO_ERROR(ec) ASSERT_FALSE(ec) << (ec).message()

// A fresh directory below the system temp directory, removed with all its
// contents on destruction unless DRILLPRESS_KEEP_TEMPORARY_DIRECTORIES is set.
class temporary_directory {
 public:
  temporary_directory();
  ~temporary_directory();

  temporary_directory(temporary_directory const&) = delete;
  temporary_directory& operator=(temporary_directory const&) = delete;

  std::filesystem::path const& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

std::string read_file(std::filesystem::path const& path);
void write_file(std::filesystem::path const& path, std::string_view content);

// bytes uniformly drawn from [min, max]
std::string create_random_string(size_t size, uint8_t min, uint8_t max,
                                 std::mt19937_64& gen);

// Captures everything a tool writes.
class test_iolayer {
 public:
  tool::iolayer const& get() const { return iol_; }

  std::string out() const { return out_.str(); }
  std::string err() const { return err_.str(); }

 private:
  std::ostringstream out_;
  std::ostringstream err_;
  tool::iolayer iol_{.out = out_, .err = err_};
};

} // namespace drillpress::test
