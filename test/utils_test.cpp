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

#include <chrono>
#include <cstdlib>
#include <string_view>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <drillpress/error.h>
#include <drillpress/util.h>

using namespace drillpress;

namespace {

constexpr file_size_t KiB{1024};
constexpr file_size_t MiB{1024 * KiB};
constexpr file_size_t GiB{1024 * MiB};
constexpr file_size_t TiB{1024 * GiB};

} // namespace

TEST(utils, parse_size_with_unit) {
  EXPECT_EQ(static_cast<file_size_t>(2), parse_size_with_unit("2"));
  EXPECT_EQ(3 * KiB, parse_size_with_unit("3k"));
  EXPECT_EQ(4 * MiB, parse_size_with_unit("4m"));
  EXPECT_EQ(5 * GiB, parse_size_with_unit("5g"));
  EXPECT_EQ(6 * TiB, parse_size_with_unit("6t"));
  EXPECT_EQ(1001 * KiB, parse_size_with_unit("1001K"));
  EXPECT_EQ(1002 * MiB, parse_size_with_unit("1002M"));
  EXPECT_EQ(1003 * GiB, parse_size_with_unit("1003G"));
  EXPECT_EQ(1004 * TiB, parse_size_with_unit("1004T"));
  EXPECT_THROW(parse_size_with_unit("7y"), drillpress::runtime_error);
  EXPECT_THROW(parse_size_with_unit("7tb"), drillpress::runtime_error);
  EXPECT_THROW(parse_size_with_unit("asd"), drillpress::runtime_error);
  EXPECT_THROW(parse_size_with_unit(""), drillpress::runtime_error);
}

#ifndef _WIN32
TEST(utils, getenv_is_enabled) {
  static char const* const test_var = "_DRILLPRESS_THIS_IS_A_TEST_";

  EXPECT_EQ(0, unsetenv(test_var));
  EXPECT_FALSE(getenv_is_enabled(test_var));

  EXPECT_EQ(0, setenv(test_var, "0", 1));
  EXPECT_FALSE(getenv_is_enabled(test_var));

  EXPECT_EQ(0, setenv(test_var, "1", 1));
  EXPECT_TRUE(getenv_is_enabled(test_var));

  EXPECT_EQ(0, setenv(test_var, "false", 1));
  EXPECT_FALSE(getenv_is_enabled(test_var));

  EXPECT_EQ(0, setenv(test_var, "true", 1));
  EXPECT_TRUE(getenv_is_enabled(test_var));

  EXPECT_EQ(0, setenv(test_var, "ThisAintBool", 1));
  EXPECT_FALSE(getenv_is_enabled(test_var));

  EXPECT_EQ(0, unsetenv(test_var));
  EXPECT_FALSE(getenv_is_enabled(test_var));
}
#endif

TEST(utils, size_with_unit) {
  EXPECT_EQ("0 B", size_with_unit(0));
  EXPECT_EQ("1023 B", size_with_unit(1023));
  EXPECT_EQ("1 KiB", size_with_unit(1024));
  EXPECT_EQ("1.5 KiB", size_with_unit(1536));
  EXPECT_EQ("97.66 KiB", size_with_unit(100'000));
  EXPECT_EQ("256 KiB", size_with_unit(256 * KiB));
  EXPECT_EQ("1 MiB", size_with_unit(MiB));
  EXPECT_EQ("1 GiB", size_with_unit(GiB));
  EXPECT_EQ("1 TiB", size_with_unit(TiB));
}

TEST(utils, time_with_unit) {
  using namespace std::chrono_literals;
  EXPECT_EQ("0s", time_with_unit(0ms));
  EXPECT_EQ("999ms", time_with_unit(999ms));
  EXPECT_EQ("1s", time_with_unit(1000ms));
  EXPECT_EQ("1.5s", time_with_unit(1500ms));
  EXPECT_EQ("1m", time_with_unit(60s));
  EXPECT_EQ("12.5us", time_with_unit(12500ns));
}

TEST(utils, basename) {
  EXPECT_EQ("foo.cpp", basename("foo.cpp"));
  EXPECT_EQ("foo.cpp", basename("/a/b/foo.cpp"));
  EXPECT_EQ("foo.cpp", basename("C:\\a\\foo.cpp"));
  EXPECT_EQ("", basename("dir/"));
}

TEST(utils, split_to) {
  std::vector<std::string_view> parts;
  split_to("a\nbc\n\nd", '\n', parts);
  EXPECT_THAT(parts, ::testing::ElementsAre("a", "bc", "", "d"));

  parts.clear();
  split_to("", '\n', parts);
  EXPECT_THAT(parts, ::testing::ElementsAre(""));
}
