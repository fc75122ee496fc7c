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

#include <filesystem>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fmt/format.h>

#include <drillpress/error.h>
#include <drillpress/util.h>

using namespace drillpress;

namespace {

int parse_or_throw(std::string_view arg) {
  if (arg.empty()) {
    DRILLPRESS_THROW(runtime_error, "empty argument");
  }
  return static_cast<int>(arg.size());
}

} // namespace

TEST(error_test, runtime_error_location) {
  EXPECT_EQ(3, parse_or_throw("abc"));

  try {
    parse_or_throw("");
    FAIL() << "expected runtime_error";
  } catch (runtime_error const& e) {
    EXPECT_EQ("error_test.cpp",
              std::filesystem::path(e.file()).filename().string());
    EXPECT_GT(e.line(), 0);
    EXPECT_EQ(fmt::format("[error_test.cpp:{}] empty argument", e.line()),
              std::string(e.what()));
  } catch (std::exception const& e) {
    FAIL() << "expected runtime_error, got " << exception_str(e);
  }
}

TEST(error_test, runtime_error_is_a_drillpress_error) {
  EXPECT_THROW(parse_or_throw(""), error);
  EXPECT_THROW(parse_or_throw(""), std::exception);
}

TEST(error_test, check) {
  DRILLPRESS_CHECK(1 + 1 == 2, "arithmetic");
  EXPECT_DEATH(DRILLPRESS_CHECK(1 + 1 == 3, "arithmetic is broken"),
               "Assertion `1 \\+ 1 == 3` failed .*: arithmetic is broken");
}
