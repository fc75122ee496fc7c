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

#include <deque>
#include <initializer_list>
#include <system_error>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <drillpress/internal/allocated_ranges.h>

using namespace drillpress;
using drillpress::internal::allocated_range;
using drillpress::internal::collect_allocated_ranges;
using drillpress::internal::scan_allocated_ranges;
using drillpress::internal::segments_from_allocated_ranges;
using ::testing::ElementsAre;
using ::testing::Pair;

namespace {

constexpr auto H = segment_type::hole;
constexpr auto D = segment_type::data;

struct scripted_page {
  std::vector<allocated_range> ranges;
  bool more{false};
  std::error_code error{};
};

// replays one scripted page per call and records the requested windows
class scripted_range_query {
 public:
  scripted_range_query(std::initializer_list<scripted_page> pages)
      : pages_{pages} {}

  bool operator()(file_off_t start, file_size_t length,
                  std::vector<allocated_range>& page, std::error_code& ec) {
    calls.emplace_back(start, length);

    if (pages_.empty()) {
      ADD_FAILURE() << "unexpected query at offset " << start;
      return false;
    }

    auto p = std::move(pages_.front());
    pages_.pop_front();

    if (p.error) {
      ec = p.error;
      return false;
    }

    page = std::move(p.ranges);
    return p.more;
  }

  std::vector<std::pair<file_off_t, file_size_t>> calls;

 private:
  std::deque<scripted_page> pages_;
};

} // namespace

TEST(allocated_ranges_test, empty_file) {
  EXPECT_TRUE(segments_from_allocated_ranges({}, 0).empty());

  std::vector<allocated_range> const ranges{{0, 4096}};
  EXPECT_TRUE(segments_from_allocated_ranges(ranges, 0).empty());
}

TEST(allocated_ranges_test, no_ranges_is_one_hole) {
  EXPECT_THAT(segments_from_allocated_ranges({}, 8192),
              ElementsAre(segment(H, 0, 8192)));
}

TEST(allocated_ranges_test, gaps_become_holes) {
  std::vector<allocated_range> const ranges{{0, 4096}, {8192, 4096}};

  EXPECT_THAT(segments_from_allocated_ranges(ranges, 16384),
              ElementsAre(segment(D, 0, 4096), segment(H, 4096, 8192),
                          segment(D, 8192, 12288), segment(H, 12288, 16384)));
}

TEST(allocated_ranges_test, leading_hole) {
  std::vector<allocated_range> const ranges{{4096, 4096}};

  EXPECT_THAT(segments_from_allocated_ranges(ranges, 8192),
              ElementsAre(segment(H, 0, 4096), segment(D, 4096, 8192)));
}

TEST(allocated_ranges_test, adjacent_ranges_are_merged) {
  std::vector<allocated_range> const ranges{
      {0, 4096}, {4096, 4096}, {8192, 4096}};

  EXPECT_THAT(segments_from_allocated_ranges(ranges, 12288),
              ElementsAre(segment(D, 0, 12288)));
}

TEST(allocated_ranges_test, overlapping_ranges_are_merged) {
  std::vector<allocated_range> const ranges{{0, 8192}, {4096, 8192}};

  EXPECT_THAT(segments_from_allocated_ranges(ranges, 16384),
              ElementsAre(segment(D, 0, 12288), segment(H, 12288, 16384)));
}

TEST(allocated_ranges_test, ranges_are_clipped_to_size) {
  // allocation is rounded up to clusters beyond the end of the file
  std::vector<allocated_range> const ranges{
      {4096, 65536}, {131072, 4096}};

  EXPECT_THAT(segments_from_allocated_ranges(ranges, 10000),
              ElementsAre(segment(H, 0, 4096), segment(D, 4096, 10000)));
}

TEST(allocated_ranges_test, zero_length_ranges_are_ignored) {
  std::vector<allocated_range> const ranges{{0, 0}, {4096, 0}, {8192, 100}};

  EXPECT_THAT(segments_from_allocated_ranges(ranges, 8292),
              ElementsAre(segment(H, 0, 8192), segment(D, 8192, 8292)));
}

TEST(allocated_ranges_test, single_complete_page) {
  scripted_range_query q{{.ranges = {{0, 4096}, {8192, 4096}}}};
  std::error_code ec;

  auto ranges = collect_allocated_ranges(q, 16384, ec);

  EXPECT_FALSE(ec);
  EXPECT_EQ(2U, ranges.size());
  EXPECT_THAT(q.calls, ElementsAre(Pair(0, 16384)));
}

TEST(allocated_ranges_test, truncated_pages_continue_after_last_range) {
  scripted_range_query q{
      {.ranges = {{0, 4096}, {8192, 4096}}, .more = true},
      {.ranges = {{16384, 4096}, {24576, 4096}}, .more = true},
      {.ranges = {{32768, 4096}}},
  };
  std::error_code ec;

  auto segments = scan_allocated_ranges(q, 40960, true, ec);

  EXPECT_FALSE(ec);
  EXPECT_THAT(q.calls, ElementsAre(Pair(0, 40960), Pair(12288, 28672),
                                   Pair(28672, 12288)));
  EXPECT_THAT(segments,
              ElementsAre(segment(D, 0, 4096), segment(H, 4096, 8192),
                          segment(D, 8192, 12288), segment(H, 12288, 16384),
                          segment(D, 16384, 20480), segment(H, 20480, 24576),
                          segment(D, 24576, 28672), segment(H, 28672, 32768),
                          segment(D, 32768, 36864), segment(H, 36864, 40960)));
}

TEST(allocated_ranges_test, truncated_page_reaching_end_stops) {
  scripted_range_query q{
      {.ranges = {{0, 4096}}, .more = true},
      {.ranges = {{4096, 4096}}, .more = true},
  };
  std::error_code ec;

  auto segments = scan_allocated_ranges(q, 8192, true, ec);

  EXPECT_FALSE(ec);
  EXPECT_EQ(2U, q.calls.size());
  EXPECT_THAT(segments, ElementsAre(segment(D, 0, 8192)));
}

TEST(allocated_ranges_test, empty_truncated_page_stops) {
  scripted_range_query q{
      {.ranges = {{0, 4096}}, .more = true},
      {.more = true},
  };
  std::error_code ec;

  auto ranges = collect_allocated_ranges(q, 65536, ec);

  EXPECT_FALSE(ec);
  EXPECT_EQ(2U, q.calls.size());
  EXPECT_EQ(1U, ranges.size());
}

TEST(allocated_ranges_test, non_advancing_truncated_page_stops) {
  scripted_range_query q{
      {.ranges = {{8192, 4096}}, .more = true},
      // the range ends before the requested offset
      {.ranges = {{0, 4096}}, .more = true},
  };
  std::error_code ec;

  auto ranges = collect_allocated_ranges(q, 65536, ec);

  EXPECT_FALSE(ec);
  EXPECT_THAT(q.calls, ElementsAre(Pair(0, 65536), Pair(12288, 53248)));
  EXPECT_EQ(2U, ranges.size());
}

TEST(allocated_ranges_test, query_error_discards_ranges) {
  auto const error = std::make_error_code(std::errc::io_error);
  scripted_range_query q{
      {.ranges = {{0, 4096}}, .more = true},
      {.error = error},
  };
  std::error_code ec;

  auto segments = scan_allocated_ranges(q, 65536, true, ec);

  EXPECT_EQ(error, ec);
  EXPECT_TRUE(segments.empty());
}

TEST(allocated_ranges_test, non_sparse_file_is_not_queried) {
  scripted_range_query q{};
  std::error_code ec;

  auto segments = scan_allocated_ranges(q, 10000, false, ec);

  EXPECT_FALSE(ec);
  EXPECT_TRUE(q.calls.empty());
  EXPECT_THAT(segments, ElementsAre(segment(D, 0, 10000)));
}

TEST(allocated_ranges_test, empty_sparse_file_is_not_queried) {
  scripted_range_query q{};
  std::error_code ec;

  EXPECT_TRUE(scan_allocated_ranges(q, 0, true, ec).empty());
  EXPECT_FALSE(ec);
  EXPECT_TRUE(q.calls.empty());
}
