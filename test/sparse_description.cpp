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

#include <algorithm>
#include <ostream>
#include <utility>

#include <drillpress/segments.h>

#include "sparse_description.h"
#include "sparse_file_builder.h"
#include "test_helpers.h"

namespace drillpress::test {

sparse_description::sparse_description(segment_type start_type,
                                       std::vector<uint8_t> split_points,
                                       file_size_t block_size)
    : start_type_{start_type}
    , split_points_{std::move(split_points)}
    , block_size_{block_size} {
  std::erase(split_points_, 0);
  if (split_points_.size() > kMaxSplits) {
    split_points_.resize(kMaxSplits);
  }
  std::ranges::sort(split_points_);
  auto const dup = std::ranges::unique(split_points_);
  split_points_.erase(dup.begin(), dup.end());
}

sparse_description
sparse_description::random(std::mt19937_64& rng, file_size_t block_size) {
  std::bernoulli_distribution type_dist;
  std::uniform_int_distribution<size_t> count_dist{0, 2 * kMaxSplits};
  std::uniform_int_distribution<int> point_dist{0, 255};

  auto const start_type =
      type_dist(rng) ? segment_type::hole : segment_type::data;

  std::vector<uint8_t> points(count_dist(rng));
  std::ranges::generate(points,
                        [&] { return static_cast<uint8_t>(point_dist(rng)); });

  return {start_type, std::move(points), block_size};
}

sparse_description sparse_description::one_segment(segment_type type,
                                                    file_size_t end,
                                                    file_size_t block_size) {
  return {type, {static_cast<uint8_t>(end / block_size)}, block_size};
}

file_size_t sparse_description::size() const {
  return split_points_.empty() ? 0 : split_points_.back() * block_size_;
}

std::vector<segment> sparse_description::segments() const {
  std::vector<segment> segs;
  auto type = start_type_;
  file_off_t prev{0};

  segs.reserve(split_points_.size());

  for (auto point : split_points_) {
    file_off_t const offset = point * block_size_;
    segs.emplace_back(type, prev, offset);
    prev = offset;
    type = opposite(type);
  }

  return segs;
}

void sparse_description::to_file(std::filesystem::path const& path) const {
  std::mt19937_64 rng{block_size_ ^ split_points_.size()};
  auto sfb = sparse_file_builder::create(path);

  auto const segs = segments();

  for (auto const& seg : data_segments(segs)) {
    sfb.write_data(seg.start(), create_random_string(seg.size(), 1, 255, rng));
  }

  sfb.truncate(size());
  sfb.commit();
}

std::ostream& operator<<(std::ostream& os, sparse_description const& desc) {
  os << "sparse_description{" << desc.start_type() << ", [";
  for (size_t i = 0; i < desc.split_points().size(); ++i) {
    os << (i > 0 ? ", " : "") << static_cast<int>(desc.split_points()[i]);
  }
  return os << "] x " << desc.block_size() << "}";
}

} // namespace drillpress::test
