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
#include <iosfwd>
#include <random>
#include <vector>

#include <drillpress/segment.h>

namespace drillpress::test {

/**
 * Describes the intended layout of a sparse test file.
 *
 * The file consists of alternating segments, starting with `start_type`.
 * Each split point is a block index at which the segment type changes;
 * the last split point is the file length. Split points are sanitized on
 * construction: zeroes are removed, the list is truncated to `kMaxSplits`
 * entries, sorted and deduplicated.
 */
class sparse_description {
 public:
  static constexpr size_t kMaxSplits{50};
  static constexpr file_size_t kDefaultBlockSize{4096};

  sparse_description(segment_type start_type,
                     std::vector<uint8_t> split_points,
                     file_size_t block_size = kDefaultBlockSize);

  static sparse_description
  random(std::mt19937_64& rng, file_size_t block_size = kDefaultBlockSize);

  static sparse_description
  one_segment(segment_type type, file_size_t end,
              file_size_t block_size = kDefaultBlockSize);

  segment_type start_type() const { return start_type_; }
  std::vector<uint8_t> const& split_points() const { return split_points_; }
  file_size_t block_size() const { return block_size_; }

  file_size_t size() const;

  std::vector<segment> segments() const;

  // creates the file at `path`, data segments are filled with non-zero bytes
  void to_file(std::filesystem::path const& path) const;

 private:
  segment_type start_type_;
  std::vector<uint8_t> split_points_;
  file_size_t block_size_;
};

std::ostream& operator<<(std::ostream& os, sparse_description const& desc);

} // namespace drillpress::test
