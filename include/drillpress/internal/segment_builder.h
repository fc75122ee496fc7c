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

#pragma once

#include <vector>

#include <drillpress/segment.h>

namespace drillpress::internal {

/**
 * Collects segments in ascending order into the canonical form.
 *
 * Empty segments are dropped and a segment that continues the previous one
 * with the same type extends it instead of being appended. Segments must be
 * added in order, each starting where the previous one ended.
 */
class segment_builder {
 public:
  void add(segment_type type, file_off_t start, file_off_t end);
  void add(segment const& seg) { add(seg.type(), seg.start(), seg.end()); }

  // end offset of the last segment, 0 if there is none
  file_off_t end() const noexcept;

  bool empty() const noexcept { return segments_.empty(); }

  std::vector<segment> build() &&;

 private:
  std::vector<segment> segments_;
};

} // namespace drillpress::internal
