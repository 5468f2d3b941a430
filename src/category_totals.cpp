/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of tap.
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

#include <tap/category_totals.h>
#include <tap/file_record.h>
#include <tap/scanner.h>

namespace tap {

void category_totals::add(file_record const& rec) {
  add(rec.category, rec.size);
}

void category_totals::add(std::string_view category, file_size_t bytes) {
  auto it = counts_.find(category);

  if (it == counts_.end()) {
    it = counts_.emplace(std::string(category), category_count{}).first;
  }

  it->second += category_count{1, bytes};
}

void category_totals::merge(category_totals const& other) {
  for (auto const& [name, count] : other.counts_) {
    counts_[name] += count;
  }
}

category_count category_totals::get(std::string_view category) const {
  if (auto it = counts_.find(category); it != counts_.end()) {
    return it->second;
  }
  return {};
}

size_t category_totals::total_files() const {
  size_t rv = 0;
  for (auto const& [_, count] : counts_) {
    rv += count.files;
  }
  return rv;
}

file_size_t category_totals::total_bytes() const {
  file_size_t rv = 0;
  for (auto const& [_, count] : counts_) {
    rv += count.bytes;
  }
  return rv;
}

std::vector<category_totals::entry> category_totals::summary() const {
  std::vector<entry> rv;
  rv.reserve(counts_.size());

  for (auto const& [name, count] : counts_) {
    rv.push_back({name, count});
  }

  // counts_ is ordered by name, so a stable sort keeps ties alphabetical
  std::ranges::stable_sort(rv, std::greater<>{},
                           [](auto const& e) { return e.count.files; });

  return rv;
}

category_totals aggregate(scan_cursor& cursor) {
  category_totals totals;

  while (auto rec = cursor.next()) {
    totals.add(*rec);
  }

  return totals;
}

} // namespace tap
