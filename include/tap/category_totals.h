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

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <tap/types.h>

namespace tap {

struct file_record;
class scan_cursor;

struct category_count {
  size_t files{0};
  file_size_t bytes{0};

  category_count& operator+=(category_count const& other) {
    files += other.files;
    bytes += other.bytes;
    return *this;
  }

  bool operator==(category_count const&) const = default;
};

/**
 * Per-category file counts and sizes
 *
 * Memory use is proportional to the number of categories, not files.
 * `merge()` is commutative and associative.
 */
class category_totals {
 public:
  struct entry {
    std::string category;
    category_count count;
  };

  void add(file_record const& rec);
  void add(std::string_view category, file_size_t bytes);
  void merge(category_totals const& other);

  category_count get(std::string_view category) const;

  size_t total_files() const;
  file_size_t total_bytes() const;
  size_t num_categories() const { return counts_.size(); }
  bool empty() const { return counts_.empty(); }

  // sorted by descending file count, then by name
  std::vector<entry> summary() const;

  bool operator==(category_totals const&) const = default;

 private:
  std::map<std::string, category_count, std::less<>> counts_;
};

// consumes the whole cursor
category_totals aggregate(scan_cursor& cursor);

} // namespace tap
