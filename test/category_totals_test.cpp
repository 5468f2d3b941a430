/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of tap.
 *
 * tap is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * tap is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with tap.  If not, see <https://www.gnu.org/licenses/>.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <tap/category_totals.h>
#include <tap/file_record.h>

using namespace tap;

namespace {

file_record make_record(std::string category, file_size_t size) {
  file_record rec;
  rec.source_path = "/src/x";
  rec.relative_path = "x";
  rec.size = size;
  rec.category = std::move(category);
  return rec;
}

std::vector<std::string> summary_names(category_totals const& t) {
  std::vector<std::string> rv;
  for (auto const& e : t.summary()) {
    rv.push_back(e.category);
  }
  return rv;
}

} // namespace

TEST(category_totals, add_and_query) {
  category_totals t;
  EXPECT_TRUE(t.empty());

  t.add(make_record("documents", 100));
  t.add(make_record("documents", 50));
  t.add("images", 7);

  EXPECT_FALSE(t.empty());
  EXPECT_EQ(2, t.num_categories());
  EXPECT_EQ(3, t.total_files());
  EXPECT_EQ(157, t.total_bytes());
  EXPECT_EQ((category_count{2, 150}), t.get("documents"));
  EXPECT_EQ((category_count{1, 7}), t.get("images"));
  EXPECT_EQ((category_count{}), t.get("audio"));
}

TEST(category_totals, zero_byte_files_are_counted) {
  category_totals t;
  t.add("misc", 0);
  t.add("misc", 0);

  EXPECT_EQ(2, t.total_files());
  EXPECT_EQ(0, t.total_bytes());
}

TEST(category_totals, summary_order) {
  category_totals t;

  t.add("videos", 1);
  t.add("audio", 1);
  t.add("images", 1);
  t.add("images", 1);
  t.add("code", 1);
  t.add("code", 1);
  t.add("documents", 1);
  t.add("documents", 1);
  t.add("documents", 1);

  EXPECT_EQ((std::vector<std::string>{"documents", "code", "images", "audio",
                                      "videos"}),
            summary_names(t));
}

TEST(category_totals, merge_is_commutative_and_associative) {
  category_totals a, b, c;

  a.add("documents", 10);
  a.add("images", 5);
  b.add("documents", 1);
  b.add("misc", 3);
  c.add("images", 2);
  c.add("audio", 8);

  auto ab_c = a;
  ab_c.merge(b);
  ab_c.merge(c);

  auto bc = b;
  bc.merge(c);
  auto a_bc = a;
  a_bc.merge(bc);

  auto ca = c;
  ca.merge(a);
  auto cab = ca;
  cab.merge(b);

  EXPECT_EQ(ab_c, a_bc);
  EXPECT_EQ(ab_c, cab);
  EXPECT_EQ(6, ab_c.total_files());
  EXPECT_EQ(29, ab_c.total_bytes());
  EXPECT_EQ((category_count{2, 11}), ab_c.get("documents"));
}

TEST(category_totals, merge_with_empty) {
  category_totals a, empty;
  a.add("documents", 10);

  auto b = a;
  b.merge(empty);
  EXPECT_EQ(a, b);

  auto c = empty;
  c.merge(a);
  EXPECT_EQ(a, c);
}
