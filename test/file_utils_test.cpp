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

#include <filesystem>
#include <set>
#include <string>
#include <system_error>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <tap/error.h>
#include <tap/file_stat.h>
#include <tap/file_util.h>
#include <tap/os_access_generic.h>
#include <tap/util.h>

using namespace tap;

namespace fs = std::filesystem;

TEST(file_utils, file_stat_nonexistent) {
  file_stat st("somenonexistentfile");

  EXPECT_FALSE(st.valid());
  EXPECT_TRUE(st.error());
  EXPECT_THAT([&] { st.ensure_valid(file_stat::mode_valid); },
              testing::Throws<std::system_error>());
  EXPECT_THROW(st.size(), std::system_error);
}

TEST(file_utils, file_stat) {
  file_stat st;

  EXPECT_THAT([&] { st.ensure_valid(file_stat::size_valid); },
              testing::ThrowsMessage<tap::runtime_error>(
                  testing::HasSubstr("missing stat fields:")));

  EXPECT_THAT([&] { st.type(); },
              testing::ThrowsMessage<tap::runtime_error>(
                  testing::HasSubstr("missing stat fields:")));

  st.set_mode(0100644);

  EXPECT_NO_THROW(st.ensure_valid(file_stat::mode_valid));
  EXPECT_TRUE(st.is_regular_file());
  EXPECT_FALSE(st.is_directory());
  EXPECT_FALSE(st.is_symlink());

  st.set_mode(0040755);

  EXPECT_FALSE(st.is_regular_file());
  EXPECT_TRUE(st.is_directory());

  st.set_mode(0120644);

  EXPECT_TRUE(st.is_symlink());
  EXPECT_EQ("symlink", posix_file_type::name(st.type()));

  st.set_size(42);
  st.set_mtime(1700000000);
  st.set_nlink(1);

  EXPECT_TRUE(st.valid());
  EXPECT_EQ(42, st.size());
  EXPECT_EQ(1700000000, st.mtime());
}

TEST(file_utils, file_stat_symlink) {
  temporary_directory td("tap");

  write_file(td.path() / "target_file", "Hello, this is a long string!\n");
  fs::copy(td.path() / "target_file", td.path() / u8"我爱你.txt");

  fs::create_symlink("target_file", td.path() / "link_to_target");
  fs::create_symlink(u8"我爱你.txt", td.path() / "link_to_unicode");

  {
    file_stat st(td.path() / "target_file");
    EXPECT_TRUE(st.is_regular_file());
    EXPECT_EQ(30, st.size());
  }

  {
    file_stat st(td.path() / "link_to_target");
    EXPECT_TRUE(st.is_symlink());
    EXPECT_EQ(11, st.size());
  }

  {
    file_stat st(td.path() / "link_to_unicode");
    EXPECT_TRUE(st.is_symlink());
    EXPECT_EQ(13, st.size());
  }
}

TEST(file_utils, read_write_file) {
  temporary_directory td("tap");
  auto const path = td.path() / "file";

  write_file(path, "some content");
  EXPECT_EQ("some content", read_file(path));

  std::error_code ec;
  read_file(td.path() / "missing", ec);
  EXPECT_TRUE(ec);

  EXPECT_THROW(read_file(td.path() / "missing"), std::system_error);
  EXPECT_THROW(write_file(td.path() / "missing" / "file", "x"),
               std::system_error);
}

TEST(file_utils, sibling_temp_path) {
  fs::path const target{"/some/dir/out.zip"};

  auto a = sibling_temp_path(target);
  auto b = sibling_temp_path(target);

  EXPECT_EQ(target.parent_path(), a.parent_path());
  EXPECT_THAT(a.filename().string(), testing::StartsWith("out.zip.tmp-"));
  EXPECT_NE(a, b);
}

TEST(file_utils, temporary_directory) {
  fs::path p;

  {
    temporary_directory td("tap-test");
    p = td.path();
    EXPECT_TRUE(fs::is_directory(p));
    EXPECT_THAT(p.filename().string(), testing::StartsWith("tap-test."));
    write_file(p / "file", "x");
  }

  EXPECT_FALSE(fs::exists(p));
}

TEST(os_access_generic, read_directory) {
  temporary_directory td("tap");
  write_file(td.path() / "a", "a");
  write_file(td.path() / "b", "b");
  fs::create_directory(td.path() / "c");

  os_access_generic os;

  std::set<std::string> names;
  auto dir = os.opendir(td.path());
  fs::path name;
  while (dir->read(name)) {
    names.insert(name.filename().string());
  }

  EXPECT_EQ((std::set<std::string>{"a", "b", "c"}), names);
  EXPECT_TRUE(os.symlink_info(td.path() / "c").is_directory());
  EXPECT_EQ(canonical_path(td.path()), os.canonical(td.path()));

  EXPECT_THROW(os.opendir(td.path() / "missing"), std::system_error);
}
