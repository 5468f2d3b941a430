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

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <tap/conv.h>
#include <tap/error.h>
#include <tap/library_dependencies.h>
#include <tap/string.h>
#include <tap/util.h>

using namespace tap;

namespace {

constexpr file_size_t operator""_KiB(unsigned long long x) { return x << 10; }
constexpr file_size_t operator""_MiB(unsigned long long x) { return x << 20; }
constexpr file_size_t operator""_GiB(unsigned long long x) { return x << 30; }
constexpr file_size_t operator""_TiB(unsigned long long x) { return x << 40; }

int test_throw_runtime_error(bool throw_it) {
  if (throw_it) {
    TAP_THROW(runtime_error, "my test error");
  }
  return __LINE__ - 2;
}

int test_throw_system_error(bool throw_it) {
  if (throw_it) {
    errno = EPERM;
    TAP_THROW(system_error, "my test system error");
  }
  return __LINE__ - 2;
}

} // namespace

TEST(utils, parse_size_with_unit) {
  EXPECT_EQ(static_cast<file_size_t>(2), parse_size_with_unit("2"));
  EXPECT_EQ(3_KiB, parse_size_with_unit("3k"));
  EXPECT_EQ(256_KiB, parse_size_with_unit("256K"));
  EXPECT_EQ(4_MiB, parse_size_with_unit("4m"));
  EXPECT_EQ(5_GiB, parse_size_with_unit("5g"));
  EXPECT_EQ(6_TiB, parse_size_with_unit("6t"));
  EXPECT_EQ(1002_MiB, parse_size_with_unit("1002M"));
  EXPECT_THROW(parse_size_with_unit("7y"), tap::runtime_error);
  EXPECT_THROW(parse_size_with_unit("7kb"), tap::runtime_error);
  EXPECT_THROW(parse_size_with_unit("asd"), tap::runtime_error);
  EXPECT_THROW(parse_size_with_unit("-1"), tap::runtime_error);
}

TEST(utils, size_with_unit) {
  EXPECT_EQ("0 B", size_with_unit(0));
  EXPECT_EQ("1023 B", size_with_unit(1023));
  EXPECT_EQ("1 KiB", size_with_unit(1024));
  EXPECT_EQ("1.5 KiB", size_with_unit(1536));
  EXPECT_EQ("256 KiB", size_with_unit(256_KiB));
  EXPECT_EQ("1 MiB", size_with_unit(1_MiB));
  EXPECT_EQ("1 GiB", size_with_unit(1_GiB));
  EXPECT_EQ("1 TiB", size_with_unit(1_TiB));
}

TEST(utils, time_with_unit) {
  using namespace std::chrono_literals;
  EXPECT_EQ("999ms", time_with_unit(999ms));
  EXPECT_EQ("1.5s", time_with_unit(1500ms));
  EXPECT_EQ("1m", time_with_unit(60s));
  EXPECT_EQ("12.5us", time_with_unit(12500ns));
}

TEST(utils, getenv_is_enabled) {
  static char const* const test_var = "_TAP_THIS_IS_A_TEST_";

  EXPECT_EQ(0, unsetenv(test_var));
  EXPECT_FALSE(getenv_is_enabled(test_var));

  for (auto v : {"1", "true", "on", "yes", " TRUE "}) {
    EXPECT_EQ(0, setenv(test_var, v, 1));
    EXPECT_TRUE(getenv_is_enabled(test_var)) << v;
  }

  for (auto v : {"0", "false", "off", "no", "ThisAintBool", ""}) {
    EXPECT_EQ(0, setenv(test_var, v, 1));
    EXPECT_FALSE(getenv_is_enabled(test_var)) << v;
  }

  EXPECT_EQ(0, unsetenv(test_var));
}

TEST(utils, try_to) {
  EXPECT_EQ(42, try_to<int>("42"));
  EXPECT_EQ(std::nullopt, try_to<int>("forty-two"));
  EXPECT_EQ(std::nullopt, try_to<int>(""));
  EXPECT_EQ(true, try_to<bool>("Yes"));
  EXPECT_EQ(false, try_to<bool>("off"));
  EXPECT_EQ(std::nullopt, try_to<bool>("maybe"));
}

TEST(utils, basename) {
  EXPECT_EQ("foo.cpp", basename("/a/b/foo.cpp"));
  EXPECT_EQ("foo.cpp", basename("foo.cpp"));
}

TEST(utils, canonical_path) {
  EXPECT_TRUE(canonical_path("does/not/exist").is_absolute());
  EXPECT_TRUE(canonical_path("").empty());
}

TEST(utils, library_dependencies) {
  library_dependencies deps;

  deps.add_library("libfoo 1.2");
  deps.add_library("bar", "3.4.5");
  deps.add_library("libbaz", 10203, version_format::maj_min_patch_dec_100);
  deps.add_library("qux", 1002003, version_format::maj_min_patch_dec_1000);
  deps.add_library("libboost", 107400, version_format::boost);

  EXPECT_EQ((std::set<std::string>{"bar-3.4.5", "baz-1.2.3", "boost-1.74.0",
                                   "foo-1.2", "qux-1.2.3"}),
            deps.as_set());
  EXPECT_EQ("using: bar-3.4.5, baz-1.2.3, boost-1.74.0, foo-1.2, qux-1.2.3",
            deps.as_string());

  for (int i = 0; i < 10; ++i) {
    deps.add_library(fmt::format("library{}", i), "1.0.0");
  }

  auto const lines =
      split_to<std::vector<std::string>>(deps.as_string(), '\n');
  EXPECT_GT(lines.size(), 1);
  for (auto const& l : lines) {
    EXPECT_LE(l.size(), 80) << l;
  }
  EXPECT_THAT(lines[1], testing::StartsWith("       "));
}

TEST(string, split_to) {
  EXPECT_THAT(split_to<std::vector<std::string>>("a,b,c", ','),
              testing::ElementsAre("a", "b", "c"));
  EXPECT_THAT(split_to<std::vector<std::string>>(",b,", ','),
              testing::ElementsAre("", "b", ""));
  EXPECT_THAT(split_to<std::vector<std::string>>("", ','),
              testing::ElementsAre());
  EXPECT_THAT(split_to<std::vector<std::string_view>>("a,,c", ','),
              testing::ElementsAre("a", "", "c"));
  EXPECT_THAT(split_to<std::set<std::string>>(".pdf,.doc,.pdf", ','),
              testing::ElementsAre(".doc", ".pdf"));
}

TEST(string, trim_and_lower) {
  EXPECT_EQ("abc", trim("  abc\t\n"));
  EXPECT_EQ("a b", trim(" a b "));
  EXPECT_EQ("", trim(" \t "));
  EXPECT_EQ(".jpeg", to_lower(".JPeG"));
}

TEST(error_test, runtime_error) {
  int expected_line = test_throw_runtime_error(false);

  try {
    test_throw_runtime_error(true);
    FAIL() << "expected runtime_error to be thrown";
  } catch (runtime_error const& e) {
    EXPECT_EQ("utils_test.cpp",
              std::filesystem::path(e.file()).filename().string());
    EXPECT_EQ(fmt::format("[utils_test.cpp:{}] my test error", e.line()),
              std::string(e.what()));
    EXPECT_EQ(expected_line, e.line());
  } catch (std::exception const& e) {
    FAIL() << "expected runtime_error, got " << exception_str(e);
  }
}

TEST(error_test, system_error) {
  int expected_line = test_throw_system_error(false);

  try {
    test_throw_system_error(true);
    FAIL() << "expected system_error to be thrown";
  } catch (system_error const& e) {
    EXPECT_THAT(std::string(e.what()),
                ::testing::MatchesRegex(
                    "\\[utils_test\\.cpp:.*\\] my test system error: .*"));
    EXPECT_EQ(EPERM, e.get_errno());
    EXPECT_EQ(expected_line, e.line());
  } catch (std::exception const& e) {
    FAIL() << "expected system_error, got " << exception_str(e);
  }
}

TEST(error_test, derived_errors) {
  EXPECT_THROW(TAP_THROW(config_error, "bad"), runtime_error);
  EXPECT_THROW(TAP_THROW(archive_error, "bad"), runtime_error);
  EXPECT_THROW(TAP_THROW(fatal_io_error, "bad"), runtime_error);
}

TEST(error_test, tap_check) {
  TAP_CHECK(true, "my test error");
  EXPECT_DEATH(TAP_CHECK(false, "my test error"), "my test error");
}

TEST(error_test, tap_panic) {
  EXPECT_DEATH(TAP_PANIC("my test panic"), "my test panic");
}
