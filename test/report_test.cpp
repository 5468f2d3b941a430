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

#include <ctime>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <tap/exporter.h>
#include <tap/file_access_generic.h>
#include <tap/file_util.h>
#include <tap/report.h>
#include <tap/string.h>
#include <tap/util.h>

using namespace tap;
using namespace std::chrono_literals;

using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

namespace fs = std::filesystem;

namespace {

std::tm fixed_time() {
  std::tm tm{};
  tm.tm_year = 2024 - 1900;
  tm.tm_mon = 2;
  tm.tm_mday = 7;
  tm.tm_hour = 9;
  tm.tm_min = 5;
  tm.tm_sec = 3;
  return tm;
}

category_totals example_totals() {
  category_totals t;
  for (int i = 0; i < 10; ++i) {
    t.add("documents", 100);
  }
  for (int i = 0; i < 5; ++i) {
    t.add("images", 10);
  }
  t.add("misc", 1);
  return t;
}

} // namespace

TEST(report_test, summary_table) {
  auto table = format_summary_table(example_totals());

  auto lines = split_to<std::vector<std::string>>(table, '\n');
  ASSERT_EQ(6, lines.size());
  EXPECT_EQ("", lines.back());

  EXPECT_THAT(lines[0], StartsWith("CATEGORY "));
  EXPECT_THAT(lines[0], EndsWith("SIZE"));
  EXPECT_THAT(lines[1], StartsWith("documents "));
  EXPECT_THAT(lines[1], HasSubstr(" 10 "));
  EXPECT_THAT(lines[1], EndsWith(size_with_unit(1000)));
  EXPECT_THAT(lines[2], StartsWith("images "));
  EXPECT_THAT(lines[3], StartsWith("misc "));
  EXPECT_THAT(lines[4], StartsWith("TOTAL "));
  EXPECT_THAT(lines[4], HasSubstr(" 16 "));
  EXPECT_THAT(lines[4], EndsWith(size_with_unit(1051)));

  for (size_t i = 1; i < 5; ++i) {
    EXPECT_EQ(lines[0].size(), lines[i].size()) << lines[i];
  }
}

TEST(report_test, empty_summary_table) {
  auto table = format_summary_table(category_totals{});
  EXPECT_THAT(table, StartsWith("CATEGORY"));
  EXPECT_THAT(table, HasSubstr("TOTAL"));
}

TEST(report_test, inspect_log) {
  inspect_report rep;
  rep.root = "/media/usb";
  rep.totals = example_totals();
  rep.stats.files = 16;
  rep.stats.directories = 4;
  rep.stats.excluded = 2;
  rep.stats.errors.push_back({"/media/usb/locked", "Permission denied"});
  rep.elapsed = 1500ms;

  auto log = format_inspect_log(rep, fixed_time());

  EXPECT_THAT(log, StartsWith("TAP INSPECTION LOG\n" + std::string(70, '=')));
  EXPECT_THAT(log, HasSubstr("Source: /media/usb\n"));
  EXPECT_THAT(log, HasSubstr("Timestamp: 2024-03-07 09:05:03\n"));
  EXPECT_THAT(log, HasSubstr("Total files scanned: 16\n"));
  EXPECT_THAT(log, HasSubstr("FILES BY CATEGORY\n"));
  EXPECT_THAT(log, HasSubstr("documents: 10 files (" + size_with_unit(1000) +
                             ")\n"));
  EXPECT_THAT(log, HasSubstr("misc: 1 files ("));
  EXPECT_THAT(log, HasSubstr("Directories: 4, excluded: 2, skipped: 0\n"));
  EXPECT_THAT(log, HasSubstr("SCAN ERRORS\n"));
  EXPECT_THAT(log, HasSubstr("/media/usb/locked: Permission denied\n"));
  EXPECT_THAT(log, EndsWith("End of log\n"));

  EXPECT_LT(log.find("documents:"), log.find("images:"));
  EXPECT_LT(log.find("images:"), log.find("misc:"));
}

TEST(report_test, inspect_log_without_errors) {
  inspect_report rep;
  rep.root = "/data";

  auto log = format_inspect_log(rep, fixed_time());

  EXPECT_THAT(log, HasSubstr("Total files scanned: 0\n"));
  EXPECT_THAT(log, Not(HasSubstr("SCAN ERRORS")));
}

TEST(report_test, export_log) {
  export_job job;
  job.root = "/media/usb";
  job.destination = "/backup/usb";

  export_result res;
  res.scanned = example_totals();
  res.totals = example_totals();
  copy_result failed;
  failed.record.source_path = "/media/usb/x.pdf";
  failed.error = "Permission denied";
  res.failures.push_back(failed);

  auto log = format_export_log(job, res, fixed_time());

  EXPECT_THAT(log, StartsWith("TAP LOG\n"));
  EXPECT_THAT(log, HasSubstr("Source: /media/usb\n"));
  EXPECT_THAT(log, HasSubstr("Destination: /backup/usb\n"));
  EXPECT_THAT(log, HasSubstr("Timestamp: 2024-03-07 09:05:03\n"));
  EXPECT_THAT(log, HasSubstr("Total files scanned: 16\n"));
  EXPECT_THAT(log, HasSubstr("Files copied: 16\n"));
  EXPECT_THAT(log, HasSubstr("Files failed: 1\n"));
  EXPECT_THAT(log, HasSubstr("EXPORT ERRORS\n"));
  EXPECT_THAT(log, HasSubstr("/media/usb/x.pdf: Permission denied\n"));
  EXPECT_THAT(log, Not(HasSubstr("Export aborted")));
  EXPECT_THAT(log, Not(HasSubstr("SCAN ERRORS")));

  res.aborted = true;
  res.abort_reason = "stopped on request";
  EXPECT_THAT(format_export_log(job, res, fixed_time()),
              HasSubstr("Export aborted: stopped on request\n"));
}

TEST(report_test, inspect_log_name) {
  auto const tm = fixed_time();
  EXPECT_EQ(fs::path("tap_inspect_usb_20240307_090503.txt"),
            inspect_log_name("/media/usb", tm));
  EXPECT_EQ(fs::path("tap_inspect_usb_20240307_090503.txt"),
            inspect_log_name("/media/usb/", tm));
  EXPECT_EQ(fs::path("tap_inspect_unknown_20240307_090503.txt"),
            inspect_log_name("/", tm));
}

TEST(report_test, write_report) {
  temporary_directory td{"tap-report"};
  auto fa = create_file_access_generic();
  auto const path = td.path() / "report.txt";

  write_report(*fa, path, "hello\nworld\n");
  EXPECT_EQ("hello\nworld\n", read_file(path));

  EXPECT_THROW(write_report(*fa, td.path() / "missing" / "report.txt", "x"),
               std::exception);
}
