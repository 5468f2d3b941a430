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

#include <atomic>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <system_error>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fmt/format.h>

#include <tap/category_table.h>
#include <tap/error.h>
#include <tap/exclusion_rules.h>
#include <tap/exporter.h>
#include <tap/file_util.h>

#include "test_helpers.h"
#include "test_logger.h"

using namespace tap;
using namespace std::chrono_literals;

using ::testing::HasSubstr;

namespace fs = std::filesystem;

namespace {

std::set<std::string> keys(std::map<std::string, std::string> const& m) {
  std::set<std::string> rv;
  for (auto const& [k, v] : m) {
    rv.insert(k);
  }
  return rv;
}

class exporter_test : public ::testing::Test {
 protected:
  void SetUp() override {
    categories.emplace(lgr, category_table::builtin_definitions());
  }

  export_job make_job(size_t limit = 4) const {
    export_job job;
    job.root = src();
    job.destination = dest();
    job.concurrency_limit = limit;
    job.buffer_size = 7;
    return job;
  }

  export_result run(export_job const& job,
                    exporter::progress_function progress = nullptr) {
    exporter ex(lgr, os, fa, *categories, rules);
    return ex.run(job, std::move(progress));
  }

  void make_example_tree() {
    for (int i = 0; i < 10; ++i) {
      test::write_file_at(src(), fmt::format("docs/d{}/a.pdf", i),
                          std::string(100, 'a' + i));
    }
    for (int i = 0; i < 5; ++i) {
      test::write_file_at(src(), fmt::format("pics/p{}/b.jpg", i),
                          std::string(10, 'b'));
    }
    test::write_file_at(src(), "c.xyz", "c");
    test::write_file_at(src(), "node_modules/x/a.pdf", "nope");
    test::write_file_at(src(), "node_modules/y.jpg", "nope");
  }

  fs::path src() const { return td.path() / "src"; }
  fs::path dest() const { return td.path() / "out"; }

  test::test_logger lgr;
  test::instrumented_os_access os;
  std::shared_ptr<test::instrumented_file_access> fa{
      std::make_shared<test::instrumented_file_access>()};
  std::optional<category_table> categories;
  exclusion_rules rules;
  temporary_directory td{"tap-exporter"};
};

} // namespace

TEST_F(exporter_test, example_scenario) {
  make_example_tree();
  rules.add("node_modules/");

  auto res = run(make_job());

  EXPECT_EQ(export_status::success, res.status());
  EXPECT_FALSE(res.aborted);
  EXPECT_TRUE(res.failures.empty());
  EXPECT_EQ((category_count{10, 1000}), res.totals.get("documents"));
  EXPECT_EQ((category_count{5, 50}), res.totals.get("images"));
  EXPECT_EQ((category_count{1, 1}), res.totals.get("misc"));
  EXPECT_EQ(3, res.totals.num_categories());
  EXPECT_EQ(res.scanned, res.totals);
  EXPECT_EQ(1, res.excluded);

  auto tree = test::read_tree(dest());

  EXPECT_EQ(std::string(100, 'a'), tree.at("documents/docs/d0/a.pdf"));
  EXPECT_EQ(std::string(100, 'j'), tree.at("documents/docs/d9/a.pdf"));
  EXPECT_EQ(std::string(10, 'b'), tree.at("images/pics/p4/b.jpg"));
  EXPECT_EQ("c", tree.at("misc/c.xyz"));

  for (auto const& [path, content] : tree) {
    EXPECT_THAT(path, ::testing::Not(HasSubstr("node_modules")));
  }

  // 16 exported files plus the log
  EXPECT_EQ(17, tree.size());
}

TEST_F(exporter_test, writes_log_file) {
  make_example_tree();
  rules.add("node_modules/");

  auto res = run(make_job());

  EXPECT_EQ(canonical_path(dest()) / "tap.log", res.log_path);

  auto log = read_file(res.log_path);

  EXPECT_THAT(log, HasSubstr("TAP LOG"));
  EXPECT_THAT(log, HasSubstr("Total files scanned: 16"));
  EXPECT_THAT(log, HasSubstr("documents: 10 files"));
  EXPECT_THAT(log, HasSubstr("Files copied: 16"));
  EXPECT_THAT(log, HasSubstr("Files failed: 0"));
}

TEST_F(exporter_test, no_log_file) {
  test::write_file_at(src(), "a.pdf", "a");

  auto job = make_job();
  job.write_log = false;
  auto res = run(job);

  EXPECT_TRUE(res.log_path.empty());
  EXPECT_FALSE(fs::exists(dest() / "tap.log"));
}

TEST_F(exporter_test, results_independent_of_concurrency) {
  for (int i = 0; i < 60; ++i) {
    test::write_file_at(src(),
                        fmt::format("dir{}/file{}.{}", i % 7, i,
                                    i % 3 == 0   ? "txt"
                                    : i % 3 == 1 ? "png"
                                                 : "mp3"),
                        std::string(i * 37, 'x'));
  }
  test::write_file_at(src(), "same/x.pdf", "1");
  test::write_file_at(src(), "same/x__2.pdf", "2");
  test::write_file_at(dest(), "documents/same/x.pdf", "0");

  std::optional<category_totals> first_totals;
  std::optional<std::map<std::string, std::string>> first_tree;

  for (size_t limit : {1, 50}) {
    temporary_directory out{"tap-exporter-out"};
    auto job = make_job(limit);
    job.destination = out.path() / "export";
    job.write_log = false;
    fs::copy(dest(), job.destination, fs::copy_options::recursive);

    auto res = run(job);

    EXPECT_EQ(export_status::success, res.status()) << limit;
    EXPECT_EQ(62, res.totals.total_files()) << limit;

    auto tree = test::read_tree(job.destination);

    if (first_totals) {
      EXPECT_EQ(*first_totals, res.totals);
      EXPECT_EQ(*first_tree, tree);
    } else {
      first_totals = res.totals;
      first_tree = std::move(tree);
    }
  }
}

TEST_F(exporter_test, concurrency_ceiling) {
  for (int i = 0; i < 40; ++i) {
    test::write_file_at(src(), fmt::format("f{:02}.txt", i), "data");
  }

  fa->set_open_delay(10ms);

  for (size_t limit : {1, 3}) {
    temporary_directory out{"tap-exporter-out"};
    auto job = make_job(limit);
    job.destination = out.path() / "export";

    auto res = run(job);

    EXPECT_EQ(40, res.totals.total_files());
    EXPECT_LE(fa->max_open_inputs(), limit);
    EXPECT_GE(fa->max_open_inputs(), 1);
    EXPECT_EQ(0, fa->num_open_inputs());
  }

  EXPECT_EQ(80, fa->total_inputs_opened());
}

TEST_F(exporter_test, single_failure_is_contained) {
  for (int i = 0; i < 10; ++i) {
    test::write_file_at(src(), fmt::format("f{}.pdf", i), "pdf");
  }

  fa->set_open_error("f4.pdf",
                     std::make_error_code(std::errc::permission_denied));

  std::atomic<size_t> progress_calls{0};
  auto res = run(make_job(), [&](copy_result const&) { ++progress_calls; });

  EXPECT_EQ(export_status::partial, res.status());
  EXPECT_FALSE(res.aborted);
  EXPECT_EQ(10, progress_calls);
  EXPECT_EQ((category_count{9, 27}), res.totals.get("documents"));
  EXPECT_EQ(10, res.scanned.total_files());

  ASSERT_EQ(1, res.failures.size());
  auto const& f = res.failures.front();
  EXPECT_FALSE(f.ok());
  EXPECT_EQ(fs::path("f4.pdf"), f.record.relative_path);
  EXPECT_THAT(f.error, HasSubstr("Permission denied"));

  auto tree = test::read_tree(dest());
  EXPECT_EQ(0, tree.count("documents/f4.pdf"));
  for (int i = 0; i < 10; ++i) {
    if (i != 4) {
      EXPECT_EQ("pdf", tree.at(fmt::format("documents/f{}.pdf", i)));
    }
  }

  EXPECT_THAT(read_file(res.log_path), HasSubstr("Files failed: 1"));
  EXPECT_THAT(read_file(res.log_path), HasSubstr("EXPORT ERRORS"));
}

TEST_F(exporter_test, collisions_get_distinct_names) {
  test::write_file_at(dest(), "documents/a.pdf", "existing");
  test::write_file_at(src(), "a.pdf", "first");
  test::write_file_at(src(), "a__2.pdf", "second");

  auto res = run(make_job());

  EXPECT_EQ(export_status::success, res.status());
  EXPECT_EQ(2, res.totals.total_files());

  auto tree = test::read_tree(dest());

  EXPECT_EQ("existing", tree.at("documents/a.pdf"));
  EXPECT_EQ("first", tree.at("documents/a__2.pdf"));
  EXPECT_EQ("second", tree.at("documents/a__2__2.pdf"));
}

TEST_F(exporter_test, no_empty_category_directories) {
  test::write_file_at(src(), "a.pdf", "a");

  auto job = make_job();
  job.write_log = false;
  run(job);

  std::set<std::string> dirs;
  for (auto const& e : fs::directory_iterator(dest())) {
    dirs.insert(e.path().filename().string());
  }

  EXPECT_EQ(std::set<std::string>{"documents"}, dirs);
}

TEST_F(exporter_test, unusable_destination_aborts) {
  test::write_file_at(src(), "a.pdf", "a");
  test::write_file_at(td.path(), "blocker", "x");

  auto job = make_job();
  job.destination = td.path() / "blocker" / "out";

  auto res = run(job);

  EXPECT_EQ(export_status::aborted, res.status());
  EXPECT_TRUE(res.aborted);
  EXPECT_THAT(res.abort_reason, HasSubstr("cannot create destination"));
  EXPECT_TRUE(res.totals.empty());
  EXPECT_TRUE(res.scanned.empty());
}

TEST_F(exporter_test, destination_equal_to_source_aborts) {
  test::write_file_at(src(), "a.pdf", "a");

  auto job = make_job();
  job.destination = src();

  auto res = run(job);

  EXPECT_EQ(export_status::aborted, res.status());
  EXPECT_THAT(res.abort_reason, HasSubstr("is the source directory"));
  EXPECT_EQ((std::map<std::string, std::string>{{"a.pdf", "a"}}),
            test::read_tree(src()));
}

TEST_F(exporter_test, destination_inside_source_is_skipped) {
  test::write_file_at(src(), "a.pdf", "a");
  test::write_file_at(src(), "export/documents/old.pdf", "old");

  auto job = make_job();
  job.destination = src() / "export";
  job.write_log = false;

  auto res = run(job);

  EXPECT_EQ(export_status::success, res.status());
  EXPECT_EQ(1, res.totals.total_files());
  EXPECT_EQ((std::map<std::string, std::string>{
                {"documents/a.pdf", "a"},
                {"documents/old.pdf", "old"},
            }),
            test::read_tree(job.destination));
}

TEST_F(exporter_test, archive_skips_its_own_files) {
  test::write_file_at(src(), "top.pdf", "top");
  test::write_file_at(src(), "a/z.pdf", "z");

  // `a` is only listed once the archive has been opened
  auto job = make_job();
  job.destination = src() / "a" / "out";
  job.archive = true;
  job.keep_directory = true;

  auto res = run(job);

  EXPECT_EQ(export_status::success, res.status());
  EXPECT_EQ(2, res.totals.total_files());
  ASSERT_TRUE(res.archive);
  ASSERT_TRUE(res.archive->ok()) << res.archive->error;

  auto tree = test::read_tree(job.destination);

  EXPECT_EQ((std::set<std::string>{"documents/a/z.pdf", "documents/top.pdf",
                                   "tap.log"}),
            keys(tree));
  EXPECT_EQ(tree, test::read_zip(*res.archive->path));
}

TEST_F(exporter_test, request_stop) {
  for (int i = 0; i < 50; ++i) {
    test::write_file_at(src(), fmt::format("f{:02}.txt", i), "x");
  }

  exporter ex(lgr, os, fa, *categories, rules);

  std::atomic<bool> stopped{false};
  fa->set_open_hook([&](fs::path const&) {
    if (!stopped.exchange(true)) {
      ex.request_stop();
    }
  });

  auto res = ex.run(make_job(1));

  EXPECT_EQ(export_status::aborted, res.status());
  EXPECT_EQ("stopped on request", res.abort_reason);
  EXPECT_GE(res.totals.total_files(), 1);
  EXPECT_LE(res.totals.total_files(), 10);
  EXPECT_EQ(res.scanned, res.totals);

  // the stop request does not carry over to the next run
  fa->set_open_hook(nullptr);
  auto job = make_job(1);
  job.destination = td.path() / "again";
  auto res2 = ex.run(job);

  EXPECT_EQ(export_status::success, res2.status());
  EXPECT_EQ(50, res2.totals.total_files());
}

TEST_F(exporter_test, invalid_job) {
  auto job = make_job(0);
  EXPECT_THROW(run(job), runtime_error);

  job = make_job();
  job.buffer_size = 0;
  EXPECT_THROW(run(job), runtime_error);
}

TEST_F(exporter_test, archive_mirrors_directory) {
  make_example_tree();
  rules.add("node_modules/");

  auto job = make_job();
  job.archive = true;
  job.keep_directory = true;

  auto res = run(job);

  EXPECT_EQ(export_status::success, res.status());
  ASSERT_TRUE(res.archive);
  ASSERT_TRUE(res.archive->ok()) << res.archive->error;
  EXPECT_FALSE(res.archive->directory_removed);
  EXPECT_EQ(17, res.archive->entries);

  auto zip = dest();
  zip += ".zip";
  EXPECT_EQ(zip, *res.archive->path);

  auto tree = test::read_tree(dest());
  auto entries = test::read_zip(zip);

  EXPECT_EQ(keys(tree), keys(entries));
  EXPECT_EQ(tree, entries);
}

TEST_F(exporter_test, archive_replaces_directory) {
  test::write_file_at(src(), "a.pdf", "a");
  test::write_file_at(src(), "x/b.jpg", "b");

  auto job = make_job();
  job.archive = true;

  auto res = run(job);

  ASSERT_TRUE(res.archive);
  ASSERT_TRUE(res.archive->ok()) << res.archive->error;
  EXPECT_TRUE(res.archive->directory_removed);
  EXPECT_FALSE(fs::exists(dest()));

  auto entries = test::read_zip(*res.archive->path);

  EXPECT_EQ((std::set<std::string>{"documents/a.pdf", "images/x/b.jpg",
                                   "tap.log"}),
            keys(entries));
  EXPECT_THAT(entries.at("tap.log"), HasSubstr("Files copied: 2"));
}

TEST_F(exporter_test, archive_not_written_when_aborted) {
  for (int i = 0; i < 20; ++i) {
    test::write_file_at(src(), fmt::format("f{:02}.txt", i), "x");
  }

  exporter ex(lgr, os, fa, *categories, rules);

  std::atomic<bool> stopped{false};
  fa->set_open_hook([&](fs::path const&) {
    if (!stopped.exchange(true)) {
      ex.request_stop();
    }
  });

  auto job = make_job(1);
  job.archive = true;

  auto res = ex.run(job);

  EXPECT_EQ(export_status::aborted, res.status());
  ASSERT_TRUE(res.archive);
  EXPECT_FALSE(res.archive->ok());
  EXPECT_EQ("export was aborted", res.archive->error);

  auto zip = dest();
  zip += ".zip";
  EXPECT_FALSE(fs::exists(zip));
  EXPECT_TRUE(fs::is_directory(dest()));

  for (auto const& e : fs::directory_iterator(td.path())) {
    EXPECT_THAT(e.path().filename().string(),
                ::testing::Not(HasSubstr(".tmp-")));
  }
}

TEST_F(exporter_test, case_insensitive_destination_keeps_both_files) {
  test::write_file_at(src(), "A.pdf", "upper");
  test::write_file_at(src(), "a.pdf", "lower");
  fa->set_case_insensitive(true);

  auto job = make_job(1);
  job.write_log = false;

  auto res = run(job);

  EXPECT_EQ(export_status::success, res.status());
  EXPECT_EQ(2, res.totals.total_files());
  EXPECT_EQ((std::map<std::string, std::string>{
                {"documents/A.pdf", "upper"},
                {"documents/a__2.pdf", "lower"},
            }),
            test::read_tree(dest()));
}

TEST_F(exporter_test, case_insensitive_destination_concurrent) {
  for (int i = 0; i < 20; ++i) {
    test::write_file_at(src(), fmt::format("d{:02}/X.pdf", i), "upper");
    test::write_file_at(src(), fmt::format("d{:02}/x.pdf", i), "lower");
  }
  fa->set_case_insensitive(true);
  fa->set_open_delay(2ms);

  auto job = make_job(8);
  job.write_log = false;

  auto res = run(job);

  EXPECT_EQ(export_status::success, res.status());
  EXPECT_EQ(40, res.totals.total_files());

  auto tree = test::read_tree(dest());

  ASSERT_EQ(40, tree.size());

  for (int i = 0; i < 20; ++i) {
    std::multiset<std::string> contents;
    for (auto const& [path, content] : tree) {
      if (path.starts_with(fmt::format("documents/d{:02}/", i))) {
        contents.insert(content);
      }
    }
    EXPECT_EQ((std::multiset<std::string>{"lower", "upper"}), contents) << i;
  }
}

TEST_F(exporter_test, destination_becoming_read_only_aborts) {
  for (int i = 0; i < 30; ++i) {
    test::write_file_at(src(), fmt::format("f{:02}.pdf", i), "pdf");
  }

  std::atomic<size_t> opened{0};
  fa->set_open_hook([&](fs::path const&) {
    if (++opened == 5) {
      fa->set_create_error(
          std::make_error_code(std::errc::read_only_file_system));
      os.set_access_error(EROFS);
    }
  });

  auto res = run(make_job(1));

  EXPECT_EQ(export_status::aborted, res.status());
  EXPECT_TRUE(res.aborted);
  EXPECT_THAT(res.abort_reason, HasSubstr("is no longer writable"));
  EXPECT_EQ(4, res.totals.total_files());
  EXPECT_FALSE(res.failures.empty());
  EXPECT_LT(res.scanned.total_files(), 30);

  auto tree = test::read_tree(dest());

  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ("pdf", tree.at(fmt::format("documents/f{:02}.pdf", i)));
  }
  EXPECT_EQ(0, tree.count("documents/f04.pdf"));
}

TEST_F(exporter_test, destination_vanishing_aborts) {
  for (int i = 0; i < 30; ++i) {
    test::write_file_at(src(), fmt::format("f{:02}.pdf", i), "pdf");
  }

  std::atomic<size_t> opened{0};
  fa->set_open_hook([&](fs::path const&) {
    if (++opened == 5) {
      fs::remove_all(dest());
      write_file(dest(), "not a directory");
    }
  });

  auto res = run(make_job(1));

  EXPECT_EQ(export_status::aborted, res.status());
  EXPECT_THAT(res.abort_reason, HasSubstr("is no longer accessible"));
  EXPECT_EQ(4, res.totals.total_files());
  EXPECT_FALSE(res.failures.empty());
  EXPECT_LT(res.scanned.total_files(), 30);
  EXPECT_EQ("not a directory", read_file(dest()));
}

TEST_F(exporter_test, archive_failure_keeps_directory_export) {
  for (int i = 0; i < 10; ++i) {
    test::write_file_at(src(), fmt::format("f{}.pdf", i), "pdf");
  }

  fs::create_directories(dest());
  auto const exported = fs::canonical(dest()) / "documents" / "f3.pdf";
  fa->set_open_error(exported.string(),
                     std::make_error_code(std::errc::io_error));

  auto job = make_job(1);
  job.archive = true;

  auto res = run(job);

  EXPECT_EQ(export_status::partial, res.status());
  EXPECT_FALSE(res.aborted);
  EXPECT_TRUE(res.failures.empty());
  EXPECT_EQ((category_count{10, 30}), res.totals.get("documents"));

  ASSERT_TRUE(res.archive);
  EXPECT_FALSE(res.archive->ok());
  EXPECT_THAT(res.archive->error, HasSubstr("f3.pdf"));
  EXPECT_FALSE(res.archive->directory_removed);

  auto tree = test::read_tree(dest());

  EXPECT_EQ(11, tree.size());
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ("pdf", tree.at(fmt::format("documents/f{}.pdf", i)));
  }
  EXPECT_THAT(tree.at("tap.log"), HasSubstr("Files copied: 10"));

  auto zip = dest();
  zip += ".zip";
  EXPECT_FALSE(fs::exists(zip));

  for (auto const& e : fs::directory_iterator(td.path())) {
    EXPECT_THAT(e.path().filename().string(),
                ::testing::Not(HasSubstr(".tmp-")));
  }
}
