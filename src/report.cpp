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
#include <iterator>
#include <ostream>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <tap/exporter.h>
#include <tap/file_access.h>
#include <tap/report.h>
#include <tap/util.h>

namespace tap {

namespace fs = std::filesystem;

namespace {

constexpr size_t kRuleWidth{70};

void add_rule(std::string& out, char c) {
  out.append(kRuleWidth, c);
  out += '\n';
}

void add_section(std::string& out, std::string_view title) {
  fmt::format_to(std::back_inserter(out), "\n{}\n", title);
  add_rule(out, '-');
}

void add_totals(std::string& out, category_totals const& totals) {
  fmt::format_to(std::back_inserter(out), "Total files scanned: {}\n",
                 totals.total_files());
  fmt::format_to(std::back_inserter(out), "Total size: {}\n",
                 size_with_unit(totals.total_bytes()));

  add_section(out, "FILES BY CATEGORY");

  for (auto const& e : totals.summary()) {
    fmt::format_to(std::back_inserter(out), "{}: {} files ({})\n", e.category,
                   e.count.files, size_with_unit(e.count.bytes));
  }
}

void add_scan_errors(std::string& out, std::vector<scan_event> const& errors) {
  if (!errors.empty()) {
    add_section(out, "SCAN ERRORS");
    for (auto const& ev : errors) {
      fmt::format_to(std::back_inserter(out), "{}: {}\n",
                     path_to_utf8_string(ev.path), ev.message);
    }
  }
}

} // namespace

std::string format_summary_table(category_totals const& totals) {
  auto const rows = totals.summary();

  size_t name_width = std::string_view("TOTAL").size();
  for (auto const& e : rows) {
    name_width = std::max(name_width, e.category.size());
  }

  std::string out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "{:<{}}  {:>10}  {:>12}\n", "CATEGORY", name_width,
                 "FILES", "SIZE");

  for (auto const& e : rows) {
    fmt::format_to(it, "{:<{}}  {:>10}  {:>12}\n", e.category, name_width,
                   e.count.files, size_with_unit(e.count.bytes));
  }

  fmt::format_to(it, "{:<{}}  {:>10}  {:>12}\n", "TOTAL", name_width,
                 totals.total_files(), size_with_unit(totals.total_bytes()));

  return out;
}

std::string format_inspect_log(inspect_report const& rep, std::tm const& now) {
  std::string out;

  out += "TAP INSPECTION LOG\n";
  add_rule(out, '=');

  fmt::format_to(std::back_inserter(out), "\nSource: {}\n",
                 path_to_utf8_string(rep.root));
  fmt::format_to(std::back_inserter(out), "Timestamp: {:%Y-%m-%d %H:%M:%S}\n",
                 now);
  fmt::format_to(std::back_inserter(out), "Elapsed: {}\n\n",
                 time_with_unit(rep.elapsed));

  add_totals(out, rep.totals);

  fmt::format_to(std::back_inserter(out),
                 "\nDirectories: {}, excluded: {}, skipped: {}\n",
                 rep.stats.directories, rep.stats.excluded, rep.stats.skipped);

  add_scan_errors(out, rep.stats.errors);

  out += '\n';
  add_rule(out, '=');
  out += "End of log\n";

  return out;
}

std::string format_export_log(export_job const& job, export_result const& res,
                              std::tm const& now) {
  std::string out;
  auto it = std::back_inserter(out);

  out += "TAP LOG\n";
  add_rule(out, '=');

  fmt::format_to(it, "\nSource: {}\n", path_to_utf8_string(job.root));
  fmt::format_to(it, "Destination: {}\n",
                 path_to_utf8_string(job.destination));
  fmt::format_to(it, "Timestamp: {:%Y-%m-%d %H:%M:%S}\n\n", now);

  add_totals(out, res.scanned);

  fmt::format_to(it, "\nFiles copied: {}\n", res.totals.total_files());
  fmt::format_to(it, "Files failed: {}\n", res.failures.size());
  fmt::format_to(it, "Bytes copied: {}\n",
                 size_with_unit(res.totals.total_bytes()));

  if (res.aborted) {
    fmt::format_to(it, "Export aborted: {}\n", res.abort_reason);
  }

  add_scan_errors(out, res.scan_errors);

  if (!res.failures.empty()) {
    add_section(out, "EXPORT ERRORS");
    for (auto const& f : res.failures) {
      fmt::format_to(it, "{}: {}\n", path_to_utf8_string(f.record.source_path),
                     f.error);
    }
  }

  return out;
}

fs::path inspect_log_name(fs::path const& root, std::tm const& now) {
  auto name = path_to_utf8_string(root.filename());

  if (name.empty()) {
    name = path_to_utf8_string(root.parent_path().filename());
  }

  if (name.empty()) {
    name = "unknown";
  }

  return fmt::format("tap_inspect_{}_{:%Y%m%d_%H%M%S}.txt", name, now);
}

void write_report(file_access const& fa, fs::path const& path,
                  std::string_view content) {
  auto out = fa.open_output(path);
  out->os() << content;
  out->close();
}

} // namespace tap
