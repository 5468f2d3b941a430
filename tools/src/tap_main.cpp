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

#include <chrono>
#include <ctime>
#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <tap/archive_writer.h>
#include <tap/category_table.h>
#include <tap/category_totals.h>
#include <tap/error.h>
#include <tap/exclusion_rules.h>
#include <tap/exporter.h>
#include <tap/file_access.h>
#include <tap/logger.h>
#include <tap/os_access.h>
#include <tap/report.h>
#include <tap/scanner.h>
#include <tap/terminal.h>
#include <tap/util.h>
#include <tap/tool/iolayer.h>
#include <tap/tool/tap_main.h>
#include <tap/tool/tool.h>

namespace tap::tool {

namespace po = boost::program_options;

namespace {

constexpr int kExitSuccess{0};
constexpr int kExitError{1};
constexpr int kExitPartial{2};

struct tap_options {
  std::string command;
  std::string input;
  std::string output;
  std::vector<std::string> excludes;
  std::vector<std::string> categories;
  std::string buffer_size_str;
  size_t num_workers{10};
  int compression_level{6};
  bool zip{false};
  bool keep_directory{false};
  bool no_default_excludes{false};
  bool first_match_wins{false};
  bool log_file{false};
  bool no_log_file{false};
};

class console {
 public:
  explicit console(iolayer const& iol)
      : iol_{iol}
      , color_{iol.term->is_tty(iol.out) && iol.term->is_fancy()} {}

  std::ostream& out() const { return iol_.out; }

  std::string heading(std::string_view text) const {
    return iol_.term->colored(text, termcolor::BOLD_WHITE, color_);
  }

  std::string good(std::string_view text) const {
    return iol_.term->colored(text, termcolor::GREEN, color_);
  }

  std::string bad(std::string_view text) const {
    return iol_.term->colored(text, termcolor::BOLD_RED, color_);
  }

  std::string warn(std::string_view text) const {
    return iol_.term->colored(text, termcolor::YELLOW, color_);
  }

 private:
  iolayer const& iol_;
  bool const color_;
};

category_table make_categories(logger& lgr, tap_options const& opts) {
  std::vector<category_definition> defs;

  if (opts.categories.empty()) {
    defs = category_table::builtin_definitions();
  } else {
    for (auto const& arg : opts.categories) {
      defs.push_back(category_table::parse_definition(arg));
    }
  }

  category_table::options catopts;

  if (opts.first_match_wins) {
    catopts.duplicates = category_table::duplicate_policy::first_match_wins;
  }

  return category_table(lgr, defs, catopts);
}

exclusion_rules make_exclusions(tap_options const& opts) {
  exclusion_rules rules;

  if (!opts.no_default_excludes) {
    for (auto const& pattern : exclusion_rules::default_patterns()) {
      rules.add(pattern);
    }
  }

  for (auto const& pattern : opts.excludes) {
    rules.add(pattern);
  }

  return rules;
}

void print_scan_errors(console const& con, std::vector<scan_event> const& ev) {
  if (!ev.empty()) {
    con.out() << "\n"
              << con.warn(fmt::format("{} scan error(s):", ev.size())) << "\n";
    for (auto const& e : ev) {
      con.out() << "  " << path_to_utf8_string(e.path) << ": " << e.message
                << "\n";
    }
  }
}

int do_inspect(logger& lgr, iolayer const& iol, tap_options const& opts,
               category_table const& categories,
               exclusion_rules const& excludes) {
  LOG_PROXY(debug_logger_policy, lgr);
  console con(iol);

  auto const start = std::chrono::steady_clock::now();

  scanner sc(lgr, *iol.os, categories, excludes);
  auto cursor = sc.scan(opts.input);

  inspect_report rep;
  rep.root = cursor.root();
  rep.totals = aggregate(cursor);
  rep.stats = cursor.stats();
  rep.elapsed = std::chrono::steady_clock::now() - start;

  con.out() << con.heading(fmt::format("Contents of {}",
                                       path_to_utf8_string(rep.root)))
            << "\n\n"
            << format_summary_table(rep.totals) << "\n";

  con.out() << fmt::format(
      "{} directories scanned, {} entries excluded, {} skipped in {}\n",
      rep.stats.directories, rep.stats.excluded, rep.stats.skipped,
      time_with_unit(rep.elapsed));

  print_scan_errors(con, rep.stats.errors);

  if (opts.log_file) {
    auto const now = safe_localtime(std::time(nullptr));
    auto const path = iol.os->current_path() / inspect_log_name(rep.root, now);

    write_report(*iol.file, path, format_inspect_log(rep, now));

    LOG_INFO << "log written to " << path_to_utf8_string(path);
  }

  return kExitSuccess;
}

int do_export(logger& lgr, iolayer const& iol, tap_options const& opts,
              category_table const& categories,
              exclusion_rules const& excludes) {
  LOG_PROXY(debug_logger_policy, lgr);
  console con(iol);

  if (opts.output.empty()) {
    LOG_ERROR << "export requires an output directory (--output)";
    return kExitError;
  }

  if (opts.num_workers < 1) {
    LOG_ERROR << "--num-workers must be at least 1";
    return kExitError;
  }

  export_job job;
  job.root = opts.input;
  job.destination = opts.output;
  job.concurrency_limit = opts.num_workers;
  job.archive = opts.zip;
  job.keep_directory = opts.keep_directory;
  job.write_log = !opts.no_log_file;
  job.archive_opts.compression_level = opts.compression_level;

  auto const buffer_size = parse_size_with_unit(opts.buffer_size_str);

  if (buffer_size < 1) {
    LOG_ERROR << "--buffer-size must not be zero";
    return kExitError;
  }

  job.buffer_size = static_cast<size_t>(buffer_size);
  job.archive_opts.buffer_size = job.buffer_size;

  exporter ex(lgr, *iol.os, iol.file, categories, excludes);
  auto res = ex.run(job);

  con.out() << con.heading(fmt::format("Exported {} to {}",
                                       path_to_utf8_string(job.root),
                                       path_to_utf8_string(job.destination)))
            << "\n\n"
            << format_summary_table(res.totals) << "\n";

  con.out() << fmt::format("{} copied, {} failed in {}\n",
                           res.totals.total_files(), res.failures.size(),
                           time_with_unit(res.elapsed));

  if (!res.failures.empty()) {
    con.out() << "\n"
              << con.warn(fmt::format("{} file(s) could not be exported:",
                                      res.failures.size()))
              << "\n";
    for (auto const& f : res.failures) {
      con.out() << "  " << path_to_utf8_string(f.record.source_path) << ": "
                << f.error << "\n";
    }
  }

  print_scan_errors(con, res.scan_errors);

  if (res.archive) {
    if (res.archive->ok()) {
      con.out() << "\narchive: " << path_to_utf8_string(*res.archive->path)
                << " (" << res.archive->entries << " entries)\n";
    } else {
      con.out() << "\n"
                << con.bad("archive failed: " + res.archive->error) << "\n";
    }
  }

  switch (res.status()) {
  case export_status::success:
    con.out() << "\n" << con.good("export complete") << "\n";
    return kExitSuccess;

  case export_status::partial:
    con.out() << "\n" << con.warn("export completed with errors") << "\n";
    return kExitPartial;

  case export_status::aborted:
    con.out() << "\n"
              << con.bad("export aborted: " + res.abort_reason) << "\n";
    return kExitError;
  }

  return kExitError;
}

} // namespace

int tap_main(int argc, char** argv, iolayer const& iol) {
  tap_options opts;
  logger_options logopts;

  auto const compression_desc = fmt::format(
      "zip compression level (0 = store, 1-9 = deflate), libarchive {}",
      archive_writer::library_version());

  // clang-format off
  po::options_description opts_desc("Command line options");
  opts_desc.add_options()
    ("command",
        po::value<std::string>(&opts.command),
        "command (inspect, export)")
    ("input,i",
        po::value<std::string>(&opts.input),
        "drive or directory to read")
    ("output,o",
        po::value<std::string>(&opts.output),
        "output directory (export)")
    ("zip,z",
        po::value<bool>(&opts.zip)->zero_tokens(),
        "also create <output>.zip (export)")
    ("keep-directory",
        po::value<bool>(&opts.keep_directory)->zero_tokens(),
        "keep the output directory after archiving (export)")
    ("num-workers,j",
        po::value<size_t>(&opts.num_workers)->default_value(10),
        "maximum number of concurrent copies (export)")
    ("compression-level",
        po::value<int>(&opts.compression_level)->default_value(6),
        compression_desc.c_str())
    ("buffer-size",
        po::value<std::string>(&opts.buffer_size_str)->default_value("256k"),
        "copy and archive buffer size (export)")
    ("exclude,x",
        po::value<std::vector<std::string>>(&opts.excludes),
        "exclude entries matching this glob (repeatable)")
    ("no-default-excludes",
        po::value<bool>(&opts.no_default_excludes)->zero_tokens(),
        "do not exclude hidden, system and node_modules entries")
    ("category,c",
        po::value<std::vector<std::string>>(&opts.categories),
        "category definition NAME=.ext,.ext (repeatable, replaces built-ins)")
    ("first-match-wins",
        po::value<bool>(&opts.first_match_wins)->zero_tokens(),
        "allow an extension in several categories, first definition wins")
    ("log-file",
        po::value<bool>(&opts.log_file)->zero_tokens(),
        "write an inspection log to the current directory (inspect)")
    ("no-log-file",
        po::value<bool>(&opts.no_log_file)->zero_tokens(),
        "do not write tap.log into the output directory (export)")
    ;
  // clang-format on

  tool::add_common_options(opts_desc, logopts);

  po::positional_options_description pos;
  pos.add("command", 1);
  pos.add("input", 1);

  po::variables_map vm;

  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(opts_desc)
                  .positional(pos)
                  .run(),
              vm);
    po::notify(vm);
  } catch (po::error const& e) {
    iol.err << "error: " << e.what() << "\n";
    return kExitError;
  }

  auto constexpr usage = "Usage: tap inspect <path> [OPTIONS...]\n"
                         "       tap export <path> -o <dir> [OPTIONS...]\n";

  if (vm.contains("help") or !vm.contains("command")) {
    iol.out << tool::tool_header("tap") << usage << "\n" << opts_desc << "\n";
    return kExitSuccess;
  }

  if (opts.command != "inspect" && opts.command != "export") {
    iol.err << "error: unknown command '" << opts.command << "'\n" << usage;
    return kExitError;
  }

  if (opts.input.empty()) {
    iol.err << "error: no input path given\n" << usage;
    return kExitError;
  }

  try {
    stream_logger lgr(iol.term, iol.err, logopts);

    auto const categories = make_categories(lgr, opts);
    auto const excludes = make_exclusions(opts);

    if (opts.command == "inspect") {
      return do_inspect(lgr, iol, opts, categories, excludes);
    }

    return do_export(lgr, iol, opts, categories, excludes);
  } catch (config_error const& e) {
    iol.err << "configuration error: " << e.what() << "\n";
  } catch (std::exception const& e) {
    iol.err << "error: " << exception_str(e) << "\n";
  }

  return kExitError;
}

} // namespace tap::tool
