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

#include <atomic>
#include <cerrno>
#include <ctime>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <system_error>
#include <unordered_set>
#include <vector>

#include <unistd.h>

#include <fmt/format.h>

#include <tap/archive_writer.h>
#include <tap/error.h>
#include <tap/exporter.h>
#include <tap/file_access.h>
#include <tap/logger.h>
#include <tap/os_access.h>
#include <tap/report.h>
#include <tap/scanner.h>
#include <tap/util.h>

#include <tap/internal/worker_group.h>

namespace tap {

namespace fs = std::filesystem;

namespace internal {

namespace {

constexpr std::string_view kLogFileName{"tap.log"};

bool is_within(fs::path const& p, fs::path const& dir) {
  auto rel = p.lexically_relative(dir);
  return !rel.empty() && *rel.begin() != "..";
}

std::string entry_name(fs::path const& p, fs::path const& base) {
  return u8string_to_string(p.lexically_relative(base).generic_u8string());
}

} // namespace

template <typename LoggerPolicy>
class exporter_ final : public exporter::impl {
 public:
  exporter_(logger& lgr, os_access const& os,
            std::shared_ptr<file_access const> fa,
            category_table const& categories, exclusion_rules const& excludes)
      : LOG_PROXY_INIT(lgr)
      , os_{os}
      , fa_{std::move(fa)}
      , scanner_{lgr, os, categories, excludes} {}

  export_result
  run(export_job const& job, exporter::progress_function progress) override;

  void request_stop() override {
    LOG_INFO << "stop requested";
    stop_requested_ = true;
  }

 private:
  struct run_state {
    run_state(export_job const& j, exporter::progress_function p)
        : job{j}
        , progress{std::move(p)} {}

    export_job const& job;
    exporter::progress_function progress;
    fs::path destination;
    fs::path archive_path;
    fs::path archive_temp_path;

    std::mutex claim_mx;
    std::unordered_set<fs::path::string_type> claimed;

    // collector thread only
    category_totals totals;
    std::vector<copy_result> failures;
    std::unique_ptr<archive_writer> archive;
    archive_outcome archive_result;

    std::mutex mx;
    std::atomic<bool> fatal{false};
    std::string fatal_reason;
  };

  void prepare_destination(run_state& st, fs::path const& root) const;
  bool is_own_output(run_state const& st, fs::path const& p) const;
  bool is_taken(run_state const& st, fs::path const& p) const;
  fs::path assign_destination(run_state& st, file_record const& rec) const;
  std::unique_ptr<output_stream>
  create_destination(run_state& st, copy_result& cr) const;
  std::optional<std::string> check_destination(run_state const& st) const;
  copy_result copy_file(run_state& st, file_record&& rec, fs::path&& dest);
  void copy_contents(run_state& st, copy_result& cr, bool& created) const;
  void collect(run_state& st, copy_result&& cr);
  void set_fatal(run_state& st, std::string reason);
  void open_archive(run_state& st);
  void finish_archive(run_state& st, export_result& res);
  void write_log(run_state const& st, export_result& res);

  LOG_PROXY_DECL(LoggerPolicy);
  os_access const& os_;
  std::shared_ptr<file_access const> fa_;
  scanner scanner_;
  std::atomic<bool> stop_requested_{false};
};

template <typename LoggerPolicy>
void exporter_<LoggerPolicy>::prepare_destination(run_state& st,
                                                  fs::path const& root) const {
  std::error_code ec;
  fs::create_directories(st.job.destination, ec);

  if (ec || !fs::is_directory(st.job.destination)) {
    TAP_THROW(fatal_io_error,
              fmt::format("cannot create destination '{}': {}",
                          path_to_utf8_string(st.job.destination),
                          ec ? ec.message() : "not a directory"));
  }

  st.destination = canonical_path(st.job.destination);

  if (st.destination == root) {
    TAP_THROW(fatal_io_error,
              fmt::format("destination '{}' is the source directory",
                          path_to_utf8_string(st.destination)));
  }
}

template <typename LoggerPolicy>
bool exporter_<LoggerPolicy>::is_own_output(run_state const& st,
                                            fs::path const& p) const {
  return is_within(p, st.destination) ||
         (!st.archive_path.empty() &&
          (p == st.archive_path || p == st.archive_temp_path));
}

template <typename LoggerPolicy>
bool exporter_<LoggerPolicy>::is_taken(run_state const& st,
                                       fs::path const& p) const {
  return st.claimed.contains(p.native()) || fa_->exists(p);
}

template <typename LoggerPolicy>
fs::path
exporter_<LoggerPolicy>::assign_destination(run_state& st,
                                            file_record const& rec) const {
  auto const base = st.destination / rec.category / rec.relative_path;
  auto candidate = base;

  std::lock_guard lock(st.claim_mx);

  for (size_t n = 2; is_taken(st, candidate); ++n) {
    auto name = base.stem();
    name += fmt::format("__{}", n);
    name += base.extension();
    candidate = base.parent_path() / name;
  }

  if (candidate != base) {
    LOG_VERBOSE << "renaming " << path_to_utf8_string(rec.relative_path)
                << " to " << path_to_utf8_string(candidate.filename())
                << " in category " << rec.category;
  }

  st.claimed.insert(candidate.native());

  return candidate;
}

template <typename LoggerPolicy>
std::unique_ptr<output_stream>
exporter_<LoggerPolicy>::create_destination(run_state& st,
                                            copy_result& cr) const {
  for (;;) {
    std::error_code ec;
    auto out = fa_->create_output_binary(cr.destination_path, ec);

    if (!ec) {
      return out;
    }

    if (ec != std::errc::file_exists) {
      throw std::system_error(
          ec, fmt::format("cannot create '{}'",
                          path_to_utf8_string(cr.destination_path)));
    }

    // someone else got there first, e.g. a name differing only in case
    // on a case-insensitive file system
    auto dest = assign_destination(st, cr.record);

    LOG_VERBOSE << path_to_utf8_string(cr.destination_path)
                << " already exists, using "
                << path_to_utf8_string(dest.filename()) << " instead";

    cr.destination_path = std::move(dest);
  }
}

template <typename LoggerPolicy>
std::optional<std::string>
exporter_<LoggerPolicy>::check_destination(run_state const& st) const {
  std::error_code ec;

  if (!fs::is_directory(st.destination, ec)) {
    return "is no longer accessible";
  }

  if (os_.access(st.destination, W_OK) != 0) {
    return fmt::format("is no longer writable: {}",
                       std::generic_category().message(errno));
  }

  return std::nullopt;
}

template <typename LoggerPolicy>
void exporter_<LoggerPolicy>::copy_contents(run_state& st, copy_result& cr,
                                            bool& created) const {
  fs::create_directories(cr.destination_path.parent_path());

  auto in = fa_->open_input_binary(cr.record.source_path);
  auto out = create_destination(st, cr);
  created = true;

  std::vector<char> buffer(st.job.buffer_size);
  auto& is = in->is();
  auto& os = out->os();

  while (is) {
    is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto const n = is.gcount();

    if (n > 0) {
      os.write(buffer.data(), n);

      if (!os) {
        TAP_THROW(runtime_error,
                  fmt::format("write to '{}' failed",
                              path_to_utf8_string(cr.destination_path)));
      }

      cr.bytes_copied += n;
    }
  }

  if (is.bad()) {
    TAP_THROW(runtime_error,
              fmt::format("read from '{}' failed",
                          path_to_utf8_string(cr.record.source_path)));
  }

  out->close();
  in->close();

  std::error_code ec;
  auto const mtime = fs::last_write_time(cr.record.source_path, ec);

  if (!ec) {
    fs::last_write_time(cr.destination_path, mtime, ec);
  }

  if (ec) {
    LOG_DEBUG << "cannot preserve modification time of "
              << path_to_utf8_string(cr.destination_path) << ": "
              << ec.message();
  }
}

template <typename LoggerPolicy>
copy_result exporter_<LoggerPolicy>::copy_file(run_state& st,
                                               file_record&& rec,
                                               fs::path&& dest) {
  copy_result cr;
  cr.record = std::move(rec);
  cr.destination_path = std::move(dest);

  LOG_TRACE << "copying " << path_to_utf8_string(cr.record.source_path)
            << " to " << path_to_utf8_string(cr.destination_path);

  bool created = false;

  try {
    copy_contents(st, cr, created);
  } catch (std::exception const& e) {
    cr.error = e.what();
  }

  if (!cr.ok()) {
    if (created) {
      std::error_code ec;
      fs::remove(cr.destination_path, ec);
    }

    if (auto why = check_destination(st)) {
      set_fatal(st, fmt::format("destination '{}' {}",
                                path_to_utf8_string(st.destination), *why));
    }
  }

  return cr;
}

template <typename LoggerPolicy>
void exporter_<LoggerPolicy>::collect(run_state& st, copy_result&& cr) {
  if (cr.ok()) {
    st.totals.add(cr.record.category, cr.bytes_copied);

    if (st.archive && st.archive_result.error.empty()) {
      try {
        st.archive->add(entry_name(cr.destination_path, st.destination),
                        cr.destination_path, cr.record.mtime);
      } catch (archive_error const& e) {
        LOG_ERROR << "archive creation failed: " << e.what();
        st.archive_result.error = e.what();
        st.archive->abort();
      }
    }
  } else {
    LOG_WARN << "failed to export "
             << path_to_utf8_string(cr.record.source_path) << ": "
             << cr.error;
  }

  if (st.progress) {
    st.progress(cr);
  }

  if (!cr.ok()) {
    st.failures.push_back(std::move(cr));
  }
}

template <typename LoggerPolicy>
void exporter_<LoggerPolicy>::set_fatal(run_state& st, std::string reason) {
  std::lock_guard lock(st.mx);

  if (!st.fatal) {
    LOG_ERROR << reason;
    st.fatal_reason = std::move(reason);
    st.fatal = true;
  }
}

template <typename LoggerPolicy>
void exporter_<LoggerPolicy>::open_archive(run_state& st) {
  auto zip = st.destination;
  zip += ".zip";

  st.archive_path = zip;

  try {
    st.archive = std::make_unique<archive_writer>(LOG_GET_LOGGER, fa_, zip,
                                                  st.job.archive_opts);
    st.archive_temp_path = st.archive->temp_path();
  } catch (archive_error const& e) {
    LOG_ERROR << "cannot create archive: " << e.what();
    st.archive_result.error = e.what();
  }
}

template <typename LoggerPolicy>
void exporter_<LoggerPolicy>::write_log(run_state const& st,
                                        export_result& res) {
  auto path = st.destination / kLogFileName;

  try {
    write_report(*fa_, path,
                 format_export_log(st.job, res,
                                   safe_localtime(std::time(nullptr))));
    res.log_path = std::move(path);
  } catch (std::system_error const& e) {
    LOG_ERROR << "cannot write " << path_to_utf8_string(path) << ": "
              << e.what();
  }
}

template <typename LoggerPolicy>
void exporter_<LoggerPolicy>::finish_archive(run_state& st,
                                             export_result& res) {
  auto& ao = st.archive_result;

  if (st.archive && ao.error.empty()) {
    if (res.aborted) {
      st.archive->abort();
      ao.error = "export was aborted";
    } else {
      try {
        if (!res.log_path.empty()) {
          st.archive->add(kLogFileName, res.log_path, std::time(nullptr));
        }
        ao.entries = st.archive->num_entries();
        ao.path = st.archive->commit();
        LOG_INFO << "wrote " << path_to_utf8_string(*ao.path) << " ("
                 << ao.entries << " entries)";
      } catch (archive_error const& e) {
        LOG_ERROR << "archive creation failed: " << e.what();
        ao.error = e.what();
        st.archive->abort();
      }
    }
  }

  if (ao.ok() && !st.job.keep_directory) {
    std::error_code ec;
    fs::remove_all(st.destination, ec);

    if (ec) {
      LOG_WARN << "cannot remove " << path_to_utf8_string(st.destination)
               << ": " << ec.message();
    } else {
      LOG_VERBOSE << "removed " << path_to_utf8_string(st.destination);
      ao.directory_removed = true;
    }
  }

  st.archive.reset();
  res.archive = std::move(ao);
}

template <typename LoggerPolicy>
export_result
exporter_<LoggerPolicy>::run(export_job const& job,
                             exporter::progress_function progress) {
  if (job.concurrency_limit < 1) {
    TAP_THROW(runtime_error, "concurrency limit must be at least 1");
  }

  if (job.buffer_size < 1) {
    TAP_THROW(runtime_error, "copy buffer size must not be zero");
  }

  auto const start = std::chrono::steady_clock::now();
  auto ti = LOG_TIMED_INFO;

  auto cursor = scanner_.scan(job.root);
  run_state st(job, std::move(progress));
  export_result res;

  try {
    prepare_destination(st, cursor.root());
  } catch (fatal_io_error const& e) {
    LOG_ERROR << e.what();
    res.aborted = true;
    res.abort_reason = e.what();
    res.elapsed = std::chrono::steady_clock::now() - start;
    stop_requested_ = false;
    return res;
  }

  bool const skip_own_output = is_within(st.destination, cursor.root());

  if (job.archive) {
    open_archive(st);
  }

  LOG_VERBOSE << "exporting to " << path_to_utf8_string(st.destination)
              << " with " << job.concurrency_limit << " workers";

  {
    worker_group collector(LOG_GET_LOGGER, "collect", 1,
                           job.max_pending_results);
    worker_group copiers(LOG_GET_LOGGER, "copy", job.concurrency_limit,
                         2 * job.concurrency_limit);

    while (!stop_requested_ && !st.fatal) {
      auto rec = cursor.next();

      if (!rec) {
        break;
      }

      if (skip_own_output && is_own_output(st, rec->source_path)) {
        LOG_DEBUG << "skipping " << path_to_utf8_string(rec->source_path)
                  << ", it is part of the export";
        continue;
      }

      auto dest = assign_destination(st, *rec);

      res.scanned.add(*rec);

      copiers.add_job([this, &st, &collector, r = std::move(*rec),
                       d = std::move(dest)]() mutable {
        auto cr = copy_file(st, std::move(r), std::move(d));
        collector.add_job([this, &st, cr = std::move(cr)]() mutable {
          collect(st, std::move(cr));
        });
      });
    }

    copiers.wait();
    copiers.stop();
    collector.wait();
    collector.stop();
  }

  auto const& stats = cursor.stats();
  res.scan_errors = stats.errors;
  res.excluded = stats.excluded;
  res.skipped = stats.skipped;
  res.totals = std::move(st.totals);
  res.failures = std::move(st.failures);

  if (st.fatal) {
    res.aborted = true;
    res.abort_reason = st.fatal_reason;
  } else if (stop_requested_) {
    res.aborted = true;
    res.abort_reason = "stopped on request";
  }

  stop_requested_ = false;

  res.elapsed = std::chrono::steady_clock::now() - start;

  if (job.write_log) {
    write_log(st, res);
  }

  if (job.archive) {
    finish_archive(st, res);
  }

  res.elapsed = std::chrono::steady_clock::now() - start;

  ti << "exported " << res.totals.total_files() << "/"
     << res.scanned.total_files() << " files ("
     << size_with_unit(res.totals.total_bytes()) << ")";

  return res;
}

} // namespace internal

export_status export_result::status() const {
  if (aborted) {
    return export_status::aborted;
  }

  if (!failures.empty() || (archive && !archive->ok())) {
    return export_status::partial;
  }

  return export_status::success;
}

exporter::exporter(logger& lgr, os_access const& os,
                   std::shared_ptr<file_access const> fa,
                   category_table const& categories,
                   exclusion_rules const& excludes)
    : impl_{make_unique_logging_object<impl, internal::exporter_,
                                       logger_policies>(
          lgr, os, std::move(fa), categories, excludes)} {}

exporter::~exporter() = default;

} // namespace tap
