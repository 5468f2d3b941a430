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

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <folly/Function.h>

#include <tap/archive_writer.h>
#include <tap/category_totals.h>
#include <tap/file_record.h>
#include <tap/types.h>

namespace tap {

class category_table;
class exclusion_rules;
class file_access;
class logger;
class os_access;

struct copy_result {
  file_record record;
  std::filesystem::path destination_path;
  file_size_t bytes_copied{0};
  // empty on success
  std::string error;

  bool ok() const { return error.empty(); }
};

struct archive_outcome {
  // set once the archive has been committed
  std::optional<std::filesystem::path> path;
  std::string error;
  size_t entries{0};
  bool directory_removed{false};

  bool ok() const { return path.has_value(); }
};

enum class export_status {
  success,
  partial,
  aborted,
};

struct export_result {
  // successful copies only
  category_totals totals;
  // every record handed to a copy worker
  category_totals scanned;
  std::vector<copy_result> failures;
  std::vector<scan_event> scan_errors;
  size_t excluded{0};
  size_t skipped{0};
  bool aborted{false};
  std::string abort_reason;
  std::optional<archive_outcome> archive;
  std::filesystem::path log_path;
  std::chrono::nanoseconds elapsed{0};

  export_status status() const;
};

struct export_job {
  std::filesystem::path root;
  std::filesystem::path destination;
  size_t concurrency_limit{10};
  size_t buffer_size{static_cast<size_t>(256) << 10};
  size_t max_pending_results{1024};
  bool archive{false};
  bool keep_directory{false};
  bool write_log{true};
  archive_options archive_opts{};
};

/**
 * Copies every scanned file into `<destination>/<category>/<relative path>`
 *
 * A single producer drains the scan cursor and assigns destination names,
 * a group of `concurrency_limit` workers does the copying, and a single
 * collector thread owns the totals, the failure list and the optional
 * ZIP archive. Failures of individual files are recorded in the result
 * and never abort the run. If the destination becomes unusable, or if
 * `request_stop()` is called, no further copies are started and the
 * result is marked as aborted.
 */
class exporter {
 public:
  // called on the collector thread for every finished copy
  using progress_function = folly::Function<void(copy_result const&)>;

  exporter(logger& lgr, os_access const& os,
           std::shared_ptr<file_access const> fa,
           category_table const& categories, exclusion_rules const& excludes);
  ~exporter();

  export_result
  run(export_job const& job, progress_function progress = nullptr) {
    return impl_->run(job, std::move(progress));
  }

  // may be called from any thread
  void request_stop() { impl_->request_stop(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual export_result
    run(export_job const& job, progress_function progress) = 0;
    virtual void request_stop() = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace tap
