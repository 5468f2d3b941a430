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
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include <tap/file_record.h>

namespace tap {

class category_table;
class exclusion_rules;
class logger;
class os_access;

struct scan_stats {
  size_t files{0};
  size_t directories{0};
  size_t excluded{0};
  size_t skipped{0};
  std::vector<scan_event> errors;
};

/**
 * Lazy, depth-first walk over a directory tree
 *
 * Each call to `next()` yields the next regular file. Only the entries
 * of the directories on the current descent path are held in memory.
 * Entries are visited in sorted name order. Symbolic links are never
 * followed, and unreadable entries are recorded in `stats().errors`
 * instead of aborting the walk.
 */
class scan_cursor {
 public:
  class impl;

  explicit scan_cursor(std::unique_ptr<impl> impl);
  ~scan_cursor();

  scan_cursor(scan_cursor&&) = default;
  scan_cursor& operator=(scan_cursor&&) = default;

  std::optional<file_record> next() { return impl_->next(); }

  std::filesystem::path const& root() const { return impl_->root(); }

  scan_stats const& stats() const { return impl_->stats(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual std::optional<file_record> next() = 0;
    virtual std::filesystem::path const& root() const = 0;
    virtual scan_stats const& stats() const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

/**
 * Produces scan cursors
 *
 * The scanner, its category table and its exclusion rules must outlive
 * all cursors created from it.
 */
class scanner {
 public:
  scanner(logger& lgr, os_access const& os, category_table const& categories,
          exclusion_rules const& excludes);

  // throws if `root` is not an accessible directory
  scan_cursor scan(std::filesystem::path const& root) const {
    return impl_->scan(root);
  }

  class impl {
   public:
    virtual ~impl() = default;

    virtual scan_cursor scan(std::filesystem::path const& root) const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace tap
