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
#include <string>
#include <string_view>

#include <tap/types.h>

namespace tap {

class file_access;
class logger;

struct archive_options {
  // 0 stores entries uncompressed, 1-9 select the deflate level
  int compression_level{6};
  size_t buffer_size{static_cast<size_t>(256) << 10};
};

/**
 * Incremental ZIP writer
 *
 * Entries are compressed and written one at a time as they are added,
 * so memory use does not depend on the size of the archive. Data goes
 * to a temporary file next to the output path, which is renamed into
 * place by `commit()`. If any entry fails, the archive is unusable:
 * `abort()`, or destroying the writer without committing, removes the
 * temporary file. All errors are reported as `archive_error`.
 *
 * Not thread-safe; all calls must come from the same thread.
 */
class archive_writer {
 public:
  archive_writer(logger& lgr, std::shared_ptr<file_access const> fa,
                 std::filesystem::path const& output,
                 archive_options const& opts = {});
  ~archive_writer();

  archive_writer(archive_writer&&) = default;
  archive_writer& operator=(archive_writer&&) = default;

  static std::string library_version();

  void add(std::string_view entry_path, std::filesystem::path const& source,
           std::optional<int64_t> mtime = std::nullopt) {
    impl_->add(entry_path, source, mtime);
  }

  std::filesystem::path const& commit() { return impl_->commit(); }

  void abort() { impl_->abort(); }

  std::filesystem::path const& output_path() const {
    return impl_->output_path();
  }

  std::filesystem::path const& temp_path() const { return impl_->temp_path(); }

  size_t num_entries() const { return impl_->num_entries(); }
  file_size_t bytes_in() const { return impl_->bytes_in(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual void add(std::string_view entry_path,
                     std::filesystem::path const& source,
                     std::optional<int64_t> mtime) = 0;
    virtual std::filesystem::path const& commit() = 0;
    virtual void abort() = 0;
    virtual std::filesystem::path const& output_path() const = 0;
    virtual std::filesystem::path const& temp_path() const = 0;
    virtual size_t num_entries() const = 0;
    virtual file_size_t bytes_in() const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace tap
