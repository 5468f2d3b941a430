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
#include <cerrno>
#include <istream>
#include <ostream>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

#include <fmt/format.h>

#include <tap/archive_writer.h>
#include <tap/error.h>
#include <tap/file_access.h>
#include <tap/file_util.h>
#include <tap/logger.h>
#include <tap/util.h>

namespace tap {

namespace fs = std::filesystem;

namespace internal {

template <typename LoggerPolicy>
class archive_writer_ final : public archive_writer::impl {
 public:
  using archive_ptr = std::shared_ptr<struct ::archive>;

  archive_writer_(logger& lgr, std::shared_ptr<file_access const> fa,
                  fs::path const& output, archive_options const& opts);

  ~archive_writer_() override {
    if (!committed_) {
      abort();
    }
  }

  void add(std::string_view entry_path, fs::path const& source,
           std::optional<int64_t> mtime) override;

  fs::path const& commit() override;

  void abort() override;

  fs::path const& output_path() const override { return output_; }
  fs::path const& temp_path() const override { return temp_; }

  size_t num_entries() const override { return num_entries_; }
  file_size_t bytes_in() const override { return bytes_in_; }

 private:
  static la_ssize_t on_stream_write(struct archive* a, void* client_data,
                                    void const* buffer, size_t length) {
    auto self = static_cast<archive_writer_*>(client_data);
    if (!self->out_) {
      ::archive_set_error(a, EBADF, "%s is not open", self->temp_.c_str());
      return -1;
    }
    auto& os = self->out_->os();
    os.write(static_cast<char const*>(buffer), length);
    if (!os.good()) {
      ::archive_set_error(a, errno ? errno : EIO, "write to %s failed",
                          self->temp_.c_str());
      return -1;
    }
    return static_cast<la_ssize_t>(length);
  }

  static int on_stream_close(struct archive* a, void* client_data) {
    auto self = static_cast<archive_writer_*>(client_data);
    if (!self->out_) {
      return ARCHIVE_OK;
    }
    std::error_code ec;
    self->out_->close(ec);
    if (ec) {
      ::archive_set_error(a, ec.value(), "close of %s failed: %s",
                          self->temp_.c_str(), ec.message().c_str());
      return ARCHIVE_FATAL;
    }
    return ARCHIVE_OK;
  }

  static int on_stream_free(struct archive* /*a*/, void* client_data) {
    auto self = static_cast<archive_writer_*>(client_data);
    self->out_.reset();
    return ARCHIVE_OK;
  }

  static char const* error_string(struct archive* a) {
    auto msg = ::archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
  }

  void check_result(struct archive* a, la_ssize_t res) {
    switch (res) {
    case ARCHIVE_WARN:
      LOG_WARN << error_string(a);
      break;
    case ARCHIVE_RETRY:
    case ARCHIVE_FAILED:
    case ARCHIVE_FATAL:
      failed_ = true;
      TAP_THROW(archive_error, error_string(a));
    default:
      break;
    }
  }

  void check_result(archive_ptr const& a, la_ssize_t res) {
    check_result(a.get(), res);
  }

  void ensure_usable() const {
    if (committed_) {
      TAP_THROW(archive_error, "archive has already been committed");
    }
    if (failed_ || !a_) {
      TAP_THROW(archive_error, "archive is in a failed state");
    }
  }

  LOG_PROXY_DECL(LoggerPolicy);
  std::shared_ptr<file_access const> fa_;
  fs::path const output_;
  fs::path const temp_;
  archive_options const opts_;
  archive_ptr a_;
  std::unique_ptr<output_stream> out_;
  std::vector<char> buffer_;
  size_t num_entries_{0};
  file_size_t bytes_in_{0};
  bool failed_{false};
  bool committed_{false};
};

template <typename LoggerPolicy>
archive_writer_<LoggerPolicy>::archive_writer_(
    logger& lgr, std::shared_ptr<file_access const> fa, fs::path const& output,
    archive_options const& opts)
    : LOG_PROXY_INIT(lgr)
    , fa_{std::move(fa)}
    , output_{output}
    , temp_{sibling_temp_path(output)}
    , opts_{opts}
    , buffer_(std::max<size_t>(opts.buffer_size, 4096)) {
  if (opts_.compression_level < 0 || opts_.compression_level > 9) {
    TAP_THROW(archive_error, fmt::format("invalid compression level: {}",
                                         opts_.compression_level));
  }

  LOG_DEBUG << "opening zip archive " << path_to_utf8_string(temp_);

  a_.reset(::archive_write_new(), ::archive_write_free);

  check_result(a_, ::archive_write_set_format_zip(a_.get()));

  if (opts_.compression_level == 0) {
    check_result(a_, ::archive_write_set_format_option(a_.get(), "zip",
                                                       "compression", "store"));
  } else {
    auto const level = std::to_string(opts_.compression_level);
    check_result(a_, ::archive_write_set_format_option(
                         a_.get(), "zip", "compression", "deflate"));
    check_result(a_, ::archive_write_set_format_option(
                         a_.get(), "zip", "compression-level", level.c_str()));
  }

  check_result(a_, ::archive_write_set_bytes_in_last_block(a_.get(), 1));

  std::error_code ec;
  out_ = fa_->open_output_binary(temp_, ec);

  if (ec) {
    failed_ = true;
    TAP_THROW(archive_error,
              fmt::format("cannot create '{}': {}", path_to_utf8_string(temp_),
                          ec.message()));
  }

  try {
    check_result(a_, ::archive_write_open2(a_.get(), this, nullptr,
                                           on_stream_write, on_stream_close,
                                           on_stream_free));
  } catch (archive_error const&) {
    // the destructor won't run for a partially constructed writer
    abort();
    throw;
  }
}

template <typename LoggerPolicy>
void archive_writer_<LoggerPolicy>::add(std::string_view entry_path,
                                        fs::path const& source,
                                        std::optional<int64_t> mtime) {
  ensure_usable();

  std::error_code ec;
  auto const size = fs::file_size(source, ec);

  if (ec) {
    failed_ = true;
    TAP_THROW(archive_error,
              fmt::format("cannot archive '{}': {}",
                          path_to_utf8_string(source), ec.message()));
  }

  auto in = fa_->open_input_binary(source, ec);

  if (ec) {
    failed_ = true;
    TAP_THROW(archive_error,
              fmt::format("cannot open '{}': {}", path_to_utf8_string(source),
                          ec.message()));
  }

  std::unique_ptr<::archive_entry, decltype(&::archive_entry_free)> ae{
      ::archive_entry_new(), ::archive_entry_free};

  std::string const pathname(entry_path);
  ::archive_entry_set_pathname_utf8(ae.get(), pathname.c_str());
  ::archive_entry_set_filetype(ae.get(), AE_IFREG);
  ::archive_entry_set_perm(ae.get(), 0644);
  ::archive_entry_set_size(ae.get(), static_cast<la_int64_t>(size));
  if (mtime) {
    ::archive_entry_set_mtime(ae.get(), *mtime, 0);
  }

  LOG_TRACE << "adding " << pathname << " (" << size << " bytes)";

  check_result(a_, ::archive_write_header(a_.get(), ae.get()));

  auto& is = in->is();
  uintmax_t remaining = size;

  while (remaining > 0) {
    auto const chunk = std::min<uintmax_t>(remaining, buffer_.size());
    is.read(buffer_.data(), static_cast<std::streamsize>(chunk));
    auto const got = is.gcount();

    if (got <= 0) {
      failed_ = true;
      TAP_THROW(archive_error,
                fmt::format("short read from '{}': {} bytes missing",
                            path_to_utf8_string(source), remaining));
    }

    auto const rv = ::archive_write_data(a_.get(), buffer_.data(),
                                         static_cast<size_t>(got));

    check_result(a_, rv);

    if (rv != got) {
      failed_ = true;
      TAP_THROW(archive_error, fmt::format("short write: {} != {}", rv, got));
    }

    remaining -= static_cast<uintmax_t>(got);
  }

  in->close(ec);

  check_result(a_, ::archive_write_finish_entry(a_.get()));

  ++num_entries_;
  bytes_in_ += static_cast<file_size_t>(size);
}

template <typename LoggerPolicy>
fs::path const& archive_writer_<LoggerPolicy>::commit() {
  ensure_usable();

  auto ti = LOG_TIMED_DEBUG;

  check_result(a_, ::archive_write_close(a_.get()));
  a_.reset();

  std::error_code ec;
  fs::rename(temp_, output_, ec);

  if (ec) {
    failed_ = true;
    TAP_THROW(archive_error,
              fmt::format("cannot rename '{}' to '{}': {}",
                          path_to_utf8_string(temp_),
                          path_to_utf8_string(output_), ec.message()));
  }

  committed_ = true;

  ti << "committed " << num_entries_ << " entries to "
     << path_to_utf8_string(output_);

  return output_;
}

template <typename LoggerPolicy>
void archive_writer_<LoggerPolicy>::abort() {
  if (committed_) {
    return;
  }

  if (a_) {
    // prevents libarchive from writing the central directory on free
    ::archive_write_fail(a_.get());
    a_.reset();
  }

  out_.reset();

  std::error_code ec;
  if (fs::remove(temp_, ec)) {
    LOG_DEBUG << "removed " << path_to_utf8_string(temp_);
  } else if (ec) {
    LOG_WARN << "cannot remove '" << path_to_utf8_string(temp_)
             << "': " << ec.message();
  }

  failed_ = true;
}

} // namespace internal

archive_writer::archive_writer(logger& lgr,
                               std::shared_ptr<file_access const> fa,
                               fs::path const& output,
                               archive_options const& opts)
    : impl_{make_unique_logging_object<impl, internal::archive_writer_,
                                       logger_policies>(lgr, std::move(fa),
                                                        output, opts)} {}

archive_writer::~archive_writer() = default;

std::string archive_writer::library_version() {
  return ::archive_version_string();
}

} // namespace tap
