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

#include <cerrno>
#include <system_error>

#include <sys/stat.h>
#include <sys/types.h>

#include <fmt/format.h>

#include <tap/error.h>
#include <tap/file_stat.h>
#include <tap/util.h>

namespace tap {

namespace fs = std::filesystem;

std::string_view posix_file_type::name(value type) {
  switch (type) {
  case socket:
    return "socket";
  case symlink:
    return "symlink";
  case regular:
    return "regular file";
  case block:
    return "block device";
  case directory:
    return "directory";
  case character:
    return "character device";
  case fifo:
    return "fifo";
  }
  return "unknown";
}

file_stat::file_stat() = default;

file_stat::file_stat(fs::path const& path) {
  struct ::stat st;

  if (::lstat(path.c_str(), &st) != 0) {
    exception_ = std::make_exception_ptr(std::system_error(
        errno, std::generic_category(),
        fmt::format("lstat: {}", path_to_utf8_string(path))));
    return;
  }

  valid_fields_ = file_stat::all_valid;
  mode_ = st.st_mode;
  nlink_ = st.st_nlink;
  size_ = st.st_size;
  mtime_ = st.st_mtim.tv_sec;
}

void file_stat::ensure_valid(valid_fields_type fields) const {
  if ((valid_fields_ & fields) != fields) {
    if (exception_) {
      std::rethrow_exception(exception_);
    } else {
      TAP_THROW(runtime_error,
                fmt::format("missing stat fields: {:#x} (have: {:#x})", fields,
                            valid_fields_));
    }
  }
}

posix_file_type::value file_stat::type() const {
  ensure_valid(mode_valid);
  return posix_file_type::from_mode(mode_);
}

file_stat::mode_type file_stat::mode() const {
  ensure_valid(mode_valid);
  return mode_;
}

void file_stat::set_mode(mode_type mode) {
  valid_fields_ |= mode_valid;
  mode_ = mode;
}

file_stat::nlink_type file_stat::nlink() const {
  ensure_valid(nlink_valid);
  return nlink_;
}

void file_stat::set_nlink(nlink_type nlink) {
  valid_fields_ |= nlink_valid;
  nlink_ = nlink;
}

file_stat::off_type file_stat::size() const {
  ensure_valid(size_valid);
  return size_;
}

void file_stat::set_size(off_type size) {
  valid_fields_ |= size_valid;
  size_ = size;
}

file_stat::time_type file_stat::mtime() const {
  ensure_valid(mtime_valid);
  return mtime_;
}

void file_stat::set_mtime(time_type mtime) {
  valid_fields_ |= mtime_valid;
  mtime_ = mtime;
}

bool file_stat::is_directory() const {
  return type() == posix_file_type::directory;
}

bool file_stat::is_regular_file() const {
  return type() == posix_file_type::regular;
}

bool file_stat::is_symlink() const {
  return type() == posix_file_type::symlink;
}

} // namespace tap
