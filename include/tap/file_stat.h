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

#include <cstdint>
#include <exception>
#include <filesystem>

#include <tap/file_type.h>

namespace tap {

/**
 * Metadata of a single directory entry, as seen by lstat(2)
 *
 * A failed lstat does not throw on construction. The error is stored and
 * rethrown by the first accessor that needs the missing fields.
 */
class file_stat {
 public:
  using valid_fields_type = uint32_t;
  using mode_type = uint32_t;
  using nlink_type = uint64_t;
  using off_type = int64_t;
  using time_type = int64_t;

  static constexpr valid_fields_type mode_valid = 1 << 0;
  static constexpr valid_fields_type nlink_valid = 1 << 1;
  static constexpr valid_fields_type size_valid = 1 << 2;
  static constexpr valid_fields_type mtime_valid = 1 << 3;
  static constexpr valid_fields_type all_valid = (1 << 4) - 1;

  file_stat();
  explicit file_stat(std::filesystem::path const& path);

  void ensure_valid(valid_fields_type fields) const;
  bool valid() const { return valid_fields_ == all_valid; }
  std::exception_ptr error() const { return exception_; }

  posix_file_type::value type() const;

  mode_type mode() const;
  void set_mode(mode_type mode);

  nlink_type nlink() const;
  void set_nlink(nlink_type nlink);

  off_type size() const;
  void set_size(off_type size);

  time_type mtime() const;
  void set_mtime(time_type mtime);

  bool is_directory() const;
  bool is_regular_file() const;
  bool is_symlink() const;

 private:
  valid_fields_type valid_fields_{0};
  mode_type mode_{};
  nlink_type nlink_{};
  off_type size_{};
  time_type mtime_{};
  std::exception_ptr exception_;
};

} // namespace tap
