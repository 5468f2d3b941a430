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

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <thread>

#include <unistd.h>

#include <archive.h>
#include <archive_entry.h>

#include <fmt/format.h>

#include <tap/error.h>
#include <tap/file_access_generic.h>
#include <tap/file_util.h>
#include <tap/util.h>

#include "test_helpers.h"

namespace tap::test {

namespace fs = std::filesystem;

namespace {

class counted_input_stream : public input_stream {
 public:
  counted_input_stream(std::unique_ptr<input_stream> is,
                       instrumented_file_access const& fa)
      : is_{std::move(is)}
      , fa_{fa} {}

  ~counted_input_stream() override { release(); }

  std::istream& is() override { return is_->is(); }

  void close(std::error_code& ec) override {
    is_->close(ec);
    release();
  }

  void close() override {
    is_->close();
    release();
  }

 private:
  void release() {
    if (!released_) {
      released_ = true;
      fa_.input_closed();
    }
  }

  std::unique_ptr<input_stream> is_;
  instrumented_file_access const& fa_;
  bool released_{false};
};

} // namespace

instrumented_file_access::instrumented_file_access()
    : fa_{create_file_access_generic()} {}

instrumented_file_access::~instrumented_file_access() = default;

namespace {

std::string fold_case(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // namespace

bool instrumented_file_access::exists_folded(fs::path const& path) const {
  std::error_code ec;
  auto const name = fold_case(path.filename().string());

  for (auto const& e : fs::directory_iterator(path.parent_path(), ec)) {
    if (fold_case(e.path().filename().string()) == name) {
      return true;
    }
  }

  return false;
}

bool instrumented_file_access::exists(fs::path const& path) const {
  if (case_insensitive_) {
    return exists_folded(path);
  }
  return fa_->exists(path);
}

std::unique_ptr<input_stream>
instrumented_file_access::open_input_binary(fs::path const& path,
                                            std::error_code& ec) const {
  for (auto const& key : {path.filename().string(), path.string()}) {
    if (auto it = open_errors_.find(key); it != open_errors_.end()) {
      ec = it->second;
      return nullptr;
    }
  }

  auto is = fa_->open_input_binary(path, ec);

  if (ec) {
    return nullptr;
  }

  auto const n = ++open_;
  auto prev = max_open_.load();
  while (prev < n && !max_open_.compare_exchange_weak(prev, n)) {
  }
  ++total_;

  auto rv = std::make_unique<counted_input_stream>(std::move(is), *this);

  if (hook_) {
    hook_(path);
  }

  if (delay_.count() > 0) {
    std::this_thread::sleep_for(delay_);
  }

  return rv;
}

std::unique_ptr<input_stream>
instrumented_file_access::open_input_binary(fs::path const& path) const {
  std::error_code ec;
  auto rv = open_input_binary(path, ec);
  if (ec) {
    throw std::system_error(ec, fmt::format("open_input_binary('{}')",
                                            path_to_utf8_string(path)));
  }
  return rv;
}

std::unique_ptr<output_stream>
instrumented_file_access::open_output(fs::path const& path) const {
  return fa_->open_output(path);
}

std::unique_ptr<output_stream>
instrumented_file_access::open_output_binary(fs::path const& path,
                                             std::error_code& ec) const {
  return fa_->open_output_binary(path, ec);
}

std::unique_ptr<output_stream>
instrumented_file_access::create_output_binary(fs::path const& path,
                                               std::error_code& ec) const {
  // checking and creating must not interleave with other threads
  std::lock_guard lock(create_mx_);

  if (create_error_) {
    ec = create_error_;
    return nullptr;
  }

  if (case_insensitive_ && exists_folded(path)) {
    ec = std::make_error_code(std::errc::file_exists);
    return nullptr;
  }

  return fa_->create_output_binary(path, ec);
}

void instrumented_file_access::set_open_error(std::string const& name,
                                              std::error_code ec) {
  open_errors_[name] = ec;
}

void instrumented_file_access::set_create_error(std::error_code ec) {
  std::lock_guard lock(create_mx_);
  create_error_ = ec;
}

void instrumented_file_access::input_closed() const { --open_; }

std::unique_ptr<dir_reader>
instrumented_os_access::opendir(fs::path const& path) const {
  return os_.opendir(path);
}

file_stat instrumented_os_access::symlink_info(fs::path const& path) const {
  return os_.symlink_info(path);
}

int instrumented_os_access::access(fs::path const& path, int mode) const {
  if (auto err = access_error_.load(); err != 0) {
    errno = err;
    return -1;
  }
  return os_.access(path, mode);
}

fs::path instrumented_os_access::canonical(fs::path const& path) const {
  return os_.canonical(path);
}

fs::path instrumented_os_access::current_path() const {
  return os_.current_path();
}

void write_file_at(fs::path const& root, std::string_view rel,
                   std::string_view content) {
  auto const path = root / rel;
  fs::create_directories(path.parent_path());
  write_file(path, content);
}

std::map<std::string, std::string> read_tree(fs::path const& root) {
  std::map<std::string, std::string> rv;

  for (auto const& e : fs::recursive_directory_iterator(root)) {
    if (e.is_regular_file()) {
      auto rel = e.path().lexically_relative(root);
      rv.emplace(u8string_to_string(rel.generic_u8string()),
                 read_file(e.path()));
    }
  }

  return rv;
}

std::map<std::string, std::string> read_zip(fs::path const& archive) {
  std::unique_ptr<struct ::archive, decltype(&::archive_read_free)> a{
      ::archive_read_new(), ::archive_read_free};

  auto error = [&a] {
    auto msg = ::archive_error_string(a.get());
    return std::string(msg ? msg : "unknown error");
  };

  ::archive_read_support_format_zip(a.get());

  if (::archive_read_open_filename(a.get(), archive.c_str(), 16384) !=
      ARCHIVE_OK) {
    TAP_THROW(runtime_error, error());
  }

  std::map<std::string, std::string> rv;
  struct ::archive_entry* ae;
  int res;

  while ((res = ::archive_read_next_header(a.get(), &ae)) == ARCHIVE_OK) {
    std::string data;
    std::array<char, 4096> buf;
    la_ssize_t n;

    while ((n = ::archive_read_data(a.get(), buf.data(), buf.size())) > 0) {
      data.append(buf.data(), static_cast<size_t>(n));
    }

    if (n < 0) {
      TAP_THROW(runtime_error, error());
    }

    rv.emplace(::archive_entry_pathname(ae), std::move(data));
  }

  if (res != ARCHIVE_EOF) {
    TAP_THROW(runtime_error, error());
  }

  return rv;
}

std::vector<std::string> parse_args(std::string_view args) {
  std::vector<std::string> rv;
  std::string current;

  for (auto c : args) {
    if (c == ' ') {
      if (!current.empty()) {
        rv.push_back(std::move(current));
        current.clear();
      }
    } else {
      current += c;
    }
  }

  if (!current.empty()) {
    rv.push_back(std::move(current));
  }

  return rv;
}

bool running_as_root() { return ::geteuid() == 0; }

} // namespace tap::test
