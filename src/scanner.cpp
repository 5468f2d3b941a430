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
#include <system_error>

#include <fmt/format.h>

#include <tap/category_table.h>
#include <tap/error.h>
#include <tap/exclusion_rules.h>
#include <tap/logger.h>
#include <tap/os_access.h>
#include <tap/scanner.h>
#include <tap/util.h>

namespace tap {

namespace fs = std::filesystem;

namespace internal {

namespace {

struct dir_frame {
  fs::path path;
  fs::path relative_path;
  std::vector<fs::path> names;
  size_t next{0};
};

} // namespace

template <typename LoggerPolicy>
class scan_cursor_ final : public scan_cursor::impl {
 public:
  scan_cursor_(logger& lgr, os_access const& os,
               category_table const& categories,
               exclusion_rules const& excludes, fs::path const& root);

  std::optional<file_record> next() override;

  fs::path const& root() const override { return root_; }

  scan_stats const& stats() const override { return stats_; }

 private:
  void enter_directory(fs::path const& path, fs::path const& relative_path);
  void record_error(fs::path const& path, std::string message);

  LOG_PROXY_DECL(LoggerPolicy);
  os_access const& os_;
  category_table const& categories_;
  exclusion_rules const& excludes_;
  fs::path root_;
  std::vector<dir_frame> stack_;
  scan_stats stats_;
};

template <typename LoggerPolicy>
scan_cursor_<LoggerPolicy>::scan_cursor_(logger& lgr, os_access const& os,
                                         category_table const& categories,
                                         exclusion_rules const& excludes,
                                         fs::path const& root)
    : LOG_PROXY_INIT(lgr)
    , os_{os}
    , categories_{categories}
    , excludes_{excludes}
    , root_{os.canonical(root)} {
  auto st = os_.symlink_info(root_);

  if (!st.valid()) {
    TAP_THROW(runtime_error,
              fmt::format("cannot access '{}': {}", path_to_utf8_string(root),
                          exception_str(st.error())));
  }

  if (!st.is_directory()) {
    TAP_THROW(runtime_error, fmt::format("'{}' must be a directory",
                                         path_to_utf8_string(root)));
  }

  LOG_VERBOSE << "scanning " << path_to_utf8_string(root_);

  enter_directory(root_, fs::path{});

  if (stack_.empty()) {
    TAP_THROW(runtime_error,
              fmt::format("cannot read directory '{}': {}",
                          path_to_utf8_string(root),
                          stats_.errors.empty() ? std::string{}
                                                : stats_.errors.back().message));
  }
}

template <typename LoggerPolicy>
void scan_cursor_<LoggerPolicy>::enter_directory(
    fs::path const& path, fs::path const& relative_path) {
  try {
    auto d = os_.opendir(path);
    dir_frame frame{path, relative_path, {}, 0};
    fs::path name;

    while (d->read(name)) {
      frame.names.push_back(name.filename());
    }

    std::ranges::sort(frame.names);

    stack_.push_back(std::move(frame));
    ++stats_.directories;
  } catch (std::system_error const& e) {
    record_error(path, exception_str(e));
  }
}

template <typename LoggerPolicy>
void scan_cursor_<LoggerPolicy>::record_error(fs::path const& path,
                                              std::string message) {
  LOG_WARN << "cannot read '" << path_to_utf8_string(path)
           << "': " << message;
  stats_.errors.push_back({path, std::move(message)});
}

template <typename LoggerPolicy>
std::optional<file_record> scan_cursor_<LoggerPolicy>::next() {
  while (!stack_.empty()) {
    auto& top = stack_.back();

    if (top.next == top.names.size()) {
      stack_.pop_back();
      continue;
    }

    auto const& name = top.names[top.next++];
    auto path = top.path / name;
    auto rel = top.relative_path.empty() ? name : top.relative_path / name;

    if (excludes_.excludes(rel)) {
      LOG_DEBUG << "excluding " << path_to_utf8_string(rel);
      ++stats_.excluded;
      continue;
    }

    auto st = os_.symlink_info(path);

    if (!st.valid()) {
      record_error(path, exception_str(st.error()));
      continue;
    }

    switch (st.type()) {
    case posix_file_type::directory:
      if (excludes_.excludes_directory(rel)) {
        LOG_DEBUG << "excluding " << path_to_utf8_string(rel) << "/";
        ++stats_.excluded;
      } else {
        // invalidates `top`
        enter_directory(path, rel);
      }
      break;

    case posix_file_type::regular: {
      auto const& cat = categories_.classify(rel);
      LOG_TRACE << path_to_utf8_string(rel) << " -> " << cat.name();
      ++stats_.files;
      return file_record{std::move(path), std::move(rel), st.size(),
                         cat.name(), st.mtime()};
    }

    default:
      LOG_DEBUG << "skipping " << posix_file_type::name(st.type()) << " "
                << path_to_utf8_string(rel);
      ++stats_.skipped;
      break;
    }
  }

  return std::nullopt;
}

template <typename LoggerPolicy>
class scanner_ final : public scanner::impl {
 public:
  scanner_(logger& lgr, os_access const& os, category_table const& categories,
           exclusion_rules const& excludes)
      : lgr_{lgr}
      , os_{os}
      , categories_{categories}
      , excludes_{excludes} {}

  scan_cursor scan(fs::path const& root) const override {
    return scan_cursor(std::make_unique<scan_cursor_<LoggerPolicy>>(
        lgr_, os_, categories_, excludes_, root));
  }

 private:
  logger& lgr_;
  os_access const& os_;
  category_table const& categories_;
  exclusion_rules const& excludes_;
};

} // namespace internal

scan_cursor::scan_cursor(std::unique_ptr<impl> impl)
    : impl_{std::move(impl)} {}

scan_cursor::~scan_cursor() = default;

scanner::scanner(logger& lgr, os_access const& os,
                 category_table const& categories,
                 exclusion_rules const& excludes)
    : impl_{make_unique_logging_object<impl, internal::scanner_,
                                       logger_policies>(lgr, os, categories,
                                                        excludes)} {}

} // namespace tap
