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
#include <unordered_map>
#include <unordered_set>

#include <fmt/format.h>

#include <folly/small_vector.h>

#include <tap/category_table.h>
#include <tap/error.h>
#include <tap/logger.h>
#include <tap/string.h>
#include <tap/util.h>

namespace tap {

namespace fs = std::filesystem;

namespace internal {

namespace {

void check_category_name(std::string_view name) {
  if (name.empty()) {
    TAP_THROW(config_error, "empty category name");
  }

  if (name == category_table::fallback_name) {
    TAP_THROW(config_error,
              fmt::format("category name '{}' is reserved for the fallback "
                          "category",
                          name));
  }

  if (name == "." || name == ".." ||
      name.find_first_of("/\\") != std::string_view::npos) {
    TAP_THROW(config_error, fmt::format("invalid category name: '{}'", name));
  }
}

} // namespace

template <typename LoggerPolicy>
class category_table_ final : public category_table::impl {
 public:
  category_table_(logger& lgr, std::span<category_definition const> defs,
                  category_table::options const& opts);

  category const& classify(fs::path const& path) const override;

  category const& fallback() const override { return categories_.back(); }

  category const* find(std::string_view name) const override {
    auto it = std::ranges::find_if(
        categories_, [name](auto const& c) { return c.name() == name; });
    return it == categories_.end() ? nullptr : &*it;
  }

  std::vector<category const*> categories() const override {
    std::vector<category const*> rv;
    rv.reserve(categories_.size());
    for (auto const& c : categories_) {
      rv.push_back(&c);
    }
    return rv;
  }

  std::span<category_conflict const> conflicts() const override {
    return conflicts_;
  }

  size_t size() const override { return categories_.size(); }

 private:
  LOG_PROXY_DECL(LoggerPolicy);
  std::vector<category> categories_;
  std::unordered_map<std::string, size_t> index_;
  std::vector<category_conflict> conflicts_;
  size_t max_suffix_parts_{1};
};

template <typename LoggerPolicy>
category_table_<LoggerPolicy>::category_table_(
    logger& lgr, std::span<category_definition const> defs,
    category_table::options const& opts)
    : LOG_PROXY_INIT(lgr) {
  std::unordered_set<std::string_view> names;

  categories_.reserve(defs.size() + 1);

  for (auto const& def : defs) {
    check_category_name(def.name);

    if (!names.insert(def.name).second) {
      TAP_THROW(config_error,
                fmt::format("duplicate category name: '{}'", def.name));
    }

    auto const self = categories_.size();
    std::vector<std::string> extensions;

    for (auto const& raw : def.extensions) {
      auto ext = category_table::normalize_extension(raw);
      auto [it, inserted] = index_.emplace(ext, self);

      if (!inserted) {
        if (it->second == self) {
          LOG_DEBUG << "ignoring repeated extension " << ext << " in category "
                    << def.name;
          continue;
        }

        auto const& owner = categories_[it->second].name();

        if (opts.duplicates == category_table::duplicate_policy::strict) {
          TAP_THROW(config_error,
                    fmt::format("extension '{}' is claimed by both '{}' and "
                                "'{}'",
                                ext, owner, def.name));
        }

        LOG_WARN << "extension " << ext << " already belongs to category "
                 << owner << ", ignoring it for category " << def.name;
        conflicts_.push_back({ext, owner, def.name});
        continue;
      }

      max_suffix_parts_ = std::max<size_t>(max_suffix_parts_,
                                           std::ranges::count(ext, '.'));
      extensions.push_back(std::move(ext));
    }

    if (extensions.empty()) {
      LOG_WARN << "category " << def.name << " has no extensions";
    }

    categories_.emplace_back(def.name, std::move(extensions));
  }

  categories_.emplace_back(std::string(category_table::fallback_name),
                           std::vector<std::string>{});

  LOG_VERBOSE << "category table: " << categories_.size() << " categories, "
              << index_.size() << " extensions";
}

template <typename LoggerPolicy>
category const&
category_table_<LoggerPolicy>::classify(fs::path const& path) const {
  auto const name = to_lower(path_to_utf8_string(path.filename()));

  // dot positions from right to left; a leading dot does not start an
  // extension
  folly::small_vector<size_t, 4> dots;
  auto pos = name.size();

  while (dots.size() < max_suffix_parts_ && pos > 0) {
    pos = name.rfind('.', pos - 1);
    if (pos == std::string::npos || pos == 0) {
      break;
    }
    dots.push_back(pos);
  }

  // longest suffix first, so ".tar.gz" wins over ".gz"
  for (auto it = dots.rbegin(); it != dots.rend(); ++it) {
    if (auto m = index_.find(name.substr(*it)); m != index_.end()) {
      return categories_[m->second];
    }
  }

  return fallback();
}

} // namespace internal

category_table::category_table(logger& lgr,
                               std::span<category_definition const> defs,
                               options const& opts)
    : impl_{make_unique_logging_object<impl, internal::category_table_,
                                       logger_policies>(lgr, defs, opts)} {}

category_table::~category_table() = default;

category_definition
category_table::parse_definition(std::string_view arg) {
  auto const pos = arg.find('=');

  if (pos == std::string_view::npos) {
    TAP_THROW(config_error,
              fmt::format("invalid category definition '{}', expected "
                          "NAME=.ext[,.ext...]",
                          arg));
  }

  category_definition def;
  def.name = std::string(trim(arg.substr(0, pos)));

  for (auto const& ext :
       split_to<std::vector<std::string>>(arg.substr(pos + 1), ',')) {
    if (!trim(ext).empty()) {
      def.extensions.push_back(normalize_extension(ext));
    }
  }

  return def;
}

std::string category_table::normalize_extension(std::string_view ext) {
  auto rv = to_lower(trim(ext));

  if (!rv.empty() && rv.front() != '.') {
    rv.insert(rv.begin(), '.');
  }

  if (rv.size() < 2) {
    TAP_THROW(config_error, fmt::format("invalid extension: '{}'", ext));
  }

  if (rv.find_first_of("/\\") != std::string::npos ||
      rv.find("..") != std::string::npos || rv.back() == '.') {
    TAP_THROW(config_error, fmt::format("invalid extension: '{}'", ext));
  }

  return rv;
}

} // namespace tap
