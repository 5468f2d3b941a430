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
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tap {

class logger;

struct category_definition {
  std::string name;
  std::vector<std::string> extensions;
};

class category {
 public:
  category(std::string name, std::vector<std::string> extensions)
      : name_{std::move(name)}
      , extensions_{std::move(extensions)} {}

  std::string const& name() const { return name_; }
  std::span<std::string const> extensions() const { return extensions_; }

 private:
  std::string name_;
  std::vector<std::string> extensions_;
};

// an extension claimed by more than one category
struct category_conflict {
  std::string extension;
  std::string kept;
  std::string dropped;
};

namespace detail {

// declared outside category_table so `options` can be used as a default
// argument inside the class
enum class category_duplicate_policy {
  // reject the same extension in two categories
  strict,
  // keep the first claim in definition order, warn about the rest
  first_match_wins,
};

struct category_table_options {
  category_duplicate_policy duplicates{category_duplicate_policy::strict};
};

} // namespace detail

/**
 * Maps file extensions to categories
 *
 * The table is validated once at construction and is immutable
 * afterwards, so `classify()` can be called concurrently. Every path
 * maps to exactly one category; paths without a known extension map
 * to the fallback category `misc`.
 */
class category_table {
 public:
  static constexpr std::string_view fallback_name{"misc"};

  using duplicate_policy = detail::category_duplicate_policy;
  using options = detail::category_table_options;

  category_table(logger& lgr, std::span<category_definition const> defs,
                 options const& opts = {});
  ~category_table();

  category_table(category_table&&) = default;
  category_table& operator=(category_table&&) = default;

  static std::vector<category_definition> builtin_definitions();

  // "NAME=.ext,.ext", extensions are normalized
  static category_definition parse_definition(std::string_view arg);

  // ".PDF", "pdf" and ".pdf" all become ".pdf"
  static std::string normalize_extension(std::string_view ext);

  category const& classify(std::filesystem::path const& path) const {
    return impl_->classify(path);
  }

  category const& fallback() const { return impl_->fallback(); }

  category const* find(std::string_view name) const {
    return impl_->find(name);
  }

  // configured categories in definition order, followed by the fallback
  std::vector<category const*> categories() const {
    return impl_->categories();
  }

  std::span<category_conflict const> conflicts() const {
    return impl_->conflicts();
  }

  size_t size() const { return impl_->size(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual category const&
    classify(std::filesystem::path const& path) const = 0;
    virtual category const& fallback() const = 0;
    virtual category const* find(std::string_view name) const = 0;
    virtual std::vector<category const*> categories() const = 0;
    virtual std::span<category_conflict const> conflicts() const = 0;
    virtual size_t size() const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace tap
