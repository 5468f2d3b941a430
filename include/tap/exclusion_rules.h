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

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <tap/glob_matcher.h>

namespace tap {

/**
 * Glob patterns for entries that are skipped entirely during the scan
 *
 * A pattern is matched against the base name of an entry and against
 * its path relative to the scan root (with `/` separators). A pattern
 * ending in `/` only applies to directories. Patterns prefixed with
 * `i:` are matched case-insensitively.
 */
class exclusion_rules {
 public:
  exclusion_rules();
  explicit exclusion_rules(std::span<std::string const> patterns);

  static std::vector<std::string> default_patterns();

  void add(std::string_view pattern);

  bool empty() const { return any_.empty() && dirs_.empty(); }

  bool excludes(std::filesystem::path const& relative_path) const;
  bool excludes_directory(std::filesystem::path const& relative_path) const;

 private:
  glob_matcher any_;
  glob_matcher dirs_;
};

} // namespace tap
