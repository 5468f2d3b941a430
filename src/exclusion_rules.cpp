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

#include <tap/exclusion_rules.h>
#include <tap/util.h>

namespace tap {

namespace fs = std::filesystem;

namespace {

bool match_entry(glob_matcher const& m, fs::path const& relative_path) {
  if (m.empty()) {
    return false;
  }

  auto const rel = path_to_utf8_string(fs::path(relative_path.generic_u8string()));

  return m.match(basename(rel)) || m.match(rel);
}

} // namespace

exclusion_rules::exclusion_rules() = default;

exclusion_rules::exclusion_rules(std::span<std::string const> patterns) {
  for (auto const& p : patterns) {
    add(p);
  }
}

std::vector<std::string> exclusion_rules::default_patterns() {
  return {".*", "System Volume Information", "$RECYCLE.BIN", "node_modules"};
}

void exclusion_rules::add(std::string_view pattern) {
  if (pattern.size() > 1 && pattern.ends_with('/')) {
    pattern.remove_suffix(1);
    dirs_.add_pattern(pattern);
  } else {
    any_.add_pattern(pattern);
  }
}

bool exclusion_rules::excludes(fs::path const& relative_path) const {
  return match_entry(any_, relative_path);
}

bool exclusion_rules::excludes_directory(fs::path const& relative_path) const {
  return match_entry(any_, relative_path) || match_entry(dirs_, relative_path);
}

} // namespace tap
