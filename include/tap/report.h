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

#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>
#include <string_view>

#include <tap/category_totals.h>
#include <tap/scanner.h>

namespace tap {

class file_access;
struct export_job;
struct export_result;

struct inspect_report {
  std::filesystem::path root;
  category_totals totals;
  scan_stats stats;
  std::chrono::nanoseconds elapsed{0};
};

// console table, one row per category, sorted like `category_totals::summary`
std::string format_summary_table(category_totals const& totals);

std::string format_inspect_log(inspect_report const& rep, std::tm const& now);

std::string format_export_log(export_job const& job, export_result const& res,
                              std::tm const& now);

// `tap_inspect_<root name>_<YYYYmmdd_HHMMSS>.txt`
std::filesystem::path
inspect_log_name(std::filesystem::path const& root, std::tm const& now);

void write_report(file_access const& fa, std::filesystem::path const& path,
                  std::string_view content);

} // namespace tap
