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

#include <sstream>

#include <gtest/gtest.h>

#include <tap/terminal_ansi.h>

using namespace tap;

TEST(terminal, ansi_color) {
  EXPECT_EQ("\033[0m", terminal_ansi::color_impl(termcolor::NORMAL));
  EXPECT_EQ("\033[31m", terminal_ansi::color_impl(termcolor::RED));
  EXPECT_EQ("\033[32m", terminal_ansi::color_impl(termcolor::GREEN));
  EXPECT_EQ("\033[33m", terminal_ansi::color_impl(termcolor::YELLOW));
  EXPECT_EQ("\033[90m", terminal_ansi::color_impl(termcolor::GRAY));
  EXPECT_EQ("\033[1;31m", terminal_ansi::color_impl(termcolor::BOLD_RED));
  EXPECT_EQ("\033[1;37m", terminal_ansi::color_impl(termcolor::BOLD_WHITE));
  EXPECT_EQ("\033[2;90m", terminal_ansi::color_impl(termcolor::DIM_GRAY));

  terminal_ansi term;
  terminal const& t = term;

  EXPECT_EQ("\033[0m", t.color(termcolor::NORMAL));
  EXPECT_EQ("\033[31m", t.color(termcolor::RED));
}

TEST(terminal, ansi_colored) {
  EXPECT_EQ("\033[31mfoo\033[0m",
            terminal_ansi::colored_impl("foo", termcolor::RED));
  EXPECT_EQ("foo", terminal_ansi::colored_impl("foo", termcolor::RED, false));

  terminal_ansi term;
  terminal const& t = term;

  EXPECT_EQ("\033[1;32mok\033[0m", t.colored("ok", termcolor::BOLD_GREEN, true));
  EXPECT_EQ("ok", t.colored("ok", termcolor::BOLD_GREEN, false));
}

TEST(terminal, string_stream_is_not_a_tty) {
  terminal_ansi term;
  std::ostringstream oss;
  EXPECT_FALSE(term.is_tty(oss));
}
