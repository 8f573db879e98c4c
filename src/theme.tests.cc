/**
 * Copyright (c) 2025, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file theme.tests.cc
 */

#include "theme.hh"

#include "doctest/doctest.h"

using namespace mat;

TEST_CASE("parse_theme")
{
    CHECK(parse_theme("light") == theme_t::light);
    CHECK(parse_theme("DARK") == theme_t::dark);
    CHECK(parse_theme("Light") == theme_t::light);
    CHECK_FALSE(parse_theme("solarized").has_value());
    CHECK_FALSE(parse_theme("").has_value());
}

TEST_CASE("classify_background")
{
    CHECK(classify_background(rgb_color(255, 255, 255)) == theme_t::light);
    CHECK(classify_background(rgb_color(0, 0, 0)) == theme_t::dark);
    CHECK(classify_background(rgb_color(40, 44, 52)) == theme_t::dark);
    CHECK(classify_background(rgb_color(253, 246, 227)) == theme_t::light);
    // green dominates the luminance
    CHECK(classify_background(rgb_color(0, 200, 0)) == theme_t::light);
    CHECK(classify_background(rgb_color(0, 0, 255)) == theme_t::dark);
}

TEST_CASE("theme_colors differ between themes")
{
    auto light = theme_colors::for_theme(theme_t::light);
    auto dark = theme_colors::for_theme(theme_t::dark);

    CHECK_FALSE(light.tc_status_bg == dark.tc_status_bg);
    CHECK_FALSE(light.tc_status_fg == dark.tc_status_fg);
    CHECK_FALSE(light.tc_match_line_bg == dark.tc_match_line_bg);
    CHECK_FALSE(dark.tc_status_fg == dark.tc_status_bg);
    CHECK_FALSE(light.tc_search_fg == light.tc_search_bg);
}

TEST_CASE("resolve_theme")
{
    CHECK(resolve_theme(std::string("light")) == theme_t::light);
    CHECK(resolve_theme(std::string("dark")) == theme_t::dark);
}
