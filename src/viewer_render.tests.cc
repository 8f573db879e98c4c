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
 */

#include <algorithm>

#include "viewer_render.hh"

#include "doctest/doctest.h"
#include "regex_pattern.hh"

using namespace mat;

static viewer_options
options(bool gutter, wrap_mode_t mode = wrap_mode_t::none)
{
    viewer_options retval;

    retval.vo_show_gutter = gutter;
    retval.vo_wrap_mode = mode;
    return retval;
}

static bool
contains(const styled_line& sl, const std::string& needle)
{
    return sl.text().find(needle) != std::string::npos;
}

TEST_CASE("clip_line does not split wide characters")
{
    auto line = styled_line::plain(1, "Hello\xe4\xb8\x96\xe7\x95\x8c");
    auto row = clip_line(line, 0, 7);

    CHECK(row.text() == "Hello\xe4\xb8\x96");
    CHECK(row.width() == 7);

    row = clip_line(line, 0, 6);
    CHECK(row.text() == "Hello ");
    CHECK(row.width() == 6);
}

TEST_CASE("clip_line scrolls and pads")
{
    auto row = clip_line(styled_line::plain(1, "ab"), 0, 5);
    CHECK(row.text() == "ab   ");

    row = clip_line(styled_line::plain(1, "\xe4\xb8\x96\xe7\x95\x8cx"), 1, 4);
    CHECK(row.text() == " \xe7\x95\x8cx");
    CHECK(row.width() == 4);

    row = clip_line(styled_line::plain(1, "short"), 10, 3);
    CHECK(row.text() == "   ");

    styled_line colored;
    auto red = text_attrs::with_fg(COLOR_RED);
    colored.append("abc", red).append("def");
    row = clip_line(colored, 2, 3);
    REQUIRE(row.sl_spans.size() == 2);
    CHECK(row.sl_spans[0].ss_text == "c");
    CHECK(row.sl_spans[0].ss_attrs == red);
    CHECK(row.sl_spans[1].ss_text == "de");
}

TEST_CASE("clip_line_truncated")
{
    auto line = styled_line::plain(1, std::string(10, 'x'));
    auto row = clip_line_truncated(line, 0, 5, 8);

    CHECK(row.text() == "xxxx…   ");
    CHECK(row.width() == 8);

    auto ellipsis = std::find_if(
        row.sl_spans.begin(), row.sl_spans.end(), [](const auto& span) {
            return span.ss_text == "…";
        });
    REQUIRE(ellipsis != row.sl_spans.end());
    CHECK(ellipsis->ss_attrs == text_attrs::with_fg(COLOR_DARK_GRAY));

    row = clip_line_truncated(styled_line::plain(1, "short"), 0, 5, 8);
    CHECK(row.text() == "short   ");
}

TEST_CASE("slice_wrapped_row")
{
    auto line = styled_line::plain(1, "abcdefghij");

    CHECK(slice_wrapped_row(line, 0, 4).text() == "abcd");
    CHECK(slice_wrapped_row(line, 4, 4).text() == "efgh");
    CHECK(slice_wrapped_row(line, 8, 4).text() == "ij  ");

    auto wide = styled_line::plain(1, "a\xe4\xb8\x96\xe7\x95\x8c");
    CHECK(slice_wrapped_row(wide, 1, 3).text() == "\xe4\xb8\x96 ");
}

TEST_CASE("render_gutter")
{
    theme_colors palette = theme_colors::for_theme(theme_t::dark);
    auto gutter = render_gutter(12, 5, palette);

    CHECK(gutter.text() == " 12  ");
    CHECK(gutter.sl_spans[0].ss_attrs.ta_fg_color == palette.tc_gutter);
    CHECK(render_gutter(std::nullopt, 5, palette).text() == "     ");
    CHECK(render_gutter(3, 3, palette).text() == "3  ");
}

TEST_CASE("render_status_bar")
{
    auto doc = document::from_text("one\ntwo\nthree\n", "t.txt", "UTF-8");
    auto re = compile_pattern("o", pattern_options{});
    search_state ss(re, find_matches(doc, *re));
    viewer_state vs(std::move(doc), std::move(ss), theme_colors{}, options(false));

    vs.set_terminal_size(60, 10);

    auto status = render_status_bar(vs);
    CHECK(status.width() == 60);
    CHECK(status.text().find(" t.txt (1/3) ") == 0);
    CHECK(contains(status, "2 matches"));
    CHECK(status.text().substr(status.text().size() - 8) == "Col 1/5 ");
    CHECK(status.sl_spans[0].ss_attrs.has_style(text_attrs::style::bold));

    vs.next_match();
    CHECK(contains(render_status_bar(vs), "Match 1/2"));

    vs.set_wrap_mode(wrap_mode_t::wrap);
    status = render_status_bar(vs);
    CHECK(contains(status, "[WRAP] | Match 1/2"));
    CHECK_FALSE(contains(status, "Col "));

    vs.set_wrap_mode(wrap_mode_t::truncate);
    CHECK(contains(render_status_bar(vs), "[TRUNC]"));

    vs.enter_search_mode(true);
    vs.search_add_char("t");
    status = render_status_bar(vs);
    CHECK(contains(status, " [SEARCH: t] "));
    CHECK_FALSE(contains(status, "[TRUNC]"));

    vs.set_terminal_size(10, 10);
    CHECK(render_status_bar(vs).width() == 10);
}

TEST_CASE("render_status_bar shows the encoding")
{
    auto doc = document::from_text("caf\xc3\xa9\n", "t.txt", "Latin-1");
    viewer_state vs(std::move(doc), std::nullopt, theme_colors{}, options(false));

    vs.set_terminal_size(60, 10);
    CHECK(contains(render_status_bar(vs), "Col 1/4 | Latin-1 "));

    vs.set_wrap_mode(wrap_mode_t::wrap);
    CHECK(contains(render_status_bar(vs), "Latin-1 "));
}

TEST_CASE("render_screen")
{
    std::string text;
    for (int lpc = 1; lpc <= 10; lpc++) {
        text += "line " + std::to_string(lpc) + "\n";
    }
    auto doc = document::from_text(text, "t.txt", "UTF-8");
    viewer_state vs(std::move(doc), std::nullopt, theme_colors{}, options(true));

    vs.set_terminal_size(20, 5);

    auto rows = render_screen(vs);
    REQUIRE(rows.size() == 5);
    for (const auto& row : rows) {
        CHECK(row.width() == 20);
    }
    CHECK(rows[0].text() == " 1  line 1          ");
    CHECK(rows[3].text() == " 4  line 4          ");
    CHECK(contains(rows[4], "(1/10)"));

    vs.go_to_bottom();
    rows = render_screen(vs);
    CHECK(rows[0].text().find(" 7  line 7") == 0);
    CHECK(rows[3].text().find("10  line 10") == 0);
}

TEST_CASE("render_screen fills short documents")
{
    document doc;
    doc.d_lines.emplace_back(styled_line::plain(1, "a"));
    doc.d_lines.emplace_back(styled_line::separator());
    doc.d_lines.emplace_back(styled_line::plain(5, "e"));
    doc.d_source_name = "t";
    doc.d_encoding = "UTF-8";
    doc.recalculate_max_width();
    viewer_state vs(std::move(doc), std::nullopt, theme_colors{}, options(true));

    vs.set_terminal_size(12, 6);

    auto rows = render_screen(vs);
    REQUIRE(rows.size() == 6);
    CHECK(rows[0].text() == "1  a        ");
    CHECK(rows[1].text() == "   --       ");
    CHECK(rows[2].text() == "5  e        ");
    CHECK(rows[3].text() == std::string(12, ' '));
    CHECK(rows[4].width() == 12);
}

TEST_CASE("render_screen in wrap mode")
{
    auto doc = document::from_text("abcdefghijkl\nxy\n", "t", "UTF-8");
    viewer_state vs(
        std::move(doc), std::nullopt, theme_colors{}, options(true, wrap_mode_t::wrap));

    vs.set_terminal_size(8, 5);

    auto rows = render_screen(vs);
    REQUIRE(rows.size() == 5);
    CHECK(rows[0].text() == "1  abcde");
    CHECK(rows[1].text() == "   fghij");
    CHECK(rows[2].text() == "   kl   ");
    CHECK(rows[3].text() == "2  xy   ");
}

TEST_CASE("render_screen in truncate mode")
{
    auto doc = document::from_text(std::string(30, 'x') + "\nshort\n", "t", "UTF-8");
    auto opts = options(false, wrap_mode_t::truncate);
    opts.vo_max_width = 10;
    viewer_state vs(std::move(doc), std::nullopt, theme_colors{}, opts);

    vs.set_terminal_size(20, 4);

    auto rows = render_screen(vs);
    CHECK(rows[0].text() == std::string(9, 'x') + "…" + std::string(10, ' '));
    CHECK(rows[1].text() == "short" + std::string(15, ' '));
}
