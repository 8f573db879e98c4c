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

#include <filesystem>
#include <fstream>

#include <unistd.h>

#include "viewer_state.hh"

#include "doctest/doctest.h"
#include "fmt/format.h"
#include "regex_pattern.hh"

using namespace mat;

static ncinput
key(uint32_t id, unsigned modifiers = 0)
{
    ncinput retval{};

    retval.id = id;
    retval.evtype = NCTYPE_PRESS;
    retval.modifiers = modifiers;
    return retval;
}

static document
numbered_doc(size_t count, const std::string& prefix = "line ")
{
    std::string text;

    for (size_t lpc = 1; lpc <= count; lpc++) {
        text += fmt::format(FMT_STRING("{}{}\n"), prefix, lpc);
    }

    return document::from_text(text, "numbers.txt", "UTF-8");
}

static viewer_options
options(bool gutter = false, wrap_mode_t mode = wrap_mode_t::none)
{
    viewer_options retval;

    retval.vo_show_gutter = gutter;
    retval.vo_wrap_mode = mode;
    return retval;
}

TEST_CASE("parse_wrap_mode")
{
    CHECK(parse_wrap_mode("none").value() == wrap_mode_t::none);
    CHECK(parse_wrap_mode("WRAP").value() == wrap_mode_t::wrap);
    CHECK(parse_wrap_mode("Truncate").value() == wrap_mode_t::truncate);
    CHECK_FALSE(parse_wrap_mode("soft").has_value());
}

TEST_CASE("build_wrap_rows")
{
    auto doc = document::from_text(
        "abcdefghij\n\n\xe4\xb8\x96\xe7\x95\x8c\xe4\xb8\x96\n", "t", "UTF-8");
    auto rows = build_wrap_rows(doc, 4);

    REQUIRE(rows.size() == 6);
    CHECK(rows[0].wr_line_idx == 0);
    CHECK(rows[0].wr_is_first_row);
    CHECK(rows[0].wr_char_offset == 0);
    CHECK(rows[0].wr_display_width == 4);
    CHECK(rows[1].wr_char_offset == 4);
    CHECK_FALSE(rows[1].wr_is_first_row);
    CHECK(rows[2].wr_char_offset == 8);
    CHECK(rows[2].wr_display_width == 2);
    CHECK(rows[3].wr_line_idx == 1);
    CHECK(rows[3].wr_display_width == 0);
    CHECK(rows[4].wr_line_number == 3);
    CHECK(rows[4].wr_display_width == 4);
    CHECK(rows[5].wr_char_offset == 2);
    CHECK(rows[5].wr_display_width == 2);

    rows = build_wrap_rows(doc, 3);
    REQUIRE(rows.size() == 8);
    CHECK(rows[3].wr_display_width == 1);
    CHECK(rows[6].wr_char_offset == 1);
    CHECK(rows[6].wr_display_width == 2);
}

TEST_CASE("wrap rows total the wrapped line counts")
{
    auto doc = document::from_text(
        "short\n\na line that is somewhat longer than the others\nxyz\n",
        "t",
        "UTF-8");

    for (size_t width : {1, 3, 7, 10, 80}) {
        size_t expected = 0;

        for (const auto& line : doc.d_lines) {
            expected += std::max((size_t) 1, (line.width() + width - 1) / width);
        }
        CHECK(build_wrap_rows(doc, width).size() == expected);
    }
}

TEST_CASE("vertical scrolling is clamped")
{
    viewer_state vs(numbered_doc(100), std::nullopt, theme_colors{}, options());

    vs.set_terminal_size(80, 24);
    CHECK(vs.content_height() == 23);
    CHECK(vs.max_scroll() == 77);

    vs.scroll_down(1000);
    CHECK(vs.get_scroll_line() == 77);
    vs.scroll_up(5);
    CHECK(vs.get_scroll_line() == 72);
    vs.scroll_up(1000);
    CHECK(vs.get_scroll_line() == 0);
    vs.half_page_down();
    CHECK(vs.get_scroll_line() == 11);
    vs.go_to_bottom();
    CHECK(vs.get_scroll_line() == 77);
    vs.half_page_up();
    CHECK(vs.get_scroll_line() == 66);
    vs.go_to_top();
    CHECK(vs.get_scroll_line() == 0);

    vs.set_terminal_size(80, 200);
    CHECK(vs.max_scroll() == 0);
    vs.scroll_down(10);
    CHECK(vs.get_scroll_line() == 0);
}

TEST_CASE("resizing keeps the scroll position in range")
{
    viewer_state vs(numbered_doc(50), std::nullopt, theme_colors{}, options());

    vs.set_terminal_size(80, 11);
    vs.go_to_bottom();
    CHECK(vs.get_scroll_line() == 40);
    vs.set_terminal_size(80, 31);
    CHECK(vs.get_scroll_line() == 20);
}

TEST_CASE("gutter width")
{
    viewer_state vs(numbered_doc(100), std::nullopt, theme_colors{}, options(true));

    vs.set_terminal_size(80, 24);
    CHECK(vs.gutter_width() == 5);
    CHECK(vs.content_width() == 75);
    vs.toggle_gutter();
    CHECK_FALSE(vs.is_gutter_shown());
    CHECK(vs.gutter_width() == 0);
    CHECK(vs.content_width() == 80);

    viewer_state small(numbered_doc(3), std::nullopt, theme_colors{}, options(true));
    CHECK(small.gutter_width() == 3);

    viewer_state empty(document{}, std::nullopt, theme_colors{}, options(true));
    CHECK(empty.gutter_width() == 3);
    CHECK(empty.max_scroll() == 0);
}

TEST_CASE("horizontal scrolling")
{
    auto doc = document::from_text(std::string(100, 'x') + "\nshort\n", "t", "UTF-8");
    viewer_state vs(std::move(doc), std::nullopt, theme_colors{}, options());

    vs.set_terminal_size(80, 24);
    vs.scroll_right(4);
    CHECK(vs.get_scroll_col() == 4);
    vs.scroll_right(100);
    CHECK(vs.get_scroll_col() == 20);
    vs.scroll_left(8);
    CHECK(vs.get_scroll_col() == 12);
    vs.scroll_to_line_start();
    CHECK(vs.get_scroll_col() == 0);
    vs.scroll_to_line_end();
    CHECK(vs.get_scroll_col() == 20);
    vs.scroll_left(100);
    CHECK(vs.get_scroll_col() == 0);

    vs.set_wrap_mode(wrap_mode_t::wrap);
    vs.scroll_right(4);
    CHECK(vs.get_scroll_col() == 0);
    vs.scroll_to_line_end();
    CHECK(vs.get_scroll_col() == 0);
}

TEST_CASE("wrap mode rows")
{
    auto doc = document::from_text(std::string(100, 'x') + "\nshort\n", "t", "UTF-8");
    viewer_state vs(std::move(doc),
                    std::nullopt,
                    theme_colors{},
                    options(false, wrap_mode_t::wrap));

    vs.set_terminal_size(40, 3);
    CHECK(vs.total_rows() == 4);
    CHECK(vs.max_scroll() == 2);

    vs.set_terminal_size(20, 3);
    CHECK(vs.total_rows() == 6);
    CHECK(vs.get_wrap_rows()[5].wr_line_number == 2);

    vs.set_wrap_mode(wrap_mode_t::none);
    CHECK(vs.total_rows() == 2);
}

TEST_CASE("interactive search")
{
    auto doc = document::from_text("alpha\nbeta\nALPHABET\n", "t", "UTF-8");
    auto original = doc;
    viewer_state vs(std::move(doc), std::nullopt, theme_colors{}, options());

    vs.enter_search_mode(true);
    CHECK(vs.get_mode() == view_mode_t::search);
    CHECK(vs.in_search_snapshot());

    vs.search_add_char("a");
    vs.search_add_char("l");
    CHECK(vs.get_search_query() == "al");
    CHECK(vs.get_document().d_lines[0].sl_spans[0].ss_attrs
          == search_highlight_attrs());
    CHECK(vs.get_document().d_lines[2].sl_spans[0].ss_attrs
          == search_highlight_attrs());

    vs.search_backspace();
    CHECK(vs.get_search_query() == "a");

    vs.cancel_search();
    CHECK(vs.get_mode() == view_mode_t::normal);
    CHECK_FALSE(vs.in_search_snapshot());
    CHECK(vs.get_search_query().empty());
    for (size_t lpc = 0; lpc < original.line_count(); lpc++) {
        CHECK(vs.get_document().d_lines[lpc].sl_spans
              == original.d_lines[lpc].sl_spans);
    }
    CHECK_FALSE(vs.get_search_state().has_value());
}

TEST_CASE("case-sensitive search confirms matches")
{
    auto doc = document::from_text("alpha\nbeta\nALPHABET\n", "t", "UTF-8");
    viewer_state vs(std::move(doc), std::nullopt, theme_colors{}, options());

    vs.enter_search_mode(false);
    vs.search_add_char("A");
    vs.search_add_char("L");
    vs.confirm_search();

    CHECK(vs.get_mode() == view_mode_t::normal);
    REQUIRE(vs.get_search_state().has_value());
    REQUIRE(vs.get_search_state()->get_matches().size() == 1);
    CHECK(vs.get_search_state()->get_matches()[0].mp_line_idx == 2);
    CHECK(vs.get_document().d_lines[0].sl_spans.size() == 1);
}

TEST_CASE("invalid search patterns are ignored")
{
    auto doc = document::from_text("a[b\n", "t", "UTF-8");
    viewer_state vs(std::move(doc), std::nullopt, theme_colors{}, options());

    vs.enter_search_mode(true);
    vs.search_add_char("[");
    CHECK(vs.get_document().d_lines[0].sl_spans.size() == 1);
    vs.confirm_search();
    CHECK_FALSE(vs.get_search_state().has_value());
    CHECK(vs.get_mode() == view_mode_t::normal);
}

TEST_CASE("match navigation centers the match")
{
    auto doc = numbered_doc(100, "row ");
    doc.d_lines[59] = styled_line::plain(60, "the needle");
    doc.d_lines[89] = styled_line::plain(90, "another needle");

    auto re = compile_pattern("needle", pattern_options{});
    search_state ss(re, find_matches(doc, *re));
    viewer_state vs(std::move(doc), std::move(ss), theme_colors{}, options());

    vs.set_terminal_size(80, 24);
    vs.next_match();
    CHECK(vs.get_scroll_line() == 48);
    vs.next_match();
    CHECK(vs.get_scroll_line() == 77);
    vs.next_match();
    CHECK(vs.get_scroll_line() == 48);
    vs.prev_match();
    CHECK(vs.get_scroll_line() == 77);
}

TEST_CASE("scroll_to_line in wrap mode")
{
    auto doc = document::from_text(
        std::string(30, 'x') + "\n" + std::string(30, 'y') + "\nz\n", "t", "UTF-8");
    viewer_state vs(std::move(doc),
                    std::nullopt,
                    theme_colors{},
                    options(false, wrap_mode_t::wrap));

    vs.set_terminal_size(10, 3);
    CHECK(vs.total_rows() == 7);
    vs.scroll_to_line(2);
    CHECK(vs.get_scroll_line() == 5);
    vs.scroll_to_line(1);
    CHECK(vs.get_scroll_line() == 2);
}

TEST_CASE("normal mode keys")
{
    viewer_state vs(numbered_doc(100), std::nullopt, theme_colors{}, options());

    vs.set_terminal_size(80, 24);
    CHECK_FALSE(vs.handle_key(key('j')));
    CHECK(vs.get_scroll_line() == 1);
    vs.handle_key(key(NCKEY_DOWN));
    CHECK(vs.get_scroll_line() == 2);
    vs.handle_key(key('k'));
    CHECK(vs.get_scroll_line() == 1);

    auto release = key('j');
    release.evtype = NCTYPE_RELEASE;
    vs.handle_key(release);
    CHECK(vs.get_scroll_line() == 1);

    vs.handle_key(key('G'));
    CHECK(vs.get_scroll_line() == 77);
    vs.handle_key(key('g'));
    CHECK(vs.get_scroll_line() == 0);
    vs.handle_key(key('d'));
    CHECK(vs.get_scroll_line() == 11);
    vs.handle_key(key(NCKEY_PGUP));
    CHECK(vs.get_scroll_line() == 0);

    vs.handle_key(key('#'));
    CHECK(vs.is_gutter_shown());

    vs.handle_key(key('/'));
    CHECK(vs.get_mode() == view_mode_t::search);
    vs.handle_key(key('q'));
    CHECK_FALSE(vs.should_quit());
    CHECK(vs.get_search_query() == "q");
    vs.handle_key(key(NCKEY_BACKSPACE));
    CHECK(vs.get_search_query().empty());
    vs.handle_key(key('9'));
    vs.handle_key(key(NCKEY_ENTER));
    CHECK(vs.get_mode() == view_mode_t::normal);
    REQUIRE(vs.get_search_state().has_value());
    CHECK(vs.get_search_state()->get_matches().size() == 20);

    vs.handle_key(key('?'));
    vs.handle_key(key(NCKEY_ESC));
    CHECK(vs.get_mode() == view_mode_t::normal);
    CHECK_FALSE(vs.should_quit());

    CHECK(vs.handle_key(key('q')));
    CHECK(vs.should_quit());
}

TEST_CASE("ctrl-c quits in any mode")
{
    viewer_state vs(numbered_doc(10), std::nullopt, theme_colors{}, options());

    vs.handle_key(key('/'));
    CHECK(vs.handle_key(key('c', NCKEY_MOD_CTRL)));
    CHECK(vs.should_quit());

    viewer_state esc(numbered_doc(10), std::nullopt, theme_colors{}, options());
    CHECK(esc.handle_key(key(NCKEY_ESC)));
}

TEST_CASE("follow mode")
{
    auto path = std::filesystem::temp_directory_path()
        / fmt::format(FMT_STRING("mat-{}-follow.txt"), getpid());

    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "first\nsecond\n";
    }

    auto opts = options();
    opts.vo_path = path;

    viewer_state vs(document::from_text("first\nsecond\n", path.string(), "UTF-8"),
                    std::nullopt,
                    theme_colors{},
                    opts);

    vs.set_terminal_size(80, 2);
    CHECK_FALSE(vs.check_follow_updates());
    vs.toggle_follow();
    CHECK(vs.is_following());
    CHECK(vs.get_scroll_line() == 1);
    CHECK_FALSE(vs.check_follow_updates());

    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << "th\tird\n";
    }

    CHECK(vs.check_follow_updates());
    REQUIRE(vs.get_document().line_count() == 3);
    CHECK(vs.get_document().d_lines[2].text() == "th  ird");
    CHECK(vs.get_document().d_lines[2].sl_number == 3);
    CHECK(vs.get_document().d_lines[0].text() == "first");
    CHECK(vs.get_scroll_line() == 2);

    vs.handle_key(key('f'));
    CHECK_FALSE(vs.is_following());

    std::filesystem::remove(path);
}

TEST_CASE("follow needs a file")
{
    viewer_state vs(numbered_doc(3), std::nullopt, theme_colors{}, options());

    vs.toggle_follow();
    CHECK_FALSE(vs.is_following());
}
