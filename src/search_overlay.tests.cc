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

#include "search_overlay.hh"

#include "doctest/doctest.h"
#include "regex_pattern.hh"

using namespace mat;

static std::shared_ptr<pcre2pp::code>
regex(const char* pattern)
{
    return compile_pattern(pattern, pattern_options{});
}

TEST_CASE("find_matches")
{
    auto doc = document::from_text(
        "foo bar foo\nnothing\n\xe4\xb8\x96 foo\n", "t", "UTF-8");
    auto matches = find_matches(doc, *regex("foo"));

    REQUIRE(matches.size() == 3);
    CHECK(matches[0] == match_position{0, 0, 3});
    CHECK(matches[1] == match_position{0, 8, 11});
    CHECK(matches[2] == match_position{2, 4, 7});
}

TEST_CASE("find_matches skips empty matches")
{
    auto doc = document::from_text("abc\n", "t", "UTF-8");

    CHECK(find_matches(doc, *regex("x*")).empty());
}

TEST_CASE("apply_search_highlight splits spans")
{
    document doc;
    styled_line sl;
    auto red = text_attrs::with_fg(COLOR_RED);

    sl.sl_number = 7;
    sl.sl_is_match = true;
    sl.append("let ", red).append("needle = 1;");
    doc.d_lines.emplace_back(sl);

    apply_search_highlight(doc, *regex("t nee"));

    const auto& line = doc.d_lines[0];
    REQUIRE(line.sl_spans.size() == 3);
    CHECK(line.sl_spans[0].ss_text == "le");
    CHECK(line.sl_spans[0].ss_attrs == red);
    CHECK(line.sl_spans[1].ss_text == "t nee");
    CHECK(line.sl_spans[1].ss_attrs == search_highlight_attrs());
    CHECK(line.sl_spans[2].ss_text == "dle = 1;");
    CHECK(line.sl_spans[2].ss_attrs.empty());
    CHECK(line.sl_number == 7);
    CHECK(line.sl_is_match);
    CHECK(line.text() == "let needle = 1;");
}

TEST_CASE("apply_search_highlight keeps text and untouched lines")
{
    auto doc = document::from_text(
        "alpha beta\n\xe4\xb8\x96\xe7\x95\x8c alpha\nnone here\n",
        "t",
        "UTF-8");
    auto red = text_attrs::with_fg(COLOR_RED);
    doc.d_lines[2].sl_spans[0].ss_attrs = red;
    auto before = doc;

    apply_search_highlight(doc, *regex("alpha"));

    for (size_t lpc = 0; lpc < doc.line_count(); lpc++) {
        CHECK(doc.d_lines[lpc].text() == before.d_lines[lpc].text());
        CHECK(doc.d_lines[lpc].width() == before.d_lines[lpc].width());
    }
    CHECK(doc.d_lines[2].sl_spans == before.d_lines[2].sl_spans);
    CHECK(doc.d_lines[1].sl_spans.back().ss_text == "alpha");

    auto unchanged = before;
    apply_search_highlight(unchanged, *regex("zzz"));
    for (size_t lpc = 0; lpc < doc.line_count(); lpc++) {
        CHECK(unchanged.d_lines[lpc].sl_spans == before.d_lines[lpc].sl_spans);
    }
}

TEST_CASE("search_state cycles through matches")
{
    auto doc = document::from_text("a\nb a\na\n", "t", "UTF-8");
    auto re = regex("a");
    search_state ss(re, find_matches(doc, *re));

    CHECK_FALSE(ss.get_current().has_value());
    CHECK(ss.next_match().value().mp_line_idx == 0);
    CHECK(ss.next_match().value().mp_line_idx == 1);
    CHECK(ss.next_match().value().mp_line_idx == 2);
    CHECK(ss.next_match().value().mp_line_idx == 0);
    CHECK(ss.prev_match().value().mp_line_idx == 2);
    CHECK(ss.get_current().value() == 2);

    search_state fresh(re, find_matches(doc, *re));
    CHECK(fresh.prev_match().value().mp_line_idx == 2);

    search_state none(re, {});
    CHECK_FALSE(none.next_match().has_value());
    CHECK_FALSE(none.prev_match().has_value());
}
