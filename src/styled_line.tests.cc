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

#include "styled_line.hh"

#include "doctest/doctest.h"

using namespace mat;

TEST_CASE("styled_line::append merges equal attributes")
{
    styled_line sl;
    auto red = text_attrs::with_fg(COLOR_RED);

    sl.append("abc").append("def").append("ghi", red).append("", red);
    sl.append("jkl", red);

    REQUIRE(sl.sl_spans.size() == 2);
    CHECK(sl.sl_spans[0].ss_text == "abcdef");
    CHECK(sl.sl_spans[1].ss_text == "ghijkl");
    CHECK(sl.sl_spans[1].ss_attrs == red);
    CHECK(sl.text() == "abcdefghijkl");
    CHECK(sl.width() == 12);
}

TEST_CASE("styled_line::width counts wide characters twice")
{
    auto sl = styled_line::plain(1, "Hello\xe4\xb8\x96\xe7\x95\x8c");

    CHECK(sl.width() == 9);
    CHECK(sl.sl_spans.size() == 1);
}

TEST_CASE("styled_line::separator")
{
    auto sl = styled_line::separator();

    CHECK(sl.is_separator());
    CHECK(sl.sl_number == 0);
    CHECK(sl.text() == "--");
    CHECK(sl.sl_spans[0].ss_attrs.ta_fg_color
          == styling::color_unit::from_palette(COLOR_DARK_GRAY));
}

TEST_CASE("styled_line::plain")
{
    auto sl = styled_line::plain(3, "");

    CHECK(sl.empty());
    CHECK(sl.width() == 0);
    CHECK_FALSE(sl.is_separator());
}
