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

#include "line_range.hh"

#include "base/mat.error.hh"
#include "doctest/doctest.h"

using namespace mat;

static void
check_invalid(const char* spec, size_t total)
{
    try {
        parse_line_range(spec, total);
        FAIL("expected an error for ", spec);
    } catch (const mat::error& e) {
        CHECK(e.is<invalid_line_range>());
        CHECK(e.exit_code() == 2);
        CHECK(e.get_message().find(spec) != std::string::npos);
    }
}

TEST_CASE("parse_line_range")
{
    auto lr = parse_line_range("3:5", 10);
    CHECK(lr.lr_start == 3);
    CHECK(lr.lr_end == 5);

    lr = parse_line_range(":4", 10);
    CHECK(lr.lr_start == 1);
    CHECK(lr.lr_end == 4);

    lr = parse_line_range("7:", 10);
    CHECK(lr.lr_start == 7);
    CHECK(lr.lr_end == 10);

    lr = parse_line_range("6", 10);
    CHECK(lr.lr_start == 6);
    CHECK(lr.lr_end == 6);

    lr = parse_line_range("8:50", 10);
    CHECK(lr.lr_end == 10);
    CHECK(lr.contains(9));
    CHECK_FALSE(lr.contains(7));
}

TEST_CASE("parse_line_range errors")
{
    check_invalid("0", 10);
    check_invalid("0:3", 10);
    check_invalid("5:3", 10);
    check_invalid("abc", 10);
    check_invalid("1:x", 10);
    check_invalid("-1", 10);
    check_invalid("1:2:3", 10);
}

TEST_CASE("filter_line_range")
{
    auto doc = document::from_text(
        "Line 1\nLine 2\nLine 3\nLine 4\nLine 5\nLine 6 is long\n",
        "t",
        "UTF-8");

    filter_line_range(doc, parse_line_range("3:5", doc.line_count()));
    REQUIRE(doc.line_count() == 3);
    CHECK(doc.d_lines[0].text() == "Line 3");
    CHECK(doc.d_lines[0].sl_number == 3);
    CHECK(doc.d_lines[2].text() == "Line 5");
    CHECK(doc.d_max_line_width == 6);
}
