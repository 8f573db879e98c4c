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

#include <stdio.h>

#include "document.hh"

#include "base/auto_mem.hh"
#include "doctest/doctest.h"

using namespace mat;

static std::string
print_to_string(const document& doc, bool line_numbers)
{
    auto_mem<FILE> tmp(fclose);

    tmp = tmpfile();
    REQUIRE(tmp.in() != nullptr);
    print_document(tmp.in(), doc, line_numbers);
    rewind(tmp.in());

    std::string retval;
    char buffer[1024];
    size_t rc;

    while ((rc = fread(buffer, 1, sizeof(buffer), tmp.in())) > 0) {
        retval.append(buffer, rc);
    }

    return retval;
}

TEST_CASE("split_lines")
{
    CHECK(split_lines("").empty());
    CHECK(split_lines("a\nb\n") == std::vector<std::string>{"a", "b"});
    CHECK(split_lines("a\r\nb") == std::vector<std::string>{"a", "b"});
    CHECK(split_lines("a\n\nb") == std::vector<std::string>{"a", "", "b"});
    CHECK(split_lines("\n") == std::vector<std::string>{""});
}

TEST_CASE("document::from_text")
{
    auto doc = document::from_text("one\ntwo\n\xe4\xb8\x96\n", "test", "UTF-8");

    REQUIRE(doc.line_count() == 3);
    CHECK(doc.d_lines[0].sl_number == 1);
    CHECK(doc.d_lines[2].sl_number == 3);
    CHECK(doc.d_lines[1].text() == "two");
    CHECK(doc.d_max_line_width == 3);
    CHECK(doc.d_source_name == "test");
    CHECK(doc.d_encoding == "UTF-8");
}

TEST_CASE("document::recalculate_max_width")
{
    auto doc = document::from_text("short\na much longer line\n", "t", "UTF-8");

    CHECK(doc.d_max_line_width == 18);
    doc.d_lines.pop_back();
    doc.recalculate_max_width();
    CHECK(doc.d_max_line_width == 5);
}

TEST_CASE("print_document")
{
    auto doc = document::from_text("alpha\nbeta\n", "t", "UTF-8");

    CHECK(print_to_string(doc, false) == "alpha\nbeta\n");
    CHECK(print_to_string(doc, true) == "1 alpha\n2 beta\n");

    std::string text;
    for (int lpc = 1; lpc <= 10; lpc++) {
        text += "x\n";
    }
    auto doc10 = document::from_text(text, "t", "UTF-8");
    auto out = print_to_string(doc10, true);

    CHECK(out.substr(0, 5) == " 1 x\n");
    CHECK(out.substr(out.size() - 5) == "10 x\n");
}

TEST_CASE("print_document leaves separators unnumbered")
{
    document doc;

    doc.d_lines.emplace_back(styled_line::plain(2, "b"));
    doc.d_lines.emplace_back(styled_line::separator());
    doc.d_lines.emplace_back(styled_line::plain(10, "j"));

    CHECK(print_to_string(doc, true) == " 2 b\n   --\n10 j\n");
    CHECK(print_to_string(doc, false) == "b\n--\nj\n");
}
