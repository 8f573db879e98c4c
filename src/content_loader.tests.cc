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

#include "content_loader.hh"

#include "base/mat.error.hh"
#include "doctest/doctest.h"

using namespace mat;

TEST_CASE("is_binary")
{
    CHECK(is_binary(string_fragment::from_const("Hello\0World")));
    CHECK_FALSE(is_binary(string_fragment::from_const("Hello, World!\n")));
    CHECK_FALSE(is_binary(string_fragment::from_const("")));
    CHECK_FALSE(
        is_binary(string_fragment::from_const("caf\xc3\xa9\tau lait\r\n")));
    CHECK(is_binary(string_fragment::from_const("\x01\x02\x03\x04 ab")));
}

TEST_CASE("detect_encoding")
{
    CHECK(detect_encoding(string_fragment::from_const("plain"))
          == text_encoding::utf8);
    CHECK(detect_encoding(string_fragment::from_const("\xef\xbb\xbfhi"))
          == text_encoding::utf8_bom);
    CHECK(detect_encoding(string_fragment::from_const("\xff\xfeh\0i\0"))
          == text_encoding::utf16le);
    CHECK(detect_encoding(string_fragment::from_const("\xfe\xff\0h\0i"))
          == text_encoding::utf16be);
    CHECK(detect_encoding(string_fragment::from_const("caf\xe9"))
          == text_encoding::latin1);
    CHECK(std::string(encoding_name(text_encoding::utf8_bom)) == "UTF-8-BOM");
    CHECK(std::string(encoding_name(text_encoding::latin1)) == "Latin-1");
}

TEST_CASE("decode_bytes")
{
    CHECK(decode_bytes(string_fragment::from_const("\xef\xbb\xbfhi"),
                       text_encoding::utf8_bom,
                       "t")
          == "hi");
    CHECK(decode_bytes(string_fragment::from_const("\xff\xfeh\0i\0"),
                       text_encoding::utf16le,
                       "t")
          == "hi");
    CHECK(decode_bytes(string_fragment::from_const("\xfe\xff\0h\0i"),
                       text_encoding::utf16be,
                       "t")
          == "hi");
    CHECK(decode_bytes(string_fragment::from_const("caf\xe9 \x93q\x94"),
                       text_encoding::latin1,
                       "t")
          == "caf\xc3\xa9 \xe2\x80\x9cq\xe2\x80\x9d");
}

TEST_CASE("expand_tabs")
{
    CHECK(expand_tabs("a\tb", 4) == "a   b");
    CHECK(expand_tabs("\tb", 4) == "    b");
    CHECK(expand_tabs("abcd\te", 4) == "abcd    e");
    CHECK(expand_tabs("a\tb\nab\tc", 4) == "a   b\nab  c");
    CHECK(expand_tabs("\xe4\xb8\x96\tx", 4) == "\xe4\xb8\x96  x");
    CHECK(expand_tabs("no tabs") == "no tabs");
}

TEST_CASE("expand_tabs ends runs on a tab stop")
{
    const std::string text = "x\tab\t\tabc\tq\xe4\xb8\x96\tz";

    for (size_t width : {2, 4, 8}) {
        auto expanded = expand_tabs(text, width);
        size_t column = 0;
        bool in_run = false;

        for (size_t lpc = 0; lpc < expanded.size(); lpc++) {
            auto ch = expanded[lpc];

            if (ch == ' ') {
                in_run = true;
                column += 1;
                continue;
            }
            if (in_run) {
                CHECK(column % width == 0);
                in_run = false;
            }
            if ((ch & 0xc0) == 0x80) {
                continue;
            }
            column += (ch & 0x80) ? 2 : 1;
        }
    }
}

TEST_CASE("detect_extension")
{
    CHECK(detect_extension("README.MD").value() == "md");
    CHECK(detect_extension("/tmp/foo.tar.gz").value() == "gz");
    CHECK_FALSE(detect_extension("Makefile").has_value());
    CHECK(is_markdown_extension("markdown"));
    CHECK(is_markdown_extension("mkdn"));
    CHECK_FALSE(is_markdown_extension("txt"));
}

TEST_CASE("prepare_content")
{
    load_options opts;

    SUBCASE("binary is rejected")
    {
        try {
            prepare_content(std::string("Hello\0World", 11), "bin.dat", std::nullopt, opts);
            CHECK(false);
        } catch (const mat::error& e) {
            CHECK(e.is<binary_file>());
            CHECK(e.exit_code() == 1);
            CHECK(e.get_message().find("bin.dat") != std::string::npos);
        }
    }

    SUBCASE("binary can be forced")
    {
        opts.lo_force_binary = true;
        auto con = prepare_content(
            std::string("Hello\0World", 11), "bin.dat", std::nullopt, opts);

        CHECK(con.c_text.find("Hello") == 0);
    }

    SUBCASE("ansi is stripped unless preserved")
    {
        auto con = prepare_content(
            "\x1b[31mred\x1b[0m\tx\n", "t.txt", std::string("txt"), opts);

        CHECK(con.c_text == "red x\n");
        CHECK(con.c_extension.value() == "txt");
        CHECK(con.c_encoding == text_encoding::utf8);

        opts.lo_preserve_ansi = true;
        con = prepare_content("\x1b[31mred\x1b[0m\n", "t.txt", std::nullopt, opts);
        CHECK(con.c_text == "\x1b[31mred\x1b[0m\n");
    }
}
