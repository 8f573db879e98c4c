/**
 * Copyright (c) 2022, Timothy Stack
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

#include "base/string_util.hh"

#include "base/ansi_scrubber.hh"
#include "doctest/doctest.h"

TEST_CASE("digit_count")
{
    CHECK(digit_count(0) == 1);
    CHECK(digit_count(9) == 1);
    CHECK(digit_count(10) == 2);
    CHECK(digit_count(99) == 2);
    CHECK(digit_count(1000) == 4);
}

TEST_CASE("utf8_display_width")
{
    CHECK(utf8_display_width(std::string("Hello")) == 5);
    CHECK(utf8_display_width(std::string("\xe4\xb8\x96\xe7\x95\x8c")) == 4);
    CHECK(utf8_display_width(std::string("Hello\xe4\xb8\x96")) == 7);
    CHECK(utf8_display_width(std::string("")) == 0);
}

TEST_CASE("utf8_string_length")
{
    auto sf = string_fragment::from_const("a\xe4\xb8\x96" "b");

    CHECK(utf8_string_length(sf) == 3);
    CHECK(utf8_char_to_byte_index(sf, 0) == 0);
    CHECK(utf8_char_to_byte_index(sf, 1) == 1);
    CHECK(utf8_char_to_byte_index(sf, 2) == 4);
    CHECK(utf8_char_to_byte_index(sf, 3) == 5);
    CHECK(utf8_char_to_byte_index(sf, 10) == 5);
}

TEST_CASE("utf8_floor_boundary")
{
    auto sf = string_fragment::from_const("a\xe4\xb8\x96" "b");

    CHECK(utf8_floor_boundary(sf, 0) == 0);
    CHECK(utf8_floor_boundary(sf, 2) == 1);
    CHECK(utf8_floor_boundary(sf, 3) == 1);
    CHECK(utf8_floor_boundary(sf, 4) == 4);
    CHECK(utf8_floor_boundary(sf, 9) == 5);
}

TEST_CASE("utf8_decode_at-invalid")
{
    auto sf = string_fragment::from_const("\xff" "a");
    uint32_t cp;

    CHECK(utf8_decode_at(sf, 0, cp) == 1);
    CHECK(cp == 0xfffd);
    CHECK(utf8_decode_at(sf, 1, cp) == 1);
    CHECK(cp == 'a');
}

TEST_CASE("string_fragment::trim")
{
    auto sf = string_fragment::from_const("  3:5 \n");

    CHECK(sf.trim().to_string() == "3:5");
    CHECK(sf.rtrim(" \n").to_string() == "  3:5");
}

TEST_CASE("strip_ansi_string")
{
    {
        std::string str = "\x1b[31mred\x1b[0m text";

        strip_ansi_string(str);
        CHECK(str == "red text");
    }
    {
        std::string str = "\x1b[1;32;40mbold\x1b[m";

        strip_ansi_string(str);
        CHECK(str == "bold");
    }
    {
        std::string str = "a\x1b" "7b\x1b" "8c";

        strip_ansi_string(str);
        CHECK(str == "abc");
    }
    {
        std::string str = "no escapes here";

        strip_ansi_string(str);
        CHECK(str == "no escapes here");
    }
    {
        std::string str = "dangling\x1b";

        strip_ansi_string(str);
        CHECK(str == "dangling");
    }
    {
        std::string str = "unterminated\x1b[12;3";

        strip_ansi_string(str);
        CHECK(str == "unterminated");
    }
    {
        std::string str = "\xe4\xb8\x96\x1b[0m\xe7\x95\x8c";

        strip_ansi_string(str);
        CHECK(str == "\xe4\xb8\x96\xe7\x95\x8c");
    }
}
