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
 * @file ansi_scrubber.tests.cc
 */

#include "base/ansi_scrubber.hh"

#include "doctest/doctest.h"

TEST_CASE("erase_ansi_escapes")
{
    char input[] = "Hello, \x1b[33;mWorld\x1b[0;m!";

    auto new_len = erase_ansi_escapes(string_fragment::from_const(input));

    CHECK(new_len == 13);
    CHECK(std::string(input, new_len) == "Hello, World!");
}

TEST_CASE("strip_ansi_string")
{
    std::string str = "Hello, World!";

    strip_ansi_string(str);
    CHECK(str == "Hello, World!");

    str = "Hello\x1b[44;m, \x1b[33;mWorld\x1b[0;m!";
    strip_ansi_string(str);
    CHECK(str == "Hello, World!");

    str = ANSI_BOLD("bold") " and " ANSI_COLOR(1) "red" ANSI_NORM;
    strip_ansi_string(str);
    CHECK(str == "bold and red");

    // two-character escapes and a dangling ESC
    str = "a\x1b" "7b\x1b" "8c\x1b";
    strip_ansi_string(str);
    CHECK(str == "abc");

    str = "\xe2\x80\xa2\x1b[1m\xe4\xb8\x96\x1b[0m";
    strip_ansi_string(str);
    CHECK(str == "\xe2\x80\xa2\xe4\xb8\x96");
}
