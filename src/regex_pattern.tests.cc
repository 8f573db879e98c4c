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

#include "regex_pattern.hh"

#include "base/mat.error.hh"
#include "doctest/doctest.h"

using namespace mat;

static bool
matches(const pcre2pp::code& re, const char* str)
{
    return re.find_in(string_fragment::from_c_str(str)).ignore_error()
        .has_value();
}

TEST_CASE("build_regex_pattern")
{
    pattern_options opts;

    CHECK(build_regex_pattern("a.b", opts) == "a.b");

    opts.po_fixed_strings = true;
    CHECK(build_regex_pattern("a.b", opts) == "a\\.b");

    opts.po_word_regexp = true;
    CHECK(build_regex_pattern("a|b", opts) == "\\b(?:a\\|b)\\b");

    opts = pattern_options{};
    opts.po_line_regexp = true;
    opts.po_ignore_case = true;
    CHECK(build_regex_pattern("a|b", opts) == "(?i)^(?:a|b)$");
}

TEST_CASE("compile_pattern options")
{
    pattern_options opts;

    SUBCASE("plain")
    {
        auto re = compile_pattern("te.t", opts);

        CHECK(matches(*re, "a test"));
        CHECK(matches(*re, "text"));
        CHECK_FALSE(matches(*re, "TEST"));
    }

    SUBCASE("ignore case")
    {
        opts.po_ignore_case = true;
        auto re = compile_pattern("hello", opts);

        CHECK(matches(*re, "HELLO there"));
    }

    SUBCASE("fixed strings")
    {
        opts.po_fixed_strings = true;
        auto re = compile_pattern("test[0]", opts);

        CHECK(matches(*re, "x = test[0];"));
        CHECK_FALSE(matches(*re, "test0"));
    }

    SUBCASE("word")
    {
        opts.po_word_regexp = true;
        auto re = compile_pattern("test", opts);

        CHECK(matches(*re, "a test here"));
        CHECK_FALSE(matches(*re, "testing"));
    }

    SUBCASE("line")
    {
        opts.po_line_regexp = true;
        auto re = compile_pattern("foo|bar", opts);

        CHECK(matches(*re, "bar"));
        CHECK_FALSE(matches(*re, "foobar"));
    }
}

TEST_CASE("compile_pattern errors")
{
    pattern_options opts;

    try {
        compile_pattern("[invalid", opts);
        CHECK(false);
    } catch (const mat::error& e) {
        CHECK(e.is<invalid_regex>());
        CHECK(e.exit_code() == 2);
        CHECK(e.get_message().find("[invalid") != std::string::npos);
    }

    try {
        compile_pattern("", opts);
        CHECK(false);
    } catch (const mat::error& e) {
        CHECK(e.is<empty_pattern>());
        CHECK(e.exit_code() == 1);
    }
}
