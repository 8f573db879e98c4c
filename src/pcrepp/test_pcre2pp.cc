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

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "pcre2pp.hh"

TEST_CASE("bad pattern")
{
    try {
        mat::pcre2pp::code::from(string_fragment::from_const("[abc"));
        CHECK(false);
    } catch (const mat::pcre2pp::compile_error& ce) {
        CHECK(ce.ce_offset == 4);
        CHECK(ce.ce_pattern == "[abc");
        CHECK(!ce.get_message().empty());
    }
}

TEST_CASE("match")
{
    static const char INPUT[] = "key1=1234;key2=5678;";

    auto co = mat::pcre2pp::code::from_const(R"((\w+)=([^;]+);)");
    std::vector<std::string> keys;

    co.capture_from(string_fragment::from_const(INPUT))
        .for_each([&keys](mat::pcre2pp::match_data& md) {
            keys.emplace_back(md[1]->to_string());
        });

    CHECK(keys.size() == 2);
    CHECK(keys[0] == "key1");
    CHECK(keys[1] == "key2");
}

TEST_CASE("for_each-empty-matches-multibyte")
{
    static const char INPUT[] = "\xe4\xb8\x96\xe7\x95\x8c";

    auto co = mat::pcre2pp::code::from_const(R"(x*)");
    auto count = 0;

    co.capture_from(string_fragment::from_const(INPUT))
        .for_each([&count](mat::pcre2pp::match_data& md) { count += 1; });

    CHECK(count == 3);
}

TEST_CASE("find_in")
{
    auto co = mat::pcre2pp::code::from_const(R"(\bworld\b)", PCRE2_CASELESS);
    auto inp = string_fragment::from_const("Hello, World!");

    auto find_res = co.find_in(inp).ignore_error();
    REQUIRE(find_res.has_value());
    CHECK(find_res->f_all.sf_begin == 7);
    CHECK(find_res->f_all.sf_end == 12);
}

TEST_CASE("capture_count")
{
    auto co = mat::pcre2pp::code::from_const(R"(^(\w+)=([^;]+);)");

    CHECK(co.get_capture_count() == 2);
}

TEST_CASE("quote")
{
    auto quoted = mat::pcre2pp::quote(string_fragment::from_const("a.b*c(d)"));

    CHECK(quoted == R"(a\.b\*c\(d\))");

    auto co = mat::pcre2pp::code::from(quoted);
    CHECK(co.find_in(string_fragment::from_const("xa.b*c(d)"))
              .ignore_error()
              .has_value());
    CHECK(!co.find_in(string_fragment::from_const("aXbbbcd"))
               .ignore_error()
               .has_value());
}
