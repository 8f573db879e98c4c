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

#include <map>

#include "syntax_colorer.hh"

#include "doctest/doctest.h"
#include "grammar_set.hh"
#include "syntax_theme.hh"

using namespace mat;

static std::multimap<role_t, std::string>
tokens_of(syntax_tokenizer& tokenizer, const std::string& line)
{
    std::multimap<role_t, std::string> retval;
    size_t last_end = 0;

    for (const auto& token : tokenizer.tokenize(line)) {
        CHECK(token.st_start >= last_end);
        CHECK(token.st_end > token.st_start);
        CHECK(token.st_end <= line.size());
        retval.emplace(token.st_role,
                       line.substr(token.st_start,
                                   token.st_end - token.st_start));
        last_end = token.st_end;
    }

    return retval;
}

static bool
has_token(const std::multimap<role_t, std::string>& tokens,
          role_t role,
          const std::string& text)
{
    auto range = tokens.equal_range(role);

    for (auto iter = range.first; iter != range.second; ++iter) {
        if (iter->second == text) {
            return true;
        }
    }

    return false;
}

TEST_CASE("grammar_set lookups")
{
    const auto& gs = grammar_set::get();

    CHECK(gs.get_grammars().size() >= 40);
    for (const auto& gr : gs.get_grammars()) {
        for (const auto& hl : gr.g_highlighters) {
            CHECK(hl.h_regex != nullptr);
        }
    }

    REQUIRE(gs.find_by_name("rust") != nullptr);
    CHECK(gs.find_by_name("RUST")->g_name == "Rust");
    REQUIRE(gs.find_by_extension("PY") != nullptr);
    CHECK(gs.find_by_extension("PY")->g_name == "Python");
    CHECK(gs.find_by_name("klingon") == nullptr);
}

TEST_CASE("detect_language")
{
    CHECK(detect_language("src/main.rs").value() == "Rust");
    CHECK(detect_language("/tmp/Makefile").value() == "Makefile");
    CHECK(detect_language("Dockerfile").value() == "Dockerfile");
    CHECK(detect_language("x.HPP").value() == "C++");
    CHECK_FALSE(detect_language("notes.xyz").has_value());
    CHECK_FALSE(detect_language("stdin").has_value());
}

TEST_CASE("grammar_set::select")
{
    const auto& gs = grammar_set::get();

    CHECK(gs.select(std::nullopt, "main.rs")->g_name == "Rust");
    CHECK(gs.select(std::nullopt, "notes.txt")->g_name == "Plain Text");
    CHECK(gs.select(std::string("python"), "main.rs")->g_name == "Python");
    CHECK(gs.select(std::string("js"), "stdin")->g_name == "JavaScript");
    CHECK(gs.select(std::nullopt, "notes.xyz") == nullptr);
    CHECK(gs.select(std::string("klingon"), "main.rs") == nullptr);
}

TEST_CASE("tokenize rust")
{
    syntax_tokenizer tokenizer(*grammar_set::get().find_by_name("Rust"));
    auto tokens = tokens_of(
        tokenizer, R"(fn main() { let x = 42; println!("hi {}", x); })");

    CHECK(has_token(tokens, role_t::VCR_KEYWORD, "fn"));
    CHECK(has_token(tokens, role_t::VCR_KEYWORD, "let"));
    CHECK(has_token(tokens, role_t::VCR_NUMBER, "42"));
    CHECK(has_token(tokens, role_t::VCR_FUNCTION, "main"));
    CHECK(has_token(tokens, role_t::VCR_FUNCTION, "println!"));
    CHECK(has_token(tokens, role_t::VCR_STRING, R"("hi {}")"));
    CHECK_FALSE(tokenizer.in_block());

    tokens = tokens_of(tokenizer, "    // a comment");
    CHECK(has_token(tokens, role_t::VCR_COMMENT, "// a comment"));
}

TEST_CASE("tokenize block comments across lines")
{
    syntax_tokenizer tokenizer(*grammar_set::get().find_by_name("C"));

    auto tokens = tokens_of(tokenizer, "int x; /* start");
    CHECK(has_token(tokens, role_t::VCR_TYPE, "int"));
    CHECK(has_token(tokens, role_t::VCR_COMMENT, "/* start"));
    CHECK(tokenizer.in_block());

    tokens = tokens_of(tokenizer, "still inside");
    CHECK(has_token(tokens, role_t::VCR_COMMENT, "still inside"));
    CHECK(tokenizer.in_block());

    tokens = tokens_of(tokenizer, "end */ return 0;");
    CHECK(has_token(tokens, role_t::VCR_COMMENT, "end */"));
    CHECK(has_token(tokens, role_t::VCR_KEYWORD, "return"));
    CHECK(has_token(tokens, role_t::VCR_NUMBER, "0"));
    CHECK_FALSE(tokenizer.in_block());
}

TEST_CASE("tokenize python strings")
{
    syntax_tokenizer tokenizer(*grammar_set::get().find_by_name("Python"));

    auto tokens = tokens_of(tokenizer, R"(x = f"val" + 'y'  # note)");
    CHECK(has_token(tokens, role_t::VCR_STRING, R"(f"val")"));
    CHECK(has_token(tokens, role_t::VCR_STRING, "'y'"));
    CHECK(has_token(tokens, role_t::VCR_COMMENT, "# note"));

    tokens = tokens_of(tokenizer, R"(doc = """first)");
    CHECK(tokenizer.in_block());
    tokens = tokens_of(tokenizer, R"(last""" if True else None)");
    CHECK(has_token(tokens, role_t::VCR_STRING, R"(last""")"));
    CHECK(has_token(tokens, role_t::VCR_CONSTANT, "True"));
    CHECK_FALSE(tokenizer.in_block());
}

TEST_CASE("tokenize handles multibyte text")
{
    syntax_tokenizer tokenizer(*grammar_set::get().find_by_name("Rust"));
    auto tokens
        = tokens_of(tokenizer, "let s = \"\xe4\xb8\x96\xe7\x95\x8c\"; // \xf0\x9f\x8e\x89");

    CHECK(has_token(tokens, role_t::VCR_STRING, "\"\xe4\xb8\x96\xe7\x95\x8c\""));
    CHECK(has_token(tokens, role_t::VCR_COMMENT, "// \xf0\x9f\x8e\x89"));
}

TEST_CASE("apply_syntax_highlight")
{
    auto doc = document::from_text(
        "fn main() {\n    let x = 1;\n}\n", "main.rs", "UTF-8");
    auto before = doc;

    apply_syntax_highlight(doc, std::nullopt, theme_t::dark);

    REQUIRE(doc.line_count() == before.line_count());
    for (size_t lpc = 0; lpc < doc.line_count(); lpc++) {
        CHECK(doc.d_lines[lpc].text() == before.d_lines[lpc].text());
        CHECK(doc.d_lines[lpc].width() == before.d_lines[lpc].width());
        CHECK(doc.d_lines[lpc].sl_number == before.d_lines[lpc].sl_number);
    }

    const auto& st = theme_set::get().for_theme(theme_t::dark);
    REQUIRE(doc.d_lines[0].sl_spans.size() > 1);
    CHECK(doc.d_lines[0].sl_spans[0].ss_text == "fn");
    CHECK(doc.d_lines[0].sl_spans[0].ss_attrs
          == st.attrs_for_role(role_t::VCR_KEYWORD));
    CHECK(doc.d_lines[2].sl_spans[0].ss_attrs
          == st.attrs_for_role(role_t::VCR_TEXT));
}

TEST_CASE("apply_syntax_highlight skips context and separators")
{
    document doc;

    doc.d_source_name = "main.rs";
    doc.d_lines.emplace_back(styled_line::plain(1, "let a = 1;"));
    doc.d_lines.emplace_back(styled_line::separator());
    auto context = styled_line::plain(5, "let b = 2;");
    context.sl_is_context = true;
    doc.d_lines.emplace_back(context);
    auto before = doc;

    apply_syntax_highlight(doc, std::nullopt, theme_t::light);

    CHECK(doc.d_lines[0].sl_spans.size() > 1);
    CHECK(doc.d_lines[1].sl_spans == before.d_lines[1].sl_spans);
    CHECK(doc.d_lines[2].sl_spans == before.d_lines[2].sl_spans);
}

TEST_CASE("apply_syntax_highlight carries comments out of context lines")
{
    document doc;

    doc.d_source_name = "main.c";
    auto opener = styled_line::plain(1, "/* start");
    opener.sl_is_context = true;
    doc.d_lines.emplace_back(opener);
    auto matched = styled_line::plain(2, "still comment */ int x;");
    matched.sl_is_match = true;
    doc.d_lines.emplace_back(matched);
    auto before = doc;

    apply_syntax_highlight(doc, std::nullopt, theme_t::dark);

    const auto& st = theme_set::get().for_theme(theme_t::dark);
    CHECK(doc.d_lines[0].sl_spans == before.d_lines[0].sl_spans);
    REQUIRE_FALSE(doc.d_lines[1].sl_spans.empty());
    CHECK(doc.d_lines[1].sl_spans[0].ss_text == "still comment */");
    CHECK(doc.d_lines[1].sl_spans[0].ss_attrs
          == st.attrs_for_role(role_t::VCR_COMMENT));
}

TEST_CASE("apply_syntax_highlight without a grammar")
{
    auto doc = document::from_text("fn main() {}\n", "notes.xyz", "UTF-8");
    auto before = doc;

    apply_syntax_highlight(doc, std::nullopt, theme_t::dark);
    CHECK(doc.d_lines[0].sl_spans == before.d_lines[0].sl_spans);
}

TEST_CASE("theme_set")
{
    const auto& ts = theme_set::get();

    CHECK(ts.for_theme(theme_t::dark).st_name == "base16-ocean.dark");
    CHECK(ts.for_theme(theme_t::light).st_name == "base16-ocean.light");
    REQUIRE(ts.find("base16-ocean.light") != nullptr);
    CHECK(ts.find("solarized") == nullptr);
    CHECK(ts.for_theme(theme_t::dark).attrs_for_role(role_t::VCR_KEYWORD)
          != ts.for_theme(theme_t::dark).attrs_for_role(role_t::VCR_STRING));
}
