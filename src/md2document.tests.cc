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

#include <algorithm>

#include "md2document.hh"

#include "base/string_util.hh"
#include "doctest/doctest.h"

using namespace mat;

static std::vector<std::string>
texts_of(const document& doc)
{
    std::vector<std::string> retval;

    for (const auto& line : doc.d_lines) {
        retval.emplace_back(line.text());
    }

    return retval;
}

static const styled_span*
find_span(const document& doc, const std::string& text)
{
    for (const auto& line : doc.d_lines) {
        for (const auto& span : line.sl_spans) {
            if (span.ss_text == text) {
                return &span;
            }
        }
    }

    return nullptr;
}

static bool
has_line(const document& doc, const std::string& text)
{
    auto lines = texts_of(doc);

    return std::find(lines.begin(), lines.end(), text) != lines.end();
}

TEST_CASE("markdown headings")
{
    auto doc = render_markdown("# Title\n\n## Section {#sec}\n\n### Sub\n",
                               "README.md");
    auto lines = texts_of(doc);

    REQUIRE(lines.size() >= 5);
    CHECK(lines[0].find("╔") == 0);
    CHECK(lines[1] == "║  Title");
    CHECK(lines[2].find("╚") == 0);
    CHECK(has_line(doc, "──◈ Section ◈" + repeat("─", 30)));
    CHECK(has_line(doc, "▸ Sub"));
    CHECK(doc.d_source_name == "README.md");

    auto* title = find_span(doc, "Title");
    REQUIRE(title != nullptr);
    CHECK(title->ss_attrs.has_style(text_attrs::style::bold));
}

TEST_CASE("markdown line numbers are sequential")
{
    auto doc = render_markdown("para one\n\npara two\n", "t.md");

    REQUIRE(doc.line_count() == 3);
    for (size_t lpc = 0; lpc < doc.line_count(); lpc++) {
        CHECK(doc.d_lines[lpc].sl_number == lpc + 1);
    }
    CHECK(texts_of(doc)
          == std::vector<std::string>{"para one", "", "para two"});
    CHECK(doc.d_encoding == "UTF-8");
}

TEST_CASE("markdown nested emphasis merges styles")
{
    auto doc = render_markdown("**bold *both***\n", "t.md");
    auto* both = find_span(doc, "both");
    auto* bold = find_span(doc, "bold ");

    REQUIRE(both != nullptr);
    REQUIRE(bold != nullptr);
    CHECK(both->ss_attrs.has_style(text_attrs::style::bold));
    CHECK(both->ss_attrs.ta_fg_color
          == styling::color_unit::from_palette(COLOR_YELLOW));
    CHECK(bold->ss_attrs.ta_fg_color.empty());
}

TEST_CASE("markdown lists")
{
    auto doc = render_markdown(
        "- one\n- two\n  - nested\n\n3. third\n4. fourth\n\n- [x] done\n- [ ] todo\n",
        "t.md");

    CHECK(has_line(doc, "• one"));
    CHECK(has_line(doc, "• two"));
    CHECK(has_line(doc, "  ◦ nested"));
    CHECK(has_line(doc, "3. third"));
    CHECK(has_line(doc, "4. fourth"));
    CHECK(has_line(doc, "• [x] done"));
    CHECK(has_line(doc, "• [ ] todo"));
}

TEST_CASE("markdown code")
{
    auto doc = render_markdown(
        "Use `ls` here.\n\n```rust\nfn main() {\n\n}\n```\n", "t.md");

    CHECK(has_line(doc, "Use ls here."));
    CHECK(has_line(doc, "fn main() {"));
    CHECK(has_line(doc, "}"));

    auto* inline_code = find_span(doc, "ls");
    REQUIRE(inline_code != nullptr);
    CHECK(inline_code->ss_attrs.ta_fg_color
          == styling::color_unit::from_palette(COLOR_CYAN));

    auto* block_code = find_span(doc, "fn main() {");
    REQUIRE(block_code != nullptr);
    CHECK(block_code->ss_attrs.ta_fg_color
          == styling::color_unit::from_palette(COLOR_GREEN));

    auto lines = texts_of(doc);
    auto info_iter = std::find_if(lines.begin(), lines.end(), [](const auto& l) {
        return l.find("─── rust ") == 0;
    });
    CHECK(info_iter != lines.end());

    auto open_iter = std::find(lines.begin(), lines.end(), "fn main() {");
    REQUIRE(open_iter != lines.end());
    CHECK(*(open_iter + 1) == "");
}

TEST_CASE("markdown quotes links and images")
{
    auto doc = render_markdown(
        "> quoted\n\nSee [the site](https://example.com) and ![logo](l.png)\n",
        "t.md");

    CHECK(has_line(doc, "│ quoted"));
    CHECK(has_line(doc, "See the site and [Image: logo]"));

    auto* link = find_span(doc, "the site");
    REQUIRE(link != nullptr);
    CHECK(link->ss_attrs.has_style(text_attrs::style::underline));
    CHECK(link->ss_attrs.ta_fg_color
          == styling::color_unit::from_palette(COLOR_BLUE));
}

TEST_CASE("markdown rule and strikethrough")
{
    auto doc = render_markdown("above\n\n---\n\n~~gone~~\n", "t.md");
    auto* del = find_span(doc, "gone");

    REQUIRE(del != nullptr);
    CHECK(del->ss_attrs.ta_fg_color
          == styling::color_unit::from_palette(COLOR_DARK_GRAY));

    auto lines = texts_of(doc);
    CHECK(std::any_of(lines.begin(), lines.end(), [](const auto& l) {
        return l.find("────") == 0;
    }));
}

TEST_CASE("markdown width is tracked")
{
    auto doc = render_markdown("short\n\na longer paragraph\n", "t.md");

    CHECK(doc.d_max_line_width == 18);
}
