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

#include <limits>

#include "grep_filter.hh"

#include "doctest/doctest.h"
#include "regex_pattern.hh"

using namespace mat;

static grep_options
grep_for(const char* pattern, size_t before = 0, size_t after = 0)
{
    grep_options retval;

    retval.go_pattern = compile_pattern(pattern, pattern_options{});
    retval.go_before = before;
    retval.go_after = after;
    return retval;
}

static std::vector<std::string>
texts_of(const document& doc)
{
    std::vector<std::string> retval;

    for (const auto& line : doc.d_lines) {
        retval.emplace_back(line.text());
    }

    return retval;
}

static const char* FRUIT
    = "apple\nbanana\ncherry\napricot\nblueberry\ncoconut\navocado\n";

TEST_CASE("merge_intervals")
{
    using ivs = std::vector<line_interval>;

    CHECK(merge_intervals({}).empty());
    CHECK(merge_intervals({{5, 7}, {0, 2}}) == ivs{{0, 2}, {5, 7}});
    CHECK(merge_intervals({{0, 3}, {2, 5}}) == ivs{{0, 5}});
    CHECK(merge_intervals({{0, 3}, {3, 5}}) == ivs{{0, 5}});
    CHECK(merge_intervals({{0, 10}, {2, 5}}) == ivs{{0, 10}});

    ivs disjoint{{0, 1}, {3, 4}, {8, 9}};
    CHECK(merge_intervals(disjoint) == disjoint);
    CHECK(merge_intervals(merge_intervals({{4, 6}, {0, 2}, {1, 3}}))
          == merge_intervals({{1, 3}, {4, 6}, {0, 2}}));
}

TEST_CASE("grep_filter without context")
{
    auto doc = document::from_text(FRUIT, "fruit.txt", "UTF-8");
    auto filtered = grep_filter(doc, grep_for("a"));

    CHECK(texts_of(filtered)
          == std::vector<std::string>{
              "apple", "banana", "--", "apricot", "--", "avocado"});
    CHECK(filtered.d_lines[0].sl_is_match);
    CHECK(filtered.d_lines[2].is_separator());
    CHECK(filtered.d_lines[3].sl_number == 4);
    CHECK(filtered.d_source_name == "fruit.txt");
}

TEST_CASE("grep_filter with context")
{
    auto doc = document::from_text(FRUIT, "fruit.txt", "UTF-8");
    auto filtered = grep_filter(doc, grep_for("cherry", 1, 1));

    REQUIRE(filtered.line_count() == 3);
    CHECK(filtered.d_lines[0].sl_number == 2);
    CHECK(filtered.d_lines[0].sl_is_context);
    CHECK(filtered.d_lines[0].sl_spans[0].ss_attrs.ta_fg_color
          == styling::color_unit::from_palette(COLOR_DARK_GRAY));
    CHECK(filtered.d_lines[1].sl_number == 3);
    CHECK(filtered.d_lines[1].sl_is_match);
    CHECK(filtered.d_lines[2].sl_number == 4);
    CHECK(filtered.d_lines[2].sl_is_context);
}

TEST_CASE("grep_filter clamps context to the document")
{
    auto doc = document::from_text(FRUIT, "fruit.txt", "UTF-8");
    auto filtered = grep_filter(doc, grep_for("^(apple|avocado)$", 3, 3));

    CHECK(texts_of(filtered)
          == std::vector<std::string>{"apple",
                                      "banana",
                                      "cherry",
                                      "apricot",
                                      "blueberry",
                                      "coconut",
                                      "avocado"});
}

TEST_CASE("grep_filter with huge context counts")
{
    auto doc = document::from_text(FRUIT, "fruit.txt", "UTF-8");
    auto huge = std::numeric_limits<size_t>::max();

    auto filtered = grep_filter(doc, grep_for("^coconut$", 0, huge));
    CHECK(texts_of(filtered)
          == std::vector<std::string>{"coconut", "avocado"});
    CHECK(filtered.d_lines[0].sl_is_match);

    filtered = grep_filter(doc, grep_for("^banana$", huge, 0));
    CHECK(texts_of(filtered) == std::vector<std::string>{"apple", "banana"});
}

TEST_CASE("grep_filter separates disjoint windows")
{
    auto doc = document::from_text(
        "a\nb\nMATCH1\nc\nd\ne\nMATCH2\nf\n", "t", "UTF-8");
    auto filtered = grep_filter(doc, grep_for("MATCH", 1, 1));

    CHECK(texts_of(filtered)
          == std::vector<std::string>{
              "b", "MATCH1", "c", "--", "e", "MATCH2", "f"});
    CHECK_FALSE(filtered.d_lines.front().is_separator());
    CHECK_FALSE(filtered.d_lines.back().is_separator());
}

TEST_CASE("grep_filter merges touching windows")
{
    auto doc
        = document::from_text("a\nb\nMATCH1\nc\nd\nMATCH2\nf\n", "t", "UTF-8");
    auto filtered = grep_filter(doc, grep_for("MATCH", 1, 1));

    CHECK(texts_of(filtered)
          == std::vector<std::string>{"b", "MATCH1", "c", "d", "MATCH2", "f"});
}

TEST_CASE("grep_filter with no matches")
{
    auto doc = document::from_text(FRUIT, "fruit.txt", "UTF-8");
    auto filtered = grep_filter(doc, grep_for("zebra"));

    CHECK(filtered.empty());
    CHECK(filtered.d_max_line_width == 0);
}

TEST_CASE("grep_options::with_context")
{
    grep_options opts;

    opts.with_context(2, 3, std::nullopt);
    CHECK(opts.go_before == 2);
    CHECK(opts.go_after == 3);

    opts.with_context(2, 3, 5);
    CHECK(opts.go_before == 5);
    CHECK(opts.go_after == 5);

    opts.with_context(std::nullopt, 1, std::nullopt);
    CHECK(opts.go_before == 0);
    CHECK(opts.go_after == 1);
}
