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
 * @file search_overlay.cc
 */

#include "search_overlay.hh"

#include "base/mat_log.hh"
#include "base/string_util.hh"

namespace mat {

text_attrs
search_highlight_attrs()
{
    return text_attrs::with_colors(
               styling::color_unit::from_palette(COLOR_BLACK),
               styling::color_unit::from_palette(COLOR_YELLOW))
        | text_attrs::style::bold;
}

static std::vector<std::pair<size_t, size_t>>
find_ranges(const std::string& text, const pcre2pp::code& re)
{
    std::vector<std::pair<size_t, size_t>> retval;
    auto sf = string_fragment::from_str(text);

    re.capture_from(sf).for_each([&retval](const pcre2pp::match_data& md) {
        auto all = md[0];

        if (all && !all->empty()) {
            retval.emplace_back(all->sf_begin, all->sf_end);
        }
    });

    return retval;
}

std::vector<match_position>
find_matches(const document& doc, const pcre2pp::code& re)
{
    std::vector<match_position> retval;

    for (size_t lpc = 0; lpc < doc.d_lines.size(); lpc++) {
        for (const auto& range : find_ranges(doc.d_lines[lpc].text(), re)) {
            retval.emplace_back(match_position{lpc, range.first, range.second});
        }
    }

    return retval;
}

static size_t
utf8_ceil_boundary(const std::string& text, size_t byte_index)
{
    while (byte_index < text.size() && (text[byte_index] & 0xc0) == 0x80) {
        byte_index += 1;
    }

    return byte_index;
}

void
apply_search_highlight(document& doc, const pcre2pp::code& re)
{
    auto hl_attrs = search_highlight_attrs();

    for (auto& line : doc.d_lines) {
        auto text = line.text();
        auto ranges = find_ranges(text, re);

        if (ranges.empty()) {
            continue;
        }

        auto text_sf = string_fragment::from_str(text);
        for (auto& range : ranges) {
            range.first = utf8_floor_boundary(text_sf, range.first);
            range.second = utf8_ceil_boundary(text, range.second);
        }

        styled_line hl_line;
        size_t span_start = 0;

        hl_line.sl_number = line.sl_number;
        hl_line.sl_is_match = line.sl_is_match;
        hl_line.sl_is_context = line.sl_is_context;
        for (const auto& span : line.sl_spans) {
            auto span_end = span_start + span.ss_text.size();
            auto cursor = span_start;

            for (const auto& range : ranges) {
                if (range.second <= span_start || range.first >= span_end) {
                    continue;
                }

                auto hl_start = std::max(range.first, cursor);
                auto hl_end = std::min(range.second, span_end);

                if (hl_start >= hl_end) {
                    continue;
                }
                if (hl_start > cursor) {
                    hl_line.append(
                        text.substr(cursor, hl_start - cursor), span.ss_attrs);
                }
                hl_line.append(text.substr(hl_start, hl_end - hl_start),
                               hl_attrs);
                cursor = hl_end;
            }
            if (cursor < span_end) {
                hl_line.append(text.substr(cursor, span_end - cursor),
                               span.ss_attrs);
            }
            span_start = span_end;
        }

        line = std::move(hl_line);
    }
}

std::optional<match_position>
search_state::next_match()
{
    if (this->ss_matches.empty()) {
        return std::nullopt;
    }

    if (!this->ss_current) {
        this->ss_current = 0;
    } else {
        this->ss_current
            = (this->ss_current.value() + 1) % this->ss_matches.size();
    }

    return this->ss_matches[this->ss_current.value()];
}

std::optional<match_position>
search_state::prev_match()
{
    if (this->ss_matches.empty()) {
        return std::nullopt;
    }

    if (!this->ss_current || this->ss_current.value() == 0) {
        this->ss_current = this->ss_matches.size() - 1;
    } else {
        this->ss_current = this->ss_current.value() - 1;
    }

    return this->ss_matches[this->ss_current.value()];
}

}  // namespace mat
