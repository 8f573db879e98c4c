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
 * @file viewer_render.cc
 */

#include "viewer_render.hh"

#include "base/string_util.hh"
#include "fmt/format.h"
#include "fmt/ranges.h"

namespace mat {

namespace {

/** Walks the characters of a line, copying the visible ones to a row. */
struct row_builder {
    styled_line rb_row;
    size_t rb_taken{0};

    void pad(size_t width)
    {
        if (this->rb_taken < width) {
            this->rb_row.append(std::string(width - this->rb_taken, ' '));
            this->rb_taken = width;
        }
    }
};

void
clip_into(row_builder& rb,
          const styled_line& line,
          size_t scroll_col,
          size_t width)
{
    size_t current_col = 0;

    for (const auto& span : line.sl_spans) {
        auto sf = string_fragment::from_str(span.ss_text);

        for (size_t index = 0; index < span.ss_text.size();) {
            uint32_t cp;
            auto start = index;

            index += utf8_decode_at(sf, index, cp);

            auto cp_width = (size_t) codepoint_width(cp);
            if (current_col >= scroll_col) {
                if (rb.rb_taken + cp_width > width) {
                    return;
                }
                rb.rb_row.append(span.ss_text.substr(start, index - start),
                                 span.ss_attrs);
                rb.rb_taken += cp_width;
            } else if (current_col + cp_width > scroll_col) {
                auto overlap = current_col + cp_width - scroll_col;

                overlap = std::min(overlap, width - rb.rb_taken);
                rb.rb_row.append(std::string(overlap, ' '), span.ss_attrs);
                rb.rb_taken += overlap;
            }
            current_col += cp_width;
        }
    }
}

}  // namespace

styled_line
clip_line(const styled_line& line, size_t scroll_col, size_t width)
{
    row_builder rb;

    clip_into(rb, line, scroll_col, width);
    rb.pad(width);

    return std::move(rb.rb_row);
}

styled_line
clip_line_truncated(const styled_line& line,
                    size_t scroll_col,
                    size_t max_width,
                    size_t width)
{
    if (line.width() <= max_width) {
        return clip_line(line, scroll_col, width);
    }

    row_builder rb;

    clip_into(rb, line, scroll_col, max_width > 0 ? max_width - 1 : 0);
    rb.rb_row.append("…", text_attrs::with_fg(COLOR_DARK_GRAY));
    rb.rb_taken += 1;
    rb.pad(width);

    return std::move(rb.rb_row);
}

styled_line
slice_wrapped_row(const styled_line& line, size_t char_offset, size_t width)
{
    row_builder rb;
    size_t char_index = 0;

    for (const auto& span : line.sl_spans) {
        auto sf = string_fragment::from_str(span.ss_text);
        bool full = false;

        for (size_t index = 0; index < span.ss_text.size() && !full;) {
            uint32_t cp;
            auto start = index;

            index += utf8_decode_at(sf, index, cp);
            if (char_index >= char_offset) {
                auto cp_width = (size_t) codepoint_width(cp);

                if (rb.rb_taken + cp_width > width) {
                    full = true;
                    continue;
                }
                rb.rb_row.append(span.ss_text.substr(start, index - start),
                                 span.ss_attrs);
                rb.rb_taken += cp_width;
            }
            char_index += 1;
        }
        if (full) {
            break;
        }
    }
    rb.pad(width);

    return std::move(rb.rb_row);
}

styled_line
render_gutter(std::optional<size_t> number,
              size_t gutter_width,
              const theme_colors& palette)
{
    auto attrs = text_attrs::with_colors(palette.tc_gutter,
                                         styling::color_unit::make_empty());
    styled_line retval;

    if (number) {
        auto num_width = gutter_width >= 2 ? gutter_width - 2 : 0;
        auto num_str = fmt::format(
            FMT_STRING("{:>{}} "), number.value(), num_width);
        auto num_cols = utf8_display_width(num_str);

        if (num_cols < gutter_width) {
            num_str.append(gutter_width - num_cols, ' ');
        }
        retval.append(num_str, attrs);
    } else {
        retval.append(std::string(gutter_width, ' '), attrs);
    }

    return retval;
}

/** @return The prefix of the string that fits in the given columns. */
static std::string
take_columns(const std::string& str, size_t width)
{
    auto sf = string_fragment::from_str(str);
    size_t cols = 0;
    size_t index = 0;

    while (index < str.size()) {
        uint32_t cp;
        auto len = utf8_decode_at(sf, index, cp);
        auto cp_width = (size_t) codepoint_width(cp);

        if (cols + cp_width > width) {
            break;
        }
        cols += cp_width;
        index += len;
    }

    return str.substr(0, index);
}

styled_line
render_status_bar(viewer_state& vs)
{
    const auto& doc = vs.get_document();
    auto left = fmt::format(FMT_STRING(" {} ({}/{}) "),
                            doc.d_source_name,
                            vs.get_scroll_line() + 1,
                            doc.line_count());
    std::string center;

    switch (vs.get_mode()) {
        case view_mode_t::normal: {
            std::vector<std::string> indicators;

            switch (vs.get_wrap_mode()) {
                case wrap_mode_t::wrap:
                    indicators.emplace_back("[WRAP]");
                    break;
                case wrap_mode_t::truncate:
                    indicators.emplace_back("[TRUNC]");
                    break;
                case wrap_mode_t::none:
                    break;
            }
            if (vs.is_following()) {
                indicators.emplace_back("[FOLLOW]");
            }

            const auto& ss = vs.get_search_state();
            if (ss && !ss->get_matches().empty()) {
                auto current = ss->get_current();

                if (current) {
                    indicators.emplace_back(
                        fmt::format(FMT_STRING("Match {}/{}"),
                                    current.value() + 1,
                                    ss->get_matches().size()));
                } else {
                    indicators.emplace_back(
                        fmt::format(FMT_STRING("{} matches"),
                                    ss->get_matches().size()));
                }
            }
            if (!indicators.empty()) {
                center = fmt::format(FMT_STRING(" {} "),
                                     fmt::join(indicators, " | "));
            }
            break;
        }
        case view_mode_t::search:
            center = fmt::format(FMT_STRING(" [SEARCH: {}] "),
                                 vs.get_search_query());
            break;
    }

    std::string right;
    auto utf8 = doc.d_encoding == "UTF-8";

    if (vs.get_wrap_mode() == wrap_mode_t::wrap) {
        if (!utf8) {
            right = fmt::format(FMT_STRING("{} "), doc.d_encoding);
        }
    } else if (utf8) {
        right = fmt::format(FMT_STRING("Col {}/{} "),
                            vs.get_scroll_col() + 1,
                            doc.d_max_line_width);
    } else {
        right = fmt::format(FMT_STRING("Col {}/{} | {} "),
                            vs.get_scroll_col() + 1,
                            doc.d_max_line_width,
                            doc.d_encoding);
    }

    auto total_width = vs.get_width();
    auto used = utf8_display_width(left) + utf8_display_width(center)
        + utf8_display_width(right);
    auto available = total_width > used ? total_width - used : 0;
    auto left_padding = available / 2;
    auto right_padding = available - left_padding;
    auto status = left + std::string(left_padding, ' ') + center
        + std::string(right_padding, ' ') + right;

    status = take_columns(status, total_width);

    auto status_cols = utf8_display_width(status);
    if (status_cols < total_width) {
        status.append(total_width - status_cols, ' ');
    }

    const auto& palette = vs.get_palette();
    styled_line retval;

    retval.append(status,
                  text_attrs::with_colors(palette.tc_status_fg,
                                          palette.tc_status_bg)
                      | text_attrs::style::bold);

    return retval;
}

std::vector<styled_line>
render_screen(viewer_state& vs)
{
    std::vector<styled_line> retval;
    const auto& doc = vs.get_document();
    auto height = vs.content_height();
    auto gutter_width = vs.gutter_width();
    auto content_width = vs.content_width();
    auto scroll_line = vs.get_scroll_line();
    auto scroll_col = vs.get_scroll_col();
    const auto& palette = vs.get_palette();

    auto add_row = [&retval, gutter_width, &palette](
                       std::optional<size_t> number,
                       bool show_number,
                       styled_line content) {
        styled_line row;

        if (gutter_width > 0) {
            row = render_gutter(
                show_number ? number : std::nullopt, gutter_width, palette);
        }
        for (const auto& span : content.sl_spans) {
            row.append(span.ss_text, span.ss_attrs);
        }
        retval.emplace_back(std::move(row));
    };

    if (vs.get_wrap_mode() == wrap_mode_t::wrap) {
        const auto& rows = vs.get_wrap_rows();

        for (auto lpc = scroll_line;
             lpc < rows.size() && retval.size() < height;
             lpc++)
        {
            const auto& wr = rows[lpc];

            add_row(wr.wr_line_number,
                    wr.wr_is_first_row && wr.wr_line_number != 0,
                    slice_wrapped_row(doc.d_lines[wr.wr_line_idx],
                                      wr.wr_char_offset,
                                      content_width));
        }
    } else {
        auto max_width = std::min(vs.get_max_width(), content_width);

        for (auto lpc = scroll_line;
             lpc < doc.line_count() && retval.size() < height;
             lpc++)
        {
            const auto& line = doc.d_lines[lpc];

            if (vs.get_wrap_mode() == wrap_mode_t::truncate) {
                add_row(line.sl_number,
                        !line.is_separator(),
                        clip_line_truncated(
                            line, scroll_col, max_width, content_width));
            } else {
                add_row(line.sl_number,
                        !line.is_separator(),
                        clip_line(line, scroll_col, content_width));
            }
        }
    }

    while (retval.size() < height) {
        styled_line blank;

        blank.append(std::string(vs.get_width(), ' '));
        retval.emplace_back(std::move(blank));
    }
    retval.emplace_back(render_status_bar(vs));

    return retval;
}

}  // namespace mat
