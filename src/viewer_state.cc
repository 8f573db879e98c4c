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
 * @file viewer_state.cc
 */

#include <algorithm>

#include "viewer_state.hh"

#include "base/mat.error.hh"
#include "base/string_util.hh"
#include "content_loader.hh"
#include "regex_pattern.hh"

namespace mat {

std::optional<wrap_mode_t>
parse_wrap_mode(const std::string& name)
{
    auto lower = tolower(name);

    if (lower == "none") {
        return wrap_mode_t::none;
    }
    if (lower == "wrap") {
        return wrap_mode_t::wrap;
    }
    if (lower == "truncate") {
        return wrap_mode_t::truncate;
    }

    return std::nullopt;
}

std::vector<wrapped_row>
build_wrap_rows(const document& doc, size_t content_width)
{
    std::vector<wrapped_row> retval;
    auto width = std::max(content_width, (size_t) 1);

    for (size_t line_idx = 0; line_idx < doc.d_lines.size(); line_idx++) {
        const auto& line = doc.d_lines[line_idx];
        auto text = line.text();
        auto sf = string_fragment::from_str(text);
        size_t row_width = 0;
        size_t row_start = 0;
        size_t char_index = 0;
        bool first = true;

        for (size_t index = 0; index < text.size();) {
            uint32_t cp;

            index += utf8_decode_at(sf, index, cp);

            auto cp_width = (size_t) codepoint_width(cp);
            if (row_width + cp_width > width && row_width > 0) {
                retval.emplace_back(wrapped_row{
                    line_idx, line.sl_number, first, row_start, row_width});
                first = false;
                row_start = char_index;
                row_width = 0;
            }
            row_width += cp_width;
            char_index += 1;
        }
        retval.emplace_back(wrapped_row{
            line_idx, line.sl_number, first, row_start, row_width});
    }

    return retval;
}

viewer_state::viewer_state(document doc,
                           std::optional<search_state> search,
                           theme_colors palette,
                           viewer_options opts)
    : vs_document(std::move(doc)), vs_search_state(std::move(search)),
      vs_palette(palette), vs_wrap_mode(opts.vo_wrap_mode),
      vs_max_width(opts.vo_max_width), vs_show_gutter(opts.vo_show_gutter),
      vs_path(std::move(opts.vo_path))
{
}

void
viewer_state::log_state()
{
    log_info("viewer_state: source=%s lines=%zu scroll=%zu,%zu size=%zux%zu",
             this->vs_document.d_source_name.c_str(),
             this->vs_document.line_count(),
             this->vs_scroll_line,
             this->vs_scroll_col,
             this->vs_width,
             this->vs_height);
    log_info("  wrap=%d mode=%d follow=%d query=%s",
             (int) this->vs_wrap_mode,
             (int) this->vs_mode,
             this->is_following(),
             this->vs_search_query.c_str());
}

void
viewer_state::set_terminal_size(size_t width, size_t height)
{
    if (width == this->vs_width && height == this->vs_height) {
        return;
    }

    log_debug("terminal resized to %zux%zu", width, height);
    this->vs_width = width;
    this->vs_height = height;
    if (this->vs_wrap_mode == wrap_mode_t::wrap) {
        this->invalidate_wrap_cache();
    }
    this->vs_scroll_line = std::min(this->vs_scroll_line, this->max_scroll());
}

size_t
viewer_state::content_height() const
{
    return this->vs_height > 0 ? this->vs_height - 1 : 0;
}

size_t
viewer_state::gutter_width() const
{
    if (!this->vs_show_gutter) {
        return 0;
    }

    auto count = this->vs_document.line_count();
    if (count == 0) {
        return 3;
    }

    return std::max(digit_count(count) + 2, (size_t) 3);
}

size_t
viewer_state::content_width() const
{
    auto gutter = this->gutter_width();

    return this->vs_width > gutter ? this->vs_width - gutter : 0;
}

const std::vector<wrapped_row>&
viewer_state::get_wrap_rows()
{
    if (!this->vs_wrap_cache) {
        this->vs_wrap_cache
            = build_wrap_rows(this->vs_document, this->content_width());
    }

    return this->vs_wrap_cache.value();
}

size_t
viewer_state::total_rows()
{
    if (this->vs_wrap_mode == wrap_mode_t::wrap) {
        return this->get_wrap_rows().size();
    }

    return this->vs_document.line_count();
}

size_t
viewer_state::max_scroll()
{
    auto total = this->total_rows();
    auto height = this->content_height();

    return total > height ? total - height : 0;
}

void
viewer_state::scroll_down(size_t amount)
{
    this->vs_scroll_line
        = std::min(this->vs_scroll_line + amount, this->max_scroll());
}

void
viewer_state::scroll_up(size_t amount)
{
    this->vs_scroll_line
        = this->vs_scroll_line > amount ? this->vs_scroll_line - amount : 0;
}

void
viewer_state::scroll_left(size_t amount)
{
    if (this->vs_wrap_mode == wrap_mode_t::wrap) {
        return;
    }

    this->vs_scroll_col
        = this->vs_scroll_col > amount ? this->vs_scroll_col - amount : 0;
}

void
viewer_state::scroll_right(size_t amount)
{
    if (this->vs_wrap_mode == wrap_mode_t::wrap) {
        return;
    }

    auto max_width = this->vs_document.d_max_line_width;
    auto content_width = this->content_width();
    auto max_col = max_width > content_width ? max_width - content_width : 0;

    this->vs_scroll_col = std::min(this->vs_scroll_col + amount, max_col);
}

void
viewer_state::scroll_to_line_start()
{
    if (this->vs_wrap_mode == wrap_mode_t::wrap) {
        return;
    }

    this->vs_scroll_col = 0;
}

void
viewer_state::scroll_to_line_end()
{
    if (this->vs_wrap_mode == wrap_mode_t::wrap) {
        return;
    }

    auto max_width = this->vs_document.d_max_line_width;
    auto content_width = this->content_width();

    this->vs_scroll_col
        = max_width > content_width ? max_width - content_width : 0;
}

void
viewer_state::scroll_to_line(size_t line_idx)
{
    auto row = line_idx;

    if (this->vs_wrap_mode == wrap_mode_t::wrap) {
        const auto& rows = this->get_wrap_rows();
        auto iter = std::find_if(
            rows.begin(), rows.end(), [line_idx](const wrapped_row& wr) {
                return wr.wr_line_idx == line_idx;
            });

        row = std::distance(rows.begin(), iter);
    }

    auto half = this->content_height() / 2;
    auto target = row > half ? row - half : 0;

    this->vs_scroll_line = std::min(target, this->max_scroll());
}

void
viewer_state::toggle_gutter()
{
    this->vs_show_gutter = !this->vs_show_gutter;
    if (this->vs_wrap_mode == wrap_mode_t::wrap) {
        this->invalidate_wrap_cache();
    }
    this->vs_scroll_line = std::min(this->vs_scroll_line, this->max_scroll());
}

void
viewer_state::set_wrap_mode(wrap_mode_t mode)
{
    if (mode == this->vs_wrap_mode) {
        return;
    }

    this->vs_wrap_mode = mode;
    this->invalidate_wrap_cache();
    this->vs_scroll_line = std::min(this->vs_scroll_line, this->max_scroll());
}

void
viewer_state::toggle_follow()
{
    if (this->vs_tail_reader) {
        log_info("stopped following");
        this->vs_tail_reader.reset();
        return;
    }

    if (!this->vs_path) {
        log_info("cannot follow a document that is not from a file");
        return;
    }

    this->vs_tail_reader
        = std::make_unique<tail_reader>(this->vs_path.value(), true);
    this->go_to_bottom();
}

bool
viewer_state::check_follow_updates()
{
    if (!this->vs_tail_reader) {
        return false;
    }

    auto lines = this->vs_tail_reader->poll();
    if (lines.empty()) {
        return false;
    }

    log_debug("follow added %zu lines", lines.size());
    for (auto* doc : {&this->vs_document,
                      this->vs_snapshot ? &this->vs_snapshot.value() : nullptr})
    {
        if (doc == nullptr) {
            continue;
        }

        for (const auto& line : lines) {
            size_t number = 1;

            if (!doc->d_lines.empty()) {
                number = std::max(doc->line_count(),
                                  doc->d_lines.back().sl_number)
                    + 1;
            }

            doc->d_lines.emplace_back(
                styled_line::plain(number, expand_tabs(line)));
            doc->d_max_line_width = std::max(doc->d_max_line_width,
                                             doc->d_lines.back().width());
        }
    }
    this->invalidate_wrap_cache();
    this->go_to_bottom();

    return true;
}

void
viewer_state::enter_search_mode(bool case_insensitive)
{
    this->vs_mode = view_mode_t::search;
    this->vs_search_query.clear();
    this->vs_search_ignore_case = case_insensitive;
    this->vs_snapshot = this->vs_document;
}

void
viewer_state::update_search_preview()
{
    if (this->vs_snapshot) {
        this->vs_document = this->vs_snapshot.value();
    }
    this->invalidate_wrap_cache();

    if (this->vs_search_query.empty()) {
        return;
    }

    pattern_options popts;

    popts.po_ignore_case = this->vs_search_ignore_case;
    try {
        auto re = compile_pattern(this->vs_search_query, popts);

        apply_search_highlight(this->vs_document, *re);
    } catch (const mat::error& e) {
        log_trace("search preview is not a valid pattern: %s",
                  e.get_message().c_str());
    }
}

void
viewer_state::search_add_char(const std::string& ch)
{
    this->vs_search_query.append(ch);
    this->update_search_preview();
}

void
viewer_state::search_backspace()
{
    if (this->vs_search_query.empty()) {
        return;
    }

    auto sf = string_fragment::from_str(this->vs_search_query);
    this->vs_search_query.resize(
        utf8_floor_boundary(sf, this->vs_search_query.size() - 1));
    this->update_search_preview();
}

void
viewer_state::confirm_search()
{
    if (!this->vs_search_query.empty()) {
        pattern_options popts;

        popts.po_ignore_case = this->vs_search_ignore_case;
        try {
            auto re = compile_pattern(this->vs_search_query, popts);
            auto matches = find_matches(this->vs_document, *re);

            log_info("search for '%s' found %zu matches",
                     this->vs_search_query.c_str(),
                     matches.size());
            this->vs_search_state
                = search_state(std::move(re), std::move(matches));
        } catch (const mat::error& e) {
            log_info("search not applied: %s", e.get_message().c_str());
        }
    }

    this->vs_mode = view_mode_t::normal;
    this->vs_search_query.clear();
    this->vs_snapshot = std::nullopt;
}

void
viewer_state::cancel_search()
{
    if (this->vs_snapshot) {
        this->vs_document = std::move(this->vs_snapshot.value());
        this->vs_snapshot = std::nullopt;
        this->invalidate_wrap_cache();
    }

    this->vs_mode = view_mode_t::normal;
    this->vs_search_query.clear();
}

void
viewer_state::next_match()
{
    if (!this->vs_search_state) {
        return;
    }

    auto mp = this->vs_search_state->next_match();
    if (mp) {
        this->scroll_to_line(mp->mp_line_idx);
    }
}

void
viewer_state::prev_match()
{
    if (!this->vs_search_state) {
        return;
    }

    auto mp = this->vs_search_state->prev_match();
    if (mp) {
        this->scroll_to_line(mp->mp_line_idx);
    }
}

bool
viewer_state::handle_key(const ncinput& ch)
{
    if (ch.evtype == NCTYPE_RELEASE) {
        return this->vs_should_quit;
    }

    if ((ncinput_ctrl_p(&ch) && (ch.id == 'c' || ch.id == 'C'))
        || ch.id == 0x03)
    {
        this->vs_should_quit = true;
        return true;
    }

    switch (this->vs_mode) {
        case view_mode_t::normal:
            return this->handle_normal_key(ch);
        case view_mode_t::search:
            return this->handle_search_key(ch);
    }

    return this->vs_should_quit;
}

bool
viewer_state::handle_normal_key(const ncinput& ch)
{
    if (ncinput_ctrl_p(&ch) || ncinput_alt_p(&ch)) {
        return false;
    }

    switch (ch.id) {
        case 'q':
        case NCKEY_ESC:
            this->vs_should_quit = true;
            break;

        case 'j':
        case NCKEY_DOWN:
            this->scroll_down(1);
            break;
        case 'k':
        case NCKEY_UP:
            this->scroll_up(1);
            break;
        case 'h':
        case NCKEY_LEFT:
            this->scroll_left(HORIZONTAL_STEP);
            break;
        case 'l':
        case NCKEY_RIGHT:
            this->scroll_right(HORIZONTAL_STEP);
            break;
        case 'd':
        case NCKEY_PGDOWN:
            this->half_page_down();
            break;
        case 'u':
        case NCKEY_PGUP:
            this->half_page_up();
            break;
        case '0':
            this->scroll_to_line_start();
            break;
        case '$':
            this->scroll_to_line_end();
            break;
        case 'g':
        case NCKEY_HOME:
            this->go_to_top();
            break;
        case 'G':
        case NCKEY_END:
            this->go_to_bottom();
            break;

        case '/':
            this->enter_search_mode(true);
            break;
        case '?':
            this->enter_search_mode(false);
            break;
        case 'n':
            this->next_match();
            break;
        case 'N':
            this->prev_match();
            break;

        case 'f':
            this->toggle_follow();
            break;
        case '#':
            this->toggle_gutter();
            break;

        default:
            log_trace("unhandled key %u", ch.id);
            break;
    }

    return this->vs_should_quit;
}

bool
viewer_state::handle_search_key(const ncinput& ch)
{
    switch (ch.id) {
        case NCKEY_ESC:
            this->cancel_search();
            break;
        case NCKEY_ENTER:
        case '\n':
        case '\r':
            this->confirm_search();
            break;
        case NCKEY_BACKSPACE:
        case 0x7f:
        case '\b':
            this->search_backspace();
            break;
        default:
            if (ch.id >= 0x20 && !nckey_synthesized_p(ch.id)
                && !ncinput_ctrl_p(&ch) && !ncinput_alt_p(&ch))
            {
                std::string utf8;

                utf8_append(utf8, ch.id);
                this->search_add_char(utf8);
            }
            break;
    }

    return this->vs_should_quit;
}

}  // namespace mat
