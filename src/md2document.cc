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
 *
 * @file md2document.cc
 */

#include "md2document.hh"

#include "base/mat_log.hh"
#include "base/string_util.hh"
#include "fmt/format.h"
#include "pcrepp/pcre2pp.hh"

namespace mat {

static constexpr size_t H1_FRAME_WIDTH = 50;
static constexpr size_t H2_TRAILER_WIDTH = 30;
static constexpr size_t RULE_WIDTH = 40;
static constexpr size_t CODE_INFO_RULE_WIDTH = 30;

static text_attrs
heading_attrs(unsigned level)
{
    switch (level) {
        case 1:
            return text_attrs::with_fg(COLOR_WHITE) | text_attrs::style::bold;
        case 2:
            return text_attrs::with_fg(COLOR_CYAN) | text_attrs::style::bold;
        case 3:
            return text_attrs::with_fg(COLOR_GREEN) | text_attrs::style::bold;
        case 4:
            return text_attrs::with_fg(COLOR_MAGENTA)
                | text_attrs::style::bold;
        case 5:
            return text_attrs::with_fg(COLOR_YELLOW) | text_attrs::style::bold;
        default:
            return text_attrs::with_fg(COLOR_DARK_GRAY)
                | text_attrs::style::bold;
    }
}

static const char*
heading_glyph(unsigned level)
{
    switch (level) {
        case 3:
            return "▸ ";
        case 4:
            return "◆ ";
        case 5:
            return "◇ ";
        case 6:
            return "· ";
        default:
            return "";
    }
}

static std::string
rule(size_t width)
{
    return repeat("─", width);
}

void
md2document::push_attrs(const text_attrs& attrs)
{
    this->md_style_stack.emplace_back(
        this->current_attrs().merged_with(attrs));
}

void
md2document::pop_attrs()
{
    if (this->md_style_stack.size() > 1) {
        this->md_style_stack.pop_back();
    }
}

void
md2document::flush_line()
{
    this->md_lines.emplace_back(std::move(this->md_current));
    this->md_current = styled_line{};
}

void
md2document::finish_line()
{
    if (!this->md_current.empty()) {
        this->flush_line();
    }
}

void
md2document::blank_line()
{
    this->finish_line();
    if (!this->md_lines.empty() && !this->md_lines.back().empty()) {
        this->flush_line();
    }
}

void
md2document::add_text(const std::string& str, const text_attrs& attrs)
{
    if (this->md_needs_list_prefix) {
        this->md_needs_list_prefix = false;
        this->add_list_prefix();
    }
    this->md_current.append(str, attrs);
}

void
md2document::add_normal_text(const std::string& str)
{
    size_t start = 0;

    while (true) {
        auto eol = str.find('\n', start);

        this->add_text(str.substr(start, eol - start), this->current_attrs());
        if (eol == std::string::npos) {
            break;
        }
        this->flush_line();
        this->add_quote_prefix();
        start = eol + 1;
    }
}

void
md2document::add_code_block_text(const string_fragment& sf)
{
    static const auto CODE_ATTRS = text_attrs::with_fg(COLOR_GREEN);

    auto str = sf.to_string();
    size_t start = 0;

    while (true) {
        auto eol = str.find('\n', start);

        this->add_text(str.substr(start, eol - start), CODE_ATTRS);
        if (eol == std::string::npos) {
            break;
        }
        this->flush_line();
        start = eol + 1;
    }
}

void
md2document::add_list_prefix()
{
    static const auto PREFIX_ATTRS = text_attrs::with_fg(COLOR_YELLOW);

    if (this->md_list_stack.empty()) {
        return;
    }

    auto depth = this->md_list_stack.size();
    auto indent = repeat("  ", depth - 1);
    auto& ls = this->md_list_stack.back();

    if (ls.ls_ordered) {
        this->md_current.append(
            fmt::format(FMT_STRING("{}{}. "), indent, ls.ls_counter),
            PREFIX_ATTRS);
        ls.ls_counter += 1;
    } else {
        const char* bullet;

        switch (depth) {
            case 1:
                bullet = "• ";
                break;
            case 2:
                bullet = "◦ ";
                break;
            default:
                bullet = "▪ ";
                break;
        }
        this->md_current.append(indent + bullet, PREFIX_ATTRS);
    }

    if (this->md_task_mark != '\0') {
        this->md_current.append(
            this->md_task_mark == ' ' ? "[ ] " : "[x] ",
            text_attrs::with_fg(COLOR_MAGENTA));
        this->md_task_mark = '\0';
    }
}

void
md2document::add_quote_prefix()
{
    if (this->md_quote_depth == 0) {
        return;
    }

    this->md_current.append(repeat("│ ", this->md_quote_depth),
                            text_attrs::with_fg(COLOR_DARK_GRAY));
}

void
md2document::strip_heading_attributes()
{
    static const auto ATTRS_RE = pcre2pp::code::from_const(
        R"(\s*\{\s*(?:[#.]|[\w-]+=)[^{}]*\}\s*$)");

    if (this->md_current.empty()) {
        return;
    }

    auto& last_span = this->md_current.sl_spans.back();
    auto find_res
        = ATTRS_RE.find_in(string_fragment::from_str(last_span.ss_text))
              .ignore_error();
    if (!find_res) {
        return;
    }

    last_span.ss_text.erase(find_res->f_all.sf_begin);
    if (last_span.ss_text.empty()) {
        this->md_current.sl_spans.pop_back();
    }
}

void
md2document::enter_block(const block& bl)
{
    log_trace("enter_block %s", md4cpp::block_name(bl));

    if (bl.is<MD_BLOCK_H_DETAIL*>()) {
        auto* hbl = bl.get<MD_BLOCK_H_DETAIL*>();
        static const auto FRAME_ATTRS = text_attrs::with_fg(COLOR_YELLOW);

        this->blank_line();
        switch (hbl->level) {
            case 1:
                this->add_text("╔" + repeat("═", H1_FRAME_WIDTH)
                                   + "╗",
                               FRAME_ATTRS);
                this->flush_line();
                this->add_text("║  ", FRAME_ATTRS);
                break;
            case 2:
                this->add_text("──◈ ", FRAME_ATTRS);
                break;
            default:
                this->add_text(heading_glyph(hbl->level),
                               heading_attrs(hbl->level));
                break;
        }
        this->push_attrs(heading_attrs(hbl->level));
    } else if (bl.is<block_p>()) {
        if (this->md_list_stack.empty() && this->md_quote_depth == 0) {
            this->blank_line();
        } else if (this->md_current.empty()) {
            this->add_quote_prefix();
        }
    } else if (bl.is<block_quote>()) {
        if (this->md_quote_depth == 0) {
            this->blank_line();
        } else {
            this->finish_line();
        }
        this->md_quote_depth += 1;
        this->add_quote_prefix();
    } else if (bl.is<MD_BLOCK_UL_DETAIL*>() || bl.is<MD_BLOCK_OL_DETAIL*>()) {
        list_state ls;

        if (this->md_list_stack.empty()) {
            this->blank_line();
        } else {
            this->finish_line();
        }
        if (bl.is<MD_BLOCK_OL_DETAIL*>()) {
            ls.ls_ordered = true;
            ls.ls_counter = bl.get<MD_BLOCK_OL_DETAIL*>()->start;
        }
        this->md_list_stack.emplace_back(ls);
    } else if (bl.is<MD_BLOCK_LI_DETAIL*>()) {
        auto* li = bl.get<MD_BLOCK_LI_DETAIL*>();

        this->finish_line();
        this->md_needs_list_prefix = true;
        this->md_task_mark = li->is_task ? li->task_mark : '\0';
        if (this->md_task_mark == 'X') {
            this->md_task_mark = 'x';
        }
    } else if (bl.is<block_hr>()) {
        this->finish_line();
        this->add_text(rule(RULE_WIDTH), text_attrs::with_fg(COLOR_DARK_GRAY));
        this->flush_line();
    } else if (bl.is<MD_BLOCK_CODE_DETAIL*>()) {
        auto* cbl = bl.get<MD_BLOCK_CODE_DETAIL*>();
        auto info = cbl->info.text == nullptr
            ? string_fragment{}
            : string_fragment(cbl->info.text, 0, cbl->info.size).trim();
        auto rule_attrs = text_attrs::with_fg(COLOR_DARK_GRAY);

        this->blank_line();
        if (!info.empty()) {
            this->add_text(fmt::format(FMT_STRING("─── {} "),
                                       info.to_string_view()),
                           rule_attrs);
            this->add_text(rule(CODE_INFO_RULE_WIDTH), rule_attrs);
        } else {
            this->add_text(rule(RULE_WIDTH), rule_attrs);
        }
        this->flush_line();
        this->md_in_code_block = true;
    } else if (bl.is<MD_BLOCK_TABLE_DETAIL*>()) {
        this->blank_line();
    }
}

void
md2document::leave_block(const block& bl)
{
    log_trace("leave_block %s", md4cpp::block_name(bl));

    if (bl.is<block_doc>()) {
        this->finish_line();
    } else if (bl.is<MD_BLOCK_H_DETAIL*>()) {
        auto* hbl = bl.get<MD_BLOCK_H_DETAIL*>();
        static const auto FRAME_ATTRS = text_attrs::with_fg(COLOR_YELLOW);

        this->pop_attrs();
        this->strip_heading_attributes();
        switch (hbl->level) {
            case 1:
                this->finish_line();
                this->add_text("╚" + repeat("═", H1_FRAME_WIDTH)
                                   + "╝",
                               FRAME_ATTRS);
                break;
            case 2:
                this->add_text(" ◈" + rule(H2_TRAILER_WIDTH),
                               FRAME_ATTRS);
                break;
            default:
                break;
        }
        this->flush_line();
        this->flush_line();
    } else if (bl.is<block_p>()) {
        this->finish_line();
    } else if (bl.is<block_quote>()) {
        this->md_quote_depth -= 1;
        this->finish_line();
    } else if (bl.is<MD_BLOCK_UL_DETAIL*>() || bl.is<MD_BLOCK_OL_DETAIL*>()) {
        this->md_list_stack.pop_back();
        if (this->md_list_stack.empty()) {
            this->finish_line();
        }
    } else if (bl.is<MD_BLOCK_LI_DETAIL*>()) {
        this->md_needs_list_prefix = false;
        this->md_task_mark = '\0';
        this->finish_line();
    } else if (bl.is<MD_BLOCK_CODE_DETAIL*>()) {
        this->md_in_code_block = false;
        this->finish_line();
        this->add_text(rule(RULE_WIDTH), text_attrs::with_fg(COLOR_DARK_GRAY));
        this->flush_line();
    } else if (bl.is<block_tr>()) {
        this->finish_line();
    } else if (bl.is<block_th>() || bl.is<MD_BLOCK_TD_DETAIL*>()) {
        this->add_text(" | ", this->current_attrs());
    }
}

void
md2document::enter_span(const span& sp)
{
    log_trace("enter_span %s", md4cpp::span_name(sp));

    if (sp.is<span_em>()) {
        this->push_attrs(text_attrs::with_fg(COLOR_YELLOW));
    } else if (sp.is<span_strong>()) {
        this->push_attrs(text_attrs::with_bold());
    } else if (sp.is<span_del>()) {
        this->push_attrs(text_attrs::with_fg(COLOR_DARK_GRAY));
    } else if (sp.is<span_u>()) {
        this->push_attrs(text_attrs::with_underline());
    } else if (sp.is<MD_SPAN_A_DETAIL*>()) {
        this->push_attrs(text_attrs::with_fg(COLOR_BLUE)
                         | text_attrs::style::underline);
    } else if (sp.is<MD_SPAN_IMG_DETAIL*>()) {
        this->add_text("[Image: ", text_attrs::with_fg(COLOR_MAGENTA));
        this->push_attrs(text_attrs::with_fg(COLOR_MAGENTA));
    } else if (sp.is<span_code>()) {
        this->md_in_code_span = true;
    }
}

void
md2document::leave_span(const span& sp)
{
    log_trace("leave_span %s", md4cpp::span_name(sp));

    if (sp.is<span_code>()) {
        this->md_in_code_span = false;
    } else if (sp.is<MD_SPAN_IMG_DETAIL*>()) {
        this->pop_attrs();
        this->add_text("]", text_attrs::with_fg(COLOR_MAGENTA));
    } else {
        this->pop_attrs();
    }
}

void
md2document::text(MD_TEXTTYPE tt, const string_fragment& sf)
{
    static const auto INLINE_CODE_ATTRS = text_attrs::with_fg(COLOR_CYAN);

    switch (tt) {
        case MD_TEXT_NORMAL:
            this->add_normal_text(sf.to_string());
            break;
        case MD_TEXT_NULLCHAR:
            this->add_normal_text("\uFFFD");
            break;
        case MD_TEXT_BR:
            this->flush_line();
            this->add_quote_prefix();
            break;
        case MD_TEXT_SOFTBR:
            if (this->md_in_code_span) {
                this->add_text(" ", INLINE_CODE_ATTRS);
            } else {
                this->add_normal_text(" ");
            }
            break;
        case MD_TEXT_ENTITY:
            this->add_normal_text(md4cpp::decode_entity(sf));
            break;
        case MD_TEXT_CODE:
            if (this->md_in_code_block) {
                this->add_code_block_text(sf);
            } else {
                auto code = sf.to_string();

                for (auto& ch : code) {
                    if (ch == '\n') {
                        ch = ' ';
                    }
                }
                this->add_text(code, INLINE_CODE_ATTRS);
            }
            break;
        default:
            break;
    }
}

document
md2document::get_result()
{
    document retval;
    size_t number = 1;

    this->finish_line();
    retval.d_lines = std::move(this->md_lines);
    for (auto& line : retval.d_lines) {
        line.sl_number = number;
        number += 1;
    }
    retval.d_encoding = "UTF-8";
    retval.recalculate_max_width();

    return retval;
}

document
render_markdown(const std::string& text, const std::string& source_name)
{
    md2document handler;

    try {
        auto retval
            = md4cpp::parse(string_fragment::from_str(text), handler);

        retval.d_source_name = source_name;
        log_info("rendered %zu markdown lines from %s",
                 retval.line_count(),
                 source_name.c_str());
        return retval;
    } catch (const md4cpp::parse_error& e) {
        log_error("unable to render markdown in %s: %s",
                  source_name.c_str(),
                  e.what());
    }

    return document::from_text(text, source_name, "UTF-8");
}

}  // namespace mat
