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
 * @file syntax_colorer.cc
 */

#include "syntax_colorer.hh"

#include "base/mat_log.hh"
#include "syntax_theme.hh"

namespace mat {

syntax_tokenizer::syntax_tokenizer(const grammar& gr) : st_grammar(gr)
{
    for (const auto& hl : gr.g_highlighters) {
        this->st_begin_data.emplace_back(hl.h_regex->create_match_data());
        if (hl.is_block()) {
            this->st_end_data.emplace_back(hl.h_end_regex->create_match_data());
        } else {
            this->st_end_data.emplace_back(
                pcre2pp::match_data::unitialized());
        }
    }
}

std::optional<syntax_tokenizer::span>
syntax_tokenizer::search(const pcre2pp::code& re,
                         pcre2pp::match_data& md,
                         string_fragment line,
                         size_t pos)
{
    auto found = re.capture_from(line)
                     .at(line.substr(pos))
                     .into(md)
                     .matches()
                     .ignore_error();

    if (!found) {
        return std::nullopt;
    }

    return span{
        (size_t) found->f_all.sf_begin,
        (size_t) found->f_all.sf_end,
    };
}

static size_t
next_code_point(const std::string& line, size_t pos)
{
    pos += 1;
    while (pos < line.size() && (line[pos] & 0xc0) == 0x80) {
        pos += 1;
    }

    return pos;
}

std::vector<syntax_token>
syntax_tokenizer::tokenize(const std::string& line)
{
    const auto& rules = this->st_grammar.g_highlighters;
    auto sf = string_fragment::from_str(line);
    std::vector<syntax_token> retval;
    size_t pos = 0;

    if (this->st_open_block) {
        auto index = this->st_open_block.value();
        const auto& hl = rules[index];
        auto end = this->search(
            *hl.h_end_regex, this->st_end_data[index], sf, 0);

        if (!end) {
            if (!line.empty()) {
                retval.emplace_back(syntax_token{0, line.size(), hl.h_role});
            }
            return retval;
        }
        if (end->s_end > 0) {
            retval.emplace_back(syntax_token{0, end->s_end, hl.h_role});
        }
        pos = end->s_end;
        this->st_open_block = std::nullopt;
    }

    while (pos < line.size()) {
        std::optional<size_t> best_index;
        span best{0, 0};

        for (size_t lpc = 0; lpc < rules.size(); lpc++) {
            auto found = this->search(
                *rules[lpc].h_regex, this->st_begin_data[lpc], sf, pos);

            if (!found) {
                continue;
            }
            if (!best_index || found->s_start < best.s_start) {
                best_index = lpc;
                best = found.value();
                if (best.s_start == pos) {
                    break;
                }
            }
        }

        if (!best_index) {
            break;
        }

        auto index = best_index.value();
        const auto& hl = rules[index];

        if (hl.is_block()) {
            auto end = this->search(
                *hl.h_end_regex, this->st_end_data[index], sf, best.s_end);

            if (end) {
                retval.emplace_back(
                    syntax_token{best.s_start, end->s_end, hl.h_role});
                pos = end->s_end;
            } else {
                retval.emplace_back(
                    syntax_token{best.s_start, line.size(), hl.h_role});
                this->st_open_block = index;
                pos = line.size();
            }
        } else {
            auto& md = this->st_begin_data[index];

            if (md.get_count() > 1) {
                size_t last_end = best.s_start;

                for (size_t cap = 1; cap < md.get_count(); cap++) {
                    auto group = md[cap];

                    if (!group || group->empty()
                        || (size_t) group->sf_begin < last_end)
                    {
                        continue;
                    }
                    retval.emplace_back(syntax_token{
                        (size_t) group->sf_begin,
                        (size_t) group->sf_end,
                        hl.h_role,
                    });
                    last_end = group->sf_end;
                }
            } else if (best.s_end > best.s_start) {
                retval.emplace_back(
                    syntax_token{best.s_start, best.s_end, hl.h_role});
            }
            pos = best.s_end;
        }

        if (pos <= best.s_start) {
            pos = next_code_point(line, best.s_start);
        }
    }

    return retval;
}

void
apply_syntax_highlight(document& doc,
                       const std::optional<std::string>& language,
                       theme_t theme)
{
    const auto* gr = grammar_set::get().select(language, doc.d_source_name);

    if (gr == nullptr) {
        log_debug("no grammar for %s, leaving document unstyled",
                  doc.d_source_name.c_str());
        return;
    }

    const auto& st = theme_set::get().for_theme(theme);
    auto plain_attrs = st.attrs_for_role(role_t::VCR_TEXT);
    syntax_tokenizer tokenizer(*gr);

    log_info("highlighting %s using the %s grammar and %s theme",
             doc.d_source_name.c_str(),
             gr->g_name.c_str(),
             st.st_name.c_str());
    for (auto& line : doc.d_lines) {
        if (line.is_separator()) {
            continue;
        }

        auto text = line.text();
        std::vector<syntax_token> tokens;

        try {
            tokens = tokenizer.tokenize(text);
        } catch (const std::exception& e) {
            log_warning("unable to tokenize line %zu -- %s",
                        line.sl_number,
                        e.what());
            continue;
        }

        // context lines keep their dim style, they only advance the state
        if (line.sl_is_context) {
            continue;
        }

        styled_line colored;
        size_t pos = 0;

        for (const auto& token : tokens) {
            if (token.st_start > pos) {
                colored.append(text.substr(pos, token.st_start - pos),
                               plain_attrs);
            }
            colored.append(text.substr(token.st_start,
                                       token.st_end - token.st_start),
                           st.attrs_for_role(token.st_role));
            pos = token.st_end;
        }
        if (pos < text.size()) {
            colored.append(text.substr(pos), plain_attrs);
        }
        line.sl_spans = std::move(colored.sl_spans);
    }
}

}  // namespace mat
