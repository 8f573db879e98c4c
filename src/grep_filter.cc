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
 * @file grep_filter.cc
 */

#include <algorithm>
#include <unordered_set>

#include "grep_filter.hh"

#include "base/mat_log.hh"

namespace mat {

std::vector<line_interval>
merge_intervals(std::vector<line_interval> ivs)
{
    std::vector<line_interval> retval;

    std::sort(ivs.begin(), ivs.end());
    for (const auto& iv : ivs) {
        if (!retval.empty() && iv.first <= retval.back().second) {
            retval.back().second = std::max(retval.back().second, iv.second);
        } else {
            retval.emplace_back(iv);
        }
    }

    return retval;
}

document
grep_filter(const document& doc, const grep_options& opts)
{
    require(opts.go_pattern != nullptr);

    document retval;
    std::unordered_set<size_t> matches;
    std::vector<line_interval> ivs;
    auto total = doc.line_count();

    retval.d_source_name = doc.d_source_name;
    retval.d_encoding = doc.d_encoding;

    for (size_t lpc = 0; lpc < total; lpc++) {
        auto text = doc.d_lines[lpc].text();
        auto find_res = opts.go_pattern->find_in(string_fragment::from_str(text))
                            .ignore_error();

        if (find_res) {
            matches.insert(lpc);
            auto end = opts.go_after >= total - lpc ? total
                                                   : lpc + opts.go_after + 1;

            ivs.emplace_back(lpc >= opts.go_before ? lpc - opts.go_before : 0,
                             end);
        }
    }

    log_debug("grep %s: %zu matching lines of %zu",
              opts.go_pattern->get_pattern().c_str(),
              matches.size(),
              total);
    if (matches.empty()) {
        return retval;
    }

    for (const auto& iv : merge_intervals(std::move(ivs))) {
        if (!retval.empty()) {
            retval.d_lines.emplace_back(styled_line::separator());
        }
        for (auto lpc = iv.first; lpc < iv.second; lpc++) {
            const auto& src = doc.d_lines[lpc];

            if (matches.contains(lpc)) {
                auto line = src;

                line.sl_is_match = true;
                line.sl_is_context = false;
                retval.d_lines.emplace_back(std::move(line));
            } else {
                styled_line line;

                line.sl_number = src.sl_number;
                line.sl_is_context = true;
                line.append(src.text(), text_attrs::with_fg(COLOR_DARK_GRAY));
                retval.d_lines.emplace_back(std::move(line));
            }
        }
    }
    retval.recalculate_max_width();

    return retval;
}

}  // namespace mat
