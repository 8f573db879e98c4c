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
 * @file line_range.cc
 */

#include <algorithm>

#include "line_range.hh"

#include "base/mat.error.hh"
#include "base/mat_log.hh"
#include "base/string_fragment.hh"

namespace mat {

static size_t
parse_line_number(string_fragment sf, const std::string& spec)
{
    if (sf.empty()
        || !std::all_of(sf.begin(), sf.end(), [](char ch) {
               return '0' <= ch && ch <= '9';
           }))
    {
        throw mat::error(invalid_line_range{spec});
    }

    size_t retval = 0;
    for (auto ch : sf) {
        auto next = retval * 10 + (ch - '0');

        if (next / 10 != retval) {
            throw mat::error(invalid_line_range{spec});
        }
        retval = next;
    }

    return retval;
}

line_range
parse_line_range(const std::string& spec, size_t total)
{
    auto trimmed_sf = string_fragment::from_str(spec).trim();
    auto trimmed = trimmed_sf.to_string();

    if (trimmed.empty()) {
        throw mat::error(invalid_line_range{trimmed});
    }

    auto colon = trimmed_sf.find(':');
    if (!colon) {
        auto line = parse_line_number(trimmed_sf, trimmed);

        if (line == 0 || line > total) {
            throw mat::error(invalid_line_range{trimmed});
        }
        return line_range{line, line};
    }

    auto start_sf = trimmed_sf.sub_range(0, colon.value());
    auto end_sf = trimmed_sf.substr(colon.value() + 1);
    size_t start = 1;
    size_t end = total;

    if (!start_sf.empty()) {
        start = parse_line_number(start_sf, trimmed);
    }
    if (!end_sf.empty()) {
        end = parse_line_number(end_sf, trimmed);
    }
    if (start == 0 || end == 0 || start > end) {
        throw mat::error(invalid_line_range{trimmed});
    }

    return line_range{start, std::min(end, total)};
}

void
filter_line_range(document& doc, const line_range& lr)
{
    auto iter = std::remove_if(
        doc.d_lines.begin(), doc.d_lines.end(), [&lr](const styled_line& sl) {
            return !lr.contains(sl.sl_number);
        });

    doc.d_lines.erase(iter, doc.d_lines.end());
    doc.recalculate_max_width();
    log_debug("line range %zu:%zu kept %zu lines",
              lr.lr_start,
              lr.lr_end,
              doc.line_count());
}

}  // namespace mat
