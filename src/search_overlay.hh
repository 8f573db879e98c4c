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
 * @file search_overlay.hh
 */

#ifndef mat_search_overlay_hh
#define mat_search_overlay_hh

#include <memory>
#include <optional>
#include <vector>

#include "document.hh"
#include "pcrepp/pcre2pp.hh"

namespace mat {

/**
 * The location of a match.  The start and end are byte offsets into the
 * text of the line.
 */
struct match_position {
    size_t mp_line_idx;
    size_t mp_start;
    size_t mp_end;

    bool operator==(const match_position& rhs) const
    {
        return this->mp_line_idx == rhs.mp_line_idx
            && this->mp_start == rhs.mp_start && this->mp_end == rhs.mp_end;
    }
};

/** Black on yellow and bold. */
text_attrs search_highlight_attrs();

/** Find the non-empty matches of the regex in document order. */
std::vector<match_position> find_matches(const document& doc,
                                         const pcre2pp::code& re);

/**
 * Draw the matches of the regex with the search highlight.  Text outside
 * of a match keeps its attributes and the text of the lines is not
 * changed.
 */
void apply_search_highlight(document& doc, const pcre2pp::code& re);

/** The result of a confirmed search and the match that is selected. */
class search_state {
public:
    search_state(std::shared_ptr<pcre2pp::code> re,
                 std::vector<match_position> matches)
        : ss_regex(std::move(re)), ss_matches(std::move(matches))
    {
    }

    const pcre2pp::code& get_regex() const { return *this->ss_regex; }

    const std::vector<match_position>& get_matches() const
    {
        return this->ss_matches;
    }

    std::optional<size_t> get_current() const { return this->ss_current; }

    /**
     * Select the next match, wrapping around to the first one.
     *
     * @return The newly selected match or nullopt if there are none.
     */
    std::optional<match_position> next_match();

    /** Select the previous match, wrapping around to the last one. */
    std::optional<match_position> prev_match();

private:
    std::shared_ptr<pcre2pp::code> ss_regex;
    std::vector<match_position> ss_matches;
    std::optional<size_t> ss_current;
};

}  // namespace mat

#endif
