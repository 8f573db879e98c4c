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
 * @file styled_line.hh
 */

#ifndef mat_styled_line_hh
#define mat_styled_line_hh

#include <string>
#include <utility>
#include <vector>

#include "base/text_attrs.hh"

namespace mat {

struct styled_span {
    static styled_span plain(std::string text)
    {
        return styled_span{std::move(text), text_attrs{}};
    }

    /** @return The display width of the text in terminal cells. */
    size_t width() const;

    bool operator==(const styled_span& rhs) const
    {
        return this->ss_text == rhs.ss_text && this->ss_attrs == rhs.ss_attrs;
    }

    std::string ss_text;
    text_attrs ss_attrs;
};

/**
 * A line of the document.  The text of the line is the concatenation of
 * the span texts.  A line number of zero marks the separator between
 * groups of grep results.
 */
struct styled_line {
    static styled_line plain(size_t number, const std::string& text);

    static styled_line separator();

    /**
     * Append a span to the line.  Empty text is dropped and text with the
     * same attributes as the last span is merged into it.
     */
    styled_line& append(const std::string& text, const text_attrs& attrs = {});

    size_t width() const;

    std::string text() const;

    bool empty() const { return this->sl_spans.empty(); }

    bool is_separator() const { return this->sl_number == 0; }

    size_t sl_number{0};
    std::vector<styled_span> sl_spans;
    bool sl_is_match{false};
    bool sl_is_context{false};
};

}  // namespace mat

#endif
