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
 * @file styled_line.cc
 */

#include "styled_line.hh"

#include "base/string_util.hh"

namespace mat {

size_t
styled_span::width() const
{
    return utf8_display_width(this->ss_text);
}

styled_line
styled_line::plain(size_t number, const std::string& text)
{
    styled_line retval;

    retval.sl_number = number;
    retval.append(text);
    return retval;
}

styled_line
styled_line::separator()
{
    styled_line retval;

    retval.append("--", text_attrs::with_fg(COLOR_DARK_GRAY));
    return retval;
}

styled_line&
styled_line::append(const std::string& text, const text_attrs& attrs)
{
    if (text.empty()) {
        return *this;
    }

    if (!this->sl_spans.empty() && this->sl_spans.back().ss_attrs == attrs) {
        this->sl_spans.back().ss_text.append(text);
    } else {
        this->sl_spans.emplace_back(styled_span{text, attrs});
    }

    return *this;
}

size_t
styled_line::width() const
{
    size_t retval = 0;

    for (const auto& span : this->sl_spans) {
        retval += span.width();
    }

    return retval;
}

std::string
styled_line::text() const
{
    std::string retval;

    for (const auto& span : this->sl_spans) {
        retval.append(span.ss_text);
    }

    return retval;
}

}  // namespace mat
