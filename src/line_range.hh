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
 * @file line_range.hh
 */

#ifndef mat_line_range_hh
#define mat_line_range_hh

#include <string>

#include "document.hh"

namespace mat {

/** An inclusive range of one-based line numbers. */
struct line_range {
    size_t lr_start;
    size_t lr_end;

    bool contains(size_t number) const
    {
        return this->lr_start <= number && number <= this->lr_end;
    }
};

/**
 * Parse a range in one of the forms "X:Y", ":Y", "X:" or "X".  A missing
 * start is the first line and a missing end is the last line.  An end past
 * the last line is clamped.
 *
 * @param spec The range given by the user.
 * @param total The number of lines in the document.
 * @throws mat::error with invalid_line_range if the range is malformed,
 * contains a zero, is reversed, or names a single line that does not
 * exist.
 */
line_range parse_line_range(const std::string& spec, size_t total);

/** Keep only the lines whose numbers are in the range. */
void filter_line_range(document& doc, const line_range& lr);

}  // namespace mat

#endif
