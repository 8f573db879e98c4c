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
 * @file document.hh
 */

#ifndef mat_document_hh
#define mat_document_hh

#include <string>
#include <vector>

#include <stdio.h>

#include "styled_line.hh"

namespace mat {

struct document {
    /**
     * Split the text into plain lines numbered from one.  One trailing
     * carriage return is removed from each line and a final newline does
     * not start an empty line.
     */
    static document from_text(const std::string& text,
                              std::string source_name,
                              std::string encoding);

    size_t line_count() const { return this->d_lines.size(); }

    bool empty() const { return this->d_lines.empty(); }

    void recalculate_max_width();

    std::vector<styled_line> d_lines;
    size_t d_max_line_width{0};
    std::string d_source_name;
    std::string d_encoding;
};

/** Split text into lines the way document::from_text() does. */
std::vector<std::string> split_lines(const std::string& text);

/**
 * Write the text of the document without any styling, one line per line
 * with the line numbers right-aligned in front if requested.
 *
 * @throws mat::error with an io_error if the output could not be written.
 */
void print_document(FILE* out, const document& doc, bool line_numbers);

}  // namespace mat

#endif
