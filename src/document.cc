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
 * @file document.cc
 */

#include <algorithm>

#include <errno.h>

#include "document.hh"

#include "base/mat.error.hh"
#include "base/string_util.hh"
#include "fmt/format.h"

namespace mat {

std::vector<std::string>
split_lines(const std::string& text)
{
    std::vector<std::string> retval;
    size_t start = 0;

    while (start < text.size()) {
        auto eol = text.find('\n', start);
        auto end = eol == std::string::npos ? text.size() : eol;
        auto len = end - start;

        if (len > 0 && text[start + len - 1] == '\r') {
            len -= 1;
        }
        retval.emplace_back(text.substr(start, len));
        if (eol == std::string::npos) {
            break;
        }
        start = eol + 1;
    }

    return retval;
}

document
document::from_text(const std::string& text,
                    std::string source_name,
                    std::string encoding)
{
    document retval;
    size_t number = 1;

    for (const auto& line : split_lines(text)) {
        retval.d_lines.emplace_back(styled_line::plain(number, line));
        number += 1;
    }
    retval.d_source_name = std::move(source_name);
    retval.d_encoding = std::move(encoding);
    retval.recalculate_max_width();

    return retval;
}

void
document::recalculate_max_width()
{
    this->d_max_line_width = 0;
    for (const auto& line : this->d_lines) {
        auto width = line.width();

        if (width > this->d_max_line_width) {
            this->d_max_line_width = width;
        }
    }
}

void
print_document(FILE* out, const document& doc, bool line_numbers)
{
    size_t max_number = doc.line_count();

    for (const auto& line : doc.d_lines) {
        max_number = std::max(max_number, line.sl_number);
    }

    auto num_width = digit_count(max_number);

    for (const auto& line : doc.d_lines) {
        if (line_numbers) {
            if (line.is_separator()) {
                fmt::print(out, FMT_STRING("{:>{}} "), "", num_width);
            } else {
                fmt::print(
                    out, FMT_STRING("{:>{}} "), line.sl_number, num_width);
            }
        }
        fmt::print(out, FMT_STRING("{}\n"), line.text());
    }

    if (fflush(out) != 0 || ferror(out)) {
        throw mat::error(io_error{"stdout", errno});
    }
}

}  // namespace mat
