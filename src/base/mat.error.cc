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
 * @file mat.error.cc
 */

#include <string.h>

#include <utility>

#include "mat.error.hh"

#include "fmt/format.h"

namespace mat {

error::error(kind_t kind)
    : e_kind(std::move(kind)), e_what(this->get_message())
{
}

std::string
error::get_message() const
{
    return this->e_kind.match(
        [](const io_error& ie) {
            return fmt::format(FMT_STRING("I/O error for '{}': {}"),
                               ie.ie_path,
                               strerror(ie.ie_errno));
        },
        [](const invalid_regex& ir) {
            return fmt::format(FMT_STRING("Invalid regex pattern '{}': {}"),
                               ir.ir_pattern,
                               ir.ir_cause);
        },
        [](const empty_pattern&) {
            return std::string(
                "Empty pattern provided. Did you mean to omit -s/-g?");
        },
        [](const binary_file& bf) {
            return fmt::format(
                FMT_STRING("Binary file detected: '{}'. Use --force-binary "
                           "to view anyway"),
                bf.bf_path);
        },
        [](const invalid_line_range& ilr) {
            return fmt::format(
                FMT_STRING("Invalid line range format: '{}'. Expected "
                           "formats: X:Y, :Y, X:, or X"),
                ilr.ilr_range);
        },
        [](const encoding_error& ee) {
            return fmt::format(
                FMT_STRING("Failed to detect or convert encoding for '{}'"),
                ee.ee_path);
        });
}

int
error::exit_code() const
{
    if (this->e_kind.is<invalid_regex>()
        || this->e_kind.is<invalid_line_range>())
    {
        return 2;
    }

    return 1;
}

const char*
error::what() const noexcept
{
    return this->e_what.c_str();
}

}  // namespace mat
