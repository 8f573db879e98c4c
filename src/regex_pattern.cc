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
 * @file regex_pattern.cc
 */

#include "regex_pattern.hh"

#include "base/mat.error.hh"
#include "base/mat_log.hh"
#include "fmt/format.h"

namespace mat {

std::string
build_regex_pattern(const std::string& pattern, const pattern_options& opts)
{
    auto retval = opts.po_fixed_strings
        ? pcre2pp::quote(string_fragment::from_str(pattern))
        : pattern;

    if (opts.po_word_regexp) {
        retval = fmt::format(FMT_STRING(R"(\b(?:{})\b)"), retval);
    }
    if (opts.po_line_regexp) {
        retval = fmt::format(FMT_STRING("^(?:{})$"), retval);
    }
    if (opts.po_ignore_case) {
        retval = "(?i)" + retval;
    }

    return retval;
}

std::shared_ptr<pcre2pp::code>
compile_pattern(const std::string& pattern, const pattern_options& opts)
{
    if (pattern.empty()) {
        throw mat::error(empty_pattern{});
    }

    auto full_pattern = build_regex_pattern(pattern, opts);

    log_debug("compiling pattern: %s", full_pattern.c_str());
    try {
        return pcre2pp::code::from(string_fragment::from_str(full_pattern))
            .to_shared();
    } catch (const pcre2pp::compile_error& ce) {
        log_info("invalid pattern %s -- %s",
                 pattern.c_str(),
                 ce.get_message().c_str());
        throw mat::error(invalid_regex{
            pattern,
            fmt::format(FMT_STRING("{} at offset {}"),
                        ce.get_message(),
                        ce.ce_offset),
        });
    }
}

}  // namespace mat
