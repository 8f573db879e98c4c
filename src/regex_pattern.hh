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
 * @file regex_pattern.hh
 */

#ifndef mat_regex_pattern_hh
#define mat_regex_pattern_hh

#include <memory>
#include <string>

#include "pcrepp/pcre2pp.hh"

namespace mat {

struct pattern_options {
    bool po_ignore_case{false};
    bool po_fixed_strings{false};
    bool po_word_regexp{false};
    bool po_line_regexp{false};
};

/**
 * Apply the grep-style flags to a user pattern.  The steps are applied in
 * order: quoting, word boundaries, line anchors and then the caseless
 * flag.
 */
std::string build_regex_pattern(const std::string& pattern,
                                 const pattern_options& opts);

/**
 * @throws mat::error with empty_pattern if the pattern is empty or
 * invalid_regex if it does not compile.
 */
std::shared_ptr<pcre2pp::code> compile_pattern(const std::string& pattern,
                                               const pattern_options& opts);

}  // namespace mat

#endif
