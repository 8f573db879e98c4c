/**
 * Copyright (c) 2017, Timothy Stack
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
 * @file highlighter.hh
 */

#ifndef mat_highlighter_hh
#define mat_highlighter_hh

#include <memory>
#include <string>

#include "pcrepp/pcre2pp.hh"

/** The syntactic role of a token, used to pick the token's style. */
enum class role_t {
    VCR_TEXT,
    VCR_KEYWORD,
    VCR_TYPE,
    VCR_STRING,
    VCR_COMMENT,
    VCR_NUMBER,
    VCR_CONSTANT,
    VCR_FUNCTION,
    VCR_VARIABLE,
    VCR_PREPROCESSOR,
    VCR_SYMBOL,
    VCR_TAG,
    VCR_ATTRIBUTE,
    VCR_DIFF_ADD,
    VCR_DIFF_DELETE,
    VCR_DIFF_SECTION,
    VCR_HEADING,
    VCR_STRONG,
    VCR_EMPHASIS,
    VCR_LINK,
};

/**
 * A rule in a grammar.  Text matched by the regex is given the rule's
 * role.  If the regex has capture groups, only the captured text gets the
 * role.  A rule with an end regex starts a block, like a comment, that
 * can span lines and runs until the end regex matches.
 */
struct highlighter {
    highlighter() = default;

    explicit highlighter(const std::shared_ptr<mat::pcre2pp::code>& regex)
        : h_regex(regex)
    {
    }

    highlighter& with_role(role_t role)
    {
        this->h_role = role;

        return *this;
    }

    highlighter& with_end(const std::shared_ptr<mat::pcre2pp::code>& regex)
    {
        this->h_end_regex = regex;

        return *this;
    }

    bool is_block() const { return this->h_end_regex != nullptr; }

    role_t h_role{role_t::VCR_TEXT};
    std::shared_ptr<mat::pcre2pp::code> h_regex;
    std::shared_ptr<mat::pcre2pp::code> h_end_regex;
};

#endif
