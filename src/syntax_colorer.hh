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
 * @file syntax_colorer.hh
 */

#ifndef mat_syntax_colorer_hh
#define mat_syntax_colorer_hh

#include <optional>
#include <string>
#include <vector>

#include "document.hh"
#include "grammar_set.hh"
#include "theme.hh"

namespace mat {

struct syntax_token {
    size_t st_start;
    size_t st_end;
    role_t st_role;
};

/**
 * Splits lines into tokens using the rules of a grammar.  Blocks that are
 * still open at the end of a line, like a multi-line comment, continue on
 * the next line that is fed to the tokenizer.
 */
class syntax_tokenizer {
public:
    explicit syntax_tokenizer(const grammar& gr);

    /**
     * @return The tokens found in the line, sorted and non-overlapping.
     * Text that is not covered by a token is plain.
     */
    std::vector<syntax_token> tokenize(const std::string& line);

    bool in_block() const { return this->st_open_block.has_value(); }

private:
    struct span {
        size_t s_start;
        size_t s_end;
    };

    std::optional<span> search(const pcre2pp::code& re,
                               pcre2pp::match_data& md,
                               string_fragment line,
                               size_t pos);

    const grammar& st_grammar;
    std::vector<pcre2pp::match_data> st_begin_data;
    std::vector<pcre2pp::match_data> st_end_data;
    std::optional<size_t> st_open_block;
};

/**
 * Color the lines of the document using the grammar that matches the
 * language or, if no language is given, the document's source name.
 * Context lines and group separators keep their styling.  The document is
 * left unchanged if no grammar matches.
 */
void apply_syntax_highlight(document& doc,
                            const std::optional<std::string>& language,
                            theme_t theme);

}  // namespace mat

#endif
