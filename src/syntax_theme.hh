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
 * @file syntax_theme.hh
 */

#ifndef mat_syntax_theme_hh
#define mat_syntax_theme_hh

#include <map>
#include <string>
#include <vector>

#include "base/text_attrs.hh"
#include "highlighter.hh"
#include "theme.hh"

namespace mat {

/** Maps the role of a token to the attributes it is drawn with. */
struct syntax_theme {
    text_attrs attrs_for_role(role_t role) const;

    std::string st_name;
    text_attrs st_default;
    std::map<role_t, text_attrs> st_roles;
};

/** The built-in syntax themes, a light and a dark variant. */
class theme_set {
public:
    static const theme_set& get();

    const syntax_theme* find(const std::string& name) const;

    const syntax_theme& for_theme(theme_t theme) const;

private:
    theme_set();

    std::vector<syntax_theme> ts_themes;
};

}  // namespace mat

#endif
