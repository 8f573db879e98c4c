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
 * @file syntax_theme.cc
 */

#include "syntax_theme.hh"

#include "base/mat_log.hh"

namespace mat {

namespace {

struct palette {
    rgb_color p_foreground;
    rgb_color p_comment;
    rgb_color p_red;
    rgb_color p_orange;
    rgb_color p_yellow;
    rgb_color p_green;
    rgb_color p_cyan;
    rgb_color p_blue;
    rgb_color p_magenta;
    rgb_color p_brown;
};

syntax_theme
base16_ocean(const char* name, const palette& pal)
{
    syntax_theme retval;

    retval.st_name = name;
    retval.st_default = text_attrs::with_fg(pal.p_foreground);
    retval.st_roles = {
        {role_t::VCR_TEXT, text_attrs::with_fg(pal.p_foreground)},
        {role_t::VCR_KEYWORD, text_attrs::with_fg(pal.p_magenta)},
        {role_t::VCR_TYPE, text_attrs::with_fg(pal.p_yellow)},
        {role_t::VCR_STRING, text_attrs::with_fg(pal.p_green)},
        {role_t::VCR_COMMENT, text_attrs::with_fg(pal.p_comment)},
        {role_t::VCR_NUMBER, text_attrs::with_fg(pal.p_orange)},
        {role_t::VCR_CONSTANT, text_attrs::with_fg(pal.p_orange)},
        {role_t::VCR_FUNCTION, text_attrs::with_fg(pal.p_blue)},
        {role_t::VCR_VARIABLE, text_attrs::with_fg(pal.p_red)},
        {role_t::VCR_PREPROCESSOR, text_attrs::with_fg(pal.p_brown)},
        {role_t::VCR_SYMBOL, text_attrs::with_fg(pal.p_cyan)},
        {role_t::VCR_TAG, text_attrs::with_fg(pal.p_red)},
        {role_t::VCR_ATTRIBUTE, text_attrs::with_fg(pal.p_orange)},
        {role_t::VCR_DIFF_ADD, text_attrs::with_fg(pal.p_green)},
        {role_t::VCR_DIFF_DELETE, text_attrs::with_fg(pal.p_red)},
        {role_t::VCR_DIFF_SECTION, text_attrs::with_fg(pal.p_cyan)},
        {role_t::VCR_HEADING,
         text_attrs::with_fg(pal.p_blue) | text_attrs::style::bold},
        {role_t::VCR_STRONG,
         text_attrs::with_fg(pal.p_yellow) | text_attrs::style::bold},
        {role_t::VCR_EMPHASIS,
         text_attrs::with_fg(pal.p_magenta) | text_attrs::style::italic},
        {role_t::VCR_LINK,
         text_attrs::with_fg(pal.p_orange) | text_attrs::style::underline},
    };

    return retval;
}

}  // namespace

text_attrs
syntax_theme::attrs_for_role(role_t role) const
{
    auto iter = this->st_roles.find(role);

    if (iter == this->st_roles.end()) {
        return this->st_default;
    }

    return iter->second;
}

theme_set::theme_set()
{
    this->ts_themes.emplace_back(base16_ocean("base16-ocean.dark",
                                              palette{
                                                  rgb_color(0xc0, 0xc5, 0xce),
                                                  rgb_color(0x65, 0x73, 0x7e),
                                                  rgb_color(0xbf, 0x61, 0x6a),
                                                  rgb_color(0xd0, 0x87, 0x70),
                                                  rgb_color(0xeb, 0xcb, 0x8b),
                                                  rgb_color(0xa3, 0xbe, 0x8c),
                                                  rgb_color(0x96, 0xb5, 0xb4),
                                                  rgb_color(0x8f, 0xa1, 0xb3),
                                                  rgb_color(0xb4, 0x8e, 0xad),
                                                  rgb_color(0xab, 0x79, 0x67),
                                              }));
    this->ts_themes.emplace_back(base16_ocean("base16-ocean.light",
                                              palette{
                                                  rgb_color(0x4f, 0x5b, 0x66),
                                                  rgb_color(0xa7, 0xad, 0xba),
                                                  rgb_color(0xbf, 0x61, 0x6a),
                                                  rgb_color(0xd0, 0x87, 0x70),
                                                  rgb_color(0xeb, 0xcb, 0x8b),
                                                  rgb_color(0xa3, 0xbe, 0x8c),
                                                  rgb_color(0x96, 0xb5, 0xb4),
                                                  rgb_color(0x8f, 0xa1, 0xb3),
                                                  rgb_color(0xb4, 0x8e, 0xad),
                                                  rgb_color(0xab, 0x79, 0x67),
                                              }));
}

const theme_set&
theme_set::get()
{
    static const theme_set retval;

    return retval;
}

const syntax_theme*
theme_set::find(const std::string& name) const
{
    for (const auto& st : this->ts_themes) {
        if (st.st_name == name) {
            return &st;
        }
    }

    return nullptr;
}

const syntax_theme&
theme_set::for_theme(theme_t theme) const
{
    const auto* retval = this->find(theme == theme_t::light
                                        ? "base16-ocean.light"
                                        : "base16-ocean.dark");

    require(retval != nullptr);

    return *retval;
}

}  // namespace mat
