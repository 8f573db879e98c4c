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
 * @file theme.hh
 */

#ifndef mat_theme_hh
#define mat_theme_hh

#include <optional>
#include <string>

#include "base/color_spaces.hh"

namespace mat {

enum class theme_t {
    light,
    dark,
};

/** The colors used for the chrome of the viewer. */
struct theme_colors {
    static theme_colors for_theme(theme_t theme);

    styling::color_unit tc_gutter{styling::color_unit::make_empty()};
    styling::color_unit tc_status_bg{styling::color_unit::make_empty()};
    styling::color_unit tc_status_fg{styling::color_unit::make_empty()};
    styling::color_unit tc_search_bg{styling::color_unit::make_empty()};
    styling::color_unit tc_search_fg{styling::color_unit::make_empty()};
    styling::color_unit tc_match_line_bg{styling::color_unit::make_empty()};
    styling::color_unit tc_context_fg{styling::color_unit::make_empty()};
    styling::color_unit tc_separator{styling::color_unit::make_empty()};
    styling::color_unit tc_error{styling::color_unit::make_empty()};
};

/** Parse "light" or "dark", ignoring case. */
std::optional<theme_t> parse_theme(const std::string& name);

/** Pick a theme that contrasts with the given background color. */
theme_t classify_background(const rgb_color& bg);

/**
 * Ask the terminal for its default background color and classify it.  The
 * terminal is only queried once per process, the dark theme is used when
 * it does not answer.
 */
theme_t detect_terminal_theme();

/**
 * Resolve the theme requested on the command-line, falling back to
 * detection when no name or an unknown name was given.
 */
theme_t resolve_theme(const std::optional<std::string>& name);

}  // namespace mat

#endif
