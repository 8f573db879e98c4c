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
 * @file theme.cc
 */

#include <unistd.h>

#include "theme.hh"

#include <notcurses/notcurses.h>

#include "base/mat_log.hh"
#include "base/string_util.hh"

namespace mat {

theme_colors
theme_colors::for_theme(theme_t theme)
{
    theme_colors retval;

    retval.tc_gutter = styling::color_unit::from_palette(COLOR_DARK_GRAY);
    retval.tc_search_bg = styling::color_unit::from_palette(COLOR_YELLOW);
    retval.tc_search_fg = styling::color_unit::from_palette(COLOR_BLACK);
    retval.tc_context_fg = styling::color_unit::from_palette(COLOR_DARK_GRAY);
    retval.tc_separator = styling::color_unit::from_palette(COLOR_DARK_GRAY);
    retval.tc_error = styling::color_unit::from_palette(COLOR_RED);
    switch (theme) {
        case theme_t::light:
            retval.tc_status_bg
                = styling::color_unit::from_rgb(rgb_color(200, 200, 200));
            retval.tc_status_fg
                = styling::color_unit::from_palette(COLOR_BLACK);
            retval.tc_match_line_bg
                = styling::color_unit::from_rgb(rgb_color(255, 255, 200));
            break;
        case theme_t::dark:
            retval.tc_status_bg
                = styling::color_unit::from_palette(COLOR_DARK_GRAY);
            retval.tc_status_fg
                = styling::color_unit::from_palette(COLOR_WHITE);
            retval.tc_match_line_bg
                = styling::color_unit::from_rgb(rgb_color(50, 50, 30));
            break;
    }

    return retval;
}

std::optional<theme_t>
parse_theme(const std::string& name)
{
    auto lower = tolower(name);

    if (lower == "light") {
        return theme_t::light;
    }
    if (lower == "dark") {
        return theme_t::dark;
    }

    return std::nullopt;
}

theme_t
classify_background(const rgb_color& bg)
{
    return bg.luminance() > 0.5 ? theme_t::light : theme_t::dark;
}

static std::optional<rgb_color>
query_default_background()
{
    if (!isatty(STDOUT_FILENO)) {
        log_debug("stdout is not a terminal, skipping background query");
        return std::nullopt;
    }

    notcurses_options nco = {};
    nco.flags |= NCOPTION_SUPPRESS_BANNERS | NCOPTION_NO_ALTERNATE_SCREEN
        | NCOPTION_NO_CLEAR_BITMAPS | NCOPTION_PRESERVE_CURSOR
        | NCOPTION_NO_WINCH_SIGHANDLER | NCOPTION_NO_QUIT_SIGHANDLERS
        | NCOPTION_DRAIN_INPUT;
    auto* nc = notcurses_core_init(&nco, stdout);
    if (nc == nullptr) {
        log_warning("unable to initialize notcurses for background query");
        return std::nullopt;
    }

    uint32_t bg = 0;
    auto rc = notcurses_default_background(nc, &bg);
    notcurses_stop(nc);
    if (rc != 0) {
        log_info("terminal did not report a default background");
        return std::nullopt;
    }

    return rgb_color((bg >> 16) & 0xff, (bg >> 8) & 0xff, bg & 0xff);
}

theme_t
detect_terminal_theme()
{
    static const auto retval = []() {
        auto bg = query_default_background();

        if (!bg) {
            return theme_t::dark;
        }

        auto theme = classify_background(bg.value());
        log_info("terminal background (%d, %d, %d) -> %s theme",
                 bg->rc_r,
                 bg->rc_g,
                 bg->rc_b,
                 theme == theme_t::light ? "light" : "dark");
        return theme;
    }();

    return retval;
}

theme_t
resolve_theme(const std::optional<std::string>& name)
{
    if (name) {
        auto parsed = parse_theme(name.value());

        if (parsed) {
            return parsed.value();
        }
        log_warning("unknown theme '%s', detecting from terminal",
                    name->c_str());
    }

    return detect_terminal_theme();
}

}  // namespace mat
