/**
 * Copyright (c) 2007-2012, Timothy Stack
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
 * @file view_curses.cc
 */

#include <errno.h>

#include "view_curses.hh"

#include "base/mat.error.hh"
#include "base/string_util.hh"

namespace mat {

screen_curses
screen_curses::create(const notcurses_options& options)
{
    auto* nc = notcurses_core_init(&options, stdout);
    if (nc == nullptr) {
        auto err = errno;

        log_error("unable to initialize notcurses -- %s", strerror(err));
        throw mat::error(io_error{"/dev/tty", err});
    }

    // ^C and ^\ are delivered as keys instead of signals
    if (notcurses_linesigs_disable(nc) != 0) {
        log_warning("unable to disable terminal line signals");
    }

    log_info("notcurses detected terminal: %s",
             notcurses_detected_terminal(nc));

    const auto* caps = notcurses_capabilities(nc);
    if (caps->rgb) {
        log_info("terminal supports RGB colors");
    } else {
        log_info("terminal supports %d colors", caps->colors);
    }

    return screen_curses(nc);
}

uint64_t
view_curses::to_channels(const text_attrs& ta)
{
    uint64_t retval = 0;
    ta.ta_fg_color.cu_value.match(
        [&retval](styling::transparent) {
            ncchannels_set_fg_default(&retval);
        },
        [&retval](const palette_color& pc) {
            ncchannels_set_fg_palindex(&retval, pc);
        },
        [&retval](const rgb_color& rc) {
            if (rc.empty()) {
                ncchannels_set_fg_default(&retval);
            } else {
                ncchannels_set_fg_rgb8(&retval, rc.rc_r, rc.rc_g, rc.rc_b);
            }
        });
    ta.ta_bg_color.cu_value.match(
        [&retval](styling::transparent) {
            ncchannels_set_bg_default(&retval);
        },
        [&retval](const palette_color& pc) {
            ncchannels_set_bg_palindex(&retval, pc);
        },
        [&retval](const rgb_color& rc) {
            if (rc.empty()) {
                ncchannels_set_bg_default(&retval);
            } else {
                ncchannels_set_bg_rgb8(&retval, rc.rc_r, rc.rc_g, rc.rc_b);
            }
        });

    return retval;
}

size_t
view_curses::mvwattrline(ncplane* window,
                         int y,
                         const int x,
                         const styled_line& row)
{
    unsigned rows, cols;
    size_t retval = 0;

    ncplane_dim_yx(window, &rows, &cols);
    if (y < 0 || (unsigned) y >= rows || x < 0 || (unsigned) x >= cols) {
        return 0;
    }

    auto avail = (size_t) (cols - x);
    for (const auto& span : row.sl_spans) {
        auto sf = string_fragment::from_str(span.ss_text);
        std::string visible;
        size_t span_cols = 0;

        for (size_t index = 0; index < span.ss_text.size();) {
            uint32_t cp;
            auto start = index;

            index += utf8_decode_at(sf, index, cp);

            // control characters have no width and would move the cursor
            if (cp < 0x20 || cp == 0x7f) {
                continue;
            }

            auto cp_width = (size_t) codepoint_width(cp);
            if (retval + span_cols + cp_width > avail) {
                break;
            }
            visible.append(span.ss_text, start, index - start);
            span_cols += cp_width;
        }

        if (!visible.empty()) {
            ncplane_set_styles(window, span.ss_attrs.ta_attrs);
            ncplane_set_channels(window, to_channels(span.ss_attrs));
            ncplane_putstr_yx(window, y, x + retval, visible.c_str());
        }
        retval += span_cols;
        if (retval >= avail) {
            break;
        }
    }
    ncplane_set_styles(window, NCSTYLE_NONE);
    ncplane_set_channels(window, 0);

    return retval;
}

}  // namespace mat
