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
 * @file viewer_render.hh
 */

#ifndef mat_viewer_render_hh
#define mat_viewer_render_hh

#include <optional>
#include <vector>

#include "styled_line.hh"
#include "theme.hh"
#include "viewer_state.hh"

namespace mat {

/**
 * Cut out the columns [scroll_col, scroll_col + width) of the line and pad
 * the result to the width.  A wide character that straddles the left edge
 * is replaced by spaces for the part that is visible.
 */
styled_line clip_line(const styled_line& line, size_t scroll_col, size_t width);

/**
 * Like clip_line(), but a line wider than max_width only shows
 * max_width - 1 columns followed by an ellipsis.
 */
styled_line clip_line_truncated(const styled_line& line,
                                size_t scroll_col,
                                size_t max_width,
                                size_t width);

/**
 * Take the characters starting at the given character offset that fit in
 * the width, padded to the width.
 */
styled_line slice_wrapped_row(const styled_line& line,
                              size_t char_offset,
                              size_t width);

/**
 * The gutter for a row.  Continuation rows of a wrapped line have no
 * number.
 */
styled_line render_gutter(std::optional<size_t> number,
                          size_t gutter_width,
                          const theme_colors& palette);

styled_line render_status_bar(viewer_state& vs);

/**
 * Render the whole screen, one entry per terminal row with the status bar
 * last.  Every row is exactly as wide as the terminal.
 */
std::vector<styled_line> render_screen(viewer_state& vs);

}  // namespace mat

#endif
