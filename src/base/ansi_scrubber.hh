/**
 * Copyright (c) 2013, Timothy Stack
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
 * @file ansi_scrubber.hh
 */

#ifndef mat_ansi_scrubber_hh
#define mat_ansi_scrubber_hh

#include <string>

#include "string_fragment.hh"

#define ANSI_CSI             "\x1b["
#define ANSI_CHAR_ATTR       "m"
#define ANSI_BOLD_PARAM      "1"
#define ANSI_BOLD_START      ANSI_CSI ANSI_BOLD_PARAM ANSI_CHAR_ATTR
#define ANSI_NORM            ANSI_CSI "0m"

#define ANSI_BOLD(msg) ANSI_BOLD_START msg ANSI_NORM

#define XANSI_COLOR(col)      "3" #col
#define ANSI_COLOR_PARAM(col) XANSI_COLOR(col)
#define ANSI_COLOR(col)       ANSI_CSI XANSI_COLOR(col) "m"

/**
 * Remove terminal escape sequences from the input in place.  A CSI
 * sequence runs from "ESC [" through the first ASCII letter.  Any other
 * escape is ESC followed by a single character.  A trailing lone ESC is
 * dropped.
 *
 * @param input The text to scrub, modified in place.
 * @return The length of the scrubbed text.
 */
size_t erase_ansi_escapes(string_fragment input);

void strip_ansi_string(std::string& str);

#endif
