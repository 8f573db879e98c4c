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
 * @file string_util.hh
 */

#ifndef mat_string_util_hh
#define mat_string_util_hh

#include <string>

#include <ctype.h>
#include <stdint.h>
#include <string.h>

#include "string_fragment.hh"

inline std::string
tolower(const char* str)
{
    std::string retval;

    for (int lpc = 0; str[lpc]; lpc++) {
        retval.push_back(::tolower(str[lpc]));
    }

    return retval;
}

inline std::string
tolower(const std::string& str)
{
    return tolower(str.c_str());
}

std::string repeat(const std::string& input, size_t num);

/** @return The number of decimal digits needed to print the value. */
size_t digit_count(size_t value);

/**
 * Decode the code point at the given byte offset.  Invalid sequences decode
 * as U+FFFD and consume at least one byte.
 *
 * @param sf The UTF-8 text.
 * @param offset The byte offset of the code point to decode.
 * @param cp_out Receives the decoded code point.
 * @return The number of bytes consumed.
 */
int utf8_decode_at(const string_fragment& sf, size_t offset, uint32_t& cp_out);

void utf8_append(std::string& dst, uint32_t cp);

/**
 * @return The number of terminal cells occupied by the code point.  Control
 * characters occupy zero cells and East-Asian ambiguous characters one.
 */
int codepoint_width(uint32_t cp);

size_t utf8_string_length(const string_fragment& sf);

size_t utf8_display_width(const string_fragment& sf);

inline size_t
utf8_display_width(const std::string& str)
{
    return utf8_display_width(string_fragment::from_str(str));
}

/** @return The byte offset of the given character index in the string. */
size_t utf8_char_to_byte_index(const string_fragment& sf, size_t ch_index);

/**
 * Round the byte offset down to the start of the code point that contains
 * it.
 */
size_t utf8_floor_boundary(const string_fragment& sf, size_t byte_index);

#endif
