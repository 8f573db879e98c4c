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
 * @file string_util.cc
 */

#include <algorithm>
#include <iterator>
#include <sstream>

#include "string_util.hh"

#include <unistr.h>
#include <uniwidth.h>

std::string
repeat(const std::string& input, size_t num)
{
    std::ostringstream os;
    std::fill_n(std::ostream_iterator<std::string>(os), num, input);
    return os.str();
}

size_t
digit_count(size_t value)
{
    size_t retval = 1;

    while (value >= 10) {
        value /= 10;
        retval += 1;
    }

    return retval;
}

int
utf8_decode_at(const string_fragment& sf, size_t offset, uint32_t& cp_out)
{
    ucs4_t uc;
    auto rc = u8_mbtouc(&uc, sf.udata() + offset, sf.length() - offset);

    if (rc <= 0) {
        cp_out = 0xfffd;
        return 1;
    }
    cp_out = uc;
    return rc;
}

void
utf8_append(std::string& dst, uint32_t cp)
{
    uint8_t buf[6];
    auto rc = u8_uctomb(buf, cp, sizeof(buf));

    if (rc <= 0) {
        rc = u8_uctomb(buf, 0xfffd, sizeof(buf));
    }
    dst.append((const char*) buf, rc);
}

int
codepoint_width(uint32_t cp)
{
    auto retval = uc_width(cp, "UTF-8");

    if (retval < 0) {
        return 0;
    }

    return retval;
}

size_t
utf8_string_length(const string_fragment& sf)
{
    size_t retval = 0;

    for (size_t index = 0; index < (size_t) sf.length();) {
        uint32_t cp;

        index += utf8_decode_at(sf, index, cp);
        retval += 1;
    }

    return retval;
}

size_t
utf8_display_width(const string_fragment& sf)
{
    size_t retval = 0;

    for (size_t index = 0; index < (size_t) sf.length();) {
        uint32_t cp;

        index += utf8_decode_at(sf, index, cp);
        retval += codepoint_width(cp);
    }

    return retval;
}

size_t
utf8_char_to_byte_index(const string_fragment& sf, size_t ch_index)
{
    size_t retval = 0;

    while (ch_index > 0 && retval < (size_t) sf.length()) {
        uint32_t cp;

        retval += utf8_decode_at(sf, retval, cp);
        ch_index -= 1;
    }

    return retval;
}

size_t
utf8_floor_boundary(const string_fragment& sf, size_t byte_index)
{
    if (byte_index >= (size_t) sf.length()) {
        return sf.length();
    }

    while (byte_index > 0 && (sf.udata()[byte_index] & 0xc0) == 0x80) {
        byte_index -= 1;
    }

    return byte_index;
}
