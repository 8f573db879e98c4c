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
 * @file ansi_scrubber.cc
 */

#include <string.h>

#include "ansi_scrubber.hh"

#include "mat_log.hh"
#include "pcrepp/pcre2pp.hh"

static const mat::pcre2pp::code&
ansi_regex()
{
    static const auto retval = mat::pcre2pp::code::from_const(
        R"(\x1b\[[^a-zA-Z]*[a-zA-Z]?|\x1b(?s:.)?)");

    return retval;
}

size_t
erase_ansi_escapes(string_fragment input)
{
    thread_local auto md = mat::pcre2pp::match_data::unitialized();

    const auto& regex = ansi_regex();
    std::optional<int> move_start;
    size_t fill_index = 0;

    auto matcher = regex.capture_from(input).into(md);
    while (true) {
        auto match_res = matcher.matches(PCRE2_NO_UTF_CHECK);

        if (match_res.is<mat::pcre2pp::matcher::not_found>()) {
            break;
        }
        if (match_res.is<mat::pcre2pp::matcher::error>()) {
            log_error("ansi scrub regex failure");
            break;
        }

        auto sf = md[0].value();

        if (move_start) {
            auto move_len = sf.sf_begin - move_start.value();
            memmove(input.writable_data(fill_index),
                    input.data() + move_start.value(),
                    move_len);
            fill_index += move_len;
        } else {
            fill_index = sf.sf_begin;
        }

        move_start = md.remaining().is_valid() ? md.remaining().sf_begin
                                               : input.sf_end;
    }

    if (!move_start) {
        return input.length();
    }

    auto tail_len = input.sf_end - move_start.value();
    memmove(input.writable_data(fill_index),
            input.data() + move_start.value(),
            tail_len);
    fill_index += tail_len;

    return fill_index;
}

void
strip_ansi_string(std::string& str)
{
    if (str.find('\x1b') == std::string::npos) {
        return;
    }

    auto new_len = erase_ansi_escapes(string_fragment::from_str(str));

    str.resize(new_len);
}
