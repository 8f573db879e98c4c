/**
 * Copyright (c) 2022, Timothy Stack
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
 * @file md4cpp.hh
 */

#ifndef mat_md4cpp_hh
#define mat_md4cpp_hh

#include <stdexcept>
#include <string>

#include "base/string_fragment.hh"
#include "mapbox/variant.hpp"
#include "md4c.h"

namespace md4cpp {

class parse_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Receives the callbacks from the md4c parser as typed events.  A handler
 * can abort the parse by throwing, the message is then reported by
 * parse() as a parse_error.
 */
class event_handler {
public:
    virtual ~event_handler() = default;

    struct block_doc {};
    struct block_quote {};
    struct block_hr {};
    struct block_html {};
    struct block_p {};
    struct block_thead {};
    struct block_tbody {};
    struct block_tr {};
    struct block_th {};

    using block = mapbox::util::variant<block_doc,
                                        block_quote,
                                        MD_BLOCK_UL_DETAIL*,
                                        MD_BLOCK_OL_DETAIL*,
                                        MD_BLOCK_LI_DETAIL*,
                                        block_hr,
                                        MD_BLOCK_H_DETAIL*,
                                        MD_BLOCK_CODE_DETAIL*,
                                        block_html,
                                        block_p,
                                        MD_BLOCK_TABLE_DETAIL*,
                                        block_thead,
                                        block_tbody,
                                        block_tr,
                                        block_th,
                                        MD_BLOCK_TD_DETAIL*>;

    virtual void enter_block(const block& bl) = 0;
    virtual void leave_block(const block& bl) = 0;

    struct span_em {};
    struct span_strong {};
    struct span_code {};
    struct span_del {};
    struct span_u {};

    using span = mapbox::util::variant<span_em,
                                       span_strong,
                                       MD_SPAN_A_DETAIL*,
                                       MD_SPAN_IMG_DETAIL*,
                                       span_code,
                                       span_del,
                                       span_u>;

    virtual void enter_span(const span& sp) = 0;
    virtual void leave_span(const span& sp) = 0;

    virtual void text(MD_TEXTTYPE tt, const string_fragment& sf) = 0;

    static block build_block(MD_BLOCKTYPE type, void* detail);
    static span build_span(MD_SPANTYPE type, void* detail);
};

/** @return A short name for the block type, used in trace logging. */
const char* block_name(const event_handler::block& bl);

const char* span_name(const event_handler::span& sp);

namespace details {
/**
 * @throws parse_error if the input is not valid UTF-8 or a handler threw.
 */
void parse(const string_fragment& sf, event_handler& eh);
}  // namespace details

template<typename T>
class typed_event_handler : public event_handler {
public:
    virtual T get_result() = 0;
};

template<typename T>
T
parse(const string_fragment& sf, typed_event_handler<T>& eh)
{
    details::parse(sf, eh);

    return eh.get_result();
}

/**
 * Decode an HTML entity reference, like "&amp;" or "&#x1F600;".
 *
 * @return The UTF-8 text for the entity or the input if it is not known.
 */
std::string decode_entity(const string_fragment& sf);

}  // namespace md4cpp

#endif
