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
 * @file md4cpp.cc
 */

#include <map>

#include <stdlib.h>

#include "md4cpp.hh"

#include <unistr.h>

#include "base/string_util.hh"
#include "fmt/format.h"

namespace md4cpp {

static const std::map<std::string, uint32_t> NAMED_ENTITIES = {
    {"&amp;", '&'},     {"&lt;", '<'},       {"&gt;", '>'},
    {"&quot;", '"'},    {"&apos;", '\''},    {"&nbsp;", 0xa0},
    {"&copy;", 0xa9},   {"&reg;", 0xae},     {"&trade;", 0x2122},
    {"&mdash;", 0x2014}, {"&ndash;", 0x2013}, {"&hellip;", 0x2026},
    {"&laquo;", 0xab},  {"&raquo;", 0xbb},   {"&lsquo;", 0x2018},
    {"&rsquo;", 0x2019}, {"&ldquo;", 0x201c}, {"&rdquo;", 0x201d},
    {"&bull;", 0x2022}, {"&middot;", 0xb7},  {"&deg;", 0xb0},
    {"&times;", 0xd7},  {"&divide;", 0xf7},  {"&euro;", 0x20ac},
    {"&larr;", 0x2190}, {"&rarr;", 0x2192},  {"&uarr;", 0x2191},
    {"&darr;", 0x2193}, {"&check;", 0x2713}, {"&sect;", 0xa7},
};

std::string
decode_entity(const string_fragment& sf)
{
    std::string retval;

    if (sf.startswith("&#")) {
        auto digits = sf.sub_range(2, sf.length() - 1).to_string();
        auto base = 10;

        if (!digits.empty() && (digits[0] == 'x' || digits[0] == 'X')) {
            digits.erase(0, 1);
            base = 16;
        }

        char* end = nullptr;
        auto cp = strtoul(digits.c_str(), &end, base);
        if (digits.empty() || end == nullptr || *end != '\0') {
            return sf.to_string();
        }
        if (cp == 0 || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
            cp = 0xfffd;
        }
        utf8_append(retval, cp);
        return retval;
    }

    auto iter = NAMED_ENTITIES.find(sf.to_string());
    if (iter == NAMED_ENTITIES.end()) {
        return sf.to_string();
    }
    utf8_append(retval, iter->second);

    return retval;
}

const char*
block_name(const event_handler::block& bl)
{
    return bl.match([](event_handler::block_doc) { return "doc"; },
                    [](event_handler::block_quote) { return "quote"; },
                    [](MD_BLOCK_UL_DETAIL*) { return "ul"; },
                    [](MD_BLOCK_OL_DETAIL*) { return "ol"; },
                    [](MD_BLOCK_LI_DETAIL*) { return "li"; },
                    [](event_handler::block_hr) { return "hr"; },
                    [](MD_BLOCK_H_DETAIL*) { return "h"; },
                    [](MD_BLOCK_CODE_DETAIL*) { return "code"; },
                    [](event_handler::block_html) { return "html"; },
                    [](event_handler::block_p) { return "p"; },
                    [](MD_BLOCK_TABLE_DETAIL*) { return "table"; },
                    [](event_handler::block_thead) { return "thead"; },
                    [](event_handler::block_tbody) { return "tbody"; },
                    [](event_handler::block_tr) { return "tr"; },
                    [](event_handler::block_th) { return "th"; },
                    [](MD_BLOCK_TD_DETAIL*) { return "td"; });
}

const char*
span_name(const event_handler::span& sp)
{
    return sp.match([](event_handler::span_em) { return "em"; },
                    [](event_handler::span_strong) { return "strong"; },
                    [](MD_SPAN_A_DETAIL*) { return "a"; },
                    [](MD_SPAN_IMG_DETAIL*) { return "img"; },
                    [](event_handler::span_code) { return "code"; },
                    [](event_handler::span_del) { return "del"; },
                    [](event_handler::span_u) { return "u"; });
}

struct parse_userdata {
    event_handler& pu_handler;
    std::string pu_error_msg;
};

event_handler::block
event_handler::build_block(MD_BLOCKTYPE type, void* detail)
{
    switch (type) {
        case MD_BLOCK_DOC:
            return block_doc{};
        case MD_BLOCK_QUOTE:
            return block_quote{};
        case MD_BLOCK_UL:
            return static_cast<MD_BLOCK_UL_DETAIL*>(detail);
        case MD_BLOCK_OL:
            return static_cast<MD_BLOCK_OL_DETAIL*>(detail);
        case MD_BLOCK_LI:
            return static_cast<MD_BLOCK_LI_DETAIL*>(detail);
        case MD_BLOCK_HR:
            return block_hr{};
        case MD_BLOCK_H:
            return static_cast<MD_BLOCK_H_DETAIL*>(detail);
        case MD_BLOCK_CODE:
            return static_cast<MD_BLOCK_CODE_DETAIL*>(detail);
        case MD_BLOCK_HTML:
            return block_html{};
        case MD_BLOCK_P:
            return block_p{};
        case MD_BLOCK_TABLE:
            return static_cast<MD_BLOCK_TABLE_DETAIL*>(detail);
        case MD_BLOCK_THEAD:
            return block_thead{};
        case MD_BLOCK_TBODY:
            return block_tbody{};
        case MD_BLOCK_TR:
            return block_tr{};
        case MD_BLOCK_TH:
            return block_th{};
        case MD_BLOCK_TD:
            return static_cast<MD_BLOCK_TD_DETAIL*>(detail);
    }

    return {};
}

event_handler::span
event_handler::build_span(MD_SPANTYPE type, void* detail)
{
    switch (type) {
        case MD_SPAN_EM:
            return span_em{};
        case MD_SPAN_STRONG:
            return span_strong{};
        case MD_SPAN_A:
            return static_cast<MD_SPAN_A_DETAIL*>(detail);
        case MD_SPAN_IMG:
            return static_cast<MD_SPAN_IMG_DETAIL*>(detail);
        case MD_SPAN_CODE:
            return span_code{};
        case MD_SPAN_DEL:
            return span_del{};
        case MD_SPAN_U:
            return span_u{};
        default:
            break;
    }

    return {};
}

template<typename F>
static int
dispatch(void* userdata, F func)
{
    auto* pu = static_cast<parse_userdata*>(userdata);

    try {
        func(pu->pu_handler);
    } catch (const std::exception& e) {
        pu->pu_error_msg = e.what();
        return 1;
    }

    return 0;
}

static int
md4cpp_enter_block(MD_BLOCKTYPE type, void* detail, void* userdata)
{
    return dispatch(userdata, [type, detail](event_handler& eh) {
        eh.enter_block(event_handler::build_block(type, detail));
    });
}

static int
md4cpp_leave_block(MD_BLOCKTYPE type, void* detail, void* userdata)
{
    return dispatch(userdata, [type, detail](event_handler& eh) {
        eh.leave_block(event_handler::build_block(type, detail));
    });
}

static int
md4cpp_enter_span(MD_SPANTYPE type, void* detail, void* userdata)
{
    return dispatch(userdata, [type, detail](event_handler& eh) {
        eh.enter_span(event_handler::build_span(type, detail));
    });
}

static int
md4cpp_leave_span(MD_SPANTYPE type, void* detail, void* userdata)
{
    return dispatch(userdata, [type, detail](event_handler& eh) {
        eh.leave_span(event_handler::build_span(type, detail));
    });
}

static int
md4cpp_text(MD_TEXTTYPE type, const MD_CHAR* text, MD_SIZE size, void* userdata)
{
    return dispatch(userdata, [type, text, size](event_handler& eh) {
        eh.text(type, string_fragment(text, 0, size));
    });
}

namespace details {
void
parse(const string_fragment& sf, event_handler& eh)
{
    const auto* invalid = u8_check(sf.udata(), sf.length());
    if (invalid != nullptr) {
        throw parse_error(
            fmt::format(FMT_STRING("file has invalid UTF-8 at offset {}"),
                        invalid - sf.udata()));
    }

    MD_PARSER parser = {0};
    auto pu = parse_userdata{eh};

    parser.abi_version = 0;
    parser.flags = MD_FLAG_STRIKETHROUGH | MD_FLAG_TABLES | MD_FLAG_TASKLISTS;
    parser.enter_block = md4cpp_enter_block;
    parser.leave_block = md4cpp_leave_block;
    parser.enter_span = md4cpp_enter_span;
    parser.leave_span = md4cpp_leave_span;
    parser.text = md4cpp_text;

    auto rc = md_parse(sf.data(), sf.length(), &parser, &pu);

    if (rc != 0) {
        if (pu.pu_error_msg.empty()) {
            pu.pu_error_msg = fmt::format(FMT_STRING("md4c failed with {}"), rc);
        }
        throw parse_error(pu.pu_error_msg);
    }
}
}  // namespace details

}  // namespace md4cpp
