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
 * @file content_loader.cc
 */

#include <algorithm>
#include <vector>

#include <unistd.h>

#include "content_loader.hh"

#include <unistr.h>

#include "base/ansi_scrubber.hh"
#include "base/fs_util.hh"
#include "base/mat.error.hh"
#include "base/mat_log.hh"
#include "base/string_util.hh"

namespace mat {

static const uint32_t CP1252_HIGH[32] = {
    0x20ac, 0x0081, 0x201a, 0x0192, 0x201e, 0x2026, 0x2020, 0x2021,
    0x02c6, 0x2030, 0x0160, 0x2039, 0x0152, 0x008d, 0x017d, 0x008f,
    0x0090, 0x2018, 0x2019, 0x201c, 0x201d, 0x2022, 0x2013, 0x2014,
    0x02dc, 0x2122, 0x0161, 0x203a, 0x0153, 0x009d, 0x017e, 0x0178,
};

const char*
encoding_name(text_encoding enc)
{
    switch (enc) {
        case text_encoding::utf8:
            return "UTF-8";
        case text_encoding::utf8_bom:
            return "UTF-8-BOM";
        case text_encoding::utf16le:
            return "UTF-16LE";
        case text_encoding::utf16be:
            return "UTF-16BE";
        case text_encoding::latin1:
            return "Latin-1";
    }

    return "UTF-8";
}

static bool
is_printable_byte(unsigned char ch)
{
    return ch == '\t' || ch == '\n' || ch == '\r' || (ch >= 0x20 && ch <= 0x7e)
        || ch >= 0x80;
}

bool
is_binary(string_fragment sf)
{
    auto check_len = std::min((size_t) sf.length(), BINARY_CHECK_SIZE);
    size_t non_printable = 0;

    if (check_len == 0) {
        return false;
    }

    for (size_t lpc = 0; lpc < check_len; lpc++) {
        auto ch = sf.udata()[lpc];

        if (ch == '\0') {
            return true;
        }
        if (!is_printable_byte(ch)) {
            non_printable += 1;
        }
    }

    return ((double) non_printable / (double) check_len) > 0.30;
}

text_encoding
detect_encoding(string_fragment sf)
{
    if (sf.startswith("\xef\xbb\xbf")) {
        return text_encoding::utf8_bom;
    }
    if (sf.startswith("\xff\xfe")) {
        return text_encoding::utf16le;
    }
    if (sf.startswith("\xfe\xff")) {
        return text_encoding::utf16be;
    }
    if (u8_check(sf.udata(), sf.length()) == nullptr) {
        return text_encoding::utf8;
    }

    return text_encoding::latin1;
}

static std::string
decode_utf8_lossy(string_fragment sf)
{
    std::string retval;

    retval.reserve(sf.length());
    for (size_t index = 0; index < (size_t) sf.length();) {
        uint32_t cp;
        auto len = utf8_decode_at(sf, index, cp);

        if (cp == 0xfffd) {
            utf8_append(retval, cp);
        } else {
            retval.append(sf.data() + index, len);
        }
        index += len;
    }

    return retval;
}

static std::string
decode_utf16(string_fragment sf, bool little_endian)
{
    std::vector<uint16_t> units;
    std::string retval;

    units.reserve(sf.length() / 2);
    for (int lpc = 0; lpc + 1 < sf.length(); lpc += 2) {
        uint16_t lo = sf.udata()[lpc];
        uint16_t hi = sf.udata()[lpc + 1];

        units.push_back(little_endian ? (hi << 8) | lo : (lo << 8) | hi);
    }

    for (size_t index = 0; index < units.size();) {
        ucs4_t uc;
        auto rc = u16_mbtouc(&uc, units.data() + index, units.size() - index);

        if (rc <= 0) {
            uc = 0xfffd;
            rc = 1;
        }
        utf8_append(retval, uc);
        index += rc;
    }
    if (sf.length() % 2 == 1) {
        utf8_append(retval, 0xfffd);
    }

    return retval;
}

static std::string
decode_cp1252(string_fragment sf)
{
    std::string retval;

    retval.reserve(sf.length() + sf.length() / 4);
    for (auto ch : sf) {
        auto uch = (unsigned char) ch;

        if (uch < 0x80) {
            retval.push_back(ch);
        } else if (uch < 0xa0) {
            utf8_append(retval, CP1252_HIGH[uch - 0x80]);
        } else {
            utf8_append(retval, uch);
        }
    }

    return retval;
}

std::string
decode_bytes(string_fragment sf,
             text_encoding enc,
             const std::string& source_name)
{
    std::string retval;

    switch (enc) {
        case text_encoding::utf8:
            retval = decode_utf8_lossy(sf);
            break;
        case text_encoding::utf8_bom:
            retval = decode_utf8_lossy(sf.substr(3));
            break;
        case text_encoding::utf16le:
            retval = decode_utf16(sf.substr(2), true);
            break;
        case text_encoding::utf16be:
            retval = decode_utf16(sf.substr(2), false);
            break;
        case text_encoding::latin1:
            retval = decode_cp1252(sf);
            break;
    }

    if (u8_check((const uint8_t*) retval.data(), retval.size()) != nullptr) {
        log_error("conversion from %s produced bad UTF-8", encoding_name(enc));
        throw mat::error(encoding_error{source_name});
    }

    return retval;
}

std::string
expand_tabs(const std::string& text, size_t tab_width)
{
    if (text.find('\t') == std::string::npos) {
        return text;
    }

    auto sf = string_fragment::from_str(text);
    std::string retval;
    size_t column = 0;

    retval.reserve(text.size() + text.size() / 8);
    for (size_t index = 0; index < text.size();) {
        uint32_t cp;
        auto len = utf8_decode_at(sf, index, cp);

        switch (cp) {
            case '\t': {
                auto spaces = tab_width - (column % tab_width);

                retval.append(spaces, ' ');
                column += spaces;
                break;
            }
            case '\n':
                retval.push_back('\n');
                column = 0;
                break;
            default:
                retval.append(text, index, len);
                column += codepoint_width(cp);
                break;
        }
        index += len;
    }

    return retval;
}

std::optional<std::string>
detect_extension(const std::filesystem::path& path)
{
    auto ext = path.extension().string();

    if (ext.size() <= 1) {
        return std::nullopt;
    }

    return tolower(ext.substr(1));
}

bool
is_markdown_extension(const std::string& ext)
{
    return ext == "md" || ext == "markdown" || ext == "mdown" || ext == "mkd"
        || ext == "mkdn";
}

content
prepare_content(std::string raw,
                std::string source_name,
                std::optional<std::string> extension,
                const load_options& opts)
{
    auto raw_sf = string_fragment::from_str(raw);

    if (!opts.lo_force_binary && is_binary(raw_sf)) {
        log_info("%s appears to be binary", source_name.c_str());
        throw mat::error(binary_file{source_name});
    }

    content retval;

    retval.c_encoding = detect_encoding(raw_sf);
    log_debug("detected encoding of %s: %s",
              source_name.c_str(),
              encoding_name(retval.c_encoding));
    retval.c_text = decode_bytes(raw_sf, retval.c_encoding, source_name);
    raw.clear();
    if (!opts.lo_preserve_ansi) {
        strip_ansi_string(retval.c_text);
    }
    retval.c_text = expand_tabs(retval.c_text);
    retval.c_source_name = std::move(source_name);
    retval.c_extension = std::move(extension);

    return retval;
}

content
load_content(const std::optional<std::filesystem::path>& path,
             const load_options& opts)
{
    if (path) {
        return prepare_content(mat::filesystem::read_file(path.value()),
                               path->string(),
                               detect_extension(path.value()),
                               opts);
    }

    return prepare_content(mat::filesystem::read_fd(STDIN_FILENO, "stdin"),
                           "stdin",
                           std::nullopt,
                           opts);
}

}  // namespace mat
