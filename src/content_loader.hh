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
 * @file content_loader.hh
 */

#ifndef mat_content_loader_hh
#define mat_content_loader_hh

#include <filesystem>
#include <optional>
#include <string>

#include "base/string_fragment.hh"

namespace mat {

enum class text_encoding {
    utf8,
    utf8_bom,
    utf16le,
    utf16be,
    latin1,
};

/** @return The name of the encoding as shown in the status bar. */
const char* encoding_name(text_encoding enc);

constexpr size_t BINARY_CHECK_SIZE = 8192;
constexpr size_t TAB_WIDTH = 4;

/**
 * Guess whether the data is binary by looking at the first
 * BINARY_CHECK_SIZE bytes.  The data is binary if it contains a NUL or if
 * more than 30% of the bytes are not printable.
 */
bool is_binary(string_fragment sf);

text_encoding detect_encoding(string_fragment sf);

/**
 * Convert the data to UTF-8.  Byte order marks are removed and bad input
 * is replaced with U+FFFD.
 */
std::string decode_bytes(string_fragment sf,
                         text_encoding enc,
                         const std::string& source_name);

/**
 * Replace tabs with the number of spaces needed to reach the next tab
 * stop.  The column is reset by a newline.
 */
std::string expand_tabs(const std::string& text, size_t tab_width = TAB_WIDTH);

/** @return The lowercased extension of the path without the dot. */
std::optional<std::string> detect_extension(const std::filesystem::path& path);

bool is_markdown_extension(const std::string& ext);

struct load_options {
    bool lo_force_binary{false};
    bool lo_preserve_ansi{false};
};

struct content {
    std::string c_text;
    std::string c_source_name;
    std::optional<std::string> c_extension;
    text_encoding c_encoding{text_encoding::utf8};
};

/**
 * Turn raw bytes into the text that the rest of the pipeline works on.
 *
 * @throws mat::error with a binary_file error if the data looks binary.
 */
content prepare_content(std::string raw,
                        std::string source_name,
                        std::optional<std::string> extension,
                        const load_options& opts);

/**
 * Read and prepare the contents of a file, or of the standard input when
 * no path is given.
 */
content load_content(const std::optional<std::filesystem::path>& path,
                     const load_options& opts);

}  // namespace mat

#endif
