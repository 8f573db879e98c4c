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
 * @file grammar_set.hh
 */

#ifndef mat_grammar_set_hh
#define mat_grammar_set_hh

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "highlighter.hh"

namespace mat {

struct grammar {
    std::string g_name;
    std::vector<std::string> g_extensions;
    /** The rules in priority order, earlier rules win ties. */
    std::vector<highlighter> g_highlighters;
};

/**
 * The built-in grammars.  The set is built on first use and lives for the
 * rest of the process.
 */
class grammar_set {
public:
    static const grammar_set& get();

    /** Find a grammar by its name, ignoring case. */
    const grammar* find_by_name(const std::string& name) const;

    /** Find a grammar by file extension, ignoring case. */
    const grammar* find_by_extension(const std::string& ext) const;

    /**
     * Pick the grammar for a document.  An explicit language is looked up
     * by name and then by extension.  Otherwise, the extension of the
     * source name is mapped to a language name and then looked up
     * directly.
     */
    const grammar* select(const std::optional<std::string>& language,
                          const std::string& source_name) const;

    const std::vector<grammar>& get_grammars() const
    {
        return this->gs_grammars;
    }

private:
    grammar_set();

    std::vector<grammar> gs_grammars;
    std::map<std::string, size_t> gs_name_index;
    std::map<std::string, size_t> gs_ext_index;
};

/**
 * Map a file name to the name of its language, using the extension or, for
 * names without a dot, the whole name.
 */
std::optional<std::string> detect_language(const std::string& source_name);

}  // namespace mat

#endif
