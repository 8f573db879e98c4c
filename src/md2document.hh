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
 * @file md2document.hh
 */

#ifndef mat_md2document_hh
#define mat_md2document_hh

#include <string>
#include <vector>

#include "document.hh"
#include "md4cpp.hh"

namespace mat {

/**
 * Turns the markdown event stream into styled lines for the terminal.
 * Block structure is flattened: headings are decorated, lists get
 * bullets or numbers, quotes and code blocks are framed.
 */
class md2document : public md4cpp::typed_event_handler<document> {
public:
    md2document() { this->md_style_stack.emplace_back(); }

    void enter_block(const block& bl) override;
    void leave_block(const block& bl) override;
    void enter_span(const span& sp) override;
    void leave_span(const span& sp) override;
    void text(MD_TEXTTYPE tt, const string_fragment& sf) override;

    document get_result() override;

private:
    struct list_state {
        bool ls_ordered{false};
        unsigned ls_counter{1};
    };

    const text_attrs& current_attrs() const
    {
        return this->md_style_stack.back();
    }

    void push_attrs(const text_attrs& attrs);
    void pop_attrs();

    void add_text(const std::string& str, const text_attrs& attrs);
    void add_normal_text(const std::string& str);
    void add_code_block_text(const string_fragment& sf);
    void add_list_prefix();
    void add_quote_prefix();

    /** Move the current line into the document, even if it is empty. */
    void flush_line();
    /** Move the current line into the document if it has content. */
    void finish_line();
    /** Finish the current line and separate it with one blank line. */
    void blank_line();
    void strip_heading_attributes();

    std::vector<styled_line> md_lines;
    styled_line md_current;
    std::vector<text_attrs> md_style_stack;
    std::vector<list_state> md_list_stack;
    size_t md_quote_depth{0};
    bool md_in_code_block{false};
    bool md_in_code_span{false};
    bool md_needs_list_prefix{false};
    char md_task_mark{'\0'};
};

/**
 * Render markdown text into a document.  If the text cannot be parsed,
 * the plain text is returned instead.
 */
document render_markdown(const std::string& text,
                         const std::string& source_name);

}  // namespace mat

#endif
