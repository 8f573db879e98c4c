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
 * @file grep_filter.hh
 */

#ifndef mat_grep_filter_hh
#define mat_grep_filter_hh

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "document.hh"
#include "pcrepp/pcre2pp.hh"

namespace mat {

struct grep_options {
    std::shared_ptr<pcre2pp::code> go_pattern;
    size_t go_before{0};
    size_t go_after{0};

    /**
     * Set the context counts.  A combined context count replaces the
     * separate before and after counts.
     */
    grep_options& with_context(std::optional<size_t> before,
                               std::optional<size_t> after,
                               std::optional<size_t> context)
    {
        if (context) {
            this->go_before = this->go_after = context.value();
        } else {
            this->go_before = before.value_or(0);
            this->go_after = after.value_or(0);
        }
        return *this;
    }
};

/** A half-open range of line indexes. */
using line_interval = std::pair<size_t, size_t>;

/**
 * Sort the intervals and merge the ones that overlap or touch.
 */
std::vector<line_interval> merge_intervals(std::vector<line_interval> ivs);

/**
 * Keep only the lines that match the pattern, along with their context.
 * Groups of lines that are not adjacent are divided by a separator line.
 * Context lines lose their styling and are dimmed.
 */
document grep_filter(const document& doc, const grep_options& opts);

}  // namespace mat

#endif
