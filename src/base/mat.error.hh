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
 * @file mat.error.hh
 */

#ifndef mat_error_hh
#define mat_error_hh

#include <exception>
#include <string>

#include "mapbox/variant.hpp"

namespace mat {

struct io_error {
    std::string ie_path;
    int ie_errno{0};
};

struct invalid_regex {
    std::string ir_pattern;
    std::string ir_cause;
};

struct empty_pattern {};

struct binary_file {
    std::string bf_path;
};

struct invalid_line_range {
    std::string ilr_range;
};

struct encoding_error {
    std::string ee_path;
};

/**
 * The failures that are reported to the user.  Operations that consume
 * user input throw this exception and main() turns it into a message on
 * stderr and an exit code.
 */
class error : public std::exception {
public:
    using kind_t = mapbox::util::variant<io_error,
                                         invalid_regex,
                                         empty_pattern,
                                         binary_file,
                                         invalid_line_range,
                                         encoding_error>;

    explicit error(kind_t kind);

    const kind_t& get_kind() const { return this->e_kind; }

    template<typename T>
    bool is() const
    {
        return this->e_kind.is<T>();
    }

    std::string get_message() const;

    /** @return 2 for errors in the arguments, 1 for everything else. */
    int exit_code() const;

    const char* what() const noexcept override;

private:
    kind_t e_kind;
    std::string e_what;
};

}  // namespace mat

#endif
