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
 * @file tail_reader.hh
 */

#ifndef mat_tail_reader_hh
#define mat_tail_reader_hh

#include <filesystem>
#include <string>
#include <vector>

#include <sys/types.h>

namespace mat {

/**
 * Reads the lines appended to a file since the last poll.  The file is
 * reopened on every poll so that it can be replaced or truncated while it
 * is being followed.
 */
class tail_reader {
public:
    /**
     * @param path The file to follow.
     * @param start_at_end If true, only lines written after this call are
     * returned by poll().
     */
    tail_reader(std::filesystem::path path, bool start_at_end);

    /**
     * @return The complete lines added since the last poll.  A file that
     * shrank is read again from the start.  Errors are logged and result
     * in no lines.
     */
    std::vector<std::string> poll();

    off_t get_offset() const { return this->tr_offset; }

private:
    std::filesystem::path tr_path;
    off_t tr_offset{0};
};

}  // namespace mat

#endif
