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
 * @file tail_reader.cc
 */

#include <errno.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "tail_reader.hh"

#include "base/fs_util.hh"
#include "base/mat.error.hh"
#include "base/mat_log.hh"

namespace mat {

tail_reader::tail_reader(std::filesystem::path path, bool start_at_end)
    : tr_path(std::move(path))
{
    if (start_at_end) {
        struct stat st;

        if (filesystem::statp(this->tr_path, &st) == 0) {
            this->tr_offset = st.st_size;
        } else {
            log_warning("unable to stat followed file %s -- %s",
                        this->tr_path.c_str(),
                        strerror(errno));
        }
    }
    log_info("following %s from offset %lld",
             this->tr_path.c_str(),
             (long long) this->tr_offset);
}

std::vector<std::string>
tail_reader::poll()
{
    std::vector<std::string> retval;

    try {
        auto fd = filesystem::open_file(this->tr_path, O_RDONLY);
        struct stat st;

        if (fstat(fd, &st) == -1) {
            log_warning("unable to stat followed file %s -- %s",
                        this->tr_path.c_str(),
                        strerror(errno));
            return retval;
        }

        if (st.st_size < this->tr_offset) {
            log_info("%s was truncated, reading from the start",
                     this->tr_path.c_str());
            this->tr_offset = 0;
        }
        if (st.st_size == this->tr_offset) {
            return retval;
        }

        if (lseek(fd, this->tr_offset, SEEK_SET) == -1) {
            log_warning("unable to seek in followed file %s -- %s",
                        this->tr_path.c_str(),
                        strerror(errno));
            return retval;
        }

        auto data = filesystem::read_fd(fd, this->tr_path.string());
        size_t line_start = 0;

        for (auto nl = data.find('\n'); nl != std::string::npos;
             nl = data.find('\n', line_start))
        {
            auto line = data.substr(line_start, nl - line_start);

            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            retval.emplace_back(std::move(line));
            line_start = nl + 1;
        }
        this->tr_offset += line_start;
    } catch (const mat::error& e) {
        log_warning("unable to poll followed file -- %s",
                    e.get_message().c_str());
    }

    return retval;
}

}  // namespace mat
