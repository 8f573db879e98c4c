/**
 * Copyright (c) 2021, Timothy Stack
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
 * @file fs_util.cc
 */

#include <errno.h>
#include <string.h>

#include "fs_util.hh"

#include "mat.error.hh"
#include "mat_log.hh"

namespace mat::filesystem {

auto_fd
open_file(const std::filesystem::path& path, int flags)
{
    auto fd = openp(path, flags | O_CLOEXEC);

    if (fd == -1) {
        auto errno_save = errno;

        log_error("unable to open %s -- %s", path.c_str(), strerror(errno));
        throw mat::error(io_error{path.string(), errno_save});
    }

    return auto_fd(fd);
}

std::string
read_fd(int fd, const std::string& name)
{
    std::string retval;
    char buffer[64 * 1024];

    while (true) {
        auto rc = read(fd, buffer, sizeof(buffer));

        if (rc == 0) {
            break;
        }
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto errno_save = errno;

            log_error("read of %s failed -- %s", name.c_str(), strerror(errno));
            throw mat::error(io_error{name, errno_save});
        }
        retval.append(buffer, rc);
    }

    return retval;
}

std::string
read_file(const std::filesystem::path& path)
{
    auto fd = open_file(path, O_RDONLY);
    struct stat st;

    if (fstat(fd, &st) == 0 && S_ISDIR(st.st_mode)) {
        throw mat::error(io_error{path.string(), EISDIR});
    }

    auto retval = read_fd(fd, path.string());

    log_debug("read %zu bytes from %s", retval.size(), path.c_str());
    return retval;
}

}  // namespace mat::filesystem
