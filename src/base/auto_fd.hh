/**
 * Copyright (c) 2007, Timothy Stack
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
 * @file auto_fd.hh
 */

#ifndef mat_auto_fd_hh
#define mat_auto_fd_hh

#include <fcntl.h>

/**
 * Owns a file descriptor and closes it when it goes out of scope.  The
 * standard streams are never closed so that an auto_fd can safely wrap
 * them.
 */
class auto_fd {
public:
    /**
     * Create a pipe(2) and store the read end in af[0] and the write end in
     * af[1].
     *
     * @return The result of pipe(2).
     */
    static int pipe(auto_fd* af);

    explicit auto_fd(int fd = -1);

    auto_fd(auto_fd&& af) noexcept;

    auto_fd(const auto_fd& af) = delete;

    ~auto_fd();

    operator int() const { return this->af_fd; }

    /** Close the current descriptor and take ownership of the given one. */
    auto_fd& operator=(int fd);

    auto_fd& operator=(auto_fd&& af) noexcept
    {
        this->reset(af.release());
        return *this;
    }

    /** Give up ownership of the descriptor without closing it. */
    int release()
    {
        int retval = this->af_fd;

        this->af_fd = -1;
        return retval;
    }

    /** dup2(2) the descriptor onto the given one, a child's stdin say. */
    void copy_to(int fd) const;

    int get() const { return this->af_fd; }

    void reset(int fd = -1);

private:
    int af_fd;
};

#endif
