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
 * @file fs_util.tests.cc
 */

#include <filesystem>
#include <fstream>

#include <errno.h>
#include <sys/wait.h>
#include <unistd.h>

#include "base/fs_util.hh"

#include "base/mat.error.hh"
#include "doctest/doctest.h"

TEST_CASE("fs_util::read_file")
{
    auto path = std::filesystem::temp_directory_path()
        / ("mat-fs-util-" + std::to_string(getpid()) + ".txt");

    {
        std::ofstream out(path, std::ios::binary);

        out << "hello\r\nworld" << std::string(1, '\0') << "end";
    }

    auto content = mat::filesystem::read_file(path);
    CHECK(content == std::string("hello\r\nworld\0end", 16));

    std::filesystem::remove(path);
}

TEST_CASE("fs_util::read_file errors")
{
    auto missing = std::filesystem::temp_directory_path()
        / ("mat-fs-util-missing-" + std::to_string(getpid()));

    try {
        mat::filesystem::read_file(missing);
        FAIL("expected an error");
    } catch (const mat::error& e) {
        REQUIRE(e.is<mat::io_error>());
        CHECK(e.get_kind().get<mat::io_error>().ie_errno == ENOENT);
        CHECK(e.exit_code() == 1);
    }

    try {
        mat::filesystem::read_file(std::filesystem::temp_directory_path());
        FAIL("expected an error");
    } catch (const mat::error& e) {
        REQUIRE(e.is<mat::io_error>());
        CHECK(e.get_kind().get<mat::io_error>().ie_errno == EISDIR);
    }
}

TEST_CASE("fs_util::read_fd")
{
    auto_fd fds[2];

    REQUIRE(auto_fd::pipe(fds) == 0);

    auto& read_end = fds[0];
    auto& write_end = fds[1];
    std::string payload(100 * 1024, 'x');

    // larger than the pipe buffer, so write from a child
    auto pid = fork();
    REQUIRE(pid != -1);
    if (pid == 0) {
        read_end.reset();
        auto rc = write(write_end, payload.data(), payload.size());
        _exit(rc == (ssize_t) payload.size() ? 0 : 1);
    }
    write_end.reset();

    auto content = mat::filesystem::read_fd(read_end, "<pipe>");
    CHECK(content.size() == payload.size());

    int status = 0;
    waitpid(pid, &status, 0);
    CHECK(WEXITSTATUS(status) == 0);
}
