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
 */

#include <filesystem>
#include <fstream>

#include <unistd.h>

#include "tail_reader.hh"

#include "doctest/doctest.h"
#include "fmt/format.h"

using namespace mat;

static std::filesystem::path
temp_path(const char* name)
{
    return std::filesystem::temp_directory_path()
        / fmt::format(FMT_STRING("mat-{}-{}"), getpid(), name);
}

static void
write_file(const std::filesystem::path& path,
           const std::string& content,
           bool append = false)
{
    std::ofstream out(path,
                      append ? std::ios::binary | std::ios::app
                             : std::ios::binary | std::ios::trunc);

    out << content;
}

TEST_CASE("tail_reader from the start")
{
    auto path = temp_path("tail-start");

    write_file(path, "one\r\ntwo\npart");

    tail_reader tr(path, false);
    auto lines = tr.poll();

    CHECK(lines == std::vector<std::string>{"one", "two"});
    CHECK(tr.get_offset() == 9);
    CHECK(tr.poll().empty());

    write_file(path, "ial\nthree\n", true);
    lines = tr.poll();
    CHECK(lines == std::vector<std::string>{"partial", "three"});

    std::filesystem::remove(path);
}

TEST_CASE("tail_reader from the end")
{
    auto path = temp_path("tail-end");

    write_file(path, "old 1\nold 2\n");

    tail_reader tr(path, true);

    CHECK(tr.get_offset() == 12);
    CHECK(tr.poll().empty());

    write_file(path, "new 1\n", true);
    CHECK(tr.poll() == std::vector<std::string>{"new 1"});

    std::filesystem::remove(path);
}

TEST_CASE("tail_reader handles truncation")
{
    auto path = temp_path("tail-trunc");

    write_file(path, "a long first line\n");

    tail_reader tr(path, true);

    write_file(path, "new\n");
    CHECK(tr.poll() == std::vector<std::string>{"new"});
    CHECK(tr.get_offset() == 4);

    std::filesystem::remove(path);
}

TEST_CASE("tail_reader absorbs errors")
{
    auto path = temp_path("tail-missing");

    std::filesystem::remove(path);

    tail_reader tr(path, true);

    CHECK(tr.get_offset() == 0);
    CHECK(tr.poll().empty());

    write_file(path, "appeared\n");
    CHECK(tr.poll() == std::vector<std::string>{"appeared"});

    std::filesystem::remove(path);
}
