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
 */

#include <errno.h>
#include <string.h>

#include "base/mat.error.hh"

#include "doctest/doctest.h"

TEST_CASE("error messages")
{
    mat::error io(mat::io_error{"/tmp/missing.txt", ENOENT});

    CHECK(io.get_message()
          == std::string("I/O error for '/tmp/missing.txt': ")
              + strerror(ENOENT));
    CHECK(io.exit_code() == 1);

    mat::error range(mat::invalid_line_range{"a:b"});
    CHECK(range.is<mat::invalid_line_range>());
    CHECK(range.exit_code() == 2);
}

TEST_CASE("error::what is ready after construction")
{
    const mat::error err(mat::binary_file{"image.png"});
    const std::exception& base = err;

    CHECK(std::string(base.what()) == err.get_message());
    CHECK(std::string(base.what())
          == "Binary file detected: 'image.png'. Use --force-binary to view "
             "anyway");
    CHECK(base.what() == err.what());

    auto copy = err;
    CHECK(std::string(copy.what()) == err.get_message());
}
