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
 * @file pager.tests.cc
 */

#include <signal.h>

#include "pager.hh"

#include "doctest/doctest.h"

using namespace mat;

TEST_CASE("pager_options")
{
    auto nco = pager_options();

    CHECK((nco.flags & NCOPTION_NO_QUIT_SIGHANDLERS) != 0);
    CHECK((nco.flags & NCOPTION_SUPPRESS_BANNERS) != 0);
}

TEST_CASE("pager_sigint")
{
    pager_take_sigint();
    CHECK_FALSE(pager_take_sigint());

    auto* old_handler = signal(SIGINT, pager_sigint);
    raise(SIGINT);
    signal(SIGINT, old_handler);

    CHECK(pager_take_sigint());
    CHECK_FALSE(pager_take_sigint());

    pager_sigint(SIGTERM);
    pager_sigint(SIGTERM);
    CHECK(pager_take_sigint());
    CHECK_FALSE(pager_take_sigint());
}
