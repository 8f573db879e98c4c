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
 * @file pager.hh
 */

#ifndef mat_pager_hh
#define mat_pager_hh

#include <notcurses/notcurses.h>

#include "viewer_state.hh"

namespace mat {

/**
 * The options the pager screen is started with.  notcurses is told to keep
 * its hands off SIGINT and SIGTERM, the pager handles them itself.
 */
notcurses_options pager_options();

/**
 * Handler for SIGINT and SIGTERM while the pager is running.  The pager
 * loop notices the signal and returns as if the user had quit.
 */
void pager_sigint(int sig);

/** @return True if pager_sigint() was called since the last check. */
bool pager_take_sigint();

/**
 * Take over the terminal and run the interactive viewer until the user
 * quits.  The terminal is restored on every exit path.
 *
 * @throws mat::error if the terminal could not be initialized.
 */
void run_pager(viewer_state& vs);

}  // namespace mat

#endif
