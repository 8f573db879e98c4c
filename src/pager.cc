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
 * @file pager.cc
 */

#include <atomic>

#include <signal.h>
#include <stdlib.h>
#include <time.h>

#include "pager.hh"

#include "base/mat_log.hh"
#include "view_curses.hh"
#include "viewer_render.hh"

namespace mat {

static const timespec POLL_TIMEOUT = {0, 100 * 1000 * 1000};

static std::atomic<int> sigint_count{0};

notcurses_options
pager_options()
{
    notcurses_options retval = {};

    retval.flags |= NCOPTION_SUPPRESS_BANNERS | NCOPTION_NO_QUIT_SIGHANDLERS;
    return retval;
}

void
pager_sigint(int sig)
{
    auto counter = sigint_count.fetch_add(1);
    if (counter >= 3) {
        abort();
    }
}

bool
pager_take_sigint()
{
    return sigint_count.exchange(0) > 0;
}

static void
draw(ncplane* plane, viewer_state& vs)
{
    auto rows = render_screen(vs);

    ncplane_erase(plane);
    for (size_t lpc = 0; lpc < rows.size(); lpc++) {
        view_curses::mvwattrline(plane, lpc, 0, rows[lpc]);
    }
}

void
run_pager(viewer_state& vs)
{
    auto sc = screen_curses::create(pager_options());
    auto* nc = sc.get_notcurses();
    unsigned rows, cols;

    notcurses_stddim_yx(nc, &rows, &cols);
    vs.set_terminal_size(cols, rows);
    log_info("starting pager with a %ux%u terminal", cols, rows);

    pager_take_sigint();
    (void) signal(SIGINT, pager_sigint);
    (void) signal(SIGTERM, pager_sigint);

    while (!vs.should_quit()) {
        if (pager_take_sigint()) {
            log_info("interrupted, leaving the pager");
            break;
        }

        draw(sc.get_std_plane(), vs);
        if (notcurses_render(nc) == -1) {
            log_error("unable to render the screen");
            break;
        }

        ncinput ch;
        auto id = notcurses_get(nc, &POLL_TIMEOUT, &ch);

        if (id == (uint32_t) -1) {
            log_error("unable to read terminal input");
            break;
        }
        if (id == NCKEY_RESIZE) {
            notcurses_refresh(nc, &rows, &cols);
            vs.set_terminal_size(cols, rows);
        } else if (id != 0) {
            vs.handle_key(ch);
        }

        vs.check_follow_updates();
    }
    (void) signal(SIGINT, SIG_DFL);
    (void) signal(SIGTERM, SIG_DFL);
    log_info("pager finished");
}

}  // namespace mat
