/**
 * Copyright (c) 2007-2012, Timothy Stack
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
 * @file view_curses.hh
 */

#ifndef mat_view_curses_hh
#define mat_view_curses_hh

#include <utility>

#include <notcurses/notcurses.h>
#include <stdint.h>

#include "base/mat_log.hh"
#include "base/text_attrs.hh"
#include "styled_line.hh"

namespace mat {

/**
 * An RAII class that initializes and deinitializes curses.
 */
class screen_curses : public log_crash_recoverer {
public:
    void log_crash_recover() override
    {
        if (this->sc_notcurses != nullptr) {
            notcurses_stop(this->sc_notcurses);
            this->sc_notcurses = nullptr;
        }
    }

    /**
     * @throws mat::error with an io_error if the terminal could not be
     * initialized.
     */
    static screen_curses create(const notcurses_options& options);

    ~screen_curses() override { this->log_crash_recover(); }

    screen_curses(screen_curses&& other) noexcept
        : sc_notcurses(std::exchange(other.sc_notcurses, nullptr))
    {
    }

    screen_curses(const screen_curses&) = delete;

    screen_curses& operator=(screen_curses&& other) noexcept
    {
        this->sc_notcurses = std::exchange(other.sc_notcurses, nullptr);
        return *this;
    }

    notcurses* get_notcurses() const { return this->sc_notcurses; }

    ncplane* get_std_plane() const
    {
        return notcurses_stdplane(this->sc_notcurses);
    }

private:
    explicit screen_curses(notcurses* nc) : sc_notcurses(nc) {}

    notcurses* sc_notcurses;
};

class view_curses {
public:
    static uint64_t to_channels(const text_attrs& ta);

    /**
     * Draw a row of styled text on the plane.  The row is clipped to the
     * width of the plane.
     *
     * @return The number of columns that were drawn.
     */
    static size_t mvwattrline(ncplane* window,
                              int y,
                              int x,
                              const styled_line& row);
};

}  // namespace mat

#endif
