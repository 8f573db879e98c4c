/**
 * Copyright (c) 2020, Timothy Stack
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
 * @file color_spaces.hh
 */

#ifndef mat_color_spaces_hh
#define mat_color_spaces_hh

#include <stdint.h>

#include "mapbox/variant.hpp"

using palette_color = uint8_t;

#define COLOR_BLACK     0
#define COLOR_RED       1
#define COLOR_GREEN     2
#define COLOR_YELLOW    3
#define COLOR_BLUE      4
#define COLOR_MAGENTA   5
#define COLOR_CYAN      6
#define COLOR_WHITE     7
#define COLOR_DARK_GRAY 8

/** A 24-bit color, with -1 components for "not set". */
struct rgb_color {
    explicit constexpr rgb_color(short r = -1, short g = -1, short b = -1)
        : rc_r(r), rc_g(g), rc_b(b)
    {
    }

    bool empty() const
    {
        return this->rc_r == -1 && this->rc_g == -1 && this->rc_b == -1;
    }

    /**
     * @return The relative luminance of the color in the range [0, 1] using
     * the Rec. 709 coefficients.
     */
    double luminance() const;

    bool operator==(const rgb_color& rhs) const;

    short rc_r;
    short rc_g;
    short rc_b;
};

namespace styling {

struct transparent {
    bool operator==(const transparent& rhs) const { return true; }
};

/**
 * A terminal color.  Named colors are kept as an index into the terminal's
 * palette so that they follow the user's terminal color scheme, while
 * colors from the syntax themes are direct RGB values.
 */
class color_unit {
public:
    static color_unit make_empty() { return color_unit{transparent{}}; }

    static color_unit from_rgb(const rgb_color& rgb)
    {
        return color_unit{rgb};
    }

    static color_unit from_palette(const palette_color& indexed)
    {
        return color_unit{indexed};
    }

    bool operator==(const color_unit& rhs) const
    {
        return this->cu_value == rhs.cu_value;
    }

    bool operator!=(const color_unit& rhs) const { return !(*this == rhs); }

    bool empty() const
    {
        return this->cu_value.match(
            [](transparent) { return true; },
            [](const palette_color& pc) { return false; },
            [](const rgb_color& rc) { return rc.empty(); });
    }

    using variants_t
        = mapbox::util::variant<transparent, palette_color, rgb_color>;

    variants_t cu_value;

private:
    explicit color_unit(variants_t value) : cu_value(std::move(value)) {}
};

}  // namespace styling

#endif
