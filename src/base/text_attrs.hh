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
 * @file text_attrs.hh
 */

#ifndef mat_text_attrs_hh
#define mat_text_attrs_hh

#include <stdint.h>

#include "color_spaces.hh"

/**
 * The display attributes of a run of text: an optional foreground and
 * background color and a set of font styles.
 */
struct text_attrs {
    enum class style : uint32_t {
        none = 0x0000,
        bold = 0x0002u,
        underline = 0x0008u,
        italic = 0x0010u,
    };

    static text_attrs with_bold()
    {
        return text_attrs{static_cast<uint32_t>(style::bold)};
    }

    static text_attrs with_underline()
    {
        return text_attrs{static_cast<uint32_t>(style::underline)};
    }

    static text_attrs with_fg(palette_color pc)
    {
        text_attrs retval;

        retval.ta_fg_color = styling::color_unit::from_palette(pc);
        return retval;
    }

    static text_attrs with_fg(const rgb_color& rgb)
    {
        text_attrs retval;

        retval.ta_fg_color = styling::color_unit::from_rgb(rgb);
        return retval;
    }

    static text_attrs with_colors(const styling::color_unit& fg,
                                  const styling::color_unit& bg)
    {
        text_attrs retval;

        retval.ta_fg_color = fg;
        retval.ta_bg_color = bg;
        return retval;
    }

    /** @return true if no color or style is set. */
    bool empty() const
    {
        return this->ta_attrs == 0 && this->ta_fg_color.empty()
            && this->ta_bg_color.empty();
    }

    /**
     * Layer the given attributes on top of these ones.  Colors set in the
     * child replace the ones here and the styles are combined.
     */
    text_attrs merged_with(const text_attrs& child) const
    {
        return text_attrs{
            this->ta_attrs | child.ta_attrs,
            !child.ta_fg_color.empty() ? child.ta_fg_color : this->ta_fg_color,
            !child.ta_bg_color.empty() ? child.ta_bg_color : this->ta_bg_color,
        };
    }

    text_attrs operator|(const style other) const
    {
        return text_attrs{
            this->ta_attrs | static_cast<uint32_t>(other),
            this->ta_fg_color,
            this->ta_bg_color,
        };
    }

    text_attrs& operator|=(const style other)
    {
        this->ta_attrs |= static_cast<uint32_t>(other);
        return *this;
    }

    bool has_style(style other) const
    {
        return this->ta_attrs & static_cast<uint32_t>(other);
    }

    bool operator==(const text_attrs& other) const
    {
        return this->ta_attrs == other.ta_attrs
            && this->ta_fg_color == other.ta_fg_color
            && this->ta_bg_color == other.ta_bg_color;
    }

    bool operator!=(const text_attrs& other) const
    {
        return !(*this == other);
    }

    uint32_t ta_attrs{0};
    styling::color_unit ta_fg_color{styling::color_unit::make_empty()};
    styling::color_unit ta_bg_color{styling::color_unit::make_empty()};
};

#endif
