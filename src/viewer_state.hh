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
 * @file viewer_state.hh
 */

#ifndef mat_viewer_state_hh
#define mat_viewer_state_hh

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <notcurses/notcurses.h>

#include "base/mat_log.hh"
#include "document.hh"
#include "search_overlay.hh"
#include "tail_reader.hh"
#include "theme.hh"

namespace mat {

enum class wrap_mode_t {
    none,
    wrap,
    truncate,
};

/** Parse "none", "wrap" or "truncate", ignoring case. */
std::optional<wrap_mode_t> parse_wrap_mode(const std::string& name);

enum class view_mode_t {
    normal,
    search,
};

/** A screen row of a soft-wrapped document. */
struct wrapped_row {
    size_t wr_line_idx;
    size_t wr_line_number;
    bool wr_is_first_row;
    /** The offset into the line's text, in code points. */
    size_t wr_char_offset;
    size_t wr_display_width;
};

/**
 * Break the lines of the document into rows no wider than the given
 * width.  Characters are never split between rows and empty lines take a
 * single row.
 */
std::vector<wrapped_row> build_wrap_rows(const document& doc,
                                         size_t content_width);

struct viewer_options {
    bool vo_show_gutter{false};
    wrap_mode_t vo_wrap_mode{wrap_mode_t::none};
    size_t vo_max_width{200};
    std::optional<std::filesystem::path> vo_path;
};

/**
 * The state of the interactive viewer.  All of the scrolling, searching
 * and following logic lives here so that it can be driven without a
 * terminal.
 */
class viewer_state : public log_state_dumper {
public:
    static constexpr size_t DEFAULT_WIDTH = 80;
    static constexpr size_t DEFAULT_HEIGHT = 24;
    static constexpr size_t HORIZONTAL_STEP = 4;

    viewer_state(document doc,
                 std::optional<search_state> search,
                 theme_colors palette,
                 viewer_options opts);

    void log_state() override;

    void set_terminal_size(size_t width, size_t height);

    size_t get_width() const { return this->vs_width; }

    /** The height of the viewport, the last row is the status bar. */
    size_t content_height() const;

    size_t gutter_width() const;

    size_t content_width() const;

    /** The number of rows the document takes on the screen. */
    size_t total_rows();

    size_t max_scroll();

    void scroll_down(size_t amount);

    void scroll_up(size_t amount);

    void scroll_left(size_t amount);

    void scroll_right(size_t amount);

    void scroll_to_line_start();

    void scroll_to_line_end();

    void go_to_top() { this->vs_scroll_line = 0; }

    void go_to_bottom() { this->vs_scroll_line = this->max_scroll(); }

    void half_page_up() { this->scroll_up(this->content_height() / 2); }

    void half_page_down() { this->scroll_down(this->content_height() / 2); }

    /** Center the viewport on the given line, as far as scrolling allows. */
    void scroll_to_line(size_t line_idx);

    void toggle_gutter();

    /**
     * Start or stop following the file.  Following starts at the current
     * end of the file and moves the viewport to the bottom.  Nothing
     * happens if the document did not come from a file.
     */
    void toggle_follow();

    /**
     * Append any lines that were written to the followed file.
     *
     * @return true if lines were added.
     */
    bool check_follow_updates();

    /** Start an interactive search, remembering the current document. */
    void enter_search_mode(bool case_insensitive);

    void search_add_char(const std::string& ch);

    void search_backspace();

    void confirm_search();

    void cancel_search();

    void next_match();

    void prev_match();

    /**
     * Dispatch a key press.
     *
     * @return true if the viewer should quit.
     */
    bool handle_key(const ncinput& ch);

    const std::vector<wrapped_row>& get_wrap_rows();

    void set_wrap_mode(wrap_mode_t mode);

    wrap_mode_t get_wrap_mode() const { return this->vs_wrap_mode; }

    const document& get_document() const { return this->vs_document; }

    size_t get_scroll_line() const { return this->vs_scroll_line; }

    size_t get_scroll_col() const { return this->vs_scroll_col; }

    size_t get_max_width() const { return this->vs_max_width; }

    bool is_gutter_shown() const { return this->vs_show_gutter; }

    bool is_following() const { return this->vs_tail_reader != nullptr; }

    bool in_search_snapshot() const
    {
        return this->vs_snapshot.has_value();
    }

    view_mode_t get_mode() const { return this->vs_mode; }

    const std::string& get_search_query() const
    {
        return this->vs_search_query;
    }

    const std::optional<search_state>& get_search_state() const
    {
        return this->vs_search_state;
    }

    const theme_colors& get_palette() const { return this->vs_palette; }

    bool should_quit() const { return this->vs_should_quit; }

private:
    bool handle_normal_key(const ncinput& ch);

    bool handle_search_key(const ncinput& ch);

    void update_search_preview();

    void invalidate_wrap_cache() { this->vs_wrap_cache = std::nullopt; }

    document vs_document;
    std::optional<document> vs_snapshot;
    std::optional<search_state> vs_search_state;
    theme_colors vs_palette;
    size_t vs_scroll_line{0};
    size_t vs_scroll_col{0};
    size_t vs_width{DEFAULT_WIDTH};
    size_t vs_height{DEFAULT_HEIGHT};
    wrap_mode_t vs_wrap_mode;
    size_t vs_max_width;
    bool vs_show_gutter;
    std::optional<std::filesystem::path> vs_path;
    std::unique_ptr<tail_reader> vs_tail_reader;
    view_mode_t vs_mode{view_mode_t::normal};
    std::string vs_search_query;
    bool vs_search_ignore_case{false};
    std::optional<std::vector<wrapped_row>> vs_wrap_cache;
    bool vs_should_quit{false};
};

}  // namespace mat

#endif
