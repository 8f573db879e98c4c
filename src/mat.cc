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
 * @file mat.cc
 */

#include <filesystem>
#include <optional>
#include <string>

#include <errno.h>
#include <locale.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include "CLI/CLI.hpp"
#include "base/mat.error.hh"
#include "base/mat_log.hh"
#include "content_loader.hh"
#include "document.hh"
#include "fmt/format.h"
#include "grep_filter.hh"
#include "line_range.hh"
#include "md2document.hh"
#include "pager.hh"
#include "regex_pattern.hh"
#include "search_overlay.hh"
#include "syntax_colorer.hh"
#include "theme.hh"
#include "viewer_state.hh"

#ifndef MAT_VERSION
#    define MAT_VERSION "0.0.0"
#endif

namespace mat {

struct options {
    std::optional<std::string> o_file;
    bool o_line_numbers{false};
    bool o_no_highlight{false};
    bool o_markdown{false};
    bool o_no_markdown{false};
    bool o_follow{false};
    std::optional<std::string> o_search;
    std::optional<std::string> o_grep;
    bool o_ignore_case{false};
    bool o_fixed_strings{false};
    bool o_word_regexp{false};
    bool o_line_regexp{false};
    std::optional<size_t> o_after;
    std::optional<size_t> o_before;
    std::optional<size_t> o_context;
    wrap_mode_t o_wrap{wrap_mode_t::none};
    size_t o_max_width{200};
    std::optional<std::string> o_language;
    std::optional<std::string> o_theme;
    std::optional<std::string> o_lines;
    bool o_no_pager{false};
    bool o_ansi{false};
    bool o_force_binary{false};
    std::string o_debug_log;

    pattern_options to_pattern_options() const
    {
        pattern_options retval;

        retval.po_ignore_case = this->o_ignore_case;
        retval.po_fixed_strings = this->o_fixed_strings;
        retval.po_word_regexp = this->o_word_regexp;
        retval.po_line_regexp = this->o_line_regexp;
        return retval;
    }
};

/**
 * Compile a pattern given on the command-line.
 *
 * @throws error with empty_pattern if the pattern is empty.
 */
static std::shared_ptr<pcre2pp::code>
compile_arg_pattern(const std::string& pattern, const pattern_options& popts)
{
    if (pattern.empty()) {
        throw error(empty_pattern{});
    }

    return compile_pattern(pattern, popts);
}

static bool
should_render_markdown(const options& opts, const content& con)
{
    if (opts.o_no_markdown) {
        return false;
    }
    if (opts.o_markdown) {
        return true;
    }

    return con.c_extension && is_markdown_extension(con.c_extension.value());
}

static int
run(const options& opts)
{
    std::optional<std::filesystem::path> path;

    if (opts.o_file && opts.o_file.value() != "-") {
        path = opts.o_file.value();
    } else if (!opts.o_file && isatty(STDIN_FILENO)) {
        fmt::print(stderr,
                   FMT_STRING("mat: No input file specified. Use 'mat <file>' "
                              "or pipe data to stdin.\n"));
        return EXIT_FAILURE;
    }

    load_options lopts;

    lopts.lo_force_binary = opts.o_force_binary;
    lopts.lo_preserve_ansi = opts.o_ansi;

    auto con = load_content(path, lopts);
    auto markdown = should_render_markdown(opts, con);
    document doc;

    if (markdown) {
        log_info("rendering %s as markdown", con.c_source_name.c_str());
        doc = render_markdown(con.c_text, con.c_source_name);
        doc.d_encoding = encoding_name(con.c_encoding);
    } else {
        doc = document::from_text(
            con.c_text, con.c_source_name, encoding_name(con.c_encoding));
    }
    con.c_text.clear();
    log_info("loaded %zu lines from %s (%s)",
             doc.line_count(),
             doc.d_source_name.c_str(),
             doc.d_encoding.c_str());

    if (opts.o_lines) {
        auto lr = parse_line_range(opts.o_lines.value(), doc.line_count());

        filter_line_range(doc, lr);
    }

    auto popts = opts.to_pattern_options();

    if (opts.o_grep) {
        grep_options gopts;

        gopts.go_pattern = compile_arg_pattern(opts.o_grep.value(), popts);
        gopts.with_context(opts.o_before, opts.o_after, opts.o_context);
        doc = grep_filter(doc, gopts);
    }

    std::optional<theme_t> theme;
    if (opts.o_no_pager) {
        if (opts.o_theme) {
            theme = parse_theme(opts.o_theme.value());
        }
    } else {
        theme = resolve_theme(opts.o_theme);
    }

    if (!opts.o_no_highlight && !markdown) {
        apply_syntax_highlight(
            doc, opts.o_language, theme.value_or(theme_t::dark));
    }

    std::optional<search_state> search;
    if (opts.o_search) {
        auto re = compile_arg_pattern(opts.o_search.value(), popts);

        apply_search_highlight(doc, *re);
        auto matches = find_matches(doc, *re);
        log_info("search pattern %s matched %zu times",
                 re->get_pattern().c_str(),
                 matches.size());
        search.emplace(re, std::move(matches));
    }

    if (opts.o_no_pager) {
        print_document(stdout, doc, opts.o_line_numbers);
        return EXIT_SUCCESS;
    }

    viewer_options vopts;

    vopts.vo_show_gutter = opts.o_line_numbers;
    vopts.vo_wrap_mode = opts.o_wrap;
    vopts.vo_max_width = opts.o_max_width;
    vopts.vo_path = path;

    viewer_state vs(std::move(doc),
                    std::move(search),
                    theme_colors::for_theme(theme.value_or(theme_t::dark)),
                    vopts);

    if (opts.o_follow) {
        vs.toggle_follow();
    }
    run_pager(vs);

    return EXIT_SUCCESS;
}

}  // namespace mat

int
main(int argc, char* argv[])
{
    mat::options opts;
    std::string wrap_name = "none";

    setlocale(LC_ALL, "");

    CLI::App app{
        "View files with syntax highlighting, markdown rendering, "
        "searching and filtering"};

    app.add_option("file", opts.o_file, "The file to view, '-' for stdin")
        ->type_name("FILE");
    app.add_flag("-n,--line-numbers", opts.o_line_numbers, "Show line numbers");
    app.add_flag(
        "-N,--no-highlight", opts.o_no_highlight, "Disable syntax highlighting");
    app.add_flag("-m,--markdown", opts.o_markdown, "Force markdown rendering");
    app.add_flag("-M,--no-markdown",
                 opts.o_no_markdown,
                 "Disable markdown auto-detection");
    app.add_flag("-f,--follow", opts.o_follow, "Follow the end of the file");
    app.add_option("-s,--search", opts.o_search, "Highlight pattern matches")
        ->type_name("PAT");
    app.add_option("-g,--grep", opts.o_grep, "Only show matching lines")
        ->type_name("PAT");
    app.add_flag("-i,--ignore-case",
                 opts.o_ignore_case,
                 "Ignore case when searching or filtering");
    app.add_flag("-F,--fixed-strings",
                 opts.o_fixed_strings,
                 "Treat the pattern as a literal string");
    app.add_flag(
        "-w,--word-regexp", opts.o_word_regexp, "Match whole words only");
    app.add_flag(
        "-x,--line-regexp", opts.o_line_regexp, "Match whole lines only");
    app.add_option("-A,--after", opts.o_after, "Lines to show after a match")
        ->type_name("N");
    app.add_option("-B,--before", opts.o_before, "Lines to show before a match")
        ->type_name("N");
    app.add_option("-C,--context",
                   opts.o_context,
                   "Lines to show before and after a match")
        ->type_name("N");
    app.add_option("--wrap", wrap_name, "Line wrap mode: none, wrap, truncate")
        ->type_name("MODE")
        ->check([](std::string name) -> std::string {
            if (!mat::parse_wrap_mode(name)) {
                return "expected one of none, wrap or truncate";
            }
            return std::string();
        });
    app.add_option("-W,--max-width",
                   opts.o_max_width,
                   "Maximum line width in truncate mode")
        ->type_name("N");
    app.add_option("-l,--language",
                   opts.o_language,
                   "The language to use for syntax highlighting")
        ->type_name("LANG");
    app.add_option("-t,--theme", opts.o_theme, "The color theme: light, dark")
        ->type_name("NAME");
    app.add_option(
           "-L,--lines", opts.o_lines, "Show a line range: X:Y, :Y, X: or X")
        ->type_name("RANGE");
    app.add_flag("-P,--no-pager", opts.o_no_pager, "Write to stdout directly");
    app.add_flag(
        "--ansi", opts.o_ansi, "Preserve ANSI escape sequences in the input");
    app.add_flag(
        "--force-binary", opts.o_force_binary, "Show binary files anyway");
    app.add_option(
           "-d", opts.o_debug_log, "Write debug messages to the given file.")
        ->type_name("FILE");
    app.set_version_flag("-V,--version");
    app.footer(fmt::format(FMT_STRING("Version: {}"), MAT_VERSION));

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        fmt::print(FMT_STRING("{}"), app.help());
        return EXIT_SUCCESS;
    } catch (const CLI::CallForVersion& e) {
        fmt::print(FMT_STRING("mat {}\n"), MAT_VERSION);
        return EXIT_SUCCESS;
    } catch (const CLI::ParseError& e) {
        fmt::print(stderr,
                   FMT_STRING("mat: invalid command-line arguments: {}\n"),
                   e.what());
        return 2;
    }

    opts.o_wrap = mat::parse_wrap_mode(wrap_name).value_or(
        mat::wrap_mode_t::none);

    if (!opts.o_debug_log.empty()) {
        mat_log_level = mat_log_level_t::TRACE;
        if (!log_open_file(opts.o_debug_log.c_str())) {
            fmt::print(stderr,
                       FMT_STRING("mat: unable to open debug log '{}': {}\n"),
                       opts.o_debug_log,
                       strerror(errno));
        }
    }

    log_install_handlers();
    log_argv(argc, argv);
    log_host_info();

    try {
        return mat::run(opts);
    } catch (const mat::error& e) {
        log_error("%s", e.get_message().c_str());
        fmt::print(stderr, FMT_STRING("mat: {}\n"), e.get_message());
        return e.exit_code();
    }
}
