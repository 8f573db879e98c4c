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
 * @file test_mat_cli.cc
 *
 * End-to-end tests that run the mat binary with -P and check what it writes
 * to stdout and stderr.
 */

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "base/auto_fd.hh"
#include "base/fs_util.hh"
#include "doctest/doctest.h"

#ifndef MAT_BINARY_PATH
#    define MAT_BINARY_PATH "mat"
#endif

namespace {

struct run_result {
    int rr_status{-1};
    std::string rr_stdout;
    std::string rr_stderr;

    bool out_has(const std::string& needle) const
    {
        return this->rr_stdout.find(needle) != std::string::npos;
    }

    bool err_has(const std::string& needle) const
    {
        return this->rr_stderr.find(needle) != std::string::npos;
    }
};

class temp_dir {
public:
    temp_dir()
        : td_path(std::filesystem::temp_directory_path()
                  / ("mat-cli-test-" + std::to_string(getpid())))
    {
        std::filesystem::create_directories(this->td_path);
    }

    ~temp_dir() { std::filesystem::remove_all(this->td_path); }

    std::filesystem::path write(const std::string& name,
                                const std::string& content) const
    {
        auto retval = this->td_path / name;
        std::ofstream out(retval, std::ios::binary);

        out << content;
        return retval;
    }

private:
    std::filesystem::path td_path;
};

/**
 * Run the binary with the given arguments.  The stdin of the child is the
 * given file or /dev/null.
 */
run_result
run_mat(const std::vector<std::string>& args,
        const std::string& stdin_path = "/dev/null")
{
    auto out_path = std::filesystem::temp_directory_path()
        / ("mat-cli-out-" + std::to_string(getpid()));
    auto err_path = std::filesystem::temp_directory_path()
        / ("mat-cli-err-" + std::to_string(getpid()));
    run_result retval;

    auto pid = fork();
    REQUIRE(pid != -1);
    if (pid == 0) {
        auto_fd in_fd(open(stdin_path.c_str(), O_RDONLY));
        auto_fd out_fd(open(out_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600));
        auto_fd err_fd(open(err_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600));

        if (in_fd == -1 || out_fd == -1 || err_fd == -1) {
            _exit(127);
        }
        in_fd.copy_to(STDIN_FILENO);
        out_fd.copy_to(STDOUT_FILENO);
        err_fd.copy_to(STDERR_FILENO);

        std::vector<char*> argv;
        argv.emplace_back(const_cast<char*>(MAT_BINARY_PATH));
        for (const auto& arg : args) {
            argv.emplace_back(const_cast<char*>(arg.c_str()));
        }
        argv.emplace_back(nullptr);

        execv(MAT_BINARY_PATH, argv.data());
        _exit(127);
    }

    int status = 0;
    REQUIRE(waitpid(pid, &status, 0) == pid);
    REQUIRE(WIFEXITED(status));
    retval.rr_status = WEXITSTATUS(status);
    retval.rr_stdout = mat::filesystem::read_file(out_path);
    retval.rr_stderr = mat::filesystem::read_file(err_path);
    std::filesystem::remove(out_path);
    std::filesystem::remove(err_path);

    return retval;
}

}  // namespace

TEST_CASE("line range")
{
    temp_dir td;
    std::string content;

    for (int lpc = 1; lpc <= 10; lpc++) {
        content += "Line " + std::to_string(lpc) + "\n";
    }
    auto path = td.write("lines.txt", content);

    auto res = run_mat({"-P", "-L", "3:5", path.string()});
    CHECK(res.rr_status == 0);
    CHECK(res.rr_stdout == "Line 3\nLine 4\nLine 5\n");
    CHECK_FALSE(res.out_has("Line 2"));
    CHECK_FALSE(res.out_has("Line 6"));

    res = run_mat({"-P", "-n", "-L", "9:", path.string()});
    CHECK(res.rr_status == 0);
    CHECK(res.rr_stdout == " 9 Line 9\n10 Line 10\n");

    res = run_mat({"-P", "-L", "abc", path.string()});
    CHECK(res.rr_status == 2);
    CHECK(res.err_has("mat: Invalid line range format: 'abc'"));

    res = run_mat({"-P", "-L", "5:3", path.string()});
    CHECK(res.rr_status == 2);
}

TEST_CASE("grep with word boundary")
{
    temp_dir td;
    auto path = td.write("words.txt", "test\ntesting\na test here\n");

    auto res = run_mat({"-P", "-g", "test", "-w", path.string()});
    CHECK(res.rr_status == 0);
    CHECK(res.rr_stdout == "test\na test here\n");
    CHECK_FALSE(res.out_has("testing"));

    res = run_mat({"-P", "-n", "-g", "TESTING", "-i", path.string()});
    CHECK(res.rr_stdout == "2 testing\n");
}

TEST_CASE("grep context")
{
    temp_dir td;
    auto path
        = td.write("ctx.txt", "a\nb\nMATCH1\nc\nd\ne\nMATCH2\nf\n");

    auto res = run_mat({"-P", "-g", "MATCH", "-B", "1", "-A", "1", path.string()});
    CHECK(res.rr_status == 0);
    CHECK(res.rr_stdout == "b\nMATCH1\nc\n--\ne\nMATCH2\nf\n");
    CHECK_FALSE(res.out_has("d\n"));

    res = run_mat({"-P", "-g", "MATCH", "-C", "2", path.string()});
    CHECK(res.rr_stdout == "a\nb\nMATCH1\nc\nd\ne\nMATCH2\nf\n");
}

TEST_CASE("binary files")
{
    temp_dir td;
    auto path = td.write("data.bin", std::string("Hello\0World", 11));

    auto res = run_mat({"-P", path.string()});
    CHECK(res.rr_status == 1);
    CHECK(res.err_has("Binary file detected"));
    CHECK(res.rr_stdout.empty());

    res = run_mat({"-P", "--force-binary", path.string()});
    CHECK(res.rr_status == 0);
    CHECK(res.out_has("Hello"));
}

TEST_CASE("invalid patterns")
{
    temp_dir td;
    auto path = td.write("file.txt", "text\n");

    auto res = run_mat({"-P", "-g", "[invalid", path.string()});
    CHECK(res.rr_status == 2);
    CHECK(res.err_has("Invalid regex pattern '[invalid'"));

    res = run_mat({"-P", "-F", "-g", "[invalid", path.string()});
    CHECK(res.rr_status == 0);
    CHECK(res.rr_stdout.empty());

    res = run_mat({"-P", "-s", "", path.string()});
    CHECK(res.rr_status == 1);
    CHECK(res.err_has("Empty pattern"));
}

TEST_CASE("missing files")
{
    auto res = run_mat({"-P", "/nonexistent/mat-cli-test.txt"});
    CHECK(res.rr_status == 1);
    CHECK(res.err_has("mat: I/O error for '/nonexistent/mat-cli-test.txt'"));
}

TEST_CASE("stdin")
{
    temp_dir td;
    auto path = td.write("input.txt", "x\ty\nsecond\n");

    auto res = run_mat({"-P"}, path.string());
    CHECK(res.rr_status == 0);
    CHECK(res.rr_stdout == "x   y\nsecond\n");

    res = run_mat({"-P", "-n", "-"}, path.string());
    CHECK(res.rr_stdout == "1 x   y\n2 second\n");
}

TEST_CASE("markdown")
{
    temp_dir td;
    auto path = td.write("doc.md", "# Title\n\n- item\n");

    auto res = run_mat({"-P", path.string()});
    CHECK(res.rr_status == 0);
    CHECK(res.out_has("\xe2\x95\x91  Title"));
    CHECK(res.out_has("\xe2\x80\xa2 item"));

    res = run_mat({"-P", "-M", path.string()});
    CHECK(res.rr_stdout == "# Title\n\n- item\n");
}

TEST_CASE("no ANSI in plain output")
{
    temp_dir td;
    auto path = td.write("main.rs", "fn main() { let x = 1; }\n");

    auto res = run_mat({"-P", "-s", "x", path.string()});
    CHECK(res.rr_status == 0);
    CHECK(res.rr_stdout == "fn main() { let x = 1; }\n");
    CHECK(res.rr_stdout.find('\x1b') == std::string::npos);
}

TEST_CASE("help and version")
{
    auto res = run_mat({"--help"});
    CHECK(res.rr_status == 0);
    CHECK(res.out_has("--line-numbers"));
    CHECK(res.out_has("--force-binary"));

    res = run_mat({"-V"});
    CHECK(res.rr_status == 0);
    CHECK(res.rr_stdout.find("mat ") == 0);

    res = run_mat({"--wrap", "sideways", "/dev/null"});
    CHECK(res.rr_status == 2);
    CHECK(res.err_has("mat: invalid command-line arguments"));
}
