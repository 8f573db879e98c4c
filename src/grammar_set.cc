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
 * @file grammar_set.cc
 */

#include <filesystem>
#include <initializer_list>

#include "grammar_set.hh"

#include "base/mat_log.hh"
#include "base/string_util.hh"

namespace mat {

static std::shared_ptr<pcre2pp::code>
xpcre_compile(const std::string& pattern, int options = 0)
{
    try {
        return pcre2pp::code::from(string_fragment::from_str(pattern), options)
            .to_shared();
    } catch (const pcre2pp::compile_error& ce) {
        log_error("failed to compile built-in pattern: %s -- %s",
                  pattern.c_str(),
                  ce.get_message().c_str());
        throw;
    }
}

static highlighter
rule(const std::string& pattern, role_t role, int options = 0)
{
    return highlighter(xpcre_compile(pattern, options)).with_role(role);
}

static highlighter
block(const std::string& begin, const std::string& end, role_t role)
{
    return highlighter(xpcre_compile(begin))
        .with_end(xpcre_compile(end))
        .with_role(role);
}

/** @return A regex that matches any of the given words. */
static std::string
words(std::initializer_list<const char*> list)
{
    std::string retval = R"(\b(?:)";
    bool first = true;

    for (const auto* word : list) {
        if (!first) {
            retval.push_back('|');
        }
        retval.append(word);
        first = false;
    }
    retval.append(R"()\b)");

    return retval;
}

static const char* const DQ_STRING = R"re("(?:\\.|[^"\\])*")re";
static const char* const SQ_STRING = R"re('(?:\\.|[^'\\])*')re";
static const char* const CHAR_LITERAL = R"re('(?:\\.|[^'\\])')re";
static const char* const DQ_STRING_END = R"re((?:\\.|[^"\\])*")re";
static const char* const NUMBER
    = R"re(\b(?:0[xX][0-9a-fA-F_]+|0[bB][01_]+|0[oO][0-7_]+|\d[\d_]*(?:\.\d[\d_]*)?(?:[eE][+-]?\d+)?)[a-zA-Z]*\b)re";
static const char* const FUNCTION = R"re(\b([A-Za-z_]\w*)\s*(?=\())re";
static const char* const CAPS_TYPE = R"re(\b[A-Z][a-z]\w*\b)re";
static const char* const HASH_COMMENT = R"re((?:^|(?<=\s))#.*)re";
static const char* const SLASH_COMMENT = R"re(//.*)re";

static highlighter
c_block_comment()
{
    return block(R"re(/\*)re", R"re(\*/)re", role_t::VCR_COMMENT);
}

static std::vector<highlighter>
c_like_rules(const std::string& keywords,
             const std::string& types,
             const std::string& constants)
{
    return {
        rule(SLASH_COMMENT, role_t::VCR_COMMENT),
        c_block_comment(),
        rule(DQ_STRING, role_t::VCR_STRING),
        rule(CHAR_LITERAL, role_t::VCR_STRING),
        rule(keywords, role_t::VCR_KEYWORD),
        rule(constants, role_t::VCR_CONSTANT),
        rule(types, role_t::VCR_TYPE),
        rule(NUMBER, role_t::VCR_NUMBER),
        rule(FUNCTION, role_t::VCR_FUNCTION),
    };
}

static std::vector<highlighter>
markup_rules()
{
    return {
        block(R"re(<!--)re", R"re(-->)re", role_t::VCR_COMMENT),
        block(R"re(<!\[CDATA\[)re", R"re(\]\]>)re", role_t::VCR_STRING),
        rule(R"re(<![A-Za-z][^>]*>|<\?.*?\?>)re", role_t::VCR_PREPROCESSOR),
        rule(R"re(</?([\w:.\-]+))re", role_t::VCR_TAG),
        rule(R"re(\b([\w:.\-]+)(?==))re", role_t::VCR_ATTRIBUTE),
        rule(DQ_STRING, role_t::VCR_STRING),
        rule(SQ_STRING, role_t::VCR_STRING),
        rule(R"re(&(?:\w+|#\d+|#x[0-9a-fA-F]+);)re", role_t::VCR_CONSTANT),
    };
}

static grammar
rust_grammar()
{
    return grammar{
        "Rust",
        {"rs"},
        {
            rule(SLASH_COMMENT, role_t::VCR_COMMENT),
            c_block_comment(),
            block(R"re((?:\bb)?")re", DQ_STRING_END, role_t::VCR_STRING),
            rule(R"re(b?'(?:\\.|[^'\\])')re", role_t::VCR_STRING),
            rule(R"re(#!?\[[^\]]*\])re", role_t::VCR_PREPROCESSOR),
            rule(words({"as",       "async",  "await", "break",  "const",
                        "continue", "crate",  "dyn",   "else",   "enum",
                        "extern",   "fn",     "for",   "if",     "impl",
                        "in",       "let",    "loop",  "match",  "mod",
                        "move",     "mut",    "pub",   "ref",    "return",
                        "static",   "struct", "super", "trait",  "type",
                        "unsafe",   "use",    "where", "while",  "yield"}),
                 role_t::VCR_KEYWORD),
            rule(words({"true", "false", "self", "Self", "None", "Some", "Ok",
                        "Err"}),
                 role_t::VCR_CONSTANT),
            rule(words({"i8",    "i16",   "i32",   "i64",  "i128", "isize",
                        "u8",    "u16",   "u32",   "u64",  "u128", "usize",
                        "f32",   "f64",   "bool",  "char", "str"}),
                 role_t::VCR_TYPE),
            rule(CAPS_TYPE, role_t::VCR_TYPE),
            rule(R"re('\w+\b)re", role_t::VCR_SYMBOL),
            rule(NUMBER, role_t::VCR_NUMBER),
            rule(R"re(\b(\w+!)(?=\s*[(\[{]))re", role_t::VCR_FUNCTION),
            rule(FUNCTION, role_t::VCR_FUNCTION),
        },
    };
}

static grammar
python_grammar()
{
    return grammar{
        "Python",
        {"py", "pyw", "pyi"},
        {
            rule(R"re(#.*)re", role_t::VCR_COMMENT),
            block(R"re((?:\b[rRbBuUfF]{1,2})?""")re",
                  R"re(""")re",
                  role_t::VCR_STRING),
            block(R"re((?:\b[rRbBuUfF]{1,2})?''')re",
                  R"re(''')re",
                  role_t::VCR_STRING),
            rule(R"re((?:\b[rRbBuUfF]{1,2})?"(?:\\.|[^"\\])*")re",
                 role_t::VCR_STRING),
            rule(R"re((?:\b[rRbBuUfF]{1,2})?'(?:\\.|[^'\\])*')re",
                 role_t::VCR_STRING),
            rule(R"re(^\s*(@[\w.]+))re", role_t::VCR_PREPROCESSOR),
            rule(words({"and",    "as",       "assert", "async", "await",
                        "break",  "class",    "continue", "def", "del",
                        "elif",   "else",     "except", "finally", "for",
                        "from",   "global",   "if",     "import", "in",
                        "is",     "lambda",   "nonlocal", "not", "or",
                        "pass",   "raise",    "return", "try",   "while",
                        "with",   "yield",    "match",  "case"}),
                 role_t::VCR_KEYWORD),
            rule(words({"True", "False", "None"}), role_t::VCR_CONSTANT),
            rule(words({"self", "cls"}), role_t::VCR_VARIABLE),
            rule(words({"int", "str", "float", "bool", "bytes", "list",
                        "dict", "set", "tuple", "object", "type"}),
                 role_t::VCR_TYPE),
            rule(NUMBER, role_t::VCR_NUMBER),
            rule(FUNCTION, role_t::VCR_FUNCTION),
        },
    };
}

static std::vector<highlighter>
javascript_rules(bool typescript)
{
    std::vector<highlighter> retval = {
        rule(SLASH_COMMENT, role_t::VCR_COMMENT),
        c_block_comment(),
        block("`", R"re((?:\\.|[^`\\])*`)re", role_t::VCR_STRING),
        rule(DQ_STRING, role_t::VCR_STRING),
        rule(SQ_STRING, role_t::VCR_STRING),
        rule(words({"async",   "await",  "break",    "case",   "catch",
                    "class",   "const",  "continue", "debugger", "default",
                    "delete",  "do",     "else",     "export", "extends",
                    "finally", "for",    "from",     "function", "if",
                    "import",  "in",     "instanceof", "let",  "new",
                    "of",      "return", "static",   "super",  "switch",
                    "this",    "throw",  "try",      "typeof", "var",
                    "void",    "while",  "with",     "yield"}),
             role_t::VCR_KEYWORD),
        rule(words({"true", "false", "null", "undefined", "NaN", "Infinity"}),
             role_t::VCR_CONSTANT),
    };

    if (typescript) {
        retval.emplace_back(rule(words({"interface", "type", "enum",
                                        "implements", "namespace", "declare",
                                        "abstract", "private", "protected",
                                        "public", "readonly", "keyof",
                                        "as", "is"}),
                                 role_t::VCR_KEYWORD));
        retval.emplace_back(rule(words({"string", "number", "boolean", "any",
                                        "unknown", "never", "void", "object",
                                        "bigint", "symbol"}),
                                 role_t::VCR_TYPE));
        retval.emplace_back(rule(R"re(@\w+)re", role_t::VCR_PREPROCESSOR));
    }
    retval.emplace_back(rule(CAPS_TYPE, role_t::VCR_TYPE));
    retval.emplace_back(rule(NUMBER, role_t::VCR_NUMBER));
    retval.emplace_back(rule(FUNCTION, role_t::VCR_FUNCTION));

    return retval;
}

static const char* const C_KEYWORDS[] = {
    "auto",   "break",   "case",    "const",  "continue", "default",
    "do",     "else",    "enum",    "extern", "for",      "goto",
    "if",     "inline",  "register", "restrict", "return", "sizeof",
    "static", "struct",  "switch",  "typedef", "union",   "volatile",
    "while",
};

static std::string
c_keywords(std::initializer_list<const char*> extra)
{
    std::string retval = R"(\b(?:)";

    for (const auto* word : C_KEYWORDS) {
        retval.append(word).push_back('|');
    }
    for (const auto* word : extra) {
        retval.append(word).push_back('|');
    }
    retval.pop_back();
    retval.append(R"()\b)");

    return retval;
}

static grammar
c_grammar()
{
    auto rules = c_like_rules(
        c_keywords({}),
        R"re(\b(?:void|char|short|int|long|float|double|signed|unsigned|_Bool|bool|\w+_t)\b)re",
        words({"NULL", "true", "false", "EOF", "stdin", "stdout", "stderr"}));

    rules.insert(rules.begin() + 2,
                 rule(R"re(^\s*#\s*\w+)re", role_t::VCR_PREPROCESSOR));
    return grammar{"C", {"c", "h"}, std::move(rules)};
}

static grammar
cpp_grammar()
{
    auto rules = c_like_rules(
        c_keywords({"alignas",    "alignof",   "catch",    "class",
                    "concept",    "constexpr", "consteval", "constinit",
                    "co_await",   "co_return", "co_yield", "decltype",
                    "delete",     "explicit",  "export",   "final",
                    "friend",     "mutable",   "namespace", "new",
                    "noexcept",   "operator",  "override", "private",
                    "protected",  "public",    "requires", "static_assert",
                    "template",   "this",      "throw",    "try",
                    "typename",   "using",     "virtual"}),
        R"re(\b(?:void|char|char8_t|char16_t|char32_t|wchar_t|short|int|long|float|double|signed|unsigned|bool|\w+_t|std::\w+)\b)re",
        words({"nullptr", "NULL", "true", "false"}));

    rules.insert(rules.begin() + 2,
                 rule(R"re(^\s*#\s*\w+)re", role_t::VCR_PREPROCESSOR));
    rules.insert(rules.begin() + 3,
                 block(R"re(\bR"([^(\s]{0,16})\()re",
                       R"re(\)[^"\s]{0,16}")re",
                       role_t::VCR_STRING));
    return grammar{
        "C++",
        {"cpp", "cc", "cxx", "c++", "hpp", "hh", "hxx", "h++", "ipp"},
        std::move(rules),
    };
}

static grammar
go_grammar()
{
    return grammar{
        "Go",
        {"go"},
        {
            rule(SLASH_COMMENT, role_t::VCR_COMMENT),
            c_block_comment(),
            block("`", "`", role_t::VCR_STRING),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(CHAR_LITERAL, role_t::VCR_STRING),
            rule(words({"break",   "case",   "chan",   "const",  "continue",
                        "default", "defer",  "else",   "fallthrough",
                        "for",     "func",   "go",     "goto",   "if",
                        "import",  "interface", "map", "package", "range",
                        "return",  "select", "struct", "switch", "type",
                        "var"}),
                 role_t::VCR_KEYWORD),
            rule(words({"true", "false", "nil", "iota"}), role_t::VCR_CONSTANT),
            rule(words({"bool",    "byte",    "complex64", "complex128",
                        "error",   "float32", "float64",   "int",
                        "int8",    "int16",   "int32",     "int64",
                        "rune",    "string",  "uint",      "uint8",
                        "uint16",  "uint32",  "uint64",    "uintptr",
                        "any"}),
                 role_t::VCR_TYPE),
            rule(NUMBER, role_t::VCR_NUMBER),
            rule(FUNCTION, role_t::VCR_FUNCTION),
        },
    };
}

static std::vector<highlighter>
jvm_rules(const std::string& keywords, const std::string& constants)
{
    return {
        rule(SLASH_COMMENT, role_t::VCR_COMMENT),
        c_block_comment(),
        block(R"re(""")re", R"re(""")re", role_t::VCR_STRING),
        rule(DQ_STRING, role_t::VCR_STRING),
        rule(CHAR_LITERAL, role_t::VCR_STRING),
        rule(R"re(@\w+)re", role_t::VCR_PREPROCESSOR),
        rule(keywords, role_t::VCR_KEYWORD),
        rule(constants, role_t::VCR_CONSTANT),
        rule(words({"boolean", "byte", "char", "short", "int", "long",
                    "float", "double", "void"}),
             role_t::VCR_TYPE),
        rule(CAPS_TYPE, role_t::VCR_TYPE),
        rule(NUMBER, role_t::VCR_NUMBER),
        rule(FUNCTION, role_t::VCR_FUNCTION),
    };
}

static grammar
java_grammar()
{
    return grammar{
        "Java",
        {"java"},
        jvm_rules(
            words({"abstract",   "assert",     "break",   "case",
                   "catch",      "class",      "const",   "continue",
                   "default",    "do",         "else",    "enum",
                   "extends",    "final",      "finally", "for",
                   "goto",       "if",         "implements", "import",
                   "instanceof", "interface",  "native",  "new",
                   "package",    "private",    "protected", "public",
                   "record",     "return",     "static",  "strictfp",
                   "super",      "switch",     "synchronized", "this",
                   "throw",      "throws",     "transient", "try",
                   "var",        "volatile",   "while",   "yield"}),
            words({"true", "false", "null"})),
    };
}

static grammar
kotlin_grammar()
{
    return grammar{
        "Kotlin",
        {"kt", "kts"},
        jvm_rules(words({"as",       "break",   "class",    "continue",
                         "do",       "else",    "for",      "fun",
                         "if",       "in",      "interface", "is",
                         "object",   "package", "return",   "super",
                         "this",     "throw",   "try",      "typealias",
                         "val",      "var",     "when",     "while",
                         "by",       "companion", "data",   "enum",
                         "import",   "init",    "internal", "open",
                         "override", "private", "protected", "public",
                         "sealed",   "suspend", "lateinit", "inline"}),
                  words({"true", "false", "null"})),
    };
}

static grammar
scala_grammar()
{
    return grammar{
        "Scala",
        {"scala", "sc"},
        jvm_rules(words({"abstract", "case",     "catch",   "class",
                         "def",      "do",       "else",    "extends",
                         "final",    "finally",  "for",     "forSome",
                         "given",    "if",       "implicit", "import",
                         "lazy",     "match",    "new",     "object",
                         "override", "package",  "private", "protected",
                         "return",   "sealed",   "super",   "this",
                         "throw",    "trait",    "try",     "type",
                         "val",      "var",      "while",   "with",
                         "yield",    "then",     "enum",    "using"}),
                  words({"true", "false", "null"})),
    };
}

static grammar
csharp_grammar()
{
    auto rules = jvm_rules(
        words({"abstract", "as",        "base",     "break",    "case",
               "catch",    "checked",   "class",    "const",    "continue",
               "default",  "delegate",  "do",       "else",     "enum",
               "event",    "explicit",  "extern",   "finally",  "fixed",
               "for",      "foreach",   "goto",     "if",       "implicit",
               "in",       "interface", "internal", "is",       "lock",
               "namespace", "new",      "operator", "out",      "override",
               "params",   "private",   "protected", "public",  "readonly",
               "ref",      "return",    "sealed",   "sizeof",   "stackalloc",
               "static",   "struct",    "switch",   "this",     "throw",
               "try",      "typeof",    "unchecked", "unsafe",  "using",
               "virtual",  "volatile",  "while",    "async",    "await",
               "var",      "get",       "set",      "record"}),
        words({"true", "false", "null"}));

    rules.insert(rules.begin() + 2,
                 rule(R"re(^\s*#\s*\w+)re", role_t::VCR_PREPROCESSOR));
    rules.insert(rules.begin() + 3,
                 rule(R"re(@"(?:""|[^"])*")re", role_t::VCR_STRING));
    rules.emplace(rules.begin() + 4,
                  rule(words({"string", "object", "decimal", "uint", "ulong",
                              "ushort", "sbyte", "dynamic"}),
                       role_t::VCR_TYPE));
    return grammar{"C#", {"cs", "csx"}, std::move(rules)};
}

static grammar
swift_grammar()
{
    return grammar{
        "Swift",
        {"swift"},
        jvm_rules(words({"associatedtype", "break",    "case",
                         "catch",          "class",    "continue",
                         "default",        "defer",    "deinit",
                         "do",             "else",     "enum",
                         "extension",      "fallthrough", "fileprivate",
                         "for",            "func",     "guard",
                         "if",             "import",   "in",
                         "init",           "inout",    "internal",
                         "is",             "let",      "open",
                         "operator",       "private",  "protocol",
                         "public",         "repeat",   "rethrows",
                         "return",         "self",     "static",
                         "struct",         "subscript", "super",
                         "switch",         "throw",    "throws",
                         "try",            "typealias", "var",
                         "where",          "while",    "async",
                         "await"}),
                  words({"true", "false", "nil"})),
    };
}

static grammar
ruby_grammar()
{
    return grammar{
        "Ruby",
        {"rb", "rake", "gemspec", "ru"},
        {
            block(R"re(^=begin\b)re", R"re(^=end\b.*)re", role_t::VCR_COMMENT),
            rule(HASH_COMMENT, role_t::VCR_COMMENT),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(SQ_STRING, role_t::VCR_STRING),
            rule(R"re((?<![:\w]):\w+[?!]?)re", role_t::VCR_SYMBOL),
            rule(R"re(@@?\w+|\$\w+)re", role_t::VCR_VARIABLE),
            rule(words({"alias",  "and",    "begin",  "break",  "case",
                        "class",  "def",    "defined?", "do",   "else",
                        "elsif",  "end",    "ensure", "for",    "if",
                        "in",     "module", "next",   "not",    "or",
                        "redo",   "rescue", "retry",  "return", "self",
                        "super",  "then",   "undef",  "unless", "until",
                        "when",   "while",  "yield",  "require",
                        "attr_accessor", "attr_reader", "attr_writer"}),
                 role_t::VCR_KEYWORD),
            rule(words({"true", "false", "nil"}), role_t::VCR_CONSTANT),
            rule(CAPS_TYPE, role_t::VCR_TYPE),
            rule(NUMBER, role_t::VCR_NUMBER),
            rule(FUNCTION, role_t::VCR_FUNCTION),
        },
    };
}

static grammar
shell_grammar()
{
    return grammar{
        "Bash",
        {"sh", "bash", "zsh", "ksh"},
        {
            rule(R"re((?:^|(?<=[\s;]))#.*)re", role_t::VCR_COMMENT),
            block(R"re(")re", DQ_STRING_END, role_t::VCR_STRING),
            block(R"re(')re", R"re([^']*')re", role_t::VCR_STRING),
            rule(R"re(\$\{[^}]*\}|\$\w+|\$[#@*?$!0-9])re",
                 role_t::VCR_VARIABLE),
            rule(words({"if",     "then",   "else",   "elif",   "fi",
                        "for",    "in",     "do",     "done",   "case",
                        "esac",   "while",  "until",  "function", "return",
                        "local",  "export", "readonly", "declare", "select",
                        "break",  "continue", "exit", "shift",  "source",
                        "trap",   "set",    "unset"}),
                 role_t::VCR_KEYWORD),
            rule(words({"echo", "printf", "cd", "test", "read", "eval",
                        "exec", "alias", "true", "false"}),
                 role_t::VCR_FUNCTION),
            rule(R"re(\b([\w\-]+)(?=\(\)))re", role_t::VCR_FUNCTION),
            rule(R"re((?<=\s)--?[\w\-]+)re", role_t::VCR_ATTRIBUTE),
            rule(NUMBER, role_t::VCR_NUMBER),
        },
    };
}

static grammar
powershell_grammar()
{
    return grammar{
        "PowerShell",
        {"ps1", "psm1", "psd1"},
        {
            block(R"re(<#)re", R"re(#>)re", role_t::VCR_COMMENT),
            rule(R"re(#.*)re", role_t::VCR_COMMENT),
            block(R"re(")re", R"re((?:`.|[^"`])*")re", role_t::VCR_STRING),
            rule(R"re('(?:''|[^'])*')re", role_t::VCR_STRING),
            rule(R"re(\$[\w:]+)re", role_t::VCR_VARIABLE),
            rule(R"re(\b[A-Z][a-z]+-[A-Z]\w+\b)re", role_t::VCR_FUNCTION),
            rule(words({"begin",  "break",   "catch",  "class",  "continue",
                        "data",   "do",      "dynamicparam", "else",
                        "elseif", "end",     "exit",   "filter", "finally",
                        "for",    "foreach", "from",   "function", "if",
                        "in",     "param",   "process", "return", "switch",
                        "throw",  "trap",    "try",    "until",  "using",
                        "while"}),
                 role_t::VCR_KEYWORD,
                 PCRE2_CASELESS),
            rule(R"re(-(?:eq|ne|gt|ge|lt|le|like|notlike|match|notmatch|and|or|not)\b)re",
                 role_t::VCR_SYMBOL,
                 PCRE2_CASELESS),
            rule(NUMBER, role_t::VCR_NUMBER),
        },
    };
}

static grammar
json_grammar()
{
    return grammar{
        "JSON",
        {"json", "jsonc", "geojson"},
        {
            rule(SLASH_COMMENT, role_t::VCR_COMMENT),
            rule(R"re(("(?:\\.|[^"\\])*")\s*:)re", role_t::VCR_ATTRIBUTE),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(words({"true", "false", "null"}), role_t::VCR_CONSTANT),
            rule(R"re(-?\b\d+(?:\.\d+)?(?:[eE][+-]?\d+)?\b)re",
                 role_t::VCR_NUMBER),
        },
    };
}

static grammar
yaml_grammar()
{
    return grammar{
        "YAML",
        {"yaml", "yml"},
        {
            rule(HASH_COMMENT, role_t::VCR_COMMENT),
            rule(R"re(^(?:---|\.\.\.)\s*$)re", role_t::VCR_SYMBOL),
            rule(R"re(^\s*(?:- )?([^\s:#'"][^:#]*?)\s*:(?=\s|$))re",
                 role_t::VCR_ATTRIBUTE),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(SQ_STRING, role_t::VCR_STRING),
            rule(R"re([&*][\w\-]+)re", role_t::VCR_VARIABLE),
            rule(R"re(!!?\w+)re", role_t::VCR_TYPE),
            rule(words({"true", "false", "null", "yes", "no", "on", "off"}),
                 role_t::VCR_CONSTANT),
            rule(R"re((?<=\s)~(?=\s|$))re", role_t::VCR_CONSTANT),
            rule(NUMBER, role_t::VCR_NUMBER),
        },
    };
}

static grammar
toml_grammar()
{
    return grammar{
        "TOML",
        {"toml"},
        {
            rule(R"re(#.*)re", role_t::VCR_COMMENT),
            rule(R"re(^\s*\[\[?[^\]]+\]\]?)re", role_t::VCR_TAG),
            rule(R"re(^\s*([\w\-."]+)\s*=)re", role_t::VCR_ATTRIBUTE),
            block(R"re(""")re", R"re(""")re", role_t::VCR_STRING),
            block(R"re(''')re", R"re(''')re", role_t::VCR_STRING),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(R"re('[^']*')re", role_t::VCR_STRING),
            rule(words({"true", "false", "inf", "nan"}), role_t::VCR_CONSTANT),
            rule(R"re(\b\d{4}-\d{2}-\d{2}(?:[T ]\d{2}:\d{2}:\d{2}(?:\.\d+)?(?:Z|[+-]\d{2}:\d{2})?)?\b)re",
                 role_t::VCR_CONSTANT),
            rule(NUMBER, role_t::VCR_NUMBER),
        },
    };
}

static grammar
xml_grammar()
{
    return grammar{
        "XML",
        {"xml", "xsd", "xsl", "xslt", "svg", "plist", "rss", "atom"},
        markup_rules(),
    };
}

static grammar
html_grammar()
{
    return grammar{"HTML", {"html", "htm", "xhtml"}, markup_rules()};
}

static grammar
css_grammar()
{
    return grammar{
        "CSS",
        {"css", "scss", "less"},
        {
            c_block_comment(),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(SQ_STRING, role_t::VCR_STRING),
            rule(R"re(@[\w\-]+)re", role_t::VCR_KEYWORD),
            rule(R"re(#[0-9a-fA-F]{3,8}\b)re", role_t::VCR_CONSTANT),
            rule(R"re(([\w\-]+)\s*:(?=[^;{}]*;))re", role_t::VCR_ATTRIBUTE),
            rule(R"re([.#][A-Za-z_][\w\-]*)re", role_t::VCR_TAG),
            rule(R"re(!important\b)re", role_t::VCR_KEYWORD),
            rule(R"re(-?\b\d+(?:\.\d+)?(?:px|em|rem|ex|ch|vh|vw|vmin|vmax|pt|pc|cm|mm|in|deg|rad|turn|s|ms|fr|%)?)re",
                 role_t::VCR_NUMBER),
            rule(FUNCTION, role_t::VCR_FUNCTION),
        },
    };
}

static grammar
sql_grammar()
{
    return grammar{
        "SQL",
        {"sql", "ddl", "dml"},
        {
            rule(R"re(--.*)re", role_t::VCR_COMMENT),
            c_block_comment(),
            rule(R"re('(?:''|[^'])*')re", role_t::VCR_STRING),
            rule(R"re("(?:""|[^"])*")re", role_t::VCR_VARIABLE),
            rule(words({"select",   "from",    "where",   "and",     "or",
                        "not",      "insert",  "into",    "values",  "update",
                        "set",      "delete",  "create",  "table",   "drop",
                        "alter",    "add",     "column",  "index",   "view",
                        "join",     "inner",   "left",    "right",   "outer",
                        "full",     "cross",   "on",      "as",      "group",
                        "by",       "order",   "having",  "limit",   "offset",
                        "union",    "all",     "distinct", "case",   "when",
                        "then",     "else",    "end",     "in",      "is",
                        "like",     "between", "exists",  "primary", "key",
                        "foreign",  "references", "unique", "default",
                        "constraint", "begin", "commit",  "rollback",
                        "transaction", "with", "recursive", "asc",   "desc",
                        "if",       "replace", "trigger", "returning"}),
                 role_t::VCR_KEYWORD,
                 PCRE2_CASELESS),
            rule(words({"null", "true", "false"}),
                 role_t::VCR_CONSTANT,
                 PCRE2_CASELESS),
            rule(words({"int",     "integer", "bigint",  "smallint", "text",
                        "varchar", "char",    "boolean", "real",     "float",
                        "double",  "numeric", "decimal", "date",     "time",
                        "timestamp", "blob",  "json"}),
                 role_t::VCR_TYPE,
                 PCRE2_CASELESS),
            rule(NUMBER, role_t::VCR_NUMBER),
            rule(FUNCTION, role_t::VCR_FUNCTION),
        },
    };
}

static grammar
markdown_grammar()
{
    return grammar{
        "Markdown",
        {"md", "markdown", "mdown", "mkd", "mkdn"},
        {
            block(R"re(^\s*(?:```|~~~).*)re",
                  R"re(^\s*(?:```|~~~)\s*$)re",
                  role_t::VCR_STRING),
            rule(R"re(^#{1,6}\s.*)re", role_t::VCR_HEADING),
            rule(R"re(^\s*>.*)re", role_t::VCR_COMMENT),
            rule(R"re(^\s*(?:[-*_]\s*){3,}$)re", role_t::VCR_SYMBOL),
            rule(R"re(^\s*(?:[-*+]|\d+[.)])(?=\s))re", role_t::VCR_SYMBOL),
            rule(R"re(`[^`]+`)re", role_t::VCR_STRING),
            rule(R"re(\*\*[^*]+\*\*|__[^_]+__)re", role_t::VCR_STRONG),
            rule(R"re(\*[^*\s][^*]*\*|\b_[^_]+_\b)re", role_t::VCR_EMPHASIS),
            rule(R"re(!?\[[^\]]*\]\([^)]*\))re", role_t::VCR_LINK),
        },
    };
}

static grammar
php_grammar()
{
    auto rules = c_like_rules(
        words({"abstract", "and",       "as",        "break",     "case",
               "catch",    "class",     "clone",     "const",     "continue",
               "declare",  "default",   "do",        "echo",      "else",
               "elseif",   "empty",     "enddeclare", "endfor",   "endforeach",
               "endif",    "endswitch", "endwhile",  "extends",   "final",
               "finally",  "fn",        "for",       "foreach",   "function",
               "global",   "if",        "implements", "include",  "instanceof",
               "interface", "isset",    "list",      "match",     "namespace",
               "new",      "or",        "print",     "private",   "protected",
               "public",   "require",   "return",    "static",    "switch",
               "throw",    "trait",     "try",       "unset",     "use",
               "var",      "while",     "yield"}),
        words({"int", "float", "string", "bool", "array", "object", "mixed",
               "void", "callable", "iterable"}),
        words({"true", "false", "null", "TRUE", "FALSE", "NULL"}));

    rules.insert(rules.begin(),
                 rule(R"re(<\?(?:php|=)?|\?>)re", role_t::VCR_PREPROCESSOR));
    rules.insert(rules.begin() + 1, rule(HASH_COMMENT, role_t::VCR_COMMENT));
    rules.emplace_back(rule(R"re(\$\w+)re", role_t::VCR_VARIABLE));
    return grammar{"PHP", {"php", "phtml"}, std::move(rules)};
}

static grammar
r_grammar()
{
    return grammar{
        "R",
        {"r"},
        {
            rule(R"re(#.*)re", role_t::VCR_COMMENT),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(SQ_STRING, role_t::VCR_STRING),
            rule(words({"function", "if",   "else",   "for",  "while",
                        "repeat",   "break", "next",  "return", "in",
                        "library",  "require"}),
                 role_t::VCR_KEYWORD),
            rule(words({"TRUE", "FALSE", "NULL", "NA", "Inf", "NaN",
                        "NA_integer_", "NA_real_", "NA_character_"}),
                 role_t::VCR_CONSTANT),
            rule(R"re(<<?-|->>?)re", role_t::VCR_SYMBOL),
            rule(NUMBER, role_t::VCR_NUMBER),
            rule(R"re(\b([A-Za-z_.][\w.]*)\s*(?=\())re", role_t::VCR_FUNCTION),
        },
    };
}

static grammar
lua_grammar()
{
    return grammar{
        "Lua",
        {"lua"},
        {
            block(R"re(--\[(=*)\[)re", R"re(\]=*\])re", role_t::VCR_COMMENT),
            rule(R"re(--.*)re", role_t::VCR_COMMENT),
            block(R"re(\[(=*)\[)re", R"re(\]=*\])re", role_t::VCR_STRING),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(SQ_STRING, role_t::VCR_STRING),
            rule(words({"and",   "break", "do",     "else",  "elseif",
                        "end",   "for",   "function", "goto", "if",
                        "in",    "local", "not",    "or",    "repeat",
                        "return", "then", "until",  "while"}),
                 role_t::VCR_KEYWORD),
            rule(words({"nil", "true", "false", "self"}), role_t::VCR_CONSTANT),
            rule(NUMBER, role_t::VCR_NUMBER),
            rule(FUNCTION, role_t::VCR_FUNCTION),
        },
    };
}

static grammar
perl_grammar()
{
    return grammar{
        "Perl",
        {"pl", "pm", "t"},
        {
            block(R"re(^=\w+)re", R"re(^=cut\b.*)re", role_t::VCR_COMMENT),
            rule(R"re((?<![$\\])#.*)re", role_t::VCR_COMMENT),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(SQ_STRING, role_t::VCR_STRING),
            rule(R"re([$@%]\{?\w+\}?)re", role_t::VCR_VARIABLE),
            rule(words({"my",      "our",    "local",  "sub",    "if",
                        "elsif",   "else",   "unless", "while",  "until",
                        "for",     "foreach", "do",    "last",   "next",
                        "redo",    "return", "package", "use",   "require",
                        "no",      "BEGIN",  "END",    "and",    "or",
                        "not",     "eq",     "ne",     "lt",     "gt",
                        "le",      "ge",     "cmp"}),
                 role_t::VCR_KEYWORD),
            rule(words({"undef", "__PACKAGE__", "__FILE__", "__LINE__"}),
                 role_t::VCR_CONSTANT),
            rule(NUMBER, role_t::VCR_NUMBER),
            rule(FUNCTION, role_t::VCR_FUNCTION),
        },
    };
}

static std::vector<highlighter>
ml_family_rules(const std::string& keywords)
{
    return {
        block(R"re(\{-)re", R"re(-\})re", role_t::VCR_COMMENT),
        rule(R"re(--.*)re", role_t::VCR_COMMENT),
        rule(DQ_STRING, role_t::VCR_STRING),
        rule(CHAR_LITERAL, role_t::VCR_STRING),
        rule(keywords, role_t::VCR_KEYWORD),
        rule(words({"True", "False", "Nothing", "Just"}), role_t::VCR_CONSTANT),
        rule(R"re(\b[A-Z][\w']*\b)re", role_t::VCR_TYPE),
        rule(R"re(->|<-|=>|::|\|>|<\|)re", role_t::VCR_SYMBOL),
        rule(NUMBER, role_t::VCR_NUMBER),
    };
}

static grammar
haskell_grammar()
{
    return grammar{
        "Haskell",
        {"hs", "lhs"},
        ml_family_rules(words({"case",    "class",   "data",     "default",
                               "deriving", "do",     "else",     "forall",
                               "if",      "import",  "in",       "infix",
                               "infixl",  "infixr",  "instance", "let",
                               "module",  "newtype", "of",       "qualified",
                               "then",    "type",    "where",    "as",
                               "hiding"})),
    };
}

static grammar
elm_grammar()
{
    return grammar{
        "Elm",
        {"elm"},
        ml_family_rules(words({"case",   "of",     "if",       "then",
                               "else",   "let",    "in",       "type",
                               "alias",  "module", "exposing", "import",
                               "as",     "port"})),
    };
}

static grammar
fsharp_grammar()
{
    return grammar{
        "F#",
        {"fs", "fsx", "fsi"},
        {
            block(R"re(\(\*)re", R"re(\*\))re", role_t::VCR_COMMENT),
            rule(SLASH_COMMENT, role_t::VCR_COMMENT),
            block(R"re(""")re", R"re(""")re", role_t::VCR_STRING),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(CHAR_LITERAL, role_t::VCR_STRING),
            rule(R"re(\[<[^>]*>\])re", role_t::VCR_PREPROCESSOR),
            rule(words({"abstract", "and",      "as",       "assert",
                        "base",     "begin",    "class",    "default",
                        "do",       "done",     "downcast", "downto",
                        "elif",     "else",     "end",      "exception",
                        "extern",   "finally",  "for",      "fun",
                        "function", "if",       "in",       "inherit",
                        "inline",   "interface", "internal", "lazy",
                        "let",      "match",    "member",   "module",
                        "mutable",  "namespace", "new",     "of",
                        "open",     "or",       "override", "private",
                        "public",   "rec",      "return",   "static",
                        "struct",   "then",     "to",       "try",
                        "type",     "upcast",   "use",      "val",
                        "when",     "while",    "with",     "yield"}),
                 role_t::VCR_KEYWORD),
            rule(words({"true", "false", "null", "None", "Some"}),
                 role_t::VCR_CONSTANT),
            rule(CAPS_TYPE, role_t::VCR_TYPE),
            rule(R"re(->|<-|\|>|<\||>>|<<)re", role_t::VCR_SYMBOL),
            rule(NUMBER, role_t::VCR_NUMBER),
        },
    };
}

static grammar
erlang_grammar()
{
    return grammar{
        "Erlang",
        {"erl", "hrl"},
        {
            rule(R"re(%.*)re", role_t::VCR_COMMENT),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(R"re(^-\w+)re", role_t::VCR_PREPROCESSOR),
            rule(words({"after",   "and",     "andalso", "band",  "begin",
                        "bnot",    "bor",     "bsl",     "bsr",   "bxor",
                        "case",    "catch",   "cond",    "div",   "end",
                        "fun",     "if",      "let",     "not",   "of",
                        "or",      "orelse",  "receive", "rem",   "try",
                        "when",    "xor"}),
                 role_t::VCR_KEYWORD),
            rule(words({"true", "false", "undefined", "ok", "error"}),
                 role_t::VCR_CONSTANT),
            rule(R"re(\b[A-Z_]\w*\b)re", role_t::VCR_VARIABLE),
            rule(R"re(\?\w+)re", role_t::VCR_PREPROCESSOR),
            rule(R"re(->|<-|=>|::|\|\|)re", role_t::VCR_SYMBOL),
            rule(NUMBER, role_t::VCR_NUMBER),
            rule(FUNCTION, role_t::VCR_FUNCTION),
        },
    };
}

static grammar
elixir_grammar()
{
    return grammar{
        "Elixir",
        {"ex", "exs"},
        {
            block(R"re(""")re", R"re(""")re", role_t::VCR_STRING),
            rule(HASH_COMMENT, role_t::VCR_COMMENT),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(SQ_STRING, role_t::VCR_STRING),
            rule(R"re(@\w+)re", role_t::VCR_PREPROCESSOR),
            rule(R"re((?<![:\w]):\w+[?!]?|\b\w+:(?=\s))re", role_t::VCR_SYMBOL),
            rule(words({"after",    "alias",   "and",      "case",
                        "catch",    "cond",    "def",      "defp",
                        "defmacro", "defmodule", "defstruct", "defprotocol",
                        "defimpl",  "do",      "else",     "end",
                        "fn",       "for",     "if",       "import",
                        "in",       "not",     "or",       "quote",
                        "raise",    "receive", "require",  "rescue",
                        "try",      "unless",  "unquote",  "use",
                        "when",     "with"}),
                 role_t::VCR_KEYWORD),
            rule(words({"true", "false", "nil"}), role_t::VCR_CONSTANT),
            rule(CAPS_TYPE, role_t::VCR_TYPE),
            rule(R"re(\|>|->|<-|=>)re", role_t::VCR_SYMBOL),
            rule(NUMBER, role_t::VCR_NUMBER),
            rule(FUNCTION, role_t::VCR_FUNCTION),
        },
    };
}

static grammar
clojure_grammar()
{
    return grammar{
        "Clojure",
        {"clj", "cljs", "cljc", "edn"},
        {
            rule(R"re(;.*)re", role_t::VCR_COMMENT),
            block(R"re(")re", DQ_STRING_END, role_t::VCR_STRING),
            rule(R"re(\\(?:newline|space|tab|\S))re", role_t::VCR_STRING),
            rule(R"re((?<![\w\-]):[\w\-.*+!?/<>=]+)re", role_t::VCR_SYMBOL),
            rule(R"re((?<=\()(?:def\w*|let|letfn|fn|if|if-not|when|when-not|do|loop|recur|ns|require|import|try|catch|finally|throw|cond|case|and|or|quote|binding|doseq|dotimes|for)(?=[\s)]))re",
                 role_t::VCR_KEYWORD),
            rule(words({"nil", "true", "false"}), role_t::VCR_CONSTANT),
            rule(R"re(\^\w+|#\w*)re", role_t::VCR_PREPROCESSOR),
            rule(R"re((?<![\w\-])-?\d+(?:\.\d+)?(?:[MN]|/\d+)?\b)re",
                 role_t::VCR_NUMBER),
            rule(R"re((?<=\()[\w\-.*+!?/<>=]+)re", role_t::VCR_FUNCTION),
        },
    };
}

static grammar
visual_basic_grammar()
{
    return grammar{
        "Visual Basic",
        {"vb", "vbs", "bas"},
        {
            rule(R"re('.*|\bREM\b.*)re", role_t::VCR_COMMENT, PCRE2_CASELESS),
            rule(R"re("(?:""|[^"])*")re", role_t::VCR_STRING),
            rule(R"re(^\s*#\w+)re", role_t::VCR_PREPROCESSOR),
            rule(words({"addhandler", "and",      "andalso",  "as",
                        "byref",      "byval",    "call",     "case",
                        "catch",      "class",    "const",    "dim",
                        "do",         "each",     "else",     "elseif",
                        "end",        "enum",     "exit",     "for",
                        "friend",     "function", "get",      "handles",
                        "if",         "imports",  "in",       "inherits",
                        "interface",  "is",       "let",      "loop",
                        "me",         "module",   "mod",      "namespace",
                        "new",        "next",     "not",      "of",
                        "on",         "option",   "or",       "orelse",
                        "overrides",  "private",  "property", "protected",
                        "public",     "raiseevent", "redim",  "return",
                        "select",     "set",      "shared",   "static",
                        "step",       "structure", "sub",     "then",
                        "throw",      "to",       "try",      "until",
                        "using",      "wend",     "when",     "while",
                        "with"}),
                 role_t::VCR_KEYWORD,
                 PCRE2_CASELESS),
            rule(words({"true", "false", "nothing"}),
                 role_t::VCR_CONSTANT,
                 PCRE2_CASELESS),
            rule(words({"boolean", "byte", "char", "date", "decimal",
                        "double", "integer", "long", "object", "short",
                        "single", "string", "variant"}),
                 role_t::VCR_TYPE,
                 PCRE2_CASELESS),
            rule(NUMBER, role_t::VCR_NUMBER),
            rule(FUNCTION, role_t::VCR_FUNCTION),
        },
    };
}

static grammar
dockerfile_grammar()
{
    return grammar{
        "Dockerfile",
        {"dockerfile", "containerfile"},
        {
            rule(R"re(^\s*#.*)re", role_t::VCR_COMMENT),
            rule(R"re(^\s*(?:FROM|RUN|CMD|LABEL|MAINTAINER|EXPOSE|ENV|ADD|COPY|ENTRYPOINT|VOLUME|USER|WORKDIR|ARG|ONBUILD|STOPSIGNAL|HEALTHCHECK|SHELL)\b)re",
                 role_t::VCR_KEYWORD,
                 PCRE2_CASELESS),
            rule(R"re(\bAS\b)re", role_t::VCR_KEYWORD),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(SQ_STRING, role_t::VCR_STRING),
            rule(R"re(\$\{[^}]*\}|\$\w+)re", role_t::VCR_VARIABLE),
            rule(R"re((?<=\s)--[\w\-]+)re", role_t::VCR_ATTRIBUTE),
        },
    };
}

static grammar
makefile_grammar()
{
    return grammar{
        "Makefile",
        {"makefile", "mk", "mak", "gnumakefile"},
        {
            rule(R"re((?<!\\)#.*)re", role_t::VCR_COMMENT),
            rule(R"re(^\s*-?(?:include|sinclude|ifeq|ifneq|ifdef|ifndef|else|endif|define|endef|export|unexport|override|vpath)\b)re",
                 role_t::VCR_KEYWORD),
            rule(R"re(^\s*([\w.\-]+)\s*(?=[:+?!]?=))re", role_t::VCR_VARIABLE),
            rule(R"re(^([^\s:=#][^:=#]*?)\s*(?=::?(?!=)))re",
                 role_t::VCR_FUNCTION),
            rule(R"re(\$\([^)]*\)|\$\{[^}]*\}|\$[@<^+*?%])re",
                 role_t::VCR_VARIABLE),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(SQ_STRING, role_t::VCR_STRING),
        },
    };
}

static grammar
cmake_grammar()
{
    return grammar{
        "CMake",
        {"cmake"},
        {
            block(R"re(#\[(=*)\[)re", R"re(\]=*\])re", role_t::VCR_COMMENT),
            rule(R"re(#.*)re", role_t::VCR_COMMENT),
            block(R"re(")re", DQ_STRING_END, role_t::VCR_STRING),
            rule(R"re(\$\{[^}]*\}|\$ENV\{[^}]*\})re", role_t::VCR_VARIABLE),
            rule(words({"if",       "elseif",    "else",   "endif",
                        "foreach",  "endforeach", "while", "endwhile",
                        "function", "endfunction", "macro", "endmacro",
                        "return",   "break",     "continue"}),
                 role_t::VCR_KEYWORD,
                 PCRE2_CASELESS),
            rule(words({"ON", "OFF", "TRUE", "FALSE", "YES", "NO",
                        "PUBLIC", "PRIVATE", "INTERFACE", "REQUIRED",
                        "AND", "OR", "NOT", "STREQUAL", "EQUAL",
                        "DEFINED", "MATCHES", "VERSION_LESS"}),
                 role_t::VCR_CONSTANT),
            rule(NUMBER, role_t::VCR_NUMBER),
            rule(FUNCTION, role_t::VCR_FUNCTION),
        },
    };
}

static grammar
terraform_grammar()
{
    return grammar{
        "Terraform",
        {"tf", "tfvars", "hcl"},
        {
            rule(R"re(#.*|//.*)re", role_t::VCR_COMMENT),
            c_block_comment(),
            block(R"re(<<-?(\w+))re", R"re(^\s*\w+\s*$)re", role_t::VCR_STRING),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(R"re(^\s*(?:resource|data|variable|output|module|provider|locals|terraform|backend|moved|import)\b)re",
                 role_t::VCR_KEYWORD),
            rule(words({"for", "in", "if", "else", "endif", "endfor"}),
                 role_t::VCR_KEYWORD),
            rule(R"re(^\s*([\w\-]+)\s*(?==))re", role_t::VCR_ATTRIBUTE),
            rule(words({"true", "false", "null"}), role_t::VCR_CONSTANT),
            rule(words({"string", "number", "bool", "list", "map", "set",
                        "object", "tuple", "any"}),
                 role_t::VCR_TYPE),
            rule(NUMBER, role_t::VCR_NUMBER),
            rule(FUNCTION, role_t::VCR_FUNCTION),
        },
    };
}

static grammar
viml_grammar()
{
    return grammar{
        "VimL",
        {"vim", "vimrc"},
        {
            rule(R"re(^\s*".*)re", role_t::VCR_COMMENT),
            rule(SQ_STRING, role_t::VCR_STRING),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(R"re(\b[gslabwtv]:\w+|&\w+|@\w)re", role_t::VCR_VARIABLE),
            rule(words({"function", "endfunction", "let",    "unlet",
                        "if",       "elseif",      "else",   "endif",
                        "for",      "endfor",      "while",  "endwhile",
                        "try",      "catch",       "finally", "endtry",
                        "return",   "call",        "execute", "set",
                        "setlocal", "autocmd",     "augroup", "command",
                        "map",      "nmap",        "nnoremap", "inoremap",
                        "vnoremap", "noremap",     "syntax", "highlight",
                        "source",   "echo"}),
                 role_t::VCR_KEYWORD),
            rule(NUMBER, role_t::VCR_NUMBER),
            rule(FUNCTION, role_t::VCR_FUNCTION),
        },
    };
}

static grammar
diff_grammar()
{
    return grammar{
        "Diff",
        {"diff", "patch"},
        {
            rule(R"re(^(?:diff|index|new file|deleted file|similarity|rename) .*)re",
                 role_t::VCR_HEADING),
            rule(R"re(^(?:\+\+\+|---) .*)re", role_t::VCR_HEADING),
            rule(R"re(^@@ .*)re", role_t::VCR_DIFF_SECTION),
            rule(R"re(^\+.*)re", role_t::VCR_DIFF_ADD),
            rule(R"re(^-.*)re", role_t::VCR_DIFF_DELETE),
        },
    };
}

static grammar
ini_grammar()
{
    return grammar{
        "INI",
        {"ini", "cfg", "conf", "properties"},
        {
            rule(R"re(^\s*[;#].*)re", role_t::VCR_COMMENT),
            rule(R"re(^\s*\[[^\]]*\])re", role_t::VCR_TAG),
            rule(R"re(^\s*([^=:;#\s\[][^=:]*?)\s*(?=[=:]))re",
                 role_t::VCR_ATTRIBUTE),
            rule(DQ_STRING, role_t::VCR_STRING),
            rule(SQ_STRING, role_t::VCR_STRING),
            rule(words({"true", "false", "yes", "no", "on", "off"}),
                 role_t::VCR_CONSTANT,
                 PCRE2_CASELESS),
            rule(NUMBER, role_t::VCR_NUMBER),
        },
    };
}

static grammar
csv_grammar()
{
    return grammar{
        "CSV",
        {"csv", "tsv"},
        {
            rule(R"re("(?:""|[^"])*")re", role_t::VCR_STRING),
            rule(R"re((?<=^|,|\t)-?\d+(?:\.\d+)?(?=$|,|\t))re",
                 role_t::VCR_NUMBER),
            rule(R"re([,\t])re", role_t::VCR_SYMBOL),
        },
    };
}

static grammar
plain_text_grammar()
{
    return grammar{"Plain Text", {"txt", "text"}, {}};
}

grammar_set::grammar_set()
{
    this->gs_grammars = {
        rust_grammar(),       python_grammar(),
        grammar{"JavaScript", {"js", "jsx", "mjs", "cjs"}, javascript_rules(false)},
        grammar{"TypeScript", {"ts", "tsx", "mts", "cts"}, javascript_rules(true)},
        c_grammar(),          cpp_grammar(),
        go_grammar(),         java_grammar(),
        ruby_grammar(),       shell_grammar(),
        json_grammar(),       yaml_grammar(),
        toml_grammar(),       xml_grammar(),
        html_grammar(),       css_grammar(),
        sql_grammar(),        markdown_grammar(),
        php_grammar(),        swift_grammar(),
        kotlin_grammar(),     scala_grammar(),
        r_grammar(),          lua_grammar(),
        perl_grammar(),       haskell_grammar(),
        elm_grammar(),        erlang_grammar(),
        elixir_grammar(),     clojure_grammar(),
        fsharp_grammar(),     csharp_grammar(),
        visual_basic_grammar(), powershell_grammar(),
        dockerfile_grammar(), makefile_grammar(),
        cmake_grammar(),      terraform_grammar(),
        viml_grammar(),       diff_grammar(),
        ini_grammar(),        csv_grammar(),
        plain_text_grammar(),
    };

    for (size_t lpc = 0; lpc < this->gs_grammars.size(); lpc++) {
        const auto& gr = this->gs_grammars[lpc];

        this->gs_name_index.emplace(tolower(gr.g_name), lpc);
        for (const auto& ext : gr.g_extensions) {
            this->gs_ext_index.emplace(ext, lpc);
        }
    }
    log_info("loaded %zu grammars", this->gs_grammars.size());
}

const grammar_set&
grammar_set::get()
{
    static const grammar_set retval;

    return retval;
}

const grammar*
grammar_set::find_by_name(const std::string& name) const
{
    auto iter = this->gs_name_index.find(tolower(name));

    if (iter == this->gs_name_index.end()) {
        return nullptr;
    }

    return &this->gs_grammars[iter->second];
}

const grammar*
grammar_set::find_by_extension(const std::string& ext) const
{
    auto iter = this->gs_ext_index.find(tolower(ext));

    if (iter == this->gs_ext_index.end()) {
        return nullptr;
    }

    return &this->gs_grammars[iter->second];
}

/** @return The text after the last dot in the file name or the whole name. */
static std::string
extension_key(const std::string& source_name)
{
    auto filename = std::filesystem::path(source_name).filename().string();
    auto dot = filename.rfind('.');

    if (dot == std::string::npos) {
        return tolower(filename);
    }

    return tolower(filename.substr(dot + 1));
}

std::optional<std::string>
detect_language(const std::string& source_name)
{
    static const std::map<std::string, const char*> EXT_TO_NAME = {
        {"rs", "Rust"},
        {"py", "Python"},
        {"js", "JavaScript"},
        {"jsx", "JavaScript"},
        {"ts", "TypeScript"},
        {"tsx", "TypeScript"},
        {"c", "C"},
        {"h", "C"},
        {"cpp", "C++"},
        {"cc", "C++"},
        {"cxx", "C++"},
        {"hpp", "C++"},
        {"hh", "C++"},
        {"hxx", "C++"},
        {"go", "Go"},
        {"java", "Java"},
        {"rb", "Ruby"},
        {"sh", "Bash"},
        {"bash", "Bash"},
        {"zsh", "Bash"},
        {"json", "JSON"},
        {"yaml", "YAML"},
        {"yml", "YAML"},
        {"toml", "TOML"},
        {"xml", "XML"},
        {"html", "HTML"},
        {"htm", "HTML"},
        {"css", "CSS"},
        {"sql", "SQL"},
        {"md", "Markdown"},
        {"markdown", "Markdown"},
        {"php", "PHP"},
        {"swift", "Swift"},
        {"kt", "Kotlin"},
        {"kts", "Kotlin"},
        {"scala", "Scala"},
        {"r", "R"},
        {"lua", "Lua"},
        {"pl", "Perl"},
        {"pm", "Perl"},
        {"hs", "Haskell"},
        {"elm", "Elm"},
        {"erl", "Erlang"},
        {"ex", "Elixir"},
        {"exs", "Elixir"},
        {"clj", "Clojure"},
        {"cljs", "Clojure"},
        {"fs", "F#"},
        {"fsx", "F#"},
        {"cs", "C#"},
        {"vb", "Visual Basic"},
        {"ps1", "PowerShell"},
        {"psm1", "PowerShell"},
        {"dockerfile", "Dockerfile"},
        {"makefile", "Makefile"},
        {"mk", "Makefile"},
        {"cmake", "CMake"},
        {"tf", "Terraform"},
        {"vim", "VimL"},
        {"diff", "Diff"},
        {"patch", "Diff"},
        {"ini", "INI"},
        {"cfg", "INI"},
        {"csv", "CSV"},
    };

    auto iter = EXT_TO_NAME.find(extension_key(source_name));
    if (iter == EXT_TO_NAME.end()) {
        return std::nullopt;
    }

    return std::string(iter->second);
}

const grammar*
grammar_set::select(const std::optional<std::string>& language,
                    const std::string& source_name) const
{
    if (language) {
        const auto* retval = this->find_by_name(language.value());

        if (retval == nullptr) {
            retval = this->find_by_extension(language.value());
        }
        return retval;
    }

    auto lang_name = detect_language(source_name);
    if (lang_name) {
        const auto* retval = this->find_by_name(lang_name.value());

        if (retval != nullptr) {
            return retval;
        }
    }

    return this->find_by_extension(extension_key(source_name));
}

}  // namespace mat
