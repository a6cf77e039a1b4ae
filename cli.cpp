// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Copyright 2024 Mozilla Foundation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "cli.h"
#include "format.h"
#include "json.h"
#include "query.h"
#include "version.h"

#include <cerrno>
#include <cstring>
#include <exception>

namespace qj {

static bool
HasPrefix(const std::string& s, const std::string& prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Accepts the same spellings as Go's strconv.ParseBool.
static bool
ParseBool(const std::string& name, bool hasValue, const std::string& value)
{
    if (!hasValue)
        return true;
    static const char* const kTrue[] = { "1", "t", "T", "TRUE", "true", "True" };
    static const char* const kFalse[] = { "0", "f", "F", "FALSE", "false", "False" };
    for (const char* s : kTrue)
        if (value == s)
            return true;
    for (const char* s : kFalse)
        if (value == s)
            return false;
    throw QueryError(QueryError::usage_error,
                     "invalid boolean value \"" + value + "\" for --" + name);
}

static void
ReportError(FILE* err, const QueryError& e)
{
    fprintf(err, "%s: %s\n", QueryError::KindToPrefix(e.kind()), e.what());
}

static void
WriteOutput(FILE* out, const std::string& text)
{
    if (fwrite(text.data(), 1, text.size(), out) != text.size() ||
        fflush(out) != 0)
        throw QueryError(QueryError::format_error,
                         std::string("write: ") + strerror(errno));
}

Options
ParseArgs(int argc, char** argv)
{
    Options opts;
    bool flagsDone = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (flagsDone || arg.size() < 2 || arg[0] != '-') {
            opts.files.push_back(arg);
            continue;
        }
        if (arg == "--") {
            flagsDone = true;
            continue;
        }
        std::string name = arg.substr(HasPrefix(arg, "--") ? 2 : 1);
        std::string value;
        bool hasValue = false;
        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name.resize(eq);
            hasValue = true;
        }
        if (name == "help" || name == "h") {
            opts.showHelp = true;
        } else if (name == "query") {
            if (!hasValue) {
                if (i + 1 >= argc)
                    throw QueryError(QueryError::usage_error,
                                     "flag needs an argument: --query");
                value = argv[++i];
            }
            opts.query = value;
        } else if (name == "pretty") {
            opts.pretty = ParseBool(name, hasValue, value);
        } else if (name == "raw") {
            opts.raw = ParseBool(name, hasValue, value);
        } else if (name == "version") {
            opts.showVersion = ParseBool(name, hasValue, value);
        } else {
            throw QueryError(QueryError::usage_error,
                             "flag provided but not defined: " +
                               arg.substr(0, arg.find('=')));
        }
    }
    return opts;
}

void
PrintUsage(FILE* f, const char* progname)
{
    fprintf(f, "Usage: %s [options] <json-file>\n", progname);
    fprintf(f, "\nOptions:\n");
    fprintf(f, "  --pretty\n");
    fprintf(f, "    \tPretty print JSON output (default true)\n");
    fprintf(f, "  --query string\n");
    fprintf(f, "    \tJSONPath query (e.g., $.root[0], $.users[*].name)\n");
    fprintf(f, "  --raw\n");
    fprintf(f, "    \tOutput raw values (no JSON formatting for strings)\n");
    fprintf(f, "  --version\n");
    fprintf(f, "    \tShow version information\n");
    fprintf(f, "\nExamples:\n");
    fprintf(f, "  %s --query '$.users[0].name' ./examples/test.json\n", progname);
    fprintf(f,
            "  %s --query '$.products[?(@.price > 100)]' ./examples/test.json\n",
            progname);
    fprintf(f, "  %s --query '$.users[*].email' --raw ./examples/test.json\n",
            progname);
}

void
PrintVersion(FILE* f)
{
    fprintf(f, "query_json version %s\n", QJ_VERSION);
    fprintf(f, "  commit: %s\n", QJ_COMMIT);
    fprintf(f, "  built: %s\n", QJ_BUILD_DATE);
}

int
runQueryJson(int argc, char** argv, FILE* out, FILE* err)
{
    const char* progname = argc > 0 ? argv[0] : "query_json";
    Options opts;
    try {
        opts = ParseArgs(argc, argv);
    } catch (const QueryError& e) {
        ReportError(err, e);
        PrintUsage(err, progname);
        return 1;
    }
    if (opts.showHelp) {
        PrintUsage(err, progname);
        return 0;
    }
    if (opts.showVersion) {
        PrintVersion(out);
        return fflush(out) == 0 ? 0 : 1;
    }
    if (opts.files.empty()) {
        PrintUsage(err, progname);
        return 1;
    }
    try {
        if (opts.query.empty())
            throw QueryError(QueryError::usage_error,
                             "--query parameter is required");
        validateQuery(opts.query);
        Json document = loadDocument(opts.files[0]);
        Json result = normalizeResults(evaluateQuery(opts.query, document));
        WriteOutput(out, formatResult(result, opts.pretty, opts.raw));
    } catch (const QueryError& e) {
        ReportError(err, e);
        return 1;
    } catch (const std::exception& e) {
        fprintf(err, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}

} // namespace qj
