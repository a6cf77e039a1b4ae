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

#ifndef QJ_CLI_H_
#define QJ_CLI_H_

#include <cstdio>
#include <string>
#include <vector>

namespace qj {

struct Options
{
    std::string query;
    bool pretty = true;
    bool raw = false;
    bool showVersion = false;
    bool showHelp = false;
    std::vector<std::string> files;
};

// Parses command line flags. Both `--name` and `-name` spellings are
// accepted, with values given as `--name=value` or as the following
// argument. Boolean flags only take values through `=`. Flags may
// follow the file argument; `--` ends flag processing.
//
// Throws QueryError(usage_error) on malformed input.
Options ParseArgs(int argc, char** argv);

void PrintUsage(FILE* f, const char* progname);
void PrintVersion(FILE* f);

// Runs one query_json invocation and returns the process exit status.
// Results go to `out` and diagnostics to `err`.
int runQueryJson(int argc, char** argv, FILE* out, FILE* err);

} // namespace qj

#endif /* QJ_CLI_H_ */
