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

#include "query.h"
#include "jsonpath.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>

namespace qj {

namespace {

struct FileCloser
{
    void operator()(FILE* f) const
    {
        fclose(f);
    }
};

using FilePtr = std::unique_ptr<FILE, FileCloser>;

// Maps a byte offset to a 1-based line and column.
void
OffsetToLineColumn(const std::string& text,
                   size_t offset,
                   size_t* line,
                   size_t* column)
{
    *line = 1;
    *column = 1;
    if (offset > text.size())
        offset = text.size();
    for (size_t i = 0; i < offset; ++i) {
        if (text[i] == '\n') {
            ++*line;
            *column = 1;
        } else {
            ++*column;
        }
    }
}

JsonPath
CompilePath(const std::string& query)
{
    try {
        return JsonPath::parse(query);
    } catch (const JsonPathError& e) {
        throw QueryError(QueryError::query_syntax_error, e.what());
    }
}

} // namespace

const char*
QueryError::KindToPrefix(Kind kind)
{
    switch (kind) {
        case usage_error:
            return "Error";
        case invalid_query:
            return "Error: Invalid JSONPath query";
        case open_error:
            return "Error opening file";
        case read_error:
            return "Error reading file";
        case json_decode_error:
            return "Error parsing JSON";
        case query_syntax_error:
            return "Error parsing JSONPath";
        case evaluation_error:
            return "Error evaluating JSONPath";
        case format_error:
            return "Error formatting output";
        default:
            return "Error";
    }
}

void
validateQuery(const std::string& query)
{
    if (query.empty())
        throw QueryError(QueryError::invalid_query, "empty JSONPath");
    if (query[0] != '$')
        throw QueryError(QueryError::invalid_query,
                         "JSONPath must start with '$'");
}

Json
loadDocument(const std::string& path)
{
    FilePtr file(fopen(path.c_str(), "rb"));
    if (!file)
        throw QueryError(QueryError::open_error,
                         "open " + path + ": " + strerror(errno));

    std::string text;
    char buf[65536];
    for (;;) {
        size_t got = fread(buf, 1, sizeof(buf), file.get());
        text.append(buf, got);
        if (got < sizeof(buf))
            break;
    }
    if (ferror(file.get()))
        throw QueryError(QueryError::read_error,
                         "read " + path + ": " + strerror(errno));
    file.reset();

    size_t offset = 0;
    std::pair<Json::Status, Json> res = Json::parse(text, &offset);
    if (res.first != Json::success) {
        size_t line, column;
        OffsetToLineColumn(text, offset, &line, &column);
        char where[64];
        snprintf(where, sizeof(where), " at line %zu, column %zu", line, column);
        throw QueryError(QueryError::json_decode_error,
                         std::string(Json::StatusToString(res.first)) + where);
    }
    return std::move(res.second);
}

std::vector<const Json*>
evaluateQuery(const std::string& query, const Json& document)
{
    JsonPath path = CompilePath(query);
    try {
        return path.evaluate(document);
    } catch (const JsonPathError& e) {
        throw QueryError(QueryError::evaluation_error, e.what());
    }
}

Json
normalizeResults(const std::vector<const Json*>& matches)
{
    if (matches.empty())
        return Json(nullptr);
    if (matches.size() == 1)
        return *matches.front();
    Json array;
    array.setArray();
    std::vector<Json>& items = array.getArray();
    items.reserve(matches.size());
    for (const Json* match : matches)
        items.push_back(*match);
    return array;
}

} // namespace qj
