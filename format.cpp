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

#include "format.h"
#include "query.h"

#include <cstdio>
#include <stdexcept>

namespace qj {

static void
FormatRawNumber(std::string& out, double value)
{
    char buf[32];
    snprintf(buf, sizeof(buf), "%.10g", value);
    out += buf;
}

static void
FormatRawArray(std::string& out, const std::vector<Json>& items)
{
    for (const Json& item : items) {
        if (item.isString()) {
            out += item.getString();
        } else {
            out += item.toString();
        }
        out += '\n';
    }
}

static std::string
FormatValue(const Json& value, bool pretty, bool raw)
{
    std::string out;
    if (raw) {
        switch (value.getType()) {
            case Json::String:
                out += value.getString();
                out += '\n';
                return out;
            case Json::Long:
            case Json::Double:
                FormatRawNumber(out, value.getNumber());
                out += '\n';
                return out;
            case Json::Bool:
                out += value.getBool() ? "true" : "false";
                out += '\n';
                return out;
            case Json::Array:
                FormatRawArray(out, value.getArray());
                return out;
            default:
                break;
        }
    }
    out = pretty ? value.toStringPretty() : value.toString();
    out += '\n';
    return out;
}

std::string
formatResult(const Json& value, bool pretty, bool raw)
{
    try {
        return FormatValue(value, pretty, raw);
    } catch (const std::invalid_argument& e) {
        throw QueryError(QueryError::format_error, e.what());
    }
}

} // namespace qj
