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

#ifndef QJ_QUERY_H_
#define QJ_QUERY_H_

#include "json.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace qj {

// Terminal failure of one pipeline stage.
class QueryError : public std::runtime_error
{
  public:
    enum Kind
    {
        usage_error,
        invalid_query,
        open_error,
        read_error,
        json_decode_error,
        query_syntax_error,
        evaluation_error,
        format_error,
    };

    QueryError(Kind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind)
    {
    }

    Kind kind() const
    {
        return kind_;
    }

    // Returns the stderr prefix for a kind, e.g. "Error parsing JSON".
    static const char* KindToPrefix(Kind);

  private:
    Kind kind_;
};

// Cheap syntactic precheck run before any file is touched.
void validateQuery(const std::string& query);

// Reads and decodes a whole file.
Json loadDocument(const std::string& path);

std::vector<const Json*> evaluateQuery(const std::string& query,
                                       const Json& document);

// Zero matches become null, a single match is unwrapped, and several
// matches are copied into an array in match order.
Json normalizeResults(const std::vector<const Json*>& matches);

} // namespace qj

#endif /* QJ_QUERY_H_ */
