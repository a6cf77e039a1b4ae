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

#ifndef QJ_JSONPATH_H_
#define QJ_JSONPATH_H_

#include "json.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace qj {

namespace detail {
struct CompiledPath;
}

class JsonPathError : public std::runtime_error
{
  public:
    explicit JsonPathError(const std::string& message)
      : std::runtime_error(message)
    {
    }
};

// A compiled JSONPath expression.
//
// Supported syntax: `$` root, `.name` and `['name']` children, `[n]`
// indices (negative counts from the end), `[start:end:step]` slices,
// `*` wildcards, `..` recursive descent, `[a,b]` unions, and
// `[?(...)]` filters over `@` (current node) and `$` (document root).
// Filters support == != < <= > >= =~ && || ! and parentheses, literal
// numbers, strings, true, false, null, `/regex/` or `/regex/i`, and
// the length(), size() and count() functions.
class JsonPath
{
  public:
    // Throws JsonPathError if the expression is malformed.
    static JsonPath parse(const std::string& expression);

    // Returns every matching node, in document order for each step.
    // The pointers stay valid as long as `document` is alive and
    // unmodified. Throws JsonPathError if a filter cannot be evaluated.
    std::vector<const Json*> evaluate(const Json& document) const;

    const std::string& expression() const
    {
        return expression_;
    }

  private:
    JsonPath(const std::string& expression,
             std::shared_ptr<const detail::CompiledPath> compiled);

    std::string expression_;
    std::shared_ptr<const detail::CompiledPath> compiled_;
};

} // namespace qj

#endif /* QJ_JSONPATH_H_ */
