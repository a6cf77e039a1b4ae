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

#ifndef QJ_FORMAT_H_
#define QJ_FORMAT_H_

#include "json.h"

#include <string>

namespace qj {

// Renders a normalized query result, always ending in a newline.
//
// In raw mode strings are printed without quotes, numbers with at
// most ten significant digits, and arrays one element per line.
// Objects and null are printed as JSON in either mode. Throws
// QueryError(format_error) if the value cannot be encoded.
std::string formatResult(const Json& value, bool pretty, bool raw);

} // namespace qj

#endif /* QJ_FORMAT_H_ */
