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

#ifndef QJ_VERSION_H_
#define QJ_VERSION_H_

// Overridden at build time through compile definitions.

#ifndef QJ_VERSION
#define QJ_VERSION "dev"
#endif

#ifndef QJ_COMMIT
#define QJ_COMMIT "unknown"
#endif

#ifndef QJ_BUILD_DATE
#define QJ_BUILD_DATE "unknown"
#endif

#endif /* QJ_VERSION_H_ */
