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

#include "jsonpath.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>

#define ARRAYLEN(A) \
    ((sizeof(A) / sizeof(*(A))) / ((unsigned)!(sizeof(A) % sizeof(*(A)))))

using qj::Json;
using qj::JsonPath;
using qj::JsonPathError;

static const char kStoreExample[] = R"({
  "store": {
    "book": [
      {
        "category": "reference",
        "author": "Nigel Rees",
        "title": "Sayings of the Century",
        "price": 8.95
      },
      {
        "category": "fiction",
        "author": "Evelyn Waugh",
        "title": "Sword of Honour",
        "price": 12.99
      },
      {
        "category": "fiction",
        "author": "Herman Melville",
        "title": "Moby Dick",
        "isbn": "0-553-21311-3",
        "price": 8.99
      },
      {
        "category": "fiction",
        "author": "J. R. R. Tolkien",
        "title": "The Lord of the Rings",
        "isbn": "0-395-19395-8",
        "price": 22.99
      }
    ],
    "bicycle": {
      "color": "red",
      "price": 19.95
    }
  },
  "expensive": 10
})";

#define BENCH(ITERATIONS, WORK_PER_RUN, CODE) \
    do { \
        auto start = std::chrono::high_resolution_clock::now(); \
        for (int __i = 0; __i < ITERATIONS; ++__i) { \
            std::atomic_signal_fence(std::memory_order_acq_rel); \
            CODE; \
        } \
        auto end = std::chrono::high_resolution_clock::now(); \
        auto duration = \
          std::chrono::duration_cast<std::chrono::nanoseconds>(end - start); \
        long long work = (WORK_PER_RUN) * (ITERATIONS); \
        double nanos = (duration.count() + work - 1) / (double)work; \
        printf("%10g ns %2dx %s\n", nanos, (ITERATIONS), #CODE); \
    } while (0)

static Json
Store()
{
    std::pair<Json::Status, Json> res = Json::parse(kStoreExample);
    if (res.first != Json::success)
        exit(100);
    return std::move(res.second);
}

static std::vector<const Json*>
Query(const Json& doc, const std::string& path)
{
    return JsonPath::parse(path).evaluate(doc);
}

static const struct
{
    const char* path;
    size_t count;
} kCounts[] = {
    { "$", 1 },
    { "$.store.book[*].author", 4 },
    { "$..author", 4 },
    { "$.store.*", 2 },
    { "$.store..price", 5 },
    { "$..*", 28 },
    { "$..book[2]", 1 },
    { "$..book[-1]", 1 },
    { "$..book[-5]", 0 },
    { "$..book[10]", 0 },
    { "$..book[0,1]", 2 },
    { "$..book[ 0 , 1 ]", 2 },
    { "$..book[:2]", 2 },
    { "$..book[-2:]", 2 },
    { "$..book[::2]", 2 },
    { "$..book[1:3]", 2 },
    { "$..book[5:9]", 0 },
    { "$.store.book[*]['title','price']", 8 },
    { "$.store.book[?(@.price > 20), 0]", 2 },
    { "$..book[?(@.isbn)]", 2 },
    { "$..book[?(!@.isbn)]", 2 },
    { "$..book[?(@.price<10)]", 2 },
    { "$..book[?(@.price <= $.expensive)]", 2 },
    { "$..book[?(@.price == 8.95)]", 1 },
    { "$..book[?(@.price != 8.95)]", 3 },
    { "$..book[?(@.category == \"reference\")]", 1 },
    { "$..book[?(@.category == 'fiction' && @.price < 15)]", 2 },
    { "$..book[?(@.price < 9 || @.category == 'reference')]", 2 },
    { "$..book[?((@.price < 9 || @.price > 20) && @.isbn)]", 2 },
    { "$..book[?(@.author =~ /tolkien/i)]", 1 },
    { "$..book[?(@.author =~ /tolkien/)]", 0 },
    { "$..book[?(@.author =~ /^J\\. R/)]", 1 },
    { "$..book[?(@.title =~ 'Moby.*')]", 1 },
    { "$..book[?(length(@.title) > 10)]", 3 },
    { "$..book[?(size(@.title) == 9)]", 1 },
    { "$.store[?(count(@) == 4)]", 1 },
    { "$..[?(@.price > 20)]", 1 },
    { "$[?(@ == 10.0)]", 1 },
    { "$.store.bicycle[?(@ == 'red')]", 1 },
    { "$.store.nothing", 0 },
    { "$.store.nothing.deeper[0]", 0 },
    { "$.expensive.price", 0 },
    { "$.expensive[0]", 0 },
};

void
count_test()
{
    Json doc = Store();
    for (size_t i = 0; i < ARRAYLEN(kCounts); ++i) {
        size_t got = Query(doc, kCounts[i].path).size();
        if (got != kCounts[i].count) {
            printf("error: %s matched %zu nodes but should have matched %zu\n",
                   kCounts[i].path,
                   got,
                   kCounts[i].count);
            exit(1);
        }
    }
}

void
order_test()
{
    Json doc = Store();

    std::vector<const Json*> authors = Query(doc, "$.store.book[*].author");
    if (authors.size() != 4 || authors[0]->getString() != "Nigel Rees" ||
        authors[3]->getString() != "J. R. R. Tolkien")
        exit(2);

    std::vector<const Json*> cheap = Query(doc, "$.store.book[?(@.price < 10)].title");
    if (cheap.size() != 2 || cheap[0]->getString() != "Sayings of the Century" ||
        cheap[1]->getString() != "Moby Dick")
        exit(3);

    // keys are visited in sorted order, so bicycle precedes book
    std::vector<const Json*> prices = Query(doc, "$.store..price");
    if (prices.size() != 5 || prices[0]->getNumber() != 19.95 ||
        prices[1]->getNumber() != 8.95 || prices[4]->getNumber() != 22.99)
        exit(4);

    std::vector<const Json*> reversed = Query(doc, "$.store.book[::-1].author");
    if (reversed.size() != 4 || reversed[0]->getString() != "J. R. R. Tolkien" ||
        reversed[3]->getString() != "Nigel Rees")
        exit(5);

    std::vector<const Json*> unionNodes = Query(doc, "$.store['bicycle','book']");
    if (unionNodes.size() != 2 || !unionNodes[0]->isObject() ||
        !unionNodes[1]->isArray())
        exit(6);

    std::vector<const Json*> mixed = Query(doc, "$.store.book[0]['title','price']");
    if (mixed.size() != 2 || mixed[0]->getString() != "Sayings of the Century" ||
        mixed[1]->getNumber() != 8.95)
        exit(7);

    std::vector<const Json*> color = Query(doc, "$['store'][\"bicycle\"].color");
    if (color.size() != 1 || color[0]->getString() != "red")
        exit(8);

    std::vector<const Json*> root = Query(doc, "$");
    if (root.size() != 1 || root[0] != &doc)
        exit(9);

    std::vector<const Json*> last = Query(doc, "$..book[-1].title");
    if (last.size() != 1 || last[0]->getString() != "The Lord of the Rings")
        exit(10);
}

void
names_test()
{
    std::pair<Json::Status, Json> res =
      Json::parse(R"({"naïve":1,"a'b":2,"first-name":3,"a b":4,"$ref":5})");
    if (res.first != Json::success)
        exit(11);
    const Json& doc = res.second;
    if (Query(doc, "$.na\xc3\xafve").size() != 1)
        exit(12);
    std::vector<const Json*> quoted = Query(doc, "$['a\\'b']");
    if (quoted.size() != 1 || quoted[0]->getLong() != 2)
        exit(13);
    if (Query(doc, "$.first-name").size() != 1)
        exit(14);
    if (Query(doc, "$[\"a b\"]").size() != 1)
        exit(15);
    if (Query(doc, "$.$ref").size() != 1)
        exit(16);
    if (Query(doc, "$['na\\u00efve']").size() != 1)
        exit(17);
}

void
dynamic_regex_test()
{
    std::pair<Json::Status, Json> res = Json::parse(
      R"({"items":[{"name":"abc","re":"^a"},{"name":"xyz","re":"^a"}]})");
    if (res.first != Json::success)
        exit(18);
    if (Query(res.second, "$.items[?(@.name =~ @.re)]").size() != 1)
        exit(19);

    std::pair<Json::Status, Json> bad =
      Json::parse(R"({"items":[{"name":"abc","re":"("}]})");
    JsonPath path = JsonPath::parse("$.items[?(@.name =~ @.re)]");
    try {
        path.evaluate(bad.second);
        exit(20);
    } catch (const JsonPathError& e) {
        if (std::string(e.what()).find("invalid regular expression") ==
            std::string::npos)
            exit(21);
    }
}

void
reuse_test()
{
    JsonPath path = JsonPath::parse("$..price");
    if (path.expression() != "$..price")
        exit(22);
    Json doc = Store();
    if (path.evaluate(doc).size() != 5)
        exit(23);
    std::pair<Json::Status, Json> other = Json::parse(R"({"price":1})");
    if (path.evaluate(other.second).size() != 1)
        exit(24);
}

void
huge_step_test()
{
    std::pair<Json::Status, Json> res = Json::parse("[1,2,3]");
    if (res.first != Json::success)
        exit(38);
    const Json& doc = res.second;
    std::vector<const Json*> got = Query(doc, "$[1::9223372036854775807]");
    if (got.size() != 1 || got[0]->getLong() != 2)
        exit(39);
    got = Query(doc, "$[0:3:9223372036854775807]");
    if (got.size() != 1 || got[0]->getLong() != 1)
        exit(40);
    got = Query(doc, "$[2::-9223372036854775808]");
    if (got.size() != 1 || got[0]->getLong() != 3)
        exit(41);
    got = Query(doc, "$[::2]");
    if (got.size() != 2 || got[1]->getLong() != 3)
        exit(42);
}

static const char* const kSyntaxErrors[] = {
    "",
    "store",
    "@.price",
    "$.",
    "$..",
    "$.store[invalid]",
    "$.store[",
    "$.store['book'",
    "$.store['book",
    "$.a b",
    "$[::0]",
    "$[1:2:0]",
    "$[?(@.a <)]",
    "$[?(@.a < 1]",
    "$[?@.a]",
    "$[?()]",
    "$[?(@.a =~ /[/)]",
    "$[?(@.a =~ /x/g)]",
    "$[?(@.a =~ 5)]",
    "$[?(@.a == /x/)]",
    "$[?(foo(@.a))]",
    "$[?(length(@.a, @.b))]",
    "$[?(length())]",
    "$[?(@.a == 'x' &&)]",
    "$[?(@.a ~ 1)]",
    "$['\\q']",
    "$[99999999999999999999]",
};

void
syntax_error_test()
{
    for (size_t i = 0; i < ARRAYLEN(kSyntaxErrors); ++i) {
        try {
            JsonPath::parse(kSyntaxErrors[i]);
            printf("error: JsonPath::parse(%s) should have failed\n",
                   kSyntaxErrors[i]);
            exit(30);
        } catch (const JsonPathError& e) {
            std::string what = e.what();
            if (what.find("JSONPath parse error at position ") != 0) {
                printf("error: unexpected message: %s\n", what.c_str());
                exit(31);
            }
        }
    }
}

void
error_message_test()
{
    try {
        JsonPath::parse("$.users[invalid]");
        exit(32);
    } catch (const JsonPathError& e) {
        std::string what = e.what();
        if (what.find("position 8 in '$.users[invalid]'") == std::string::npos)
            exit(33);
    }
    try {
        JsonPath::parse("$[?(@.a <)]");
        exit(34);
    } catch (const JsonPathError& e) {
        if (std::string(e.what()).find("position 9 ") == std::string::npos)
            exit(35);
    }
    try {
        JsonPath::parse("users");
        exit(36);
    } catch (const JsonPathError& e) {
        if (std::string(e.what()).find("must start with '$'") ==
            std::string::npos)
            exit(37);
    }
}

int
main()
{
    count_test();
    order_test();
    names_test();
    dynamic_regex_test();
    reuse_test();
    huge_step_test();
    syntax_error_test();
    error_message_test();

    BENCH(200, 1, count_test());
    BENCH(2000, 1, order_test());
    BENCH(2000, 1, syntax_error_test());
}
