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

#ifndef QJ_JSON_H_
#define QJ_JSON_H_

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace qj {

// Tagged union holding one JSON value.
//
// Objects keep their members in a std::map, so iteration and
// serialization always visit keys in byte-lexicographic order.
class Json
{
  public:
    enum Type
    {
        Null,
        Bool,
        Long,
        Double,
        String,
        Array,
        Object
    };

    enum Status
    {
        success,
        bad_double,
        absent_value,
        bad_negative,
        bad_exponent,
        missing_comma,
        missing_colon,
        depth_exceeded,
        unexpected_eof,
        unexpected_comma,
        unexpected_colon,
        unexpected_octal,
        trailing_content,
        illegal_character,
        number_out_of_range,
        object_missing_value,
        invalid_unicode_escape,
        unexpected_end_of_array,
        invalid_escape_character,
        unexpected_end_of_string,
        unexpected_end_of_object,
        object_key_must_be_string,
        non_del_c0_control_code_in_string,
    };

  private:
    Type type_;
    union
    {
        bool bool_value;
        long long long_value;
        double double_value;
        std::string string_value;
        std::vector<Json> array_value;
        std::map<std::string, Json> object_value;
    };

  public:
    static const char* StatusToString(Status);
    static std::pair<Status, Json> parse(const std::string&,
                                         size_t* errorOffset = nullptr);

    Json(const Json&);
    Json(Json&&);
    Json(unsigned long);
    Json(unsigned long long);
    Json(const char*);
    Json(const std::string&);
    Json(std::string&&);
    ~Json();

    Json(const std::nullptr_t = nullptr) : type_(Null)
    {
    }

    Json(bool value) : type_(Bool), bool_value(value)
    {
    }

    Json(int value) : type_(Long), long_value(value)
    {
    }

    Json(unsigned value) : type_(Long), long_value(value)
    {
    }

    Json(long value) : type_(Long), long_value(value)
    {
    }

    Json(long long value) : type_(Long), long_value(value)
    {
    }

    Json(double value) : type_(Double), double_value(value)
    {
    }

    Type getType() const
    {
        return type_;
    }

    bool isNull() const
    {
        return type_ == Null;
    }

    bool isBool() const
    {
        return type_ == Bool;
    }

    bool isNumber() const
    {
        return type_ == Long || type_ == Double;
    }

    bool isLong() const
    {
        return type_ == Long;
    }

    bool isDouble() const
    {
        return type_ == Double;
    }

    bool isString() const
    {
        return type_ == String;
    }

    bool isArray() const
    {
        return type_ == Array;
    }

    bool isObject() const
    {
        return type_ == Object;
    }

    bool getBool() const;
    double getNumber() const;
    long long getLong() const;
    double getDouble() const;
    std::string& getString();
    const std::string& getString() const;
    std::vector<Json>& getArray();
    const std::vector<Json>& getArray() const;
    std::map<std::string, Json>& getObject();
    const std::map<std::string, Json>& getObject() const;

    bool contains(const std::string&) const;

    void setArray();
    void setObject();

    // Compact encoding with no insignificant whitespace.
    //
    // Throws std::invalid_argument if the value holds a number that
    // has no JSON representation (infinity or NaN).
    std::string toString() const;

    // Indented encoding: two spaces per level, one array element or
    // object member per line, and `"key": value` separators.
    std::string toStringPretty() const;

    Json& operator=(const Json&);
    Json& operator=(Json&&);

    Json& operator[](size_t);
    Json& operator[](const std::string&);

    bool operator==(const Json&) const;
    bool operator!=(const Json& other) const
    {
        return !(*this == other);
    }

  private:
    void clear();
    void marshal(std::string&, bool, int) const;
    static void stringify(std::string&, const std::string&);
    static void serialize(std::string&, const std::string&);
};

} // namespace qj

#endif /* QJ_JSON_H_ */
