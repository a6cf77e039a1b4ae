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

#include "json.h"

#include <jtckdint.h>

#include <cctype>
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

#include <double-conversion/double-to-string.h>
#include <double-conversion/string-to-double.h>

#define MAX_DEPTH 10000

#define UTF16_MASK 0xfc00
#define UTF16_MOAR 0xd800 // 0xD800..0xDBFF
#define UTF16_CONT 0xdc00 // 0xDC00..0xDFFF

#define IsSurrogate(wc) ((0xf800 & (wc)) == 0xd800)
#define IsHighSurrogate(wc) (((wc) & UTF16_MASK) == UTF16_MOAR)
#define IsLowSurrogate(wc) (((wc) & UTF16_MASK) == UTF16_CONT)
#define MergeUtf16(hi, lo) ((((hi) - 0xD800) << 10) + ((lo) - 0xDC00) + 0x10000)

#if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || defined(_CPPUNWIND)
#define ON_LOGIC_ERROR(s) throw std::logic_error(s)
#else
#define ON_LOGIC_ERROR(s) abort()
#endif

namespace qj {

// 0 literal, 1 \t, 2 \n, 3 \r, 4 \f, 5 \\, 6 \b, 7 \", 9 \u00XX
//
// < > & are escaped too, as Go does.
static const char kEscapeLiteral[128] = {
    9, 9, 9, 9, 9, 9, 9, 9, 6, 1, 2, 9, 4, 3, 9, 9, // 0x00
    9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, // 0x10
    0, 0, 7, 0, 0, 0, 9, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 0x20
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 9, 0, 9, 0, // 0x30
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 0x40
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 5, 0, 0, 0, // 0x50
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 0x60
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 0x70
};

alignas(signed char) static const signed char kHexToInt[256] = {
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x00
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x10
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x20
    0,  1,  2,  3,  4,  5,  6,  7,  8,  9,  -1, -1, -1, -1, -1, -1, // 0x30
    -1, 10, 11, 12, 13, 14, 15, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x40
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x50
    -1, 10, 11, 12, 13, 14, 15, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x60
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x70
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x80
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x90
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xa0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xb0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xc0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xd0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xe0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xf0
};

// Shortest round-trip digits; decimal notation for 1e-6 <= |x| < 1e21.
static const double_conversion::DoubleToStringConverter kDoubleToJson(
  double_conversion::DoubleToStringConverter::EMIT_POSITIVE_EXPONENT_SIGN,
  "Infinity",
  "NaN",
  'e',
  -6,
  21,
  6,
  0);

// The scanner validates the number grammar before conversion, so the
// converter must consume the whole span.
static const double_conversion::StringToDoubleConverter kJsonToDouble(
  double_conversion::StringToDoubleConverter::NO_FLAGS,
  0.0,
  0.0,
  "Infinity",
  "NaN");

static char*
UlongToString(char* p, unsigned long long x)
{
    char t;
    size_t i, a, b;
    i = 0;
    do {
        p[i++] = x % 10 + '0';
        x = x / 10;
    } while (x > 0);
    p[i] = '\0';
    if (i) {
        for (a = 0, b = i - 1; a < b; ++a, --b) {
            t = p[a];
            p[a] = p[b];
            p[b] = t;
        }
    }
    return p + i;
}

static char*
LongToString(char* p, long long x)
{
    if (x < 0)
        *p++ = '-', x = 0 - (unsigned long long)x;
    return UlongToString(p, x);
}

// Returns the length of the well-formed UTF-8 sequence at p, or 0 if
// the bytes are truncated, overlong, a surrogate, or out of range.
static int
DecodeUtf8(const char* p, const char* e, unsigned* out)
{
    unsigned c = *p & 255;
    unsigned min;
    int n;
    if (c < 0x80) {
        *out = c;
        return 1;
    }
    if (c < 0xc2)
        return 0;
    if (c < 0xe0) {
        n = 2;
        c &= 037;
        min = 0x80;
    } else if (c < 0xf0) {
        n = 3;
        c &= 017;
        min = 0x800;
    } else if (c < 0xf5) {
        n = 4;
        c &= 007;
        min = 0x10000;
    } else {
        return 0;
    }
    if (e - p < n)
        return 0;
    for (int i = 1; i < n; ++i) {
        if ((p[i] & 0300) != 0200)
            return 0;
        c = c << 6 | (p[i] & 077);
    }
    if (c < min || c > 0x10ffff || IsSurrogate(c))
        return 0;
    *out = c;
    return n;
}

static void
EncodeUtf8(std::string& b, unsigned c)
{
    if (c <= 0x7f) {
        b += static_cast<char>(c);
    } else if (c <= 0x7ff) {
        b += static_cast<char>(0300 | (c >> 6));
        b += static_cast<char>(0200 | (c & 077));
    } else if (c <= 0xffff) {
        b += static_cast<char>(0340 | (c >> 12));
        b += static_cast<char>(0200 | ((c >> 6) & 077));
        b += static_cast<char>(0200 | (c & 077));
    } else {
        b += static_cast<char>(0360 | (c >> 18));
        b += static_cast<char>(0200 | ((c >> 12) & 077));
        b += static_cast<char>(0200 | ((c >> 6) & 077));
        b += static_cast<char>(0200 | (c & 077));
    }
}

static int
ReadHex4(const char* p, const char* e)
{
    int A, B, C, D;
    if (e - p < 4 || //
        (A = kHexToInt[p[0] & 255]) == -1 || //
        (B = kHexToInt[p[1] & 255]) == -1 || //
        (C = kHexToInt[p[2] & 255]) == -1 || //
        (D = kHexToInt[p[3] & 255]) == -1)
        return -1;
    return A << 12 | B << 8 | C << 4 | D;
}

static void
AppendEscape(std::string& b, unsigned w)
{
    char esc[6];
    esc[0] = '\\';
    esc[1] = 'u';
    esc[2] = "0123456789abcdef"[(w & 0xF000) >> 014];
    esc[3] = "0123456789abcdef"[(w & 0x0F00) >> 010];
    esc[4] = "0123456789abcdef"[(w & 0x00F0) >> 004];
    esc[5] = "0123456789abcdef"[(w & 0x000F) >> 000];
    b.append(esc, 6);
}

static void
Indent(std::string& b, int level)
{
    b += '\n';
    b.append(static_cast<size_t>(level) * 2, ' ');
}

Json::Json(unsigned long value)
{
    if (value <= LLONG_MAX) {
        type_ = Long;
        long_value = value;
    } else {
        type_ = Double;
        double_value = value;
    }
}

Json::Json(unsigned long long value)
{
    if (value <= LLONG_MAX) {
        type_ = Long;
        long_value = value;
    } else {
        type_ = Double;
        double_value = value;
    }
}

Json::Json(const char* value)
{
    if (value) {
        type_ = String;
        new (&string_value) std::string(value);
    } else {
        type_ = Null;
    }
}

Json::Json(const std::string& value) : type_(String), string_value(value)
{
}

Json::Json(std::string&& value)
  : type_(String), string_value(std::move(value))
{
}

Json::~Json()
{
    if (type_ >= String)
        clear();
}

void
Json::clear()
{
    switch (type_) {
        case String:
            string_value.~basic_string();
            break;
        case Array:
            array_value.~vector();
            break;
        case Object:
            object_value.~map();
            break;
        default:
            break;
    }
    type_ = Null;
}

Json::Json(const Json& other) : type_(other.type_)
{
    switch (type_) {
        case Null:
            break;
        case Bool:
            bool_value = other.bool_value;
            break;
        case Long:
            long_value = other.long_value;
            break;
        case Double:
            double_value = other.double_value;
            break;
        case String:
            new (&string_value) std::string(other.string_value);
            break;
        case Array:
            new (&array_value) std::vector<Json>(other.array_value);
            break;
        case Object:
            new (&object_value) std::map<std::string, Json>(other.object_value);
            break;
        default:
            ON_LOGIC_ERROR("Unhandled JSON type.");
    }
}

Json&
Json::operator=(const Json& other)
{
    if (this != &other) {
        Json copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Json::Json(Json&& other) : type_(other.type_)
{
    switch (type_) {
        case Null:
            break;
        case Bool:
            bool_value = other.bool_value;
            break;
        case Long:
            long_value = other.long_value;
            break;
        case Double:
            double_value = other.double_value;
            break;
        case String:
            new (&string_value) std::string(std::move(other.string_value));
            break;
        case Array:
            new (&array_value) std::vector<Json>(std::move(other.array_value));
            break;
        case Object:
            new (&object_value)
              std::map<std::string, Json>(std::move(other.object_value));
            break;
        default:
            ON_LOGIC_ERROR("Unhandled JSON type.");
    }
    other.clear();
}

Json&
Json::operator=(Json&& other)
{
    if (this != &other) {
        // other may live inside this value, e.g. `v = std::move(v[0])`
        Json moved(std::move(other));
        if (type_ >= String)
            clear();
        type_ = moved.type_;
        switch (type_) {
            case Null:
                break;
            case Bool:
                bool_value = moved.bool_value;
                break;
            case Long:
                long_value = moved.long_value;
                break;
            case Double:
                double_value = moved.double_value;
                break;
            case String:
                new (&string_value) std::string(std::move(moved.string_value));
                break;
            case Array:
                new (&array_value)
                  std::vector<Json>(std::move(moved.array_value));
                break;
            case Object:
                new (&object_value)
                  std::map<std::string, Json>(std::move(moved.object_value));
                break;
            default:
                ON_LOGIC_ERROR("Unhandled JSON type.");
        }
    }
    return *this;
}

double
Json::getNumber() const
{
    switch (type_) {
        case Long:
            return long_value;
        case Double:
            return double_value;
        default:
            ON_LOGIC_ERROR("JSON value is not a number.");
    }
}

long long
Json::getLong() const
{
    switch (type_) {
        case Long:
            return long_value;
        default:
            ON_LOGIC_ERROR("JSON value is not a long.");
    }
}

bool
Json::getBool() const
{
    switch (type_) {
        case Bool:
            return bool_value;
        default:
            ON_LOGIC_ERROR("JSON value is not a bool.");
    }
}

double
Json::getDouble() const
{
    switch (type_) {
        case Double:
            return double_value;
        default:
            ON_LOGIC_ERROR("JSON value is not a floating-point number.");
    }
}

std::string&
Json::getString()
{
    switch (type_) {
        case String:
            return string_value;
        default:
            ON_LOGIC_ERROR("JSON value is not a string.");
    }
}

const std::string&
Json::getString() const
{
    switch (type_) {
        case String:
            return string_value;
        default:
            ON_LOGIC_ERROR("JSON value is not a string.");
    }
}

std::vector<Json>&
Json::getArray()
{
    switch (type_) {
        case Array:
            return array_value;
        default:
            ON_LOGIC_ERROR("JSON value is not an array.");
    }
}

const std::vector<Json>&
Json::getArray() const
{
    switch (type_) {
        case Array:
            return array_value;
        default:
            ON_LOGIC_ERROR("JSON value is not an array.");
    }
}

std::map<std::string, Json>&
Json::getObject()
{
    switch (type_) {
        case Object:
            return object_value;
        default:
            ON_LOGIC_ERROR("JSON value is not an object.");
    }
}

const std::map<std::string, Json>&
Json::getObject() const
{
    switch (type_) {
        case Object:
            return object_value;
        default:
            ON_LOGIC_ERROR("JSON value is not an object.");
    }
}

void
Json::setArray()
{
    if (type_ >= String)
        clear();
    type_ = Array;
    new (&array_value) std::vector<Json>();
}

void
Json::setObject()
{
    if (type_ >= String)
        clear();
    type_ = Object;
    new (&object_value) std::map<std::string, Json>();
}

bool
Json::contains(const std::string& key) const
{
    if (!isObject())
        return false;
    return object_value.find(key) != object_value.end();
}

Json&
Json::operator[](size_t index)
{
    if (!isArray())
        setArray();
    if (index >= array_value.size()) {
        array_value.resize(index + 1);
    }
    return array_value[index];
}

Json&
Json::operator[](const std::string& key)
{
    if (!isObject())
        setObject();
    return object_value[key];
}

bool
Json::operator==(const Json& other) const
{
    if (isNumber() && other.isNumber()) {
        if (type_ == Long && other.type_ == Long)
            return long_value == other.long_value;
        return getNumber() == other.getNumber();
    }
    if (type_ != other.type_)
        return false;
    switch (type_) {
        case Null:
            return true;
        case Bool:
            return bool_value == other.bool_value;
        case String:
            return string_value == other.string_value;
        case Array:
            return array_value == other.array_value;
        case Object:
            return object_value == other.object_value;
        default:
            ON_LOGIC_ERROR("Unhandled JSON type.");
    }
}

std::string
Json::toString() const
{
    std::string b;
    marshal(b, false, 0);
    return b;
}

std::string
Json::toStringPretty() const
{
    std::string b;
    marshal(b, true, 0);
    return b;
}

void
Json::marshal(std::string& b, bool pretty, int indent) const
{
    switch (type_) {
        case Null:
            b += "null";
            break;
        case String:
            stringify(b, string_value);
            break;
        case Bool:
            b += bool_value ? "true" : "false";
            break;
        case Long: {
            char buf[64];
            b.append(buf, LongToString(buf, long_value) - buf);
            break;
        }
        case Double: {
            if (std::isnan(double_value))
                throw std::invalid_argument("unsupported value: NaN");
            if (std::isinf(double_value))
                throw std::invalid_argument(double_value > 0
                                              ? "unsupported value: +Inf"
                                              : "unsupported value: -Inf");
            char buf[128];
            double_conversion::StringBuilder db(buf, 128);
            kDoubleToJson.ToShortest(double_value, &db);
            db.Finalize();
            b += buf;
            break;
        }
        case Array: {
            if (array_value.empty()) {
                b += "[]";
                break;
            }
            bool once = false;
            b += '[';
            for (auto i = array_value.begin(); i != array_value.end(); ++i) {
                if (once) {
                    b += ',';
                } else {
                    once = true;
                }
                if (pretty)
                    Indent(b, indent + 1);
                i->marshal(b, pretty, indent + 1);
            }
            if (pretty)
                Indent(b, indent);
            b += ']';
            break;
        }
        case Object: {
            if (object_value.empty()) {
                b += "{}";
                break;
            }
            bool once = false;
            b += '{';
            for (auto i = object_value.begin(); i != object_value.end(); ++i) {
                if (once) {
                    b += ',';
                } else {
                    once = true;
                }
                if (pretty)
                    Indent(b, indent + 1);
                stringify(b, i->first);
                b += ':';
                if (pretty)
                    b += ' ';
                i->second.marshal(b, pretty, indent + 1);
            }
            if (pretty)
                Indent(b, indent);
            b += '}';
            break;
        }
        default:
            ON_LOGIC_ERROR("Unhandled JSON type.");
    }
}

void
Json::stringify(std::string& b, const std::string& s)
{
    b += '"';
    serialize(b, s);
    b += '"';
}

void
Json::serialize(std::string& sb, const std::string& s)
{
    const char* p = s.data();
    const char* e = s.data() + s.size();
    while (p < e) {
        unsigned x = *p & 255;
        if (x >= 0x80) {
            unsigned wc;
            int n = DecodeUtf8(p, e, &wc);
            if (!n) {
                sb += "\\ufffd";
                ++p;
            } else if (wc == 0x2028 || wc == 0x2029) {
                AppendEscape(sb, wc);
                p += n;
            } else {
                sb.append(p, n);
                p += n;
            }
            continue;
        }
        ++p;
        switch (kEscapeLiteral[x]) {
            case 0:
                sb += static_cast<char>(x);
                break;
            case 1:
                sb += "\\t";
                break;
            case 2:
                sb += "\\n";
                break;
            case 3:
                sb += "\\r";
                break;
            case 4:
                sb += "\\f";
                break;
            case 5:
                sb += "\\\\";
                break;
            case 6:
                sb += "\\b";
                break;
            case 7:
                sb += "\\\"";
                break;
            case 9:
                AppendEscape(sb, x);
                break;
            default:
                ON_LOGIC_ERROR("Unhandled character escape code during string serialization.");
        }
    }
}

namespace detail {

// Strict RFC 8259 decoder. On failure p_ is left on (or just past) the
// byte that could not be accepted.
class JsonParser
{
  public:
    JsonParser(const char* p, const char* e) : begin_(p), p_(p), e_(e)
    {
    }

    Json::Status parse(Json& json);

    size_t offset() const
    {
        return p_ - begin_;
    }

  private:
    const char* begin_;
    const char* p_;
    const char* e_;

    void skipWhitespace();
    bool isValueStart() const;
    Json::Status unexpected() const;
    bool parseLiteral(const char* word, size_t size);
    Json::Status parseValue(Json& json, int depth);
    Json::Status parseNumber(Json& json);
    Json::Status parseString(std::string& b);
    Json::Status parseArray(Json& json, int depth);
    Json::Status parseObject(Json& json, int depth);
};

void
JsonParser::skipWhitespace()
{
    while (p_ < e_ &&
           (*p_ == ' ' || *p_ == '\n' || *p_ == '\r' || *p_ == '\t'))
        ++p_;
}

bool
JsonParser::isValueStart() const
{
    switch (*p_) {
        case '"':
        case '[':
        case '{':
        case '-':
        case 't':
        case 'f':
        case 'n':
            return true;
        default:
            return isdigit(*p_ & 255);
    }
}

// Classifies the byte where a separator or terminator was expected.
Json::Status
JsonParser::unexpected() const
{
    if (p_ >= e_)
        return Json::unexpected_eof;
    switch (*p_) {
        case ',':
            return Json::unexpected_comma;
        case ':':
            return Json::unexpected_colon;
        case ']':
            return Json::unexpected_end_of_array;
        case '}':
            return Json::unexpected_end_of_object;
        default:
            if (isValueStart())
                return Json::missing_comma;
            return Json::illegal_character;
    }
}

bool
JsonParser::parseLiteral(const char* word, size_t size)
{
    if (static_cast<size_t>(e_ - p_) < size)
        return false;
    for (size_t i = 0; i < size; ++i)
        if (p_[i] != word[i])
            return false;
    p_ += size;
    return true;
}

Json::Status
JsonParser::parse(Json& json)
{
    skipWhitespace();
    if (p_ >= e_)
        return Json::absent_value;
    Json::Status status = parseValue(json, MAX_DEPTH);
    if (status != Json::success)
        return status;
    skipWhitespace();
    if (p_ < e_)
        return Json::trailing_content;
    return Json::success;
}

Json::Status
JsonParser::parseValue(Json& json, int depth)
{
    if (p_ >= e_)
        return Json::unexpected_eof;
    switch (*p_) {
        case '{':
            return parseObject(json, depth);
        case '[':
            return parseArray(json, depth);
        case '"': {
            std::string b;
            Json::Status status = parseString(b);
            if (status != Json::success)
                return status;
            json = Json(std::move(b));
            return Json::success;
        }
        case 't':
            if (!parseLiteral("true", 4))
                return Json::illegal_character;
            json = true;
            return Json::success;
        case 'f':
            if (!parseLiteral("false", 5))
                return Json::illegal_character;
            json = false;
            return Json::success;
        case 'n':
            if (!parseLiteral("null", 4))
                return Json::illegal_character;
            json = nullptr;
            return Json::success;
        case '-':
        case '0':
        case '1':
        case '2':
        case '3':
        case '4':
        case '5':
        case '6':
        case '7':
        case '8':
        case '9':
            return parseNumber(json);
        case ',':
            return Json::unexpected_comma;
        case ':':
            return Json::unexpected_colon;
        case ']':
            return Json::unexpected_end_of_array;
        case '}':
            return Json::unexpected_end_of_object;
        default:
            return Json::illegal_character;
    }
}

Json::Status
JsonParser::parseNumber(Json& json)
{
    const char* a = p_;
    bool negative = false;
    bool integral = true;
    if (*p_ == '-') {
        negative = true;
        if (++p_ >= e_ || !isdigit(*p_ & 255))
            return Json::bad_negative;
    }
    if (*p_ == '0') {
        if (++p_ < e_ && isdigit(*p_ & 255))
            return Json::unexpected_octal;
    } else {
        while (p_ < e_ && isdigit(*p_ & 255))
            ++p_;
    }
    if (p_ < e_ && *p_ == '.') {
        if (++p_ >= e_ || !isdigit(*p_ & 255))
            return Json::bad_double;
        while (p_ < e_ && isdigit(*p_ & 255))
            ++p_;
        integral = false;
    }
    if (p_ < e_ && (*p_ == 'e' || *p_ == 'E')) {
        if (++p_ < e_ && (*p_ == '+' || *p_ == '-'))
            ++p_;
        if (p_ >= e_ || !isdigit(*p_ & 255))
            return Json::bad_exponent;
        while (p_ < e_ && isdigit(*p_ & 255))
            ++p_;
        integral = false;
    }
    if (integral) {
        long long x = 0;
        bool overflow = false;
        for (const char* q = a + negative; q < p_; ++q) {
            int digit = *q - '0';
            if (ckd_mul(&x, x, 10) ||
                ckd_add(&x, x, negative ? -digit : digit)) {
                overflow = true;
                break;
            }
        }
        // -0 is kept as a double
        if (!overflow && !(negative && x == 0)) {
            json = x;
            return Json::success;
        }
    }
    int length = static_cast<int>(p_ - a);
    int processed = 0;
    double d = kJsonToDouble.StringToDouble(a, length, &processed);
    if (processed != length)
        return Json::bad_double;
    if (std::isinf(d))
        return Json::number_out_of_range;
    json = d;
    return Json::success;
}

// Malformed UTF-8 and unpaired surrogate escapes decode to U+FFFD.
Json::Status
JsonParser::parseString(std::string& b)
{
    ++p_;
    for (;;) {
        if (p_ >= e_)
            return Json::unexpected_end_of_string;
        unsigned c = *p_ & 255;
        if (c == '"') {
            ++p_;
            return Json::success;
        }
        if (c == '\\') {
            if (++p_ >= e_)
                return Json::unexpected_end_of_string;
            switch (*p_++) {
                case '"':
                    b += '"';
                    break;
                case '\\':
                    b += '\\';
                    break;
                case '/':
                    b += '/';
                    break;
                case 'b':
                    b += '\b';
                    break;
                case 'f':
                    b += '\f';
                    break;
                case 'n':
                    b += '\n';
                    break;
                case 'r':
                    b += '\r';
                    break;
                case 't':
                    b += '\t';
                    break;
                case 'u': {
                    int u = ReadHex4(p_, e_);
                    if (u == -1)
                        return Json::invalid_unicode_escape;
                    p_ += 4;
                    if (IsHighSurrogate(u)) {
                        int v = -1;
                        if (e_ - p_ >= 6 && p_[0] == '\\' && p_[1] == 'u')
                            v = ReadHex4(p_ + 2, e_);
                        if (v != -1 && IsLowSurrogate(v)) {
                            p_ += 6;
                            u = MergeUtf16(u, v);
                        } else {
                            u = 0xfffd;
                        }
                    } else if (IsLowSurrogate(u)) {
                        u = 0xfffd;
                    }
                    EncodeUtf8(b, u);
                    break;
                }
                default:
                    --p_;
                    return Json::invalid_escape_character;
            }
        } else if (c < 0x20) {
            return Json::non_del_c0_control_code_in_string;
        } else if (c < 0x80) {
            b += static_cast<char>(c);
            ++p_;
        } else {
            unsigned wc;
            int n = DecodeUtf8(p_, e_, &wc);
            if (n) {
                b.append(p_, n);
                p_ += n;
            } else {
                EncodeUtf8(b, 0xfffd);
                ++p_;
            }
        }
    }
}

Json::Status
JsonParser::parseArray(Json& json, int depth)
{
    if (!depth)
        return Json::depth_exceeded;
    ++p_;
    json.setArray();
    std::vector<Json>& array = json.getArray();
    skipWhitespace();
    if (p_ < e_ && *p_ == ']') {
        ++p_;
        return Json::success;
    }
    for (;;) {
        skipWhitespace();
        Json value;
        Json::Status status = parseValue(value, depth - 1);
        if (status != Json::success)
            return status;
        array.emplace_back(std::move(value));
        skipWhitespace();
        if (p_ < e_ && *p_ == ',') {
            ++p_;
        } else if (p_ < e_ && *p_ == ']') {
            ++p_;
            return Json::success;
        } else {
            return unexpected();
        }
    }
}

// Duplicate keys are accepted and the last occurrence wins.
Json::Status
JsonParser::parseObject(Json& json, int depth)
{
    if (!depth)
        return Json::depth_exceeded;
    ++p_;
    json.setObject();
    std::map<std::string, Json>& object = json.getObject();
    skipWhitespace();
    if (p_ < e_ && *p_ == '}') {
        ++p_;
        return Json::success;
    }
    for (;;) {
        skipWhitespace();
        if (p_ >= e_)
            return Json::unexpected_eof;
        if (*p_ != '"') {
            if (*p_ == ',' || *p_ == ':' || *p_ == ']' || *p_ == '}')
                return unexpected();
            if (isValueStart())
                return Json::object_key_must_be_string;
            return Json::illegal_character;
        }
        std::string key;
        Json::Status status = parseString(key);
        if (status != Json::success)
            return status;
        skipWhitespace();
        if (p_ >= e_)
            return Json::unexpected_eof;
        if (*p_ != ':') {
            if (*p_ != ',' && isValueStart())
                return Json::missing_colon;
            return unexpected();
        }
        ++p_;
        skipWhitespace();
        if (p_ < e_ && *p_ == '}')
            return Json::object_missing_value;
        Json value;
        status = parseValue(value, depth - 1);
        if (status != Json::success)
            return status;
        object[std::move(key)] = std::move(value);
        skipWhitespace();
        if (p_ < e_ && *p_ == ',') {
            ++p_;
        } else if (p_ < e_ && *p_ == '}') {
            ++p_;
            return Json::success;
        } else {
            return unexpected();
        }
    }
}

} // namespace detail

std::pair<Json::Status, Json>
Json::parse(const std::string& s, size_t* errorOffset)
{
    std::pair<Json::Status, Json> res;
    detail::JsonParser parser(s.data(), s.data() + s.size());
    res.first = parser.parse(res.second);
    if (res.first != success)
        res.second = Json();
    if (errorOffset)
        *errorOffset = res.first == success ? 0 : parser.offset();
    return res;
}

const char*
Json::StatusToString(Json::Status status)
{
    switch (status) {
        case success:
            return "success";
        case bad_double:
            return "bad_double";
        case absent_value:
            return "absent_value";
        case bad_negative:
            return "bad_negative";
        case bad_exponent:
            return "bad_exponent";
        case missing_comma:
            return "missing_comma";
        case missing_colon:
            return "missing_colon";
        case depth_exceeded:
            return "depth_exceeded";
        case unexpected_eof:
            return "unexpected_eof";
        case unexpected_comma:
            return "unexpected_comma";
        case unexpected_colon:
            return "unexpected_colon";
        case unexpected_octal:
            return "unexpected_octal";
        case trailing_content:
            return "trailing_content";
        case illegal_character:
            return "illegal_character";
        case number_out_of_range:
            return "number_out_of_range";
        case object_missing_value:
            return "object_missing_value";
        case invalid_unicode_escape:
            return "invalid_unicode_escape";
        case unexpected_end_of_array:
            return "unexpected_end_of_array";
        case invalid_escape_character:
            return "invalid_escape_character";
        case unexpected_end_of_string:
            return "unexpected_end_of_string";
        case unexpected_end_of_object:
            return "unexpected_end_of_object";
        case object_key_must_be_string:
            return "object_key_must_be_string";
        case non_del_c0_control_code_in_string:
            return "non_del_c0_control_code_in_string";
        default:
            ON_LOGIC_ERROR("Unhandled Json status value.");
    }
}

} // namespace qj
