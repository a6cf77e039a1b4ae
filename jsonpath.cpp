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

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <regex>

namespace qj {

namespace detail {

class SyntaxError : public std::runtime_error
{
  public:
    SyntaxError(size_t position, const std::string& message)
      : std::runtime_error(message), position_(position)
    {
    }

    size_t position() const
    {
        return position_;
    }

  private:
    size_t position_;
};

struct Expr;

// [from:to:stride] with Python-style defaults.
struct Range
{
    bool hasFrom = false;
    bool hasTo = false;
    long long from = 0;
    long long to = 0;
    long long stride = 1;
};

struct Selector
{
    enum Kind
    {
        member,
        element,
        range,
        every,
        predicate
    };

    Kind kind = every;
    std::string key;
    long long index = 0;
    Range slice;
    std::shared_ptr<const Expr> expr;
};

// One `.x`, `..x` or `[...]` group. Descendant segments apply their
// selectors to the node and everything beneath it.
struct Segment
{
    bool descendant = false;
    std::vector<Selector> selectors;
};

struct CompiledPath
{
    bool relative = false;
    std::vector<Segment> segments;
};

struct Term
{
    enum Kind
    {
        constant,
        query,
        call
    };

    enum Function
    {
        length_of,
        count_of
    };

    Kind kind = constant;
    Json value;
    std::shared_ptr<const std::regex> pattern;
    CompiledPath path;
    Function function = length_of;
    std::vector<Term> args;
};

struct Expr
{
    enum Op
    {
        any_of,
        all_of,
        negate,
        truthy,
        eq,
        ne,
        lt,
        le,
        gt,
        ge,
        matches
    };

    Op op = truthy;
    Term lhs;
    Term rhs;
    std::shared_ptr<const Expr> left;
    std::shared_ptr<const Expr> right;
};

static const struct
{
    const char* text;
    Expr::Op op;
} kRelations[] = {
    { "==", Expr::eq }, { "!=", Expr::ne }, { "<=", Expr::le },
    { ">=", Expr::ge }, { "=~", Expr::matches }, { "<", Expr::lt },
    { ">", Expr::gt },
};

static void
AppendUtf8(std::string& s, unsigned c)
{
    static const unsigned char kLead[] = { 0, 0, 0xc0, 0xe0, 0xf0 };
    if (c < 0x80) {
        s += static_cast<char>(c);
        return;
    }
    char buf[4];
    int n = c < 0x800 ? 2 : c < 0x10000 ? 3 : 4;
    for (int i = n - 1; i > 0; --i) {
        buf[i] = static_cast<char>(0x80 | (c & 0x3f));
        c >>= 6;
    }
    buf[0] = static_cast<char>(kLead[n] | c);
    s.append(buf, n);
}

static std::shared_ptr<const std::regex>
CompileRegex(const std::string& pattern, bool icase)
{
    std::regex::flag_type flags = std::regex::ECMAScript;
    if (icase)
        flags |= std::regex::icase;
    return std::make_shared<const std::regex>(pattern, flags);
}

static bool
IsNameStart(unsigned char c)
{
    return std::isalpha(c) || c == '_' || c == '$' || c >= 0x80;
}

static bool
IsNameChar(unsigned char c)
{
    return IsNameStart(c) || std::isdigit(c) || c == '-';
}

// Recursive descent over the whole expression. Filter bodies and the
// paths inside them are read in place, so every error position is an
// offset into the original text.
class PathCompiler
{
  public:
    explicit PathCompiler(const std::string& text) : text_(text), pos_(0)
    {
    }

    CompiledPath compile();

  private:
    const std::string& text_;
    size_t pos_;

    bool atEnd() const
    {
        return pos_ >= text_.size();
    }

    char peek() const
    {
        return atEnd() ? '\0' : text_[pos_];
    }

    bool eat(char c)
    {
        if (peek() != c)
            return false;
        ++pos_;
        return true;
    }

    void skipSpace()
    {
        while (!atEnd() && std::isspace(static_cast<unsigned char>(text_[pos_])))
            ++pos_;
    }

    [[noreturn]] void fail(const std::string& message) const
    {
        throw SyntaxError(pos_, message);
    }

    [[noreturn]] void failAt(size_t at, const std::string& message) const
    {
        throw SyntaxError(at, message);
    }

    void readSegments(CompiledPath& path, bool embedded);
    Segment readSegment();
    void readBracket(Segment& segment);
    Selector readSelector();
    bool readInteger(long long* out);
    std::string readName();
    std::string readQuoted();
    unsigned readHex4();

    std::shared_ptr<const Expr> readDisjunction();
    std::shared_ptr<const Expr> readConjunction();
    std::shared_ptr<const Expr> readUnary();
    std::shared_ptr<const Expr> readRelation();
    Term readTerm();
    Term readNumber();
    Term readRegex();
    Term readCall(const std::string& name, size_t at);
};

CompiledPath
PathCompiler::compile()
{
    if (atEnd())
        fail("empty JSONPath expression");
    if (!eat('$'))
        fail("JSONPath must start with '$'");
    CompiledPath path;
    readSegments(path, false);
    return path;
}

// Paths embedded in a filter stop at the first character that cannot
// begin another segment.
void
PathCompiler::readSegments(CompiledPath& path, bool embedded)
{
    for (;;) {
        skipSpace();
        if (atEnd())
            return;
        if (embedded && peek() != '.' && peek() != '[')
            return;
        path.segments.push_back(readSegment());
    }
}

Segment
PathCompiler::readSegment()
{
    Segment segment;
    if (peek() == '[') {
        readBracket(segment);
        return segment;
    }
    if (!eat('.'))
        fail("expected '.' or '['");
    segment.descendant = eat('.');
    if (atEnd())
        fail("incomplete JSONPath segment");
    if (peek() == '[') {
        readBracket(segment);
        return segment;
    }
    Selector sel;
    if (eat('*')) {
        sel.kind = Selector::every;
    } else {
        sel.kind = Selector::member;
        sel.key = readName();
    }
    segment.selectors.push_back(std::move(sel));
    return segment;
}

void
PathCompiler::readBracket(Segment& segment)
{
    ++pos_;
    for (;;) {
        segment.selectors.push_back(readSelector());
        skipSpace();
        if (eat(','))
            continue;
        if (atEnd())
            fail("unterminated '['");
        if (!eat(']'))
            fail("expected ']'");
        return;
    }
}

Selector
PathCompiler::readSelector()
{
    skipSpace();
    if (atEnd())
        fail("unterminated '['");
    Selector sel;
    char c = peek();
    if (c == '\'' || c == '"') {
        sel.kind = Selector::member;
        sel.key = readQuoted();
        return sel;
    }
    if (eat('*')) {
        sel.kind = Selector::every;
        return sel;
    }
    if (eat('?')) {
        skipSpace();
        if (!eat('('))
            fail("expected '(' after '?'");
        sel.kind = Selector::predicate;
        sel.expr = readDisjunction();
        skipSpace();
        if (!eat(')'))
            fail("expected ')'");
        return sel;
    }

    long long first = 0;
    bool hasFirst = readInteger(&first);
    skipSpace();
    if (!eat(':')) {
        if (!hasFirst)
            fail("expected quoted name, index, slice or '*' inside brackets");
        sel.kind = Selector::element;
        sel.index = first;
        return sel;
    }
    sel.kind = Selector::range;
    sel.slice.hasFrom = hasFirst;
    sel.slice.from = first;
    sel.slice.hasTo = readInteger(&sel.slice.to);
    skipSpace();
    if (eat(':')) {
        skipSpace();
        size_t at = pos_;
        if (readInteger(&sel.slice.stride) && sel.slice.stride == 0)
            failAt(at, "slice step cannot be zero");
    }
    return sel;
}

bool
PathCompiler::readInteger(long long* out)
{
    skipSpace();
    size_t start = pos_;
    if (peek() == '-' || peek() == '+')
        ++pos_;
    size_t digits = pos_;
    while (std::isdigit(static_cast<unsigned char>(peek())))
        ++pos_;
    if (pos_ == digits) {
        pos_ = start;
        return false;
    }
    std::string number(text_, start, pos_ - start);
    errno = 0;
    *out = std::strtoll(number.c_str(), nullptr, 10);
    if (errno == ERANGE)
        failAt(start, "integer out of range");
    return true;
}

std::string
PathCompiler::readName()
{
    if (!IsNameStart(static_cast<unsigned char>(peek())))
        fail("invalid member name");
    size_t start = pos_;
    while (!atEnd() && IsNameChar(static_cast<unsigned char>(text_[pos_])))
        ++pos_;
    return text_.substr(start, pos_ - start);
}

unsigned
PathCompiler::readHex4()
{
    if (pos_ + 4 > text_.size())
        fail("incomplete unicode escape");
    unsigned value = 0;
    for (int i = 0; i < 4; ++i) {
        unsigned char c = text_[pos_ + i];
        if (!std::isxdigit(c))
            fail("invalid unicode escape");
        value <<= 4;
        value |= std::isdigit(c) ? c - '0' : (std::tolower(c) - 'a' + 10);
    }
    pos_ += 4;
    return value;
}

// Single or double quoted, with the JSON escapes plus \'.
std::string
PathCompiler::readQuoted()
{
    size_t open = pos_;
    char quote = text_[pos_++];
    std::string s;
    for (;;) {
        if (atEnd())
            failAt(open, "unterminated string literal");
        char c = text_[pos_++];
        if (c == quote)
            return s;
        if (c != '\\') {
            s += c;
            continue;
        }
        if (atEnd())
            failAt(open, "unterminated string literal");
        c = text_[pos_++];
        switch (c) {
            case '"':
            case '\'':
            case '/':
            case '\\':
                s += c;
                break;
            case 'b':
                s += '\b';
                break;
            case 'f':
                s += '\f';
                break;
            case 'n':
                s += '\n';
                break;
            case 'r':
                s += '\r';
                break;
            case 't':
                s += '\t';
                break;
            case 'u': {
                unsigned c1 = readHex4();
                if (0xdc00 <= c1 && c1 <= 0xdfff)
                    fail("unpaired low surrogate");
                if (0xd800 <= c1 && c1 <= 0xdbff) {
                    if (!eat('\\') || !eat('u'))
                        fail("unpaired high surrogate");
                    unsigned c2 = readHex4();
                    if (c2 < 0xdc00 || c2 > 0xdfff)
                        fail("invalid low surrogate");
                    c1 = 0x10000 + ((c1 - 0xd800) << 10) + (c2 - 0xdc00);
                }
                AppendUtf8(s, c1);
                break;
            }
            default:
                failAt(pos_ - 1, "invalid escape sequence");
        }
    }
}

std::shared_ptr<const Expr>
PathCompiler::readDisjunction()
{
    std::shared_ptr<const Expr> e = readConjunction();
    for (;;) {
        skipSpace();
        if (text_.compare(pos_, 2, "||") != 0)
            return e;
        pos_ += 2;
        auto parent = std::make_shared<Expr>();
        parent->op = Expr::any_of;
        parent->left = e;
        parent->right = readConjunction();
        e = parent;
    }
}

std::shared_ptr<const Expr>
PathCompiler::readConjunction()
{
    std::shared_ptr<const Expr> e = readUnary();
    for (;;) {
        skipSpace();
        if (text_.compare(pos_, 2, "&&") != 0)
            return e;
        pos_ += 2;
        auto parent = std::make_shared<Expr>();
        parent->op = Expr::all_of;
        parent->left = e;
        parent->right = readUnary();
        e = parent;
    }
}

std::shared_ptr<const Expr>
PathCompiler::readUnary()
{
    skipSpace();
    if (eat('!')) {
        auto e = std::make_shared<Expr>();
        e->op = Expr::negate;
        e->left = readUnary();
        return e;
    }
    if (eat('(')) {
        std::shared_ptr<const Expr> e = readDisjunction();
        skipSpace();
        if (!eat(')'))
            fail("expected ')'");
        return e;
    }
    return readRelation();
}

std::shared_ptr<const Expr>
PathCompiler::readRelation()
{
    auto e = std::make_shared<Expr>();
    e->lhs = readTerm();
    skipSpace();
    const char* spelling = nullptr;
    for (const auto& rel : kRelations) {
        if (text_.compare(pos_, strlen(rel.text), rel.text) == 0) {
            spelling = rel.text;
            e->op = rel.op;
            break;
        }
    }
    if (!spelling) {
        if (e->lhs.pattern)
            fail("regular expression must follow '=~'");
        e->op = Expr::truthy;
        return e;
    }
    pos_ += strlen(spelling);
    skipSpace();
    size_t at = pos_;
    e->rhs = readTerm();
    if (e->lhs.pattern || (e->rhs.pattern && e->op != Expr::matches))
        failAt(at, "regular expression must follow '=~'");
    if (e->op == Expr::matches && e->rhs.kind == Term::constant &&
        !e->rhs.pattern) {
        if (!e->rhs.value.isString())
            failAt(at, "'=~' expects a regular expression");
        try {
            e->rhs.pattern = CompileRegex(e->rhs.value.getString(), false);
        } catch (const std::regex_error& ex) {
            failAt(at, std::string("invalid regular expression: ") + ex.what());
        }
    }
    return e;
}

Term
PathCompiler::readTerm()
{
    skipSpace();
    if (atEnd())
        fail("unexpected end of filter expression");
    Term t;
    char c = peek();
    if (c == '\'' || c == '"') {
        t.value = Json(readQuoted());
        return t;
    }
    if (c == '/')
        return readRegex();
    if (c == '@' || c == '$') {
        ++pos_;
        t.kind = Term::query;
        t.path.relative = c == '@';
        readSegments(t.path, true);
        return t;
    }
    if (c == '-' || c == '+' || std::isdigit(static_cast<unsigned char>(c)))
        return readNumber();
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        size_t at = pos_;
        while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')
            ++pos_;
        std::string word = text_.substr(at, pos_ - at);
        if (word == "true") {
            t.value = Json(true);
        } else if (word == "false") {
            t.value = Json(false);
        } else if (word == "null") {
            t.value = Json(nullptr);
        } else {
            return readCall(word, at);
        }
        return t;
    }
    fail(std::string("unexpected character '") + c + "'");
}

Term
PathCompiler::readNumber()
{
    size_t start = pos_;
    bool digits = false;
    bool integral = true;
    if (peek() == '-' || peek() == '+')
        ++pos_;
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
        ++pos_;
        digits = true;
    }
    if (eat('.')) {
        integral = false;
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            ++pos_;
            digits = true;
        }
    }
    if (digits && (peek() == 'e' || peek() == 'E')) {
        integral = false;
        ++pos_;
        if (peek() == '-' || peek() == '+')
            ++pos_;
        if (!std::isdigit(static_cast<unsigned char>(peek())))
            failAt(start, "invalid numeric literal");
        while (std::isdigit(static_cast<unsigned char>(peek())))
            ++pos_;
    }
    if (!digits)
        failAt(start, "invalid numeric literal");
    std::string number(text_, start, pos_ - start);
    Term t;
    if (integral) {
        errno = 0;
        long long x = std::strtoll(number.c_str(), nullptr, 10);
        if (errno != ERANGE) {
            t.value = Json(x);
            return t;
        }
    }
    t.value = Json(std::strtod(number.c_str(), nullptr));
    return t;
}

// /pattern/ or /pattern/i; a backslash-slash inside stands for '/'.
Term
PathCompiler::readRegex()
{
    size_t open = pos_++;
    std::string source;
    for (;;) {
        if (atEnd())
            failAt(open, "unterminated regular expression");
        char c = text_[pos_++];
        if (c == '/')
            break;
        if (c == '\\' && !atEnd()) {
            c = text_[pos_++];
            if (c != '/')
                source += '\\';
        }
        source += c;
    }
    bool icase = false;
    while (std::isalpha(static_cast<unsigned char>(peek()))) {
        if (peek() != 'i')
            fail("unsupported regular expression flag");
        icase = true;
        ++pos_;
    }
    Term t;
    t.value = Json(source);
    try {
        t.pattern = CompileRegex(source, icase);
    } catch (const std::regex_error& e) {
        failAt(open, std::string("invalid regular expression: ") + e.what());
    }
    return t;
}

Term
PathCompiler::readCall(const std::string& name, size_t at)
{
    std::string lower(name);
    for (char& c : lower)
        c = std::tolower(static_cast<unsigned char>(c));
    Term t;
    t.kind = Term::call;
    if (lower == "length" || lower == "size") {
        t.function = Term::length_of;
    } else if (lower == "count") {
        t.function = Term::count_of;
    } else {
        failAt(at, "unknown function '" + name + "'");
    }
    skipSpace();
    if (!eat('('))
        fail("expected '(' after function name");
    skipSpace();
    if (!eat(')')) {
        for (;;) {
            t.args.push_back(readTerm());
            skipSpace();
            if (eat(','))
                continue;
            if (!eat(')'))
                fail("expected ')' after function arguments");
            break;
        }
    }
    if (t.args.size() != 1)
        failAt(at, name + "() expects exactly one argument");
    return t;
}

// Nodes a filter operand stands for. Function results are owned here,
// everything else points into the document or the compiled path.
struct Operand
{
    std::vector<const Json*> nodes;
    std::unique_ptr<Json> result;
};

static bool
Truthy(const Json& v)
{
    switch (v.getType()) {
        case Json::Null:
            return false;
        case Json::Bool:
            return v.getBool();
        case Json::Long:
        case Json::Double:
            return v.getNumber() != 0;
        case Json::String:
            return !v.getString().empty();
        case Json::Array:
            return !v.getArray().empty();
        case Json::Object:
            return !v.getObject().empty();
        default:
            return false;
    }
}

static bool
AsNumber(const Json& v, double* out)
{
    if (v.isNumber()) {
        *out = v.getNumber();
        return true;
    }
    if (v.isBool()) {
        *out = v.getBool();
        return true;
    }
    return false;
}

template <typename T>
static bool
Ordered(Expr::Op op, const T& a, const T& b)
{
    switch (op) {
        case Expr::lt:
            return a < b;
        case Expr::le:
            return a <= b;
        case Expr::gt:
            return a > b;
        case Expr::ge:
            return a >= b;
        default:
            return false;
    }
}

static long long
SizeOf(const Json& v)
{
    if (v.isString())
        return v.getString().size();
    if (v.isArray())
        return v.getArray().size();
    if (v.isObject())
        return v.getObject().size();
    return 0;
}

static void
AddChildren(const Json& v, std::vector<const Json*>& out)
{
    if (v.isArray()) {
        for (const Json& item : v.getArray())
            out.push_back(&item);
    } else if (v.isObject()) {
        for (const auto& member : v.getObject())
            out.push_back(&member.second);
    }
}

// Pre-order: a node precedes its children, and members come in key
// order.
static void
AddSubtree(const Json& v, std::vector<const Json*>& out)
{
    out.push_back(&v);
    if (v.isArray()) {
        for (const Json& item : v.getArray())
            AddSubtree(item, out);
    } else if (v.isObject()) {
        for (const auto& member : v.getObject())
            AddSubtree(member.second, out);
    }
}

static void
AddRange(const Json& v, const Range& r, std::vector<const Json*>& out)
{
    if (!v.isArray())
        return;
    const std::vector<Json>& items = v.getArray();
    long long n = items.size();
    if (r.stride > 0) {
        long long lo = r.hasFrom ? r.from : 0;
        long long hi = r.hasTo ? r.to : n;
        if (lo < 0)
            lo += n;
        if (hi < 0)
            hi += n;
        lo = lo < 0 ? 0 : lo > n ? n : lo;
        hi = hi < 0 ? 0 : hi > n ? n : hi;
        for (long long i = lo; i < hi; i += r.stride) {
            out.push_back(&items[i]);
            if (r.stride >= hi - i)
                break;
        }
    } else {
        long long hi = r.hasFrom ? r.from : n - 1;
        long long lo = r.hasTo ? r.to : -1;
        if (r.hasFrom && hi < 0)
            hi += n;
        if (r.hasTo && lo < 0)
            lo += n;
        hi = hi < -1 ? -1 : hi > n - 1 ? n - 1 : hi;
        lo = lo < -1 ? -1 : lo > n - 1 ? n - 1 : lo;
        for (long long i = hi; i > lo; i += r.stride)
            out.push_back(&items[i]);
    }
}

class Matcher
{
  public:
    explicit Matcher(const Json& root) : root_(root)
    {
    }

    std::vector<const Json*> run(const CompiledPath& path,
                                 const Json& start) const;

  private:
    const Json& root_;

    void select(const Selector& sel,
                const Json& node,
                std::vector<const Json*>& out) const;
    bool test(const Expr& e, const Json& current) const;
    bool compare(const Expr& e, const Operand& a, const Operand& b) const;
    bool search(const Expr& e, const Operand& a, const Operand& b) const;
    Operand resolve(const Term& t, const Json& current) const;
};

std::vector<const Json*>
Matcher::run(const CompiledPath& path, const Json& start) const
{
    std::vector<const Json*> nodes(1, &start);
    std::vector<const Json*> scope;
    std::vector<const Json*> found;
    for (const Segment& segment : path.segments) {
        scope.clear();
        if (segment.descendant) {
            for (const Json* node : nodes)
                AddSubtree(*node, scope);
        } else {
            scope.swap(nodes);
        }
        found.clear();
        for (const Json* node : scope)
            for (const Selector& sel : segment.selectors)
                select(sel, *node, found);
        nodes.swap(found);
        if (nodes.empty())
            break;
    }
    return nodes;
}

void
Matcher::select(const Selector& sel,
                const Json& node,
                std::vector<const Json*>& out) const
{
    switch (sel.kind) {
        case Selector::member:
            if (node.isObject()) {
                const std::map<std::string, Json>& members = node.getObject();
                auto it = members.find(sel.key);
                if (it != members.end())
                    out.push_back(&it->second);
            }
            break;
        case Selector::element:
            if (node.isArray()) {
                const std::vector<Json>& items = node.getArray();
                long long n = items.size();
                long long i = sel.index < 0 ? sel.index + n : sel.index;
                if (0 <= i && i < n)
                    out.push_back(&items[i]);
            }
            break;
        case Selector::range:
            AddRange(node, sel.slice, out);
            break;
        case Selector::every:
            AddChildren(node, out);
            break;
        case Selector::predicate: {
            std::vector<const Json*> children;
            AddChildren(node, children);
            for (const Json* child : children)
                if (test(*sel.expr, *child))
                    out.push_back(child);
            break;
        }
    }
}

bool
Matcher::test(const Expr& e, const Json& current) const
{
    switch (e.op) {
        case Expr::any_of:
            return test(*e.left, current) || test(*e.right, current);
        case Expr::all_of:
            return test(*e.left, current) && test(*e.right, current);
        case Expr::negate:
            return !test(*e.left, current);
        case Expr::truthy: {
            Operand a = resolve(e.lhs, current);
            for (const Json* v : a.nodes)
                if (Truthy(*v))
                    return true;
            return false;
        }
        default:
            return compare(e, resolve(e.lhs, current), resolve(e.rhs, current));
    }
}

// Operands are nodelists; a comparison holds if any pairing satisfies
// it, except != which needs a left node unequal to every right node.
bool
Matcher::compare(const Expr& e, const Operand& a, const Operand& b) const
{
    switch (e.op) {
        case Expr::eq:
            for (const Json* x : a.nodes)
                for (const Json* y : b.nodes)
                    if (*x == *y)
                        return true;
            return false;
        case Expr::ne:
            if (a.nodes.empty())
                return false;
            for (const Json* x : a.nodes) {
                bool same = false;
                for (const Json* y : b.nodes)
                    if (*x == *y) {
                        same = true;
                        break;
                    }
                if (!same)
                    return true;
            }
            return false;
        case Expr::matches:
            return search(e, a, b);
        default:
            for (const Json* x : a.nodes) {
                for (const Json* y : b.nodes) {
                    double dx, dy;
                    if (AsNumber(*x, &dx) && AsNumber(*y, &dy)) {
                        if (Ordered(e.op, dx, dy))
                            return true;
                    } else if (x->isString() && y->isString()) {
                        if (Ordered(e.op, x->getString(), y->getString()))
                            return true;
                    }
                }
            }
            return false;
    }
}

bool
Matcher::search(const Expr& e, const Operand& a, const Operand& b) const
{
    if (a.nodes.empty() || b.nodes.empty())
        return false;
    std::shared_ptr<const std::regex> re = e.rhs.pattern;
    if (!re) {
        const Json& source = *b.nodes.front();
        if (!source.isString())
            return false;
        try {
            re = CompileRegex(source.getString(), false);
        } catch (const std::regex_error& ex) {
            throw JsonPathError("invalid regular expression \"" +
                                source.getString() + "\": " + ex.what());
        }
    }
    for (const Json* x : a.nodes)
        if (x->isString() && std::regex_search(x->getString(), *re))
            return true;
    return false;
}

// length() and size() measure the first node of their argument.
// count() does the same for containers and counts a scalar as one.
Operand
Matcher::resolve(const Term& t, const Json& current) const
{
    Operand r;
    switch (t.kind) {
        case Term::constant:
            r.nodes.push_back(&t.value);
            break;
        case Term::query:
            r.nodes = run(t.path, t.path.relative ? current : root_);
            break;
        case Term::call: {
            Operand arg = resolve(t.args.front(), current);
            long long n = 0;
            if (!arg.nodes.empty()) {
                const Json& v = *arg.nodes.front();
                if (t.function == Term::count_of &&
                    !v.isArray() && !v.isObject())
                    n = 1;
                else
                    n = SizeOf(v);
            }
            r.result.reset(new Json(n));
            r.nodes.push_back(r.result.get());
            break;
        }
    }
    return r;
}

} // namespace detail

JsonPath::JsonPath(const std::string& expression,
                   std::shared_ptr<const detail::CompiledPath> compiled)
  : expression_(expression), compiled_(std::move(compiled))
{
}

JsonPath
JsonPath::parse(const std::string& expression)
{
    try {
        detail::PathCompiler compiler(expression);
        auto compiled = std::make_shared<detail::CompiledPath>(compiler.compile());
        return JsonPath(expression, std::move(compiled));
    } catch (const detail::SyntaxError& e) {
        throw JsonPathError("JSONPath parse error at position " +
                            std::to_string(e.position()) + " in '" +
                            expression + "': " + e.what());
    }
}

std::vector<const Json*>
JsonPath::evaluate(const Json& document) const
{
    return detail::Matcher(document).run(*compiled_, document);
}

} // namespace qj
