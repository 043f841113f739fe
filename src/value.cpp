#include "skytest/value.h"

#include "skytest/engine.h"
#include "skytest/errors.h"

#include <algorithm>
#include <fmt/format.h>

namespace skytest {

namespace {

template <typename T> const T &expect(const auto &storage, std::string_view want, const Value &self) {
    if (const auto *p = std::get_if<T>(&storage))
        return *p;
    throw EvalError(fmt::format("expected {}, got {}", want, self.type_name()));
}

std::string join_repr(const std::vector<Value> &items) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i != 0)
            out += ", ";
        out += items[i].repr();
    }
    return out;
}

std::optional<int> compare_sequences(const std::vector<Value> &lhs, const std::vector<Value> &rhs) {
    const std::size_t n = std::min(lhs.size(), rhs.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (lhs[i] == rhs[i])
            continue;
        return compare_values(lhs[i], rhs[i]);
    }
    if (lhs.size() == rhs.size())
        return 0;
    return lhs.size() < rhs.size() ? -1 : 1;
}

bool is_number(Value::Kind k) { return k == Value::Kind::Int || k == Value::Kind::Float; }

template <typename T> int three_way(const T &a, const T &b) { return a < b ? -1 : (b < a ? 1 : 0); }

} // namespace

Value Value::boolean(bool b) { return Value(Storage{b}); }
Value Value::integer(std::int64_t i) { return Value(Storage{i}); }
Value Value::floating(double d) { return Value(Storage{d}); }
Value Value::string(std::string s) { return Value(Storage{std::move(s)}); }
Value Value::bytes(std::string data) { return Value(Storage{BytesBox{std::move(data)}}); }
Value Value::list(std::vector<Value> items) { return Value(Storage{std::make_shared<ListValue>(ListValue{std::move(items)})}); }
Value Value::tuple(std::vector<Value> items) { return Value(Storage{std::make_shared<TupleValue>(TupleValue{std::move(items)})}); }

Value Value::dict(std::vector<std::pair<Value, Value>> entries) {
    auto d = std::make_shared<DictValue>();
    for (auto &[k, v] : entries)
        d->insert_or_assign(std::move(k), std::move(v));
    return Value(Storage{std::move(d)});
}

Value Value::set(std::vector<Value> items) {
    auto s = std::make_shared<SetValue>();
    for (auto &v : items)
        s->insert(std::move(v));
    return Value(Storage{std::move(s)});
}

Value Value::structure(std::string name, std::vector<std::pair<std::string, Value>> fields) {
    return Value(Storage{std::make_shared<StructValue>(StructValue{std::move(name), std::move(fields)})});
}

Value Value::callable(std::shared_ptr<Callable> fn) { return Value(Storage{std::move(fn)}); }
Value Value::opaque(std::shared_ptr<OpaqueValue> v) { return Value(Storage{std::move(v)}); }

Value::Kind Value::kind() const { return static_cast<Kind>(data_.index()); }

std::string Value::type_name() const {
    switch (kind()) {
    case Kind::None: return "NoneType";
    case Kind::Bool: return "bool";
    case Kind::Int: return "int";
    case Kind::Float: return "float";
    case Kind::String: return "string";
    case Kind::Bytes: return "bytes";
    case Kind::List: return "list";
    case Kind::Tuple: return "tuple";
    case Kind::Dict: return "dict";
    case Kind::Set: return "set";
    case Kind::Struct: return as_struct()->name == "struct" ? "struct" : "module";
    case Kind::Callable: return "function";
    case Kind::Opaque: return as_opaque()->type_name();
    }
    return "unknown";
}

bool Value::truth() const {
    switch (kind()) {
    case Kind::None: return false;
    case Kind::Bool: return std::get<bool>(data_);
    case Kind::Int: return std::get<std::int64_t>(data_) != 0;
    case Kind::Float: return std::get<double>(data_) != 0.0;
    case Kind::String: return !std::get<std::string>(data_).empty();
    case Kind::Bytes: return !std::get<BytesBox>(data_).data.empty();
    case Kind::List:
    case Kind::Tuple:
    case Kind::Set: return !elements()->empty();
    case Kind::Dict: return !as_dict()->entries.empty();
    case Kind::Struct:
    case Kind::Callable:
    case Kind::Opaque: return true;
    }
    return true;
}

bool Value::as_bool() const { return expect<bool>(data_, "bool", *this); }
std::int64_t Value::as_int() const { return expect<std::int64_t>(data_, "int", *this); }

double Value::as_float() const {
    if (const auto *i = std::get_if<std::int64_t>(&data_))
        return static_cast<double>(*i);
    return expect<double>(data_, "float", *this);
}

const std::string &Value::as_string() const {
    if (const auto *b = std::get_if<BytesBox>(&data_))
        return b->data;
    return expect<std::string>(data_, "string", *this);
}

const std::shared_ptr<ListValue> &Value::as_list() const { return expect<std::shared_ptr<ListValue>>(data_, "list", *this); }
const std::shared_ptr<TupleValue> &Value::as_tuple() const { return expect<std::shared_ptr<TupleValue>>(data_, "tuple", *this); }
const std::shared_ptr<DictValue> &Value::as_dict() const { return expect<std::shared_ptr<DictValue>>(data_, "dict", *this); }
const std::shared_ptr<SetValue> &Value::as_set() const { return expect<std::shared_ptr<SetValue>>(data_, "set", *this); }
const std::shared_ptr<StructValue> &Value::as_struct() const { return expect<std::shared_ptr<StructValue>>(data_, "struct", *this); }
const std::shared_ptr<Callable> &Value::as_callable() const { return expect<std::shared_ptr<Callable>>(data_, "callable", *this); }
const std::shared_ptr<OpaqueValue> &Value::as_opaque() const { return expect<std::shared_ptr<OpaqueValue>>(data_, "opaque value", *this); }

const std::vector<Value> *Value::elements() const {
    switch (kind()) {
    case Kind::List: return &as_list()->items;
    case Kind::Tuple: return &as_tuple()->items;
    case Kind::Set: return &as_set()->items;
    default: return nullptr;
    }
}

std::string Value::str() const {
    if (kind() == Kind::String)
        return std::get<std::string>(data_);
    return repr();
}

std::string Value::repr() const {
    switch (kind()) {
    case Kind::None: return "None";
    case Kind::Bool: return std::get<bool>(data_) ? "True" : "False";
    case Kind::Int: return fmt::format("{}", std::get<std::int64_t>(data_));
    case Kind::Float: {
        std::string s = fmt::format("{}", std::get<double>(data_));
        if (s.find_first_of(".eEn") == std::string::npos)
            s += ".0";
        return s;
    }
    case Kind::String: return quote_string(std::get<std::string>(data_));
    case Kind::Bytes: return "b" + quote_string(std::get<BytesBox>(data_).data);
    case Kind::List: return "[" + join_repr(as_list()->items) + "]";
    case Kind::Tuple: {
        const auto &items = as_tuple()->items;
        if (items.size() == 1)
            return "(" + items.front().repr() + ",)";
        return "(" + join_repr(items) + ")";
    }
    case Kind::Dict: {
        std::string out = "{";
        bool        first = true;
        for (const auto &[k, v] : as_dict()->entries) {
            if (!first)
                out += ", ";
            first = false;
            out += k.repr() + ": " + v.repr();
        }
        return out + "}";
    }
    case Kind::Set: return "set([" + join_repr(as_set()->items) + "])";
    case Kind::Struct: {
        const auto &s = *as_struct();
        if (s.name != "struct")
            return fmt::format("<module \"{}\">", s.name);
        std::string out   = "struct(";
        bool        first = true;
        for (const auto &[k, v] : s.fields) {
            if (!first)
                out += ", ";
            first = false;
            out += k + " = " + v.repr();
        }
        return out + ")";
    }
    case Kind::Callable: return fmt::format("<function {}>", as_callable()->name());
    case Kind::Opaque: return as_opaque()->str();
    }
    return "?";
}

bool operator==(const Value &lhs, const Value &rhs) {
    const auto lk = lhs.kind();
    const auto rk = rhs.kind();
    if (is_number(lk) && is_number(rk)) {
        if (lk == Value::Kind::Int && rk == Value::Kind::Int)
            return lhs.as_int() == rhs.as_int();
        return lhs.as_float() == rhs.as_float();
    }
    if (lk != rk)
        return false;
    switch (lk) {
    case Value::Kind::None: return true;
    case Value::Kind::Bool: return lhs.as_bool() == rhs.as_bool();
    case Value::Kind::String:
    case Value::Kind::Bytes: return lhs.as_string() == rhs.as_string();
    case Value::Kind::List:
    case Value::Kind::Tuple: return *lhs.elements() == *rhs.elements();
    case Value::Kind::Set: {
        const auto &a = lhs.as_set()->items;
        const auto &b = rhs.as_set()->items;
        if (a.size() != b.size())
            return false;
        return std::all_of(a.begin(), a.end(), [&](const Value &v) { return std::find(b.begin(), b.end(), v) != b.end(); });
    }
    case Value::Kind::Dict: {
        const auto &a = *lhs.as_dict();
        const auto &b = *rhs.as_dict();
        if (a.entries.size() != b.entries.size())
            return false;
        for (const auto &[k, v] : a.entries) {
            const Value *other = b.find(k);
            if (!other || !(*other == v))
                return false;
        }
        return true;
    }
    case Value::Kind::Struct: {
        const auto &a = *lhs.as_struct();
        const auto &b = *rhs.as_struct();
        if (a.name != b.name || a.fields.size() != b.fields.size())
            return false;
        for (const auto &[k, v] : a.fields) {
            const Value *other = b.attr(k);
            if (!other || !(*other == v))
                return false;
        }
        return true;
    }
    case Value::Kind::Callable: return lhs.as_callable() == rhs.as_callable();
    case Value::Kind::Opaque: return lhs.as_opaque() == rhs.as_opaque();
    default: return false;
    }
}

const Value *DictValue::find(const Value &key) const {
    for (const auto &[k, v] : entries) {
        if (k == key)
            return &v;
    }
    return nullptr;
}

const Value *DictValue::find(std::string_view key) const {
    for (const auto &[k, v] : entries) {
        if (k.is_string() && k.as_string() == key)
            return &v;
    }
    return nullptr;
}

void DictValue::insert_or_assign(Value key, Value value) {
    for (auto &[k, v] : entries) {
        if (k == key) {
            v = std::move(value);
            return;
        }
    }
    entries.emplace_back(std::move(key), std::move(value));
}

bool SetValue::insert(Value v) {
    if (std::find(items.begin(), items.end(), v) != items.end())
        return false;
    items.push_back(std::move(v));
    return true;
}

const Value *StructValue::attr(std::string_view field) const {
    for (const auto &[k, v] : fields) {
        if (k == field)
            return &v;
    }
    return nullptr;
}

std::optional<int> compare_values(const Value &lhs, const Value &rhs) {
    const auto lk = lhs.kind();
    const auto rk = rhs.kind();
    if (is_number(lk) && is_number(rk)) {
        if (lk == Value::Kind::Int && rk == Value::Kind::Int)
            return three_way(lhs.as_int(), rhs.as_int());
        const double a = lhs.as_float();
        const double b = rhs.as_float();
        if (a != a || b != b)
            return std::nullopt;
        return three_way(a, b);
    }
    if (lk != rk)
        return std::nullopt;
    switch (lk) {
    case Value::Kind::None: return 0;
    case Value::Kind::Bool: return three_way(lhs.as_bool(), rhs.as_bool());
    case Value::Kind::String:
    case Value::Kind::Bytes: return three_way(lhs.as_string(), rhs.as_string());
    case Value::Kind::List:
    case Value::Kind::Tuple: return compare_sequences(*lhs.elements(), *rhs.elements());
    default: return std::nullopt;
    }
}

bool value_less(const Value &lhs, const Value &rhs) {
    const std::string lt = lhs.type_name();
    const std::string rt = rhs.type_name();
    if (lt != rt)
        return lt < rt;
    if (const auto c = compare_values(lhs, rhs))
        return *c < 0;
    return lhs.repr() < rhs.repr();
}

std::string quote_string(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (const char ch : s) {
        switch (ch) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20 || ch == 0x7f)
                out += fmt::format("\\x{:02x}", static_cast<unsigned char>(ch));
            else
                out.push_back(ch);
            break;
        }
    }
    out.push_back('"');
    return out;
}

} // namespace skytest
