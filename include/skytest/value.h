#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace skytest {

class Value;
class Callable;
class ExecutionContext;

using Args   = std::vector<Value>;
using Kwargs = std::vector<std::pair<std::string, Value>>;

struct ListValue;
struct TupleValue;
struct DictValue;
struct SetValue;
struct StructValue;

// Engine-specific value the library does not interpret (a rule, a target, ...).
class OpaqueValue {
public:
    virtual ~OpaqueValue() = default;

    virtual std::string type_name() const = 0;
    virtual std::string str() const       = 0;
};

// A Starlark value as seen from the host side. Containers and callables have
// reference semantics: copies of a Value share the underlying object.
class Value {
public:
    enum class Kind {
        None,
        Bool,
        Int,
        Float,
        String,
        Bytes,
        List,
        Tuple,
        Dict,
        Set,
        Struct,
        Callable,
        Opaque,
    };

    Value() = default;

    static Value boolean(bool b);
    static Value integer(std::int64_t i);
    static Value floating(double d);
    static Value string(std::string s);
    static Value bytes(std::string data);
    static Value list(std::vector<Value> items = {});
    static Value tuple(std::vector<Value> items = {});
    static Value dict(std::vector<std::pair<Value, Value>> entries = {});
    static Value set(std::vector<Value> items = {});
    static Value structure(std::string name, std::vector<std::pair<std::string, Value>> fields);
    static Value callable(std::shared_ptr<Callable> fn);
    static Value opaque(std::shared_ptr<OpaqueValue> v);

    Kind        kind() const;
    std::string type_name() const;
    bool        truth() const;

    bool is_none() const { return kind() == Kind::None; }
    bool is_string() const { return kind() == Kind::String; }
    bool is_callable() const { return kind() == Kind::Callable; }

    bool                                as_bool() const;
    std::int64_t                        as_int() const;
    double                              as_float() const; // Int or Float
    const std::string                  &as_string() const; // String or Bytes
    const std::shared_ptr<ListValue>   &as_list() const;
    const std::shared_ptr<TupleValue>  &as_tuple() const;
    const std::shared_ptr<DictValue>   &as_dict() const;
    const std::shared_ptr<SetValue>    &as_set() const;
    const std::shared_ptr<StructValue> &as_struct() const;
    const std::shared_ptr<Callable>    &as_callable() const;
    const std::shared_ptr<OpaqueValue> &as_opaque() const;

    // Elements of a list, tuple or set; nullptr for anything else.
    const std::vector<Value> *elements() const;

    // Starlark str(): strings unquoted, everything else as repr().
    std::string str() const;
    // Starlark repr().
    std::string repr() const;

    // Structural equality; callables and opaque values compare by identity.
    friend bool operator==(const Value &lhs, const Value &rhs);
    friend bool operator!=(const Value &lhs, const Value &rhs) { return !(lhs == rhs); }

private:
    struct BytesBox {
        std::string data;
    };

    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, BytesBox, std::shared_ptr<ListValue>,
                                 std::shared_ptr<TupleValue>, std::shared_ptr<DictValue>, std::shared_ptr<SetValue>,
                                 std::shared_ptr<StructValue>, std::shared_ptr<Callable>, std::shared_ptr<OpaqueValue>>;

    explicit Value(Storage s) : data_(std::move(s)) {}

    Storage data_;
};

struct ListValue {
    std::vector<Value> items;
};

struct TupleValue {
    std::vector<Value> items;
};

// Insertion ordered, keys unique.
struct DictValue {
    std::vector<std::pair<Value, Value>> entries;

    const Value *find(const Value &key) const;
    const Value *find(std::string_view key) const;
    void         insert_or_assign(Value key, Value value);
};

// Insertion ordered, elements unique.
struct SetValue {
    std::vector<Value> items;

    bool insert(Value v);
};

// A struct(...) or a module namespace such as `assert`.
struct StructValue {
    std::string                                 name;
    std::vector<std::pair<std::string, Value>>  fields;

    const Value *attr(std::string_view field) const;
};

// Natural ordering between two values. Returns std::nullopt when the values
// are not mutually comparable (different types, dicts, callables...).
std::optional<int> compare_values(const Value &lhs, const Value &rhs);

// Total order used for deterministic output: type name first, then the
// natural ordering, then repr().
bool value_less(const Value &lhs, const Value &rhs);

// Quote a string the way Starlark's repr does.
std::string quote_string(std::string_view s);

} // namespace skytest
