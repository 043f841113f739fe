#pragma once

#include "skytest/engine.h"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace skytest {

class MockManager;

// Recording stand-in for a callable. Owned by the MockManager that created it.
class MockWrapper : public Callable {
public:
    MockWrapper(int id, Value wrapped, MockManager &manager) : id_(id), wrapped_(std::move(wrapped)), manager_(manager) {}

    int          id() const { return id_; }
    const Value &wrapped() const { return wrapped_; }

    std::string              name() const override;
    std::vector<std::string> param_names() const override;
    Value                    call(ExecutionContext &ctx, const Args &args, const Kwargs &kwargs) override;

private:
    int          id_;
    Value        wrapped_;
    MockManager &manager_;
};

struct MockCall {
    Args   args;
    Kwargs kwargs;
};

// Builder returned by MockManager::when().
class MockWhen {
public:
    MockWhen(MockManager &manager, std::shared_ptr<MockWrapper> wrapper, std::optional<Args> args = std::nullopt)
        : manager_(manager), wrapper_(std::move(wrapper)), args_(std::move(args)) {}

    MockWhen called_with(Args args) const { return MockWhen(manager_, wrapper_, std::move(args)); }
    void     then_return(Value value) const;

    const std::shared_ptr<MockWrapper> &wrapper() const { return wrapper_; }

private:
    MockManager                 &manager_;
    std::shared_ptr<MockWrapper> wrapper_;
    std::optional<Args>          args_;
};

// Owns every wrapper created during a file run plus their configuration.
class MockManager {
public:
    MockManager() = default;

    MockManager(const MockManager &)            = delete;
    MockManager &operator=(const MockManager &) = delete;

    // Same callable -> same wrapper. Throws MockError for non-callables.
    std::shared_ptr<MockWrapper> wrap(const Value &fn);

    // Throws MockError when `v` is not a wrapper created by this manager.
    MockWhen when(const Value &v);

    void set_return(const MockWrapper &w, Value value);
    void set_return_for_args(const MockWrapper &w, const Args &args, Value value);

    bool                  was_called(const MockWrapper &w) const;
    std::size_t           call_count(const MockWrapper &w) const;
    std::vector<MockCall> calls(const MockWrapper &w) const;

    // Drops every wrapper and its configuration.
    void reset();

    // The `mock` module exposed to Starlark. Lives as long as the manager.
    Value module();

private:
    friend class MockWrapper;

    struct MockConfig {
        std::optional<Value>         return_value;
        std::map<std::string, Value> return_values; // keyed by args_key()
        std::vector<MockCall>        calls;
    };

    std::optional<Value> configured_return(const MockWrapper &w, const Args &args) const;
    void                 record_call(const MockWrapper &w, const Args &args, const Kwargs &kwargs);

    std::shared_ptr<MockWrapper> wrapper_arg(const Value &v, std::string_view fn) const;

    mutable std::shared_mutex                               mtx_;
    std::map<const MockWrapper *, MockConfig>               configs_;
    std::map<const Callable *, std::shared_ptr<MockWrapper>> wrapped_;
    int                                                     next_id_ = 0;
};

// Canonical key for a positional argument list: "()" or the tuple repr.
std::string args_key(const Args &args);

} // namespace skytest
