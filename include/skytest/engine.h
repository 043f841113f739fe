#pragma once

#include "skytest/value.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace skytest {

class SnapshotManager;

// Top-level bindings produced by executing a file, sorted by name.
using Namespace = std::map<std::string, Value>;

// Per-thread execution state handed to the engine. Each test gets a fresh one.
//
// The engine must call check_cancelled() between evaluation steps and report
// executed lines through on_exec() when a hook is installed.
class ExecutionContext {
public:
    using ExecHook = std::function<void(std::string_view file, int line)>;

    explicit ExecutionContext(std::string name = {});

    ExecutionContext(const ExecutionContext &)            = delete;
    ExecutionContext &operator=(const ExecutionContext &) = delete;

    const std::string &name() const { return name_; }

    // Thread-safe; the first reason wins.
    void        cancel(std::string reason);
    bool        cancelled() const { return cancelled_.load(std::memory_order_acquire); }
    std::string cancel_reason() const;
    // Throws TimeoutError carrying the cancel reason if cancelled.
    void check_cancelled() const;

    void set_exec_hook(ExecHook hook) { hook_ = std::move(hook); }
    void on_exec(std::string_view file, int line) const {
        if (hook_)
            hook_(file, line);
    }

    void             set_snapshots(SnapshotManager *snapshots) { snapshots_ = snapshots; }
    SnapshotManager *snapshots() const { return snapshots_; }

    // Output of print() during execution.
    void        print(std::string_view text);
    std::string captured_output() const;

private:
    std::string       name_;
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mtx_;
    std::string       cancel_reason_;
    std::string       output_;
    ExecHook          hook_;
    SnapshotManager  *snapshots_ = nullptr;
};

// Anything callable from Starlark. Exceptions thrown by call() propagate
// through the engine to the caller unchanged.
class Callable {
public:
    virtual ~Callable() = default;

    virtual std::string              name() const = 0;
    virtual std::vector<std::string> param_names() const { return {}; }
    virtual Value                    call(ExecutionContext &ctx, const Args &args, const Kwargs &kwargs) = 0;
};

// A callable implemented on the host side.
class Builtin : public Callable {
public:
    using Fn = std::function<Value(ExecutionContext &, const Args &, const Kwargs &)>;

    Builtin(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

    std::string name() const override { return name_; }
    Value       call(ExecutionContext &ctx, const Args &args, const Kwargs &kwargs) override { return fn_(ctx, args, kwargs); }

private:
    std::string name_;
    Fn          fn_;
};

Value make_builtin(std::string name, Builtin::Fn fn);

// Calls `callee`, throwing EvalError if it is not callable.
Value call_value(ExecutionContext &ctx, const Value &callee, const Args &args = {}, const Kwargs &kwargs = {});

// The Starlark interpreter. Implementations must allow concurrent exec_file
// calls on distinct contexts.
class Engine {
public:
    virtual ~Engine() = default;

    // Parses and executes `source`, returning its globals. Throws EvalError.
    virtual Namespace exec_file(ExecutionContext &ctx, const std::string &filename, std::string_view source,
                                const Namespace &predeclared) = 0;
};

// Positional/keyword binding for builtins. Parameters after `required` are
// optional and default to None. Throws EvalError on arity or name mismatch.
std::vector<Value> unpack_args(std::string_view fn, const Args &args, const Kwargs &kwargs, const std::vector<std::string_view> &params,
                               std::size_t required);

} // namespace skytest
