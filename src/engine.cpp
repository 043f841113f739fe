#include "skytest/engine.h"

#include "skytest/errors.h"

#include <fmt/format.h>

namespace skytest {

ExecutionContext::ExecutionContext(std::string name) : name_(std::move(name)) {}

void ExecutionContext::cancel(std::string reason) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (cancelled_.load(std::memory_order_relaxed))
        return;
    cancel_reason_ = std::move(reason);
    cancelled_.store(true, std::memory_order_release);
}

std::string ExecutionContext::cancel_reason() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return cancel_reason_;
}

void ExecutionContext::check_cancelled() const {
    if (cancelled())
        throw TimeoutError(cancel_reason());
}

void ExecutionContext::print(std::string_view text) {
    std::lock_guard<std::mutex> lk(mtx_);
    output_.append(text);
    output_.push_back('\n');
}

std::string ExecutionContext::captured_output() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return output_;
}

Value make_builtin(std::string name, Builtin::Fn fn) { return Value::callable(std::make_shared<Builtin>(std::move(name), std::move(fn))); }

Value call_value(ExecutionContext &ctx, const Value &callee, const Args &args, const Kwargs &kwargs) {
    if (!callee.is_callable())
        throw EvalError(fmt::format("invalid call of non-function ({})", callee.type_name()));
    return callee.as_callable()->call(ctx, args, kwargs);
}

std::vector<Value> unpack_args(std::string_view fn, const Args &args, const Kwargs &kwargs, const std::vector<std::string_view> &params,
                               std::size_t required) {
    if (args.size() > params.size())
        throw EvalError(fmt::format("{}: got {} arguments, want at most {}", fn, args.size(), params.size()));
    std::vector<Value> out(params.size());
    std::vector<bool>  seen(params.size(), false);
    for (std::size_t i = 0; i < args.size(); ++i) {
        out[i]  = args[i];
        seen[i] = true;
    }
    for (const auto &[key, value] : kwargs) {
        std::size_t idx = 0;
        while (idx < params.size() && params[idx] != key)
            ++idx;
        if (idx == params.size())
            throw EvalError(fmt::format("{}: unexpected keyword argument \"{}\"", fn, key));
        if (seen[idx])
            throw EvalError(fmt::format("{}: got multiple values for parameter \"{}\"", fn, key));
        out[idx]  = value;
        seen[idx] = true;
    }
    for (std::size_t i = 0; i < required; ++i) {
        if (!seen[i])
            throw EvalError(fmt::format("{}: missing argument for {}", fn, params[i]));
    }
    return out;
}

} // namespace skytest
