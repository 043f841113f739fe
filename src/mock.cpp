#include "skytest/mock.h"

#include "skytest/errors.h"

#include <fmt/format.h>
#include <mutex>

namespace skytest {

std::string args_key(const Args &args) {
    if (args.empty())
        return "()";
    return Value::tuple(args).repr();
}

std::string MockWrapper::name() const {
    if (wrapped_.is_callable())
        return wrapped_.as_callable()->name();
    return "mock";
}

std::vector<std::string> MockWrapper::param_names() const {
    if (wrapped_.is_callable())
        return wrapped_.as_callable()->param_names();
    return {};
}

Value MockWrapper::call(ExecutionContext &ctx, const Args &args, const Kwargs &kwargs) {
    manager_.record_call(*this, args, kwargs);
    if (auto ret = manager_.configured_return(*this, args))
        return *ret;
    if (!wrapped_.is_callable())
        return Value();
    return wrapped_.as_callable()->call(ctx, args, kwargs);
}

void MockWhen::then_return(Value value) const {
    if (args_)
        manager_.set_return_for_args(*wrapper_, *args_, std::move(value));
    else
        manager_.set_return(*wrapper_, std::move(value));
}

std::shared_ptr<MockWrapper> MockManager::wrap(const Value &fn) {
    if (!fn.is_callable())
        throw MockError(fmt::format("mock.wrap: expected callable, got {}", fn.type_name()));
    std::unique_lock lk(mtx_);
    const Callable  *key = fn.as_callable().get();
    if (auto it = wrapped_.find(key); it != wrapped_.end())
        return it->second;
    auto wrapper = std::make_shared<MockWrapper>(++next_id_, fn, *this);
    configs_.emplace(wrapper.get(), MockConfig{});
    wrapped_.emplace(key, wrapper);
    return wrapper;
}

std::shared_ptr<MockWrapper> MockManager::wrapper_arg(const Value &v, std::string_view fn) const {
    std::shared_ptr<MockWrapper> w;
    if (v.is_callable())
        w = std::dynamic_pointer_cast<MockWrapper>(v.as_callable());
    if (!w)
        throw MockError(fmt::format("{}: expected mock wrapper, got {} (use mock.wrap() first)", fn, v.type_name()));
    return w;
}

MockWhen MockManager::when(const Value &v) { return MockWhen(*this, wrapper_arg(v, "mock.when")); }

void MockManager::set_return(const MockWrapper &w, Value value) {
    std::unique_lock lk(mtx_);
    if (auto it = configs_.find(&w); it != configs_.end())
        it->second.return_value = std::move(value);
}

void MockManager::set_return_for_args(const MockWrapper &w, const Args &args, Value value) {
    std::unique_lock lk(mtx_);
    if (auto it = configs_.find(&w); it != configs_.end())
        it->second.return_values.insert_or_assign(args_key(args), std::move(value));
}

std::optional<Value> MockManager::configured_return(const MockWrapper &w, const Args &args) const {
    std::shared_lock lk(mtx_);
    auto             it = configs_.find(&w);
    if (it == configs_.end())
        return std::nullopt;
    if (auto r = it->second.return_values.find(args_key(args)); r != it->second.return_values.end())
        return r->second;
    return it->second.return_value;
}

void MockManager::record_call(const MockWrapper &w, const Args &args, const Kwargs &kwargs) {
    std::unique_lock lk(mtx_);
    if (auto it = configs_.find(&w); it != configs_.end())
        it->second.calls.push_back(MockCall{args, kwargs});
}

bool MockManager::was_called(const MockWrapper &w) const { return call_count(w) > 0; }

std::size_t MockManager::call_count(const MockWrapper &w) const {
    std::shared_lock lk(mtx_);
    auto             it = configs_.find(&w);
    return it == configs_.end() ? 0 : it->second.calls.size();
}

std::vector<MockCall> MockManager::calls(const MockWrapper &w) const {
    std::shared_lock lk(mtx_);
    auto             it = configs_.find(&w);
    if (it == configs_.end())
        return {};
    return it->second.calls;
}

void MockManager::reset() {
    std::unique_lock lk(mtx_);
    configs_.clear();
    wrapped_.clear();
    next_id_ = 0;
}

namespace {

Value when_value(const MockWhen &when) {
    return Value::structure(
        "mock_when",
        {
            {"called_with", make_builtin("called_with", [when](ExecutionContext &, const Args &args, const Kwargs &) {
                 return when_value(when.called_with(args));
             })},
            {"then_return", make_builtin("then_return", [when](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                 auto a = unpack_args("then_return", args, kwargs, {"value"}, 1);
                 when.then_return(a[0]);
                 return Value::callable(when.wrapper());
             })},
        });
}

} // namespace

Value MockManager::module() {
    return Value::structure(
        "mock",
        {
            {"wrap", make_builtin("mock.wrap",
                                  [this](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                                      auto a = unpack_args("mock.wrap", args, kwargs, {"fn"}, 1);
                                      return Value::callable(wrap(a[0]));
                                  })},
            {"when", make_builtin("mock.when",
                                  [this](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                                      auto a = unpack_args("mock.when", args, kwargs, {"fn"}, 1);
                                      return when_value(when(a[0]));
                                  })},
            {"was_called", make_builtin("mock.was_called",
                                        [this](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                                            auto a = unpack_args("mock.was_called", args, kwargs, {"fn"}, 1);
                                            return Value::boolean(was_called(*wrapper_arg(a[0], "mock.was_called")));
                                        })},
            {"call_count", make_builtin("mock.call_count",
                                        [this](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                                            auto a = unpack_args("mock.call_count", args, kwargs, {"fn"}, 1);
                                            const auto n = call_count(*wrapper_arg(a[0], "mock.call_count"));
                                            return Value::integer(static_cast<std::int64_t>(n));
                                        })},
            {"calls", make_builtin("mock.calls",
                                   [this](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                                       auto               a = unpack_args("mock.calls", args, kwargs, {"fn"}, 1);
                                       std::vector<Value> out;
                                       for (auto &c : calls(*wrapper_arg(a[0], "mock.calls"))) {
                                           std::vector<std::pair<Value, Value>> kw;
                                           for (auto &[k, v] : c.kwargs)
                                               kw.emplace_back(Value::string(k), v);
                                           out.push_back(Value::dict({
                                               {Value::string("args"), Value::tuple(std::move(c.args))},
                                               {Value::string("kwargs"), Value::dict(std::move(kw))},
                                           }));
                                       }
                                       return Value::list(std::move(out));
                                   })},
            {"reset", make_builtin("mock.reset",
                                   [this](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                                       unpack_args("mock.reset", args, kwargs, {}, 0);
                                       reset();
                                       return Value();
                                   })},
        });
}

} // namespace skytest
