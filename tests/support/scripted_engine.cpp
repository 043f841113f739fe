#include "scripted_engine.h"

#include "skytest/errors.h"

namespace skytest::test_support {

namespace {

std::string key_for(const std::filesystem::path &p) { return std::filesystem::absolute(p).lexically_normal().string(); }

} // namespace

Value ScriptedFunction::call(ExecutionContext &ctx, const Args &args, const Kwargs &) {
    if (!file_.empty())
        ctx.on_exec(file_, line_);
    ctx.check_cancelled();
    if (args.size() != params_.size())
        throw EvalError(name_ + ": got " + std::to_string(args.size()) + " arguments, want " + std::to_string(params_.size()));
    return body_(ctx, args);
}

Value fn(std::string name, std::vector<std::string> params, Body body, std::string file, int line) {
    return Value::callable(std::make_shared<ScriptedFunction>(std::move(name), std::move(params), std::move(body), std::move(file), line));
}

Value fn(std::string name, Body body) { return fn(std::move(name), {}, std::move(body)); }

Value noop(std::string name) {
    return fn(std::move(name), [](ExecutionContext &, const Args &) { return Value(); });
}

Value failing(std::string name, std::string message) {
    return fn(std::move(name), [message](ExecutionContext &, const Args &) -> Value { throw EvalError(message); });
}

Value member(const Value &module, std::string_view field) {
    const Value *v = module.as_struct()->attr(field);
    if (!v)
        throw EvalError("no member " + std::string(field));
    return *v;
}

void ScriptedEngine::add(const std::filesystem::path &file, Script script) {
    std::lock_guard<std::mutex> lk(mtx_);
    scripts_[key_for(file)] = std::move(script);
}

Namespace ScriptedEngine::exec_file(ExecutionContext &ctx, const std::string &filename, std::string_view, const Namespace &predeclared) {
    Script script;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        executed_.push_back(filename);
        auto it = scripts_.find(key_for(filename));
        if (it == scripts_.end())
            throw EvalError(filename + ":1:1: syntax error");
        script = it->second;
    }
    ctx.on_exec(filename, 1);
    return script(ctx, predeclared);
}

std::vector<std::string> ScriptedEngine::executed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return executed_;
}

} // namespace skytest::test_support
