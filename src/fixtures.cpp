#include "skytest/fixtures.h"

#include "skytest/errors.h"

#include <algorithm>
#include <mutex>
#include <system_error>

namespace skytest {

namespace fs = std::filesystem;

void FixtureRegistry::register_fixture(Fixture fixture) {
    std::unique_lock lk(mtx_);
    std::string      name = fixture.name;
    cache_.erase(name);
    fixtures_.insert_or_assign(std::move(name), std::move(fixture));
}

void FixtureRegistry::register_builtin(std::string name, Value value) {
    std::unique_lock lk(mtx_);
    builtins_.insert_or_assign(std::move(name), std::move(value));
}

bool FixtureRegistry::contains(std::string_view name) const {
    std::shared_lock lk(mtx_);
    const std::string key(name);
    return fixtures_.count(key) != 0 || builtins_.count(key) != 0;
}

std::vector<std::string> FixtureRegistry::names() const {
    std::shared_lock         lk(mtx_);
    std::vector<std::string> out;
    out.reserve(fixtures_.size());
    for (const auto &[name, _] : fixtures_)
        out.push_back(name);
    return out;
}

std::size_t FixtureRegistry::size() const {
    std::shared_lock lk(mtx_);
    return fixtures_.size();
}

Value FixtureRegistry::get_or_compute(ExecutionContext &ctx, const std::string &name) {
    std::vector<std::string> resolving;
    return compute(ctx, name, resolving);
}

Args FixtureRegistry::resolve_args(ExecutionContext &ctx, const std::vector<std::string> &params, std::size_t skip) {
    Args args;
    for (std::size_t i = skip; i < params.size(); ++i)
        args.push_back(get_or_compute(ctx, params[i]));
    return args;
}

Value FixtureRegistry::compute(ExecutionContext &ctx, const std::string &name, std::vector<std::string> &resolving) {
    Fixture fixture;
    {
        std::shared_lock lk(mtx_);
        if (auto it = builtins_.find(name); it != builtins_.end())
            return it->second;
        auto it = fixtures_.find(name);
        if (it == fixtures_.end())
            throw FixtureNotFound(name);
        if (auto c = cache_.find(name); c != cache_.end())
            return c->second;
        fixture = it->second;
    }

    if (std::find(resolving.begin(), resolving.end(), name) != resolving.end()) {
        auto chain = std::vector<std::string>(std::find(resolving.begin(), resolving.end(), name), resolving.end());
        chain.push_back(name);
        throw FixtureCycle(std::move(chain));
    }

    resolving.push_back(name);
    Args args;
    if (fixture.producer.is_callable()) {
        for (const auto &param : fixture.producer.as_callable()->param_names())
            args.push_back(compute(ctx, param, resolving));
    }
    Value value;
    try {
        value = call_value(ctx, fixture.producer, args);
    } catch (const TimeoutError &) {
        throw;
    } catch (const FixtureCycle &) {
        throw;
    } catch (const std::exception &e) {
        throw FixtureResolutionError(name, e.what());
    }
    resolving.pop_back();

    std::unique_lock lk(mtx_);
    // Another worker may have raced us; keep the first value so every test sees one instance.
    return cache_.emplace(name, std::move(value)).first->second;
}

void FixtureRegistry::clear_test_cache() {
    std::unique_lock lk(mtx_);
    for (auto it = cache_.begin(); it != cache_.end();) {
        auto f = fixtures_.find(it->first);
        if (f == fixtures_.end() || f->second.scope == FixtureScope::Test)
            it = cache_.erase(it);
        else
            ++it;
    }
}

void FixtureRegistry::clear_file_cache() {
    std::unique_lock lk(mtx_);
    cache_.clear();
}

void FixtureRegistry::merge_from(const FixtureRegistry &other) {
    if (&other == this)
        return;
    std::scoped_lock lk(mtx_, other.mtx_);
    for (const auto &[name, fixture] : other.fixtures_) {
        cache_.erase(name);
        fixtures_.insert_or_assign(name, fixture);
    }
}

void find_fixtures(const Namespace &globals, FixtureRegistry &out) {
    const DictValue *config = nullptr;
    if (auto it = globals.find(std::string(kFixtureConfigName)); it != globals.end() && it->second.kind() == Value::Kind::Dict)
        config = it->second.as_dict().get();

    for (const auto &[name, value] : globals) {
        if (!value.is_callable() || name.rfind(kFixturePrefix, 0) != 0 || name.size() == kFixturePrefix.size())
            continue;
        Fixture f;
        f.name     = name.substr(kFixturePrefix.size());
        f.producer = value;
        if (config) {
            if (const Value *scope = config->find(f.name); scope && scope->is_string() && scope->as_string() == "file")
                f.scope = FixtureScope::File;
        }
        out.register_fixture(std::move(f));
    }
}

std::vector<fs::path> find_conftest_files(const fs::path &test_file) {
    static const char *const kRootMarkers[] = {".git", ".hg", ".jj", "WORKSPACE", "MODULE.bazel"};

    std::error_code ec;
    fs::path        dir = fs::absolute(test_file, ec).parent_path();
    if (ec)
        dir = test_file.parent_path();

    std::vector<fs::path> found;
    while (true) {
        const fs::path candidate = dir / kConftestName;
        if (fs::is_regular_file(candidate, ec))
            found.push_back(candidate);
        const bool at_root =
            std::any_of(std::begin(kRootMarkers), std::end(kRootMarkers), [&](const char *m) { return fs::exists(dir / m, ec); });
        if (at_root || !dir.has_parent_path() || dir.parent_path() == dir)
            break;
        dir = dir.parent_path();
    }
    std::reverse(found.begin(), found.end());
    return found;
}

} // namespace skytest
