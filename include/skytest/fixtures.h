#pragma once

#include "skytest/engine.h"

#include <filesystem>
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace skytest {

inline constexpr std::string_view kFixturePrefix      = "fixture_";
inline constexpr std::string_view kFixtureConfigName  = "__fixture_config__";
inline constexpr std::string_view kConftestName       = "conftest.star";

enum class FixtureScope {
    Test,
    File,
};

struct Fixture {
    std::string  name;
    Value        producer;
    FixtureScope scope = FixtureScope::Test;
};

// Named, interdependent setup values for one test file.
//
// Values are computed on demand by calling the producer with its own
// parameters resolved through the registry. File-scoped values are computed
// at most once until clear_file_cache(); test-scoped values live until
// clear_test_cache(). The lock is never held while a producer runs.
class FixtureRegistry {
public:
    FixtureRegistry() = default;

    FixtureRegistry(const FixtureRegistry &)            = delete;
    FixtureRegistry &operator=(const FixtureRegistry &) = delete;

    void register_fixture(Fixture fixture);
    void register_builtin(std::string name, Value value);

    bool                     contains(std::string_view name) const;
    std::vector<std::string> names() const;
    std::size_t              size() const;

    // Throws FixtureNotFound, FixtureCycle or FixtureResolutionError.
    Value get_or_compute(ExecutionContext &ctx, const std::string &name);

    // Resolves params[skip..] as fixtures.
    Args resolve_args(ExecutionContext &ctx, const std::vector<std::string> &params, std::size_t skip = 0);

    void clear_test_cache();
    void clear_file_cache();

    // Copies fixture definitions (not cached values) from `other`, replacing
    // definitions with the same name.
    void merge_from(const FixtureRegistry &other);

private:
    Value compute(ExecutionContext &ctx, const std::string &name, std::vector<std::string> &resolving);

    mutable std::shared_mutex    mtx_;
    std::map<std::string, Fixture> fixtures_;
    std::map<std::string, Value>   builtins_;
    std::map<std::string, Value>   cache_;
};

// Collects `fixture_<name>` callables, honouring the `__fixture_config__` scope dict.
void find_fixtures(const Namespace &globals, FixtureRegistry &out);

// conftest.star files from the root-most ancestor down to the test file's
// directory. The walk stops at the filesystem root or the first directory
// holding a VCS/workspace marker.
std::vector<std::filesystem::path> find_conftest_files(const std::filesystem::path &test_file);

} // namespace skytest
