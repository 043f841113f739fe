#pragma once

#include "skytest/engine.h"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace skytest::runner {

inline constexpr std::string_view kTestMetaName   = "__test_meta__";
inline constexpr std::string_view kTestParamsName = "__test_params__";

struct TestMeta {
    bool                     skip  = false;
    bool                     xfail = false;
    std::string              skip_reason;
    std::string              xfail_reason;
    std::vector<std::string> markers;
};

struct ParamCase {
    std::string name; // "name" key of the case dict, else its index
    Value       case_dict;

    std::string virtual_name(std::string_view test) const;
};

// Callables whose name starts with `prefix`, sorted.
std::vector<std::string> find_test_functions(const Namespace &globals, std::string_view prefix);

std::map<std::string, TestMeta> extract_test_meta(const Namespace &globals);

std::map<std::string, std::vector<ParamCase>> extract_test_params(const Namespace &globals);

} // namespace skytest::runner
