#pragma once

#include "runner_metadata.h"

#include "skytest/options.h"

#include <string_view>

namespace skytest::runner {

bool iequals(std::string_view lhs, std::string_view rhs);
bool icontains(std::string_view haystack, std::string_view needle);

// `marker` or `not marker`, case-insensitive. Empty filter matches everything.
bool matches_marker_filter(const TestMeta &meta, std::string_view filter);

// The TestNames allow-list wins when present (exact match on the case name
// or its base test name); otherwise the case-insensitive substring filter.
bool matches_name_filter(std::string_view name, std::string_view base_name, const Options &opts);

} // namespace skytest::runner
