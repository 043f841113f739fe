#pragma once

#include "skytest/engine.h"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skytest {

struct Options {
    std::string              test_prefix = "test_";
    std::string              filter;          // case-insensitive substring, "not <s>" negates
    std::string              marker_filter;   // marker name, "not <m>" negates
    std::vector<std::string> test_names;      // exact allow-list, wins over filter
    std::vector<std::string> preludes;        // loaded in order, later files shadow earlier
    std::chrono::milliseconds timeout{0};     // 0 disables
    bool                     fail_fast        = false;
    bool                     update_snapshots = false;
    bool                     coverage         = false;
    Namespace                predeclared;
    bool                     disable_assert   = false;
    bool                     verbose          = false;
};

// Accepts "500ms", "10s", "2m", "1h" and bare seconds ("3"). Empty on error.
std::optional<std::chrono::milliseconds> parse_duration(std::string_view text);

// Inverse of parse_duration for whole units: 2000ms -> "2s", 1500ms -> "1500ms".
std::string format_duration(std::chrono::milliseconds d);

} // namespace skytest
