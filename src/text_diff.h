#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace skytest::detail {

// Splits after each '\n'; the final line always ends with '\n'.
std::vector<std::string> split_lines(std::string_view text);

// Unified diff in the `diff -u` layout. Empty when the inputs are equal.
std::string unified_diff(std::string_view a, std::string_view b, std::string_view from_file, std::string_view to_file,
                         std::size_t context = 3);

} // namespace skytest::detail
