#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace skytest {

enum class PathKind {
    File,
    Dir,
    Glob,
};

const std::vector<std::string> &default_test_patterns();

// Shell-style match of a single path component: `*`, `?` and `[...]` classes.
bool match_pattern(std::string_view pattern, std::string_view name);

bool is_test_file(const std::filesystem::path &path, const std::vector<std::string> &patterns = {});

PathKind classify_path(std::string_view path);

// Test files in `dir`, sorted. Hidden directories are skipped.
std::vector<std::filesystem::path> discover_files(const std::filesystem::path &dir, const std::vector<std::string> &patterns = {},
                                                  bool recursive = false);

// Expands files, directories and globs into a deduplicated list in argument
// order. Throws NoFilesFound when nothing matched.
std::vector<std::filesystem::path> expand_paths(const std::vector<std::string> &paths, const std::vector<std::string> &patterns = {},
                                                bool recursive = false);

// "a_test.star::test_x" -> {"a_test.star", "test_x"}; no selector -> {arg, ""}.
std::pair<std::string, std::string> split_test_selector(std::string_view arg);

} // namespace skytest
