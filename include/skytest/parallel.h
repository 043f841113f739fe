// Fans per-file work out over a fixed pool of worker threads.
#pragma once

#include "skytest/result.h"

#include <cstddef>
#include <exception>
#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace skytest {

// Runs one file. Anything the job wants printed goes into `output`; it is
// written to the session stream in input order once the file's turn comes.
using FileTask = std::function<FileResult(const std::filesystem::path &file, std::string &output)>;

struct FileOutcome {
    std::filesystem::path     file;
    std::optional<FileResult> result;
    std::exception_ptr        error;
    std::string               output;

    bool done() const { return result.has_value() || error != nullptr; }
};

[[nodiscard]] std::size_t default_concurrency(std::size_t task_count);

// "auto" or a positive integer. Throws UsageError.
std::size_t parse_parallelism(std::string_view text);

// Runs files one after another. A task exception propagates after the
// output produced before it was written. With `fail_fast`, stops after the
// first file with failures.
RunResult run_sequential(const std::vector<std::filesystem::path> &files, const FileTask &task, bool fail_fast, std::ostream &out);

// Same contract as run_sequential with up to `jobs` files in flight. Every
// file before the first failing one in input order runs; files after it that
// have not started yet are not run, work already started still completes.
RunResult run_parallel(const std::vector<std::filesystem::path> &files, std::size_t jobs, const FileTask &task, bool fail_fast,
                       std::ostream &out);

} // namespace skytest
