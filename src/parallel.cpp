#include "skytest/parallel.h"

#include "log.h"
#include "skytest/errors.h"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <limits>
#include <thread>

namespace skytest {

namespace fs = std::filesystem;

std::size_t default_concurrency(std::size_t task_count) {
    const unsigned hw   = std::thread::hardware_concurrency();
    std::size_t    jobs = hw == 0 ? 1u : static_cast<std::size_t>(hw);
    jobs                = std::max<std::size_t>(1, std::min(jobs, task_count));
    return jobs;
}

std::size_t parse_parallelism(std::string_view text) {
    if (text == "auto")
        return default_concurrency(std::numeric_limits<std::size_t>::max());
    std::size_t value = 0;
    const auto *end   = text.data() + text.size();
    auto [ptr, ec]    = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || value == 0)
        throw UsageError("invalid value for -j: '" + std::string(text) + "' (expected a positive integer or 'auto')");
    return value;
}

RunResult run_sequential(const std::vector<fs::path> &files, const FileTask &task, bool fail_fast, std::ostream &out) {
    const auto start = std::chrono::steady_clock::now();
    RunResult  run;
    for (const auto &file : files) {
        std::string output;
        FileResult  result;
        try {
            result = task(file, output);
        } catch (...) {
            out << output;
            throw;
        }
        out << output;
        const bool failed = result.has_failures();
        run.files.push_back(std::move(result));
        if (fail_fast && failed)
            break;
    }
    run.duration = std::chrono::steady_clock::now() - start;
    return run;
}

RunResult run_parallel(const std::vector<fs::path> &files, std::size_t jobs, const FileTask &task, bool fail_fast, std::ostream &out) {
    jobs = std::max<std::size_t>(1, std::min(jobs, files.size()));
    if (jobs <= 1)
        return run_sequential(files, task, fail_fast, out);

    const auto               start = std::chrono::steady_clock::now();
    std::vector<FileOutcome> slots(files.size());
    std::atomic<std::size_t> next{0};
    // Lowest index that failed or threw. Files below it always run, so the
    // assembled prefix matches what run_sequential would produce.
    std::atomic<std::size_t> stop_at{files.size()};

    auto stop_after = [&](std::size_t idx) {
        std::size_t cur = stop_at.load(std::memory_order_acquire);
        while (idx < cur && !stop_at.compare_exchange_weak(cur, idx, std::memory_order_acq_rel)) {
        }
    };

    auto worker = [&] {
        while (true) {
            const std::size_t idx = next.fetch_add(1, std::memory_order_relaxed);
            // Indices only grow, so nothing left for this worker is needed.
            if (idx >= files.size() || idx > stop_at.load(std::memory_order_acquire))
                return;
            FileOutcome &slot = slots[idx];
            slot.file         = files[idx];
            try {
                slot.result = task(files[idx], slot.output);
                if (fail_fast && slot.result->has_failures())
                    stop_after(idx);
            } catch (...) {
                // Rethrown in input order once every worker has joined.
                slot.error = std::current_exception();
                stop_after(idx);
            }
        }
    };

    log_info("running {} file(s) on {} worker(s)", files.size(), jobs);
    std::vector<std::thread> threads;
    threads.reserve(jobs);
    for (std::size_t t = 0; t < jobs; ++t)
        threads.emplace_back(worker);
    for (auto &th : threads)
        th.join();

    RunResult run;
    for (auto &slot : slots) {
        if (!slot.done())
            break;
        out << slot.output;
        if (slot.error)
            std::rethrow_exception(slot.error);
        const bool failed = slot.result->has_failures();
        run.files.push_back(std::move(*slot.result));
        if (fail_fast && failed)
            break;
    }
    run.duration = std::chrono::steady_clock::now() - start;
    return run;
}

} // namespace skytest
