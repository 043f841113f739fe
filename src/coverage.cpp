#include "skytest/coverage.h"

#include <mutex>

namespace skytest {

std::size_t CoverageReport::covered_lines() const {
    std::size_t n = 0;
    for (const auto &f : files)
        n += f.covered_lines();
    return n;
}

std::size_t CoverageReport::total_hits() const {
    std::size_t n = 0;
    for (const auto &f : files) {
        for (const auto &[line, count] : f.hits)
            n += count;
    }
    return n;
}

void CoverageCollector::before_exec(std::string_view file, int line) {
    if (file.empty() || line <= 0)
        return;
    std::unique_lock lk(mtx_);
    auto             it = hits_.find(file);
    if (it == hits_.end())
        it = hits_.emplace(std::string(file), std::map<int, std::size_t>{}).first;
    ++it->second[line];
}

CoverageReport CoverageCollector::report() const {
    std::shared_lock lk(mtx_);
    CoverageReport   r;
    r.files.reserve(hits_.size());
    for (const auto &[path, lines] : hits_)
        r.files.push_back(FileCoverage{path, lines});
    return r;
}

void CoverageCollector::reset() {
    std::unique_lock lk(mtx_);
    hits_.clear();
}

} // namespace skytest
