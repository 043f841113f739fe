#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace skytest {

struct FileCoverage {
    std::string                   path;
    std::map<int, std::size_t>    hits; // line -> hit count

    std::size_t covered_lines() const { return hits.size(); }
};

struct CoverageReport {
    std::vector<FileCoverage> files;

    std::size_t covered_lines() const;
    std::size_t total_hits() const;
};

// Line-hit collector shared by every runner of a session. Fed from the
// engine's execution hook; safe to call from several workers.
class CoverageCollector {
public:
    void before_exec(std::string_view file, int line);

    CoverageReport report() const;
    void           reset();

private:
    mutable std::shared_mutex                              mtx_;
    std::map<std::string, std::map<int, std::size_t>, std::less<>> hits_;
};

} // namespace skytest
