#pragma once

#include "skytest/options.h"
#include "skytest/reporter.h"

#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace skytest::runner {

enum class Mode {
    Execute,
    Help,
};

struct CliOptions {
    Mode    mode = Mode::Execute;
    Options run;

    std::vector<std::string>                        paths;
    std::map<std::string, std::vector<std::string>> selected_tests; // from `file::test`, keyed by the file argument
    bool                                            recursive = false;
    std::size_t                                     jobs      = 1;

    bool watch         = false;
    bool affected_only = false;

    ReportFormat format             = ReportFormat::Text;
    bool         show_duration      = false;
    bool         color_output       = true;
    bool         github_annotations = false; // text output followed by ::error lines
};

bool env_no_color();
bool env_github_actions();

// Prints "error: ..." to stderr and returns false on bad input.
bool parse_cli(std::span<const char *> args, CliOptions &out_opt);

std::string usage_text();

} // namespace skytest::runner
