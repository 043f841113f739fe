#include "cli.h"

#include "skytest/discovery.h"
#include "skytest/errors.h"
#include "skytest/parallel.h"

#include <algorithm>
#include <cstdlib>
#include <initializer_list>
#include <string_view>

#include <fmt/format.h>

namespace skytest::runner {
namespace {

static bool env_has_value(const char *name) {
    const char *value = std::getenv(name);
    return value != nullptr && value[0] != '\0';
}

} // namespace

bool env_no_color() { return env_has_value("NO_COLOR") || env_has_value("SKYTEST_NO_COLOR"); }
bool env_github_actions() { return env_has_value("GITHUB_ACTIONS"); }

std::string usage_text() {
    std::string out;
    out += "Usage: skytest [options] [paths...]\n";
    out += "\nPaths are test files, directories or globs (default: .). Use file::test to select one test.\n";
    out += "\nOptions:\n";
    out += "  -h, --help                Show this help\n";
    out += "  -k, --filter=<pattern>    Run tests whose name contains pattern ('not <pattern>' inverts)\n";
    out += "  -m, --marker=<marker>     Run tests carrying marker ('not <marker>' inverts)\n";
    out += "  --prefix=<prefix>         Test function prefix (default test_)\n";
    out += "  --prelude=<file>          Load file before each test file (repeatable)\n";
    out += "  --timeout=<duration>      Per-test timeout, e.g. 500ms, 10s, 2m (default off)\n";
    out += "  -x, --bail, --fail-fast   Stop after the first failing test\n";
    out += "  -u, --update-snapshots    Rewrite snapshots that differ\n";
    out += "  --coverage                Collect line coverage\n";
    out += "  -r                        Search directories recursively\n";
    out += "  -j <N|auto>               Run up to N files in parallel (default 1)\n";
    out += "  -w, --watch               Re-run tests when files change\n";
    out += "  --affected-only           In watch mode, re-run only affected test files\n";
    out += "  --format=<fmt>            text|json|junit|markdown|github (default text)\n";
    out += "  --json, --junit           Shorthands for --format\n";
    out += "  --duration                Show test durations\n";
    out += "  -v, --verbose             Show test output and diagnostics\n";
    out += "  --no-color                Disable colorized output (or set NO_COLOR/SKYTEST_NO_COLOR)\n";
    return out;
}

bool parse_cli(std::span<const char *> args, CliOptions &out_opt) {
    CliOptions opt{};

    bool wants_help    = false;
    bool no_color_flag = false;
    bool format_seen   = false;

    enum class ValueMatch { No, Yes, Error };
    auto match_value = [&](std::size_t &i, std::string_view s, std::string_view opt_name, std::string_view &value) -> ValueMatch {
        if (s == opt_name) {
            if (i + 1 >= args.size() || !args[i + 1]) {
                fmt::print(stderr, "error: {} requires a value\n", opt_name);
                return ValueMatch::Error;
            }
            value = std::string_view(args[i + 1]);
            if (value.empty()) {
                fmt::print(stderr, "error: {} requires a non-empty value\n", opt_name);
                return ValueMatch::Error;
            }
            ++i;
            return ValueMatch::Yes;
        }
        if (s.rfind(opt_name, 0) == 0 && s.size() > opt_name.size() && s[opt_name.size()] == '=') {
            value = s.substr(opt_name.size() + 1);
            if (value.empty()) {
                fmt::print(stderr, "error: {} requires a non-empty value\n", opt_name);
                return ValueMatch::Error;
            }
            return ValueMatch::Yes;
        }
        return ValueMatch::No;
    };
    enum class OptionParseResult { NoMatch, Consumed, Error };
    auto parse_value_option = [&](std::size_t &i, std::string_view s, std::initializer_list<std::string_view> names,
                                  auto &&on_value) -> OptionParseResult {
        for (const auto opt_name : names) {
            std::string_view value;
            switch (match_value(i, s, opt_name, value)) {
            case ValueMatch::Error: return OptionParseResult::Error;
            case ValueMatch::Yes:
                if (!on_value(opt_name, value))
                    return OptionParseResult::Error;
                return OptionParseResult::Consumed;
            case ValueMatch::No: break;
            }
        }
        return OptionParseResult::NoMatch;
    };

    auto set_format = [&](std::string_view opt_name, ReportFormat format) -> bool {
        if (format_seen && opt.format != format) {
            fmt::print(stderr, "error: {} conflicts with an earlier output format\n", opt_name);
            return false;
        }
        opt.format  = format;
        format_seen = true;
        return true;
    };

    std::size_t start = 0;
    if (!args.empty() && args[0] && args[0][0] != '-') {
        start = 1; // Skip argv[0] (program name) when present.
    }
    for (std::size_t i = start; i < args.size(); ++i) {
        const char *arg = args[i];
        if (!arg)
            continue;
        const std::string_view s(arg);

        if (s == "--help" || s == "-h") {
            wants_help = true;
            continue;
        }
        if (s == "--no-color") {
            no_color_flag = true;
            continue;
        }
        if (s == "-x" || s == "--bail" || s == "--fail-fast") {
            opt.run.fail_fast = true;
            continue;
        }
        if (s == "-u" || s == "--update-snapshots") {
            opt.run.update_snapshots = true;
            continue;
        }
        if (s == "--coverage") {
            opt.run.coverage = true;
            continue;
        }
        if (s == "-r" || s == "--recursive") {
            opt.recursive = true;
            continue;
        }
        if (s == "-w" || s == "--watch") {
            opt.watch = true;
            continue;
        }
        if (s == "--affected-only") {
            opt.affected_only = true;
            continue;
        }
        if (s == "--duration") {
            opt.show_duration = true;
            continue;
        }
        if (s == "-v" || s == "--verbose") {
            opt.run.verbose = true;
            continue;
        }
        if (s == "--json") {
            if (!set_format(s, ReportFormat::Json))
                return false;
            continue;
        }
        if (s == "--junit") {
            if (!set_format(s, ReportFormat::JUnit))
                return false;
            continue;
        }

        OptionParseResult result = parse_value_option(i, s, {"--filter", "-k"}, [&](std::string_view, std::string_view value) {
            opt.run.filter = std::string(value);
            return true;
        });
        if (result == OptionParseResult::NoMatch)
            result = parse_value_option(i, s, {"--marker", "-m"}, [&](std::string_view, std::string_view value) {
                opt.run.marker_filter = std::string(value);
                return true;
            });
        if (result == OptionParseResult::NoMatch)
            result = parse_value_option(i, s, {"--prefix"}, [&](std::string_view, std::string_view value) {
                opt.run.test_prefix = std::string(value);
                return true;
            });
        if (result == OptionParseResult::NoMatch)
            result = parse_value_option(i, s, {"--prelude"}, [&](std::string_view, std::string_view value) {
                opt.run.preludes.emplace_back(value);
                return true;
            });
        if (result == OptionParseResult::NoMatch)
            result = parse_value_option(i, s, {"--timeout"}, [&](std::string_view opt_name, std::string_view value) {
                const auto parsed = parse_duration(value);
                if (!parsed) {
                    fmt::print(stderr, "error: {} expects a duration like 500ms, 10s or 2m, got: '{}'\n", opt_name, value);
                    return false;
                }
                opt.run.timeout = *parsed;
                return true;
            });
        if (result == OptionParseResult::NoMatch)
            result = parse_value_option(i, s, {"-j", "--jobs"}, [&](std::string_view, std::string_view value) {
                try {
                    opt.jobs = parse_parallelism(value);
                } catch (const UsageError &e) {
                    fmt::print(stderr, "error: {}\n", e.what());
                    return false;
                }
                return true;
            });
        if (result == OptionParseResult::NoMatch)
            result = parse_value_option(i, s, {"--format"}, [&](std::string_view opt_name, std::string_view value) {
                try {
                    return set_format(opt_name, parse_report_format(value));
                } catch (const UsageError &e) {
                    fmt::print(stderr, "error: {}\n", e.what());
                    return false;
                }
            });
        if (result == OptionParseResult::Error)
            return false;
        if (result == OptionParseResult::Consumed)
            continue;

        if (s.size() > 1 && s[0] == '-') {
            fmt::print(stderr, "error: unknown option '{}'\n", s);
            return false;
        }

        auto [file, test] = split_test_selector(s);
        if (file.empty()) {
            fmt::print(stderr, "error: missing file in selector '{}'\n", s);
            return false;
        }
        if (!test.empty())
            opt.selected_tests[file].push_back(test);
        if (std::find(opt.paths.begin(), opt.paths.end(), file) == opt.paths.end())
            opt.paths.push_back(std::move(file));
    }

    if (opt.paths.empty())
        opt.paths.emplace_back(".");
    if (opt.affected_only && !opt.watch) {
        fmt::print(stderr, "error: --affected-only requires --watch\n");
        return false;
    }

    opt.color_output = !no_color_flag && !env_no_color();
    if (!format_seen && env_github_actions())
        opt.github_annotations = true;
    if (opt.format == ReportFormat::GitHub) {
        opt.format             = ReportFormat::Text;
        opt.github_annotations = true;
    }
    opt.mode = wants_help ? Mode::Help : Mode::Execute;
    out_opt  = std::move(opt);
    return true;
}

} // namespace skytest::runner
