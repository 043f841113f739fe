#include "skytest/session.h"

#include "cli.h"
#include "log.h"
#include "skytest/coverage.h"
#include "skytest/discovery.h"
#include "skytest/errors.h"
#include "skytest/parallel.h"
#include "skytest/reporter.h"
#include "skytest/runner.h"
#include "skytest/watcher.h"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>
#include <map>
#include <set>
#include <sstream>

#include <fmt/format.h>

namespace skytest {

namespace fs = std::filesystem;

namespace {

using runner::CliOptions;
using runner::Mode;

std::atomic<bool> g_quit{false};

void on_interrupt(int) { g_quit.store(true); }

fs::path absolute_normal(const fs::path &p) {
    std::error_code ec;
    fs::path        abs = fs::absolute(p, ec);
    return (ec ? p : abs).lexically_normal();
}

class Session {
public:
    Session(Engine &engine, const CliOptions &opt, std::ostream &out) : engine_(engine), opt_(opt), out_(out) {
        TextReporterOptions text_opts;
        text_opts.verbose       = opt.run.verbose;
        text_opts.show_duration = opt.show_duration;
        text_opts.color         = opt.color_output;
        reporter_               = make_reporter(opt.format, text_opts);
        if (opt.github_annotations)
            annotations_ = make_reporter(ReportFormat::GitHub);
        for (const auto &[file, tests] : opt.selected_tests)
            selected_[absolute_normal(file)] = tests;
    }

    // Runs `files` once and reports. Returns the exit code for this run.
    int run(const std::vector<fs::path> &files) {
        if (opt_.run.coverage)
            coverage_.reset();
        FileTask task = [this](const fs::path &file, std::string &output) { return run_one(file, output); };
        RunResult result = opt_.jobs > 1 ? run_parallel(files, opt_.jobs, task, opt_.run.fail_fast, out_)
                                         : run_sequential(files, task, opt_.run.fail_fast, out_);
        reporter_->report_summary(out_, result);
        if (annotations_)
            annotations_->report_summary(out_, result);
        if (opt_.run.coverage)
            report_coverage();
        out_.flush();
        return result.has_failures() ? kExitFailures : kExitOk;
    }

    // Runs the initial pass, then re-runs on change until interrupted.
    int watch(const std::vector<fs::path> &files) {
        int status = run_guarded(files);

        Watcher watcher(fs::current_path());
        for (const auto &file : files)
            watcher.add(file);
        out_ << fmt::format("\nWatching {} test file(s) for changes. Press Ctrl+C to stop.\n", files.size());
        out_.flush();

        g_quit.store(false);
        auto *previous = std::signal(SIGINT, on_interrupt);
        while (!g_quit.load()) {
            auto note = watcher.wait(std::chrono::milliseconds(200));
            if (auto *err = std::get_if<WatchError>(&note)) {
                log_err("watch: {}", err->what());
                continue;
            }
            auto *event = std::get_if<WatchEvent>(&note);
            if (!event)
                continue;

            // Editors often write several files at once; fold them into one re-run.
            std::set<fs::path> changed{event->file};
            std::set<fs::path> affected(event->affected_tests.begin(), event->affected_tests.end());
            while (auto more = watcher.wait_event(std::chrono::milliseconds(50))) {
                changed.insert(more->file);
                affected.insert(more->affected_tests.begin(), more->affected_tests.end());
            }
            for (const auto &file : changed)
                watcher.refresh_dependencies(file);

            std::vector<fs::path> rerun;
            for (const auto &file : files) {
                if (!opt_.affected_only || affected.count(absolute_normal(file)))
                    rerun.push_back(file);
            }
            out_ << fmt::format("\nChange detected: {} ({} test file(s) to re-run)\n", event->file.string(), rerun.size());
            if (!rerun.empty())
                status = run_guarded(rerun);
        }
        std::signal(SIGINT, previous);
        watcher.close();
        return status;
    }

private:
    int run_guarded(const std::vector<fs::path> &files) {
        try {
            return run(files);
        } catch (const error &e) {
            log_err("{}", e.what());
            return kExitUsage;
        }
    }

    FileResult run_one(const fs::path &file, std::string &output) {
        Options opts = opt_.run;
        if (auto it = selected_.find(absolute_normal(file)); it != selected_.end())
            opts.test_names = it->second;
        Runner             runner(engine_, std::move(opts), opt_.run.coverage ? &coverage_ : nullptr);
        FileResult         result = runner.run_file(file);
        std::ostringstream os;
        // Reporters that only render whole runs wait for report_summary.
        if (reporter_->supports_incremental_output())
            reporter_->report_file(os, result);
        if (annotations_ && annotations_->supports_incremental_output())
            annotations_->report_file(os, result);
        output = os.str();
        return result;
    }

    void report_coverage() {
        const CoverageReport report = coverage_.report();
        out_ << fmt::format("Coverage: {} line(s) hit across {} file(s)\n", report.covered_lines(), report.files.size());
        if (!opt_.run.verbose)
            return;
        for (const auto &f : report.files)
            out_ << fmt::format("  {}: {} line(s)\n", f.path, f.covered_lines());
    }

    Engine                                         &engine_;
    const CliOptions                               &opt_;
    std::ostream                                   &out_;
    std::unique_ptr<Reporter>                       reporter_;
    std::unique_ptr<Reporter>                       annotations_;
    std::map<fs::path, std::vector<std::string>>    selected_;
    CoverageCollector                               coverage_;
};

int run_from_options(Engine &engine, const CliOptions &opt, std::ostream &out) {
    if (opt.mode == Mode::Help) {
        out << runner::usage_text();
        return kExitOk;
    }
    set_verbose_logging(opt.run.verbose);

    try {
        std::vector<fs::path> files = expand_paths(opt.paths, default_test_patterns(), opt.recursive);
        log_info("discovered {} test file(s)", files.size());
        Session session(engine, opt, out);
        if (opt.watch)
            return session.watch(files);
        return session.run(files);
    } catch (const UsageError &e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return kExitUsage;
    } catch (const error &e) {
        log_err("{}", e.what());
        return kExitUsage;
    }
}

} // namespace

int run_all(Engine &engine, std::span<const char *> args, std::ostream &out) {
    CliOptions opt;
    if (!runner::parse_cli(args, opt))
        return kExitUsage;
    return run_from_options(engine, opt, out);
}

int run_all(Engine &engine, int argc, char **argv) {
    std::vector<const char *> args(argv, argv + argc);
    return run_all(engine, std::span<const char *>(args.data(), args.size()), std::cout);
}

} // namespace skytest
