#include "cli.h"
#include "skytest/session.h"

#include "support/scripted_engine.h"
#include "support/temp_dir.h"

#include <gtest/gtest.h>
#include <sstream>

using namespace skytest;
using skytest::runner::CliOptions;
using skytest::test_support::failing;
using skytest::test_support::noop;
using skytest::test_support::ScriptedEngine;
using skytest::test_support::TempDir;

namespace fs = std::filesystem;

namespace {

bool parse(std::vector<const char *> args, CliOptions &opt) { return runner::parse_cli(std::span<const char *>(args.data(), args.size()), opt); }

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmp_.mkdir(".git");
        a_ = tmp_.write("a_test.star", "def test_ok(): pass\n");
        engine_.add(a_, [](ExecutionContext &, const Namespace &) {
            return Namespace{{"test_ok", noop("test_ok")}, {"test_other", noop("test_other")}};
        });
        b_ = tmp_.write("b_test.star", "def test_bad(): fail('boom')\n");
        engine_.add(b_, [](ExecutionContext &, const Namespace &) { return Namespace{{"test_bad", failing("test_bad", "boom")}}; });
    }

    int run(std::vector<std::string> args) {
        std::vector<const char *> argv{"skytest", "--no-color"};
        for (const auto &a : args)
            argv.push_back(a.c_str());
        out_.str("");
        return run_all(engine_, std::span<const char *>(argv.data(), argv.size()), out_);
    }

    std::string output() const { return out_.str(); }
    bool        printed(std::string_view needle) const { return out_.str().find(needle) != std::string::npos; }

    TempDir            tmp_;
    ScriptedEngine     engine_;
    fs::path           a_;
    fs::path           b_;
    std::ostringstream out_;
};

} // namespace

TEST(ParseCli, Defaults) {
    CliOptions opt;
    ASSERT_TRUE(parse({"skytest"}, opt));
    EXPECT_EQ(opt.mode, runner::Mode::Execute);
    EXPECT_EQ(opt.paths, (std::vector<std::string>{"."}));
    EXPECT_EQ(opt.jobs, 1u);
    EXPECT_EQ(opt.run.test_prefix, "test_");
    EXPECT_FALSE(opt.watch);
    EXPECT_FALSE(opt.recursive);
}

TEST(ParseCli, FlagsAndValues) {
    CliOptions opt;
    ASSERT_TRUE(parse({"skytest", "-x", "-u", "--coverage", "-r", "-v", "--duration", "-k", "add", "--marker=not slow", "--prefix=check_",
                       "--prelude", "p1.star", "--prelude=p2.star", "--timeout=2s", "-j", "3", "tests"},
                      opt));
    EXPECT_TRUE(opt.run.fail_fast);
    EXPECT_TRUE(opt.run.update_snapshots);
    EXPECT_TRUE(opt.run.coverage);
    EXPECT_TRUE(opt.recursive);
    EXPECT_TRUE(opt.run.verbose);
    EXPECT_TRUE(opt.show_duration);
    EXPECT_EQ(opt.run.filter, "add");
    EXPECT_EQ(opt.run.marker_filter, "not slow");
    EXPECT_EQ(opt.run.test_prefix, "check_");
    EXPECT_EQ(opt.run.preludes, (std::vector<std::string>{"p1.star", "p2.star"}));
    EXPECT_EQ(opt.run.timeout, std::chrono::seconds(2));
    EXPECT_EQ(opt.jobs, 3u);
    EXPECT_EQ(opt.paths, (std::vector<std::string>{"tests"}));
}

TEST(ParseCli, ProgramNameIsOptional) {
    CliOptions opt;
    ASSERT_TRUE(parse({"--bail"}, opt));
    EXPECT_TRUE(opt.run.fail_fast);
}

TEST(ParseCli, TestSelectorsArePerFile) {
    CliOptions opt;
    ASSERT_TRUE(parse({"skytest", "a_test.star::test_x", "a_test.star::test_y", "b_test.star"}, opt));
    EXPECT_EQ(opt.paths, (std::vector<std::string>{"a_test.star", "b_test.star"}));
    ASSERT_EQ(opt.selected_tests.size(), 1u);
    EXPECT_EQ(opt.selected_tests.at("a_test.star"), (std::vector<std::string>{"test_x", "test_y"}));
}

TEST(ParseCli, Formats) {
    CliOptions opt;
    ASSERT_TRUE(parse({"skytest", "--junit"}, opt));
    EXPECT_EQ(opt.format, ReportFormat::JUnit);

    ASSERT_TRUE(parse({"skytest", "--format", "md"}, opt));
    EXPECT_EQ(opt.format, ReportFormat::Markdown);

    ASSERT_TRUE(parse({"skytest", "--format=github"}, opt));
    EXPECT_EQ(opt.format, ReportFormat::Text);
    EXPECT_TRUE(opt.github_annotations);

    EXPECT_TRUE(parse({"skytest", "--junit", "--format=junit"}, opt));
    EXPECT_FALSE(parse({"skytest", "--junit", "--format=markdown"}, opt));
    EXPECT_FALSE(parse({"skytest", "--format=yaml"}, opt));
}

TEST(ParseCli, RejectsBadInput) {
    CliOptions opt;
    EXPECT_FALSE(parse({"skytest", "--frobnicate"}, opt));
    EXPECT_FALSE(parse({"skytest", "--timeout=soon"}, opt));
    EXPECT_FALSE(parse({"skytest", "-j", "0"}, opt));
    EXPECT_FALSE(parse({"skytest", "-k"}, opt));
    EXPECT_FALSE(parse({"skytest", "--filter="}, opt));
    EXPECT_FALSE(parse({"skytest", "--affected-only"}, opt));
    EXPECT_FALSE(parse({"skytest", "::test_x"}, opt));
    EXPECT_TRUE(parse({"skytest", "--watch", "--affected-only"}, opt));
}

TEST(ParseCli, Help) {
    CliOptions opt;
    ASSERT_TRUE(parse({"skytest", "--help"}, opt));
    EXPECT_EQ(opt.mode, runner::Mode::Help);
    EXPECT_NE(runner::usage_text().find("Usage: skytest"), std::string::npos);
}

TEST_F(SessionTest, PassingFileExitsZero) {
    EXPECT_EQ(run({a_.string()}), kExitOk);
    EXPECT_TRUE(printed("[ PASS ] test_ok\n"));
    EXPECT_TRUE(printed("[ PASS ] test_other\n"));
    EXPECT_TRUE(printed("Summary: passed 2/2; failed 0; skipped 0; xfail 0; xpass 0.\n"));
}

TEST_F(SessionTest, FailuresExitOne) {
    EXPECT_EQ(run({tmp_.path().string()}), kExitFailures);
    EXPECT_TRUE(printed("[ FAIL ] test_bad\n      boom\n"));
    EXPECT_TRUE(printed("Failed tests:\n"));
    // Directory expansion is sorted, so a_test.star reports first.
    EXPECT_LT(output().find("test_ok"), output().find("test_bad"));
}

TEST_F(SessionTest, SelectorRunsOneTest) {
    EXPECT_EQ(run({a_.string() + "::test_other"}), kExitOk);
    EXPECT_TRUE(printed("[ PASS ] test_other\n"));
    EXPECT_FALSE(printed("test_ok"));
}

TEST_F(SessionTest, ParallelOutputKeepsFileOrder) {
    EXPECT_EQ(run({"-j", "2", a_.string(), b_.string()}), kExitFailures);
    EXPECT_LT(output().find("test_ok"), output().find("test_bad"));
    EXPECT_TRUE(printed("Summary: passed 2/3; failed 1;"));
}

TEST_F(SessionTest, JUnitOutput) {
    EXPECT_EQ(run({"--junit", a_.string()}), kExitOk);
    EXPECT_EQ(output().rfind("<?xml", 0), 0u);
    EXPECT_FALSE(printed("[ PASS ]"));
}

TEST_F(SessionTest, WholeRunReportersPrintNothingPerFile) {
    EXPECT_EQ(run({"--format=markdown", a_.string(), b_.string()}), kExitFailures);
    EXPECT_EQ(output().rfind("## Test Results\n", 0), 0u);
    EXPECT_FALSE(printed("[ PASS ]"));
    EXPECT_FALSE(printed("[ FAIL ]"));

    EXPECT_EQ(run({"--junit", "-j", "2", a_.string(), b_.string()}), kExitFailures);
    EXPECT_EQ(output().rfind("<?xml", 0), 0u);
    EXPECT_FALSE(printed("[ FAIL ]"));
}

TEST_F(SessionTest, GitHubAnnotationsFollowText) {
    EXPECT_EQ(run({"--format=github", b_.string()}), kExitFailures);
    EXPECT_TRUE(printed("[ FAIL ] test_bad\n"));
    EXPECT_TRUE(printed("::error file=" + b_.string() + ",line=1,title=test_bad::boom\n"));
}

TEST_F(SessionTest, CoverageSummary) {
    EXPECT_EQ(run({"--coverage", a_.string()}), kExitOk);
    EXPECT_TRUE(printed("Coverage: 1 line(s) hit across 1 file(s)\n"));
}

TEST_F(SessionTest, UsageAndFileErrorsExitTwo) {
    EXPECT_EQ(run({"--frobnicate"}), kExitUsage);

    const auto broken = tmp_.write("broken_test.star", "def (:\n");
    EXPECT_EQ(run({broken.string()}), kExitUsage);

    tmp_.mkdir("empty");
    EXPECT_EQ(run({(tmp_.path() / "empty").string()}), kExitUsage);
}

TEST_F(SessionTest, HelpExitsZero) {
    EXPECT_EQ(run({"--help"}), kExitOk);
    EXPECT_TRUE(printed("Usage: skytest"));
}
