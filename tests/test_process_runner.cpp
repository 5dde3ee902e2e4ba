#include <execgate/core/process_runner.hpp>
#include <execgate/core/utils.hpp>
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <thread>
#include <signal.h>
#include <sys/types.h>

using namespace execgate;
using execgate::testutil::CwdGuard;
using execgate::testutil::EnvGuard;
using execgate::testutil::TempDir;

namespace {

class ProcessRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        policy_.default_timeout_s = 10;
        policy_.max_timeout_s = 10;
        runner_.set_poll_interval_ms(10);
    }

    RunOutcome run(const std::string& program, const std::vector<std::string>& args,
                   const std::optional<int64_t>& timeout = std::nullopt) {
        return runner_.run(program, args, tmp_.path(), timeout, policy_);
    }

    TempDir tmp_;
    Policy policy_;
    PosixProcessRunner runner_;
};

// A reparented child can linger as a zombie until init reaps it
bool process_gone(pid_t pid, int wait_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(wait_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (kill(pid, 0) != 0) return true;
        std::ifstream stat(("/proc/" + std::to_string(pid) + "/stat").c_str());
        std::string line;
        if (!std::getline(stat, line)) return true;
        size_t close_paren = line.rfind(')');
        if (close_paren != std::string::npos && close_paren + 2 < line.size() &&
            line[close_paren + 2] == 'Z') {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

} // namespace

TEST_F(ProcessRunnerTest, CapturesStdoutAndExitCode) {
    RunOutcome r = run("echo", {"hello", "world"});
    ASSERT_TRUE(r.success) << r.error;
    ASSERT_TRUE(r.result.exit_code.has_value());
    EXPECT_EQ(*r.result.exit_code, 0);
    EXPECT_EQ(r.result.stdout_output, "hello world\n");
    EXPECT_EQ(r.result.stderr_output, "");
    EXPECT_FALSE(r.result.timed_out);
    EXPECT_FALSE(r.result.truncated);
    EXPECT_TRUE(r.result.exited_cleanly());
}

TEST_F(ProcessRunnerTest, ArgumentsAreNotShellInterpreted) {
    RunOutcome r = run("echo", {"$HOME", "*", "a;b", "`id`"});
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.result.stdout_output, "$HOME * a;b `id`\n");
}

TEST_F(ProcessRunnerTest, SeparatesStdoutAndStderr) {
    RunOutcome r = run("sh", {"-c", "echo out; echo err >&2"});
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.result.stdout_output, "out\n");
    EXPECT_EQ(r.result.stderr_output, "err\n");
}

TEST_F(ProcessRunnerTest, ReportsNonZeroExitCode) {
    RunOutcome r = run("sh", {"-c", "exit 3"});
    ASSERT_TRUE(r.success) << r.error;
    ASSERT_TRUE(r.result.exit_code.has_value());
    EXPECT_EQ(*r.result.exit_code, 3);
    EXPECT_FALSE(r.result.exited_cleanly());
}

TEST_F(ProcessRunnerTest, ReportsTerminatingSignal) {
    RunOutcome r = run("sh", {"-c", "kill -9 $$"});
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_FALSE(r.result.exit_code.has_value());
    EXPECT_EQ(r.result.term_signal, SIGKILL);
    EXPECT_FALSE(r.result.timed_out);
}

TEST_F(ProcessRunnerTest, RunsInRequestedDirectory) {
    RunOutcome r = run("pwd", {});
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.result.stdout_output, tmp_.path() + "\n");
}

TEST_F(ProcessRunnerTest, StdinIsEmpty) {
    // cat would block forever on an inherited terminal
    RunOutcome r = run("cat", {}, std::optional<int64_t>(5));
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_FALSE(r.result.timed_out);
    ASSERT_TRUE(r.result.exit_code.has_value());
    EXPECT_EQ(*r.result.exit_code, 0);
    EXPECT_EQ(r.result.stdout_output, "");
    EXPECT_LT(r.result.elapsed_ms, 2000);
}

TEST_F(ProcessRunnerTest, TimeoutKillsAndReportsNoExitCode) {
    policy_.default_timeout_s = 1;
    auto start = std::chrono::steady_clock::now();
    RunOutcome r = run("sleep", {"5"});
    auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    ASSERT_TRUE(r.success) << r.error;
    EXPECT_TRUE(r.result.timed_out);
    EXPECT_FALSE(r.result.exit_code.has_value());
    EXPECT_EQ(r.result.term_signal, SIGKILL);
    EXPECT_GE(r.result.elapsed_ms, 900);
    EXPECT_LT(took, 3000);
}

TEST_F(ProcessRunnerTest, RequestedTimeoutIsClampedToMax) {
    policy_.max_timeout_s = 1;
    auto start = std::chrono::steady_clock::now();
    RunOutcome r = run("sleep", {"5"}, std::optional<int64_t>(600));
    auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    ASSERT_TRUE(r.success) << r.error;
    EXPECT_TRUE(r.result.timed_out);
    EXPECT_LT(took, 3000);
}

TEST_F(ProcessRunnerTest, TimeoutKillsWholeProcessGroup) {
    RunOutcome r = run("sh", {"-c", "sleep 30 & echo $!; wait"}, std::optional<int64_t>(1));
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_TRUE(r.result.timed_out);

    pid_t background = static_cast<pid_t>(atoi(r.result.stdout_output.c_str()));
    ASSERT_GT(background, 0) << r.result.stdout_output;
    EXPECT_TRUE(process_gone(background, 2000));
}

TEST_F(ProcessRunnerTest, BusyProducerStillTimesOut) {
    policy_.max_output_bytes = 4096;
    auto start = std::chrono::steady_clock::now();
    RunOutcome r = run("yes", {}, std::optional<int64_t>(1));
    auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    ASSERT_TRUE(r.success) << r.error;
    EXPECT_TRUE(r.result.timed_out);
    EXPECT_TRUE(r.result.truncated);
    EXPECT_LE(r.result.stdout_output.size(), 4096u);
    EXPECT_LT(took, 3000);
}

TEST_F(ProcessRunnerTest, TruncatesAtCapWithVerbatimPrefix) {
    policy_.max_output_bytes = 4096;
    // About 2.5 MB, far beyond twice the cap
    RunOutcome r = run("seq", {"1", "400000"});
    ASSERT_TRUE(r.success) << r.error;
    ASSERT_TRUE(r.result.exit_code.has_value());
    EXPECT_EQ(*r.result.exit_code, 0);
    EXPECT_TRUE(r.result.truncated);

    const std::string& out = r.result.stdout_output;
    EXPECT_LE(out.size() + r.result.stderr_output.size(), 4096u);

    const std::string marker = OutputCapture::TRUNCATION_MARKER;
    ASSERT_GT(out.size(), marker.size());
    EXPECT_EQ(out.substr(out.size() - marker.size()), marker);

    std::string kept = out.substr(0, out.size() - marker.size());
    std::string expected = execgate::testutil::seq_output(1, 2000);
    EXPECT_EQ(kept, expected.substr(0, kept.size()));
}

TEST_F(ProcessRunnerTest, UnknownProgramIsSpawnFailure) {
    RunOutcome r = run("execgate-no-such-program", {});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.kind, ErrorKind::SPAWN_FAILED);
    EXPECT_NE(r.error.find("Command not found"), std::string::npos);
}

TEST_F(ProcessRunnerTest, NonExecutableFileIsPermissionDenied) {
    std::string script = tmp_.write_file("script.sh", "#!/bin/sh\necho hi\n", 0644);
    RunOutcome r = run(script, {});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.kind, ErrorKind::PERMISSION_DENIED);
}

TEST_F(ProcessRunnerTest, MissingWorkingDirectoryIsSpawnFailure) {
    RunOutcome r = runner_.run("true", {}, tmp_.path() + "/gone", std::nullopt, policy_);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.kind, ErrorKind::SPAWN_FAILED);
    EXPECT_NE(r.error.find("chdir"), std::string::npos);
}

TEST_F(ProcessRunnerTest, ConcurrentRunsDoNotShareOutput) {
    const int n = 8;
    std::vector<RunOutcome> outcomes(n);
    std::vector<std::thread> threads;
    for (int i = 0; i < n; ++i) {
        threads.push_back(std::thread([this, i, &outcomes]() {
            PosixProcessRunner local;
            outcomes[i] = local.run("echo", {"run-" + std::to_string(i)}, tmp_.path(),
                                    std::nullopt, policy_);
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) threads[i].join();

    for (int i = 0; i < n; ++i) {
        ASSERT_TRUE(outcomes[i].success) << outcomes[i].error;
        EXPECT_EQ(outcomes[i].result.stdout_output, "run-" + std::to_string(i) + "\n");
    }
}

TEST_F(ProcessRunnerTest, OutputWrittenBeforeTimeoutIsKept) {
    RunOutcome r = run("sh", {"-c", "echo first; echo warn >&2; sleep 1; echo last; exec sleep 30"}, 2);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_TRUE(r.result.timed_out);
    EXPECT_EQ(r.result.stdout_output, "first\nlast\n");
    EXPECT_EQ(r.result.stderr_output, "warn\n");
}

TEST_F(ProcessRunnerTest, RelativePathEntriesNeverResolveInsideWorkingDir) {
    std::string gw = tmp_.mkdir("gw");
    tmp_.mkdir("gw/bin");
    std::string work = tmp_.mkdir("work");
    tmp_.mkdir("work/bin");
    tmp_.write_file("gw/bin/tool", "#!/bin/sh\necho TRUSTED\n", 0755);
    tmp_.write_file("work/bin/tool", "#!/bin/sh\necho PLANTED\n", 0755);

    CwdGuard cwd(gw);
    EnvGuard path("PATH", "bin::.:/usr/bin:/bin");

    RunOutcome r = runner_.run("tool", {}, work, std::nullopt, policy_);
    EXPECT_FALSE(r.success) << r.result.stdout_output;
    EXPECT_EQ(r.kind, ErrorKind::SPAWN_FAILED);
    EXPECT_EQ(find_executable("tool"), "");
}

TEST_F(ProcessRunnerTest, RelativeProgramPathResolvesAgainstGatewayDirectory) {
    std::string gw = tmp_.mkdir("gw");
    tmp_.mkdir("gw/bin");
    std::string work = tmp_.mkdir("work");
    tmp_.mkdir("work/bin");
    tmp_.write_file("gw/bin/tool", "#!/bin/sh\necho TRUSTED\n", 0755);
    tmp_.write_file("work/bin/tool", "#!/bin/sh\necho PLANTED\n", 0755);

    CwdGuard cwd(gw);
    EXPECT_EQ(find_executable("bin/tool"), gw + "/bin/tool");

    RunOutcome r = runner_.run("bin/tool", {}, work, std::nullopt, policy_);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.result.stdout_output, "TRUSTED\n");
}

TEST(FindExecutableTest, ReturnsAbsolutePathFromPath) {
    std::string sh = find_executable("sh");
    ASSERT_FALSE(sh.empty());
    EXPECT_EQ(sh[0], '/');
    EXPECT_EQ(find_executable(""), "");
    EXPECT_EQ(find_executable("execgate-no-such-binary"), "");
}
