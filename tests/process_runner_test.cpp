#include "test_helpers.hpp"

#include "process_runner.hpp"

#include <csignal>
#include <thread>

using namespace metaclean;
using namespace std::chrono_literals;

TEST(ProcessRunnerTest, ReportsExitCode) {
    const auto ok = run_process({"/bin/sh", "-c", "exit 0"});
    EXPECT_TRUE(ok.succeeded());
    EXPECT_EQ(ok.exit_code, 0);

    const auto failed = run_process({"/bin/sh", "-c", "exit 3"});
    EXPECT_FALSE(failed.succeeded());
    EXPECT_EQ(failed.exit_code, 3);
    EXPECT_FALSE(failed.launch_failed);
}

TEST(ProcessRunnerTest, CapturesStdoutAndStderrSeparately) {
    const auto result = run_process({"/bin/sh", "-c", "echo out; echo err >&2"});
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
}

TEST(ProcessRunnerTest, ArgumentsAreNotInterpretedByAShell) {
    const auto result = run_process({"/bin/sh", "-c", "printf '%s|' \"$@\"", "sh", "a b", "$HOME", ";"});
    EXPECT_EQ(result.stdout_output, "a b|$HOME|;|");
}

TEST(ProcessRunnerTest, StdinIsEmpty) {
    const auto result = run_process({"/bin/sh", "-c", "cat; echo end"}, 5s);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.stdout_output, "end\n");
}

TEST(ProcessRunnerTest, LargeOutputIsTruncated) {
    const auto result = run_process({"/bin/sh", "-c", "head -c 3000000 /dev/zero"}, 20s);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdout_output.size(), kMaxCapturedOutput);
}

TEST(ProcessRunnerTest, ReportsTerminatingSignal) {
    const auto result = run_process({"/bin/sh", "-c", "kill -TERM $$"});
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.term_signal, SIGTERM);
    EXPECT_EQ(result.exit_code, -1);
}

TEST(ProcessRunnerTest, KillsChildOnTimeout) {
    const auto start = std::chrono::steady_clock::now();
    const auto result = run_process({"/bin/sh", "-c", "exec sleep 10"}, 300ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.succeeded());
    EXPECT_LT(elapsed, 5s);
}

TEST(ProcessRunnerTest, StopFlagCancelsChild) {
    std::atomic<bool> stop{false};
    std::thread canceller([&stop] {
        std::this_thread::sleep_for(200ms);
        stop.store(true);
    });

    const auto start = std::chrono::steady_clock::now();
    const auto result = run_process({"/bin/sh", "-c", "exec sleep 10"}, 0ms, &stop);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
    EXPECT_LT(elapsed, 5s);
}

TEST(ProcessRunnerTest, MissingProgramFailsToLaunch) {
    const auto result = run_process({"/nonexistent/metaclean-no-such-tool", "-version"});
    EXPECT_TRUE(result.launch_failed);
    EXPECT_FALSE(result.launch_error.empty());
    EXPECT_FALSE(result.succeeded());
}

TEST(ProcessRunnerTest, EmptyCommandLineFailsToLaunch) {
    const auto result = run_process({});
    EXPECT_TRUE(result.launch_failed);
}
