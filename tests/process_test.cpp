/**
 * @file process_test.cpp
 * @brief 子进程执行测试（使用 /bin/sh）
 */

#include <gtest/gtest.h>
#include <chrono>
#include <string>

#include "sandbox/process.h"
#include "test_util.h"

using namespace plot;
using namespace plot::sandbox;
using namespace std::chrono_literals;

class ProcessTest : public plot_test::TempDirTest {
protected:
    Result<ProcessOutcome> sh(const std::string &script,
                              std::chrono::milliseconds timeout = 10000ms) const {
        return Process("/bin/sh").arg("-c").arg(script).run(timeout);
    }

    pid_t read_pid(const std::string &name) const {
        return static_cast<pid_t>(std::stol(trim(read(name))));
    }
};

TEST_F(ProcessTest, CapturesStdoutStderrAndExitCode) {
    auto res = sh("echo out; echo err >&2; exit 3");
    ASSERT_TRUE(res.ok()) << res.error().to_string();
    const ProcessOutcome &o = res.value();
    EXPECT_EQ(o.stdout_text, "out\n");
    EXPECT_EQ(o.stderr_text, "err\n");
    EXPECT_EQ(o.exit_code, 3);
    EXPECT_EQ(o.status, RunStatus::RUNTIME_ERROR);
    EXPECT_FALSE(o.timed_out);
    EXPECT_FALSE(o.ok());
}

TEST_F(ProcessTest, CleanExit) {
    auto res = sh("printf 'a b'");
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().stdout_text, "a b");
    EXPECT_EQ(res.value().stderr_text, "");
    EXPECT_EQ(res.value().exit_code, 0);
    EXPECT_EQ(res.value().status, RunStatus::OK);
    EXPECT_TRUE(res.value().ok());
}

TEST_F(ProcessTest, ReportsTerminatingSignal) {
    auto res = sh("echo before; kill -9 $$");
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().status, RunStatus::KILLED_BY_SIGNAL);
    EXPECT_EQ(res.value().signal, 9);
    EXPECT_EQ(res.value().stdout_text, "before\n");
    EXPECT_FALSE(res.value().timed_out);
}

TEST_F(ProcessTest, EnvironmentOverridesAndInheritance) {
    plot_test::ScopedEnv inherited("PLOT_TEST_INHERITED", "parent");
    plot_test::ScopedEnv replaced("PLOT_TEST_REPLACED", "old");

    auto res = Process("/bin/sh")
                   .arg("-c")
                   .arg("printf '%s|%s|%s' \"$PLOT_TEST_INHERITED\" \"$PLOT_TEST_REPLACED\" \"$PLOT_TEST_NEW\"")
                   .env("PLOT_TEST_REPLACED", "new")
                   .env("PLOT_TEST_NEW", "added")
                   .run(10000ms);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().stdout_text, "parent|new|added");
}

TEST_F(ProcessTest, RunsInWorkingDirectory) {
    make_dir("cwd");
    auto res = Process("/bin/sh").arg("-c").arg("pwd -P").work_dir(path("cwd")).run(10000ms);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(trim(res.value().stdout_text), get_realpath(path("cwd")));
}

TEST_F(ProcessTest, StdinIsEmpty) {
    auto res = sh("cat; echo done");
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().stdout_text, "done\n");
    EXPECT_FALSE(res.value().timed_out);
}

TEST_F(ProcessTest, LargeOutputOnBothStreamsDoesNotDeadlock) {
    auto res = sh("head -c 307200 /dev/zero | tr '\\000' b >&2; "
                  "head -c 1048576 /dev/zero | tr '\\000' a");
    ASSERT_TRUE(res.ok());
    EXPECT_FALSE(res.value().timed_out);
    EXPECT_EQ(res.value().status, RunStatus::OK);
    EXPECT_EQ(res.value().stdout_text, std::string(1048576, 'a'));
    EXPECT_EQ(res.value().stderr_text, std::string(307200, 'b'));
}

TEST_F(ProcessTest, TimeoutKillsWholeProcessGroup) {
    std::string script =
        "echo $$ > '" + path("main.pid") + "'; "
        "sleep 30 & echo $! > '" + path("child.pid") + "'; "
        "echo started; wait";
    auto start = std::chrono::steady_clock::now();
    auto res = sh(script, 500ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(res.ok()) << res.error().to_string();
    EXPECT_TRUE(res.value().timed_out);
    EXPECT_EQ(res.value().status, RunStatus::TIME_LIMIT);
    EXPECT_EQ(res.value().signal, SIGKILL);
    EXPECT_EQ(res.value().stdout_text, "started\n");
    EXPECT_GE(res.value().real_time_ms, 500);
    EXPECT_LT(elapsed, 10s);

    EXPECT_TRUE(plot_test::wait_process_gone(read_pid("main.pid")));
    EXPECT_TRUE(plot_test::wait_process_gone(read_pid("child.pid")));
}

TEST_F(ProcessTest, LeftoverDescendantsAreKilledAfterExit) {
    std::string script = "sleep 30 & echo $! > '" + path("child.pid") + "'; exit 0";
    auto start = std::chrono::steady_clock::now();
    auto res = sh(script);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(res.ok());
    EXPECT_FALSE(res.value().timed_out);
    EXPECT_EQ(res.value().status, RunStatus::OK);
    EXPECT_LT(elapsed, 10s);
    EXPECT_TRUE(plot_test::wait_process_gone(read_pid("child.pid")));
}

TEST_F(ProcessTest, MissingProgramIsAnExecError) {
    auto res = Process(path("does-not-exist")).run(1000ms);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code(), ErrorCode::EXEC_FAILED);
}

TEST_F(ProcessTest, NonExecutableProgramIsAnExecError) {
    write("plain.sh", "#!/bin/sh\necho hi\n");
    auto res = Process(path("plain.sh")).run(1000ms);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code(), ErrorCode::EXEC_FAILED);
}

TEST_F(ProcessTest, MissingWorkingDirectoryIsAnExecError) {
    auto res = Process("/bin/sh").arg("-c").arg("true").work_dir(path("nowhere")).run(1000ms);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code(), ErrorCode::EXEC_FAILED);
}

TEST_F(ProcessTest, ScriptWithArguments) {
    std::string script = write_script("args.sh", "printf '%s,' \"$@\"\n");
    auto res = Process(script).args({"one", "two words"}).arg("three").run(10000ms);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().stdout_text, "one,two words,three,");
}
