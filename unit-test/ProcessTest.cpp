#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "process.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace oj;

class ProcessTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }
};

TEST_F(ProcessTest, CapturesExitCodeAndOutputTest) {
    process_options options;
    options.argv = {"/bin/sh", "-c", "echo out; echo err >&2; exit 3"};
    process_result result = run_process(options);

    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.signal, 0);
    EXPECT_EQ(result.captured_stdout, "out\n");
    EXPECT_EQ(result.captured_stderr, "err\n");
    EXPECT_FALSE(result.deadline_exceeded);
    EXPECT_FALSE(result.success());
}

TEST_F(ProcessTest, RedirectsStdinAndStdoutTest) {
    auto input = write_test_file("ProcessTest/redirect.in", "hello\nworld\n");
    auto output = input.parent_path() / "redirect.out";

    process_options options;
    options.argv = {"cat"};
    options.stdin_path = input;
    options.stdout_path = output;
    process_result result = run_process(options);

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.captured_stdout, "");
    EXPECT_EQ(read_file_content(output), "hello\nworld\n");
}

TEST_F(ProcessTest, DeadlineExceededTest) {
    process_options options;
    options.argv = {"/bin/sh", "-c", "sleep 10"};
    options.deadline = chrono::microseconds(200000);

    elapsed_time timer;
    process_result result = run_process(options);

    EXPECT_TRUE(result.deadline_exceeded);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.elapsed, chrono::microseconds(200000));
    EXPECT_LT(timer.duration<chrono::seconds>().count(), 5);
}

TEST_F(ProcessTest, FinishesWithinDeadlineTest) {
    process_options options;
    options.argv = {"/bin/sh", "-c", "sleep 0.1"};
    options.deadline = chrono::microseconds(5000000);
    process_result result = run_process(options);

    EXPECT_TRUE(result.success());
    EXPECT_FALSE(result.deadline_exceeded);
    EXPECT_GE(result.elapsed, chrono::microseconds(100000));
    EXPECT_LT(result.elapsed, chrono::microseconds(5000000));
}

TEST_F(ProcessTest, SpawnFailureTest) {
    process_options options;
    options.argv = {"/nonexistent/oj-judger-program"};
    EXPECT_THROW(run_process(options), execution_error);
}

TEST_F(ProcessTest, RepeatedSpawnFailureTest) {
    // exec 失败必须每次都被报告，而不是被当成返回值 127 的正常退出
    process_options options;
    options.argv = {"/nonexistent/oj-judger-program"};
    for (int i = 0; i < 100; ++i)
        EXPECT_THROW(run_process(options), execution_error) << "attempt " << i;
}

TEST_F(ProcessTest, MissingStdinFileTest) {
    process_options options;
    options.argv = {"cat"};
    options.stdin_path = "/nonexistent/testdata.in";
    EXPECT_THROW(run_process(options), execution_error);
}

TEST_F(ProcessTest, KilledBySignalTest) {
    process_options options;
    options.argv = {"/bin/sh", "-c", "kill -9 $$"};
    process_result result = run_process(options);

    EXPECT_EQ(result.signal, 9);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_FALSE(result.success());
}

TEST_F(ProcessTest, LargeOutputTest) {
    process_options options;
    options.argv = {"head", "-c", "1000000", "/dev/zero"};
    process_result result = run_process(options);

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.captured_stdout.size(), 1000000u);
}

TEST_F(ProcessTest, CancellationTest) {
    cancellation_token token;
    process_options options;
    options.argv = {"/bin/sh", "-c", "sleep 10"};
    options.token = &token;

    thread canceler([&] {
        this_thread::sleep_for(chrono::milliseconds(100));
        token.cancel();
    });
    elapsed_time timer;
    process_result result = run_process(options);
    canceler.join();

    EXPECT_TRUE(result.canceled);
    EXPECT_FALSE(result.success());
    EXPECT_LT(timer.duration<chrono::seconds>().count(), 5);
}

TEST_F(ProcessTest, CanceledBeforeSpawnTest) {
    cancellation_token token;
    token.cancel();
    process_options options;
    options.argv = {"/nonexistent/oj-judger-program"};
    options.token = &token;

    process_result result = run_process(options);
    EXPECT_TRUE(result.canceled);
}

TEST_F(ProcessTest, WorkingDirectoryTest) {
    auto dir = write_test_file("ProcessTest/cwd/marker", "").parent_path();
    process_options options;
    options.argv = {"/bin/sh", "-c", "ls"};
    options.working_dir = dir;
    process_result result = run_process(options);

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.captured_stdout, "marker\n");
}
