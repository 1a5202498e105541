#include <cerrno>
#include "common/exceptions.hpp"
#include "execute/process.hpp"
#include "gtest/gtest.h"
#include "test/temp_directory.hpp"

using namespace std;
using namespace std::chrono;
using namespace grader;

static vector<string> shell(const string &script) {
    return {"/bin/sh", "-c", script};
}

TEST(ProcessTest, CaptureOutputTest) {
    process_result result = run_process(shell("echo hello; echo world >&2"));
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.signal, 0);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.out, "hello\n");
    EXPECT_EQ(result.err, "world\n");
    EXPECT_EQ(classify(result), (execution_outcome{outcome_status::CHECKED, "hello"}));
}

TEST(ProcessTest, StdinTest) {
    process_options options;
    options.input = "abc\ndef\n";
    process_result result = run_process({"cat"}, options);
    EXPECT_EQ(result.out, "abc\ndef\n");
}

TEST(ProcessTest, LargeInputTest) {
    process_options options;
    options.input = string(4 << 20, 'x');
    options.time_limit = seconds(10);
    process_result result = run_process({"cat"}, options);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.out.size(), options.input->size());
}

TEST(ProcessTest, ProgramIgnoringInputTest) {
    process_options options;
    options.input = string(1 << 20, 'x');
    options.time_limit = seconds(10);
    process_result result = run_process(shell("echo done"), options);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, "done\n");
}

TEST(ProcessTest, ErrorFromStderrTest) {
    process_result result = run_process(shell("echo out; echo 'division by zero' >&2; exit 3"));
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(classify(result), (execution_outcome{outcome_status::ERROR, "division by zero\n"}));
}

TEST(ProcessTest, ErrorFromStdoutTest) {
    process_result result = run_process(shell("echo 'only stdout'; exit 1"));
    EXPECT_EQ(classify(result), (execution_outcome{outcome_status::ERROR, "only stdout\n"}));
}

TEST(ProcessTest, SilentFailureIsFatalTest) {
    process_result result = run_process(shell("exit 2"));
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_THROW(classify(result), execution_error);
}

TEST(ProcessTest, SignalTest) {
    process_result result = run_process(shell("kill -SEGV $$"));
    EXPECT_EQ(result.signal, SIGSEGV);
    EXPECT_EQ(result.exit_code, 128 + SIGSEGV);
    execution_outcome outcome = classify(result);
    EXPECT_EQ(outcome.status, outcome_status::ERROR);
    EXPECT_NE(outcome.payload.find("signal 11"), string::npos) << outcome.payload;
}

TEST(ProcessTest, TimeoutTest) {
    process_options options;
    options.time_limit = milliseconds(200);
    process_result result = run_process(shell("sleep 10"), options);
    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(result.wall_time, seconds(3));
    EXPECT_EQ(classify(result).status, outcome_status::TIMED_OUT);
}

TEST(ProcessTest, TimeoutKillsProcessGroupTest) {
    process_options options;
    options.time_limit = milliseconds(200);
    // 后台的 sleep 持有输出管道，只有杀死整个进程组才能结束
    process_result result = run_process(shell("sleep 10 & echo started; wait"), options);
    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(result.wall_time, seconds(3));
    EXPECT_EQ(result.out, "started\n");
}

TEST(ProcessTest, TimeoutAfterClosingOutputTest) {
    process_options options;
    options.time_limit = milliseconds(200);
    process_result result = run_process(shell("exec >/dev/null 2>&1; sleep 10"), options);
    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(result.wall_time, seconds(3));
}

TEST(ProcessTest, SpawnErrorTest) {
    try {
        run_process({"/nonexistent/program"});
        FAIL() << "spawn_error expected";
    } catch (spawn_error &e) {
        EXPECT_EQ(e.error_code, ENOENT);
    }

    process_options options;
    options.working_dir = "/nonexistent/directory";
    EXPECT_THROW(run_process({"true"}, options), spawn_error);
}

TEST(ProcessTest, WorkingDirectoryAndEnvironmentTest) {
    temp_directory dir;
    process_options options;
    options.working_dir = dir.path;
    options.environment["GRADER_TEST"] = "value";
    process_result result = run_process(shell("echo $GRADER_TEST; pwd"), options);
    EXPECT_EQ(result.out, "value\n" + filesystem::canonical(dir.path).string() + "\n");
}

TEST(ProcessTest, CompileFailureSkipsRunTest) {
    temp_directory dir;
    process_options options;
    options.working_dir = dir.path;
    program_driver driver(shell("touch ran; cat"), options, shell("echo 'syntax error' >&2; exit 1"));

    vector<execution_outcome> outcomes = driver.run_all({"1", "2"});
    ASSERT_EQ(outcomes.size(), 2u);
    for (auto &outcome : outcomes)
        EXPECT_EQ(outcome, (execution_outcome{outcome_status::ERROR, "syntax error\n"}));
    EXPECT_FALSE(filesystem::exists(dir.path / "ran"));
}

TEST(ProcessTest, CompileOnceThenRunTest) {
    temp_directory dir;
    process_options options;
    options.working_dir = dir.path;
    program_driver driver(shell("read a b; echo $((a + b)) $(cat count)"), options,
                          shell("echo x >> count; wc -l < count > count.tmp; mv count.tmp count"));

    EXPECT_EQ(driver.run("1 2\n"), (execution_outcome{outcome_status::CHECKED, "3 1"}));
    EXPECT_EQ(driver.run("5 5\n"), (execution_outcome{outcome_status::CHECKED, "10 1"}));
}
