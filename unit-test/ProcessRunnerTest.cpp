#include <signal.h>
#include <thread>
#include "gtest/gtest.h"
#include "polyrun/common/proc_stat.hpp"
#include "polyrun/runner/process_runner.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace polyrun;
namespace fs = std::filesystem;

class ProcessRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = make_temp_dir("polyrun-runner");
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    run_request shell(const string &script) {
        run_request request;
        request.command = {"sh", "-c", script};
        request.work_dir = dir;
        request.limits.timeout_ms = 10000;
        return request;
    }

    fs::path dir;
    local_process_runner runner{test_sandbox()};
};

TEST_F(ProcessRunnerTest, CaptureStdout) {
    run_result result = runner.run(shell("echo hello"));
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.stdout_data, "hello\n");
    EXPECT_EQ(result.stderr_data, "");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.signal);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(runner.spawn_count(), 1);
}

TEST_F(ProcessRunnerTest, SeparateStderr) {
    run_result result = runner.run(shell("echo out; echo err >&2"));
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.stdout_data, "out\n");
    EXPECT_EQ(result.stderr_data, "err\n");
}

TEST_F(ProcessRunnerTest, FeedStdin) {
    run_request request = shell("cat");
    request.stdin_data = "line1\nline2\n";
    run_result result = runner.run(request);
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.stdout_data, "line1\nline2\n");
}

TEST_F(ProcessRunnerTest, EmptyStdinReadsEof) {
    run_result result = runner.run(shell("cat; echo done"));
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.stdout_data, "done\n");
}

TEST_F(ProcessRunnerTest, UnreadStdinIsDropped) {
    run_request request = shell("echo ignored");
    request.stdin_data = string(1 << 20, 'x');
    run_result result = runner.run(request);
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.stdout_data, "ignored\n");
}

TEST_F(ProcessRunnerTest, NonZeroExitCode) {
    run_result result = runner.run(shell("echo partial; exit 3"));
    EXPECT_EQ(result.stat, status::RUNTIME_ERROR);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_data, "partial\n");
    EXPECT_EQ(result.error, "Command exited with code 3");
}

TEST_F(ProcessRunnerTest, KilledBySignal) {
    run_result result = runner.run(shell("kill -SEGV $$"));
    EXPECT_EQ(result.stat, status::RUNTIME_ERROR);
    ASSERT_TRUE(result.signal);
    EXPECT_EQ(*result.signal, SIGSEGV);
    EXPECT_EQ(result.exit_code, 128 + SIGSEGV);
}

TEST_F(ProcessRunnerTest, WallTimeLimit) {
    run_request request = shell("sleep 30");
    request.limits.timeout_ms = 300;
    run_result result = runner.run(request);
    EXPECT_EQ(result.stat, status::TIMEOUT);
    EXPECT_TRUE(result.timed_out);
    EXPECT_GE(result.wall_time_ms, 300);
    EXPECT_LT(result.wall_time_ms, 5000);
}

TEST_F(ProcessRunnerTest, TimeoutKillsDescendants) {
    run_request request = shell("sleep 30 & sleep 30 & echo started; wait");
    request.limits.timeout_ms = 300;
    run_result result = runner.run(request);
    EXPECT_EQ(result.stat, status::TIMEOUT);
    EXPECT_EQ(result.stdout_data, "started\n");
    // 后台进程持有输出管道，没有被杀死时读取会一直等到排空超时
    EXPECT_LT(result.wall_time_ms, 5000);
}

TEST_F(ProcessRunnerTest, OutputTruncated) {
    run_request request = shell("head -c 100000 /dev/zero; echo err >&2");
    request.limits.max_output_bytes = 1000;
    run_result result = runner.run(request);
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.stdout_data.size(), 1000u);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_EQ(result.stderr_data, "err\n");
    EXPECT_FALSE(result.stderr_truncated);
}

TEST_F(ProcessRunnerTest, CpuTimeLimit) {
    run_request request = shell("while :; do :; done");
    request.limits.cpu_time_ms = 1000;
    request.limits.timeout_ms = 20000;
    run_result result = runner.run(request);
    EXPECT_EQ(result.stat, status::RESOURCE_EXCEEDED);
    EXPECT_FALSE(result.timed_out);
    EXPECT_GE(result.cpu_time_ms, 900);
}

TEST_F(ProcessRunnerTest, FileSizeLimit) {
    run_request request = shell("exec head -c 100000 /dev/zero > out.bin");
    request.limits.file_size_bytes = 1000;
    run_result result = runner.run(request);
    EXPECT_EQ(result.stat, status::RESOURCE_EXCEEDED);
    ASSERT_TRUE(result.signal);
    EXPECT_EQ(*result.signal, SIGXFSZ);
    EXPECT_LE(fs::file_size(dir / "out.bin"), 1000u);
}

TEST_F(ProcessRunnerTest, FileSizeLimitUnderShell) {
    // shell 不会 exec 最后一条命令，被 SIGXFSZ 杀死的是 head，shell 以 128 + SIGXFSZ 退出
    run_request request = shell("head -c 100000 /dev/zero > out.bin; code=$?; exit $code");
    request.limits.file_size_bytes = 1000;
    run_result result = runner.run(request);
    EXPECT_EQ(result.stat, status::RESOURCE_EXCEEDED);
    EXPECT_FALSE(result.signal);
    EXPECT_EQ(result.exit_code, 128 + SIGXFSZ);
    EXPECT_NE(result.error.find("File Size Limit Exceeded"), string::npos) << result.error;
}

TEST_F(ProcessRunnerTest, ExitCodeWithoutFileSizeLimit) {
    run_result result = runner.run(shell("exit " + to_string(128 + SIGXFSZ)));
    EXPECT_EQ(result.stat, status::RUNTIME_ERROR);
    EXPECT_EQ(result.exit_code, 128 + SIGXFSZ);
}

TEST_F(ProcessRunnerTest, MemoryLimit) {
    if (!has_program("python3")) GTEST_SKIP() << "python3 is not installed";

    run_request request;
    request.command = {"python3", "-c", "import time\na = b'x' * (512 * 1024 * 1024)\ntime.sleep(10)"};
    request.work_dir = dir;
    request.limits.timeout_ms = 10000;
    request.limits.memory_bytes = 64LL * 1024 * 1024;
    run_result result = runner.run(request);
    EXPECT_EQ(result.stat, status::RESOURCE_EXCEEDED);
    EXPECT_FALSE(result.timed_out);
    EXPECT_GT(result.memory_bytes, 64LL * 1024 * 1024);
}

TEST_F(ProcessRunnerTest, Environment) {
    run_request request = shell("echo $GREETING; echo $HOME; pwd");
    request.env = {{"GREETING", "hi"}};
    run_result result = runner.run(request);
    EXPECT_EQ(result.stat, status::SUCCESS);
    string expected = "hi\n" + dir.string() + "\n" + fs::canonical(dir).string() + "\n";
    EXPECT_EQ(result.stdout_data, expected);
}

TEST_F(ProcessRunnerTest, CommandNotFound) {
    run_request request;
    request.command = {"polyrun-no-such-command"};
    request.work_dir = dir;
    run_result result = runner.run(request);
    EXPECT_EQ(result.stat, status::INTERNAL_ERROR);
    EXPECT_NE(result.error.find("Unable to start command"), string::npos) << result.error;
}

TEST_F(ProcessRunnerTest, EmptyCommand) {
    run_request request;
    request.work_dir = dir;
    run_result result = runner.run(request);
    EXPECT_EQ(result.stat, status::INTERNAL_ERROR);
    EXPECT_EQ(runner.spawn_count(), 0);
}

TEST_F(ProcessRunnerTest, Cancellation) {
    cancellation_token token;
    run_request request = shell("sleep 30");
    request.cancel = &token;

    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(100));
        token.cancel();
    });
    run_result result = runner.run(request);
    canceller.join();

    EXPECT_EQ(result.stat, status::TIMEOUT);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.error, "Execution cancelled");
    EXPECT_LT(result.wall_time_ms, 5000);
}

TEST_F(ProcessRunnerTest, RequestDeadline) {
    cancellation_token token;
    token.set_deadline(chrono::steady_clock::now() + chrono::milliseconds(300));
    run_request request = shell("sleep 30");
    request.cancel = &token;
    run_result result = runner.run(request);

    EXPECT_EQ(result.stat, status::TIMEOUT);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.error, "Time Limit Exceeded (request deadline)");
    EXPECT_LT(result.wall_time_ms, 5000);
}

TEST_F(ProcessRunnerTest, WorkspaceIsWritable) {
    run_result result = runner.run(shell("echo saved > result.txt && cat result.txt"));
    EXPECT_EQ(result.stat, status::SUCCESS);
    EXPECT_EQ(result.stdout_data, "saved\n");
    EXPECT_TRUE(fs::exists(dir / "result.txt"));
}

TEST_F(ProcessRunnerTest, CannotWriteOutsideWorkspace) {
    if (!isolation_available()) GTEST_SKIP() << "namespaces are not available";

    fs::path outside = make_temp_dir("polyrun-outside");
    run_result result = runner.run(shell("echo escaped > " + (outside / "escaped.txt").string() + " && echo written"));
    EXPECT_EQ(result.stat, status::RUNTIME_ERROR);
    EXPECT_EQ(result.stdout_data, "");
    EXPECT_FALSE(fs::exists(outside / "escaped.txt"));

    // 工作目录的父目录同样是只读的
    result = runner.run(shell("echo escaped > ../polyrun-escaped.txt"));
    EXPECT_EQ(result.stat, status::RUNTIME_ERROR);
    EXPECT_FALSE(fs::exists(dir.parent_path() / "polyrun-escaped.txt"));
    fs::remove_all(outside);
}

TEST_F(ProcessRunnerTest, DetachedDescendantsAreKilled) {
    if (!isolation_available()) GTEST_SKIP() << "namespaces are not available";
    if (!has_program("setsid")) GTEST_SKIP() << "setsid is not installed";

    run_result result = runner.run(shell("setsid sleep 30 < /dev/null > /dev/null 2>&1 & echo $!"));
    ASSERT_EQ(result.stat, status::SUCCESS);
    pid_t detached = stoi(result.stdout_data);

    auto stat = read_proc_stat(detached);
    EXPECT_TRUE(!stat || stat->state == 'Z' || stat->state == 'X') << "process " << detached << " is still running";
}

TEST_F(ProcessRunnerTest, IsolationCheck) {
    EXPECT_TRUE(runner.check_isolation(dir));

    sandbox_options options;
    options.isolate = false;
    EXPECT_TRUE(local_process_runner(options).check_isolation(dir));
}

TEST_F(ProcessRunnerTest, ConcurrentRuns) {
    vector<thread> threads;
    vector<run_result> results(4);
    for (size_t i = 0; i < results.size(); ++i)
        threads.emplace_back([&, i] {
            results[i] = runner.run(shell("echo " + to_string(i)));
        });
    for (auto &th : threads) th.join();

    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].stat, status::SUCCESS);
        EXPECT_EQ(results[i].stdout_data, to_string(i) + "\n");
    }
    EXPECT_EQ(runner.spawn_count(), 4);
}
