#include <cerrno>
#include <csignal>
#include <future>
#include <sys/types.h>

#include "taskq/executor.hpp"
#include "taskq/state_machine.hpp"
#include "test_fixation.hpp"

namespace taskq {

class ExecutorTests : public TaskqTest {
protected:
    std::unique_ptr<Executor> executor_;

    void SetUp() override {
        TaskqTest::SetUp();
        executor_ = std::make_unique<Executor>(*store_, config_, log_);
    }

    Status runTask(TaskId id) { return executor_->run(fetch(id)); }

    static double secondsSince(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }

    bool pidRecorded(TaskId id) const {
        auto task = store_->getTask(id);
        return task && task->pid.has_value();
    }

    static bool processGone(int pid) { return ::kill(pid, 0) != 0 && errno == ESRCH; }
};

TEST_F(ExecutorTests, SuccessfulCommandCompletes) {
    TaskId id = insert("echo hello", 5, 0, "hello");

    EXPECT_EQ(runTask(id), Status::Completed);

    Task task = fetch(id);
    EXPECT_EQ(task.status, Status::Completed);
    ASSERT_TRUE(task.exitCode.has_value());
    EXPECT_EQ(*task.exitCode, 0);
    ASSERT_TRUE(task.startTime.has_value());
    ASSERT_TRUE(task.endTime.has_value());
    EXPECT_LE(*task.startTime, *task.endTime);
    ASSERT_TRUE(task.pid.has_value());
    EXPECT_GT(*task.pid, 0);
    EXPECT_FALSE(task.error.has_value());
    EXPECT_EQ(readAll(task.stdoutFile), "hello\n");
    EXPECT_TRUE(captured_.contains("TASK COMPLETED: " + std::to_string(id)));
}

TEST_F(ExecutorTests, RunsInSubmittedDirectoryWithSubmittedEnvironment) {
    auto workDir = home_ / "work";
    std::filesystem::create_directories(workDir);

    TaskSpec spec = makeSpec("echo \"$FOO\"; pwd -P; echo oops >&2", 5, 0, "envcheck");
    spec.cwd = workDir;
    spec.environment["FOO"] = "bar";
    TaskId id = store_->insertTask(spec);

    EXPECT_EQ(runTask(id), Status::Completed);

    Task task = fetch(id);
    EXPECT_EQ(readAll(task.stdoutFile), "bar\n" + std::filesystem::canonical(workDir).string() + "\n");
    EXPECT_EQ(readAll(task.stderrFile), "oops\n");
}

TEST_F(ExecutorTests, EchoFromTmpLandsInStdoutFile) {
    TaskSpec spec = makeSpec("echo $FOO; pwd -P", 5, 0, "tmpecho");
    spec.cwd = "/tmp";
    spec.environment["FOO"] = "bar";
    TaskId id = store_->insertTask(spec);

    EXPECT_EQ(runTask(id), Status::Completed);
    EXPECT_EQ(readAll(fetch(id).stdoutFile), "bar\n" + std::filesystem::canonical("/tmp").string() + "\n");
}

TEST_F(ExecutorTests, OnlySubmittedVariablesAreVisible) {
    ::setenv("TASKQ_EXECUTOR_LEAK_CHECK", "leaked", 1);
    TaskId id = insert("echo \"[${TASKQ_EXECUTOR_LEAK_CHECK}]\"", 5, 0, "leak");
    EXPECT_EQ(runTask(id), Status::Completed);
    ::unsetenv("TASKQ_EXECUTOR_LEAK_CHECK");

    EXPECT_EQ(readAll(fetch(id).stdoutFile), "[]\n");
}

TEST_F(ExecutorTests, OutputFilesAreAppended) {
    TaskId first = insert("echo first", 5, 0, "shared");
    TaskId second = insert("echo second", 5, 0, "shared");

    EXPECT_EQ(runTask(first), Status::Completed);
    EXPECT_EQ(runTask(second), Status::Completed);

    EXPECT_EQ(readAll(fetch(second).stdoutFile), "first\nsecond\n");
}

TEST_F(ExecutorTests, NonZeroExitFails) {
    TaskId id = insert("exit 3");

    EXPECT_EQ(runTask(id), Status::Failed);

    Task task = fetch(id);
    ASSERT_TRUE(task.exitCode.has_value());
    EXPECT_EQ(*task.exitCode, 3);
    ASSERT_TRUE(task.error.has_value());
    EXPECT_EQ(*task.error, "exited with status 3");
    EXPECT_TRUE(task.endTime.has_value());
    EXPECT_TRUE(captured_.contains("TASK FAILED: " + std::to_string(id)));
}

TEST_F(ExecutorTests, SignalDeathRecordsShellStyleCode) {
    TaskId id = insert("kill -9 $$");

    EXPECT_EQ(runTask(id), Status::Failed);

    Task task = fetch(id);
    ASSERT_TRUE(task.exitCode.has_value());
    EXPECT_EQ(*task.exitCode, 128 + SIGKILL);
    ASSERT_TRUE(task.error.has_value());
    EXPECT_NE(task.error->find("signal 9"), std::string::npos);
}

TEST_F(ExecutorTests, TimeoutTerminatesTheChild) {
    TaskId id = insert("sleep 5", 5, 1, "sleeper");

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(runTask(id), Status::Failed);
    double elapsed = secondsSince(start);

    EXPECT_GE(elapsed, 0.9);
    EXPECT_LT(elapsed, 4.0);

    Task task = fetch(id);
    ASSERT_TRUE(task.error.has_value());
    EXPECT_NE(task.error->find("timed out"), std::string::npos);
    EXPECT_TRUE(task.endTime.has_value());
    ASSERT_TRUE(task.pid.has_value());
    EXPECT_TRUE(processGone(*task.pid));
}

TEST_F(ExecutorTests, TimeoutEscalatesWhenTermIsIgnored) {
    TaskId id = insert("trap '' TERM; sleep 30", 5, 1, "stubborn");

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(runTask(id), Status::Failed);
    EXPECT_LT(secondsSince(start), 6.0);

    Task task = fetch(id);
    ASSERT_TRUE(task.pid.has_value());
    EXPECT_TRUE(processGone(*task.pid));
    EXPECT_TRUE(captured_.contains("sending SIGKILL"));
}

TEST_F(ExecutorTests, MissingWorkingDirectoryFailsWithoutSpawning) {
    TaskSpec spec = makeSpec("echo never");
    spec.cwd = home_ / "does-not-exist";
    TaskId id = store_->insertTask(spec);

    EXPECT_EQ(runTask(id), Status::Failed);

    Task task = fetch(id);
    EXPECT_FALSE(task.pid.has_value());
    EXPECT_FALSE(task.exitCode.has_value());
    EXPECT_TRUE(task.startTime.has_value());
    EXPECT_TRUE(task.endTime.has_value());
    ASSERT_TRUE(task.error.has_value());
    EXPECT_FALSE(task.error->empty());
}

TEST_F(ExecutorTests, UnopenableOutputFailsWithoutSpawning) {
    std::ofstream(home_ / "blocker") << "x";
    TaskSpec spec = makeSpec("echo never");
    spec.stdoutFile = home_ / "blocker" / "out.log";
    TaskId id = store_->insertTask(spec);

    EXPECT_EQ(runTask(id), Status::Failed);

    Task task = fetch(id);
    EXPECT_FALSE(task.pid.has_value());
    EXPECT_TRUE(task.endTime.has_value());
    ASSERT_TRUE(task.error.has_value());
    EXPECT_NE(task.error->find("Cannot open"), std::string::npos);
}

TEST_F(ExecutorTests, TaskNoLongerPendingIsSkipped) {
    TaskId id = insert("echo never");
    store_->updateStatus(id, Status::Cancelled);

    ExecutionResult result = executor_->execute(fetch(id));
    EXPECT_EQ(result.outcome, ExecutionOutcome::Skipped);
    EXPECT_FALSE(result.started);
    EXPECT_EQ(executor_->finish(fetch(id), result), Status::Cancelled);

    Task task = fetch(id);
    EXPECT_FALSE(task.startTime.has_value());
    EXPECT_FALSE(task.endTime.has_value());
    EXPECT_FALSE(task.pid.has_value());
}

TEST_F(ExecutorTests, CancelWhileRunningStaysCancelled) {
    TaskId id = insert("sleep 30", 5, 0, "cancelme");

    auto running = std::async(std::launch::async, [&] { return runTask(id); });
    ASSERT_TRUE(waitUntil([&] { return pidRecorded(id); }));

    CancelResult cancelled = cancelTask(*store_, id, *log_);
    EXPECT_TRUE(cancelled);

    ASSERT_EQ(running.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_EQ(running.get(), Status::Cancelled);

    Task task = fetch(id);
    EXPECT_EQ(task.status, Status::Cancelled);
    EXPECT_TRUE(task.endTime.has_value());
    EXPECT_TRUE(processGone(*task.pid));
    EXPECT_TRUE(captured_.contains("keeping cancelled"));
}

TEST_F(ExecutorTests, AbortFlagTerminatesTheChild) {
    TaskId id = insert("sleep 30", 5, 0, "aborted");
    std::atomic<bool> abort{false};

    auto running = std::async(std::launch::async, [&] { return executor_->run(fetch(id), &abort); });
    ASSERT_TRUE(waitUntil([&] { return pidRecorded(id); }));
    abort.store(true);

    ASSERT_EQ(running.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_EQ(running.get(), Status::Failed);

    Task task = fetch(id);
    ASSERT_TRUE(task.error.has_value());
    EXPECT_EQ(*task.error, "terminated by scheduler shutdown");
    EXPECT_TRUE(processGone(*task.pid));
}

TEST(ExecutionOutcomeTest, NamesAreStable) {
    EXPECT_STREQ(outcomeName(ExecutionOutcome::Completed), "completed");
    EXPECT_STREQ(outcomeName(ExecutionOutcome::TimedOut), "timed out");
    EXPECT_STREQ(outcomeName(ExecutionOutcome::Skipped), "skipped");
}

}
