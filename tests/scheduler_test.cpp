#include <future>

#include "taskq/run_state.hpp"
#include "taskq/scheduler.hpp"
#include "taskq/submitter.hpp"
#include "test_fixation.hpp"

namespace taskq {

namespace {
// Leaves a window between start() being called and the marker being claimed.
class SlowClaimRunState final : public RunStateStore {
public:
    [[nodiscard]] RunState get() const override { return inner_.get(); }
    void set(RunState state) override { inner_.set(state); }
    [[nodiscard]] bool claim() override {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return inner_.claim();
    }

private:
    MemoryRunState inner_;
};
}

class SchedulerTests : public TaskqTest {
protected:
    std::unique_ptr<FakeResourceMonitor> monitor_;

    void SetUp() override {
        TaskqTest::SetUp();
        monitor_ = std::make_unique<FakeResourceMonitor>(log_);
    }

    std::unique_ptr<FileRunState> fileRunState() {
        return std::make_unique<FileRunState>(config_.statusFile(), config_.pidFile(), log_);
    }
};

TEST_F(SchedulerTests, StatusDescribesMarker) {
    SchedulerStatus stopped;
    EXPECT_EQ(stopped.describe(), "Scheduler stopped");

    SchedulerStatus running;
    running.state = RunState::Running;
    running.owner = 4242;
    EXPECT_EQ(running.describe(), "Scheduler running (pid 4242)");

    running.stale = true;
    EXPECT_EQ(running.describe(), "Scheduler running (pid 4242), stale: owner is no longer alive");
}

TEST_F(SchedulerTests, StopWhenNotRunningIsANoOp) {
    MemoryRunState runState;
    Scheduler scheduler(*store_, runState, *monitor_, config_, log_);

    ControlResult result = scheduler.stop();
    EXPECT_FALSE(result);
    EXPECT_EQ(result.outcome, ControlOutcome::NotRunning);
    EXPECT_EQ(runState.get(), RunState::Stopped);
}

TEST_F(SchedulerTests, StartBlocksUntilStopped) {
    MemoryRunState runState;
    Scheduler scheduler(*store_, runState, *monitor_, config_, log_);

    auto started = std::async(std::launch::async, [&] { return scheduler.start(); });
    ASSERT_TRUE(waitUntil([&] { return runState.get() == RunState::Running; }));
    EXPECT_EQ(started.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);
    EXPECT_EQ(scheduler.status().state, RunState::Running);

    ControlResult stopped = scheduler.stop();
    EXPECT_TRUE(stopped);

    ASSERT_EQ(started.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    ControlResult result = started.get();
    EXPECT_EQ(result.outcome, ControlOutcome::Done);
    EXPECT_EQ(result.message, "Scheduler stopped");
    EXPECT_EQ(scheduler.status().state, RunState::Stopped);
}

TEST_F(SchedulerTests, SecondStartIsRefused) {
    MemoryRunState runState;
    Scheduler first(*store_, runState, *monitor_, config_, log_);
    Scheduler second(*store_, runState, *monitor_, config_, log_);

    auto running = std::async(std::launch::async, [&] { return first.start(); });
    ASSERT_TRUE(waitUntil([&] { return runState.get() == RunState::Running; }));

    ControlResult refused = second.start();
    EXPECT_EQ(refused.outcome, ControlOutcome::AlreadyRunning);
    EXPECT_EQ(runState.get(), RunState::Running);

    EXPECT_TRUE(second.stop());
    ASSERT_EQ(running.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_TRUE(running.get());
}

TEST_F(SchedulerTests, LiveForeignOwnerIsRespected) {
    writeMarker("running", 1);
    auto runState = fileRunState();
    Scheduler scheduler(*store_, *runState, *monitor_, config_, log_);

    SchedulerStatus status = scheduler.status();
    EXPECT_EQ(status.state, RunState::Running);
    ASSERT_TRUE(status.owner.has_value());
    EXPECT_EQ(*status.owner, 1);
    EXPECT_FALSE(status.stale);

    EXPECT_EQ(scheduler.start().outcome, ControlOutcome::AlreadyRunning);
}

TEST_F(SchedulerTests, StaleMarkerIsReportedAndTakenOver) {
    pid_t gone = deadPid();
    writeMarker("running", gone);
    auto runState = fileRunState();
    Scheduler scheduler(*store_, *runState, *monitor_, config_, log_);

    SchedulerStatus status = scheduler.status();
    EXPECT_TRUE(status.stale);
    EXPECT_NE(status.describe().find("stale"), std::string::npos);

    auto started = std::async(std::launch::async, [&] { return scheduler.start(); });
    ASSERT_TRUE(waitUntil([&] {
        auto owner = runState->owner();
        return owner && *owner == ::getpid();
    }));
    EXPECT_TRUE(captured_.contains("Taking over stale run-state left by pid " + std::to_string(gone)));
    EXPECT_FALSE(scheduler.status().stale);

    EXPECT_TRUE(scheduler.stop());
    ASSERT_EQ(started.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_TRUE(started.get());
    EXPECT_EQ(readAll(config_.statusFile()), "stopped\n");
    EXPECT_FALSE(std::filesystem::exists(config_.pidFile()));
}

TEST_F(SchedulerTests, StopClearsStaleMarker) {
    writeMarker("running", deadPid());
    auto runState = fileRunState();
    Scheduler scheduler(*store_, *runState, *monitor_, config_, log_);

    ControlResult result = scheduler.stop();
    EXPECT_TRUE(result);
    EXPECT_NE(result.message.find("stale"), std::string::npos);
    EXPECT_EQ(runState->get(), RunState::Stopped);
}

TEST_F(SchedulerTests, SubmittedTasksRunToCompletion) {
    MemoryRunState runState;
    Scheduler scheduler(*store_, runState, *monitor_, config_, log_);
    Submitter submitter(*store_, config_.logsDir(), log_);

    TaskSpec spec = makeSpec("echo scheduled", 5, 0, "");
    spec.stdoutFile.clear();
    spec.stderrFile.clear();
    SubmitResult submitted = submitter.submit(spec);
    ASSERT_TRUE(submitted) << submitted.message;

    auto started = std::async(std::launch::async, [&] { return scheduler.start(); });
    ASSERT_TRUE(waitUntil([&] { return fetch(submitted.id).status == Status::Completed; }));
    EXPECT_TRUE(scheduler.stop());
    ASSERT_EQ(started.wait_for(std::chrono::seconds(10)), std::future_status::ready);

    Task task = fetch(submitted.id);
    EXPECT_EQ(task.name, "echo");
    EXPECT_EQ(task.stdoutFile, config_.logsDir() / "echo.out");
    EXPECT_EQ(readAll(task.stdoutFile), "scheduled\n");
}

TEST_F(SchedulerTests, RacingStartsRunOneDispatcher) {
    MemoryRunState runState;
    Scheduler first(*store_, runState, *monitor_, config_, log_);
    Scheduler second(*store_, runState, *monitor_, config_, log_);

    auto a = std::async(std::launch::async, [&] { return first.start(); });
    auto b = std::async(std::launch::async, [&] { return second.start(); });
    auto ready = [](std::future<ControlResult>& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    };
    // The loser returns at once; the winner blocks until stopped
    ASSERT_TRUE(waitUntil([&] { return ready(a) || ready(b); }));
    EXPECT_FALSE(ready(a) && ready(b));

    EXPECT_TRUE(first.stop());
    ASSERT_EQ(a.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    ASSERT_EQ(b.wait_for(std::chrono::seconds(10)), std::future_status::ready);

    ControlOutcome ra = a.get().outcome;
    ControlOutcome rb = b.get().outcome;
    EXPECT_EQ((ra == ControlOutcome::Done) + (rb == ControlOutcome::Done), 1);
    EXPECT_EQ((ra == ControlOutcome::AlreadyRunning) + (rb == ControlOutcome::AlreadyRunning), 1);
}

TEST_F(SchedulerTests, ShutdownRequestedBeforeClaimStillStops) {
    SlowClaimRunState runState;
    Scheduler scheduler(*store_, runState, *monitor_, config_, log_);

    auto running = std::async(std::launch::async, [&] {
        return scheduler.runUntil([] { return true; }, std::chrono::milliseconds(10));
    });

    ASSERT_EQ(running.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    ControlResult result = running.get();
    EXPECT_EQ(result.outcome, ControlOutcome::Done);
    EXPECT_EQ(runState.get(), RunState::Stopped);
    // The first stop found nothing to stop and was repeated
    EXPECT_TRUE(captured_.contains("Scheduler is not running"));
    EXPECT_TRUE(captured_.contains("Stop requested"));
}

TEST_F(SchedulerTests, RunUntilReturnsWhenStartIsRefused) {
    writeMarker("running", 1);
    auto runState = fileRunState();
    Scheduler scheduler(*store_, *runState, *monitor_, config_, log_);

    ControlResult result = scheduler.runUntil([] { return false; }, std::chrono::milliseconds(10));
    EXPECT_EQ(result.outcome, ControlOutcome::AlreadyRunning);
}

TEST_F(SchedulerTests, RunUntilRethrowsStartFailures) {
    std::ofstream(home_ / "blocker") << "x";
    FileRunState runState(home_ / "blocker" / "scheduler.status", home_ / "blocker" / "scheduler.pid", log_);
    Scheduler scheduler(*store_, runState, *monitor_, config_, log_);

    EXPECT_THROW((void)scheduler.runUntil([] { return false; }, std::chrono::milliseconds(10)), StoreError);
}

}
