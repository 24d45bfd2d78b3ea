#include <algorithm>
#include <cerrno>
#include <csignal>

#include "taskq/dispatcher.hpp"
#include "taskq/run_state.hpp"
#include "test_fixation.hpp"

namespace taskq {

namespace {
// Delegates to a real store but fails the first few listings.
class FlakyStore final : public TaskStore {
public:
    FlakyStore(TaskStore& inner, int failures) : inner_(inner), failures_(failures) {}

    void initialize() override { inner_.initialize(); }
    TaskId insertTask(const TaskSpec& spec) override { return inner_.insertTask(spec); }
    std::optional<Task> getTask(TaskId id) const override { return inner_.getTask(id); }
    std::vector<Task> listTasks(const std::vector<Status>& filter) const override {
        if (failures_.load() > 0) {
            failures_.fetch_sub(1);
            throw StoreError("disk went away");
        }
        return inner_.listTasks(filter);
    }
    void updateStatus(TaskId id, Status status) override { inner_.updateStatus(id, status); }
    bool transition(TaskId id, Status from, Status to) override { return inner_.transition(id, from, to); }
    void updatePid(TaskId id, int pid) override { inner_.updatePid(id, pid); }
    void updateStartTime(TaskId id, Timestamp ts) override { inner_.updateStartTime(id, ts); }
    void updateEndTime(TaskId id, Timestamp ts) override { inner_.updateEndTime(id, ts); }
    void updateExitCode(TaskId id, int exitCode) override { inner_.updateExitCode(id, exitCode); }
    void updateError(TaskId id, const std::string& error) override { inner_.updateError(id, error); }

private:
    TaskStore& inner_;
    mutable std::atomic<int> failures_;
};
}

class DispatcherTests : public TaskqTest {
protected:
    MemoryRunState                       runState_;
    std::unique_ptr<FakeResourceMonitor> monitor_;
    std::unique_ptr<Dispatcher>          dispatcher_;
    std::thread                          thread_;

    void SetUp() override {
        TaskqTest::SetUp();
        monitor_ = std::make_unique<FakeResourceMonitor>(log_);
    }

    void TearDown() override {
        stopDispatcher();
        dispatcher_.reset();
        TaskqTest::TearDown();
    }

    void startDispatcher(TaskStore& store) {
        runState_.set(RunState::Running);
        dispatcher_ = std::make_unique<Dispatcher>(store, runState_, *monitor_, config_, log_);
        thread_ = std::thread([this] { dispatcher_->run(); });
    }
    void startDispatcher() { startDispatcher(*store_); }

    void stopDispatcher() {
        runState_.set(RunState::Stopped);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::size_t countIn(Status status) const { return store_->listTasks({status}).size(); }

    bool pidRecorded(TaskId id) const {
        auto task = store_->getTask(id);
        return task && task->pid.has_value();
    }
};

TEST(DispatcherBackoffTest, DoublesUpToCeiling) {
    const Millis ceiling(100);
    EXPECT_EQ(Dispatcher::nextBackoff(Millis(20), ceiling), Millis(40));
    EXPECT_EQ(Dispatcher::nextBackoff(Millis(40), ceiling), Millis(80));
    EXPECT_EQ(Dispatcher::nextBackoff(Millis(60), ceiling), ceiling);
    EXPECT_EQ(Dispatcher::nextBackoff(ceiling, ceiling), ceiling);
    EXPECT_EQ(Dispatcher::nextBackoff(Millis(0), ceiling), Millis(1));
}

TEST_F(DispatcherTests, WorkerCountFollowsLoad) {
    config_.minWorkers = 2;
    config_.maxWorkers = 6;
    Dispatcher dispatcher(*store_, runState_, *monitor_, config_, log_);

    monitor_->setLoad(10.0, 10.0);
    EXPECT_EQ(dispatcher.chooseWorkerCount(), 6);

    monitor_->setLoad(75.0, 10.0);
    EXPECT_EQ(dispatcher.chooseWorkerCount(), 2);

    monitor_->setLoad(10.0, 10.0);
    monitor_->setFailing(true);
    EXPECT_EQ(dispatcher.chooseWorkerCount(), 2);
}

TEST_F(DispatcherTests, HigherPriorityStartsFirst) {
    config_.minWorkers = 1;
    config_.maxWorkers = 1;
    TaskId low = insert("true", 3, 0, "low");
    TaskId high = insert("true", 1, 0, "high");
    TaskId mid = insert("true", 2, 0, "mid");

    startDispatcher();
    ASSERT_TRUE(waitUntil([&] { return countIn(Status::Completed) == 3; }));
    stopDispatcher();

    auto started = [&](TaskId id) { return *fetch(id).startTime; };
    EXPECT_LT(started(high), started(mid));
    EXPECT_LT(started(mid), started(low));
}

TEST_F(DispatcherTests, OverloadAdmitsNothing) {
    monitor_->setLoad(95.0, 10.0);
    TaskId id = insert("true");

    startDispatcher();
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    EXPECT_EQ(fetch(id).status, Status::Pending);
    EXPECT_FALSE(fetch(id).startTime.has_value());
    EXPECT_GE(monitor_->samples(), 2);
    EXPECT_TRUE(captured_.contains("Holding dispatch"));

    monitor_->setLoad(10.0, 10.0);
    EXPECT_TRUE(waitUntil([&] { return fetch(id).status == Status::Completed; }));
}

TEST_F(DispatcherTests, FailingSampleHoldsDispatch) {
    monitor_->setFailing(true);
    TaskId id = insert("true");

    startDispatcher();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(fetch(id).status, Status::Pending);

    monitor_->setFailing(false);
    EXPECT_TRUE(waitUntil([&] { return fetch(id).status == Status::Completed; }));
}

TEST_F(DispatcherTests, IdleLoopDoesNotSampleLoad) {
    startDispatcher();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    stopDispatcher();

    // Only the worker-count decision at startup
    EXPECT_EQ(monitor_->samples(), 1);
}

TEST_F(DispatcherTests, ConcurrencyNeverExceedsWorkers) {
    config_.minWorkers = 5;
    config_.maxWorkers = 5;
    config_.staggerDelay = Millis(0);
    for (int i = 0; i < 20; ++i) {
        (void)insert("sleep 0.2", 5, 0, "batch" + std::to_string(i));
    }

    startDispatcher();
    std::size_t peakRunning = 0;
    std::size_t peakInFlight = 0;
    bool finished = waitUntil(
        [&] {
            peakRunning = std::max(peakRunning, countIn(Status::Running));
            peakInFlight = std::max(peakInFlight, dispatcher_->inFlight());
            return countIn(Status::Completed) == 20;
        },
        std::chrono::milliseconds(30000));
    stopDispatcher();

    EXPECT_TRUE(finished);
    EXPECT_LE(peakRunning, 5u);
    EXPECT_LE(peakInFlight, 5u);
    EXPECT_GE(peakRunning, 2u);
    EXPECT_EQ(countIn(Status::Failed), 0u);
}

TEST_F(DispatcherTests, TaskIsExecutedOnlyOnce) {
    config_.minWorkers = 4;
    config_.maxWorkers = 4;
    TaskId id = insert("echo run >> counter.txt; sleep 0.3", 5, 0, "once");

    startDispatcher();
    ASSERT_TRUE(waitUntil([&] { return fetch(id).status == Status::Completed; }));
    stopDispatcher();

    EXPECT_EQ(readAll(home_ / "counter.txt"), "run\n");
}

TEST_F(DispatcherTests, CancelledPendingTaskIsNeverStarted) {
    config_.minWorkers = 1;
    config_.maxWorkers = 1;
    TaskId blocker = insert("sleep 0.5", 1, 0, "blocker");
    TaskId victim = insert("echo ran > victim.txt", 5, 0, "victim");

    startDispatcher();
    ASSERT_TRUE(waitUntil([&] { return pidRecorded(blocker); }));
    ASSERT_TRUE(store_->transition(victim, Status::Pending, Status::Cancelled));
    ASSERT_TRUE(waitUntil([&] { return fetch(blocker).status == Status::Completed; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    stopDispatcher();

    EXPECT_EQ(fetch(victim).status, Status::Cancelled);
    EXPECT_FALSE(std::filesystem::exists(home_ / "victim.txt"));
}

TEST_F(DispatcherTests, StopWaitsForRunningTasks) {
    TaskId id = insert("sleep 0.5; echo done", 5, 0, "graceful");

    startDispatcher();
    ASSERT_TRUE(waitUntil([&] { return pidRecorded(id); }));
    stopDispatcher();

    Task task = fetch(id);
    EXPECT_EQ(task.status, Status::Completed);
    EXPECT_EQ(readAll(task.stdoutFile), "done\n");
    EXPECT_EQ(dispatcher_->inFlight(), 0u);
    EXPECT_EQ(runState_.get(), RunState::Stopped);
}

TEST_F(DispatcherTests, TerminateOnShutdownKillsChildren) {
    config_.terminateOnShutdown = true;
    TaskId id = insert("sleep 30", 5, 0, "doomed");

    startDispatcher();
    ASSERT_TRUE(waitUntil([&] { return pidRecorded(id); }));

    auto stopStart = std::chrono::steady_clock::now();
    stopDispatcher();
    EXPECT_LT(std::chrono::steady_clock::now() - stopStart, std::chrono::seconds(5));

    Task task = fetch(id);
    EXPECT_EQ(task.status, Status::Failed);
    ASSERT_TRUE(task.error.has_value());
    EXPECT_EQ(*task.error, "terminated by scheduler shutdown");
    EXPECT_TRUE(::kill(*task.pid, 0) != 0 && errno == ESRCH);
}

TEST_F(DispatcherTests, IdleBackoffResetsOnceWorkIsFound) {
    log_->setLevel(LogLevel::TRACE);

    startDispatcher();
    // 20, 40, 80, then pinned at the 100ms ceiling
    ASSERT_TRUE(waitUntil([&] { return captured_.contains("Nothing pending, sleeping 100ms"); }));
    EXPECT_EQ(captured_.count("Nothing pending, sleeping 20ms"), 1u);

    TaskId id = insert("true");
    ASSERT_TRUE(waitUntil([&] { return fetch(id).status == Status::Completed; }));
    EXPECT_TRUE(waitUntil([&] { return captured_.count("Nothing pending, sleeping 20ms") >= 2; }));
    stopDispatcher();
}

TEST_F(DispatcherTests, StopsWhenAnotherProcessOwnsTheMarker) {
    FileRunState fileState(config_.statusFile(), config_.pidFile(), log_);
    ASSERT_TRUE(fileState.claim());
    monitor_->setDelay(std::chrono::milliseconds(400));
    TaskId id = insert("true");

    Dispatcher dispatcher(*store_, fileState, *monitor_, config_, log_);
    std::atomic<bool> finished{false};
    std::thread loop([&] {
        dispatcher.run();
        finished.store(true);
    });

    // Startup sizing is the first sample; the second is the admission check
    ASSERT_TRUE(waitUntil([&] { return monitor_->samples() >= 2; }));
    // stop + start from another process while the sample is in progress
    writeMarker("running", 1);

    bool exited = waitUntil([&] { return finished.load(); }, std::chrono::milliseconds(5000));
    if (!exited) {
        fileState.set(RunState::Stopped);
    }
    loop.join();

    EXPECT_TRUE(exited);
    EXPECT_EQ(fetch(id).status, Status::Pending);
    EXPECT_FALSE(fetch(id).startTime.has_value());
    EXPECT_TRUE(captured_.contains("Run state taken over by pid 1"));
    // The new owner's marker is left alone
    EXPECT_EQ(readAll(config_.statusFile()), "running\n");
    ASSERT_TRUE(fileState.owner().has_value());
    EXPECT_EQ(*fileState.owner(), 1);
}

TEST_F(DispatcherTests, StoreErrorsAreLoggedAndLoopContinues) {
    FlakyStore flaky(*store_, 3);
    TaskId id = insert("true");

    startDispatcher(flaky);
    EXPECT_TRUE(waitUntil([&] { return fetch(id).status == Status::Completed; }));
    stopDispatcher();

    EXPECT_TRUE(captured_.contains("Dispatch loop error: disk went away"));
}

TEST_F(DispatcherTests, FailedTaskDoesNotStopTheLoop) {
    TaskId bad = insert("exit 7", 1, 0, "bad");
    TaskId good = insert("true", 2, 0, "good");

    startDispatcher();
    EXPECT_TRUE(waitUntil([&] {
        return fetch(bad).status == Status::Failed && fetch(good).status == Status::Completed;
    }));
    stopDispatcher();

    EXPECT_EQ(*fetch(bad).exitCode, 7);
}

}
