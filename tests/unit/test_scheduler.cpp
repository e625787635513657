#include "core/scheduler.hpp"
#include "utils/error_handler.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace speechjobs;
using namespace speechjobs::core;

namespace {

// Blocks pipelines until released
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        condition_.notify_all();
    }

    // Wait for open() or cancellation; polls the token like a capability would
    void wait(const CancellationToken& token) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!open_) {
            condition_.wait_for(lock, std::chrono::milliseconds(5));
            lock.unlock();
            token.throwIfCancelled();
            lock.lock();
        }
    }

private:
    std::mutex mutex_;
    std::condition_variable condition_;
    bool open_ = false;
};

bool waitUntil(const std::function<bool()>& predicate,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return predicate();
}

} // namespace

class SchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<JobStore>();
        config.max_concurrent_jobs = 2;
        config.maintenance.interval_seconds = 0;
        utils::ErrorHandler::getInstance().clearErrorHistory();
    }

    void TearDown() override {
        if (scheduler) {
            scheduler->stop();
        }
        utils::ErrorHandler::getInstance().clearErrorHistory();
    }

    void startWith(JobPipeline pipeline) {
        scheduler = std::make_unique<Scheduler>(store, std::move(pipeline), config);
        scheduler->start();
    }

    bool waitTerminal(const std::string& id) {
        return waitUntil([&]() { return store->get(id)->isTerminal(); });
    }

    std::shared_ptr<JobStore> store;
    SchedulerConfig config;
    std::unique_ptr<Scheduler> scheduler;
};

TEST_F(SchedulerTest, RunsJobToCompletion) {
    startWith([](const JobSnapshot& job, const CancellationToken&, const ProgressCallback& progress) {
        progress(50);
        stt::TranscriptionResult result;
        result.text = "done " + job->id;
        return result;
    });

    auto id = store->create(JobOptions());
    ASSERT_TRUE(scheduler->submit(id));
    ASSERT_TRUE(waitTerminal(id));

    auto job = store->get(id);
    EXPECT_EQ(job->status, JobStatus::COMPLETED);
    EXPECT_EQ(job->progress, 100);
    EXPECT_EQ(job->result->text, "done " + id);
    EXPECT_EQ(scheduler->getStats().completed, 1u);
}

// Test that no more than max_concurrent_jobs pipelines run at once
TEST_F(SchedulerTest, ConcurrencyCeiling) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    Gate gate;

    startWith([&](const JobSnapshot&, const CancellationToken& token, const ProgressCallback&) {
        int now = ++running;
        int expected = peak.load();
        while (now > expected && !peak.compare_exchange_weak(expected, now)) {
        }
        gate.wait(token);
        --running;
        return stt::TranscriptionResult();
    });

    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(store->create(JobOptions()));
        ASSERT_TRUE(scheduler->submit(ids.back()));
    }

    ASSERT_TRUE(waitUntil([&]() { return store->countByStatus(JobStatus::PROCESSING) == 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(store->countByStatus(JobStatus::PROCESSING), 2u);
    EXPECT_EQ(store->countByStatus(JobStatus::PENDING), 3u);
    EXPECT_EQ(scheduler->getQueueLength(), 3u);

    gate.open();
    for (const auto& id : ids) {
        ASSERT_TRUE(waitTerminal(id));
        EXPECT_EQ(store->get(id)->status, JobStatus::COMPLETED);
    }
    EXPECT_LE(peak.load(), 2);
}

TEST_F(SchedulerTest, FifoOrderWithSingleWorker) {
    config.max_concurrent_jobs = 1;
    std::vector<std::string> order;
    std::mutex orderMutex;

    startWith([&](const JobSnapshot& job, const CancellationToken&, const ProgressCallback&) {
        std::lock_guard<std::mutex> lock(orderMutex);
        order.push_back(job->id);
        return stt::TranscriptionResult();
    });

    std::vector<std::string> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(store->create(JobOptions()));
        scheduler->submit(ids.back());
    }
    ASSERT_TRUE(waitTerminal(ids.back()));
    EXPECT_EQ(order, ids);
}

TEST_F(SchedulerTest, SubmitRejectsNonPendingAndDuplicates) {
    Gate gate;
    startWith([&](const JobSnapshot&, const CancellationToken& token, const ProgressCallback&) {
        gate.wait(token);
        return stt::TranscriptionResult();
    });

    EXPECT_FALSE(scheduler->submit("unknown"));

    auto started = store->create(JobOptions());
    store->transition(started, JobEvent::start());
    EXPECT_FALSE(scheduler->submit(started));

    auto id = store->create(JobOptions());
    EXPECT_TRUE(scheduler->submit(id));
    EXPECT_FALSE(scheduler->submit(id));

    gate.open();
}

TEST_F(SchedulerTest, QueueLimitRejectsAdmission) {
    config.max_concurrent_jobs = 1;
    config.max_queue_length = 1;
    Gate gate;
    startWith([&](const JobSnapshot&, const CancellationToken& token, const ProgressCallback&) {
        gate.wait(token);
        return stt::TranscriptionResult();
    });

    auto running = store->create(JobOptions());
    ASSERT_TRUE(scheduler->submit(running));
    ASSERT_TRUE(waitUntil([&]() { return store->get(running)->status == JobStatus::PROCESSING; }));

    auto queued = store->create(JobOptions());
    EXPECT_TRUE(scheduler->submit(queued));
    EXPECT_FALSE(scheduler->canAccept());

    auto rejected = store->create(JobOptions());
    EXPECT_FALSE(scheduler->submit(rejected));
    EXPECT_EQ(store->get(rejected)->status, JobStatus::PENDING);

    gate.open();
    ASSERT_TRUE(waitTerminal(queued));
    EXPECT_TRUE(scheduler->canAccept());
}

TEST_F(SchedulerTest, ReservationHoldsQueueSlot) {
    config.max_concurrent_jobs = 1;
    config.max_queue_length = 1;
    Gate gate;
    startWith([&](const JobSnapshot&, const CancellationToken& token, const ProgressCallback&) {
        gate.wait(token);
        return stt::TranscriptionResult();
    });

    auto running = store->create(JobOptions());
    ASSERT_TRUE(scheduler->submit(running));
    ASSERT_TRUE(waitUntil([&]() { return store->get(running)->status == JobStatus::PROCESSING; }));

    {
        auto slot = scheduler->reserve();
        ASSERT_TRUE(slot);
        EXPECT_FALSE(scheduler->canAccept());
        EXPECT_FALSE(scheduler->reserve());

        auto other = store->create(JobOptions());
        EXPECT_FALSE(scheduler->submit(other));
    }
    // Dropped without being used
    EXPECT_TRUE(scheduler->canAccept());

    auto slot = scheduler->reserve();
    ASSERT_TRUE(slot);
    auto queued = store->create(JobOptions());
    EXPECT_TRUE(scheduler->submit(queued, slot));
    EXPECT_FALSE(slot);
    EXPECT_EQ(scheduler->getQueueLength(), 1u);
    EXPECT_FALSE(scheduler->canAccept());

    gate.open();
    ASSERT_TRUE(waitTerminal(queued));
    EXPECT_EQ(store->get(queued)->status, JobStatus::COMPLETED);
    EXPECT_TRUE(scheduler->canAccept());
}

TEST_F(SchedulerTest, ReserveBeforeStartIsEmpty) {
    scheduler = std::make_unique<Scheduler>(store, [](const JobSnapshot&, const CancellationToken&,
                                                      const ProgressCallback&) {
        return stt::TranscriptionResult();
    }, config);

    EXPECT_FALSE(scheduler->reserve());
}

TEST_F(SchedulerTest, SubmitBeforeStartIsRejected) {
    scheduler = std::make_unique<Scheduler>(store, [](const JobSnapshot&, const CancellationToken&,
                                                      const ProgressCallback&) {
        return stt::TranscriptionResult();
    }, config);

    auto id = store->create(JobOptions());
    EXPECT_FALSE(scheduler->canAccept());
    EXPECT_FALSE(scheduler->submit(id));
}

TEST_F(SchedulerTest, CancelQueuedJob) {
    config.max_concurrent_jobs = 1;
    Gate gate;
    std::atomic<int> executed{0};
    startWith([&](const JobSnapshot&, const CancellationToken& token, const ProgressCallback&) {
        ++executed;
        gate.wait(token);
        return stt::TranscriptionResult();
    });

    auto blocker = store->create(JobOptions());
    scheduler->submit(blocker);
    ASSERT_TRUE(waitUntil([&]() { return store->get(blocker)->status == JobStatus::PROCESSING; }));

    auto queued = store->create(JobOptions());
    scheduler->submit(queued);
    EXPECT_TRUE(scheduler->cancel(queued));

    gate.open();
    ASSERT_TRUE(waitTerminal(queued));

    auto job = store->get(queued);
    EXPECT_EQ(job->status, JobStatus::FAILED);
    EXPECT_EQ(job->error->code, "CANCELED");
    EXPECT_TRUE(job->started_at);
    EXPECT_EQ(executed.load(), 1);
    EXPECT_EQ(scheduler->getStats().canceled, 1u);
}

TEST_F(SchedulerTest, CancelRunningJob) {
    Gate gate;
    startWith([&](const JobSnapshot&, const CancellationToken& token, const ProgressCallback&) {
        gate.wait(token);
        return stt::TranscriptionResult();
    });

    auto id = store->create(JobOptions());
    scheduler->submit(id);
    ASSERT_TRUE(waitUntil([&]() { return store->get(id)->status == JobStatus::PROCESSING; }));

    EXPECT_TRUE(scheduler->cancel(id));
    ASSERT_TRUE(waitTerminal(id));
    EXPECT_EQ(store->get(id)->error->code, "CANCELED");
    EXPECT_EQ(store->get(id)->error->message, "Job was canceled");

    // The token is released once the worker moves on
    EXPECT_TRUE(waitUntil([&]() { return !scheduler->cancel(id); }));
}

TEST_F(SchedulerTest, TypedFailureKeepsItsCode) {
    startWith([](const JobSnapshot&, const CancellationToken&, const ProgressCallback&)
                  -> stt::TranscriptionResult {
        throw utils::TranscriptionException("Transcription failed", "decoder error", false);
    });

    auto id = store->create(JobOptions());
    scheduler->submit(id);
    ASSERT_TRUE(waitTerminal(id));

    auto job = store->get(id);
    EXPECT_EQ(job->status, JobStatus::FAILED);
    EXPECT_EQ(job->error->code, "TRANSCRIPTION_ERROR");
    EXPECT_EQ(job->error->message, "Transcription failed: decoder error");
    EXPECT_EQ(utils::ErrorHandler::getInstance().getErrorCount(utils::ErrorKind::TRANSCRIPTION), 1u);
}

// Test that untyped exceptions surface as internal errors without their text
TEST_F(SchedulerTest, UnexpectedExceptionBecomesInternalError) {
    startWith([](const JobSnapshot&, const CancellationToken&, const ProgressCallback&)
                  -> stt::TranscriptionResult {
        throw std::runtime_error("null pointer in decoder");
    });

    auto id = store->create(JobOptions());
    scheduler->submit(id);
    ASSERT_TRUE(waitTerminal(id));

    auto job = store->get(id);
    EXPECT_EQ(job->error->code, "INTERNAL_ERROR");
    EXPECT_EQ(job->error->message, "Unexpected internal error");
    EXPECT_EQ(utils::ErrorHandler::getInstance().getErrorCount(utils::ErrorKind::INTERNAL), 1u);
}

TEST_F(SchedulerTest, WorkerSurvivesFailures) {
    config.max_concurrent_jobs = 1;
    std::atomic<int> calls{0};
    startWith([&](const JobSnapshot&, const CancellationToken&, const ProgressCallback&) {
        if (++calls == 1) {
            throw std::runtime_error("first job breaks");
        }
        return stt::TranscriptionResult();
    });

    auto first = store->create(JobOptions());
    auto second = store->create(JobOptions());
    scheduler->submit(first);
    scheduler->submit(second);

    ASSERT_TRUE(waitTerminal(second));
    EXPECT_EQ(store->get(first)->status, JobStatus::FAILED);
    EXPECT_EQ(store->get(second)->status, JobStatus::COMPLETED);
}

TEST_F(SchedulerTest, StopCancelsRunningAndQueuedJobs) {
    config.max_concurrent_jobs = 1;
    startWith([](const JobSnapshot&, const CancellationToken& token, const ProgressCallback&) {
        while (true) {
            token.throwIfCancelled();
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return stt::TranscriptionResult();
    });

    auto running = store->create(JobOptions());
    auto queued = store->create(JobOptions());
    scheduler->submit(running);
    scheduler->submit(queued);
    ASSERT_TRUE(waitUntil([&]() { return store->get(running)->status == JobStatus::PROCESSING; }));

    scheduler->stop();

    EXPECT_FALSE(scheduler->isRunning());
    for (const auto& id : {running, queued}) {
        auto job = store->get(id);
        EXPECT_EQ(job->status, JobStatus::FAILED);
        EXPECT_EQ(job->error->code, "CANCELED");
        EXPECT_EQ(job->error->message, Scheduler::kShutdownReason);
    }
    EXPECT_FALSE(scheduler->submit(store->create(JobOptions())));
}

TEST_F(SchedulerTest, ProgressFlowsIntoStore) {
    std::vector<int> observed;
    std::mutex observedMutex;
    store->addTransitionCallback([&](const JobSnapshot& job) {
        std::lock_guard<std::mutex> lock(observedMutex);
        observed.push_back(job->progress);
    });

    startWith([](const JobSnapshot&, const CancellationToken&, const ProgressCallback& progress) {
        progress(10);
        progress(5); // stale, ignored
        progress(60);
        return stt::TranscriptionResult();
    });

    auto id = store->create(JobOptions());
    scheduler->submit(id);
    // created, started, 10, 60, completed
    ASSERT_TRUE(waitUntil([&]() {
        std::lock_guard<std::mutex> lock(observedMutex);
        return observed.size() == 5;
    }));

    std::lock_guard<std::mutex> lock(observedMutex);
    EXPECT_EQ(observed[2], 10);
    EXPECT_EQ(observed[3], 60);
    EXPECT_EQ(observed[4], 100);
}

TEST_F(SchedulerTest, MaintenanceKeepsJobsWhenRetentionDisabled) {
    config.maintenance.retention_hours = 0;
    startWith([](const JobSnapshot&, const CancellationToken&, const ProgressCallback&) {
        return stt::TranscriptionResult();
    });

    auto id = store->create(JobOptions());
    scheduler->submit(id);
    ASSERT_TRUE(waitTerminal(id));

    // retention 0 disables purging
    scheduler->runMaintenance();
    EXPECT_NE(store->find(id), nullptr);
}
