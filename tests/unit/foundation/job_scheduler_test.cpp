#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "intg/foundation/error_code.hpp"
#include "intg/foundation/job_scheduler.hpp"

using namespace intg::foundation;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TEST(JobSchedulerTest, DefaultWorkerCount) {
    JobScheduler scheduler;
    EXPECT_EQ(scheduler.workerCount(), kMaxLoadConcurrency);
}

TEST(JobSchedulerTest, ZeroThreadsBecomesOne) {
    JobScheduler scheduler(0);
    EXPECT_EQ(scheduler.workerCount(), 1u);
}

TEST(JobSchedulerTest, MoveConstruction) {
    JobScheduler a(2);
    JobScheduler b(std::move(a));
    auto result = b.schedule([] {});
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(b.wait(result.value()).hasValue());
}

// ---------------------------------------------------------------------------
// Scheduling
// ---------------------------------------------------------------------------

TEST(JobSchedulerTest, ScheduleAndWaitSingleJob) {
    JobScheduler scheduler(2);
    std::atomic<bool> executed{false};

    auto result = scheduler.schedule([&] { executed.store(true); });
    ASSERT_TRUE(result.hasValue());

    EXPECT_TRUE(scheduler.wait(result.value()).hasValue());
    EXPECT_TRUE(executed.load());
}

TEST(JobSchedulerTest, ScheduleMultipleJobs) {
    JobScheduler scheduler(4);
    constexpr int kJobs = 50;
    std::atomic<int> counter{0};

    std::vector<JobScheduler::JobId> ids;
    for (int i = 0; i < kJobs; ++i) {
        auto result = scheduler.schedule([&] { counter.fetch_add(1); });
        ASSERT_TRUE(result.hasValue());
        ids.push_back(result.value());
    }

    for (auto id : ids) {
        EXPECT_TRUE(scheduler.wait(id).hasValue());
    }
    EXPECT_EQ(counter.load(), kJobs);
}

TEST(JobSchedulerTest, JobReturnsUniqueIds) {
    JobScheduler scheduler(2);
    auto r1 = scheduler.schedule([] {});
    auto r2 = scheduler.schedule([] {});
    ASSERT_TRUE(r1.hasValue());
    ASSERT_TRUE(r2.hasValue());
    EXPECT_NE(r1.value(), r2.value());
    EXPECT_TRUE(scheduler.wait(r1.value()).hasValue());
    EXPECT_TRUE(scheduler.wait(r2.value()).hasValue());
}

// No more jobs run at once than there are workers.
TEST(JobSchedulerTest, ConcurrencyIsBounded) {
    JobScheduler scheduler(2);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<JobScheduler::JobId> ids;
    for (int i = 0; i < 8; ++i) {
        auto result = scheduler.schedule([&] {
            int now = running.fetch_add(1) + 1;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(10ms);
            running.fetch_sub(1);
        });
        ASSERT_TRUE(result.hasValue());
        ids.push_back(result.value());
    }
    for (auto id : ids) {
        EXPECT_TRUE(scheduler.wait(id).hasValue());
    }
    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

TEST(JobSchedulerTest, WaitUnknownJob) {
    JobScheduler scheduler(1);
    auto result = scheduler.wait(99999);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::JobNotFound);
}

TEST(JobSchedulerTest, WaitTwiceIsNotFound) {
    JobScheduler scheduler(1);
    auto id = scheduler.schedule([] {});
    ASSERT_TRUE(id.hasValue());
    EXPECT_TRUE(scheduler.wait(id.value()).hasValue());

    auto again = scheduler.wait(id.value());
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::JobNotFound);
}

TEST(JobSchedulerTest, ThrowingJobReportsThreadError) {
    JobScheduler scheduler(1);
    auto id = scheduler.schedule([] { throw std::runtime_error("disk on fire"); });
    ASSERT_TRUE(id.hasValue());

    auto result = scheduler.wait(id.value());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ThreadError);
    EXPECT_EQ(result.error().message(), "job execution failed: disk on fire");
}
