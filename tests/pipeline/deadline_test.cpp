// File: tests/pipeline/deadline_test.cpp
#include "pipeline/deadline.hpp"
#include "pipeline/cancellation.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>

namespace careledger {
namespace {

using std::chrono::milliseconds;

TEST(DeadlineExecutorTest, ReturnsResultInTime) {
    DeadlineExecutor executor;
    int value = executor.Call("adder", milliseconds(1000), []() { return 40 + 2; });
    EXPECT_EQ(42, value);
    EXPECT_EQ(0u, executor.PendingCount());
}

TEST(DeadlineExecutorTest, SlowCallThrowsTimeout) {
    DeadlineExecutor executor;
    try {
        executor.Call("slow collaborator", milliseconds(20), []() {
            std::this_thread::sleep_for(milliseconds(300));
            return std::string("late");
        });
        FAIL() << "Expected CollaboratorTimeoutError";
    } catch (const CollaboratorTimeoutError& e) {
        EXPECT_EQ("slow collaborator", e.collaborator());
        EXPECT_NE(std::string::npos, std::string(e.what()).find("20ms"));
    }
    EXPECT_EQ(1u, executor.PendingCount());
}

TEST(DeadlineExecutorTest, ExceptionsAreRethrownOnCaller) {
    DeadlineExecutor executor;
    EXPECT_THROW(executor.Call("failing", milliseconds(1000), []() -> int {
                     throw std::runtime_error("boom");
                 }),
                 std::runtime_error);
    EXPECT_EQ(0u, executor.PendingCount());
}

TEST(DeadlineExecutorTest, DestructorWaitsForLateWorkers) {
    auto finished = std::make_shared<std::atomic<bool>>(false);
    {
        DeadlineExecutor executor;
        EXPECT_THROW(executor.Call("slow", milliseconds(10), [finished]() {
                         std::this_thread::sleep_for(milliseconds(150));
                         finished->store(true);
                         return 0;
                     }),
                     CollaboratorTimeoutError);
        EXPECT_FALSE(finished->load());
    }
    EXPECT_TRUE(finished->load());
}

TEST(DeadlineExecutorTest, SaturatedExecutorRejectsWithoutStartingWork) {
    DeadlineExecutor executor(1);
    EXPECT_THROW(executor.Call("stuck", milliseconds(10), []() {
                     std::this_thread::sleep_for(milliseconds(300));
                     return 0;
                 }),
                 CollaboratorTimeoutError);
    ASSERT_EQ(1u, executor.PendingCount());

    std::atomic<bool> ran{false};
    EXPECT_THROW(executor.Call("next", milliseconds(1000), [&ran]() {
                     ran.store(true);
                     return 0;
                 }),
                 CollaboratorTimeoutError);
    EXPECT_FALSE(ran.load());
}

TEST(DeadlineExecutorTest, FinishedLateWorkersFreeTheirSlot) {
    DeadlineExecutor executor(1);
    EXPECT_THROW(executor.Call("briefly slow", milliseconds(5), []() {
                     std::this_thread::sleep_for(milliseconds(50));
                     return 0;
                 }),
                 CollaboratorTimeoutError);

    std::this_thread::sleep_for(milliseconds(200));
    EXPECT_EQ(0u, executor.PendingCount());
    EXPECT_EQ(7, executor.Call("quick", milliseconds(1000), []() { return 7; }));
}

TEST(DeadlineExecutorTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(DeadlineExecutor(0), std::invalid_argument);
}

TEST(CancellationTokenTest, CopiesShareState) {
    CancellationToken token;
    CancellationToken copy = token;
    EXPECT_FALSE(copy.IsCancelled());
    token.Cancel();
    EXPECT_TRUE(copy.IsCancelled());
}

} // namespace
} // namespace careledger
