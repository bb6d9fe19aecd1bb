#include <gtest/gtest.h>
#include <managers/operation_tracker.hpp>
#include <core/constants.hpp>
#include <atomic>
#include <thread>
#include <vector>

TEST(OperationTracker, StartsIdle) {
    OperationTracker tracker;
    auto s = tracker.current_status();
    EXPECT_EQ(s.status, "idle");
    EXPECT_FALSE(s.last_error.has_value());
    EXPECT_TRUE(tracker.idle());
}

TEST(OperationTracker, SecondBeginIsAlreadyRunning) {
    const std::vector<std::string> ops = {OP_REBUILDING, OP_SMOKE_TESTING, OP_DEPLOYING_METRICS,
                                          OP_CREATING_CLUSTER};
    for (const auto& first : ops) {
        for (const auto& second : ops) {
            OperationTracker tracker;
            ASSERT_TRUE(tracker.begin(first).is_ok());
            auto r = tracker.begin(second);
            ASSERT_TRUE(r.is_err()) << first << " then " << second;
            EXPECT_EQ(r.kind, ErrorKind::AlreadyRunning);
            EXPECT_EQ(tracker.current_status().status, first);
        }
    }
}

TEST(OperationTracker, CompleteWithErrorKeepsErrorUntilNextBegin) {
    OperationTracker tracker;
    ASSERT_TRUE(tracker.begin(OP_REBUILDING).is_ok());
    ASSERT_TRUE(tracker.complete(OP_REBUILDING, std::string("make: *** [build] Error 2")).is_ok());

    auto s = tracker.current_status();
    EXPECT_EQ(s.status, "idle");
    ASSERT_TRUE(s.last_error.has_value());
    EXPECT_EQ(*s.last_error, "make: *** [build] Error 2");

    // Still there on a later read
    EXPECT_TRUE(tracker.current_status().last_error.has_value());

    ASSERT_TRUE(tracker.begin(OP_SMOKE_TESTING).is_ok());
    s = tracker.current_status();
    EXPECT_EQ(s.status, OP_SMOKE_TESTING);
    EXPECT_FALSE(s.last_error.has_value());
}

TEST(OperationTracker, SuccessfulCompleteLeavesNoError) {
    OperationTracker tracker;
    ASSERT_TRUE(tracker.begin(OP_REBUILDING).is_ok());
    ASSERT_TRUE(tracker.complete(OP_REBUILDING).is_ok());
    auto s = tracker.current_status();
    EXPECT_EQ(s.status, "idle");
    EXPECT_FALSE(s.last_error.has_value());
}

TEST(OperationTracker, CompletingTheWrongOperationChangesNothing) {
    OperationTracker tracker;
    ASSERT_TRUE(tracker.begin(OP_REBUILDING).is_ok());

    auto r = tracker.complete(OP_SMOKE_TESTING, std::string("nope"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidArgument);

    auto s = tracker.current_status();
    EXPECT_EQ(s.status, OP_REBUILDING);
    EXPECT_FALSE(s.last_error.has_value());
}

TEST(OperationTracker, CompleteWhileIdleIsRejected) {
    OperationTracker tracker;
    EXPECT_TRUE(tracker.complete(OP_REBUILDING).is_err());
}

TEST(OperationTracker, RejectsInvalidNames) {
    OperationTracker tracker;
    EXPECT_EQ(tracker.begin("").kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(tracker.begin("idle").kind, ErrorKind::InvalidArgument);
    EXPECT_TRUE(tracker.idle());
}

TEST(OperationTracker, RecordsStartTime) {
    OperationTracker tracker;
    ASSERT_TRUE(tracker.begin(OP_REBUILDING).is_ok());
    EXPECT_FALSE(tracker.current_status().started_at.empty());
}

TEST(OperationTracker, ConcurrentBeginGrantsExactlyOne) {
    OperationTracker tracker;
    std::atomic<int> granted{0};
    std::atomic<int> refused{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; i++) {
        threads.emplace_back([&, i] {
            auto r = tracker.begin("op" + std::to_string(i));
            if (r.is_ok()) granted++;
            else if (r.kind == ErrorKind::AlreadyRunning) refused++;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(granted.load(), 1);
    EXPECT_EQ(refused.load(), 15);
}
