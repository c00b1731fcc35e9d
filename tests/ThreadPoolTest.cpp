#include <gtest/gtest.h>
#include <shard/ThreadPool.hpp>

#include <future>
#include <mutex>
#include <vector>

using namespace shard;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, EqualPriorityWorkRunsInSubmissionOrder) {
    ShardThreadPool pool{diaspora::ThreadCount{1}};

    std::promise<void> release;
    auto released = release.get_future().share();
    pool.pushWork([released]() { released.wait(); });

    std::mutex       mutex;
    std::vector<int> order;
    std::promise<void> done;
    for(int i = 0; i < 20; ++i) {
        pool.pushWork([&, i]() {
            std::unique_lock lock{mutex};
            order.push_back(i);
            if(order.size() == 20) done.set_value();
        });
    }
    release.set_value();
    ASSERT_EQ(done.get_future().wait_for(5s), std::future_status::ready);

    std::vector<int> expected;
    for(int i = 0; i < 20; ++i) expected.push_back(i);
    EXPECT_EQ(order, expected);
}

TEST(ThreadPoolTest, HigherPriorityRunsFirst) {
    ShardThreadPool pool{diaspora::ThreadCount{1}};

    std::promise<void> release;
    auto released = release.get_future().share();
    pool.pushWork([released]() { released.wait(); });

    std::mutex       mutex;
    std::vector<int> order;
    std::promise<void> done;
    auto record = [&](int value) {
        return [&, value]() {
            std::unique_lock lock{mutex};
            order.push_back(value);
            if(order.size() == 2) done.set_value();
        };
    };
    pool.pushWork(record(1), 1);
    pool.pushWork(record(2), 2);
    release.set_value();
    ASSERT_EQ(done.get_future().wait_for(5s), std::future_status::ready);

    EXPECT_EQ(order, (std::vector<int>{2, 1}));
}

TEST(ThreadPoolTest, DelayedWorkWaitsForItsDeadline) {
    ShardThreadPool pool{diaspora::ThreadCount{1}};

    auto start = std::chrono::steady_clock::now();
    std::promise<std::chrono::steady_clock::time_point> ran;
    auto ran_at = ran.get_future();
    pool.pushWorkAfter(50ms, [&ran]() { ran.set_value(std::chrono::steady_clock::now()); });

    ASSERT_EQ(ran_at.wait_for(5s), std::future_status::ready);
    EXPECT_GE(ran_at.get() - start, 50ms);
}

TEST(ThreadPoolTest, DelayedWorkNeedsAThread) {
    ShardThreadPool pool{diaspora::ThreadCount{0}};
    EXPECT_THROW(pool.pushWorkAfter(10ms, []() {}), diaspora::Exception);
}
