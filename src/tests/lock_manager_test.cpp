#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>
#include "lock/lock_manager.hpp"
#include "test_utils.hpp"

using namespace vault::lock;
using namespace std::chrono_literals;

class LockManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_logging();
    }

    // Polls until the resource has the expected number of queued waiters
    bool wait_for_waiters(const std::string& resource, size_t expected) {
        for (int i = 0; i < 200; ++i) {
            auto table = manager.diagnostics();
            auto it = table.find(resource);
            if (it != table.end() &&
                it->second.waiting_shared + it->second.waiting_exclusive == expected) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return false;
    }

    LockManager manager;
};

TEST_F(LockManagerTest, SharedLocksCoexist) {
    auto first = manager.acquire("r", LockMode::Shared, 100ms);
    auto second = manager.acquire("r", LockMode::Shared, 100ms);

    auto table = manager.diagnostics();
    ASSERT_EQ(table.count("r"), 1u);
    EXPECT_EQ(table["r"].shared_holders, 2u);
    EXPECT_FALSE(table["r"].exclusive);
    EXPECT_TRUE(table["r"].held_for.has_value());
}

TEST_F(LockManagerTest, ExclusiveExcludesEveryone) {
    auto writer = manager.acquire("r", LockMode::Exclusive, 100ms);
    EXPECT_THROW(manager.acquire("r", LockMode::Shared, 50ms), LockTimeoutError);
    EXPECT_THROW(manager.acquire("r", LockMode::Exclusive, 50ms), LockTimeoutError);

    // Other resources are unaffected
    EXPECT_NO_THROW(manager.acquire("other", LockMode::Exclusive, 50ms));
}

TEST_F(LockManagerTest, SharedBlocksExclusive) {
    auto reader = manager.acquire("r", LockMode::Shared, 100ms);
    EXPECT_THROW(manager.acquire("r", LockMode::Exclusive, 50ms), LockTimeoutError);
    reader.release();
    EXPECT_NO_THROW(manager.acquire("r", LockMode::Exclusive, 50ms));
}

TEST_F(LockManagerTest, TimeoutLeavesNoState) {
    {
        auto writer = manager.acquire("r", LockMode::Exclusive, 100ms);
        try {
            manager.acquire("r", LockMode::Exclusive, 30ms);
            FAIL() << "Expected LockTimeoutError";
        } catch (const LockTimeoutError& e) {
            EXPECT_EQ(e.resource(), "r");
            EXPECT_EQ(e.timeout(), 30ms);
        }

        auto table = manager.diagnostics();
        EXPECT_EQ(table["r"].waiting_exclusive, 0u);
        EXPECT_EQ(table["r"].waiting_shared, 0u);
    }
    EXPECT_EQ(manager.resource_count(), 0u);
    EXPECT_TRUE(manager.diagnostics().empty());
}

TEST_F(LockManagerTest, ReleaseWakesWaiter) {
    auto writer = manager.acquire("r", LockMode::Exclusive, 100ms);

    auto waiter = std::async(std::launch::async, [this] {
        auto handle = manager.acquire("r", LockMode::Exclusive, 2000ms);
        return handle.held();
    });

    ASSERT_TRUE(wait_for_waiters("r", 1));
    writer.release();
    EXPECT_TRUE(waiter.get());
    EXPECT_EQ(manager.resource_count(), 0u);
}

TEST_F(LockManagerTest, WaitersAreServedInArrivalOrder) {
    auto holder = std::make_unique<LockHandle>(manager.acquire("r", LockMode::Exclusive, 100ms));

    std::mutex order_mutex;
    std::vector<int> order;
    std::vector<std::thread> threads;

    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([this, i, &order_mutex, &order] {
            auto handle = manager.acquire("r", LockMode::Exclusive, 5000ms);
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(i);
        });
        // Make sure thread i is queued before thread i + 1 arrives
        ASSERT_TRUE(wait_for_waiters("r", static_cast<size_t>(i + 1)));
    }

    holder.reset();
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST_F(LockManagerTest, NewReaderQueuesBehindWaitingWriter) {
    auto reader = manager.acquire("r", LockMode::Shared, 100ms);

    auto writer = std::async(std::launch::async, [this] {
        return manager.acquire("r", LockMode::Exclusive, 2000ms).held();
    });
    ASSERT_TRUE(wait_for_waiters("r", 1));

    // A compatible reader must not overtake the queued writer
    EXPECT_THROW(manager.acquire("r", LockMode::Shared, 50ms), LockTimeoutError);

    reader.release();
    EXPECT_TRUE(writer.get());
}

TEST_F(LockManagerTest, ConsecutiveReadersGrantedTogether) {
    auto writer = manager.acquire("r", LockMode::Exclusive, 100ms);
    std::atomic<int> inside{0};
    std::atomic<int> peak{0};
    std::vector<std::thread> readers;

    for (int i = 0; i < 3; ++i) {
        readers.emplace_back([this, &inside, &peak] {
            auto handle = manager.acquire("r", LockMode::Shared, 5000ms);
            int now = ++inside;
            int expected = peak.load();
            while (now > expected && !peak.compare_exchange_weak(expected, now)) {}
            std::this_thread::sleep_for(100ms);
            --inside;
        });
    }
    ASSERT_TRUE(wait_for_waiters("r", 3));

    writer.release();
    for (auto& thread : readers) {
        thread.join();
    }
    EXPECT_EQ(peak.load(), 3);
}

TEST_F(LockManagerTest, DoubleReleaseIsAnError) {
    auto handle = manager.acquire("r", LockMode::Shared, 100ms);
    EXPECT_TRUE(handle.held());
    handle.release();
    EXPECT_FALSE(handle.held());
    EXPECT_THROW(handle.release(), LockError);
    EXPECT_EQ(manager.resource_count(), 0u);
}

TEST_F(LockManagerTest, MovedHandleOwnsTheLock) {
    auto original = manager.acquire("r", LockMode::Exclusive, 100ms);
    LockHandle moved = std::move(original);
    EXPECT_TRUE(moved.held());
    EXPECT_EQ(moved.resource(), "r");
    EXPECT_EQ(moved.mode(), LockMode::Exclusive);
    moved.release();
    EXPECT_EQ(manager.resource_count(), 0u);
}

TEST_F(LockManagerTest, OrderedAcquisitionDeduplicates) {
    auto locks = manager.acquire_ordered({"b", "a", "b", "c"}, LockMode::Exclusive, 100ms);
    EXPECT_EQ(locks.size(), 3u);
    EXPECT_EQ(manager.resource_count(), 3u);
    locks.release_all();
    EXPECT_EQ(manager.resource_count(), 0u);
}

TEST_F(LockManagerTest, OrderedAcquisitionIsAllOrNothing) {
    auto blocker = manager.acquire("c", LockMode::Exclusive, 100ms);
    EXPECT_THROW(manager.acquire_ordered({"a", "b", "c"}, LockMode::Exclusive, 50ms), LockTimeoutError);

    // a and b were released again
    EXPECT_NO_THROW(manager.acquire("a", LockMode::Exclusive, 10ms));
    EXPECT_NO_THROW(manager.acquire("b", LockMode::Exclusive, 10ms));
}

TEST_F(LockManagerTest, OppositeOrdersDoNotDeadlock) {
    std::atomic<int> completed{0};
    auto worker = [this, &completed](std::vector<std::string> resources) {
        for (int i = 0; i < 50; ++i) {
            auto locks = manager.acquire_ordered(resources, LockMode::Exclusive, 5000ms);
            std::this_thread::yield();
        }
        ++completed;
    };

    std::thread t1(worker, std::vector<std::string>{"A", "B"});
    std::thread t2(worker, std::vector<std::string>{"B", "A"});
    t1.join();
    t2.join();

    EXPECT_EQ(completed.load(), 2);
    EXPECT_EQ(manager.resource_count(), 0u);
}
