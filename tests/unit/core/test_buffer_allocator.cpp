/**
 * @file test_buffer_allocator.cpp
 * @brief Unit tests for the buffer arena and its bounded channel
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/core/bounded_channel.h>
#include <kcenon/blob_transfer/core/buffer_allocator.h>

#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

namespace kcenon::blob_transfer::test {

using namespace std::chrono_literals;

class BufferAllocatorTest : public ::testing::Test {
protected:
    buffer_allocator arena_{1024, 3};
};

TEST_F(BufferAllocatorTest, LeasesAreDistinctSlots) {
    auto a = arena_.acquire(100);
    auto b = arena_.acquire(1024);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);

    EXPECT_NE(a.value().index(), b.value().index());
    EXPECT_EQ(a.value().size(), 100u);
    EXPECT_EQ(a.value().capacity(), 1024u);
    EXPECT_EQ(arena_.outstanding(), 2u);
}

TEST_F(BufferAllocatorTest, OversizedRequestIsRejected) {
    auto lease = arena_.acquire(1025);
    ASSERT_FALSE(lease);
    EXPECT_EQ(lease.error().code, error_code::chunk_too_large);
}

TEST_F(BufferAllocatorTest, ReleaseOnDestructionReturnsSlot) {
    {
        auto lease = arena_.acquire(10);
        ASSERT_TRUE(lease);
        EXPECT_EQ(arena_.outstanding(), 1u);
    }
    EXPECT_EQ(arena_.outstanding(), 0u);
    EXPECT_EQ(arena_.peak_outstanding(), 1u);
}

TEST_F(BufferAllocatorTest, ExplicitReleaseIsIdempotent) {
    auto lease = arena_.acquire(10);
    ASSERT_TRUE(lease);
    lease.value().release();
    lease.value().release();
    EXPECT_FALSE(lease.value().valid());
    EXPECT_EQ(arena_.outstanding(), 0u);
}

TEST_F(BufferAllocatorTest, TryAcquireFailsWhenExhausted) {
    std::vector<buffer_lease> held;
    for (int i = 0; i < 3; ++i) {
        auto lease = arena_.try_acquire(8);
        ASSERT_TRUE(lease.has_value());
        held.push_back(std::move(*lease));
    }
    EXPECT_FALSE(arena_.try_acquire(8).has_value());

    held.pop_back();
    EXPECT_TRUE(arena_.try_acquire(8).has_value());
}

TEST_F(BufferAllocatorTest, AcquireBlocksUntilRelease) {
    std::vector<buffer_lease> held;
    for (int i = 0; i < 3; ++i) {
        held.push_back(std::move(arena_.acquire(8).value()));
    }

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        auto lease = arena_.acquire(8);
        acquired = lease.has_value();
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(acquired.load());

    held.front().release();
    waiter.join();
    EXPECT_TRUE(acquired.load());
}

TEST_F(BufferAllocatorTest, CloseWakesBlockedAcquirer) {
    std::vector<buffer_lease> held;
    for (int i = 0; i < 3; ++i) {
        held.push_back(std::move(arena_.acquire(8).value()));
    }

    std::optional<error> failure;
    std::thread waiter([&] {
        auto lease = arena_.acquire(8);
        if (!lease) {
            failure = lease.error();
        }
    });

    std::this_thread::sleep_for(20ms);
    arena_.close();
    waiter.join();

    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->code, error_code::invalid_state);
}

TEST_F(BufferAllocatorTest, PeakNeverExceedsCapacityUnderContention) {
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([this] {
            for (int i = 0; i < 50; ++i) {
                auto lease = arena_.acquire(16);
                ASSERT_TRUE(lease);
                lease.value().writable()[0] = std::byte{1};
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    EXPECT_LE(arena_.peak_outstanding(), 3u);
    EXPECT_EQ(arena_.outstanding(), 0u);
}

TEST(BoundedChannelTest, CloseDrainsThenFails) {
    bounded_channel<int> channel(2);
    ASSERT_TRUE(channel.try_send(1));
    ASSERT_TRUE(channel.try_send(2));
    EXPECT_FALSE(channel.try_send(3));

    channel.close();
    EXPECT_FALSE(channel.send(4));
    EXPECT_EQ(channel.receive().value(), 1);
    EXPECT_EQ(channel.receive().value(), 2);
    EXPECT_FALSE(channel.receive());
}

}  // namespace kcenon::blob_transfer::test
