/**
 * @file test_batch_scheduler.cpp
 * @brief Unit tests for bounded dispatch, failure aggregation and batch events
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/adapters/worker_pool_adapter.h>
#include <kcenon/blob_transfer/transfer/batch_scheduler.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::blob_transfer::test {

using namespace std::chrono_literals;

namespace {

/**
 * @brief What happened to one scripted operation
 */
struct op_state {
    std::atomic<bool> executed{false};
    std::atomic<int> completions{0};
    std::atomic<error_code> completed_with{error_code::success};
};

/**
 * @brief Operation that optionally waits on a gate, then succeeds or fails
 */
class scripted_operation : public batch_operation {
public:
    scripted_operation(std::shared_ptr<op_state> state,
                       std::shared_future<void> gate = {},
                       std::optional<error> failure = std::nullopt,
                       std::chrono::milliseconds work = 0ms)
        : state_(std::move(state)),
          gate_(std::move(gate)),
          failure_(std::move(failure)),
          work_(work) {
        set_completion([s = state_](const error& err) {
            s->completed_with = err.code;
            ++s->completions;
        });
    }

    auto execute() -> result<void> override {
        state_->executed = true;
        if (gate_.valid()) {
            gate_.wait();
        }
        if (work_.count() > 0) {
            std::this_thread::sleep_for(work_);
        }
        if (failure_) {
            return unexpected{*failure_};
        }
        return {};
    }

    auto describe() const -> std::string override { return "scripted"; }

private:
    std::shared_ptr<op_state> state_;
    std::shared_future<void> gate_;
    std::optional<error> failure_;
    std::chrono::milliseconds work_;
};

class throwing_operation : public batch_operation {
public:
    auto execute() -> result<void> override { throw std::runtime_error("boom"); }
    auto describe() const -> std::string override { return "throwing"; }
};

auto wait_until(const std::function<bool()>& condition) -> bool {
    for (int i = 0; i < 500; ++i) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return condition();
}

}  // namespace

class BatchSchedulerTest : public ::testing::Test {
protected:
    std::shared_ptr<adapters::worker_pool_interface> pool_ =
        std::make_shared<adapters::async_worker_pool>();
};

TEST_F(BatchSchedulerTest, EmptyBatchEndsOnEnableComplete) {
    batch_scheduler scheduler(2, pool_);
    int ends = 0;
    scheduler.on_end([&](const std::optional<error>& err) {
        EXPECT_FALSE(err.has_value());
        ++ends;
    });

    EXPECT_FALSE(scheduler.is_ended());
    scheduler.enable_complete();
    EXPECT_FALSE(scheduler.wait_for_end().has_value());
    EXPECT_TRUE(scheduler.is_ended());
    EXPECT_EQ(ends, 1);
}

TEST_F(BatchSchedulerTest, InFlightNeverExceedsLimit) {
    batch_scheduler scheduler(3, pool_);
    std::atomic<int> current{0};
    std::atomic<int> highest{0};

    class counting_operation : public batch_operation {
    public:
        counting_operation(std::atomic<int>& current, std::atomic<int>& highest)
            : current_(current), highest_(highest) {}
        auto execute() -> result<void> override {
            const int now = ++current_;
            int seen = highest_.load();
            while (now > seen && !highest_.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(3ms);
            --current_;
            return {};
        }
        auto describe() const -> std::string override { return "counting"; }

    private:
        std::atomic<int>& current_;
        std::atomic<int>& highest_;
    };

    for (int i = 0; i < 20; ++i) {
        scheduler.add_operation(std::make_unique<counting_operation>(current, highest));
    }
    scheduler.enable_complete();

    EXPECT_FALSE(scheduler.wait_for_end().has_value());
    EXPECT_LE(highest.load(), 3);
    EXPECT_LE(scheduler.peak_in_flight(), 3u);
    EXPECT_EQ(scheduler.dispatched(), 20u);
    EXPECT_EQ(scheduler.completed(), 20u);
    EXPECT_EQ(scheduler.in_flight(), 0u);
}

TEST_F(BatchSchedulerTest, AddReportsFullAndDrainFires) {
    batch_scheduler scheduler(2, pool_);
    std::promise<void> release;
    auto gate = release.get_future().share();
    std::atomic<int> drains{0};
    scheduler.on_drain([&] { ++drains; });

    auto first = std::make_shared<op_state>();
    auto second = std::make_shared<op_state>();
    EXPECT_FALSE(scheduler.add_operation(std::make_unique<scripted_operation>(first, gate)));
    EXPECT_TRUE(scheduler.add_operation(std::make_unique<scripted_operation>(second, gate)));
    EXPECT_TRUE(scheduler.is_full());

    release.set_value();
    scheduler.enable_complete();
    EXPECT_FALSE(scheduler.wait_for_end().has_value());
    EXPECT_GE(drains.load(), 1);
    EXPECT_EQ(first->completions.load(), 1);
    EXPECT_EQ(second->completions.load(), 1);
}

TEST_F(BatchSchedulerTest, QueuedOperationsRunAfterSlotsFree) {
    batch_scheduler scheduler(1, pool_);
    std::vector<std::shared_ptr<op_state>> states;
    for (int i = 0; i < 4; ++i) {
        states.push_back(std::make_shared<op_state>());
        EXPECT_TRUE(scheduler.add_operation(
            std::make_unique<scripted_operation>(states.back(), std::shared_future<void>{},
                                                 std::nullopt, 2ms)));
    }
    scheduler.enable_complete();
    EXPECT_FALSE(scheduler.wait_for_end().has_value());

    for (const auto& state : states) {
        EXPECT_TRUE(state->executed.load());
        EXPECT_EQ(state->completions.load(), 1);
        EXPECT_EQ(state->completed_with.load(), error_code::success);
    }
    EXPECT_EQ(scheduler.peak_in_flight(), 1u);
}

TEST_F(BatchSchedulerTest, FailureCompletesQueuedOperationsWithoutRunning) {
    batch_scheduler scheduler(1, pool_);
    std::promise<void> release;
    auto gate = release.get_future().share();

    auto failing = std::make_shared<op_state>();
    auto queued_a = std::make_shared<op_state>();
    auto queued_b = std::make_shared<op_state>();
    const error failure{error_code::service_error, "server busy", 503, "ServerBusy"};

    scheduler.add_operation(std::make_unique<scripted_operation>(failing, gate, failure));
    scheduler.add_operation(std::make_unique<scripted_operation>(queued_a));
    scheduler.add_operation(std::make_unique<scripted_operation>(queued_b));
    EXPECT_EQ(scheduler.queued(), 2u);

    release.set_value();
    scheduler.enable_complete();
    auto err = scheduler.wait_for_end();

    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, error_code::service_error);
    EXPECT_EQ(err->http_status, 503);
    EXPECT_TRUE(scheduler.failed());

    EXPECT_FALSE(queued_a->executed.load());
    EXPECT_FALSE(queued_b->executed.load());
    EXPECT_EQ(queued_a->completions.load(), 1);
    EXPECT_EQ(queued_b->completed_with.load(), error_code::service_error);
    EXPECT_EQ(scheduler.completed(), 3u);
    EXPECT_EQ(scheduler.dispatched(), 1u);
}

TEST_F(BatchSchedulerTest, InFlightOperationsDrainAfterFailure) {
    batch_scheduler scheduler(3, pool_);
    std::promise<void> release;
    auto gate = release.get_future().share();

    auto failing = std::make_shared<op_state>();
    auto slow_a = std::make_shared<op_state>();
    auto slow_b = std::make_shared<op_state>();
    std::atomic<int> ends{0};
    scheduler.on_end([&](const std::optional<error>&) { ++ends; });

    scheduler.add_operation(std::make_unique<scripted_operation>(slow_a, gate));
    scheduler.add_operation(std::make_unique<scripted_operation>(slow_b, gate));
    scheduler.add_operation(std::make_unique<scripted_operation>(
        failing, std::shared_future<void>{}, error{error_code::blob_not_found, "gone", 404}));
    scheduler.enable_complete();

    ASSERT_TRUE(wait_until([&] { return scheduler.failed(); }));
    EXPECT_FALSE(scheduler.is_ended());
    EXPECT_EQ(scheduler.in_flight(), 2u);

    release.set_value();
    auto err = scheduler.wait_for_end();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, error_code::blob_not_found);
    EXPECT_EQ(slow_a->completed_with.load(), error_code::success);
    EXPECT_EQ(slow_b->completed_with.load(), error_code::success);
    EXPECT_EQ(ends.load(), 1);
}

TEST_F(BatchSchedulerTest, OperationsAddedAfterFailureNeverRun) {
    batch_scheduler scheduler(2, pool_);
    auto failing = std::make_shared<op_state>();
    scheduler.add_operation(std::make_unique<scripted_operation>(
        failing, std::shared_future<void>{}, error{error_code::content_md5_mismatch, "md5"}));
    ASSERT_TRUE(wait_until([&] { return scheduler.failed() && scheduler.in_flight() == 0; }));

    auto late = std::make_shared<op_state>();
    scheduler.add_operation(std::make_unique<scripted_operation>(late));
    EXPECT_FALSE(late->executed.load());
    EXPECT_EQ(late->completions.load(), 1);
    EXPECT_EQ(late->completed_with.load(), error_code::content_md5_mismatch);

    scheduler.enable_complete();
    EXPECT_EQ(scheduler.wait_for_end()->code, error_code::content_md5_mismatch);
}

TEST_F(BatchSchedulerTest, OnlyFirstErrorIsKept) {
    batch_scheduler scheduler(1, pool_);
    auto a = std::make_shared<op_state>();
    auto b = std::make_shared<op_state>();

    scheduler.add_operation(std::make_unique<scripted_operation>(
        a, std::shared_future<void>{}, error{error_code::connection_failed, "first"}));
    ASSERT_TRUE(wait_until([&] { return scheduler.failed(); }));
    scheduler.add_operation(std::make_unique<scripted_operation>(
        b, std::shared_future<void>{}, error{error_code::request_timeout, "second"}));
    scheduler.enable_complete();

    auto err = scheduler.wait_for_end();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->message, "first");
    EXPECT_FALSE(b->executed.load());
}

TEST_F(BatchSchedulerTest, ExceptionBecomesInternalError) {
    batch_scheduler scheduler(1, pool_);
    scheduler.add_operation(std::make_unique<throwing_operation>());
    scheduler.enable_complete();

    auto err = scheduler.wait_for_end();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, error_code::internal_error);
    EXPECT_NE(err->message.find("boom"), std::string::npos);
}

TEST_F(BatchSchedulerTest, ZeroLimitIsTreatedAsOne) {
    batch_scheduler scheduler(0, pool_);
    EXPECT_EQ(scheduler.limit(), 1u);
}

}  // namespace kcenon::blob_transfer::test
