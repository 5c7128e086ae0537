/**
 * @file test_retry_filter_chain.cpp
 * @brief Unit tests for the retry driver loop
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/retry/retry_filter_chain.h>

#include "unit/test_fixtures.h"

#include <string>
#include <vector>

namespace kcenon::blob_transfer::test {

using namespace std::chrono_literals;

class RetryFilterChainTest : public ::testing::Test {
protected:
    auto make_chain(location_mode mode, retry_options retry,
                    std::optional<std::chrono::milliseconds> budget = std::nullopt)
        -> std::unique_ptr<retry_filter_chain> {
        auto chain = retry_filter_chain::from_options(retry, mode, budget, 5000ms);
        chain->set_sleeper(sleeper_.fn());
        return chain;
    }

    static auto busy() -> error {
        return error{error_code::service_error, "busy", 503, "ServerBusy"};
    }

    recording_sleeper sleeper_;
    std::vector<storage_location> visited_;
};

TEST_F(RetryFilterChainTest, FirstSuccessReturnsImmediately) {
    auto chain = make_chain(location_mode::primary_only, retry_options::linear(3, 100ms));

    auto outcome = chain->execute(
        [&](const attempt_info& info) -> result<int> {
            visited_.push_back(info.location);
            return 7;
        },
        request_location_mode::primary_only, "put_block");

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value(), 7);
    EXPECT_EQ(chain->attempts_made(), 1u);
    EXPECT_TRUE(sleeper_.delays().empty());
}

TEST_F(RetryFilterChainTest, TransientFailuresAreRetriedWithPolicyDelay) {
    auto chain = make_chain(location_mode::primary_only, retry_options::linear(3, 100ms));

    int calls = 0;
    auto outcome = chain->execute(
        [&](const attempt_info& info) -> result<void> {
            EXPECT_EQ(info.attempt, static_cast<uint32_t>(calls));
            if (++calls < 3) {
                return unexpected{busy()};
            }
            return {};
        },
        request_location_mode::primary_only);

    ASSERT_TRUE(outcome);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(chain->attempts_made(), 3u);
    EXPECT_EQ(sleeper_.delays(), (std::vector<std::chrono::milliseconds>{100ms, 100ms}));
}

TEST_F(RetryFilterChainTest, ExhaustionReportsRetriesExhausted) {
    auto chain = make_chain(location_mode::primary_only, retry_options::exponential(2, 10ms, 1000ms));

    auto outcome = chain->execute(
        [&](const attempt_info&) -> result<void> { return unexpected{busy()}; },
        request_location_mode::primary_only);

    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::retries_exhausted);
    EXPECT_EQ(outcome.error().http_status, 503);
    EXPECT_EQ(chain->attempts_made(), 3u);
    EXPECT_EQ(sleeper_.delays(), (std::vector<std::chrono::milliseconds>{10ms, 20ms}));
}

TEST_F(RetryFilterChainTest, NonRetryableFailureIsReturnedAsIs) {
    auto chain = make_chain(location_mode::primary_only, retry_options::linear(5, 10ms));

    auto outcome = chain->execute(
        [&](const attempt_info&) -> result<void> {
            return unexpected{error{error_code::content_md5_mismatch, "md5", 400, "Md5Mismatch"}};
        },
        request_location_mode::primary_only);

    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::content_md5_mismatch);
    EXPECT_EQ(chain->attempts_made(), 1u);
}

TEST_F(RetryFilterChainTest, ReadsFailOverToSecondary) {
    auto chain = make_chain(location_mode::primary_then_secondary, retry_options::linear(3, 10ms));

    auto outcome = chain->execute(
        [&](const attempt_info& info) -> result<std::string> {
            visited_.push_back(info.location);
            if (info.location == storage_location::primary) {
                return unexpected{busy()};
            }
            return std::string("from secondary");
        },
        request_location_mode::primary_or_secondary, "get_range");

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value(), "from secondary");
    EXPECT_EQ(visited_, (std::vector<storage_location>{storage_location::primary,
                                                       storage_location::secondary}));
}

TEST_F(RetryFilterChainTest, SecondaryNotFoundPinsPrimary) {
    auto chain = make_chain(location_mode::secondary_then_primary, retry_options::linear(4, 10ms));

    auto outcome = chain->execute(
        [&](const attempt_info& info) -> result<void> {
            visited_.push_back(info.location);
            if (info.location == storage_location::secondary) {
                return unexpected{error{error_code::blob_not_found, "lag", 404, "BlobNotFound"}};
            }
            return unexpected{busy()};
        },
        request_location_mode::primary_or_secondary);

    ASSERT_FALSE(outcome);
    ASSERT_EQ(visited_.size(), 5u);
    EXPECT_EQ(visited_[0], storage_location::secondary);
    for (std::size_t i = 1; i < visited_.size(); ++i) {
        EXPECT_EQ(visited_[i], storage_location::primary);
    }
}

TEST_F(RetryFilterChainTest, WritesNeverLeavePrimary) {
    auto chain = make_chain(location_mode::primary_then_secondary, retry_options::linear(2, 10ms));

    auto outcome = chain->execute(
        [&](const attempt_info& info) -> result<void> {
            visited_.push_back(info.location);
            return unexpected{busy()};
        },
        request_location_mode::primary_only);

    ASSERT_FALSE(outcome);
    EXPECT_EQ(visited_, (std::vector<storage_location>(3, storage_location::primary)));
}

TEST_F(RetryFilterChainTest, BudgetStopsRetriesAndCapsTimeout) {
    auto chain = make_chain(location_mode::primary_only, retry_options::linear(10, 300ms), 1000ms);

    // Fake clock advanced by the sleeper
    auto now = retry_filter_chain::clock::time_point{};
    chain->set_clock([&] { return now; });
    chain->set_sleeper([&](std::chrono::milliseconds delay) { now += delay; });

    std::vector<std::chrono::milliseconds> timeouts;
    auto outcome = chain->execute(
        [&](const attempt_info& info) -> result<void> {
            timeouts.push_back(info.timeout);
            return unexpected{busy()};
        },
        request_location_mode::primary_only);

    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::execution_timeout);
    EXPECT_EQ(outcome.error().http_status, 503);
    EXPECT_EQ(timeouts, (std::vector<std::chrono::milliseconds>{1000ms, 700ms, 400ms, 100ms}));
}

TEST_F(RetryFilterChainTest, FirstDecidingPolicyWins) {
    class refuse_conflicts : public retry_policy {
    public:
        auto decide(const retry_context&, const error& err) const
            -> std::optional<retry_decision> override {
            if (err.http_status == 409) {
                return retry_decision::give_up(err);
            }
            return std::nullopt;
        }
        auto name() const -> std::string_view override { return "refuse_conflicts"; }
    };

    retry_filter_chain chain;
    chain.set_sleeper(sleeper_.fn());
    chain.add_policy(std::make_shared<refuse_conflicts>())
         .add_policy(std::make_shared<linear_retry_policy>(3, 10ms));
    EXPECT_EQ(chain.policy_count(), 2u);

    auto conflict = chain.decide(retry_context{}, error{error_code::service_error, "c", 409});
    EXPECT_EQ(conflict.action, retry_action::give_up);

    auto transient = chain.decide(retry_context{}, busy());
    EXPECT_EQ(transient.action, retry_action::retry_after);
}

TEST_F(RetryFilterChainTest, EmptyChainGivesUp) {
    retry_filter_chain chain;
    auto decision = chain.decide(retry_context{}, busy());
    EXPECT_EQ(decision.action, retry_action::give_up);
    EXPECT_EQ(decision.final_error->code, error_code::service_error);
}

}  // namespace kcenon::blob_transfer::test
