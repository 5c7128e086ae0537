/**
 * @file retry_filter_chain.h
 * @brief Driver loop that runs a request under a list of retry policies
 */

#ifndef KCENON_BLOB_TRANSFER_RETRY_RETRY_FILTER_CHAIN_H
#define KCENON_BLOB_TRANSFER_RETRY_RETRY_FILTER_CHAIN_H

#include <kcenon/blob_transfer/core/logging.h>
#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/retry/location_mode.h>
#include <kcenon/blob_transfer/retry/retry_policy.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Parameters handed to one attempt of a request
 */
struct attempt_info {
    storage_location location = storage_location::primary;

    /// 0 for the first attempt
    uint32_t attempt = 0;

    /// Timeout for this attempt, capped by the remaining budget
    std::chrono::milliseconds timeout{0};
};

/**
 * @brief Ordered retry policies plus the single loop that applies them
 *
 * After each failure the policies are asked in order and the first
 * decision wins; no decision means give up with the failure as is. A
 * budget stops further retries but never recalls an attempt in progress.
 *
 * execute() may be called from several threads at once.
 */
class retry_filter_chain {
public:
    using clock = std::chrono::steady_clock;
    using sleeper = std::function<void(std::chrono::milliseconds)>;
    using clock_source = std::function<clock::time_point()>;

    explicit retry_filter_chain(
        location_mode mode = location_mode::primary_only,
        std::optional<std::chrono::milliseconds> budget = std::nullopt,
        std::chrono::milliseconds request_timeout = std::chrono::milliseconds{30000});

    retry_filter_chain(const retry_filter_chain&) = delete;
    auto operator=(const retry_filter_chain&) -> retry_filter_chain& = delete;

    /**
     * @brief Chain with one policy built from retry options
     */
    [[nodiscard]] static auto from_options(const retry_options& retry,
                                           location_mode mode,
                                           std::optional<std::chrono::milliseconds> budget,
                                           std::chrono::milliseconds request_timeout)
        -> std::unique_ptr<retry_filter_chain>;

    auto add_policy(std::shared_ptr<const retry_policy> policy) -> retry_filter_chain&;

    /// Replace the delay function (tests use a recording no-op)
    void set_sleeper(sleeper fn);

    /// Replace the time source used for budget accounting
    void set_clock(clock_source fn);

    [[nodiscard]] auto mode() const noexcept -> location_mode { return mode_; }
    [[nodiscard]] auto budget() const noexcept -> std::optional<std::chrono::milliseconds> {
        return budget_;
    }
    [[nodiscard]] auto policy_count() const noexcept -> std::size_t { return policies_.size(); }

    /**
     * @brief Attempts made by the most recently finished execution
     */
    [[nodiscard]] auto attempts_made() const noexcept -> uint32_t {
        return attempts_made_.load();
    }

    /**
     * @brief Consult the policies for one failure
     */
    [[nodiscard]] auto decide(const retry_context& context, const error& err) const
        -> retry_decision;

    /**
     * @brief Run a request until it succeeds or a policy gives up
     *
     * @param request Callable taking const attempt_info& and returning result<T>
     * @param request_mode Locations the request may use
     * @param operation Short name for logs
     */
    template <typename Request>
    auto execute(Request&& request,
                 request_location_mode request_mode,
                 std::string_view operation = "request") const
        -> std::invoke_result_t<Request&, const attempt_info&>;

private:
    [[nodiscard]] auto now() const -> clock::time_point;
    void sleep(std::chrono::milliseconds delay) const;
    void record_attempts(uint32_t attempts) const noexcept { attempts_made_.store(attempts); }

    location_mode mode_;
    std::optional<std::chrono::milliseconds> budget_;
    std::chrono::milliseconds request_timeout_;
    std::vector<std::shared_ptr<const retry_policy>> policies_;
    sleeper sleeper_;
    clock_source clock_;
    mutable std::atomic<uint32_t> attempts_made_{0};
};

template <typename Request>
auto retry_filter_chain::execute(Request&& request,
                                 request_location_mode request_mode,
                                 std::string_view operation) const
    -> std::invoke_result_t<Request&, const attempt_info&> {
    using result_type = std::invoke_result_t<Request&, const attempt_info&>;

    const auto started = now();
    auto elapsed = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now() - started);
    };

    retry_context context;
    context.mode = mode_;
    context.request = request_mode;
    context.budget = budget_;
    context.location = initial_location(mode_, request_mode);

    for (uint32_t attempt = 0;; ++attempt) {
        attempt_info info;
        info.location = context.location;
        info.attempt = attempt;
        info.timeout = request_timeout_;

        if (budget_.has_value()) {
            const auto spent = elapsed();
            if (spent >= *budget_) {
                record_attempts(attempt);
                return unexpected{error{error_code::execution_timeout,
                    std::string(operation) + ": execution budget of " +
                    std::to_string(budget_->count()) + " ms exhausted"}};
            }
            info.timeout = std::min(request_timeout_, *budget_ - spent);
        }

        result_type outcome = request(static_cast<const attempt_info&>(info));
        if (outcome) {
            record_attempts(attempt + 1);
            return outcome;
        }

        context.attempt = attempt;
        context.elapsed = elapsed();
        const auto decision = decide(context, outcome.error());

        if (decision.action == retry_action::give_up) {
            record_attempts(attempt + 1);
            auto final_error = decision.final_error.value_or(outcome.error());
            if (attempt > 0) {
                BT_LOG_WARN(log_category::retry,
                            std::string(operation) + " gave up after " +
                            std::to_string(attempt + 1) + " attempts: " +
                            final_error.message);
            }
            return unexpected{std::move(final_error)};
        }

        if (context.location == storage_location::secondary &&
            outcome.error().http_status == 404) {
            context.secondary_not_found = true;
        }

        BT_LOG_DEBUG(log_category::retry,
                     std::string(operation) + " attempt " + std::to_string(attempt + 1) +
                     " on " + std::string(to_string(context.location)) + " failed (" +
                     outcome.error().message + "), " + std::string(to_string(decision.action)) +
                     " in " + std::to_string(decision.delay.count()) + " ms");

        sleep(decision.delay);
        context.location = decision.target;
    }
}

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_RETRY_RETRY_FILTER_CHAIN_H
