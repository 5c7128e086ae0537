/**
 * @file retry_policy.h
 * @brief Retry decisions for failed service requests
 */

#ifndef KCENON_BLOB_TRANSFER_RETRY_RETRY_POLICY_H
#define KCENON_BLOB_TRANSFER_RETRY_RETRY_POLICY_H

#include <kcenon/blob_transfer/config/transfer_options.h>
#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/retry/location_mode.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string_view>

namespace kcenon::blob_transfer {

enum class retry_action : uint8_t {
    retry_after,
    switch_endpoint,
    give_up,
};

[[nodiscard]] constexpr auto to_string(retry_action action) -> std::string_view {
    switch (action) {
        case retry_action::retry_after: return "retry_after";
        case retry_action::switch_endpoint: return "switch_endpoint";
        case retry_action::give_up: return "give_up";
    }
    return "unknown";
}

/**
 * @brief Outcome of consulting a policy after a failed attempt
 *
 * For give_up, final_error is the error to report to the caller.
 */
struct retry_decision {
    retry_action action = retry_action::give_up;
    std::chrono::milliseconds delay{0};
    storage_location target = storage_location::primary;
    std::optional<error> final_error;

    [[nodiscard]] static auto give_up(error err) -> retry_decision {
        retry_decision decision;
        decision.action = retry_action::give_up;
        decision.final_error = std::move(err);
        return decision;
    }
};

/**
 * @brief State of a request at the moment a policy is consulted
 */
struct retry_context {
    /// Retries already made; 0 after the first failure
    uint32_t attempt = 0;

    /// Location the failed attempt went to
    storage_location location = storage_location::primary;

    location_mode mode = location_mode::primary_only;
    request_location_mode request = request_location_mode::primary_only;

    /// Time since the first attempt started
    std::chrono::milliseconds elapsed{0};

    std::optional<std::chrono::milliseconds> budget;

    /// The secondary already answered 404 for this request
    bool secondary_not_found = false;
};

/**
 * @brief Decides whether and how a failed request is retried
 *
 * decide() is pure with respect to the request: it only inspects the
 * context and the error.
 */
class retry_policy {
public:
    virtual ~retry_policy() = default;

    /**
     * @return Decision, or nullopt if this policy does not apply
     */
    [[nodiscard]] virtual auto decide(const retry_context& context, const error& err) const
        -> std::optional<retry_decision> = 0;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

/**
 * @brief Shared classification, count, budget and location handling
 *
 * Subclasses only supply the delay before a given retry.
 */
class backoff_retry_policy : public retry_policy {
public:
    explicit backoff_retry_policy(uint32_t retry_count) : retry_count_(retry_count) {}

    [[nodiscard]] auto decide(const retry_context& context, const error& err) const
        -> std::optional<retry_decision> override;

    [[nodiscard]] auto retry_count() const noexcept -> uint32_t { return retry_count_; }

    /**
     * @brief Delay before retry number attempt (0-based)
     */
    [[nodiscard]] virtual auto delay_for(uint32_t attempt) const -> std::chrono::milliseconds = 0;

private:
    uint32_t retry_count_;
};

/**
 * @brief Constant delay between attempts
 */
class linear_retry_policy : public backoff_retry_policy {
public:
    explicit linear_retry_policy(uint32_t retry_count = 3,
                                 std::chrono::milliseconds interval = std::chrono::milliseconds{30000})
        : backoff_retry_policy(retry_count), interval_(interval) {}

    [[nodiscard]] auto delay_for(uint32_t attempt) const -> std::chrono::milliseconds override;
    [[nodiscard]] auto name() const -> std::string_view override { return "linear"; }

private:
    std::chrono::milliseconds interval_;
};

/**
 * @brief Delay of min(base * 2^attempt, max), optionally jittered
 */
class exponential_retry_policy : public backoff_retry_policy {
public:
    exponential_retry_policy(uint32_t retry_count = 3,
                             std::chrono::milliseconds base = std::chrono::milliseconds{3000},
                             std::chrono::milliseconds max = std::chrono::milliseconds{90000},
                             bool use_jitter = false);

    [[nodiscard]] auto delay_for(uint32_t attempt) const -> std::chrono::milliseconds override;
    [[nodiscard]] auto name() const -> std::string_view override { return "exponential"; }

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds max_;
    bool use_jitter_;

    mutable std::mutex rng_mutex_;
    mutable std::mt19937 rng_;
};

/**
 * @brief Gives up on every failure with the original error
 */
class no_retry_policy : public retry_policy {
public:
    [[nodiscard]] auto decide(const retry_context& context, const error& err) const
        -> std::optional<retry_decision> override;
    [[nodiscard]] auto name() const -> std::string_view override { return "none"; }
};

/**
 * @brief Build the policy selected by retry options
 */
[[nodiscard]] auto make_retry_policy(const retry_options& options)
    -> std::shared_ptr<const retry_policy>;

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_RETRY_RETRY_POLICY_H
