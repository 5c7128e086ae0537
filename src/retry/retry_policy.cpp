/**
 * @file retry_policy.cpp
 * @brief Implementation of retry policies
 */

#include <kcenon/blob_transfer/retry/retry_policy.h>

#include <kcenon/blob_transfer/core/error_codes.h>

#include <algorithm>
#include <string>

namespace kcenon::blob_transfer {

namespace {

auto is_secondary_not_found(const retry_context& context, const error& err) -> bool {
    return context.location == storage_location::secondary && err.http_status == 404;
}

}  // namespace

// ============================================================================
// backoff_retry_policy
// ============================================================================

auto backoff_retry_policy::decide(const retry_context& context, const error& err) const
    -> std::optional<retry_decision> {
    const bool alternate = can_alternate(context.mode, context.request);

    // A 404 from the secondary usually means replication lag, so the
    // primary gets a chance before the error is final.
    const bool secondary_miss = alternate && is_secondary_not_found(context, err);

    if (!secondary_miss && !is_retryable(err)) {
        return retry_decision::give_up(err);
    }

    if (context.attempt >= retry_count_) {
        return retry_decision::give_up(error{error_code::retries_exhausted,
            "gave up after " + std::to_string(context.attempt + 1) + " attempts: " +
            err.message,
            err.http_status, err.service_code});
    }

    const auto delay = delay_for(context.attempt);
    if (context.budget.has_value() && context.elapsed + delay > *context.budget) {
        return retry_decision::give_up(error{error_code::execution_timeout,
            "execution budget of " + std::to_string(context.budget->count()) +
            " ms exhausted: " + err.message,
            err.http_status, err.service_code});
    }

    retry_decision decision;
    decision.delay = delay;
    decision.target = context.location;
    decision.action = retry_action::retry_after;

    if (alternate) {
        auto target = other_location(context.location);
        if (secondary_miss || context.secondary_not_found) {
            target = storage_location::primary;
        }
        decision.target = target;
        if (target != context.location) {
            decision.action = retry_action::switch_endpoint;
        }
    }
    return decision;
}

// ============================================================================
// linear_retry_policy
// ============================================================================

auto linear_retry_policy::delay_for(uint32_t /*attempt*/) const -> std::chrono::milliseconds {
    return interval_;
}

// ============================================================================
// exponential_retry_policy
// ============================================================================

exponential_retry_policy::exponential_retry_policy(uint32_t retry_count,
                                                   std::chrono::milliseconds base,
                                                   std::chrono::milliseconds max,
                                                   bool use_jitter)
    : backoff_retry_policy(retry_count),
      base_(base),
      max_(max),
      use_jitter_(use_jitter),
      rng_(std::random_device{}()) {}

auto exponential_retry_policy::delay_for(uint32_t attempt) const -> std::chrono::milliseconds {
    // Saturate well before the shift overflows
    const auto shift = std::min<uint32_t>(attempt, 30);
    const auto raw = static_cast<double>(base_.count()) * static_cast<double>(1ULL << shift);
    auto delay = std::min(raw, static_cast<double>(max_.count()));

    if (use_jitter_) {
        std::lock_guard lock(rng_mutex_);
        std::uniform_real_distribution<double> factor(0.8, 1.2);
        delay = std::min(delay * factor(rng_), static_cast<double>(max_.count()));
    }
    return std::chrono::milliseconds{static_cast<int64_t>(delay)};
}

// ============================================================================
// no_retry_policy
// ============================================================================

auto no_retry_policy::decide(const retry_context& /*context*/, const error& err) const
    -> std::optional<retry_decision> {
    return retry_decision::give_up(err);
}

auto make_retry_policy(const retry_options& options) -> std::shared_ptr<const retry_policy> {
    switch (options.kind) {
        case retry_options::policy_kind::linear:
            return std::make_shared<linear_retry_policy>(options.retry_count, options.interval);
        case retry_options::policy_kind::exponential:
            return std::make_shared<exponential_retry_policy>(
                options.retry_count, options.interval, options.max_interval,
                options.use_jitter);
        case retry_options::policy_kind::none:
            break;
    }
    return std::make_shared<no_retry_policy>();
}

}  // namespace kcenon::blob_transfer
