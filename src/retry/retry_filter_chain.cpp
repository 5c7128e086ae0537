/**
 * @file retry_filter_chain.cpp
 * @brief Non-template parts of the retry filter chain
 */

#include <kcenon/blob_transfer/retry/retry_filter_chain.h>

#include <thread>

namespace kcenon::blob_transfer {

retry_filter_chain::retry_filter_chain(location_mode mode,
                                       std::optional<std::chrono::milliseconds> budget,
                                       std::chrono::milliseconds request_timeout)
    : mode_(mode), budget_(budget), request_timeout_(request_timeout) {}

auto retry_filter_chain::from_options(const retry_options& retry,
                                      location_mode mode,
                                      std::optional<std::chrono::milliseconds> budget,
                                      std::chrono::milliseconds request_timeout)
    -> std::unique_ptr<retry_filter_chain> {
    auto chain = std::make_unique<retry_filter_chain>(mode, budget, request_timeout);
    chain->add_policy(make_retry_policy(retry));
    return chain;
}

auto retry_filter_chain::add_policy(std::shared_ptr<const retry_policy> policy)
    -> retry_filter_chain& {
    if (policy) {
        policies_.push_back(std::move(policy));
    }
    return *this;
}

void retry_filter_chain::set_sleeper(sleeper fn) {
    sleeper_ = std::move(fn);
}

void retry_filter_chain::set_clock(clock_source fn) {
    clock_ = std::move(fn);
}

auto retry_filter_chain::decide(const retry_context& context, const error& err) const
    -> retry_decision {
    for (const auto& policy : policies_) {
        if (auto decision = policy->decide(context, err)) {
            return *decision;
        }
    }
    return retry_decision::give_up(err);
}

auto retry_filter_chain::now() const -> clock::time_point {
    return clock_ ? clock_() : clock::now();
}

void retry_filter_chain::sleep(std::chrono::milliseconds delay) const {
    if (delay.count() <= 0) return;
    if (sleeper_) {
        sleeper_(delay);
    } else {
        std::this_thread::sleep_for(delay);
    }
}

}  // namespace kcenon::blob_transfer
