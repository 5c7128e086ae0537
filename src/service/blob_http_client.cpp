/**
 * @file blob_http_client.cpp
 * @brief network_system backed HTTP client
 */

#include <kcenon/blob_transfer/service/blob_http_client.h>

#include <kcenon/blob_transfer/config/feature_flags.h>
#include <kcenon/blob_transfer/core/logging.h>

#include <mutex>
#include <unordered_map>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::blob_transfer {

struct network_blob_http_client::impl {
    std::chrono::milliseconds default_timeout;

#if KCENON_WITH_NETWORK_SYSTEM
    std::mutex clients_mutex;
    std::unordered_map<int64_t, std::shared_ptr<kcenon::network::core::http_client>> clients;

    /**
     * @brief Client configured for a timeout; one is kept per distinct value
     */
    auto client_for(std::chrono::milliseconds timeout)
        -> std::shared_ptr<kcenon::network::core::http_client> {
        if (timeout.count() <= 0) {
            timeout = default_timeout;
        }
        std::lock_guard lock(clients_mutex);
        auto& client = clients[timeout.count()];
        if (!client) {
            client = std::make_shared<kcenon::network::core::http_client>(timeout);
        }
        return client;
    }

    static auto convert_response(const kcenon::network::internal::http_response& resp)
        -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        for (const auto& [key, value] : resp.headers) {
            result.headers[key] = value;
        }
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }
#endif

    explicit impl(std::chrono::milliseconds timeout) : default_timeout(timeout) {}
};

network_blob_http_client::network_blob_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_blob_http_client::~network_blob_http_client() = default;

network_blob_http_client::network_blob_http_client(network_blob_http_client&&) noexcept =
    default;
auto network_blob_http_client::operator=(network_blob_http_client&&) noexcept
    -> network_blob_http_client& = default;

auto network_blob_http_client::is_available() const noexcept -> bool {
#if KCENON_WITH_NETWORK_SYSTEM
    return true;
#else
    return false;
#endif
}

auto network_blob_http_client::send(const http_request& request) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto client = impl_->client_for(request.timeout);

    const std::string body(reinterpret_cast<const char*>(request.body.data()),
                           request.body.size());

    auto response = [&] {
        switch (request.method) {
            case http_method::get:
                return client->get(request.url, request.query, request.headers);
            case http_method::put:
                return client->put(request.full_url(), body, request.headers);
            case http_method::head:
                return client->head(request.full_url(), request.headers);
            case http_method::del:
                break;
        }
        return client->del(request.full_url(), request.headers);
    }();

    if (response.is_err()) {
        BT_LOG_DEBUG(log_category::service,
                     std::string("HTTP ") + std::string(to_string(request.method)) +
                     " failed: " + request.full_url());
        return unexpected{error{error_code::connection_failed,
            "HTTP " + std::string(to_string(request.method)) + " request failed"}};
    }
    return impl::convert_response(response.value());
#else
    (void)request;
    return unexpected{error{error_code::http_client_unavailable,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto make_network_blob_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<blob_http_client> {
    return std::make_shared<network_blob_http_client>(timeout);
}

}  // namespace kcenon::blob_transfer
