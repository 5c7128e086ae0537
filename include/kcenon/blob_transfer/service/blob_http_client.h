/**
 * @file blob_http_client.h
 * @brief HTTP transport used by the blob service client
 *
 * The transfer engine talks to the network only through
 * blob_http_client::send(). The production implementation wraps the
 * network_system HTTP client; tests script their own.
 */

#ifndef KCENON_BLOB_TRANSFER_SERVICE_BLOB_HTTP_CLIENT_H
#define KCENON_BLOB_TRANSFER_SERVICE_BLOB_HTTP_CLIENT_H

#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/service/http_types.h>

#include <chrono>
#include <memory>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace kcenon::blob_transfer {

/**
 * @brief Sends one HTTP request and returns the raw response
 *
 * A response with any status is a success at this level; only transport
 * failures (no status) are errors. Implementations must be safe to call
 * from several threads at once.
 */
class blob_http_client {
public:
    virtual ~blob_http_client() = default;

    [[nodiscard]] virtual auto send(const http_request& request) -> result<http_response> = 0;
};

/**
 * @brief blob_http_client over kcenon::network::core::http_client
 *
 * Without network_system every call reports http_client_unavailable.
 */
class network_blob_http_client : public blob_http_client {
public:
    explicit network_blob_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));
    ~network_blob_http_client() override;

    network_blob_http_client(const network_blob_http_client&) = delete;
    auto operator=(const network_blob_http_client&) -> network_blob_http_client& = delete;
    network_blob_http_client(network_blob_http_client&&) noexcept;
    auto operator=(network_blob_http_client&&) noexcept -> network_blob_http_client&;

    [[nodiscard]] auto send(const http_request& request) -> result<http_response> override;

    /**
     * @brief Check if the HTTP client is available
     * @return true if network system is available, false otherwise
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Create the production HTTP client
 */
[[nodiscard]] auto make_network_blob_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<blob_http_client>;

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_SERVICE_BLOB_HTTP_CLIENT_H
