/**
 * @file blob_service_client.h
 * @brief Typed blob service calls over an HTTP client and a retry chain
 */

#ifndef KCENON_BLOB_TRANSFER_SERVICE_BLOB_SERVICE_CLIENT_H
#define KCENON_BLOB_TRANSFER_SERVICE_BLOB_SERVICE_CLIENT_H

#include <kcenon/blob_transfer/config/transfer_options.h>
#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/retry/retry_filter_chain.h>
#include <kcenon/blob_transfer/service/blob_http_client.h>
#include <kcenon/blob_transfer/service/http_types.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Properties written with a commit or a property update
 */
struct blob_properties {
    std::optional<std::string> content_type;

    /// Base64 MD5 of the whole blob
    std::optional<std::string> content_md5;

    /// Page blob length (x-ms-blob-content-length)
    std::optional<uint64_t> content_length;
};

/**
 * @brief Properties returned by a HEAD request
 */
struct blob_info {
    uint64_t content_length = 0;
    blob_kind kind = blob_kind::block;
    std::optional<std::string> content_md5;
    std::optional<std::string> etag;
    std::optional<std::string> content_type;
    std::optional<std::string> last_modified;
};

enum class block_list_filter : uint8_t {
    committed,
    uncommitted,
    all,
};

[[nodiscard]] constexpr auto to_string(block_list_filter filter) -> std::string_view {
    switch (filter) {
        case block_list_filter::committed: return "committed";
        case block_list_filter::uncommitted: return "uncommitted";
        case block_list_filter::all: return "all";
    }
    return "all";
}

struct block_entry {
    std::string id;
    uint64_t size = 0;
    bool committed = false;
};

/**
 * @brief Client for the blob REST surface used by transfers
 *
 * Every call runs through the client's retry_filter_chain. Writes go to
 * the primary endpoint; reads may use the secondary according to the
 * chain's location mode.
 *
 * Thread-safe: calls may be issued concurrently.
 */
class blob_service_client {
public:
    /**
     * @param endpoint Primary and optional secondary endpoint
     * @param http Transport (shared with sibling clients)
     * @param retry Retry policy selection
     */
    blob_service_client(service_endpoint endpoint,
                        std::shared_ptr<blob_http_client> http,
                        retry_options retry = {});

    blob_service_client(blob_service_client&&) noexcept;
    auto operator=(blob_service_client&&) noexcept -> blob_service_client&;
    blob_service_client(const blob_service_client&) = delete;
    auto operator=(const blob_service_client&) -> blob_service_client& = delete;
    ~blob_service_client();

    /**
     * @brief Create a client over the network_system transport
     */
    [[nodiscard]] static auto create(service_endpoint endpoint, retry_options retry = {})
        -> blob_service_client;

    /**
     * @brief Sibling client sharing the transport, with a chain configured
     *        for one transfer's location mode, budget and timeout
     */
    [[nodiscard]] auto with_options(const transfer_options& options) const
        -> blob_service_client;

    /**
     * @brief Replace the retry delay function, inherited by siblings
     */
    void set_sleeper(retry_filter_chain::sleeper fn);

    [[nodiscard]] auto endpoint() const noexcept -> const service_endpoint& { return endpoint_; }
    [[nodiscard]] auto retry_chain() const noexcept -> const retry_filter_chain& {
        return *chain_;
    }

    // ========================================================================
    // Writes (primary only)
    // ========================================================================

    /**
     * @brief Stage one block (PUT ?comp=block), expects 201
     */
    [[nodiscard]] auto put_block(const std::string& container,
                                 const std::string& blob,
                                 const std::string& block_id,
                                 std::span<const std::byte> body,
                                 const std::optional<std::string>& content_md5 = std::nullopt)
        -> result<http_response>;

    /**
     * @brief Create an empty page blob of `length` bytes (PUT with
     *        x-ms-blob-type: PageBlob), expects 201
     *
     * Replaces any existing blob at the path. `length` must be 512-aligned.
     */
    [[nodiscard]] auto create_page_blob(const std::string& container,
                                        const std::string& blob,
                                        uint64_t length,
                                        const blob_properties& properties = {})
        -> result<http_response>;

    /**
     * @brief Write a 512-aligned page range (PUT ?comp=page), expects 201
     */
    [[nodiscard]] auto put_page(const std::string& container,
                                const std::string& blob,
                                byte_range range,
                                std::span<const std::byte> body,
                                const std::optional<std::string>& content_md5 = std::nullopt)
        -> result<http_response>;

    /**
     * @brief Commit block ids in the given order (PUT ?comp=blocklist), expects 201
     */
    [[nodiscard]] auto commit_block_list(const std::string& container,
                                         const std::string& blob,
                                         const std::vector<std::string>& block_ids,
                                         const blob_properties& properties = {})
        -> result<http_response>;

    /**
     * @brief Update blob properties (PUT ?comp=properties), expects 200
     */
    [[nodiscard]] auto set_blob_properties(const std::string& container,
                                           const std::string& blob,
                                           const blob_properties& properties)
        -> result<http_response>;

    // ========================================================================
    // Reads (primary or secondary)
    // ========================================================================

    [[nodiscard]] auto get_blob_properties(const std::string& container,
                                           const std::string& blob) -> result<blob_info>;

    /**
     * @brief HEAD the blob; a 404 is reported as false
     */
    [[nodiscard]] auto exists(const std::string& container, const std::string& blob)
        -> result<bool>;

    /**
     * @brief GET bytes [range.start, range.end), expects 200 or 206
     * @param want_md5 Ask the service for the MD5 of the range
     */
    [[nodiscard]] auto get_blob_range(const std::string& container,
                                      const std::string& blob,
                                      byte_range range,
                                      bool want_md5 = false) -> result<http_response>;

    /**
     * @brief Valid (written) page ranges, half-open
     */
    [[nodiscard]] auto get_page_ranges(const std::string& container,
                                       const std::string& blob,
                                       std::optional<byte_range> range = std::nullopt)
        -> result<std::vector<byte_range>>;

    [[nodiscard]] auto list_blocks(const std::string& container,
                                   const std::string& blob,
                                   block_list_filter filter = block_list_filter::all)
        -> result<std::vector<block_entry>>;

    /**
     * @brief Map a non-success response to an error
     */
    [[nodiscard]] static auto error_from_response(const http_response& response,
                                                  std::string_view operation) -> error;

private:
    blob_service_client(service_endpoint endpoint,
                        std::shared_ptr<blob_http_client> http,
                        retry_options retry,
                        std::unique_ptr<retry_filter_chain> chain);

    [[nodiscard]] auto blob_path(const std::string& container, const std::string& blob) const
        -> std::string;

    /**
     * @brief Send through the chain; any status outside expected is an error
     */
    [[nodiscard]] auto send(http_request request,
                            const std::string& path,
                            std::initializer_list<int> expected,
                            request_location_mode mode,
                            std::string_view operation) -> result<http_response>;

    service_endpoint endpoint_;
    std::shared_ptr<blob_http_client> http_;
    retry_options retry_;
    std::unique_ptr<retry_filter_chain> chain_;
    retry_filter_chain::sleeper sleeper_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_SERVICE_BLOB_SERVICE_CLIENT_H
