/**
 * @file http_types.h
 * @brief Request and response types at the network boundary
 */

#ifndef KCENON_BLOB_TRANSFER_SERVICE_HTTP_TYPES_H
#define KCENON_BLOB_TRANSFER_SERVICE_HTTP_TYPES_H

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::blob_transfer {

enum class http_method : uint8_t {
    get,
    put,
    head,
    del,
};

[[nodiscard]] constexpr auto to_string(http_method method) -> std::string_view {
    switch (method) {
        case http_method::get: return "GET";
        case http_method::put: return "PUT";
        case http_method::head: return "HEAD";
        case http_method::del: return "DELETE";
    }
    return "UNKNOWN";
}

namespace detail {

[[nodiscard]] inline auto iequals(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

}  // namespace detail

/**
 * @brief One HTTP request
 *
 * The body is a view; the caller keeps the bytes alive until send()
 * returns.
 */
struct http_request {
    http_method method = http_method::get;

    /// Absolute URL without query string
    std::string url;

    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::span<const std::byte> body;

    /// Zero means the client default
    std::chrono::milliseconds timeout{0};

    /**
     * @brief URL with the query map appended, values URL-encoded
     */
    [[nodiscard]] auto full_url() const -> std::string;
};

/**
 * @brief One HTTP response
 */
struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(std::string_view key) const -> std::optional<std::string> {
        for (const auto& [k, v] : headers) {
            if (detail::iequals(k, key)) {
                return v;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_SERVICE_HTTP_TYPES_H
