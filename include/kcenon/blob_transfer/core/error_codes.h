/**
 * @file error_codes.h
 * @brief Error classification for blob_transfer
 *
 * Maps error codes onto the error taxonomy (validation, source, transport,
 * service, integrity, retry, aggregate) and decides which failures a retry
 * policy may repeat.
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_ERROR_CODES_H
#define KCENON_BLOB_TRANSFER_CORE_ERROR_CODES_H

#include <kcenon/blob_transfer/core/types.h>

#include <cstdint>
#include <string_view>

namespace kcenon::blob_transfer {

/**
 * @brief Error taxonomy
 */
enum class error_category : uint8_t {
    none,
    validation,
    source,
    transport,
    service,
    integrity,
    retry,
    aggregate,
};

[[nodiscard]] constexpr auto to_string(error_category category) -> std::string_view {
    switch (category) {
        case error_category::none: return "none";
        case error_category::validation: return "validation";
        case error_category::source: return "source";
        case error_category::transport: return "transport";
        case error_category::service: return "service";
        case error_category::integrity: return "integrity";
        case error_category::retry: return "retry";
        case error_category::aggregate: return "aggregate";
        default: return "unknown";
    }
}

/**
 * @brief Check if error code is in validation error range
 */
[[nodiscard]] constexpr auto is_validation_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -100 && v >= -119;
}

/**
 * @brief Check if error code is in source / sink I/O error range
 */
[[nodiscard]] constexpr auto is_source_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -120 && v >= -139;
}

/**
 * @brief Check if error code is in transport error range
 */
[[nodiscard]] constexpr auto is_transport_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -140 && v >= -159;
}

/**
 * @brief Check if error code is in service error range
 */
[[nodiscard]] constexpr auto is_service_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -160 && v >= -179;
}

/**
 * @brief Check if error code is in integrity error range
 */
[[nodiscard]] constexpr auto is_integrity_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -180 && v >= -199;
}

/**
 * @brief Check if error code is in retry error range
 */
[[nodiscard]] constexpr auto is_retry_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -200 && v >= -209;
}

[[nodiscard]] constexpr auto category_of(error_code code) noexcept -> error_category {
    if (code == error_code::success) return error_category::none;
    if (is_validation_error(code)) return error_category::validation;
    if (is_source_error(code)) return error_category::source;
    if (is_transport_error(code)) return error_category::transport;
    if (is_service_error(code)) return error_category::service;
    if (is_integrity_error(code)) return error_category::integrity;
    if (is_retry_error(code)) return error_category::retry;
    return error_category::aggregate;
}

/**
 * @brief Check if an HTTP status may be retried
 *
 * 3xx and 4xx are final except 408 (request timeout); 501 (not implemented)
 * and 505 (version not supported) are final; every other 5xx is transient.
 */
[[nodiscard]] constexpr auto is_retryable_status(int status) noexcept -> bool {
    if (status == 408) return true;
    if (status >= 300 && status < 500) return false;
    if (status == 501 || status == 505) return false;
    return status >= 500 && status < 600;
}

/**
 * @brief Check if an error may be retried by a retry policy
 */
[[nodiscard]] inline auto is_retryable(const error& err) noexcept -> bool {
    switch (category_of(err.code)) {
        case error_category::transport:
            if (err.code == error_code::http_client_unavailable) return false;
            return err.http_status == 0 || is_retryable_status(err.http_status);
        case error_category::service:
            return is_retryable_status(err.http_status);
        default:
            return false;
    }
}

/**
 * @brief Map a non-success HTTP response to an error code
 * @param status HTTP status code
 * @param service_code Error code parsed from the response body
 */
[[nodiscard]] inline auto error_code_from_response(
    int status, std::string_view service_code) noexcept -> error_code {
    if (service_code == "Md5Mismatch" || service_code == "InvalidMd5") {
        return error_code::content_md5_mismatch;
    }
    if (status == 404) return error_code::blob_not_found;
    if (status == 408) return error_code::request_timeout;
    return error_code::service_error;
}

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_ERROR_CODES_H
