/**
 * @file types.h
 * @brief Core type definitions for blob_transfer
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_TYPES_H
#define KCENON_BLOB_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::blob_transfer {

/**
 * @brief Error codes for blob transfer operations
 *
 * Ranges map to error categories (see error_codes.h):
 * - -100 to -119: Validation
 * - -120 to -139: Source / sink I/O
 * - -140 to -159: Transport
 * - -160 to -179: Service
 * - -180 to -199: Integrity
 * - -200 to -209: Retry
 * - -210 to -229: Aggregate / internal
 */
enum class error_code {
    success = 0,

    // Validation errors (-100 to -119)
    invalid_argument = -100,
    invalid_chunk_size = -101,
    invalid_range = -102,
    invalid_block_id = -103,
    invalid_configuration = -104,
    chunk_too_large = -105,
    invalid_page_alignment = -106,

    // Source / sink errors (-120 to -139)
    source_read_error = -120,
    file_not_found = -121,
    file_access_denied = -122,
    file_write_error = -123,

    // Transport errors (-140 to -159)
    connection_failed = -140,
    request_timeout = -141,
    http_client_unavailable = -142,

    // Service errors (-160 to -179)
    service_error = -160,
    blob_not_found = -161,

    // Integrity errors (-180 to -199)
    content_length_mismatch = -180,
    content_md5_mismatch = -181,
    md5_not_present = -182,

    // Retry errors (-200 to -209)
    execution_timeout = -200,
    retries_exhausted = -201,

    // Aggregate / internal errors (-210 to -229)
    transfer_aborted = -210,
    invalid_state = -211,
    internal_error = -212,
    not_initialized = -213,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_range:
            return "invalid range";
        case error_code::invalid_block_id:
            return "invalid block id";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::chunk_too_large:
            return "chunk too large";
        case error_code::invalid_page_alignment:
            return "invalid page alignment";
        case error_code::source_read_error:
            return "source read error";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_write_error:
            return "file write error";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::request_timeout:
            return "request timeout";
        case error_code::http_client_unavailable:
            return "http client unavailable";
        case error_code::service_error:
            return "service error";
        case error_code::blob_not_found:
            return "blob not found";
        case error_code::content_length_mismatch:
            return "content length mismatch";
        case error_code::content_md5_mismatch:
            return "content md5 mismatch";
        case error_code::md5_not_present:
            return "md5 not present";
        case error_code::execution_timeout:
            return "maximum execution time exceeded";
        case error_code::retries_exhausted:
            return "retries exhausted";
        case error_code::transfer_aborted:
            return "transfer aborted";
        case error_code::invalid_state:
            return "invalid state";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code, message and optional service details
 *
 * http_status is 0 when no HTTP response was received (transport failure or
 * local error). service_code holds the machine-readable code from the
 * service's error body, e.g. "Md5Mismatch".
 */
struct error {
    error_code code;
    std::string message;
    int http_status = 0;
    std::string service_code;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, int status, std::string svc_code = {})
        : code(c), message(std::move(msg)), http_status(status),
          service_code(std::move(svc_code)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Kind of remote blob a transfer targets
 */
enum class blob_kind : uint8_t {
    block,  ///< Block-oriented: staged blocks committed by id list
    page,   ///< Page-oriented: 512-byte aligned random-access ranges
};

[[nodiscard]] constexpr auto to_string(blob_kind kind) -> const char* {
    return kind == blob_kind::block ? "BlockBlob" : "PageBlob";
}

/**
 * @brief Half-open byte range [start, end)
 */
struct byte_range {
    uint64_t start = 0;
    uint64_t end = 0;

    [[nodiscard]] auto size() const noexcept -> uint64_t { return end - start; }
    [[nodiscard]] auto empty() const noexcept -> bool { return end <= start; }

    /// Inclusive last byte, as used by the x-ms-range header
    [[nodiscard]] auto last() const noexcept -> uint64_t { return end - 1; }

    [[nodiscard]] auto operator==(const byte_range& other) const -> bool = default;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_TYPES_H
