/**
 * @file location_mode.h
 * @brief Primary / secondary storage location selection
 */

#ifndef KCENON_BLOB_TRANSFER_RETRY_LOCATION_MODE_H
#define KCENON_BLOB_TRANSFER_RETRY_LOCATION_MODE_H

#include <cstdint>
#include <string_view>

namespace kcenon::blob_transfer {

/**
 * @brief Physical endpoint of a geo-replicated account
 */
enum class storage_location : uint8_t {
    primary,
    secondary,
};

/**
 * @brief Client preference for where requests go and how retries alternate
 */
enum class location_mode : uint8_t {
    primary_only,
    primary_then_secondary,
    secondary_only,
    secondary_then_primary,
};

/**
 * @brief Where a given request is allowed to go
 *
 * Writes are primary_only. Reads may use either location.
 */
enum class request_location_mode : uint8_t {
    primary_only,
    secondary_only,
    primary_or_secondary,
};

[[nodiscard]] constexpr auto to_string(storage_location location) -> std::string_view {
    return location == storage_location::primary ? "primary" : "secondary";
}

[[nodiscard]] constexpr auto other_location(storage_location location) -> storage_location {
    return location == storage_location::primary ? storage_location::secondary
                                                 : storage_location::primary;
}

/**
 * @brief Location of the first attempt for a request
 */
[[nodiscard]] constexpr auto initial_location(location_mode mode,
                                              request_location_mode request) -> storage_location {
    if (request == request_location_mode::primary_only) return storage_location::primary;
    if (request == request_location_mode::secondary_only) return storage_location::secondary;
    switch (mode) {
        case location_mode::secondary_only:
        case location_mode::secondary_then_primary:
            return storage_location::secondary;
        default:
            return storage_location::primary;
    }
}

/**
 * @brief True if retries of this request may alternate between locations
 */
[[nodiscard]] constexpr auto can_alternate(location_mode mode,
                                           request_location_mode request) -> bool {
    return request == request_location_mode::primary_or_secondary &&
           (mode == location_mode::primary_then_secondary ||
            mode == location_mode::secondary_then_primary);
}

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_RETRY_LOCATION_MODE_H
