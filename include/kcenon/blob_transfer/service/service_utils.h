/**
 * @file service_utils.h
 * @brief Encoding, time and XML helpers for blob service requests
 */

#ifndef KCENON_BLOB_TRANSFER_SERVICE_SERVICE_UTILS_H
#define KCENON_BLOB_TRANSFER_SERVICE_SERVICE_UTILS_H

#include <optional>
#include <string>
#include <vector>

namespace kcenon::blob_transfer::service_utils {

/**
 * @brief Percent-encode a string for use in a URL
 * @param value String to encode
 * @param encode_slash Whether '/' is encoded too
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Current time formatted for the x-ms-date header
 */
auto get_rfc1123_time() -> std::string;

/**
 * @brief Extract the first element value with the given tag
 * @return Element value if found, nullopt otherwise
 */
auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string>;

/**
 * @brief Extract every element value with the given tag, in document order
 */
auto extract_xml_elements(const std::string& xml,
                          const std::string& tag) -> std::vector<std::string>;

/**
 * @brief Escape the five XML special characters
 */
auto xml_escape(const std::string& value) -> std::string;

}  // namespace kcenon::blob_transfer::service_utils

#endif  // KCENON_BLOB_TRANSFER_SERVICE_SERVICE_UTILS_H
