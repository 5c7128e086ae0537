/**
 * @file transfer_options.cpp
 * @brief Validation of transfer options
 */

#include <kcenon/blob_transfer/config/transfer_options.h>

#include <algorithm>
#include <cctype>

namespace kcenon::blob_transfer {

namespace {

auto is_valid_prefix(const std::string& prefix) -> bool {
    if (prefix.empty() || prefix.size() > blob_constants::max_block_id_prefix) {
        return false;
    }
    return std::all_of(prefix.begin(), prefix.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
    });
}

}  // namespace

auto transfer_options::validate(blob_kind kind, std::optional<uint64_t> total_length) const
    -> result<void> {
    if (chunk_size == 0) {
        return unexpected{error{error_code::invalid_chunk_size, "chunk size must be positive"}};
    }

    const auto limit = kind == blob_kind::block ? blob_constants::max_block_size
                                                : blob_constants::max_update_page_size;
    if (chunk_size > limit) {
        return unexpected{error{error_code::chunk_too_large,
            "chunk size " + std::to_string(chunk_size) + " exceeds maximum " +
            std::to_string(limit)}};
    }

    if (concurrency == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "concurrency must be at least 1"}};
    }

    if (range_size == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "range size must be positive"}};
    }

    if (kind == blob_kind::page) {
        if (chunk_size % blob_constants::page_size != 0) {
            return unexpected{error{error_code::invalid_page_alignment,
                "page chunk size must be a multiple of 512"}};
        }
        if (total_length.has_value() && *total_length % blob_constants::page_size != 0) {
            return unexpected{error{error_code::invalid_page_alignment,
                "page blob length must be a multiple of 512"}};
        }
    }

    if (id_prefix.has_value() && !is_valid_prefix(*id_prefix)) {
        return unexpected{error{error_code::invalid_block_id,
            "invalid block id prefix: " + *id_prefix}};
    }

    if (execution_budget.has_value() && execution_budget->count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "execution budget must be positive"}};
    }

    if (content_digest_override.has_value() && content_digest_override->empty()) {
        return unexpected{error{error_code::invalid_argument,
            "content digest override is empty"}};
    }

    return {};
}

}  // namespace kcenon::blob_transfer
