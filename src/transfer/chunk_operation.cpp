/**
 * @file chunk_operation.cpp
 * @brief Implementation of single-chunk uploads
 */

#include <kcenon/blob_transfer/transfer/chunk_operation.h>

#include <kcenon/blob_transfer/config/transfer_options.h>
#include <kcenon/blob_transfer/core/checksum.h>
#include <kcenon/blob_transfer/core/logging.h>

#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::blob_transfer {

// ============================================================================
// block_id
// ============================================================================

auto block_id::make(std::string_view prefix, uint64_t sequence) -> std::string {
    std::ostringstream oss;
    oss << prefix << '-' << std::setfill('0') << std::setw(6) << sequence;
    const auto raw = oss.str();
    return checksum::base64_encode(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(raw.data()), raw.size()));
}

auto block_id::random_prefix() -> std::string {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << gen();
    return oss.str();
}

// ============================================================================
// chunk_operation
// ============================================================================

chunk_operation::chunk_operation(operation_kind kind,
                                 chunk piece,
                                 blob_service_client& client,
                                 blob_target target,
                                 std::string id,
                                 bool transactional_digest,
                                 bool already_staged)
    : kind_(kind),
      piece_(std::move(piece)),
      client_(client),
      target_(std::move(target)),
      id_(std::move(id)),
      transactional_digest_(transactional_digest),
      already_staged_(already_staged),
      sequence_(piece_.sequence),
      range_(piece_.range) {}

auto chunk_operation::describe() const -> std::string {
    return std::string(to_string(kind_)) + " #" + std::to_string(sequence_) + " [" +
           std::to_string(range_.start) + ", " + std::to_string(range_.end) + ")";
}

auto chunk_operation::execute() -> result<void> {
    auto outcome = send();
    piece_.buffer.release();
    return outcome;
}

auto chunk_operation::send() -> result<void> {
    if (kind_ == operation_kind::block_upload && already_staged_) {
        BT_LOG_TRACE(log_category::orchestrator, describe() + " already staged");
        return {};
    }

    if (kind_ == operation_kind::page_write && checksum::is_all_zero(piece_.data())) {
        zero_skipped_ = true;
        BT_LOG_TRACE(log_category::orchestrator, describe() + " is all zeros, skipped");
        return {};
    }

    if (transactional_digest_ &&
        piece_.size() <= blob_constants::max_transactional_digest_size) {
        auto digest = checksum::md5_base64(piece_.data());
        if (!digest) {
            return unexpected{digest.error()};
        }
        piece_.content_md5 = digest.value();
    }

    result<http_response> response = kind_ == operation_kind::block_upload
        ? client_.put_block(target_.container, target_.blob, id_, piece_.data(),
                            piece_.content_md5)
        : client_.put_page(target_.container, target_.blob, range_, piece_.data(),
                           piece_.content_md5);
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

}  // namespace kcenon::blob_transfer
