/**
 * @file chunk_operation.h
 * @brief Upload of one chunk as a staged block or a page write
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_CHUNK_OPERATION_H
#define KCENON_BLOB_TRANSFER_TRANSFER_CHUNK_OPERATION_H

#include <kcenon/blob_transfer/core/chunk_producer.h>
#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/service/blob_service_client.h>
#include <kcenon/blob_transfer/transfer/batch_scheduler.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace kcenon::blob_transfer {

enum class operation_kind : uint8_t {
    block_upload,
    page_write,
};

[[nodiscard]] constexpr auto to_string(operation_kind kind) -> std::string_view {
    return kind == operation_kind::block_upload ? "block_upload" : "page_write";
}

/**
 * @brief Container and blob name of a transfer
 */
struct blob_target {
    std::string container;
    std::string blob;
};

/**
 * @brief Block id helpers
 */
struct block_id {
    /**
     * @brief Wire form of the id for a sequence number
     * @return base64("<prefix>-<sequence zero-padded to 6>")
     */
    [[nodiscard]] static auto make(std::string_view prefix, uint64_t sequence) -> std::string;

    /**
     * @brief Random 16-character hex prefix
     */
    [[nodiscard]] static auto random_prefix() -> std::string;
};

/**
 * @brief Moves one chunk to the service
 *
 * Page chunks whose bytes are all zero complete without a network call.
 * Block chunks whose id is already staged (resume) complete without a
 * network call too. The buffer lease is released as soon as the call
 * returns.
 */
class chunk_operation : public batch_operation {
public:
    /**
     * @param kind Block upload or page write
     * @param piece Chunk to upload (ownership of its buffer moves in)
     * @param client Service client carrying the transfer's retry chain
     * @param target Destination blob
     * @param id Wire block id (block uploads only)
     * @param transactional_digest Send a Content-MD5 with the chunk
     * @param already_staged Block is known to be staged; skip the upload
     */
    chunk_operation(operation_kind kind,
                    chunk piece,
                    blob_service_client& client,
                    blob_target target,
                    std::string id,
                    bool transactional_digest,
                    bool already_staged = false);

    [[nodiscard]] auto execute() -> result<void> override;
    [[nodiscard]] auto describe() const -> std::string override;

    [[nodiscard]] auto kind() const noexcept -> operation_kind { return kind_; }
    [[nodiscard]] auto sequence() const noexcept -> uint64_t { return sequence_; }
    [[nodiscard]] auto range() const noexcept -> byte_range { return range_; }
    [[nodiscard]] auto id() const noexcept -> const std::string& { return id_; }

    /// True if a page chunk was all zeros and no write was sent
    [[nodiscard]] auto zero_skipped() const noexcept -> bool { return zero_skipped_; }

    /// True if a block upload was skipped because the block was staged
    [[nodiscard]] auto resumed() const noexcept -> bool { return already_staged_; }

    /// Base64 MD5 sent with the chunk, if any
    [[nodiscard]] auto content_md5() const -> const std::optional<std::string>& {
        return piece_.content_md5;
    }

private:
    auto send() -> result<void>;

    operation_kind kind_;
    chunk piece_;
    blob_service_client& client_;
    blob_target target_;
    std::string id_;
    bool transactional_digest_;
    bool already_staged_;

    uint64_t sequence_;
    byte_range range_;
    bool zero_skipped_ = false;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_CHUNK_OPERATION_H
