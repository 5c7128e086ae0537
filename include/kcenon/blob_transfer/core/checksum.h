/**
 * @file checksum.h
 * @brief Content digest utilities for integrity verification
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_CHECKSUM_H
#define KCENON_BLOB_TRANSFER_CORE_CHECKSUM_H

#include <kcenon/blob_transfer/core/types.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Incremental MD5 digest
 *
 * Bytes must be fed in content order; the digest of a transfer is defined
 * over the source bytes, not over network completion order.
 *
 * @note Not thread-safe. Owned by a single chunk_producer.
 */
class md5_accumulator {
public:
    static constexpr std::size_t digest_size = 16;

    md5_accumulator();
    ~md5_accumulator();

    md5_accumulator(md5_accumulator&&) noexcept;
    auto operator=(md5_accumulator&&) noexcept -> md5_accumulator&;
    md5_accumulator(const md5_accumulator&) = delete;
    auto operator=(const md5_accumulator&) -> md5_accumulator& = delete;

    /**
     * @brief Feed bytes into the digest
     * @return Error if called after finalize() or if the hash backend fails
     */
    [[nodiscard]] auto update(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Finish the digest
     *
     * Subsequent calls return the same digest.
     */
    [[nodiscard]] auto finalize() -> result<std::array<uint8_t, digest_size>>;

    /**
     * @brief Finish the digest and return it base64 encoded (Content-MD5 form)
     */
    [[nodiscard]] auto finalize_base64() -> result<std::string>;

    [[nodiscard]] auto bytes_hashed() const noexcept -> uint64_t;

    [[nodiscard]] auto is_finalized() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief One-shot digest helpers
 */
class checksum {
public:
    /**
     * @brief MD5 of data, base64 encoded as used by Content-MD5
     */
    [[nodiscard]] static auto md5_base64(std::span<const std::byte> data)
        -> result<std::string>;

    /**
     * @brief MD5 of a whole file, base64 encoded
     */
    [[nodiscard]] static auto md5_file_base64(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief True if every byte of data is zero
     */
    [[nodiscard]] static auto is_all_zero(std::span<const std::byte> data) noexcept -> bool;

    [[nodiscard]] static auto base64_encode(std::span<const uint8_t> data) -> std::string;

    [[nodiscard]] static auto base64_decode(const std::string& encoded) -> std::vector<uint8_t>;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_CHECKSUM_H
