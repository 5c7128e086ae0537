/**
 * @file chunk_producer.h
 * @brief Lazy, ordered chunking of a transfer source
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_CHUNK_PRODUCER_H
#define KCENON_BLOB_TRANSFER_CORE_CHUNK_PRODUCER_H

#include <kcenon/blob_transfer/core/buffer_allocator.h>
#include <kcenon/blob_transfer/core/checksum.h>
#include <kcenon/blob_transfer/core/types.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief One emitted slice of the source
 *
 * Owns its buffer lease; moving the chunk moves buffer ownership.
 */
struct chunk {
    uint64_t sequence = 0;
    byte_range range;
    buffer_lease buffer;

    /// Base64 MD5 of this chunk, filled when a transactional digest is used
    std::optional<std::string> content_md5;

    [[nodiscard]] auto data() const noexcept -> std::span<const std::byte> {
        return buffer.data();
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return buffer.size(); }
};

/**
 * @brief Byte source feeding a chunk_producer
 */
class chunk_source {
public:
    virtual ~chunk_source() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Bytes read; 0 means end of source
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    /**
     * @brief True once no further byte can be read
     */
    [[nodiscard]] virtual auto exhausted() -> bool = 0;

    /**
     * @brief Total length, when known up front
     */
    [[nodiscard]] virtual auto length() const -> std::optional<uint64_t> = 0;

    [[nodiscard]] virtual auto name() const -> std::string = 0;
};

/**
 * @brief Source over a caller-owned std::istream
 *
 * The stream must outlive the source.
 */
class stream_source : public chunk_source {
public:
    explicit stream_source(std::istream& stream,
                           std::optional<uint64_t> length = std::nullopt,
                           std::string name = "stream");

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto exhausted() -> bool override;
    [[nodiscard]] auto length() const -> std::optional<uint64_t> override { return length_; }
    [[nodiscard]] auto name() const -> std::string override { return name_; }

private:
    std::istream& stream_;
    std::optional<uint64_t> length_;
    std::string name_;
};

/**
 * @brief Source over a local file
 */
class file_source : public chunk_source {
    /// Only open() can name this, so only open() can construct
    struct open_tag {
        explicit open_tag() = default;
    };

public:
    /**
     * @brief Open a file for reading
     * @return Source or error if the file is missing or unreadable
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::unique_ptr<file_source>>;

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto exhausted() -> bool override;
    [[nodiscard]] auto length() const -> std::optional<uint64_t> override { return size_; }
    [[nodiscard]] auto name() const -> std::string override { return path_.string(); }

    file_source(open_tag, std::filesystem::path path, std::ifstream file, uint64_t size);

private:

    std::filesystem::path path_;
    std::ifstream file_;
    uint64_t size_;
    uint64_t offset_ = 0;
};

/**
 * @brief Source over an in-memory byte vector
 */
class memory_source : public chunk_source {
public:
    explicit memory_source(std::vector<std::byte> data, std::string name = "memory");

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto exhausted() -> bool override { return offset_ >= data_.size(); }
    [[nodiscard]] auto length() const -> std::optional<uint64_t> override {
        return data_.size();
    }
    [[nodiscard]] auto name() const -> std::string override { return name_; }

private:
    std::vector<std::byte> data_;
    std::size_t offset_ = 0;
    std::string name_;
};

/**
 * @brief Turns a source into a finite, ordered sequence of chunks
 *
 * Chunks are emitted in strict byte order with sequence numbers 0, 1, ...
 * and each one fills a buffer leased from the allocator, so next() blocks
 * while the arena is exhausted. A running MD5 covers every emitted byte in
 * emission order.
 *
 * The sequence is not restartable. pause() makes the next call to next()
 * wait until resume() or cancel(); both may be called from any thread.
 */
class chunk_producer {
public:
    /**
     * @param source Byte source (ownership taken)
     * @param allocator Arena supplying chunk buffers; must outlive the producer
     * @param chunk_size Maximum bytes per chunk
     * @param total_length Declared length; overrides the source's own length
     */
    chunk_producer(std::unique_ptr<chunk_source> source,
                   buffer_allocator& allocator,
                   std::size_t chunk_size,
                   std::optional<uint64_t> total_length = std::nullopt);

    chunk_producer(const chunk_producer&) = delete;
    auto operator=(const chunk_producer&) -> chunk_producer& = delete;

    /**
     * @brief Check if another chunk will be emitted
     */
    [[nodiscard]] auto has_next() -> bool;

    /**
     * @brief Emit the next chunk
     * @return Chunk, or error on read failure, cancellation or end of sequence
     */
    [[nodiscard]] auto next() -> result<chunk>;

    void pause();
    void resume();

    /**
     * @brief Wake a paused producer and end the sequence
     */
    void cancel();

    [[nodiscard]] auto is_paused() const -> bool;

    /**
     * @brief Base64 MD5 of every emitted byte
     * @return Digest, or error if the sequence has not ended
     */
    [[nodiscard]] auto digest_base64() -> result<std::string>;

    [[nodiscard]] auto bytes_emitted() const noexcept -> uint64_t { return bytes_emitted_; }
    [[nodiscard]] auto chunks_emitted() const noexcept -> uint64_t { return chunks_emitted_; }
    [[nodiscard]] auto is_finished() const noexcept -> bool { return finished_; }
    [[nodiscard]] auto total_length() const noexcept -> std::optional<uint64_t> {
        return total_length_;
    }
    [[nodiscard]] auto chunk_size() const noexcept -> std::size_t { return chunk_size_; }

private:
    auto fill(buffer_lease& lease, std::size_t want) -> result<std::size_t>;
    auto fail(error err) -> unexpected;

    std::unique_ptr<chunk_source> source_;
    buffer_allocator& allocator_;
    std::size_t chunk_size_;
    std::optional<uint64_t> total_length_;

    md5_accumulator digest_;
    std::optional<std::string> digest_value_;

    uint64_t bytes_emitted_ = 0;
    uint64_t chunks_emitted_ = 0;
    bool finished_ = false;
    bool failed_ = false;

    mutable std::mutex pause_mutex_;
    std::condition_variable pause_cv_;
    bool paused_ = false;
    std::atomic<bool> cancelled_{false};
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_CHUNK_PRODUCER_H
