/**
 * @file range_downloader.h
 * @brief Parallel ranged download with integrity checks
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_RANGE_DOWNLOADER_H
#define KCENON_BLOB_TRANSFER_TRANSFER_RANGE_DOWNLOADER_H

#include <kcenon/blob_transfer/adapters/worker_pool_adapter.h>
#include <kcenon/blob_transfer/config/transfer_options.h>
#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/service/blob_service_client.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Destination of downloaded bytes
 *
 * write() is positional and may be called from several workers at once,
 * in any offset order.
 */
class range_sink {
public:
    virtual ~range_sink() = default;

    /**
     * @brief Size the destination before any write
     */
    [[nodiscard]] virtual auto prepare(uint64_t length) -> result<void> = 0;

    [[nodiscard]] virtual auto write(uint64_t offset, std::span<const std::byte> data)
        -> result<void> = 0;

    /**
     * @brief Flush after the last write
     */
    [[nodiscard]] virtual auto finish() -> result<void> { return {}; }

    /**
     * @brief Discard whatever was written; called once on failure
     */
    virtual void abort() {}
};

/**
 * @brief Collects the blob in memory
 */
class memory_sink : public range_sink {
public:
    [[nodiscard]] auto prepare(uint64_t length) -> result<void> override;
    [[nodiscard]] auto write(uint64_t offset, std::span<const std::byte> data)
        -> result<void> override;
    void abort() override;

    [[nodiscard]] auto data() const -> const std::vector<std::byte>& { return data_; }

private:
    std::mutex mutex_;
    std::vector<std::byte> data_;
};

/**
 * @brief Writes the blob to a local file
 *
 * The file is created (or truncated) by prepare() and removed by abort().
 */
class file_sink : public range_sink {
public:
    explicit file_sink(std::filesystem::path path);
    ~file_sink() override;

    [[nodiscard]] auto prepare(uint64_t length) -> result<void> override;
    [[nodiscard]] auto write(uint64_t offset, std::span<const std::byte> data)
        -> result<void> override;
    [[nodiscard]] auto finish() -> result<void> override;
    void abort() override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
    std::fstream file_;
};

/**
 * @brief One planned piece of a download
 */
struct download_segment {
    byte_range range;

    /// Not backed by written pages; filled with zeros locally
    bool zero = false;
};

/**
 * @brief Split [0, length) into fetch ranges
 *
 * Without page ranges the blob is cut into pieces of at most range_size.
 * With page ranges, valid ranges separated by less than
 * blob_constants::min_write_page_size are merged, the merged ranges are
 * cut at range_size, and everything between them becomes zero segments.
 *
 * @param length Blob length
 * @param range_size Maximum fetch size
 * @param valid_pages Sorted half-open valid page ranges, if sparse
 */
[[nodiscard]] auto plan_download(uint64_t length,
                                 std::size_t range_size,
                                 const std::optional<std::vector<byte_range>>& valid_pages)
    -> std::vector<download_segment>;

/**
 * @brief Outcome of a successful download
 */
struct download_result {
    std::string blob_name;
    blob_kind kind = blob_kind::block;
    uint64_t total_bytes = 0;
    uint64_t fetched_ranges = 0;
    uint64_t zero_ranges = 0;

    /// Content-MD5 stored with the blob, if any
    std::optional<std::string> stored_md5;

    /// MD5 of the assembled bytes, when it was computed
    std::optional<std::string> computed_md5;

    std::optional<std::string> etag;
};

/**
 * @brief Downloads a blob in parallel ranges
 *
 * @code
 * range_downloader downloader(service);
 * file_sink sink("db.bak");
 * auto result = downloader.download("backups", "db.bak", sink,
 *                                   transfer_options_builder().with_concurrency(8).build());
 * @endcode
 */
class range_downloader {
public:
    /**
     * @param service Client used for every call; must outlive the downloader
     * @param pool Worker pool; created by worker_pool_factory when null
     */
    explicit range_downloader(blob_service_client& service,
                              std::shared_ptr<adapters::worker_pool_interface> pool = nullptr);

    /**
     * @brief Download a blob into a sink
     *
     * Range bodies must match the requested length. With
     * use_transactional_digest each range of at most 4 MiB is fetched with
     * its MD5, which must be present and match. Unless
     * disable_digest_validation is set, the whole blob must match its
     * stored Content-MD5. The sink is aborted on any failure.
     */
    [[nodiscard]] auto download(const std::string& container,
                                const std::string& blob,
                                range_sink& sink,
                                const transfer_options& options = {})
        -> result<download_result>;

    /// Highest number of range fetches in flight during the last download
    [[nodiscard]] auto peak_in_flight() const noexcept -> std::size_t { return peak_in_flight_; }

    /**
     * @brief Most bytes held out of order for the whole-blob digest
     *        during the last download
     *
     * Ranges are not fetched more than concurrency * range_size bytes past
     * the hashed prefix, which bounds this value.
     */
    [[nodiscard]] auto peak_held_bytes() const noexcept -> uint64_t { return peak_held_bytes_; }

private:
    auto fetch_all(blob_service_client& client,
                   const std::string& container,
                   const std::string& blob,
                   range_sink& sink,
                   const transfer_options& options,
                   const std::vector<download_segment>& segments,
                   uint64_t length,
                   bool hash_whole,
                   download_result& summary) -> result<void>;

    blob_service_client& service_;
    std::shared_ptr<adapters::worker_pool_interface> pool_;
    std::size_t peak_in_flight_ = 0;
    uint64_t peak_held_bytes_ = 0;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_RANGE_DOWNLOADER_H
