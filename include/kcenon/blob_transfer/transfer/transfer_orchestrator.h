/**
 * @file transfer_orchestrator.h
 * @brief Chunked upload of one blob: produce, dispatch, drain, commit
 *
 * One orchestrator drives one upload. It reads the source through a
 * chunk_producer, runs each chunk as a chunk_operation on a
 * batch_scheduler with bounded concurrency, and once every operation has
 * drained commits the block list (block blobs) or finalizes the blob
 * properties (page blobs). The outcome is reported through exactly one
 * callback invocation.
 *
 * @code
 * transfer_request request;
 * request.target = {"backups", "db.bak"};
 * request.source = file_source::open("db.bak").value();
 * request.options = transfer_options_builder().with_concurrency(4).build();
 *
 * transfer_orchestrator upload(std::move(request), service);
 * upload.run([](const error& err, const auto& result, const auto& response) {
 *     ...
 * });
 * @endcode
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_TRANSFER_ORCHESTRATOR_H
#define KCENON_BLOB_TRANSFER_TRANSFER_TRANSFER_ORCHESTRATOR_H

#include <kcenon/blob_transfer/adapters/worker_pool_adapter.h>
#include <kcenon/blob_transfer/config/transfer_options.h>
#include <kcenon/blob_transfer/core/chunk_producer.h>
#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/service/blob_service_client.h>
#include <kcenon/blob_transfer/transfer/chunk_operation.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::blob_transfer {

enum class transfer_phase : uint8_t {
    idle,
    filling,
    dispatching,
    draining,
    committing,
    done,
    failed,
};

[[nodiscard]] constexpr auto to_string(transfer_phase phase) -> std::string_view {
    switch (phase) {
        case transfer_phase::idle: return "idle";
        case transfer_phase::filling: return "filling";
        case transfer_phase::dispatching: return "dispatching";
        case transfer_phase::draining: return "draining";
        case transfer_phase::committing: return "committing";
        case transfer_phase::done: return "done";
        case transfer_phase::failed: return "failed";
    }
    return "unknown";
}

/**
 * @brief What to upload and where
 */
struct transfer_request {
    blob_target target;
    blob_kind kind = blob_kind::block;
    std::unique_ptr<chunk_source> source;

    /// Declared length; required for page blobs unless the source knows it
    std::optional<uint64_t> total_length;

    transfer_options options;
};

/**
 * @brief Outcome of a successful upload
 */
struct transfer_result {
    std::string blob_name;
    blob_kind kind = blob_kind::block;
    uint64_t total_bytes = 0;

    /// Committed ids in sequence order (block blobs)
    std::vector<std::string> committed_block_ids;

    /// Content-MD5 stored with the blob, or the computed digest if none was stored
    std::optional<std::string> content_md5;

    std::optional<std::string> etag;
    uint64_t chunk_count = 0;
    uint64_t skipped_zero_pages = 0;
    uint64_t resumed_blocks = 0;
};

/**
 * @brief Terminal callback: (error, result, raw commit/finalize response)
 *
 * On success the error is default constructed (error_code::success).
 */
using transfer_callback = std::function<void(const error&,
                                             const std::optional<transfer_result>&,
                                             const std::optional<http_response>&)>;

class transfer_orchestrator {
public:
    /**
     * @param request Upload description (source ownership moves in)
     * @param service Client used for every call; must outlive the orchestrator
     * @param pool Worker pool; created by worker_pool_factory when null
     */
    transfer_orchestrator(transfer_request request,
                          blob_service_client& service,
                          std::shared_ptr<adapters::worker_pool_interface> pool = nullptr);
    ~transfer_orchestrator();

    transfer_orchestrator(const transfer_orchestrator&) = delete;
    auto operator=(const transfer_orchestrator&) -> transfer_orchestrator& = delete;

    /**
     * @brief Run the upload on the calling thread
     *
     * The callback fires exactly once. A second call reports invalid_state.
     */
    void run(const transfer_callback& callback);

    /**
     * @brief Run the upload and return its result
     */
    [[nodiscard]] auto run() -> result<transfer_result>;

    /**
     * @brief Run the upload on its own thread
     *
     * The orchestrator must outlive the returned future.
     */
    [[nodiscard]] auto run_async(transfer_callback callback) -> std::future<void>;

    [[nodiscard]] auto phase() const noexcept -> transfer_phase { return phase_.load(); }

    /**
     * @brief Ids staged by the last run, for resuming a failed block upload
     */
    [[nodiscard]] auto last_staged_blocks() const -> std::set<std::string>;

    [[nodiscard]] auto bytes_acknowledged() const noexcept -> uint64_t {
        return bytes_acknowledged_.load();
    }

    /// Highest number of operations in flight during the run
    [[nodiscard]] auto peak_in_flight() const noexcept -> std::size_t {
        return peak_in_flight_.load();
    }

    /// Highest number of arena buffers leased at once during the run
    [[nodiscard]] auto peak_buffers() const noexcept -> std::size_t {
        return peak_buffers_.load();
    }

    [[nodiscard]] auto transfer_id() const -> const std::string& { return transfer_id_; }

private:
    struct progress_state;

    void set_phase(transfer_phase phase);
    auto prepare() -> result<void>;
    auto dispatch_all(blob_service_client& client, progress_state& state)
        -> std::optional<error>;
    auto commit(blob_service_client& client, progress_state& state)
        -> std::pair<result<http_response>, transfer_result>;
    auto log_context() const -> transfer_log_context;

    transfer_request request_;
    blob_service_client& service_;
    std::shared_ptr<adapters::worker_pool_interface> pool_;
    std::string transfer_id_;
    std::string prefix_;

    std::unique_ptr<buffer_allocator> arena_;
    std::unique_ptr<chunk_producer> producer_;

    std::atomic<transfer_phase> phase_{transfer_phase::idle};
    std::atomic<bool> started_{false};
    std::atomic<uint64_t> bytes_acknowledged_{0};
    std::atomic<std::size_t> peak_in_flight_{0};
    std::atomic<std::size_t> peak_buffers_{0};

    mutable std::mutex staged_mutex_;
    std::set<std::string> last_staged_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_TRANSFER_ORCHESTRATOR_H
