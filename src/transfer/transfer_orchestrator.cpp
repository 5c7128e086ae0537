/**
 * @file transfer_orchestrator.cpp
 * @brief Implementation of the chunked upload driver
 */

#include <kcenon/blob_transfer/transfer/transfer_orchestrator.h>

#include <kcenon/blob_transfer/core/logging.h>
#include <kcenon/blob_transfer/transfer/batch_scheduler.h>

#include <algorithm>
#include <chrono>
#include <map>

namespace kcenon::blob_transfer {

/**
 * @brief Counters shared between the orchestrator thread and completion hooks
 */
struct transfer_orchestrator::progress_state {
    std::mutex mutex;
    std::map<uint64_t, std::string> ids;  ///< sequence -> block id
    std::set<std::string> staged;
    uint64_t skipped_zero_pages = 0;
    uint64_t resumed_blocks = 0;
    uint64_t acknowledged = 0;
    std::optional<uint64_t> total;
    progress_callback on_progress;
};

transfer_orchestrator::transfer_orchestrator(
    transfer_request request,
    blob_service_client& service,
    std::shared_ptr<adapters::worker_pool_interface> pool)
    : request_(std::move(request)),
      service_(service),
      pool_(std::move(pool)),
      transfer_id_(block_id::random_prefix()) {}

transfer_orchestrator::~transfer_orchestrator() = default;

void transfer_orchestrator::set_phase(transfer_phase phase) {
    const auto previous = phase_.exchange(phase);
    if (previous == phase) {
        return;
    }
    auto ctx = log_context();
    ctx.phase = std::string(to_string(phase));
    BT_LOG_DEBUG_CTX(log_category::orchestrator,
                     std::string("Phase ") + std::string(to_string(previous)) + " -> " +
                     std::string(to_string(phase)),
                     ctx);
}

auto transfer_orchestrator::log_context() const -> transfer_log_context {
    transfer_log_context ctx;
    ctx.transfer_id = transfer_id_;
    ctx.blob_name = request_.target.container + "/" + request_.target.blob;
    if (producer_) {
        ctx.total_length = producer_->total_length();
    } else {
        ctx.total_length = request_.total_length;
    }
    ctx.bytes_acknowledged = bytes_acknowledged_.load();
    return ctx;
}

auto transfer_orchestrator::last_staged_blocks() const -> std::set<std::string> {
    std::lock_guard lock(staged_mutex_);
    return last_staged_;
}

auto transfer_orchestrator::prepare() -> result<void> {
    if (!request_.source) {
        return unexpected{error{error_code::invalid_argument, "transfer has no source"}};
    }
    if (request_.target.container.empty() || request_.target.blob.empty()) {
        return unexpected{error{error_code::invalid_argument,
            "container and blob name are required"}};
    }

    const auto total = request_.total_length ? request_.total_length
                                             : request_.source->length();
    if (request_.kind == blob_kind::page && !total) {
        return unexpected{error{error_code::invalid_argument,
            "page blob uploads need a declared length"}};
    }

    auto valid = request_.options.validate(request_.kind, total);
    if (!valid) {
        return valid;
    }

    prefix_ = request_.options.id_prefix.value_or(block_id::random_prefix());

    if (!pool_) {
        pool_ = adapters::worker_pool_factory::create(request_.options.concurrency);
    }

    // One buffer per worker plus the one being filled
    arena_ = std::make_unique<buffer_allocator>(request_.options.chunk_size,
                                                request_.options.concurrency + 1);
    producer_ = std::make_unique<chunk_producer>(std::move(request_.source), *arena_,
                                                 request_.options.chunk_size, total);
    return {};
}

void transfer_orchestrator::run(const transfer_callback& callback) {
    if (started_.exchange(true)) {
        callback(error{error_code::invalid_state, "transfer already started"},
                 std::nullopt, std::nullopt);
        return;
    }

    get_logger().initialize();
    const auto started_at = std::chrono::steady_clock::now();
    auto elapsed_ms = [started_at] {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at).count());
    };

    auto fail = [&](const error& err) {
        set_phase(transfer_phase::failed);
        auto ctx = log_context();
        ctx.duration_ms = elapsed_ms();
        ctx.error_message = err.message;
        if (err.http_status != 0) {
            ctx.http_status = err.http_status;
        }
        BT_LOG_ERROR_CTX(log_category::orchestrator, "Transfer failed", ctx);
        callback(err, std::nullopt, std::nullopt);
    };

    auto ready = prepare();
    if (!ready) {
        fail(ready.error());
        return;
    }

    auto start_ctx = log_context();
    start_ctx.phase = std::string(to_string(phase_.load()));
    BT_LOG_INFO_CTX(log_category::orchestrator,
                    std::string("Starting ") + std::string(to_string(request_.kind)) +
                    " blob upload",
                    start_ctx);

    auto client = service_.with_options(request_.options);

    // Page writes need an existing blob of the final length
    if (request_.kind == blob_kind::page) {
        blob_properties initial;
        initial.content_type = request_.options.content_type;
        const auto length = producer_->total_length().value_or(0);
        BT_LOG_DEBUG(log_category::orchestrator,
                     "Creating page blob of " + std::to_string(length) + " bytes");
        auto created = client.create_page_blob(request_.target.container, request_.target.blob,
                                               length, initial);
        if (!created) {
            arena_->close();
            fail(created.error());
            return;
        }
    }

    progress_state state;
    state.total = producer_->total_length();
    state.on_progress = request_.options.on_progress;

    if (auto batch_error = dispatch_all(client, state)) {
        arena_->close();
        {
            std::lock_guard lock(staged_mutex_);
            last_staged_ = state.staged;
        }
        fail(*batch_error);
        return;
    }

    {
        std::lock_guard lock(staged_mutex_);
        last_staged_ = state.staged;
    }

    set_phase(transfer_phase::committing);
    auto [response, summary] = commit(client, state);
    if (!response) {
        fail(response.error());
        return;
    }

    set_phase(transfer_phase::done);
    auto ctx = log_context();
    ctx.duration_ms = elapsed_ms();
    ctx.http_status = response.value().status_code;
    BT_LOG_INFO_CTX(log_category::orchestrator,
                    "Transfer completed, " + std::to_string(summary.chunk_count) + " chunks",
                    ctx);

    callback(error{}, summary, response.value());
}

auto transfer_orchestrator::dispatch_all(blob_service_client& client, progress_state& state)
    -> std::optional<error> {
    const auto op_kind = request_.kind == blob_kind::block ? operation_kind::block_upload
                                                           : operation_kind::page_write;
    const auto& options = request_.options;

    std::optional<error> producer_error;
    bool producer_failed_first = false;
    {
        batch_scheduler scheduler(options.concurrency, pool_);
        scheduler.on_drain([this] { producer_->resume(); });

        set_phase(transfer_phase::filling);
        while (!scheduler.failed() && producer_->has_next()) {
            auto piece = producer_->next();
            if (!piece) {
                // Unknown-length streams report the end through next()
                if (producer_->is_finished() &&
                    piece.error().code == error_code::invalid_state) {
                    break;
                }
                producer_error = piece.error();
                // The earlier of the two failures is the one reported
                producer_failed_first = !scheduler.failed();
                break;
            }

            const auto sequence = piece.value().sequence;
            const auto size = piece.value().size();
            std::string id;
            bool staged = false;
            if (op_kind == operation_kind::block_upload) {
                id = block_id::make(prefix_, sequence);
                staged = options.resume_staged_blocks.count(id) > 0;
                std::lock_guard lock(state.mutex);
                state.ids.emplace(sequence, id);
            }

            auto op = std::make_unique<chunk_operation>(op_kind, std::move(piece.value()),
                                                        client, request_.target, id,
                                                        options.use_transactional_digest,
                                                        staged);
            auto* raw = op.get();
            op->set_completion([this, raw, size, &state](const error& err) {
                if (err.code != error_code::success) {
                    return;
                }
                progress_callback notify;
                uint64_t acknowledged = 0;
                {
                    std::lock_guard lock(state.mutex);
                    if (raw->kind() == operation_kind::block_upload) {
                        state.staged.insert(raw->id());
                    }
                    if (raw->zero_skipped()) {
                        ++state.skipped_zero_pages;
                    }
                    if (raw->resumed()) {
                        ++state.resumed_blocks;
                    }
                    state.acknowledged += size;
                    acknowledged = state.acknowledged;
                    notify = state.on_progress;
                }
                bytes_acknowledged_.store(acknowledged);
                if (notify) {
                    notify(acknowledged, state.total.value_or(0));
                }
            });

            set_phase(transfer_phase::dispatching);
            if (scheduler.add_operation(std::move(op))) {
                producer_->pause();
                // A drain between add_operation and pause would be lost
                if (!scheduler.is_full()) {
                    producer_->resume();
                }
            }
            set_phase(transfer_phase::filling);
        }

        set_phase(transfer_phase::draining);
        scheduler.enable_complete();
        auto batch_error = scheduler.wait_for_end();

        peak_in_flight_.store(scheduler.peak_in_flight());
        peak_buffers_.store(arena_->peak_outstanding());

        if (batch_error && !producer_failed_first) {
            return batch_error;
        }
    }
    return producer_error;
}

auto transfer_orchestrator::commit(blob_service_client& client, progress_state& state)
    -> std::pair<result<http_response>, transfer_result> {
    const auto& options = request_.options;

    transfer_result summary;
    summary.blob_name = request_.target.blob;
    summary.kind = request_.kind;
    summary.total_bytes = producer_->bytes_emitted();
    summary.chunk_count = producer_->chunks_emitted();
    {
        std::lock_guard lock(state.mutex);
        summary.skipped_zero_pages = state.skipped_zero_pages;
        summary.resumed_blocks = state.resumed_blocks;
        for (const auto& [sequence, id] : state.ids) {
            summary.committed_block_ids.push_back(id);
        }
    }

    auto computed = producer_->digest_base64();
    if (!computed) {
        return {unexpected{computed.error()}, std::move(summary)};
    }

    blob_properties properties;
    properties.content_type = options.content_type;
    if (options.content_digest_override) {
        properties.content_md5 = options.content_digest_override;
    } else if (options.store_final_digest) {
        properties.content_md5 = computed.value();
    }
    summary.content_md5 = properties.content_md5 ? properties.content_md5 : computed.value();

    result<http_response> response = [&]() -> result<http_response> {
        if (request_.kind == blob_kind::block) {
            BT_LOG_DEBUG(log_category::orchestrator,
                         "Committing " + std::to_string(summary.committed_block_ids.size()) +
                         " blocks");
            return client.commit_block_list(request_.target.container, request_.target.blob,
                                            summary.committed_block_ids, properties);
        }
        properties.content_length = summary.total_bytes;
        BT_LOG_DEBUG(log_category::orchestrator,
                     "Finalizing page blob length " + std::to_string(summary.total_bytes));
        return client.set_blob_properties(request_.target.container, request_.target.blob,
                                          properties);
    }();

    if (response) {
        if (auto etag = response.value().get_header("ETag")) {
            summary.etag = *etag;
        }
    }
    return {std::move(response), std::move(summary)};
}

auto transfer_orchestrator::run() -> result<transfer_result> {
    std::optional<error> failure;
    std::optional<transfer_result> outcome;
    run([&](const error& err, const std::optional<transfer_result>& summary,
            const std::optional<http_response>&) {
        if (err.code != error_code::success) {
            failure = err;
        } else {
            outcome = summary;
        }
    });
    if (failure) {
        return unexpected{*failure};
    }
    return std::move(*outcome);
}

auto transfer_orchestrator::run_async(transfer_callback callback) -> std::future<void> {
    return std::async(std::launch::async,
                      [this, callback = std::move(callback)] { run(callback); });
}

}  // namespace kcenon::blob_transfer
