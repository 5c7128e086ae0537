/**
 * @file test_transfer_orchestrator.cpp
 * @brief Unit tests for chunked block and page blob uploads
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/transfer/transfer_orchestrator.h>

#include "unit/test_fixtures.h"

#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

namespace kcenon::blob_transfer::test {

using namespace std::chrono_literals;

namespace {

constexpr std::size_t mib = 1024 * 1024;

/**
 * @brief Collects terminal callbacks
 */
struct callback_recorder {
    int calls = 0;
    error err;
    std::optional<transfer_result> summary;
    std::optional<http_response> response;

    auto fn() -> transfer_callback {
        return [this](const error& e, const std::optional<transfer_result>& r,
                      const std::optional<http_response>& raw) {
            ++calls;
            err = e;
            summary = r;
            response = raw;
        };
    }
};

}  // namespace

class TransferOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<mock_blob_http_client>(store_.handler());
        client_ = std::make_unique<blob_service_client>(test_endpoint(), http_,
                                                        retry_options::linear(2, 10ms));
        client_->set_sleeper(sleeper_.fn());
    }

    static auto block_request(std::vector<std::byte> data, transfer_options options)
        -> transfer_request {
        transfer_request request;
        request.target = blob_target{"container", "blob"};
        request.kind = blob_kind::block;
        request.source = std::make_unique<memory_source>(std::move(data));
        request.options = std::move(options);
        return request;
    }

    static auto page_request(std::vector<std::byte> data, transfer_options options)
        -> transfer_request {
        auto request = block_request(std::move(data), std::move(options));
        request.kind = blob_kind::page;
        return request;
    }

    static auto blocks_of(std::string_view prefix, uint64_t count) -> std::vector<std::string> {
        std::vector<std::string> ids;
        for (uint64_t i = 0; i < count; ++i) {
            ids.push_back(block_id::make(prefix, i));
        }
        return ids;
    }

    in_memory_blob_store store_;
    recording_sleeper sleeper_;
    std::shared_ptr<mock_blob_http_client> http_;
    std::unique_ptr<blob_service_client> client_;
};

// =============================================================================
// Block blobs
// =============================================================================

TEST_F(TransferOrchestratorTest, BlockUploadCommitsInSequenceOrder) {
    auto data = pattern_bytes(10 * mib, 1);
    auto options = transfer_options_builder()
        .with_chunk_size(4 * mib)
        .with_concurrency(2)
        .with_id_prefix("prefix")
        .build();

    transfer_orchestrator orchestrator(block_request(data, options), *client_);
    callback_recorder seen;
    orchestrator.run(seen.fn());

    ASSERT_EQ(seen.calls, 1);
    ASSERT_FALSE(static_cast<bool>(seen.err)) << seen.err.message;
    ASSERT_TRUE(seen.summary.has_value());
    ASSERT_TRUE(seen.response.has_value());

    const auto& summary = *seen.summary;
    EXPECT_EQ(summary.committed_block_ids,
              (std::vector<std::string>{"cHJlZml4LTAwMDAwMA==", "cHJlZml4LTAwMDAwMQ==",
                                        "cHJlZml4LTAwMDAwMg=="}));
    EXPECT_EQ(summary.chunk_count, 3u);
    EXPECT_EQ(summary.total_bytes, 10u * mib);
    EXPECT_EQ(summary.content_md5.value(), md5_of(data));
    EXPECT_EQ(summary.etag.value(), "\"0x1001\"");
    EXPECT_EQ(seen.response->status_code, 201);

    EXPECT_EQ(http_->count_comp("block"), 3u);
    EXPECT_EQ(http_->count_comp("blocklist"), 1u);
    EXPECT_LE(orchestrator.peak_in_flight(), 2u);
    EXPECT_LE(orchestrator.peak_buffers(), 3u);
    EXPECT_EQ(orchestrator.phase(), transfer_phase::done);
    EXPECT_EQ(orchestrator.bytes_acknowledged(), 10u * mib);

    auto blob = store_.find("/container/blob");
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(blob->data, data);
    EXPECT_FALSE(blob->content_md5.has_value());
}

TEST_F(TransferOrchestratorTest, CommitIsTheLastRequest) {
    auto options = transfer_options_builder().with_chunk_size(1024).with_concurrency(4).build();
    transfer_orchestrator orchestrator(block_request(pattern_bytes(10000), options), *client_);

    ASSERT_TRUE(orchestrator.run());
    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 11u);
    EXPECT_EQ(requests.back().comp(), "blocklist");
}

TEST_F(TransferOrchestratorTest, StoredDigestIsTheComputedOne) {
    auto data = pattern_bytes(5000, 4);
    auto options = transfer_options_builder()
        .with_chunk_size(2048)
        .with_final_digest()
        .with_content_type("application/octet-stream")
        .build();

    transfer_orchestrator orchestrator(block_request(data, options), *client_);
    auto outcome = orchestrator.run();
    ASSERT_TRUE(outcome);

    auto commit = http_->requests().back();
    EXPECT_EQ(commit.header("x-ms-blob-content-md5").value(), md5_of(data));
    EXPECT_EQ(commit.header("x-ms-blob-content-type").value(), "application/octet-stream");
    EXPECT_EQ(outcome.value().content_md5.value(), md5_of(data));
}

TEST_F(TransferOrchestratorTest, DigestOverrideWins) {
    auto options = transfer_options_builder()
        .with_chunk_size(2048)
        .with_final_digest()
        .with_content_digest("XrY7u+Ae7tCTyyK7j1rNww==")
        .build();

    transfer_orchestrator orchestrator(block_request(pattern_bytes(5000), options), *client_);
    auto outcome = orchestrator.run();
    ASSERT_TRUE(outcome);

    EXPECT_EQ(http_->requests().back().header("x-ms-blob-content-md5").value(),
              "XrY7u+Ae7tCTyyK7j1rNww==");
    EXPECT_EQ(outcome.value().content_md5.value(), "XrY7u+Ae7tCTyyK7j1rNww==");
    EXPECT_EQ(store_.find("/container/blob")->content_md5.value(), "XrY7u+Ae7tCTyyK7j1rNww==");
}

TEST_F(TransferOrchestratorTest, TransactionalDigestOnEveryBlock) {
    auto options = transfer_options_builder()
        .with_chunk_size(1000)
        .with_transactional_digest()
        .build();
    transfer_orchestrator orchestrator(block_request(pattern_bytes(3500), options), *client_);
    ASSERT_TRUE(orchestrator.run());

    EXPECT_EQ(http_->count([](const recorded_request& r) {
                  return r.comp() == "block" && r.header("Content-MD5").has_value();
              }),
              4u);
}

TEST_F(TransferOrchestratorTest, UnknownLengthStreamUpload) {
    const std::string text(10000, 'q');
    std::istringstream input(text);

    transfer_request request;
    request.target = blob_target{"container", "stream"};
    request.source = std::make_unique<stream_source>(input);
    request.options = transfer_options_builder().with_chunk_size(4096).build();

    transfer_orchestrator orchestrator(std::move(request), *client_);
    auto outcome = orchestrator.run();
    ASSERT_TRUE(outcome) << outcome.error().message;
    EXPECT_EQ(outcome.value().chunk_count, 3u);
    EXPECT_EQ(store_.find("/container/stream")->data, to_bytes(text));
}

TEST_F(TransferOrchestratorTest, EmptySourceCommitsEmptyList) {
    transfer_orchestrator orchestrator(block_request({}, transfer_options{}), *client_);
    auto outcome = orchestrator.run();
    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.value().committed_block_ids.empty());
    EXPECT_EQ(outcome.value().content_md5.value(), "1B2M2Y8AsgTpgAmY7PhCfg==");
    EXPECT_EQ(http_->total(), 1u);
    EXPECT_TRUE(store_.find("/container/blob")->data.empty());
}

// =============================================================================
// Page blobs
// =============================================================================

TEST_F(TransferOrchestratorTest, ZeroPagesAreNeverWritten) {
    std::vector<std::byte> zeros(mib);
    auto options = transfer_options_builder().with_chunk_size(512 * 1024).build();

    transfer_orchestrator orchestrator(page_request(zeros, options), *client_);
    callback_recorder seen;
    orchestrator.run(seen.fn());

    ASSERT_EQ(seen.calls, 1);
    ASSERT_FALSE(static_cast<bool>(seen.err)) << seen.err.message;
    EXPECT_EQ(http_->count_comp("page"), 0u);
    EXPECT_EQ(http_->count_comp("properties"), 1u);
    EXPECT_EQ(http_->total(), 2u);
    EXPECT_EQ(http_->requests().back().header("x-ms-blob-content-length").value(), "1048576");
    EXPECT_EQ(seen.summary->skipped_zero_pages, 2u);
    EXPECT_EQ(seen.summary->content_md5.value(), "ttgbNgpWctgMJ0MPORU+LA==");
    EXPECT_TRUE(seen.summary->committed_block_ids.empty());
    EXPECT_EQ(seen.response->status_code, 200);
}

TEST_F(TransferOrchestratorTest, PageUploadWritesOnlyNonZeroPages) {
    std::vector<std::byte> data(4096);
    std::fill(data.begin() + 1024, data.begin() + 2048, std::byte{0x33});
    auto options = transfer_options_builder().with_chunk_size(1024).with_final_digest().build();

    transfer_orchestrator orchestrator(page_request(data, options), *client_);
    auto outcome = orchestrator.run();
    ASSERT_TRUE(outcome) << outcome.error().message;

    EXPECT_EQ(http_->count_comp("page"), 1u);
    EXPECT_EQ(outcome.value().skipped_zero_pages, 3u);
    EXPECT_EQ(outcome.value().chunk_count, 4u);

    auto blob = store_.find("/container/blob");
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(blob->kind, blob_kind::page);
    EXPECT_EQ(blob->data, data);
    EXPECT_EQ(blob->content_md5.value(), md5_of(data));
}

TEST_F(TransferOrchestratorTest, PageBlobIsCreatedBeforeTheFirstWrite) {
    std::vector<std::byte> data(2048, std::byte{0x5a});
    auto options = transfer_options_builder()
        .with_chunk_size(512)
        .with_concurrency(2)
        .with_content_type("application/x-disk")
        .build();

    transfer_orchestrator orchestrator(page_request(data, options), *client_);
    auto outcome = orchestrator.run();
    ASSERT_TRUE(outcome) << outcome.error().message;

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 6u);
    const auto& create = requests.front();
    EXPECT_EQ(create.method, http_method::put);
    EXPECT_TRUE(create.comp().empty());
    EXPECT_EQ(create.header("x-ms-blob-type").value(), "PageBlob");
    EXPECT_EQ(create.header("x-ms-blob-content-length").value(), "2048");
    EXPECT_EQ(create.header("x-ms-blob-content-type").value(), "application/x-disk");
    EXPECT_EQ(http_->count([](const recorded_request& r) {
                  return r.header("x-ms-blob-type").has_value();
              }),
              1u);
    EXPECT_EQ(http_->count_comp("page"), 4u);
    EXPECT_EQ(requests.back().comp(), "properties");

    auto blob = store_.find("/container/blob");
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(blob->kind, blob_kind::page);
    EXPECT_EQ(blob->data, data);
}

TEST_F(TransferOrchestratorTest, PageBlobCreationFailureStopsTheUpload) {
    http_->set_handler([&](const recorded_request& r) -> result<http_response> {
        if (r.header("x-ms-blob-type").has_value()) {
            return error_response(403, "AuthorizationPermissionMismatch");
        }
        return store_.handle(r);
    });

    std::vector<std::byte> data(1024, std::byte{1});
    auto options = transfer_options_builder().with_chunk_size(512).build();
    transfer_orchestrator orchestrator(page_request(data, options), *client_);

    callback_recorder seen;
    orchestrator.run(seen.fn());
    ASSERT_EQ(seen.calls, 1);
    EXPECT_EQ(seen.err.http_status, 403);
    EXPECT_EQ(seen.err.service_code, "AuthorizationPermissionMismatch");
    EXPECT_EQ(http_->total(), 1u);
    EXPECT_EQ(orchestrator.phase(), transfer_phase::failed);
    EXPECT_FALSE(store_.find("/container/blob").has_value());
}

TEST_F(TransferOrchestratorTest, PageBlobNeedsDeclaredLength) {
    std::istringstream input(std::string(1024, 'x'));
    transfer_request request;
    request.target = blob_target{"container", "disk"};
    request.kind = blob_kind::page;
    request.source = std::make_unique<stream_source>(input);
    request.options.chunk_size = 512;

    transfer_orchestrator orchestrator(std::move(request), *client_);
    auto outcome = orchestrator.run();
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::invalid_argument);
    EXPECT_EQ(http_->total(), 0u);
}

TEST_F(TransferOrchestratorTest, MisalignedPageLengthIsRejected) {
    auto options = transfer_options_builder().with_chunk_size(512).build();
    transfer_orchestrator orchestrator(page_request(pattern_bytes(1000), options), *client_);
    auto outcome = orchestrator.run();
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::invalid_page_alignment);
    EXPECT_EQ(http_->total(), 0u);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(TransferOrchestratorTest, InvalidOptionsFailBeforeAnyRequest) {
    auto options = transfer_options_builder().with_chunk_size(5 * mib).build();
    transfer_orchestrator orchestrator(block_request(pattern_bytes(100), options), *client_);

    callback_recorder seen;
    orchestrator.run(seen.fn());
    ASSERT_EQ(seen.calls, 1);
    EXPECT_EQ(seen.err.code, error_code::chunk_too_large);
    EXPECT_FALSE(seen.summary.has_value());
    EXPECT_FALSE(seen.response.has_value());
    EXPECT_EQ(http_->total(), 0u);
    EXPECT_EQ(orchestrator.phase(), transfer_phase::failed);
}

TEST_F(TransferOrchestratorTest, MissingSourceIsRejected) {
    transfer_request request;
    request.target = blob_target{"container", "blob"};
    transfer_orchestrator orchestrator(std::move(request), *client_);

    auto outcome = orchestrator.run();
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::invalid_argument);
}

TEST_F(TransferOrchestratorTest, BlockFailureSkipsCommitAndReportsOnce) {
    const auto poisoned = block_id::make("fail", 2);
    http_->set_handler([&](const recorded_request& r) -> result<http_response> {
        if (r.comp() == "block" && r.query.at("blockid") == poisoned) {
            return error_response(503, "ServerBusy");
        }
        return store_.handle(r);
    });

    auto options = transfer_options_builder()
        .with_chunk_size(1024)
        .with_concurrency(2)
        .with_id_prefix("fail")
        .build();
    transfer_orchestrator orchestrator(block_request(pattern_bytes(8192), options), *client_);

    callback_recorder seen;
    orchestrator.run(seen.fn());

    ASSERT_EQ(seen.calls, 1);
    EXPECT_EQ(seen.err.code, error_code::retries_exhausted);
    EXPECT_EQ(seen.err.http_status, 503);
    EXPECT_FALSE(seen.summary.has_value());
    EXPECT_EQ(http_->count_comp("blocklist"), 0u);
    EXPECT_EQ(orchestrator.phase(), transfer_phase::failed);
    EXPECT_EQ(orchestrator.last_staged_blocks().count(poisoned), 0u);
    EXPECT_EQ(sleeper_.delays().size(), 2u);
}

TEST_F(TransferOrchestratorTest, CommitFailureIsReported) {
    http_->set_handler([&](const recorded_request& r) -> result<http_response> {
        if (r.comp() == "blocklist") {
            return error_response(400, "InvalidBlockList");
        }
        return store_.handle(r);
    });

    auto options = transfer_options_builder().with_chunk_size(1024).build();
    transfer_orchestrator orchestrator(block_request(pattern_bytes(3000), options), *client_);

    callback_recorder seen;
    orchestrator.run(seen.fn());
    ASSERT_EQ(seen.calls, 1);
    EXPECT_EQ(seen.err.service_code, "InvalidBlockList");
    EXPECT_FALSE(seen.response.has_value());
    EXPECT_EQ(orchestrator.last_staged_blocks().size(), 3u);
}

TEST_F(TransferOrchestratorTest, ShortSourceFailsTheTransfer) {
    std::istringstream input(std::string(100, 'x'));
    transfer_request request;
    request.target = blob_target{"container", "blob"};
    request.source = std::make_unique<stream_source>(input);
    request.total_length = 4096;
    request.options.chunk_size = 1024;

    transfer_orchestrator orchestrator(std::move(request), *client_);
    auto outcome = orchestrator.run();
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::source_read_error);
    EXPECT_EQ(http_->count_comp("blocklist"), 0u);
}

TEST_F(TransferOrchestratorTest, SourceFailureBeforeBlockFailureIsReported) {
    const auto slow = block_id::make("race", 0);
    http_->set_handler([&](const recorded_request& r) -> result<http_response> {
        if (r.comp() == "block" && r.query.at("blockid") == slow) {
            std::this_thread::sleep_for(300ms);
            return error_response(400, "InvalidBlockId");
        }
        return store_.handle(r);
    });

    transfer_request request;
    request.target = blob_target{"container", "blob"};
    request.source = std::make_unique<failing_source>(2 * 1024, 8 * 1024);
    request.options = transfer_options_builder()
        .with_chunk_size(1024)
        .with_concurrency(4)
        .with_id_prefix("race")
        .build();

    transfer_orchestrator orchestrator(std::move(request), *client_);
    callback_recorder seen;
    orchestrator.run(seen.fn());

    ASSERT_EQ(seen.calls, 1);
    EXPECT_EQ(seen.err.code, error_code::source_read_error);
    EXPECT_EQ(seen.err.http_status, 0);
    EXPECT_EQ(http_->count_comp("blocklist"), 0u);
    EXPECT_EQ(orchestrator.phase(), transfer_phase::failed);
}

TEST_F(TransferOrchestratorTest, BlockFailureBeforeSourceFailureIsReported) {
    const auto broken = block_id::make("race", 0);
    std::atomic<bool> rejected{false};
    http_->set_handler([&](const recorded_request& r) -> result<http_response> {
        if (r.comp() == "block" && r.query.at("blockid") == broken) {
            rejected = true;
            return error_response(400, "InvalidBlockId");
        }
        return store_.handle(r);
    });

    transfer_request request;
    request.target = blob_target{"container", "blob"};
    request.source = std::make_unique<failing_source>(2 * 1024, 8 * 1024, 300ms);
    request.options = transfer_options_builder()
        .with_chunk_size(1024)
        .with_concurrency(4)
        .with_id_prefix("race")
        .build();

    transfer_orchestrator orchestrator(std::move(request), *client_);
    callback_recorder seen;
    orchestrator.run(seen.fn());

    ASSERT_EQ(seen.calls, 1);
    EXPECT_TRUE(rejected.load());
    EXPECT_EQ(seen.err.http_status, 400);
    EXPECT_EQ(seen.err.service_code, "InvalidBlockId");
    EXPECT_EQ(http_->count_comp("blocklist"), 0u);
}

TEST_F(TransferOrchestratorTest, CorruptedBlockAbortsWithoutRetryOrCommit) {
    const auto corrupted = block_id::make("md5", 1);
    http_->set_handler([&](const recorded_request& r) -> result<http_response> {
        if (r.comp() == "block" && r.query.at("blockid") == corrupted) {
            auto damaged = r;
            damaged.body.front() ^= std::byte{0xff};
            return store_.handle(damaged);
        }
        return store_.handle(r);
    });

    auto options = transfer_options_builder()
        .with_chunk_size(1024)
        .with_concurrency(2)
        .with_transactional_digest()
        .with_id_prefix("md5")
        .build();
    transfer_orchestrator orchestrator(block_request(pattern_bytes(4096, 5), options), *client_);

    callback_recorder seen;
    orchestrator.run(seen.fn());

    ASSERT_EQ(seen.calls, 1);
    EXPECT_EQ(seen.err.code, error_code::content_md5_mismatch);
    EXPECT_EQ(seen.err.http_status, 400);
    EXPECT_EQ(seen.err.service_code, "Md5Mismatch");
    EXPECT_EQ(http_->count([&](const recorded_request& r) {
                  return r.comp() == "block" && r.query.at("blockid") == corrupted;
              }),
              1u);
    EXPECT_EQ(http_->count_comp("blocklist"), 0u);
    EXPECT_TRUE(sleeper_.delays().empty());
    EXPECT_EQ(orchestrator.last_staged_blocks().count(corrupted), 0u);
    auto blob = store_.find("/container/blob");
    EXPECT_TRUE(!blob || blob->committed_ids.empty());
}

TEST_F(TransferOrchestratorTest, ResumeSkipsStagedBlocks) {
    auto data = pattern_bytes(5 * 1024, 8);
    const auto poisoned = block_id::make("job", 2);
    std::atomic<bool> outage{true};
    http_->set_handler([&](const recorded_request& r) -> result<http_response> {
        if (outage && r.comp() == "block" && r.query.at("blockid") == poisoned) {
            return error_response(400, "InvalidBlockId");
        }
        return store_.handle(r);
    });

    auto options = transfer_options_builder()
        .with_chunk_size(1024)
        .with_concurrency(1)
        .with_id_prefix("job")
        .build();

    transfer_orchestrator first(block_request(data, options), *client_);
    ASSERT_FALSE(first.run());
    const auto staged = first.last_staged_blocks();
    EXPECT_EQ(staged, (std::set<std::string>{block_id::make("job", 0), block_id::make("job", 1)}));

    outage = false;
    http_->clear();
    options.resume_staged_blocks = staged;
    transfer_orchestrator second(block_request(data, options), *client_);
    auto outcome = second.run();
    ASSERT_TRUE(outcome) << outcome.error().message;

    EXPECT_EQ(outcome.value().resumed_blocks, 2u);
    EXPECT_EQ(http_->count_comp("block"), 3u);
    EXPECT_EQ(outcome.value().committed_block_ids, blocks_of("job", 5));
    EXPECT_EQ(store_.find("/container/blob")->data, data);
}

// =============================================================================
// Callback and lifecycle
// =============================================================================

TEST_F(TransferOrchestratorTest, ProgressReachesTotal) {
    std::mutex mutex;
    std::vector<std::pair<uint64_t, uint64_t>> reports;
    auto options = transfer_options_builder()
        .with_chunk_size(1000)
        .with_concurrency(3)
        .with_progress([&](uint64_t done, uint64_t total) {
            std::lock_guard lock(mutex);
            reports.emplace_back(done, total);
        })
        .build();

    transfer_orchestrator orchestrator(block_request(pattern_bytes(9500), options), *client_);
    ASSERT_TRUE(orchestrator.run());

    std::lock_guard lock(mutex);
    ASSERT_EQ(reports.size(), 10u);
    uint64_t highest = 0;
    for (const auto& [done, total] : reports) {
        EXPECT_EQ(total, 9500u);
        highest = std::max(highest, done);
    }
    EXPECT_EQ(highest, 9500u);
}

TEST_F(TransferOrchestratorTest, SecondRunIsRejected) {
    auto options = transfer_options_builder().with_chunk_size(1024).build();
    transfer_orchestrator orchestrator(block_request(pattern_bytes(2000), options), *client_);
    ASSERT_TRUE(orchestrator.run());

    callback_recorder seen;
    orchestrator.run(seen.fn());
    EXPECT_EQ(seen.calls, 1);
    EXPECT_EQ(seen.err.code, error_code::invalid_state);
    EXPECT_EQ(http_->count_comp("blocklist"), 1u);
}

TEST_F(TransferOrchestratorTest, RunAsyncDeliversCallback) {
    auto options = transfer_options_builder().with_chunk_size(1024).build();
    transfer_orchestrator orchestrator(block_request(pattern_bytes(4096), options), *client_);

    std::promise<error> delivered;
    auto done = orchestrator.run_async(
        [&](const error& err, const std::optional<transfer_result>&,
            const std::optional<http_response>&) { delivered.set_value(err); });
    done.get();

    EXPECT_FALSE(static_cast<bool>(delivered.get_future().get()));
    EXPECT_EQ(orchestrator.phase(), transfer_phase::done);
}

TEST_F(TransferOrchestratorTest, SharedPoolIsUsed) {
    auto pool = adapters::worker_pool_factory::create(2);
    auto options = transfer_options_builder().with_chunk_size(1024).with_concurrency(2).build();

    transfer_orchestrator orchestrator(block_request(pattern_bytes(6000), options), *client_,
                                       pool);
    ASSERT_TRUE(orchestrator.run());
    EXPECT_EQ(pool->pending_tasks(adapters::worker_stage::chunk_operation), 0u);
}

// =============================================================================
// Concurrency and length sweep
// =============================================================================

constexpr std::size_t sweep_chunk = 1024;

class TransferOrchestratorSweepTest
    : public TransferOrchestratorTest,
      public ::testing::WithParamInterface<std::tuple<std::size_t, std::size_t>> {};

TEST_P(TransferOrchestratorSweepTest, BlocksCoverTheSourceAndCommitInEmissionOrder) {
    const auto concurrency = std::get<0>(GetParam());
    const auto length = std::get<1>(GetParam());
    const auto data = pattern_bytes(length, static_cast<uint32_t>(length + concurrency));

    // Completions land in a shuffled order
    std::mutex rng_mutex;
    std::mt19937 rng(static_cast<uint32_t>(concurrency * 7919 + length));
    http_->set_handler([&](const recorded_request& r) -> result<http_response> {
        if (r.comp() == "block") {
            int delay_us = 0;
            {
                std::lock_guard lock(rng_mutex);
                delay_us = std::uniform_int_distribution<int>(0, 3000)(rng);
            }
            std::this_thread::sleep_for(std::chrono::microseconds(delay_us));
        }
        return store_.handle(r);
    });

    auto options = transfer_options_builder()
        .with_chunk_size(sweep_chunk)
        .with_concurrency(concurrency)
        .with_id_prefix("sweep")
        .build();
    transfer_orchestrator orchestrator(block_request(data, options), *client_);
    auto outcome = orchestrator.run();
    ASSERT_TRUE(outcome) << outcome.error().message;

    const uint64_t chunks = (length + sweep_chunk - 1) / sweep_chunk;
    const auto expected_ids = blocks_of("sweep", chunks);
    EXPECT_EQ(outcome.value().committed_block_ids, expected_ids);
    EXPECT_EQ(outcome.value().chunk_count, chunks);
    EXPECT_EQ(outcome.value().total_bytes, length);
    EXPECT_EQ(outcome.value().content_md5.value(), md5_of(data));

    // Every staged block carries exactly its own slice of the source
    std::map<std::string, uint64_t> sequence_of;
    for (uint64_t i = 0; i < chunks; ++i) {
        sequence_of.emplace(expected_ids[i], i);
    }
    std::size_t staged = 0;
    for (const auto& r : http_->requests()) {
        if (r.comp() != "block") {
            continue;
        }
        ++staged;
        auto it = sequence_of.find(r.query.at("blockid"));
        ASSERT_NE(it, sequence_of.end());
        const auto start = static_cast<std::size_t>(it->second) * sweep_chunk;
        const auto end = std::min(start + sweep_chunk, length);
        EXPECT_EQ(r.body, std::vector<std::byte>(data.begin() + static_cast<std::ptrdiff_t>(start),
                                                 data.begin() + static_cast<std::ptrdiff_t>(end)));
    }
    EXPECT_EQ(staged, chunks);

    auto blob = store_.find("/container/blob");
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(blob->committed_ids, expected_ids);
    EXPECT_EQ(blob->data, data);
    EXPECT_LE(orchestrator.peak_in_flight(), concurrency);
    EXPECT_LE(orchestrator.peak_buffers(), concurrency + 1);
}

INSTANTIATE_TEST_SUITE_P(
    ConcurrencyAndLength, TransferOrchestratorSweepTest,
    ::testing::Combine(::testing::Values(1, 2, 3, 8),
                       ::testing::Values(0, 1, sweep_chunk - 1, sweep_chunk, sweep_chunk + 1,
                                         7 * sweep_chunk + 300)));

TEST(TransferPhaseTest, Names) {
    EXPECT_EQ(to_string(transfer_phase::idle), "idle");
    EXPECT_EQ(to_string(transfer_phase::committing), "committing");
    EXPECT_EQ(to_string(transfer_phase::failed), "failed");
}

}  // namespace kcenon::blob_transfer::test
