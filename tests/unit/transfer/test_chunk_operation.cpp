/**
 * @file test_chunk_operation.cpp
 * @brief Unit tests for block ids and single-chunk uploads
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/core/buffer_allocator.h>
#include <kcenon/blob_transfer/transfer/chunk_operation.h>

#include "unit/test_fixtures.h"

#include <algorithm>
#include <memory>

namespace kcenon::blob_transfer::test {

using namespace std::chrono_literals;

class ChunkOperationTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<mock_blob_http_client>(store_.handler());
        client_ = std::make_unique<blob_service_client>(test_endpoint(), http_,
                                                        retry_options::no_retry());
    }

    auto make_chunk(uint64_t sequence, uint64_t offset, std::span<const std::byte> bytes)
        -> chunk {
        auto lease = arena_.acquire(bytes.size());
        EXPECT_TRUE(lease);
        std::copy(bytes.begin(), bytes.end(), lease.value().writable().begin());
        chunk piece;
        piece.sequence = sequence;
        piece.range = byte_range{offset, offset + bytes.size()};
        piece.buffer = std::move(lease.value());
        return piece;
    }

    auto run(chunk_operation& op) -> error {
        error reported{error_code::internal_error, "not completed"};
        op.set_completion([&](const error& err) { reported = err; });
        auto outcome = op.execute();
        op.complete(outcome ? error{} : outcome.error());
        return reported;
    }

    const blob_target target_{"container", "blob"};
    buffer_allocator arena_{8192, 4};
    in_memory_blob_store store_;
    std::shared_ptr<mock_blob_http_client> http_;
    std::unique_ptr<blob_service_client> client_;
};

TEST(BlockIdTest, EncodesPrefixAndPaddedSequence) {
    EXPECT_EQ(block_id::make("prefix", 0), "cHJlZml4LTAwMDAwMA==");
    EXPECT_EQ(block_id::make("prefix", 1), "cHJlZml4LTAwMDAwMQ==");

    // Fixed-width ids keep every encoded id the same length
    EXPECT_EQ(block_id::make("p", 7).size(), block_id::make("p", 123456).size());
}

TEST(BlockIdTest, RandomPrefixIsHex) {
    const auto a = block_id::random_prefix();
    const auto b = block_id::random_prefix();
    EXPECT_EQ(a.size(), 16u);
    EXPECT_TRUE(std::all_of(a.begin(), a.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    }));
    EXPECT_NE(a, b);
}

TEST_F(ChunkOperationTest, BlockUploadStagesBlock) {
    auto bytes = pattern_bytes(3000);
    const auto id = block_id::make("t", 0);
    chunk_operation op(operation_kind::block_upload, make_chunk(0, 0, bytes), *client_,
                       target_, id, false);

    EXPECT_FALSE(static_cast<bool>(run(op)));
    EXPECT_EQ(arena_.outstanding(), 0u);
    EXPECT_FALSE(op.content_md5().has_value());

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].comp(), "block");
    EXPECT_EQ(requests[0].query.at("blockid"), id);
    EXPECT_FALSE(requests[0].header("Content-MD5").has_value());
    EXPECT_EQ(requests[0].body, bytes);
}

TEST_F(ChunkOperationTest, TransactionalDigestIsSent) {
    auto bytes = pattern_bytes(4096, 3);
    chunk_operation op(operation_kind::block_upload, make_chunk(2, 8192, bytes), *client_,
                       target_, block_id::make("t", 2), true);

    EXPECT_FALSE(static_cast<bool>(run(op)));
    ASSERT_TRUE(op.content_md5().has_value());
    EXPECT_EQ(*op.content_md5(), md5_of(bytes));
    EXPECT_EQ(http_->requests().back().header("Content-MD5").value(), md5_of(bytes));
}

TEST_F(ChunkOperationTest, ServiceRejectionIsReported) {
    http_->set_handler([](const recorded_request&) -> result<http_response> {
        return error_response(400, "Md5Mismatch", "digest mismatch");
    });

    chunk_operation op(operation_kind::block_upload, make_chunk(0, 0, pattern_bytes(100)),
                       *client_, target_, block_id::make("t", 0), true);
    auto err = run(op);
    EXPECT_EQ(err.code, error_code::content_md5_mismatch);
    EXPECT_EQ(err.http_status, 400);
    EXPECT_EQ(arena_.outstanding(), 0u);
}

TEST_F(ChunkOperationTest, StagedBlockIsNotUploadedAgain) {
    chunk_operation op(operation_kind::block_upload, make_chunk(1, 4096, pattern_bytes(4096)),
                       *client_, target_, block_id::make("t", 1), false, true);

    EXPECT_FALSE(static_cast<bool>(run(op)));
    EXPECT_TRUE(op.resumed());
    EXPECT_EQ(http_->total(), 0u);
    EXPECT_EQ(arena_.outstanding(), 0u);
}

TEST_F(ChunkOperationTest, ZeroPageIsSkipped) {
    std::vector<std::byte> zeros(4096);
    chunk_operation op(operation_kind::page_write, make_chunk(0, 0, zeros), *client_, target_,
                       "", true);

    EXPECT_FALSE(static_cast<bool>(run(op)));
    EXPECT_TRUE(op.zero_skipped());
    EXPECT_FALSE(op.content_md5().has_value());
    EXPECT_EQ(http_->total(), 0u);
}

TEST_F(ChunkOperationTest, PageWriteCarriesRange) {
    store_.put_page_blob("/container/blob", 4096, {});
    std::vector<std::byte> page(1024, std::byte{0});
    page[700] = std::byte{0x5a};
    chunk_operation op(operation_kind::page_write, make_chunk(3, 3072, page), *client_,
                       target_, "", false);

    EXPECT_FALSE(static_cast<bool>(run(op)));
    EXPECT_FALSE(op.zero_skipped());
    EXPECT_EQ(op.range(), (byte_range{3072, 4096}));
    EXPECT_EQ(op.describe(), "page_write #3 [3072, 4096)");

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].comp(), "page");
    EXPECT_EQ(requests[0].header("x-ms-range").value(), "bytes=3072-4095");

    auto blob = store_.find("/container/blob");
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(blob->data[3072 + 700], std::byte{0x5a});
}

TEST_F(ChunkOperationTest, MisalignedPageFailsWithoutRequest) {
    chunk_operation op(operation_kind::page_write, make_chunk(0, 100, pattern_bytes(512)),
                       *client_, target_, "", false);
    EXPECT_EQ(run(op).code, error_code::invalid_page_alignment);
    EXPECT_EQ(http_->total(), 0u);
}

}  // namespace kcenon::blob_transfer::test
