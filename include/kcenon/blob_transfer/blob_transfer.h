/**
 * @file blob_transfer.h
 * @brief Main header for the blob_transfer library
 * @version 0.1.0
 *
 * Include this header to access the upload orchestrator, the range
 * downloader and the blob service client.
 *
 * @code
 * #include <kcenon/blob_transfer/blob_transfer.h>
 *
 * using namespace kcenon::blob_transfer;
 *
 * service_endpoint endpoint;
 * endpoint.primary = "https://account.blob.core.windows.net";
 * auto service = blob_service_client::create(endpoint, retry_options::exponential());
 *
 * transfer_request request;
 * request.target = {"backups", "db.bak"};
 * request.source = file_source::open("db.bak").value();
 * transfer_orchestrator upload(std::move(request), service);
 * auto result = upload.run();
 * @endcode
 */

#ifndef KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H
#define KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H

#include <string>

// Core
#include "kcenon/blob_transfer/core/types.h"
#include "kcenon/blob_transfer/core/error_codes.h"
#include "kcenon/blob_transfer/core/checksum.h"
#include "kcenon/blob_transfer/core/buffer_allocator.h"
#include "kcenon/blob_transfer/core/chunk_producer.h"
#include "kcenon/blob_transfer/core/logging.h"

// Configuration
#include "kcenon/blob_transfer/config/transfer_options.h"

// Retry
#include "kcenon/blob_transfer/retry/location_mode.h"
#include "kcenon/blob_transfer/retry/retry_policy.h"
#include "kcenon/blob_transfer/retry/retry_filter_chain.h"

// Service
#include "kcenon/blob_transfer/service/http_types.h"
#include "kcenon/blob_transfer/service/blob_http_client.h"
#include "kcenon/blob_transfer/service/blob_service_client.h"

// Transfer
#include "kcenon/blob_transfer/transfer/batch_scheduler.h"
#include "kcenon/blob_transfer/transfer/chunk_operation.h"
#include "kcenon/blob_transfer/transfer/transfer_orchestrator.h"
#include "kcenon/blob_transfer/transfer/range_downloader.h"

// Adapters
#include "kcenon/blob_transfer/adapters/worker_pool_adapter.h"

namespace kcenon::blob_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H
