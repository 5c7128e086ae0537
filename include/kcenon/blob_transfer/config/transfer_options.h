/**
 * @file transfer_options.h
 * @brief Configuration structures for blob transfers
 *
 * Defines the limits imposed by the blob service, the retry configuration,
 * endpoint addresses and the per-transfer options, plus a fluent builder.
 */

#ifndef KCENON_BLOB_TRANSFER_CONFIG_TRANSFER_OPTIONS_H
#define KCENON_BLOB_TRANSFER_CONFIG_TRANSFER_OPTIONS_H

#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/retry/location_mode.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>

namespace kcenon::blob_transfer {

/**
 * @brief Service limits and defaults
 */
struct blob_constants {
    static constexpr std::size_t kib = 1024;
    static constexpr std::size_t mib = 1024 * kib;

    /// Largest single block a PUT Block may carry
    static constexpr std::size_t max_block_size = 4 * mib;

    /// Largest page range a single PUT Page may carry
    static constexpr std::size_t max_update_page_size = 4 * mib;

    /// Page blob alignment
    static constexpr std::size_t page_size = 512;

    /// Default chunk size for uploads
    static constexpr std::size_t default_chunk_size = 4 * mib;

    /// Largest chunk or range for which a per-request MD5 is computed
    static constexpr std::size_t max_transactional_digest_size = 4 * mib;

    /// Default and maximum size of a ranged GET during download
    static constexpr std::size_t default_range_size = 4 * mib;

    /// Page ranges smaller than this are merged during sparse download
    static constexpr std::size_t min_write_page_size = 2 * mib;

    static constexpr std::size_t default_concurrency = 5;

    /// Longest block id prefix that keeps the encoded id under 64 bytes
    static constexpr std::size_t max_block_id_prefix = 40;

    static constexpr std::chrono::milliseconds default_request_timeout{30000};
};

/**
 * @brief Retry policy selection
 */
struct retry_options {
    enum class policy_kind : uint8_t { none, linear, exponential };

    policy_kind kind = policy_kind::exponential;

    /// Maximum number of retries after the first attempt
    uint32_t retry_count = 3;

    /// Linear: constant delay. Exponential: base delay.
    std::chrono::milliseconds interval{3000};

    /// Exponential only: cap on a single delay
    std::chrono::milliseconds max_interval{90000};

    /// Scale each delay by a random factor in [0.8, 1.2]
    bool use_jitter = false;

    static auto linear(uint32_t count = 3,
                       std::chrono::milliseconds interval = std::chrono::milliseconds{30000})
        -> retry_options {
        retry_options options;
        options.kind = policy_kind::linear;
        options.retry_count = count;
        options.interval = interval;
        return options;
    }

    static auto exponential(uint32_t count = 3,
                            std::chrono::milliseconds base = std::chrono::milliseconds{3000},
                            std::chrono::milliseconds cap = std::chrono::milliseconds{90000})
        -> retry_options {
        retry_options options;
        options.kind = policy_kind::exponential;
        options.retry_count = count;
        options.interval = base;
        options.max_interval = cap;
        return options;
    }

    static auto no_retry() -> retry_options {
        retry_options options;
        options.kind = policy_kind::none;
        options.retry_count = 0;
        return options;
    }
};

/**
 * @brief Primary and optional secondary service endpoints
 *
 * Both are base URLs such as "https://account.blob.core.windows.net".
 */
struct service_endpoint {
    std::string primary;
    std::optional<std::string> secondary;

    /// Opaque capability token appended to every request query
    std::optional<std::string> capability_token;

    std::string api_version = "2018-03-28";

    [[nodiscard]] auto url_for(storage_location location) const -> const std::string& {
        if (location == storage_location::secondary && secondary.has_value()) {
            return *secondary;
        }
        return primary;
    }
};

/**
 * @brief Byte count progress observer: (bytes acknowledged, total or 0 if unknown)
 */
using progress_callback = std::function<void(uint64_t, uint64_t)>;

/**
 * @brief Options for one upload or download
 */
struct transfer_options {
    std::size_t chunk_size = blob_constants::default_chunk_size;
    std::size_t concurrency = blob_constants::default_concurrency;

    /// Send a Content-MD5 with each chunk / request one for each range
    bool use_transactional_digest = false;

    /// Store the content MD5 of the whole blob on commit
    bool store_final_digest = false;

    /// Skip whole-blob MD5 validation on download
    bool disable_digest_validation = false;

    /// Block id prefix; generated when absent
    std::optional<std::string> id_prefix;

    /// Wall-clock budget across all retries of one request
    std::optional<std::chrono::milliseconds> execution_budget;

    std::chrono::milliseconds request_timeout = blob_constants::default_request_timeout;

    location_mode location = location_mode::primary_only;

    /// Final Content-MD5 to store instead of the computed one
    std::optional<std::string> content_digest_override;

    std::optional<std::string> content_type;

    /// Block ids already staged by an earlier attempt of the same upload
    std::set<std::string> resume_staged_blocks;

    /// Download: size of each ranged GET
    std::size_t range_size = blob_constants::default_range_size;

    /// Download: consult the page list and skip empty page ranges
    bool sparse_page_download = true;

    progress_callback on_progress;

    /**
     * @brief Validate option values
     * @param kind Target blob kind
     * @param total_length Declared source length, if known
     */
    [[nodiscard]] auto validate(blob_kind kind,
                                std::optional<uint64_t> total_length = std::nullopt) const
        -> result<void>;
};

/**
 * @brief Fluent builder for transfer_options
 */
class transfer_options_builder {
public:
    auto with_chunk_size(std::size_t size) -> transfer_options_builder& {
        options_.chunk_size = size;
        return *this;
    }

    auto with_concurrency(std::size_t limit) -> transfer_options_builder& {
        options_.concurrency = limit;
        return *this;
    }

    auto with_transactional_digest(bool enable = true) -> transfer_options_builder& {
        options_.use_transactional_digest = enable;
        return *this;
    }

    auto with_final_digest(bool enable = true) -> transfer_options_builder& {
        options_.store_final_digest = enable;
        return *this;
    }

    auto with_digest_validation_disabled(bool disable = true) -> transfer_options_builder& {
        options_.disable_digest_validation = disable;
        return *this;
    }

    auto with_id_prefix(std::string prefix) -> transfer_options_builder& {
        options_.id_prefix = std::move(prefix);
        return *this;
    }

    auto with_execution_budget(std::chrono::milliseconds budget) -> transfer_options_builder& {
        options_.execution_budget = budget;
        return *this;
    }

    auto with_request_timeout(std::chrono::milliseconds timeout) -> transfer_options_builder& {
        options_.request_timeout = timeout;
        return *this;
    }

    auto with_location_mode(location_mode mode) -> transfer_options_builder& {
        options_.location = mode;
        return *this;
    }

    auto with_content_digest(std::string digest) -> transfer_options_builder& {
        options_.content_digest_override = std::move(digest);
        return *this;
    }

    auto with_content_type(std::string type) -> transfer_options_builder& {
        options_.content_type = std::move(type);
        return *this;
    }

    auto with_resume(std::set<std::string> staged) -> transfer_options_builder& {
        options_.resume_staged_blocks = std::move(staged);
        return *this;
    }

    auto with_range_size(std::size_t size) -> transfer_options_builder& {
        options_.range_size = size;
        return *this;
    }

    auto with_sparse_page_download(bool enable = true) -> transfer_options_builder& {
        options_.sparse_page_download = enable;
        return *this;
    }

    auto with_progress(progress_callback callback) -> transfer_options_builder& {
        options_.on_progress = std::move(callback);
        return *this;
    }

    [[nodiscard]] auto build() const -> transfer_options { return options_; }

private:
    transfer_options options_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CONFIG_TRANSFER_OPTIONS_H
