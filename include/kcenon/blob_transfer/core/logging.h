// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <kcenon/blob_transfer/config/feature_flags.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::blob_transfer {

/**
 * @brief Category names, one per engine component
 */
struct log_category {
    static constexpr std::string_view producer = "blob_transfer.producer";
    static constexpr std::string_view allocator = "blob_transfer.allocator";
    static constexpr std::string_view scheduler = "blob_transfer.scheduler";
    static constexpr std::string_view retry = "blob_transfer.retry";
    static constexpr std::string_view orchestrator = "blob_transfer.orchestrator";
    static constexpr std::string_view service = "blob_transfer.service";
    static constexpr std::string_view download = "blob_transfer.download";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

[[nodiscard]] constexpr auto to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Which credentials are scrubbed from log output
 */
struct masking_config {
    bool mask_tokens = true;       ///< capability token signatures (sig=...)
    bool mask_account_keys = true; ///< AccountKey=... in connection strings
    std::string mask_text = "REDACTED";

    static auto all_masked() -> masking_config { return {}; }
    static auto none() -> masking_config { return {false, false, "REDACTED"}; }
};

/**
 * @brief Masks credentials that may appear in request URLs and messages
 *
 * Capability tokens travel in the query string, so any logged URL can leak
 * the signature unless it is scrubbed here.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::all_masked())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string;

    [[nodiscard]] auto config() const -> const masking_config& { return config_; }
    void set_config(masking_config config) { config_ = std::move(config); }

private:
    masking_config config_;
};

/**
 * @brief Per-transfer fields attached to a log line
 *
 * Only the fields that are set are rendered.
 */
struct transfer_log_context {
    std::string transfer_id;
    std::string blob_name;
    std::optional<uint64_t> total_length;
    std::optional<uint64_t> bytes_acknowledged;
    std::optional<uint64_t> sequence;
    std::optional<uint32_t> attempt;
    std::optional<int> http_status;
    std::optional<std::string> location;
    std::optional<std::string> phase;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string { return to_json_with_masking(nullptr); }

    /// @param masker Applied to error_message when not null
    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string;
};

/**
 * @brief One JSON log record
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    const char* source_file = nullptr;
    int source_line = 0;
    const char* function_name = nullptr;

    [[nodiscard]] auto to_json() const -> std::string { return to_json_with_masking(nullptr); }
    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string;
};

/**
 * @brief Fluent construction of a structured_log_entry
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::warn)
 *     .with_category(log_category::retry)
 *     .with_message("Retrying put_block")
 *     .with_attempt(2)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder();

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    auto with_blob(std::string_view blob) -> log_entry_builder& {
        context().blob_name = std::string(blob);
        return *this;
    }

    auto with_sequence(uint64_t sequence) -> log_entry_builder& {
        context().sequence = sequence;
        return *this;
    }

    auto with_attempt(uint32_t attempt) -> log_entry_builder& {
        context().attempt = attempt;
        return *this;
    }

    auto with_http_status(int status) -> log_entry_builder& {
        context().http_status = status;
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder& {
        entry_.source_file = file;
        entry_.source_line = line;
        entry_.function_name = function;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry { return entry_; }

private:
    auto context() -> transfer_log_context& {
        if (!entry_.context) {
            entry_.context.emplace();
        }
        return *entry_.context;
    }

    structured_log_entry entry_;
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for the engine
 *
 * Messages go to logger_system when it is linked in and initialize() has
 * been called, and to stderr otherwise. Every message is masked before it
 * reaches the callback or a writer. The callback observes each message that
 * passes the level filter.
 */
class blob_transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    blob_transfer_logger();
    ~blob_transfer_logger();

    blob_transfer_logger(const blob_transfer_logger&) = delete;
    auto operator=(const blob_transfer_logger&) -> blob_transfer_logger& = delete;

    /**
     * @brief Start the logger_system back end; repeated calls are ignored
     */
    void initialize();
    void shutdown();
    void flush();

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level);
    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }
    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void set_output_format(log_output_format format);
    [[nodiscard]] auto get_output_format() const -> log_output_format;

    void set_masking_config(masking_config config);
    [[nodiscard]] auto get_masking_config() const -> masking_config;

    void set_callback(log_callback callback);

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr);

private:
    void write(log_level level, const std::string& rendered,
               const char* file, int line, const char* function);

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};

    std::mutex callback_mutex_;
    log_callback callback_;

    mutable std::mutex config_mutex_;
    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;

    struct backend;
    std::unique_ptr<backend> backend_;
};

/**
 * @brief Global logger accessor
 */
auto get_logger() -> blob_transfer_logger&;

#define BT_LOG(level, category, message) \
    kcenon::blob_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define BT_LOG_CTX(level, category, message, context) \
    kcenon::blob_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define BT_LOG_TRACE(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::trace, category, message)

#define BT_LOG_DEBUG(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::debug, category, message)

#define BT_LOG_INFO(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::info, category, message)

#define BT_LOG_WARN(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::warn, category, message)

#define BT_LOG_ERROR(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::error, category, message)

#define BT_LOG_DEBUG_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::debug, category, message, ctx)

#define BT_LOG_INFO_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::info, category, message, ctx)

#define BT_LOG_WARN_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::warn, category, message, ctx)

#define BT_LOG_ERROR_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::error, category, message, ctx)

} // namespace kcenon::blob_transfer
