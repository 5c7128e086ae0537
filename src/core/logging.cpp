// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#include <kcenon/blob_transfer/core/logging.h>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::blob_transfer {

namespace {

void append_escaped(std::string& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char code[8];
                    std::snprintf(code, sizeof(code), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    out += code;
                } else {
                    out += c;
                }
        }
    }
}

/**
 * @brief Appends "name":value members to an open JSON object
 */
class json_fields {
public:
    explicit json_fields(std::string& out) : out_(out) {}

    void text(std::string_view name, std::string_view value) {
        key(name);
        out_ += '"';
        append_escaped(out_, value);
        out_ += '"';
    }

    void number(std::string_view name, int64_t value) {
        key(name);
        out_ += std::to_string(value);
    }

    void raw(std::string_view name, std::string_view json) {
        key(name);
        out_ += json;
    }

private:
    void key(std::string_view name) {
        if (!first_) out_ += ',';
        first_ = false;
        out_ += '"';
        out_ += name;
        out_ += "\":";
    }

    std::string& out_;
    bool first_ = true;
};

void append_context(json_fields& fields, const transfer_log_context& ctx,
                    const sensitive_info_masker* masker) {
    if (!ctx.transfer_id.empty()) fields.text("transfer_id", ctx.transfer_id);
    if (!ctx.blob_name.empty()) fields.text("blob", ctx.blob_name);
    if (ctx.total_length) fields.number("total_length", static_cast<int64_t>(*ctx.total_length));
    if (ctx.bytes_acknowledged) {
        fields.number("bytes_acknowledged", static_cast<int64_t>(*ctx.bytes_acknowledged));
    }
    if (ctx.sequence) fields.number("sequence", static_cast<int64_t>(*ctx.sequence));
    if (ctx.attempt) fields.number("attempt", *ctx.attempt);
    if (ctx.http_status) fields.number("http_status", *ctx.http_status);
    if (ctx.location) fields.text("location", *ctx.location);
    if (ctx.phase) fields.text("phase", *ctx.phase);
    if (ctx.duration_ms) fields.number("duration_ms", static_cast<int64_t>(*ctx.duration_ms));
    if (ctx.error_message) {
        fields.text("error_message",
                    masker ? masker->mask(*ctx.error_message) : *ctx.error_message);
    }
}

/// ISO-8601 UTC for JSON records, local time for text lines
auto format_timestamp(bool utc) -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    std::tm parts{};
#if defined(_WIN32)
    utc ? gmtime_s(&parts, &seconds) : localtime_s(&parts, &seconds);
#else
    utc ? gmtime_r(&seconds, &parts) : localtime_r(&seconds, &parts);
#endif

    std::ostringstream oss;
    oss << std::put_time(&parts, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis;
    if (utc) {
        oss << 'Z';
    }
    return oss.str();
}

}  // namespace

// ============================================================================
// sensitive_info_masker
// ============================================================================

auto sensitive_info_masker::mask(const std::string& input) const -> std::string {
    std::string masked = input;
    if (config_.mask_tokens) {
        static const std::regex signature(R"(([?&]sig=)[^&\s"]*)", std::regex::icase);
        masked = std::regex_replace(masked, signature, "$1" + config_.mask_text);
    }
    if (config_.mask_account_keys) {
        static const std::regex account_key(R"((AccountKey=)[^;\s"]*)", std::regex::icase);
        masked = std::regex_replace(masked, account_key, "$1" + config_.mask_text);
    }
    return masked;
}

// ============================================================================
// Structured records
// ============================================================================

auto transfer_log_context::to_json_with_masking(const sensitive_info_masker* masker) const
    -> std::string {
    std::string out = "{";
    json_fields fields(out);
    append_context(fields, *this, masker);
    out += '}';
    return out;
}

auto structured_log_entry::to_json_with_masking(const sensitive_info_masker* masker) const
    -> std::string {
    std::string out = "{";
    json_fields fields(out);
    fields.text("timestamp", timestamp);
    fields.text("level", to_string(level));
    fields.text("category", category);
    fields.text("message", masker ? masker->mask(message) : message);
    if (context) {
        append_context(fields, *context, masker);
    }
    if (source_file != nullptr) {
        std::string source = "{";
        json_fields location(source);
        location.text("file", source_file);
        if (source_line > 0) location.number("line", source_line);
        if (function_name != nullptr) location.text("function", function_name);
        source += '}';
        fields.raw("source", source);
    }
    out += '}';
    return out;
}

log_entry_builder::log_entry_builder() {
    entry_.timestamp = format_timestamp(true);
}

// ============================================================================
// blob_transfer_logger
// ============================================================================

struct blob_transfer_logger::backend {
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
        }
        return kcenon::logger::log_level::info;
    }

    std::unique_ptr<kcenon::logger::logger> logger;
#endif
};

blob_transfer_logger::blob_transfer_logger() : backend_(std::make_unique<backend>()) {}

blob_transfer_logger::~blob_transfer_logger() = default;

void blob_transfer_logger::initialize() {
    bool expected = false;
    if (!initialized_.compare_exchange_strong(expected, true)) {
        return;
    }

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    auto built = kcenon::logger::logger_builder()
        .with_async(true)
        .with_min_level(backend::to_logger_level(min_level_.load()))
        .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
        .build();
    if (built) {
        backend_->logger = std::move(built.value());
    } else {
        std::cerr << "blob_transfer: logger_system unavailable, logging to stderr\n";
    }
#endif
}

void blob_transfer_logger::shutdown() {
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    if (backend_->logger) {
        backend_->logger->flush();
        backend_->logger->stop();
        backend_->logger.reset();
    }
#endif
    initialized_ = false;
}

void blob_transfer_logger::flush() {
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    if (backend_->logger) {
        backend_->logger->flush();
    }
#endif
}

void blob_transfer_logger::set_level(log_level level) {
    min_level_.store(level);
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    if (backend_->logger) {
        backend_->logger->set_min_level(backend::to_logger_level(level));
    }
#endif
}

void blob_transfer_logger::set_output_format(log_output_format format) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    output_format_ = format;
}

auto blob_transfer_logger::get_output_format() const -> log_output_format {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return output_format_;
}

void blob_transfer_logger::set_masking_config(masking_config config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    masker_.set_config(std::move(config));
}

auto blob_transfer_logger::get_masking_config() const -> masking_config {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return masker_.config();
}

void blob_transfer_logger::set_callback(log_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

void blob_transfer_logger::log(log_level level,
                               std::string_view category,
                               std::string_view message,
                               const transfer_log_context* context,
                               const char* file,
                               int line,
                               const char* function) {
    if (!is_enabled(level)) {
        return;
    }

    log_output_format format;
    sensitive_info_masker masker;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        format = output_format_;
        masker = masker_;
    }

    const std::string masked = masker.mask(std::string(message));
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (callback_) {
            callback_(level, category, masked, context);
        }
    }

    std::string rendered;
    if (format == log_output_format::json) {
        log_entry_builder builder;
        builder.with_level(level).with_category(category).with_message(masked);
        if (file != nullptr) {
            builder.with_source_location(file, line, function);
        }
        if (context != nullptr) {
            builder.with_context(*context);
        }
        rendered = builder.build().to_json_with_masking(&masker);
    } else {
        rendered.append("[").append(category).append("] ").append(masked);
        if (context != nullptr) {
            rendered.append(" ").append(context->to_json_with_masking(&masker));
        }
    }

    write(level, rendered, file, line, function);
}

void blob_transfer_logger::write(log_level level,
                                 const std::string& rendered,
                                 [[maybe_unused]] const char* file,
                                 [[maybe_unused]] int line,
                                 [[maybe_unused]] const char* function) {
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    if (backend_->logger) {
        const auto target = backend::to_logger_level(level);
        if (file != nullptr && line > 0 && function != nullptr) {
            backend_->logger->log(target, rendered, file, line, function);
        } else {
            backend_->logger->log(target, rendered);
        }
        return;
    }
#endif
    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << format_timestamp(false) << " [" << to_string(level) << "] " << rendered
              << '\n';
}

auto get_logger() -> blob_transfer_logger& {
    static blob_transfer_logger instance;
    return instance;
}

}  // namespace kcenon::blob_transfer
