/**
 * @file range_downloader.cpp
 * @brief Implementation of parallel ranged downloads
 */

#include <kcenon/blob_transfer/transfer/range_downloader.h>

#include <kcenon/blob_transfer/core/checksum.h>
#include <kcenon/blob_transfer/core/logging.h>
#include <kcenon/blob_transfer/transfer/batch_scheduler.h>

#include <algorithm>
#include <array>
#include <condition_variable>
#include <functional>
#include <map>
#include <system_error>

namespace kcenon::blob_transfer {

namespace {

constexpr std::size_t zero_block_size = 64 * 1024;

auto zero_block() -> std::span<const std::byte> {
    static const std::array<std::byte, zero_block_size> zeros{};
    return zeros;
}

/**
 * @brief MD5 over pieces that arrive out of order, hashed in offset order
 *
 * Pieces ahead of the hashed prefix are held until the gap before them
 * has been filled. Callers bound the held bytes by not fetching past
 * within().
 */
class ordered_digest {
public:
    explicit ordered_digest(bool enabled) : enabled_(enabled) {}

    auto add(uint64_t offset, std::span<const std::byte> bytes) -> result<void> {
        if (!enabled_) {
            return {};
        }
        std::lock_guard lock(mutex_);
        pending_.emplace(offset, piece{std::vector<std::byte>(bytes.begin(), bytes.end()), 0});
        held_bytes_ += bytes.size();
        peak_held_bytes_ = std::max(peak_held_bytes_, held_bytes_);
        return advance();
    }

    auto add_zeros(uint64_t offset, uint64_t length) -> result<void> {
        if (!enabled_) {
            return {};
        }
        std::lock_guard lock(mutex_);
        pending_.emplace(offset, piece{{}, length});
        return advance();
    }

    /// True if a piece at `offset` lies less than `window` bytes past the hashed prefix
    auto within(uint64_t offset, uint64_t window) -> bool {
        if (!enabled_) {
            return true;
        }
        std::lock_guard lock(mutex_);
        return offset < next_ + window;
    }

    auto peak_held_bytes() -> uint64_t {
        std::lock_guard lock(mutex_);
        return peak_held_bytes_;
    }

    auto finish(uint64_t length) -> result<std::optional<std::string>> {
        if (!enabled_) {
            return std::optional<std::string>{};
        }
        std::lock_guard lock(mutex_);
        if (next_ != length) {
            return unexpected{error{error_code::content_length_mismatch,
                "hashed " + std::to_string(next_) + " of " + std::to_string(length) +
                " bytes"}};
        }
        auto digest = md5_.finalize_base64();
        if (!digest) {
            return unexpected{digest.error()};
        }
        return std::optional<std::string>{digest.value()};
    }

private:
    struct piece {
        std::vector<std::byte> bytes;
        uint64_t zeros = 0;
    };

    auto advance() -> result<void> {
        while (!pending_.empty() && pending_.begin()->first == next_) {
            auto node = pending_.extract(pending_.begin());
            auto& current = node.mapped();
            if (current.zeros > 0) {
                uint64_t left = current.zeros;
                while (left > 0) {
                    const auto n = static_cast<std::size_t>(
                        std::min<uint64_t>(left, zero_block_size));
                    if (auto updated = md5_.update(zero_block().first(n)); !updated) {
                        return updated;
                    }
                    left -= n;
                }
                next_ += current.zeros;
            } else {
                if (auto updated = md5_.update(current.bytes); !updated) {
                    return updated;
                }
                next_ += current.bytes.size();
                held_bytes_ -= current.bytes.size();
            }
        }
        return {};
    }

    const bool enabled_;
    std::mutex mutex_;
    std::map<uint64_t, piece> pending_;
    uint64_t next_ = 0;
    uint64_t held_bytes_ = 0;
    uint64_t peak_held_bytes_ = 0;
    md5_accumulator md5_;
};

/**
 * @brief GET of one range, checked and written to the sink
 */
class range_fetch : public batch_operation {
public:
    range_fetch(blob_service_client& client,
                const std::string& container,
                const std::string& blob,
                byte_range range,
                bool want_md5,
                range_sink& sink,
                ordered_digest& digest)
        : client_(client),
          container_(container),
          blob_(blob),
          range_(range),
          want_md5_(want_md5),
          sink_(sink),
          digest_(digest) {}

    auto describe() const -> std::string override {
        return "range_fetch [" + std::to_string(range_.start) + ", " +
               std::to_string(range_.end) + ")";
    }

    auto execute() -> result<void> override {
        auto response = client_.get_blob_range(container_, blob_, range_, want_md5_);
        if (!response) {
            return unexpected{response.error()};
        }

        const auto& body = response.value().body;
        if (body.size() != range_.size()) {
            return unexpected{error{error_code::content_length_mismatch,
                describe() + " returned " + std::to_string(body.size()) + " bytes"}};
        }

        const auto bytes = std::as_bytes(std::span<const uint8_t>(body));

        if (want_md5_) {
            auto expected = response.value().get_header("Content-MD5");
            if (!expected || expected->empty()) {
                return unexpected{error{error_code::md5_not_present,
                    describe() + " has no Content-MD5"}};
            }
            auto actual = checksum::md5_base64(bytes);
            if (!actual) {
                return unexpected{actual.error()};
            }
            if (actual.value() != *expected) {
                return unexpected{error{error_code::content_md5_mismatch,
                    describe() + " MD5 " + actual.value() + " != " + *expected}};
            }
        }

        if (auto written = sink_.write(range_.start, bytes); !written) {
            return written;
        }
        return digest_.add(range_.start, bytes);
    }

private:
    blob_service_client& client_;
    const std::string& container_;
    const std::string& blob_;
    byte_range range_;
    bool want_md5_;
    range_sink& sink_;
    ordered_digest& digest_;
};

auto write_zeros(range_sink& sink, byte_range range) -> result<void> {
    uint64_t offset = range.start;
    while (offset < range.end) {
        const auto n = static_cast<std::size_t>(
            std::min<uint64_t>(range.end - offset, zero_block_size));
        if (auto written = sink.write(offset, zero_block().first(n)); !written) {
            return written;
        }
        offset += n;
    }
    return {};
}

void split_into(std::vector<download_segment>& out, byte_range range, std::size_t range_size) {
    for (uint64_t start = range.start; start < range.end; start += range_size) {
        out.push_back({byte_range{start, std::min<uint64_t>(start + range_size, range.end)},
                       false});
    }
}

}  // namespace

// ============================================================================
// Sinks
// ============================================================================

auto memory_sink::prepare(uint64_t length) -> result<void> {
    std::lock_guard lock(mutex_);
    data_.assign(static_cast<std::size_t>(length), std::byte{0});
    return {};
}

auto memory_sink::write(uint64_t offset, std::span<const std::byte> data) -> result<void> {
    std::lock_guard lock(mutex_);
    if (offset + data.size() > data_.size()) {
        return unexpected{error{error_code::invalid_range,
            "write past end of memory sink at " + std::to_string(offset)}};
    }
    std::copy(data.begin(), data.end(),
              data_.begin() + static_cast<std::ptrdiff_t>(offset));
    return {};
}

void memory_sink::abort() {
    std::lock_guard lock(mutex_);
    data_.clear();
}

file_sink::file_sink(std::filesystem::path path) : path_(std::move(path)) {}

file_sink::~file_sink() {
    if (file_.is_open()) {
        file_.close();
    }
}

auto file_sink::prepare(uint64_t length) -> result<void> {
    std::lock_guard lock(mutex_);
    file_.open(path_, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        return unexpected{error{error_code::file_write_error,
            "cannot open " + path_.string() + " for writing"}};
    }

    std::error_code ec;
    std::filesystem::resize_file(path_, length, ec);
    if (ec) {
        return unexpected{error{error_code::file_write_error,
            "cannot size " + path_.string() + ": " + ec.message()}};
    }
    return {};
}

auto file_sink::write(uint64_t offset, std::span<const std::byte> data) -> result<void> {
    std::lock_guard lock(mutex_);
    file_.seekp(static_cast<std::streamoff>(offset));
    file_.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
    if (!file_) {
        return unexpected{error{error_code::file_write_error,
            "write to " + path_.string() + " failed at " + std::to_string(offset)}};
    }
    return {};
}

auto file_sink::finish() -> result<void> {
    std::lock_guard lock(mutex_);
    file_.flush();
    if (!file_) {
        return unexpected{error{error_code::file_write_error,
            "flush of " + path_.string() + " failed"}};
    }
    file_.close();
    return {};
}

void file_sink::abort() {
    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        BT_LOG_WARN(log_category::download,
                    "Could not remove partial file " + path_.string() + ": " + ec.message());
    }
}

// ============================================================================
// Planning
// ============================================================================

auto plan_download(uint64_t length,
                   std::size_t range_size,
                   const std::optional<std::vector<byte_range>>& valid_pages)
    -> std::vector<download_segment> {
    std::vector<download_segment> segments;
    if (length == 0 || range_size == 0) {
        return segments;
    }

    if (!valid_pages) {
        split_into(segments, byte_range{0, length}, range_size);
        return segments;
    }

    std::vector<byte_range> merged;
    for (auto page : *valid_pages) {
        page.end = std::min(page.end, length);
        if (page.start >= page.end) {
            continue;
        }
        // Small holes are cheaper to fetch than to skip
        if (!merged.empty() &&
            page.start < merged.back().end + blob_constants::min_write_page_size) {
            merged.back().end = std::max(merged.back().end, page.end);
            continue;
        }
        merged.push_back(page);
    }

    uint64_t cursor = 0;
    for (const auto& range : merged) {
        if (cursor < range.start) {
            segments.push_back({byte_range{cursor, range.start}, true});
        }
        split_into(segments, range, range_size);
        cursor = range.end;
    }
    if (cursor < length) {
        segments.push_back({byte_range{cursor, length}, true});
    }
    return segments;
}

// ============================================================================
// range_downloader
// ============================================================================

range_downloader::range_downloader(blob_service_client& service,
                                   std::shared_ptr<adapters::worker_pool_interface> pool)
    : service_(service), pool_(std::move(pool)) {}

auto range_downloader::download(const std::string& container,
                                const std::string& blob,
                                range_sink& sink,
                                const transfer_options& options) -> result<download_result> {
    if (options.concurrency == 0 || options.range_size == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "concurrency and range size must be positive"}};
    }
    get_logger().initialize();
    if (!pool_) {
        pool_ = adapters::worker_pool_factory::create(options.concurrency);
    }

    auto client = service_.with_options(options);

    auto info = client.get_blob_properties(container, blob);
    if (!info) {
        return unexpected{info.error()};
    }
    const auto length = info.value().content_length;

    download_result summary;
    summary.blob_name = blob;
    summary.kind = info.value().kind;
    summary.total_bytes = length;
    summary.stored_md5 = info.value().content_md5;
    summary.etag = info.value().etag;

    std::optional<std::vector<byte_range>> pages;
    if (summary.kind == blob_kind::page && options.sparse_page_download && length > 0) {
        auto listed = client.get_page_ranges(container, blob);
        if (!listed) {
            return unexpected{listed.error()};
        }
        pages = std::move(listed.value());
    }

    const auto segments = plan_download(length, options.range_size, pages);
    BT_LOG_DEBUG(log_category::download,
                 "Downloading " + container + "/" + blob + " (" + std::to_string(length) +
                 " bytes) in " + std::to_string(segments.size()) + " segments");

    if (auto prepared = sink.prepare(length); !prepared) {
        sink.abort();
        return unexpected{prepared.error()};
    }

    const bool hash_whole = !options.disable_digest_validation && summary.stored_md5.has_value();
    auto fetched = fetch_all(client, container, blob, sink, options, segments, length,
                             hash_whole, summary);
    if (!fetched) {
        sink.abort();
        BT_LOG_ERROR(log_category::download,
                     "Download of " + container + "/" + blob + " failed: " +
                     fetched.error().message);
        return unexpected{fetched.error()};
    }

    if (auto finished = sink.finish(); !finished) {
        sink.abort();
        return unexpected{finished.error()};
    }

    BT_LOG_INFO(log_category::download,
                "Downloaded " + container + "/" + blob + ", " +
                std::to_string(summary.fetched_ranges) + " ranges fetched, " +
                std::to_string(summary.zero_ranges) + " zero ranges");
    return summary;
}

auto range_downloader::fetch_all(blob_service_client& client,
                                 const std::string& container,
                                 const std::string& blob,
                                 range_sink& sink,
                                 const transfer_options& options,
                                 const std::vector<download_segment>& segments,
                                 uint64_t length,
                                 bool hash_whole,
                                 download_result& summary) -> result<void> {
    ordered_digest digest(hash_whole);
    std::optional<error> local_error;

    // Fetches hold at most `window` bytes ahead of the hashed prefix
    const uint64_t window = static_cast<uint64_t>(options.concurrency) * options.range_size;

    {
        std::mutex gate_mutex;
        std::condition_variable gate;
        bool aborted = false;
        auto wake = [&] {
            {
                std::lock_guard lock(gate_mutex);
            }
            gate.notify_all();
        };
        auto wait_until = [&](const std::function<bool()>& ready) -> bool {
            std::unique_lock lock(gate_mutex);
            gate.wait(lock, [&] { return aborted || ready(); });
            return !aborted;
        };

        batch_scheduler scheduler(options.concurrency, pool_,
                                  adapters::worker_stage::range_fetch);
        scheduler.on_drain(wake);

        for (const auto& segment : segments) {
            if (scheduler.failed()) {
                break;
            }
            if (segment.zero) {
                auto zeroed = write_zeros(sink, segment.range);
                if (zeroed) {
                    zeroed = digest.add_zeros(segment.range.start, segment.range.size());
                }
                if (!zeroed) {
                    local_error = zeroed.error();
                    break;
                }
                ++summary.zero_ranges;
                continue;
            }

            const bool want_md5 = options.use_transactional_digest &&
                segment.range.size() <= blob_constants::max_transactional_digest_size;
            if (!wait_until([&] { return digest.within(segment.range.start, window); })) {
                break;
            }

            auto fetch = std::make_unique<range_fetch>(client, container, blob, segment.range,
                                                       want_md5, sink, digest);
            fetch->set_completion([&](const error& err) {
                {
                    std::lock_guard lock(gate_mutex);
                    if (err.code != error_code::success) {
                        aborted = true;
                    }
                }
                gate.notify_all();
            });
            ++summary.fetched_ranges;
            if (scheduler.add_operation(std::move(fetch)) &&
                !wait_until([&] { return !scheduler.is_full(); })) {
                break;
            }
        }

        scheduler.enable_complete();
        auto batch_error = scheduler.wait_for_end();
        peak_in_flight_ = scheduler.peak_in_flight();
        peak_held_bytes_ = digest.peak_held_bytes();
        if (batch_error) {
            return unexpected{*batch_error};
        }
    }

    if (local_error) {
        return unexpected{*local_error};
    }

    auto computed = digest.finish(length);
    if (!computed) {
        return unexpected{computed.error()};
    }
    summary.computed_md5 = computed.value();
    if (summary.computed_md5 && *summary.computed_md5 != *summary.stored_md5) {
        return unexpected{error{error_code::content_md5_mismatch,
            "blob MD5 " + *summary.computed_md5 + " != stored " + *summary.stored_md5}};
    }
    return {};
}

}  // namespace kcenon::blob_transfer
