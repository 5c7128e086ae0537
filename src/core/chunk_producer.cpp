/**
 * @file chunk_producer.cpp
 * @brief Implementation of source chunking
 */

#include <kcenon/blob_transfer/core/chunk_producer.h>

#include <kcenon/blob_transfer/core/logging.h>

#include <algorithm>
#include <system_error>

namespace kcenon::blob_transfer {

// ============================================================================
// stream_source
// ============================================================================

stream_source::stream_source(std::istream& stream,
                             std::optional<uint64_t> length,
                             std::string name)
    : stream_(stream), length_(length), name_(std::move(name)) {}

auto stream_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (buffer.empty() || stream_.eof()) {
        return std::size_t{0};
    }
    if (stream_.bad()) {
        return unexpected{error{error_code::source_read_error, "stream is in a bad state"}};
    }

    stream_.read(reinterpret_cast<char*>(buffer.data()),
                 static_cast<std::streamsize>(buffer.size()));
    if (stream_.bad()) {
        return unexpected{error{error_code::source_read_error, "failed to read " + name_}};
    }
    return static_cast<std::size_t>(stream_.gcount());
}

auto stream_source::exhausted() -> bool {
    if (!stream_.good()) return true;
    return stream_.peek() == std::istream::traits_type::eof();
}

// ============================================================================
// file_source
// ============================================================================

file_source::file_source(open_tag, std::filesystem::path path, std::ifstream file,
                         uint64_t size)
    : path_(std::move(path)), file_(std::move(file)), size_(size) {}

auto file_source::open(const std::filesystem::path& path)
    -> result<std::unique_ptr<file_source>> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return unexpected{error{error_code::file_not_found,
            "file not found: " + path.string()}};
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected{error{error_code::file_access_denied,
            "cannot stat file: " + path.string() + ": " + ec.message()}};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_access_denied,
            "cannot open file: " + path.string()}};
    }

    return std::make_unique<file_source>(open_tag{}, path, std::move(file),
                                         static_cast<uint64_t>(size));
}

auto file_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (offset_ >= size_ || buffer.empty()) {
        return std::size_t{0};
    }

    const auto want = static_cast<std::size_t>(
        std::min<uint64_t>(buffer.size(), size_ - offset_));
    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
    const auto got = static_cast<std::size_t>(file_.gcount());
    if (file_.bad() || (got == 0 && want > 0)) {
        return unexpected{error{error_code::source_read_error,
            "failed to read " + path_.string() + " at offset " + std::to_string(offset_)}};
    }

    offset_ += got;
    return got;
}

auto file_source::exhausted() -> bool {
    return offset_ >= size_;
}

// ============================================================================
// memory_source
// ============================================================================

memory_source::memory_source(std::vector<std::byte> data, std::string name)
    : data_(std::move(data)), name_(std::move(name)) {}

auto memory_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    const auto n = std::min(buffer.size(), data_.size() - offset_);
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), n, buffer.begin());
    offset_ += n;
    return n;
}

// ============================================================================
// chunk_producer
// ============================================================================

chunk_producer::chunk_producer(std::unique_ptr<chunk_source> source,
                               buffer_allocator& allocator,
                               std::size_t chunk_size,
                               std::optional<uint64_t> total_length)
    : source_(std::move(source)),
      allocator_(allocator),
      chunk_size_(std::min(chunk_size, allocator.buffer_size())),
      total_length_(total_length ? total_length : source_->length()) {}

auto chunk_producer::has_next() -> bool {
    if (finished_ || failed_ || cancelled_.load()) {
        return false;
    }
    if (total_length_.has_value()) {
        return bytes_emitted_ < *total_length_;
    }
    return !source_->exhausted();
}

auto chunk_producer::next() -> result<chunk> {
    {
        std::unique_lock lock(pause_mutex_);
        pause_cv_.wait(lock, [this] { return !paused_ || cancelled_.load(); });
    }

    if (cancelled_.load()) {
        return unexpected{error{error_code::transfer_aborted, "producer cancelled"}};
    }
    if (!has_next()) {
        return unexpected{error{error_code::invalid_state, "no more chunks available"}};
    }

    std::size_t want = chunk_size_;
    if (total_length_.has_value()) {
        want = static_cast<std::size_t>(
            std::min<uint64_t>(chunk_size_, *total_length_ - bytes_emitted_));
    }

    auto lease = allocator_.acquire(want);
    if (!lease) {
        return fail(lease.error());
    }

    auto filled = fill(lease.value(), want);
    if (!filled) {
        return fail(filled.error());
    }

    const auto got = filled.value();
    if (got == 0) {
        // Unknown-length stream ended exactly on a chunk boundary
        finished_ = true;
        return unexpected{error{error_code::invalid_state, "no more chunks available"}};
    }
    if (total_length_.has_value() && got < want) {
        return fail(error{error_code::source_read_error,
            "source ended at " + std::to_string(bytes_emitted_ + got) +
            " bytes, expected " + std::to_string(*total_length_)});
    }

    lease.value().resize(got);
    if (auto updated = digest_.update(lease.value().data()); !updated) {
        return fail(updated.error());
    }

    chunk out;
    out.sequence = chunks_emitted_;
    out.range = byte_range{bytes_emitted_, bytes_emitted_ + got};
    out.buffer = std::move(lease.value());

    bytes_emitted_ += got;
    ++chunks_emitted_;

    if (total_length_.has_value() ? bytes_emitted_ >= *total_length_ : got < want) {
        finished_ = true;
    }

    BT_LOG_TRACE(log_category::producer,
                 "Emitted chunk " + std::to_string(out.sequence) + " [" +
                 std::to_string(out.range.start) + ", " + std::to_string(out.range.end) +
                 ")");
    return out;
}

auto chunk_producer::fill(buffer_lease& lease, std::size_t want) -> result<std::size_t> {
    auto target = lease.writable().first(want);
    std::size_t got = 0;
    while (got < want) {
        auto n = source_->read(target.subspan(got));
        if (!n) {
            return unexpected{n.error()};
        }
        if (n.value() == 0) {
            break;
        }
        got += n.value();
    }
    return got;
}

auto chunk_producer::fail(error err) -> unexpected {
    failed_ = true;
    BT_LOG_ERROR(log_category::producer,
                 "Chunking " + source_->name() + " failed: " + err.message);
    return unexpected{std::move(err)};
}

void chunk_producer::pause() {
    std::lock_guard lock(pause_mutex_);
    paused_ = true;
}

void chunk_producer::resume() {
    {
        std::lock_guard lock(pause_mutex_);
        paused_ = false;
    }
    pause_cv_.notify_all();
}

void chunk_producer::cancel() {
    {
        std::lock_guard lock(pause_mutex_);
        cancelled_.store(true);
    }
    pause_cv_.notify_all();
}

auto chunk_producer::is_paused() const -> bool {
    std::lock_guard lock(pause_mutex_);
    return paused_;
}

auto chunk_producer::digest_base64() -> result<std::string> {
    if (digest_value_) {
        return *digest_value_;
    }
    if (!finished_ && has_next()) {
        return unexpected{error{error_code::invalid_state,
            "digest requested before the sequence ended"}};
    }
    auto digest = digest_.finalize_base64();
    if (!digest) {
        return unexpected{digest.error()};
    }
    digest_value_ = digest.value();
    return digest.value();
}

}  // namespace kcenon::blob_transfer
