/**
 * @file buffer_allocator.cpp
 * @brief Implementation of the transfer buffer arena
 */

#include <kcenon/blob_transfer/core/buffer_allocator.h>

#include <kcenon/blob_transfer/core/logging.h>

#include <string>

namespace kcenon::blob_transfer {

// ============================================================================
// buffer_lease
// ============================================================================

buffer_lease::~buffer_lease() {
    release();
}

buffer_lease::buffer_lease(buffer_lease&& other) noexcept
    : owner_(other.owner_), index_(other.index_), size_(other.size_) {
    other.owner_ = nullptr;
    other.size_ = 0;
}

auto buffer_lease::operator=(buffer_lease&& other) noexcept -> buffer_lease& {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        index_ = other.index_;
        size_ = other.size_;
        other.owner_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

auto buffer_lease::capacity() const noexcept -> std::size_t {
    return owner_ ? owner_->buffer_size() : 0;
}

auto buffer_lease::writable() noexcept -> std::span<std::byte> {
    if (!owner_) return {};
    return owner_->slot(index_);
}

auto buffer_lease::data() const noexcept -> std::span<const std::byte> {
    if (!owner_) return {};
    return owner_->slot(index_).first(size_);
}

void buffer_lease::resize(std::size_t used) noexcept {
    size_ = used <= capacity() ? used : capacity();
}

void buffer_lease::release() noexcept {
    if (owner_) {
        owner_->release(*this);
    }
}

// ============================================================================
// buffer_allocator
// ============================================================================

buffer_allocator::buffer_allocator(std::size_t buffer_size, std::size_t capacity)
    : buffer_size_(buffer_size),
      capacity_(capacity == 0 ? 1 : capacity),
      free_slots_(capacity_) {
    for (std::size_t i = 0; i < capacity_; ++i) {
        (void)free_slots_.try_send(i);
    }
}

buffer_allocator::~buffer_allocator() {
    free_slots_.close();
}

void buffer_allocator::ensure_storage() {
    std::call_once(storage_once_, [this] {
        slots_.reserve(capacity_);
        for (std::size_t i = 0; i < capacity_; ++i) {
            slots_.push_back(std::make_unique<std::byte[]>(buffer_size_));
        }
        BT_LOG_DEBUG(log_category::allocator,
                     "Arena allocated: " + std::to_string(capacity_) + " x " +
                     std::to_string(buffer_size_) + " bytes");
    });
}

auto buffer_allocator::slot(std::size_t index) noexcept -> std::span<std::byte> {
    return std::span<std::byte>(slots_[index].get(), buffer_size_);
}

auto buffer_allocator::make_lease(std::size_t index, std::size_t size) -> buffer_lease {
    auto now = outstanding_.fetch_add(1, std::memory_order_acq_rel) + 1;
    auto peak = peak_outstanding_.load(std::memory_order_relaxed);
    while (now > peak &&
           !peak_outstanding_.compare_exchange_weak(peak, now, std::memory_order_relaxed)) {
    }
    return buffer_lease(this, index, size);
}

auto buffer_allocator::acquire(std::size_t size) -> result<buffer_lease> {
    if (size > buffer_size_) {
        return unexpected{error{error_code::chunk_too_large,
            "requested " + std::to_string(size) + " bytes exceeds buffer size " +
            std::to_string(buffer_size_)}};
    }
    if (free_slots_.is_closed()) {
        return unexpected{error{error_code::invalid_state, "allocator closed"}};
    }

    ensure_storage();

    auto index = free_slots_.receive();
    if (!index) {
        return unexpected{error{error_code::invalid_state, "allocator closed"}};
    }
    return make_lease(index.value(), size);
}

auto buffer_allocator::try_acquire(std::size_t size) -> std::optional<buffer_lease> {
    if (size > buffer_size_ || free_slots_.is_closed()) {
        return std::nullopt;
    }

    ensure_storage();

    auto index = free_slots_.try_receive();
    if (!index) {
        return std::nullopt;
    }
    return make_lease(*index, size);
}

void buffer_allocator::release(buffer_lease& lease) noexcept {
    if (lease.owner_ != this) {
        return;
    }
    auto index = lease.index_;
    lease.owner_ = nullptr;
    lease.size_ = 0;

    outstanding_.fetch_sub(1, std::memory_order_acq_rel);
    (void)free_slots_.try_send(index);
}

void buffer_allocator::close() {
    free_slots_.close();
}

auto buffer_allocator::outstanding() const noexcept -> std::size_t {
    return outstanding_.load(std::memory_order_acquire);
}

auto buffer_allocator::peak_outstanding() const noexcept -> std::size_t {
    return peak_outstanding_.load(std::memory_order_acquire);
}

}  // namespace kcenon::blob_transfer
