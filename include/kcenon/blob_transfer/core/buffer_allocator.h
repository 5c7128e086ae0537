/**
 * @file buffer_allocator.h
 * @brief Fixed arena of transfer buffers addressed by index
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_BUFFER_ALLOCATOR_H
#define KCENON_BLOB_TRANSFER_CORE_BUFFER_ALLOCATOR_H

#include <kcenon/blob_transfer/core/bounded_channel.h>
#include <kcenon/blob_transfer/core/types.h>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace kcenon::blob_transfer {

class buffer_allocator;

/**
 * @brief Exclusive ownership of one arena buffer
 *
 * Move-only. The lease returns its buffer to the arena when released or
 * destroyed, whichever comes first. The arena must outlive every lease.
 */
class buffer_lease {
public:
    buffer_lease() = default;
    ~buffer_lease();

    buffer_lease(buffer_lease&& other) noexcept;
    auto operator=(buffer_lease&& other) noexcept -> buffer_lease&;
    buffer_lease(const buffer_lease&) = delete;
    auto operator=(const buffer_lease&) -> buffer_lease& = delete;

    [[nodiscard]] auto valid() const noexcept -> bool { return owner_ != nullptr; }

    /// Arena slot backing this lease
    [[nodiscard]] auto index() const noexcept -> std::size_t { return index_; }

    /// Bytes in use (set by the filler, at most capacity())
    [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t;

    /// Writable view over the whole buffer
    [[nodiscard]] auto writable() noexcept -> std::span<std::byte>;

    /// Read-only view over the bytes in use
    [[nodiscard]] auto data() const noexcept -> std::span<const std::byte>;

    void resize(std::size_t used) noexcept;

    /**
     * @brief Give the buffer back to the arena now
     */
    void release() noexcept;

private:
    friend class buffer_allocator;

    buffer_lease(buffer_allocator* owner, std::size_t index, std::size_t size) noexcept
        : owner_(owner), index_(index), size_(size) {}

    buffer_allocator* owner_ = nullptr;
    std::size_t index_ = 0;
    std::size_t size_ = 0;
};

/**
 * @brief Arena of `capacity` buffers of `buffer_size` bytes
 *
 * Free slots travel through a bounded channel of indices, so an exhausted
 * arena blocks acquire() until some lease is released. Releases may arrive
 * in any order and from any thread.
 *
 * Storage is allocated on first acquisition.
 */
class buffer_allocator {
public:
    /**
     * @param buffer_size Size of each buffer in bytes
     * @param capacity Number of buffers in the arena
     */
    buffer_allocator(std::size_t buffer_size, std::size_t capacity);
    ~buffer_allocator();

    buffer_allocator(const buffer_allocator&) = delete;
    auto operator=(const buffer_allocator&) -> buffer_allocator& = delete;

    /**
     * @brief Lease a buffer, blocking until one is free
     * @param size Bytes the caller intends to use
     * @return Lease, or error if size exceeds buffer_size or the arena is closed
     */
    [[nodiscard]] auto acquire(std::size_t size) -> result<buffer_lease>;

    /**
     * @brief Lease a buffer if one is free right now
     */
    [[nodiscard]] auto try_acquire(std::size_t size) -> std::optional<buffer_lease>;

    /**
     * @brief Return a lease to the arena
     */
    void release(buffer_lease& lease) noexcept;

    /**
     * @brief Wake blocked acquirers with an error and refuse new leases
     */
    void close();

    [[nodiscard]] auto buffer_size() const noexcept -> std::size_t { return buffer_size_; }
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }
    [[nodiscard]] auto outstanding() const noexcept -> std::size_t;
    [[nodiscard]] auto peak_outstanding() const noexcept -> std::size_t;

private:
    friend class buffer_lease;

    void ensure_storage();
    auto make_lease(std::size_t index, std::size_t size) -> buffer_lease;
    auto slot(std::size_t index) noexcept -> std::span<std::byte>;

    const std::size_t buffer_size_;
    const std::size_t capacity_;

    std::once_flag storage_once_;
    std::vector<std::unique_ptr<std::byte[]>> slots_;
    bounded_channel<std::size_t> free_slots_;

    std::atomic<std::size_t> outstanding_{0};
    std::atomic<std::size_t> peak_outstanding_{0};
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_BUFFER_ALLOCATOR_H
