/**
 * @file checksum.cpp
 * @brief Implementation of content digest utilities
 */

#include <kcenon/blob_transfer/core/checksum.h>

#include <algorithm>
#include <fstream>

#include <openssl/evp.h>

namespace kcenon::blob_transfer {

namespace {

constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::size_t FILE_READ_BLOCK = 64 * 1024;

auto decode_base64_char(char c) -> int {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

struct evp_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

}  // namespace

// ============================================================================
// md5_accumulator
// ============================================================================

struct md5_accumulator::impl {
    std::unique_ptr<EVP_MD_CTX, evp_ctx_deleter> ctx;
    bool ready = false;
    bool finalized = false;
    uint64_t bytes = 0;
    std::array<uint8_t, digest_size> digest{};

    impl() : ctx(EVP_MD_CTX_new()) {
        ready = ctx && EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) == 1;
    }
};

md5_accumulator::md5_accumulator() : impl_(std::make_unique<impl>()) {}

md5_accumulator::~md5_accumulator() = default;

md5_accumulator::md5_accumulator(md5_accumulator&&) noexcept = default;
auto md5_accumulator::operator=(md5_accumulator&&) noexcept -> md5_accumulator& = default;

auto md5_accumulator::update(std::span<const std::byte> data) -> result<void> {
    if (!impl_->ready) {
        return unexpected{error{error_code::internal_error, "MD5 context unavailable"}};
    }
    if (impl_->finalized) {
        return unexpected{error{error_code::invalid_state, "digest already finalized"}};
    }
    if (data.empty()) {
        return {};
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        return unexpected{error{error_code::internal_error, "MD5 update failed"}};
    }
    impl_->bytes += data.size();
    return {};
}

auto md5_accumulator::finalize() -> result<std::array<uint8_t, digest_size>> {
    if (!impl_->ready) {
        return unexpected{error{error_code::internal_error, "MD5 context unavailable"}};
    }
    if (!impl_->finalized) {
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(impl_->ctx.get(), impl_->digest.data(), &len) != 1 ||
            len != digest_size) {
            return unexpected{error{error_code::internal_error, "MD5 finalize failed"}};
        }
        impl_->finalized = true;
    }
    return impl_->digest;
}

auto md5_accumulator::finalize_base64() -> result<std::string> {
    auto digest = finalize();
    if (!digest) {
        return unexpected{digest.error()};
    }
    return checksum::base64_encode(std::span<const uint8_t>(digest.value()));
}

auto md5_accumulator::bytes_hashed() const noexcept -> uint64_t {
    return impl_->bytes;
}

auto md5_accumulator::is_finalized() const noexcept -> bool {
    return impl_->finalized;
}

// ============================================================================
// checksum
// ============================================================================

auto checksum::md5_base64(std::span<const std::byte> data) -> result<std::string> {
    md5_accumulator md5;
    if (auto r = md5.update(data); !r) {
        return unexpected{r.error()};
    }
    return md5.finalize_base64();
}

auto checksum::md5_file_base64(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_not_found,
            "cannot open file: " + path.string()}};
    }

    md5_accumulator md5;
    std::vector<std::byte> buffer(FILE_READ_BLOCK);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        auto n = static_cast<std::size_t>(file.gcount());
        if (n == 0) break;
        if (auto r = md5.update(std::span<const std::byte>(buffer.data(), n)); !r) {
            return unexpected{r.error()};
        }
    }
    if (file.bad()) {
        return unexpected{error{error_code::source_read_error,
            "read failed: " + path.string()}};
    }
    return md5.finalize_base64();
}

auto checksum::is_all_zero(std::span<const std::byte> data) noexcept -> bool {
    return std::all_of(data.begin(), data.end(),
                       [](std::byte b) { return b == std::byte{0}; });
}

auto checksum::base64_encode(std::span<const uint8_t> data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

auto checksum::base64_decode(const std::string& encoded) -> std::vector<uint8_t> {
    std::vector<uint8_t> result;
    result.reserve((encoded.size() / 4) * 3);

    int bits = 0;
    int bit_count = 0;
    for (char c : encoded) {
        if (c == '=') break;
        int val = decode_base64_char(c);
        if (val < 0) continue;

        bits = ((bits << 6) | val) & 0xFFFFFF;
        bit_count += 6;
        if (bit_count >= 8) {
            bit_count -= 8;
            result.push_back(static_cast<uint8_t>((bits >> bit_count) & 0xFF));
        }
    }
    return result;
}

}  // namespace kcenon::blob_transfer
