/**
 * @file upload_example.cpp
 * @brief Chunked block or page blob upload with progress and resume
 *
 * This example demonstrates:
 * - Building transfer_options with the fluent builder
 * - Uploading a local file as a block blob or page blob
 * - Reporting progress from the options callback
 * - Retrying a failed block upload from the blocks it already staged
 *
 * Resuming relies on a fixed block id prefix, so that a second run
 * produces the same ids as the blocks the first run staged.
 */

#include <kcenon/blob_transfer/blob_transfer.h>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::blob_transfer;

namespace {

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

void print_usage(const char* program) {
    std::cout << "Upload Example - Blob Transfer" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program
              << " [options] <endpoint> <container> <local_file> <blob_name>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --secondary <url>       Secondary endpoint for read failover" << std::endl;
    std::cout << "  --token <query>         Capability token appended to every request" << std::endl;
    std::cout << "  --page                  Upload as a page blob (512-aligned length)" << std::endl;
    std::cout << "  -c, --concurrency <n>   Parallel block uploads (default: 5)" << std::endl;
    std::cout << "  --chunk <bytes>         Chunk size, at most 4194304 (default: 4194304)" << std::endl;
    std::cout << "  --md5                   Send per-chunk Content-MD5 and store the final digest"
              << std::endl;
    std::cout << "  --retries <n>           Attempts per resume of a failed upload (default: 1)"
              << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

auto upload_once(blob_service_client& service,
                 const std::filesystem::path& local_path,
                 const blob_target& target,
                 blob_kind kind,
                 const transfer_options& options,
                 std::set<std::string>& staged) -> result<transfer_result> {
    auto source = file_source::open(local_path);
    if (!source) {
        return unexpected{source.error()};
    }

    transfer_request request;
    request.target = target;
    request.kind = kind;
    request.source = std::move(source.value());
    request.options = options;
    request.options.resume_staged_blocks = staged;

    transfer_orchestrator upload(std::move(request), service);
    auto outcome = upload.run();
    if (!outcome) {
        staged = upload.last_staged_blocks();
    }
    return outcome;
}

}  // namespace

int main(int argc, char* argv[]) {
    service_endpoint endpoint;
    blob_kind kind = blob_kind::block;
    std::size_t concurrency = blob_constants::default_concurrency;
    std::size_t chunk_size = blob_constants::default_chunk_size;
    bool use_md5 = false;
    int resume_attempts = 1;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&](const char* name) -> std::optional<std::string> {
            if (++i >= argc) {
                std::cerr << "Error: " << name << " requires an argument" << std::endl;
                return std::nullopt;
            }
            return std::string(argv[i]);
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--secondary") {
            auto value = next_value("--secondary");
            if (!value) return 1;
            endpoint.secondary = *value;
        } else if (arg == "--token") {
            auto value = next_value("--token");
            if (!value) return 1;
            endpoint.capability_token = *value;
        } else if (arg == "--page") {
            kind = blob_kind::page;
        } else if (arg == "-c" || arg == "--concurrency") {
            auto value = next_value("--concurrency");
            if (!value) return 1;
            concurrency = static_cast<std::size_t>(std::stoul(*value));
        } else if (arg == "--chunk") {
            auto value = next_value("--chunk");
            if (!value) return 1;
            chunk_size = static_cast<std::size_t>(std::stoul(*value));
        } else if (arg == "--md5") {
            use_md5 = true;
        } else if (arg == "--retries") {
            auto value = next_value("--retries");
            if (!value) return 1;
            resume_attempts = std::stoi(*value);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 4) {
        print_usage(argv[0]);
        return 1;
    }
    endpoint.primary = positional[0];
    const blob_target target{positional[1], positional[3]};
    const std::filesystem::path local_path = positional[2];

    auto options = transfer_options_builder()
                       .with_chunk_size(chunk_size)
                       .with_concurrency(concurrency)
                       .with_transactional_digest(use_md5)
                       .with_final_digest(use_md5)
                       .with_id_prefix("upload")
                       .with_location_mode(endpoint.secondary
                                               ? location_mode::primary_then_secondary
                                               : location_mode::primary_only)
                       .with_progress([](uint64_t done, uint64_t total) {
                           std::cout << "\r  " << format_bytes(done) << " / "
                                     << format_bytes(total) << std::flush;
                       })
                       .build();

    auto service = blob_service_client::create(endpoint, retry_options::exponential());

    std::cout << "Uploading " << local_path << " to " << target.container << "/"
              << target.blob << " as " << to_string(kind) << std::endl;

    const auto start = std::chrono::steady_clock::now();
    std::set<std::string> staged;
    result<transfer_result> outcome = unexpected{error{error_code::invalid_state}};
    for (int attempt = 0; attempt <= resume_attempts; ++attempt) {
        if (attempt > 0) {
            std::cout << "Resuming with " << staged.size() << " staged blocks" << std::endl;
        }
        outcome = upload_once(service, local_path, target, kind, options, staged);
        std::cout << std::endl;
        if (outcome || kind == blob_kind::page || staged.empty()) {
            break;
        }
    }

    if (!outcome) {
        const auto& err = outcome.error();
        std::cerr << "Upload failed: " << err.message;
        if (err.http_status != 0) {
            std::cerr << " (HTTP " << err.http_status << " " << err.service_code << ")";
        }
        std::cerr << std::endl;
        return 1;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    const auto& info = outcome.value();
    std::cout << "Uploaded " << format_bytes(info.total_bytes) << " in " << info.chunk_count
              << " chunks (" << elapsed.count() << " ms)" << std::endl;
    if (info.resumed_blocks > 0) {
        std::cout << "  Resumed blocks:     " << info.resumed_blocks << std::endl;
    }
    if (info.skipped_zero_pages > 0) {
        std::cout << "  Skipped zero pages: " << info.skipped_zero_pages << std::endl;
    }
    if (info.content_md5) {
        std::cout << "  Content-MD5:        " << *info.content_md5 << std::endl;
    }
    if (info.etag) {
        std::cout << "  ETag:               " << *info.etag << std::endl;
    }
    return 0;
}
