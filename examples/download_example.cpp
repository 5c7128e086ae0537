/**
 * @file download_example.cpp
 * @brief Parallel ranged blob download with integrity validation
 *
 * This example demonstrates:
 * - Checking that a blob exists before downloading it
 * - Downloading into a file through file_sink with bounded concurrency
 * - Per-range Content-MD5 validation and sparse page blob downloads
 * - Reading from a secondary endpoint when the primary is unavailable
 */

#include <kcenon/blob_transfer/blob_transfer.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace kcenon::blob_transfer;

namespace {

void print_usage(const char* program) {
    std::cout << "Download Example - Blob Transfer" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program
              << " [options] <endpoint> <container> <blob_name> <local_file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --secondary <url>       Secondary endpoint used on read failover" << std::endl;
    std::cout << "  --token <query>         Capability token appended to every request" << std::endl;
    std::cout << "  -c, --concurrency <n>   Parallel range fetches (default: 5)" << std::endl;
    std::cout << "  --range <bytes>         Range size (default: 4194304)" << std::endl;
    std::cout << "  --md5                   Validate each range's Content-MD5" << std::endl;
    std::cout << "  --no-validate           Skip the whole-blob Content-MD5 check" << std::endl;
    std::cout << "  --dense                 Fetch page blob gaps instead of writing zeros"
              << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    service_endpoint endpoint;
    transfer_options_builder builder;
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
            builder.with_location_mode(location_mode::primary_then_secondary);
        } else if (arg == "--token") {
            auto value = next_value("--token");
            if (!value) return 1;
            endpoint.capability_token = *value;
        } else if (arg == "-c" || arg == "--concurrency") {
            auto value = next_value("--concurrency");
            if (!value) return 1;
            builder.with_concurrency(static_cast<std::size_t>(std::stoul(*value)));
        } else if (arg == "--range") {
            auto value = next_value("--range");
            if (!value) return 1;
            builder.with_range_size(static_cast<std::size_t>(std::stoul(*value)));
        } else if (arg == "--md5") {
            builder.with_transactional_digest();
        } else if (arg == "--no-validate") {
            builder.with_digest_validation_disabled();
        } else if (arg == "--dense") {
            builder.with_sparse_page_download(false);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 4) {
        print_usage(argv[0]);
        return 1;
    }
    endpoint.primary = positional[0];
    const std::string container = positional[1];
    const std::string blob = positional[2];
    const std::filesystem::path local_path = positional[3];

    auto service = blob_service_client::create(endpoint, retry_options::exponential());
    const auto options = builder.build();

    auto present = service.with_options(options).exists(container, blob);
    if (!present) {
        std::cerr << "Existence check failed: " << present.error().message << std::endl;
        return 1;
    }
    if (!present.value()) {
        std::cerr << "Blob " << container << "/" << blob << " does not exist" << std::endl;
        return 1;
    }

    range_downloader downloader(service);
    file_sink sink(local_path);

    const auto start = std::chrono::steady_clock::now();
    auto outcome = downloader.download(container, blob, sink, options);
    if (!outcome) {
        const auto& err = outcome.error();
        std::cerr << "Download failed: " << err.message;
        if (err.http_status != 0) {
            std::cerr << " (HTTP " << err.http_status << " " << err.service_code << ")";
        }
        std::cerr << std::endl;
        return 1;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    const auto& info = outcome.value();
    std::cout << "Downloaded " << info.total_bytes << " bytes of " << to_string(info.kind)
              << " to " << local_path << " (" << elapsed.count() << " ms)" << std::endl;
    std::cout << "  Fetched ranges: " << info.fetched_ranges << std::endl;
    std::cout << "  Zero ranges:    " << info.zero_ranges << std::endl;
    std::cout << "  Peak in flight: " << downloader.peak_in_flight() << std::endl;
    if (info.computed_md5) {
        std::cout << "  Content-MD5:    " << *info.computed_md5 << " (verified)" << std::endl;
    }
    return 0;
}
