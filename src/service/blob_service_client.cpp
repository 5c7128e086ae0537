/**
 * @file blob_service_client.cpp
 * @brief Blob service client implementation
 */

#include <kcenon/blob_transfer/service/blob_service_client.h>

#include <kcenon/blob_transfer/core/error_codes.h>
#include <kcenon/blob_transfer/core/logging.h>
#include <kcenon/blob_transfer/service/service_utils.h>

#include <algorithm>
#include <charconv>
#include <sstream>

namespace kcenon::blob_transfer {

using service_utils::extract_xml_element;
using service_utils::extract_xml_elements;
using service_utils::get_rfc1123_time;
using service_utils::url_encode;

namespace {

auto parse_uint(const std::string& text) -> std::optional<uint64_t> {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto range_header(byte_range range) -> std::string {
    return "bytes=" + std::to_string(range.start) + "-" + std::to_string(range.last());
}

auto parse_block_section(const std::string& section, bool committed,
                         std::vector<block_entry>& out) -> void {
    for (const auto& block : extract_xml_elements(section, "Block")) {
        block_entry entry;
        entry.id = extract_xml_element(block, "Name").value_or("");
        entry.size = parse_uint(extract_xml_element(block, "Size").value_or("0")).value_or(0);
        entry.committed = committed;
        out.push_back(std::move(entry));
    }
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

blob_service_client::blob_service_client(service_endpoint endpoint,
                                         std::shared_ptr<blob_http_client> http,
                                         retry_options retry)
    : blob_service_client(std::move(endpoint), std::move(http), retry,
                          retry_filter_chain::from_options(
                              retry, location_mode::primary_only, std::nullopt,
                              blob_constants::default_request_timeout)) {}

blob_service_client::blob_service_client(service_endpoint endpoint,
                                         std::shared_ptr<blob_http_client> http,
                                         retry_options retry,
                                         std::unique_ptr<retry_filter_chain> chain)
    : endpoint_(std::move(endpoint)),
      http_(std::move(http)),
      retry_(retry),
      chain_(std::move(chain)) {}

blob_service_client::blob_service_client(blob_service_client&&) noexcept = default;
auto blob_service_client::operator=(blob_service_client&&) noexcept
    -> blob_service_client& = default;
blob_service_client::~blob_service_client() = default;

auto blob_service_client::create(service_endpoint endpoint, retry_options retry)
    -> blob_service_client {
    return blob_service_client(std::move(endpoint), make_network_blob_http_client(), retry);
}

auto blob_service_client::with_options(const transfer_options& options) const
    -> blob_service_client {
    auto chain = retry_filter_chain::from_options(retry_, options.location,
                                                  options.execution_budget,
                                                  options.request_timeout);
    if (sleeper_) {
        chain->set_sleeper(sleeper_);
    }
    blob_service_client sibling(endpoint_, http_, retry_, std::move(chain));
    sibling.sleeper_ = sleeper_;
    return sibling;
}

void blob_service_client::set_sleeper(retry_filter_chain::sleeper fn) {
    sleeper_ = fn;
    chain_->set_sleeper(std::move(fn));
}

// ============================================================================
// Request plumbing
// ============================================================================

auto blob_service_client::blob_path(const std::string& container,
                                    const std::string& blob) const -> std::string {
    return "/" + url_encode(container) + "/" + url_encode(blob, false);
}

auto blob_service_client::error_from_response(const http_response& response,
                                              std::string_view operation) -> error {
    const auto body = response.get_body_string();
    const auto service_code = extract_xml_element(body, "Code").value_or("");
    const auto service_message = extract_xml_element(body, "Message");

    std::string message = std::string(operation) + " failed with HTTP status " +
                          std::to_string(response.status_code);
    if (!service_code.empty()) {
        message += " (" + service_code + ")";
    }
    if (service_message) {
        message += ": " + *service_message;
    }

    return error{error_code_from_response(response.status_code, service_code),
                 std::move(message), response.status_code, service_code};
}

auto blob_service_client::send(http_request request,
                               const std::string& path,
                               std::initializer_list<int> expected,
                               request_location_mode mode,
                               std::string_view operation) -> result<http_response> {
    if (!http_) {
        return unexpected{error{error_code::not_initialized, "HTTP client not set"}};
    }

    if (mode == request_location_mode::primary_only &&
        chain_->mode() == location_mode::secondary_only) {
        return unexpected{error{error_code::invalid_configuration,
            std::string(operation) + " must go to the primary location, "
            "which the secondary_only location mode excludes"}};
    }

    request.headers["x-ms-version"] = endpoint_.api_version;

    const std::vector<int> accepted(expected);
    return chain_->execute(
        [&](const attempt_info& attempt) -> result<http_response> {
            request.url = endpoint_.url_for(attempt.location) + path;
            if (endpoint_.capability_token && !endpoint_.capability_token->empty()) {
                request.url += "?" + *endpoint_.capability_token;
            }
            request.timeout = attempt.timeout;
            request.headers["x-ms-date"] = get_rfc1123_time();

            BT_LOG_TRACE(log_category::service,
                         std::string(to_string(request.method)) + " " + request.full_url() +
                         " (" + std::string(to_string(attempt.location)) + ", attempt " +
                         std::to_string(attempt.attempt + 1) + ")");

            auto response = http_->send(request);
            if (!response) {
                return unexpected{response.error()};
            }
            if (std::find(accepted.begin(), accepted.end(), response.value().status_code) ==
                accepted.end()) {
                return unexpected{error_from_response(response.value(), operation)};
            }
            return std::move(response).value();
        },
        mode, operation);
}

// ============================================================================
// Writes
// ============================================================================

auto blob_service_client::put_block(const std::string& container,
                                    const std::string& blob,
                                    const std::string& block_id,
                                    std::span<const std::byte> body,
                                    const std::optional<std::string>& content_md5)
    -> result<http_response> {
    if (body.size() > blob_constants::max_block_size) {
        return unexpected{error{error_code::chunk_too_large,
            "block of " + std::to_string(body.size()) + " bytes exceeds the block limit"}};
    }

    http_request request;
    request.method = http_method::put;
    request.query["comp"] = "block";
    request.query["blockid"] = block_id;
    request.headers["Content-Length"] = std::to_string(body.size());
    if (content_md5) {
        request.headers["Content-MD5"] = *content_md5;
    }
    request.body = body;

    return send(std::move(request), blob_path(container, blob), {201},
                request_location_mode::primary_only, "put_block");
}

auto blob_service_client::create_page_blob(const std::string& container,
                                           const std::string& blob,
                                           uint64_t length,
                                           const blob_properties& properties)
    -> result<http_response> {
    if (length % blob_constants::page_size != 0) {
        return unexpected{error{error_code::invalid_page_alignment,
            "page blob length " + std::to_string(length) + " is not a multiple of 512"}};
    }

    http_request request;
    request.method = http_method::put;
    request.headers["x-ms-blob-type"] = "PageBlob";
    request.headers["x-ms-blob-content-length"] = std::to_string(length);
    request.headers["Content-Length"] = "0";
    if (properties.content_type) {
        request.headers["x-ms-blob-content-type"] = *properties.content_type;
    }

    return send(std::move(request), blob_path(container, blob), {201},
                request_location_mode::primary_only, "create_page_blob");
}

auto blob_service_client::put_page(const std::string& container,
                                   const std::string& blob,
                                   byte_range range,
                                   std::span<const std::byte> body,
                                   const std::optional<std::string>& content_md5)
    -> result<http_response> {
    if (range.empty() || range.start % blob_constants::page_size != 0 ||
        range.end % blob_constants::page_size != 0) {
        return unexpected{error{error_code::invalid_page_alignment,
            "page range [" + std::to_string(range.start) + ", " + std::to_string(range.end) +
            ") is not 512-byte aligned"}};
    }
    if (range.size() != body.size()) {
        return unexpected{error{error_code::invalid_range,
            "page range size does not match body size"}};
    }
    if (body.size() > blob_constants::max_update_page_size) {
        return unexpected{error{error_code::chunk_too_large,
            "page write of " + std::to_string(body.size()) + " bytes exceeds the page limit"}};
    }

    http_request request;
    request.method = http_method::put;
    request.query["comp"] = "page";
    request.headers["x-ms-page-write"] = "update";
    request.headers["x-ms-range"] = range_header(range);
    request.headers["Content-Length"] = std::to_string(body.size());
    if (content_md5) {
        request.headers["Content-MD5"] = *content_md5;
    }
    request.body = body;

    return send(std::move(request), blob_path(container, blob), {201},
                request_location_mode::primary_only, "put_page");
}

auto blob_service_client::commit_block_list(const std::string& container,
                                            const std::string& blob,
                                            const std::vector<std::string>& block_ids,
                                            const blob_properties& properties)
    -> result<http_response> {
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<BlockList>\n";
    for (const auto& id : block_ids) {
        xml << "  <Latest>" << service_utils::xml_escape(id) << "</Latest>\n";
    }
    xml << "</BlockList>";
    const std::string body = xml.str();

    http_request request;
    request.method = http_method::put;
    request.query["comp"] = "blocklist";
    request.headers["Content-Type"] = "application/xml";
    request.headers["Content-Length"] = std::to_string(body.size());
    if (properties.content_type) {
        request.headers["x-ms-blob-content-type"] = *properties.content_type;
    }
    if (properties.content_md5) {
        request.headers["x-ms-blob-content-md5"] = *properties.content_md5;
    }
    request.body = std::as_bytes(std::span<const char>(body.data(), body.size()));

    return send(std::move(request), blob_path(container, blob), {201},
                request_location_mode::primary_only, "commit_block_list");
}

auto blob_service_client::set_blob_properties(const std::string& container,
                                              const std::string& blob,
                                              const blob_properties& properties)
    -> result<http_response> {
    http_request request;
    request.method = http_method::put;
    request.query["comp"] = "properties";
    request.headers["Content-Length"] = "0";
    if (properties.content_type) {
        request.headers["x-ms-blob-content-type"] = *properties.content_type;
    }
    if (properties.content_md5) {
        request.headers["x-ms-blob-content-md5"] = *properties.content_md5;
    }
    if (properties.content_length) {
        request.headers["x-ms-blob-content-length"] = std::to_string(*properties.content_length);
    }

    return send(std::move(request), blob_path(container, blob), {200},
                request_location_mode::primary_only, "set_blob_properties");
}

// ============================================================================
// Reads
// ============================================================================

auto blob_service_client::get_blob_properties(const std::string& container,
                                              const std::string& blob) -> result<blob_info> {
    http_request request;
    request.method = http_method::head;

    auto response = send(std::move(request), blob_path(container, blob), {200},
                         request_location_mode::primary_or_secondary, "get_blob_properties");
    if (!response) {
        return unexpected{response.error()};
    }

    const auto& resp = response.value();
    blob_info info;
    info.content_length =
        parse_uint(resp.get_header("Content-Length").value_or("0")).value_or(0);
    info.kind = resp.get_header("x-ms-blob-type").value_or("BlockBlob") == "PageBlob"
                    ? blob_kind::page
                    : blob_kind::block;
    info.content_md5 = resp.get_header("Content-MD5");
    info.etag = resp.get_header("ETag");
    info.content_type = resp.get_header("Content-Type");
    info.last_modified = resp.get_header("Last-Modified");
    return info;
}

auto blob_service_client::exists(const std::string& container, const std::string& blob)
    -> result<bool> {
    auto info = get_blob_properties(container, blob);
    if (info) {
        return true;
    }
    if (info.error().code == error_code::blob_not_found) {
        return false;
    }
    return unexpected{info.error()};
}

auto blob_service_client::get_blob_range(const std::string& container,
                                         const std::string& blob,
                                         byte_range range,
                                         bool want_md5) -> result<http_response> {
    if (range.empty()) {
        return unexpected{error{error_code::invalid_range, "empty range requested"}};
    }

    http_request request;
    request.method = http_method::get;
    request.headers["x-ms-range"] = range_header(range);
    if (want_md5) {
        request.headers["x-ms-range-get-content-md5"] = "true";
    }

    return send(std::move(request), blob_path(container, blob), {200, 206},
                request_location_mode::primary_or_secondary, "get_blob_range");
}

auto blob_service_client::get_page_ranges(const std::string& container,
                                          const std::string& blob,
                                          std::optional<byte_range> range)
    -> result<std::vector<byte_range>> {
    http_request request;
    request.method = http_method::get;
    request.query["comp"] = "pagelist";
    if (range) {
        request.headers["x-ms-range"] = range_header(*range);
    }

    auto response = send(std::move(request), blob_path(container, blob), {200},
                         request_location_mode::primary_or_secondary, "get_page_ranges");
    if (!response) {
        return unexpected{response.error()};
    }

    std::vector<byte_range> ranges;
    const auto body = response.value().get_body_string();
    for (const auto& page : extract_xml_elements(body, "PageRange")) {
        auto start = parse_uint(extract_xml_element(page, "Start").value_or(""));
        auto end = parse_uint(extract_xml_element(page, "End").value_or(""));
        if (!start || !end || *end < *start) {
            return unexpected{error{error_code::internal_error,
                "malformed PageRange in page list response"}};
        }
        ranges.push_back(byte_range{*start, *end + 1});
    }
    std::sort(ranges.begin(), ranges.end(),
              [](const byte_range& a, const byte_range& b) { return a.start < b.start; });
    return ranges;
}

auto blob_service_client::list_blocks(const std::string& container,
                                      const std::string& blob,
                                      block_list_filter filter)
    -> result<std::vector<block_entry>> {
    http_request request;
    request.method = http_method::get;
    request.query["comp"] = "blocklist";
    request.query["blocklisttype"] = std::string(to_string(filter));

    auto response = send(std::move(request), blob_path(container, blob), {200},
                         request_location_mode::primary_or_secondary, "list_blocks");
    if (!response) {
        return unexpected{response.error()};
    }

    std::vector<block_entry> blocks;
    const auto body = response.value().get_body_string();
    if (auto committed = extract_xml_element(body, "CommittedBlocks")) {
        parse_block_section(*committed, true, blocks);
    }
    if (auto uncommitted = extract_xml_element(body, "UncommittedBlocks")) {
        parse_block_section(*uncommitted, false, blocks);
    }
    return blocks;
}

}  // namespace kcenon::blob_transfer
