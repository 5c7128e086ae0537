/**
 * @file service_utils.cpp
 * @brief Blob service helper implementation
 */

#include <kcenon/blob_transfer/service/service_utils.h>
#include <kcenon/blob_transfer/service/http_types.h>

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace kcenon::blob_transfer {

namespace service_utils {

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto get_rfc1123_time() -> std::string {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string> {
    const std::string open_tag = "<" + tag + ">";
    const std::string close_tag = "</" + tag + ">";

    auto start_pos = xml.find(open_tag);
    if (start_pos == std::string::npos) {
        return std::nullopt;
    }
    start_pos += open_tag.length();

    auto end_pos = xml.find(close_tag, start_pos);
    if (end_pos == std::string::npos) {
        return std::nullopt;
    }

    return xml.substr(start_pos, end_pos - start_pos);
}

auto extract_xml_elements(const std::string& xml,
                          const std::string& tag) -> std::vector<std::string> {
    const std::string open_tag = "<" + tag + ">";
    const std::string close_tag = "</" + tag + ">";

    std::vector<std::string> values;
    std::size_t pos = 0;
    while ((pos = xml.find(open_tag, pos)) != std::string::npos) {
        pos += open_tag.length();
        auto end_pos = xml.find(close_tag, pos);
        if (end_pos == std::string::npos) {
            break;
        }
        values.push_back(xml.substr(pos, end_pos - pos));
        pos = end_pos + close_tag.length();
    }
    return values;
}

auto xml_escape(const std::string& value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

}  // namespace service_utils

auto http_request::full_url() const -> std::string {
    if (query.empty()) {
        return url;
    }
    std::string out = url;
    char separator = url.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : query) {
        out += separator;
        out += service_utils::url_encode(key);
        if (!value.empty()) {
            out += '=';
            out += service_utils::url_encode(value);
        }
        separator = '&';
    }
    return out;
}

}  // namespace kcenon::blob_transfer
