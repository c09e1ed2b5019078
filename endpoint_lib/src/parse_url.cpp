#include "parse_url.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cctype>

namespace endpoint_lib {

bool isIpv4Literal(const std::string& host) {
    std::vector<std::string> octets = core::utils::split(host, '.');
    if (octets.size() != 4) {
        return false;
    }
    for (const auto& octet : octets) {
        if (octet.empty() || octet.size() > 3) {
            return false;
        }
        for (char c : octet) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        if (std::stoi(octet) > 255) {
            return false;
        }
    }
    return true;
}

std::optional<core::Url> parseUrl(const std::string& input, core::DiagnosticCollector& diagnostics) {
    const std::string separator = "://";
    std::string::size_type scheme_end = input.find(separator);
    if (scheme_end == std::string::npos) {
        diagnostics.reportError(fmt::format("URL '{}' has no scheme", input));
        return std::nullopt;
    }

    core::Url url;
    url.scheme = input.substr(0, scheme_end);
    if (url.scheme != "http" && url.scheme != "https") {
        diagnostics.reportError(fmt::format("URL '{}' has unsupported scheme '{}'", input, url.scheme));
        return std::nullopt;
    }

    std::string rest = input.substr(scheme_end + separator.size());
    if (rest.find('?') != std::string::npos) {
        diagnostics.reportError(fmt::format("URL '{}' cannot have a query component", input));
        return std::nullopt;
    }
    if (rest.find('#') != std::string::npos) {
        diagnostics.reportError(fmt::format("URL '{}' cannot have a fragment", input));
        return std::nullopt;
    }

    std::string::size_type path_start = rest.find('/');
    url.authority = rest.substr(0, path_start);
    url.path = path_start == std::string::npos ? "" : rest.substr(path_start);
    if (url.authority.empty()) {
        diagnostics.reportError(fmt::format("URL '{}' has an empty authority", input));
        return std::nullopt;
    }

    // Host without userinfo or port
    std::string host = url.authority;
    std::string::size_type at = host.rfind('@');
    if (at != std::string::npos) {
        host = host.substr(at + 1);
    }
    if (!host.empty() && host.front() == '[') {
        if (host.find(']') == std::string::npos) {
            diagnostics.reportError(fmt::format("URL '{}' has an unterminated IPv6 literal", input));
            return std::nullopt;
        }
        url.is_ip = true;
    } else {
        std::string::size_type colon = host.find(':');
        url.is_ip = isIpv4Literal(host.substr(0, colon));
    }

    if (url.path.empty()) {
        url.normalized_path = "/";
    } else {
        url.normalized_path = url.path;
        if (url.normalized_path.front() != '/') {
            url.normalized_path.insert(url.normalized_path.begin(), '/');
        }
        if (url.normalized_path.back() != '/') {
            url.normalized_path.push_back('/');
        }
    }
    return url;
}

} // namespace endpoint_lib
