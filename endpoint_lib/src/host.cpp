#include "host.hpp"
#include "parse_url.hpp"
#include "utils.hpp"
#include <algorithm>

namespace endpoint_lib {

namespace {

    bool isVirtualHostableSegment(const std::string& segment) {
        if (segment.size() < 3 || segment.size() > 63) {
            return false;
        }
        auto is_lower_alnum = [](char c) { return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'); };
        if (!is_lower_alnum(segment.front()) || !is_lower_alnum(segment.back())) {
            return false;
        }
        return std::all_of(segment.begin(), segment.end(),
            [&](char c) { return is_lower_alnum(c) || c == '-'; });
    }

} // end anonymous namespace

bool isValidHostLabel(const std::string& label, bool allow_subdomains) {
    if (allow_subdomains) {
        for (const auto& part : core::utils::split(label, '.')) {
            if (!isValidHostLabel(part, false)) {
                return false;
            }
        }
        return true;
    }
    if (label.empty() || label.size() > 63) {
        return false;
    }
    if (!core::utils::isAsciiAlnum(label.front())) {
        return false;
    }
    return std::all_of(label.begin(), label.end(),
        [](char c) { return core::utils::isAsciiAlnum(c) || c == '-'; });
}

bool isVirtualHostableS3Bucket(const std::string& bucket, bool allow_subdomains) {
    if (!allow_subdomains) {
        return isVirtualHostableSegment(bucket);
    }
    if (bucket.size() < 3 || bucket.size() > 63) {
        return false;
    }
    if (bucket.find(".-") != std::string::npos || bucket.find("-.") != std::string::npos) {
        return false;
    }
    if (isIpv4Literal(bucket)) {
        return false;
    }
    // Each dotted label must itself be a valid lower-case host label
    for (const auto& part : core::utils::split(bucket, '.')) {
        if (part.empty() || !isValidHostLabel(part, false) || core::utils::toLower(part) != part) {
            return false;
        }
    }
    return core::utils::isAsciiAlnum(bucket.front()) && core::utils::isAsciiAlnum(bucket.back());
}

} // namespace endpoint_lib
