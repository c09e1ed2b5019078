#include "string_functions.hpp"
#include "utils.hpp"
#include <stdexcept>

namespace endpoint_lib {

std::optional<std::string> substring(const std::string& input, std::size_t start,
                                     std::size_t stop, bool reverse) {
    if (start >= stop || input.size() < stop || !core::utils::isAscii(input)) {
        return std::nullopt;
    }
    if (reverse) {
        std::size_t r_start = input.size() - stop;
        std::size_t r_stop = input.size() - start;
        return input.substr(r_start, r_stop - r_start);
    }
    return input.substr(start, stop - start);
}

std::string uriEncode(const std::string& input) {
    static const char* kHex = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(input.size());
    for (char c : input) {
        if (core::utils::isAsciiAlnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(c);
        } else {
            unsigned char byte = static_cast<unsigned char>(c);
            encoded.push_back('%');
            encoded.push_back(kHex[byte >> 4]);
            encoded.push_back(kHex[byte & 0x0F]);
        }
    }
    return encoded;
}

core::StringArray split(const std::string& input, const std::string& delimiter, std::size_t limit) {
    if (delimiter.empty()) {
        throw std::invalid_argument("split delimiter cannot be empty");
    }
    return core::utils::splitLimited(input, delimiter, limit);
}

} // namespace endpoint_lib
