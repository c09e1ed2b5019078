#include "utils.hpp"
#include <algorithm>
#include <cctype>

namespace core {
namespace utils {

    std::string toLower(const std::string& input) {
        std::string lower_str = input;
        std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return lower_str;
    }

    std::vector<std::string> split(const std::string& input, char delimiter) {
        return splitAny(input, std::string(1, delimiter));
    }

    std::vector<std::string> splitAny(const std::string& input, const std::string& delimiters) {
        std::vector<std::string> parts;
        std::string::size_type start = 0;
        while (true) {
            std::string::size_type pos = input.find_first_of(delimiters, start);
            if (pos == std::string::npos) {
                parts.push_back(input.substr(start));
                break;
            }
            parts.push_back(input.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }

    std::vector<std::string> splitLimited(const std::string& input, const std::string& delimiter,
                                          std::size_t max_parts) {
        std::vector<std::string> parts;
        if (delimiter.empty()) {
            parts.push_back(input);
            return parts;
        }
        std::string::size_type start = 0;
        while (max_parts == 0 || parts.size() + 1 < max_parts) {
            std::string::size_type pos = input.find(delimiter, start);
            if (pos == std::string::npos) {
                break;
            }
            parts.push_back(input.substr(start, pos - start));
            start = pos + delimiter.size();
        }
        parts.push_back(input.substr(start));
        return parts;
    }

    bool isAscii(const std::string& input) {
        return std::all_of(input.begin(), input.end(),
            [](char c){ return static_cast<unsigned char>(c) < 0x80; });
    }

    bool isAsciiAlnum(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    }

} // namespace utils
} // namespace core
