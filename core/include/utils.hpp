#pragma once

#include <string>
#include <vector>

namespace core {
namespace utils {

    // Lower-case copy (ASCII only)
    std::string toLower(const std::string& input);

    // Splits on a single delimiter. Empty segments are kept: split("a::b", ':') -> {"a", "", "b"}
    std::vector<std::string> split(const std::string& input, char delimiter);

    // Splits on any of the delimiter characters, keeping empty segments
    std::vector<std::string> splitAny(const std::string& input, const std::string& delimiters);

    // Splits on a (possibly multi-character) delimiter, producing at most max_parts
    // segments when max_parts > 0. The final segment keeps the unsplit remainder.
    std::vector<std::string> splitLimited(const std::string& input, const std::string& delimiter,
                                          std::size_t max_parts);

    bool isAscii(const std::string& input);
    bool isAsciiAlnum(char c);

} // namespace utils
} // namespace core
