#pragma once

#include "datatypes.hpp"
#include <optional>
#include <string>

namespace endpoint_lib {

    // Characters [start, stop) of an ASCII string; with reverse the indices count
    // from the end. nullopt when start >= stop, stop > size, or the input is not ASCII.
    std::optional<std::string> substring(const std::string& input, std::size_t start,
                                         std::size_t stop, bool reverse);

    // Percent-encodes everything except RFC 3986 unreserved characters
    std::string uriEncode(const std::string& input);

    // Splits on a non-empty delimiter; limit 0 means unlimited, otherwise at most
    // 'limit' parts with the remainder left in the final part.
    core::StringArray split(const std::string& input, const std::string& delimiter, std::size_t limit);

} // namespace endpoint_lib
