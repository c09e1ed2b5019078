#pragma once

#include "datatypes.hpp"
#include "diagnostics.hpp"
#include <optional>
#include <string>

namespace endpoint_lib {

    // Parses an absolute http(s) URL into its rule-visible components.
    // URLs with a query string or a fragment are rejected.
    std::optional<core::Url> parseUrl(const std::string& input, core::DiagnosticCollector& diagnostics);

    // True for dotted-quad IPv4 literals ("10.0.0.1")
    bool isIpv4Literal(const std::string& host);

} // namespace endpoint_lib
