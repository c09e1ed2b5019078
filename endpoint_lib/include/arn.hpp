#pragma once

#include "datatypes.hpp"
#include "diagnostics.hpp"
#include <optional>
#include <string>

namespace endpoint_lib {

    // Parses "arn:partition:service:region:account-id:resource".
    // partition, service and resource must be non-empty; region and account may be empty.
    // The resource is split on ':' and '/' into resource_id.
    // Returns nullopt (and reports the reason) for anything else.
    std::optional<core::Arn> parseArn(const std::string& input, core::DiagnosticCollector& diagnostics);

} // namespace endpoint_lib
