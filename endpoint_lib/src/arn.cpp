#include "arn.hpp"
#include "utils.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace endpoint_lib {

std::optional<core::Arn> parseArn(const std::string& input, core::DiagnosticCollector& diagnostics) {
    std::vector<std::string> parts = core::utils::splitLimited(input, ":", 6);
    if (parts.size() != 6) {
        diagnostics.reportError(fmt::format("ARN '{}' must have 6 colon-delimited components", input));
        return std::nullopt;
    }
    if (parts[0] != "arn") {
        diagnostics.reportError(fmt::format("ARN '{}' must start with 'arn:'", input));
        return std::nullopt;
    }
    if (parts[1].empty()) {
        diagnostics.reportError(fmt::format("ARN '{}' has an empty partition", input));
        return std::nullopt;
    }
    if (parts[2].empty()) {
        diagnostics.reportError(fmt::format("ARN '{}' has an empty service", input));
        return std::nullopt;
    }
    if (parts[5].empty()) {
        diagnostics.reportError(fmt::format("ARN '{}' has an empty resource", input));
        return std::nullopt;
    }

    core::Arn arn;
    arn.partition = parts[1];
    arn.service = parts[2];
    arn.region = parts[3];
    arn.account_id = parts[4];
    arn.resource_id = core::utils::splitAny(parts[5], ":/");

    core::logging::getLogger()->trace("Parsed ARN '{}' -> {} resource segment(s)", input, arn.resource_id.size());
    return arn;
}

} // namespace endpoint_lib
