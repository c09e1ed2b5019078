#include "diagnostics.hpp"
#include <spdlog/fmt/fmt.h>
#include <sstream>

namespace core {

void DiagnosticCollector::record(std::size_t condition_index, const std::string& function_id,
                                 const OptionalValue& value, bool outcome) {
    ConditionRecord entry;
    entry.condition_index = condition_index;
    entry.function_id = function_id;
    entry.value = value;
    entry.outcome = outcome;
    records_.push_back(std::move(entry));
}

void DiagnosticCollector::reportError(std::string message) {
    errors_.push_back(std::move(message));
}

std::string DiagnosticCollector::summary() const {
    std::stringstream ss;
    for (const auto& entry : records_) {
        ss << fmt::format("  cond[{}] {} -> {} ({})\n",
                          entry.condition_index, entry.function_id,
                          describe(entry.value), entry.outcome ? "true" : "false");
    }
    for (const auto& error : errors_) {
        ss << "  error: " << error << "\n";
    }
    return ss.str();
}

} // namespace core
