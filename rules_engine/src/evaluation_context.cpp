#include "evaluation_context.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

namespace rules_engine {

void EvaluationContext::bind(const std::string& name, core::OptionalValue value) {
    if (!variables_.emplace(name, std::move(value)).second) {
        throw core::MalformedModelException(fmt::format("Variable '{}' bound twice in one evaluation.", name));
    }
}

bool EvaluationContext::isBound(const std::string& name) const {
    return variables_.count(name) > 0;
}

core::OptionalValue EvaluationContext::lookup(const std::string& name) const {
    auto it = variables_.find(name);
    if (it == variables_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace rules_engine
