#include "function_registry.hpp"
#include "rule_model.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <limits>
#include <stdexcept>
#include <string>

namespace rules_engine {

std::string Arity::describe() const {
    if (min == max) {
        return std::to_string(min);
    }
    if (max == std::numeric_limits<std::size_t>::max()) {
        return fmt::format("at least {}", min);
    }
    return fmt::format("{} to {}", min, max);
}

void FunctionRegistry::registerFunction(const std::string& id, FunctionImpl impl,
                                        bool needs_extra_state, core::ValueType return_type,
                                        Arity arity) {
    if (isFrozen()) {
        throw core::RegistryFrozenException(fmt::format("Cannot register '{}': the function registry is frozen.", id));
    }
    if (id.empty()) {
        throw std::invalid_argument("Function id cannot be empty.");
    }
    if (!impl) {
        throw std::invalid_argument(fmt::format("Function '{}' has no implementation.", id));
    }
    if (functions_.count(id) > 0) {
        throw core::DuplicateFunctionException(fmt::format("Function '{}' is already registered.", id));
    }
    if (arity.min > arity.max) {
        throw std::invalid_argument(fmt::format("Function '{}' has an empty arity range.", id));
    }

    FunctionDefinition definition;
    definition.id = id;
    definition.impl = std::move(impl);
    definition.needs_extra_state = needs_extra_state;
    definition.return_type = return_type;
    definition.arity = arity;
    functions_.emplace(id, std::move(definition));

    core::logging::getLogger()->trace("Registered rule function '{}' (returns {}, extra state: {})",
                                      id, core::typeName(return_type), needs_extra_state);
}

const FunctionDefinition& FunctionRegistry::lookup(const std::string& id) const {
    auto it = functions_.find(id);
    if (it == functions_.end()) {
        throw core::FunctionNotFoundException(fmt::format("Function '{}' is not registered.", id));
    }
    return it->second;
}

bool FunctionRegistry::contains(const std::string& id) const {
    return functions_.count(id) > 0;
}

std::set<std::string> FunctionRegistry::usedFunctions(const RuleModel& model) const {
    std::set<std::string> used;
    for (const auto& id : model.referencedFunctions()) {
        // lookup() throws for anything the model needs but nobody registered
        used.insert(lookup(id).id);
    }
    return used;
}

void FunctionRegistry::checkCalls(const RuleModel& model) const {
    model.forEachCall([this](const std::string& id, std::size_t arg_count, const std::string& where) {
        const FunctionDefinition& definition = lookup(id);
        if (!definition.arity.accepts(arg_count)) {
            throw core::MalformedModelException(fmt::format("{} calls '{}' with {} argument(s); it takes {}.",
                                                            where, id, arg_count, definition.arity.describe()));
        }
    });
}

std::set<std::string> FunctionRegistry::requiresExtraState(const RuleModel& model) const {
    std::set<std::string> result;
    for (const auto& id : usedFunctions(model)) {
        if (lookup(id).needs_extra_state) {
            result.insert(id);
        }
    }
    return result;
}

std::vector<std::string> FunctionRegistry::registeredIds() const {
    std::vector<std::string> ids;
    ids.reserve(functions_.size());
    for (const auto& entry : functions_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace rules_engine
