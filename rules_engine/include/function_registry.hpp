#pragma once

#include "datatypes.hpp"
#include "diagnostics.hpp"
#include <atomic>
#include <functional>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace rules_engine {

    class RuleModel;

    // Uniform function capability: already-evaluated, possibly-absent arguments in,
    // possibly-absent value out. Must be free of side effects other than its result
    // (and diagnostics it reports).
    using FunctionImpl = std::function<core::OptionalValue(const std::vector<core::OptionalValue>& args,
                                                           core::DiagnosticCollector& diagnostics)>;

    // Accepted argument counts, checked against every call site when a resolver is built
    struct Arity {
        std::size_t min = 0;
        std::size_t max = std::numeric_limits<std::size_t>::max(); // unbounded

        bool accepts(std::size_t count) const { return count >= min && count <= max; }
        std::string describe() const;
    };

    struct FunctionDefinition {
        std::string id;
        FunctionImpl impl;
        bool needs_extra_state = false;                   // e.g. partition tables
        core::ValueType return_type = core::ValueType::Any;
        Arity arity;
    };

    // --- FunctionRegistry ---
    // Identifier-keyed table of rule functions. Filled once during start-up, then
    // frozen; after freeze() it is read-only and may be shared between threads.
    class FunctionRegistry {
    public:
        FunctionRegistry() = default;
        FunctionRegistry(const FunctionRegistry&) = delete;
        FunctionRegistry& operator=(const FunctionRegistry&) = delete;

        // Throws core::RegistryFrozenException when frozen and
        // core::DuplicateFunctionException when 'id' is already taken
        void registerFunction(const std::string& id, FunctionImpl impl,
                              bool needs_extra_state = false,
                              core::ValueType return_type = core::ValueType::Any,
                              Arity arity = {});

        // Throws core::FunctionNotFoundException
        const FunctionDefinition& lookup(const std::string& id) const;
        bool contains(const std::string& id) const;

        // Function ids a model actually exercises (conditions and result expressions)
        std::set<std::string> usedFunctions(const RuleModel& model) const;
        // Throws core::FunctionNotFoundException for unknown ids and
        // core::MalformedModelException for a call with the wrong argument count
        void checkCalls(const RuleModel& model) const;
        // Subset of usedFunctions() flagged with needs_extra_state
        std::set<std::string> requiresExtraState(const RuleModel& model) const;

        std::vector<std::string> registeredIds() const;

        void freeze() { frozen_.store(true); }
        bool isFrozen() const { return frozen_.load(); }

    private:
        std::map<std::string, FunctionDefinition> functions_;
        std::atomic<bool> frozen_{false};
    };

} // namespace rules_engine
