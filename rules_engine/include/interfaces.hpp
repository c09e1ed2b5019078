#pragma once

#include <set>
#include <string>
#include <variant>
#include <vector>

#include "common_types.hpp"
#include "datatypes.hpp"
#include "diagnostics.hpp"

namespace rules_engine {

    // A per-call failure. Never thrown; returned inside ResolveOutcome.
    struct ResolveFailure {
        FailureKind kind = FailureKind::NoRuleMatched;
        std::string message;
        std::vector<core::ConditionRecord> trace; // condition evaluations of this call
        std::vector<std::string> errors;          // problems reported by rule functions
    };

    // --- ResolveOutcome ---
    // Either the resolved Endpoint or a ResolveFailure
    class ResolveOutcome {
    public:
        static ResolveOutcome fromEndpoint(core::Endpoint endpoint);
        static ResolveOutcome fromFailure(ResolveFailure failure);

        bool isEndpoint() const { return std::holds_alternative<core::Endpoint>(value_); }
        bool isFailure() const { return !isEndpoint(); }

        // std::bad_variant_access when the other alternative is held
        const core::Endpoint& endpoint() const { return std::get<core::Endpoint>(value_); }
        const ResolveFailure& failure() const { return std::get<ResolveFailure>(value_); }

        std::string describe() const;

    private:
        explicit ResolveOutcome(std::variant<core::Endpoint, ResolveFailure> value) : value_(std::move(value)) {}

        std::variant<core::Endpoint, ResolveFailure> value_;
    };

    // --- Endpoint Resolver Interface ---
    // What the request pipeline consumes: parameters in, endpoint or failure out
    class IEndpointResolver {
    public:
        virtual ~IEndpointResolver() = default;

        virtual ResolveOutcome resolve(const ParameterMap& parameters) const = 0;

        // Function ids the loaded model exercises
        virtual const std::set<std::string>& usedFunctions() const = 0;
    };

} // namespace rules_engine
