#pragma once

#include "common_types.hpp"
#include "diagnostics.hpp"
#include "evaluation_context.hpp"
#include "expression_evaluator.hpp"
#include "function_registry.hpp"
#include "interfaces.hpp"
#include "rule_model.hpp"
#include <optional>

namespace rules_engine {

    // --- ResultResolver ---
    // Turns the terminal reached by the DecisionWalker into the caller-visible
    // outcome. Variables the taken path never bound read as absent here.
    class ResultResolver {
    public:
        static constexpr const char* kNoMatchMessage = "No endpoint rule matched";

        ResultResolver(const RuleModel& model, const FunctionRegistry& registry);

        // 'result_index' nullopt is the NoMatch terminal
        ResolveOutcome render(std::optional<std::size_t> result_index,
                              const ParameterMap& params,
                              const EvaluationContext& context,
                              core::DiagnosticCollector& diagnostics) const;

    private:
        const RuleModel& model_;
        ExpressionEvaluator expressions_;

        ResolveOutcome renderEndpoint(std::size_t result_index, const EndpointTemplate& endpoint,
                                      const ParameterMap& params, const EvaluationContext& context,
                                      core::DiagnosticCollector& diagnostics) const;
    };

    // Copies the call's diagnostics into a failure of the given kind
    ResolveFailure makeFailure(FailureKind kind, std::string message, const core::DiagnosticCollector& diagnostics);

} // namespace rules_engine
