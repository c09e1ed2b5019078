#pragma once

#include "common_types.hpp"
#include "diagnostics.hpp"
#include "evaluation_context.hpp"
#include "expression_evaluator.hpp"
#include "function_registry.hpp"
#include "rule_model.hpp"

namespace rules_engine {

    // --- ConditionEvaluator ---
    // Evaluates one condition of the model: resolves its arguments, invokes the
    // registered function once, stores the result under the condition's binding
    // (absent results included) and records the evaluation in the diagnostics.
    // Memoization is the caller's job (see DecisionWalker).
    class ConditionEvaluator {
    public:
        ConditionEvaluator(const RuleModel& model, const FunctionRegistry& registry);

        bool evaluate(std::size_t condition_index,
                      const ParameterMap& params,
                      EvaluationContext& context,
                      core::DiagnosticCollector& diagnostics) const;

        // absent -> false, bool -> itself, any other present value -> true
        static bool isTruthy(const core::OptionalValue& value);

    private:
        const RuleModel& model_;
        const FunctionRegistry& registry_;
        ExpressionEvaluator expressions_;
    };

} // namespace rules_engine
