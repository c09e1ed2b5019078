#pragma once

#include "common_types.hpp"
#include "condition_evaluator.hpp"
#include "diagnostics.hpp"
#include "evaluation_context.hpp"
#include "rule_model.hpp"
#include <optional>

namespace rules_engine {

    // --- DecisionWalker ---
    // Follows the decision diagram from the root to a terminal. Outcomes are
    // memoized per condition index for the duration of one call, so a condition
    // shared by several nodes is evaluated (and binds) at most once.
    class DecisionWalker {
    public:
        enum class MemoState : std::uint8_t { Unevaluated, True, False };

        // step_budget 0 means "node count + 1"
        DecisionWalker(const RuleModel& model, const ConditionEvaluator& evaluator, std::size_t step_budget = 0);

        // Index of the reached result, or nullopt for the NoMatch terminal.
        // Throws core::MalformedModelException when the step budget is exhausted.
        std::optional<std::size_t> resolve(const ParameterMap& params,
                                           EvaluationContext& context,
                                           core::DiagnosticCollector& diagnostics) const;

        std::size_t stepBudget() const { return step_budget_; }

    private:
        const RuleModel& model_;
        const ConditionEvaluator& evaluator_;
        std::size_t step_budget_;
    };

} // namespace rules_engine
