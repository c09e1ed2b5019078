#include "decision_walker.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <vector>

namespace rules_engine {

DecisionWalker::DecisionWalker(const RuleModel& model, const ConditionEvaluator& evaluator, std::size_t step_budget)
    : model_(model),
      evaluator_(evaluator),
      step_budget_(step_budget == 0 ? model.nodes().size() + 1 : step_budget)
{
}

std::optional<std::size_t> DecisionWalker::resolve(const ParameterMap& params,
                                                   EvaluationContext& context,
                                                   core::DiagnosticCollector& diagnostics) const {
    auto logger = core::logging::getLogger();
    const auto& nodes = model_.nodes();
    std::vector<MemoState> memo(model_.conditions().size(), MemoState::Unevaluated);

    NodeRef current = model_.root();
    std::size_t steps = 0;
    while (isNodeRef(current)) {
        if (++steps > step_budget_) {
            throw core::MalformedModelException(fmt::format("Decision walk exceeded its budget of {} steps at node {}.",
                                                            step_budget_, current));
        }
        const DecisionNode& node = nodes[static_cast<std::size_t>(current)];
        MemoState& state = memo[node.condition_index];
        if (state == MemoState::Unevaluated) {
            bool outcome = evaluator_.evaluate(node.condition_index, params, context, diagnostics);
            state = outcome ? MemoState::True : MemoState::False;
        } else {
            logger->trace("Node {} reuses memoized condition {}", current, node.condition_index);
        }
        current = state == MemoState::True ? node.high_ref : node.low_ref;
    }

    if (isResultRef(current)) {
        logger->trace("Decision walk reached result {} after {} step(s)", resultIndexOf(current), steps);
        return resultIndexOf(current);
    }
    logger->trace("Decision walk reached NoMatch after {} step(s)", steps);
    return std::nullopt;
}

} // namespace rules_engine
