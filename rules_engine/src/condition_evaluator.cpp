#include "condition_evaluator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace rules_engine {

ConditionEvaluator::ConditionEvaluator(const RuleModel& model, const FunctionRegistry& registry)
    : model_(model),
      registry_(registry),
      expressions_(registry)
{
}

bool ConditionEvaluator::isTruthy(const core::OptionalValue& value) {
    if (!value) {
        return false;
    }
    if (const auto* flag = std::get_if<bool>(&*value)) {
        return *flag;
    }
    return true;
}

bool ConditionEvaluator::evaluate(std::size_t condition_index,
                                  const ParameterMap& params,
                                  EvaluationContext& context,
                                  core::DiagnosticCollector& diagnostics) const {
    const auto& conditions = model_.conditions();
    if (condition_index >= conditions.size()) {
        throw core::MalformedModelException(fmt::format("Condition index {} out of range ({} conditions).",
                                                        condition_index, conditions.size()));
    }
    const Condition& condition = conditions[condition_index];
    const FunctionDefinition& definition = registry_.lookup(condition.function_id);

    std::vector<core::OptionalValue> args;
    args.reserve(condition.args.size());
    for (const auto& arg : condition.args) {
        args.push_back(expressions_.evaluate(arg, params, context, diagnostics, VariableAccess::Strict));
    }

    core::OptionalValue value = definition.impl(args, diagnostics);

    if (condition.binding) {
        core::ValueType expected = condition.binding->type == core::ValueType::Any
                                       ? definition.return_type
                                       : condition.binding->type;
        if (value && !core::matchesType(*value, expected)) {
            throw core::MalformedModelException(fmt::format("Condition {} ({}) bound '{}' to {} but the binding is declared as {}.",
                                                            condition_index, condition.function_id, condition.binding->name,
                                                            core::describe(value), core::typeName(expected)));
        }
        context.bind(condition.binding->name, value);
    }

    bool outcome = isTruthy(value);
    diagnostics.record(condition_index, condition.function_id, value, outcome);
    core::logging::getLogger()->trace("Condition {} {} -> {} ({})", condition_index, condition.function_id,
                                      core::describe(value), outcome);
    return outcome;
}

} // namespace rules_engine
