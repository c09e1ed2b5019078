#pragma once

#include "common_types.hpp"
#include "diagnostics.hpp"
#include "evaluation_context.hpp"
#include "expression.hpp"
#include "function_registry.hpp"
#include <nlohmann/json.hpp>

namespace rules_engine {

    // How a reference to a variable with no binding in the context is treated
    enum class VariableAccess {
        Strict,  // core::MalformedModelException (condition arguments)
        Lenient  // absent (result rendering, where the path may have skipped the binder)
    };

    // --- ExpressionEvaluator ---
    // Evaluates argument and result expressions. Every sub-expression, including
    // every coalesce operand, is evaluated exactly once, left to right.
    class ExpressionEvaluator {
    public:
        explicit ExpressionEvaluator(const FunctionRegistry& registry);

        core::OptionalValue evaluate(const Expression& expr,
                                     const ParameterMap& params,
                                     const EvaluationContext& context,
                                     core::DiagnosticCollector& diagnostics,
                                     VariableAccess access) const;

        // Renders an endpoint property: records become objects, tuples arrays,
        // absent values null.
        nlohmann::json renderDocument(const Expression& expr,
                                      const ParameterMap& params,
                                      const EvaluationContext& context,
                                      core::DiagnosticCollector& diagnostics) const;

    private:
        const FunctionRegistry& registry_;

        std::string renderTemplate(const Expression& expr,
                                   const ParameterMap& params,
                                   const EvaluationContext& context,
                                   core::DiagnosticCollector& diagnostics,
                                   VariableAccess access) const;
    };

} // namespace rules_engine
