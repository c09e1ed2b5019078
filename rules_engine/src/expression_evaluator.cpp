#include "expression_evaluator.hpp"
#include "standard_library.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace rules_engine {

ExpressionEvaluator::ExpressionEvaluator(const FunctionRegistry& registry)
    : registry_(registry)
{
}

core::OptionalValue ExpressionEvaluator::evaluate(const Expression& expr,
                                                  const ParameterMap& params,
                                                  const EvaluationContext& context,
                                                  core::DiagnosticCollector& diagnostics,
                                                  VariableAccess access) const {
    switch (expr.kind) {
        case Expression::Kind::Literal:
            return expr.literal;

        case Expression::Kind::Template:
            return core::Value(renderTemplate(expr, params, context, diagnostics, access));

        case Expression::Kind::ParameterRef: {
            auto it = params.find(expr.name);
            if (it == params.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        case Expression::Kind::VariableRef:
            if (!context.isBound(expr.name)) {
                if (access == VariableAccess::Strict) {
                    throw core::MalformedModelException(fmt::format("Variable '{}' read before the condition binding it was evaluated.",
                                                                    expr.name));
                }
                return std::nullopt;
            }
            return context.lookup(expr.name);

        case Expression::Kind::FunctionCall: {
            const FunctionDefinition& definition = registry_.lookup(expr.name);
            std::vector<core::OptionalValue> args;
            args.reserve(expr.args.size());
            for (const auto& arg : expr.args) {
                args.push_back(evaluate(arg, params, context, diagnostics, access));
            }
            return definition.impl(args, diagnostics);
        }

        case Expression::Kind::Coalesce: {
            // Every operand is evaluated, including those after the first present one
            std::vector<core::OptionalValue> operands;
            operands.reserve(expr.args.size());
            for (const auto& operand : expr.args) {
                operands.push_back(evaluate(operand, params, context, diagnostics, access));
            }
            return coalesceValues(operands);
        }

        case Expression::Kind::Record:
        case Expression::Kind::Tuple:
        case Expression::Kind::Document:
            throw core::MalformedModelException(fmt::format("'{}' is only valid inside endpoint properties.", expr.describe()));

        default:
            throw core::MalformedModelException("Unknown expression kind.");
    }
}

std::string ExpressionEvaluator::renderTemplate(const Expression& expr,
                                                const ParameterMap& params,
                                                const EvaluationContext& context,
                                                core::DiagnosticCollector& diagnostics,
                                                VariableAccess access) const {
    std::string rendered;
    for (const auto& part : expr.args) {
        core::OptionalValue value = evaluate(part, params, context, diagnostics, access);
        if (!value) {
            diagnostics.reportError(fmt::format("template segment {} is absent", part.describe()));
            core::logging::getLogger()->warn("Template segment {} evaluated to nothing; rendering it as empty.", part.describe());
            continue;
        }
        if (const auto* text = std::get_if<std::string>(&*value)) {
            rendered += *text;
        } else if (const auto* flag = std::get_if<bool>(&*value)) {
            rendered += *flag ? "true" : "false";
        } else if (const auto* number = std::get_if<std::int64_t>(&*value)) {
            rendered += std::to_string(*number);
        } else {
            throw core::MalformedModelException(fmt::format("Template segment {} produced {} which cannot be rendered as text.",
                                                            part.describe(), core::describe(value)));
        }
    }
    return rendered;
}

nlohmann::json ExpressionEvaluator::renderDocument(const Expression& expr,
                                                   const ParameterMap& params,
                                                   const EvaluationContext& context,
                                                   core::DiagnosticCollector& diagnostics) const {
    switch (expr.kind) {
        case Expression::Kind::Record: {
            nlohmann::json object = nlohmann::json::object();
            for (std::size_t i = 0; i < expr.keys.size(); ++i) {
                object[expr.keys[i]] = renderDocument(expr.args[i], params, context, diagnostics);
            }
            return object;
        }
        case Expression::Kind::Tuple: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : expr.args) {
                array.push_back(renderDocument(item, params, context, diagnostics));
            }
            return array;
        }
        case Expression::Kind::Document:
            return expr.document;
        default: {
            core::OptionalValue value = evaluate(expr, params, context, diagnostics, VariableAccess::Lenient);
            if (!value) {
                return nullptr;
            }
            return core::toJson(*value);
        }
    }
}

} // namespace rules_engine
