#include "result_resolver.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace rules_engine {

// --- ResolveOutcome ---

ResolveOutcome ResolveOutcome::fromEndpoint(core::Endpoint endpoint) {
    return ResolveOutcome(std::move(endpoint));
}

ResolveOutcome ResolveOutcome::fromFailure(ResolveFailure failure) {
    return ResolveOutcome(std::move(failure));
}

std::string ResolveOutcome::describe() const {
    if (isEndpoint()) {
        return fmt::format("Endpoint({})", endpoint().url);
    }
    return fmt::format("Failure({}: {})", failureKindName(failure().kind), failure().message);
}

ResolveFailure makeFailure(FailureKind kind, std::string message, const core::DiagnosticCollector& diagnostics) {
    ResolveFailure failure;
    failure.kind = kind;
    failure.message = std::move(message);
    failure.trace = diagnostics.records();
    failure.errors = diagnostics.errors();
    return failure;
}

// --- ResultResolver ---

ResultResolver::ResultResolver(const RuleModel& model, const FunctionRegistry& registry)
    : model_(model),
      expressions_(registry)
{
}

ResolveOutcome ResultResolver::render(std::optional<std::size_t> result_index,
                                      const ParameterMap& params,
                                      const EvaluationContext& context,
                                      core::DiagnosticCollector& diagnostics) const {
    if (!result_index) {
        return ResolveOutcome::fromFailure(makeFailure(FailureKind::NoRuleMatched, kNoMatchMessage, diagnostics));
    }
    const auto& results = model_.results();
    if (*result_index >= results.size()) {
        throw core::MalformedModelException(fmt::format("Result index {} out of range ({} results).",
                                                        *result_index, results.size()));
    }

    const ResultSpec& result = results[*result_index];
    if (result.kind == ResultSpec::Kind::Error) {
        core::OptionalValue message = expressions_.evaluate(result.error_message, params, context, diagnostics,
                                                            VariableAccess::Lenient);
        const auto* text = message ? std::get_if<std::string>(&*message) : nullptr;
        if (!text) {
            return ResolveOutcome::fromFailure(makeFailure(
                FailureKind::RenderError,
                fmt::format("Error result {} did not produce a message (got {})", *result_index, core::describe(message)),
                diagnostics));
        }
        return ResolveOutcome::fromFailure(makeFailure(FailureKind::RuleDefinedError, *text, diagnostics));
    }
    return renderEndpoint(*result_index, result.endpoint, params, context, diagnostics);
}

ResolveOutcome ResultResolver::renderEndpoint(std::size_t result_index, const EndpointTemplate& endpoint,
                                              const ParameterMap& params, const EvaluationContext& context,
                                              core::DiagnosticCollector& diagnostics) const {
    core::OptionalValue url = expressions_.evaluate(endpoint.url, params, context, diagnostics, VariableAccess::Lenient);
    const auto* url_text = url ? std::get_if<std::string>(&*url) : nullptr;
    if (!url_text) {
        return ResolveOutcome::fromFailure(makeFailure(
            FailureKind::RenderError,
            fmt::format("Endpoint result {} URL did not evaluate to a string (got {})", result_index, core::describe(url)),
            diagnostics));
    }

    core::Endpoint resolved;
    resolved.url = *url_text;

    for (const auto& [name, value_exprs] : endpoint.headers) {
        std::vector<std::string> values;
        for (const auto& value_expr : value_exprs) {
            core::OptionalValue value = expressions_.evaluate(value_expr, params, context, diagnostics, VariableAccess::Lenient);
            if (!value) {
                continue; // absent header values are dropped
            }
            const auto* text = std::get_if<std::string>(&*value);
            if (!text) {
                throw core::MalformedModelException(fmt::format("Header '{}' of result {} produced non-string value {}.",
                                                                name, result_index, core::describe(value)));
            }
            values.push_back(*text);
        }
        if (!values.empty()) {
            resolved.headers[name] = std::move(values);
        }
    }

    for (const auto& [name, property_expr] : endpoint.properties) {
        resolved.properties[name] = expressions_.renderDocument(property_expr, params, context, diagnostics);
    }

    core::logging::getLogger()->trace("Rendered result {} -> {}", result_index, resolved.url);
    return ResolveOutcome::fromEndpoint(std::move(resolved));
}

} // namespace rules_engine
