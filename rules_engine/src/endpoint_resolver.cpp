#include "endpoint_resolver.hpp"
#include "evaluation_context.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <stdexcept>

namespace rules_engine {

ResolverSettings ResolverSettings::fromJson(const nlohmann::json& config) {
    if (!config.is_object()) {
        throw core::ModelLoadException("Resolver settings must be a JSON object.");
    }
    ResolverSettings settings;
    if (config.contains("stepBudget")) {
        const auto& budget = config["stepBudget"];
        if (!budget.is_number_integer() || budget.get<std::int64_t>() < 0) {
            throw core::ModelLoadException("'stepBudget' must be a non-negative integer.");
        }
        settings.step_budget = budget.get<std::size_t>();
    }
    if (config.contains("logFailures")) {
        if (!config["logFailures"].is_boolean()) {
            throw core::ModelLoadException("'logFailures' must be a boolean.");
        }
        settings.log_failures = config["logFailures"].get<bool>();
    }
    return settings;
}

namespace {

    std::shared_ptr<const RuleModel> requireModel(std::shared_ptr<const RuleModel> model) {
        if (!model) {
            throw std::invalid_argument("EndpointResolver requires a rule model.");
        }
        return model;
    }

    std::shared_ptr<FunctionRegistry> requireRegistry(std::shared_ptr<FunctionRegistry> registry) {
        if (!registry) {
            throw std::invalid_argument("EndpointResolver requires a function registry.");
        }
        registry->freeze();
        return registry;
    }

} // end anonymous namespace

EndpointResolver::EndpointResolver(std::shared_ptr<const RuleModel> model,
                                   std::shared_ptr<FunctionRegistry> registry,
                                   ResolverSettings settings)
    : model_(requireModel(std::move(model))),
      registry_(requireRegistry(std::move(registry))),
      settings_(settings),
      used_functions_(registry_->usedFunctions(*model_)),
      condition_evaluator_(*model_, *registry_),
      walker_(*model_, condition_evaluator_, settings_.step_budget),
      result_resolver_(*model_, *registry_)
{
    registry_->checkCalls(*model_);

    auto logger = core::logging::getLogger();
    logger->info("EndpointResolver ready: model v{} with {} condition(s), {} result(s), {} node(s); step budget {}",
                 model_->version(), model_->conditions().size(), model_->results().size(),
                 model_->nodes().size(), walker_.stepBudget());
    logger->debug("Functions used by model: {}", fmt::join(used_functions_, ", "));
    auto stateful = registry_->requiresExtraState(*model_);
    if (!stateful.empty()) {
        logger->info("Model requires extra state for: {}", fmt::join(stateful, ", "));
    }
}

std::optional<std::string> EndpointResolver::bindParameters(const ParameterMap& supplied, ParameterMap& bound) const {
    for (const auto& [name, value] : supplied) {
        const Parameter* param = model_->findParameter(name);
        if (!param) {
            return fmt::format("Unknown parameter '{}'", name);
        }
        if (!core::matchesType(value, param->type)) {
            return fmt::format("Parameter '{}' must be of type {} but got {}", name, core::typeName(param->type),
                               core::describe(value));
        }
        bound.emplace(name, value);
    }
    for (const auto& param : model_->parameters()) {
        if (bound.count(param.name) > 0) {
            continue;
        }
        if (param.default_value) {
            core::logging::getLogger()->debug("Parameter '{}' defaulted to {}", param.name, core::describe(param.default_value));
            bound.emplace(param.name, *param.default_value);
        } else if (param.required) {
            return fmt::format("Missing required parameter '{}'", param.name);
        }
    }
    return std::nullopt;
}

ResolveOutcome EndpointResolver::walkAndRender(const ParameterMap& bound, core::DiagnosticCollector& diagnostics) const {
    EvaluationContext context;
    std::optional<std::size_t> result_index = walker_.resolve(bound, context, diagnostics);
    return result_resolver_.render(result_index, bound, context, diagnostics);
}

ResolveOutcome EndpointResolver::resolve(const ParameterMap& parameters) const {
    auto logger = core::logging::getLogger();
    core::DiagnosticCollector diagnostics;

    ParameterMap bound;
    std::optional<std::string> problem = bindParameters(parameters, bound);
    ResolveOutcome outcome = problem
        ? ResolveOutcome::fromFailure(makeFailure(FailureKind::InvalidParameters, *problem, diagnostics))
        : walkAndRender(bound, diagnostics);

    if (outcome.isFailure() && settings_.log_failures) {
        logger->debug("Endpoint resolution failed: {}\n{}", outcome.describe(), diagnostics.summary());
    } else {
        logger->debug("Endpoint resolution: {}", outcome.describe());
    }
    return outcome;
}

} // namespace rules_engine
