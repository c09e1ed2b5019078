#pragma once

#include "interfaces.hpp"
#include "condition_evaluator.hpp"
#include "decision_walker.hpp"
#include "function_registry.hpp"
#include "result_resolver.hpp"
#include "rule_model.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace rules_engine {

    struct ResolverSettings {
        std::size_t step_budget = 0; // 0 -> node count + 1
        bool log_failures = true;    // debug-log failed resolves with their trace

        // Reads "stepBudget" and "logFailures"; throws core::ModelLoadException on wrong types
        static ResolverSettings fromJson(const nlohmann::json& config);
    };

    // --- EndpointResolver ---
    // Entry point of the engine. Construction freezes the registry and checks that
    // every function the model names is registered (core::FunctionNotFoundException
    // otherwise) and called with an accepted argument count
    // (core::MalformedModelException otherwise). resolve() is const and safe to call concurrently; all per-call
    // state lives on the stack of the call. The walker refers to the sibling
    // evaluator, so instances are neither copyable nor movable; share them
    // through std::shared_ptr or std::unique_ptr.
    class EndpointResolver : public IEndpointResolver {
    public:
        EndpointResolver(std::shared_ptr<const RuleModel> model,
                         std::shared_ptr<FunctionRegistry> registry,
                         ResolverSettings settings = {});

        EndpointResolver(const EndpointResolver&) = delete;
        EndpointResolver& operator=(const EndpointResolver&) = delete;
        EndpointResolver(EndpointResolver&&) = delete;
        EndpointResolver& operator=(EndpointResolver&&) = delete;

        ResolveOutcome resolve(const ParameterMap& parameters) const override;
        const std::set<std::string>& usedFunctions() const override { return used_functions_; }

        const RuleModel& model() const { return *model_; }
        const ResolverSettings& settings() const { return settings_; }

    private:
        std::shared_ptr<const RuleModel> model_;
        std::shared_ptr<FunctionRegistry> registry_;
        ResolverSettings settings_;
        std::set<std::string> used_functions_;

        ConditionEvaluator condition_evaluator_;
        DecisionWalker walker_;
        ResultResolver result_resolver_;

        // Applies defaults and checks declared types and requiredness.
        // Returns a description of the first problem, if any.
        std::optional<std::string> bindParameters(const ParameterMap& supplied, ParameterMap& bound) const;
        ResolveOutcome walkAndRender(const ParameterMap& bound, core::DiagnosticCollector& diagnostics) const;
    };

} // namespace rules_engine
