#pragma once

#include <memory>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

#include "expression.hpp"
#include "rule_model.hpp"

namespace rules_engine {

    using json = nlohmann::json;

    class ModelFactory {
    public:
        // Builds a validated model from its JSON form. Structural problems raise
        // core::ModelLoadException, semantic ones core::MalformedModelException.
        static std::shared_ptr<const RuleModel> createModel(const json& document);

        static std::shared_ptr<const RuleModel> loadModelFromFile(const std::string& path);

    private:
        static Parameter parseParameter(const std::string& name, const json& config);
        static Condition parseCondition(std::size_t index, const json& config, const RefBinder& bind_ref);
        static Expression parseArgument(const json& config, const RefBinder& bind_ref);
        static ResultSpec parseResult(const json& config, const RefBinder& bind_ref);
        static Expression parseProperty(const json& config, const RefBinder& bind_ref);
        static DecisionNode parseNode(const json& config);
    };

} // namespace rules_engine
