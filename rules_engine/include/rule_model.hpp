#pragma once

#include "common_types.hpp"
#include "expression.hpp"
#include "datatypes.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rules_engine {

    struct Parameter {
        std::string name;
        core::ValueType type = core::ValueType::String; // String, Boolean or StringArray
        bool required = false;
        std::optional<core::Value> default_value;
        std::string built_in;       // e.g. "AWS::Region"; metadata only
        std::string documentation;
        bool deprecated = false;
    };

    // Names the context variable a condition's function result is stored under
    struct Binding {
        std::string name;
        core::ValueType type = core::ValueType::Any;
    };

    struct Condition {
        std::size_t index = 0;           // ordinal, equal to position in the table
        std::string function_id;
        std::vector<Expression> args;
        std::optional<Binding> binding;
    };

    struct DecisionNode {
        std::uint32_t condition_index = 0;
        NodeRef high_ref = kNoMatchRef;  // followed when the condition is true
        NodeRef low_ref = kNoMatchRef;   // followed when the condition is false
    };

    struct EndpointTemplate {
        Expression url;
        std::vector<std::pair<std::string, std::vector<Expression>>> headers;
        std::vector<std::pair<std::string, Expression>> properties;
    };

    // --- ResultSpec ---
    // A terminal of the diagram: an Endpoint template or an Error message template
    struct ResultSpec {
        enum class Kind { Endpoint, Error };

        Kind kind = Kind::Error;
        Expression error_message;   // Kind::Error
        EndpointTemplate endpoint;  // Kind::Endpoint

        static ResultSpec makeError(Expression message);
        static ResultSpec makeEndpoint(EndpointTemplate endpoint);
    };

    // --- RuleModel ---
    // Immutable compiled rule set: parameters, condition and result tables, and
    // a reduced decision diagram stored as a flat node array.
    // The constructor validates every index, reference and binding and rejects
    // cyclic diagrams with core::MalformedModelException.
    class RuleModel {
    public:
        RuleModel(std::vector<Parameter> parameters,
                  std::vector<Condition> conditions,
                  std::vector<ResultSpec> results,
                  std::vector<DecisionNode> nodes,
                  NodeRef root,
                  std::string version = "1.1");

        const std::vector<Parameter>& parameters() const { return parameters_; }
        const std::vector<Condition>& conditions() const { return conditions_; }
        const std::vector<ResultSpec>& results() const { return results_; }
        const std::vector<DecisionNode>& nodes() const { return nodes_; }
        NodeRef root() const { return root_; }
        const std::string& version() const { return version_; }

        const Parameter* findParameter(const std::string& name) const;
        // Index of the condition that binds 'variable_name', if any
        std::optional<std::size_t> bindingCondition(const std::string& variable_name) const;

        // Every function id referenced by conditions and result expressions
        std::vector<std::string> referencedFunctions() const;

        // (function id, argument count, location such as "condition 2")
        using CallVisitor = std::function<void(const std::string&, std::size_t, const std::string&)>;
        // Visits each condition's call and every nested FunctionCall, conditions first
        void forEachCall(const CallVisitor& visit) const;

    private:
        std::vector<Parameter> parameters_;
        std::vector<Condition> conditions_;
        std::vector<ResultSpec> results_;
        std::vector<DecisionNode> nodes_;
        NodeRef root_;
        std::string version_;

        std::map<std::string, std::size_t> parameter_index_;
        std::map<std::string, std::size_t> binding_index_;

        void validate();
        void validateParameters();
        void validateConditions();
        void validateResults() const;
        void validateDiagram() const;
        void validateRef(NodeRef ref, const std::string& where) const;
        // 'max_binding' limits visible bindings to those from conditions < max_binding
        void validateExpression(const Expression& expr, std::size_t max_binding, const std::string& where) const;
        // getAttr needs a literal, well-formed path
        void validateAttrAccess(const std::vector<Expression>& args, const std::string& where) const;
    };

} // namespace rules_engine
