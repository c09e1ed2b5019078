#pragma once

#include "datatypes.hpp"
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace rules_engine {

    // --- Expression ---
    // Argument and result expressions of the rule language. A small tagged tree:
    // only the members relevant to 'kind' are populated.
    struct Expression {
        enum class Kind {
            Literal,      // literal
            Template,     // args = parts, rendered and concatenated as a string
            ParameterRef, // name
            VariableRef,  // name (a condition binding)
            FunctionCall, // name = function id, args
            Coalesce,     // args, first present wins, else the last
            Record,       // keys + args (endpoint property objects)
            Tuple,        // args (endpoint property arrays)
            Document      // document (numbers / null inside endpoint properties)
        };

        Kind kind = Kind::Literal;
        core::Value literal;
        std::string name;
        std::vector<Expression> args;
        std::vector<std::string> keys;
        nlohmann::json document;

        static Expression makeLiteral(core::Value value);
        static Expression makeLiteral(const char* text); // string literal, not bool
        static Expression makeParameterRef(std::string parameter_name);
        static Expression makeVariableRef(std::string variable_name);
        static Expression makeCall(std::string function_id, std::vector<Expression> call_args);
        static Expression makeCoalesce(std::vector<Expression> operands);
        static Expression makeTemplate(std::vector<Expression> parts);
        static Expression makeRecord(std::vector<std::string> record_keys, std::vector<Expression> values);
        static Expression makeTuple(std::vector<Expression> items);
        static Expression makeDocument(nlohmann::json value);

        std::string describe() const;
    };

    // Turns a referenced name into a ParameterRef or VariableRef expression
    using RefBinder = std::function<Expression(const std::string& name)>;

    // Parses "https://{Region}.{partitionResult#dnsSuffix}/x". "{{" and "}}" escape braces.
    // A string without placeholders comes back as a string Literal.
    // Throws std::invalid_argument on unbalanced braces or empty placeholders.
    Expression parseTemplate(const std::string& text, const RefBinder& bind_ref);

    // Depth-first visit of every node in the tree (including 'expr' itself)
    void forEachNode(const Expression& expr, const std::function<void(const Expression&)>& visit);

} // namespace rules_engine
