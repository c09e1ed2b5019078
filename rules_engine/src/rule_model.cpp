#include "rule_model.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <set>
#include <stdexcept>
#include <variant>

namespace rules_engine {

ResultSpec ResultSpec::makeError(Expression message) {
    ResultSpec result;
    result.kind = Kind::Error;
    result.error_message = std::move(message);
    return result;
}

ResultSpec ResultSpec::makeEndpoint(EndpointTemplate endpoint) {
    ResultSpec result;
    result.kind = Kind::Endpoint;
    result.endpoint = std::move(endpoint);
    return result;
}

RuleModel::RuleModel(std::vector<Parameter> parameters,
                     std::vector<Condition> conditions,
                     std::vector<ResultSpec> results,
                     std::vector<DecisionNode> nodes,
                     NodeRef root,
                     std::string version)
    : parameters_(std::move(parameters)),
      conditions_(std::move(conditions)),
      results_(std::move(results)),
      nodes_(std::move(nodes)),
      root_(root),
      version_(std::move(version))
{
    validate();
    core::logging::getLogger()->debug("RuleModel created: {} parameter(s), {} condition(s), {} result(s), {} node(s), root {}",
                                      parameters_.size(), conditions_.size(), results_.size(), nodes_.size(), root_);
}

const Parameter* RuleModel::findParameter(const std::string& name) const {
    auto it = parameter_index_.find(name);
    return it == parameter_index_.end() ? nullptr : &parameters_[it->second];
}

std::optional<std::size_t> RuleModel::bindingCondition(const std::string& variable_name) const {
    auto it = binding_index_.find(variable_name);
    if (it == binding_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> RuleModel::referencedFunctions() const {
    std::set<std::string> ids;
    forEachCall([&ids](const std::string& id, std::size_t, const std::string&) { ids.insert(id); });
    return std::vector<std::string>(ids.begin(), ids.end());
}

void RuleModel::forEachCall(const CallVisitor& visit) const {
    auto nested = [&visit](const Expression& root, const std::string& where) {
        forEachNode(root, [&visit, &where](const Expression& expr) {
            if (expr.kind == Expression::Kind::FunctionCall) {
                visit(expr.name, expr.args.size(), where);
            }
        });
    };
    for (const auto& condition : conditions_) {
        std::string where = fmt::format("condition {}", condition.index);
        visit(condition.function_id, condition.args.size(), where);
        for (const auto& arg : condition.args) {
            nested(arg, where);
        }
    }
    for (std::size_t i = 0; i < results_.size(); ++i) {
        const ResultSpec& result = results_[i];
        std::string where = fmt::format("result {}", i);
        if (result.kind == ResultSpec::Kind::Error) {
            nested(result.error_message, where);
            continue;
        }
        nested(result.endpoint.url, where);
        for (const auto& header : result.endpoint.headers) {
            for (const auto& value : header.second) {
                nested(value, where);
            }
        }
        for (const auto& property : result.endpoint.properties) {
            nested(property.second, where);
        }
    }
}

// --- Validation ---

void RuleModel::validate() {
    validateParameters();
    validateConditions();
    validateResults();
    validateDiagram();
}

void RuleModel::validateParameters() {
    for (std::size_t i = 0; i < parameters_.size(); ++i) {
        const Parameter& param = parameters_[i];
        if (param.name.empty()) {
            throw core::MalformedModelException(fmt::format("Parameter #{} has an empty name.", i));
        }
        if (param.type != core::ValueType::String && param.type != core::ValueType::Boolean &&
            param.type != core::ValueType::StringArray) {
            throw core::MalformedModelException(fmt::format("Parameter '{}' has unsupported type '{}'.",
                                                            param.name, core::typeName(param.type)));
        }
        if (param.default_value && !core::matchesType(*param.default_value, param.type)) {
            throw core::MalformedModelException(fmt::format("Default of parameter '{}' is not of type '{}'.",
                                                            param.name, core::typeName(param.type)));
        }
        if (!parameter_index_.emplace(param.name, i).second) {
            throw core::MalformedModelException(fmt::format("Duplicate parameter '{}'.", param.name));
        }
    }
}

void RuleModel::validateConditions() {
    for (std::size_t i = 0; i < conditions_.size(); ++i) {
        const Condition& condition = conditions_[i];
        if (condition.index != i) {
            throw core::MalformedModelException(fmt::format("Condition at position {} declares index {}.", i, condition.index));
        }
        if (condition.function_id.empty()) {
            throw core::MalformedModelException(fmt::format("Condition {} has no function id.", i));
        }
        // Only bindings of earlier conditions are visible to this one
        for (const auto& arg : condition.args) {
            validateExpression(arg, i, fmt::format("condition {}", i));
        }
        if (condition.function_id == "getAttr") {
            validateAttrAccess(condition.args, fmt::format("condition {}", i));
        }
        if (condition.binding) {
            const std::string& name = condition.binding->name;
            if (name.empty()) {
                throw core::MalformedModelException(fmt::format("Condition {} has an empty binding name.", i));
            }
            if (parameter_index_.count(name) > 0) {
                throw core::MalformedModelException(fmt::format("Binding '{}' of condition {} shadows a parameter.", name, i));
            }
            if (!binding_index_.emplace(name, i).second) {
                throw core::MalformedModelException(fmt::format("Variable '{}' is bound by more than one condition.", name));
            }
        }
    }
}

void RuleModel::validateResults() const {
    for (std::size_t i = 0; i < results_.size(); ++i) {
        const ResultSpec& result = results_[i];
        std::string where = fmt::format("result {}", i);
        if (result.kind == ResultSpec::Kind::Error) {
            validateExpression(result.error_message, conditions_.size(), where);
            continue;
        }
        validateExpression(result.endpoint.url, conditions_.size(), where);
        for (const auto& header : result.endpoint.headers) {
            for (const auto& value : header.second) {
                validateExpression(value, conditions_.size(), where);
            }
        }
        for (const auto& property : result.endpoint.properties) {
            validateExpression(property.second, conditions_.size(), where);
        }
    }
}

void RuleModel::validateExpression(const Expression& expr, std::size_t max_binding, const std::string& where) const {
    switch (expr.kind) {
        case Expression::Kind::ParameterRef:
            if (parameter_index_.count(expr.name) == 0) {
                throw core::MalformedModelException(fmt::format("{} references unknown parameter '{}'.", where, expr.name));
            }
            break;
        case Expression::Kind::VariableRef: {
            auto it = binding_index_.find(expr.name);
            if (it == binding_index_.end() || it->second >= max_binding) {
                throw core::MalformedModelException(fmt::format("{} references variable '{}' which is not bound by an earlier condition.",
                                                                where, expr.name));
            }
            break;
        }
        case Expression::Kind::FunctionCall:
            if (expr.name.empty()) {
                throw core::MalformedModelException(fmt::format("{} contains a function call without an id.", where));
            }
            if (expr.name == "getAttr") {
                validateAttrAccess(expr.args, where);
            }
            break;
        case Expression::Kind::Coalesce:
            if (expr.args.empty()) {
                throw core::MalformedModelException(fmt::format("{} contains an empty coalesce.", where));
            }
            break;
        case Expression::Kind::Record:
            if (expr.keys.size() != expr.args.size()) {
                throw core::MalformedModelException(fmt::format("{} contains a record with mismatched keys.", where));
            }
            break;
        default:
            break;
    }
    for (const auto& arg : expr.args) {
        validateExpression(arg, max_binding, where);
    }
}

void RuleModel::validateAttrAccess(const std::vector<Expression>& args, const std::string& where) const {
    // Argument counts are checked against the function registry
    if (args.size() < 2) {
        return;
    }
    const Expression& path = args[1];
    const std::string* text = path.kind == Expression::Kind::Literal ? std::get_if<std::string>(&path.literal) : nullptr;
    if (!text) {
        throw core::MalformedModelException(fmt::format("{} calls getAttr without a literal string path.", where));
    }
    try {
        core::validateAttrPath(*text);
    } catch (const std::invalid_argument& e) {
        throw core::MalformedModelException(fmt::format("{}: {}", where, e.what()));
    }
}

void RuleModel::validateRef(NodeRef ref, const std::string& where) const {
    if (isNodeRef(ref)) {
        if (static_cast<std::size_t>(ref) >= nodes_.size()) {
            throw core::MalformedModelException(fmt::format("{} references node {} but only {} node(s) exist.",
                                                            where, ref, nodes_.size()));
        }
    } else if (isResultRef(ref)) {
        if (resultIndexOf(ref) >= results_.size()) {
            throw core::MalformedModelException(fmt::format("{} references result {} but only {} result(s) exist.",
                                                            where, resultIndexOf(ref), results_.size()));
        }
    }
}

void RuleModel::validateDiagram() const {
    validateRef(root_, "root");
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        const DecisionNode& node = nodes_[i];
        std::string where = fmt::format("node {}", i);
        if (node.condition_index >= conditions_.size()) {
            throw core::MalformedModelException(fmt::format("{} references condition {} but only {} condition(s) exist.",
                                                            where, node.condition_index, conditions_.size()));
        }
        validateRef(node.high_ref, where);
        validateRef(node.low_ref, where);
    }

    // Iterative three-colour DFS over the whole node array
    enum class Mark { Unvisited, InProgress, Done };
    std::vector<Mark> marks(nodes_.size(), Mark::Unvisited);
    for (std::size_t start = 0; start < nodes_.size(); ++start) {
        if (marks[start] != Mark::Unvisited) {
            continue;
        }
        // (node, next child to explore: 0 = high, 1 = low, 2 = finished)
        std::vector<std::pair<std::size_t, int>> stack;
        stack.emplace_back(start, 0);
        marks[start] = Mark::InProgress;
        while (!stack.empty()) {
            auto& [node_index, child] = stack.back();
            if (child == 2) {
                marks[node_index] = Mark::Done;
                stack.pop_back();
                continue;
            }
            NodeRef next = child == 0 ? nodes_[node_index].high_ref : nodes_[node_index].low_ref;
            ++child;
            if (!isNodeRef(next)) {
                continue;
            }
            std::size_t next_index = static_cast<std::size_t>(next);
            if (marks[next_index] == Mark::InProgress) {
                throw core::MalformedModelException(fmt::format("Decision diagram contains a cycle through node {}.", next_index));
            }
            if (marks[next_index] == Mark::Unvisited) {
                marks[next_index] = Mark::InProgress;
                stack.emplace_back(next_index, 0);
            }
        }
    }
}

} // namespace rules_engine
