#include "model_factory.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "common_types.hpp"
#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace rules_engine {

    namespace { // File-local conversion helpers

        core::Value parseDefault(const std::string& name, core::ValueType type, const json& value) {
            switch (type) {
                case core::ValueType::String:
                    if (value.is_string()) return core::Value(value.get<std::string>());
                    break;
                case core::ValueType::Boolean:
                    if (value.is_boolean()) return core::Value(value.get<bool>());
                    break;
                case core::ValueType::StringArray:
                    if (value.is_array()) return core::Value(value.get<core::StringArray>());
                    break;
                default:
                    break;
            }
            throw std::invalid_argument(fmt::format("Default of parameter '{}' does not match its type '{}'.",
                                                    name, core::typeName(type)));
        }

        NodeRef parseRef(const json& value, const char* what) {
            if (!value.is_number_integer()) {
                throw std::invalid_argument(fmt::format("{} must be an integer reference.", what));
            }
            if (value.is_number_unsigned()) {
                if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<NodeRef>::max())) {
                    throw std::invalid_argument(fmt::format("{} {} is out of range.", what, value.dump()));
                }
                return static_cast<NodeRef>(value.get<std::uint64_t>());
            }
            return value.get<NodeRef>();
        }

    } // end anonymous namespace

    // --- Parameters ---
    Parameter ModelFactory::parseParameter(const std::string& name, const json& config) {
        if (!config.is_object() || !config.contains("type") || !config["type"].is_string()) {
            throw std::invalid_argument(fmt::format("Parameter '{}' must be an object with a 'type' (string).", name));
        }
        Parameter param;
        param.name = name;
        param.type = core::typeFromString(config["type"].get<std::string>());
        if (param.type != core::ValueType::String && param.type != core::ValueType::Boolean &&
            param.type != core::ValueType::StringArray) {
            throw std::invalid_argument(fmt::format("Parameter '{}' has unsupported type '{}'.", name,
                                                    config["type"].get<std::string>()));
        }
        param.required = config.value("required", false);
        if (config.contains("default") && !config["default"].is_null()) {
            param.default_value = parseDefault(name, param.type, config["default"]);
        }
        param.built_in = config.value("builtIn", std::string());
        param.documentation = config.value("documentation", std::string());
        if (config.contains("deprecated")) {
            const auto& deprecated = config["deprecated"];
            // Either a flag or a {message, since} object
            param.deprecated = deprecated.is_boolean() ? deprecated.get<bool>() : !deprecated.is_null();
        }
        return param;
    }

    // --- Argument expressions ---
    Expression ModelFactory::parseArgument(const json& config, const RefBinder& bind_ref) {
        if (config.is_string()) {
            return parseTemplate(config.get<std::string>(), bind_ref);
        }
        if (config.is_boolean()) {
            return Expression::makeLiteral(core::Value(config.get<bool>()));
        }
        if (config.is_number_integer()) {
            return Expression::makeLiteral(core::Value(config.get<std::int64_t>()));
        }
        if (config.is_array()) {
            core::StringArray items;
            for (const auto& item : config) {
                if (!item.is_string()) {
                    throw std::invalid_argument("Array literals may only contain strings.");
                }
                items.push_back(item.get<std::string>());
            }
            return Expression::makeLiteral(core::Value(std::move(items)));
        }
        if (config.is_object() && config.contains("ref")) {
            if (!config["ref"].is_string()) {
                throw std::invalid_argument("'ref' must be a string.");
            }
            return bind_ref(config["ref"].get<std::string>());
        }
        if (config.is_object() && config.contains("fn")) {
            if (!config["fn"].is_string() || !config.contains("argv") || !config["argv"].is_array()) {
                throw std::invalid_argument("Function call requires 'fn' (string) and 'argv' (array).");
            }
            std::string fn = config["fn"].get<std::string>();
            std::vector<Expression> args;
            for (const auto& arg : config["argv"]) {
                args.push_back(parseArgument(arg, bind_ref));
            }
            if (fn == "coalesce") {
                return Expression::makeCoalesce(std::move(args));
            }
            return Expression::makeCall(std::move(fn), std::move(args));
        }
        throw std::invalid_argument(fmt::format("Unsupported argument expression: {}", config.dump()));
    }

    // --- Conditions ---
    Condition ModelFactory::parseCondition(std::size_t index, const json& config, const RefBinder& bind_ref) {
        if (!config.is_object() || !config.contains("fn") || !config["fn"].is_string()) {
            throw std::invalid_argument(fmt::format("Condition {} must be an object with 'fn' (string).", index));
        }
        Condition condition;
        condition.index = index;
        condition.function_id = config["fn"].get<std::string>();
        if (config.contains("argv")) {
            if (!config["argv"].is_array()) {
                throw std::invalid_argument(fmt::format("Condition {} has non-array 'argv'.", index));
            }
            for (const auto& arg : config["argv"]) {
                condition.args.push_back(parseArgument(arg, bind_ref));
            }
        }
        if (config.contains("assign")) {
            Binding binding;
            binding.name = config["assign"].get<std::string>();
            if (config.contains("assignType")) {
                binding.type = core::typeFromString(config["assignType"].get<std::string>());
            }
            condition.binding = binding;
        }
        return condition;
    }

    // --- Endpoint properties ---
    Expression ModelFactory::parseProperty(const json& config, const RefBinder& bind_ref) {
        if (config.is_string()) {
            return parseTemplate(config.get<std::string>(), bind_ref);
        }
        if (config.is_boolean()) {
            return Expression::makeLiteral(core::Value(config.get<bool>()));
        }
        if (config.is_array()) {
            std::vector<Expression> items;
            for (const auto& item : config) {
                items.push_back(parseProperty(item, bind_ref));
            }
            return Expression::makeTuple(std::move(items));
        }
        if (config.is_object()) {
            std::vector<std::string> keys;
            std::vector<Expression> values;
            for (const auto& [key, value] : config.items()) {
                keys.push_back(key);
                values.push_back(parseProperty(value, bind_ref));
            }
            return Expression::makeRecord(std::move(keys), std::move(values));
        }
        // Numbers and null pass through untouched
        return Expression::makeDocument(config);
    }

    // --- Results ---
    ResultSpec ModelFactory::parseResult(const json& config, const RefBinder& bind_ref) {
        if (!config.is_object() || !config.contains("type") || !config["type"].is_string()) {
            throw std::invalid_argument("Result must be an object with a 'type' (string).");
        }
        std::string type = config["type"].get<std::string>();
        if (type == "error") {
            if (!config.contains("error")) {
                throw std::invalid_argument("Error result requires 'error'.");
            }
            return ResultSpec::makeError(parseArgument(config["error"], bind_ref));
        }
        if (type != "endpoint") {
            throw std::invalid_argument(fmt::format("Unknown result type '{}'.", type));
        }
        if (!config.contains("endpoint") || !config["endpoint"].is_object() || !config["endpoint"].contains("url")) {
            throw std::invalid_argument("Endpoint result requires 'endpoint' with a 'url'.");
        }
        const json& endpoint_conf = config["endpoint"];
        EndpointTemplate endpoint;
        endpoint.url = parseArgument(endpoint_conf["url"], bind_ref);
        if (endpoint_conf.contains("headers")) {
            if (!endpoint_conf["headers"].is_object()) {
                throw std::invalid_argument("Endpoint 'headers' must be an object.");
            }
            for (const auto& [name, values] : endpoint_conf["headers"].items()) {
                if (!values.is_array()) {
                    throw std::invalid_argument(fmt::format("Header '{}' must be an array.", name));
                }
                std::vector<Expression> value_exprs;
                for (const auto& value : values) {
                    value_exprs.push_back(parseArgument(value, bind_ref));
                }
                endpoint.headers.emplace_back(name, std::move(value_exprs));
            }
        }
        if (endpoint_conf.contains("properties")) {
            if (!endpoint_conf["properties"].is_object()) {
                throw std::invalid_argument("Endpoint 'properties' must be an object.");
            }
            for (const auto& [name, value] : endpoint_conf["properties"].items()) {
                endpoint.properties.emplace_back(name, parseProperty(value, bind_ref));
            }
        }
        return ResultSpec::makeEndpoint(std::move(endpoint));
    }

    // --- Nodes ---
    DecisionNode ModelFactory::parseNode(const json& config) {
        if (!config.is_array() || config.size() != 3) {
            throw std::invalid_argument(fmt::format("Node must be [condition, high, low], got {}", config.dump()));
        }
        // nlohmann stores literals from code as signed and parsed non-negatives as unsigned
        const json& index = config[0];
        bool in_range = index.is_number_unsigned()
            ? index.get<std::uint64_t>() <= std::numeric_limits<std::uint32_t>::max()
            : index.is_number_integer() && index.get<std::int64_t>() >= 0 &&
              index.get<std::int64_t>() <= static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max());
        if (!in_range) {
            throw std::invalid_argument(fmt::format("Node condition index must be an unsigned 32-bit integer, got {}",
                                                    index.dump()));
        }
        DecisionNode node;
        node.condition_index = index.is_number_unsigned()
            ? static_cast<std::uint32_t>(index.get<std::uint64_t>())
            : static_cast<std::uint32_t>(index.get<std::int64_t>());
        node.high_ref = parseRef(config[1], "Node high reference");
        node.low_ref = parseRef(config[2], "Node low reference");
        return node;
    }

    // --- Main Factory Method ---
    std::shared_ptr<const RuleModel> ModelFactory::createModel(const json& document) {
        auto logger = core::logging::getLogger();
        logger->debug("Creating rule model from JSON document...");

        try {
            if (!document.is_object()) throw std::invalid_argument("Model must be a JSON object.");
            std::string version = document.value("version", std::string("1.1"));

            // --- Parameters ---
            std::vector<Parameter> parameters;
            std::set<std::string> parameter_names;
            if (document.contains("parameters")) {
                if (!document["parameters"].is_object()) throw std::invalid_argument("'parameters' must be an object.");
                for (const auto& [name, config] : document["parameters"].items()) {
                    parameters.push_back(parseParameter(name, config));
                    parameter_names.insert(name);
                }
            }

            if (!document.contains("conditions") || !document["conditions"].is_array()) throw std::invalid_argument("Model missing 'conditions' array.");
            if (!document.contains("results") || !document["results"].is_array()) throw std::invalid_argument("Model missing 'results' array.");
            if (!document.contains("nodes") || !document["nodes"].is_array()) throw std::invalid_argument("Model missing 'nodes' array.");
            if (!document.contains("root")) throw std::invalid_argument("Model missing 'root'.");

            // Variable names are known up front; RuleModel checks their ordering
            std::set<std::string> variable_names;
            for (const auto& condition_conf : document["conditions"]) {
                if (condition_conf.is_object() && condition_conf.contains("assign")) {
                    if (!condition_conf["assign"].is_string()) throw std::invalid_argument("'assign' must be a string.");
                    variable_names.insert(condition_conf["assign"].get<std::string>());
                }
            }
            RefBinder bind_ref = [&parameter_names, &variable_names](const std::string& name) {
                if (parameter_names.count(name) > 0) return Expression::makeParameterRef(name);
                if (variable_names.count(name) > 0) return Expression::makeVariableRef(name);
                throw std::invalid_argument(fmt::format("Reference to unknown parameter or variable '{}'.", name));
            };

            std::vector<Condition> conditions;
            for (const auto& condition_conf : document["conditions"]) {
                conditions.push_back(parseCondition(conditions.size(), condition_conf, bind_ref));
            }

            std::vector<ResultSpec> results;
            for (const auto& result_conf : document["results"]) {
                results.push_back(parseResult(result_conf, bind_ref));
            }

            std::vector<DecisionNode> nodes;
            for (const auto& node_conf : document["nodes"]) {
                nodes.push_back(parseNode(node_conf));
            }
            NodeRef root = parseRef(document["root"], "'root'");

            auto model = std::make_shared<const RuleModel>(std::move(parameters), std::move(conditions),
                                                           std::move(results), std::move(nodes), root, version);
            logger->info("Loaded rule model v{}: {} parameter(s), {} condition(s), {} result(s), {} node(s)",
                         model->version(), model->parameters().size(), model->conditions().size(),
                         model->results().size(), model->nodes().size());
            return model;

        } catch (const json::exception& e) {
            logger->error("JSON error while creating rule model: {}", e.what());
            throw core::ModelLoadException(fmt::format("Invalid model JSON: {}", e.what()));
        } catch (const std::invalid_argument& e) {
            logger->error("Invalid rule model: {}", e.what());
            throw core::ModelLoadException(e.what());
        } catch (const core::MalformedModelException& e) {
            logger->error("Malformed rule model: {}", e.what());
            throw;
        }
    }

    std::shared_ptr<const RuleModel> ModelFactory::loadModelFromFile(const std::string& path) {
        auto logger = core::logging::getLogger();
        logger->info("Loading rule model from '{}'", path);
        std::ifstream input(path);
        if (!input.is_open()) {
            logger->error("Cannot open rule model file '{}'", path);
            throw core::ModelLoadException(fmt::format("Cannot open rule model file '{}'.", path));
        }
        json document;
        try {
            input >> document;
        } catch (const json::parse_error& e) {
            logger->error("Failed to parse rule model file '{}': {}", path, e.what());
            throw core::ModelLoadException(fmt::format("Failed to parse '{}': {}", path, e.what()));
        }
        return createModel(document);
    }

} // namespace rules_engine
