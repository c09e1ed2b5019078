#include "test_helpers.hpp"
#include "standard_library.hpp"

namespace test_helpers {

using rules_engine::Expression;

nlohmann::json samplePartitionsJson() {
    return nlohmann::json::parse(R"({
        "version": "1.1",
        "partitions": [
            {
                "id": "aws",
                "regionRegex": "^(us|eu|ap|sa|ca|me|af)-\\w+-\\d+$",
                "regions": { "us-east-1": {}, "us-west-2": {}, "aws-global": {} },
                "outputs": {
                    "name": "aws",
                    "dnsSuffix": "amazonaws.com",
                    "dualStackDnsSuffix": "api.aws",
                    "supportsFIPS": true,
                    "supportsDualStack": true,
                    "implicitGlobalRegion": "us-east-1"
                }
            },
            {
                "id": "aws-cn",
                "regionRegex": "^cn\\-\\w+\\-\\d+$",
                "regions": { "cn-north-1": {} },
                "outputs": {
                    "name": "aws-cn",
                    "dnsSuffix": "amazonaws.com.cn",
                    "dualStackDnsSuffix": "api.amazonwebservices.com.cn",
                    "supportsFIPS": true,
                    "supportsDualStack": true,
                    "implicitGlobalRegion": "cn-northwest-1"
                }
            },
            {
                "id": "aws-us-gov",
                "regionRegex": "^us\\-gov\\-\\w+\\-\\d+$",
                "regions": { "us-gov-west-1": { "supportsDualStack": false } },
                "outputs": {
                    "name": "aws-us-gov",
                    "dnsSuffix": "amazonaws.com",
                    "dualStackDnsSuffix": "api.aws",
                    "supportsFIPS": true,
                    "supportsDualStack": true,
                    "implicitGlobalRegion": "us-gov-west-1"
                }
            }
        ]
    })");
}

std::shared_ptr<const endpoint_lib::PartitionResolver> samplePartitions() {
    return endpoint_lib::PartitionResolver::fromJson(samplePartitionsJson());
}

std::shared_ptr<rules_engine::FunctionRegistry> makeRegistry() {
    auto registry = std::make_shared<rules_engine::FunctionRegistry>();
    rules_engine::registerStandardFunctions(*registry);
    rules_engine::registerAwsFunctions(*registry, samplePartitions());
    return registry;
}

core::Value str(const std::string& text) {
    return core::Value(text);
}

Expression param(const std::string& name) {
    return Expression::makeParameterRef(name);
}

Expression var(const std::string& name) {
    return Expression::makeVariableRef(name);
}

rules_engine::Parameter stringParam(const std::string& name, bool required) {
    rules_engine::Parameter p;
    p.name = name;
    p.type = core::ValueType::String;
    p.required = required;
    return p;
}

rules_engine::Parameter boolParam(const std::string& name, std::optional<bool> default_value) {
    rules_engine::Parameter p;
    p.name = name;
    p.type = core::ValueType::Boolean;
    if (default_value) {
        p.default_value = core::Value(*default_value);
    }
    return p;
}

rules_engine::Condition condition(std::size_t index, const std::string& function_id,
                                  std::vector<Expression> args,
                                  const std::string& binding, core::ValueType binding_type) {
    rules_engine::Condition c;
    c.index = index;
    c.function_id = function_id;
    c.args = std::move(args);
    if (!binding.empty()) {
        c.binding = rules_engine::Binding{binding, binding_type};
    }
    return c;
}

rules_engine::ResultSpec endpointResult(Expression url) {
    rules_engine::EndpointTemplate endpoint;
    endpoint.url = std::move(url);
    return rules_engine::ResultSpec::makeEndpoint(std::move(endpoint));
}

rules_engine::ResultSpec endpointResult(const std::string& url) {
    return endpointResult(Expression::makeLiteral(str(url)));
}

rules_engine::ResultSpec errorResult(const std::string& message) {
    return rules_engine::ResultSpec::makeError(Expression::makeLiteral(str(message)));
}

} // namespace test_helpers
