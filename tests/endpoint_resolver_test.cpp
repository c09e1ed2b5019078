#include <gtest/gtest.h>
#include "endpoint_resolver.hpp"
#include "model_factory.hpp"
#include "partition.hpp"
#include "standard_library.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"
#include <type_traits>

using namespace rules_engine;
using test_helpers::str;

namespace {

    const char* kRegionalModel = R"({
        "parameters": {
            "Region": {"type": "string", "required": true},
            "UseFIPS": {"type": "boolean", "required": true, "default": false},
            "Zones": {"type": "stringArray"}
        },
        "conditions": [
            {"fn": "aws.partition", "argv": [{"ref": "Region"}], "assign": "partitionResult"},
            {"fn": "booleanEquals", "argv": [{"ref": "UseFIPS"}, true]},
            {"fn": "getAttr", "argv": [{"ref": "partitionResult"}, "supportsFIPS"]}
        ],
        "results": [
            {"type": "endpoint", "endpoint": {"url": "https://svc.{Region}.{partitionResult#dnsSuffix}"}},
            {"type": "endpoint", "endpoint": {"url": "https://svc-fips.{Region}.{partitionResult#dnsSuffix}"}},
            {"type": "error", "error": "FIPS is not supported in partition {partitionResult#name}"}
        ],
        "nodes": [[0, 1, -1], [1, 2, -2], [2, -3, -4]],
        "root": 0
    })";

} // namespace

class EndpointResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<const RuleModel> model_ = ModelFactory::createModel(json::parse(kRegionalModel));
    std::shared_ptr<FunctionRegistry> registry_ = test_helpers::makeRegistry();
};

TEST_F(EndpointResolverTest, ResolvesWithDefaults) {
    EndpointResolver resolver(model_, registry_);
    ResolveOutcome outcome = resolver.resolve({{"Region", str("us-west-2")}});
    ASSERT_TRUE(outcome.isEndpoint()) << outcome.describe();
    EXPECT_EQ(outcome.endpoint().url, "https://svc.us-west-2.amazonaws.com");
}

TEST_F(EndpointResolverTest, FipsBranchAndRuleDefinedError) {
    EndpointResolver resolver(model_, registry_);
    ResolveOutcome fips = resolver.resolve({{"Region", str("cn-north-1")}, {"UseFIPS", core::Value(true)}});
    ASSERT_TRUE(fips.isEndpoint()) << fips.describe();
    EXPECT_EQ(fips.endpoint().url, "https://svc-fips.cn-north-1.amazonaws.com.cn");

    auto no_fips_registry = std::make_shared<FunctionRegistry>();
    registerStandardFunctions(*no_fips_registry);
    registerAwsFunctions(*no_fips_registry, endpoint_lib::PartitionResolver::fromJson(nlohmann::json::parse(R"({
        "partitions": [{"id": "aws", "regionRegex": ".*", "outputs": {"dnsSuffix": "example.net", "supportsFIPS": false}}]
    })")));
    EndpointResolver restricted(model_, no_fips_registry);
    ResolveOutcome error = restricted.resolve({{"Region", str("us-east-1")}, {"UseFIPS", core::Value(true)}});
    ASSERT_TRUE(error.isFailure());
    EXPECT_EQ(error.failure().kind, FailureKind::RuleDefinedError);
    EXPECT_EQ(error.failure().message, "FIPS is not supported in partition aws");
    EXPECT_EQ(error.failure().trace.size(), 3u);
}

TEST_F(EndpointResolverTest, ParameterProblemsAreInvalidParameters) {
    EndpointResolver resolver(model_, registry_);

    ResolveOutcome missing = resolver.resolve({});
    ASSERT_TRUE(missing.isFailure());
    EXPECT_EQ(missing.failure().kind, FailureKind::InvalidParameters);
    EXPECT_NE(missing.failure().message.find("Region"), std::string::npos);

    ResolveOutcome wrong_type = resolver.resolve({{"Region", core::Value(true)}});
    ASSERT_TRUE(wrong_type.isFailure());
    EXPECT_EQ(wrong_type.failure().kind, FailureKind::InvalidParameters);

    ResolveOutcome undeclared = resolver.resolve({{"Region", str("us-east-1")}, {"Bucket", str("b")}});
    ASSERT_TRUE(undeclared.isFailure());
    EXPECT_EQ(undeclared.failure().kind, FailureKind::InvalidParameters);
    EXPECT_TRUE(undeclared.failure().trace.empty());

    ResolveOutcome array_ok = resolver.resolve({{"Region", str("us-east-1")}, {"Zones", core::Value(core::StringArray{"a"})}});
    EXPECT_TRUE(array_ok.isEndpoint());
}

TEST_F(EndpointResolverTest, ConstructionFreezesRegistryAndReportsUsage) {
    EndpointResolver resolver(model_, registry_);
    EXPECT_TRUE(registry_->isFrozen());
    std::set<std::string> expected{"aws.partition", "booleanEquals", "getAttr"};
    EXPECT_EQ(resolver.usedFunctions(), expected);
    EXPECT_THROW(registry_->registerFunction("late", [](const std::vector<core::OptionalValue>&, core::DiagnosticCollector&) {
        return core::OptionalValue();
    }), core::RegistryFrozenException);
}

TEST_F(EndpointResolverTest, MissingFunctionFailsAtConstruction) {
    auto bare = std::make_shared<FunctionRegistry>();
    registerStandardFunctions(*bare);
    EXPECT_THROW(EndpointResolver(model_, bare), core::FunctionNotFoundException);
    EXPECT_THROW(EndpointResolver(nullptr, registry_), std::invalid_argument);
}

TEST_F(EndpointResolverTest, BadGetAttrPathsFailWhenTheModelLoads) {
    const char* unterminated = R"({
        "parameters": {"Region": {"type": "string", "required": true}},
        "conditions": [{"fn": "aws.partition", "argv": [{"ref": "Region"}], "assign": "p"}],
        "results": [{"type": "endpoint", "endpoint": {"url": "https://svc.{p#dnsSuffix[}"}}],
        "nodes": [[0, -2, -1]],
        "root": 0
    })";
    const char* oversized = R"({
        "parameters": {"Arn": {"type": "string", "required": true}},
        "conditions": [{"fn": "aws.parseArn", "argv": [{"ref": "Arn"}], "assign": "arn"}],
        "results": [{"type": "endpoint", "endpoint": {"url": "https://{arn#resourceId[99999999999999999999999]}.example.com"}}],
        "nodes": [[0, -2, -1]],
        "root": 0
    })";
    EXPECT_THROW(ModelFactory::createModel(json::parse(unterminated)), core::MalformedModelException);
    EXPECT_THROW(ModelFactory::createModel(json::parse(oversized)), core::MalformedModelException);
}

TEST_F(EndpointResolverTest, WrongArgumentCountFailsAtConstruction) {
    auto condition_arity = ModelFactory::createModel(json::parse(R"({
        "parameters": {"Region": {"type": "string"}},
        "conditions": [{"fn": "isSet", "argv": [{"ref": "Region"}, {"ref": "Region"}]}],
        "results": [{"type": "endpoint", "endpoint": {"url": "https://a.example.com"}}],
        "nodes": [[0, -2, -1]],
        "root": 0
    })"));
    EXPECT_THROW(EndpointResolver(condition_arity, registry_), core::MalformedModelException);

    auto nested_arity = ModelFactory::createModel(json::parse(R"({
        "parameters": {"Region": {"type": "string"}},
        "conditions": [{"fn": "isSet", "argv": [{"ref": "Region"}]}],
        "results": [{"type": "endpoint", "endpoint": {"url": {"fn": "substring", "argv": [{"ref": "Region"}, 0, 2]}}}],
        "nodes": [[0, -2, -1]],
        "root": 0
    })"));
    EXPECT_THROW(EndpointResolver(nested_arity, test_helpers::makeRegistry()), core::MalformedModelException);
}

TEST_F(EndpointResolverTest, SharedByPointerOnly) {
    static_assert(!std::is_copy_constructible<EndpointResolver>::value, "resolver must not be copied");
    static_assert(!std::is_move_constructible<EndpointResolver>::value, "resolver must not be moved");
    static_assert(!std::is_copy_assignable<EndpointResolver>::value, "resolver must not be copy-assigned");

    auto owner = std::make_unique<EndpointResolver>(model_, registry_);
    std::shared_ptr<const IEndpointResolver> shared = std::move(owner);
    EXPECT_FALSE(owner);
    ResolveOutcome outcome = shared->resolve({{"Region", str("us-east-1")}});
    ASSERT_TRUE(outcome.isEndpoint()) << outcome.describe();
    EXPECT_EQ(outcome.endpoint().url, "https://svc.us-east-1.amazonaws.com");
}

TEST_F(EndpointResolverTest, UsableThroughInterface) {
    std::unique_ptr<IEndpointResolver> resolver = std::make_unique<EndpointResolver>(model_, registry_);
    EXPECT_TRUE(resolver->resolve({{"Region", str("eu-west-1")}}).isEndpoint());
}

TEST(ResolverSettingsTest, ParsesKnownKeys) {
    ResolverSettings defaults = ResolverSettings::fromJson(json::object());
    EXPECT_EQ(defaults.step_budget, 0u);
    EXPECT_TRUE(defaults.log_failures);

    ResolverSettings settings = ResolverSettings::fromJson(json::parse(R"({"stepBudget": 64, "logFailures": false, "other": 1})"));
    EXPECT_EQ(settings.step_budget, 64u);
    EXPECT_FALSE(settings.log_failures);
}

TEST(ResolverSettingsTest, RejectsWrongTypes) {
    EXPECT_THROW(ResolverSettings::fromJson(json::parse(R"({"stepBudget": -1})")), core::ModelLoadException);
    EXPECT_THROW(ResolverSettings::fromJson(json::parse(R"({"stepBudget": "10"})")), core::ModelLoadException);
    EXPECT_THROW(ResolverSettings::fromJson(json::parse(R"({"logFailures": 1})")), core::ModelLoadException);
    EXPECT_THROW(ResolverSettings::fromJson(json::array()), core::ModelLoadException);
}

TEST(ResolverSettingsTest, StepBudgetReachesWalker) {
    auto model = ModelFactory::createModel(json::parse(kRegionalModel));
    ResolverSettings settings;
    settings.step_budget = 1;
    EndpointResolver resolver(model, test_helpers::makeRegistry(), settings);
    EXPECT_THROW(resolver.resolve({{"Region", str("us-east-1")}}), core::MalformedModelException);
}
