#include <gtest/gtest.h>
#include "result_resolver.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using namespace rules_engine;
using test_helpers::condition;
using test_helpers::param;
using test_helpers::str;
using test_helpers::stringParam;
using test_helpers::var;

namespace {

    Expression binder(const std::string& name) {
        return name == "partitionResult" ? Expression::makeVariableRef(name) : Expression::makeParameterRef(name);
    }

    std::vector<ResultSpec> sampleResults() {
        EndpointTemplate full;
        full.url = parseTemplate("https://svc.{Region}.{partitionResult#dnsSuffix}", binder);
        full.headers.emplace_back("x-region", std::vector<Expression>{parseTemplate("{Region}", binder)});
        full.headers.emplace_back("x-multi", std::vector<Expression>{Expression::makeLiteral("*"), param("Bucket")});
        full.headers.emplace_back("x-empty", std::vector<Expression>{param("Bucket")});
        full.properties.emplace_back("authSchemes", Expression::makeTuple({Expression::makeRecord(
            {"name", "signingRegion", "disableDoubleEncoding", "priority"},
            {Expression::makeLiteral("sigv4"), parseTemplate("{Region}", binder),
             Expression::makeLiteral(core::Value(true)), Expression::makeDocument(10)})}));
        full.properties.emplace_back("bucket", param("Bucket"));

        EndpointTemplate bad_url;
        bad_url.url = Expression::makeLiteral(core::Value(true));

        return {ResultSpec::makeEndpoint(full),
                ResultSpec::makeError(parseTemplate("Invalid region: {Region}", binder)),
                ResultSpec::makeEndpoint(bad_url),
                ResultSpec::makeError(param("Bucket"))};
    }

} // namespace

class ResultResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<FunctionRegistry> registry_ = test_helpers::makeRegistry();
    RuleModel model_{
        {stringParam("Region"), stringParam("Bucket")},
        {condition(0, "aws.partition", {param("Region")}, "partitionResult")},
        sampleResults(),
        {{0, resultRef(0), resultRef(1)}},
        0};
    ResultResolver resolver_{model_, *registry_};
    EvaluationContext context_;
    core::DiagnosticCollector diagnostics_;
};

TEST_F(ResultResolverTest, NoMatchCarriesTrace) {
    diagnostics_.record(0, "aws.partition", std::nullopt, false);
    ResolveOutcome outcome = resolver_.render(std::nullopt, {}, context_, diagnostics_);
    ASSERT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.failure().kind, FailureKind::NoRuleMatched);
    EXPECT_EQ(outcome.failure().message, ResultResolver::kNoMatchMessage);
    EXPECT_EQ(outcome.failure().trace.size(), 1u);
}

TEST_F(ResultResolverTest, ErrorResultRendersTemplateVerbatim) {
    ResolveOutcome outcome = resolver_.render(1, {{"Region", str("mars-1")}}, context_, diagnostics_);
    ASSERT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.failure().kind, FailureKind::RuleDefinedError);
    EXPECT_EQ(outcome.failure().message, "Invalid region: mars-1");
}

TEST_F(ResultResolverTest, RendersUrlHeadersAndProperties) {
    core::Partition partition;
    partition.name = "aws";
    partition.dns_suffix = "amazonaws.com";
    context_.bind("partitionResult", core::Value(partition));

    ResolveOutcome outcome = resolver_.render(0, {{"Region", str("us-west-2")}}, context_, diagnostics_);
    ASSERT_TRUE(outcome.isEndpoint()) << outcome.describe();
    const core::Endpoint& endpoint = outcome.endpoint();
    EXPECT_EQ(endpoint.url, "https://svc.us-west-2.amazonaws.com");
    EXPECT_EQ(endpoint.headers.at("x-region"), std::vector<std::string>{"us-west-2"});
    EXPECT_EQ(endpoint.headers.at("x-multi"), std::vector<std::string>{"*"}); // absent Bucket dropped
    EXPECT_EQ(endpoint.headers.count("x-empty"), 0u);

    nlohmann::json expected_auth = nlohmann::json::parse(R"([
        {"name": "sigv4", "signingRegion": "us-west-2", "disableDoubleEncoding": true, "priority": 10}
    ])");
    EXPECT_EQ(endpoint.properties.at("authSchemes"), expected_auth);
    EXPECT_TRUE(endpoint.properties.at("bucket").is_null());
    EXPECT_TRUE(diagnostics_.errors().empty());
}

TEST_F(ResultResolverTest, UnsetBindingRendersAsEmptySegment) {
    // The path never evaluated aws.partition: the URL still renders
    ResolveOutcome outcome = resolver_.render(0, {{"Region", str("us-west-2")}}, context_, diagnostics_);
    ASSERT_TRUE(outcome.isEndpoint());
    EXPECT_EQ(outcome.endpoint().url, "https://svc.us-west-2.");
    EXPECT_EQ(diagnostics_.errors().size(), 1u);
}

TEST_F(ResultResolverTest, NonStringUrlIsARenderError) {
    ResolveOutcome outcome = resolver_.render(2, {}, context_, diagnostics_);
    ASSERT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.failure().kind, FailureKind::RenderError);
}

TEST_F(ResultResolverTest, AbsentErrorMessageIsARenderError) {
    ResolveOutcome outcome = resolver_.render(3, {}, context_, diagnostics_);
    ASSERT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.failure().kind, FailureKind::RenderError);
}

TEST_F(ResultResolverTest, OutOfRangeResultIsAModelError) {
    EXPECT_THROW(resolver_.render(9, {}, context_, diagnostics_), core::MalformedModelException);
}
