#include <gtest/gtest.h>
#include "expression.hpp"
#include <stdexcept>

using rules_engine::Expression;
using rules_engine::parseTemplate;

namespace {

    Expression bindAsParameter(const std::string& name) {
        return Expression::makeParameterRef(name);
    }

} // namespace

TEST(ExpressionTest, PlainStringIsALiteral) {
    Expression expr = parseTemplate("https://example.com", bindAsParameter);
    ASSERT_EQ(expr.kind, Expression::Kind::Literal);
    EXPECT_EQ(std::get<std::string>(expr.literal), "https://example.com");
}

TEST(ExpressionTest, EscapedBracesStayLiteral) {
    Expression expr = parseTemplate("{{not-a-ref}}", bindAsParameter);
    ASSERT_EQ(expr.kind, Expression::Kind::Literal);
    EXPECT_EQ(std::get<std::string>(expr.literal), "{not-a-ref}");
}

TEST(ExpressionTest, PlaceholdersBecomeReferences) {
    Expression expr = parseTemplate("https://svc.{Region}.amazonaws.com", bindAsParameter);
    ASSERT_EQ(expr.kind, Expression::Kind::Template);
    ASSERT_EQ(expr.args.size(), 3u);
    EXPECT_EQ(std::get<std::string>(expr.args[0].literal), "https://svc.");
    EXPECT_EQ(expr.args[1].kind, Expression::Kind::ParameterRef);
    EXPECT_EQ(expr.args[1].name, "Region");
    EXPECT_EQ(std::get<std::string>(expr.args[2].literal), ".amazonaws.com");
}

TEST(ExpressionTest, HashPathBecomesGetAttr) {
    Expression expr = parseTemplate("{partitionResult#dnsSuffix}", [](const std::string& name) {
        return Expression::makeVariableRef(name);
    });
    ASSERT_EQ(expr.kind, Expression::Kind::Template);
    ASSERT_EQ(expr.args.size(), 1u);
    const Expression& call = expr.args[0];
    EXPECT_EQ(call.kind, Expression::Kind::FunctionCall);
    EXPECT_EQ(call.name, "getAttr");
    ASSERT_EQ(call.args.size(), 2u);
    EXPECT_EQ(call.args[0].kind, Expression::Kind::VariableRef);
    EXPECT_EQ(std::get<std::string>(call.args[1].literal), "dnsSuffix");
    EXPECT_EQ(expr.describe(), "template(getAttr(var:partitionResult, \"dnsSuffix\"))");
}

TEST(ExpressionTest, MalformedTemplatesThrow) {
    EXPECT_THROW(parseTemplate("https://{Region", bindAsParameter), std::invalid_argument);
    EXPECT_THROW(parseTemplate("https://{}", bindAsParameter), std::invalid_argument);
    EXPECT_THROW(parseTemplate("a}b", bindAsParameter), std::invalid_argument);
    EXPECT_THROW(parseTemplate("{#path}", bindAsParameter), std::invalid_argument);
}

TEST(ExpressionTest, FactoriesCheckShape) {
    EXPECT_THROW(Expression::makeCoalesce({}), std::invalid_argument);
    EXPECT_THROW(Expression::makeRecord({"a", "b"}, {Expression::makeLiteral("x")}), std::invalid_argument);
    EXPECT_EQ(Expression::makeLiteral("x").literal.index(), 1u); // string, not bool
}

TEST(ExpressionTest, ForEachNodeVisitsWholeTree) {
    Expression expr = Expression::makeCoalesce({
        Expression::makeCall("uriEncode", {Expression::makeParameterRef("Bucket")}),
        Expression::makeLiteral("fallback")});
    int visited = 0;
    rules_engine::forEachNode(expr, [&visited](const Expression&) { ++visited; });
    EXPECT_EQ(visited, 4);
}
