#include "core/ArgumentValidator.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace toolrpc;
using json = nlohmann::json;

class ArgumentValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        calculator = Schema::object()
            .property("x", Schema::integer(), true)
            .property("y", Schema::integer(), true)
            .property("operation", Schema::enumeration({"add", "subtract", "multiply", "divide"}), true);
    }

    Schema calculator = Schema::object();
};

TEST_F(ArgumentValidatorTest, AcceptsValidArguments) {
    EXPECT_FALSE(ArgumentValidator::validate(calculator, {{"x", 1}, {"y", -2}, {"operation", "add"}}));
}

TEST_F(ArgumentValidatorTest, OpenSchemaAllowsExtraFields) {
    EXPECT_FALSE(ArgumentValidator::validate(calculator,
        {{"x", 1}, {"y", 2}, {"operation", "add"}, {"note", "ignored"}}));
}

TEST_F(ArgumentValidatorTest, MissingRequiredField) {
    auto error = ArgumentValidator::validate(calculator, {{"x", 1}, {"operation", "add"}});

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->path, "y");
    EXPECT_EQ(error->message, "missing required field 'y'");
}

TEST_F(ArgumentValidatorTest, FirstMissingFieldInDeclarationOrder) {
    auto error = ArgumentValidator::validate(calculator, json::object());

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->path, "x");
}

TEST_F(ArgumentValidatorTest, MissingFieldReportedBeforeTypeError) {
    auto error = ArgumentValidator::validate(calculator, {{"x", "one"}, {"operation", "add"}});

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->path, "y");
}

TEST_F(ArgumentValidatorTest, NoCoercionFromString) {
    auto error = ArgumentValidator::validate(calculator, {{"x", "1"}, {"y", 2}, {"operation", "add"}});

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->path, "x");
    EXPECT_EQ(error->message, "field 'x' must be of type integer, got string");
}

TEST_F(ArgumentValidatorTest, FloatIsNotInteger) {
    auto error = ArgumentValidator::validate(calculator, {{"x", 1.5}, {"y", 2}, {"operation", "add"}});

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->path, "x");
}

TEST_F(ArgumentValidatorTest, EnumRejectsUnknownValue) {
    auto error = ArgumentValidator::validate(calculator, {{"x", 1}, {"y", 2}, {"operation", "power"}});

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->path, "operation");
    EXPECT_NE(error->message.find("power"), std::string::npos);
}

TEST_F(ArgumentValidatorTest, RootMustBeObject) {
    auto error = ArgumentValidator::validate(calculator, json::array({1, 2}));

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->path, "");
    EXPECT_EQ(error->message, "arguments must be of type object, got array");
}

TEST(ArgumentValidatorKindsTest, PrimitiveKinds) {
    EXPECT_FALSE(ArgumentValidator::validate(Schema::number(), 2));
    EXPECT_FALSE(ArgumentValidator::validate(Schema::number(), 2.5));
    EXPECT_TRUE(ArgumentValidator::validate(Schema::number(), "2.5"));
    EXPECT_FALSE(ArgumentValidator::validate(Schema::boolean(), false));
    EXPECT_TRUE(ArgumentValidator::validate(Schema::boolean(), 0));
    EXPECT_FALSE(ArgumentValidator::validate(Schema::null_value(), nullptr));
    EXPECT_TRUE(ArgumentValidator::validate(Schema::string(), nullptr));
    EXPECT_FALSE(ArgumentValidator::validate(Schema::any(), json::array()));
}

TEST(ArgumentValidatorKindsTest, NonFiniteNumberRejected) {
    EXPECT_TRUE(ArgumentValidator::validate(Schema::number(), std::numeric_limits<double>::infinity()));
    EXPECT_TRUE(ArgumentValidator::validate(Schema::number(), std::numeric_limits<double>::quiet_NaN()));
}

TEST(ArgumentValidatorNestingTest, NestedPathsUseDots) {
    Schema schema = Schema::object()
        .property("options", Schema::object().property("depth", Schema::integer(), true), true);

    auto missing = ArgumentValidator::validate(schema, {{"options", json::object()}});
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing->path, "options.depth");

    auto wrong = ArgumentValidator::validate(schema, {{"options", {{"depth", true}}}});
    ASSERT_TRUE(wrong.has_value());
    EXPECT_EQ(wrong->path, "options.depth");
}

TEST(ArgumentValidatorNestingTest, ArrayElementsAreIndexed) {
    Schema schema = Schema::object().property("tags", Schema::array(Schema::string()));

    EXPECT_FALSE(ArgumentValidator::validate(schema, {{"tags", {"a", "b"}}}));

    auto error = ArgumentValidator::validate(schema, {{"tags", {"a", "b", 3}}});
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->path, "tags.2");
}

TEST(ArgumentValidatorClosedTest, RejectsUnexpectedField) {
    Schema schema = Schema::object().property("quantity", Schema::integer(), true).closed();

    EXPECT_FALSE(ArgumentValidator::validate(schema, {{"quantity", 3}}));

    auto error = ArgumentValidator::validate(schema, {{"quantity", 3}, {"extra", 1}});
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->path, "extra");
    EXPECT_EQ(error->message, "unexpected field 'extra'");
}

TEST(ArgumentValidatorClosedTest, ErrorToJson) {
    ValidationError error{"y", "missing required field 'y'"};

    json expected = {{"path", "y"}, {"reason", "missing required field 'y'"}};
    EXPECT_EQ(error.to_json(), expected);
}
