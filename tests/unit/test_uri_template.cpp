#include <gtest/gtest.h>
#include "taskmcp/uri_template.hpp"
#include "taskmcp/error.hpp"

using namespace taskmcp;

// ---- parse ----

TEST(UriTemplateParse, LiteralOnly) {
    auto t = UriTemplate::parse("tasks://list");
    EXPECT_EQ(t.scheme(), "tasks");
    ASSERT_EQ(t.segments().size(), 1u);
    EXPECT_EQ(t.segments()[0].text, "list");
    EXPECT_FALSE(t.segments()[0].placeholder);
    EXPECT_TRUE(t.parameter_names().empty());
}

TEST(UriTemplateParse, Placeholder) {
    auto t = UriTemplate::parse("tasks://task/{taskId}");
    ASSERT_EQ(t.segments().size(), 2u);
    EXPECT_TRUE(t.segments()[1].placeholder);
    EXPECT_EQ(t.segments()[1].text, "taskId");
    EXPECT_EQ(t.parameter_names(), std::vector<std::string>{"taskId"});
    EXPECT_EQ(t.pattern(), "tasks://task/{taskId}");
}

TEST(UriTemplateParse, RejectsMissingScheme) {
    EXPECT_THROW(UriTemplate::parse("tasks/list"), TemplateError);
    EXPECT_THROW(UriTemplate::parse("://list"), TemplateError);
}

TEST(UriTemplateParse, RejectsBadPlaceholders) {
    EXPECT_THROW(UriTemplate::parse("tasks://task/{}"), TemplateError);
    EXPECT_THROW(UriTemplate::parse("tasks://{id}/{id}"), TemplateError);
    EXPECT_THROW(UriTemplate::parse("{s}://x"), TemplateError);
}

// ---- match ----

TEST(UriTemplateMatch, BindsPlaceholder) {
    auto params = match_uri("tasks://task/42", "tasks://task/{taskId}");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->at("taskId"), "42");
}

TEST(UriTemplateMatch, LiteralTemplateDoesNotMatchLongerUri) {
    EXPECT_FALSE(match_uri("tasks://task/42", "tasks://list").has_value());
}

TEST(UriTemplateMatch, ExactLiteralMatchHasNoParams) {
    auto params = match_uri("tasks://list", "tasks://list");
    ASSERT_TRUE(params.has_value());
    EXPECT_TRUE(params->empty());
}

TEST(UriTemplateMatch, SegmentCountMustBeEqual) {
    EXPECT_FALSE(match_uri("tasks://task", "tasks://task/{taskId}").has_value());
    EXPECT_FALSE(match_uri("tasks://task/1/extra", "tasks://task/{taskId}").has_value());
}

TEST(UriTemplateMatch, TrailingSlashIsAnExtraSegment) {
    EXPECT_FALSE(match_uri("tasks://list/", "tasks://list").has_value());
}

TEST(UriTemplateMatch, EmptyPlaceholderValueDoesNotBind) {
    EXPECT_FALSE(match_uri("tasks://task/", "tasks://task/{taskId}").has_value());
}

TEST(UriTemplateMatch, SchemeIsComparedExactly) {
    EXPECT_FALSE(match_uri("task://list", "tasks://list").has_value());
    EXPECT_FALSE(match_uri("TASKS://list", "tasks://list").has_value());
    EXPECT_FALSE(match_uri("tasks:/list", "tasks://list").has_value());
}

TEST(UriTemplateMatch, LiteralIsCaseSensitive) {
    EXPECT_FALSE(match_uri("tasks://List", "tasks://list").has_value());
}

TEST(UriTemplateMatch, PlaceholderBindsAnyTextWithoutDecoding) {
    auto params = match_uri("tasks://task/a%20b", "tasks://task/{taskId}");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->at("taskId"), "a%20b");

    params = match_uri("tasks://task/not-a-number", "tasks://task/{taskId}");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->at("taskId"), "not-a-number");
}

TEST(UriTemplateMatch, MultiplePlaceholders) {
    auto params = match_uri("files://proj/src/main.cpp", "files://{project}/{dir}/{file}");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->size(), 3u);
    EXPECT_EQ(params->at("project"), "proj");
    EXPECT_EQ(params->at("dir"), "src");
    EXPECT_EQ(params->at("file"), "main.cpp");
}

TEST(UriTemplateMatch, MixedLiteralsAndPlaceholders) {
    auto t = UriTemplate::parse("tasks://user/{userId}/task/{taskId}");
    EXPECT_TRUE(t.match("tasks://user/7/task/9").has_value());
    EXPECT_FALSE(t.match("tasks://user/7/item/9").has_value());
}

TEST(UriTemplateMatch, IsDeterministic) {
    auto t = UriTemplate::parse("tasks://task/{taskId}");
    auto first = t.match("tasks://task/5");
    auto second = t.match("tasks://task/5");
    EXPECT_TRUE(first == second);
}

TEST(UriTemplateSplit, KeepsEmptySegments) {
    auto parts = split_path("a//b");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
}

TEST(UriTemplateSplit, SchemeSplitUsesFirstSeparator) {
    auto split = split_scheme("tasks://a://b");
    ASSERT_TRUE(split.has_value());
    EXPECT_EQ(split->first, "tasks");
    EXPECT_EQ(split->second, "a://b");
    EXPECT_FALSE(split_scheme("no-scheme").has_value());
}
