#include <gtest/gtest.h>
#include "taskmcp/registry.hpp"
#include "taskmcp/error.hpp"

using namespace taskmcp;

namespace {

ToolEntry make_tool(const std::string& name, const std::string& reply) {
    ToolEntry t;
    t.name = name;
    t.handler = [reply](const nlohmann::json&) {
        ToolResult r;
        r.content.push_back(TextContent{reply});
        return r;
    };
    return t;
}

ResourceEntry make_resource(const std::string& name, const std::string& pattern) {
    ResourceEntry r;
    r.name = name;
    r.uri_template = UriTemplate::parse(pattern);
    r.handler = [name](const std::string& uri, const UriParams&) {
        ResourceResult result;
        result.contents.push_back(ResourceContent{uri, name, nlohmann::json::object()});
        return result;
    };
    return r;
}

std::string call_text(const ToolEntry& t) {
    return std::get<TextContent>(t.handler(nlohmann::json::object()).content.at(0)).text;
}

} // anonymous namespace

TEST(Registry, EmptyLookups) {
    Registry reg;
    EXPECT_EQ(reg.find_tool("x"), nullptr);
    EXPECT_EQ(reg.find_prompt("x"), nullptr);
    EXPECT_EQ(reg.find_resource("x"), nullptr);
    EXPECT_FALSE(reg.match_resource("tasks://list").has_value());
    EXPECT_TRUE(reg.all(CapabilityKind::Tool).empty());
}

TEST(Registry, KindsAreSeparateNamespaces) {
    Registry reg;
    reg.add_tool(make_tool("tasks", "tool"));
    reg.add_resource(make_resource("tasks", "tasks://list"));

    ASSERT_NE(reg.find_tool("tasks"), nullptr);
    ASSERT_NE(reg.find_resource("tasks"), nullptr);
    EXPECT_EQ(reg.find_prompt("tasks"), nullptr);
}

TEST(Registry, PreservesRegistrationOrder) {
    Registry reg;
    reg.add_tool(make_tool("listTasks", "a"));
    reg.add_tool(make_tool("createTask", "b"));
    reg.add_tool(make_tool("deleteTask", "c"));

    ASSERT_EQ(reg.tools().size(), 3u);
    EXPECT_EQ(reg.tools()[0].name, "listTasks");
    EXPECT_EQ(reg.tools()[1].name, "createTask");
    EXPECT_EQ(reg.tools()[2].name, "deleteTask");
}

TEST(Registry, ReRegistrationReplacesInPlace) {
    Registry reg;
    reg.add_tool(make_tool("a", "first"));
    reg.add_tool(make_tool("b", "other"));
    reg.add_tool(make_tool("a", "second"));

    ASSERT_EQ(reg.tools().size(), 2u);
    EXPECT_EQ(reg.tools()[0].name, "a");
    EXPECT_EQ(call_text(*reg.find_tool("a")), "second");
}

TEST(Registry, ResourceMatchUsesTemplates) {
    Registry reg;
    reg.add_resource(make_resource("tasks", "tasks://list"));
    reg.add_resource(make_resource("task", "tasks://task/{taskId}"));

    auto m = reg.match_resource("tasks://task/42");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->entry->name, "task");
    EXPECT_EQ(m->params.at("taskId"), "42");

    auto list = reg.match_resource("tasks://list");
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ(list->entry->name, "tasks");
    EXPECT_TRUE(list->params.empty());

    EXPECT_FALSE(reg.match_resource("tasks://other").has_value());
}

TEST(Registry, FirstRegisteredTemplateWins) {
    Registry reg;
    reg.add_resource(make_resource("by-id", "tasks://task/{taskId}"));
    reg.add_resource(make_resource("latest", "tasks://task/latest"));

    auto m = reg.match_resource("tasks://task/latest");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->entry->name, "by-id");
}

TEST(Registry, ResourceSchemaDerivedFromPlaceholders) {
    Registry reg;
    reg.add_resource(make_resource("task", "tasks://task/{taskId}"));
    const auto* r = reg.find_resource("task");
    ASSERT_NE(r, nullptr);
    ASSERT_EQ(r->schema.size(), 1u);
    EXPECT_EQ(r->schema[0].name, "taskId");
    EXPECT_TRUE(r->schema[0].required);
    EXPECT_EQ(r->schema[0].kind, ParamKind::String);
}

TEST(Registry, GenericAddAndLookup) {
    Registry reg;
    PromptEntry p;
    p.name = "listAllTasks";
    p.handler = [](const nlohmann::json&) { return PromptResult{}; };
    reg.add(CapabilityEntry{p});
    reg.add(CapabilityEntry{make_tool("t", "x")});

    auto found = reg.lookup(CapabilityKind::Prompt, "listAllTasks");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(capability_kind(*found), CapabilityKind::Prompt);
    EXPECT_EQ(capability_name(*found), "listAllTasks");

    EXPECT_FALSE(reg.lookup(CapabilityKind::Tool, "listAllTasks").has_value());
    EXPECT_EQ(reg.all(CapabilityKind::Tool).size(), 1u);
}

TEST(Registry, BadTemplateFailsAtRegistration) {
    EXPECT_THROW(make_resource("bad", "no-scheme"), TemplateError);
}

TEST(Registry, KindNames) {
    EXPECT_EQ(capability_kind_to_string(CapabilityKind::Resource), "resource");
    EXPECT_EQ(capability_kind_to_string(CapabilityKind::Tool), "tool");
    EXPECT_EQ(capability_kind_to_string(CapabilityKind::Prompt), "prompt");
}
