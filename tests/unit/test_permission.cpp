#include "../../src/internal/permission_handler.hpp"

#include <agentlink/errors.hpp>
#include <gtest/gtest.h>

using namespace agentlink;
using internal::PermissionHandler;

TEST(PermissionHandlerTest, DefaultDenyWithoutCallback)
{
    PermissionHandler handler(std::nullopt);

    json result = handler.handle({{"subtype", "can_use_tool"}, {"tool_name", "Bash"}});
    EXPECT_EQ(result["behavior"], "deny");
    EXPECT_EQ(result["message"], "no permission callback registered");
    EXPECT_FALSE(result.contains("interrupt"));
}

TEST(PermissionHandlerTest, MissingToolNameFails)
{
    PermissionHandler handler(std::nullopt);
    try
    {
        handler.handle({{"subtype", "can_use_tool"}, {"input", json::object()}});
        FAIL() << "expected HandlerError";
    }
    catch (const HandlerError& e)
    {
        EXPECT_STREQ(e.what(), "missing tool_name");
    }
}

TEST(PermissionHandlerTest, AllowPassesInputAndContext)
{
    std::string seen_tool;
    json seen_input;
    ToolPermissionContext seen_context;

    PermissionHandler handler(
        [&](const std::string& tool_name, const json& input, const ToolPermissionContext& ctx)
        {
            seen_tool = tool_name;
            seen_input = input;
            seen_context = ctx;
            return PermissionResultAllow{};
        });

    json request = {{"subtype", "can_use_tool"},
                    {"tool_name", "Write"},
                    {"input", {{"file_path", "/tmp/x"}}},
                    {"blocked_path", "/etc"},
                    {"permission_suggestions",
                     {{{"type", "addRules"},
                       {"rules", {{{"toolName", "Write"}, {"ruleContent", "/tmp/**"}}}},
                       {"behavior", "allow"},
                       {"destination", "session"},
                       {"futureField", 1}},
                      "not an object",
                      {{"type", "setMode"}, {"mode", "acceptEdits"}}}}};

    json result = handler.handle(request);

    // Only "behavior" when the callback does not change anything
    EXPECT_EQ(result, json({{"behavior", "allow"}}));

    EXPECT_EQ(seen_tool, "Write");
    EXPECT_EQ(seen_input["file_path"], "/tmp/x");
    EXPECT_TRUE(seen_context.blocked_path == "/etc");
    ASSERT_EQ(seen_context.suggestions.size(), 2u);
    EXPECT_EQ(seen_context.suggestions[0].type, "addRules");
    ASSERT_TRUE(seen_context.suggestions[0].rules.has_value());
    EXPECT_EQ((*seen_context.suggestions[0].rules)[0].tool_name, "Write");
    EXPECT_TRUE((*seen_context.suggestions[0].rules)[0].rule_content == "/tmp/**");
    EXPECT_TRUE(seen_context.suggestions[1].mode == "acceptEdits");
}

TEST(PermissionHandlerTest, MissingInputBecomesEmptyObject)
{
    json seen_input;
    PermissionHandler handler(
        [&](const std::string&, const json& input, const ToolPermissionContext&)
        {
            seen_input = input;
            return PermissionResultAllow{};
        });

    handler.handle({{"tool_name", "Read"}, {"input", "garbage"}});
    EXPECT_TRUE(seen_input.is_object());
    EXPECT_TRUE(seen_input.empty());
}

TEST(PermissionHandlerTest, AllowWithUpdates)
{
    PermissionHandler handler(
        [](const std::string&, const json&, const ToolPermissionContext&)
        {
            PermissionResultAllow allow;
            allow.updated_input = json{{"command", "ls -la"}};
            PermissionUpdate update;
            update.type = "setMode";
            update.mode = "acceptEdits";
            update.destination = PermissionUpdateDestination::Session;
            allow.updated_permissions = std::vector<PermissionUpdate>{update};
            return allow;
        });

    json result = handler.handle({{"tool_name", "Bash"}, {"input", {{"command", "ls"}}}});
    EXPECT_EQ(result["behavior"], "allow");
    EXPECT_EQ(result["updatedInput"]["command"], "ls -la");
    ASSERT_EQ(result["updatedPermissions"].size(), 1u);
    EXPECT_EQ(result["updatedPermissions"][0]["type"], "setMode");
    EXPECT_EQ(result["updatedPermissions"][0]["mode"], "acceptEdits");
    EXPECT_EQ(result["updatedPermissions"][0]["destination"], "session");
}

TEST(PermissionHandlerTest, DenyWithMessageAndInterrupt)
{
    PermissionHandler handler([](const std::string&, const json&, const ToolPermissionContext&)
                              { return PermissionResultDeny{"not in this repo", true}; });

    json result = handler.handle({{"tool_name", "Bash"}});
    EXPECT_EQ(result["behavior"], "deny");
    EXPECT_EQ(result["message"], "not in this repo");
    EXPECT_EQ(result["interrupt"], true);
}

TEST(PermissionHandlerTest, DenyOmitsEmptyMessage)
{
    PermissionHandler handler([](const std::string&, const json&, const ToolPermissionContext&)
                              { return PermissionResultDeny{}; });

    EXPECT_EQ(handler.handle({{"tool_name", "Bash"}}), json({{"behavior", "deny"}}));
}

TEST(PermissionHandlerTest, ThrowingCallbackBecomesHandlerError)
{
    PermissionHandler handler(
        [](const std::string&, const json&, const ToolPermissionContext&) -> PermissionResult
        { throw std::runtime_error("policy store offline"); });

    try
    {
        handler.handle({{"tool_name", "Bash"}});
        FAIL() << "expected HandlerError";
    }
    catch (const HandlerError& e)
    {
        EXPECT_STREQ(e.what(), "callback error: policy store offline");
    }
}
