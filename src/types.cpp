#include "internal/json_util.hpp"

#include <agentlink/types.hpp>

namespace agentlink
{

json PermissionUpdate::to_json() const
{
    json result = {{"type", type}};

    if (destination.has_value())
        result["destination"] = *destination;

    if (type == "addRules" || type == "replaceRules" || type == "removeRules")
    {
        if (rules.has_value())
        {
            json rules_array = json::array();
            for (const auto& rule : *rules)
            {
                json rule_obj = {{"toolName", rule.tool_name}};
                rule_obj["ruleContent"] =
                    rule.rule_content.has_value() ? json(*rule.rule_content) : json(nullptr);
                rules_array.push_back(rule_obj);
            }
            result["rules"] = rules_array;
        }
        if (behavior.has_value())
            result["behavior"] = *behavior;
    }
    else if (type == "setMode")
    {
        if (mode.has_value())
            result["mode"] = *mode;
    }
    else if (type == "addDirectories" || type == "removeDirectories")
    {
        if (directories.has_value())
            result["directories"] = *directories;
    }

    return result;
}

PermissionUpdate PermissionUpdate::from_json(const json& j)
{
    PermissionUpdate update;
    update.type = internal::get_string(j, "type");
    update.behavior = internal::get_optional_string(j, "behavior");
    update.mode = internal::get_optional_string(j, "mode");
    update.destination = internal::get_optional_string(j, "destination");

    auto rules_it = j.find("rules");
    if (rules_it != j.end() && rules_it->is_array())
    {
        std::vector<PermissionRuleValue> rules;
        for (const auto& rule_json : *rules_it)
        {
            if (!rule_json.is_object())
                continue;
            PermissionRuleValue rule;
            rule.tool_name = internal::get_string(rule_json, "toolName");
            rule.rule_content = internal::get_optional_string(rule_json, "ruleContent");
            rules.push_back(std::move(rule));
        }
        update.rules = std::move(rules);
    }

    auto dirs_it = j.find("directories");
    if (dirs_it != j.end() && dirs_it->is_array())
    {
        std::vector<std::string> dirs;
        for (const auto& d : *dirs_it)
        {
            if (d.is_string())
                dirs.push_back(d.get<std::string>());
        }
        update.directories = std::move(dirs);
    }

    return update;
}

InitializeResult InitializeResult::from_json(const json& j)
{
    InitializeResult result;
    if (!j.is_object())
        return result;

    result.raw = j;
    result.output_style = internal::get_string(j, "output_style");

    auto cmds = j.find("commands");
    if (cmds == j.end() || !cmds->is_array())
        cmds = j.find("supported_commands");

    if (cmds != j.end() && cmds->is_array())
    {
        for (const auto& cmd : *cmds)
        {
            if (cmd.is_string())
                result.commands.push_back(cmd.get<std::string>());
            else if (cmd.is_object() && !internal::get_string(cmd, "name").empty())
                result.commands.push_back(internal::get_string(cmd, "name"));
        }
    }

    return result;
}

} // namespace agentlink
