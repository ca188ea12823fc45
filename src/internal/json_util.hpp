#ifndef AGENTLINK_INTERNAL_JSON_UTIL_HPP
#define AGENTLINK_INTERNAL_JSON_UTIL_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace agentlink
{
namespace internal
{

// Lenient field accessors: a missing or mistyped field yields the default
// instead of throwing, so payloads from newer agent versions never break parsing.

inline std::string get_string(const nlohmann::json& obj, const char* key)
{
    if (!obj.is_object())
        return "";
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return "";
    return it->get<std::string>();
}

inline std::optional<std::string> get_optional_string(const nlohmann::json& obj, const char* key)
{
    if (!obj.is_object())
        return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

inline bool get_bool(const nlohmann::json& obj, const char* key)
{
    if (!obj.is_object())
        return false;
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

inline nlohmann::json get_object(const nlohmann::json& obj, const char* key)
{
    if (obj.is_object())
    {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_object())
            return *it;
    }
    return nlohmann::json::object();
}

} // namespace internal
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_JSON_UTIL_HPP
