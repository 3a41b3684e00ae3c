#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

// We create our own macro with special to_json support for std::optional / nullptr
// Note: instead of converting nullptr to a JSON null, this macro omits the field completely (similar to undefined)
// WARNING: explicit nulls will be lost! If nulls are necessary (and no undefineds), then use the standard macro
#define NLOHMANN_JSON_TO_OPTIONAL(v1) \
    { \
        json val = nlohmann_json_t.v1; \
        if (val != nullptr) \
            nlohmann_json_j[#v1] = val; \
    }; // NOLINT(...)
#define NLOHMANN_DEFINE_OPTIONAL(Type, ...) \
    inline void to_json(nlohmann::json& nlohmann_json_j, const Type& nlohmann_json_t) \
    { \
        NLOHMANN_JSON_EXPAND(NLOHMANN_JSON_PASTE(NLOHMANN_JSON_TO_OPTIONAL, __VA_ARGS__)) \
    } \
    inline void from_json(const nlohmann::json& nlohmann_json_j, Type& nlohmann_json_t) \
    { \
        Type nlohmann_json_default_obj; \
        NLOHMANN_JSON_EXPAND(NLOHMANN_JSON_PASTE(NLOHMANN_JSON_FROM_WITH_DEFAULT, __VA_ARGS__)) \
    } // NOLINT(...)

// Define serializer/deserializer for std::optional
namespace nlohmann
{
template<typename T>
struct adl_serializer<std::optional<T>>
{
    static void to_json(json& j, const std::optional<T>& opt)
    {
        if (opt == std::nullopt)
            j = nullptr;
        else
            j = *opt;
    }

    static void from_json(const json& j, std::optional<T>& opt)
    {
        if (j.is_null())
            opt = std::nullopt;
        else
            opt = j.get<T>();
    }
};
} // namespace nlohmann
