#pragma once

#include <nlohmann/json.hpp>
#include <reflect>
#include <string>
#include <type_traits>

/**
 * Generic reflection-based JSON serialization for aggregate types.
 *
 * Uses qlibs/reflect for compile-time introspection and nlohmann/json
 * for JSON generation.
 *
 * Example:
 *   struct Point { int x = 0; int y = 0; };
 *   auto j = SandSim::ReflectSerializer::to_json(Point{ 1, 2 });
 *   auto p = SandSim::ReflectSerializer::from_json<Point>(j, Point{});
 */
namespace SandSim::ReflectSerializer {

template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));
            j[name] = reflect::get<I>(obj);
        },
        obj);

    return j;
}

/**
 * Members missing from the JSON object keep the value they have in defaults.
 * Type mismatches throw nlohmann::json::type_error.
 */
template <typename T>
T from_json(const nlohmann::json& j, T defaults = T{})
{
    T obj = std::move(defaults);

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));
            if (j.contains(name)) {
                using MemberType = std::remove_cvref_t<decltype(reflect::get<I>(obj))>;
                reflect::get<I>(obj) = j.at(name).template get<MemberType>();
            }
        },
        obj);

    return obj;
}

} // namespace SandSim::ReflectSerializer
