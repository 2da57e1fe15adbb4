#pragma once

#include <reflect>

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

/**
 * Reflection-based JSON serialization for aggregate config structs.
 *
 * Uses qlibs/reflect to walk the members and nlohmann/json to store them.
 * Enums are written by enumerator name, empty optionals are omitted, and
 * from_json() leaves members that are absent from the JSON at their defaults.
 *
 * Example:
 *   struct Rates { double crossover = 0.8; double mutation = 0.05; };
 *   auto j = ReflectSerializer::to_json(Rates{});
 *   auto rates = ReflectSerializer::from_json<Rates>(j);
 */
namespace ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename E>
nlohmann::json enumToJson(E value)
{
    return std::string(reflect::enum_name(value));
}

template <typename E>
E enumFromJson(const nlohmann::json& j)
{
    const auto text = j.get<std::string>();
    for (const auto& [enumValue, enumName] : reflect::enumerators<E>) {
        if (enumName == text) {
            return static_cast<E>(enumValue);
        }
    }
    throw std::runtime_error("Invalid enum value: " + text);
}

template <typename M>
nlohmann::json memberToJson(const M& value)
{
    if constexpr (std::is_enum_v<M>) {
        return enumToJson(value);
    }
    else {
        return nlohmann::json(value);
    }
}

template <typename M>
M memberFromJson(const nlohmann::json& j)
{
    if constexpr (std::is_enum_v<M>) {
        return enumFromJson<M>(j);
    }
    else {
        return j.get<M>();
    }
}

template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();

    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            const auto& value = reflect::get<I>(obj);
            using MemberType = std::remove_cvref_t<decltype(value)>;

            if constexpr (is_optional_v<MemberType>) {
                if (value.has_value()) {
                    j[name] = memberToJson(*value);
                }
            }
            else {
                j[name] = memberToJson(value);
            }
        },
        obj);

    return j;
}

template <typename T>
T from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        throw std::runtime_error("Expected a JSON object");
    }

    T obj{};
    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            if (!j.contains(name)) {
                return;
            }

            auto& member = reflect::get<I>(obj);
            using MemberType = std::remove_cvref_t<decltype(member)>;

            if constexpr (is_optional_v<MemberType>) {
                if (j[name].is_null()) {
                    member.reset();
                }
                else {
                    member = memberFromJson<typename MemberType::value_type>(j[name]);
                }
            }
            else {
                member = memberFromJson<MemberType>(j[name]);
            }
        },
        obj);

    return obj;
}

} // namespace ReflectSerializer
