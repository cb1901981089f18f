#pragma once

#include "core/utf8.hpp"
#include "core/utils.hpp"
#include "traversal/plan_registry.hpp"
#include "traversal/redactor.hpp"
#include "traversal/shape_traits.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <string>
#include <string_view>
#include <type_traits>

namespace redactkit {

inline constexpr std::string_view kSerializationFailure = "Failed to serialize redacted value";
inline constexpr std::string_view kUnserializable = "<unserializable>";

namespace detail {

template<typename K>
inline constexpr bool is_string_key_v =
    SensitiveValue<K> || (std::is_class_v<K> && std::is_convertible_v<const K&, std::string_view>);

template<typename K>
std::string json_key(const K& key) {
    if constexpr (SensitiveValue<K>) {
        return std::string(SensitiveValueTraits<K>::view(key));
    } else {
        return std::string(std::string_view(key));
    }
}

/**
 * @brief JSON for an already-redacted value
 */
template<typename U>
nlohmann::json to_json_value(const U& value, const PlanRegistry& plans) {
    if constexpr (SensitiveValue<U>) {
        return std::string(SensitiveValueTraits<U>::view(value));
    } else if constexpr (std::is_same_v<U, bool>) {
        return value;
    } else if constexpr (std::is_same_v<U, char>) {
        return std::string(1, value);
    } else if constexpr (is_char_type_v<U>) {
        std::string s;
        utf8::append(s, static_cast<char32_t>(value));
        return s;
    } else if constexpr (std::is_enum_v<U>) {
        return static_cast<std::underlying_type_t<U>>(value);
    } else if constexpr (std::is_arithmetic_v<U>) {
        return value;
    } else if constexpr (is_optional_v<U> || is_box_v<U>) {
        if (!value) return nullptr;
        return to_json_value(*value, plans);
    } else if constexpr (is_sequence_v<U> || is_set_v<U>) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& element : value) {
            array.push_back(to_json_value(element, plans));
        }
        return array;
    } else if constexpr (is_map_v<U>) {
        if constexpr (is_string_key_v<typename U::key_type>) {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& [key, mapped] : value) {
                object[json_key(key)] = to_json_value(mapped, plans);
            }
            return object;
        } else {
            nlohmann::json pairs = nlohmann::json::array();
            for (const auto& [key, mapped] : value) {
                pairs.push_back(nlohmann::json::array(
                    {to_json_value(key, plans), to_json_value(mapped, plans)}));
            }
            return pairs;
        }
    } else if constexpr (is_variant_v<U>) {
        nlohmann::json result;
        visit_indexed(value, [&](const auto& alt) {
            result = to_json_value(alt, plans);
        });
        return result;
    } else if constexpr (std::is_class_v<U>) {
        if (const auto* plan = plans.find<U>()) {
            return plan->to_json(value);
        }
        if constexpr (std::is_constructible_v<nlohmann::json, const U&>) {
            return nlohmann::json(value);
        } else {
            return std::string(kUnserializable);
        }
    } else if constexpr (std::is_constructible_v<nlohmann::json, const U&>) {
        return nlohmann::json(value);
    } else {
        return std::string(kUnserializable);
    }
}

} // namespace detail

/**
 * @brief JSON form of the redacted copy of @p value
 *
 * The original value is redacted first; only the redacted copy is
 * serialized. Registered types become objects keyed by field name.
 */
template<typename T>
[[nodiscard]] nlohmann::json to_redacted_json(const T& value,
                                              const PlanRegistry& plans = PlanRegistry::global()) {
    return detail::to_json_value(redact(value, plans), plans);
}

/**
 * @brief Compact JSON text of the redacted copy
 *
 * A dump failure (e.g. a pass-through string holding invalid UTF-8) is
 * logged and replaced by the JSON string "Failed to serialize redacted value".
 */
template<typename T>
[[nodiscard]] std::string redacted_json_string(const T& value,
                                               const PlanRegistry& plans = PlanRegistry::global()) {
    const nlohmann::json json = to_redacted_json(value, plans);
    try {
        return json.dump();
    } catch (const nlohmann::json::exception& e) {
        utils::log::warn(std::format("Failed to serialize redacted value: {}", e.what()));
        return nlohmann::json(std::string(kSerializationFailure)).dump();
    }
}

/**
 * @brief Log "event <redacted json>" through the project logger
 */
template<typename T>
void log_redacted(utils::log::Level level, std::string_view event, const T& value,
                  const PlanRegistry& plans = PlanRegistry::global()) {
    utils::log::write(level, std::format("{} {}", event, redacted_json_string(value, plans)));
}

} // namespace redactkit
