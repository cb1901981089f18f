#pragma once

#include "core/types.hpp"
#include "core/utf8.hpp"
#include "core/utils.hpp"
#include "traversal/plan_registry.hpp"
#include "traversal/shape_traits.hpp"

#include <concepts>
#include <format>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace redactkit {

template<typename T>
concept Streamable = requires(std::ostream& os, const T& value) {
    { os << value } -> std::convertible_to<std::ostream&>;
};

namespace detail {

/**
 * @brief Append a debug rendering of @p value
 *
 * Registered class types render through their plan (so their own masked
 * fields print the placeholder); nothing here calls the PolicyEngine.
 */
template<typename U>
void render_value(std::string& out, const U& value, const PlanRegistry& plans,
                  std::string_view placeholder) {
    if constexpr (SensitiveValue<U>) {
        utils::append_quoted(out, SensitiveValueTraits<U>::view(value));
    } else if constexpr (std::is_same_v<U, bool>) {
        out += utils::booltostr(value);
    } else if constexpr (std::is_same_v<U, char>) {
        out += '\'';
        out += value;
        out += '\'';
    } else if constexpr (is_char_type_v<U>) {
        out += '\'';
        utf8::append(out, static_cast<char32_t>(value));
        out += '\'';
    } else if constexpr (std::is_enum_v<U>) {
        out += std::format("{}", +static_cast<std::underlying_type_t<U>>(value));
    } else if constexpr (std::is_arithmetic_v<U>) {
        out += std::format("{}", value);
    } else if constexpr (is_optional_v<U> || is_box_v<U>) {
        if (!value) {
            out += "null";
        } else {
            render_value(out, *value, plans, placeholder);
        }
    } else if constexpr (is_sequence_v<U> || is_set_v<U>) {
        out += '[';
        bool first = true;
        for (const auto& element : value) {
            if (!first) out += ", ";
            first = false;
            render_value(out, element, plans, placeholder);
        }
        out += ']';
    } else if constexpr (is_map_v<U>) {
        out += '{';
        bool first = true;
        for (const auto& [key, mapped] : value) {
            if (!first) out += ", ";
            first = false;
            render_value(out, key, plans, placeholder);
            out += ": ";
            render_value(out, mapped, plans, placeholder);
        }
        out += '}';
    } else if constexpr (is_variant_v<U>) {
        visit_indexed(value, [&](const auto& alt) {
            render_value(out, alt, plans, placeholder);
        });
    } else if constexpr (std::is_class_v<U> && std::is_convertible_v<const U&, std::string_view>) {
        utils::append_quoted(out, std::string_view(value));
    } else if constexpr (std::is_class_v<U>) {
        if (const auto* plan = plans.find<U>()) {
            plan->render(value, out, placeholder);
            return;
        }
        if constexpr (Streamable<U>) {
            std::ostringstream os;
            os << value;
            out += os.str();
        } else {
            out += "{..}";
        }
    } else {
        out += "{..}";
    }
}

} // namespace detail

/**
 * @brief Policy-independent debug string for @p value
 *
 * Renders "TypeName { field: value, ... }" for registered types. Fields
 * marked Recurse or Classify always print the quoted placeholder, whatever
 * policy their classification currently maps to; pass-through fields print
 * their value.
 */
template<typename T>
[[nodiscard]] std::string debug_render(const T& value,
                                       const PlanRegistry& plans = PlanRegistry::global(),
                                       std::string_view placeholder = kRedactedPlaceholder) {
    std::string out;
    detail::render_value(out, value, plans, placeholder);
    return out;
}

} // namespace redactkit
