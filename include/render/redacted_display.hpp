#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"
#include "render/debug_render.hpp"
#include "traversal/plan_registry.hpp"
#include "traversal/redactor.hpp"
#include "traversal/shape_traits.hpp"

#include <string>
#include <type_traits>

namespace redactkit {

namespace detail {

/**
 * @brief Append the display form of an already-redacted value
 *
 * Strings print raw, or quoted when @p debug is set. Registered types use
 * their display template, falling back to "TypeName { field: value, ... }".
 * Elements of containers always print in debug form.
 */
template<typename U>
void display_value(std::string& out, const U& value, const PlanRegistry& plans, bool debug) {
    if constexpr (SensitiveValue<U>) {
        if (debug) {
            utils::append_quoted(out, SensitiveValueTraits<U>::view(value));
        } else {
            out += SensitiveValueTraits<U>::view(value);
        }
    } else if constexpr (is_optional_v<U> || is_box_v<U>) {
        if (!value) {
            out += "null";
        } else {
            display_value(out, *value, plans, debug);
        }
    } else if constexpr (is_sequence_v<U> || is_set_v<U>) {
        out += '[';
        bool first = true;
        for (const auto& element : value) {
            if (!first) out += ", ";
            first = false;
            display_value(out, element, plans, true);
        }
        out += ']';
    } else if constexpr (is_map_v<U>) {
        out += '{';
        bool first = true;
        for (const auto& [key, mapped] : value) {
            if (!first) out += ", ";
            first = false;
            display_value(out, key, plans, true);
            out += ": ";
            display_value(out, mapped, plans, true);
        }
        out += '}';
    } else if constexpr (is_variant_v<U>) {
        visit_indexed(value, [&](const auto& alt) {
            display_value(out, alt, plans, debug);
        });
    } else if constexpr (std::is_class_v<U> && !std::is_convertible_v<const U&, std::string_view>) {
        if (const auto* plan = plans.find<U>()) {
            plan->display(value, out, debug);
            return;
        }
        render_value(out, value, plans, kRedactedPlaceholder);
    } else {
        render_value(out, value, plans, kRedactedPlaceholder);
    }
}

} // namespace detail

/**
 * @brief Human-readable text of the redacted copy of @p value
 *
 * Meant for error messages: a type registered with
 *   PlanBuilder<LoginFailed>(plans, "LoginFailed")
 *       .pass_through("user", &LoginFailed::user)
 *       .classify("password", &LoginFailed::password, classification::kSecret)
 *       .display("login failed for {user} with {password:?}")
 *       .register_plan();
 * prints "login failed for alice with \"[REDACTED]\"". Classified fields
 * show their policy output, nested types their own display form.
 */
template<typename T>
[[nodiscard]] std::string redacted_display(const T& value,
                                           const PlanRegistry& plans = PlanRegistry::global()) {
    std::string out;
    detail::display_value(out, redact(value, plans), plans, false);
    return out;
}

} // namespace redactkit
