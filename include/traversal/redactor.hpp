#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"
#include "traversal/classifiable.hpp"
#include "traversal/plan_registry.hpp"
#include "traversal/walker.hpp"

#include <type_traits>

namespace redactkit {

/**
 * @brief Redacted copy of @p value, following the registered traversal plans
 *
 * T is a registered type, or a container / variant of registered types
 * (e.g. std::vector<User>, std::optional<User>). Scalars redact to their
 * default. For a bare string-like value use classify() instead.
 *
 * @throws RegistrationError (UNREGISTERED_TYPE) if T has no plan, or
 *         (INVALID_FIELD_MODE) if a container holds a type that cannot be
 *         walked; never throws once every reachable type is registered
 */
template<typename T>
[[nodiscard]] T redact(const T& value, const PlanRegistry& plans = PlanRegistry::global()) {
    static_assert(!SensitiveValue<T>,
                  "string-like values carry no plan; use classify() with a classification");

    if constexpr (is_aggregate_candidate_v<T>) {
        return plans.get<T>().redact(value);
    } else if constexpr (RedactableScalar<T>) {
        return redacted_scalar<T>();
    } else {
        // Top-level container: compose a walker for this call
        detail::PlanDiagnostics diagnostics;
        const std::string label = detail::type_label<T>();
        const detail::FieldContext ctx{label, "<value>", diagnostics};
        const auto walker = detail::make_walker<detail::NoSelf, T>(plans, nullptr, ctx);
        if (!walker) {
            const std::string message = diagnostics.summary(label);
            utils::log::error(message);
            throw RegistrationError(diagnostics.category(), message);
        }
        return walker(value);
    }
}

} // namespace redactkit
