#pragma once

#include "classifier/classification_registry.hpp"
#include "policy/policy_engine.hpp"
#include "traversal/shape_traits.hpp"

#include <type_traits>

namespace redactkit {

// ============================================================================
// Classifiable shapes
// ============================================================================

namespace detail {

template<typename T>
constexpr bool classifiable();

template<typename V>
struct all_alternatives_classifiable : std::false_type {};

template<typename... Ts>
struct all_alternatives_classifiable<std::variant<Ts...>>
    : std::bool_constant<(classifiable<Ts>() && ...)> {};

template<typename T>
constexpr bool classifiable() {
    if constexpr (SensitiveValue<T> || RedactableScalar<T>) {
        return true;
    } else if constexpr (is_box_v<T>) {
        return classifiable<typename T::element_type>();
    } else if constexpr (is_optional_v<T> || is_sequence_v<T> || is_set_v<T>) {
        return classifiable<typename T::value_type>();
    } else if constexpr (is_map_v<T>) {
        return classifiable<typename T::mapped_type>();
    } else if constexpr (is_variant_v<T>) {
        return all_alternatives_classifiable<T>::value;
    } else {
        return false;
    }
}

} // namespace detail

/**
 * @brief True if a classification can be applied to T: a string-like or
 * scalar leaf, possibly wrapped in any composition of container shapes.
 */
template<typename T>
inline constexpr bool is_classifiable_v = detail::classifiable<T>();

// ============================================================================
// Classification traversal
// ============================================================================

/**
 * @brief Rebuild @p value with @p policy applied to every leaf.
 *
 * String-like leaves go through the PolicyEngine, scalars become their
 * redacted default. Containers keep their shape: optionals stay engaged or
 * empty, lists keep order and length, map keys are copied untouched, variants
 * keep their active index. Sets are rebuilt, so leaves that redact to the
 * same text collapse into one element.
 */
template<typename T>
[[nodiscard]] T classify_with(const TextRedactionPolicy& policy, const T& value) {
    static_assert(is_classifiable_v<T>,
                  "classification needs a string-like or scalar leaf inside supported containers");

    if constexpr (SensitiveValue<T>) {
        using Traits = SensitiveValueTraits<T>;
        return Traits::from_redacted(PolicyEngine::apply(policy, Traits::view(value)));
    } else if constexpr (RedactableScalar<T>) {
        return redacted_scalar<T>();
    } else if constexpr (is_optional_v<T>) {
        if (!value) return std::nullopt;
        return T(classify_with(policy, *value));
    } else if constexpr (is_box_v<T>) {
        if (!value) return nullptr;
        return make_box<T>(classify_with(policy, *value));
    } else if constexpr (is_sequence_v<T>) {
        T out;
        for (const auto& element : value) {
            out.push_back(classify_with(policy, element));
        }
        return out;
    } else if constexpr (is_set_v<T>) {
        T out;
        for (const auto& element : value) {
            out.insert(classify_with(policy, element));
        }
        return out;
    } else if constexpr (is_map_v<T>) {
        T out;
        for (const auto& [key, mapped] : value) {
            out.emplace(key, classify_with(policy, mapped));
        }
        return out;
    } else {
        return rebuild_variant(value, [&policy](auto, const auto& alt) {
            return classify_with(policy, alt);
        });
    }
}

/**
 * @brief Apply the policy registered for @p classification to @p value.
 * @throws RegistrationError (UNRESOLVED_CLASSIFICATION) if the registry has
 *         no policy for it
 */
template<typename T>
[[nodiscard]] T classify(const Classification& classification, const T& value,
                         const ClassificationRegistry& registry = ClassificationRegistry::global()) {
    const TextRedactionPolicy policy = registry.resolve(classification);
    return classify_with(policy, value);
}

} // namespace redactkit
