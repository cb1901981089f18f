#pragma once

#include "core/types.hpp"

#include <concepts>
#include <cstddef>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace redactkit {

// ============================================================================
// String-like leaves
// ============================================================================

/**
 * @brief Customization point for string-like leaf types
 *
 * Specialize for an application newtype to let classifications apply to it:
 *
 *   template<> struct redactkit::SensitiveValueTraits<ApiKey> {
 *       static std::string_view view(const ApiKey& k) { return k.value; }
 *       static ApiKey from_redacted(std::string s) { return ApiKey{std::move(s)}; }
 *   };
 *
 * from_redacted does not need to preserve the original representation.
 */
template<typename T>
struct SensitiveValueTraits {};

template<>
struct SensitiveValueTraits<std::string> {
    static std::string_view view(const std::string& value) { return value; }
    static std::string from_redacted(std::string redacted) { return redacted; }
};

template<typename T>
concept SensitiveValue = requires(const T& value, std::string redacted) {
    { SensitiveValueTraits<T>::view(value) } -> std::convertible_to<std::string_view>;
    { SensitiveValueTraits<T>::from_redacted(std::move(redacted)) } -> std::same_as<T>;
};

// ============================================================================
// Scalar leaves
// ============================================================================

template<typename T>
inline constexpr bool is_char_type_v =
    std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
    std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> ||
    std::is_same_v<T, char32_t>;

template<typename T>
concept RedactableScalar = std::is_arithmetic_v<T> || std::is_enum_v<T>;

/**
 * @brief Fixed value a scalar redacts to: 0, false, 'X', or T{} for enums
 */
template<RedactableScalar T>
[[nodiscard]] constexpr T redacted_scalar() noexcept {
    if constexpr (std::is_same_v<T, bool>) {
        return false;
    } else if constexpr (is_char_type_v<T>) {
        return static_cast<T>(kScalarSentinel);
    } else {
        return T{};
    }
}

// ============================================================================
// Container shapes
// ============================================================================

namespace detail {

template<typename T> struct is_optional : std::false_type {};
template<typename T> struct is_optional<std::optional<T>> : std::true_type {};

template<typename T> struct is_unique_ptr : std::false_type {};
template<typename T> struct is_unique_ptr<std::unique_ptr<T>> : std::true_type {};

template<typename T> struct is_shared_ptr : std::false_type {};
template<typename T> struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template<typename T> struct is_sequence : std::false_type {};
template<typename T, typename A> struct is_sequence<std::vector<T, A>> : std::true_type {};
template<typename T, typename A> struct is_sequence<std::deque<T, A>> : std::true_type {};
template<typename T, typename A> struct is_sequence<std::list<T, A>> : std::true_type {};

template<typename T> struct is_map : std::false_type {};
template<typename K, typename V, typename C, typename A>
struct is_map<std::map<K, V, C, A>> : std::true_type {};
template<typename K, typename V, typename H, typename E, typename A>
struct is_map<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template<typename T> struct is_set : std::false_type {};
template<typename T, typename C, typename A>
struct is_set<std::set<T, C, A>> : std::true_type {};
template<typename T, typename H, typename E, typename A>
struct is_set<std::unordered_set<T, H, E, A>> : std::true_type {};

template<typename T> struct is_variant : std::false_type {};
template<typename... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};

} // namespace detail

template<typename T> inline constexpr bool is_optional_v = detail::is_optional<T>::value;
template<typename T> inline constexpr bool is_unique_ptr_v = detail::is_unique_ptr<T>::value;
template<typename T> inline constexpr bool is_shared_ptr_v = detail::is_shared_ptr<T>::value;
template<typename T> inline constexpr bool is_box_v = is_unique_ptr_v<T> || is_shared_ptr_v<T>;
template<typename T> inline constexpr bool is_sequence_v = detail::is_sequence<T>::value;
template<typename T> inline constexpr bool is_map_v = detail::is_map<T>::value;
template<typename T> inline constexpr bool is_set_v = detail::is_set<T>::value;
template<typename T> inline constexpr bool is_variant_v = detail::is_variant<T>::value;

template<typename T>
inline constexpr bool is_container_shape_v =
    is_optional_v<T> || is_box_v<T> || is_sequence_v<T> ||
    is_map_v<T> || is_set_v<T> || is_variant_v<T>;

/**
 * @brief Class types that can only be walked through a registered plan
 */
template<typename T>
inline constexpr bool is_aggregate_candidate_v =
    std::is_class_v<T> && !SensitiveValue<T> && !is_container_shape_v<T>;

// ============================================================================
// Shape helpers
// ============================================================================

/**
 * @brief Box a value the same way as @p Box (unique_ptr or shared_ptr)
 */
template<typename Box, typename U>
[[nodiscard]] Box make_box(U&& value) {
    using Element = typename Box::element_type;
    if constexpr (is_unique_ptr_v<Box>) {
        return std::make_unique<Element>(std::forward<U>(value));
    } else {
        return std::make_shared<Element>(std::forward<U>(value));
    }
}

/**
 * @brief Rebuild a variant from its active alternative, preserving the index
 *
 * Index-based so that variants repeating a type (e.g. variant<string, string>
 * used as ok/error) keep their discriminant. @p fn is called as
 * fn(std::integral_constant<size_t, I>, alternative).
 */
template<size_t I = 0, typename V, typename F>
[[nodiscard]] V rebuild_variant(const V& value, F&& fn) {
    if constexpr (I + 1 < std::variant_size_v<V>) {
        if (value.index() != I) {
            return rebuild_variant<I + 1>(value, std::forward<F>(fn));
        }
    }
    return V(std::in_place_index<I>, fn(std::integral_constant<size_t, I>{}, std::get<I>(value)));
}

/**
 * @brief Call fn on the active alternative of a variant (by index)
 */
template<size_t I = 0, typename V, typename F>
void visit_indexed(const V& value, F&& fn) {
    if constexpr (I + 1 < std::variant_size_v<V>) {
        if (value.index() != I) {
            visit_indexed<I + 1>(value, std::forward<F>(fn));
            return;
        }
    }
    fn(std::get<I>(value));
}

// ============================================================================
// Deep copy (pass-through fields)
// ============================================================================

template<typename T>
struct clone_support;

template<typename T>
inline constexpr bool is_clonable_v = clone_support<T>::value;

template<typename T>
struct clone_support : std::bool_constant<std::is_copy_constructible_v<T>> {};
template<typename T>
struct clone_support<std::unique_ptr<T>> : clone_support<T> {};
template<typename T>
struct clone_support<std::shared_ptr<T>> : clone_support<T> {};
template<typename T>
struct clone_support<std::optional<T>> : clone_support<T> {};
template<typename T, typename A>
struct clone_support<std::vector<T, A>> : clone_support<T> {};
template<typename T, typename A>
struct clone_support<std::deque<T, A>> : clone_support<T> {};
template<typename T, typename A>
struct clone_support<std::list<T, A>> : clone_support<T> {};
template<typename K, typename V, typename C, typename A>
struct clone_support<std::map<K, V, C, A>> : clone_support<V> {};
template<typename K, typename V, typename H, typename E, typename A>
struct clone_support<std::unordered_map<K, V, H, E, A>> : clone_support<V> {};
template<typename... Ts>
struct clone_support<std::variant<Ts...>> : std::conjunction<clone_support<Ts>...> {};

/**
 * @brief Independent copy of a value; boxed members are deep-copied
 */
template<typename T>
[[nodiscard]] T clone(const T& value) {
    static_assert(is_clonable_v<T>, "type cannot be copied");
    if constexpr (is_box_v<T>) {
        if (!value) return nullptr;
        return make_box<T>(clone(*value));
    } else if constexpr (is_optional_v<T>) {
        if (!value) return std::nullopt;
        return T(clone(*value));
    } else if constexpr (is_sequence_v<T>) {
        T out;
        for (const auto& element : value) {
            out.push_back(clone(element));
        }
        return out;
    } else if constexpr (is_map_v<T>) {
        T out;
        for (const auto& [key, mapped] : value) {
            out.emplace(key, clone(mapped));
        }
        return out;
    } else if constexpr (is_variant_v<T>) {
        return rebuild_variant(value, [](auto, const auto& alt) { return clone(alt); });
    } else {
        return value;
    }
}

} // namespace redactkit
