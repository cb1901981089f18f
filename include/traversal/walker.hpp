#pragma once

#include "traversal/plan_registry.hpp"
#include "traversal/shape_traits.hpp"
#include "traversal/traversal_plan.hpp"

#include <format>
#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace redactkit {

/**
 * @brief Rebuilds a value of type U with all sensitive content redacted
 *
 * An empty Walker means the shape could not be walked; the reason has been
 * reported to the FieldContext.
 */
template<typename U>
using Walker = std::function<U(const U&)>;

namespace detail {

/**
 * @brief Self type for walkers composed outside any plan
 */
struct NoSelf {};

template<typename Self, typename U>
Walker<U> make_walker(const PlanRegistry& plans, const TraversalPlan<Self>* self,
                      const FieldContext& ctx);

template<typename Self, typename V, size_t... I>
Walker<V> make_variant_walker(const PlanRegistry& plans, const TraversalPlan<Self>* self,
                              const FieldContext& ctx, std::index_sequence<I...>) {
    auto walkers = std::make_tuple(
        make_walker<Self, std::variant_alternative_t<I, V>>(plans, self, ctx)...);
    if (!(static_cast<bool>(std::get<I>(walkers)) && ...)) {
        return {};
    }
    return [walkers](const V& value) {
        return rebuild_variant(value, [&walkers](auto index, const auto& alt) {
            return std::get<decltype(index)::value>(walkers)(alt);
        });
    };
}

/**
 * @brief Compose the walker for a Recurse field of type U
 *
 * Resolved once, at registration:
 * - scalars redact to their fixed default
 * - optionals, boxes, lists, sets, map values and variant alternatives are
 *   walked element by element
 * - class types walk through their registered plan; @p self stands in for
 *   the plan still being built so a type may contain itself
 * - string-like leaves and anything else are reported as invalid
 */
template<typename Self, typename U>
Walker<U> make_walker(const PlanRegistry& plans, const TraversalPlan<Self>* self,
                      const FieldContext& ctx) {
    if constexpr (RedactableScalar<U>) {
        return [](const U&) { return redacted_scalar<U>(); };
    } else if constexpr (SensitiveValue<U>) {
        ctx.fail(ErrorCategory::INVALID_FIELD_MODE, std::format(
            "Recurse on string-like type {}; mark it Classify with a classification",
            type_label<U>()));
        return {};
    } else if constexpr (is_optional_v<U>) {
        auto inner = make_walker<Self, typename U::value_type>(plans, self, ctx);
        if (!inner) return {};
        return [inner](const U& value) -> U {
            if (!value) return std::nullopt;
            return U(inner(*value));
        };
    } else if constexpr (is_box_v<U>) {
        auto inner = make_walker<Self, typename U::element_type>(plans, self, ctx);
        if (!inner) return {};
        return [inner](const U& value) -> U {
            if (!value) return nullptr;
            return make_box<U>(inner(*value));
        };
    } else if constexpr (is_sequence_v<U>) {
        auto inner = make_walker<Self, typename U::value_type>(plans, self, ctx);
        if (!inner) return {};
        return [inner](const U& value) {
            U out;
            for (const auto& element : value) {
                out.push_back(inner(element));
            }
            return out;
        };
    } else if constexpr (is_set_v<U>) {
        auto inner = make_walker<Self, typename U::value_type>(plans, self, ctx);
        if (!inner) return {};
        return [inner](const U& value) {
            U out;
            for (const auto& element : value) {
                out.insert(inner(element));
            }
            return out;
        };
    } else if constexpr (is_map_v<U>) {
        auto inner = make_walker<Self, typename U::mapped_type>(plans, self, ctx);
        if (!inner) return {};
        return [inner](const U& value) {
            U out;
            for (const auto& [key, mapped] : value) {
                out.emplace(key, inner(mapped));
            }
            return out;
        };
    } else if constexpr (is_variant_v<U>) {
        return make_variant_walker<Self, U>(
            plans, self, ctx, std::make_index_sequence<std::variant_size_v<U>>{});
    } else if constexpr (std::is_same_v<U, Self>) {
        return [self](const U& value) { return self->redact(value); };
    } else if constexpr (is_aggregate_candidate_v<U>) {
        const auto* plan = plans.find<U>();
        if (!plan) {
            ctx.fail(ErrorCategory::INVALID_FIELD_MODE, std::format(
                "Recurse into {} which has no registered traversal plan", type_label<U>()));
            return {};
        }
        return [plan](const U& value) { return plan->redact(value); };
    } else {
        ctx.fail(ErrorCategory::INVALID_FIELD_MODE, std::format(
            "type {} cannot be walked", type_label<U>()));
        return {};
    }
}

} // namespace detail

} // namespace redactkit
