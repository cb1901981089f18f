#pragma once

#include "classifier/classification_registry.hpp"
#include "core/error.hpp"
#include "traversal/traversal_plan.hpp"

#include <atomic>
#include <format>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace redactkit {

/**
 * @brief Registry of traversal plans, keyed by C++ type and by type name
 *
 * Plans are added once by PlanBuilder::register_plan() and never replaced.
 * Like the ClassificationRegistry, the registry is populated during start-up
 * and may be frozen afterwards, after which lookups take no lock.
 *
 * Plans hold raw pointers to each other and to the classification registry,
 * so both registries must outlive every redact() that uses them.
 */
class PlanRegistry {
public:
    explicit PlanRegistry(const ClassificationRegistry& classifications = ClassificationRegistry::global());

    PlanRegistry(const PlanRegistry&) = delete;
    PlanRegistry& operator=(const PlanRegistry&) = delete;

    /**
     * @brief Process-wide plan registry (uses the global classification registry)
     */
    static PlanRegistry& global();

    template<typename T>
    [[nodiscard]] const TraversalPlan<T>* find() const {
        return static_cast<const TraversalPlan<T>*>(find_by_type(std::type_index(typeid(T))));
    }

    /**
     * @throws RegistrationError (UNREGISTERED_TYPE) if T has no plan
     */
    template<typename T>
    [[nodiscard]] const TraversalPlan<T>& get() const {
        const auto* plan = find<T>();
        if (!plan) {
            throw RegistrationError(ErrorCategory::UNREGISTERED_TYPE,
                std::format("No traversal plan registered for type {}", detail::type_label<T>()));
        }
        return *plan;
    }

    template<typename T>
    [[nodiscard]] bool contains() const {
        return find_by_type(std::type_index(typeid(T))) != nullptr;
    }

    [[nodiscard]] const PlanBase* find_by_type(std::type_index type) const;
    [[nodiscard]] const PlanBase* find_by_name(std::string_view type_name) const;

    /**
     * @brief Registered type names, sorted
     */
    [[nodiscard]] std::vector<std::string> type_names() const;

    [[nodiscard]] size_t size() const;

    /**
     * @brief Take ownership of a validated plan
     * @throws RegistrationError (DUPLICATE_TYPE) if the type or its name is
     *         already registered, (REGISTRY_FROZEN) after freeze()
     */
    void add(std::shared_ptr<const PlanBase> plan);

    void freeze();

    [[nodiscard]] bool frozen() const noexcept {
        return frozen_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const ClassificationRegistry& classifications() const noexcept {
        return classifications_;
    }

private:
    const ClassificationRegistry& classifications_;

    std::unordered_map<std::type_index, std::shared_ptr<const PlanBase>> by_type_;
    std::unordered_map<std::string, const PlanBase*> by_name_;
    mutable std::shared_mutex mutex_;
    std::atomic<bool> frozen_{false};
};

} // namespace redactkit
