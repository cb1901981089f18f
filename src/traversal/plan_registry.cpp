#include "traversal/plan_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <mutex>

namespace redactkit {

PlanRegistry::PlanRegistry(const ClassificationRegistry& classifications)
    : classifications_(classifications) {}

PlanRegistry& PlanRegistry::global() {
    static PlanRegistry registry(ClassificationRegistry::global());
    return registry;
}

const PlanBase* PlanRegistry::find_by_type(std::type_index type) const {
    if (frozen()) {
        const auto it = by_type_.find(type);
        return it != by_type_.end() ? it->second.get() : nullptr;
    }

    std::shared_lock lock(mutex_);
    const auto it = by_type_.find(type);
    return it != by_type_.end() ? it->second.get() : nullptr;
}

const PlanBase* PlanRegistry::find_by_name(std::string_view type_name) const {
    const std::string key(type_name);
    if (frozen()) {
        const auto it = by_name_.find(key);
        return it != by_name_.end() ? it->second : nullptr;
    }

    std::shared_lock lock(mutex_);
    const auto it = by_name_.find(key);
    return it != by_name_.end() ? it->second : nullptr;
}

std::vector<std::string> PlanRegistry::type_names() const {
    std::vector<std::string> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(by_name_.size());
        for (const auto& [name, plan] : by_name_) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t PlanRegistry::size() const {
    std::shared_lock lock(mutex_);
    return by_type_.size();
}

void PlanRegistry::add(std::shared_ptr<const PlanBase> plan) {
    if (!plan) {
        throw RegistrationError(ErrorCategory::INTERNAL_ERROR, "Cannot register a null traversal plan");
    }

    std::unique_lock lock(mutex_);
    if (frozen()) {
        utils::log::error(std::format(
            "Rejected traversal plan for {}: plan registry is frozen", plan->type_name()));
        throw RegistrationError(ErrorCategory::REGISTRY_FROZEN,
            std::format("Cannot register traversal plan for {}: plan registry is frozen",
                        plan->type_name()));
    }

    if (by_type_.contains(plan->type()) || by_name_.contains(plan->type_name())) {
        utils::log::error(std::format(
            "Rejected traversal plan for {}: type already registered", plan->type_name()));
        throw RegistrationError(ErrorCategory::DUPLICATE_TYPE,
            std::format("Traversal plan for {} is already registered", plan->type_name()));
    }

    utils::log::info(std::format("Registered traversal plan {}", plan->describe()));
    by_name_.emplace(plan->type_name(), plan.get());
    by_type_.emplace(plan->type(), std::move(plan));
}

void PlanRegistry::freeze() {
    std::unique_lock lock(mutex_);
    if (frozen()) return;
    frozen_.store(true, std::memory_order_release);
    utils::log::info(std::format("Plan registry frozen with {} plans", by_type_.size()));
}

} // namespace redactkit
