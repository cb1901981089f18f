#include "classifier/classification_registry.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <utility>

namespace redactkit {

std::vector<std::pair<Classification, TextRedactionPolicy>> ClassificationRegistry::builtins() {
    using namespace classification;
    return {
        {kSecret,            TextRedactionPolicy::full()},
        {kToken,             TextRedactionPolicy::keep_last(4)},
        {kEmail,             TextRedactionPolicy::keep_first(2)},
        {kCreditCard,        TextRedactionPolicy::keep_last(4)},
        {kPii,               TextRedactionPolicy::keep_last(4)},
        {kPhoneNumber,       TextRedactionPolicy::keep_last(2)},
        {kNationalId,        TextRedactionPolicy::keep_last(4)},
        {kAccountId,         TextRedactionPolicy::keep_last(4)},
        {kSessionId,         TextRedactionPolicy::keep_last(4)},
        {kIpAddress,         TextRedactionPolicy::keep_last(4)},
        {kDateOfBirth,       TextRedactionPolicy::full()},
        {kBlockchainAddress, TextRedactionPolicy::keep_last(6)},
    };
}

ClassificationRegistry::ClassificationRegistry() {
    for (auto& [classification, policy] : builtins()) {
        policies_.insert_or_assign(classification.name(), std::move(policy));
    }
}

ClassificationRegistry& ClassificationRegistry::global() {
    static ClassificationRegistry registry;
    return registry;
}

void ClassificationRegistry::register_classification(
    const Classification& classification, TextRedactionPolicy policy) {

    if (classification.name().empty()) {
        throw RegistrationError(ErrorCategory::CONFIG_ERROR,
            "Classification name must not be empty");
    }

    std::unique_lock lock(mutex_);
    if (frozen()) {
        utils::log::error(std::format(
            "Rejected registration of classification '{}': registry is frozen",
            classification.name()));
        throw RegistrationError(ErrorCategory::REGISTRY_FROZEN,
            std::format("Cannot register classification '{}': registry is frozen",
                        classification.name()));
    }

    const std::string desc = policy.describe();
    const auto [it, inserted] = policies_.insert_or_assign(classification.name(), std::move(policy));
    if (inserted) {
        utils::log::info(std::format("Registered classification {} -> {}",
                                     classification.name(), desc));
    } else {
        utils::log::warn(std::format("Overriding policy for classification {} -> {}",
                                     classification.name(), desc));
    }
}

const TextRedactionPolicy* ClassificationRegistry::lookup_unlocked(const std::string& name) const {
    const auto it = policies_.find(name);
    return it != policies_.end() ? &it->second : nullptr;
}

std::optional<TextRedactionPolicy> ClassificationRegistry::find(
    const Classification& classification) const {

    // Frozen: the map is immutable, read without locking
    if (frozen()) {
        const auto* policy = lookup_unlocked(classification.name());
        if (!policy) return std::nullopt;
        return *policy;
    }

    // Copy under the lock; an override may replace the entry right after
    std::shared_lock lock(mutex_);
    const auto* policy = lookup_unlocked(classification.name());
    if (!policy) return std::nullopt;
    return *policy;
}

TextRedactionPolicy ClassificationRegistry::resolve(const Classification& classification) const {
    auto policy = find(classification);
    if (!policy) {
        throw RegistrationError(ErrorCategory::UNRESOLVED_CLASSIFICATION,
            std::format("No redaction policy registered for classification '{}'",
                        classification.name()));
    }
    return std::move(*policy);
}

bool ClassificationRegistry::contains(const Classification& classification) const {
    if (frozen()) {
        return lookup_unlocked(classification.name()) != nullptr;
    }
    std::shared_lock lock(mutex_);
    return lookup_unlocked(classification.name()) != nullptr;
}

std::vector<std::string> ClassificationRegistry::names() const {
    std::vector<std::string> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(policies_.size());
        for (const auto& [name, policy] : policies_) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t ClassificationRegistry::size() const {
    std::shared_lock lock(mutex_);
    return policies_.size();
}

void ClassificationRegistry::freeze() {
    std::unique_lock lock(mutex_);
    if (frozen()) return;
    frozen_.store(true, std::memory_order_release);
    utils::log::info(std::format("Classification registry frozen with {} classifications",
                                 policies_.size()));
}

} // namespace redactkit
