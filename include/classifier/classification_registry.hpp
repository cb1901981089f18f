#pragma once

#include "core/types.hpp"
#include "policy/policy_types.hpp"

#include <atomic>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace redactkit {

/**
 * @brief Classification registry - maps classifications to text policies
 *
 * Lifecycle:
 * 1. Construction pre-registers the built-in classifications.
 * 2. Registration phase: the application adds custom classifications or
 *    overrides built-ins (single-threaded or under the internal lock).
 * 3. freeze(): further registration throws; lookups take no lock.
 *
 * Usage:
 *   auto& registry = ClassificationRegistry::global();
 *   registry.register_classification(Classification{"InternalId"},
 *                                    TextRedactionPolicy::keep_last(3));
 *   registry.freeze();
 */
class ClassificationRegistry {
public:
    ClassificationRegistry();

    ClassificationRegistry(const ClassificationRegistry&) = delete;
    ClassificationRegistry& operator=(const ClassificationRegistry&) = delete;

    /**
     * @brief Process-wide registry used by the default redaction entry points
     */
    static ClassificationRegistry& global();

    /**
     * @brief Register or override the policy for a classification
     * @throws RegistrationError (REGISTRY_FROZEN) after freeze()
     */
    void register_classification(const Classification& classification,
                                 TextRedactionPolicy policy);

    /**
     * @brief Copy of the policy for a classification
     *
     * Returned by value: before freeze() another thread may override the
     * entry at any time.
     * @throws RegistrationError (UNRESOLVED_CLASSIFICATION) if unknown
     */
    [[nodiscard]] TextRedactionPolicy resolve(const Classification& classification) const;

    [[nodiscard]] std::optional<TextRedactionPolicy> find(const Classification& classification) const;

    [[nodiscard]] bool contains(const Classification& classification) const;

    /**
     * @brief Registered classification names, sorted
     */
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] size_t size() const;

    void freeze();

    [[nodiscard]] bool frozen() const noexcept {
        return frozen_.load(std::memory_order_acquire);
    }

    /**
     * @brief Built-in classification → policy table
     */
    [[nodiscard]] static std::vector<std::pair<Classification, TextRedactionPolicy>> builtins();

private:
    // Caller holds mutex_ or the registry is frozen
    const TextRedactionPolicy* lookup_unlocked(const std::string& name) const;

    std::unordered_map<std::string, TextRedactionPolicy> policies_;
    mutable std::shared_mutex mutex_;
    std::atomic<bool> frozen_{false};
};

} // namespace redactkit
