#pragma once

#include "classifier/classification_registry.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "policy/policy_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace redactkit {

// ============================================================================
// Classification Config
// ============================================================================

struct ClassificationConfig {
    std::string name;
    std::string policy = "full";        // full | keep | mask
    int64_t prefix = 0;
    int64_t suffix = 0;
    std::optional<std::string> mask_char;
    std::optional<std::string> placeholder;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Top-level Config
// ============================================================================

struct RedactionConfig {
    LoggingConfig logging;
    bool freeze_registry = false;
    std::vector<ClassificationConfig> classifications;
};

// ============================================================================
// Config Loader
// ============================================================================

/**
 * @brief Loads classification policies from TOML
 *
 * Example:
 *   [logging]
 *   level = "warn"
 *
 *   [registry]
 *   freeze = true
 *
 *   [[classifications]]
 *   name = "InternalId"
 *   policy = "keep"
 *   suffix = 3
 *   mask_char = "#"
 *
 * String values may reference environment variables as ${NAME}.
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration from file
     * @param config_path Path to TOML config file
     * @return Result with parsed config or error
     */
    [[nodiscard]] static Result<RedactionConfig> load_from_file(const std::string& config_path);

    /**
     * @brief Load configuration from string
     * @param toml_content TOML content
     * @return Result with parsed config or error
     */
    [[nodiscard]] static Result<RedactionConfig> load_from_string(const std::string& toml_content);

    /**
     * @brief Semantic checks; every problem found is reported
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const RedactionConfig& config);

    /**
     * @brief Policy described by one [[classifications]] entry
     * @return std::nullopt if the entry is invalid
     */
    [[nodiscard]] static std::optional<TextRedactionPolicy> build_policy(const ClassificationConfig& entry);

    /**
     * @brief Apply a loaded config: log level, classifications, freeze
     *
     * All or nothing: the config is validated and every policy built
     * before the log level or the registry is touched. Returns an error
     * instead of throwing (e.g. CONFIG_ERROR, or REGISTRY_FROZEN when the
     * registry is already frozen).
     */
    [[nodiscard]] static Result<size_t> apply(const RedactionConfig& config,
                                              ClassificationRegistry& registry);
};

} // namespace redactkit
