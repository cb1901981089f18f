#include "config/config_loader.hpp"
#include "core/utf8.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>
#include <utility>

using namespace std::string_literals;

namespace redactkit {

namespace {

constexpr std::string_view kLogging         = "logging";
constexpr std::string_view kRegistry        = "registry";
constexpr std::string_view kClassifications = "classifications";

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_in_table(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_in_table(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_in_node(elem);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_in_table(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_in_table(result);
    return result;
}

// Wrong TOML types are collected, not silently replaced by the default
using TypeErrors = std::vector<std::string>;

template<typename T>
T read_value(const toml::table& tbl, std::string_view key, T fallback,
             std::string_view path, std::string_view expected, TypeErrors& type_errors) {
    const auto node = tbl[key];
    if (!node) return fallback;
    if (auto v = node.template value_exact<T>()) return *v;
    type_errors.push_back(std::format("{} must be {}", path, expected));
    return fallback;
}

std::optional<std::string> read_optional_string(const toml::table& tbl, std::string_view key,
                                                std::string_view path, TypeErrors& type_errors) {
    const auto node = tbl[key];
    if (!node) return std::nullopt;
    if (const auto* v = node.as_string()) {
        return std::string(v->get());
    }
    type_errors.push_back(std::format("{} must be a string", path));
    return std::nullopt;
}

const toml::table* section_table(const toml::table& root, std::string_view name,
                                 TypeErrors& type_errors) {
    const auto node = root[name];
    if (!node) return nullptr;
    if (const auto* tbl = node.as_table()) return tbl;
    type_errors.push_back(std::format("{} must be a table", name));
    return nullptr;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root, TypeErrors& type_errors) {
    LoggingConfig cfg;
    if (const auto* logging = section_table(root, kLogging, type_errors)) {
        cfg.level = read_value(*logging, "level", "info"s, "logging.level", "a string", type_errors);
    }
    return cfg;
}

bool extract_freeze(const toml::table& root, TypeErrors& type_errors) {
    if (const auto* registry = section_table(root, kRegistry, type_errors)) {
        return read_value(*registry, "freeze", false, "registry.freeze", "a boolean", type_errors);
    }
    return false;
}

std::vector<ClassificationConfig> extract_classifications(const toml::table& root,
                                                          TypeErrors& type_errors) {
    std::vector<ClassificationConfig> result;
    const auto node = root[kClassifications];
    if (!node) return result;
    const auto* arr = node.as_array();
    if (!arr) {
        type_errors.push_back("classifications must be an array of tables");
        return result;
    }

    result.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* tbl = (*arr)[i].as_table();
        if (!tbl) {
            type_errors.push_back(std::format("classifications[{}] must be a table", i));
            continue;
        }

        const auto path = [i](std::string_view key) {
            return std::format("classifications[{}].{}", i, key);
        };

        ClassificationConfig entry;
        entry.name = read_value(*tbl, "name", ""s, path("name"), "a string", type_errors);
        entry.policy = utils::to_lower(
            read_value(*tbl, "policy", "full"s, path("policy"), "a string", type_errors));
        entry.prefix = read_value(*tbl, "prefix", int64_t{0}, path("prefix"), "an integer", type_errors);
        entry.suffix = read_value(*tbl, "suffix", int64_t{0}, path("suffix"), "an integer", type_errors);
        entry.mask_char = read_optional_string(*tbl, "mask_char", path("mask_char"), type_errors);
        entry.placeholder = read_optional_string(*tbl, "placeholder", path("placeholder"), type_errors);
        result.push_back(std::move(entry));
    }
    return result;
}

RedactionConfig extract_all_sections(const toml::table& root, TypeErrors& type_errors) {
    RedactionConfig config;
    config.logging = extract_logging(root, type_errors);
    config.freeze_registry = extract_freeze(root, type_errors);
    config.classifications = extract_classifications(root, type_errors);
    return config;
}

std::string combine_errors(const std::vector<std::string>& errors) {
    std::string combined = "Config validation failed:";
    for (const auto& err : errors) { combined += "\n  - "; combined += err; }
    return combined;
}

Result<RedactionConfig> validate_and_return(RedactionConfig config, TypeErrors type_errors) {
    auto errors = std::move(type_errors);
    for (auto& err : ConfigLoader::validate_config(config)) {
        errors.push_back(std::move(err));
    }
    if (!errors.empty()) {
        std::string combined = combine_errors(errors);
        utils::log::error(combined);
        return Result<RedactionConfig>::error(ErrorCategory::CONFIG_ERROR, std::move(combined));
    }
    return Result<RedactionConfig>::ok(std::move(config));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

Result<RedactionConfig> ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        TypeErrors type_errors;
        auto config = extract_all_sections(tbl, type_errors);
        return validate_and_return(std::move(config), std::move(type_errors));
    } catch (const std::exception& e) {
        const std::string message = std::format("Failed to load config: {}", e.what());
        utils::log::error(message);
        return Result<RedactionConfig>::error(ErrorCategory::CONFIG_ERROR, message);
    }
}

Result<RedactionConfig> ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        TypeErrors type_errors;
        auto config = extract_all_sections(tbl, type_errors);
        return validate_and_return(std::move(config), std::move(type_errors));
    } catch (const std::exception& e) {
        const std::string message = std::format("Failed to parse config: {}", e.what());
        utils::log::error(message);
        return Result<RedactionConfig>::error(ErrorCategory::CONFIG_ERROR, message);
    }
}

std::optional<TextRedactionPolicy> ConfigLoader::build_policy(const ClassificationConfig& entry) {
    if (entry.prefix < 0 || entry.suffix < 0) {
        return std::nullopt;
    }

    const auto prefix = static_cast<size_t>(entry.prefix);
    const auto suffix = static_cast<size_t>(entry.suffix);

    std::optional<TextRedactionPolicy> policy;
    if (entry.policy == "full") {
        return entry.placeholder ? TextRedactionPolicy::full(*entry.placeholder)
                                 : TextRedactionPolicy::full();
    } else if (entry.policy == "keep") {
        policy = TextRedactionPolicy::keep(prefix, suffix);
    } else if (entry.policy == "mask") {
        policy = TextRedactionPolicy::mask(prefix, suffix);
    } else {
        return std::nullopt;
    }

    if (entry.mask_char) {
        char32_t mask_char = 0;
        if (!utf8::decode_single(*entry.mask_char, mask_char)) {
            return std::nullopt;
        }
        policy = policy->with_mask_char(mask_char);
    }
    return policy;
}

Result<size_t> ConfigLoader::apply(const RedactionConfig& config, ClassificationRegistry& registry) {
    // Everything is checked and built before the logger or registry changes
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        return Result<size_t>::error(ErrorCategory::CONFIG_ERROR, combine_errors(errors));
    }

    const auto level = utils::log::parse_level(config.logging.level);
    if (!level) {
        return Result<size_t>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Unknown log level '{}'", config.logging.level));
    }

    std::vector<std::pair<Classification, TextRedactionPolicy>> staged;
    staged.reserve(config.classifications.size());
    for (const auto& entry : config.classifications) {
        auto policy = build_policy(entry);
        if (!policy) {
            return Result<size_t>::error(ErrorCategory::CONFIG_ERROR,
                std::format("Invalid policy for classification '{}'", entry.name));
        }
        staged.emplace_back(Classification{entry.name}, std::move(*policy));
    }

    if (registry.frozen() && !staged.empty()) {
        return Result<size_t>::error(ErrorCategory::REGISTRY_FROZEN,
            std::format("Cannot apply {} classifications: registry is frozen", staged.size()));
    }

    utils::log::set_level(*level);

    size_t registered = 0;
    try {
        for (auto& [classification, policy] : staged) {
            registry.register_classification(classification, std::move(policy));
            ++registered;
        }
    } catch (const RegistrationError& e) {
        // Only reachable if another thread froze the registry meanwhile
        return Result<size_t>::error(e.category(), e.what());
    }

    if (config.freeze_registry) {
        registry.freeze();
    }

    utils::log::info(std::format("Applied redaction config: {} classifications", registered));
    return Result<size_t>::ok(registered);
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const RedactionConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be info, warn or error, got '{}'", config.logging.level));
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.classifications.size(); ++i) {
        const auto& entry = config.classifications[i];

        if (entry.name.empty()) {
            errors.push_back(std::format("classifications[{}].name must not be empty", i));
        } else if (!seen.insert(entry.name).second) {
            errors.push_back(std::format(
                "classifications[{}].name '{}' is declared more than once", i, entry.name));
        }

        const bool is_full = entry.policy == "full";
        if (!is_full && entry.policy != "keep" && entry.policy != "mask") {
            errors.push_back(std::format(
                "classifications[{}].policy must be full, keep or mask, got '{}'", i, entry.policy));
            continue;
        }

        if (entry.prefix < 0) {
            errors.push_back(std::format(
                "classifications[{}].prefix must be >= 0, got {}", i, entry.prefix));
        }
        if (entry.suffix < 0) {
            errors.push_back(std::format(
                "classifications[{}].suffix must be >= 0, got {}", i, entry.suffix));
        }

        if (entry.mask_char) {
            char32_t mask_char = 0;
            if (is_full) {
                errors.push_back(std::format(
                    "classifications[{}].mask_char is not used by the full policy", i));
            } else if (!utf8::decode_single(*entry.mask_char, mask_char)) {
                errors.push_back(std::format(
                    "classifications[{}].mask_char must be exactly one character", i));
            }
        }
        if (entry.placeholder && !is_full) {
            errors.push_back(std::format(
                "classifications[{}].placeholder is only valid for the full policy", i));
        }
    }

    return errors;
}

} // namespace redactkit
