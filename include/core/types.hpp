#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace redactkit {

// ============================================================================
// Constants
// ============================================================================

inline constexpr std::string_view kRedactedPlaceholder = "[REDACTED]";
inline constexpr char32_t kDefaultMaskChar = U'*';

// Character-typed scalars redact to this sentinel instead of '\0'
inline constexpr char kScalarSentinel = 'X';

// ============================================================================
// Classification
// ============================================================================

/**
 * @brief Nominal label for the kind of data a leaf value holds
 *
 * Carries no state beyond its name; used only as a key into the
 * ClassificationRegistry.
 */
class Classification {
public:
    explicit Classification(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    bool operator==(const Classification& other) const = default;

private:
    std::string name_;
};

namespace classification {

inline const Classification kSecret{"Secret"};
inline const Classification kToken{"Token"};
inline const Classification kEmail{"Email"};
inline const Classification kCreditCard{"CreditCard"};
inline const Classification kPii{"Pii"};
inline const Classification kPhoneNumber{"PhoneNumber"};
inline const Classification kNationalId{"NationalId"};
inline const Classification kAccountId{"AccountId"};
inline const Classification kSessionId{"SessionId"};
inline const Classification kIpAddress{"IpAddress"};
inline const Classification kDateOfBirth{"DateOfBirth"};
inline const Classification kBlockchainAddress{"BlockchainAddress"};

} // namespace classification

// ============================================================================
// Field Modes
// ============================================================================

enum class FieldMode {
    PASS_THROUGH,   // copied unchanged
    RECURSE,        // walked: nested plan, container, or scalar default
    CLASSIFY        // leaf transformed by the classification's policy
};

[[nodiscard]] inline constexpr const char* field_mode_to_string(FieldMode mode) noexcept {
    switch (mode) {
        case FieldMode::PASS_THROUGH: return "PassThrough";
        case FieldMode::RECURSE:      return "Recurse";
        case FieldMode::CLASSIFY:     return "Classify";
    }
    return "Unknown";
}

} // namespace redactkit

template<>
struct std::hash<redactkit::Classification> {
    size_t operator()(const redactkit::Classification& c) const noexcept {
        return std::hash<std::string>{}(c.name());
    }
};
