#pragma once

#include "policy/policy_types.hpp"

#include <string>
#include <string_view>

namespace redactkit {

/**
 * @brief Text redaction engine - applies a policy to a single string value
 *
 * Strategies:
 * - FULL: Replace entire value with the placeholder (even when empty)
 * - KEEP: "tok_live_abcdef" with Keep(0,4) => "***********cdef"
 * - MASK: "abcdef" with Mask(2,2) => "**cd**"
 *
 * Pure and deterministic; only the output string is allocated.
 */
class PolicyEngine {
public:
    [[nodiscard]] static std::string apply(
        const TextRedactionPolicy& policy,
        std::string_view input);

private:
    static std::string keep_segments(
        std::string_view input, size_t prefix, size_t suffix, char32_t mask_char);
    static std::string mask_segments(
        std::string_view input, size_t prefix, size_t suffix, char32_t mask_char);
};

} // namespace redactkit
