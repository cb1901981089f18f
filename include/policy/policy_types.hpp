#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace redactkit {

enum class PolicyKind {
    FULL,   // replace the whole value with a placeholder
    KEEP,   // keep prefix/suffix visible, mask the middle
    MASK    // mask prefix/suffix, keep the middle visible
};

[[nodiscard]] inline constexpr const char* policy_kind_to_string(PolicyKind kind) noexcept {
    switch (kind) {
        case PolicyKind::FULL: return "Full";
        case PolicyKind::KEEP: return "Keep";
        case PolicyKind::MASK: return "Mask";
    }
    return "Unknown";
}

/**
 * @brief Text redaction strategy bound to a classification
 *
 * Counts are Unicode scalar values, not bytes. Keep and Mask preserve the
 * scalar count of their input; Full does not.
 */
class TextRedactionPolicy {
public:
    [[nodiscard]] static TextRedactionPolicy full(
        std::string placeholder = std::string(kRedactedPlaceholder)) {
        TextRedactionPolicy p(PolicyKind::FULL, 0, 0);
        p.placeholder_ = std::move(placeholder);
        return p;
    }

    [[nodiscard]] static TextRedactionPolicy keep(size_t prefix, size_t suffix) {
        return TextRedactionPolicy(PolicyKind::KEEP, prefix, suffix);
    }

    [[nodiscard]] static TextRedactionPolicy keep_first(size_t prefix) { return keep(prefix, 0); }
    [[nodiscard]] static TextRedactionPolicy keep_last(size_t suffix) { return keep(0, suffix); }

    [[nodiscard]] static TextRedactionPolicy mask(size_t prefix, size_t suffix) {
        return TextRedactionPolicy(PolicyKind::MASK, prefix, suffix);
    }

    [[nodiscard]] static TextRedactionPolicy mask_first(size_t prefix) { return mask(prefix, 0); }
    [[nodiscard]] static TextRedactionPolicy mask_last(size_t suffix) { return mask(0, suffix); }

    /**
     * @brief Copy with a different mask character (no effect on Full).
     */
    [[nodiscard]] TextRedactionPolicy with_mask_char(char32_t mask_char) const {
        TextRedactionPolicy p = *this;
        if (kind_ != PolicyKind::FULL) {
            p.mask_char_ = mask_char;
        }
        return p;
    }

    [[nodiscard]] PolicyKind kind() const noexcept { return kind_; }
    [[nodiscard]] size_t prefix() const noexcept { return prefix_; }
    [[nodiscard]] size_t suffix() const noexcept { return suffix_; }
    [[nodiscard]] char32_t mask_char() const noexcept { return mask_char_; }
    [[nodiscard]] const std::string& placeholder() const noexcept { return placeholder_; }

    /**
     * @brief Short form for logs, e.g. Keep(0,4) or Full("[REDACTED]").
     */
    [[nodiscard]] std::string describe() const;

    bool operator==(const TextRedactionPolicy& other) const = default;

private:
    TextRedactionPolicy(PolicyKind kind, size_t prefix, size_t suffix)
        : kind_(kind), prefix_(prefix), suffix_(suffix) {}

    PolicyKind kind_;
    size_t prefix_;
    size_t suffix_;
    char32_t mask_char_ = kDefaultMaskChar;
    std::string placeholder_;
};

} // namespace redactkit
