#pragma once

#include "core/error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace redactkit {

/**
 * @brief Literal text followed by at most one field placeholder
 */
struct DisplaySegment {
    std::string literal;
    std::optional<size_t> field;    // index into the plan's fields
    bool debug = false;             // {name:?} quotes strings
};

/**
 * @brief Parsed display template of a traversal plan
 *
 * Placeholders:
 *   {name}    field by name
 *   {0}       field by position in the plan
 *   {}        next position (counted separately from explicit indices)
 *   {name:?}  debug form: strings are quoted
 *   {{ }}     literal braces
 *
 * Format options after ':' other than '?' are accepted and ignored.
 */
class DisplayTemplate {
public:
    /**
     * @brief Parse @p text against the plan's field names
     * @return INVALID_TEMPLATE error for unmatched braces, unknown fields,
     *         out-of-range indices or malformed placeholders
     */
    [[nodiscard]] static Result<DisplayTemplate> parse(std::string_view text,
                                                       const std::vector<std::string>& field_names);

    [[nodiscard]] const std::string& text() const noexcept { return text_; }
    [[nodiscard]] const std::vector<DisplaySegment>& segments() const noexcept { return segments_; }

private:
    std::string text_;
    std::vector<DisplaySegment> segments_;
};

} // namespace redactkit
