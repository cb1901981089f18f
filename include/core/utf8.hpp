#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace redactkit::utf8 {

/**
 * @brief Byte length of the scalar value starting at @p pos.
 *
 * A byte that does not begin a well-formed sequence (stray continuation byte,
 * invalid lead byte, truncated sequence) counts as a unit of its own so that
 * malformed input is still processed deterministically.
 */
[[nodiscard]] size_t sequence_length(std::string_view s, size_t pos) noexcept;

/**
 * @brief Number of scalar values in @p s.
 */
[[nodiscard]] size_t scalar_count(std::string_view s) noexcept;

/**
 * @brief Byte offset of the scalar value at @p index (s.size() if past the end).
 */
[[nodiscard]] size_t byte_offset(std::string_view s, size_t index) noexcept;

/**
 * @brief Encode a scalar value onto @p out (U+FFFD for surrogates / out of range).
 */
void append(std::string& out, char32_t codepoint);

/**
 * @brief Byte length of the UTF-8 encoding of @p codepoint.
 */
[[nodiscard]] size_t encoded_length(char32_t codepoint) noexcept;

/**
 * @brief Decode a string holding exactly one scalar value.
 * @return false if @p s is empty, malformed, or holds more than one scalar
 */
[[nodiscard]] bool decode_single(std::string_view s, char32_t& codepoint) noexcept;

} // namespace redactkit::utf8
