#include "policy/policy_engine.hpp"
#include "core/utf8.hpp"

#include <format>

namespace redactkit {

namespace {

// prefix + suffix >= total, without overflowing on huge counts
constexpr bool spans_cover(size_t prefix, size_t suffix, size_t total) noexcept {
    return prefix >= total || suffix >= total - prefix;
}

} // anonymous namespace

std::string PolicyEngine::apply(
    const TextRedactionPolicy& policy,
    std::string_view input) {

    switch (policy.kind()) {
        case PolicyKind::FULL:
            return policy.placeholder();

        case PolicyKind::KEEP:
            return keep_segments(input, policy.prefix(), policy.suffix(), policy.mask_char());

        case PolicyKind::MASK:
            return mask_segments(input, policy.prefix(), policy.suffix(), policy.mask_char());
    }
    return policy.placeholder();
}

std::string PolicyEngine::keep_segments(
    std::string_view input, size_t prefix, size_t suffix, char32_t mask_char) {

    if (input.empty()) {
        return {};
    }

    const size_t total = utf8::scalar_count(input);

    // Nothing left to mask
    if (spans_cover(prefix, suffix, total)) {
        return std::string(input);
    }

    const size_t head_end = utf8::byte_offset(input, prefix);
    const size_t tail_start = utf8::byte_offset(input, total - suffix);
    const size_t masked = total - prefix - suffix;

    std::string result;
    result.reserve(head_end + masked * utf8::encoded_length(mask_char) +
                   (input.size() - tail_start));
    result.append(input.substr(0, head_end));
    for (size_t i = 0; i < masked; ++i) {
        utf8::append(result, mask_char);
    }
    result.append(input.substr(tail_start));
    return result;
}

std::string PolicyEngine::mask_segments(
    std::string_view input, size_t prefix, size_t suffix, char32_t mask_char) {

    if (input.empty()) {
        return {};
    }

    const size_t total = utf8::scalar_count(input);
    const size_t mask_len = utf8::encoded_length(mask_char);

    std::string result;

    // Mask spans swallow the whole value
    if (spans_cover(prefix, suffix, total)) {
        result.reserve(total * mask_len);
        for (size_t i = 0; i < total; ++i) {
            utf8::append(result, mask_char);
        }
        return result;
    }

    const size_t head_end = utf8::byte_offset(input, prefix);
    const size_t tail_start = utf8::byte_offset(input, total - suffix);

    result.reserve((prefix + suffix) * mask_len + (tail_start - head_end));
    for (size_t i = 0; i < prefix; ++i) {
        utf8::append(result, mask_char);
    }
    result.append(input.substr(head_end, tail_start - head_end));
    for (size_t i = 0; i < suffix; ++i) {
        utf8::append(result, mask_char);
    }
    return result;
}

std::string TextRedactionPolicy::describe() const {
    if (kind_ == PolicyKind::FULL) {
        return std::format("Full(\"{}\")", placeholder_);
    }

    std::string desc = std::format("{}({},{})", policy_kind_to_string(kind_), prefix_, suffix_);
    if (mask_char_ != kDefaultMaskChar) {
        desc += " mask='";
        utf8::append(desc, mask_char_);
        desc += '\'';
    }
    return desc;
}

} // namespace redactkit
