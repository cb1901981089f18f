#include "render/display_template.hpp"

#include <algorithm>
#include <charconv>
#include <format>

namespace redactkit {

namespace {

bool is_identifier(std::string_view s) {
    if (s.empty()) return false;
    const auto is_alpha = [](char c) {
        return c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    };
    const auto is_digit = [](char c) { return c >= '0' && c <= '9'; };
    if (!is_alpha(s.front())) return false;
    return std::all_of(s.begin() + 1, s.end(), [&](char c) { return is_alpha(c) || is_digit(c); });
}

bool is_all_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

Result<DisplayTemplate> DisplayTemplate::parse(std::string_view text,
                                               const std::vector<std::string>& field_names) {
    const auto fail = [](std::string message) {
        return Result<DisplayTemplate>::error(ErrorCategory::INVALID_TEMPLATE, std::move(message));
    };

    DisplayTemplate tmpl;
    tmpl.text_ = std::string(text);

    DisplaySegment current;
    size_t implicit_index = 0;
    size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];

        if (c == '}') {
            if (i + 1 < text.size() && text[i + 1] == '}') {
                current.literal += '}';
                i += 2;
                continue;
            }
            return fail(std::format("unmatched '}}' at position {}", i));
        }

        if (c != '{') {
            current.literal += c;
            ++i;
            continue;
        }

        if (i + 1 < text.size() && text[i + 1] == '{') {
            current.literal += '{';
            i += 2;
            continue;
        }

        const size_t close = text.find('}', i + 1);
        if (close == std::string_view::npos) {
            return fail(std::format("unmatched '{{' at position {}", i));
        }

        const std::string_view inside = text.substr(i + 1, close - i - 1);
        const size_t colon = inside.find(':');
        const std::string_view arg = trim(inside.substr(0, colon));
        const bool debug = colon != std::string_view::npos
            && inside.substr(colon + 1).find('?') != std::string_view::npos;

        size_t index = 0;
        if (arg.empty()) {
            index = implicit_index++;
        } else if (is_all_digits(arg)) {
            const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), index);
            if (ec != std::errc{} || ptr != arg.data() + arg.size()) {
                return fail(std::format("invalid index '{}'", arg));
            }
        } else if (is_identifier(arg)) {
            const auto it = std::find(field_names.begin(), field_names.end(), arg);
            if (it == field_names.end()) {
                return fail(std::format("unknown field '{}'", arg));
            }
            index = static_cast<size_t>(it - field_names.begin());
        } else {
            return fail(std::format("unsupported placeholder '{}'", arg));
        }

        if (index >= field_names.size()) {
            return fail(std::format("unknown positional field index {}", index));
        }

        current.field = index;
        current.debug = debug;
        tmpl.segments_.push_back(std::move(current));
        current = DisplaySegment{};
        i = close + 1;
    }

    if (!current.literal.empty()) {
        tmpl.segments_.push_back(std::move(current));
    }
    return Result<DisplayTemplate>::ok(std::move(tmpl));
}

} // namespace redactkit
