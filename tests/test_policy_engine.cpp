#include <catch2/catch_test_macros.hpp>
#include "core/utf8.hpp"
#include "policy/policy_engine.hpp"

#include <string>
#include <vector>

using namespace redactkit;

// ============================================================================
// PolicyEngine::apply
// ============================================================================

TEST_CASE("PolicyEngine: Full replaces the whole value", "[policy]") {
    const auto policy = TextRedactionPolicy::full();

    CHECK(PolicyEngine::apply(policy, "hunter2") == "[REDACTED]");
    CHECK(PolicyEngine::apply(policy, "a much longer secret value") == "[REDACTED]");
    CHECK(PolicyEngine::apply(policy, "") == "[REDACTED]");
}

TEST_CASE("PolicyEngine: Full with custom placeholder", "[policy]") {
    const auto policy = TextRedactionPolicy::full("<hidden>");
    CHECK(PolicyEngine::apply(policy, "x") == "<hidden>");
}

TEST_CASE("PolicyEngine: Keep shows prefix and suffix", "[policy]") {
    CHECK(PolicyEngine::apply(TextRedactionPolicy::keep(0, 4), "tok_live_abcdef") == "***********cdef");
    CHECK(PolicyEngine::apply(TextRedactionPolicy::keep(2, 0), "john") == "jo**");
    CHECK(PolicyEngine::apply(TextRedactionPolicy::keep(1, 1), "abcde") == "a***e");
    CHECK(PolicyEngine::apply(TextRedactionPolicy::keep(0, 0), "abc") == "***");
}

TEST_CASE("PolicyEngine: Mask hides prefix and suffix", "[policy]") {
    CHECK(PolicyEngine::apply(TextRedactionPolicy::mask(2, 2), "abcdef") == "**cd**");
    CHECK(PolicyEngine::apply(TextRedactionPolicy::mask_first(3), "abcdef") == "***def");
    CHECK(PolicyEngine::apply(TextRedactionPolicy::mask_last(2), "abcdef") == "abcd**");
    CHECK(PolicyEngine::apply(TextRedactionPolicy::mask(0, 0), "abc") == "abc");
}

TEST_CASE("PolicyEngine: boundary collapse", "[policy]") {
    SECTION("Keep returns input unchanged when spans cover it") {
        CHECK(PolicyEngine::apply(TextRedactionPolicy::keep(0, 4), "abcd") == "abcd");
        CHECK(PolicyEngine::apply(TextRedactionPolicy::keep(0, 4), "ab") == "ab");
        CHECK(PolicyEngine::apply(TextRedactionPolicy::keep(3, 3), "abcdef") == "abcdef");
    }

    SECTION("Mask masks everything when spans cover it") {
        CHECK(PolicyEngine::apply(TextRedactionPolicy::mask(2, 2), "abc") == "***");
        CHECK(PolicyEngine::apply(TextRedactionPolicy::mask(5, 0), "abcde") == "*****");
    }

    SECTION("Huge counts do not overflow") {
        const size_t huge = static_cast<size_t>(-1);
        CHECK(PolicyEngine::apply(TextRedactionPolicy::keep(huge, huge), "secret") == "secret");
        CHECK(PolicyEngine::apply(TextRedactionPolicy::mask(huge, 1), "secret") == "******");
    }
}

TEST_CASE("PolicyEngine: empty input", "[policy]") {
    CHECK(PolicyEngine::apply(TextRedactionPolicy::keep(0, 4), "").empty());
    CHECK(PolicyEngine::apply(TextRedactionPolicy::mask(1, 1), "").empty());
}

TEST_CASE("PolicyEngine: Keep and Mask preserve scalar length", "[policy]") {
    const std::vector<std::string> inputs = {
        "a", "hunter2", "tok_live_abcdef", "caf\xC3\xA9 cr\xC3\xA8me",
        "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E", "\xF0\x9F\x94\x91\xF0\x9F\x94\x92xyz",
    };
    const std::vector<TextRedactionPolicy> policies = {
        TextRedactionPolicy::keep(0, 4), TextRedactionPolicy::keep(2, 0),
        TextRedactionPolicy::keep(1, 1), TextRedactionPolicy::mask(2, 2),
        TextRedactionPolicy::mask_first(1), TextRedactionPolicy::keep(0, 2).with_mask_char(U'•'),
    };

    for (const auto& input : inputs) {
        for (const auto& policy : policies) {
            INFO(input << " / " << policy.describe());
            CHECK(utf8::scalar_count(PolicyEngine::apply(policy, input)) == utf8::scalar_count(input));
        }
    }
}

TEST_CASE("PolicyEngine: multi-byte scalars are never split", "[policy]") {
    SECTION("Keep suffix of accented text") {
        // "crème" Keep(0,2) => "***me"
        CHECK(PolicyEngine::apply(TextRedactionPolicy::keep(0, 2), "cr\xC3\xA8me") == "***me");
    }

    SECTION("Keep prefix of CJK text") {
        // "日本語" Keep(1,0) => "日**"
        CHECK(PolicyEngine::apply(TextRedactionPolicy::keep(1, 0), "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E")
              == "\xE6\x97\xA5**");
    }

    SECTION("Mask middle of emoji text") {
        // "🔑ab🔒" Mask(1,1) => "*ab*"
        CHECK(PolicyEngine::apply(TextRedactionPolicy::mask(1, 1), "\xF0\x9F\x94\x91" "ab" "\xF0\x9F\x94\x92")
              == "*ab*");
    }
}

TEST_CASE("PolicyEngine: custom mask character", "[policy]") {
    SECTION("ASCII mask char") {
        const auto policy = TextRedactionPolicy::keep_last(4).with_mask_char(U'#');
        CHECK(PolicyEngine::apply(policy, "4111111111111111") == "############1111");
    }

    SECTION("Multi-byte mask char") {
        const auto policy = TextRedactionPolicy::keep(0, 2).with_mask_char(U'•');
        CHECK(PolicyEngine::apply(policy, "12345") == "\xE2\x80\xA2\xE2\x80\xA2\xE2\x80\xA2" "45");
    }

    SECTION("No effect on Full") {
        const auto policy = TextRedactionPolicy::full().with_mask_char(U'#');
        CHECK(policy == TextRedactionPolicy::full());
        CHECK(PolicyEngine::apply(policy, "abc") == "[REDACTED]");
    }
}

TEST_CASE("PolicyEngine: malformed UTF-8 counts bytes as units", "[policy]") {
    // 0x80 is a lone continuation byte: 4 units, last 2 kept
    CHECK(PolicyEngine::apply(TextRedactionPolicy::keep(0, 2), "a\x80yz") == "**yz");
}

TEST_CASE("TextRedactionPolicy: describe", "[policy]") {
    CHECK(TextRedactionPolicy::full().describe() == "Full(\"[REDACTED]\")");
    CHECK(TextRedactionPolicy::keep_last(4).describe() == "Keep(0,4)");
    CHECK(TextRedactionPolicy::mask(1, 2).describe() == "Mask(1,2)");
    CHECK(TextRedactionPolicy::keep_first(2).with_mask_char(U'#').describe() == "Keep(2,0) mask='#'");
}
