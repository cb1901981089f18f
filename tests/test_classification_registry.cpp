#include <catch2/catch_test_macros.hpp>
#include "classifier/classification_registry.hpp"
#include "core/error.hpp"
#include "policy/policy_engine.hpp"

#include <algorithm>

using namespace redactkit;

TEST_CASE("ClassificationRegistry: built-ins are pre-registered", "[registry]") {
    ClassificationRegistry registry;

    CHECK(registry.size() == 12);
    CHECK(registry.resolve(classification::kSecret) == TextRedactionPolicy::full());
    CHECK(registry.resolve(classification::kToken) == TextRedactionPolicy::keep(0, 4));
    CHECK(registry.resolve(classification::kEmail) == TextRedactionPolicy::keep(2, 0));
    CHECK(registry.resolve(classification::kCreditCard) == TextRedactionPolicy::keep(0, 4));
    CHECK(registry.resolve(classification::kPii) == TextRedactionPolicy::keep(0, 4));
    CHECK(registry.resolve(classification::kPhoneNumber) == TextRedactionPolicy::keep(0, 2));
    CHECK(registry.resolve(classification::kNationalId) == TextRedactionPolicy::keep(0, 4));
    CHECK(registry.resolve(classification::kAccountId) == TextRedactionPolicy::keep(0, 4));
    CHECK(registry.resolve(classification::kSessionId) == TextRedactionPolicy::keep(0, 4));
    CHECK(registry.resolve(classification::kIpAddress) == TextRedactionPolicy::keep(0, 4));
    CHECK(registry.resolve(classification::kDateOfBirth) == TextRedactionPolicy::full());
    CHECK(registry.resolve(classification::kBlockchainAddress) == TextRedactionPolicy::keep(0, 6));
}

TEST_CASE("ClassificationRegistry: Pii keeps the last four scalars", "[registry]") {
    ClassificationRegistry registry;
    CHECK(PolicyEngine::apply(registry.resolve(classification::kPii), "john_doe") == "****_doe");
}

TEST_CASE("ClassificationRegistry: names are sorted", "[registry]") {
    ClassificationRegistry registry;
    const auto names = registry.names();
    REQUIRE(names.size() == 12);
    CHECK(std::is_sorted(names.begin(), names.end()));
    CHECK(names.front() == "AccountId");
}

TEST_CASE("ClassificationRegistry: custom classifications", "[registry]") {
    ClassificationRegistry registry;
    const Classification internal_id{"InternalId"};

    SECTION("Unknown classification does not resolve") {
        CHECK_FALSE(registry.contains(internal_id));
        CHECK_FALSE(registry.find(internal_id).has_value());
        try {
            (void)registry.resolve(internal_id);
            FAIL("expected RegistrationError");
        } catch (const RegistrationError& e) {
            CHECK(e.category() == ErrorCategory::UNRESOLVED_CLASSIFICATION);
        }
    }

    SECTION("Registered classification resolves") {
        registry.register_classification(internal_id, TextRedactionPolicy::keep_last(3));
        CHECK(registry.contains(internal_id));
        CHECK(registry.size() == 13);
        REQUIRE(registry.find(internal_id).has_value());
        CHECK(*registry.find(internal_id) == TextRedactionPolicy::keep(0, 3));
    }

    SECTION("Built-in can be overridden") {
        registry.register_classification(classification::kSecret, TextRedactionPolicy::keep(0, 2));
        CHECK(registry.resolve(classification::kSecret) == TextRedactionPolicy::keep(0, 2));
        CHECK(registry.size() == 12);
    }

    SECTION("Empty name is rejected") {
        try {
            registry.register_classification(Classification{""}, TextRedactionPolicy::full());
            FAIL("expected RegistrationError");
        } catch (const RegistrationError& e) {
            CHECK(e.category() == ErrorCategory::CONFIG_ERROR);
        }
    }
}

TEST_CASE("ClassificationRegistry: freeze ends registration", "[registry]") {
    ClassificationRegistry registry;
    registry.register_classification(Classification{"Before"}, TextRedactionPolicy::mask(1, 1));

    CHECK_FALSE(registry.frozen());
    registry.freeze();
    CHECK(registry.frozen());

    // Idempotent
    registry.freeze();
    CHECK(registry.frozen());

    try {
        registry.register_classification(Classification{"After"}, TextRedactionPolicy::full());
        FAIL("expected RegistrationError");
    } catch (const RegistrationError& e) {
        CHECK(e.category() == ErrorCategory::REGISTRY_FROZEN);
    }

    // Reads keep working after freeze
    CHECK(registry.contains(Classification{"Before"}));
    CHECK_FALSE(registry.contains(Classification{"After"}));
    CHECK(registry.resolve(classification::kToken) == TextRedactionPolicy::keep(0, 4));
}

TEST_CASE("ClassificationRegistry: instances are independent", "[registry]") {
    ClassificationRegistry a;
    ClassificationRegistry b;

    a.register_classification(classification::kEmail, TextRedactionPolicy::full());
    CHECK(a.resolve(classification::kEmail) == TextRedactionPolicy::full());
    CHECK(b.resolve(classification::kEmail) == TextRedactionPolicy::keep(2, 0));
}

TEST_CASE("ClassificationRegistry: built-in table", "[registry]") {
    const auto builtins = ClassificationRegistry::builtins();
    CHECK(builtins.size() == 12);
    CHECK(std::any_of(builtins.begin(), builtins.end(), [](const auto& entry) {
        return entry.first == classification::kBlockchainAddress;
    }));
}
