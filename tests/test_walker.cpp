#include <catch2/catch_test_macros.hpp>
#include "traversal/plan_builder.hpp"
#include "traversal/redactor.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace redactkit;

namespace {

struct User {
    std::string username;
    std::string password;
    int age = 0;
};

struct Address {
    std::string street;
    std::string city;
};

struct Customer {
    std::string name;
    std::string email;
    Address address;
    std::vector<Address> previous;
    std::map<std::string, Address> by_label;
    std::optional<Address> shipping;
    std::shared_ptr<Address> office;
    std::unique_ptr<Address> billing;
    std::variant<Address, int> contact;
    std::vector<std::string> tokens;
    std::optional<std::string> phone;
    bool vip = false;
};

struct Node {
    std::string label;
    std::string secret;
    std::vector<Node> children;
    std::unique_ptr<Node> next;
};

struct Unregistered {
    std::string data;
};

void register_user(PlanRegistry& plans) {
    PlanBuilder<User>(plans, "User")
        .pass_through("username", &User::username)
        .classify("password", &User::password, classification::kSecret)
        .recurse("age", &User::age)
        .register_plan();
}

void register_address(PlanRegistry& plans) {
    PlanBuilder<Address>(plans, "Address")
        .classify("street", &Address::street, classification::kPii)
        .pass_through("city", &Address::city)
        .register_plan();
}

void register_customer(PlanRegistry& plans) {
    register_address(plans);
    PlanBuilder<Customer>(plans, "Customer")
        .pass_through("name", &Customer::name)
        .classify("email", &Customer::email, classification::kEmail)
        .recurse("address", &Customer::address)
        .recurse("previous", &Customer::previous)
        .recurse("by_label", &Customer::by_label)
        .recurse("shipping", &Customer::shipping)
        .recurse("office", &Customer::office)
        .pass_through("billing", &Customer::billing)
        .recurse("contact", &Customer::contact)
        .classify("tokens", &Customer::tokens, classification::kToken)
        .classify("phone", &Customer::phone, classification::kPhoneNumber)
        .recurse("vip", &Customer::vip)
        .register_plan();
}

Customer make_customer() {
    Customer c;
    c.name = "Jane Doe";
    c.email = "jane@example.com";
    c.address = Address{"12 Baker Street", "London"};
    c.previous = {Address{"1 Main St", "Springfield"}, Address{"22 Elm Road", "Shelbyville"}};
    c.by_label = {{"home", Address{"5 Oak Lane", "Leeds"}}};
    c.shipping = Address{"9 Dock Road", "Dover"};
    c.office = std::make_shared<Address>(Address{"100 Tower", "Manchester"});
    c.billing = std::make_unique<Address>(Address{"77 Bank St", "York"});
    c.contact = Address{"3 Mill Way", "Bath"};
    c.tokens = {"tok_live_abcdef", "tok_test_123456"};
    c.phone = "5551234567";
    c.vip = true;
    return c;
}

} // anonymous namespace

// ============================================================================
// Scalars, classify and pass-through
// ============================================================================

TEST_CASE("redact: pass-through, classify and scalar recurse", "[walker]") {
    ClassificationRegistry classes;
    PlanRegistry plans(classes);
    register_user(plans);

    const User input{"alice", "hunter2", 30};
    const User out = redact(input, plans);

    CHECK(out.username == "alice");
    CHECK(out.password == "[REDACTED]");
    CHECK(out.age == 0);

    // Original untouched
    CHECK(input.password == "hunter2");
    CHECK(input.age == 30);
}

TEST_CASE("redact: classification policy is resolved at redaction time", "[walker]") {
    ClassificationRegistry classes;
    PlanRegistry plans(classes);
    register_user(plans);

    classes.register_classification(classification::kSecret, TextRedactionPolicy::keep(0, 2));
    CHECK(redact(User{"bob", "hunter2", 41}, plans).password == "*****r2");
}

// ============================================================================
// Nested plans and containers
// ============================================================================

TEST_CASE("redact: nested aggregates and containers", "[walker]") {
    ClassificationRegistry classes;
    PlanRegistry plans(classes);
    register_customer(plans);

    const Customer input = make_customer();
    const Customer out = redact(input, plans);

    SECTION("Pass-through fields are identical") {
        CHECK(out.name == input.name);
    }

    SECTION("Classified leaves") {
        CHECK(out.email == "ja**************");
        CHECK(out.tokens == std::vector<std::string>{"***********cdef", "***********3456"});
        REQUIRE(out.phone.has_value());
        CHECK(*out.phone == "********67");
    }

    SECTION("Nested aggregate walked through its own plan") {
        CHECK(out.address.street == "***********reet");
        CHECK(out.address.city == "London");
    }

    SECTION("List of aggregates keeps length and order") {
        REQUIRE(out.previous.size() == 2);
        CHECK(out.previous[0].street == "*****n St");
        CHECK(out.previous[0].city == "Springfield");
        CHECK(out.previous[1].city == "Shelbyville");
    }

    SECTION("Map keys unchanged, values walked") {
        REQUIRE(out.by_label.size() == 1);
        REQUIRE(out.by_label.count("home") == 1);
        CHECK(out.by_label.at("home").street == "******Lane");
    }

    SECTION("Optional and shared_ptr") {
        REQUIRE(out.shipping.has_value());
        CHECK(out.shipping->street == "*******Road");

        REQUIRE(out.office);
        CHECK(out.office.get() != input.office.get());
        CHECK(out.office->street == "*****ower");
        CHECK(input.office->street == "100 Tower");
    }

    SECTION("Pass-through unique_ptr is deep-copied") {
        REQUIRE(out.billing);
        CHECK(out.billing.get() != input.billing.get());
        CHECK(out.billing->street == "77 Bank St");
    }

    SECTION("Variant alternative walked") {
        REQUIRE(std::holds_alternative<Address>(out.contact));
        CHECK(std::get<Address>(out.contact).street == "****** Way");
    }

    SECTION("Scalar recurse") {
        CHECK_FALSE(out.vip);
    }
}

TEST_CASE("redact: empty containers stay empty", "[walker]") {
    ClassificationRegistry classes;
    PlanRegistry plans(classes);
    register_customer(plans);

    const Customer out = redact(Customer{}, plans);
    CHECK(out.previous.empty());
    CHECK(out.by_label.empty());
    CHECK_FALSE(out.shipping.has_value());
    CHECK(out.office == nullptr);
    CHECK(out.billing == nullptr);
    CHECK_FALSE(out.phone.has_value());
    CHECK(out.email.empty());
}

// ============================================================================
// Self-recursive types
// ============================================================================

TEST_CASE("redact: self-recursive type", "[walker]") {
    ClassificationRegistry classes;
    PlanRegistry plans(classes);
    PlanBuilder<Node>(plans, "Node")
        .pass_through("label", &Node::label)
        .classify("secret", &Node::secret, classification::kSecret)
        .recurse("children", &Node::children)
        .recurse("next", &Node::next)
        .register_plan();

    Node root;
    root.label = "root";
    root.secret = "s-root";

    Node child;
    child.label = "child";
    child.secret = "s-child";
    root.children.push_back(std::move(child));

    root.next = std::make_unique<Node>();
    root.next->label = "next";
    root.next->secret = "s-next";

    const Node out = redact(root, plans);
    CHECK(out.label == "root");
    CHECK(out.secret == "[REDACTED]");
    REQUIRE(out.children.size() == 1);
    CHECK(out.children[0].label == "child");
    CHECK(out.children[0].secret == "[REDACTED]");
    REQUIRE(out.next);
    CHECK(out.next->label == "next");
    CHECK(out.next->secret == "[REDACTED]");
    CHECK(out.next->next == nullptr);
}

// ============================================================================
// Top-level entry points
// ============================================================================

TEST_CASE("redact: containers of registered types at the top level", "[walker]") {
    ClassificationRegistry classes;
    PlanRegistry plans(classes);
    register_user(plans);

    SECTION("Vector") {
        const std::vector<User> users = {{"alice", "pw1", 1}, {"bob", "pw2", 2}};
        const auto out = redact(users, plans);
        REQUIRE(out.size() == 2);
        CHECK(out[0].username == "alice");
        CHECK(out[1].password == "[REDACTED]");
        CHECK(out[1].age == 0);
    }

    SECTION("Result-like variant keeps its index") {
        using Outcome = std::variant<User, int>;
        const Outcome ok = User{"carol", "pw", 5};
        const Outcome err = 404;

        const auto ok_out = redact(ok, plans);
        REQUIRE(ok_out.index() == 0);
        CHECK(std::get<User>(ok_out).password == "[REDACTED]");

        const auto err_out = redact(err, plans);
        REQUIRE(err_out.index() == 1);
        CHECK(std::get<int>(err_out) == 0);
    }

    SECTION("Scalar") {
        CHECK(redact(1234, plans) == 0);
    }
}

TEST_CASE("redact: unregistered types are reported", "[walker]") {
    ClassificationRegistry classes;
    PlanRegistry plans(classes);

    try {
        (void)redact(Unregistered{"x"}, plans);
        FAIL("expected RegistrationError");
    } catch (const RegistrationError& e) {
        CHECK(e.category() == ErrorCategory::UNREGISTERED_TYPE);
    }

    CHECK_THROWS_AS(redact(std::vector<Unregistered>{{"x"}}, plans), RegistrationError);
}

TEST_CASE("PlanRegistry: lookups", "[walker]") {
    ClassificationRegistry classes;
    PlanRegistry plans(classes);
    register_user(plans);
    register_address(plans);

    CHECK(plans.size() == 2);
    CHECK(plans.contains<User>());
    CHECK_FALSE(plans.contains<Unregistered>());
    CHECK(plans.find<Unregistered>() == nullptr);
    CHECK(plans.type_names() == std::vector<std::string>{"Address", "User"});

    const PlanBase* by_name = plans.find_by_name("User");
    REQUIRE(by_name != nullptr);
    CHECK(by_name == &plans.get<User>());
    REQUIRE(by_name->fields().size() == 3);
    CHECK(by_name->fields()[0].name == "username");
    CHECK(by_name->fields()[0].mode == FieldMode::PASS_THROUGH);
    CHECK(by_name->fields()[1].mode == FieldMode::CLASSIFY);
    CHECK(by_name->fields()[1].classification == classification::kSecret);
    CHECK(by_name->fields()[2].mode == FieldMode::RECURSE);
    CHECK(by_name->field("age") != nullptr);
    CHECK(by_name->field("missing") == nullptr);
}

TEST_CASE("PlanRegistry: freeze keeps lookups working", "[walker]") {
    ClassificationRegistry classes;
    PlanRegistry plans(classes);
    register_user(plans);
    plans.freeze();

    CHECK(plans.frozen());
    CHECK(redact(User{"dave", "pw", 9}, plans).password == "[REDACTED]");

    try {
        register_address(plans);
        FAIL("expected RegistrationError");
    } catch (const RegistrationError& e) {
        CHECK(e.category() == ErrorCategory::REGISTRY_FROZEN);
    }
}
