#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace redactkit;

TEST_CASE("EnvConfig: expand env var in placeholder", "[config][env]") {
    ::setenv("TEST_REDACT_PLACEHOLDER", "<scrubbed>", 1);

    const std::string toml = R"(
[[classifications]]
name = "Internal"
policy = "full"
placeholder = "${TEST_REDACT_PLACEHOLDER}"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().classifications.size() == 1);
    CHECK(result.value().classifications[0].placeholder == "<scrubbed>");

    ::unsetenv("TEST_REDACT_PLACEHOLDER");
}

TEST_CASE("EnvConfig: expand env var in log level", "[config][env]") {
    ::setenv("TEST_REDACT_LOG_LEVEL", "warn", 1);

    const std::string toml = R"(
[logging]
level = "${TEST_REDACT_LOG_LEVEL}"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.is_ok());
    CHECK(result.value().logging.level == "warn");

    ::unsetenv("TEST_REDACT_LOG_LEVEL");
}

TEST_CASE("EnvConfig: missing env var expands to empty", "[config][env]") {
    ::unsetenv("NONEXISTENT_VAR_XYZ_12345");

    const std::string toml = R"(
[[classifications]]
name = "Internal${NONEXISTENT_VAR_XYZ_12345}"
policy = "keep"
suffix = 2
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.is_ok());
    CHECK(result.value().classifications[0].name == "Internal");
}

TEST_CASE("EnvConfig: unclosed ${ is parse error", "[config][env]") {
    const std::string toml = R"(
[[classifications]]
name = "${UNCLOSED"
policy = "full"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONFIG_ERROR);
    CHECK(result.error_message().find("Unclosed") != std::string::npos);
}

TEST_CASE("EnvConfig: no env vars passes through unchanged", "[config][env]") {
    const std::string toml = R"(
[[classifications]]
name = "Plain"
policy = "mask"
prefix = 1
mask_char = "#"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.is_ok());
    CHECK(result.value().classifications[0].name == "Plain");
    CHECK(result.value().classifications[0].mask_char == "#");
}
