#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

void write_file(const char* path, std::string_view content)
{
    std::ofstream f(path);
    f << content;
}

} // namespace

TEST_CASE("Config::load_defaults returns valid config with defaults")
{
    auto cfg = Config::load_defaults();

    CHECK(cfg.protocol().max_envelope_data == 0xFFFF);
    CHECK(cfg.protocol().log_skipped_entries == true);
    CHECK(cfg.logging().level == "info");
    CHECK(cfg.logging().file.empty());
    CHECK(cfg.logging().max_size_mb == 100);
    CHECK(cfg.logging().enable_console == true);
}

TEST_CASE("Config::load parses valid JSON file")
{
    const char* test_file = "/tmp/hamsync_config_valid.json";

    write_file(test_file, R"({
        "protocol": {
            "max_envelope_data": 1400,
            "log_skipped_entries": false
        },
        "logging": {
            "level": "debug",
            "file": "/var/log/hamsync.log",
            "max_size_mb": 50,
            "enable_console": false
        }
    })");

    auto result = Config::load(test_file);

    REQUIRE(result.has_value());
    CHECK(result->protocol().max_envelope_data == 1400);
    CHECK(result->protocol().log_skipped_entries == false);
    CHECK(result->logging().level == "debug");
    CHECK(result->logging().file == "/var/log/hamsync.log");
    CHECK(result->logging().max_size_mb == 50);
    CHECK(result->logging().enable_console == false);

    fs::remove(test_file);
}

TEST_CASE("Config::load returns error for missing file")
{
    auto result = Config::load("/nonexistent/path/config.json");

    REQUIRE(!result.has_value());
}

TEST_CASE("Config::load returns error for invalid JSON")
{
    const char* test_file = "/tmp/hamsync_config_invalid.json";

    write_file(test_file, "{ invalid json }");

    auto result = Config::load(test_file);

    REQUIRE(!result.has_value());

    fs::remove(test_file);
}

TEST_CASE("Config::load rejects envelope sizes the header cannot carry")
{
    const char* test_file = "/tmp/hamsync_config_bad_size.json";

    SECTION("too large")
    {
        write_file(test_file, R"({"protocol": {"max_envelope_data": 70000}})");
        CHECK(!Config::load(test_file).has_value());
    }

    SECTION("too small")
    {
        write_file(test_file, R"({"protocol": {"max_envelope_data": 8}})");
        CHECK(!Config::load(test_file).has_value());
    }

    SECTION("negative")
    {
        write_file(test_file, R"({"protocol": {"max_envelope_data": -1}})");
        CHECK(!Config::load(test_file).has_value());
    }

    fs::remove(test_file);
}

TEST_CASE("Config::load rejects mistyped values")
{
    const char* test_file = "/tmp/hamsync_config_bad_type.json";

    write_file(test_file, R"({"protocol": {"log_skipped_entries": "yes"}})");

    auto result = Config::load(test_file);

    REQUIRE(!result.has_value());
    CHECK(result.error().find("log_skipped_entries") != std::string::npos);

    fs::remove(test_file);
}

TEST_CASE("Config::load_or_defaults uses defaults when file missing")
{
    auto cfg = Config::load_or_defaults("/nonexistent/config.json");

    CHECK(cfg.protocol().max_envelope_data == 0xFFFF);
    CHECK(cfg.logging().level == "info");
}

TEST_CASE("Config::load applies defaults for missing sections")
{
    const char* test_file = "/tmp/hamsync_config_partial.json";

    write_file(test_file, R"({"protocol": {"max_envelope_data": 512}})");

    auto result = Config::load(test_file);

    REQUIRE(result.has_value());
    CHECK(result->protocol().max_envelope_data == 512);
    CHECK(result->protocol().log_skipped_entries == true);
    CHECK(result->logging().level == "info");

    fs::remove(test_file);
}

TEST_CASE("Config::load handles empty JSON object")
{
    const char* test_file = "/tmp/hamsync_config_empty.json";

    write_file(test_file, "{}");

    auto result = Config::load(test_file);

    REQUIRE(result.has_value());
    CHECK(result->protocol().max_envelope_data == 0xFFFF);
    CHECK(result->logging().enable_console == true);

    fs::remove(test_file);
}
