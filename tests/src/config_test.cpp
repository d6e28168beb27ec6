#include <catch2/catch.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "cardforge/config.hpp"
#include "cardforge/env.hpp"

using namespace cardforge;

namespace
{
    // Sets an environment variable for the lifetime of the guard.
    class scoped_env
    {
        std::string p_name;
    public:
        scoped_env(std::string name, const char* value) : p_name(std::move(name))
        {
            setenv(p_name.c_str(), value, 1);
        }

        ~scoped_env()
        {
            unsetenv(p_name.c_str());
        }
    };
}

TEST_CASE("Output formats parse by name", "cardforge::config")
{
    REQUIRE(config::parse_format("listing") == OutputFormat::Listing);
    REQUIRE(config::parse_format("report") == OutputFormat::Report);
    REQUIRE(config::parse_format("json") == OutputFormat::Json);
    REQUIRE(config::format_name(OutputFormat::Report) == "report");
    REQUIRE_THROWS_AS(config::parse_format("xml"), std::invalid_argument);
}

TEST_CASE("Log levels use spdlog names", "cardforge::config")
{
    REQUIRE(config::parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(config::parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(config::parse_log_level("off") == spdlog::level::off);
    REQUIRE_THROWS_AS(config::parse_log_level("loud"), std::invalid_argument);
}

TEST_CASE("Config documents override the defaults", "cardforge::config")
{
    GeneratorOptions defaults;
    auto j = nlohmann::json::parse(R"({
        "registry": "bins.json",
        "bin": "532959",
        "quantity": 25,
        "format": "report",
        "log_level": "debug"
    })");

    auto options = config::apply_json(defaults, j);
    REQUIRE(options.registry == "bins.json");
    REQUIRE(options.bin == "532959");
    REQUIRE(options.quantity == 25);
    REQUIRE(options.format == OutputFormat::Report);
    REQUIRE(options.log_level == "debug");

    // Keys that aren't there keep what was already set
    auto partial = config::apply_json(options, nlohmann::json{{"bin", "411111"}, {"quantity", nullptr}});
    REQUIRE(partial.bin == "411111");
    REQUIRE(partial.quantity == 25);
    REQUIRE(partial.registry == "bins.json");
}

TEST_CASE("Config documents with the wrong types are rejected", "cardforge::config")
{
    REQUIRE_THROWS_AS(config::apply_json({}, nlohmann::json{{"quantity", "lots"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(config::apply_json({}, nlohmann::json{{"format", "yaml"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(config::apply_json({}, nlohmann::json::array()), std::invalid_argument);
}

TEST_CASE("Environment variables override the config", "cardforge::config")
{
    scoped_env bin("CARDFORGE_BIN", "378282");
    scoped_env quantity("CARDFORGE_QUANTITY", "7");
    scoped_env format("CARDFORGE_FORMAT", "json");
    scoped_env empty("CARDFORGE_REGISTRY", "");

    GeneratorOptions options;
    options.bin = "411111";
    options = config::apply_environment(options);

    REQUIRE(options.bin == "378282");
    REQUIRE(options.quantity == 7);
    REQUIRE(options.format == OutputFormat::Json);
    REQUIRE(options.registry == "data/bin-database.json");
}

TEST_CASE("Loading reads the config file named in the environment", "cardforge::config")
{
    auto path = std::filesystem::temp_directory_path() / "cardforge_config_test.json";
    {
        std::ofstream out(path);
        out << R"({ "bin": "601100", "quantity": 3, "format": "report" })";
    }

    scoped_env file(config::CONFIG_FILE_VARIABLE, path.c_str());
    scoped_env quantity("CARDFORGE_QUANTITY", "4");

    auto options = config::load();
    REQUIRE(options.bin == "601100");
    REQUIRE(options.quantity == 4);
    REQUIRE(options.format == OutputFormat::Report);
    REQUIRE(options.registry == "data/bin-database.json");

    std::filesystem::remove(path);
}

TEST_CASE("Environment values are parsed leniently", "cardforge::env")
{
    {
        scoped_env flag("CARDFORGE_TEST_FLAG", "yes");
        REQUIRE(env::get_bool("CARDFORGE_TEST_FLAG", false));
    }
    {
        scoped_env flag("CARDFORGE_TEST_FLAG", "0");
        REQUIRE_FALSE(env::get_bool("CARDFORGE_TEST_FLAG", true));
    }
    {
        scoped_env flag("CARDFORGE_TEST_FLAG", "TRUE");
        REQUIRE(env::get_bool("CARDFORGE_TEST_FLAG").value());
    }
    REQUIRE_FALSE(env::get_bool("CARDFORGE_TEST_FLAG").has_value());

    {
        scoped_env number("CARDFORGE_TEST_NUMBER", "8080");
        REQUIRE(env::get_int("CARDFORGE_TEST_NUMBER", 1) == 8080);
    }
    {
        scoped_env number("CARDFORGE_TEST_NUMBER", "70000");
        REQUIRE(env::get_int("CARDFORGE_TEST_NUMBER", 1) == 1);
    }
    {
        scoped_env number("CARDFORGE_TEST_NUMBER", "-4");
        REQUIRE_FALSE(env::get_int("CARDFORGE_TEST_NUMBER").has_value());
    }
    {
        scoped_env number("CARDFORGE_TEST_NUMBER", "12abc");
        REQUIRE(env::get_int("CARDFORGE_TEST_NUMBER", 3) == 3);
    }

    REQUIRE(env::get_string("CARDFORGE_TEST_STRING", "fallback") == "fallback");
}
