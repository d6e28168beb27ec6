#include "cardforge/config.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>

#include <spdlog/spdlog.h>

#include "cardforge/env.hpp"

namespace cardforge::config
{
    OutputFormat parse_format(std::string_view name)
    {
        if (name == "listing")
            return OutputFormat::Listing;
        if (name == "report")
            return OutputFormat::Report;
        if (name == "json")
            return OutputFormat::Json;

        throw std::invalid_argument("unknown output format '" + std::string{name} + "', expected listing, report or json");
    }

    std::string_view format_name(OutputFormat format)
    {
        switch (format)
        {
        case OutputFormat::Listing: return "listing";
        case OutputFormat::Report: return "report";
        case OutputFormat::Json: return "json";
        }
        return "listing";
    }

    spdlog::level::level_enum parse_log_level(const std::string& name)
    {
        // from_str quietly turns anything it doesn't know into `off`
        auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off")
            throw std::invalid_argument("unknown log level '" + name + "'");
        return level;
    }

    nlohmann::json read_json(const fs::path& file)
    {
        std::ifstream i(file);
        if (!i.is_open())
            throw std::invalid_argument("unable to open config file `" + file.string() + "`");

        nlohmann::json j;
        try
        {
            i >> j;
        }
        catch (const nlohmann::json::parse_error& e)
        {
            throw std::invalid_argument("unable to parse config file `" + file.string() + "`: " + e.what());
        }
        return j;
    }

    GeneratorOptions apply_json(GeneratorOptions options, const nlohmann::json& j)
    {
        if (!j.is_object())
            throw std::invalid_argument("the config document must be a JSON object");

        auto get_or_default = [&j](const char* name, auto default_val) -> decltype(default_val)
        {
            auto it = j.find(name);
            if (it == j.end() || it->is_null())
                return default_val;

            return it->template get<decltype(default_val)>();
        };

        try
        {
            options.registry = get_or_default("registry", options.registry);
            options.bin = get_or_default("bin", options.bin);
            options.quantity = get_or_default("quantity", options.quantity);
            options.log_level = get_or_default("log_level", options.log_level);

            auto format = get_or_default("format", std::string{format_name(options.format)});
            options.format = parse_format(format);
        }
        catch (const nlohmann::json::type_error& e)
        {
            throw std::invalid_argument(std::string{"config value has the wrong type: "} + e.what());
        }

        return options;
    }

    GeneratorOptions apply_file(GeneratorOptions options, const fs::path& file)
    {
        return apply_json(std::move(options), read_json(file));
    }

    GeneratorOptions apply_environment(GeneratorOptions options)
    {
        options.registry = env::get_string("CARDFORGE_REGISTRY", options.registry);
        options.bin = env::get_string("CARDFORGE_BIN", options.bin);
        options.quantity = env::get_int("CARDFORGE_QUANTITY", (uint16_t)std::min<unsigned int>(options.quantity, UINT16_MAX));
        options.log_level = env::get_string("CARDFORGE_LOG_LEVEL", options.log_level);

        if (auto format = env::get_string("CARDFORGE_FORMAT"))
            options.format = parse_format(*format);

        return options;
    }

    GeneratorOptions load()
    {
        GeneratorOptions options;
        auto config_file = env::get_string(CONFIG_FILE_VARIABLE, DEFAULT_CONFIG_FILE);

        if (fs::exists(config_file))
        {
            spdlog::debug("Reading configuration from `{}`", config_file);
            options = apply_file(std::move(options), config_file);
        }

        return apply_environment(std::move(options));
    }
}
