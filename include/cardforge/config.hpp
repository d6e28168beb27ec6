#ifndef CARDFORGE_CONFIG_HPP
#define CARDFORGE_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include "validation.hpp"

namespace cardforge
{
    enum class OutputFormat
    {
        Listing,
        Report,
        Json
    };

    /**
     * Everything the generator front end can be told.
     *
     * The options come from, in increasing priority:
     *   the defaults below
     *   a JSON config file
     *   CARDFORGE_* environment variables
     *   command line flags (applied by the front end itself)
     */
    struct GeneratorOptions
    {
        std::string registry = "data/bin-database.json";
        std::string bin;
        unsigned int quantity = validation::DEFAULT_QUANTITY;
        OutputFormat format = OutputFormat::Listing;
        std::string log_level = "info";
    };

    namespace config
    {
        namespace fs = std::filesystem;

        constexpr const char* CONFIG_FILE_VARIABLE = "CARDFORGE_CONFIG_FILE";
        constexpr const char* DEFAULT_CONFIG_FILE = "cardforge.json";

        /**
         * @throws std::invalid_argument For anything other than listing, report or json
         */
        OutputFormat parse_format(std::string_view name);
        std::string_view format_name(OutputFormat format);

        /**
         * @throws std::invalid_argument If `name` isn't a spdlog level name
         */
        spdlog::level::level_enum parse_log_level(const std::string& name);

        /**
         * Overrides `options` with whatever keys the document has:
         * @code
         * {
         *      "registry": string,
         *      "bin": string,
         *      "quantity": int,
         *      "format": "listing" | "report" | "json",
         *      "log_level": string
         * }
         * @endcode
         */
        GeneratorOptions apply_json(GeneratorOptions options, const nlohmann::json& j);

        /**
         * @throws std::invalid_argument If the file can't be read or parsed
         */
        GeneratorOptions apply_file(GeneratorOptions options, const fs::path& file);

        GeneratorOptions apply_environment(GeneratorOptions options);

        /**
         * Defaults, then the config file named by CARDFORGE_CONFIG_FILE (or
         * cardforge.json if it exists), then the environment.
         */
        GeneratorOptions load();

        /**
         * Reads and parses a JSON config file.
         *
         * @throws std::invalid_argument If the file can't be read or parsed
         */
        nlohmann::json read_json(const fs::path& file);
    }
}

#endif //CARDFORGE_CONFIG_HPP
