#pragma once

#include <cstdint>
#include <string>
#include <optional>

#include <nlohmann/json.hpp>

#include "cardforge/validation.hpp"

/**
 * A structure containing all of the configurable options of the server.
 *
 * There are multiple ways to set these options, which are:
 *   A cardforge.json file
 *   Environment variables
 *   Command line flags
 *
 * So defaults -> config files -> environment variables -> command line flags.
 */
struct ServerOptions
{
    uint16_t port = 8080;
    uint16_t max_connections = 0;
    uint16_t timeout = 180;
    uint16_t max_threads = 1;
    bool thread_per_connection = false;
    bool use_ipv6 = false;
    bool use_ipv4 = true;
    std::optional<std::string> certificate;
    std::optional<std::string> private_key;
    // Upper bound for /cards?quantity=
    uint16_t max_quantity = cardforge::validation::MAX_QUANTITY;
    std::string registry = "data/bin-database.json";
    std::string log_level = "info";
};

/**
 * Overrides `options` with the keys set in a parsed config file. The format is:
 * @code
 * {
 *      "port": int,
 *      "connections": int,
 *      "timeout": int,
 *      "threads": int,
 *      "thread_per_connection": bool,
 *      "ipv6": bool,
 *      "ipv4": bool,
 *      "certificate": string,
 *      "private_key": string,
 *      "max_quantity": int,
 *      "registry": string,
 *      "log_level": string
 * }
 * @endcode
 *
 * @throws std::invalid_argument If a key has the wrong type
 */
ServerOptions apply_server_json(ServerOptions options, const nlohmann::json& j);

/**
 * Generates a ServerOptions structure with values from config files,
 * environment variables, and command line arguments, and sanity
 * checks the options to make sure they're valid.
 *
 * @param argc Argument count passed in from `main`
 * @param argv Argument list passed in from `main`
 * @returns A populated and sanity checked ServerOptions struct
 * @throws std::invalid_argument Thrown whenever a sanity check fails
 */
ServerOptions parse_options(int argc, const char** argv);
