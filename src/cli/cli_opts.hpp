#pragma once

#include <string>

#include "cardforge/config.hpp"

enum class CliAction
{
    Generate,
    Brand,
    Validate,
    BankAccount
};

struct CliOptions
{
    cardforge::GeneratorOptions generator;
    CliAction action = CliAction::Generate;
    // The number handed to --validate
    std::string number;
};

/**
 * Generates a CliOptions structure with values from the config file, environment
 * variables, and command line arguments, in that order, so flags win over the
 * environment, which wins over the file.
 *
 * Prints the usage and exits when --help is given.
 *
 * @param argc Argument count passed in from `main`
 * @param argv Argument list passed in from `main`
 * @returns A populated and sanity checked CliOptions struct
 * @throws std::invalid_argument Thrown whenever a flag or a config value is unusable
 */
CliOptions parse_cli_options(int argc, const char** argv);
