#include "cli_opts.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

#include <popl.hpp>

namespace fs = std::filesystem;

CliOptions parse_cli_options(int argc, const char** argv)
{
    popl::OptionParser op("OPTIONS");
    auto help_opt = op.add<popl::Switch>("h", "help", "show this message");
    auto conf_opt = op.add<popl::Value<std::string>>("i", "config", "config file to use");
    auto bin_opt = op.add<popl::Value<std::string>>("b", "bin", "BIN prefix to generate cards from");
    auto quantity_opt = op.add<popl::Value<std::string>>("n", "quantity", "how many unique cards to generate");
    auto registry_opt = op.add<popl::Value<std::string>>("r", "registry", "BIN registry JSON file");
    auto format_opt = op.add<popl::Value<std::string>>("f", "format", "output format: listing, report or json");
    auto level_opt = op.add<popl::Value<std::string>>("l", "log-level", "trace, debug, info, warn, error, critical or off");
    auto brand_opt = op.add<popl::Switch>("", "brand", "print the brand profile the BIN resolves to");
    auto validate_opt = op.add<popl::Value<std::string>>("", "validate", "check a card number's check digit");
    auto bank_opt = op.add<popl::Switch>("", "bank-account", "print a US routing and account number");
    op.parse(argc, argv);

    if (help_opt->is_set())
    {
        std::cout << "usage:\n";
        std::cout << "\t" << argv[0] << " [OPTIONS]\n\n";
        std::cout << op << "\n";
        std::exit(EXIT_SUCCESS);
    }

    CliOptions options;

    if (conf_opt->is_set())
    {
        if (!fs::exists(conf_opt->value()))
            throw std::invalid_argument("config file `" + conf_opt->value() + "` doesn't exist!");

        options.generator = cardforge::config::apply_file(options.generator, conf_opt->value());
        options.generator = cardforge::config::apply_environment(options.generator);
    }
    else
    {
        options.generator = cardforge::config::load();
    }

    if (bin_opt->is_set())
        options.generator.bin = bin_opt->value();
    if (quantity_opt->is_set())
        options.generator.quantity = cardforge::validation::validate_quantity(quantity_opt->value());
    if (registry_opt->is_set())
        options.generator.registry = registry_opt->value();
    if (format_opt->is_set())
        options.generator.format = cardforge::config::parse_format(format_opt->value());
    if (level_opt->is_set())
        options.generator.log_level = level_opt->value();

    int actions = (int)brand_opt->is_set() + (int)validate_opt->is_set() + (int)bank_opt->is_set();
    if (actions > 1)
        throw std::invalid_argument("--brand, --validate and --bank-account can't be combined!");

    if (brand_opt->is_set())
        options.action = CliAction::Brand;
    else if (validate_opt->is_set())
    {
        options.action = CliAction::Validate;
        options.number = validate_opt->value();
    }
    else if (bank_opt->is_set())
        options.action = CliAction::BankAccount;

    if ((options.action == CliAction::Generate || options.action == CliAction::Brand) && options.generator.bin.empty())
        throw std::invalid_argument("a BIN is required, pass --bin or set CARDFORGE_BIN");

    // Checked here so a typo fails before anything is generated.
    cardforge::config::parse_log_level(options.generator.log_level);

    return options;
}
