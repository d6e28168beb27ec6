#include <iostream>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "cardforge/bank_account.hpp"
#include "cardforge/batch.hpp"
#include "cardforge/errors.hpp"
#include "cardforge/luhn.hpp"
#include "cardforge/output.hpp"
#include "cardforge/registry.hpp"
#include "cardforge/validation.hpp"
#include "cli_opts.hpp"

/**
 * Logs go to stderr, stdout is kept for the cards so the output can be piped.
 */
void initialize_logging(const std::string& level)
{
    auto logger = spdlog::stderr_color_mt("cardforge");
    logger->set_pattern("[%D %r] [thread %t] [%^%n - %l%$] %v");
    logger->set_level(cardforge::config::parse_log_level(level));
    spdlog::set_default_logger(logger);
}

int generate(const cardforge::CardSynthesizer& synthesizer, const cardforge::GeneratorOptions& opts)
{
    using namespace cardforge;

    auto bin = validation::validate_bin(opts.bin);
    auto quantity = validation::validate_quantity((long long)opts.quantity);
    auto result = batch::generate(synthesizer, bin, quantity);

    switch (opts.format)
    {
    case OutputFormat::Listing:
        std::cout << batch::format_listing(result);
        break;
    case OutputFormat::Report:
        std::cout << batch::format_report(result, batch::timestamp_now());
        break;
    case OutputFormat::Json:
    {
        auto cards = nlohmann::json::array();
        for (const auto& record : result.records)
            cards.push_back(output::to_form_fill(record, true));
        std::cout << cards.dump(4) << "\n";
        break;
    }
    }

    if (result.records.empty())
    {
        std::cerr << "No cards could be generated: " << result.error << "\n";
        return 1;
    }
    return 0;
}

int main(int argc, const char** argv)
{
    CliOptions opts;
    try
    {
        opts = parse_cli_options(argc, argv);
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << e.what() << "\n";
        std::cerr << "Run " << argv[0] << " --help for usage\n";
        return 1;
    }

    initialize_logging(opts.generator.log_level);

    auto loader = cardforge::RegistryLoader::from_file(opts.generator.registry);
    cardforge::CardSynthesizer synthesizer{cardforge::BrandResolver{loader}};

    try
    {
        switch (opts.action)
        {
        case CliAction::Generate:
            return generate(synthesizer, opts.generator);
        case CliAction::Brand:
        {
            auto bin = cardforge::validation::validate_bin(opts.generator.bin);
            nlohmann::json j = synthesizer.resolver().resolve(bin);
            std::cout << j.dump(4) << "\n";
            return 0;
        }
        case CliAction::Validate:
        {
            auto valid = cardforge::luhn::validate(cardforge::validation::validate_card_number(opts.number));
            std::cout << (valid ? "valid" : "invalid") << "\n";
            return valid ? 0 : 2;
        }
        case CliAction::BankAccount:
            std::cout << "Routing: " << cardforge::bank_account::generate_routing_number() << "\n";
            std::cout << "Account: " << cardforge::bank_account::generate_account_number() << "\n";
            return 0;
        }
    }
    catch (const cardforge::length_error& e)
    {
        spdlog::error("{} (length {}, limit {})", e.what(), e.length(), e.limit());
        return 1;
    }
    catch (const cardforge::input_error& e)
    {
        spdlog::error("{}", e.what());
        return 1;
    }
    catch (const cardforge::checksum_consistency_fault& e)
    {
        spdlog::critical("{}", e.what());
        return 1;
    }

    return 0;
}
