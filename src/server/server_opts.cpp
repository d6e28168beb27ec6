#include "server_opts.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

#include <popl.hpp>

#include "cardforge/config.hpp"
#include "cardforge/env.hpp"

namespace fs = std::filesystem;
namespace env = cardforge::env;

ServerOptions apply_server_json(ServerOptions opts, const nlohmann::json& j)
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
        opts.port = get_or_default("port", opts.port);
        opts.max_connections = get_or_default("connections", opts.max_connections);
        opts.timeout = get_or_default("timeout", opts.timeout);
        opts.max_threads = get_or_default("threads", opts.max_threads);
        opts.thread_per_connection = get_or_default("thread_per_connection", opts.thread_per_connection);
        opts.use_ipv6 = get_or_default("ipv6", opts.use_ipv6);
        opts.use_ipv4 = get_or_default("ipv4", opts.use_ipv4);
        if (j.contains("certificate") && !j["certificate"].is_null())
            opts.certificate = j["certificate"].get<std::string>();
        if (j.contains("private_key") && !j["private_key"].is_null())
            opts.private_key = j["private_key"].get<std::string>();
        opts.max_quantity = get_or_default("max_quantity", opts.max_quantity);
        opts.registry = get_or_default("registry", opts.registry);
        opts.log_level = get_or_default("log_level", opts.log_level);
    }
    catch (const nlohmann::json::type_error& e)
    {
        throw std::invalid_argument(std::string{"config value has the wrong type: "} + e.what());
    }

    return opts;
}

ServerOptions parse_options(int argc, const char** argv)
{
    ServerOptions options;
    auto config_file = env::get_string(cardforge::config::CONFIG_FILE_VARIABLE, cardforge::config::DEFAULT_CONFIG_FILE);

    if (fs::exists(config_file))
        options = apply_server_json(options, cardforge::config::read_json(config_file));

    options.port = env::get_int("CARDFORGE_PORT", options.port);
    options.max_connections = env::get_int("CARDFORGE_MAX_CONNECTIONS", options.max_connections);
    options.timeout = env::get_int("CARDFORGE_TIMEOUT", options.timeout);
    options.max_threads = env::get_int("CARDFORGE_MAX_THREADS", options.max_threads);
    options.thread_per_connection = env::get_bool("CARDFORGE_THREAD_PER_CONNECTION", options.thread_per_connection);
    options.use_ipv4 = env::get_bool("CARDFORGE_USE_IPV4", options.use_ipv4);
    options.use_ipv6 = env::get_bool("CARDFORGE_USE_IPV6", options.use_ipv6);
    if (auto certificate = env::get_string("CARDFORGE_CERTIFICATE"))
        options.certificate = certificate;
    if (auto private_key = env::get_string("CARDFORGE_PRIVATE_KEY"))
        options.private_key = private_key;
    options.max_quantity = env::get_int("CARDFORGE_MAX_QUANTITY", options.max_quantity);
    options.registry = env::get_string("CARDFORGE_REGISTRY", options.registry);
    options.log_level = env::get_string("CARDFORGE_LOG_LEVEL", options.log_level);

    popl::OptionParser op("OPTIONS");
    auto help_opt = op.add<popl::Switch>("h", "help", "show this message");
    auto conf_opt = op.add<popl::Value<std::string>>("i", "config", "config file to use");
    auto port_opt = op.add<popl::Value<uint16_t>>("p", "port", "port to start the server on");
    auto conn_opt = op.add<popl::Value<uint16_t>>("c", "connections", "maximum connections to allow");
    auto time_opt = op.add<popl::Value<uint16_t>>("t", "timeout", "seconds of inactivity before connection is timed out");
    auto thread_opt = op.add<popl::Value<uint16_t>>("T", "threads", "max threads for the thread pool");
    auto tpc_opt = op.add<popl::Switch>("e", "tpc", "switch to thread-per-connection model");
    auto ipv4_opt = op.add<popl::Switch>("4", "use-ipv4", "allow IPv4 connections");
    auto ipv6_opt = op.add<popl::Switch>("6", "use-ipv6", "allow IPv6 connections");
    auto noipv4_opt = op.add<popl::Switch>("", "no-ipv4", "disallow IPv4 connections");
    auto noipv6_opt = op.add<popl::Switch>("", "no-ipv6", "disallow IPv6 connections");
    auto cert_opt = op.add<popl::Value<std::string>>("C", "cert", "certificate to authenticate with");
    auto key_opt = op.add<popl::Value<std::string>>("K", "key", "private key for the certificate");
    auto quantity_opt = op.add<popl::Value<uint16_t>>("q", "max-quantity", "most cards a single /cards request may ask for");
    auto registry_opt = op.add<popl::Value<std::string>>("r", "registry", "BIN registry JSON file");
    auto level_opt = op.add<popl::Value<std::string>>("l", "log-level", "trace, debug, info, warn, error, critical or off");
    op.parse(argc, argv);

    if (help_opt->is_set())
    {
        std::cout << "usage:\n";
        std::cout << "\t" << argv[0] << " [OPTIONS]\n\n";
        std::cout << op << "\n";
        std::exit(EXIT_SUCCESS);
    }

    if (conf_opt->is_set())
    {
        if (!fs::exists(conf_opt->value()))
            throw std::invalid_argument("config file `" + conf_opt->value() + "` doesn't exist!");
        options = apply_server_json(options, cardforge::config::read_json(conf_opt->value()));
    }

    if ((ipv4_opt->is_set() && noipv4_opt->is_set()) || (ipv6_opt->is_set() && noipv6_opt->is_set()))
        throw std::invalid_argument("ipv4/6 is both set and unset!");

    if (cert_opt->is_set() != key_opt->is_set())
    {
        throw std::invalid_argument("--cert and --key must be both set or unset!");
    }
    else if (cert_opt->is_set())
    {
        options.certificate = cert_opt->value();
        options.private_key = key_opt->value();
    }

    if (port_opt->is_set())
        options.port = port_opt->value();
    if (conn_opt->is_set())
        options.max_connections = conn_opt->value();
    if (time_opt->is_set())
        options.timeout = time_opt->value();
    if (thread_opt->is_set())
        options.max_threads = thread_opt->value();
    if (tpc_opt->is_set())
        options.thread_per_connection = true;
    if (quantity_opt->is_set())
        options.max_quantity = quantity_opt->value();
    if (registry_opt->is_set())
        options.registry = registry_opt->value();
    if (level_opt->is_set())
        options.log_level = level_opt->value();

    if (noipv4_opt->is_set())
        options.use_ipv4 = false;
    else if (ipv4_opt->is_set())
        options.use_ipv4 = true;

    if (noipv6_opt->is_set())
        options.use_ipv6 = false;
    else if (ipv6_opt->is_set())
        options.use_ipv6 = true;

    if (!options.use_ipv4 && !options.use_ipv6)
        throw std::invalid_argument("both ipv4 and ipv6 are disallowed, so no connections can be made!");

    if (options.certificate.has_value() != options.private_key.has_value())
        throw std::invalid_argument("a certificate and a private key must be both set or unset!");

    if (options.max_quantity < cardforge::validation::MIN_QUANTITY)
        throw std::invalid_argument("max_quantity must be at least 1!");

    cardforge::config::parse_log_level(options.log_level);

    return options;
}
