#include <httpserver.hpp>
#include <chrono>
#include <csignal>
#include <iostream>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/daily_file_sink.h>

#include "cardforge/config.hpp"
#include "cardforge/registry.hpp"
#include "server_opts.hpp"
#include "resources.hpp"
#include "shutdown_flag.hpp"

void initialize_logging(const std::string& level)
{
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);

    auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>("logs/server.log", 0, 0);
    file_sink->set_level(spdlog::level::trace);

    auto logger = std::make_shared<spdlog::logger>("cardforge", spdlog::sinks_init_list({file_sink, console_sink}));
    logger->set_pattern("[%D %r] [thread %t] [%^%n - %l%$] %v");
    logger->set_level(cardforge::config::parse_log_level(level));

    logger->flush_on(spdlog::level::warn);
    spdlog::flush_every(std::chrono::seconds(2));
    spdlog::set_default_logger(logger);
}

ShutdownFlag shutdown_flag;

void signal_callback_handler(int signum)
{
    if (signum == SIGINT)
        shutdown_flag.request();
}

int main(int argc, const char** argv)
{
    using httpserver::create_webserver;
    using httpserver::http::http_utils;

    ServerOptions opts;
    try
    {
        opts = parse_options(argc, argv);
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }

    auto builder = create_webserver(opts.port)
            .max_connections(opts.max_connections)
            .connection_timeout(opts.timeout)
            .log_access([](const auto& url) {
                spdlog::info("ACCESSING: {}", url);
            })
            .log_error([](const auto& err) {
                spdlog::error("ERROR: {}", err);
            });

    if (opts.certificate.has_value() && opts.private_key.has_value())
    {
        builder
            .use_ssl()
            .https_mem_key(*opts.private_key)
            .https_mem_cert(*opts.certificate);
    }

    if (opts.thread_per_connection)
        builder.start_method(http_utils::THREAD_PER_CONNECTION);
    else
        builder.start_method(http_utils::INTERNAL_SELECT).max_threads(opts.max_threads);

    /**
     * There is no option to turn off IPv4, so IPv6 only and dual stack
     * have to be picked by hand. The library defaults to IPv4 only.
     */
    if (opts.use_ipv6 && !opts.use_ipv4)
        builder.use_ipv6();
    else if (opts.use_ipv6 && opts.use_ipv4)
        builder.use_dual_stack();

    signal(SIGINT, signal_callback_handler);

    initialize_logging(opts.log_level);

    // Start reading the registry now so the first request doesn't pay for it.
    auto loader = cardforge::RegistryLoader::from_file(opts.registry);
    loader->get_async();

    auto synthesizer = std::make_shared<const cardforge::CardSynthesizer>(cardforge::BrandResolver{loader});

    httpserver::webserver ws = builder;
    auto resource_list = resources::resources(synthesizer, opts.max_quantity);
    for (auto& resource : resource_list)
    {
        ws.register_resource(resource->endpoint(), resource.get(), resource->family());
    }

    spdlog::info("Starting server on port {}...", opts.port);
    ws.start();

    shutdown_flag.wait();

    spdlog::info("Graceful shutdown requested, shutting down...");

    if (ws.is_running())
        ws.sweet_kill();

    spdlog::debug("Webserver gracefully killed.");
    return 0;
}
