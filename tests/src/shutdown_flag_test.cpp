#include <catch2/catch.hpp>

#include <csignal>
#include <thread>

#include "shutdown_flag.hpp"

namespace
{
    ShutdownFlag signalled;

    void on_signal(int)
    {
        signalled.request();
    }
}

TEST_CASE("Waiting returns once shutdown is requested", "cardforge::server")
{
    ShutdownFlag flag;
    REQUIRE_FALSE(flag.requested());

    std::thread requester([&flag]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        flag.request();
    });

    flag.wait(std::chrono::milliseconds(5));
    REQUIRE(flag.requested());
    requester.join();
}

TEST_CASE("Waiting on a flag that's already set returns immediately", "cardforge::server")
{
    ShutdownFlag flag;
    flag.request();
    flag.wait(std::chrono::hours(1));
    REQUIRE(flag.requested());
}

TEST_CASE("A signal handler can request shutdown", "cardforge::server")
{
    auto previous = std::signal(SIGUSR1, on_signal);
    REQUIRE(previous != SIG_ERR);

    std::raise(SIGUSR1);
    signalled.wait(std::chrono::milliseconds(5));
    REQUIRE(signalled.requested());

    std::signal(SIGUSR1, previous);
}
