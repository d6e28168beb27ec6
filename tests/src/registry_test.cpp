#include <catch2/catch.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include "cardforge/errors.hpp"
#include "cardforge/registry.hpp"

using namespace cardforge;
namespace fs = std::filesystem;

namespace
{
    nlohmann::json sample_document()
    {
        return nlohmann::json::parse(R"({
            "version": "1.0",
            "bins": {
                "532959": {
                    "brand": "Mastercard",
                    "bank": "Bank of America",
                    "country": "US",
                    "length": 16,
                    "cvvLength": 3,
                    "type": "credit"
                },
                "3782": {
                    "brand": "American Express",
                    "length": 15,
                    "cvvLength": 4
                }
            }
        })");
    }
}

TEST_CASE("Registry parses entries", "cardforge::registry")
{
    auto registry = BinRegistry::from_json(sample_document());
    REQUIRE(registry.size() == 2);

    auto mastercard = registry.find("532959");
    REQUIRE(mastercard.has_value());
    REQUIRE(mastercard->brand == "Mastercard");
    REQUIRE(mastercard->bank == "Bank of America");
    REQUIRE(mastercard->length == 16);
    REQUIRE(mastercard->cvv_length == 3);

    // Missing fields get the defaults
    auto amex = registry.find("3782");
    REQUIRE(amex.has_value());
    REQUIRE(amex->bank == "Unknown");
    REQUIRE(amex->country == "US");
    REQUIRE(amex->type == "credit");
    REQUIRE(amex->cvv_length == 4);

    REQUIRE_FALSE(registry.find("5329").has_value());
}

TEST_CASE("Registry skips entries it can't use", "cardforge::registry")
{
    auto document = nlohmann::json::parse(R"({
        "bins": {
            "411111": { "brand": "Visa", "length": 16, "cvvLength": 3 },
            "4111111111": { "brand": "Visa", "length": 16, "cvvLength": 3 },
            "41a1": { "brand": "Visa", "length": 16, "cvvLength": 3 },
            "422222": { "length": 16, "cvvLength": 3 },
            "433333": { "brand": "Visa", "length": 11, "cvvLength": 3 },
            "444444": { "brand": "Visa", "length": 16, "cvvLength": 5 },
            "455555": { "brand": "Visa", "length": "sixteen", "cvvLength": 3 },
            "466666": "Visa"
        }
    })");

    auto registry = BinRegistry::from_json(document);
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.find("411111").has_value());
}

TEST_CASE("Registry needs a bins object", "cardforge::registry")
{
    REQUIRE_THROWS_AS(BinRegistry::from_json(nlohmann::json::array()), registry_error);
    REQUIRE_THROWS_AS(BinRegistry::from_json(nlohmann::json::object()), registry_error);
    REQUIRE_THROWS_AS(BinRegistry::from_json(nlohmann::json{{"bins", 5}}), registry_error);
}

TEST_CASE("Registry reads from a file", "cardforge::registry")
{
    auto path = fs::temp_directory_path() / "cardforge_registry_test.json";
    {
        std::ofstream out(path);
        out << sample_document().dump();
    }

    auto registry = BinRegistry::from_file(path);
    REQUIRE(registry.size() == 2);
    fs::remove(path);

    REQUIRE_THROWS_AS(BinRegistry::from_file(path), registry_error);

    auto broken = fs::temp_directory_path() / "cardforge_registry_broken.json";
    {
        std::ofstream out(broken);
        out << "{ \"bins\": ";
    }
    REQUIRE_THROWS_AS(BinRegistry::from_file(broken), registry_error);
    fs::remove(broken);
}

TEST_CASE("Loader fetches once for concurrent callers", "cardforge::registry")
{
    std::atomic_int fetches{0};
    RegistryLoader loader([&fetches]() {
        fetches++;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return std::make_shared<const BinRegistry>(BinRegistry::from_json(sample_document()));
    });

    std::vector<std::shared_ptr<const BinRegistry>> seen(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < seen.size(); ++i)
        threads.emplace_back([&loader, &seen, i]() { seen[i] = loader.get(); });

    for (auto& thread : threads)
        thread.join();

    REQUIRE(fetches == 1);
    for (const auto& registry : seen)
    {
        REQUIRE(registry != nullptr);
        REQUIRE(registry == seen.front());
    }

    // Later calls reuse the loaded registry
    REQUIRE(loader.get() == seen.front());
    REQUIRE(fetches == 1);
}

TEST_CASE("A failed load is remembered as no registry", "cardforge::registry")
{
    std::atomic_int fetches{0};
    RegistryLoader loader([&fetches]() -> RegistryLoader::registry_ptr {
        fetches++;
        throw registry_error("unreachable");
    });

    REQUIRE(loader.get() == nullptr);
    REQUIRE(loader.get() == nullptr);
    REQUIRE(fetches == 1);

    auto missing = RegistryLoader::from_file("definitely/not/here.json");
    REQUIRE(missing->get() == nullptr);
}
