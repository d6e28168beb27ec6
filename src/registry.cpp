#include "cardforge/registry.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

#include "cardforge/errors.hpp"
#include "cardforge/helpers.hpp"

namespace cardforge
{
    namespace
    {
        constexpr unsigned int MIN_CARD_LENGTH = 12;
        constexpr unsigned int MAX_CARD_LENGTH = 19;

        /**
         * Turns one registry entry into a profile, or returns nothing (after saying why)
         * when the entry can't describe a card.
         */
        std::optional<BrandProfile> parse_entry(const std::string& prefix, const nlohmann::json& entry)
        {
            if (prefix.size() > BinRegistry::MAX_PREFIX_LENGTH || !helpers::is_digits(prefix))
            {
                spdlog::warn("Skipping registry entry `{}`, the key must be 1 to {} digits", prefix, BinRegistry::MAX_PREFIX_LENGTH);
                return std::nullopt;
            }

            if (!entry.is_object())
            {
                spdlog::warn("Skipping registry entry `{}`, it isn't an object", prefix);
                return std::nullopt;
            }

            auto get_or_default = [&entry](const char* name, auto default_val) -> decltype(default_val)
            {
                auto it = entry.find(name);
                if (it == entry.end() || it->is_null())
                    return default_val;

                return it->template get<decltype(default_val)>();
            };

            BrandProfile profile;
            try
            {
                profile.brand = get_or_default("brand", std::string{});
                profile.length = get_or_default("length", 0U);
                profile.cvv_length = get_or_default("cvvLength", 0U);
                profile.bank = get_or_default("bank", profile.bank);
                profile.country = get_or_default("country", profile.country);
                profile.type = get_or_default("type", profile.type);
            }
            catch (const nlohmann::json::exception& e)
            {
                spdlog::warn("Skipping registry entry `{}`: {}", prefix, e.what());
                return std::nullopt;
            }

            if (profile.brand.empty())
            {
                spdlog::warn("Skipping registry entry `{}`, it has no brand", prefix);
                return std::nullopt;
            }
            if (profile.length < MIN_CARD_LENGTH || profile.length > MAX_CARD_LENGTH)
            {
                spdlog::warn("Skipping registry entry `{}`, length {} isn't between {} and {}", prefix, profile.length, MIN_CARD_LENGTH, MAX_CARD_LENGTH);
                return std::nullopt;
            }
            if (profile.cvv_length != 3 && profile.cvv_length != 4)
            {
                spdlog::warn("Skipping registry entry `{}`, cvvLength must be 3 or 4", prefix);
                return std::nullopt;
            }

            return profile;
        }
    }

    BinRegistry BinRegistry::from_json(const nlohmann::json& document)
    {
        if (!document.is_object())
            throw registry_error("the registry document isn't a JSON object");

        auto bins_it = document.find("bins");
        if (bins_it == document.end() || !bins_it->is_object())
            throw registry_error("the registry document has no \"bins\" object");

        std::unordered_map<std::string, BrandProfile> bins;
        bins.reserve(bins_it->size());
        for (const auto& item : bins_it->items())
        {
            if (auto profile = parse_entry(item.key(), item.value()))
                bins.emplace(item.key(), std::move(*profile));
        }

        return BinRegistry{std::move(bins)};
    }

    BinRegistry BinRegistry::from_file(const fs::path& file)
    {
        std::ifstream in(file);
        if (!in.is_open())
            throw registry_error("unable to open the registry at `" + file.string() + "`");

        nlohmann::json document;
        try
        {
            in >> document;
        }
        catch (const nlohmann::json::parse_error& e)
        {
            throw registry_error("unable to parse the registry at `" + file.string() + "`: " + e.what());
        }

        return from_json(document);
    }

    std::optional<BrandProfile> BinRegistry::find(std::string_view prefix) const
    {
        auto it = p_bins.find(std::string{prefix});
        if (it == p_bins.end())
            return std::nullopt;
        return it->second;
    }

    RegistryLoader::RegistryLoader(fetch_function fetch) : p_fetch(std::move(fetch)) {}

    std::shared_ptr<RegistryLoader> RegistryLoader::from_file(fs::path file)
    {
        return std::make_shared<RegistryLoader>([file = std::move(file)]() -> registry_ptr {
            auto registry = std::make_shared<const BinRegistry>(BinRegistry::from_file(file));
            spdlog::info("Loaded {} BIN registry entries from `{}`", registry->size(), file.string());
            return registry;
        });
    }

    std::shared_future<RegistryLoader::registry_ptr> RegistryLoader::get_async()
    {
        std::call_once(p_once, [this]() {
            p_future = std::async(std::launch::async, [fetch = p_fetch]() -> registry_ptr {
                try
                {
                    auto registry = fetch();
                    if (!registry)
                        spdlog::warn("The BIN registry fetch returned nothing, using the static rules only");
                    return registry;
                }
                catch (const std::exception& e)
                {
                    spdlog::error("Unable to load the BIN registry, using the static rules only: {}", e.what());
                    return nullptr;
                }
            }).share();
        });

        return p_future;
    }

    RegistryLoader::registry_ptr RegistryLoader::get()
    {
        return get_async().get();
    }
}
