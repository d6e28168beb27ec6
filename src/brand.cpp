#include "cardforge/brand.hpp"

#include <array>

#include "cardforge/helpers.hpp"
#include "cardforge/registry.hpp"

namespace cardforge
{
    bool BrandProfile::operator==(const BrandProfile& other) const
    {
        return brand == other.brand
            && length == other.length
            && cvv_length == other.cvv_length
            && bank == other.bank
            && country == other.country
            && type == other.type;
    }

    void to_json(nlohmann::json& j, const BrandProfile& profile)
    {
        j = nlohmann::json{
            {"brand", profile.brand},
            {"length", profile.length},
            {"cvvLength", profile.cvv_length},
            {"bank", profile.bank},
            {"country", profile.country},
            {"type", profile.type}
        };
    }

    BrandProfile brand::from_static_rules(std::string_view bin)
    {
        /**
         * True when the first `digits` digits of the BIN, read as a number, fall in
         * [min, max]. A BIN shorter than `digits` never matches.
         */
        auto leading_in = [&bin](std::size_t digits, unsigned long min, unsigned long max) {
            if (bin.size() < digits)
                return false;
            auto val = helpers::digits_value(bin.substr(0, digits));
            return val >= min && val <= max;
        };

        auto make = [](const char* name, unsigned int length, unsigned int cvv_length, const char* country = "US") {
            BrandProfile profile;
            profile.brand = name;
            profile.length = length;
            profile.cvv_length = cvv_length;
            profile.country = country;
            return profile;
        };

        if (leading_in(1, 4, 4))
            return make("Visa", 16, 3);
        if (leading_in(2, 51, 55) || leading_in(2, 22, 27))
            return make("MasterCard", 16, 3);
        if (leading_in(2, 34, 34) || leading_in(2, 37, 37))
            return make("American Express", 15, 4);
        if (leading_in(4, 6011, 6011) || leading_in(3, 622, 629) || leading_in(3, 644, 649) || leading_in(2, 65, 65))
            return make("Discover", 16, 3);
        if (leading_in(2, 36, 36) || leading_in(2, 38, 38))
            return make("Diners Club", 14, 3);
        if (leading_in(3, 352, 358))
            return make("JCB", 16, 3, "JP");
        if (leading_in(2, 62, 62))
            return make("UnionPay", 16, 3, "CN");

        return make("Unknown", 16, 3);
    }

    BrandResolver::BrandResolver(std::shared_ptr<const BinRegistry> registry) : p_registry(std::move(registry)) {}

    BrandResolver::BrandResolver(std::shared_ptr<RegistryLoader> loader) : p_loader(std::move(loader)) {}

    std::shared_ptr<const BinRegistry> BrandResolver::registry() const
    {
        if (p_registry)
            return p_registry;
        if (p_loader)
            return p_loader->get();
        return nullptr;
    }

    BrandProfile BrandResolver::resolve(std::string_view bin) const
    {
        if (auto reg = registry())
        {
            const std::array<std::string_view, 4> candidates {
                bin,
                bin.substr(0, 4),
                bin.substr(0, 2),
                bin.substr(0, 1)
            };

            for (const auto& candidate : candidates)
            {
                if (candidate.empty())
                    continue;
                if (auto profile = reg->find(candidate))
                    return *profile;
            }
        }

        return brand::from_static_rules(bin);
    }
}
