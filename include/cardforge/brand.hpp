#ifndef CARDFORGE_BRAND_HPP
#define CARDFORGE_BRAND_HPP

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace cardforge
{
    class BinRegistry;
    class RegistryLoader;

    /**
     * What a BIN prefix tells us about the card it starts: the brand, how many digits
     * the full number has, how long the CVV is, and who issued it.
     */
    struct BrandProfile
    {
        std::string brand;
        unsigned int length = 16;
        unsigned int cvv_length = 3;
        std::string bank = "Unknown";
        std::string country = "US";
        std::string type = "credit";

        [[nodiscard]] inline bool is_amex() const noexcept { return brand == "American Express"; }

        bool operator==(const BrandProfile& other) const;
        bool operator!=(const BrandProfile& other) const { return !(*this == other); }
    };

    void to_json(nlohmann::json& j, const BrandProfile& profile);

    namespace brand
    {
        /**
         * The numbering-range rules used when the registry has nothing for a BIN.
         * Always returns a profile, "Unknown" when nothing matches.
         */
        BrandProfile from_static_rules(std::string_view bin);
    }

    /**
     * Resolves BIN prefixes to brand profiles. The registry is handed in, either already
     * loaded or as a loader that is asked for it on first use. With no registry (or one
     * that failed to load) every BIN goes through the static rules.
     */
    class BrandResolver
    {
        std::shared_ptr<const BinRegistry> p_registry;
        std::shared_ptr<RegistryLoader> p_loader;
    public:
        BrandResolver() = default;
        explicit BrandResolver(std::shared_ptr<const BinRegistry> registry);
        explicit BrandResolver(std::shared_ptr<RegistryLoader> loader);

        /**
         * Looks the BIN up in the registry (whole prefix, then the first 4, 2 and 1
         * digits), falling back to the static rules.
         *
         * @param bin A digits only BIN prefix
         */
        [[nodiscard]] BrandProfile resolve(std::string_view bin) const;

    private:
        [[nodiscard]] std::shared_ptr<const BinRegistry> registry() const;
    };
}

#endif //CARDFORGE_BRAND_HPP
