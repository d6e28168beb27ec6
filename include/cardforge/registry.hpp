#ifndef CARDFORGE_REGISTRY_HPP
#define CARDFORGE_REGISTRY_HPP

#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "brand.hpp"

namespace cardforge
{
    namespace fs = std::filesystem;

    /**
     * The BIN registry, a read-only map from digit prefixes (1 to 9 digits) to brand
     * profiles. It is parsed from a document shaped like:
     * @code
     * {
     *      "bins": {
     *          "532959": {
     *              "brand": string,
     *              "bank": string,
     *              "country": string,
     *              "length": int,
     *              "cvvLength": int,
     *              "type": string
     *          }
     *      }
     * }
     * @endcode
     */
    class BinRegistry
    {
        std::unordered_map<std::string, BrandProfile> p_bins;
    public:
        static constexpr std::size_t MAX_PREFIX_LENGTH = 9;

        BinRegistry() = default;
        explicit BinRegistry(std::unordered_map<std::string, BrandProfile> bins) : p_bins(std::move(bins)) {}

        /**
         * Builds a registry from a parsed document. Entries that can't be used are
         * skipped with a warning.
         *
         * @throws cardforge::registry_error If there is no "bins" object
         */
        static BinRegistry from_json(const nlohmann::json& document);

        /**
         * @throws cardforge::registry_error If the file can't be opened or parsed
         */
        static BinRegistry from_file(const fs::path& file);

        [[nodiscard]] std::optional<BrandProfile> find(std::string_view prefix) const;

        [[nodiscard]] inline std::size_t size() const noexcept { return p_bins.size(); }
        [[nodiscard]] inline bool empty() const noexcept { return p_bins.empty(); }
    };

    /**
     * Loads the registry once, the first time anyone asks for it. The fetch runs as a
     * background task and every caller (including the ones that show up while it's
     * still running) waits on the same shared future, so the fetch never runs twice.
     *
     * A fetch that throws, or returns nothing, is remembered as "no registry" and
     * resolution falls back to the static rules.
     */
    class RegistryLoader
    {
    public:
        using registry_ptr = std::shared_ptr<const BinRegistry>;
        using fetch_function = std::function<registry_ptr()>;

        explicit RegistryLoader(fetch_function fetch);

        static std::shared_ptr<RegistryLoader> from_file(fs::path file);

        std::shared_future<registry_ptr> get_async();

        /**
         * Blocks until the registry is loaded.
         *
         * @return The registry, or nullptr if it couldn't be loaded
         */
        registry_ptr get();

    private:
        fetch_function p_fetch;
        std::once_flag p_once;
        std::shared_future<registry_ptr> p_future;
    };
}

#endif //CARDFORGE_REGISTRY_HPP
