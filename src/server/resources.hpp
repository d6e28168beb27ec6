#pragma once

#include <httpserver.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "cardforge/card.hpp"

namespace resources
{
    using httpserver::http_resource;
    using httpserver::http_response;
    using httpserver::http_request;

    template<class T>
    using Ref = std::shared_ptr<T>;

    class card_resource : public http_resource
    {
        const std::string p_endpoint;
        const bool p_family;
        Ref<const cardforge::CardSynthesizer> p_synthesizer;
    public:
        card_resource(std::string endpoint, bool family, Ref<const cardforge::CardSynthesizer> synthesizer)
            : p_endpoint(std::move(endpoint)), p_family(family), p_synthesizer(std::move(synthesizer))
        {}

        [[nodiscard]] inline const std::string& endpoint() const noexcept { return p_endpoint; }
        [[nodiscard]] inline bool family() const noexcept { return p_family; }
        [[nodiscard]] inline const cardforge::CardSynthesizer& synthesizer() const noexcept { return *p_synthesizer; }

        /**
         * Runs `process`, turning the input errors it throws into 400 responses with
         * a JSON body.
         */
        const Ref<http_response> guarded(const http_request& req);

        virtual const Ref<http_response> process(const http_request& req) = 0;
    };

    #define CARD_RESOURCE(name, endpoint, family) class name : public card_resource     \
    {                                                                                   \
    public:                                                                             \
        explicit name(Ref<const cardforge::CardSynthesizer> synthesizer) :              \
            card_resource(endpoint, family, std::move(synthesizer))                     \
        {}                                                                              \
                                                                                        \
        const Ref<http_response> render_GET(const http_request& req) override           \
        {                                                                               \
            return guarded(req);                                                        \
        }                                                                               \
                                                                                        \
        const Ref<http_response> process(const http_request& req) override;             \
    }

    Ref<http_response> make_json_response(const nlohmann::json& body, int code = 200);
    Ref<http_response> make_json_error(const std::string& message, int code = 400);

    CARD_RESOURCE(get_card, "/card", false);
    CARD_RESOURCE(get_brand, "/brand", false);
    CARD_RESOURCE(validate_number, "/validate", false);

    class get_cards : public card_resource
    {
        unsigned int p_max_quantity;
    public:
        get_cards(Ref<const cardforge::CardSynthesizer> synthesizer, unsigned int max_quantity)
            : card_resource("/cards", false, std::move(synthesizer)), p_max_quantity(max_quantity)
        {}

        const Ref<http_response> render_GET(const http_request& req) override
        {
            return guarded(req);
        }

        const Ref<http_response> process(const http_request& req) override;
    };

    std::vector<Ref<card_resource>> resources(const Ref<const cardforge::CardSynthesizer>& synthesizer, unsigned int max_quantity);
}
