#include "resources.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

#include "cardforge/batch.hpp"
#include "cardforge/errors.hpp"
#include "cardforge/luhn.hpp"
#include "cardforge/output.hpp"
#include "cardforge/validation.hpp"

namespace resources
{
    std::vector<Ref<card_resource>> resources(const Ref<const cardforge::CardSynthesizer>& synthesizer, unsigned int max_quantity)
    {
        return {
            std::make_shared<get_card>(synthesizer),
            std::make_shared<get_cards>(synthesizer, max_quantity),
            std::make_shared<get_brand>(synthesizer),
            std::make_shared<validate_number>(synthesizer)
        };
    }

    Ref<http_response> make_json_response(const nlohmann::json& body, int code)
    {
        return std::make_shared<httpserver::string_response>(body.dump(), code, "application/json");
    }

    Ref<http_response> make_json_error(const std::string& message, int code)
    {
        return make_json_response(nlohmann::json{{"error", message}}, code);
    }

    const Ref<http_response> card_resource::guarded(const http_request& req)
    {
        try
        {
            return process(req);
        }
        catch (const cardforge::length_error& e)
        {
            nlohmann::json body {
                {"error", e.what()},
                {"length", e.length()},
                {"limit", e.limit()}
            };
            return make_json_response(body, 400);
        }
        catch (const cardforge::input_error& e)
        {
            return make_json_error(e.what());
        }
        catch (const cardforge::checksum_consistency_fault& e)
        {
            spdlog::critical("{} failed: {}", p_endpoint, e.what());
            return make_json_error("Card generation failed", 500);
        }
    }

    const Ref<http_response> get_card::process(const http_request& req)
    {
        auto bin = cardforge::validation::validate_bin(std::string{req.get_arg("bin")});
        auto record = synthesizer().generate_card(bin);
        return make_json_response(cardforge::output::to_form_fill(record, true));
    }

    const Ref<http_response> get_cards::process(const http_request& req)
    {
        auto bin = cardforge::validation::validate_bin(std::string{req.get_arg("bin")});

        std::string quantity_arg{req.get_arg("quantity")};
        auto quantity = quantity_arg.empty()
                ? std::min(cardforge::validation::DEFAULT_QUANTITY, p_max_quantity)
                : cardforge::validation::validate_quantity(quantity_arg, p_max_quantity);

        auto result = cardforge::batch::generate(synthesizer(), bin, quantity);
        if (result.records.empty())
            return make_json_error(result.error);

        return std::make_shared<httpserver::string_response>(cardforge::batch::format_listing(result), 200, "text/plain");
    }

    const Ref<http_response> get_brand::process(const http_request& req)
    {
        auto bin = cardforge::validation::validate_bin(std::string{req.get_arg("bin")});
        nlohmann::json body = synthesizer().resolver().resolve(bin);
        return make_json_response(body);
    }

    const Ref<http_response> validate_number::process(const http_request& req)
    {
        auto number = cardforge::validation::validate_card_number(std::string{req.get_arg("number")});

        nlohmann::json body {
            {"number", number},
            {"valid", cardforge::luhn::validate(number)}
        };
        return make_json_response(body);
    }
}
