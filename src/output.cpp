#include "cardforge/output.hpp"

nlohmann::json cardforge::output::to_form_fill(const CardRecord& record, bool extended)
{
    nlohmann::json j{
        {"cardNumber", record.display_number},
        {"expiryDate", record.expiry_date()},
        {"cvc", record.cvv}
    };

    if (extended)
    {
        j["cardBrand"] = record.brand;
        j["bank"] = record.bank;
        j["country"] = record.country;
        j["type"] = record.type;
    }

    return j;
}

std::string cardforge::output::to_listing_line(const CardRecord& record)
{
    return record.card_number + "|" + record.expiry_date() + "|" + record.cvv;
}
