#ifndef CARDFORGE_OUTPUT_HPP
#define CARDFORGE_OUTPUT_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "card.hpp"

namespace cardforge::output
{
    /**
     * The object a form filler expects:
     * @code
     * {
     *      "cardNumber": "5329 5912 3456 7890",
     *      "expiryDate": "MM/YY",
     *      "cvc": string
     * }
     * @endcode
     * With `extended` set, "cardBrand", "bank", "country" and "type" are added too.
     */
    nlohmann::json to_form_fill(const CardRecord& record, bool extended = false);

    // number|MM/YY|cvc, digits not grouped
    std::string to_listing_line(const CardRecord& record);
}

#endif //CARDFORGE_OUTPUT_HPP
