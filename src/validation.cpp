#include "cardforge/validation.hpp"

#include <charconv>

#include "cardforge/errors.hpp"
#include "cardforge/helpers.hpp"

namespace cardforge::validation
{
    std::string validate_bin(std::string_view bin)
    {
        auto cleaned = helpers::digits_only(bin);

        if (cleaned.empty())
            throw input_error("BIN is required");

        if (cleaned.size() < MIN_BIN_LENGTH)
            throw input_error("BIN must be at least " + std::to_string(MIN_BIN_LENGTH) + " digits");

        if (cleaned.size() > MAX_BIN_LENGTH)
            throw length_error("BIN cannot exceed " + std::to_string(MAX_BIN_LENGTH) + " digits", cleaned.size(), MAX_BIN_LENGTH);

        return cleaned;
    }

    unsigned int validate_quantity(long long quantity, unsigned int max)
    {
        if (quantity < MIN_QUANTITY)
            throw input_error("Quantity must be at least " + std::to_string(MIN_QUANTITY));

        if (quantity > max)
            throw input_error("Quantity cannot exceed " + std::to_string(max));

        return (unsigned int)quantity;
    }

    unsigned int validate_quantity(std::string_view quantity, unsigned int max)
    {
        long long value;
        auto [ptr, ec] = std::from_chars(quantity.data(), quantity.data() + quantity.size(), value);
        if (quantity.empty() || ec != std::errc{} || ptr != quantity.data() + quantity.size())
            throw input_error("Quantity must be a number");

        return validate_quantity(value, max);
    }

    std::string sanitize_numeric(std::string_view value, std::size_t max_length)
    {
        auto cleaned = helpers::digits_only(value);
        if (cleaned.size() > max_length)
            cleaned.resize(max_length);
        return cleaned;
    }

    std::string validate_card_number(std::string_view number)
    {
        auto cleaned = helpers::digits_only(number);

        if (cleaned.empty())
            throw input_error("number is required");

        if (cleaned.size() > MAX_CARD_NUMBER_LENGTH)
            throw length_error("A card number cannot exceed " + std::to_string(MAX_CARD_NUMBER_LENGTH) + " digits", cleaned.size(), MAX_CARD_NUMBER_LENGTH);

        return cleaned;
    }
}
