#ifndef CARDFORGE_VALIDATION_HPP
#define CARDFORGE_VALIDATION_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace cardforge::validation
{
    constexpr std::size_t MIN_BIN_LENGTH = 4;
    constexpr std::size_t MAX_BIN_LENGTH = 10;

    constexpr unsigned int MIN_QUANTITY = 1;
    constexpr unsigned int MAX_QUANTITY = 500;
    constexpr unsigned int DEFAULT_QUANTITY = 10;

    // The longest card number there is
    constexpr std::size_t MAX_CARD_NUMBER_LENGTH = 19;

    /**
     * Checks a BIN typed in by a user.
     *
     * @return The BIN with everything but the digits stripped
     * @throws cardforge::input_error If it's empty or shorter than MIN_BIN_LENGTH
     * @throws cardforge::length_error If it's longer than MAX_BIN_LENGTH
     */
    std::string validate_bin(std::string_view bin);

    /**
     * @throws cardforge::input_error If `quantity` is outside [MIN_QUANTITY, max]
     */
    unsigned int validate_quantity(long long quantity, unsigned int max = MAX_QUANTITY);

    /**
     * Same as above, for a quantity that's still text (a query argument, a flag).
     */
    unsigned int validate_quantity(std::string_view quantity, unsigned int max = MAX_QUANTITY);

    std::string sanitize_numeric(std::string_view value, std::size_t max_length);

    /**
     * Checks a card number handed in to be validated. Separators are stripped, but
     * extra digits are never cut off.
     *
     * @return The digits of the number
     * @throws cardforge::input_error If there are no digits
     * @throws cardforge::length_error If there are more than MAX_CARD_NUMBER_LENGTH digits
     */
    std::string validate_card_number(std::string_view number);
}

#endif //CARDFORGE_VALIDATION_HPP
