#ifndef CARDFORGE_LUHN_HPP
#define CARDFORGE_LUHN_HPP

#include <string_view>

namespace cardforge::luhn
{
    /**
     * Computes the digit that, appended to `partial`, makes the whole string pass the
     * checksum. The rightmost digit of `partial` is the first one doubled.
     *
     * @param partial A non-empty string of digits
     * @return The check digit, '0' through '9'
     * @throws cardforge::input_error If `partial` is empty or holds a non-digit
     */
    char compute_check_digit(std::string_view partial);

    /**
     * Checks a complete number, check digit included.
     *
     * @param full A non-empty string of digits
     * @throws cardforge::input_error If `full` is empty or holds a non-digit
     */
    bool validate(std::string_view full);
}

#endif //CARDFORGE_LUHN_HPP
