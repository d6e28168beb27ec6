#include "cardforge/luhn.hpp"

#include <string>

#include "cardforge/errors.hpp"
#include "cardforge/helpers.hpp"

namespace
{
    void require_digits(std::string_view str)
    {
        if (str.empty())
            throw cardforge::input_error("checksum input is empty");
        if (!cardforge::helpers::is_digits(str))
            throw cardforge::input_error("checksum input '" + std::string{str} + "' is not all digits");
    }

    /**
     * Sums the digits right to left, doubling every other one. `double_first` decides
     * whether the rightmost digit is doubled.
     */
    unsigned int weighted_sum(std::string_view digits, bool double_first)
    {
        unsigned int sum = 0;
        bool should_double = double_first;
        for (auto i = (long)digits.size() - 1; i >= 0; --i)
        {
            unsigned int digit = digits[(std::size_t)i] - '0';
            if (should_double)
            {
                digit *= 2;
                if (digit > 9)
                    digit -= 9;
            }

            sum += digit;
            should_double = !should_double;
        }
        return sum;
    }
}

char cardforge::luhn::compute_check_digit(std::string_view partial)
{
    require_digits(partial);
    auto sum = weighted_sum(partial, true);
    return (char)('0' + (10 - sum % 10) % 10);
}

bool cardforge::luhn::validate(std::string_view full)
{
    require_digits(full);
    return weighted_sum(full, false) % 10 == 0;
}
