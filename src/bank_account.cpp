#include "cardforge/bank_account.hpp"

#include "cardforge/helpers.hpp"
#include "cardforge/markov.hpp"

namespace cardforge::bank_account
{
    std::string generate_account_number()
    {
        auto length = helpers::number_in_range(MIN_ACCOUNT_LENGTH, MAX_ACCOUNT_LENGTH);

        // No digit depends on the one before it, so the context free sampler is enough.
        std::string account;
        account.reserve(length);
        for (std::size_t i = 0; i < length; ++i)
            account += (char)('0' + markov::independent_digit());
        return account;
    }

    std::string generate_routing_number()
    {
        return std::string{helpers::array_element(US_ROUTING_NUMBERS)};
    }

    bool is_valid_routing_number(std::string_view routing)
    {
        if (routing.size() != 9 || !helpers::is_digits(routing))
            return false;

        constexpr std::array<int, 3> weights { 3, 7, 1 };
        int sum = 0;
        for (std::size_t i = 0; i < routing.size(); ++i)
            sum += (routing[i] - '0') * weights[i % 3];

        return sum % 10 == 0;
    }
}
