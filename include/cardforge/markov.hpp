#ifndef CARDFORGE_MARKOV_HPP
#define CARDFORGE_MARKOV_HPP

#include <array>
#include <string_view>
#include <utility>

namespace cardforge::markov
{
    using row_type = std::array<double, 10>;

    /**
     * Row `p` holds the probability of each next digit given that the previous digit
     * was `p`. Every row adds up to 1.
     */
    constexpr std::array<row_type, 10> TRANSITIONS {{
        {0.08, 0.11, 0.12, 0.10, 0.09, 0.11, 0.10, 0.09, 0.10, 0.10},
        {0.10, 0.08, 0.11, 0.11, 0.10, 0.10, 0.10, 0.10, 0.10, 0.10},
        {0.11, 0.10, 0.08, 0.10, 0.11, 0.10, 0.10, 0.10, 0.10, 0.10},
        {0.10, 0.11, 0.10, 0.08, 0.10, 0.11, 0.10, 0.10, 0.10, 0.10},
        {0.09, 0.10, 0.11, 0.10, 0.08, 0.10, 0.11, 0.10, 0.11, 0.10},
        {0.11, 0.10, 0.10, 0.11, 0.10, 0.08, 0.10, 0.10, 0.10, 0.10},
        {0.10, 0.10, 0.10, 0.10, 0.11, 0.10, 0.08, 0.11, 0.10, 0.10},
        {0.09, 0.10, 0.10, 0.10, 0.10, 0.10, 0.11, 0.08, 0.11, 0.11},
        {0.10, 0.10, 0.10, 0.10, 0.11, 0.10, 0.10, 0.11, 0.08, 0.10},
        {0.10, 0.10, 0.10, 0.10, 0.10, 0.10, 0.10, 0.11, 0.10, 0.09}
    }};

    constexpr row_type INDEPENDENT {
        0.09, 0.10, 0.11, 0.10, 0.10, 0.11, 0.10, 0.09, 0.10, 0.10
    };

    // Used whenever there's no usable previous digit.
    constexpr int DEFAULT_ROW = 5;

    /**
     * Picks the previous digit: the last character of `context`, or of `fallback_seed`
     * when `context` is empty. Returns DEFAULT_ROW if that character isn't a digit.
     */
    int previous_digit(std::string_view context, std::string_view fallback_seed);

    /**
     * The row as (digit, probability) pairs, ready for helpers::weighted_choice.
     */
    std::array<std::pair<int, double>, 10> as_choices(const row_type& row);

    int next_digit(std::string_view context, std::string_view fallback_seed, double draw);
    int next_digit(std::string_view context, std::string_view fallback_seed);

    int independent_digit(double draw);
    int independent_digit();
}

#endif //CARDFORGE_MARKOV_HPP
