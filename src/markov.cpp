#include "cardforge/markov.hpp"

#include "cardforge/helpers.hpp"

namespace cardforge::markov
{
    int previous_digit(std::string_view context, std::string_view fallback_seed)
    {
        std::string_view source = context.empty() ? fallback_seed : context;
        if (source.empty())
            return DEFAULT_ROW;

        char last = source.back();
        if (!helpers::is_digit(last))
            return DEFAULT_ROW;

        return last - '0';
    }

    std::array<std::pair<int, double>, 10> as_choices(const row_type& row)
    {
        std::array<std::pair<int, double>, 10> choices{};
        for (int digit = 0; digit < 10; ++digit)
            choices[digit] = { digit, row[digit] };
        return choices;
    }

    int next_digit(std::string_view context, std::string_view fallback_seed, double draw)
    {
        const auto& row = TRANSITIONS[previous_digit(context, fallback_seed)];
        return helpers::weighted_choice(as_choices(row), draw);
    }

    int next_digit(std::string_view context, std::string_view fallback_seed)
    {
        return next_digit(context, fallback_seed, helpers::draw());
    }

    int independent_digit(double draw)
    {
        return helpers::weighted_choice(as_choices(INDEPENDENT), draw);
    }

    int independent_digit()
    {
        return independent_digit(helpers::draw());
    }
}
