#ifndef CARDFORGE_HELPERS_HPP
#define CARDFORGE_HELPERS_HPP

#include <array>
#include <cstddef>
#include <limits>
#include <random>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace cardforge::helpers
{
    /**
     * Every thread gets its own engine, seeded once from the random device. That way
     * generation calls running on different threads never share writable state.
     */
    inline std::mt19937_64& engine()
    {
        thread_local std::mt19937_64 gen{std::random_device{}()};
        return gen;
    }

    template<typename T, typename std::enable_if<std::is_floating_point<T>::value, T>::type* = nullptr>
    inline T number_in_range(T min, T max)
    {
        std::uniform_real_distribution<T> dist{min, max};
        return dist(engine());
    }

    template<typename T, typename std::enable_if<std::numeric_limits<T>::is_integer, T>::type* = nullptr>
    inline T number_in_range(T min, T max)
    {
        std::uniform_int_distribution<T> dist{min, max};
        return dist(engine());
    }

    /**
     * A uniform draw in [0, 1).
     */
    inline double draw()
    {
        std::uniform_real_distribution<double> dist{};
        return dist(engine());
    }

    template<typename T, std::size_t N>
    inline const T& array_element(const std::array<T, N>& array)
    {
        auto index = number_in_range(std::size_t(0), N - 1);
        return array[index];
    }

    /**
     * Walks the cumulative weights in order and returns the first value whose interval
     * contains `draw`. When rounding leaves `draw` above every cumulative sum, the last
     * value is returned.
     *
     * @param choices (value, weight) pairs, weights should add up to 1
     * @param draw A value in [0, 1)
     */
    template<typename T, std::size_t N>
    inline T weighted_choice(const std::array<std::pair<T, double>, N>& choices, double draw)
    {
        static_assert(N > 0, "weighted_choice needs at least one choice");

        double cumulative = 0.0;
        for (const auto& [value, weight] : choices)
        {
            cumulative += weight;
            if (draw < cumulative)
                return value;
        }

        return choices[N - 1].first;
    }

    template<typename T, std::size_t N>
    inline T weighted_choice(const std::array<std::pair<T, double>, N>& choices)
    {
        return weighted_choice(choices, draw());
    }

    inline bool is_digit(char c)
    {
        return c >= '0' && c <= '9';
    }

    inline bool is_digits(std::string_view str)
    {
        if (str.empty())
            return false;

        for (auto c : str)
        {
            if (!is_digit(c))
                return false;
        }
        return true;
    }

    inline std::string digits_only(std::string_view str)
    {
        std::string output;
        output.reserve(str.size());
        for (auto c : str)
        {
            if (is_digit(c))
                output += c;
        }
        return output;
    }

    /**
     * Parses a run of digits without going through std::stoi, the callers have already
     * checked that the string is digits only and short enough to fit.
     */
    inline unsigned long digits_value(std::string_view digits)
    {
        unsigned long value = 0;
        for (auto c : digits)
            value = value * 10 + (unsigned long)(c - '0');
        return value;
    }
}

#endif //CARDFORGE_HELPERS_HPP
