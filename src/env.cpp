#include "cardforge/env.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>

namespace
{
    std::optional<long> parse_integer(const std::string& s)
    {
        const char* begin = s.c_str();
        if (*begin == '+')
            ++begin;

        long value;
        auto [ptr, ec] = std::from_chars(begin, s.c_str() + s.size(), value);
        if (ec != std::errc{} || ptr != s.c_str() + s.size() || begin == ptr)
            return std::nullopt;
        return value;
    }
}

namespace cardforge::env
{
    std::optional<std::string> get_string(const char* name)
    {
        if (const char* x = std::getenv(name))
        {
            std::string res = x;
            if (res.empty())
                return {};
            return res;
        }

        return {};
    }

    std::string get_string(const char* name, std::string def)
    {
        return get_string(name).value_or(std::move(def));
    }

    std::optional<bool> get_bool(const char* name)
    {
        if (auto optstr = get_string(name))
        {
            auto str = *optstr;
            if (auto number = parse_integer(str))
                return *number != 0;

            std::transform(str.begin(), str.end(), str.begin(), ::tolower);
            return str == "true" || str == "on" || str == "yes" || str == "y";
        }

        return {};
    }

    bool get_bool(const char* name, bool def)
    {
        return get_bool(name).value_or(def);
    }

    std::optional<uint16_t> get_int(const char* name)
    {
        if (auto optstr = get_string(name))
        {
            auto number = parse_integer(*optstr);
            if (number && *number >= 0 && *number <= UINT16_MAX)
                return (uint16_t)*number;
        }

        return {};
    }

    uint16_t get_int(const char* name, uint16_t def)
    {
        return get_int(name).value_or(def);
    }
}
