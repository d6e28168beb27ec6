#ifndef CARDFORGE_ENV_HPP
#define CARDFORGE_ENV_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace cardforge::env
{
    // An unset variable and an empty one are treated the same.
    std::optional<std::string> get_string(const char* name);
    std::optional<bool> get_bool(const char* name);
    std::optional<uint16_t> get_int(const char* name);

    std::string get_string(const char* name, std::string def);
    bool get_bool(const char* name, bool def);
    uint16_t get_int(const char* name, uint16_t def);
}

#endif //CARDFORGE_ENV_HPP
