#ifndef CARDFORGE_BANK_ACCOUNT_HPP
#define CARDFORGE_BANK_ACCOUNT_HPP

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace cardforge::bank_account
{
    constexpr std::size_t MIN_ACCOUNT_LENGTH = 9;
    constexpr std::size_t MAX_ACCOUNT_LENGTH = 12;

    constexpr std::array<std::string_view, 20> US_ROUTING_NUMBERS {
        "121000358", // Bank of America
        "026009593", // Bank of America
        "021000021", // JPMorgan Chase
        "322271627", // Chase
        "021000089", // Chase
        "322271779", // Chase
        "091000019", // Wells Fargo
        "121000248", // Wells Fargo
        "062000019", // Citibank
        "043000096", // PNC Bank
        "071000013", // Truist Bank
        "122235821", // US Bank
        "053101121", // TD Bank
        "061000104", // HSBC Bank
        "111000025", // Federal Reserve Bank
        "122000247", // Union Bank
        "021200025", // State Street Bank
        "031201360", // M&T Bank
        "071923284", // Regions Bank
        "075000022"  // BMO Harris Bank
    };

    // 9 to 12 digits
    std::string generate_account_number();

    std::string generate_routing_number();

    /**
     * Nine digits whose 3-7-1 weighted sum is a multiple of 10.
     */
    bool is_valid_routing_number(std::string_view routing);
}

#endif //CARDFORGE_BANK_ACCOUNT_HPP
