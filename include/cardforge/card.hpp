#ifndef CARDFORGE_CARD_HPP
#define CARDFORGE_CARD_HPP

#include <array>
#include <string>
#include <string_view>
#include <utility>

#include "brand.hpp"

namespace cardforge
{
    struct YearMonth
    {
        int year;
        int month;

        inline bool operator<(const YearMonth& other) const noexcept
        {
            return year < other.year || (year == other.year && month < other.month);
        }
    };

    /**
     * A synthesized card. `card_number` is the bare digits, `display_number` the same
     * digits grouped for a form field.
     */
    struct CardRecord
    {
        std::string card_number;
        std::string display_number;
        std::string expiry_month;
        std::string expiry_year;
        std::string cvv;
        std::string brand;
        std::string bank;
        std::string country;
        std::string type;

        // "MM/YY"
        [[nodiscard]] inline std::string expiry_date() const { return expiry_month + "/" + expiry_year; }
    };

    namespace card
    {
        constexpr std::size_t MAX_BIN_LENGTH = 10;
        constexpr int MAX_CHECKSUM_ATTEMPTS = 3;

        constexpr std::array<std::pair<int, double>, 5> EXPIRY_YEAR_OFFSETS {{
            {2, 0.15},
            {3, 0.40},
            {4, 0.25},
            {5, 0.15},
            {6, 0.05}
        }};

        constexpr std::array<int, 6> COMMON_EXPIRY_MONTHS { 3, 5, 6, 9, 11, 12 };
        constexpr double COMMON_MONTH_PROBABILITY = 0.80;

        constexpr std::array<std::string_view, 10> WEAK_CVV_BLACKLIST {
            "000", "111", "222", "333", "444", "555", "666", "777", "888", "999"
        };

        YearMonth current_year_month();

        /**
         * Folds a bank name into 0-99. Identical names always give the same value.
         */
        int hash_bank_name(std::string_view bank_name);

        /**
         * Builds the account digits that sit between the BIN and the check digit. The
         * first two are pulled towards a range picked by the BIN and the bank, the middle
         * ones follow the Markov table, and the last (up to) three never repeat the digit
         * before them.
         *
         * @param length How many digits to produce
         * @param bin The normalized BIN, also used to seed the Markov chain
         * @param bank_name Issuing bank, "Unknown" if there is none
         */
        std::string generate_account_segment(std::size_t length, std::string_view bin, std::string_view bank_name);

        /**
         * @return month ("MM") and year ("YY"), strictly after `now`
         */
        std::pair<std::string, std::string> generate_expiry(const YearMonth& now);

        /**
         * Derives a CVV from the card number and the expiry, the same inputs always give
         * the same CVV.
         *
         * @param card_number The full card number
         * @param expiry_date "MM/YY"
         * @param cvv_length 3 or 4
         */
        std::string derive_cvv(std::string_view card_number, std::string_view expiry_date, unsigned int cvv_length);

        bool is_weak_cvv(std::string_view cvv);

        // 4-6-5 for 15 digit Amex numbers, otherwise groups of four.
        std::string format_card_number(std::string_view card_number, bool is_amex);
    }

    /**
     * Turns a BIN prefix into complete card records. It holds nothing that changes
     * between calls, so one synthesizer can serve any number of threads.
     */
    class CardSynthesizer
    {
        BrandResolver p_resolver;
    public:
        explicit CardSynthesizer(BrandResolver resolver) : p_resolver(std::move(resolver)) {}

        [[nodiscard]] inline const BrandResolver& resolver() const noexcept { return p_resolver; }

        /**
         * @param bin_prefix A BIN, anything that isn't a digit is stripped first
         * @throws cardforge::input_error If no digits are left after stripping
         * @throws cardforge::length_error If the BIN leaves no room for account digits
         */
        [[nodiscard]] CardRecord generate_card(std::string_view bin_prefix) const;
        [[nodiscard]] CardRecord generate_card(std::string_view bin_prefix, const YearMonth& now) const;
    };
}

#endif //CARDFORGE_CARD_HPP
