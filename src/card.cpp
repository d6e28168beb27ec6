#include "cardforge/card.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <vector>

#include <spdlog/spdlog.h>

#include "cardforge/errors.hpp"
#include "cardforge/helpers.hpp"
#include "cardforge/luhn.hpp"
#include "cardforge/markov.hpp"

namespace cardforge::card
{
    namespace
    {
        std::string two_digits(int value)
        {
            std::string result;
            if (value < 10)
                result += '0';
            result.append(std::to_string(value));
            return result;
        }

        /**
         * Decodes UTF-8 into UTF-16 code units, code points above the BMP become a
         * surrogate pair. A byte that doesn't start a valid sequence is kept as one unit.
         */
        std::vector<uint16_t> utf16_units(std::string_view str)
        {
            std::vector<uint16_t> units;
            units.reserve(str.size());

            std::size_t i = 0;
            while (i < str.size())
            {
                auto lead = (unsigned char)str[i];
                std::size_t extra = 0;
                uint32_t cp = lead;
                if (lead >= 0xF0 && lead <= 0xF4)
                {
                    extra = 3;
                    cp = lead & 0x07u;
                }
                else if (lead >= 0xE0 && lead <= 0xEF)
                {
                    extra = 2;
                    cp = lead & 0x0Fu;
                }
                else if (lead >= 0xC2 && lead <= 0xDF)
                {
                    extra = 1;
                    cp = lead & 0x1Fu;
                }
                else if (lead >= 0x80)
                {
                    units.push_back(lead);
                    ++i;
                    continue;
                }

                bool valid = i + extra < str.size();
                for (std::size_t k = 1; valid && k <= extra; ++k)
                {
                    auto cont = (unsigned char)str[i + k];
                    if ((cont & 0xC0u) != 0x80u)
                        valid = false;
                    else
                        cp = (cp << 6) | (cont & 0x3Fu);
                }

                if (!valid)
                {
                    units.push_back(lead);
                    ++i;
                    continue;
                }

                if (cp >= 0x10000)
                {
                    cp -= 0x10000;
                    units.push_back((uint16_t)(0xD800 + (cp >> 10)));
                    units.push_back((uint16_t)(0xDC00 + (cp & 0x3FF)));
                }
                else
                {
                    units.push_back((uint16_t)cp);
                }
                i += extra + 1;
            }

            return units;
        }

        // Both CVV lengths share the same derivation, only the modulus and shift differ.
        std::string cvv_from_pseudo(unsigned long pseudo, unsigned int cvv_length)
        {
            if (cvv_length == 4)
                return std::to_string((pseudo % 9000) + 1000);
            return std::to_string((pseudo % 900) + 100);
        }
    }

    YearMonth current_year_month()
    {
        auto now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        return { local.tm_year + 1900, local.tm_mon + 1 };
    }

    int hash_bank_name(std::string_view bank_name)
    {
        // 32 bit wrapping h = h * 31 + c over UTF-16 code units
        uint32_t hash = 0;
        for (auto unit : utf16_units(bank_name))
            hash = hash * 31u + unit;

        auto value = (int64_t)(int32_t)hash;
        return (int)(std::llabs(value) % 100);
    }

    std::string generate_account_segment(std::size_t length, std::string_view bin, std::string_view bank_name)
    {
        std::string segment;
        segment.reserve(length);

        auto bin_seed = (int)(helpers::digits_value(bin.substr(bin.size() > 4 ? bin.size() - 4 : 0)) % 100);
        auto bank_seed = hash_bank_name(bank_name);
        int base = ((bin_seed + bank_seed) / 10) % 10;

        auto head = std::min<std::size_t>(2, length);
        auto tail_start = std::max(head, length > 3 ? length - 3 : 0);

        for (std::size_t i = 0; i < head; ++i)
            segment += (char)('0' + helpers::number_in_range(base, base + 5) % 10);

        for (std::size_t i = head; i < tail_start; ++i)
            segment += (char)('0' + markov::next_digit(segment, bin));

        for (std::size_t i = tail_start; i < length; ++i)
        {
            int previous = segment.empty() ? markov::DEFAULT_ROW : segment.back() - '0';
            int digit;
            do
            {
                digit = helpers::number_in_range(0, 9);
            }
            while (digit == previous);
            segment += (char)('0' + digit);
        }

        return segment;
    }

    std::pair<std::string, std::string> generate_expiry(const YearMonth& now)
    {
        YearMonth expiry{ now.year + helpers::weighted_choice(EXPIRY_YEAR_OFFSETS), 0 };

        if (helpers::draw() < COMMON_MONTH_PROBABILITY)
            expiry.month = helpers::array_element(COMMON_EXPIRY_MONTHS);
        else
            expiry.month = helpers::number_in_range(1, 12);

        if (!(now < expiry))
            expiry.year++;

        return { two_digits(expiry.month), two_digits(expiry.year % 100) };
    }

    std::string derive_cvv(std::string_view card_number, std::string_view expiry_date, unsigned int cvv_length)
    {
        if (cvv_length != 3 && cvv_length != 4)
            throw input_error("CVV length must be 3 or 4, got " + std::to_string(cvv_length));

        auto number = helpers::digits_only(card_number);
        auto expiry = helpers::digits_only(expiry_date);
        if (number.empty() || expiry.empty())
            throw input_error("a CVV needs both a card number and an expiry date");

        auto last_four = std::string_view{number}.substr(number.size() > 4 ? number.size() - 4 : 0);
        unsigned long seed = helpers::digits_value(last_four) + helpers::digits_value(expiry);
        unsigned long pseudo = (seed * 9301 + 49297) % 233280;

        auto cvv = cvv_from_pseudo(pseudo, cvv_length);

        // One fix-up pass only, whatever it gives is kept.
        if (is_weak_cvv(cvv))
            cvv = cvv_from_pseudo(pseudo + (cvv_length == 4 ? 1234 : 123), cvv_length);

        return cvv;
    }

    bool is_weak_cvv(std::string_view cvv)
    {
        if (cvv.empty())
            return true;

        if (std::all_of(cvv.begin(), cvv.end(), [&cvv](char c) { return c == cvv[0]; }))
            return true;

        if (cvv.size() == 3)
        {
            int d1 = cvv[0] - '0';
            int d2 = cvv[1] - '0';
            int d3 = cvv[2] - '0';
            if (d2 == d1 + 1 && d3 == d2 + 1)
                return true;
            if (d2 == d1 - 1 && d3 == d2 - 1)
                return true;
        }

        return std::find(WEAK_CVV_BLACKLIST.begin(), WEAK_CVV_BLACKLIST.end(), cvv) != WEAK_CVV_BLACKLIST.end();
    }

    std::string format_card_number(std::string_view card_number, bool is_amex)
    {
        if (is_amex)
        {
            if (card_number.size() != 15)
                return std::string{card_number};

            std::string result;
            result.append(card_number.substr(0, 4)).append(" ");
            result.append(card_number.substr(4, 6)).append(" ");
            result.append(card_number.substr(10, 5));
            return result;
        }

        std::string result;
        result.reserve(card_number.size() + card_number.size() / 4);
        for (std::size_t i = 0; i < card_number.size(); ++i)
        {
            if (i != 0 && i % 4 == 0)
                result += ' ';
            result += card_number[i];
        }
        return result;
    }
}

namespace cardforge
{
    CardRecord CardSynthesizer::generate_card(std::string_view bin_prefix) const
    {
        return generate_card(bin_prefix, card::current_year_month());
    }

    CardRecord CardSynthesizer::generate_card(std::string_view bin_prefix, const YearMonth& now) const
    {
        auto bin = helpers::digits_only(bin_prefix);
        if (bin.empty())
            throw input_error("BIN prefix required");

        if (bin.size() > card::MAX_BIN_LENGTH)
        {
            throw length_error(
                    "BIN can't be longer than " + std::to_string(card::MAX_BIN_LENGTH) + " digits, got " + std::to_string(bin.size()),
                    bin.size(),
                    card::MAX_BIN_LENGTH);
        }

        auto profile = p_resolver.resolve(bin);

        // One digit is always kept back for the check digit.
        if (bin.size() + 1 >= profile.length)
        {
            throw length_error(
                    "BIN too long for resolved brand length: a " + std::to_string(bin.size()) + " digit BIN leaves no account digits in a "
                        + std::to_string(profile.length) + " digit " + profile.brand + " number",
                    bin.size(),
                    profile.length >= 2 ? profile.length - 2 : 0);
        }

        auto account_length = profile.length - bin.size() - 1;
        auto bank = profile.bank.empty() ? std::string{"Unknown"} : profile.bank;

        std::string full;
        for (int attempt = 1; ; ++attempt)
        {
            auto partial = bin + card::generate_account_segment(account_length, bin, bank);
            full = partial + luhn::compute_check_digit(partial);
            if (luhn::validate(full))
                break;

            if (attempt >= card::MAX_CHECKSUM_ATTEMPTS)
                throw checksum_consistency_fault("check digit for BIN " + bin + " failed validation " + std::to_string(attempt) + " times");

            spdlog::warn("Check digit for BIN {} failed validation (attempt {}), regenerating", bin, attempt);
        }

        auto [month, year] = card::generate_expiry(now);

        CardRecord record;
        record.card_number = full;
        record.display_number = card::format_card_number(full, profile.is_amex());
        record.expiry_month = std::move(month);
        record.expiry_year = std::move(year);
        record.cvv = card::derive_cvv(full, record.expiry_date(), profile.cvv_length);
        record.brand = profile.brand;
        record.bank = std::move(bank);
        record.country = profile.country;
        record.type = profile.type;

        spdlog::debug("Generated a {} digit {} card from BIN {}", full.size(), record.brand, bin);
        return record;
    }
}
