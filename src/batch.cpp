#include "cardforge/batch.hpp"

#include <ctime>
#include <sstream>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "cardforge/errors.hpp"
#include "cardforge/output.hpp"

namespace cardforge::batch
{
    BatchResult generate(const CardSynthesizer& synthesizer, std::string_view bin, unsigned int quantity)
    {
        BatchResult result;
        result.bin = std::string{bin};
        result.requested = quantity;
        result.records.reserve(quantity);

        std::unordered_set<std::string> generated;
        unsigned int attempts = 0;
        const unsigned int max_attempts = quantity * ATTEMPTS_PER_CARD;

        while (result.records.size() < quantity && attempts < max_attempts)
        {
            ++attempts;
            auto index = (unsigned int)result.records.size() + 1;

            try
            {
                auto record = synthesizer.generate_card(bin);
                if (!generated.insert(record.card_number).second)
                {
                    spdlog::debug("Card {} is a duplicate, regenerating", index);
                    continue;
                }

                result.records.push_back(std::move(record));
            }
            catch (const input_error& e)
            {
                result.error = e.what();
            }
            catch (const length_error& e)
            {
                result.error = e.what();
            }

            if (!result.error.empty())
            {
                spdlog::warn("Failed to generate card {} for BIN {}: {}", index, result.bin, result.error);
                for (auto i = index; i <= quantity; ++i)
                    result.failures.push_back(i);
                return result;
            }
        }

        if (result.records.size() < quantity)
        {
            spdlog::warn("Only found {} unique cards out of {} for BIN {} after {} attempts", result.records.size(), quantity, result.bin, attempts);
            for (auto i = (unsigned int)result.records.size() + 1; i <= quantity; ++i)
                result.failures.push_back(i);
            result.error = "ran out of attempts looking for unique card numbers";
        }

        return result;
    }

    std::string format_listing(const BatchResult& result)
    {
        std::string listing;
        for (const auto& record : result.records)
        {
            listing += output::to_listing_line(record);
            listing += '\n';
        }
        return listing;
    }

    std::string format_report(const BatchResult& result, std::string_view timestamp)
    {
        if (result.records.empty())
        {
            std::string message = "Generation failed: All cards failed, please check BIN settings\n";
            if (!result.error.empty())
                message += "Reason: " + result.error + "\n";
            return message;
        }

        const auto& first = result.records.front();

        std::ostringstream out;
        out << "=== Generated: " << timestamp << " ===\n";
        out << "BIN Prefix: " << result.bin << "\n";
        out << "Card Brand: " << first.brand << "\n";
        out << "Issuing Bank: " << first.bank << "\n";
        out << "Country: " << first.country << "\n";
        out << "Algorithm: Luhn (Markov Chain + BIN Database)\n";
        out << "Success: " << result.records.size() << "/" << result.requested << " cards (deduplicated)\n";

        if (!result.failures.empty())
        {
            out << "Failed: ";
            for (std::size_t i = 0; i < result.failures.size(); ++i)
            {
                if (i != 0)
                    out << ", ";
                out << result.failures[i];
            }
            out << "\n";
        }

        out << "\n" << format_listing(result);
        return out.str();
    }

    std::string timestamp_now()
    {
        char buf[80];
        auto timenow = std::time(nullptr);
        std::tm local{};
        localtime_r(&timenow, &local);
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
        return buf;
    }
}
