#ifndef CARDFORGE_BATCH_HPP
#define CARDFORGE_BATCH_HPP

#include <string>
#include <string_view>
#include <vector>

#include "card.hpp"

namespace cardforge::batch
{
    // Attempts per requested card before a batch gives up on finding unique numbers.
    constexpr unsigned int ATTEMPTS_PER_CARD = 10;

    struct BatchResult
    {
        std::string bin;
        unsigned int requested = 0;
        std::vector<CardRecord> records;
        // 1-based indexes of the cards that couldn't be generated
        std::vector<unsigned int> failures;
        // Why they couldn't, empty if nothing failed
        std::string error;

        [[nodiscard]] inline bool complete() const noexcept { return records.size() == requested; }
    };

    /**
     * Generates `quantity` cards with distinct numbers. A duplicate is thrown away and
     * generated again. Input and length errors depend only on the BIN, so the first one
     * marks that card and all the ones after it as failed.
     */
    BatchResult generate(const CardSynthesizer& synthesizer, std::string_view bin, unsigned int quantity);

    std::string format_listing(const BatchResult& result);

    /**
     * The listing with a summary header (brand, bank, country, how many succeeded).
     *
     * @param timestamp Printed as is in the header
     */
    std::string format_report(const BatchResult& result, std::string_view timestamp);

    // Local time, "YYYY-MM-DD HH:MM:SS"
    std::string timestamp_now();
}

#endif //CARDFORGE_BATCH_HPP
