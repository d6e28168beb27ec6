#include <catch2/catch.hpp>

#include "cardforge/output.hpp"

using namespace cardforge;

namespace
{
    CardRecord sample_record()
    {
        CardRecord record;
        record.card_number = "5329591234567890";
        record.display_number = "5329 5912 3456 7890";
        record.expiry_month = "03";
        record.expiry_year = "29";
        record.cvv = "675";
        record.brand = "Mastercard";
        record.bank = "Bank of America";
        record.country = "US";
        record.type = "credit";
        return record;
    }
}

TEST_CASE("Form fill JSON has the display number", "cardforge::output")
{
    auto j = output::to_form_fill(sample_record());
    REQUIRE(j.size() == 3);
    REQUIRE(j["cardNumber"] == "5329 5912 3456 7890");
    REQUIRE(j["expiryDate"] == "03/29");
    REQUIRE(j["cvc"] == "675");
}

TEST_CASE("Extended form fill JSON has the issuer details", "cardforge::output")
{
    auto j = output::to_form_fill(sample_record(), true);
    REQUIRE(j.size() == 7);
    REQUIRE(j["cardBrand"] == "Mastercard");
    REQUIRE(j["bank"] == "Bank of America");
    REQUIRE(j["country"] == "US");
    REQUIRE(j["type"] == "credit");
}

TEST_CASE("Listing lines use the bare number", "cardforge::output")
{
    REQUIRE(output::to_listing_line(sample_record()) == "5329591234567890|03/29|675");
}
