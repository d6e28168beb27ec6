#include <catch2/catch.hpp>

#include "cardforge/errors.hpp"
#include "cardforge/luhn.hpp"

using namespace cardforge;

TEST_CASE("Check digit matches known numbers", "cardforge::luhn")
{
    REQUIRE(luhn::compute_check_digit("532959123456789") == '0');
    REQUIRE(luhn::compute_check_digit("411111111111111") == '1');
    REQUIRE(luhn::compute_check_digit("552461234567890") == '6');
    REQUIRE(luhn::compute_check_digit("37828224631000") == '5');
}

TEST_CASE("Known card numbers validate", "cardforge::luhn")
{
    REQUIRE(luhn::validate("4111111111111111"));
    REQUIRE(luhn::validate("5329591234567890"));
    REQUIRE(luhn::validate("378282246310005"));
    REQUIRE(luhn::validate("6011111111111117"));
    REQUIRE(luhn::validate("0"));
}

TEST_CASE("Single digit changes are caught", "cardforge::luhn")
{
    REQUIRE_FALSE(luhn::validate("4111111111111112"));
    REQUIRE_FALSE(luhn::validate("5329591234567891"));
    REQUIRE_FALSE(luhn::validate("378282246310006"));
}

TEST_CASE("Appending the check digit always validates", "cardforge::luhn")
{
    std::string partial = "4";
    for (int i = 0; i < 30; ++i)
    {
        partial += (char)('0' + (i * 7) % 10);
        auto full = partial + luhn::compute_check_digit(partial);
        REQUIRE(luhn::validate(full));
    }
}

TEST_CASE("Checksum rejects empty and non-digit input", "cardforge::luhn")
{
    REQUIRE_THROWS_AS(luhn::compute_check_digit(""), input_error);
    REQUIRE_THROWS_AS(luhn::compute_check_digit("4111 1111"), input_error);
    REQUIRE_THROWS_AS(luhn::validate(""), input_error);
    REQUIRE_THROWS_AS(luhn::validate("41x1"), input_error);
}
