#include "crowdfund/ledger/campaign.hpp"
#include "crowdfund/ledger/rent.hpp"
#include <doctest/doctest.h>
#include <limits>

using namespace crowdfund::ledger;

TEST_SUITE("Rent Tests") {
    TEST_CASE("Default schedule") {
        Rent rent;
        CHECK(rent.lamports_per_byte_year == 3480);
        CHECK(rent.exemption_threshold == doctest::Approx(2.0));

        CHECK(rent.minimumBalance(0) == 890'880);
        CHECK(rent.minimumBalance(Campaign::SPACE) == 5'456'640);
    }

    TEST_CASE("Reserve grows with record size") {
        Rent rent;
        CHECK(rent.minimumBalance(100) < rent.minimumBalance(200));
    }

    TEST_CASE("Custom and free schedules") {
        Rent custom(10, 1.0);
        CHECK(custom.minimumBalance(72) == 2'000);

        CHECK(Rent::free().minimumBalance(Campaign::SPACE) == 0);
    }

    TEST_CASE("Saturates instead of wrapping") {
        Rent huge(std::numeric_limits<dp::u64>::max(), 2.0);
        CHECK(huge.minimumBalance(1) == std::numeric_limits<dp::u64>::max());
    }
}
