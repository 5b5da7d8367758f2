#include <crowdfund/crowdfund.hpp>
#include <doctest/doctest.h>
#include <limits>

using namespace crowdfund;
using namespace crowdfund::ledger;
using namespace crowdfund::storage;

TEST_SUITE("Memory Host Tests") {
    TEST_CASE("Balances and transfers") {
        MemoryHost host;
        auto a = Pubkey::fromSeed("mem-a").value();
        auto b = Pubkey::fromSeed("mem-b").value();

        CHECK(host.balance(a).value() == 0);
        REQUIRE(host.airdrop(a, 1'000).is_ok());
        REQUIRE(host.transfer(a, b, 400).is_ok());
        CHECK(host.balance(a).value() == 600);
        CHECK(host.balance(b).value() == 400);

        SUBCASE("Overdraft") {
            auto result = host.transfer(a, b, 601);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_INSUFFICIENT_FUNDS);
            CHECK(host.balance(a).value() == 600);
        }

        SUBCASE("Self transfer") {
            CHECK(host.transfer(a, a, 1).is_err());
        }

        SUBCASE("Destination overflow") {
            REQUIRE(host.airdrop(b, std::numeric_limits<dp::u64>::max() - 400).is_ok());
            auto result = host.transfer(a, b, 1);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_ARITHMETIC_OVERFLOW);
        }
    }

    TEST_CASE("Allocation funds the reserve from the payer") {
        MemoryHost host;
        auto payer = Pubkey::fromSeed("payer").value();
        auto record = Pubkey::fromSeed("record").value();
        REQUIRE(host.airdrop(payer, LAMPORTS_PER_SOL).is_ok());

        REQUIRE(host.allocate(record, payer, 100).is_ok());
        auto reserve = host.minimumBalance(100);
        CHECK(host.balance(record).value() == reserve);
        CHECK(host.balance(payer).value() == LAMPORTS_PER_SOL - reserve);

        auto data = host.loadRecord(record);
        REQUIRE(data.is_ok());
        CHECK(data.value() == std::vector<dp::u8>(100, 0));

        auto again = host.allocate(record, payer, 100);
        REQUIRE(again.is_err());
        CHECK(again.error().code == ERR_ACCOUNT_IN_USE);
    }

    TEST_CASE("Pre-funded address only needs a top up") {
        MemoryHost host;
        auto payer = Pubkey::fromSeed("payer").value();
        auto record = Pubkey::fromSeed("prefunded").value();
        auto reserve = host.minimumBalance(50);
        REQUIRE(host.airdrop(payer, reserve).is_ok());
        REQUIRE(host.airdrop(record, reserve - 10).is_ok());

        REQUIRE(host.allocate(record, payer, 50).is_ok());
        CHECK(host.balance(payer).value() == reserve - 10);
        CHECK(host.balance(record).value() == reserve);
    }

    TEST_CASE("Record writes stay inside the allocation") {
        MemoryHost host(Rent::free());
        auto payer = Pubkey::fromSeed("payer").value();
        auto record = Pubkey::fromSeed("bounded").value();
        REQUIRE(host.allocate(record, payer, 4).is_ok());

        REQUIRE(host.storeRecord(record, {1, 2}).is_ok());
        CHECK(host.loadRecord(record).value() == std::vector<dp::u8>{1, 2, 0, 0});

        auto too_big = host.storeRecord(record, {1, 2, 3, 4, 5});
        REQUIRE(too_big.is_err());
        CHECK(too_big.error().code == ERR_STORAGE_FAILED);

        auto missing = host.storeRecord(Pubkey::fromSeed("nope").value(), {1});
        REQUIRE(missing.is_err());
        CHECK(missing.error().code == ERR_CAMPAIGN_NOT_FOUND);
    }

    TEST_CASE("Uncommitted scope rolls back") {
        MemoryHost host(Rent::free());
        auto a = Pubkey::fromSeed("scope-a").value();
        auto b = Pubkey::fromSeed("scope-b").value();
        REQUIRE(host.airdrop(a, 1'000).is_ok());

        {
            auto scope = host.begin();
            REQUIRE(host.transfer(a, b, 700).is_ok());
            REQUIRE(host.allocate(b, a, 0).is_ok());
        }
        CHECK(host.balance(a).value() == 1'000);
        CHECK(host.balance(b).value() == 0);
        CHECK(host.recordCount() == 0);

        {
            auto scope = host.begin();
            REQUIRE(host.transfer(a, b, 700).is_ok());
            REQUIRE(scope->commit().is_ok());
        }
        CHECK(host.balance(a).value() == 300);
        CHECK(host.balance(b).value() == 700);
    }

    TEST_CASE("Record addresses are ordered") {
        MemoryHost host(Rent::free());
        auto payer = Pubkey::fromSeed("payer").value();
        for (const char *seed : {"r1", "r2", "r3", "r4"}) {
            REQUIRE(host.allocate(Pubkey::fromSeed(seed).value(), payer, 8).is_ok());
        }
        auto addresses = host.recordAddresses().value();
        REQUIRE(addresses.size() == 4);
        for (size_t i = 1; i < addresses.size(); ++i) {
            CHECK(addresses[i - 1] < addresses[i]);
        }
    }
}
