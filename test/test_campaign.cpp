#include "crowdfund/common/error.hpp"
#include "crowdfund/ledger/campaign.hpp"
#include <algorithm>
#include <doctest/doctest.h>

using namespace crowdfund;
using namespace crowdfund::ledger;

TEST_SUITE("Campaign Record Tests") {
    TEST_CASE("Account space matches the fixed layout") {
        // discriminator + admin + name + description + amount
        CHECK(Campaign::SPACE == 8 + 32 + (4 + 200) + (4 + 400) + 8);
        CHECK(Campaign::SPACE == 656);
    }

    TEST_CASE("UTF-8 character counting") {
        CHECK(utf8Length("") == 0);
        CHECK(utf8Length("Help Build a School") == 19);
        CHECK(utf8Length("caf\xC3\xA9") == 4);          // café
        CHECK(utf8Length("\xE2\x82\xAC") == 1);         // €
        CHECK(utf8Length("\xF0\x9F\x8E\x93 grad") == 6); // 🎓 grad

        SUBCASE("Invalid sequences count per byte") {
            CHECK(utf8Length("\xC3") == 1);
            CHECK(utf8Length("\xE2\x82") == 2);
            CHECK(utf8Length("\xFF\xFE") == 2);
            CHECK(utf8Length("\xF8\x80\x80") == 3);
            CHECK(utf8Length("\xF5\x80\x80\x80") == 4);
        }
    }

    TEST_CASE("Encode produces a zero padded account") {
        auto admin = Pubkey::fromSeed("campaign-admin").value();
        Campaign campaign(admin, "Help Build a School", "Funding for rural education");
        campaign.amount_donated = 1'000'000;

        auto encoded = campaign.encode();
        REQUIRE(encoded.is_ok());
        auto data = encoded.value();
        CHECK(data.size() == Campaign::SPACE);

        const auto &disc = Campaign::discriminator();
        CHECK(std::equal(disc.begin(), disc.end(), data.begin()));

        // Everything past the last field is padding
        size_t used = 8 + 32 + 4 + campaign.name.size() + 4 + campaign.description.size() + 8;
        for (size_t i = used; i < data.size(); ++i) {
            CHECK(data[i] == 0);
        }

        auto decoded = Campaign::decode(data);
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == campaign);
    }

    TEST_CASE("Maximum length multi-byte fields still fit") {
        auto admin = Pubkey::fromSeed("wide-admin").value();
        std::string name;
        for (int i = 0; i < 50; ++i)
            name += "\xF0\x9F\x8E\x93";
        std::string description;
        for (int i = 0; i < 100; ++i)
            description += "\xF0\x9F\x8C\xBE";

        Campaign campaign(admin, name, description);
        auto encoded = campaign.encode();
        REQUIRE(encoded.is_ok());
        CHECK(encoded.value().size() == Campaign::SPACE);
    }

    TEST_CASE("Oversized record is rejected") {
        auto admin = Pubkey::fromSeed("big-admin").value();
        Campaign campaign(admin, std::string(300, 'n'), std::string(400, 'd'));

        auto encoded = campaign.encode();
        REQUIRE(encoded.is_err());
        CHECK(encoded.error().code == ERR_STORAGE_FAILED);
    }

    TEST_CASE("Decode rejects foreign or truncated data") {
        SUBCASE("Zeroed account has no discriminator") {
            std::vector<dp::u8> zeroed(Campaign::SPACE, 0);
            auto decoded = Campaign::decode(zeroed);
            REQUIRE(decoded.is_err());
            CHECK(decoded.error().code == ERR_DESERIALIZATION_FAILED);
        }

        SUBCASE("Truncated account") {
            auto admin = Pubkey::fromSeed("truncated").value();
            auto data = Campaign(admin, "name", "description").encode().value();
            data.resize(8 + 20);
            auto decoded = Campaign::decode(data);
            REQUIRE(decoded.is_err());
            CHECK(decoded.error().code == ERR_DESERIALIZATION_FAILED);
        }

        SUBCASE("Empty buffer") {
            auto decoded = Campaign::decode({});
            CHECK(decoded.is_err());
        }
    }
}
