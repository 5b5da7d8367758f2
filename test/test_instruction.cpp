#include <crowdfund/crowdfund.hpp>
#include <doctest/doctest.h>

using namespace crowdfund;
using namespace crowdfund::ledger;
using namespace crowdfund::storage;

TEST_SUITE("Instruction Tests") {
    TEST_CASE("Serialization preserves every field") {
        auto target = Pubkey::fromSeed("target").value();
        auto ix = Instruction::create(target, "Library", "Books for everyone");

        auto decoded = Instruction::fromBytes(ix.toBytes());
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value().getKind() == InstructionKind::Create);
        CHECK(decoded.value().getName() == "Library");
        CHECK(decoded.value().getDescription() == "Books for everyone");
        REQUIRE(decoded.value().getCampaign().is_ok());
        CHECK(decoded.value().getCampaign().value() == target);
    }

    TEST_CASE("Kind names") {
        CHECK(instructionKindToString(InstructionKind::Create) == "create");
        CHECK(instructionKindToString(InstructionKind::Donate) == "donate");
        CHECK(instructionKindToString(InstructionKind::Withdraw) == "withdraw");
    }

    TEST_CASE("Garbage does not decode") {
        std::vector<dp::u8> garbage{0x01, 0x02};
        CHECK(Instruction::fromBytes(garbage).is_err());
    }
}

TEST_SUITE("Instruction Dispatch Tests") {
    struct DispatchFixture {
        MemoryHost host;
        CampaignLedger ledger;
        Pubkey admin = Pubkey::fromSeed("dispatch-admin").value();
        Pubkey donor = Pubkey::fromSeed("dispatch-donor").value();

        DispatchFixture() : ledger(host, options()) {
            REQUIRE(host.airdrop(admin, LAMPORTS_PER_SOL).is_ok());
            REQUIRE(host.airdrop(donor, LAMPORTS_PER_SOL).is_ok());
        }

        static LedgerOptions options() {
            LedgerOptions opts;
            opts.log_actions = false;
            return opts;
        }
    };

    TEST_CASE("Serialized instructions drive the full lifecycle") {
        DispatchFixture f;
        auto address = f.ledger.campaignAddress(f.admin).value();

        REQUIRE(f.ledger.execute(f.admin, Instruction::create(address, "Garden", "Community garden").toBytes()).is_ok());
        REQUIRE(f.ledger.execute(f.donor, Instruction::donate(address, 200'000'000).toBytes()).is_ok());
        REQUIRE(f.ledger.execute(f.admin, Instruction::withdraw(address, 50'000'000).toBytes()).is_ok());

        CHECK(f.ledger.getCampaign(address).value().amount_donated == 150'000'000);
    }

    TEST_CASE("Create must target the caller's own address") {
        DispatchFixture f;
        auto someone_else = f.ledger.campaignAddress(f.donor).value();

        auto result = f.ledger.execute(f.admin, Instruction::create(someone_else, "Hijack", ""));
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_INVALID_INSTRUCTION);
        CHECK(f.host.recordCount() == 0);
    }

    TEST_CASE("Ledger errors pass through unchanged") {
        DispatchFixture f;
        auto address = f.ledger.campaignAddress(f.admin).value();
        REQUIRE(f.ledger.execute(f.admin, Instruction::create(address, "Garden", "")).is_ok());

        auto result = f.ledger.execute(f.donor, Instruction::withdraw(address, 1));
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_UNAUTHORIZED);
    }

    TEST_CASE("Malformed instructions") {
        DispatchFixture f;

        SUBCASE("Unknown kind") {
            auto ix = Instruction::donate(f.ledger.campaignAddress(f.admin).value(), 1);
            ix.kind = 9;
            auto result = f.ledger.execute(f.donor, ix);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_INVALID_INSTRUCTION);
        }

        SUBCASE("Bad campaign address") {
            Instruction ix;
            ix.kind = static_cast<dp::u8>(InstructionKind::Donate);
            ix.campaign = dp::String("not-hex");
            ix.amount = 1;
            auto result = f.ledger.execute(f.donor, ix);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_INVALID_INSTRUCTION);
        }
    }
}
