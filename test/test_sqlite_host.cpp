#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <crowdfund/crowdfund.hpp>
#include <filesystem>
#include <limits>
#include <sqlite3.h>

using namespace crowdfund;
using namespace crowdfund::ledger;
using namespace crowdfund::storage;

// Test helper: cleanup database file
struct TestDB {
    std::string path;
    SqliteHost host;

    explicit TestDB(const std::string &name) : path(name + ".db") { cleanup(); }

    ~TestDB() {
        host.close();
        cleanup();
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove(path);
        }
        if (std::filesystem::exists(path + "-wal")) {
            std::filesystem::remove(path + "-wal");
        }
        if (std::filesystem::exists(path + "-shm")) {
            std::filesystem::remove(path + "-shm");
        }
    }

    bool openReady() { return host.open(path) && host.initializeSchema(); }
};

static LedgerOptions quiet() {
    LedgerOptions opts;
    opts.log_actions = false;
    return opts;
}

TEST_SUITE("SQLite Host - Lifecycle") {
    TEST_CASE("Open, initialize and close") {
        TestDB db("test_host_lifecycle");

        CHECK_FALSE(db.host.isOpen());
        REQUIRE(db.host.open(db.path));
        CHECK(db.host.isOpen());
        REQUIRE(db.host.initializeSchema());
        CHECK(db.host.initializeSchema());
        CHECK(db.host.quickCheck());
        CHECK(db.host.getRecordCount() == 0);

        db.host.close();
        CHECK_FALSE(db.host.isOpen());
    }

    TEST_CASE("Operations on a closed database fail") {
        SqliteHost host;
        auto account = Pubkey::fromSeed("closed").value();

        auto balance = host.balance(account);
        REQUIRE(balance.is_err());
        CHECK(balance.error().code == ERR_STORAGE_FAILED);
        CHECK(host.airdrop(account, 1).is_err());
        CHECK(host.recordAddresses().is_err());
    }

    TEST_CASE("Custom open options") {
        TestDB db("test_host_options");
        OpenOptions opts;
        opts.enable_wal = false;
        opts.sync_mode = OpenOptions::Synchronous::FULL;
        REQUIRE(db.host.open(db.path, opts));
        REQUIRE(db.host.initializeSchema());
        CHECK(db.host.quickCheck());
    }
}

TEST_SUITE("SQLite Host - Balances") {
    TEST_CASE("Airdrop and transfer") {
        TestDB db("test_host_balances");
        REQUIRE(db.openReady());
        auto a = Pubkey::fromSeed("sql-a").value();
        auto b = Pubkey::fromSeed("sql-b").value();

        CHECK(db.host.balance(a).value() == 0);
        REQUIRE(db.host.airdrop(a, 5'000).is_ok());
        REQUIRE(db.host.transfer(a, b, 2'000).is_ok());
        CHECK(db.host.balance(a).value() == 3'000);
        CHECK(db.host.balance(b).value() == 2'000);

        auto overdraft = db.host.transfer(b, a, 2'001);
        REQUIRE(overdraft.is_err());
        CHECK(overdraft.error().code == ERR_INSUFFICIENT_FUNDS);
        CHECK(db.host.balance(b).value() == 2'000);

        CHECK(db.host.transfer(a, a, 1).is_err());
    }

    TEST_CASE("Full u64 range survives storage") {
        TestDB db("test_host_u64");
        REQUIRE(db.openReady());
        auto rich = Pubkey::fromSeed("rich").value();
        constexpr dp::u64 MAX = std::numeric_limits<dp::u64>::max();

        REQUIRE(db.host.airdrop(rich, MAX).is_ok());
        CHECK(db.host.balance(rich).value() == MAX);

        auto overflow = db.host.airdrop(rich, 1);
        REQUIRE(overflow.is_err());
        CHECK(overflow.error().code == ERR_ARITHMETIC_OVERFLOW);
    }

    TEST_CASE("Uncommitted guard rolls back") {
        TestDB db("test_host_rollback");
        REQUIRE(db.openReady());
        auto a = Pubkey::fromSeed("tx-a").value();
        auto b = Pubkey::fromSeed("tx-b").value();
        REQUIRE(db.host.airdrop(a, 1'000).is_ok());

        {
            auto scope = db.host.begin();
            REQUIRE(db.host.transfer(a, b, 600).is_ok());
            CHECK(db.host.balance(b).value() == 600);
        }
        CHECK(db.host.balance(a).value() == 1'000);
        CHECK(db.host.balance(b).value() == 0);

        {
            SqliteHost::TxGuard guard(db.host);
            REQUIRE(db.host.transfer(a, b, 100).is_ok());
            guard.rollback();
            CHECK(guard.commit().is_err());
        }
        CHECK(db.host.balance(a).value() == 1'000);

        {
            auto scope = db.host.begin();
            REQUIRE(db.host.transfer(a, b, 250).is_ok());
            REQUIRE(scope->commit().is_ok());
        }
        CHECK(db.host.balance(b).value() == 250);
    }
}

TEST_SUITE("SQLite Host - Records") {
    TEST_CASE("Allocate, store and load") {
        TestDB db("test_host_records");
        REQUIRE(db.openReady());
        auto payer = Pubkey::fromSeed("sql-payer").value();
        auto record = Pubkey::fromSeed("sql-record").value();
        REQUIRE(db.host.airdrop(payer, LAMPORTS_PER_SOL).is_ok());

        REQUIRE(db.host.allocate(record, payer, 16).is_ok());
        CHECK(db.host.getRecordCount() == 1);
        CHECK(db.host.balance(record).value() == db.host.minimumBalance(16));
        CHECK(db.host.loadRecord(record).value() == std::vector<dp::u8>(16, 0));

        REQUIRE(db.host.storeRecord(record, {9, 8, 7}).is_ok());
        auto loaded = db.host.loadRecord(record).value();
        REQUIRE(loaded.size() == 16);
        CHECK(loaded[0] == 9);
        CHECK(loaded[2] == 7);
        CHECK(loaded[3] == 0);

        auto duplicate = db.host.allocate(record, payer, 16);
        REQUIRE(duplicate.is_err());
        CHECK(duplicate.error().code == ERR_ACCOUNT_IN_USE);

        auto oversized = db.host.storeRecord(record, std::vector<dp::u8>(17, 1));
        REQUIRE(oversized.is_err());
        CHECK(oversized.error().code == ERR_STORAGE_FAILED);
    }

    TEST_CASE("Missing records") {
        TestDB db("test_host_missing");
        REQUIRE(db.openReady());
        auto ghost = Pubkey::fromSeed("ghost").value();

        auto loaded = db.host.loadRecord(ghost);
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == ERR_CAMPAIGN_NOT_FOUND);
        CHECK(db.host.storeRecord(ghost, {1}).is_err());
        CHECK(db.host.recordAddresses().value().empty());
    }

    TEST_CASE("Payer without the reserve cannot allocate") {
        TestDB db("test_host_unfunded");
        REQUIRE(db.openReady());
        auto payer = Pubkey::fromSeed("broke-payer").value();
        auto record = Pubkey::fromSeed("unfunded").value();

        auto result = db.host.allocate(record, payer, 16);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_INSUFFICIENT_FUNDS);
        CHECK(db.host.getRecordCount() == 0);
    }
}

TEST_SUITE("SQLite Host - Campaign Ledger") {
    TEST_CASE("Campaigns persist across reopen") {
        TestDB db("test_host_persist");
        auto admin = Pubkey::fromSeed("persist-admin").value();
        auto donor = Pubkey::fromSeed("persist-donor").value();
        Pubkey address;

        {
            REQUIRE(db.openReady());
            CampaignLedger ledger(db.host, quiet());
            REQUIRE(db.host.airdrop(admin, LAMPORTS_PER_SOL).is_ok());
            REQUIRE(db.host.airdrop(donor, LAMPORTS_PER_SOL).is_ok());
            REQUIRE(ledger.create(admin, "Persistent", "Survives restarts").is_ok());
            address = ledger.campaignAddress(admin).value();
            REQUIRE(ledger.donate(donor, address, 200'000'000).is_ok());
            db.host.close();
        }

        REQUIRE(db.openReady());
        CampaignLedger ledger(db.host, quiet());
        auto view = ledger.getCampaignView(address);
        REQUIRE(view.is_ok());
        CHECK(view.value().campaign.admin == admin);
        CHECK(view.value().campaign.name == "Persistent");
        CHECK(view.value().campaign.amount_donated == 200'000'000);
        CHECK(view.value().held_balance == db.host.minimumBalance(Campaign::SPACE) + 200'000'000);
        CHECK(db.host.balance(donor).value() == LAMPORTS_PER_SOL - 200'000'000);

        REQUIRE(ledger.withdraw(admin, address, 200'000'000).is_ok());
        CHECK(ledger.getCampaign(address).value().amount_donated == 0);
    }

    TEST_CASE("Failed donation leaves the database untouched") {
        TestDB db("test_host_failed_donation");
        REQUIRE(db.openReady());
        CampaignLedger ledger(db.host, quiet());
        auto admin = Pubkey::fromSeed("fd-admin").value();
        auto donor = Pubkey::fromSeed("fd-donor").value();
        REQUIRE(db.host.airdrop(admin, LAMPORTS_PER_SOL).is_ok());
        REQUIRE(db.host.airdrop(donor, 100).is_ok());
        REQUIRE(ledger.create(admin, "Guarded", "").is_ok());
        auto address = ledger.campaignAddress(admin).value();

        auto result = ledger.donate(donor, address, 101);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_INSUFFICIENT_FUNDS);
        CHECK(db.host.balance(donor).value() == 100);
        CHECK(ledger.getCampaign(address).value().amount_donated == 0);

        auto listed = ledger.listCampaigns();
        REQUIRE(listed.is_ok());
        CHECK(listed.value().size() == 1);
    }
}

TEST_SUITE("SQLite Host - Locking") {
    TEST_CASE("Ledger refuses to run inside a transaction it does not own") {
        TestDB db("test_host_foreign_tx");
        REQUIRE(db.openReady());
        CampaignLedger ledger(db.host, quiet());
        auto admin = Pubkey::fromSeed("ftx-admin").value();
        auto donor = Pubkey::fromSeed("ftx-donor").value();
        REQUIRE(db.host.airdrop(admin, LAMPORTS_PER_SOL).is_ok());
        REQUIRE(db.host.airdrop(donor, LAMPORTS_PER_SOL).is_ok());
        REQUIRE(ledger.create(admin, "Locked", "").is_ok());
        auto address = ledger.campaignAddress(admin).value();

        {
            SqliteHost::TxGuard outer(db.host);
            REQUIRE(outer.isActive());
            CHECK_FALSE(static_cast<bool>(db.host.begin()));

            auto result = ledger.donate(donor, address, 1'000);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_STORAGE_FAILED);
            outer.rollback();
        }

        CHECK(db.host.balance(donor).value() == LAMPORTS_PER_SOL);
        CHECK(ledger.getCampaign(address).value().amount_donated == 0);

        REQUIRE(ledger.donate(donor, address, 1'000).is_ok());
        CHECK(ledger.getCampaign(address).value().amount_donated == 1'000);
    }

    TEST_CASE("Second connection cannot withdraw while the first holds the write lock") {
        TestDB db("test_host_two_writers");
        REQUIRE(db.openReady());
        CampaignLedger first(db.host, quiet());
        auto admin = Pubkey::fromSeed("tw-admin").value();
        auto donor = Pubkey::fromSeed("tw-donor").value();
        REQUIRE(db.host.airdrop(admin, LAMPORTS_PER_SOL).is_ok());
        REQUIRE(db.host.airdrop(donor, LAMPORTS_PER_SOL).is_ok());
        REQUIRE(first.create(admin, "Contested", "").is_ok());
        auto address = first.campaignAddress(admin).value();
        REQUIRE(first.donate(donor, address, 1'000).is_ok());

        OpenOptions impatient;
        impatient.busy_timeout_ms = 0;
        SqliteHost other;
        REQUIRE(other.open(db.path, impatient));
        CampaignLedger second(other, quiet());

        {
            auto scope = db.host.begin();
            REQUIRE(static_cast<bool>(scope));

            auto blocked = second.withdraw(admin, address, 1'000);
            REQUIRE(blocked.is_err());
            CHECK(blocked.error().code == ERR_STORAGE_FAILED);
        }
        CHECK(first.getCampaign(address).value().amount_donated == 1'000);

        REQUIRE(first.withdraw(admin, address, 1'000).is_ok());

        // The first withdrawal drained the donations; the second sees that
        auto late = second.withdraw(admin, address, 1'000);
        REQUIRE(late.is_err());
        CHECK(late.error().code == ERR_INSUFFICIENT_DONATED_FUNDS);
        CHECK(other.balance(address).value() == db.host.minimumBalance(Campaign::SPACE));
        other.close();
    }

    TEST_CASE("Busy database is an error, not an empty result") {
        TestDB db("test_host_busy_read");
        OpenOptions opts;
        opts.enable_wal = false;
        opts.busy_timeout_ms = 0;
        REQUIRE(db.host.open(db.path, opts));
        REQUIRE(db.host.initializeSchema());

        auto payer = Pubkey::fromSeed("busy-payer").value();
        auto record = Pubkey::fromSeed("busy-record").value();
        REQUIRE(db.host.airdrop(payer, LAMPORTS_PER_SOL).is_ok());
        REQUIRE(db.host.allocate(record, payer, 8).is_ok());

        sqlite3 *locker = nullptr;
        REQUIRE(sqlite3_open(db.path.c_str(), &locker) == SQLITE_OK);
        REQUIRE(sqlite3_exec(locker, "BEGIN EXCLUSIVE", nullptr, nullptr, nullptr) == SQLITE_OK);

        auto balance = db.host.balance(payer);
        CHECK(balance.is_err());
        if (balance.is_err()) {
            CHECK(balance.error().code == ERR_STORAGE_FAILED);
        }

        auto loaded = db.host.loadRecord(record);
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == ERR_STORAGE_FAILED);

        auto listed = db.host.recordAddresses();
        CHECK(listed.is_err());

        auto moved = db.host.transfer(payer, record, 1);
        CHECK(moved.is_err());

        sqlite3_exec(locker, "ROLLBACK", nullptr, nullptr, nullptr);
        sqlite3_close(locker);

        CHECK(db.host.balance(payer).value() == LAMPORTS_PER_SOL - db.host.minimumBalance(8));
        CHECK(db.host.loadRecord(record).is_ok());
    }
}
