#pragma once

#include <crowdfund/ledger/host.hpp>
#include <crowdfund/ledger/rent.hpp>
#include <cstdint>
#include <datapod/datapod.hpp>
#include <memory>
#include <string>
#include <vector>

// Forward declaration for sqlite3 C API
struct sqlite3;

namespace crowdfund::storage {

    /// SQLite database configuration
    struct OpenOptions {
        bool enable_wal = true;
        int32_t busy_timeout_ms = 5000;
        int32_t cache_size_kb = 20000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;

        OpenOptions() = default;
    };

    // ===========================================
    // SqliteHost - persistent host environment
    // ===========================================

    class SqliteHost : public ledger::Host {
      public:
        explicit SqliteHost(ledger::Rent rent = ledger::Rent{});
        ~SqliteHost() override;

        // Non-copyable, movable
        SqliteHost(const SqliteHost &) = delete;
        SqliteHost &operator=(const SqliteHost &) = delete;
        SqliteHost(SqliteHost &&) noexcept;
        SqliteHost &operator=(SqliteHost &&) noexcept;

        /// Open or create database at given path (":memory:" for a private in-memory database)
        /// @return true on success, false on failure
        bool open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Close database connection
        void close();

        /// Check if database is open
        bool isOpen() const;

        /// Create tables and run migrations; idempotent
        bool initializeSchema();

        /// Credit new funds to an account (faucet)
        dp::Result<void, dp::Error> airdrop(const Pubkey &account, dp::u64 amount);

        /// Number of allocated records
        int64_t getRecordCount();

        /// Run SQLite integrity check
        bool quickCheck();

        // === Host ===

        dp::Result<dp::u64, dp::Error> balance(const Pubkey &account) override;
        dp::Result<void, dp::Error> transfer(const Pubkey &from, const Pubkey &to, dp::u64 amount) override;
        dp::u64 minimumBalance(dp::usize data_len) const override;
        dp::Result<void, dp::Error> allocate(const Pubkey &address, const Pubkey &payer, dp::usize space) override;
        dp::Result<std::vector<dp::u8>, dp::Error> loadRecord(const Pubkey &address) override;
        dp::Result<void, dp::Error> storeRecord(const Pubkey &address, const std::vector<dp::u8> &data) override;
        dp::Result<std::vector<Pubkey>, dp::Error> recordAddresses() override;
        std::unique_ptr<ledger::AtomicScope> begin() override;

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        /// Write transaction (BEGIN IMMEDIATE): takes the database write lock up front, so concurrent
        /// connections serialize instead of reading state that is about to change
        class TxGuard : public ledger::AtomicScope {
          public:
            explicit TxGuard(SqliteHost &host);
            ~TxGuard() override;

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            dp::Result<void, dp::Error> commit() override;
            void rollback();

            /// False when BEGIN failed (busy database, or a transaction already running)
            bool isActive() const { return active_; }

          private:
            SqliteHost &host_;
            bool active_;
            bool committed_;
        };

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;
        ledger::Rent rent_;

        void applyPragmas(const OpenOptions &opts);
        bool executeSql(const std::string &sql);
        bool tableExists(const std::string &table_name);
        int32_t getCurrentSchemaVersion();
        bool setSchemaVersion(int32_t version);
        bool createSchemaV1();

        /// Guard that only opens a transaction when none is running.
        /// Fails when a transaction was needed but could not be started.
        dp::Result<void, dp::Error> beginIfIdle(std::unique_ptr<TxGuard> &guard);

        dp::Result<void, dp::Error> ensureOpen() const;
        dp::Result<bool, dp::Error> recordExists(const Pubkey &address);
        dp::Result<void, dp::Error> setBalance(const Pubkey &account, dp::u64 lamports);
        dp::Result<void, dp::Error> transferUnguarded(const Pubkey &from, const Pubkey &to, dp::u64 amount);
        dp::Error sqlError(const std::string &context) const;

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        // Balances are u64 stored bit-for-bit in SQLite's signed INTEGER
        static constexpr const char *ACCOUNTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS accounts (
                address TEXT PRIMARY KEY,
                lamports INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *RECORDS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS records (
                address TEXT PRIMARY KEY,
                payer TEXT NOT NULL,
                space INTEGER NOT NULL,
                data BLOB NOT NULL,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *IDX_RECORDS_PAYER =
            "CREATE INDEX IF NOT EXISTS idx_records_payer ON records(payer)";
    };

    /// Get current Unix timestamp in seconds
    int64_t currentTimestamp();

} // namespace crowdfund::storage
