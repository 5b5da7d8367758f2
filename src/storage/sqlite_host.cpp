#include <chrono>
#include <crowdfund/common/error.hpp>
#include <crowdfund/storage/sqlite_host.hpp>
#include <limits>
#include <sqlite3.h>

namespace crowdfund::storage {

    int64_t currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    // ===========================================
    // SqliteHost lifecycle
    // ===========================================

    SqliteHost::SqliteHost(ledger::Rent rent) : db_(nullptr), is_open_(false), rent_(rent) {}

    SqliteHost::~SqliteHost() { close(); }

    SqliteHost::SqliteHost(SqliteHost &&other) noexcept
        : db_(other.db_), db_path_(std::move(other.db_path_)), is_open_(other.is_open_), rent_(other.rent_) {
        other.db_ = nullptr;
        other.is_open_ = false;
    }

    SqliteHost &SqliteHost::operator=(SqliteHost &&other) noexcept {
        if (this != &other) {
            close();
            db_ = other.db_;
            db_path_ = std::move(other.db_path_);
            is_open_ = other.is_open_;
            rent_ = other.rent_;
            other.db_ = nullptr;
            other.is_open_ = false;
        }
        return *this;
    }

    bool SqliteHost::open(const std::string &path, const OpenOptions &opts) {
        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return false;
        }

        db_path_ = path;
        is_open_ = true;
        applyPragmas(opts);
        return true;
    }

    void SqliteHost::close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }
    }

    bool SqliteHost::isOpen() const { return is_open_; }

    void SqliteHost::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return;

        if (opts.enable_wal) {
            sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        }

        std::string busy_timeout = "PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";";
        sqlite3_exec(db_, busy_timeout.c_str(), nullptr, nullptr, nullptr);

        std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";";
        sqlite3_exec(db_, cache_size.c_str(), nullptr, nullptr, nullptr);

        std::string sync_mode;
        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        sqlite3_exec(db_, sync_mode.c_str(), nullptr, nullptr, nullptr);
    }

    // ===========================================
    // Schema
    // ===========================================

    bool SqliteHost::initializeSchema() {
        if (!db_ || !is_open_)
            return false;

        TxGuard tx(*this);
        if (!tx.isActive())
            return false;

        if (!executeSql(SCHEMA_MIGRATIONS_TABLE)) {
            return false;
        }

        int32_t current_version = getCurrentSchemaVersion();

        if (current_version < 1) {
            if (!createSchemaV1())
                return false;
            if (!setSchemaVersion(1))
                return false;
        }

        return tx.commit().is_ok();
    }

    bool SqliteHost::createSchemaV1() {
        return executeSql(ACCOUNTS_TABLE) && executeSql(RECORDS_TABLE) && executeSql(IDX_RECORDS_PAYER);
    }

    bool SqliteHost::executeSql(const std::string &sql) {
        if (!db_)
            return false;
        return sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK;
    }

    bool SqliteHost::tableExists(const std::string &table_name) {
        if (!db_)
            return false;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_text(stmt, 1, table_name.c_str(), -1, SQLITE_TRANSIENT);

        bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
        sqlite3_finalize(stmt);

        return exists;
    }

    int32_t SqliteHost::getCurrentSchemaVersion() {
        if (!tableExists("schema_migrations"))
            return 0;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT MAX(version) FROM schema_migrations";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        int32_t version = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = sqlite3_column_int(stmt, 0);
        }

        sqlite3_finalize(stmt);
        return version;
    }

    bool SqliteHost::setSchemaVersion(int32_t version) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_int(stmt, 1, version);
        sqlite3_bind_int64(stmt, 2, currentTimestamp());

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        return success;
    }

    // ===========================================
    // Transaction Guard
    // ===========================================

    SqliteHost::TxGuard::TxGuard(SqliteHost &host) : host_(host), active_(false), committed_(false) {
        if (host_.db_) {
            active_ = (sqlite3_exec(host_.db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK);
        }
    }

    SqliteHost::TxGuard::~TxGuard() {
        if (active_ && !committed_) {
            sqlite3_exec(host_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    dp::Result<void, dp::Error> SqliteHost::TxGuard::commit() {
        if (!active_ || committed_) {
            return dp::Result<void, dp::Error>::err(storage_failed("No active transaction to commit"));
        }
        if (sqlite3_exec(host_.db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(host_.sqlError("Commit failed"));
        }
        committed_ = true;
        active_ = false;
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteHost::TxGuard::rollback() {
        if (active_ && !committed_) {
            sqlite3_exec(host_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
            committed_ = true;
            active_ = false;
        }
    }

    std::unique_ptr<ledger::AtomicScope> SqliteHost::begin() {
        if (!db_ || sqlite3_get_autocommit(db_) == 0) {
            return nullptr;
        }
        auto guard = std::make_unique<TxGuard>(*this);
        if (!guard->isActive()) {
            return nullptr;
        }
        return guard;
    }

    dp::Result<void, dp::Error> SqliteHost::beginIfIdle(std::unique_ptr<TxGuard> &guard) {
        if (sqlite3_get_autocommit(db_) == 0) {
            return dp::Result<void, dp::Error>::ok();
        }
        guard = std::make_unique<TxGuard>(*this);
        if (!guard->isActive()) {
            return dp::Result<void, dp::Error>::err(sqlError("Failed to begin transaction"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Helpers
    // ===========================================

    dp::Result<void, dp::Error> SqliteHost::ensureOpen() const {
        if (!db_ || !is_open_) {
            return dp::Result<void, dp::Error>::err(storage_failed("Database is not open"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Error SqliteHost::sqlError(const std::string &context) const {
        std::string message = context;
        if (db_) {
            message += ": ";
            message += sqlite3_errmsg(db_);
        }
        return storage_failed(dp::String(message.c_str()));
    }

    dp::Result<bool, dp::Error> SqliteHost::recordExists(const Pubkey &address) {
        sqlite3_stmt *stmt;
        const char *sql = "SELECT 1 FROM records WHERE address = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<bool, dp::Error>::err(sqlError("Failed to query record"));
        }

        auto key = address.toHex();
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            auto error = sqlError("Failed to query record");
            sqlite3_finalize(stmt);
            return dp::Result<bool, dp::Error>::err(error);
        }
        sqlite3_finalize(stmt);
        return dp::Result<bool, dp::Error>::ok(rc == SQLITE_ROW);
    }

    dp::Result<void, dp::Error> SqliteHost::setBalance(const Pubkey &account, dp::u64 lamports) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR REPLACE INTO accounts (address, lamports, updated_at) VALUES (?, ?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(sqlError("Failed to prepare balance update"));
        }

        auto key = account.toHex();
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(lamports));
        sqlite3_bind_int64(stmt, 3, currentTimestamp());

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        if (!success) {
            return dp::Result<void, dp::Error>::err(sqlError("Failed to update balance"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Balances
    // ===========================================

    dp::Result<void, dp::Error> SqliteHost::airdrop(const Pubkey &account, dp::u64 amount) {
        auto ready = ensureOpen();
        if (!ready.is_ok())
            return ready;

        std::unique_ptr<TxGuard> tx;
        auto started = beginIfIdle(tx);
        if (!started.is_ok())
            return started;
        auto current = balance(account);
        if (!current.is_ok()) {
            return dp::Result<void, dp::Error>::err(current.error());
        }
        if (amount > std::numeric_limits<dp::u64>::max() - current.value()) {
            return dp::Result<void, dp::Error>::err(arithmetic_overflow("Airdrop would overflow balance"));
        }
        auto updated = setBalance(account, current.value() + amount);
        if (!updated.is_ok())
            return updated;
        return tx ? tx->commit() : dp::Result<void, dp::Error>::ok();
    }

    dp::Result<dp::u64, dp::Error> SqliteHost::balance(const Pubkey &account) {
        auto ready = ensureOpen();
        if (!ready.is_ok()) {
            return dp::Result<dp::u64, dp::Error>::err(ready.error());
        }

        sqlite3_stmt *stmt;
        const char *sql = "SELECT lamports FROM accounts WHERE address = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<dp::u64, dp::Error>::err(sqlError("Failed to query balance"));
        }

        auto key = account.toHex();
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

        // Accounts without a row hold nothing
        dp::u64 lamports = 0;
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            lamports = static_cast<dp::u64>(sqlite3_column_int64(stmt, 0));
        } else if (rc != SQLITE_DONE) {
            auto error = sqlError("Failed to query balance");
            sqlite3_finalize(stmt);
            return dp::Result<dp::u64, dp::Error>::err(error);
        }
        sqlite3_finalize(stmt);
        return dp::Result<dp::u64, dp::Error>::ok(lamports);
    }

    dp::Result<void, dp::Error> SqliteHost::transfer(const Pubkey &from, const Pubkey &to, dp::u64 amount) {
        auto ready = ensureOpen();
        if (!ready.is_ok())
            return ready;

        std::unique_ptr<TxGuard> tx;
        auto started = beginIfIdle(tx);
        if (!started.is_ok())
            return started;
        auto moved = transferUnguarded(from, to, amount);
        if (!moved.is_ok())
            return moved;
        return tx ? tx->commit() : dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> SqliteHost::transferUnguarded(const Pubkey &from, const Pubkey &to, dp::u64 amount) {
        if (from == to) {
            return dp::Result<void, dp::Error>::err(
                dp::Error::invalid_argument("Source and destination are the same account"));
        }

        auto from_balance = balance(from);
        if (!from_balance.is_ok()) {
            return dp::Result<void, dp::Error>::err(from_balance.error());
        }
        if (from_balance.value() < amount) {
            return dp::Result<void, dp::Error>::err(insufficient_funds("Source account lacks funds for transfer"));
        }
        auto to_balance = balance(to);
        if (!to_balance.is_ok()) {
            return dp::Result<void, dp::Error>::err(to_balance.error());
        }
        if (amount > std::numeric_limits<dp::u64>::max() - to_balance.value()) {
            return dp::Result<void, dp::Error>::err(arithmetic_overflow("Transfer would overflow destination"));
        }

        auto debited = setBalance(from, from_balance.value() - amount);
        if (!debited.is_ok())
            return debited;
        return setBalance(to, to_balance.value() + amount);
    }

    dp::u64 SqliteHost::minimumBalance(dp::usize data_len) const { return rent_.minimumBalance(data_len); }

    // ===========================================
    // Records
    // ===========================================

    dp::Result<void, dp::Error> SqliteHost::allocate(const Pubkey &address, const Pubkey &payer, dp::usize space) {
        auto ready = ensureOpen();
        if (!ready.is_ok())
            return ready;

        std::unique_ptr<TxGuard> tx;
        auto started = beginIfIdle(tx);
        if (!started.is_ok())
            return started;

        auto exists = recordExists(address);
        if (!exists.is_ok()) {
            return dp::Result<void, dp::Error>::err(exists.error());
        }
        if (exists.value()) {
            return dp::Result<void, dp::Error>::err(
                account_in_use(dp::String(("Account " + address.toHex() + " already in use").c_str())));
        }

        // Top the new account up to the reserve; funds already sitting there count toward it
        dp::u64 reserve = rent_.minimumBalance(space);
        auto existing = balance(address);
        if (!existing.is_ok()) {
            return dp::Result<void, dp::Error>::err(existing.error());
        }
        if (existing.value() < reserve) {
            auto funded = transferUnguarded(payer, address, reserve - existing.value());
            if (!funded.is_ok())
                return funded;
        }

        sqlite3_stmt *stmt;
        const char *sql = "INSERT INTO records (address, payer, space, data, created_at, updated_at) "
                          "VALUES (?, ?, ?, ?, ?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(sqlError("Failed to prepare record allocation"));
        }

        auto key = address.toHex();
        auto payer_key = payer.toHex();
        std::vector<dp::u8> zeroed(space, 0);
        int64_t now = currentTimestamp();
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, payer_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(space));
        sqlite3_bind_blob(stmt, 4, zeroed.data(), static_cast<int>(zeroed.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 5, now);
        sqlite3_bind_int64(stmt, 6, now);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        if (!success) {
            return dp::Result<void, dp::Error>::err(sqlError("Failed to allocate record"));
        }
        return tx ? tx->commit() : dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::vector<dp::u8>, dp::Error> SqliteHost::loadRecord(const Pubkey &address) {
        auto ready = ensureOpen();
        if (!ready.is_ok()) {
            return dp::Result<std::vector<dp::u8>, dp::Error>::err(ready.error());
        }

        sqlite3_stmt *stmt;
        const char *sql = "SELECT data FROM records WHERE address = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<std::vector<dp::u8>, dp::Error>::err(sqlError("Failed to query record"));
        }

        auto key = address.toHex();
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            const void *blob = sqlite3_column_blob(stmt, 0);
            int size = sqlite3_column_bytes(stmt, 0);
            std::vector<dp::u8> data;
            if (blob && size > 0) {
                data.assign(static_cast<const dp::u8 *>(blob), static_cast<const dp::u8 *>(blob) + size);
            }
            sqlite3_finalize(stmt);
            return dp::Result<std::vector<dp::u8>, dp::Error>::ok(std::move(data));
        }

        if (rc != SQLITE_DONE) {
            auto error = sqlError("Failed to query record");
            sqlite3_finalize(stmt);
            return dp::Result<std::vector<dp::u8>, dp::Error>::err(error);
        }
        sqlite3_finalize(stmt);
        return dp::Result<std::vector<dp::u8>, dp::Error>::err(campaign_not_found());
    }

    dp::Result<void, dp::Error> SqliteHost::storeRecord(const Pubkey &address, const std::vector<dp::u8> &data) {
        auto ready = ensureOpen();
        if (!ready.is_ok())
            return ready;

        sqlite3_stmt *stmt;
        const char *space_sql = "SELECT space FROM records WHERE address = ?";
        if (sqlite3_prepare_v2(db_, space_sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(sqlError("Failed to query record"));
        }

        auto key = address.toHex();
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_ROW) {
            auto error = rc == SQLITE_DONE ? campaign_not_found() : sqlError("Failed to query record");
            sqlite3_finalize(stmt);
            return dp::Result<void, dp::Error>::err(error);
        }
        auto space = static_cast<dp::usize>(sqlite3_column_int64(stmt, 0));
        sqlite3_finalize(stmt);

        if (data.size() > space) {
            return dp::Result<void, dp::Error>::err(storage_failed("Record data exceeds allocated space"));
        }
        std::vector<dp::u8> padded(data);
        padded.resize(space, 0);

        const char *sql = "UPDATE records SET data = ?, updated_at = ? WHERE address = ?";
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(sqlError("Failed to prepare record update"));
        }

        sqlite3_bind_blob(stmt, 1, padded.data(), static_cast<int>(padded.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, currentTimestamp());
        sqlite3_bind_text(stmt, 3, key.c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        if (!success) {
            return dp::Result<void, dp::Error>::err(sqlError("Failed to update record"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::vector<Pubkey>, dp::Error> SqliteHost::recordAddresses() {
        auto ready = ensureOpen();
        if (!ready.is_ok()) {
            return dp::Result<std::vector<Pubkey>, dp::Error>::err(ready.error());
        }

        sqlite3_stmt *stmt;
        const char *sql = "SELECT address FROM records ORDER BY address";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<std::vector<Pubkey>, dp::Error>::err(sqlError("Failed to list records"));
        }

        std::vector<Pubkey> addresses;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            std::string hex = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
            auto parsed = Pubkey::fromHex(hex);
            if (!parsed.is_ok()) {
                sqlite3_finalize(stmt);
                return dp::Result<std::vector<Pubkey>, dp::Error>::err(
                    storage_failed(dp::String(("Corrupt record address " + hex).c_str())));
            }
            addresses.push_back(parsed.value());
        }

        if (rc != SQLITE_DONE) {
            auto error = sqlError("Failed to list records");
            sqlite3_finalize(stmt);
            return dp::Result<std::vector<Pubkey>, dp::Error>::err(error);
        }
        sqlite3_finalize(stmt);
        return dp::Result<std::vector<Pubkey>, dp::Error>::ok(std::move(addresses));
    }

    int64_t SqliteHost::getRecordCount() {
        if (!db_ || !is_open_)
            return 0;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT COUNT(*) FROM records";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        int64_t count = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int64(stmt, 0);
        }

        sqlite3_finalize(stmt);
        return count;
    }

    bool SqliteHost::quickCheck() {
        if (!db_ || !is_open_)
            return false;

        sqlite3_stmt *stmt;
        const char *sql = "PRAGMA quick_check";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        bool ok = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char *result = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
            ok = result && std::string(result) == "ok";
        }

        sqlite3_finalize(stmt);
        return ok;
    }

} // namespace crowdfund::storage
