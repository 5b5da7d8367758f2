#pragma once

#include <crowdfund/ledger/host.hpp>
#include <crowdfund/ledger/rent.hpp>
#include <datapod/datapod.hpp>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace crowdfund::storage {

    /// In-process host: balances and records kept in memory.
    /// An atomic scope holds the host lock for its whole lifetime, so other threads wait until it
    /// commits or rolls back; it snapshots the state and restores it on rollback.
    /// Only one scope may be open at a time.
    class MemoryHost : public ledger::Host {
      public:
        explicit MemoryHost(ledger::Rent rent = ledger::Rent{});

        MemoryHost(const MemoryHost &) = delete;
        MemoryHost &operator=(const MemoryHost &) = delete;

        /// Credit new funds to an account (faucet)
        dp::Result<void, dp::Error> airdrop(const Pubkey &account, dp::u64 amount);

        /// Number of allocated records
        dp::usize recordCount() const;

        // === Host ===

        dp::Result<dp::u64, dp::Error> balance(const Pubkey &account) override;
        dp::Result<void, dp::Error> transfer(const Pubkey &from, const Pubkey &to, dp::u64 amount) override;
        dp::u64 minimumBalance(dp::usize data_len) const override;
        dp::Result<void, dp::Error> allocate(const Pubkey &address, const Pubkey &payer, dp::usize space) override;
        dp::Result<std::vector<dp::u8>, dp::Error> loadRecord(const Pubkey &address) override;
        dp::Result<void, dp::Error> storeRecord(const Pubkey &address, const std::vector<dp::u8> &data) override;
        dp::Result<std::vector<Pubkey>, dp::Error> recordAddresses() override;
        std::unique_ptr<ledger::AtomicScope> begin() override;

      private:
        class Scope;

        struct State {
            std::unordered_map<Pubkey, dp::u64> balances;
            std::map<Pubkey, std::vector<dp::u8>> records;
        };

        ledger::Rent rent_;
        State state_;
        bool in_scope_ = false;
        // Recursive so the thread owning a scope can keep calling into the host
        mutable std::recursive_mutex mutex_;

        dp::Result<void, dp::Error> transferLocked(const Pubkey &from, const Pubkey &to, dp::u64 amount);
    };

} // namespace crowdfund::storage
