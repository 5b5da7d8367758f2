#pragma once

#include <crowdfund/ledger/pubkey.hpp>
#include <datapod/datapod.hpp>
#include <memory>
#include <vector>

namespace crowdfund::ledger {

    // ===========================================
    // Host environment interface
    // ===========================================

    /// One all-or-nothing unit of host mutations.
    /// Destroying a scope that was not committed rolls its changes back.
    class AtomicScope {
      public:
        virtual ~AtomicScope() = default;

        virtual dp::Result<void, dp::Error> commit() = 0;
    };

    /// Services the campaign core needs from the hosting ledger:
    /// balances and transfers, the minimum reserve, and record storage
    class Host {
      public:
        virtual ~Host() = default;

        /// Balance held by an account; unknown accounts hold 0
        virtual dp::Result<dp::u64, dp::Error> balance(const Pubkey &account) = 0;

        /// Atomically move `amount` from one account to another
        virtual dp::Result<void, dp::Error> transfer(const Pubkey &from, const Pubkey &to, dp::u64 amount) = 0;

        /// Minimum balance a record of `data_len` bytes must retain
        virtual dp::u64 minimumBalance(dp::usize data_len) const = 0;

        /// Create a zeroed record of `space` bytes at `address`, funded by `payer` with the minimum balance
        virtual dp::Result<void, dp::Error> allocate(const Pubkey &address, const Pubkey &payer, dp::usize space) = 0;

        /// Raw record data at `address`
        virtual dp::Result<std::vector<dp::u8>, dp::Error> loadRecord(const Pubkey &address) = 0;

        /// Overwrite an allocated record; data must fit its space
        virtual dp::Result<void, dp::Error> storeRecord(const Pubkey &address, const std::vector<dp::u8> &data) = 0;

        /// Addresses of all allocated records, ordered
        virtual dp::Result<std::vector<Pubkey>, dp::Error> recordAddresses() = 0;

        /// Open an atomic unit covering the calls that follow.
        /// The scope is exclusive: no other caller observes or mutates host state until it ends.
        /// Returns nullptr when no scope can be opened (one is already open on this host, or the
        /// backend refused); the caller must not mutate anything in that case.
        virtual std::unique_ptr<AtomicScope> begin() = 0;
    };

} // namespace crowdfund::ledger
