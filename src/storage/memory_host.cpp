#include <crowdfund/common/error.hpp>
#include <crowdfund/storage/memory_host.hpp>
#include <algorithm>
#include <cstddef>
#include <limits>
#include <mutex>

namespace crowdfund::storage {

    class MemoryHost::Scope : public ledger::AtomicScope {
      public:
        Scope(MemoryHost &host, std::unique_lock<std::recursive_mutex> lock)
            : host_(host), lock_(std::move(lock)), snapshot_(host.state_), committed_(false) {
            host_.in_scope_ = true;
        }

        ~Scope() override {
            if (!committed_) {
                host_.state_ = std::move(snapshot_);
            }
            host_.in_scope_ = false;
        }

        Scope(const Scope &) = delete;
        Scope &operator=(const Scope &) = delete;

        dp::Result<void, dp::Error> commit() override {
            committed_ = true;
            return dp::Result<void, dp::Error>::ok();
        }

      private:
        MemoryHost &host_;
        std::unique_lock<std::recursive_mutex> lock_;
        State snapshot_;
        bool committed_;
    };

    MemoryHost::MemoryHost(ledger::Rent rent) : rent_(rent) {}

    dp::Result<void, dp::Error> MemoryHost::airdrop(const Pubkey &account, dp::u64 amount) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto &balance = state_.balances[account];
        if (amount > std::numeric_limits<dp::u64>::max() - balance) {
            return dp::Result<void, dp::Error>::err(arithmetic_overflow("Airdrop would overflow balance"));
        }
        balance += amount;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::usize MemoryHost::recordCount() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return state_.records.size();
    }

    dp::Result<dp::u64, dp::Error> MemoryHost::balance(const Pubkey &account) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = state_.balances.find(account);
        return dp::Result<dp::u64, dp::Error>::ok(it != state_.balances.end() ? it->second : 0);
    }

    dp::Result<void, dp::Error> MemoryHost::transfer(const Pubkey &from, const Pubkey &to, dp::u64 amount) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return transferLocked(from, to, amount);
    }

    dp::Result<void, dp::Error> MemoryHost::transferLocked(const Pubkey &from, const Pubkey &to, dp::u64 amount) {
        if (from == to) {
            return dp::Result<void, dp::Error>::err(
                dp::Error::invalid_argument("Source and destination are the same account"));
        }
        auto from_it = state_.balances.find(from);
        dp::u64 from_balance = from_it != state_.balances.end() ? from_it->second : 0;
        if (from_balance < amount) {
            return dp::Result<void, dp::Error>::err(insufficient_funds("Source account lacks funds for transfer"));
        }
        dp::u64 to_balance = 0;
        auto to_it = state_.balances.find(to);
        if (to_it != state_.balances.end())
            to_balance = to_it->second;
        if (amount > std::numeric_limits<dp::u64>::max() - to_balance) {
            return dp::Result<void, dp::Error>::err(arithmetic_overflow("Transfer would overflow destination"));
        }

        state_.balances[from] = from_balance - amount;
        state_.balances[to] = to_balance + amount;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::u64 MemoryHost::minimumBalance(dp::usize data_len) const { return rent_.minimumBalance(data_len); }

    dp::Result<void, dp::Error> MemoryHost::allocate(const Pubkey &address, const Pubkey &payer, dp::usize space) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (state_.records.find(address) != state_.records.end()) {
            return dp::Result<void, dp::Error>::err(
                account_in_use(dp::String(("Account " + address.toHex() + " already in use").c_str())));
        }

        // Top the new account up to the reserve; funds already sitting there count toward it
        dp::u64 reserve = rent_.minimumBalance(space);
        auto it = state_.balances.find(address);
        dp::u64 existing = it != state_.balances.end() ? it->second : 0;
        if (existing < reserve) {
            auto funded = transferLocked(payer, address, reserve - existing);
            if (!funded.is_ok()) {
                return funded;
            }
        }

        state_.records[address] = std::vector<dp::u8>(space, 0);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::vector<dp::u8>, dp::Error> MemoryHost::loadRecord(const Pubkey &address) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = state_.records.find(address);
        if (it == state_.records.end()) {
            return dp::Result<std::vector<dp::u8>, dp::Error>::err(campaign_not_found());
        }
        return dp::Result<std::vector<dp::u8>, dp::Error>::ok(it->second);
    }

    dp::Result<void, dp::Error> MemoryHost::storeRecord(const Pubkey &address, const std::vector<dp::u8> &data) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = state_.records.find(address);
        if (it == state_.records.end()) {
            return dp::Result<void, dp::Error>::err(campaign_not_found());
        }
        if (data.size() > it->second.size()) {
            return dp::Result<void, dp::Error>::err(storage_failed("Record data exceeds allocated space"));
        }
        std::copy(data.begin(), data.end(), it->second.begin());
        std::fill(it->second.begin() + static_cast<std::ptrdiff_t>(data.size()), it->second.end(), 0);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::vector<Pubkey>, dp::Error> MemoryHost::recordAddresses() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        std::vector<Pubkey> addresses;
        addresses.reserve(state_.records.size());
        for (const auto &[address, data] : state_.records) {
            addresses.push_back(address);
        }
        return dp::Result<std::vector<Pubkey>, dp::Error>::ok(std::move(addresses));
    }

    std::unique_ptr<ledger::AtomicScope> MemoryHost::begin() {
        std::unique_lock<std::recursive_mutex> lock(mutex_);
        if (in_scope_) {
            return nullptr;
        }
        return std::make_unique<Scope>(*this, std::move(lock));
    }

} // namespace crowdfund::storage
