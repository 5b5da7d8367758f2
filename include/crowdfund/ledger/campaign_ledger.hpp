#pragma once

#include <crowdfund/ledger/address.hpp>
#include <crowdfund/ledger/campaign.hpp>
#include <crowdfund/ledger/host.hpp>
#include <crowdfund/ledger/instruction.hpp>
#include <crowdfund/ledger/pubkey.hpp>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace crowdfund::ledger {

    /// Deployment configuration
    struct LedgerOptions {
        std::string domain_tag = CAMPAIGN_DOMAIN_TAG;
        Pubkey program_id{};
        bool log_actions = true;

        LedgerOptions() = default;
    };

    /// Campaign record together with its on-ledger balances
    struct CampaignView {
        Pubkey address;
        Campaign campaign;
        dp::u64 held_balance{0};
        dp::u64 minimum_reserve{0};

        /// Amount the admin could withdraw right now
        inline dp::u64 withdrawable() const {
            dp::u64 spare = held_balance > minimum_reserve ? held_balance - minimum_reserve : 0;
            return campaign.amount_donated < spare ? campaign.amount_donated : spare;
        }
    };

    /// Campaign state transitions over a host environment.
    /// Every mutating operation validates first, then applies its effects in one host AtomicScope.
    class CampaignLedger {
      public:
        explicit CampaignLedger(Host &host, LedgerOptions options = LedgerOptions{});

        CampaignLedger(const CampaignLedger &) = delete;
        CampaignLedger &operator=(const CampaignLedger &) = delete;

        /// Create the campaign owned by `admin` at its derived address.
        /// Fails with NameTooLong, then DescriptionTooLong; allocation errors come from the host.
        dp::Result<Campaign, dp::Error> create(const Pubkey &admin, const std::string &name,
                                               const std::string &description);

        /// Move `amount` from `caller` into the campaign and credit the donation accumulator.
        /// The campaign is read and updated inside one host scope.
        dp::Result<void, dp::Error> donate(const Pubkey &caller, const Pubkey &campaign_address, dp::u64 amount);

        /// Admin-only: move `amount` of donated funds from the campaign to `caller`.
        /// Checks, in order: Unauthorized, InsufficientDonatedFunds, InsufficientFunds (reserve floor).
        dp::Result<void, dp::Error> withdraw(const Pubkey &caller, const Pubkey &campaign_address, dp::u64 amount);

        /// Decode and dispatch a serialized instruction
        dp::Result<void, dp::Error> execute(const Pubkey &caller, const std::vector<dp::u8> &instruction_data);

        /// Dispatch an instruction
        dp::Result<void, dp::Error> execute(const Pubkey &caller, const Instruction &instruction);

        // === Queries ===

        dp::Result<Pubkey, dp::Error> campaignAddress(const Pubkey &admin) const;

        dp::Result<Campaign, dp::Error> getCampaign(const Pubkey &campaign_address);

        dp::Result<CampaignView, dp::Error> getCampaignView(const Pubkey &campaign_address);

        /// All campaigns known to the host, ordered by address
        dp::Result<std::vector<CampaignView>, dp::Error> listCampaigns();

        inline const LedgerOptions &options() const { return options_; }

      private:
        Host &host_;
        LedgerOptions options_;

        dp::Result<void, dp::Error> save(const Pubkey &campaign_address, const Campaign &campaign);
        dp::Error scopeUnavailable() const;

        void log(const std::string &message) const;
    };

} // namespace crowdfund::ledger
