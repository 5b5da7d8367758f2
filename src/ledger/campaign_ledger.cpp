#include <crowdfund/common/error.hpp>
#include <crowdfund/ledger/campaign_ledger.hpp>
#include <iostream>
#include <limits>

namespace crowdfund::ledger {

    CampaignLedger::CampaignLedger(Host &host, LedgerOptions options) : host_(host), options_(std::move(options)) {}

    dp::Result<Campaign, dp::Error> CampaignLedger::create(const Pubkey &admin, const std::string &name,
                                                           const std::string &description) {
        if (utf8Length(name) > Campaign::MAX_NAME_CHARS) {
            return dp::Result<Campaign, dp::Error>::err(name_too_long());
        }
        if (utf8Length(description) > Campaign::MAX_DESCRIPTION_CHARS) {
            return dp::Result<Campaign, dp::Error>::err(description_too_long());
        }

        auto address_result = campaignAddress(admin);
        if (!address_result.is_ok()) {
            return dp::Result<Campaign, dp::Error>::err(address_result.error());
        }
        auto address = address_result.value();

        Campaign campaign(admin, name, description);

        auto scope = host_.begin();
        if (!scope) {
            return dp::Result<Campaign, dp::Error>::err(scopeUnavailable());
        }
        auto alloc = host_.allocate(address, admin, Campaign::SPACE);
        if (!alloc.is_ok()) {
            log("Campaign creation by " + admin.shortHex() + " rejected: " + std::string(alloc.error().message.c_str()));
            return dp::Result<Campaign, dp::Error>::err(alloc.error());
        }
        auto saved = save(address, campaign);
        if (!saved.is_ok()) {
            return dp::Result<Campaign, dp::Error>::err(saved.error());
        }
        auto committed = scope->commit();
        if (!committed.is_ok()) {
            return dp::Result<Campaign, dp::Error>::err(committed.error());
        }

        log("Campaign " + address.shortHex() + " created by " + admin.shortHex() + ": " + name);
        return dp::Result<Campaign, dp::Error>::ok(std::move(campaign));
    }

    dp::Result<void, dp::Error> CampaignLedger::donate(const Pubkey &caller, const Pubkey &campaign_address,
                                                       dp::u64 amount) {
        auto scope = host_.begin();
        if (!scope) {
            return dp::Result<void, dp::Error>::err(scopeUnavailable());
        }

        auto loaded = getCampaign(campaign_address);
        if (!loaded.is_ok()) {
            return dp::Result<void, dp::Error>::err(loaded.error());
        }
        auto campaign = loaded.value();

        if (amount > std::numeric_limits<dp::u64>::max() - campaign.amount_donated) {
            log("Donation of " + std::to_string(amount) + " to " + campaign_address.shortHex() +
                " rejected: accumulator overflow");
            return dp::Result<void, dp::Error>::err(arithmetic_overflow("Donation accumulator would overflow"));
        }

        auto moved = host_.transfer(caller, campaign_address, amount);
        if (!moved.is_ok()) {
            log("Donation of " + std::to_string(amount) + " from " + caller.shortHex() +
                " failed: " + std::string(moved.error().message.c_str()));
            return dp::Result<void, dp::Error>::err(moved.error());
        }
        campaign.amount_donated += amount;
        auto saved = save(campaign_address, campaign);
        if (!saved.is_ok()) {
            return dp::Result<void, dp::Error>::err(saved.error());
        }
        auto committed = scope->commit();
        if (!committed.is_ok()) {
            return dp::Result<void, dp::Error>::err(committed.error());
        }

        log("Donation of " + std::to_string(amount) + " from " + caller.shortHex() + " to " +
            campaign_address.shortHex() + " (total " + std::to_string(campaign.amount_donated) + ")");
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> CampaignLedger::withdraw(const Pubkey &caller, const Pubkey &campaign_address,
                                                         dp::u64 amount) {
        auto scope = host_.begin();
        if (!scope) {
            return dp::Result<void, dp::Error>::err(scopeUnavailable());
        }

        auto loaded = getCampaign(campaign_address);
        if (!loaded.is_ok()) {
            return dp::Result<void, dp::Error>::err(loaded.error());
        }
        auto campaign = loaded.value();

        if (caller != campaign.admin) {
            log("Unauthorized withdrawal attempt by " + caller.shortHex() + " on " + campaign_address.shortHex());
            return dp::Result<void, dp::Error>::err(unauthorized());
        }

        // Also the underflow guard for the accumulator subtraction below
        if (amount > campaign.amount_donated) {
            log("Withdrawal of " + std::to_string(amount) + " exceeds donated funds of " +
                campaign_address.shortHex());
            return dp::Result<void, dp::Error>::err(insufficient_donated_funds());
        }

        auto held = host_.balance(campaign_address);
        if (!held.is_ok()) {
            return dp::Result<void, dp::Error>::err(held.error());
        }
        dp::u64 reserve = host_.minimumBalance(Campaign::SPACE);
        if (amount > held.value() || held.value() - amount < reserve) {
            log("Withdrawal of " + std::to_string(amount) + " would drop " + campaign_address.shortHex() +
                " below its reserve of " + std::to_string(reserve));
            return dp::Result<void, dp::Error>::err(
                insufficient_funds("Withdrawal would leave the campaign below its minimum reserve"));
        }

        auto moved = host_.transfer(campaign_address, caller, amount);
        if (!moved.is_ok()) {
            return dp::Result<void, dp::Error>::err(moved.error());
        }
        campaign.amount_donated -= amount;
        auto saved = save(campaign_address, campaign);
        if (!saved.is_ok()) {
            return dp::Result<void, dp::Error>::err(saved.error());
        }
        auto committed = scope->commit();
        if (!committed.is_ok()) {
            return dp::Result<void, dp::Error>::err(committed.error());
        }

        log("Withdrawal of " + std::to_string(amount) + " from " + campaign_address.shortHex() + " by admin " +
            caller.shortHex() + " (remaining " + std::to_string(campaign.amount_donated) + ")");
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> CampaignLedger::execute(const Pubkey &caller,
                                                        const std::vector<dp::u8> &instruction_data) {
        auto decoded = Instruction::fromBytes(instruction_data);
        if (!decoded.is_ok()) {
            return dp::Result<void, dp::Error>::err(decoded.error());
        }
        return execute(caller, decoded.value());
    }

    dp::Result<void, dp::Error> CampaignLedger::execute(const Pubkey &caller, const Instruction &instruction) {
        auto target = instruction.getCampaign();
        if (!target.is_ok()) {
            return dp::Result<void, dp::Error>::err(invalid_instruction("Malformed campaign address"));
        }

        switch (instruction.getKind()) {
        case InstructionKind::Create: {
            auto expected = campaignAddress(caller);
            if (!expected.is_ok()) {
                return dp::Result<void, dp::Error>::err(expected.error());
            }
            if (expected.value() != target.value()) {
                return dp::Result<void, dp::Error>::err(
                    invalid_instruction("Campaign address does not match the caller's derived address"));
            }
            auto created = create(caller, instruction.getName(), instruction.getDescription());
            if (!created.is_ok()) {
                return dp::Result<void, dp::Error>::err(created.error());
            }
            return dp::Result<void, dp::Error>::ok();
        }
        case InstructionKind::Donate:
            return donate(caller, target.value(), instruction.amount);
        case InstructionKind::Withdraw:
            return withdraw(caller, target.value(), instruction.amount);
        default:
            return dp::Result<void, dp::Error>::err(
                invalid_instruction(dp::String(("Unknown instruction kind " + std::to_string(instruction.kind)).c_str())));
        }
    }

    dp::Result<Pubkey, dp::Error> CampaignLedger::campaignAddress(const Pubkey &admin) const {
        return deriveCampaignAddress(options_.domain_tag, admin, options_.program_id);
    }

    dp::Result<Campaign, dp::Error> CampaignLedger::getCampaign(const Pubkey &campaign_address) {
        auto data = host_.loadRecord(campaign_address);
        if (!data.is_ok()) {
            return dp::Result<Campaign, dp::Error>::err(data.error());
        }
        return Campaign::decode(data.value());
    }

    dp::Result<CampaignView, dp::Error> CampaignLedger::getCampaignView(const Pubkey &campaign_address) {
        auto campaign = getCampaign(campaign_address);
        if (!campaign.is_ok()) {
            return dp::Result<CampaignView, dp::Error>::err(campaign.error());
        }
        auto held = host_.balance(campaign_address);
        if (!held.is_ok()) {
            return dp::Result<CampaignView, dp::Error>::err(held.error());
        }

        CampaignView view;
        view.address = campaign_address;
        view.campaign = campaign.value();
        view.held_balance = held.value();
        view.minimum_reserve = host_.minimumBalance(Campaign::SPACE);
        return dp::Result<CampaignView, dp::Error>::ok(std::move(view));
    }

    dp::Result<std::vector<CampaignView>, dp::Error> CampaignLedger::listCampaigns() {
        auto addresses = host_.recordAddresses();
        if (!addresses.is_ok()) {
            return dp::Result<std::vector<CampaignView>, dp::Error>::err(addresses.error());
        }

        std::vector<CampaignView> views;
        for (const auto &address : addresses.value()) {
            auto view = getCampaignView(address);
            if (!view.is_ok()) {
                // Records of other layouts share the host
                if (hasCode(view.error(), ERR_DESERIALIZATION_FAILED))
                    continue;
                return dp::Result<std::vector<CampaignView>, dp::Error>::err(view.error());
            }
            views.push_back(view.value());
        }
        return dp::Result<std::vector<CampaignView>, dp::Error>::ok(std::move(views));
    }

    dp::Result<void, dp::Error> CampaignLedger::save(const Pubkey &campaign_address, const Campaign &campaign) {
        auto encoded = campaign.encode();
        if (!encoded.is_ok()) {
            return dp::Result<void, dp::Error>::err(encoded.error());
        }
        return host_.storeRecord(campaign_address, encoded.value());
    }

    dp::Error CampaignLedger::scopeUnavailable() const {
        return storage_failed("Host could not open an atomic scope");
    }

    void CampaignLedger::log(const std::string &message) const {
        if (options_.log_actions) {
            std::cout << message << std::endl;
        }
    }

} // namespace crowdfund::ledger
