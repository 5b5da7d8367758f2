#pragma once

#include <crowdfund/common/error.hpp>
#include <crowdfund/ledger/pubkey.hpp>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace crowdfund::ledger {

    /// Entry points of the campaign program
    enum class InstructionKind : dp::u8 {
        Create = 0,
        Donate = 1,
        Withdraw = 2,
    };

    /// Get string name for instruction kind
    inline std::string instructionKindToString(InstructionKind kind) {
        switch (kind) {
        case InstructionKind::Create:
            return "create";
        case InstructionKind::Donate:
            return "donate";
        case InstructionKind::Withdraw:
            return "withdraw";
        default:
            return "unknown";
        }
    }

    /// Serialized invocation bound to a target campaign address
    struct Instruction {
        dp::u8 kind{0};         // InstructionKind
        dp::String campaign;    // Target address, hex
        dp::String name;        // Create only
        dp::String description; // Create only
        dp::u64 amount{0};      // Donate / Withdraw

        Instruction() = default;

        inline static Instruction create(const Pubkey &campaign_address, const std::string &campaign_name,
                                         const std::string &campaign_description) {
            Instruction ix;
            ix.kind = static_cast<dp::u8>(InstructionKind::Create);
            ix.campaign = dp::String(campaign_address.toHex().c_str());
            ix.name = dp::String(campaign_name.c_str());
            ix.description = dp::String(campaign_description.c_str());
            return ix;
        }

        inline static Instruction donate(const Pubkey &campaign_address, dp::u64 lamports) {
            Instruction ix;
            ix.kind = static_cast<dp::u8>(InstructionKind::Donate);
            ix.campaign = dp::String(campaign_address.toHex().c_str());
            ix.amount = lamports;
            return ix;
        }

        inline static Instruction withdraw(const Pubkey &campaign_address, dp::u64 lamports) {
            Instruction ix;
            ix.kind = static_cast<dp::u8>(InstructionKind::Withdraw);
            ix.campaign = dp::String(campaign_address.toHex().c_str());
            ix.amount = lamports;
            return ix;
        }

        inline InstructionKind getKind() const { return static_cast<InstructionKind>(kind); }

        inline std::string getName() const { return std::string(name.c_str()); }

        inline std::string getDescription() const { return std::string(description.c_str()); }

        inline dp::Result<Pubkey, dp::Error> getCampaign() const {
            return Pubkey::fromHex(std::string(campaign.c_str()));
        }

        /// Serialize to bytes
        inline std::vector<dp::u8> toBytes() const {
            auto &self = const_cast<Instruction &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<dp::u8>(buf.begin(), buf.end());
        }

        /// Deserialize from bytes
        inline static dp::Result<Instruction, dp::Error> fromBytes(const std::vector<dp::u8> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, Instruction>(buf);
                return dp::Result<Instruction, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<Instruction, dp::Error>::err(deserialization_failed(dp::String(e.what())));
            }
        }

        /// Serialization
        auto members() { return std::tie(kind, campaign, name, description, amount); }
        auto members() const { return std::tie(kind, campaign, name, description, amount); }
    };

} // namespace crowdfund::ledger
