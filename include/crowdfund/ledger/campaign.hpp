#pragma once

#include <array>
#include <crowdfund/ledger/pubkey.hpp>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace crowdfund::ledger {

    /// Count Unicode code points in a UTF-8 string.
    /// Undecodable bytes count as one character each.
    dp::usize utf8Length(const std::string &text);

    /// Crowdfunding campaign record
    struct Campaign {
        static constexpr dp::usize MAX_NAME_CHARS = 50;
        static constexpr dp::usize MAX_DESCRIPTION_CHARS = 100;

        // Worst case UTF-8 width per character
        static constexpr dp::usize MAX_CHAR_BYTES = 4;

        static constexpr dp::usize DISCRIMINATOR_SIZE = 8;

        /// Fixed account size reserved for one campaign
        static constexpr dp::usize SPACE = DISCRIMINATOR_SIZE + Pubkey::SIZE + 4 + MAX_NAME_CHARS * MAX_CHAR_BYTES +
                                           4 + MAX_DESCRIPTION_CHARS * MAX_CHAR_BYTES + 8;

        Pubkey admin{};
        std::string name;
        std::string description;
        dp::u64 amount_donated{0};

        Campaign() = default;
        Campaign(const Pubkey &admin_key, std::string campaign_name, std::string campaign_description)
            : admin(admin_key), name(std::move(campaign_name)), description(std::move(campaign_description)),
              amount_donated(0) {}

        /// First 8 bytes of SHA-256("account:Campaign")
        static const std::array<dp::u8, DISCRIMINATOR_SIZE> &discriminator();

        /// Encode into the account layout, zero padded to SPACE
        dp::Result<std::vector<dp::u8>, dp::Error> encode() const;

        /// Decode from account data
        static dp::Result<Campaign, dp::Error> decode(const std::vector<dp::u8> &data);

        inline bool operator==(const Campaign &other) const {
            return admin == other.admin && name == other.name && description == other.description &&
                   amount_donated == other.amount_donated;
        }
    };

} // namespace crowdfund::ledger
