#pragma once

#include <crowdfund/ledger/pubkey.hpp>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace crowdfund::ledger {

    /// Domain tag separating campaign addresses from other derived accounts
    inline constexpr const char *CAMPAIGN_DOMAIN_TAG = "CAMPAIGN_DEMO";

    /// Marker appended to every derivation so derived addresses never collide with plain key hashes
    inline constexpr const char *DERIVED_ADDRESS_MARKER = "ProgramDerivedAddress";

    /// Derive an address from seeds and the owning program id:
    /// SHA-256(seed_0 || ... || seed_n || program_id || marker)
    dp::Result<Pubkey, dp::Error> deriveAddress(const std::vector<std::vector<dp::u8>> &seeds,
                                                const Pubkey &program_id);

    /// Address of the campaign owned by `admin`
    dp::Result<Pubkey, dp::Error> deriveCampaignAddress(const std::string &domain_tag, const Pubkey &admin,
                                                        const Pubkey &program_id);

} // namespace crowdfund::ledger
