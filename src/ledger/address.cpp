#include <crowdfund/ledger/address.hpp>
#include <cstring>
#include <keylock/keylock.hpp>

namespace crowdfund::ledger {

    dp::Result<Pubkey, dp::Error> deriveAddress(const std::vector<std::vector<dp::u8>> &seeds,
                                                const Pubkey &program_id) {
        std::vector<dp::u8> preimage;
        for (const auto &seed : seeds) {
            if (seed.size() > Pubkey::SIZE) {
                return dp::Result<Pubkey, dp::Error>::err(dp::Error::invalid_argument("Seed exceeds 32 bytes"));
            }
            preimage.insert(preimage.end(), seed.begin(), seed.end());
        }
        const auto &program_bytes = program_id.bytes();
        preimage.insert(preimage.end(), program_bytes.begin(), program_bytes.end());
        preimage.insert(preimage.end(), DERIVED_ADDRESS_MARKER,
                        DERIVED_ADDRESS_MARKER + std::strlen(DERIVED_ADDRESS_MARKER));

        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto hash_result = crypto.hash(preimage);
        if (!hash_result.success) {
            return dp::Result<Pubkey, dp::Error>::err(dp::Error::io_error("Failed to derive address"));
        }
        return Pubkey::fromBytes(hash_result.data);
    }

    dp::Result<Pubkey, dp::Error> deriveCampaignAddress(const std::string &domain_tag, const Pubkey &admin,
                                                        const Pubkey &program_id) {
        std::vector<dp::u8> tag(domain_tag.begin(), domain_tag.end());
        return deriveAddress({tag, admin.toVector()}, program_id);
    }

} // namespace crowdfund::ledger
