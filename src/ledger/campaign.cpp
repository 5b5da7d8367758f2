#include <algorithm>
#include <crowdfund/common/error.hpp>
#include <crowdfund/ledger/campaign.hpp>
#include <crowdfund/ledger/codec.hpp>
#include <cstring>
#include <keylock/keylock.hpp>
#include <stdexcept>

namespace crowdfund::ledger {

    dp::usize utf8Length(const std::string &text) {
        dp::usize count = 0;
        size_t i = 0;
        while (i < text.size()) {
            auto lead = static_cast<unsigned char>(text[i]);
            size_t width = 1;
            if (lead >= 0xF0 && lead <= 0xF4)
                width = 4;
            else if (lead >= 0xE0 && lead <= 0xEF)
                width = 3;
            else if (lead >= 0xC2 && lead <= 0xDF)
                width = 2;

            if (width > 1) {
                if (i + width > text.size()) {
                    width = 1;
                } else {
                    for (size_t k = 1; k < width; ++k) {
                        auto cont = static_cast<unsigned char>(text[i + k]);
                        if ((cont & 0xC0) != 0x80) {
                            width = 1;
                            break;
                        }
                    }
                }
            }
            i += width;
            ++count;
        }
        return count;
    }

    const std::array<dp::u8, Campaign::DISCRIMINATOR_SIZE> &Campaign::discriminator() {
        static const std::array<dp::u8, DISCRIMINATOR_SIZE> value = [] {
            keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
            std::string preimage = "account:Campaign";
            auto hash_result = crypto.hash(std::vector<dp::u8>(preimage.begin(), preimage.end()));
            if (!hash_result.success || hash_result.data.size() < DISCRIMINATOR_SIZE) {
                throw std::runtime_error("Failed to compute account discriminator");
            }
            std::array<dp::u8, DISCRIMINATOR_SIZE> out{};
            std::memcpy(out.data(), hash_result.data.data(), DISCRIMINATOR_SIZE);
            return out;
        }();
        return value;
    }

    dp::Result<std::vector<dp::u8>, dp::Error> Campaign::encode() const {
        try {
            std::vector<dp::u8> buffer;
            buffer.reserve(SPACE);
            const auto &disc = discriminator();
            BinaryCodec::writeFixed(buffer, disc.data(), disc.size());
            BinaryCodec::writeFixed(buffer, admin.bytes().data(), Pubkey::SIZE);
            BinaryCodec::writeString(buffer, name);
            BinaryCodec::writeString(buffer, description);
            BinaryCodec::writeUint64(buffer, amount_donated);

            if (buffer.size() > SPACE) {
                return dp::Result<std::vector<dp::u8>, dp::Error>::err(
                    storage_failed("Campaign record exceeds account space"));
            }
            buffer.resize(SPACE, 0);
            return dp::Result<std::vector<dp::u8>, dp::Error>::ok(std::move(buffer));
        } catch (const std::exception &e) {
            return dp::Result<std::vector<dp::u8>, dp::Error>::err(serialization_failed(dp::String(e.what())));
        }
    }

    dp::Result<Campaign, dp::Error> Campaign::decode(const std::vector<dp::u8> &data) {
        try {
            size_t offset = 0;
            auto disc = BinaryCodec::readFixed(data, offset, DISCRIMINATOR_SIZE);
            const auto &expected = discriminator();
            if (!std::equal(disc.begin(), disc.end(), expected.begin())) {
                return dp::Result<Campaign, dp::Error>::err(
                    deserialization_failed("Account discriminator does not match Campaign"));
            }

            Campaign result;
            auto admin_bytes = BinaryCodec::readFixed(data, offset, Pubkey::SIZE);
            auto admin_result = Pubkey::fromBytes(admin_bytes);
            if (!admin_result.is_ok()) {
                return dp::Result<Campaign, dp::Error>::err(admin_result.error());
            }
            result.admin = admin_result.value();
            result.name = BinaryCodec::readString(data, offset);
            result.description = BinaryCodec::readString(data, offset);
            result.amount_donated = BinaryCodec::readUint64(data, offset);
            return dp::Result<Campaign, dp::Error>::ok(std::move(result));
        } catch (const std::exception &e) {
            return dp::Result<Campaign, dp::Error>::err(deserialization_failed(dp::String(e.what())));
        }
    }

} // namespace crowdfund::ledger
