#pragma once

#include <array>
#include <cstring>
#include <datapod/datapod.hpp>
#include <functional>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

namespace crowdfund {

    /// 32-byte account identity (Ed25519 public key or derived address)
    class Pubkey {
      public:
        static constexpr dp::usize SIZE = 32;

        Pubkey() : bytes_{} {}
        explicit Pubkey(const std::array<dp::u8, SIZE> &bytes) : bytes_(bytes) {}

        /// Build from raw bytes, must be exactly 32 long
        inline static dp::Result<Pubkey, dp::Error> fromBytes(const std::vector<dp::u8> &bytes) {
            if (bytes.size() != SIZE) {
                return dp::Result<Pubkey, dp::Error>::err(dp::Error::invalid_argument("Pubkey must be 32 bytes"));
            }
            Pubkey key;
            std::memcpy(key.bytes_.data(), bytes.data(), SIZE);
            return dp::Result<Pubkey, dp::Error>::ok(key);
        }

        /// Parse from 64-character hex string
        inline static dp::Result<Pubkey, dp::Error> fromHex(const std::string &hex) {
            if (hex.size() != SIZE * 2) {
                return dp::Result<Pubkey, dp::Error>::err(
                    dp::Error::invalid_argument("Pubkey hex must be 64 characters"));
            }
            for (char c : hex) {
                bool digit = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
                if (!digit) {
                    return dp::Result<Pubkey, dp::Error>::err(
                        dp::Error::invalid_argument("Pubkey hex contains invalid characters"));
                }
            }
            return fromBytes(keylock::keylock::from_hex(hex));
        }

        /// Generate a fresh Ed25519 keypair and take its public half
        inline static dp::Result<Pubkey, dp::Error> generate() {
            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto keypair = crypto.generate_keypair();
            if (keypair.public_key.size() != SIZE) {
                return dp::Result<Pubkey, dp::Error>::err(dp::Error::io_error("Failed to generate keypair"));
            }
            return fromBytes(keypair.public_key);
        }

        /// Deterministic identity from a label (SHA-256 of the label), for tooling and tests
        inline static dp::Result<Pubkey, dp::Error> fromSeed(const std::string &label) {
            keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
            std::vector<dp::u8> data(label.begin(), label.end());
            auto hash_result = crypto.hash(data);
            if (!hash_result.success) {
                return dp::Result<Pubkey, dp::Error>::err(dp::Error::io_error("Failed to hash seed"));
            }
            return fromBytes(hash_result.data);
        }

        inline const std::array<dp::u8, SIZE> &bytes() const { return bytes_; }

        inline std::vector<dp::u8> toVector() const { return std::vector<dp::u8>(bytes_.begin(), bytes_.end()); }

        inline std::string toHex() const { return keylock::keylock::to_hex(toVector()); }

        /// Shortened hex for log lines
        inline std::string shortHex() const { return toHex().substr(0, 8); }

        inline bool isZero() const {
            for (auto b : bytes_) {
                if (b != 0)
                    return false;
            }
            return true;
        }

        inline bool operator==(const Pubkey &other) const { return bytes_ == other.bytes_; }
        inline bool operator!=(const Pubkey &other) const { return bytes_ != other.bytes_; }
        inline bool operator<(const Pubkey &other) const { return bytes_ < other.bytes_; }

      private:
        std::array<dp::u8, SIZE> bytes_;
    };

} // namespace crowdfund

namespace std {
    template <> struct hash<crowdfund::Pubkey> {
        size_t operator()(const crowdfund::Pubkey &key) const noexcept {
            size_t h = 0;
            std::memcpy(&h, key.bytes().data(), sizeof(size_t));
            return h;
        }
    };
} // namespace std
