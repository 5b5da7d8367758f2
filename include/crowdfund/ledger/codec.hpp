#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace crowdfund::ledger {

    // Little-endian binary writer/reader for fixed account layouts
    class BinaryCodec {
      public:
        // Write operations
        static void writeUint32(std::vector<uint8_t> &buffer, uint32_t value) {
            buffer.push_back(static_cast<uint8_t>(value & 0xFF));
            buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
            buffer.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
            buffer.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
        }

        static void writeUint64(std::vector<uint8_t> &buffer, uint64_t value) {
            for (int shift = 0; shift < 64; shift += 8) {
                buffer.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }

        static void writeString(std::vector<uint8_t> &buffer, const std::string &str) {
            writeUint32(buffer, static_cast<uint32_t>(str.length()));
            buffer.insert(buffer.end(), str.begin(), str.end());
        }

        // Raw bytes without a length prefix
        static void writeFixed(std::vector<uint8_t> &buffer, const uint8_t *data, size_t size) {
            buffer.insert(buffer.end(), data, data + size);
        }

        // Read operations
        static uint32_t readUint32(const std::vector<uint8_t> &buffer, size_t &offset) {
            if (offset + 4 > buffer.size()) {
                throw std::runtime_error("Buffer underflow reading uint32");
            }
            uint32_t value = static_cast<uint32_t>(buffer[offset]) | (static_cast<uint32_t>(buffer[offset + 1]) << 8) |
                             (static_cast<uint32_t>(buffer[offset + 2]) << 16) |
                             (static_cast<uint32_t>(buffer[offset + 3]) << 24);
            offset += 4;
            return value;
        }

        static uint64_t readUint64(const std::vector<uint8_t> &buffer, size_t &offset) {
            if (offset + 8 > buffer.size()) {
                throw std::runtime_error("Buffer underflow reading uint64");
            }
            uint64_t value = 0;
            for (int i = 7; i >= 0; --i) {
                value = (value << 8) | static_cast<uint64_t>(buffer[offset + i]);
            }
            offset += 8;
            return value;
        }

        static std::string readString(const std::vector<uint8_t> &buffer, size_t &offset) {
            uint32_t length = readUint32(buffer, offset);
            if (offset + length > buffer.size()) {
                throw std::runtime_error("Buffer underflow reading string");
            }
            std::string result(buffer.begin() + offset, buffer.begin() + offset + length);
            offset += length;
            return result;
        }

        static std::vector<uint8_t> readFixed(const std::vector<uint8_t> &buffer, size_t &offset, size_t size) {
            if (offset + size > buffer.size()) {
                throw std::runtime_error("Buffer underflow reading fixed bytes");
            }
            std::vector<uint8_t> result(buffer.begin() + offset, buffer.begin() + offset + size);
            offset += size;
            return result;
        }
    };

} // namespace crowdfund::ledger
