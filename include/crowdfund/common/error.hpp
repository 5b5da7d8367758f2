#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace crowdfund {

    // ===========================================
    // Crowdfund error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_NAME_TOO_LONG = 100;
    constexpr dp::u32 ERR_DESCRIPTION_TOO_LONG = 101;
    constexpr dp::u32 ERR_UNAUTHORIZED = 102;
    constexpr dp::u32 ERR_INSUFFICIENT_DONATED_FUNDS = 103;
    constexpr dp::u32 ERR_INSUFFICIENT_FUNDS = 104;
    constexpr dp::u32 ERR_ARITHMETIC_OVERFLOW = 105;
    constexpr dp::u32 ERR_CAMPAIGN_NOT_FOUND = 106;
    constexpr dp::u32 ERR_ACCOUNT_IN_USE = 107;
    constexpr dp::u32 ERR_SERIALIZATION_FAILED = 108;
    constexpr dp::u32 ERR_DESERIALIZATION_FAILED = 109;
    constexpr dp::u32 ERR_STORAGE_FAILED = 110;
    constexpr dp::u32 ERR_INVALID_INSTRUCTION = 111;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error name_too_long(const dp::String &msg = "The provided name is too long") {
        return dp::Error{ERR_NAME_TOO_LONG, msg};
    }

    inline dp::Error description_too_long(const dp::String &msg = "The provided description is too long") {
        return dp::Error{ERR_DESCRIPTION_TOO_LONG, msg};
    }

    inline dp::Error unauthorized(const dp::String &msg = "Caller is not the campaign admin") {
        return dp::Error{ERR_UNAUTHORIZED, msg};
    }

    inline dp::Error insufficient_donated_funds(const dp::String &msg = "Amount exceeds donated funds") {
        return dp::Error{ERR_INSUFFICIENT_DONATED_FUNDS, msg};
    }

    inline dp::Error insufficient_funds(const dp::String &msg = "Insufficient funds") {
        return dp::Error{ERR_INSUFFICIENT_FUNDS, msg};
    }

    inline dp::Error arithmetic_overflow(const dp::String &msg = "Arithmetic overflow") {
        return dp::Error{ERR_ARITHMETIC_OVERFLOW, msg};
    }

    inline dp::Error campaign_not_found(const dp::String &msg = "Campaign does not exist") {
        return dp::Error{ERR_CAMPAIGN_NOT_FOUND, msg};
    }

    inline dp::Error account_in_use(const dp::String &msg = "Account already in use") {
        return dp::Error{ERR_ACCOUNT_IN_USE, msg};
    }

    inline dp::Error serialization_failed(const dp::String &msg = "Serialization failed") {
        return dp::Error{ERR_SERIALIZATION_FAILED, msg};
    }

    inline dp::Error deserialization_failed(const dp::String &msg = "Deserialization failed") {
        return dp::Error{ERR_DESERIALIZATION_FAILED, msg};
    }

    inline dp::Error storage_failed(const dp::String &msg = "Storage operation failed") {
        return dp::Error{ERR_STORAGE_FAILED, msg};
    }

    inline dp::Error invalid_instruction(const dp::String &msg = "Invalid instruction") {
        return dp::Error{ERR_INVALID_INSTRUCTION, msg};
    }

    /// Get display name for an error code
    inline std::string errorName(dp::u32 code) {
        switch (code) {
        case ERR_NAME_TOO_LONG:
            return "NameTooLong";
        case ERR_DESCRIPTION_TOO_LONG:
            return "DescriptionTooLong";
        case ERR_UNAUTHORIZED:
            return "Unauthorized";
        case ERR_INSUFFICIENT_DONATED_FUNDS:
            return "InsufficientDonatedFunds";
        case ERR_INSUFFICIENT_FUNDS:
            return "InsufficientFunds";
        case ERR_ARITHMETIC_OVERFLOW:
            return "ArithmeticOverflow";
        case ERR_CAMPAIGN_NOT_FOUND:
            return "CampaignNotFound";
        case ERR_ACCOUNT_IN_USE:
            return "AccountInUse";
        case ERR_SERIALIZATION_FAILED:
            return "SerializationFailed";
        case ERR_DESERIALIZATION_FAILED:
            return "DeserializationFailed";
        case ERR_STORAGE_FAILED:
            return "StorageFailed";
        case ERR_INVALID_INSTRUCTION:
            return "InvalidInstruction";
        default:
            return "Unknown";
        }
    }

    /// Check whether a result error carries the given code
    inline bool hasCode(const dp::Error &error, dp::u32 code) { return error.code == code; }

} // namespace crowdfund
