#pragma once

#include <cmath>
#include <datapod/datapod.hpp>
#include <limits>

namespace crowdfund::ledger {

    /// Smallest currency units per whole coin
    inline constexpr dp::u64 LAMPORTS_PER_SOL = 1'000'000'000;

    /// Minimum-reserve schedule for stored records
    struct Rent {
        /// Bytes charged on top of every record's data
        static constexpr dp::u64 ACCOUNT_STORAGE_OVERHEAD = 128;

        dp::u64 lamports_per_byte_year = 3480;
        double exemption_threshold = 2.0;

        Rent() = default;
        Rent(dp::u64 per_byte_year, double threshold)
            : lamports_per_byte_year(per_byte_year), exemption_threshold(threshold) {}

        /// Balance a record of `data_len` bytes must keep to stay valid
        inline dp::u64 minimumBalance(dp::usize data_len) const {
            double bytes = static_cast<double>(ACCOUNT_STORAGE_OVERHEAD + data_len);
            double lamports = bytes * static_cast<double>(lamports_per_byte_year) * exemption_threshold;
            if (lamports >= static_cast<double>(std::numeric_limits<dp::u64>::max())) {
                return std::numeric_limits<dp::u64>::max();
            }
            return static_cast<dp::u64>(std::floor(lamports));
        }

        /// Reserve-free schedule, for hosts that keep no storage deposit
        inline static Rent free() { return Rent(0, 0.0); }
    };

} // namespace crowdfund::ledger
