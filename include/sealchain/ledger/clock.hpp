#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <datapod/datapod.hpp>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace sealchain::ledger {

    using namespace std::chrono;

    struct Timestamp {
        dp::i64 sec{0};
        dp::u32 nanosec{0};

        Timestamp() = default;
        inline Timestamp(dp::i64 s, dp::u32 ns) : sec(s), nanosec(ns) {}

        inline static Timestamp now() {
            auto since_epoch = system_clock::now().time_since_epoch();
            Timestamp ts;
            ts.sec = duration_cast<seconds>(since_epoch).count();
            ts.nanosec = static_cast<dp::u32>(duration_cast<nanoseconds>(since_epoch).count() % 1000000000);
            return ts;
        }

        /// UTC, microsecond precision: 2024-05-01T12:30:45.123456
        inline std::string iso8601() const {
            std::time_t t = static_cast<std::time_t>(sec);
            std::tm parts{};
            gmtime_r(&t, &parts);
            std::ostringstream oss;
            oss << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
                << (nanosec / 1000);
            return oss.str();
        }

        inline bool operator==(const Timestamp &other) const { return sec == other.sec && nanosec == other.nanosec; }
        inline bool operator!=(const Timestamp &other) const { return !(*this == other); }
    };

    // RFC 4122 UUID v4 (random)
    inline std::string generateEntryId() {
        static thread_local std::mt19937_64 rng{std::random_device{}()};
        std::array<dp::u8, 16> bytes{};
        for (size_t i = 0; i < bytes.size(); i += 8) {
            uint64_t word = rng();
            for (size_t j = 0; j < 8; ++j)
                bytes[i + j] = static_cast<dp::u8>((word >> (8 * j)) & 0xFF);
        }
        bytes[6] = static_cast<dp::u8>((bytes[6] & 0x0F) | 0x40); // version 4
        bytes[8] = static_cast<dp::u8>((bytes[8] & 0x3F) | 0x80); // variant 1

        std::ostringstream o;
        o << std::hex << std::setfill('0');
        for (size_t i = 0; i < bytes.size(); i++) {
            o << std::setw(2) << static_cast<int>(bytes[i]);
            if (i == 3 || i == 5 || i == 7 || i == 9)
                o << "-";
        }
        return o.str();
    }

} // namespace sealchain::ledger
