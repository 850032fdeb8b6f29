// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include <cstdint>       // uint64_t
#include <random>        // std::random_device, std::mt19937_64
#include <string>
#include <string_view>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace aforge
{
    class Guid
    {
    public:
        using underlying_type = uint64_t;

        Guid() : value(invalid().value) {}
        explicit Guid(underlying_type val) : value(val) {}

        static Guid generate()
        {
            static thread_local std::mt19937_64 rng(std::random_device{}());
            underlying_type v = 0;
            while (v == 0) v = rng();
            return Guid(v);
        }

        /// @brief Stable GUID derived from a name (FNV-1a, 64 bit).
        /// Reimporting the same source yields the same GUID.
        static Guid from_name(std::string_view name)
        {
            underlying_type h = 0xcbf29ce484222325ull;
            for (unsigned char c : name)
            {
                h ^= c;
                h *= 0x100000001b3ull;
            }
            return Guid(h == 0 ? 1 : h);
        }

        static Guid from_string(const std::string& str)
        {
            std::istringstream iss(str);
            uint64_t high = 0;
            uint64_t mid = 0;
            uint64_t low = 0;

            char dash1 = 0, dash2 = 0;
            iss >> std::hex >> high >> dash1 >> mid >> dash2 >> low;
            if (iss.fail() || dash1 != '-' || dash2 != '-' || high > 0xFFFFFFFFull || mid > 0xFFFF || low > 0xFFFF)
            {
                throw std::invalid_argument("Invalid GUID string format: " + str);
            }

            return Guid((high << 32) | (mid << 16) | low);
        }

        static Guid invalid() { return Guid(0); }

        bool valid() const { return value != 0; }

        bool operator==(const Guid& other) const { return value == other.value; }
        bool operator!=(const Guid& other) const { return value != other.value; }
        bool operator<(const Guid& other) const { return value < other.value; }

        underlying_type raw() const { return value; }

        std::string to_string() const
        {
            std::ostringstream oss;
            oss << std::hex << std::setfill('0')
                << std::setw(8) << ((value >> 32) & 0xFFFFFFFF) << '-'
                << std::setw(4) << ((value >> 16) & 0xFFFF) << '-'
                << std::setw(4) << (value & 0xFFFF);
            return oss.str();
        }

    private:
        underlying_type value;
    };
}

namespace std {
    template<>
    struct hash<aforge::Guid>
    {
        size_t operator()(const aforge::Guid& guid) const noexcept
        {
            return std::hash<uint64_t>()(guid.raw());
        }
    };
}
