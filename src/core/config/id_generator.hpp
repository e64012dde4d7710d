#pragma once
#include <cstdint>
#include <random>
#include <sstream>
#include <string>

namespace agentcli::core::config {

    // Generates an 8-character hex ID with the given prefix, e.g. "run-1f3a9c0b"
    inline std::string generate_id(const std::string& prefix) {
        std::random_device rd;
        std::mt19937 gen(rd()); // Standard mersenne_twister_engine
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Stable 32-bit string hash rendered in base 36. Synthesized tool ids are
    // built from it, so the same input must always give the same output.
    inline std::string simple_hash(const std::string& text) {
        std::int32_t hash = 0;
        for (const unsigned char c : text) {
            const auto shifted = static_cast<std::uint32_t>(hash) << 5U;
            hash = static_cast<std::int32_t>(shifted - static_cast<std::uint32_t>(hash) + c);
        }

        std::uint64_t value = hash < 0 ? static_cast<std::uint64_t>(-static_cast<std::int64_t>(hash))
                                       : static_cast<std::uint64_t>(hash);
        if (value == 0) {
            return "0";
        }

        constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        std::string out;
        while (value > 0) {
            out.insert(out.begin(), kDigits[value % 36]);
            value /= 36;
        }
        return out;
    }

} // namespace agentcli::core::config
