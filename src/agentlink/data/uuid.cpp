#include "agentlink/data/uuid.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <random>

namespace agentlink::data {

std::string make_uuid() {
    static std::mutex mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    std::array<uint8_t, 16> bytes{};
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (size_t i = 0; i < bytes.size(); i += 8) {
            uint64_t word = rng();
            for (size_t j = 0; j < 8; ++j) {
                bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
            }
        }
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHex[bytes[i] >> 4]);
        out.push_back(kHex[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace agentlink::data
