/// @file id.cpp
/// @brief Random identifier generation

#include <sker/core/id.hpp>
#include <array>
#include <random>

namespace sker_core {

namespace {

std::mt19937_64& thread_rng() {
    thread_local std::mt19937_64 rng{[] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }()};
    return rng;
}

} // anonymous namespace

std::string generate_uuid() {
    static constexpr char HEX[] = "0123456789abcdef";

    std::array<std::uint8_t, 16> bytes{};
    auto& rng = thread_rng();
    for (std::size_t i = 0; i < bytes.size(); i += 8) {
        std::uint64_t chunk = rng();
        for (std::size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<std::uint8_t>(chunk >> (j * 8));
        }
    }

    // Version 4, variant 10xx
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(HEX[bytes[i] >> 4]);
        out.push_back(HEX[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace sker_core
