#include "veil_bitstream.hpp"

namespace veil {

BitStream bytes_to_bits(const uint8_t* data, size_t len) {
    BitStream bits;
    bits.reserve(len * 8);
    for (size_t i = 0; i < len; ++i) {
        for (int b = 7; b >= 0; --b) {
            bits.push_back(static_cast<uint8_t>((data[i] >> b) & 1));
        }
    }
    return bits;
}

BitStream bytes_to_bits(const std::vector<uint8_t>& bytes) {
    return bytes_to_bits(bytes.data(), bytes.size());
}

std::vector<uint8_t> bits_to_bytes(const BitStream& bits) {
    std::vector<uint8_t> bytes(bits.size() / 8);
    for (size_t i = 0; i < bytes.size(); ++i) {
        uint8_t v = 0;
        for (size_t b = 0; b < 8; ++b) {
            v = static_cast<uint8_t>((v << 1) | (bits[i * 8 + b] & 1));
        }
        bytes[i] = v;
    }
    return bytes;
}

} // namespace veil
