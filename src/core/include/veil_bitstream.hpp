#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace veil {

/// One entry per bit, each 0 or 1. Bytes are expanded MSB first.
using BitStream = std::vector<uint8_t>;

BitStream bytes_to_bits(const uint8_t* data, size_t len);
BitStream bytes_to_bits(const std::vector<uint8_t>& bytes);

/// Packs bits MSB first; a trailing partial byte is dropped.
std::vector<uint8_t> bits_to_bytes(const BitStream& bits);

} // namespace veil
