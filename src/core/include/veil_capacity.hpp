#pragma once

#include "veil_options.hpp"

#include <cstdint>
#include <cstddef>
#include <functional>

namespace veil {

/**
 * @brief Capacity arithmetic and redundancy factor selection
 *
 * Logical capacity for factor f on a carrier with S slots is
 * (S - PLAN_HEADER_SLOTS) / f bits; the container must fit in it.
 */
class CapacityPlanner {
public:
    /// Container size in bytes for a candidate factor (metadata records f)
    using SizeForFactor = std::function<size_t(uint32_t)>;

    static uint64_t capacity_bits(size_t slot_count, uint32_t factor) noexcept;

    /// Throws StegoError(PayloadTooLarge) when the container does not fit.
    static void validate(size_t container_bytes, size_t slot_count, uint32_t factor);

    /**
     * Fixed factors are returned verbatim (documents always use 1). Auto picks
     * 1 for image, audio and document carriers; for video the largest odd
     * factor up to video_max_redundancy whose container still fits, or 1.
     */
    static uint32_t choose_factor(const SizeForFactor& container_bytes,
                                  size_t slot_count,
                                  CarrierType type,
                                  const Redundancy& requested,
                                  const CodecOptions& options);
};

} // namespace veil
