#include "veil_capacity.hpp"
#include "veil_errors.hpp"
#include "veil_logger.hpp"
#include "veil_redundancy.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace veil {

uint64_t CapacityPlanner::capacity_bits(size_t slot_count, uint32_t factor) noexcept {
    if (factor == 0 || slot_count <= PLAN_HEADER_SLOTS) return 0;
    return (slot_count - PLAN_HEADER_SLOTS) / factor;
}

void CapacityPlanner::validate(size_t container_bytes, size_t slot_count, uint32_t factor) {
    const uint64_t needed = static_cast<uint64_t>(container_bytes) * 8;
    const uint64_t available = capacity_bits(slot_count, factor);
    if (needed > available) {
        throw StegoError(ErrorKind::PayloadTooLarge,
                         "container needs " + std::to_string(needed) + " bits, carrier holds " +
                         std::to_string(available) + " at redundancy " + std::to_string(factor));
    }
}

uint32_t CapacityPlanner::choose_factor(const SizeForFactor& container_bytes,
                                        size_t slot_count,
                                        CarrierType type,
                                        const Redundancy& requested,
                                        const CodecOptions& options)
{
    if (requested.mode == Redundancy::Mode::Fixed) {
        if (requested.factor == 0 || requested.factor > MAX_REDUNDANCY) {
            throw std::invalid_argument("redundancy factor must be in [1, " +
                                        std::to_string(MAX_REDUNDANCY) + "]");
        }
        if (type == CarrierType::Document && requested.factor != 1) {
            VEIL_LOG_WARN("[Capacity] document regions are stored verbatim; using redundancy 1");
            return 1;
        }
        return requested.factor;
    }

    if (type != CarrierType::Video) {
        return 1;
    }

    uint32_t top = std::min<uint32_t>(options.video_max_redundancy, MAX_REDUNDANCY);
    if (top % 2 == 0) --top;
    for (uint32_t f = top; f >= 3 && f <= MAX_REDUNDANCY; f -= 2) {
        if (static_cast<uint64_t>(container_bytes(f)) * 8 <= capacity_bits(slot_count, f)) {
            VEIL_LOG_DEBUG("[Capacity] auto redundancy for video: " + std::to_string(f));
            return f;
        }
    }
    return 1;
}

} // namespace veil
