#pragma once

/**
 * @file veil_redundancy.hpp
 * @brief Bit replication with majority-vote recovery
 *
 * Carrier-agnostic. The plan header is the 16-bit factor (MSB first)
 * repeated 15 times. Header copy c occupies the 16 slots starting at
 * c * spacing, where spacing depends only on the slot count and the layout:
 *
 *   Packed: spacing 16, all copies in slots [0, 240)
 *   Spread: spacing S / 15, one copy at the head of each fifteenth of the
 *           carrier, so no single damaged region holds a majority
 *
 * Every slot outside the header blocks is a data slot, numbered in physical
 * order. There are always S - 240 of them. Each stripe holds one copy of the
 * logical stream in `stride` = (S - 240) / f consecutive data slots, so the
 * copies of one logical bit sit about `stride` slots apart. On a frame-major
 * video that lands them in different frames, so a localized re-encoding
 * artifact hits at most a minority.
 *
 * Majority vote ties (even factor, exact split) decode to 0.
 */

#include "veil_bitstream.hpp"

#include <cstdint>
#include <cstddef>
#include <vector>

namespace veil {

static constexpr uint32_t MAX_REDUNDANCY = 31;
static constexpr size_t PLAN_HEADER_BITS = 16;
static constexpr uint32_t PLAN_HEADER_COPIES = 15;
static constexpr size_t PLAN_HEADER_SLOTS = PLAN_HEADER_BITS * PLAN_HEADER_COPIES;

enum class HeaderLayout {
    Packed,
    Spread
};

const char* header_layout_to_string(HeaderLayout layout) noexcept;

/// Physically contiguous slots [first_slot, first_slot + count).
struct SlotSpan {
    size_t first_slot = 0;
    size_t count = 0;
};

struct RedundancyPlan {
    uint32_t factor = 1;
    size_t stride = 0;
    size_t header_spacing = PLAN_HEADER_BITS;

    size_t header_slot(uint32_t copy) const {
        return static_cast<size_t>(copy) * header_spacing;
    }

    /// Physical slot of data slot `index`.
    size_t data_slot(size_t index) const;

    size_t slot_of(size_t bit, uint32_t copy) const {
        return data_slot(static_cast<size_t>(copy) * stride + bit);
    }

    /// Physical spans covering data slots [data_first, data_first + count).
    std::vector<SlotSpan> spans(size_t data_first, size_t count) const;

    size_t capacity_bits() const { return stride; }
};

/// A contiguous run of bits to write starting at first_slot.
struct SlotRun {
    size_t first_slot = 0;
    BitStream bits;
};

/// Throws StegoError(CarrierTooSmall) if any run ends past slot_count.
void require_runs_fit(const std::vector<SlotRun>& runs, size_t slot_count);

class RedundancyCoder {
public:
    /// Copy-major replication: out[r * n + i] = bits[i].
    static BitStream expand(const BitStream& bits, uint32_t factor);

    /// Inverse of expand(); size must be a multiple of factor.
    static BitStream collapse(const BitStream& physical, uint32_t factor);

    /// Bitwise majority across equally sized copies.
    static BitStream vote(const std::vector<BitStream>& copies);

    /// Distance between header copies; independent of the factor.
    static size_t header_spacing(size_t slot_count, HeaderLayout layout);

    /// Throws std::invalid_argument for factor 0 or above MAX_REDUNDANCY.
    static RedundancyPlan plan_for(size_t slot_count, uint32_t factor, HeaderLayout layout);

    /**
     * One run per header copy plus the runs of every stripe, split where a
     * stripe steps over a header block. Throws StegoError(CarrierTooSmall)
     * when bits do not fit the stride.
     */
    static std::vector<SlotRun> place(const BitStream& bits, const RedundancyPlan& plan);

    static BitStream encode_header(uint32_t factor);

    /// Takes the 15 header copies concatenated in copy order. Returns the raw
    /// value; the caller validates the range.
    static uint32_t decode_header(const BitStream& header_slots);
};

} // namespace veil
