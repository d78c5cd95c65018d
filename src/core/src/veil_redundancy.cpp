#include "veil_redundancy.hpp"
#include "veil_errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace veil {

void require_runs_fit(const std::vector<SlotRun>& runs, size_t slot_count) {
    for (const auto& run : runs) {
        if (run.first_slot > slot_count || run.bits.size() > slot_count - run.first_slot) {
            throw StegoError(ErrorKind::CarrierTooSmall,
                             "run at slot " + std::to_string(run.first_slot) + " of " +
                             std::to_string(run.bits.size()) + " bits exceeds " +
                             std::to_string(slot_count) + " slots");
        }
    }
}

const char* header_layout_to_string(HeaderLayout layout) noexcept {
    return layout == HeaderLayout::Spread ? "spread" : "packed";
}

// ==================== RedundancyPlan ====================

size_t RedundancyPlan::data_slot(size_t index) const {
    // Data slots between header block c and block c + 1, then the tail
    const size_t gap = header_spacing - PLAN_HEADER_BITS;
    const size_t gapped = gap * PLAN_HEADER_COPIES;
    if (index < gapped) {
        return (index / gap) * header_spacing + PLAN_HEADER_BITS + index % gap;
    }
    return PLAN_HEADER_COPIES * header_spacing + (index - gapped);
}

std::vector<SlotSpan> RedundancyPlan::spans(size_t data_first, size_t count) const {
    const size_t gap = header_spacing - PLAN_HEADER_BITS;
    const size_t gapped = gap * PLAN_HEADER_COPIES;

    std::vector<SlotSpan> out;
    size_t index = data_first;
    size_t left = count;
    while (left > 0) {
        size_t run = left;
        if (index < gapped) {
            run = std::min(left, gap - index % gap);
        }
        out.push_back({data_slot(index), run});
        index += run;
        left -= run;
    }
    return out;
}

// ==================== RedundancyCoder ====================

BitStream RedundancyCoder::expand(const BitStream& bits, uint32_t factor) {
    if (factor == 0) {
        throw std::invalid_argument("redundancy factor must be >= 1");
    }
    BitStream out;
    out.reserve(bits.size() * factor);
    for (uint32_t r = 0; r < factor; ++r) {
        out.insert(out.end(), bits.begin(), bits.end());
    }
    return out;
}

BitStream RedundancyCoder::collapse(const BitStream& physical, uint32_t factor) {
    if (factor == 0) {
        throw std::invalid_argument("redundancy factor must be >= 1");
    }
    if (physical.size() % factor != 0) {
        throw std::invalid_argument("physical bit count is not a multiple of the factor");
    }
    size_t n = physical.size() / factor;
    std::vector<BitStream> copies;
    copies.reserve(factor);
    for (uint32_t r = 0; r < factor; ++r) {
        auto first = physical.begin() + static_cast<std::ptrdiff_t>(r * n);
        copies.emplace_back(first, first + static_cast<std::ptrdiff_t>(n));
    }
    return vote(copies);
}

BitStream RedundancyCoder::vote(const std::vector<BitStream>& copies) {
    if (copies.empty()) return {};
    const size_t n = copies.front().size();
    for (const auto& c : copies) {
        if (c.size() != n) {
            throw std::invalid_argument("redundancy copies differ in length");
        }
    }

    const size_t f = copies.size();
    BitStream out(n, 0);
    for (size_t i = 0; i < n; ++i) {
        size_t ones = 0;
        for (const auto& c : copies) {
            ones += c[i] & 1;
        }
        // strict majority; an exact split decodes to 0
        out[i] = (ones * 2 > f) ? 1 : 0;
    }
    return out;
}

size_t RedundancyCoder::header_spacing(size_t slot_count, HeaderLayout layout) {
    if (layout == HeaderLayout::Packed) {
        return PLAN_HEADER_BITS;
    }
    return std::max(PLAN_HEADER_BITS, slot_count / PLAN_HEADER_COPIES);
}

RedundancyPlan RedundancyCoder::plan_for(size_t slot_count, uint32_t factor, HeaderLayout layout) {
    if (factor == 0 || factor > MAX_REDUNDANCY) {
        throw std::invalid_argument("redundancy factor must be in [1, " +
                                    std::to_string(MAX_REDUNDANCY) + "]");
    }
    RedundancyPlan plan;
    plan.factor = factor;
    plan.header_spacing = header_spacing(slot_count, layout);
    plan.stride = slot_count > PLAN_HEADER_SLOTS ? (slot_count - PLAN_HEADER_SLOTS) / factor : 0;
    return plan;
}

std::vector<SlotRun> RedundancyCoder::place(const BitStream& bits, const RedundancyPlan& plan) {
    if (bits.size() > plan.stride) {
        throw StegoError(ErrorKind::CarrierTooSmall,
                         "need " + std::to_string(bits.size()) + " bits per stripe, stride is " +
                         std::to_string(plan.stride));
    }

    const BitStream header = encode_header(plan.factor);
    std::vector<SlotRun> runs;
    runs.reserve(PLAN_HEADER_COPIES + plan.factor);
    for (uint32_t c = 0; c < PLAN_HEADER_COPIES; ++c) {
        auto first = header.begin() + static_cast<std::ptrdiff_t>(c * PLAN_HEADER_BITS);
        runs.push_back({plan.header_slot(c),
                        BitStream(first, first + static_cast<std::ptrdiff_t>(PLAN_HEADER_BITS))});
    }
    for (uint32_t r = 0; r < plan.factor; ++r) {
        size_t done = 0;
        for (const SlotSpan& span : plan.spans(static_cast<size_t>(r) * plan.stride, bits.size())) {
            auto first = bits.begin() + static_cast<std::ptrdiff_t>(done);
            runs.push_back({span.first_slot,
                            BitStream(first, first + static_cast<std::ptrdiff_t>(span.count))});
            done += span.count;
        }
    }
    return runs;
}

BitStream RedundancyCoder::encode_header(uint32_t factor) {
    BitStream header;
    header.reserve(PLAN_HEADER_BITS);
    for (int b = static_cast<int>(PLAN_HEADER_BITS) - 1; b >= 0; --b) {
        header.push_back(static_cast<uint8_t>((factor >> b) & 1));
    }
    return expand(header, PLAN_HEADER_COPIES);
}

uint32_t RedundancyCoder::decode_header(const BitStream& header_slots) {
    if (header_slots.size() != PLAN_HEADER_SLOTS) {
        throw std::invalid_argument("plan header must be exactly 240 slots");
    }
    BitStream bits = collapse(header_slots, PLAN_HEADER_COPIES);
    uint32_t value = 0;
    for (uint8_t bit : bits) {
        value = (value << 1) | bit;
    }
    return value;
}

} // namespace veil
