/**
 * @file test_redundancy.cpp
 * @brief Replication, majority vote and slot placement
 */

#include <gtest/gtest.h>
#include "veil_redundancy.hpp"
#include "veil_errors.hpp"

#include <vector>

using namespace veil;

// ─── Bit stream helpers ───────────────────────────────────────────────────

TEST(BitStreamTest, MsbFirst) {
    std::vector<uint8_t> bytes = {0xA5, 0x01};
    BitStream bits = bytes_to_bits(bytes);
    BitStream expected = {1, 0, 1, 0, 0, 1, 0, 1, 0, 0, 0, 0, 0, 0, 0, 1};
    EXPECT_EQ(bits, expected);
    EXPECT_EQ(bits_to_bytes(bits), bytes);
}

TEST(BitStreamTest, PartialTrailingByteDropped) {
    BitStream bits = {1, 1, 1, 1, 1, 1, 1, 1, 1, 0, 1};
    EXPECT_EQ(bits_to_bytes(bits), std::vector<uint8_t>({0xFF}));
}

// ─── expand / collapse ────────────────────────────────────────────────────

TEST(RedundancyTest, ExpandIsCopyMajor) {
    BitStream bits = {1, 0, 1};
    BitStream physical = RedundancyCoder::expand(bits, 3);
    BitStream expected = {1, 0, 1, 1, 0, 1, 1, 0, 1};
    EXPECT_EQ(physical, expected);
    EXPECT_EQ(RedundancyCoder::collapse(physical, 3), bits);
}

TEST(RedundancyTest, FactorOneIsIdentity) {
    BitStream bits = {0, 1, 1, 0, 1};
    EXPECT_EQ(RedundancyCoder::expand(bits, 1), bits);
    EXPECT_EQ(RedundancyCoder::collapse(bits, 1), bits);
}

TEST(RedundancyTest, AnyMinorityOfFlipsIsTolerated) {
    const BitStream bits = {1, 0, 1, 1, 0, 0, 1, 0};
    for (uint32_t factor : {3u, 5u, 7u, 15u}) {
        const size_t n = bits.size();
        const uint32_t max_flips = (factor - 1) / 2;
        BitStream physical = RedundancyCoder::expand(bits, factor);
        // Flip copies 0..max_flips-1 of every logical bit
        for (uint32_t r = 0; r < max_flips; ++r) {
            for (size_t i = 0; i < n; ++i) {
                physical[r * n + i] ^= 1;
            }
        }
        EXPECT_EQ(RedundancyCoder::collapse(physical, factor), bits) << "factor " << factor;
    }
}

TEST(RedundancyTest, MajorityOfFlipsWins) {
    BitStream physical = RedundancyCoder::expand({1}, 5);
    physical[0] = physical[1] = physical[2] = 0;
    EXPECT_EQ(RedundancyCoder::collapse(physical, 5), BitStream({0}));
}

TEST(RedundancyTest, EvenSplitResolvesToZero) {
    std::vector<BitStream> copies = {{1, 0}, {0, 1}, {1, 0}, {0, 1}};
    EXPECT_EQ(RedundancyCoder::vote(copies), BitStream({0, 0}));

    BitStream physical = {1, 0};  // factor 2, one logical bit, split vote
    EXPECT_EQ(RedundancyCoder::collapse(physical, 2), BitStream({0}));
}

TEST(RedundancyTest, InvalidArguments) {
    EXPECT_THROW(RedundancyCoder::expand({1}, 0), std::invalid_argument);
    EXPECT_THROW(RedundancyCoder::collapse({1, 0, 1}, 2), std::invalid_argument);
    std::vector<BitStream> ragged = {BitStream{1, 0}, BitStream{1}};
    EXPECT_THROW(RedundancyCoder::vote(ragged), std::invalid_argument);
    EXPECT_THROW(RedundancyCoder::plan_for(1000, 0, HeaderLayout::Packed), std::invalid_argument);
    EXPECT_THROW(RedundancyCoder::plan_for(1000, MAX_REDUNDANCY + 1, HeaderLayout::Spread),
                 std::invalid_argument);
}

// ─── Plan header ──────────────────────────────────────────────────────────

TEST(RedundancyTest, HeaderRoundTrip) {
    for (uint32_t f = 1; f <= MAX_REDUNDANCY; ++f) {
        BitStream header = RedundancyCoder::encode_header(f);
        ASSERT_EQ(header.size(), PLAN_HEADER_SLOTS);
        EXPECT_EQ(RedundancyCoder::decode_header(header), f);
    }
}

TEST(RedundancyTest, HeaderSurvivesSevenCorruptCopies) {
    BitStream header = RedundancyCoder::encode_header(5);
    for (size_t copy = 0; copy < 7; ++copy) {
        for (size_t b = 0; b < PLAN_HEADER_BITS; ++b) {
            header[copy * PLAN_HEADER_BITS + b] ^= 1;
        }
    }
    EXPECT_EQ(RedundancyCoder::decode_header(header), 5u);
}

TEST(RedundancyTest, HeaderWrongSizeRejected) {
    EXPECT_THROW(RedundancyCoder::decode_header(BitStream(16, 0)), std::invalid_argument);
}

// ─── Placement ────────────────────────────────────────────────────────────

TEST(RedundancyTest, PlanStride) {
    RedundancyPlan plan = RedundancyCoder::plan_for(240 + 300, 3, HeaderLayout::Packed);
    EXPECT_EQ(plan.stride, 100u);
    EXPECT_EQ(plan.capacity_bits(), 100u);
    EXPECT_EQ(plan.slot_of(0, 0), 240u);
    EXPECT_EQ(plan.slot_of(5, 2), 240u + 200u + 5u);

    EXPECT_EQ(RedundancyCoder::plan_for(100, 1, HeaderLayout::Packed).stride, 0u);
    EXPECT_EQ(RedundancyCoder::plan_for(100, 1, HeaderLayout::Spread).stride, 0u);
}

TEST(RedundancyTest, PlaceProducesHeaderAndStripes) {
    RedundancyPlan plan = RedundancyCoder::plan_for(240 + 30, 3, HeaderLayout::Packed);
    BitStream bits = {1, 1, 0, 1};
    auto runs = RedundancyCoder::place(bits, plan);

    ASSERT_EQ(runs.size(), PLAN_HEADER_COPIES + 3u);
    BitStream header;
    for (uint32_t c = 0; c < PLAN_HEADER_COPIES; ++c) {
        EXPECT_EQ(runs[c].first_slot, c * PLAN_HEADER_BITS);
        header.insert(header.end(), runs[c].bits.begin(), runs[c].bits.end());
    }
    EXPECT_EQ(header, RedundancyCoder::encode_header(3));
    for (uint32_t r = 0; r < 3; ++r) {
        EXPECT_EQ(runs[PLAN_HEADER_COPIES + r].first_slot, 240u + r * 10u);
        EXPECT_EQ(runs[PLAN_HEADER_COPIES + r].bits, bits);
    }
    EXPECT_NO_THROW(require_runs_fit(runs, 270));
}

TEST(RedundancyTest, SpreadHeaderIgnoresFactor) {
    // 1500 slots: one header copy at the head of each 100-slot fifteenth
    for (uint32_t f : {1u, 3u, 7u, 31u}) {
        RedundancyPlan plan = RedundancyCoder::plan_for(1500, f, HeaderLayout::Spread);
        EXPECT_EQ(plan.header_spacing, 100u);
        EXPECT_EQ(plan.stride, 1260u / f);
        for (uint32_t c = 0; c < PLAN_HEADER_COPIES; ++c) {
            EXPECT_EQ(plan.header_slot(c), c * 100u);
        }
    }
    EXPECT_EQ(RedundancyCoder::header_spacing(1500, HeaderLayout::Packed), PLAN_HEADER_BITS);
    EXPECT_EQ(RedundancyCoder::header_spacing(100, HeaderLayout::Spread), PLAN_HEADER_BITS);
}

TEST(RedundancyTest, SpreadDataSlotsStepOverHeaderBlocks) {
    RedundancyPlan plan = RedundancyCoder::plan_for(1507, 1, HeaderLayout::Spread);
    EXPECT_EQ(plan.data_slot(0), 16u);
    EXPECT_EQ(plan.data_slot(83), 99u);
    EXPECT_EQ(plan.data_slot(84), 116u);
    EXPECT_EQ(plan.data_slot(1259), 1499u);
    EXPECT_EQ(plan.data_slot(1260), 1500u);  // tail after the last fifteenth
    EXPECT_EQ(plan.data_slot(1266), 1506u);

    auto spans = plan.spans(80, 10);
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].first_slot, 96u);
    EXPECT_EQ(spans[0].count, 4u);
    EXPECT_EQ(spans[1].first_slot, 116u);
    EXPECT_EQ(spans[1].count, 6u);
}

TEST(RedundancyTest, SpreadPlacementCoversEverySlotOnce) {
    RedundancyPlan plan = RedundancyCoder::plan_for(1500, 3, HeaderLayout::Spread);
    ASSERT_EQ(plan.stride, 420u);
    auto runs = RedundancyCoder::place(BitStream(420, 1), plan);
    ASSERT_NO_THROW(require_runs_fit(runs, 1500));

    std::vector<int> hits(1500, 0);
    for (const auto& run : runs) {
        for (size_t i = 0; i < run.bits.size(); ++i) {
            ++hits[run.first_slot + i];
        }
    }
    for (size_t slot = 0; slot < hits.size(); ++slot) {
        EXPECT_EQ(hits[slot], 1) << "slot " << slot;
    }
}

TEST(RedundancyTest, PlaceRejectsOverlongStream) {
    RedundancyPlan plan = RedundancyCoder::plan_for(240 + 30, 3, HeaderLayout::Packed);
    try {
        RedundancyCoder::place(BitStream(11, 1), plan);
        FAIL() << "placed 11 bits in a 10-bit stride";
    } catch (const StegoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CarrierTooSmall);
    }
}

TEST(RedundancyTest, RequireRunsFit) {
    std::vector<SlotRun> runs = {{95, BitStream(5, 1)}};
    EXPECT_NO_THROW(require_runs_fit(runs, 100));
    EXPECT_THROW(require_runs_fit(runs, 99), StegoError);
    std::vector<SlotRun> beyond = {{200, BitStream(1, 0)}};
    EXPECT_THROW(require_runs_fit(beyond, 100), StegoError);
}
