#pragma once

/**
 * @file veil_carrier.hpp
 * @brief Closed set of carrier codecs behind one slot interface
 *
 * Every codec exposes the same three operations:
 *   slot_count()            number of addressable one-bit slots
 *   read_slots(first, n)    current bit of each slot in [first, first + n)
 *   write_slots(runs)       encoded carrier with the runs applied; every
 *                           slot not covered by a run keeps its value
 *                           (documents rebuild their region, see
 *                           DocumentCodec::write_slots)
 *
 * Pixel and sample carriers spread the plan header over the whole slot
 * range; documents keep it packed at the front of their appended region.
 */

#include "veil_audio_codec.hpp"
#include "veil_document_codec.hpp"
#include "veil_image_codec.hpp"
#include "veil_options.hpp"
#include "veil_video_codec.hpp"

#include <type_traits>
#include <variant>
#include <vector>

namespace veil {

using CarrierCodec = std::variant<ImageCodec, AudioCodec, VideoCodec, DocumentCodec>;

/// Decode the carrier for the declared type; fails before any embedding work.
CarrierCodec load_carrier(CarrierType type,
                          const std::vector<uint8_t>& bytes,
                          const CodecOptions& options);

CarrierType carrier_type_of(const CarrierCodec& codec) noexcept;

HeaderLayout header_layout_for(CarrierType type) noexcept;

/// The 15 plan header copies, concatenated in copy order.
BitStream read_plan_header(const CarrierCodec& codec, HeaderLayout layout);

size_t slot_count(const CarrierCodec& codec);
BitStream read_slots(const CarrierCodec& codec, size_t first, size_t count);
std::vector<uint8_t> write_slots(const CarrierCodec& codec, const std::vector<SlotRun>& runs);

} // namespace veil
