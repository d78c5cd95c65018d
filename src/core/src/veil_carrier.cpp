#include "veil_carrier.hpp"
#include "veil_errors.hpp"
#include "veil_logger.hpp"

namespace veil {

CarrierCodec load_carrier(CarrierType type,
                          const std::vector<uint8_t>& bytes,
                          const CodecOptions& options)
{
    if (bytes.empty()) {
        throw StegoError(ErrorKind::UnsupportedCarrierFormat, "carrier is empty");
    }
    VEIL_LOG_DEBUG(std::string("[Carrier] loading ") + carrier_type_to_string(type) +
                   " carrier, " + std::to_string(bytes.size()) + " bytes");

    switch (type) {
        case CarrierType::Image:    return ImageCodec(bytes, options);
        case CarrierType::Audio:    return AudioCodec(bytes, options);
        case CarrierType::Video:    return VideoCodec(bytes, options);
        case CarrierType::Document: return DocumentCodec(bytes, options);
    }
    throw StegoError(ErrorKind::UnsupportedCarrierFormat, "unknown carrier type");
}

CarrierType carrier_type_of(const CarrierCodec& codec) noexcept {
    return std::visit([](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, ImageCodec>) {
            return CarrierType::Image;
        } else if constexpr (std::is_same_v<T, AudioCodec>) {
            return CarrierType::Audio;
        } else if constexpr (std::is_same_v<T, VideoCodec>) {
            return CarrierType::Video;
        } else {
            static_assert(std::is_same_v<T, DocumentCodec>, "unhandled carrier codec");
            return CarrierType::Document;
        }
    }, codec);
}

HeaderLayout header_layout_for(CarrierType type) noexcept {
    // A spread header would push a document's appended region to its full capacity
    return type == CarrierType::Document ? HeaderLayout::Packed : HeaderLayout::Spread;
}

BitStream read_plan_header(const CarrierCodec& codec, HeaderLayout layout) {
    const size_t spacing = RedundancyCoder::header_spacing(slot_count(codec), layout);
    BitStream header;
    header.reserve(PLAN_HEADER_SLOTS);
    for (uint32_t c = 0; c < PLAN_HEADER_COPIES; ++c) {
        BitStream copy = read_slots(codec, c * spacing, PLAN_HEADER_BITS);
        header.insert(header.end(), copy.begin(), copy.end());
    }
    return header;
}

size_t slot_count(const CarrierCodec& codec) {
    return std::visit([](const auto& c) { return c.slot_count(); }, codec);
}

BitStream read_slots(const CarrierCodec& codec, size_t first, size_t count) {
    return std::visit([first, count](const auto& c) { return c.read_slots(first, count); }, codec);
}

std::vector<uint8_t> write_slots(const CarrierCodec& codec, const std::vector<SlotRun>& runs) {
    return std::visit([&runs](const auto& c) { return c.write_slots(runs); }, codec);
}

} // namespace veil
