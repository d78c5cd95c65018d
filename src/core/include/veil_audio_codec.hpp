#pragma once

/**
 * @file veil_audio_codec.hpp
 * @brief LSB embedding in uncompressed PCM WAV
 *
 * One slot per sample (every channel counts), the low bit of the sample's
 * least significant byte. Output is the original file byte for byte except
 * those bits, so every chunk outside "data" survives.
 */

#include "veil_bitstream.hpp"
#include "veil_options.hpp"
#include "veil_redundancy.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace veil {

struct WavFormat {
    uint16_t format_tag = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t block_align = 0;
    uint16_t bits_per_sample = 0;
    size_t data_offset = 0;
    size_t data_size = 0;
};

class AudioCodec {
public:
    /**
     * Throws StegoError(UnsupportedCarrierFormat) for non-RIFF input and
     * StegoError(UnsupportedSubformat) for compressed audio (MP3, FLAC, Ogg,
     * AAC, non-PCM WAVE) or unusual sample widths.
     */
    AudioCodec(const std::vector<uint8_t>& bytes, const CodecOptions& options);

    size_t slot_count() const noexcept { return slots_; }
    BitStream read_slots(size_t first, size_t count) const;
    std::vector<uint8_t> write_slots(const std::vector<SlotRun>& runs) const;

    const WavFormat& format() const noexcept { return format_; }

    static constexpr uint16_t WAVE_FORMAT_PCM = 0x0001;
    static constexpr uint16_t WAVE_FORMAT_EXTENSIBLE = 0xFFFE;

private:
    void parse();
    size_t byte_of(size_t slot) const noexcept {
        return format_.data_offset + slot * (format_.bits_per_sample / 8);
    }

    std::vector<uint8_t> bytes_;
    WavFormat format_;
    size_t slots_ = 0;
};

} // namespace veil
