#include "veil_audio_codec.hpp"
#include "veil_errors.hpp"
#include "veil_logger.hpp"

#include <cstring>
#include <stdexcept>

namespace veil {

namespace {

uint16_t le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

// Name of a compressed audio format recognized by signature, or nullptr
const char* compressed_audio_kind(const std::vector<uint8_t>& b) {
    if (b.size() >= 3 && std::memcmp(b.data(), "ID3", 3) == 0) return "MP3";
    if (b.size() >= 4 && tag_is(b.data(), "fLaC")) return "FLAC";
    if (b.size() >= 4 && tag_is(b.data(), "OggS")) return "Ogg";
    if (b.size() >= 12 && tag_is(b.data(), "FORM") && tag_is(b.data() + 8, "AIFC")) return "AIFF-C";
    if (b.size() >= 8 && tag_is(b.data() + 4, "ftyp")) return "MP4/AAC";
    if (b.size() >= 2 && b[0] == 0xFF && (b[1] & 0xE0) == 0xE0) {
        // MPEG audio frame sync; ADTS AAC shares it with layer bits 00
        return ((b[1] & 0x06) == 0) ? "AAC" : "MP3";
    }
    return nullptr;
}

} // namespace

AudioCodec::AudioCodec(const std::vector<uint8_t>& bytes, const CodecOptions& /*options*/)
    : bytes_(bytes)
{
    parse();
    VEIL_LOG_DEBUG("[AudioCodec] PCM " + std::to_string(format_.channels) + "ch " +
                   std::to_string(format_.sample_rate) + "Hz " +
                   std::to_string(format_.bits_per_sample) + "-bit, " +
                   std::to_string(slots_) + " slots");
}

void AudioCodec::parse() {
    if (bytes_.size() >= 12 && tag_is(bytes_.data(), "FORM") && tag_is(bytes_.data() + 8, "AIFF")) {
        // Uncompressed, but big-endian samples in a different chunk layout
        throw StegoError(ErrorKind::UnsupportedSubformat,
                         "AIFF PCM is not supported, only RIFF/WAVE PCM; re-wrap it as WAV");
    }
    if (const char* kind = compressed_audio_kind(bytes_)) {
        throw StegoError(ErrorKind::UnsupportedSubformat,
                         std::string(kind) + " audio must be converted to PCM WAV first");
    }
    if (bytes_.size() < 12 || !tag_is(bytes_.data(), "RIFF")) {
        throw StegoError(ErrorKind::UnsupportedCarrierFormat, "not a RIFF file");
    }
    if (!tag_is(bytes_.data() + 8, "WAVE")) {
        throw StegoError(ErrorKind::UnsupportedCarrierFormat, "RIFF file is not WAVE");
    }

    bool have_fmt = false;
    bool have_data = false;
    size_t pos = 12;
    while (pos + 8 <= bytes_.size() && !(have_fmt && have_data)) {
        const uint8_t* hdr = bytes_.data() + pos;
        size_t chunk_size = le32(hdr + 4);
        size_t body = pos + 8;
        size_t available = bytes_.size() - body;

        if (tag_is(hdr, "fmt ")) {
            if (chunk_size < 16 || chunk_size > available) {
                throw StegoError(ErrorKind::UnsupportedCarrierFormat, "truncated fmt chunk");
            }
            const uint8_t* f = bytes_.data() + body;
            format_.format_tag = le16(f);
            format_.channels = le16(f + 2);
            format_.sample_rate = le32(f + 4);
            format_.block_align = le16(f + 12);
            format_.bits_per_sample = le16(f + 14);

            if (format_.format_tag == WAVE_FORMAT_EXTENSIBLE) {
                // cbSize(2) validBits(2) channelMask(4) then the SubFormat GUID
                if (chunk_size < 40) {
                    throw StegoError(ErrorKind::UnsupportedCarrierFormat,
                                     "truncated WAVE_FORMAT_EXTENSIBLE header");
                }
                format_.format_tag = le16(f + 24);
            }
            have_fmt = true;
        } else if (tag_is(hdr, "data")) {
            if (chunk_size > available) {
                // Streaming writers leave a placeholder size; take what is there
                chunk_size = available;
            }
            format_.data_offset = body;
            format_.data_size = chunk_size;
            have_data = true;
        }

        pos = body + chunk_size + (chunk_size & 1);
    }

    if (!have_fmt || !have_data) {
        throw StegoError(ErrorKind::UnsupportedCarrierFormat,
                         have_fmt ? "WAVE has no data chunk" : "WAVE has no fmt chunk");
    }
    if (format_.format_tag != WAVE_FORMAT_PCM) {
        throw StegoError(ErrorKind::UnsupportedSubformat,
                         "WAVE encoding " + std::to_string(format_.format_tag) + " is not PCM");
    }
    const uint16_t bps = format_.bits_per_sample;
    if (bps != 8 && bps != 16 && bps != 24 && bps != 32) {
        throw StegoError(ErrorKind::UnsupportedSubformat,
                         std::to_string(bps) + "-bit PCM is not supported");
    }
    if (format_.channels == 0 || format_.block_align != format_.channels * (bps / 8)) {
        throw StegoError(ErrorKind::UnsupportedSubformat, "inconsistent PCM block alignment");
    }

    slots_ = (format_.data_size / format_.block_align) * format_.channels;
}

BitStream AudioCodec::read_slots(size_t first, size_t count) const {
    if (first > slots_ || count > slots_ - first) {
        throw std::out_of_range("audio slot range out of bounds");
    }
    BitStream bits(count);
    for (size_t i = 0; i < count; ++i) {
        bits[i] = bytes_[byte_of(first + i)] & 1;
    }
    return bits;
}

std::vector<uint8_t> AudioCodec::write_slots(const std::vector<SlotRun>& runs) const {
    require_runs_fit(runs, slots_);
    std::vector<uint8_t> out = bytes_;
    for (const auto& run : runs) {
        for (size_t i = 0; i < run.bits.size(); ++i) {
            uint8_t& b = out[byte_of(run.first_slot + i)];
            b = static_cast<uint8_t>((b & 0xFE) | (run.bits[i] & 1));
        }
    }
    return out;
}

} // namespace veil
