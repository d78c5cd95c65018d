#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace veil {

enum class CarrierType {
    Image,
    Audio,
    Video,
    Document
};

const char* carrier_type_to_string(CarrierType type) noexcept;

// Throws StegoError(UnsupportedCarrierFormat) for an unknown tag
CarrierType carrier_type_from_string(const std::string& tag);

/**
 * @brief Per-call codec knobs
 *
 * A plain value snapshot; build one with from_config() at the collaborator
 * boundary so a running hide/extract never sees configuration changes.
 */
struct CodecOptions {
    std::string image_output_format = "png";    // png | bmp | tiff | webp-lossless
    std::string video_fourcc = "FFV1";
    std::string video_container = ".avi";
    uint32_t video_max_redundancy = 15;
    size_t video_threads = 0;                   // 0 = hardware concurrency
    size_t document_max_append_bytes = 16u * 1024u * 1024u;
    unsigned long long kdf_opslimit = 0;        // 0 = libsodium INTERACTIVE
    size_t kdf_memlimit = 0;
    bool memory_lock = true;

    static CodecOptions from_config();
};

struct Redundancy {
    enum class Mode { Auto, Fixed };

    Mode mode = Mode::Auto;
    uint32_t factor = 0;

    static Redundancy automatic() { return Redundancy{}; }
    static Redundancy fixed(uint32_t n) { return Redundancy{Mode::Fixed, n}; }

    // "auto" or a decimal factor; throws std::invalid_argument
    static Redundancy parse(const std::string& text);
};

} // namespace veil
