#include "veil_options.hpp"
#include "veil_config.hpp"
#include "veil_errors.hpp"
#include "veil_redundancy.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace veil {

const char* carrier_type_to_string(CarrierType type) noexcept {
    switch (type) {
        case CarrierType::Image:    return "image";
        case CarrierType::Audio:    return "audio";
        case CarrierType::Video:    return "video";
        case CarrierType::Document: return "document";
    }
    return "unknown";
}

CarrierType carrier_type_from_string(const std::string& tag) {
    std::string t = tag;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "image")    return CarrierType::Image;
    if (t == "audio")    return CarrierType::Audio;
    if (t == "video")    return CarrierType::Video;
    if (t == "document") return CarrierType::Document;
    throw StegoError(ErrorKind::UnsupportedCarrierFormat, "unknown carrier type '" + tag + "'");
}

CodecOptions CodecOptions::from_config() {
    const Config& cfg = Config::instance();
    CodecOptions o;
    o.image_output_format = cfg.get("image.output_format", o.image_output_format);
    o.video_fourcc = cfg.get("video.fourcc", o.video_fourcc);
    o.video_container = cfg.get("video.container", o.video_container);
    o.video_max_redundancy = static_cast<uint32_t>(
        cfg.getUInt64("video.max_redundancy", o.video_max_redundancy));
    o.video_threads = static_cast<size_t>(cfg.getUInt64("video.threads", o.video_threads));
    o.document_max_append_bytes = static_cast<size_t>(
        cfg.getUInt64("document.max_append_bytes", o.document_max_append_bytes));
    o.kdf_opslimit = cfg.getUInt64("crypto.kdf_opslimit", o.kdf_opslimit);
    o.kdf_memlimit = static_cast<size_t>(cfg.getUInt64("crypto.kdf_memlimit", o.kdf_memlimit));
    o.memory_lock = cfg.getBool("security.memory_lock", o.memory_lock);
    return o;
}

Redundancy Redundancy::parse(const std::string& text) {
    if (text.empty() || text == "auto") {
        return automatic();
    }
    if (!std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("redundancy must be 'auto' or a number");
    }
    unsigned long n = 0;
    try {
        n = std::stoul(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("redundancy factor out of range");
    }
    if (n == 0 || n > MAX_REDUNDANCY) {
        throw std::invalid_argument("redundancy factor must be in [1, " +
                                    std::to_string(MAX_REDUNDANCY) + "]");
    }
    return fixed(static_cast<uint32_t>(n));
}

} // namespace veil
