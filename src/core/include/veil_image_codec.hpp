#pragma once

/**
 * @file veil_image_codec.hpp
 * @brief Least-significant-bit embedding in raster images
 *
 * One slot per 8-bit channel sample, row-major, channels interleaved in
 * OpenCV's native order. Output is always re-encoded with a lossless
 * encoder; JPEG carriers are accepted on input but never produced.
 */

#include "veil_bitstream.hpp"
#include "veil_options.hpp"
#include "veil_redundancy.hpp"

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace veil {

class ImageCodec {
public:
    /**
     * Decode a carrier image.
     * Throws StegoError(UnsupportedCarrierFormat) for bytes no image decoder
     * recognizes and StegoError(UnsupportedSubformat) for non-8-bit depths.
     */
    ImageCodec(const std::vector<uint8_t>& bytes, const CodecOptions& options);

    // Wrap an already decoded 8-bit image
    ImageCodec(cv::Mat image, const CodecOptions& options);

    size_t slot_count() const noexcept;
    BitStream read_slots(size_t first, size_t count) const;

    // Encoded output image; the decoded carrier itself is left untouched
    std::vector<uint8_t> write_slots(const std::vector<SlotRun>& runs) const;

    // Pixel buffer with the runs applied, before encoding
    cv::Mat apply(const std::vector<SlotRun>& runs) const;

    const cv::Mat& image() const noexcept { return image_; }
    const std::string& source_format() const noexcept { return source_format_; }

    // "png", "jpeg", "bmp", ... or "" when the signature is unknown
    static std::string sniff(const uint8_t* data, size_t len);

private:
    void adopt(cv::Mat image);

    cv::Mat image_;
    std::string source_format_;
    CodecOptions options_;
};

} // namespace veil
