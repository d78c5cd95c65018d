#pragma once

/**
 * @file veil_video_codec.hpp
 * @brief Low-band embedding across decoded video frames
 *
 * Slots are frame-major: frame 0's samples (row-major, BGR interleaved),
 * then frame 1's, and so on. A bit is written by forcing the low three bits
 * of the sample to 111 (one) or 000 (zero) and read back as (v & 7) >= 4,
 * which tolerates small re-encoding drift that flips a plain LSB.
 *
 * Per-frame work is spread over a ThreadPool (video.threads).
 */

#include "veil_bitstream.hpp"
#include "veil_options.hpp"
#include "veil_redundancy.hpp"

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace veil {

class VideoCodec {
public:
    static constexpr uint8_t BAND_MASK = 0x07;
    static constexpr uint8_t BAND_THRESHOLD = 4;

    /**
     * Decode a video container (AVI, MP4/MOV, Matroska/WebM) frame by frame.
     * Throws StegoError(UnsupportedCarrierFormat) for unknown containers or
     * streams OpenCV cannot decode.
     */
    VideoCodec(const std::vector<uint8_t>& bytes, const CodecOptions& options);

    // Already decoded frames; all must share size and 8-bit type
    VideoCodec(std::vector<cv::Mat> frames, double fps, const CodecOptions& options);

    size_t slot_count() const noexcept { return frames_.size() * slots_per_frame_; }
    BitStream read_slots(size_t first, size_t count) const;

    // Re-encodes with video.fourcc into video.container
    std::vector<uint8_t> write_slots(const std::vector<SlotRun>& runs) const;

    // Frames with the runs applied, before encoding
    std::vector<cv::Mat> apply(const std::vector<SlotRun>& runs) const;

    const std::vector<cv::Mat>& frames() const noexcept { return frames_; }
    double fps() const noexcept { return fps_; }
    size_t slots_per_frame() const noexcept { return slots_per_frame_; }

    // ".avi", ".mp4", ".mkv" or "" when the signature is unknown
    static std::string sniff(const uint8_t* data, size_t len);

    static bool is_lossless_fourcc(const std::string& fourcc);

private:
    void adopt(std::vector<cv::Mat> frames);
    size_t worker_count() const;

    std::vector<cv::Mat> frames_;
    size_t slots_per_frame_ = 0;
    double fps_ = 25.0;
    CodecOptions options_;
};

} // namespace veil
