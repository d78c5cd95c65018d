#include "veil_video_codec.hpp"
#include "veil_errors.hpp"
#include "veil_logger.hpp"
#include "veil_secure_memory.hpp"
#include "veil_thread_pool.hpp"

#include <opencv2/videoio.hpp>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace veil {

namespace {

namespace fs = std::filesystem;

/// Scratch file for the OpenCV video backends, which only speak paths
class TempFile {
public:
    explicit TempFile(const std::string& extension) {
        static const char* hex = "0123456789abcdef";
        std::string name = "veil-";
        for (uint8_t b : SecureOps::generate_random(8)) {
            name += hex[b >> 4];
            name += hex[b & 0x0F];
        }
        path_ = fs::temp_directory_path() / (name + extension);
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            VEIL_LOG_WARN("[VideoCodec] could not remove " + path_.string() + ": " + ec.message());
        }
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string path() const { return path_.string(); }

    void write(const std::vector<uint8_t>& bytes) const {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            throw std::runtime_error("failed to write " + path_.string());
        }
    }

    std::vector<uint8_t> read() const {
        std::ifstream in(path_, std::ios::binary);
        if (!in) {
            throw std::runtime_error("failed to read " + path_.string());
        }
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    }

private:
    fs::path path_;
};

/// Part of one run that lands in a single frame
struct FrameSegment {
    size_t frame_offset;
    const uint8_t* bits;
    size_t count;
};

inline uint8_t band_read(uint8_t v) {
    return (v & VideoCodec::BAND_MASK) >= VideoCodec::BAND_THRESHOLD ? 1 : 0;
}

inline uint8_t band_write(uint8_t v, uint8_t bit) {
    return bit ? static_cast<uint8_t>(v | VideoCodec::BAND_MASK)
               : static_cast<uint8_t>(v & ~VideoCodec::BAND_MASK);
}

} // namespace

std::string VideoCodec::sniff(const uint8_t* data, size_t len) {
    if (!data) return "";
    if (len >= 12 && std::memcmp(data, "RIFF", 4) == 0 && std::memcmp(data + 8, "AVI ", 4) == 0) {
        return ".avi";
    }
    if (len >= 8 && std::memcmp(data + 4, "ftyp", 4) == 0) {
        return ".mp4";
    }
    if (len >= 4 && data[0] == 0x1A && data[1] == 0x45 && data[2] == 0xDF && data[3] == 0xA3) {
        return ".mkv";
    }
    return "";
}

bool VideoCodec::is_lossless_fourcc(const std::string& fourcc) {
    static const char* lossless[] = {"FFV1", "HFYU", "FFVH", "LAGS", "PNG ", "MPNG", "RGBA"};
    for (const char* f : lossless) {
        if (fourcc == f) return true;
    }
    return false;
}

VideoCodec::VideoCodec(const std::vector<uint8_t>& bytes, const CodecOptions& options)
    : options_(options)
{
    std::string ext = sniff(bytes.data(), bytes.size());
    if (ext.empty()) {
        throw StegoError(ErrorKind::UnsupportedCarrierFormat, "unrecognized video container");
    }

    TempFile tmp(ext);
    tmp.write(bytes);

    cv::VideoCapture cap(tmp.path());
    if (!cap.isOpened()) {
        throw StegoError(ErrorKind::UnsupportedCarrierFormat,
                         "no video backend could open the " + ext + " container");
    }
    double fps = cap.get(cv::CAP_PROP_FPS);
    if (fps > 0.0) fps_ = fps;

    std::vector<cv::Mat> frames;
    cv::Mat frame;
    while (cap.read(frame)) {
        frames.push_back(frame.clone());
    }
    cap.release();

    if (frames.empty()) {
        throw StegoError(ErrorKind::UnsupportedCarrierFormat, "video has no decodable frames");
    }
    adopt(std::move(frames));
}

VideoCodec::VideoCodec(std::vector<cv::Mat> frames, double fps, const CodecOptions& options)
    : options_(options)
{
    if (frames.empty()) {
        throw StegoError(ErrorKind::UnsupportedCarrierFormat, "video has no frames");
    }
    if (fps > 0.0) fps_ = fps;
    adopt(std::move(frames));
}

void VideoCodec::adopt(std::vector<cv::Mat> frames) {
    const cv::Size size = frames.front().size();
    const int type = frames.front().type();
    if (CV_MAT_DEPTH(type) != CV_8U) {
        throw StegoError(ErrorKind::UnsupportedSubformat, "only 8-bit video frames are supported");
    }
    for (auto& f : frames) {
        if (f.size() != size || f.type() != type) {
            throw StegoError(ErrorKind::UnsupportedSubformat,
                             "frames differ in geometry or pixel type");
        }
        if (!f.isContinuous()) f = f.clone();
    }
    frames_ = std::move(frames);
    slots_per_frame_ = frames_.front().total() * static_cast<size_t>(frames_.front().channels());

    VEIL_LOG_DEBUG("[VideoCodec] " + std::to_string(frames_.size()) + " frames " +
                   std::to_string(size.width) + "x" + std::to_string(size.height) +
                   " @" + std::to_string(fps_) + "fps");
}

size_t VideoCodec::worker_count() const {
    size_t n = options_.video_threads;
    if (n == 0) n = std::max<size_t>(1, std::thread::hardware_concurrency());
    return std::min(n, frames_.size());
}

BitStream VideoCodec::read_slots(size_t first, size_t count) const {
    if (first > slot_count() || count > slot_count() - first) {
        throw std::out_of_range("video slot range out of bounds");
    }
    BitStream bits(count);
    if (count == 0) return bits;

    auto read_span = [this, &bits](size_t frame, size_t offset, size_t out_pos, size_t n) {
        const uint8_t* px = frames_[frame].ptr<uint8_t>() + offset;
        for (size_t i = 0; i < n; ++i) {
            bits[out_pos + i] = band_read(px[i]);
        }
    };

    const size_t first_frame = first / slots_per_frame_;
    const size_t last_frame = (first + count - 1) / slots_per_frame_;

    if (first_frame == last_frame || worker_count() <= 1) {
        size_t pos = 0;
        while (pos < count) {
            size_t slot = first + pos;
            size_t frame = slot / slots_per_frame_;
            size_t offset = slot % slots_per_frame_;
            size_t n = std::min(count - pos, slots_per_frame_ - offset);
            read_span(frame, offset, pos, n);
            pos += n;
        }
        return bits;
    }

    struct Span { size_t frame, offset, out_pos, n; };
    std::vector<Span> spans;
    size_t pos = 0;
    while (pos < count) {
        size_t slot = first + pos;
        size_t offset = slot % slots_per_frame_;
        size_t n = std::min(count - pos, slots_per_frame_ - offset);
        spans.push_back({slot / slots_per_frame_, offset, pos, n});
        pos += n;
    }

    ThreadPool pool(worker_count());
    pool.parallel_for(spans.size(), [&spans, &read_span](size_t k) {
        const Span& s = spans[k];
        read_span(s.frame, s.offset, s.out_pos, s.n);
    });
    return bits;
}

std::vector<cv::Mat> VideoCodec::apply(const std::vector<SlotRun>& runs) const {
    require_runs_fit(runs, slot_count());

    std::map<size_t, std::vector<FrameSegment>> by_frame;
    for (const auto& run : runs) {
        size_t pos = 0;
        while (pos < run.bits.size()) {
            size_t slot = run.first_slot + pos;
            size_t frame = slot / slots_per_frame_;
            size_t offset = slot % slots_per_frame_;
            size_t n = std::min(run.bits.size() - pos, slots_per_frame_ - offset);
            by_frame[frame].push_back({offset, run.bits.data() + pos, n});
            pos += n;
        }
    }

    // Untouched frames share storage with the carrier
    std::vector<cv::Mat> out = frames_;
    for (const auto& entry : by_frame) {
        out[entry.first] = frames_[entry.first].clone();
    }

    auto embed_frame = [&out](size_t frame, const std::vector<FrameSegment>* segments) {
        uint8_t* px = out[frame].ptr<uint8_t>();
        for (const auto& seg : *segments) {
            uint8_t* p = px + seg.frame_offset;
            for (size_t i = 0; i < seg.count; ++i) {
                p[i] = band_write(p[i], seg.bits[i] & 1);
            }
        }
    };

    if (by_frame.size() <= 1 || worker_count() <= 1) {
        for (const auto& entry : by_frame) embed_frame(entry.first, &entry.second);
        return out;
    }

    std::vector<const std::pair<const size_t, std::vector<FrameSegment>>*> work;
    work.reserve(by_frame.size());
    for (const auto& entry : by_frame) work.push_back(&entry);

    ThreadPool pool(worker_count());
    pool.parallel_for(work.size(), [&work, &embed_frame](size_t k) {
        embed_frame(work[k]->first, &work[k]->second);
    });
    return out;
}

std::vector<uint8_t> VideoCodec::write_slots(const std::vector<SlotRun>& runs) const {
    const std::string& fourcc = options_.video_fourcc;
    if (fourcc.size() != 4) {
        throw StegoError(ErrorKind::UnsupportedSubformat,
                         "video.fourcc must be four characters, got '" + fourcc + "'");
    }
    if (!is_lossless_fourcc(fourcc)) {
        VEIL_LOG_WARN("[VideoCodec] fourcc " + fourcc +
                      " is lossy; recovery relies on the redundancy factor");
    }

    std::vector<cv::Mat> frames = apply(runs);

    TempFile tmp(options_.video_container);
    const cv::Mat& head = frames.front();
    cv::VideoWriter writer(tmp.path(),
                           cv::VideoWriter::fourcc(fourcc[0], fourcc[1], fourcc[2], fourcc[3]),
                           fps_, head.size(), head.channels() > 1);
    if (!writer.isOpened()) {
        throw StegoError(ErrorKind::UnsupportedSubformat,
                         "no video encoder for " + fourcc + " in " + options_.video_container);
    }
    for (const auto& f : frames) {
        writer.write(f);
    }
    writer.release();

    std::vector<uint8_t> encoded = tmp.read();
    VEIL_LOG_DEBUG("[VideoCodec] encoded " + std::to_string(frames.size()) + " frames, " +
                   std::to_string(encoded.size()) + " bytes");
    return encoded;
}

} // namespace veil
