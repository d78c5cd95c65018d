#include "veil_image_codec.hpp"
#include "veil_errors.hpp"
#include "veil_logger.hpp"

#include <opencv2/imgcodecs.hpp>

#include <cstring>
#include <stdexcept>

namespace veil {

namespace {

bool starts_with(const uint8_t* data, size_t len, const char* sig, size_t sig_len) {
    return len >= sig_len && std::memcmp(data, sig, sig_len) == 0;
}

struct OutputEncoding {
    std::string extension;
    std::vector<int> params;
};

OutputEncoding output_encoding(const std::string& format) {
    if (format == "png") {
        return {".png", {cv::IMWRITE_PNG_COMPRESSION, 3}};
    }
    if (format == "bmp") {
        return {".bmp", {}};
    }
    if (format == "tiff" || format == "tif") {
        return {".tiff", {}};
    }
    if (format == "webp-lossless") {
        // quality above 100 selects libwebp's lossless mode
        return {".webp", {cv::IMWRITE_WEBP_QUALITY, 101}};
    }
    if (format == "jpg" || format == "jpeg" || format == "webp") {
        throw StegoError(ErrorKind::UnsupportedSubformat,
                         "lossy image output '" + format + "' would destroy embedded bits");
    }
    throw StegoError(ErrorKind::UnsupportedSubformat, "unknown image output format '" + format + "'");
}

} // namespace

std::string ImageCodec::sniff(const uint8_t* data, size_t len) {
    if (!data) return "";
    if (starts_with(data, len, "\x89PNG\r\n\x1a\n", 8)) return "png";
    if (starts_with(data, len, "\xFF\xD8\xFF", 3))      return "jpeg";
    if (starts_with(data, len, "BM", 2))                return "bmp";
    if (starts_with(data, len, "II*\0", 4) ||
        starts_with(data, len, "MM\0*", 4))             return "tiff";
    if (len >= 12 && starts_with(data, len, "RIFF", 4) &&
        std::memcmp(data + 8, "WEBP", 4) == 0)          return "webp";
    if (len >= 2 && data[0] == 'P' && data[1] >= '1' && data[1] <= '6') return "pnm";
    return "";
}

ImageCodec::ImageCodec(const std::vector<uint8_t>& bytes, const CodecOptions& options)
    : options_(options)
{
    source_format_ = sniff(bytes.data(), bytes.size());
    if (source_format_.empty()) {
        throw StegoError(ErrorKind::UnsupportedCarrierFormat, "unrecognized image signature");
    }

    cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                const_cast<uint8_t*>(bytes.data()));
    cv::Mat decoded;
    try {
        decoded = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw StegoError(ErrorKind::UnsupportedCarrierFormat,
                         std::string("image decoder failed: ") + e.what());
    }
    if (decoded.empty()) {
        throw StegoError(ErrorKind::UnsupportedCarrierFormat,
                         "could not decode " + source_format_ + " image");
    }
    if (source_format_ == "jpeg") {
        VEIL_LOG_WARN("[ImageCodec] JPEG carrier will be re-encoded as " +
                      options_.image_output_format);
    }
    adopt(std::move(decoded));
}

ImageCodec::ImageCodec(cv::Mat image, const CodecOptions& options)
    : source_format_("raw"), options_(options)
{
    if (image.empty()) {
        throw StegoError(ErrorKind::UnsupportedCarrierFormat, "empty image");
    }
    adopt(std::move(image));
}

void ImageCodec::adopt(cv::Mat image) {
    if (image.depth() != CV_8U) {
        throw StegoError(ErrorKind::UnsupportedSubformat,
                         "only 8-bit images are supported (depth " +
                         std::to_string(image.depth()) + ")");
    }
    image_ = image.isContinuous() ? image : image.clone();
    VEIL_LOG_DEBUG("[ImageCodec] " + std::to_string(image_.cols) + "x" +
                   std::to_string(image_.rows) + "x" + std::to_string(image_.channels()) +
                   " " + source_format_);
}

size_t ImageCodec::slot_count() const noexcept {
    return image_.total() * static_cast<size_t>(image_.channels());
}

BitStream ImageCodec::read_slots(size_t first, size_t count) const {
    if (first > slot_count() || count > slot_count() - first) {
        throw std::out_of_range("image slot range out of bounds");
    }
    BitStream bits(count);
    const uint8_t* px = image_.ptr<uint8_t>() + first;
    for (size_t i = 0; i < count; ++i) {
        bits[i] = px[i] & 1;
    }
    return bits;
}

cv::Mat ImageCodec::apply(const std::vector<SlotRun>& runs) const {
    require_runs_fit(runs, slot_count());
    cv::Mat out = image_.clone();
    uint8_t* px = out.ptr<uint8_t>();
    for (const auto& run : runs) {
        uint8_t* p = px + run.first_slot;
        for (size_t i = 0; i < run.bits.size(); ++i) {
            p[i] = static_cast<uint8_t>((p[i] & 0xFE) | (run.bits[i] & 1));
        }
    }
    return out;
}

std::vector<uint8_t> ImageCodec::write_slots(const std::vector<SlotRun>& runs) const {
    OutputEncoding enc = output_encoding(options_.image_output_format);
    cv::Mat out = apply(runs);

    std::vector<uint8_t> encoded;
    bool ok = false;
    try {
        ok = cv::imencode(enc.extension, out, encoded, enc.params);
    } catch (const cv::Exception& e) {
        throw StegoError(ErrorKind::UnsupportedSubformat,
                         "image encoder " + enc.extension + " failed: " + e.what());
    }
    if (!ok) {
        throw StegoError(ErrorKind::UnsupportedSubformat,
                         "image encoder " + enc.extension + " rejected the image");
    }
    return encoded;
}

} // namespace veil
