/**
 * @file test_image_codec.cpp
 * @brief LSB image codec on synthesized PNG carriers
 */

#include <gtest/gtest.h>
#include "veil_image_codec.hpp"
#include "veil_errors.hpp"
#include "carrier_fixtures.hpp"

#include <opencv2/imgcodecs.hpp>

using namespace veil;
using namespace veil::fixtures;

class ImageCodecTest : public ::testing::Test {
protected:
    CodecOptions opts;
};

TEST_F(ImageCodecTest, SlotCountIsRowsColsChannels) {
    ImageCodec rgb(make_png(64, 64), opts);
    EXPECT_EQ(rgb.slot_count(), 64u * 64u * 3u);
    EXPECT_EQ(rgb.source_format(), "png");

    ImageCodec gray(make_png(10, 20, CV_8UC1), opts);
    EXPECT_EQ(gray.slot_count(), 200u);

    ImageCodec rgba(make_png(8, 8, CV_8UC4), opts);
    EXPECT_EQ(rgba.slot_count(), 256u);
}

TEST_F(ImageCodecTest, ReadSlotsAreLowBits) {
    cv::Mat img = pattern_image(4, 4);
    ImageCodec codec(img, opts);
    BitStream bits = codec.read_slots(0, codec.slot_count());
    const uint8_t* p = img.ptr<uint8_t>();
    for (size_t i = 0; i < bits.size(); ++i) {
        EXPECT_EQ(bits[i], p[i] & 1);
    }
}

TEST_F(ImageCodecTest, WriteThenReadThroughPng) {
    ImageCodec codec(make_png(32, 32), opts);
    BitStream bits = {1, 0, 0, 1, 1, 1, 0, 1, 0, 0};
    std::vector<SlotRun> runs = {{17, bits}, {500, bits}};

    std::vector<uint8_t> stego = codec.write_slots(runs);
    ImageCodec reread(stego, opts);

    EXPECT_EQ(reread.read_slots(17, bits.size()), bits);
    EXPECT_EQ(reread.read_slots(500, bits.size()), bits);
}

TEST_F(ImageCodecTest, UntouchedSlotsAndHighBitsUnchanged) {
    cv::Mat original = pattern_image(16, 16);
    ImageCodec codec(original, opts);
    std::vector<SlotRun> runs = {{10, BitStream(20, 1)}};

    cv::Mat out = codec.apply(runs);
    const uint8_t* a = original.ptr<uint8_t>();
    const uint8_t* b = out.ptr<uint8_t>();
    for (size_t i = 0; i < codec.slot_count(); ++i) {
        EXPECT_EQ(a[i] & 0xFE, b[i] & 0xFE) << "slot " << i;
        if (i < 10 || i >= 30) {
            EXPECT_EQ(a[i], b[i]) << "slot " << i;
        } else {
            EXPECT_EQ(b[i] & 1, 1);
        }
    }
    // The carrier's own pixels are not modified
    EXPECT_EQ(cv::norm(original, codec.image(), cv::NORM_INF), 0.0);
}

TEST_F(ImageCodecTest, BmpAndTiffOutputsAreLossless) {
    for (const char* fmt : {"bmp", "tiff"}) {
        CodecOptions o;
        o.image_output_format = fmt;
        ImageCodec codec(make_png(16, 16), o);
        BitStream bits(64, 0);
        for (size_t i = 0; i < bits.size(); i += 3) bits[i] = 1;

        ImageCodec reread(codec.write_slots({{0, bits}}), o);
        EXPECT_EQ(reread.read_slots(0, bits.size()), bits) << fmt;
    }
}

TEST_F(ImageCodecTest, LossyOutputRejected) {
    CodecOptions o;
    o.image_output_format = "jpg";
    ImageCodec codec(make_png(8, 8), o);
    try {
        codec.write_slots({{0, BitStream(8, 1)}});
        FAIL() << "jpg output accepted";
    } catch (const StegoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedSubformat);
    }
}

TEST_F(ImageCodecTest, JpegInputAcceptedOutputIsPng) {
    std::vector<uint8_t> jpeg;
    cv::imencode(".jpg", pattern_image(16, 16), jpeg);
    ImageCodec codec(jpeg, opts);
    EXPECT_EQ(codec.source_format(), "jpeg");

    std::vector<uint8_t> out = codec.write_slots({{0, BitStream(8, 1)}});
    EXPECT_EQ(ImageCodec::sniff(out.data(), out.size()), "png");
}

TEST_F(ImageCodecTest, SixteenBitRejected) {
    cv::Mat deep(8, 8, CV_16UC3, cv::Scalar::all(1000));
    std::vector<uint8_t> png;
    cv::imencode(".png", deep, png);
    try {
        ImageCodec codec(png, opts);
        FAIL() << "16-bit image accepted";
    } catch (const StegoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedSubformat);
    }
}

TEST_F(ImageCodecTest, GarbageRejected) {
    std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
    try {
        ImageCodec codec(garbage, opts);
        FAIL() << "garbage accepted";
    } catch (const StegoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedCarrierFormat);
    }

    // Valid signature, broken body
    std::vector<uint8_t> broken = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n', 0, 0, 0};
    EXPECT_THROW(ImageCodec(broken, opts), StegoError);
}

TEST_F(ImageCodecTest, RunPastEndRejected) {
    ImageCodec codec(make_png(4, 4), opts);
    try {
        codec.write_slots({{40, BitStream(10, 1)}});
        FAIL() << "run past end accepted";
    } catch (const StegoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CarrierTooSmall);
    }
    EXPECT_THROW(codec.read_slots(40, 10), std::out_of_range);
}
