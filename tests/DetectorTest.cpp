#include <gtest/gtest.h>

#include <memory>

#include "FakeBackend.hpp"
#include "detect/DetectorFactory.hpp"
#include "detect/DetectorHash.hpp"
#include "detect/DetectorPixel.hpp"
#include "detect/DetectorSize.hpp"

namespace roiwatch {
namespace {

class AllDetectorsTest : public ::testing::TestWithParam<DetectionKind> {};

TEST_P(AllDetectorsTest, IdenticalFramesNeverChange) {
    auto detector = CreateDetector(GetParam());
    ASSERT_NE(detector, nullptr);
    Frame a = pngFrame(solidImage(64, 48, kGrey));
    Frame b = pngFrame(solidImage(64, 48, kGrey));
    for (double threshold : {0.0, 0.5, 20.0, 100.0, 1000.0}) {
        Verdict v = detector->compare(a, b, threshold);
        EXPECT_FALSE(v.changed) << "threshold " << threshold;
        EXPECT_EQ(v.magnitude, 0.0);
        EXPECT_EQ(v.strategy, detectionKindToString(GetParam()));
    }
}

INSTANTIATE_TEST_SUITE_P(Kinds, AllDetectorsTest,
                         ::testing::Values(DetectionKind::Size,
                                           DetectionKind::Pixel,
                                           DetectionKind::Hash));

TEST(SizeDetectorTest, ThresholdIsStrict) {
    auto detector = CreateDetectorSize();
    Frame base = rawFrame(100);
    Frame grown = rawFrame(120);

    Verdict v = detector->compare(base, grown, 20.0);
    EXPECT_FALSE(v.changed);
    EXPECT_DOUBLE_EQ(v.magnitude, 20.0);

    EXPECT_TRUE(detector->compare(base, grown, 19.9).changed);
    EXPECT_TRUE(detector->compare(base, rawFrame(80), 19.9).changed);
}

TEST(SizeDetectorTest, EmptyBaselineDoesNotDivideByZero) {
    auto detector = CreateDetectorSize();
    Verdict v = detector->compare(rawFrame(0), rawFrame(3), 50.0);
    EXPECT_TRUE(v.changed);
    EXPECT_DOUBLE_EQ(v.magnitude, 300.0);
}

TEST(PixelDetectorTest, BlackToWhiteIsMaximal) {
    auto detector = CreateDetectorPixel();
    Frame black = pngFrame(solidImage(64, 64, kBlack));
    Frame white = pngFrame(solidImage(64, 64, kWhite));
    Verdict v = detector->compare(black, white, 50.0);
    EXPECT_TRUE(v.changed);
    EXPECT_DOUBLE_EQ(v.magnitude, 100.0);
}

TEST(PixelDetectorTest, MagnitudeScalesWithChannelDifference) {
    auto detector = CreateDetectorPixel();
    Frame black = pngFrame(solidImage(40, 40, kBlack));
    Frame grey = pngFrame(solidImage(40, 40, kGrey));
    Verdict v = detector->compare(black, grey, 50.0);
    EXPECT_NEAR(v.magnitude, 128.0 / 255.0 * 100.0, 1e-9);
    EXPECT_TRUE(v.changed);
    EXPECT_FALSE(detector->compare(black, grey, 51.0).changed);
}

TEST(PixelDetectorTest, ImagesSmallerThanGrid) {
    auto detector = CreateDetectorPixel();
    Frame black = pngFrame(solidImage(12, 10, kBlack));
    Frame white = pngFrame(solidImage(12, 10, kWhite));
    EXPECT_DOUBLE_EQ(detector->compare(black, white, 0.0).magnitude, 100.0);
}

TEST(PixelDetectorTest, DimensionMismatchIsChanged) {
    auto detector = CreateDetectorPixel();
    Frame small = pngFrame(solidImage(32, 32, kBlack));
    Frame large = pngFrame(solidImage(64, 32, kBlack));
    Verdict v = detector->compare(small, large, 100.0);
    EXPECT_TRUE(v.changed);
    EXPECT_DOUBLE_EQ(v.magnitude, 100.0);
}

TEST(PixelDetectorTest, UndecodableFrameIsChanged) {
    auto detector = CreateDetectorPixel();
    Frame good = pngFrame(solidImage(10, 10, kBlack));
    Frame garbage = rawFrame(64, 0x5a);
    Verdict v = detector->compare(good, garbage, 100.0);
    EXPECT_TRUE(v.changed);
    EXPECT_DOUBLE_EQ(v.magnitude, 100.0);
}

TEST(HashDetectorTest, AnyByteDifferenceIsMaximal) {
    auto detector = CreateDetectorHash();
    Frame a = rawFrame(64, 1);
    Frame b = rawFrame(64, 1);
    b.bytes[63] = 2;
    for (double threshold : {0.0, 50.0, 100.0}) {
        Verdict v = detector->compare(a, b, threshold);
        EXPECT_TRUE(v.changed);
        EXPECT_DOUBLE_EQ(v.magnitude, 100.0);
    }
}

TEST(HashDetectorTest, HashIsStable) {
    std::vector<std::uint8_t> bytes{1, 2, 3, 4};
    EXPECT_EQ(hashPayload(bytes), hashPayload(bytes));
    EXPECT_NE(hashPayload(bytes), hashPayload({1, 2, 3, 5}));
}

TEST(DetectorFactoryTest, ParsesNames) {
    DetectionKind kind = DetectionKind::Size;
    EXPECT_TRUE(parseDetectionKind("pixel", kind));
    EXPECT_EQ(kind, DetectionKind::Pixel);
    EXPECT_TRUE(parseDetectionKind("hash", kind));
    EXPECT_EQ(kind, DetectionKind::Hash);
    EXPECT_TRUE(parseDetectionKind("size", kind));
    EXPECT_EQ(kind, DetectionKind::Size);
    EXPECT_FALSE(parseDetectionKind("ssim", kind));
    EXPECT_FALSE(describeDetectionKinds().empty());
}

}  // namespace
}  // namespace roiwatch
