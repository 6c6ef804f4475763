#include "Errors.h"
#include "SpriteExporter.h"

#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>

namespace SpriteExtractor {
namespace gtest {

cv::Mat opaqueCrop(int w, int h) {
    return cv::Mat(h, w, CV_8UC4, cv::Scalar(20, 120, 220, 255));
}

//! Bounding box of the non-transparent pixels of a BGRA image.
cv::Rect opaqueBox(const cv::Mat& bgra) {
    cv::Mat alpha;
    cv::extractChannel(bgra, alpha, 3);
    return cv::boundingRect(alpha);
}

TEST(SpriteExporter, EveryAssetHasExactCanvasSize) {
    const std::vector<OutputSize> sizes = {{"wide", 200, 50, 0}, {"tall", 30, 90, 0}, {"tiny", 1, 1, 0}, {"capped", 128, 128, 16}};
    for (const cv::Size cropSize : {cv::Size(1, 1), cv::Size(300, 20), cv::Size(7, 400), cv::Size(64, 64)}) {
        const auto assets = SpriteExporter::exportSizes(opaqueCrop(cropSize.width, cropSize.height), 0, sizes);
        ASSERT_EQ(assets.size(), sizes.size());
        for (size_t k = 0; k < sizes.size(); ++k) {
            EXPECT_EQ(assets[k].sizeName, sizes[k].name);
            EXPECT_EQ(assets[k].image.type(), CV_8UC4);
            EXPECT_EQ(assets[k].image.cols, sizes[k].width);
            EXPECT_EQ(assets[k].image.rows, sizes[k].height);
        }
    }
}

TEST(SpriteExporter, SmallSpriteIsCentredWithoutUpscaling) {
    const cv::Mat out = SpriteExporter::fitToCanvas(opaqueCrop(40, 40), {"large", 64, 64, 0});
    EXPECT_EQ(opaqueBox(out), cv::Rect(12, 12, 40, 40));
    EXPECT_EQ(out.at<cv::Vec4b>(0, 0)[3], 0);
    EXPECT_EQ(out.at<cv::Vec4b>(63, 63)[3], 0);
    EXPECT_EQ(out.at<cv::Vec4b>(32, 32), cv::Vec4b(20, 120, 220, 255));
}

TEST(SpriteExporter, UpscaleWhenAllowed) {
    const cv::Mat out = SpriteExporter::fitToCanvas(opaqueCrop(40, 20), {"large", 64, 64, 0}, /*allowUpscale=*/true);
    EXPECT_EQ(opaqueBox(out), cv::Rect(0, 16, 64, 32));
}

TEST(SpriteExporter, ShrinkKeepsAspectRatio) {
    const cv::Mat out = SpriteExporter::fitToCanvas(opaqueCrop(200, 100), {"small", 64, 64, 0});
    EXPECT_EQ(opaqueBox(out), cv::Rect(0, 16, 64, 32));
}

TEST(SpriteExporter, MaxSideCapsTheLongerSide) {
    const cv::Mat out = SpriteExporter::fitToCanvas(opaqueCrop(100, 50), {"icon", 64, 64, 32});
    EXPECT_EQ(out.size(), cv::Size(64, 64));
    EXPECT_EQ(opaqueBox(out), cv::Rect(16, 24, 32, 16));
}

TEST(SpriteExporter, OutputIsDeterministic) {
    cv::Mat crop(37, 53, CV_8UC4);
    cv::randu(crop, cv::Scalar::all(0), cv::Scalar::all(255));
    const OutputSize size{"medium", 24, 24, 0};

    const cv::Mat a = SpriteExporter::fitToCanvas(crop, size);
    const cv::Mat b = SpriteExporter::fitToCanvas(crop, size);
    EXPECT_EQ(cv::norm(a, b, cv::NORM_INF), 0.0);
}

TEST(SpriteExporter, ExportAllIsSpriteMajor) {
    const std::vector<cv::Mat> crops = {opaqueCrop(10, 10), opaqueCrop(20, 5), opaqueCrop(3, 30)};
    const std::vector<OutputSize> sizes = {{"a", 16, 16, 0}, {"b", 8, 8, 0}};

    const auto assets = SpriteExporter::exportAll(crops, sizes);
    ASSERT_EQ(assets.size(), 6u);
    for (size_t i = 0; i < assets.size(); ++i) {
        EXPECT_EQ(assets[i].spriteIndex, static_cast<int>(i / 2));
        EXPECT_EQ(assets[i].sizeName, sizes[i % 2].name);
    }
}

TEST(SpriteExporter, EmptyCropIsRejected) {
    EXPECT_THROW(SpriteExporter::fitToCanvas(cv::Mat(), {"large", 64, 64, 0}), ConfigError);
    EXPECT_THROW(SpriteExporter::exportAll({cv::Mat()}, defaultOutputSizes()), ConfigError);
}

TEST(SpriteExporter, SpriteNamesArePadded) {
    EXPECT_EQ(SpriteExporter::spriteName(0, 2), "sprite_000");
    EXPECT_EQ(SpriteExporter::spriteName(42, 100), "sprite_042");
    EXPECT_EQ(SpriteExporter::spriteName(999, 1000), "sprite_999");
    EXPECT_EQ(SpriteExporter::spriteName(7, 1001), "sprite_0007");
}

} // namespace gtest
} // namespace SpriteExtractor
