#include "BackgroundRemover.h"
#include "Errors.h"
#include "ImageGenerator.h"

#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>

namespace SpriteExtractor {
namespace gtest {

TEST(FloodFillBackgroundRemover, WritesBackgroundAsTransparent) {
    cv::Mat image(50, 50, CV_8UC3, cv::Scalar(250, 250, 250));
    cv::rectangle(image, cv::Rect(10, 10, 20, 20), cv::Scalar(0, 0, 200), cv::FILLED);

    FloodFillBackgroundRemover remover;
    const cv::Mat out = remover.removeBackground(image);
    ASSERT_EQ(out.type(), CV_8UC4);
    ASSERT_EQ(out.size(), image.size());
    EXPECT_EQ(out.at<cv::Vec4b>(0, 0)[3], 0);
    EXPECT_EQ(out.at<cv::Vec4b>(20, 20), cv::Vec4b(0, 0, 200, 255));

    cv::Mat alpha;
    cv::extractChannel(out, alpha, 3);
    EXPECT_EQ(cv::countNonZero(alpha), 400);
}

TEST(FloodFillBackgroundRemover, PassesAlphaImagesThrough) {
    cv::Mat image(8, 8, CV_8UC4, cv::Scalar(1, 2, 3, 77));
    FloodFillBackgroundRemover remover;
    const cv::Mat out = remover.removeBackground(image);
    EXPECT_EQ(cv::norm(out, image, cv::NORM_INF), 0.0);
}

TEST(FloodFillBackgroundRemover, RejectsUnsupportedInput) {
    FloodFillBackgroundRemover remover;
    EXPECT_THROW(remover.removeBackground(cv::Mat()), RemovalError);
    EXPECT_THROW(remover.removeBackground(cv::Mat(4, 4, CV_32FC3, cv::Scalar::all(0.5))), RemovalError);
    EXPECT_THROW(remover.removeBackground(cv::Mat(4, 4, CV_8UC2, cv::Scalar::all(0))), RemovalError);
}

TEST(ImageGenerator, PromptGetsSpriteHints) {
    EXPECT_EQ(optimizeSpritePrompt("a knight"),
              "a knight, with transparent or solid color background, game sprite style, clearly isolated elements");
    EXPECT_EQ(optimizeSpritePrompt("Game icons on a white BACKGROUND"), "Game icons on a white BACKGROUND, clearly isolated elements");
    const std::string complete = "separate sprite potions, transparent";
    EXPECT_EQ(optimizeSpritePrompt(complete), complete);
}

TEST(ImageGenerator, ModelAliases) {
    EXPECT_EQ(resolveModelId("nano-banana"), "gemini-2.5-flash-image");
    EXPECT_EQ(resolveModelId("nano-banana-pro"), "gemini-3-pro-image-preview");
    EXPECT_EQ(resolveModelId("something-else"), "gemini-2.5-flash-image");
    EXPECT_EQ(resolveModelId(kDefaultModelAlias), "gemini-2.5-flash-image");
}

} // namespace gtest
} // namespace SpriteExtractor
