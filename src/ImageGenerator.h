#pragma once

#include <opencv2/opencv.hpp>

#include <string>

namespace SpriteExtractor {

/// 文字生成图像的协作方。实现负责调用具体模型；拿不到图像时抛出 `GenerationError`
/// （瞬时错误，任务会重试一次）。返回 1/3/4 通道的 8-bit 图像均可。
/// 实现必须可被多个 worker 线程同时调用。
class ImageGenerator {
public:
    virtual ~ImageGenerator() = default;

    virtual cv::Mat generate(const std::string& prompt, const std::string& modelId) = 0;
};

inline constexpr const char* kDefaultModelAlias = "nano-banana";

/// 为生成 sprite sheet 补充提示词：缺少背景/风格/分离相关关键字时依次追加
/// "with transparent or solid color background"、"game sprite style"、"clearly isolated elements"。
/// 关键字匹配不区分大小写；全部已包含时原样返回。
std::string optimizeSpritePrompt(const std::string& prompt);

/// 模型别名 → 模型 id：`nano-banana` → `gemini-2.5-flash-image`，
/// `nano-banana-pro` → `gemini-3-pro-image-preview`，未知别名回落到默认模型。
std::string resolveModelId(const std::string& alias);

} // namespace SpriteExtractor
