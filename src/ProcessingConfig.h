#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace SpriteExtractor {

enum class PartitionMode { Auto, Grid };

// How the merge step measures the distance between two bounding boxes.
enum class GapMetric { EdgeToEdge, Centroid };

/// 输出画布尺寸。
/// maxSide > 0 时额外限制精灵缩放后的长边（对应旧版三元组预设 [maxSide, width, height]）；
/// maxSide == 0 表示只要求“装进画布”。
struct OutputSize {
    std::string name;
    int width = 0;
    int height = 0;
    int maxSide = 0;

    bool operator==(const OutputSize& other) const {
        return name == other.name && width == other.width && height == other.height && maxSide == other.maxSide;
    }
};

// {large:256x256, medium:128x128, small:64x64}
std::vector<OutputSize> defaultOutputSizes();

/// 单个任务的全部处理参数（显式枚举所有可识别选项，构造后立即校验）。
///
/// JSON 形式即提交接口的参数集合：
/// ```
/// { "mode": "auto"|"grid", "alpha_threshold": 50, "distance_threshold": 80,
///   "size_ratio_threshold": 0.4, "min_area_ratio": 0.0005, "max_area_ratio": 0.25,
///   "auto_detect": false, "rows": 1, "cols": 1, "padding": 0,
///   "line_threshold": 100, "min_line_length_ratio": 0.5,
///   "output_sizes": { "large": [256, 256], "banner": [100, 200, 100] } }
/// ```
/// 另外支持：connectivity, gap_metric, max_aspect_ratio, close_gaps, crop_padding,
/// isolate_regions, allow_upscale, skip_empty_cells, include_originals, remove_background。
/// 未知键、类型错误、越界值都会抛出 `ConfigError`。
struct ProcessingConfig {
    PartitionMode mode = PartitionMode::Auto;

    // Mask / detection
    int alphaThreshold = 50;          // 1..254
    int connectivity = 8;             // 4 or 8
    bool closeGaps = false;           // 3x3 closing before labelling

    // Merge / filter
    int distanceThreshold = 80;       // 10..500 px
    GapMetric gapMetric = GapMetric::EdgeToEdge;
    double sizeRatioThreshold = 0.4;  // 0.1..1.0
    double minAreaRatio = 0.0005;     // 0.0001..0.1
    double maxAreaRatio = 0.25;       // 0.05..0.9
    double maxAspectRatio = 20.0;     // 1..100

    // Grid
    bool autoDetect = false;
    int rows = 1;                     // 1..256
    int cols = 1;                     // 1..256
    int padding = 0;                  // px trimmed from each cell edge
    int lineThreshold = 100;          // 10..200, Hough accumulator votes
    double minLineLengthRatio = 0.5;  // 0.1..1.0
    bool skipEmptyCells = false;

    // Export
    std::vector<OutputSize> outputSizes = defaultOutputSizes();
    int cropPadding = 0;
    bool isolateRegions = false;
    bool allowUpscale = false;
    bool includeOriginals = false;
    bool includeDebug = false;        // background-removal result and detection overlay at the archive root

    // Background removal collaborator is skipped when false and the input already has alpha.
    bool removeBackground = true;

    void validate() const;

    static ProcessingConfig fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;
};

// Directory name used for unscaled crops when includeOriginals is set.
inline constexpr const char* kOriginalSpritesDir = "original_sprites";

// Archive-root files written when includeDebug is set.
inline constexpr const char* kBackgroundRemovalDebugFile = "debug_background_removal.png";
inline constexpr const char* kDetectionVisualizationFile = "detection_visualization.jpg";

std::string toString(PartitionMode mode);
std::string toString(GapMetric metric);

} // namespace SpriteExtractor
