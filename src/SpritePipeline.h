#pragma once

#include "BackgroundRemover.h"
#include "ProcessingConfig.h"
#include "RegionDetector.h"

#include <opencv2/opencv.hpp>

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace SpriteExtractor {

struct PipelineResult {
    int spriteCount = 0;
    std::vector<std::string> sizeNames; // output size names, in configuration order
};

// Called with the new progress value (30, 50, 80) after each stage.
using ProgressCallback = std::function<void(int)>;

class SpritePipeline {
public:
    /// 单个任务的处理流水线：每个任务用自己的参数新建一个实例，实例之间不共享状态。
    ///
    /// ----------------------------
    /// 原理
    /// ----------------------------
    /// ```
    /// bgra    = prepareSource(input)          // 统一为 8-bit BGRA；无 alpha 或要求去背景时交给 BackgroundRemover
    /// crops   = extractSprites(bgra)          // auto: 掩码 -> 连通域 -> 合并/过滤 -> 阅读顺序
    ///                                         // grid: 行列切分（可自动检测分隔线），可选丢弃空格子
    /// assets  = SpriteExporter::exportAll     // 每个精灵 x 每个输出尺寸
    /// 写出    <outputDir>/<size>/sprite_NNN.png（以及可选的 original_sprites/）
    /// ```
    /// include_debug 时另写两张调试图：去背景结果 `debug_background_removal.png`，
    /// 以及 auto 模式下的检测框叠加 `detection_visualization.jpg`（合并区域绿色并标注 `M<n>`，其余蓝色）。
    /// 没有精灵时抛出 `NoSpritesFoundError`，此时 outputDir 下已经建好所有尺寸目录（空的）。
    SpritePipeline(const ProcessingConfig& config, BackgroundRemover& remover);

    PipelineResult run(const cv::Mat& input, const std::filesystem::path& outputDir, const ProgressCallback& progress = {});

    cv::Mat prepareSource(const cv::Mat& input) const;

    // Crops in reading order. Empty when nothing survives.
    std::vector<cv::Mat> extractSprites(const cv::Mat& bgra) const;

    // Auto mode: merged and filtered regions in reading order.
    std::vector<Region> detectRegions(const cv::Mat& bgra) const;

    // BGR copy of the source with each region's box drawn on it.
    static cv::Mat drawDetections(const cv::Mat& bgra, const std::vector<Region>& regions);

    // One (empty) directory per output size, plus original_sprites/ when enabled.
    void createLayout(const std::filesystem::path& outputDir) const;

    const ProcessingConfig& config() const { return m_config; }

private:
    std::vector<cv::Mat> cropRegions(const cv::Mat& bgra, const std::vector<Region>& regions) const;
    std::vector<cv::Mat> extractCells(const cv::Mat& bgra) const;

    ProcessingConfig m_config;
    BackgroundRemover& m_remover;
};

} // namespace SpriteExtractor
