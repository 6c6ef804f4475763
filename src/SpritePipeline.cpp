#include "SpritePipeline.h"
#include "Errors.h"
#include "ForegroundMask.h"
#include "GridPartitioner.h"
#include "RegionDetector.h"
#include "RegionMerger.h"
#include "SpriteExporter.h"

#include <opencv2/core/utils/logger.hpp>

#include <system_error>

namespace fs = std::filesystem;

namespace SpriteExtractor {

namespace {

static cv::Mat to8Bit(const cv::Mat& image) {
    switch (image.depth()) {
    case CV_8U:
        return image;
    case CV_16U: {
        cv::Mat out;
        image.convertTo(out, CV_8U, 1.0 / 257.0);
        return out;
    }
    default:
        throw SpriteError("unsupported image depth " + std::to_string(image.depth()));
    }
}

static void writeImage(const fs::path& path, const cv::Mat& image) {
    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), image);
    } catch (const cv::Exception& e) {
        throw PackagingError("cannot write " + path.string() + ": " + e.what());
    }
    if (!ok) throw PackagingError("cannot write " + path.string());
}

} // namespace

SpritePipeline::SpritePipeline(const ProcessingConfig& config, BackgroundRemover& remover) : m_config(config), m_remover(remover) {
    m_config.validate();
}

cv::Mat SpritePipeline::prepareSource(const cv::Mat& input) const {
    if (input.empty()) throw SpriteError("input image is empty");

    const cv::Mat image = to8Bit(input);
    if (image.channels() == 4 && !m_config.removeBackground) return image;

    cv::Mat bgra = m_remover.removeBackground(image);
    if (bgra.empty() || bgra.type() != CV_8UC4) throw RemovalError("background remover did not return an 8-bit BGRA image");
    if (bgra.size() != image.size()) throw RemovalError("background remover changed the image size");
    return bgra;
}

std::vector<Region> SpritePipeline::detectRegions(const cv::Mat& bgra) const {
    cv::Mat mask = SpriteMask::buildAlphaMask(bgra, m_config.alphaThreshold);
    if (m_config.closeGaps) mask = RegionDetector::closeGaps(mask);

    const std::vector<Region> fragments = RegionDetector::detect(mask, m_config.connectivity);
    return RegionMerger::mergeAndFilter(fragments, bgra.size(), MergeFilterParams::from(m_config));
}

cv::Mat SpritePipeline::drawDetections(const cv::Mat& bgra, const std::vector<Region>& regions) {
    cv::Mat vis;
    cv::cvtColor(bgra, vis, cv::COLOR_BGRA2BGR);
    for (const Region& region : regions) {
        const bool merged = region.fragments > 1;
        const cv::Scalar color = merged ? cv::Scalar(0, 255, 0) : cv::Scalar(255, 0, 0);
        cv::rectangle(vis, region.bbox, color, 2);
        if (merged) {
            cv::putText(vis, "M" + std::to_string(region.fragments), cv::Point(region.bbox.x, region.bbox.y - 5),
                        cv::FONT_HERSHEY_SIMPLEX, 0.5, color, 1);
        }
    }
    return vis;
}

std::vector<cv::Mat> SpritePipeline::cropRegions(const cv::Mat& bgra, const std::vector<Region>& regions) const {
    const cv::Rect imageRect(0, 0, bgra.cols, bgra.rows);
    std::vector<cv::Mat> crops;
    crops.reserve(regions.size());
    for (const Region& region : regions) {
        const int pad = m_config.cropPadding;
        const cv::Rect rect = cv::Rect(region.bbox.x - pad, region.bbox.y - pad, region.bbox.width + 2 * pad,
                                       region.bbox.height + 2 * pad) & imageRect;
        cv::Mat crop = bgra(rect).clone();

        if (m_config.isolateRegions && !region.pixelMask.empty()) {
            // Pixels outside every member blob become fully transparent.
            cv::Mat members = cv::Mat::zeros(rect.size(), CV_8UC1);
            region.pixelMask.copyTo(members(cv::Rect(region.bbox.x - rect.x, region.bbox.y - rect.y, region.bbox.width,
                                                     region.bbox.height)));
            crop.setTo(cv::Scalar::all(0), members == 0);
        }
        crops.push_back(crop);
    }
    return crops;
}

std::vector<cv::Mat> SpritePipeline::extractCells(const cv::Mat& bgra) const {
    std::vector<GridCell> cells = GridPartitioner::partition(bgra, GridParams::from(m_config));
    if (m_config.skipEmptyCells) {
        cells = GridPartitioner::dropEmptyCells(cells, SpriteMask::buildAlphaMask(bgra, m_config.alphaThreshold));
    }

    std::vector<cv::Mat> crops;
    crops.reserve(cells.size());
    for (const GridCell& cell : cells) crops.push_back(bgra(cell.rect).clone());
    return crops;
}

std::vector<cv::Mat> SpritePipeline::extractSprites(const cv::Mat& bgra) const {
    if (bgra.type() != CV_8UC4) throw SpriteError("sprite extraction expects an 8-bit BGRA image");
    return m_config.mode == PartitionMode::Grid ? extractCells(bgra) : cropRegions(bgra, detectRegions(bgra));
}

void SpritePipeline::createLayout(const fs::path& outputDir) const {
    std::error_code ec;
    for (const OutputSize& size : m_config.outputSizes) {
        fs::create_directories(outputDir / size.name, ec);
        if (ec) throw PackagingError("cannot create " + (outputDir / size.name).string() + ": " + ec.message());
    }
    if (m_config.includeOriginals) {
        fs::create_directories(outputDir / kOriginalSpritesDir, ec);
        if (ec) throw PackagingError("cannot create " + (outputDir / kOriginalSpritesDir).string() + ": " + ec.message());
    }
}

PipelineResult SpritePipeline::run(const cv::Mat& input, const fs::path& outputDir, const ProgressCallback& progress) {
    auto report = [&](int value) {
        if (progress) progress(value);
    };

    createLayout(outputDir);

    const cv::Mat bgra = prepareSource(input);
    if (m_config.includeDebug) writeImage(outputDir / kBackgroundRemovalDebugFile, bgra);
    report(30);

    std::vector<cv::Mat> crops;
    if (m_config.mode == PartitionMode::Grid) {
        crops = extractCells(bgra);
    } else {
        const std::vector<Region> regions = detectRegions(bgra);
        if (m_config.includeDebug) writeImage(outputDir / kDetectionVisualizationFile, drawDetections(bgra, regions));
        crops = cropRegions(bgra, regions);
    }
    report(50);
    CV_LOG_INFO(NULL, "SpritePipeline: " << crops.size() << " sprites (" << toString(m_config.mode) << " mode, "
                                         << bgra.cols << "x" << bgra.rows << ")");
    if (crops.empty()) throw NoSpritesFoundError();

    const int total = static_cast<int>(crops.size());
    const std::vector<SpriteAsset> assets = SpriteExporter::exportAll(crops, m_config.outputSizes, m_config.allowUpscale);
    for (const SpriteAsset& asset : assets) {
        writeImage(outputDir / asset.sizeName / (SpriteExporter::spriteName(asset.spriteIndex, total) + ".png"), asset.image);
    }
    if (m_config.includeOriginals) {
        for (int i = 0; i < total; ++i) {
            writeImage(outputDir / kOriginalSpritesDir / (SpriteExporter::spriteName(i, total) + ".png"), crops[i]);
        }
    }
    report(80);

    PipelineResult result;
    result.spriteCount = total;
    for (const OutputSize& size : m_config.outputSizes) result.sizeNames.push_back(size.name);
    return result;
}

} // namespace SpriteExtractor
