#include "ProcessingConfig.h"
#include "Errors.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <set>
#include <sstream>

namespace SpriteExtractor {

namespace {

constexpr int kMaxGridDim = 256;
constexpr int kMaxCanvasPx = 4096;
constexpr int kMaxCropPadding = 512;

template <typename T>
static void requireRange(const char* key, T value, T lo, T hi) {
    if (value < lo || value > hi) {
        std::ostringstream os;
        os << key << " must be in [" << lo << ", " << hi << "], got " << value;
        throw ConfigError(os.str());
    }
}

// Integer-valued JSON number that fits in an int. Floats and wider values are rejected, not narrowed.
static int readInt(const std::string& key, const nlohmann::json& value) {
    if (!value.is_number_integer()) throw ConfigError(key + " must be an integer");
    if (value.is_number_unsigned() && value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        throw ConfigError(key + " is out of range");
    }
    const std::int64_t wide = value.get<std::int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        throw ConfigError(key + " is out of range");
    }
    return static_cast<int>(wide);
}

static bool isValidSizeName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return std::none_of(name.begin(), name.end(), [](char ch) {
        return ch == '/' || ch == '\\' || ch == ':' || static_cast<unsigned char>(ch) < 0x20;
    });
}

static OutputSize parseOutputSize(const std::string& name, const nlohmann::json& value) {
    if (!value.is_array() || (value.size() != 2 && value.size() != 3)) {
        throw ConfigError("output_sizes." + name + " must be [width, height] or [max_side, width, height]");
    }
    const std::string key = "output_sizes." + name;
    OutputSize size;
    size.name = name;
    if (value.size() == 2) {
        size.width = readInt(key, value[0]);
        size.height = readInt(key, value[1]);
    } else {
        size.maxSide = readInt(key, value[0]);
        size.width = readInt(key, value[1]);
        size.height = readInt(key, value[2]);
    }
    return size;
}

} // namespace

std::vector<OutputSize> defaultOutputSizes() {
    return {
        {"large", 256, 256, 0},
        {"medium", 128, 128, 0},
        {"small", 64, 64, 0},
    };
}

std::string toString(PartitionMode mode) {
    return mode == PartitionMode::Grid ? "grid" : "auto";
}

std::string toString(GapMetric metric) {
    return metric == GapMetric::Centroid ? "centroid" : "edge";
}

void ProcessingConfig::validate() const {
    requireRange("alpha_threshold", alphaThreshold, 1, 254);
    if (connectivity != 4 && connectivity != 8) {
        throw ConfigError("connectivity must be 4 or 8, got " + std::to_string(connectivity));
    }
    requireRange("distance_threshold", distanceThreshold, 10, 500);
    requireRange("size_ratio_threshold", sizeRatioThreshold, 0.1, 1.0);
    requireRange("min_area_ratio", minAreaRatio, 0.0001, 0.1);
    requireRange("max_area_ratio", maxAreaRatio, 0.05, 0.9);
    if (minAreaRatio > maxAreaRatio) {
        throw ConfigError("min_area_ratio must not exceed max_area_ratio");
    }
    requireRange("max_aspect_ratio", maxAspectRatio, 1.0, 100.0);

    requireRange("rows", rows, 1, kMaxGridDim);
    requireRange("cols", cols, 1, kMaxGridDim);
    requireRange("padding", padding, 0, kMaxCropPadding);
    requireRange("line_threshold", lineThreshold, 10, 200);
    requireRange("min_line_length_ratio", minLineLengthRatio, 0.1, 1.0);

    requireRange("crop_padding", cropPadding, 0, kMaxCropPadding);

    if (outputSizes.empty()) throw ConfigError("output_sizes must not be empty");
    std::set<std::string> names;
    for (const auto& size : outputSizes) {
        if (!isValidSizeName(size.name)) throw ConfigError("invalid output size name '" + size.name + "'");
        if (!names.insert(size.name).second) throw ConfigError("duplicate output size name '" + size.name + "'");
        requireRange(("output_sizes." + size.name + " width").c_str(), size.width, 1, kMaxCanvasPx);
        requireRange(("output_sizes." + size.name + " height").c_str(), size.height, 1, kMaxCanvasPx);
        requireRange(("output_sizes." + size.name + " max_side").c_str(), size.maxSide, 0, kMaxCanvasPx);
    }
    if (includeOriginals && names.count(kOriginalSpritesDir) > 0) {
        throw ConfigError(std::string("output size name '") + kOriginalSpritesDir + "' is reserved when include_originals is set");
    }
    if (includeDebug) {
        for (const char* reserved : {kBackgroundRemovalDebugFile, kDetectionVisualizationFile}) {
            if (names.count(reserved) > 0) {
                throw ConfigError(std::string("output size name '") + reserved + "' is reserved when include_debug is set");
            }
        }
    }
}

ProcessingConfig ProcessingConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("parameters must be a JSON object");

    ProcessingConfig cfg;
    try {
        for (const auto& [key, value] : j.items()) {
            if (key == "mode") {
                const std::string mode = value.get<std::string>();
                if (mode == "auto") cfg.mode = PartitionMode::Auto;
                else if (mode == "grid") cfg.mode = PartitionMode::Grid;
                else throw ConfigError("mode must be \"auto\" or \"grid\", got \"" + mode + "\"");
            } else if (key == "alpha_threshold") {
                cfg.alphaThreshold = readInt(key, value);
            } else if (key == "connectivity") {
                cfg.connectivity = readInt(key, value);
            } else if (key == "close_gaps") {
                cfg.closeGaps = value.get<bool>();
            } else if (key == "distance_threshold") {
                cfg.distanceThreshold = readInt(key, value);
            } else if (key == "gap_metric") {
                const std::string metric = value.get<std::string>();
                if (metric == "edge") cfg.gapMetric = GapMetric::EdgeToEdge;
                else if (metric == "centroid") cfg.gapMetric = GapMetric::Centroid;
                else throw ConfigError("gap_metric must be \"edge\" or \"centroid\", got \"" + metric + "\"");
            } else if (key == "size_ratio_threshold") {
                cfg.sizeRatioThreshold = value.get<double>();
            } else if (key == "min_area_ratio") {
                cfg.minAreaRatio = value.get<double>();
            } else if (key == "max_area_ratio") {
                cfg.maxAreaRatio = value.get<double>();
            } else if (key == "max_aspect_ratio") {
                cfg.maxAspectRatio = value.get<double>();
            } else if (key == "auto_detect") {
                cfg.autoDetect = value.get<bool>();
            } else if (key == "rows") {
                cfg.rows = readInt(key, value);
            } else if (key == "cols") {
                cfg.cols = readInt(key, value);
            } else if (key == "padding") {
                cfg.padding = readInt(key, value);
            } else if (key == "line_threshold") {
                cfg.lineThreshold = readInt(key, value);
            } else if (key == "min_line_length_ratio") {
                cfg.minLineLengthRatio = value.get<double>();
            } else if (key == "skip_empty_cells") {
                cfg.skipEmptyCells = value.get<bool>();
            } else if (key == "output_sizes") {
                if (!value.is_object()) throw ConfigError("output_sizes must be an object of name -> [width, height]");
                cfg.outputSizes.clear();
                for (const auto& [name, dims] : value.items()) {
                    cfg.outputSizes.push_back(parseOutputSize(name, dims));
                }
            } else if (key == "crop_padding") {
                cfg.cropPadding = readInt(key, value);
            } else if (key == "isolate_regions") {
                cfg.isolateRegions = value.get<bool>();
            } else if (key == "allow_upscale") {
                cfg.allowUpscale = value.get<bool>();
            } else if (key == "include_originals") {
                cfg.includeOriginals = value.get<bool>();
            } else if (key == "include_debug") {
                cfg.includeDebug = value.get<bool>();
            } else if (key == "remove_background") {
                cfg.removeBackground = value.get<bool>();
            } else {
                throw ConfigError("unknown parameter '" + key + "'");
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid parameter type: ") + e.what());
    }

    cfg.validate();
    return cfg;
}

nlohmann::json ProcessingConfig::toJson() const {
    nlohmann::json sizes = nlohmann::json::object();
    for (const auto& size : outputSizes) {
        if (size.maxSide > 0) sizes[size.name] = {size.maxSide, size.width, size.height};
        else sizes[size.name] = {size.width, size.height};
    }

    return {
        {"mode", toString(mode)},
        {"alpha_threshold", alphaThreshold},
        {"connectivity", connectivity},
        {"close_gaps", closeGaps},
        {"distance_threshold", distanceThreshold},
        {"gap_metric", toString(gapMetric)},
        {"size_ratio_threshold", sizeRatioThreshold},
        {"min_area_ratio", minAreaRatio},
        {"max_area_ratio", maxAreaRatio},
        {"max_aspect_ratio", maxAspectRatio},
        {"auto_detect", autoDetect},
        {"rows", rows},
        {"cols", cols},
        {"padding", padding},
        {"line_threshold", lineThreshold},
        {"min_line_length_ratio", minLineLengthRatio},
        {"skip_empty_cells", skipEmptyCells},
        {"output_sizes", sizes},
        {"crop_padding", cropPadding},
        {"isolate_regions", isolateRegions},
        {"allow_upscale", allowUpscale},
        {"include_originals", includeOriginals},
        {"include_debug", includeDebug},
        {"remove_background", removeBackground},
    };
}

} // namespace SpriteExtractor
