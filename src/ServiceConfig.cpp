#include "ServiceConfig.h"
#include "Errors.h"

#include <opencv2/core/utils/logger.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <map>

namespace SpriteExtractor {

namespace {

static const std::map<std::string, cv::utils::logging::LogLevel>& logLevels() {
    static const std::map<std::string, cv::utils::logging::LogLevel> levels = {
        {"silent", cv::utils::logging::LOG_LEVEL_SILENT},
        {"fatal", cv::utils::logging::LOG_LEVEL_FATAL},
        {"error", cv::utils::logging::LOG_LEVEL_ERROR},
        {"warning", cv::utils::logging::LOG_LEVEL_WARNING},
        {"info", cv::utils::logging::LOG_LEVEL_INFO},
        {"debug", cv::utils::logging::LOG_LEVEL_DEBUG},
        {"verbose", cv::utils::logging::LOG_LEVEL_VERBOSE},
    };
    return levels;
}

// Optional integer key; floats and values beyond int64 are rejected instead of narrowed.
static std::int64_t readInteger(const nlohmann::json& j, const char* key, std::int64_t fallback) {
    const auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (!it->is_number_integer()) throw ConfigError(std::string(key) + " must be an integer");
    if (it->is_number_unsigned() &&
        it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw ConfigError(std::string(key) + " is out of range");
    }
    return it->get<std::int64_t>();
}

static int readBoundedInt(const nlohmann::json& j, const char* key, int fallback, int lo, int hi) {
    const std::int64_t value = readInteger(j, key, fallback);
    if (value < lo || value > hi) {
        throw ConfigError(std::string(key) + " must be in [" + std::to_string(lo) + ", " + std::to_string(hi) + "], got " +
                          std::to_string(value));
    }
    return static_cast<int>(value);
}

} // namespace

void ServiceConfig::validate() const {
    if (workerCount == 0 || workerCount > 64) {
        throw ConfigError("worker_count must be in [1, 64], got " + std::to_string(workerCount));
    }
    if (maxRetries < 0 || maxRetries > 1) {
        throw ConfigError("max_retries must be 0 or 1, got " + std::to_string(maxRetries));
    }
    if (retentionSeconds < 0 || retentionSeconds > kMaxRetentionSeconds) {
        throw ConfigError("retention_seconds must be in [0, " + std::to_string(kMaxRetentionSeconds) + "], got " +
                          std::to_string(retentionSeconds));
    }
    if (floodDiff < 0 || floodDiff > 255) throw ConfigError("flood_diff must be in [0, 255]");
    if (scratchRoot.empty() || resultRoot.empty() || uploadRoot.empty()) {
        throw ConfigError("scratch_root, result_root and upload_root must be set");
    }
    if (logLevels().count(logLevel) == 0) throw ConfigError("unknown log_level '" + logLevel + "'");
}

ServiceConfig ServiceConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("service configuration must be a JSON object");

    ServiceConfig cfg;
    try {
        cfg.workerCount = static_cast<unsigned>(readBoundedInt(j, "worker_count", static_cast<int>(cfg.workerCount), 1, 64));
        cfg.scratchRoot = j.value("scratch_root", cfg.scratchRoot.string());
        cfg.resultRoot = j.value("result_root", cfg.resultRoot.string());
        cfg.uploadRoot = j.value("upload_root", cfg.uploadRoot.string());
        cfg.maxRetries = readBoundedInt(j, "max_retries", cfg.maxRetries, 0, 1);
        cfg.retentionSeconds = readInteger(j, "retention_seconds", cfg.retentionSeconds);
        cfg.keepInputs = j.value("keep_inputs", cfg.keepInputs);
        cfg.logLevel = j.value("log_level", cfg.logLevel);
        cfg.floodDiff = readBoundedInt(j, "flood_diff", cfg.floodDiff, 0, 255);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid service configuration: ") + e.what());
    }
    cfg.validate();
    return cfg;
}

ServiceConfig ServiceConfig::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open service configuration " + path.string());

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse " + path.string() + ": " + e.what());
    }
    return fromJson(j);
}

void applyLogLevel(const std::string& level) {
    const auto it = logLevels().find(level);
    if (it == logLevels().end()) throw ConfigError("unknown log_level '" + level + "'");
    cv::utils::logging::setLogLevel(it->second);
}

} // namespace SpriteExtractor
