#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace SpriteExtractor {

// Ten years. Keeps retention comparisons inside steady_clock's nanosecond range.
inline constexpr long long kMaxRetentionSeconds = 10LL * 365 * 24 * 3600;

/// Worker-pool level settings. Loaded once at startup; every key is optional.
///
/// ```
/// { "worker_count": 2, "scratch_root": "data/temp_processing", "result_root": "data/results",
///   "upload_root": "data/uploads", "max_retries": 1, "retention_seconds": 86400,
///   "keep_inputs": false, "log_level": "info", "flood_diff": 5 }
/// ```
struct ServiceConfig {
    unsigned workerCount = 2;
    std::filesystem::path scratchRoot = "data/temp_processing";
    std::filesystem::path resultRoot = "data/results";
    std::filesystem::path uploadRoot = "data/uploads";
    int maxRetries = 1;                 // transient collaborator failures only, 0..1
    long long retentionSeconds = 86400; // finished tasks and archives older than this are purged, 0..kMaxRetentionSeconds
    bool keepInputs = false;            // keep the uploaded source after a terminal state
    std::string logLevel = "info";      // silent|fatal|error|warning|info|debug|verbose
    int floodDiff = 5;                  // tolerance of the built-in background remover

    void validate() const;

    static ServiceConfig fromJson(const nlohmann::json& j);
    static ServiceConfig load(const std::filesystem::path& path);
};

// Applies logLevel to the OpenCV logger.
void applyLogLevel(const std::string& level);

} // namespace SpriteExtractor
