#pragma once

#include "ProcessingConfig.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace SpriteExtractor {

// PENDING -> (GENERATING) -> PROCESSING -> PACKAGING -> SUCCESS | FAILURE
// A retried task goes back to PENDING and keeps its progress.
enum class TaskState { Pending, Generating, Processing, Packaging, Success, Failure };

std::string toString(TaskState state);
bool isTerminal(TaskState state);

/// 对外可见的任务状态快照。可选字段只在有意义时出现：
/// sprite_count / sizes 只在 SUCCESS，error 只在 FAILURE，message 为附加说明（如 "No sprites found"）。
struct TaskStatus {
    std::string taskId;
    TaskState state = TaskState::Pending;
    int progress = 0;
    std::optional<int> spriteCount;
    std::optional<std::vector<std::string>> sizes;
    std::optional<std::string> error;
    std::optional<std::string> message;
};

void to_json(nlohmann::json& j, const TaskStatus& status);

struct Task {
    using Clock = std::chrono::steady_clock;

    std::string id;
    TaskState state = TaskState::Pending;
    int progress = 0;

    // Input: an uploaded file under upload_root, or a prompt that is turned into one on first run.
    std::filesystem::path inputPath;
    std::string prompt;
    std::string modelId;

    ProcessingConfig params;
    int retriesRemaining = 0;

    std::filesystem::path archivePath;
    int spriteCount = 0;
    std::vector<std::string> sizes;
    std::string error;
    std::string message;

    Clock::time_point createdAt = Clock::now();
    Clock::time_point finishedAt;

    bool needsGeneration() const { return inputPath.empty() && !prompt.empty(); }

    TaskStatus snapshot() const;
};

} // namespace SpriteExtractor
