#pragma once

#include "BackgroundRemover.h"
#include "ImageGenerator.h"
#include "ProcessingConfig.h"
#include "ServiceConfig.h"
#include "Task.h"

#include <opencv2/opencv.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace SpriteExtractor {

class TaskSupervisor {
public:
    /// 任务队列 + 固定数量的 worker 线程。
    ///
    /// ----------------------------
    /// 原理
    /// ----------------------------
    /// - 提交时立即校验参数（`ConfigError` 直接抛给调用方，任务不会入队），生成 UUID v4 作为任务 id，
    ///   输入保存为 `<upload_root>/<id>.<ext>`，然后入 FIFO 队列。
    /// - worker 取出任务，在 `<scratch_root>/<id>` 里运行一个新建的 `SpritePipeline`，
    ///   把结果打包为 `<result_root>/sprites_<id>.zip`。无论成功失败，临时目录都会被删除。
    /// - `RemovalError` / `GenerationError` 视为瞬时错误：任务剩余重试次数 > 0 时以同一 id 重新入队；
    ///   其余错误直接 FAILURE。`NoSpritesFoundError` 记为 SUCCESS（sprite_count = 0）。
    /// - 同一 id 同时只在一个 worker 上运行（重试在上一次运行结束后才入队）。
    ///
    /// remover 为空时使用 `FloodFillBackgroundRemover(config.floodDiff)`；generator 为空时拒绝 prompt 任务。
    explicit TaskSupervisor(const ServiceConfig& config, std::shared_ptr<BackgroundRemover> remover = nullptr,
                            std::shared_ptr<ImageGenerator> generator = nullptr);
    ~TaskSupervisor();

    TaskSupervisor(const TaskSupervisor&) = delete;
    TaskSupervisor& operator=(const TaskSupervisor&) = delete;

    std::string submitImage(const std::filesystem::path& imagePath, const ProcessingConfig& params);
    std::string submitImage(const cv::Mat& image, const ProcessingConfig& params);
    std::string submitPrompt(const std::string& prompt, const std::string& modelId, const ProcessingConfig& params);

    // std::nullopt for unknown (or purged) ids.
    std::optional<TaskStatus> status(const std::string& taskId) const;

    // Archive path, only once the task reached SUCCESS.
    std::optional<std::filesystem::path> resultArchive(const std::string& taskId) const;

    // Blocks until the task is terminal or the timeout expires; returns the last snapshot.
    std::optional<TaskStatus> waitFor(const std::string& taskId, std::chrono::milliseconds timeout) const;

    // Finishes the running tasks and joins the workers. Queued tasks stay PENDING.
    void stop();

    // Drops terminal tasks and archives older than retention_seconds. Returns the number of tasks dropped.
    size_t purgeExpired();

    const ServiceConfig& config() const { return m_config; }

private:
    std::string enqueue(Task task);
    void workerLoop();
    void runTask(const std::string& taskId);

    struct Outcome {
        std::filesystem::path archivePath;
        int spriteCount = 0;
        std::vector<std::string> sizes;
        std::string message;
    };
    // One attempt inside its own scratch directory; the directory is gone when this returns or throws.
    Outcome processTask(const std::string& taskId, Task task);

    void setState(const std::string& taskId, TaskState state, int progress);
    void setProgress(const std::string& taskId, int progress);
    void finishSuccess(const std::string& taskId, const Outcome& outcome);
    void finishFailure(const std::string& taskId, const std::string& error);
    bool requeueForRetry(const std::string& taskId, const std::string& error);
    void releaseInput(const std::string& taskId);

    std::string newTaskId();

    ServiceConfig m_config;
    std::shared_ptr<BackgroundRemover> m_remover;
    std::shared_ptr<ImageGenerator> m_generator;

    mutable std::mutex m_mutex;
    std::condition_variable m_queueChanged;
    mutable std::condition_variable m_taskFinished;
    std::deque<std::string> m_queue;
    std::map<std::string, Task> m_tasks;
    bool m_stopping = false;

    std::mutex m_idMutex;
    std::mt19937_64 m_idEngine;

    std::vector<std::thread> m_workers;
};

} // namespace SpriteExtractor
