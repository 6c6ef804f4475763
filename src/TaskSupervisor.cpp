#include "TaskSupervisor.h"
#include "Errors.h"
#include "ResultArchive.h"
#include "ScratchDirectory.h"
#include "SpritePipeline.h"

#include <opencv2/core/utils/logger.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <system_error>

namespace fs = std::filesystem;

namespace SpriteExtractor {

namespace {

static std::string lowerExtension(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext.empty() ? ".png" : ext;
}

static void ensureDirectory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw SpriteError("cannot create " + dir.string() + ": " + ec.message());
}

} // namespace

TaskSupervisor::TaskSupervisor(const ServiceConfig& config, std::shared_ptr<BackgroundRemover> remover,
                               std::shared_ptr<ImageGenerator> generator)
    : m_config(config), m_remover(std::move(remover)), m_generator(std::move(generator)) {
    m_config.validate();
    if (!m_remover) m_remover = std::make_shared<FloodFillBackgroundRemover>(m_config.floodDiff);

    std::random_device rd;
    std::seed_seq seed{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    m_idEngine.seed(seed);

    ensureDirectory(m_config.scratchRoot);
    ensureDirectory(m_config.resultRoot);
    ensureDirectory(m_config.uploadRoot);

    m_workers.reserve(m_config.workerCount);
    for (unsigned i = 0; i < m_config.workerCount; ++i) {
        m_workers.emplace_back(&TaskSupervisor::workerLoop, this);
    }
    CV_LOG_INFO(NULL, "TaskSupervisor: started " << m_config.workerCount << " workers");
}

TaskSupervisor::~TaskSupervisor() {
    stop();
}

void TaskSupervisor::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping && m_workers.empty()) return;
        m_stopping = true;
    }
    m_queueChanged.notify_all();
    for (auto& worker : m_workers) {
        if (worker.joinable()) worker.join();
    }
    m_workers.clear();
}

std::string TaskSupervisor::newTaskId() {
    std::lock_guard<std::mutex> lock(m_idMutex);
    uint64_t hi = m_idEngine();
    uint64_t lo = m_idEngine();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF), static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48), static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

std::string TaskSupervisor::enqueue(Task task) {
    purgeExpired();

    task.state = TaskState::Pending;
    task.progress = 0;
    task.retriesRemaining = m_config.maxRetries;
    task.createdAt = Task::Clock::now();

    const std::string id = task.id;
    const fs::path input = task.inputPath;
    bool stopping = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        stopping = m_stopping;
        if (!stopping) {
            m_tasks.emplace(id, std::move(task));
            m_queue.push_back(id);
        }
    }
    if (stopping) {
        std::error_code ec;
        if (!input.empty()) fs::remove(input, ec);
        throw SpriteError("task supervisor is stopped");
    }
    m_queueChanged.notify_one();
    CV_LOG_INFO(NULL, "TaskSupervisor: queued task " << id);
    return id;
}

std::string TaskSupervisor::submitImage(const fs::path& imagePath, const ProcessingConfig& params) {
    params.validate();
    std::error_code ec;
    if (!fs::is_regular_file(imagePath, ec)) throw ConfigError("input image not found: " + imagePath.string());

    Task task;
    task.id = newTaskId();
    task.params = params;
    task.inputPath = m_config.uploadRoot / (task.id + lowerExtension(imagePath));
    fs::copy_file(imagePath, task.inputPath, fs::copy_options::overwrite_existing, ec);
    if (ec) throw SpriteError("cannot store upload " + imagePath.string() + ": " + ec.message());
    return enqueue(std::move(task));
}

std::string TaskSupervisor::submitImage(const cv::Mat& image, const ProcessingConfig& params) {
    params.validate();
    if (image.empty()) throw ConfigError("input image is empty");

    Task task;
    task.id = newTaskId();
    task.params = params;
    task.inputPath = m_config.uploadRoot / (task.id + ".png");
    if (!cv::imwrite(task.inputPath.string(), image)) throw SpriteError("cannot store upload " + task.inputPath.string());
    return enqueue(std::move(task));
}

std::string TaskSupervisor::submitPrompt(const std::string& prompt, const std::string& modelId, const ProcessingConfig& params) {
    params.validate();
    if (prompt.empty()) throw ConfigError("prompt is empty");
    if (!m_generator) throw ConfigError("no image generator is configured");

    Task task;
    task.id = newTaskId();
    task.params = params;
    task.prompt = prompt;
    task.modelId = modelId.empty() ? kDefaultModelAlias : modelId;
    return enqueue(std::move(task));
}

std::optional<TaskStatus> TaskSupervisor::status(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) return std::nullopt;
    return it->second.snapshot();
}

std::optional<fs::path> TaskSupervisor::resultArchive(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_tasks.find(taskId);
    if (it == m_tasks.end() || it->second.state != TaskState::Success) return std::nullopt;
    return it->second.archivePath;
}

std::optional<TaskStatus> TaskSupervisor::waitFor(const std::string& taskId, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto finished = [&] {
        const auto it = m_tasks.find(taskId);
        return it == m_tasks.end() || isTerminal(it->second.state);
    };
    m_taskFinished.wait_for(lock, timeout, finished);

    const auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) return std::nullopt;
    return it->second.snapshot();
}

void TaskSupervisor::workerLoop() {
    for (;;) {
        std::string taskId;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_queueChanged.wait(lock, [&] { return m_stopping || !m_queue.empty(); });
            if (m_stopping) return;
            taskId = m_queue.front();
            m_queue.pop_front();
        }
        runTask(taskId);
    }
}

void TaskSupervisor::setState(const std::string& taskId, TaskState state, int progress) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Task& task = m_tasks.at(taskId);
    task.state = state;
    task.progress = std::max(task.progress, progress);
}

void TaskSupervisor::setProgress(const std::string& taskId, int progress) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Task& task = m_tasks.at(taskId);
    task.progress = std::max(task.progress, progress);
}

void TaskSupervisor::releaseInput(const std::string& taskId) {
    if (m_config.keepInputs) return;
    fs::path input;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        input = m_tasks.at(taskId).inputPath;
    }
    if (input.empty()) return;
    std::error_code ec;
    fs::remove(input, ec);
    if (ec) CV_LOG_WARNING(NULL, "TaskSupervisor: cannot remove input " << input.string() << ": " << ec.message());
}

void TaskSupervisor::finishSuccess(const std::string& taskId, const Outcome& outcome) {
    releaseInput(taskId);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Task& task = m_tasks.at(taskId);
        task.state = TaskState::Success;
        task.progress = 100;
        task.archivePath = outcome.archivePath;
        task.spriteCount = outcome.spriteCount;
        task.sizes = outcome.sizes;
        task.message = outcome.message;
        task.finishedAt = Task::Clock::now();
    }
    m_taskFinished.notify_all();
    CV_LOG_INFO(NULL, "TaskSupervisor: task " << taskId << " SUCCESS, " << outcome.spriteCount << " sprites");
}

void TaskSupervisor::finishFailure(const std::string& taskId, const std::string& error) {
    releaseInput(taskId);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Task& task = m_tasks.at(taskId);
        task.state = TaskState::Failure;
        task.error = error;
        task.message.clear();
        task.finishedAt = Task::Clock::now();
    }
    m_taskFinished.notify_all();
    CV_LOG_ERROR(NULL, "TaskSupervisor: task " << taskId << " FAILURE: " << error);
}

bool TaskSupervisor::requeueForRetry(const std::string& taskId, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Task& task = m_tasks.at(taskId);
        if (task.retriesRemaining <= 0) return false;
        task.retriesRemaining--;
        task.state = TaskState::Pending;
        task.message = "retrying: " + error;
        m_queue.push_back(taskId);
    }
    m_queueChanged.notify_one();
    CV_LOG_WARNING(NULL, "TaskSupervisor: task " << taskId << " will be retried: " << error);
    return true;
}

TaskSupervisor::Outcome TaskSupervisor::processTask(const std::string& taskId, Task task) {
    ScratchDirectory scratch(m_config.scratchRoot, taskId);

    if (task.needsGeneration()) {
        setState(taskId, TaskState::Generating, 5);
        const cv::Mat generated = m_generator->generate(optimizeSpritePrompt(task.prompt), resolveModelId(task.modelId));
        if (generated.empty()) throw GenerationError("No image generated");

        const fs::path stored = m_config.uploadRoot / (taskId + ".png");
        if (!cv::imwrite(stored.string(), generated)) throw SpriteError("cannot store generated image " + stored.string());
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_tasks.at(taskId).inputPath = stored;
        }
        task.inputPath = stored;
    }
    setState(taskId, TaskState::Processing, 10);

    const cv::Mat input = cv::imread(task.inputPath.string(), cv::IMREAD_UNCHANGED);
    if (input.empty()) throw SpriteError("cannot decode input image " + task.inputPath.filename().string());

    SpritePipeline pipeline(task.params, *m_remover);
    const fs::path outputDir = scratch.path() / "output";

    Outcome outcome;
    try {
        const PipelineResult result = pipeline.run(input, outputDir, [&](int progress) { setProgress(taskId, progress); });
        outcome.spriteCount = result.spriteCount;
        outcome.sizes = result.sizeNames;
    } catch (const NoSpritesFoundError& e) {
        // Still a result: an archive of empty size directories.
        outcome.message = e.what();
        for (const OutputSize& size : task.params.outputSizes) outcome.sizes.push_back(size.name);
    }

    setState(taskId, TaskState::Packaging, 80);
    outcome.archivePath = m_config.resultRoot / ("sprites_" + taskId + ".zip");
    ResultArchive::writeZip(outputDir, outcome.archivePath);
    setProgress(taskId, 90);
    return outcome;
}

void TaskSupervisor::runTask(const std::string& taskId) {
    Task task;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        task = m_tasks.at(taskId);
    }

    try {
        const Outcome outcome = processTask(taskId, std::move(task));
        finishSuccess(taskId, outcome);
    } catch (const RemovalError& e) {
        if (!requeueForRetry(taskId, e.what())) finishFailure(taskId, e.what());
    } catch (const GenerationError& e) {
        if (!requeueForRetry(taskId, e.what())) finishFailure(taskId, e.what());
    } catch (const std::exception& e) {
        // ConfigError, GridDetectionError, PackagingError, cv::Exception, ...
        finishFailure(taskId, e.what());
    }
}

size_t TaskSupervisor::purgeExpired() {
    const auto retention = std::chrono::seconds(m_config.retentionSeconds);
    const auto now = Task::Clock::now();

    std::vector<fs::path> archives;
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_tasks.begin(); it != m_tasks.end();) {
            const Task& task = it->second;
            if (isTerminal(task.state) && now - task.finishedAt > retention) {
                if (!task.archivePath.empty()) archives.push_back(task.archivePath);
                it = m_tasks.erase(it);
                ++dropped;
            } else {
                ++it;
            }
        }
    }

    std::error_code ec;
    for (const auto& archive : archives) {
        fs::remove(archive, ec);
        if (ec) CV_LOG_WARNING(NULL, "TaskSupervisor: cannot remove " << archive.string() << ": " << ec.message());
    }

    // Archives left behind by an earlier process.
    const auto fileNow = fs::file_time_type::clock::now();
    for (fs::directory_iterator it(m_config.resultRoot, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path path = it->path();
        const std::string name = path.filename().string();
        if (name.rfind("sprites_", 0) != 0 || path.extension() != ".zip") continue;
        const std::string id = name.substr(8, name.size() - 8 - 4);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_tasks.count(id)) continue;
        }
        std::error_code timeEc;
        const auto written = fs::last_write_time(path, timeEc);
        if (timeEc || fileNow - written <= retention) continue;
        std::error_code removeEc;
        fs::remove(path, removeEc);
        if (removeEc) CV_LOG_WARNING(NULL, "TaskSupervisor: cannot remove " << path.string() << ": " << removeEc.message());
    }

    if (dropped > 0) CV_LOG_INFO(NULL, "TaskSupervisor: purged " << dropped << " expired tasks");
    return dropped;
}

} // namespace SpriteExtractor
