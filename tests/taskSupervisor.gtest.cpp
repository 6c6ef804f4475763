#include "BackgroundRemover.h"
#include "Errors.h"
#include "ImageGenerator.h"
#include "ResultArchive.h"
#include "TaskSupervisor.h"

#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <thread>
#include <vector>

namespace SpriteExtractor {
namespace gtest {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

//! Fails the first `failures` calls with RemovalError, then behaves like the flood-fill remover.
class FlakyRemover : public BackgroundRemover {
public:
    explicit FlakyRemover(int failures) : m_failures(failures) {}

    cv::Mat removeBackground(const cv::Mat& image) override {
        if (calls++ < m_failures) throw RemovalError("segmentation backend unavailable");
        return m_inner.removeBackground(image);
    }

    std::atomic<int> calls{0};

private:
    int m_failures;
    FloodFillBackgroundRemover m_inner;
};

//! Blocks every call until open() is called.
class GateRemover : public BackgroundRemover {
public:
    cv::Mat removeBackground(const cv::Mat& image) override {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [&] { return m_open; });
        return image.clone();
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_open = true;
        }
        m_cv.notify_all();
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_open = false;
};

//! Fails the first call, then blocks like GateRemover until open() is called.
class FailThenWaitRemover : public BackgroundRemover {
public:
    cv::Mat removeBackground(const cv::Mat& image) override {
        if (calls++ == 0) throw RemovalError("segmentation backend unavailable");
        return m_gate.removeBackground(image);
    }

    void open() { m_gate.open(); }

    std::atomic<int> calls{0};

private:
    GateRemover m_gate;
};

//! Draws two coloured squares on white; returns nothing for the first `failures` calls.
class FakeGenerator : public ImageGenerator {
public:
    explicit FakeGenerator(int failures = 0) : m_failures(failures) {}

    cv::Mat generate(const std::string& prompt, const std::string& modelId) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            lastPrompt = prompt;
            lastModel = modelId;
        }
        if (calls++ < m_failures) return cv::Mat();
        cv::Mat image(200, 200, CV_8UC3, cv::Scalar::all(255));
        cv::rectangle(image, cv::Rect(30, 80, 40, 40), cv::Scalar(0, 180, 255), cv::FILLED);
        cv::rectangle(image, cv::Rect(130, 80, 40, 40), cv::Scalar(200, 60, 0), cv::FILLED);
        return image;
    }

    std::atomic<int> calls{0};
    std::mutex mutex;
    std::string lastPrompt;
    std::string lastModel;

private:
    int m_failures;
};

ServiceConfig serviceConfig(const std::string& name) {
    const fs::path root = fs::temp_directory_path() / "sprite_extractor_tests" / "supervisor" / name;
    fs::remove_all(root);

    ServiceConfig cfg;
    cfg.workerCount = 2;
    cfg.scratchRoot = root / "scratch";
    cfg.resultRoot = root / "results";
    cfg.uploadRoot = root / "uploads";
    return cfg;
}

cv::Mat squareSheet() {
    cv::Mat image(200, 200, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    cv::rectangle(image, cv::Rect(30, 80, 40, 40), cv::Scalar(0, 0, 255, 255), cv::FILLED);
    cv::rectangle(image, cv::Rect(130, 80, 40, 40), cv::Scalar(255, 0, 0, 255), cv::FILLED);
    return image;
}

ProcessingConfig largeOnly() {
    ProcessingConfig cfg;
    cfg.distanceThreshold = 10;
    cfg.outputSizes = {{"large", 64, 64, 0}};
    return cfg;
}

TaskStatus finish(const TaskSupervisor& supervisor, const std::string& id) {
    const auto status = supervisor.waitFor(id, 60s);
    EXPECT_TRUE(status.has_value());
    EXPECT_TRUE(status && isTerminal(status->state)) << "task " << id << " did not finish";
    return status.value_or(TaskStatus{});
}

bool isEmptyDirectory(const fs::path& dir) {
    return !fs::exists(dir) || fs::is_empty(dir);
}

TEST(TaskSupervisor, TwoSquaresEndToEnd) {
    const ServiceConfig service = serviceConfig("end_to_end");
    TaskSupervisor supervisor(service);

    const std::string id = supervisor.submitImage(squareSheet(), largeOnly());
    EXPECT_TRUE(std::regex_match(id, std::regex("[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}")));

    const TaskStatus status = finish(supervisor, id);
    ASSERT_EQ(status.state, TaskState::Success) << status.error.value_or("");
    EXPECT_EQ(status.progress, 100);
    ASSERT_TRUE(status.spriteCount.has_value());
    EXPECT_EQ(*status.spriteCount, 2);
    EXPECT_EQ(status.sizes, std::vector<std::string>{"large"});
    EXPECT_FALSE(status.error.has_value());

    const auto archive = supervisor.resultArchive(id);
    ASSERT_TRUE(archive.has_value());
    EXPECT_EQ(archive->filename().string(), "sprites_" + id + ".zip");

    const std::vector<std::string> expected = {"large/", "large/sprite_000.png", "large/sprite_001.png"};
    EXPECT_EQ(ResultArchive::listEntries(*archive), expected);

    for (const auto& entry : {"large/sprite_000.png", "large/sprite_001.png"}) {
        const auto bytes = ResultArchive::readEntry(*archive, entry);
        ASSERT_TRUE(bytes.has_value());
        const cv::Mat sprite = cv::imdecode(*bytes, cv::IMREAD_UNCHANGED);
        ASSERT_EQ(sprite.size(), cv::Size(64, 64));
        ASSERT_EQ(sprite.channels(), 4);

        cv::Mat alpha;
        cv::extractChannel(sprite, alpha, 3);
        EXPECT_EQ(cv::boundingRect(alpha), cv::Rect(12, 12, 40, 40)) << entry;
        EXPECT_EQ(alpha.at<uchar>(0, 0), 0);
        EXPECT_EQ(alpha.at<uchar>(63, 63), 0);
    }

    EXPECT_FALSE(fs::exists(service.scratchRoot / id));
    EXPECT_TRUE(isEmptyDirectory(service.uploadRoot));
}

TEST(TaskSupervisor, StatusJsonCarriesResultFields) {
    TaskSupervisor supervisor(serviceConfig("json"));
    const std::string id = supervisor.submitImage(squareSheet(), largeOnly());
    finish(supervisor, id);

    const nlohmann::json j = *supervisor.status(id);
    EXPECT_EQ(j.at("task_id"), id);
    EXPECT_EQ(j.at("status"), "SUCCESS");
    EXPECT_EQ(j.at("progress"), 100);
    EXPECT_EQ(j.at("sprite_count"), 2);
    EXPECT_EQ(j.at("sizes"), nlohmann::json::array({"large"}));
    EXPECT_FALSE(j.contains("error"));
}

TEST(TaskSupervisor, UnknownIdHasNoStatus) {
    TaskSupervisor supervisor(serviceConfig("unknown"));
    EXPECT_FALSE(supervisor.status("no-such-task").has_value());
    EXPECT_FALSE(supervisor.resultArchive("no-such-task").has_value());
}

TEST(TaskSupervisor, TransientFailureIsRetriedOnce) {
    const ServiceConfig service = serviceConfig("retry_once");
    auto remover = std::make_shared<FlakyRemover>(1);
    TaskSupervisor supervisor(service, remover);

    const std::string id = supervisor.submitImage(squareSheet(), largeOnly());
    const TaskStatus status = finish(supervisor, id);
    EXPECT_EQ(status.state, TaskState::Success) << status.error.value_or("");
    EXPECT_EQ(status.spriteCount.value_or(-1), 2);
    EXPECT_EQ(remover->calls.load(), 2);
    EXPECT_FALSE(fs::exists(service.scratchRoot / id));
}

TEST(TaskSupervisor, SecondTransientFailureFailsTheTask) {
    const ServiceConfig service = serviceConfig("retry_twice");
    auto remover = std::make_shared<FlakyRemover>(2);
    TaskSupervisor supervisor(service, remover);

    const std::string id = supervisor.submitImage(squareSheet(), largeOnly());
    const TaskStatus status = finish(supervisor, id);
    EXPECT_EQ(status.state, TaskState::Failure);
    EXPECT_EQ(status.error.value_or(""), "segmentation backend unavailable");
    EXPECT_FALSE(status.spriteCount.has_value());
    EXPECT_FALSE(status.message.has_value());
    EXPECT_EQ(remover->calls.load(), 2);
    EXPECT_FALSE(supervisor.resultArchive(id).has_value());
    EXPECT_FALSE(fs::exists(service.scratchRoot / id));
    EXPECT_TRUE(isEmptyDirectory(service.uploadRoot));
}

TEST(TaskSupervisor, RetryIsReportedWhileRunningAgain) {
    const ServiceConfig service = serviceConfig("retry_message");
    auto remover = std::make_shared<FailThenWaitRemover>();
    TaskSupervisor supervisor(service, remover);

    const std::string id = supervisor.submitImage(squareSheet(), largeOnly());
    const auto start = std::chrono::steady_clock::now();
    while (remover->calls.load() < 2 && std::chrono::steady_clock::now() - start < 30s) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(remover->calls.load(), 2);

    const TaskStatus running = *supervisor.status(id);
    EXPECT_EQ(running.state, TaskState::Processing);
    EXPECT_GE(running.progress, 10);
    EXPECT_EQ(running.message.value_or(""), "retrying: segmentation backend unavailable");

    remover->open();
    const TaskStatus done = finish(supervisor, id);
    EXPECT_EQ(done.state, TaskState::Success) << done.error.value_or("");
    EXPECT_FALSE(done.message.has_value());
}

TEST(TaskSupervisor, RetriesCanBeDisabled) {
    ServiceConfig service = serviceConfig("no_retry");
    service.maxRetries = 0;
    auto remover = std::make_shared<FlakyRemover>(1);
    TaskSupervisor supervisor(service, remover);

    const TaskStatus status = finish(supervisor, supervisor.submitImage(squareSheet(), largeOnly()));
    EXPECT_EQ(status.state, TaskState::Failure);
    EXPECT_EQ(remover->calls.load(), 1);
}

TEST(TaskSupervisor, GridDetectionErrorIsNotRetried) {
    const ServiceConfig service = serviceConfig("grid_error");
    auto remover = std::make_shared<FlakyRemover>(0);
    TaskSupervisor supervisor(service, remover);

    cv::Mat blob(200, 200, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    cv::circle(blob, cv::Point(100, 100), 80, cv::Scalar(0, 0, 255, 255), cv::FILLED);
    ProcessingConfig params = largeOnly();
    params.mode = PartitionMode::Grid;
    params.autoDetect = true;

    const std::string id = supervisor.submitImage(blob, params);
    const TaskStatus status = finish(supervisor, id);
    EXPECT_EQ(status.state, TaskState::Failure);
    EXPECT_TRUE(status.error.has_value());
    EXPECT_EQ(remover->calls.load(), 1);
    EXPECT_FALSE(fs::exists(service.scratchRoot / id));
}

TEST(TaskSupervisor, EmptySheetSucceedsWithZeroSprites) {
    const ServiceConfig service = serviceConfig("empty");
    TaskSupervisor supervisor(service);

    const cv::Mat blank(120, 120, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    const std::string id = supervisor.submitImage(blank, largeOnly());
    const TaskStatus status = finish(supervisor, id);
    ASSERT_EQ(status.state, TaskState::Success) << status.error.value_or("");
    EXPECT_EQ(status.spriteCount.value_or(-1), 0);
    EXPECT_EQ(status.message.value_or(""), "No sprites found");

    const auto archive = supervisor.resultArchive(id);
    ASSERT_TRUE(archive.has_value());
    EXPECT_EQ(ResultArchive::listEntries(*archive), std::vector<std::string>{"large/"});
}

TEST(TaskSupervisor, InvalidParametersAreRejectedAtSubmission) {
    const ServiceConfig service = serviceConfig("config_error");
    TaskSupervisor supervisor(service);

    ProcessingConfig params = largeOnly();
    params.distanceThreshold = 5;
    EXPECT_THROW(supervisor.submitImage(squareSheet(), params), ConfigError);
    EXPECT_THROW(supervisor.submitImage(service.uploadRoot / "missing.png", largeOnly()), ConfigError);
    EXPECT_THROW(supervisor.submitImage(cv::Mat(), largeOnly()), ConfigError);
    EXPECT_THROW(supervisor.submitPrompt("a knight", "nano-banana", largeOnly()), ConfigError);
    EXPECT_TRUE(isEmptyDirectory(service.uploadRoot));
}

TEST(TaskSupervisor, SubmitsFromFile) {
    ServiceConfig service = serviceConfig("from_file");
    service.keepInputs = true;
    TaskSupervisor supervisor(service);

    const fs::path written = service.scratchRoot.parent_path() / "sheet.png";
    ASSERT_TRUE(cv::imwrite(written.string(), squareSheet()));
    const fs::path input = service.scratchRoot.parent_path() / "sheet.PNG";
    fs::rename(written, input);

    const std::string id = supervisor.submitImage(input, largeOnly());
    const TaskStatus status = finish(supervisor, id);
    EXPECT_EQ(status.state, TaskState::Success) << status.error.value_or("");
    EXPECT_TRUE(fs::exists(input));
    EXPECT_TRUE(fs::exists(service.uploadRoot / (id + ".png")));
}

TEST(TaskSupervisor, PromptTaskGeneratesThenProcesses) {
    const ServiceConfig service = serviceConfig("prompt");
    auto generator = std::make_shared<FakeGenerator>(1);
    TaskSupervisor supervisor(service, nullptr, generator);

    const std::string id = supervisor.submitPrompt("two coins", "nano-banana-pro", largeOnly());
    const TaskStatus status = finish(supervisor, id);
    ASSERT_EQ(status.state, TaskState::Success) << status.error.value_or("");
    EXPECT_EQ(status.spriteCount.value_or(-1), 2);
    EXPECT_EQ(generator->calls.load(), 2);

    std::lock_guard<std::mutex> lock(generator->mutex);
    EXPECT_EQ(generator->lastModel, "gemini-3-pro-image-preview");
    EXPECT_EQ(generator->lastPrompt, optimizeSpritePrompt("two coins"));
}

TEST(TaskSupervisor, QueuedTaskWaitsForAFreeWorker) {
    ServiceConfig service = serviceConfig("queue");
    service.workerCount = 1;
    auto gate = std::make_shared<GateRemover>();
    TaskSupervisor supervisor(service, gate);

    const std::string first = supervisor.submitImage(squareSheet(), largeOnly());
    const std::string second = supervisor.submitImage(squareSheet(), largeOnly());

    // The single worker is held inside the remover, so the second task cannot start.
    const auto start = std::chrono::steady_clock::now();
    while (supervisor.status(first)->state != TaskState::Processing && std::chrono::steady_clock::now() - start < 30s) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(supervisor.status(first)->state, TaskState::Processing);
    EXPECT_EQ(supervisor.status(second)->state, TaskState::Pending);
    EXPECT_EQ(supervisor.status(second)->progress, 0);

    gate->open();
    EXPECT_EQ(finish(supervisor, first).state, TaskState::Success);
    EXPECT_EQ(finish(supervisor, second).state, TaskState::Success);
}

TEST(TaskSupervisor, StoppedSupervisorRejectsWork) {
    const ServiceConfig service = serviceConfig("stopped");
    TaskSupervisor supervisor(service);
    supervisor.stop();
    EXPECT_THROW(supervisor.submitImage(squareSheet(), largeOnly()), SpriteError);
    EXPECT_TRUE(isEmptyDirectory(service.uploadRoot));
    supervisor.stop();
}

TEST(TaskSupervisor, LongRetentionKeepsFinishedTasks) {
    ServiceConfig service = serviceConfig("long_retention");
    service.retentionSeconds = kMaxRetentionSeconds;
    TaskSupervisor supervisor(service);

    const std::string id = supervisor.submitImage(squareSheet(), largeOnly());
    ASSERT_EQ(finish(supervisor, id).state, TaskState::Success);
    const fs::path archive = *supervisor.resultArchive(id);

    std::this_thread::sleep_for(10ms);
    EXPECT_EQ(supervisor.purgeExpired(), 0u);
    EXPECT_TRUE(supervisor.status(id).has_value());
    EXPECT_TRUE(fs::exists(archive));

    service.retentionSeconds = kMaxRetentionSeconds + 1;
    EXPECT_THROW(TaskSupervisor{service}, ConfigError);
}

TEST(TaskSupervisor, ExpiredTasksArePurged) {
    ServiceConfig service = serviceConfig("purge");
    service.retentionSeconds = 0;
    TaskSupervisor supervisor(service);

    const std::string id = supervisor.submitImage(squareSheet(), largeOnly());
    ASSERT_EQ(finish(supervisor, id).state, TaskState::Success);
    const fs::path archive = *supervisor.resultArchive(id);
    ASSERT_TRUE(fs::exists(archive));

    std::this_thread::sleep_for(10ms);
    EXPECT_EQ(supervisor.purgeExpired(), 1u);
    EXPECT_FALSE(supervisor.status(id).has_value());
    EXPECT_FALSE(fs::exists(archive));
}

} // namespace gtest
} // namespace SpriteExtractor
