#include <iostream>
#include <opencv2/opencv.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <chrono>
#include "Errors.h"
#include "ProcessingConfig.h"
#include "ServiceConfig.h"
#include "TaskSupervisor.h"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace SpriteExtractor;

namespace {

struct CliOptions {
    std::string inputPath;
    std::string configPath;
    std::string paramsPath;
    std::string outDir;
    int gridRows = 0;
    int gridCols = 0;
};

static void printUsage() {
    std::cout << "Usage: SpriteExtractor <file_or_directory_path> [--config service.json] [--params params.json]"
              << " [--grid rows cols] [--out dir]" << std::endl;
}

static bool isImageFile(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".tiff" || ext == ".webp";
}

static int parseCount(const std::string& flag, const char* value) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw ConfigError(flag + " expects integers, got '" + value + "'");
    }
}

static CliOptions parseArgs(int argc, char** argv) {
    CliOptions opts;
    opts.inputPath = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.configPath = argv[++i];
        } else if (arg == "--params" && i + 1 < argc) {
            opts.paramsPath = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            opts.outDir = argv[++i];
        } else if (arg == "--grid" && i + 2 < argc) {
            opts.gridRows = parseCount(arg, argv[++i]);
            opts.gridCols = parseCount(arg, argv[++i]);
        } else {
            throw ConfigError("unexpected argument '" + arg + "'");
        }
    }
    return opts;
}

static ProcessingConfig loadParams(const CliOptions& opts) {
    ProcessingConfig params;
    if (!opts.paramsPath.empty()) {
        std::ifstream in(opts.paramsPath);
        if (!in) throw ConfigError("cannot open " + opts.paramsPath);
        json j;
        try {
            in >> j;
        } catch (const json::parse_error& e) {
            throw ConfigError("cannot parse " + opts.paramsPath + ": " + e.what());
        }
        params = ProcessingConfig::fromJson(j);
    }
    if (opts.gridRows > 0 || opts.gridCols > 0) {
        params.mode = PartitionMode::Grid;
        params.autoDetect = false;
        params.rows = opts.gridRows;
        params.cols = opts.gridCols;
    }
    params.validate();
    return params;
}

static std::vector<std::string> collectInputs(const std::string& inputPath) {
    std::vector<std::string> files;
    if (fs::is_directory(inputPath)) {
        std::cout << "Processing directory: " << inputPath << std::endl;
        for (const auto& entry : fs::recursive_directory_iterator(inputPath)) {
            if (entry.is_regular_file() && isImageFile(entry.path())) files.push_back(entry.path().string());
        }
    } else {
        files.push_back(inputPath);
    }
    std::sort(files.begin(), files.end());
    return files;
}

static int run(const CliOptions& opts) {
    ServiceConfig service = opts.configPath.empty() ? ServiceConfig() : ServiceConfig::load(opts.configPath);
    service.validate();
    applyLogLevel(service.logLevel);

    const ProcessingConfig params = loadParams(opts);
    const std::vector<std::string> files = collectInputs(opts.inputPath);
    if (!opts.outDir.empty()) fs::create_directories(opts.outDir);

    TaskSupervisor supervisor(service);

    // Submit everything first so the workers run in parallel.
    std::vector<std::pair<std::string, std::string>> submitted; // (file, task id or empty)
    json out;
    out["input"] = opts.inputPath;
    out["params"] = params.toJson();
    out["results"] = json::array();
    for (const auto& filePath : files) {
        try {
            submitted.emplace_back(filePath, supervisor.submitImage(fs::path(filePath), params));
        } catch (const SpriteError& e) {
            std::cout << "  " << fs::path(filePath).filename().string() << ": [REJECTED] " << e.what() << std::endl;
            out["results"].push_back({{"file", fs::path(filePath).filename().string()}, {"path", filePath},
                                      {"ok", false}, {"error", e.what()}});
        }
    }

    int successCount = 0;
    int totalSprites = 0;
    const auto t0 = std::chrono::steady_clock::now();
    for (const auto& [filePath, taskId] : submitted) {
        std::cout << "  Extracting: " << fs::path(filePath).filename().string() << "... " << std::flush;

        std::optional<TaskStatus> status;
        do {
            status = supervisor.waitFor(taskId, std::chrono::seconds(1));
        } while (status && !isTerminal(status->state));
        if (!status) continue;

        json entry = {{"file", fs::path(filePath).filename().string()}, {"path", filePath}, {"task", *status}};
        if (status->state == TaskState::Success) {
            successCount++;
            totalSprites += status->spriteCount.value_or(0);
            std::cout << "[OK] " << status->spriteCount.value_or(0) << " sprites";
            if (status->message) std::cout << " (" << *status->message << ")";

            if (const auto archive = supervisor.resultArchive(taskId); archive && !opts.outDir.empty()) {
                const fs::path target = fs::path(opts.outDir) / (fs::path(filePath).stem().string() + "_sprites.zip");
                fs::copy_file(*archive, target, fs::copy_options::overwrite_existing);
                entry["archive"] = target.string();
                std::cout << " -> " << target.filename().string();
            } else if (archive) {
                entry["archive"] = archive->string();
            }
            std::cout << std::endl;
        } else {
            std::cout << "[FAILED] " << status->error.value_or("") << std::endl;
        }
        entry["ok"] = status->state == TaskState::Success;
        out["results"].push_back(entry);
    }
    const auto t1 = std::chrono::steady_clock::now();
    const long long totalMs = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();

    out["totalTimeMs"] = totalMs;
    out["successCount"] = successCount;
    out["spriteCount"] = totalSprites;
    out["fileCount"] = static_cast<int>(files.size());

    std::string outPath;
    if (fs::is_directory(opts.inputPath)) {
        outPath = (fs::path(opts.inputPath) / "SpriteExtractor_results.json").string();
    } else {
        outPath = (fs::path(opts.inputPath).string() + ".results.json");
    }

    std::ofstream o(outPath);
    o << out.dump(2) << std::endl;
    std::cout << "\nBatch processing complete. " << successCount << "/" << files.size() << " files, " << totalSprites
              << " sprites. Total " << totalMs << " ms. -> " << fs::path(outPath).filename().string() << std::endl;
    return successCount == static_cast<int>(files.size()) ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    // Keep console output focused on results until the service config says otherwise.
    cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_ERROR);

    if (argc < 2) {
        printUsage();
        return 1;
    }

    try {
        return run(parseArgs(argc, argv));
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        printUsage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
