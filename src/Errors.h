#pragma once

#include <stdexcept>
#include <string>

namespace SpriteExtractor {

/// 所有流水线错误的基类。
///
/// 分类决定了任务失败后的处理方式（见 `TaskSupervisor`）：
/// - ConfigError / GridDetectionError / PackagingError：直接失败，不重试；
/// - RemovalError / GenerationError：外部协作方的瞬时错误，最多重试一次；
/// - NoSpritesFoundError：不是崩溃，而是“成功但为空”的结果。
class SpriteError : public std::runtime_error {
public:
    explicit SpriteError(const std::string& what) : std::runtime_error(what) {}
};

// Parameter out of range. Raised before a task is queued.
class ConfigError : public SpriteError {
public:
    explicit ConfigError(const std::string& what) : SpriteError(what) {}
};

// Auto grid detection found no consistent separators.
class GridDetectionError : public SpriteError {
public:
    explicit GridDetectionError(const std::string& what) : SpriteError(what) {}
};

class RemovalError : public SpriteError {
public:
    explicit RemovalError(const std::string& what) : SpriteError(what) {}
};

class GenerationError : public SpriteError {
public:
    explicit GenerationError(const std::string& what) : SpriteError(what) {}
};

class NoSpritesFoundError : public SpriteError {
public:
    explicit NoSpritesFoundError(const std::string& what = "No sprites found") : SpriteError(what) {}
};

class PackagingError : public SpriteError {
public:
    explicit PackagingError(const std::string& what) : SpriteError(what) {}
};

} // namespace SpriteExtractor
