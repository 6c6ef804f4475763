#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace SpriteExtractor {

// Zip packaging of a task's output directory (libarchive).
class ResultArchive {
public:
    /// 把 sourceDir 下的所有目录和文件（相对路径，按路径排序）写成 zip。
    /// 失败时删除写了一半的文件并抛出 `PackagingError`。
    static void writeZip(const std::filesystem::path& sourceDir, const std::filesystem::path& archivePath);

    // Entry names in archive order ("large/", "large/sprite_000.png", ...).
    static std::vector<std::string> listEntries(const std::filesystem::path& archivePath);

    static std::optional<std::vector<unsigned char>> readEntry(const std::filesystem::path& archivePath, const std::string& entryName);
};

} // namespace SpriteExtractor
