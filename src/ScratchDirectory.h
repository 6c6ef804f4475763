#pragma once

#include <filesystem>
#include <string>

namespace SpriteExtractor {

/// 任务的临时工作目录：构造时创建 <root>/<name>，析构时无条件删除（成功、失败、异常都一样）。
class ScratchDirectory {
public:
    ScratchDirectory(const std::filesystem::path& root, const std::string& name);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace SpriteExtractor
