#include "ScratchDirectory.h"
#include "Errors.h"

#include <opencv2/core/utils/logger.hpp>

#include <system_error>

namespace SpriteExtractor {

ScratchDirectory::ScratchDirectory(const std::filesystem::path& root, const std::string& name) : m_path(root / name) {
    std::error_code ec;
    // A leftover from a crashed run of the same task id is stale; start clean.
    std::filesystem::remove_all(m_path, ec);
    std::filesystem::create_directories(m_path, ec);
    if (ec) throw SpriteError("cannot create scratch directory " + m_path.string() + ": " + ec.message());
}

ScratchDirectory::~ScratchDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
    if (ec) {
        CV_LOG_ERROR(NULL, "ScratchDirectory: failed to remove " << m_path.string() << ": " << ec.message());
    }
}

} // namespace SpriteExtractor
