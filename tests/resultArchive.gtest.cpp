#include "Errors.h"
#include "ResultArchive.h"
#include "ScratchDirectory.h"

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

namespace SpriteExtractor {
namespace gtest {

namespace fs = std::filesystem;

fs::path testRoot(const std::string& name) {
    const fs::path root = fs::temp_directory_path() / "sprite_extractor_tests" / name;
    fs::remove_all(root);
    fs::create_directories(root);
    return root;
}

TEST(ScratchDirectory, RemovedOnScopeExit) {
    const fs::path root = testRoot("scratch");
    fs::path made;
    {
        ScratchDirectory scratch(root, "task-1");
        made = scratch.path();
        EXPECT_TRUE(fs::is_directory(made));
        std::ofstream(made / "file.txt") << "x";
        fs::create_directories(made / "nested");
    }
    EXPECT_FALSE(fs::exists(made));
}

TEST(ScratchDirectory, RemovedWhenUnwinding) {
    const fs::path root = testRoot("scratch_throw");
    fs::path made;
    try {
        ScratchDirectory scratch(root, "task-2");
        made = scratch.path();
        throw PackagingError("boom");
    } catch (const PackagingError&) {
    }
    EXPECT_FALSE(made.empty());
    EXPECT_FALSE(fs::exists(made));
}

TEST(ResultArchive, ZipHoldsSortedDirectoriesAndFiles) {
    const fs::path root = testRoot("archive");
    const fs::path src = root / "out";
    fs::create_directories(src / "small");
    fs::create_directories(src / "large");
    std::ofstream(src / "large" / "sprite_001.png", std::ios::binary) << "second";
    std::ofstream(src / "large" / "sprite_000.png", std::ios::binary) << "first";

    const fs::path zip = root / "results" / "sprites.zip";
    ResultArchive::writeZip(src, zip);
    ASSERT_TRUE(fs::is_regular_file(zip));

    const std::vector<std::string> expected = {"large/", "large/sprite_000.png", "large/sprite_001.png", "small/"};
    EXPECT_EQ(ResultArchive::listEntries(zip), expected);

    const auto data = ResultArchive::readEntry(zip, "large/sprite_000.png");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(std::string(data->begin(), data->end()), "first");
    EXPECT_FALSE(ResultArchive::readEntry(zip, "medium/sprite_000.png").has_value());
}

TEST(ResultArchive, MissingSourceIsAPackagingError) {
    const fs::path root = testRoot("archive_missing");
    EXPECT_THROW(ResultArchive::writeZip(root / "nope", root / "out.zip"), PackagingError);
    EXPECT_FALSE(fs::exists(root / "out.zip"));
}

} // namespace gtest
} // namespace SpriteExtractor
