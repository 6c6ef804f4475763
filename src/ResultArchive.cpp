#include "ResultArchive.h"
#include "Errors.h"

#include <archive.h>
#include <archive_entry.h>

#include <opencv2/core/utils/logger.hpp>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iterator>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;

namespace SpriteExtractor {

namespace {

struct WriterDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};
struct ReaderDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};
struct EntryDeleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};

using ArchiveWriter = std::unique_ptr<struct archive, WriterDeleter>;
using ArchiveReader = std::unique_ptr<struct archive, ReaderDeleter>;
using ArchiveEntry = std::unique_ptr<struct archive_entry, EntryDeleter>;

static std::string archiveError(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

static std::vector<char> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw PackagingError("cannot read " + path.string());
    return std::vector<char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void writeEntries(struct archive* a, const fs::path& sourceDir) {
    std::vector<fs::path> paths;
    for (const auto& entry : fs::recursive_directory_iterator(sourceDir)) {
        if (entry.is_directory() || entry.is_regular_file()) paths.push_back(entry.path());
    }
    std::sort(paths.begin(), paths.end());

    const time_t now = time(nullptr);
    for (const auto& path : paths) {
        const bool isDir = fs::is_directory(path);
        std::string name = fs::relative(path, sourceDir).generic_string();
        if (isDir) name += '/';

        ArchiveEntry entry(archive_entry_new());
        if (!entry) throw PackagingError("failed to create archive entry");
        archive_entry_set_pathname(entry.get(), name.c_str());
        archive_entry_set_mtime(entry.get(), now, 0);

        std::vector<char> data;
        if (isDir) {
            archive_entry_set_filetype(entry.get(), AE_IFDIR);
            archive_entry_set_perm(entry.get(), 0755);
            archive_entry_set_size(entry.get(), 0);
        } else {
            data = readFile(path);
            archive_entry_set_filetype(entry.get(), AE_IFREG);
            archive_entry_set_perm(entry.get(), 0644);
            archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));
        }

        if (archive_write_header(a, entry.get()) != ARCHIVE_OK) {
            throw PackagingError("failed to write archive header for " + name + ": " + archiveError(a));
        }
        if (!data.empty() && archive_write_data(a, data.data(), data.size()) != static_cast<la_ssize_t>(data.size())) {
            throw PackagingError("failed to write archive data for " + name + ": " + archiveError(a));
        }
    }
}

} // namespace

void ResultArchive::writeZip(const fs::path& sourceDir, const fs::path& archivePath) {
    std::error_code ec;
    if (!fs::is_directory(sourceDir, ec)) throw PackagingError("archive source " + sourceDir.string() + " is not a directory");
    if (archivePath.has_parent_path()) {
        fs::create_directories(archivePath.parent_path(), ec);
        if (ec) throw PackagingError("cannot create " + archivePath.parent_path().string() + ": " + ec.message());
    }

    try {
        ArchiveWriter a(archive_write_new());
        if (!a) throw PackagingError("failed to create archive");
        if (archive_write_set_format_zip(a.get()) != ARCHIVE_OK) {
            throw PackagingError("failed to set zip format: " + archiveError(a.get()));
        }
        if (archive_write_open_filename(a.get(), archivePath.string().c_str()) != ARCHIVE_OK) {
            throw PackagingError("failed to open " + archivePath.string() + ": " + archiveError(a.get()));
        }
        writeEntries(a.get(), sourceDir);
        if (archive_write_close(a.get()) != ARCHIVE_OK) {
            throw PackagingError("failed to close archive: " + archiveError(a.get()));
        }
    } catch (const std::exception& e) {
        fs::remove(archivePath, ec);
        if (dynamic_cast<const PackagingError*>(&e)) throw;
        throw PackagingError(std::string("packaging failed: ") + e.what());
    }

    CV_LOG_DEBUG(NULL, "ResultArchive: wrote " << archivePath.string());
}

std::vector<std::string> ResultArchive::listEntries(const fs::path& archivePath) {
    std::vector<std::string> names;
    ArchiveReader a(archive_read_new());
    if (!a) return names;
    archive_read_support_format_zip(a.get());
    if (archive_read_open_filename(a.get(), archivePath.string().c_str(), 10240) != ARCHIVE_OK) {
        throw PackagingError("cannot open " + archivePath.string() + ": " + archiveError(a.get()));
    }
    struct archive_entry* entry = nullptr;
    while (archive_read_next_header(a.get(), &entry) == ARCHIVE_OK) {
        names.emplace_back(archive_entry_pathname(entry));
        archive_read_data_skip(a.get());
    }
    return names;
}

std::optional<std::vector<unsigned char>> ResultArchive::readEntry(const fs::path& archivePath, const std::string& entryName) {
    ArchiveReader a(archive_read_new());
    if (!a) return std::nullopt;
    archive_read_support_format_zip(a.get());
    if (archive_read_open_filename(a.get(), archivePath.string().c_str(), 10240) != ARCHIVE_OK) {
        throw PackagingError("cannot open " + archivePath.string() + ": " + archiveError(a.get()));
    }
    struct archive_entry* entry = nullptr;
    while (archive_read_next_header(a.get(), &entry) == ARCHIVE_OK) {
        if (entryName != archive_entry_pathname(entry)) {
            archive_read_data_skip(a.get());
            continue;
        }
        std::vector<unsigned char> data;
        unsigned char buf[8192];
        la_ssize_t n = 0;
        while ((n = archive_read_data(a.get(), buf, sizeof(buf))) > 0) {
            data.insert(data.end(), buf, buf + n);
        }
        if (n < 0) throw PackagingError("cannot read " + entryName + ": " + archiveError(a.get()));
        return data;
    }
    return std::nullopt;
}

} // namespace SpriteExtractor
