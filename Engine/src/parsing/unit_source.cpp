/**
 * @file unit_source.cpp
 * @brief Archive enumeration for directory and zip inputs
 */

#include <parsing/unit_source.hpp>
#include <parsing/blk_parser.hpp>
#include <parsing/mtf_parser.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <minizip/unzip.h>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace Armory {

std::optional<EntryClass> classify_entry(std::string_view path) {
    std::string lower = to_lower(path);
    if (lower.empty() || lower.back() == '/') return std::nullopt;

    auto parts = split(lower, '/');
    const std::string& file = parts.back();
    size_t dot = file.rfind('.');
    if (dot == std::string::npos) return std::nullopt;
    std::string ext = file.substr(dot + 1);

    if (ext == "mtf") return EntryClass{UnitFormat::Mtf, UnitType::Mek};
    if (ext != "blk") return std::nullopt;

    std::string dir = parts.size() >= 2 ? parts[parts.size() - 2] : "";
    UnitType type = UnitType::Other;
    if (contains(dir, "vehicle") || contains(dir, "vee")) type = UnitType::Vehicle;
    else if (contains(dir, "fighter") || contains(dir, "aero")) type = UnitType::Fighter;
    return EntryClass{UnitFormat::Blk, type};
}

std::optional<ParsedUnit> parse_entry(const SourceEntry& entry) {
    if (entry.kind.format == UnitFormat::Mtf) return parse_mtf(entry.content);
    return parse_blk(entry.content, entry.kind.default_type);
}

std::unique_ptr<UnitSource> make_unit_source(const fs::path& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) return std::make_unique<DirectorySource>(path);
    return std::make_unique<ZipSource>(path);
}

// =============================================================================
// DirectorySource
// =============================================================================

DirectorySource::DirectorySource(fs::path root) : root_(std::move(root)) {}

void DirectorySource::open() {
    files_.clear();
    pos_ = 0;

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        throw SetupError("Unit directory not readable: " + root_.string());
    }

    for (fs::recursive_directory_iterator it(root_, ec), end; it != end; it.increment(ec)) {
        if (ec) {
            throw SetupError("Failed to walk " + root_.string() + ": " + ec.message());
        }
        if (it->is_regular_file()) files_.push_back(it->path());
    }
    std::sort(files_.begin(), files_.end());
}

std::optional<SourceEntry> DirectorySource::next() {
    while (pos_ < files_.size()) {
        const fs::path& file = files_[pos_++];
        std::string name = fs::relative(file, root_).generic_string();

        auto kind = classify_entry(name);
        if (!kind) continue;

        std::ifstream in(file, std::ios::binary);
        if (!in) {
            Logger::warn("Cannot read " + file.string());
            continue;
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        return SourceEntry{name, *kind, buf.str()};
    }
    return std::nullopt;
}

void DirectorySource::close() {
    files_.clear();
    pos_ = 0;
}

// =============================================================================
// ZipSource
// =============================================================================

ZipSource::ZipSource(fs::path archive) : archive_(std::move(archive)) {}

ZipSource::~ZipSource() {
    close();
}

void ZipSource::open() {
    close();
    handle_ = unzOpen64(archive_.string().c_str());
    if (!handle_) {
        throw SetupError("Cannot open zip archive: " + archive_.string());
    }
    at_end_ = false;
    started_ = false;
}

void ZipSource::close() {
    if (handle_) {
        unzClose(static_cast<unzFile>(handle_));
        handle_ = nullptr;
    }
}

std::string ZipSource::read_current() {
    unzFile zf = static_cast<unzFile>(handle_);
    if (unzOpenCurrentFile(zf) != UNZ_OK) {
        throw SetupError("Corrupt zip entry in " + archive_.string());
    }

    std::string content;
    char buf[16384];
    int n = 0;
    while ((n = unzReadCurrentFile(zf, buf, sizeof(buf))) > 0) {
        content.append(buf, static_cast<size_t>(n));
    }
    unzCloseCurrentFile(zf);

    if (n < 0) {
        throw SetupError("Failed to inflate zip entry in " + archive_.string());
    }
    return content;
}

std::optional<SourceEntry> ZipSource::next() {
    if (!handle_) throw SetupError("Zip archive not open: " + archive_.string());
    unzFile zf = static_cast<unzFile>(handle_);

    while (!at_end_) {
        int rc = started_ ? unzGoToNextFile(zf) : unzGoToFirstFile(zf);
        started_ = true;
        if (rc == UNZ_END_OF_LIST_OF_FILE) {
            at_end_ = true;
            break;
        }
        if (rc != UNZ_OK) {
            throw SetupError("Corrupt zip directory in " + archive_.string());
        }

        unz_file_info64 info;
        char name_buf[1024];
        if (unzGetCurrentFileInfo64(zf, &info, name_buf, sizeof(name_buf),
                                    nullptr, 0, nullptr, 0) != UNZ_OK) {
            throw SetupError("Corrupt zip entry header in " + archive_.string());
        }

        std::string name(name_buf);
        auto kind = classify_entry(name);
        if (!kind) continue;

        return SourceEntry{name, *kind, read_current()};
    }
    return std::nullopt;
}

} // namespace Armory
