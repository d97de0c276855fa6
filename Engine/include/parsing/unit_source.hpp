#pragma once

#include <export.hpp>
#include <model/unit_types.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Armory {

enum class UnitFormat {
    Mtf,
    Blk
};

struct EntryClass {
    UnitFormat format;
    UnitType default_type;
};

/**
 * @brief Decide how an archive entry is parsed from its path.
 *
 * ".mtf" is a mek. ".blk" takes its default category from the parent
 * directory name ("vehicle"/"vee" -> vehicle, "fighter"/"aero" -> fighter,
 * anything else -> other). Directories and other files yield nullopt.
 */
ARMORY_API std::optional<EntryClass> classify_entry(std::string_view path);

struct SourceEntry {
    std::string name;   // path inside the archive, '/' separated
    EntryClass kind;
    std::string content;
};

/**
 * @brief Generator over the unit files of one archive.
 *
 * Entries that classify_entry() rejects are never returned.
 */
class UnitSource {
public:
    virtual ~UnitSource() = default;

    /// Throws SetupError when the archive cannot be read.
    virtual void open() = 0;
    virtual std::optional<SourceEntry> next() = 0;
    virtual void close() = 0;
};

/**
 * @brief Already-extracted archive. Files are visited in sorted path order.
 */
class ARMORY_API DirectorySource : public UnitSource {
public:
    explicit DirectorySource(std::filesystem::path root);

    void open() override;
    std::optional<SourceEntry> next() override;
    void close() override;

private:
    std::filesystem::path root_;
    std::vector<std::filesystem::path> files_;
    size_t pos_ = 0;
};

/**
 * @brief Zip archive read in central-directory order through minizip.
 */
class ARMORY_API ZipSource : public UnitSource {
public:
    explicit ZipSource(std::filesystem::path archive);
    ~ZipSource() override;

    ZipSource(const ZipSource&) = delete;
    ZipSource& operator=(const ZipSource&) = delete;

    void open() override;
    std::optional<SourceEntry> next() override;
    void close() override;

private:
    std::filesystem::path archive_;
    void* handle_ = nullptr;  // unzFile
    bool at_end_ = false;
    bool started_ = false;

    std::string read_current();
};

/// Directory paths give a DirectorySource, anything else a ZipSource.
ARMORY_API std::unique_ptr<UnitSource> make_unit_source(const std::filesystem::path& path);

/**
 * @brief Run the parser matching the entry's format.
 */
ARMORY_API std::optional<ParsedUnit> parse_entry(const SourceEntry& entry);

} // namespace Armory
