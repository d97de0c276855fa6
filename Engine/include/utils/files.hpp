#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace Armory {

/// Whole file as bytes, or nullopt when it does not exist or cannot be opened.
std::optional<std::string> read_file(const std::filesystem::path& path);

/**
 * @brief Write via "<path>.tmp" and rename, creating parent directories.
 *
 * A reader never observes a partially written file. Throws SetupError on I/O failure.
 */
void write_file_atomic(const std::filesystem::path& path, const std::string& content);

} // namespace Armory
