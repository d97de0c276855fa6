#include <utils/files.hpp>
#include <core/errors.hpp>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace Armory {

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

void write_file_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) throw SetupError("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw SetupError("Cannot write " + tmp.string());
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) throw SetupError("Short write to " + tmp.string());
    }

    fs::rename(tmp, path, ec);
    if (ec) throw SetupError("Cannot rename " + tmp.string() + " to " + path.string() + ": " + ec.message());
}

} // namespace Armory
