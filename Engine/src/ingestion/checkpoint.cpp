#include <ingestion/checkpoint.hpp>
#include <core/errors.hpp>
#include <utils/files.hpp>
#include <utils/text.hpp>
#include <fstream>

namespace fs = std::filesystem;

namespace Armory {

Checkpoint::Checkpoint(fs::path path) : path_(std::move(path)) {}

void Checkpoint::load() {
    done_.clear();
    auto content = read_file(path_);
    if (!content) return;
    for (const auto& line : split(*content, '\n')) {
        std::string entry = trim(line);
        if (!entry.empty()) done_.insert(entry);
    }
}

void Checkpoint::record(const std::string& entry) {
    if (path_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path_.parent_path(), ec);
    }
    std::ofstream out(path_, std::ios::app);
    if (!out) throw SetupError("Cannot write checkpoint " + path_.string());
    out << entry << '\n';
    out.flush();
    if (!out) throw SetupError("Cannot write checkpoint " + path_.string());
    done_.insert(entry);
}

void Checkpoint::remove() {
    std::error_code ec;
    fs::remove(path_, ec);
    done_.clear();
}

} // namespace Armory
