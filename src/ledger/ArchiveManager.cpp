#include "ledger/ArchiveManager.hpp"
#include <algorithm>
#include <iostream>
#include <system_error>

#include "core/Errors.hpp"

using namespace champ;
namespace fs = std::filesystem;

ArchiveManager::ArchiveManager(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) throw PersistenceError("cannot create " + root_.string() + ": " + ec.message());
}

std::vector<fs::path> ArchiveManager::list_archives() const {
    std::vector<fs::path> out;
    std::error_code ec;
    for (const auto& de : fs::directory_iterator(root_, ec)) {
        if (de.is_regular_file() && de.path().extension() == ".json") out.push_back(de.path());
    }
    if (ec) throw PersistenceError("cannot scan " + root_.string() + ": " + ec.message());
    std::sort(out.begin(), out.end());
    return out;
}

size_t ArchiveManager::backup(const fs::path& destination) const {
    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec) throw PersistenceError("cannot create " + destination.string() + ": " + ec.message());

    size_t copied = 0;
    for (const auto& src : list_archives()) {
        fs::copy_file(src, destination / src.filename(),
                      fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw PersistenceError("backup of " + src.string() + " failed: " + ec.message());
        }
        ++copied;
    }
    std::cout << "[ARCHIVE] Backed up " << copied << " entries to "
              << destination.string() << "\n";
    return copied;
}
