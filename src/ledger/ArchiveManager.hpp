#pragma once
#include <filesystem>
#include <vector>

namespace champ {

// Offline view of a ChainedLog directory: listing and backup copies.
class ArchiveManager {
public:
    explicit ArchiveManager(std::filesystem::path root);

    // *.json entries, sorted by file name.
    std::vector<std::filesystem::path> list_archives() const;

    // Copies every entry into `destination` (created if missing), overwriting
    // same-named files. Returns the number copied. Throws PersistenceError.
    size_t backup(const std::filesystem::path& destination) const;

private:
    std::filesystem::path root_;
};

} // namespace champ
