#pragma once
#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "ensemble/RoundTypes.hpp"

namespace champ {

// ---------------------------------------------------------------------------
// Append-only, hash-chained round archive.
//
//   blob    = canonical JSON of the record (sorted keys, compact)
//   content = sha256_hex(blob)
//   root_n  = sha256_hex(root_{n-1} + content)        root_0 = ""
//
// Each blob lands in <base>/<content>.json. The root only advances once the
// file is flushed; a failed write throws PersistenceError and leaves the
// root where it was.
//
// Retention: after every write, the oldest entries are deleted until at most
// archive_cap remain. Order is write order: files found at startup (by
// mtime, then name) followed by this instance's writes. Pruning never
// touches the root: it is an accumulator, not a list.
//
// Single writer: log_round() is serialized by a mutex.
// ---------------------------------------------------------------------------
class ChainedLog {
public:
    ChainedLog(std::filesystem::path base, size_t archive_cap);

    std::string log_round(const RoundRecord& record);

    // "" until the first round is logged.
    std::string current_root() const;

    size_t entry_count() const;
    const std::filesystem::path& base() const { return base_; }

    static std::string serialize(const RoundRecord& record);
    static std::string combine(const std::string& prev_root, const std::string& content);

    // Re-derive the root from archived blobs, oldest first.
    static std::string replay(const std::vector<std::string>& blobs);

private:
    void load_existing();
    void prune();

    const std::filesystem::path base_;
    const size_t                cap_;

    mutable std::mutex                 mtx_;
    std::string                        root_;
    std::deque<std::filesystem::path>  entries_;
};

} // namespace champ
