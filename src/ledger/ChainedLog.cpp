#include "ledger/ChainedLog.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

#include "core/Errors.hpp"
#include "ledger/Sha256.hpp"

using namespace champ;
namespace fs = std::filesystem;

ChainedLog::ChainedLog(fs::path base, size_t archive_cap)
    : base_(std::move(base)), cap_(archive_cap) {
    if (cap_ == 0) throw std::invalid_argument("ChainedLog: archive_cap must be positive");

    std::error_code ec;
    fs::create_directories(base_, ec);
    if (ec) {
        throw PersistenceError("cannot create archive dir " + base_.string() + ": " + ec.message());
    }
    load_existing();
}

void ChainedLog::load_existing() {
    struct Found {
        fs::file_time_type mtime;
        fs::path           path;
    };
    std::vector<Found> found;

    std::error_code ec;
    for (const auto& de : fs::directory_iterator(base_, ec)) {
        if (!de.is_regular_file() || de.path().extension() != ".json") continue;
        std::error_code tec;
        auto t = fs::last_write_time(de.path(), tec);
        if (tec) continue;
        found.push_back({t, de.path()});
    }
    if (ec) {
        throw PersistenceError("cannot scan archive dir " + base_.string() + ": " + ec.message());
    }

    std::sort(found.begin(), found.end(), [](const Found& a, const Found& b) {
        if (a.mtime != b.mtime) return a.mtime < b.mtime;
        return a.path < b.path;
    });
    for (auto& f : found) entries_.push_back(std::move(f.path));

    if (!entries_.empty()) {
        std::cout << "[LEDGER] " << entries_.size() << " archived rounds found in "
                  << base_.string() << "\n";
    }
}

std::string ChainedLog::serialize(const RoundRecord& record) {
    // Endpoint text is untrusted: invalid UTF-8 becomes U+FFFD instead of
    // throwing, so a bad reply can never keep a round out of the chain.
    return nlohmann::json(record).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string ChainedLog::combine(const std::string& prev_root, const std::string& content) {
    return sha256_hex(prev_root + content);
}

std::string ChainedLog::replay(const std::vector<std::string>& blobs) {
    std::string root;
    for (const auto& blob : blobs) root = combine(root, sha256_hex(blob));
    return root;
}

std::string ChainedLog::log_round(const RoundRecord& record) {
    std::lock_guard<std::mutex> lock(mtx_);

    const std::string blob    = serialize(record);
    const std::string content = sha256_hex(blob);
    const fs::path    path    = base_ / (content + ".json");

    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw PersistenceError("cannot open " + path.string() + " for writing");
        }
        out.write(blob.data(), static_cast<std::streamsize>(blob.size()));
        out.flush();
        if (!out) throw PersistenceError("write failed: " + path.string());
    }

    root_ = combine(root_, content);

    // Identical content rewrites the same file; it moves to the newest slot.
    entries_.erase(std::remove(entries_.begin(), entries_.end(), path), entries_.end());
    entries_.push_back(path);
    prune();

    return root_;
}

void ChainedLog::prune() {
    while (entries_.size() > cap_) {
        std::error_code ec;
        fs::remove(entries_.front(), ec);
        if (ec) {
            std::cerr << "[LEDGER] Prune failed for " << entries_.front().string()
                      << ": " << ec.message() << "\n";
        }
        entries_.pop_front();
    }
}

std::string ChainedLog::current_root() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return root_;
}

size_t ChainedLog::entry_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}
