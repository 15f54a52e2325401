#pragma once

#include "persistence/records.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <vector>

class SnapshotError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Directory of snapshot files keyed by WAL sequence:
 *
 *   <dir>/snapshot_00000000000000000042.json
 *
 * Each file is written to a temporary name, fsynced and renamed into place, so
 * a crash never leaves a half-written snapshot under a final name. Older
 * snapshots are kept; retention is up to whoever manages the directory.
 */
class SnapshotStore {
public:
    explicit SnapshotStore(std::filesystem::path dir);

    // Throws SnapshotError if the file cannot be written.
    std::filesystem::path save(const Snapshot& snapshot) const;

    // Highest-sequence snapshot that parses; corrupt files are logged and skipped.
    [[nodiscard]] std::optional<Snapshot> load_latest() const;

    // Throws SnapshotError if the file is missing or does not parse.
    [[nodiscard]] static Snapshot load(const std::filesystem::path& file);

    // Sequences of the snapshot files present, ascending.
    [[nodiscard]] std::vector<SequenceNumber> list() const;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

    [[nodiscard]] static std::string file_name(SequenceNumber sequence);

private:
    std::filesystem::path dir_;
};
