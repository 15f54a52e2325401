#pragma once

#include "exchange/matching_engine.hpp"
#include "persistence/records.hpp"
#include "persistence/wal.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>

struct RecoveryStats {
    std::optional<SequenceNumber> snapshot_sequence;
    std::size_t entries_read{0};
    std::size_t malformed_lines{0};
    std::size_t orders_replayed{0};
    std::size_t cancels_replayed{0};
    std::size_t matches_skipped{0};
    std::size_t trades_rederived{0};
    std::size_t failed_entries{0};
    SequenceNumber last_sequence{0};
};

/**
 * Startup routine: latest snapshot (if any) -> restore -> replay the WAL tail.
 *
 * ORDER_PLACED and ORDER_CANCELLED entries are fed back through the matching
 * engine in ascending sequence order; trades are re-derived by the matcher, so
 * ORDER_MATCHED entries are only counted. An entry whose payload cannot be
 * replayed is logged and skipped. A snapshot that cannot be restored is
 * discarded in favour of a full replay from sequence 0.
 *
 * Built over a WriteAheadLog, recovery also moves the log's numbering past the
 * snapshot. Built over a bare path, it only reads the file.
 */
class RecoveryCoordinator {
public:
    using SnapshotLoader = std::function<std::optional<Snapshot>()>;

    RecoveryCoordinator(MatchingEngine& engine, WriteAheadLog& wal,
                        SnapshotLoader load_snapshot = {});
    RecoveryCoordinator(MatchingEngine& engine, const std::filesystem::path& wal_path,
                        SnapshotLoader load_snapshot = {});

    RecoveryStats recover();

private:
    MatchingEngine& engine_;
    WriteAheadLog* wal_;
    WalReader reader_;
    SnapshotLoader load_snapshot_;

    void replay_(const WalEntry& entry, RecoveryStats& stats);
};
