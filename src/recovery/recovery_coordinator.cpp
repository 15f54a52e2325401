#include "recovery/recovery_coordinator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <tuple>

namespace {

// A placement is only fed to the matcher if the live service could have
// accepted it; anything else would trip the matcher's own checks.
void check_replayable(const Order& order) {
    if (order.order_id.empty() || order.symbol.empty()) {
        throw std::invalid_argument("placement is missing its order_id or symbol");
    }
    if (order.quantity.is_zero()) {
        throw std::invalid_argument("order " + order.order_id + " has zero quantity");
    }
    if (order.filled_quantity > order.quantity) {
        throw std::invalid_argument("order " + order.order_id +
                                    " is filled beyond its quantity");
    }
    if (order.type == OrderType::LIMIT && order.price.is_zero()) {
        throw std::invalid_argument("limit order " + order.order_id + " has no price");
    }
}

} // namespace

RecoveryCoordinator::RecoveryCoordinator(MatchingEngine& engine, WriteAheadLog& wal,
                                         SnapshotLoader load_snapshot)
    : engine_(engine), wal_(&wal), reader_(wal.path()),
      load_snapshot_(std::move(load_snapshot)) {}

RecoveryCoordinator::RecoveryCoordinator(MatchingEngine& engine,
                                         const std::filesystem::path& wal_path,
                                         SnapshotLoader load_snapshot)
    : engine_(engine), wal_(nullptr), reader_(wal_path),
      load_snapshot_(std::move(load_snapshot)) {}

RecoveryStats RecoveryCoordinator::recover() {
    spdlog::info("Starting recovery from {}", reader_.path().string());

    RecoveryStats stats;
    SequenceNumber start_seq{0};
    engine_.reset();

    std::optional<Snapshot> snapshot = load_snapshot_ ? load_snapshot_() : std::nullopt;
    if (snapshot) {
        try {
            engine_.restore_state(snapshot->books);
            start_seq = snapshot->sequence;
            stats.snapshot_sequence = snapshot->sequence;
            spdlog::info("Loaded snapshot at sequence {} ({} resting orders)",
                         snapshot->sequence.value(), engine_.resting_order_count());
        } catch (const std::invalid_argument& e) {
            spdlog::error("Discarding snapshot at sequence {}, replaying full WAL: {}",
                          snapshot->sequence.value(), e.what());
        }
    }

    std::vector<WalEntry> entries = reader_.read_all();
    stats.malformed_lines = reader_.last_read_stats().malformed_lines;

    SequenceNumber highest_seq = start_seq;
    for (const WalEntry& entry : entries) {
        highest_seq = std::max(highest_seq, entry.seq);
    }

    std::erase_if(entries,
                  [start_seq](const WalEntry& entry) { return entry.seq <= start_seq; });
    stats.entries_read = entries.size();
    spdlog::info("Replaying {} WAL entries after sequence {}", entries.size(),
                 start_seq.value());

    std::ranges::stable_sort(entries, {}, &WalEntry::seq);

    for (const WalEntry& entry : entries) {
        try {
            replay_(entry, stats);
        } catch (const nlohmann::json::exception& e) {
            ++stats.failed_entries;
            spdlog::error("Failed to replay WAL entry {}: {}", entry.seq.value(), e.what());
        } catch (const std::invalid_argument& e) {
            ++stats.failed_entries;
            spdlog::error("Failed to replay WAL entry {}: {}", entry.seq.value(), e.what());
        }
    }

    // a snapshot may be newer than a damaged or replaced log; never reissue its sequences
    if (wal_ != nullptr) {
        wal_->ensure_sequence_at_least(highest_seq);
        stats.last_sequence = wal_->current_sequence();
    } else {
        stats.last_sequence = highest_seq;
    }

    spdlog::info("Recovery complete: {} orders, {} cancels replayed, {} trades re-derived, "
                 "{} entries failed, sequence {}",
                 stats.orders_replayed, stats.cancels_replayed, stats.trades_rederived,
                 stats.failed_entries, stats.last_sequence.value());

    return stats;
}

void RecoveryCoordinator::replay_(const WalEntry& entry, RecoveryStats& stats) {
    switch (entry.type) {
        case WalEntryType::ORDER_PLACED: {
            Order order = entry.payload.at("order").get<Order>();
            order.sequence = entry.seq;
            check_replayable(order);

            if (engine_.has_order(order.symbol, order.order_id)) {
                throw std::invalid_argument("order " + order.order_id +
                                            " is already resting in " + order.symbol);
            }

            PlaceResult result = engine_.place_order(std::move(order));
            stats.trades_rederived += result.trades.size();
            ++stats.orders_replayed;
            break;
        }
        case WalEntryType::ORDER_CANCELLED: {
            const auto symbol = entry.payload.at("symbol").get<std::string>();
            const auto order_id = entry.payload.at("order_id").get<std::string>();
            std::ignore = engine_.cancel_order(symbol, order_id);
            ++stats.cancels_replayed;
            break;
        }
        case WalEntryType::ORDER_MATCHED:
            ++stats.matches_skipped;
            break;
    }
}
