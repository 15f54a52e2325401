#pragma once

#include "exchange/matching_engine.hpp"
#include "persistence/snapshot_store.hpp"
#include "time/clock.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

/**
 * Periodically persists {timestamp, sequence, books} so recovery only has to
 * replay the WAL tail written after the snapshot.
 *
 * The engine mutex is the one that serialises WAL append + engine apply. Each
 * capture holds it while reading the current sequence and the full state, so a
 * snapshot always sits between two completed operations.
 */
class SnapshotManager {
public:
    // Sequence the captured state corresponds to, or nullopt when there is no
    // consistent one to record; that tick is skipped.
    using SequenceProvider = std::function<std::optional<SequenceNumber>()>;

    SnapshotManager(const MatchingEngine& engine, std::mutex& engine_mutex,
                    SnapshotStore store,
                    std::chrono::milliseconds interval = std::chrono::milliseconds{10000},
                    const Clock& clock = system_clock());
    ~SnapshotManager();

    SnapshotManager(const SnapshotManager&) = delete;
    SnapshotManager& operator=(const SnapshotManager&) = delete;

    // Starts the timer thread. Calling start while running is a no-op.
    void start(SequenceProvider current_sequence);

    // Cancels the timer and joins the thread. Safe to call more than once.
    void stop();

    [[nodiscard]] bool running() const noexcept { return worker_.joinable(); }

    // Captures and saves immediately. Throws SnapshotError on write failure.
    Snapshot create_snapshot(SequenceNumber sequence);

    [[nodiscard]] std::optional<Snapshot> load_latest() const { return store_.load_latest(); }

    [[nodiscard]] const SnapshotStore& store() const noexcept { return store_; }
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }
    [[nodiscard]] std::optional<SequenceNumber> last_saved_sequence() const;

private:
    const MatchingEngine& engine_;
    std::mutex& engine_mutex_;
    SnapshotStore store_;
    std::chrono::milliseconds interval_;
    const Clock& clock_;

    std::thread worker_;
    mutable std::mutex state_mutex_;
    std::condition_variable wakeup_;
    bool stop_requested_{false};
    std::optional<SequenceNumber> last_saved_;

    void run_(SequenceProvider current_sequence);
    void tick_(const SequenceProvider& current_sequence);
    void save_(const Snapshot& snapshot);
};
