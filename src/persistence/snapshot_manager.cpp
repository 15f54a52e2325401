#include "persistence/snapshot_manager.hpp"

#include <spdlog/spdlog.h>

SnapshotManager::SnapshotManager(const MatchingEngine& engine, std::mutex& engine_mutex,
                                 SnapshotStore store, std::chrono::milliseconds interval,
                                 const Clock& clock)
    : engine_(engine), engine_mutex_(engine_mutex), store_(std::move(store)),
      interval_(interval), clock_(clock) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("snapshot interval must be positive");
    }
}

SnapshotManager::~SnapshotManager() {
    stop();
}

void SnapshotManager::start(SequenceProvider current_sequence) {
    if (worker_.joinable()) {
        return;
    }

    {
        std::lock_guard lock(state_mutex_);
        stop_requested_ = false;
    }

    worker_ = std::thread(&SnapshotManager::run_, this, std::move(current_sequence));
    spdlog::info("Snapshot manager started (interval: {}ms, dir: {})", interval_.count(),
                 store_.directory().string());
}

void SnapshotManager::stop() {
    {
        std::lock_guard lock(state_mutex_);
        stop_requested_ = true;
    }
    wakeup_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
        spdlog::info("Snapshot manager stopped");
    }
}

void SnapshotManager::run_(SequenceProvider current_sequence) {
    std::unique_lock lock(state_mutex_);
    while (!wakeup_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
        lock.unlock();
        tick_(current_sequence);
        lock.lock();
    }
}

void SnapshotManager::tick_(const SequenceProvider& current_sequence) {
    Snapshot snapshot;
    {
        std::lock_guard engine_lock(engine_mutex_);
        std::optional<SequenceNumber> sequence = current_sequence();
        if (!sequence || sequence == last_saved_sequence()) {
            return;
        }

        snapshot.sequence = *sequence;

        snapshot.timestamp = clock_.now();
        snapshot.books = engine_.get_full_state();
    }

    try {
        save_(snapshot);
    } catch (const SnapshotError& e) {
        spdlog::error("Snapshot at sequence {} failed: {}", snapshot.sequence.value(),
                      e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Snapshot at sequence {} failed: {}", snapshot.sequence.value(),
                      e.what());
    }
}

Snapshot SnapshotManager::create_snapshot(SequenceNumber sequence) {
    Snapshot snapshot;
    {
        std::lock_guard engine_lock(engine_mutex_);
        snapshot = Snapshot{.timestamp = clock_.now(),
                            .sequence = sequence,
                            .books = engine_.get_full_state()};
    }

    save_(snapshot);
    return snapshot;
}

void SnapshotManager::save_(const Snapshot& snapshot) {
    auto path = store_.save(snapshot);

    {
        std::lock_guard lock(state_mutex_);
        last_saved_ = snapshot.sequence;
    }

    spdlog::info("Snapshot created at sequence {} ({} symbols) -> {}",
                 snapshot.sequence.value(), snapshot.books.size(), path.string());
}

std::optional<SequenceNumber> SnapshotManager::last_saved_sequence() const {
    std::lock_guard lock(state_mutex_);
    return last_saved_;
}
