#pragma once

#include "persistence/records.hpp"
#include "time/clock.hpp"
#include "utils/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <vector>

class WalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct WalReadStats {
    std::size_t lines_total{0};
    std::size_t entries_loaded{0};
    std::size_t malformed_lines{0};
};

// Read-only view of a log file. Never creates, opens for writing or syncs it.
class WalReader {
public:
    explicit WalReader(std::filesystem::path path) : path_(std::move(path)) {}

    // Every well-formed entry in file order. Malformed lines are logged and
    // skipped. A missing file reads as empty.
    [[nodiscard]] std::vector<WalEntry> read_all();

    [[nodiscard]] const WalReadStats& last_read_stats() const noexcept {
        return read_stats_;
    }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    WalReadStats read_stats_;
};

/**
 * Append-only, newline-delimited JSON write-ahead log.
 *
 * Each append assigns the next sequence number, writes one line and, every
 * fsync_every_n appends, fsyncs the file. With fsync_every_n == 1 every append
 * is durable before it returns; with N > 1 a power failure can lose at most
 * the N - 1 most recent entries. Write and fsync failures throw WalError. A
 * failed write does not consume a sequence number; a failed fsync does, since
 * the line is already in the file.
 *
 * After a failed fsync the log is marked failed: the kernel may have dropped
 * the dirty pages, so a later fsync succeeding proves nothing. Every further
 * append or sync throws WalError and the owner must restart and recover from
 * the file.
 *
 * Opening an existing log resumes numbering after the highest sequence in it.
 * Not thread safe; the owner serialises access.
 */
class WriteAheadLog {
public:
    explicit WriteAheadLog(std::filesystem::path path, std::uint32_t fsync_every_n = 1,
                           const Clock& clock = system_clock());
    virtual ~WriteAheadLog();

    WriteAheadLog(const WriteAheadLog&) = delete;
    WriteAheadLog& operator=(const WriteAheadLog&) = delete;
    WriteAheadLog(WriteAheadLog&&) = delete;
    WriteAheadLog& operator=(WriteAheadLog&&) = delete;

    SequenceNumber append(WalEntryType type, const nlohmann::json& payload);

    void sync();

    // WalReader::read_all, also raising current_sequence() to the highest
    // sequence seen.
    [[nodiscard]] std::vector<WalEntry> read_all();
    [[nodiscard]] std::vector<WalEntry> read_since(SequenceNumber seq);

    [[nodiscard]] SequenceNumber current_sequence() const noexcept { return sequence_; }

    // Moves numbering forward so the next append is above `seq`.
    void ensure_sequence_at_least(SequenceNumber seq);
    [[nodiscard]] const WalReadStats& last_read_stats() const noexcept {
        return reader_.last_read_stats();
    }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint32_t fsync_every_n() const noexcept { return fsync_every_n_; }
    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] bool failed() const noexcept { return failed_; }

    // Syncs and releases the file. Safe to call more than once.
    void close();

    // Deletes the log and starts over at sequence 0. Test teardown only.
    void truncate();

protected:
    // fsync(2) on the log's descriptor; overridden in tests to inject failures.
    virtual int sync_descriptor_(int fd);

private:
    std::filesystem::path path_;
    std::uint32_t fsync_every_n_;
    const Clock& clock_;
    int fd_{-1};
    SequenceNumber sequence_{0};
    std::uint32_t pending_writes_{0};
    bool needs_newline_{false};
    bool failed_{false};
    WalReader reader_;

    void open_();
    void write_all_(const char* data, std::size_t size);
    void fsync_();
};
