#include "persistence/wal.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <string>
#include <tuple>

#include <fcntl.h>
#include <unistd.h>

namespace {

std::string errno_message(const char* what, const std::filesystem::path& path) {
    return std::format("WAL {} failed for {}: {}", what, path.string(), std::strerror(errno));
}

bool ends_without_newline(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec || size == 0) {
        return false;
    }

    std::ifstream file(path, std::ios::binary);
    file.seekg(-1, std::ios::end);
    char last = '\n';
    file.get(last);
    return last != '\n';
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

} // namespace

WriteAheadLog::WriteAheadLog(std::filesystem::path path, std::uint32_t fsync_every_n,
                             const Clock& clock)
    : path_(std::move(path)), fsync_every_n_(fsync_every_n), clock_(clock), reader_(path_) {
    if (fsync_every_n_ == 0) {
        throw std::invalid_argument("fsync_every_n must be at least 1");
    }

    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }

    // resume numbering where the previous process stopped
    std::ignore = read_all();
    needs_newline_ = ends_without_newline(path_);
    if (needs_newline_) {
        spdlog::warn("WAL {} ends with a partial line, it will be terminated before the "
                     "next append",
                     path_.string());
    }

    open_();
}

WriteAheadLog::~WriteAheadLog() {
    try {
        close();
    } catch (const WalError& e) {
        spdlog::error("Closing WAL failed: {}", e.what());
    }
}

void WriteAheadLog::open_() {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw WalError(errno_message("open", path_));
    }
}

void WriteAheadLog::write_all_(const char* data, std::size_t size) {
    while (size > 0) {
        ssize_t written = ::write(fd_, data, size);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw WalError(errno_message("write", path_));
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
}

int WriteAheadLog::sync_descriptor_(int fd) {
    return ::fsync(fd);
}

void WriteAheadLog::fsync_() {
    if (failed_) {
        throw WalError("WAL " + path_.string() + " is unusable after a failed fsync");
    }
    if (sync_descriptor_(fd_) != 0) {
        failed_ = true;
        throw WalError(errno_message("fsync", path_));
    }
    pending_writes_ = 0;
}

SequenceNumber WriteAheadLog::append(WalEntryType type, const nlohmann::json& payload) {
    if (fd_ < 0) {
        throw WalError("WAL " + path_.string() + " is closed");
    }
    if (failed_) {
        throw WalError("WAL " + path_.string() + " is unusable after a failed fsync");
    }

    WalEntry entry{.seq = SequenceNumber{sequence_.value() + 1},
                   .ts = clock_.now(),
                   .type = type,
                   .payload = payload};

    std::string line = nlohmann::json(entry).dump(-1, ' ', false,
                                                  nlohmann::json::error_handler_t::replace);
    line.push_back('\n');
    if (needs_newline_) {
        line.insert(line.begin(), '\n');
    }

    try {
        write_all_(line.data(), line.size());
    } catch (const WalError&) {
        // part of the line may have reached the file
        needs_newline_ = true;
        throw;
    }

    needs_newline_ = false;
    sequence_ = entry.seq;

    if (++pending_writes_ >= fsync_every_n_) {
        fsync_();
    }

    return entry.seq;
}

void WriteAheadLog::sync() {
    if (fd_ < 0) {
        return;
    }
    fsync_();
}

std::vector<WalEntry> WalReader::read_all() {
    read_stats_ = {};
    std::vector<WalEntry> entries;

    std::ifstream file(path_);
    if (!file.is_open()) {
        return entries;
    }

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (is_blank(line)) {
            continue;
        }
        ++read_stats_.lines_total;

        try {
            WalEntry entry = nlohmann::json::parse(line).get<WalEntry>();
            entries.push_back(std::move(entry));
            ++read_stats_.entries_loaded;
        } catch (const nlohmann::json::exception& e) {
            ++read_stats_.malformed_lines;
            spdlog::warn("Skipping malformed WAL line {} in {}: {}", line_no, path_.string(),
                         e.what());
        } catch (const std::invalid_argument& e) {
            ++read_stats_.malformed_lines;
            spdlog::warn("Skipping WAL line {} in {}: {}", line_no, path_.string(), e.what());
        }
    }

    return entries;
}

std::vector<WalEntry> WriteAheadLog::read_all() {
    std::vector<WalEntry> entries = reader_.read_all();
    for (const WalEntry& entry : entries) {
        if (entry.seq > sequence_) {
            sequence_ = entry.seq;
        }
    }
    return entries;
}

std::vector<WalEntry> WriteAheadLog::read_since(SequenceNumber seq) {
    std::vector<WalEntry> entries = read_all();
    std::erase_if(entries, [seq](const WalEntry& entry) { return entry.seq <= seq; });
    return entries;
}

void WriteAheadLog::ensure_sequence_at_least(SequenceNumber seq) {
    if (sequence_ >= seq) {
        return;
    }

    spdlog::warn("WAL {} is behind sequence {} (at {}), continuing numbering from {}",
                 path_.string(), seq.value(), sequence_.value(), seq.value());
    sequence_ = seq;
}

void WriteAheadLog::close() {
    if (fd_ < 0) {
        return;
    }

    int fd = fd_;
    fd_ = -1;

    bool synced = ::fsync(fd) == 0;
    std::string sync_error = synced ? std::string{} : errno_message("fsync", path_);

    if (::close(fd) != 0 && synced) {
        throw WalError(errno_message("close", path_));
    }
    if (!synced) {
        throw WalError(sync_error);
    }
    pending_writes_ = 0;
}

void WriteAheadLog::truncate() {
    close();
    std::filesystem::remove(path_);
    sequence_ = SequenceNumber{0};
    pending_writes_ = 0;
    needs_newline_ = false;
    failed_ = false;
    reader_ = WalReader(path_);
    open_();
}
