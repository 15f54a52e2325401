#include "persistence/snapshot_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <format>
#include <fstream>
#include <string_view>

#include <fcntl.h>
#include <unistd.h>

namespace {

constexpr std::string_view kPrefix = "snapshot_";
constexpr std::string_view kSuffix = ".json";

std::optional<SequenceNumber> parse_file_name(std::string_view name) {
    if (!name.starts_with(kPrefix) || !name.ends_with(kSuffix)) {
        return std::nullopt;
    }

    std::string_view digits =
        name.substr(kPrefix.size(), name.size() - kPrefix.size() - kSuffix.size());
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || digits.empty()) {
        return std::nullopt;
    }
    return SequenceNumber{value};
}

void fsync_path(const std::filesystem::path& path, int flags) {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) {
        throw SnapshotError(
            std::format("open {} for fsync failed: {}", path.string(), std::strerror(errno)));
    }
    int rc = ::fsync(fd);
    int saved_errno = errno;
    ::close(fd);
    if (rc != 0) {
        throw SnapshotError(
            std::format("fsync {} failed: {}", path.string(), std::strerror(saved_errno)));
    }
}

} // namespace

SnapshotStore::SnapshotStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

std::string SnapshotStore::file_name(SequenceNumber sequence) {
    return std::format("{}{:020}{}", kPrefix, sequence.value(), kSuffix);
}

std::filesystem::path SnapshotStore::save(const Snapshot& snapshot) const {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        throw SnapshotError("Failed to create snapshot directory " + dir_.string() + ": " +
                            ec.message());
    }

    const std::filesystem::path target = dir_ / file_name(snapshot.sequence);
    std::filesystem::path tmp = target;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            throw SnapshotError("Failed to open " + tmp.string() + " for writing");
        }
        file << nlohmann::json(snapshot).dump(-1, ' ', false,
                                              nlohmann::json::error_handler_t::replace);
        file.flush();
        if (!file) {
            throw SnapshotError("Failed to write " + tmp.string());
        }
    }

    fsync_path(tmp, O_RDONLY);

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        throw SnapshotError("Failed to rename " + tmp.string() + ": " + ec.message());
    }

    fsync_path(dir_, O_RDONLY | O_DIRECTORY);

    return target;
}

Snapshot SnapshotStore::load(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        throw SnapshotError("Failed to open snapshot " + file.string());
    }

    try {
        return nlohmann::json::parse(in).get<Snapshot>();
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError("Failed to parse snapshot " + file.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw SnapshotError("Invalid snapshot " + file.string() + ": " + e.what());
    }
}

std::vector<SequenceNumber> SnapshotStore::list() const {
    std::vector<SequenceNumber> sequences;

    std::error_code ec;
    if (!std::filesystem::is_directory(dir_, ec)) {
        return sequences;
    }

    for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        if (auto seq = parse_file_name(entry.path().filename().string())) {
            sequences.push_back(*seq);
        }
    }

    std::ranges::sort(sequences);
    return sequences;
}

std::optional<Snapshot> SnapshotStore::load_latest() const {
    auto sequences = list();

    for (auto it = sequences.rbegin(); it != sequences.rend(); ++it) {
        try {
            return load(dir_ / file_name(*it));
        } catch (const SnapshotError& e) {
            spdlog::warn("Skipping unreadable snapshot: {}", e.what());
        }
    }

    return std::nullopt;
}
