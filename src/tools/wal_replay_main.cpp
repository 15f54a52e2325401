#include "exchange/matching_engine.hpp"
#include "persistence/snapshot_store.hpp"
#include "persistence/wal.hpp"
#include "recovery/recovery_coordinator.hpp"
#include "time/clock.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <print>
#include <string>

namespace {

struct ReplayOptions {
    std::filesystem::path wal_path;
    std::optional<std::filesystem::path> snapshot_dir;
    std::optional<std::string> symbol;
    std::optional<std::filesystem::path> output;
    std::size_t depth{15};
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " --wal <path> [options]\n";
    std::cout << "\nRebuilds the order books offline from a write-ahead log.\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --wal <path>           WAL file to replay (required)\n";
    std::cout << "  --snapshot-dir <dir>   Start from the latest snapshot in <dir>\n";
    std::cout << "  --symbol <symbol>      Only print this book (default: all)\n";
    std::cout << "  --output <file>        Write the rebuilt state as a snapshot file\n";
    std::cout << "  --depth <n>            Price levels to print per side (default: 15)\n";
    std::cout << "  --help                 Show this help message\n";
}

void print_summary(const RecoveryStats& stats, const MatchingEngine& engine) {
    std::println("Replay summary");
    if (stats.snapshot_sequence) {
        std::println("  Snapshot sequence:   {}", *stats.snapshot_sequence);
    } else {
        std::println("  Snapshot sequence:   none");
    }
    std::println("  Entries read:        {}", stats.entries_read);
    std::println("  Malformed lines:     {}", stats.malformed_lines);
    std::println("  Orders placed:       {}", stats.orders_replayed);
    std::println("  Cancels:             {}", stats.cancels_replayed);
    std::println("  Trades re-derived:   {}", stats.trades_rederived);
    std::println("  Logged matches:      {}", stats.matches_skipped);
    std::println("  Failed entries:      {}", stats.failed_entries);
    std::println("  Final sequence:      {}", stats.last_sequence);
    std::println("  Resting orders:      {}\n", engine.resting_order_count());
}

} // namespace

int main(int argc, char* argv[]) {
    ReplayOptions options;

    for (int i = 1; i < argc; ++i) {
        auto needs_value = [&](const char* flag) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << flag << " requires an argument\n";
                return false;
            }
            return true;
        };

        if (std::strcmp(argv[i], "--wal") == 0) {
            if (!needs_value("--wal")) return 1;
            options.wal_path = argv[++i];
        } else if (std::strcmp(argv[i], "--snapshot-dir") == 0) {
            if (!needs_value("--snapshot-dir")) return 1;
            options.snapshot_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--symbol") == 0) {
            if (!needs_value("--symbol")) return 1;
            options.symbol = argv[++i];
        } else if (std::strcmp(argv[i], "--output") == 0 ||
                   std::strcmp(argv[i], "-o") == 0) {
            if (!needs_value("--output")) return 1;
            options.output = argv[++i];
        } else if (std::strcmp(argv[i], "--depth") == 0) {
            if (!needs_value("--depth")) return 1;
            try {
                options.depth = std::stoul(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --depth expects a number\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--help") == 0 ||
                   std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (options.wal_path.empty()) {
        std::cerr << "Error: --wal is required\n";
        print_usage(argv[0]);
        return 1;
    }
    if (!std::filesystem::exists(options.wal_path)) {
        std::cerr << "Error: WAL file not found: " << options.wal_path.string() << "\n";
        return 1;
    }

    spdlog::set_level(spdlog::level::warn);

    try {
        MatchingEngine engine;

        RecoveryCoordinator::SnapshotLoader loader;
        if (options.snapshot_dir) {
            loader = [store = SnapshotStore(*options.snapshot_dir)] {
                return store.load_latest();
            };
        }

        RecoveryStats stats = RecoveryCoordinator(engine, options.wal_path, loader).recover();
        print_summary(stats, engine);

        if (options.symbol) {
            engine.print_order_book(*options.symbol, options.depth);
        } else {
            for (const auto& symbol : engine.symbols()) {
                engine.print_order_book(symbol, options.depth);
                std::cout << "\n";
            }
        }

        if (options.output) {
            Snapshot snapshot{.timestamp = system_clock().now(),
                              .sequence = stats.last_sequence,
                              .books = engine.get_full_state()};

            std::ofstream file(*options.output);
            if (!file.is_open()) {
                std::cerr << "Error: cannot open " << options.output->string() << "\n";
                return 1;
            }
            file << nlohmann::json(snapshot).dump(2) << "\n";
            std::cout << "Reconstructed state written to " << options.output->string()
                      << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
