#include "config/config_loader.hpp"
#include "exchange/matching_engine.hpp"
#include "persistence/snapshot_manager.hpp"
#include "persistence/wal.hpp"
#include "recovery/recovery_coordinator.hpp"
#include "service/order_service.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

namespace {

std::atomic<bool> shutdown_requested{false};

extern "C" void handle_shutdown_signal(int) {
    shutdown_requested.store(true);
}

// Installed without SA_RESTART so a signal interrupts the blocking read on stdin.
void install_signal_handlers() {
    struct sigaction action{};
    action.sa_handler = handle_shutdown_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

nlohmann::json to_wire(const ServiceResponse& response) {
    return nlohmann::json{{"status_code", response.status_code}, {"body", response.body}};
}

void serve(OrderService& service) {
    std::string line;
    while (!shutdown_requested.load() && std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        ServiceResponse response;
        try {
            response = service.handle(nlohmann::json::parse(line));
        } catch (const nlohmann::json::parse_error& e) {
            response = bad_request(std::string("Invalid JSON: ") + e.what());
        }

        std::cout << to_wire(response).dump(-1, ' ', false,
                                            nlohmann::json::error_handler_t::replace)
                  << '\n'
                  << std::flush;
    }
}

int run(const ServiceConfig& config) {
    WriteAheadLog wal(config.wal_path, config.fsync_every_n);
    MatchingEngine engine;
    std::mutex engine_mutex;

    std::unique_ptr<SnapshotManager> snapshots;
    if (config.snapshots_enabled) {
        snapshots = std::make_unique<SnapshotManager>(engine, engine_mutex,
                                                      SnapshotStore(config.snapshot_dir),
                                                      config.snapshot_interval);
    }

    RecoveryCoordinator::SnapshotLoader loader;
    if (snapshots) {
        loader = [&snapshots] { return snapshots->load_latest(); };
    }

    RecoveryStats stats = RecoveryCoordinator(engine, wal, loader).recover();
    spdlog::info("Recovered {} symbols, {} resting orders, sequence {}",
                 engine.symbols().size(), engine.resting_order_count(),
                 stats.last_sequence.value());

    if (snapshots) {
        snapshots->start([&wal]() -> std::optional<SequenceNumber> {
            if (wal.failed()) {
                return std::nullopt;
            }
            return wal.current_sequence();
        });
    }

    OrderService service(engine, wal, engine_mutex,
                         FixedPointScale{.price_scale = config.price_scale,
                                         .quantity_scale = config.quantity_scale});

    spdlog::info("Order book service ready (port {} reserved, serving stdin)", config.port);
    serve(service);
    spdlog::info("Shutting down");

    if (snapshots) {
        snapshots->stop();
        if (wal.failed()) {
            spdlog::error("Skipping final snapshot, WAL {} failed an fsync",
                          wal.path().string());
        } else {
            try {
                std::ignore = snapshots->create_snapshot(wal.current_sequence());
            } catch (const SnapshotError& e) {
                spdlog::error("Final snapshot failed: {}", e.what());
            }
        }
    }

    wal.sync();
    wal.close();
    return 0;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --config <path>  Load service configuration from JSON file\n";
    std::cout << "  --help           Show this help message\n";
    std::cout << "\nRequests are read from stdin, one JSON object per line:\n";
    std::cout << "  {\"op\": \"order\", \"user_id\": \"u1\", \"symbol\": \"BTC-USD\", "
                 "\"side\": \"buy\", \"type\": \"limit\", \"price\": 50000, "
                 "\"quantity\": 1}\n";
    std::cout << "  {\"op\": \"cancel\", \"order_id\": \"ORD-1\", \"symbol\": \"BTC-USD\"}\n";
    std::cout << "  {\"op\": \"snapshot\", \"symbol\": \"BTC-USD\"}\n";
    std::cout << "  {\"op\": \"health\"}\n";
    std::cout << "\nEnvironment: ORDERBOOK_PORT, ORDERBOOK_WAL_PATH, FSYNC_EVERY_N,\n"
                 "SNAPSHOT_INTERVAL_MS, ORDERBOOK_SNAPSHOT_DIR, ORDERBOOK_LOG_LEVEL\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<std::filesystem::path> config_path;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (i + 1 < argc) {
                config_path = argv[++i];
            } else {
                std::cerr << "Error: --config requires a path argument\n";
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

    // stdout carries responses, so logs go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("orderbook"));

    try {
        ServiceConfig config = load_config(config_path);
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        if (config_path) {
            spdlog::info("Loaded config from {}", config_path->string());
        }

        install_signal_handlers();
        return run(config);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }
}
