#include <gtest/gtest.h>

#include "config/config_loader.hpp"
#include "testing/order_fixtures.hpp"

#include <nlohmann/json.hpp>
#include <map>

using json = nlohmann::json;

namespace {

EnvLookup fake_env(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const char* name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

const EnvLookup no_env = fake_env({});

} // namespace

// =============================================================================
// Defaults
// =============================================================================

TEST(ConfigLoaderTest, DefaultsMatchServiceContract) {
    ServiceConfig config = load_config(std::nullopt, no_env);

    EXPECT_EQ(config.port, 3001);
    EXPECT_EQ(config.wal_path.string(), "./data/wal/orderbook.wal");
    EXPECT_EQ(config.fsync_every_n, 1u);
    EXPECT_EQ(config.snapshot_interval, std::chrono::milliseconds{10000});
    EXPECT_EQ(config.snapshot_dir.string(), "./data/snapshots");
    EXPECT_TRUE(config.snapshots_enabled);
    EXPECT_EQ(config.price_scale, 100'000'000u);
    EXPECT_EQ(config.quantity_scale, 100'000'000u);
    EXPECT_EQ(config.log_level, "info");
}

// =============================================================================
// JSON
// =============================================================================

TEST(ConfigLoaderTest, ParseServiceConfig) {
    json j = {
        {"port", 4000},
        {"wal_path", "/var/lib/orderbook/wal.log"},
        {"fsync_every_n", 16},
        {"snapshot_interval_ms", 2500},
        {"snapshot_dir", "/var/lib/orderbook/snapshots"},
        {"snapshots_enabled", false},
        {"price_scale", 100},
        {"quantity_scale", 1000},
        {"log_level", "debug"}
    };

    ServiceConfig config = j.get<ServiceConfig>();

    EXPECT_EQ(config.port, 4000);
    EXPECT_EQ(config.wal_path.string(), "/var/lib/orderbook/wal.log");
    EXPECT_EQ(config.fsync_every_n, 16u);
    EXPECT_EQ(config.snapshot_interval, std::chrono::milliseconds{2500});
    EXPECT_EQ(config.snapshot_dir.string(), "/var/lib/orderbook/snapshots");
    EXPECT_FALSE(config.snapshots_enabled);
    EXPECT_EQ(config.price_scale, 100u);
    EXPECT_EQ(config.quantity_scale, 1000u);
    EXPECT_EQ(config.log_level, "debug");
}

TEST(ConfigLoaderTest, PartialJsonKeepsDefaults) {
    json j = {{"fsync_every_n", 8}};

    ServiceConfig config = j.get<ServiceConfig>();

    EXPECT_EQ(config.fsync_every_n, 8u);
    EXPECT_EQ(config.port, 3001);
    EXPECT_EQ(config.snapshot_interval, std::chrono::milliseconds{10000});
}

TEST(ConfigLoaderTest, WrongJsonTypeThrows) {
    json j = {{"port", "not a port"}};
    EXPECT_THROW(j.get<ServiceConfig>(), json::type_error);
}

// =============================================================================
// Environment
// =============================================================================

TEST(ConfigLoaderTest, EnvironmentOverridesDefaults) {
    auto env = fake_env({{"ORDERBOOK_PORT", "8080"},
                         {"ORDERBOOK_WAL_PATH", "/tmp/x.wal"},
                         {"FSYNC_EVERY_N", "32"},
                         {"SNAPSHOT_INTERVAL_MS", "500"},
                         {"ORDERBOOK_SNAPSHOT_DIR", "/tmp/snaps"},
                         {"ORDERBOOK_LOG_LEVEL", "warn"}});

    ServiceConfig config = load_config(std::nullopt, env);

    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.wal_path.string(), "/tmp/x.wal");
    EXPECT_EQ(config.fsync_every_n, 32u);
    EXPECT_EQ(config.snapshot_interval, std::chrono::milliseconds{500});
    EXPECT_EQ(config.snapshot_dir.string(), "/tmp/snaps");
    EXPECT_EQ(config.log_level, "warn");
}

TEST(ConfigLoaderTest, NonNumericEnvironmentValueThrows) {
    EXPECT_THROW(load_config(std::nullopt, fake_env({{"FSYNC_EVERY_N", "often"}})),
                 std::runtime_error);
    EXPECT_THROW(load_config(std::nullopt, fake_env({{"ORDERBOOK_PORT", "99999"}})),
                 std::runtime_error);
    EXPECT_THROW(load_config(std::nullopt, fake_env({{"SNAPSHOT_INTERVAL_MS", "10s"}})),
                 std::runtime_error);
}

// =============================================================================
// Validation
// =============================================================================

TEST(ConfigLoaderTest, ValidationRejectsNonsense) {
    EXPECT_THROW(load_config(std::nullopt, fake_env({{"FSYNC_EVERY_N", "0"}})),
                 std::runtime_error);
    EXPECT_THROW(load_config(std::nullopt, fake_env({{"SNAPSHOT_INTERVAL_MS", "0"}})),
                 std::runtime_error);
    EXPECT_THROW(load_config(std::nullopt, fake_env({{"SNAPSHOT_INTERVAL_MS", "-5"}})),
                 std::runtime_error);
    EXPECT_THROW(load_config(std::nullopt, fake_env({{"ORDERBOOK_LOG_LEVEL", "loud"}})),
                 std::runtime_error);

    ServiceConfig zero_scale;
    zero_scale.price_scale = 0;
    EXPECT_THROW(validate_config(zero_scale), std::runtime_error);
}

// =============================================================================
// File Loading
// =============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    testing::ScratchDirectory dir_{"orderbook_config_test"};

    std::filesystem::path write(const std::string& content) {
        auto path = dir_ / "config.json";
        std::filesystem::remove(path);
        testing::append_raw(path, content);
        return path;
    }
};

TEST_F(ConfigFileTest, FileThenEnvironment) {
    auto path = write(R"({"port": 5000, "fsync_every_n": 4, "snapshot_dir": "/srv/snaps"})");

    ServiceConfig config = load_config(path, fake_env({{"FSYNC_EVERY_N", "2"}}));

    EXPECT_EQ(config.port, 5000);
    EXPECT_EQ(config.snapshot_dir.string(), "/srv/snaps");
    // environment wins over the file
    EXPECT_EQ(config.fsync_every_n, 2u);
}

TEST_F(ConfigFileTest, MissingFileThrows) {
    EXPECT_THROW(load_config(dir_ / "nope.json", no_env), std::runtime_error);
}

TEST_F(ConfigFileTest, MalformedFileThrows) {
    auto path = write("{ port: 5000 ");
    EXPECT_THROW(load_config(path, no_env), std::runtime_error);
}

TEST_F(ConfigFileTest, WrongTypeInFileThrows) {
    auto path = write(R"({"snapshots_enabled": "yes"})");
    EXPECT_THROW(load_config(path, no_env), std::runtime_error);
}
