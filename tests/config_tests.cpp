#include <gtest/gtest.h>
#include "utilities/config.hpp"
#include "utilities/errors.hpp"
#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

using namespace chunkkeeper;

TEST(ParseDuration, UnitsAndBareSeconds) {
    EXPECT_EQ(parseDuration("250ms"), Duration(250));
    EXPECT_EQ(parseDuration("45"), std::chrono::seconds(45));
    EXPECT_EQ(parseDuration("45s"), std::chrono::seconds(45));
    EXPECT_EQ(parseDuration("30m"), std::chrono::minutes(30));
    EXPECT_EQ(parseDuration("12h"), std::chrono::hours(12));
    EXPECT_EQ(parseDuration("7d"), std::chrono::hours(168));
}

TEST(ParseDuration, RejectsMalformed) {
    EXPECT_THROW(parseDuration(""), std::invalid_argument);
    EXPECT_THROW(parseDuration("d"), std::invalid_argument);
    EXPECT_THROW(parseDuration("5 weeks"), std::invalid_argument);
    EXPECT_THROW(parseDuration("-1h"), std::invalid_argument);
}

TEST(ConfigFromYaml, DefaultsWhenEmpty) {
    ChunkKeeperConfig cfg = configFromYaml(YAML::Load("{}"));
    EXPECT_EQ(cfg.nodeId, "node-1");
    EXPECT_EQ(cfg.gc.gracePeriod, std::chrono::hours(7 * 24));
    EXPECT_EQ(cfg.gc.runInterval, std::chrono::hours(1));
    EXPECT_EQ(cfg.gc.batchSize, 500u);
    EXPECT_EQ(cfg.gc.strategy, "refcount");
    EXPECT_FALSE(cfg.gc.dryRun);
    EXPECT_FALSE(cfg.gc.pressureGracePeriod.has_value());
    EXPECT_EQ(cfg.coordinator.leaseKey, "chunkkeeper/gc");
    EXPECT_EQ(cfg.hashAlgorithm, utils::HashAlgorithm::BLAKE3);
}

TEST(ConfigFromYaml, ReadsEverySection) {
    const char* doc = R"(
node:
  id: gc-east-2
storage:
  objects_dir: /srv/objects
  hash_algorithm: sha256
ledger:
  path: /srv/ledger.db
gc:
  grace_period: 3d
  run_interval: 15m
  batch_size: 250
  dry_run: true
  strategy: mark-sweep
  pressure_grace_period: 6h
  allow_pressure_grace_override: true
  max_delete_retries: 5
  retry_backoff: 50ms
coordinator:
  lease_ttl: 2m
alerts:
  reclaimable_fraction: 0.5
logging:
  level: debug
)";
    ChunkKeeperConfig cfg = configFromYaml(YAML::Load(doc));
    EXPECT_EQ(cfg.nodeId, "gc-east-2");
    EXPECT_EQ(cfg.objectsDir, "/srv/objects");
    EXPECT_EQ(cfg.hashAlgorithm, utils::HashAlgorithm::SHA256);
    EXPECT_EQ(cfg.ledgerPath, "/srv/ledger.db");
    EXPECT_EQ(cfg.gc.gracePeriod, std::chrono::hours(72));
    EXPECT_EQ(cfg.gc.runInterval, std::chrono::minutes(15));
    EXPECT_EQ(cfg.gc.batchSize, 250u);
    EXPECT_TRUE(cfg.gc.dryRun);
    EXPECT_EQ(cfg.gc.strategy, "mark-sweep");
    EXPECT_EQ(cfg.gc.pressureGracePeriod.value_or(Duration(0)), std::chrono::hours(6));
    EXPECT_TRUE(cfg.gc.allowPressureGraceOverride);
    EXPECT_EQ(cfg.gc.maxDeleteRetries, 5);
    EXPECT_EQ(cfg.gc.retryBackoff, Duration(50));
    EXPECT_EQ(cfg.coordinator.leaseTtl, std::chrono::minutes(2));
    EXPECT_DOUBLE_EQ(cfg.alerts.reclaimableFraction, 0.5);
    EXPECT_DOUBLE_EQ(cfg.alerts.missedRunFactor, 2.0);
    EXPECT_EQ(cfg.logLevel, "debug");
}

TEST(ConfigFromYaml, BadDurationThrows) {
    EXPECT_THROW(configFromYaml(YAML::Load("gc:\n  grace_period: soon\n")), std::invalid_argument);
}

class LoadConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        savedVarDir_ = getVarDir();
        dir_ = std::filesystem::temp_directory_path() / "chunkkeeper_config_test";
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        unsetenv("CHUNKKEEPER_VAR_DIR");
        unsetenv("CHUNKKEEPER_NODE_ID");
        unsetenv("CHUNKKEEPER_DRY_RUN");
        setVarDir(savedVarDir_);
        std::filesystem::remove_all(dir_);
    }

    std::string savedVarDir_;
    std::filesystem::path dir_;
};

TEST_F(LoadConfigTest, MissingFileGivesDefaultsUnderVarDir) {
    ChunkKeeperConfig cfg = loadConfig((dir_ / "absent.yaml").string());
    VarLayout layout = currentVarLayout();
    EXPECT_EQ(cfg.varDir, getVarDir());
    EXPECT_EQ(cfg.objectsDir, layout.objectsDir);
    EXPECT_EQ(cfg.ledgerPath, layout.ledgerPath);
    EXPECT_EQ(cfg.logFile, layout.logFile);
}

TEST(VarLayout, PathsHangOffRoot) {
    VarLayout layout = varLayout("/srv/ck");
    EXPECT_EQ(layout.root, "/srv/ck");
    EXPECT_EQ(layout.objectsDir, "/srv/ck/objects");
    EXPECT_EQ(layout.ledgerPath, "/srv/ck/ledger.db");
    EXPECT_EQ(layout.logsDir, "/srv/ck/logs");
    EXPECT_EQ(layout.logFile, "/srv/ck/logs/chunkkeeper.log");
}

TEST_F(LoadConfigTest, DefaultVarDirPrefersEnvironment) {
    std::string varDir = (dir_ / "from-env").string();
    setenv("CHUNKKEEPER_VAR_DIR", varDir.c_str(), 1);
    EXPECT_EQ(defaultVarDir(), varDir);
}

TEST_F(LoadConfigTest, EnsureParentDirectoryCreatesLedgerDir) {
    std::string ledger = (dir_ / "nested" / "state" / "ledger.db").string();
    ensureParentDirectory(ledger, "ledger");
    EXPECT_TRUE(std::filesystem::is_directory(dir_ / "nested" / "state"));
    EXPECT_FALSE(std::filesystem::exists(ledger));
}

TEST_F(LoadConfigTest, EnsureDirectoryReportsBlockingFile) {
    std::string blocker = (dir_ / "blocker").string();
    std::ofstream(blocker) << "x";
    EXPECT_THROW(ensureDirectory(blocker + "/objects", "object store"), StorageError);
}

TEST_F(LoadConfigTest, EnvironmentOverridesFile) {
    std::string path = (dir_ / "chunkkeeper_config.yaml").string();
    std::ofstream(path) << "node:\n  id: from-file\ngc:\n  dry_run: false\n";
    std::string varDir = (dir_ / "var").string();
    setenv("CHUNKKEEPER_VAR_DIR", varDir.c_str(), 1);
    setenv("CHUNKKEEPER_NODE_ID", "from-env", 1);
    setenv("CHUNKKEEPER_DRY_RUN", "true", 1);

    ChunkKeeperConfig cfg = loadConfig(path);
    EXPECT_EQ(cfg.nodeId, "from-env");
    EXPECT_TRUE(cfg.gc.dryRun);
    EXPECT_EQ(cfg.varDir, varDir);
    EXPECT_EQ(cfg.ledgerPath, varDir + "/ledger.db");
}

TEST_F(LoadConfigTest, DefaultPathFollowsEnvironment) {
    unsetenv("CHUNKKEEPER_CONFIG");
    EXPECT_EQ(defaultConfigPath(), "chunkkeeper_config.yaml");
    setenv("CHUNKKEEPER_CONFIG", "/etc/chunkkeeper.yaml", 1);
    EXPECT_EQ(defaultConfigPath(), "/etc/chunkkeeper.yaml");
    unsetenv("CHUNKKEEPER_CONFIG");
}
