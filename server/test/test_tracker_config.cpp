#include "../TrackerConfig.h"
#include "../../crypto/Schnorr.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace bt;

class TrackerConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "tracker_config_test";
    cleanupTestDir();
  }

  void TearDown() override {
    cleanupTestDir();
  }

  void cleanupTestDir() {
    std::error_code ec;
    if (std::filesystem::exists(testDir_, ec)) {
      std::filesystem::remove_all(testDir_, ec);
    }
  }

  void writeConfig(const std::string &content) {
    std::filesystem::create_directories(testDir_);
    std::ofstream out(testDir_ / TrackerConfig::FILE_NAME);
    out << content;
  }

  std::filesystem::path testDir_;
};

TEST_F(TrackerConfigTest, CreatesDefaultFile) {
  auto config = TrackerConfig::loadOrCreate(testDir_.string());
  ASSERT_TRUE(config.isOk()) << config.error().message;
  EXPECT_TRUE(std::filesystem::exists(testDir_ / TrackerConfig::FILE_NAME));
  EXPECT_EQ(config->redemptionLockSeconds, 7u * 24 * 3600);
  EXPECT_DOUBLE_EQ(config->warningRatio, 1.25);
  EXPECT_EQ(config->logLevel, "info");
  EXPECT_TRUE(config->trackerPublicKey.empty());

  // Second load reads the file just written
  auto again = TrackerConfig::loadOrCreate(testDir_.string());
  ASSERT_TRUE(again.isOk());
  EXPECT_EQ(again->queueCapacity, config->queueCapacity);
}

TEST_F(TrackerConfigTest, ExistingFileOverridesDefaults) {
  auto keys = crypto::generateKeyPair();
  ASSERT_TRUE(keys.isOk());
  writeConfig("{\"redemptionLockSeconds\": 60, \"criticalRatio\": 1.1,"
              " \"warningRatio\": 1.5, \"logLevel\": \"DEBUG\","
              " \"trackerPublicKey\": \"" + utl::hexEncode(keys->publicKey) + "\"}");

  auto config = TrackerConfig::loadOrCreate(testDir_.string());
  ASSERT_TRUE(config.isOk()) << config.error().message;
  EXPECT_EQ(config->redemptionLockSeconds, 60u);
  EXPECT_DOUBLE_EQ(config->criticalRatio, 1.1);
  EXPECT_DOUBLE_EQ(config->warningRatio, 1.5);
  EXPECT_EQ(config->checkpointInterval, 1000u);
  EXPECT_EQ(config->trackerPublicKey, keys->publicKey);
}

TEST_F(TrackerConfigTest, InvalidValuesAreConfigErrors) {
  TrackerConfig config;
  auto inverted = config.ltsFromJson(nlohmann::json{ { "warningRatio", 0.5 } });
  ASSERT_TRUE(inverted.isError());
  EXPECT_EQ(inverted.error().code, E_CONFIG);

  TrackerConfig typed;
  auto wrongType = typed.ltsFromJson(nlohmann::json{ { "queueCapacity", "lots" } });
  ASSERT_TRUE(wrongType.isError());
  EXPECT_EQ(wrongType.error().code, E_CONFIG);

  TrackerConfig empty;
  EXPECT_TRUE(empty.ltsFromJson(nlohmann::json{ { "queueCapacity", 0 } }).isError());

  TrackerConfig key;
  EXPECT_TRUE(key.ltsFromJson(nlohmann::json{ { "trackerPublicKey", "02abcd" } }).isError());

  TrackerConfig level;
  EXPECT_TRUE(level.ltsFromJson(nlohmann::json{ { "logLevel", "chatty" } }).isError());

  TrackerConfig array;
  EXPECT_TRUE(array.ltsFromJson(nlohmann::json::array()).isError());
}

TEST_F(TrackerConfigTest, MalformedFileIsRejected) {
  writeConfig("{ not json");
  auto config = TrackerConfig::loadOrCreate(testDir_.string());
  ASSERT_TRUE(config.isError());
  EXPECT_EQ(config.error().code, E_CONFIG);
}

TEST_F(TrackerConfigTest, JsonRoundTripKeepsValues) {
  TrackerConfig original;
  original.estimatedFee = 12345;
  original.maxClockSkewSeconds = 10;
  TrackerConfig restored;
  ASSERT_TRUE(restored.ltsFromJson(original.ltsToJson()).isOk());
  EXPECT_EQ(restored.estimatedFee, 12345u);
  EXPECT_EQ(restored.maxClockSkewSeconds, 10);
}
