#include "config/app_config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace galleryup {
class AppConfigTests : public ::testing::Test {
 protected:
  std::filesystem::path file_;

  void                  SetUp() override {
    file_ = std::filesystem::temp_directory_path() / "galleryup_config_test.json";
    std::filesystem::remove(file_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(file_, ec);
  }
};

TEST_F(AppConfigTests, EmptyObjectGivesDefaults) {
  AppConfig config = ConfigFromJson(nlohmann::json::object());
  EXPECT_EQ(config.upload_.batch_size_, 4u);
  EXPECT_EQ(config.upload_.max_retries_, 3u);
  EXPECT_EQ(config.scan_.sampling_method_, SamplingMethod::FIXED);
  EXPECT_EQ(config.scan_.sampling_fixed_count_, 25u);
  EXPECT_FALSE(config.queue_.auto_start_upload_);
}

TEST_F(AppConfigTests, PartialSectionsOverrideOnlyGivenKeys) {
  auto j = nlohmann::json::parse(R"({
    "upload": {"batch_size": 8, "api_key": "k"},
    "scan": {"sampling_method": "percentage", "exclude_patterns": ["*cover*", "*promo*"]},
    "queue": {"auto_start_upload": true},
    "store": {"db_path": "/tmp/q.duckdb"}
  })");
  AppConfig config = ConfigFromJson(j);
  EXPECT_EQ(config.upload_.batch_size_, 8u);
  EXPECT_EQ(config.upload_.api_key_, "k");
  EXPECT_EQ(config.upload_.max_retries_, 3u);
  EXPECT_EQ(config.scan_.sampling_method_, SamplingMethod::PERCENTAGE);
  EXPECT_EQ(config.scan_.exclude_patterns_.size(), 2u);
  EXPECT_TRUE(config.queue_.auto_start_upload_);
  EXPECT_EQ(config.store_.db_path_, std::filesystem::path("/tmp/q.duckdb"));
}

TEST_F(AppConfigTests, InvalidValuesAreRejected) {
  EXPECT_THROW(ConfigFromJson(nlohmann::json::array()), ConfigError);
  EXPECT_THROW(ConfigFromJson(nlohmann::json::parse(R"({"upload": 3})")), ConfigError);
  EXPECT_THROW(ConfigFromJson(nlohmann::json::parse(R"({"upload": {"batch_size": 0}})")),
               ConfigError);
  EXPECT_THROW(ConfigFromJson(nlohmann::json::parse(R"({"upload": {"batch_size": "four"}})")),
               ConfigError);
  EXPECT_THROW(ConfigFromJson(nlohmann::json::parse(R"({"scan": {"sampling_method": "random"}})")),
               ConfigError);
}

TEST_F(AppConfigTests, SaveAndLoadFile) {
  AppConfig config;
  config.upload_.api_key_          = "secret";
  config.upload_.retry_backoff_ms_ = 250;
  config.scan_.exclude_first_      = true;
  config.queue_.persist_debounce_ms_ = 500;
  SaveConfigToFile(config, file_);

  AppConfig loaded = LoadConfigFromFile(file_);
  EXPECT_EQ(ConfigToJson(loaded), ConfigToJson(config));
  EXPECT_EQ(loaded.upload_.retry_backoff_ms_, 250u);
  EXPECT_TRUE(loaded.scan_.exclude_first_);
}

TEST_F(AppConfigTests, MissingOrMalformedFile) {
  EXPECT_THROW(LoadConfigFromFile(file_), ConfigError);
  std::ofstream(file_) << "{ not json";
  EXPECT_THROW(LoadConfigFromFile(file_), ConfigError);
}
}  // namespace galleryup
