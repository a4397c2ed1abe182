//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace galleryup {
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class SamplingMethod : uint8_t { FIXED = 0, PERCENTAGE = 1 };

struct UploadConfig {
  std::string api_key_{};
  std::string api_endpoint_  = "https://api.imx.to/v1/upload.php";
  std::string web_base_url_  = "https://imx.to";
  std::string user_agent_    = "galleryup/1.0";

  uint32_t    batch_size_    = 4;
  uint32_t    max_retries_   = 3;
  uint32_t    connect_timeout_ms_ = 10000;
  uint32_t    read_timeout_ms_    = 30000;
  // Base delay before a retry pass, scaled by the failure class of the previous pass
  uint32_t    retry_backoff_ms_   = 1000;

  int         thumbnail_size_   = 3;
  int         thumbnail_format_ = 2;
  bool        public_gallery_   = true;
  bool        named_gallery_creation_ = true;
  // Files whose dimensions are read after a gallery finishes
  uint32_t    dimension_samples_ = 25;
};

struct ScanConfig {
  bool                     deep_validation_ = false;

  SamplingMethod           sampling_method_      = SamplingMethod::FIXED;
  uint32_t                 sampling_fixed_count_ = 25;
  uint32_t                 sampling_percentage_  = 10;

  bool                     exclude_first_        = false;
  bool                     exclude_last_         = false;
  std::vector<std::string> exclude_patterns_{};
  bool                     exclude_small_images_    = false;
  uint32_t                 exclude_small_threshold_ = 50;

  bool                     use_median_       = false;
  bool                     exclude_outliers_ = false;
};

struct QueueConfig {
  bool     auto_start_upload_   = false;
  uint32_t persist_debounce_ms_ = 100;
  // Drop persisted non-completed galleries whose folder disappeared
  bool     skip_missing_folders_ = true;
};

struct StoreConfig {
  std::filesystem::path db_path_ = "galleryup.duckdb";
};

struct AppConfig {
  UploadConfig upload_{};
  ScanConfig   scan_{};
  QueueConfig  queue_{};
  StoreConfig  store_{};
};

/**
 * @brief Build a config from JSON. Missing keys keep their defaults; keys of the wrong type throw
 *        ConfigError.
 */
auto ConfigFromJson(const nlohmann::json& j) -> AppConfig;
auto ConfigToJson(const AppConfig& config) -> nlohmann::json;
auto LoadConfigFromFile(const std::filesystem::path& path) -> AppConfig;
void SaveConfigToFile(const AppConfig& config, const std::filesystem::path& path);
};  // namespace galleryup
