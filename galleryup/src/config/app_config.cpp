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

#include "config/app_config.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

namespace galleryup {
namespace {
template <typename T>
void ReadKey(const nlohmann::json& section, const char* section_name, const char* key, T& out) {
  if (!section.contains(key)) return;
  try {
    out = section.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("Invalid value for ") + section_name + "." + key + ": " +
                      e.what());
  }
}

auto Section(const nlohmann::json& j, const char* name) -> const nlohmann::json* {
  if (!j.contains(name)) return nullptr;
  const auto& section = j.at(name);
  if (!section.is_object()) {
    throw ConfigError(std::string("Config section '") + name + "' must be an object");
  }
  return &section;
}
}  // namespace

auto ConfigFromJson(const nlohmann::json& j) -> AppConfig {
  if (!j.is_object()) {
    throw ConfigError("Config root must be an object");
  }
  AppConfig config;

  if (auto s = Section(j, "upload")) {
    auto& u = config.upload_;
    ReadKey(*s, "upload", "api_key", u.api_key_);
    ReadKey(*s, "upload", "api_endpoint", u.api_endpoint_);
    ReadKey(*s, "upload", "web_base_url", u.web_base_url_);
    ReadKey(*s, "upload", "user_agent", u.user_agent_);
    ReadKey(*s, "upload", "batch_size", u.batch_size_);
    ReadKey(*s, "upload", "max_retries", u.max_retries_);
    ReadKey(*s, "upload", "connect_timeout_ms", u.connect_timeout_ms_);
    ReadKey(*s, "upload", "read_timeout_ms", u.read_timeout_ms_);
    ReadKey(*s, "upload", "retry_backoff_ms", u.retry_backoff_ms_);
    ReadKey(*s, "upload", "thumbnail_size", u.thumbnail_size_);
    ReadKey(*s, "upload", "thumbnail_format", u.thumbnail_format_);
    ReadKey(*s, "upload", "public_gallery", u.public_gallery_);
    ReadKey(*s, "upload", "named_gallery_creation", u.named_gallery_creation_);
    ReadKey(*s, "upload", "dimension_samples", u.dimension_samples_);
    if (u.batch_size_ == 0) {
      throw ConfigError("upload.batch_size must be at least 1");
    }
  }

  if (auto s = Section(j, "scan")) {
    auto& sc = config.scan_;
    ReadKey(*s, "scan", "deep_validation", sc.deep_validation_);
    std::string method;
    ReadKey(*s, "scan", "sampling_method", method);
    if (method == "fixed") {
      sc.sampling_method_ = SamplingMethod::FIXED;
    } else if (method == "percentage") {
      sc.sampling_method_ = SamplingMethod::PERCENTAGE;
    } else if (!method.empty()) {
      throw ConfigError("scan.sampling_method must be 'fixed' or 'percentage'");
    }
    ReadKey(*s, "scan", "sampling_fixed_count", sc.sampling_fixed_count_);
    ReadKey(*s, "scan", "sampling_percentage", sc.sampling_percentage_);
    ReadKey(*s, "scan", "exclude_first", sc.exclude_first_);
    ReadKey(*s, "scan", "exclude_last", sc.exclude_last_);
    ReadKey(*s, "scan", "exclude_patterns", sc.exclude_patterns_);
    ReadKey(*s, "scan", "exclude_small_images", sc.exclude_small_images_);
    ReadKey(*s, "scan", "exclude_small_threshold", sc.exclude_small_threshold_);
    ReadKey(*s, "scan", "use_median", sc.use_median_);
    ReadKey(*s, "scan", "exclude_outliers", sc.exclude_outliers_);
  }

  if (auto s = Section(j, "queue")) {
    ReadKey(*s, "queue", "auto_start_upload", config.queue_.auto_start_upload_);
    ReadKey(*s, "queue", "persist_debounce_ms", config.queue_.persist_debounce_ms_);
    ReadKey(*s, "queue", "skip_missing_folders", config.queue_.skip_missing_folders_);
  }

  if (auto s = Section(j, "store")) {
    std::string db_path;
    ReadKey(*s, "store", "db_path", db_path);
    if (!db_path.empty()) config.store_.db_path_ = db_path;
  }
  return config;
}

auto ConfigToJson(const AppConfig& config) -> nlohmann::json {
  nlohmann::json j;
  const auto&    u = config.upload_;
  j["upload"]      = {{"api_key", u.api_key_},
                      {"api_endpoint", u.api_endpoint_},
                      {"web_base_url", u.web_base_url_},
                      {"user_agent", u.user_agent_},
                      {"batch_size", u.batch_size_},
                      {"max_retries", u.max_retries_},
                      {"connect_timeout_ms", u.connect_timeout_ms_},
                      {"read_timeout_ms", u.read_timeout_ms_},
                      {"retry_backoff_ms", u.retry_backoff_ms_},
                      {"thumbnail_size", u.thumbnail_size_},
                      {"thumbnail_format", u.thumbnail_format_},
                      {"public_gallery", u.public_gallery_},
                      {"named_gallery_creation", u.named_gallery_creation_},
                      {"dimension_samples", u.dimension_samples_}};

  const auto& sc   = config.scan_;
  j["scan"]        = {
      {"deep_validation", sc.deep_validation_},
      {"sampling_method",
              sc.sampling_method_ == SamplingMethod::FIXED ? "fixed" : "percentage"},
      {"sampling_fixed_count", sc.sampling_fixed_count_},
      {"sampling_percentage", sc.sampling_percentage_},
      {"exclude_first", sc.exclude_first_},
      {"exclude_last", sc.exclude_last_},
      {"exclude_patterns", sc.exclude_patterns_},
      {"exclude_small_images", sc.exclude_small_images_},
      {"exclude_small_threshold", sc.exclude_small_threshold_},
      {"use_median", sc.use_median_},
      {"exclude_outliers", sc.exclude_outliers_}};

  j["queue"] = {{"auto_start_upload", config.queue_.auto_start_upload_},
                {"persist_debounce_ms", config.queue_.persist_debounce_ms_},
                {"skip_missing_folders", config.queue_.skip_missing_folders_}};
  j["store"] = {{"db_path", config.store_.db_path_.string()}};
  return j;
}

auto LoadConfigFromFile(const std::filesystem::path& path) -> AppConfig {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("Cannot open config file: " + path.string());
  }
  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("Malformed config file " + path.string() + ": " + e.what());
  }
  return ConfigFromJson(j);
}

void SaveConfigToFile(const AppConfig& config, const std::filesystem::path& path) {
  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    throw ConfigError("Cannot write config file: " + path.string());
  }
  file << ConfigToJson(config).dump(2);
}
};  // namespace galleryup
