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

#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>
#include <vector>

#include "gallery/gallery_item.hpp"
#include "type/type.hpp"

namespace galleryup {
class UploadError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class UploadErrorCode : uint8_t {
  TIMEOUT = 0,
  CONNECT_FAILED,
  NETWORK_ERROR,
  REMOTE_ERROR,
  FILE_NOT_FOUND,
  CANCELED,
};

auto ErrorCodeToString(UploadErrorCode code) -> std::string_view;

/**
 * @brief What the engine needs from a queue item to upload it.
 */
struct UploadRequest {
  gallery_path_t                  path_{};
  std::string                     name_{};
  std::string                     template_name_ = "default";
  // Set when resuming: the existing remote gallery is reused
  remote_id_t                     gallery_id_{};
  std::unordered_set<file_name_t> uploaded_files_{};
  std::vector<ImageRecord>        uploaded_images_data_{};
};

struct UploadSuccess {
  file_name_t file_name_{};
  ImageRecord record_{};
  remote_id_t gallery_id_{};
};

struct UploadFailure {
  file_name_t     file_name_{};
  UploadErrorCode code_ = UploadErrorCode::NETWORK_ERROR;
  std::string     reason_{};
};

using ImageOutcome = std::variant<UploadSuccess, UploadFailure>;

struct UploadResult {
  gallery_path_t           path_{};
  remote_id_t              gallery_id_{};
  std::string              gallery_url_{};
  std::string              gallery_name_{};
  std::string              template_name_{};

  uint32_t                 total_images_     = 0;
  uint32_t                 successful_count_ = 0;
  uint32_t                 failed_count_     = 0;

  int64_t                  total_size_    = 0;
  int64_t                  uploaded_size_ = 0;
  // Bytes sent by this run only
  int64_t                  sent_bytes_    = 0;
  double                   upload_time_s_ = 0.0;
  double                   kibps_         = 0.0;

  DimensionStats           dimensions_{};
  std::string              dominant_extension_ = "JPG";

  // On-disk enumeration order; resumed files included
  std::vector<ImageRecord> images_{};
  std::vector<FailedFile>  failures_{};

  bool                     soft_stopped_ = false;
  epoch_ts_t               started_at_   = 0;
  epoch_ts_t               finished_at_  = 0;

  int                      thumbnail_size_   = 0;
  int                      thumbnail_format_ = 0;
  bool                     public_gallery_   = true;
  uint32_t                 batch_size_       = 0;
};

auto UploadResultToJson(const UploadResult& result) -> nlohmann::json;

// Events published by the engine, in the order they happen
struct GalleryStarted {
  gallery_path_t path_{};
  remote_id_t    gallery_id_{};
  uint32_t       total_images_ = 0;
  uint32_t       pending_      = 0;
};

struct ImageProgress {
  gallery_path_t path_{};
  file_name_t    file_name_{};
  int64_t        bytes_sent_    = 0;
  int64_t        bytes_total_   = 0;
  double         gallery_kibps_ = 0.0;
};

struct ImageCompleted {
  gallery_path_t path_{};
  ImageOutcome   outcome_{};
  uint32_t       completed_ = 0;
  uint32_t       total_     = 0;
};

struct GalleryFinished {
  gallery_path_t path_{};
  uint32_t       successful_ = 0;
  uint32_t       failed_     = 0;
  bool           soft_stopped_ = false;
};

struct EngineLog {
  gallery_path_t path_{};
  std::string    message_{};
};

using UploadEvent = std::variant<GalleryStarted, ImageProgress, ImageCompleted, GalleryFinished,
                                 EngineLog>;
using EventSink   = std::function<void(const UploadEvent&)>;

/**
 * @brief Thumbnail url derived from an image url of the form ".../i/<id>...".
 *
 * @return empty when the url has no "/i/<id>" segment
 */
auto DeriveThumbUrl(const std::string& image_url, const file_name_t& file_name,
                    const std::string& web_base_url) -> std::string;
};  // namespace galleryup
