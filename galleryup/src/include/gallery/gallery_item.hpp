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
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

#include "type/gallery_status.hpp"
#include "type/type.hpp"

namespace galleryup {
/**
 * @brief Remote metadata captured for one uploaded file of a gallery.
 */
struct ImageRecord {
  file_name_t file_name_{};
  int64_t     size_bytes_  = 0;
  uint32_t    width_       = 0;
  uint32_t    height_      = 0;
  epoch_ts_t  uploaded_ts_ = 0;
  std::string url_{};
  std::string thumb_url_{};

  bool        operator==(const ImageRecord&) const = default;
};

struct FailedFile {
  file_name_t file_name_{};
  std::string reason_{};

  bool        operator==(const FailedFile&) const = default;
};

struct DimensionStats {
  double avg_width_  = 0.0;
  double avg_height_ = 0.0;
  double min_width_  = 0.0;
  double min_height_ = 0.0;
  double max_width_  = 0.0;
  double max_height_ = 0.0;
};

struct GalleryItem {
  gallery_path_t                     path_{};
  std::string                        name_{};
  GalleryStatus                      status_        = GalleryStatus::VALIDATING;
  std::string                        template_name_ = "default";

  epoch_ts_t                         added_time_    = 0;
  epoch_ts_t                         finished_time_ = 0;

  // Scan results
  int64_t                            total_size_    = 0;
  DimensionStats                     dimensions_{};
  bool                               scan_complete_ = false;

  uint32_t                           total_images_    = 0;
  uint32_t                           uploaded_images_ = 0;
  int64_t                            uploaded_bytes_  = 0;
  double                             final_kibps_     = 0.0;

  // Resume support
  std::unordered_set<file_name_t>    uploaded_files_{};
  std::vector<ImageRecord>           uploaded_images_data_{};

  int64_t                            insertion_order_ = 0;
  std::string                        tab_name_        = "Main";
  std::map<std::string, std::string> custom_fields_{};

  remote_id_t                        gallery_id_{};
  std::string                        gallery_url_{};

  std::vector<FailedFile>            failed_files_{};
  std::string                        error_message_{};

  // Pre-assigned before the durable row exists
  store_id_t                         store_id_ = 0;

  // Runtime only, never persisted
  int                                progress_ = 0;
  std::string                        current_image_{};
  double                             current_kibps_ = 0.0;
};

auto FailedFilesToJson(const std::vector<FailedFile>& failed) -> std::string;
auto FailedFilesFromJson(const std::string& json_text) -> std::vector<FailedFile>;

auto CustomFieldsToJson(const std::map<std::string, std::string>& fields) -> std::string;
auto CustomFieldsFromJson(const std::string& json_text) -> std::map<std::string, std::string>;

/**
 * @brief Strip characters the remote host refuses in gallery names and trim whitespace.
 */
auto SanitizeGalleryName(const std::string& name) -> std::string;
};  // namespace galleryup
