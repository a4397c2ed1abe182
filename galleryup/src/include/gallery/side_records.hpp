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
#include <optional>
#include <string>
#include <string_view>

#include "type/type.hpp"

namespace galleryup {
/**
 * @brief A gallery created anonymously whose display name still has to be corrected by the
 *        rename collaborator.
 */
struct PendingRename {
  remote_id_t gallery_id_{};
  std::string intended_name_{};
  epoch_ts_t  discovered_ts_ = 0;
};

enum class SecondaryUploadStatus : uint8_t { PENDING = 0, UPLOADING, COMPLETED, FAILED, CANCELLED };

auto SecondaryStatusToString(SecondaryUploadStatus status) -> std::string_view;
auto SecondaryStatusFromString(std::string_view text) -> std::optional<SecondaryUploadStatus>;

/**
 * @brief Distribution of a gallery to an additional destination. Its lifecycle is independent of
 *        the gallery status.
 */
struct SecondaryUploadRecord {
  gallery_path_t        gallery_path_{};
  std::string           host_name_{};
  SecondaryUploadStatus status_         = SecondaryUploadStatus::PENDING;
  int64_t               uploaded_bytes_ = 0;
  int64_t               total_bytes_    = 0;
  std::string           download_url_{};
  std::string           file_id_{};
  std::string           error_message_{};
  epoch_ts_t            created_ts_  = 0;
  epoch_ts_t            finished_ts_ = 0;
};
};  // namespace galleryup
