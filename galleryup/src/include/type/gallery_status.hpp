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

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace galleryup {
enum class GalleryStatus : uint8_t {
  VALIDATING = 0,
  SCANNING,
  READY,
  SCAN_FAILED,
  QUEUED,
  UPLOADING,
  PAUSED,
  INCOMPLETE,
  COMPLETED,
  UPLOAD_FAILED,
};

constexpr size_t kGalleryStatusCount = 10;

auto StatusToString(GalleryStatus status) -> std::string_view;
auto StatusFromString(std::string_view text) -> std::optional<GalleryStatus>;

/**
 * @brief Whether StartItem() may move an item out of this status.
 */
inline auto IsStartable(GalleryStatus status) -> bool {
  return status == GalleryStatus::READY || status == GalleryStatus::PAUSED ||
         status == GalleryStatus::INCOMPLETE;
}

inline auto IsTerminal(GalleryStatus status) -> bool {
  return status == GalleryStatus::COMPLETED || status == GalleryStatus::UPLOAD_FAILED ||
         status == GalleryStatus::SCAN_FAILED;
}

/**
 * @brief Statuses that must not survive a restart. They are downgraded to READY on load.
 */
inline auto IsTransient(GalleryStatus status) -> bool {
  return status == GalleryStatus::QUEUED || status == GalleryStatus::UPLOADING;
}
};  // namespace galleryup
