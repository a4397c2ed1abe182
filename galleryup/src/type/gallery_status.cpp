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

#include "type/gallery_status.hpp"

#include <array>
#include <string_view>

namespace galleryup {
namespace {
constexpr std::array<std::string_view, kGalleryStatusCount> kStatusNames = {
    "validating", "scanning",   "ready",     "scan_failed", "queued",
    "uploading",  "paused",     "incomplete", "completed",  "upload_failed"};
}

auto StatusToString(GalleryStatus status) -> std::string_view {
  return kStatusNames[static_cast<size_t>(status)];
}

auto StatusFromString(std::string_view text) -> std::optional<GalleryStatus> {
  for (size_t i = 0; i < kStatusNames.size(); ++i) {
    if (kStatusNames[i] == text) {
      return static_cast<GalleryStatus>(i);
    }
  }
  // Rows written before the scan/upload failure split
  if (text == "failed") {
    return GalleryStatus::UPLOAD_FAILED;
  }
  return std::nullopt;
}
};  // namespace galleryup
