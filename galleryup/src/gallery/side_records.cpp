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

#include "gallery/side_records.hpp"

#include <array>
#include <string_view>

namespace galleryup {
namespace {
constexpr std::array<std::string_view, 5> kSecondaryNames = {"pending", "uploading", "completed",
                                                             "failed", "cancelled"};
}

auto SecondaryStatusToString(SecondaryUploadStatus status) -> std::string_view {
  return kSecondaryNames[static_cast<size_t>(status)];
}

auto SecondaryStatusFromString(std::string_view text) -> std::optional<SecondaryUploadStatus> {
  for (size_t i = 0; i < kSecondaryNames.size(); ++i) {
    if (kSecondaryNames[i] == text) {
      return static_cast<SecondaryUploadStatus>(i);
    }
  }
  return std::nullopt;
}
};  // namespace galleryup
