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

#include <atomic>
#include <cstdint>

namespace galleryup {
enum class StopKind : uint8_t { NONE = 0, PAUSE, STOP };

/**
 * @brief Cooperative stop flag of one running upload. The engine reads it at submission
 *        boundaries only; uploads already in flight always finish.
 */
class UploadJob {
 public:
  void RequestStop(StopKind kind) {
    StopKind expected = StopKind::NONE;
    stop_.compare_exchange_strong(expected, kind);
  }
  auto StopRequested() const -> bool { return stop_.load() != StopKind::NONE; }
  auto Kind() const -> StopKind { return stop_.load(); }

 private:
  std::atomic<StopKind> stop_{StopKind::NONE};
};
};  // namespace galleryup
