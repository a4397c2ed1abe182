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

#include <concepts>
#include <cstdint>
#include <mutex>

namespace galleryup {
namespace IncrID {
template <typename IDType>
concept Incrementable = requires(IDType t) {
  { ++t } -> std::same_as<IDType&>;
};

/**
 * @brief Monotonic id source. Ids handed out are strictly larger than the start id.
 */
template <Incrementable T>
class IDGenerator {
 private:
  T          counter_;
  std::mutex mtx_;

 public:
  explicit IDGenerator(T start_id) : counter_(start_id) {}
  auto GenerateID() -> T {
    std::lock_guard<std::mutex> lock(mtx_);
    return ++counter_;
  }
  auto GetCurrentID() -> T {
    std::lock_guard<std::mutex> lock(mtx_);
    return counter_;
  }
  /**
   * @brief Raise the counter to at least floor_id; never moves it backwards.
   */
  void EnsureAtLeast(T floor_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (counter_ < floor_id) counter_ = floor_id;
  }
};
};  // namespace IncrID
};  // namespace galleryup
