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
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "storage/controller/gallery_store.hpp"
#include "type/type.hpp"

namespace galleryup {
/**
 * @brief Collects the paths of changed items and writes them in one batch per interval.
 *
 * While held (batch mode) nothing is written; the last Release() writes everything collected.
 * Flushes never run concurrently with each other.
 */
class PersistenceScheduler {
 public:
  // Hands a snapshot of the given paths to the store and returns the pending write
  using Submitter = std::function<std::future<UpsertReport>(std::vector<gallery_path_t>)>;

  PersistenceScheduler(std::chrono::milliseconds interval, Submitter submit);
  ~PersistenceScheduler();

  PersistenceScheduler(const PersistenceScheduler&)            = delete;
  PersistenceScheduler& operator=(const PersistenceScheduler&) = delete;

  void MarkDirty(const gallery_path_t& path);
  void Hold();
  void Release();
  /**
   * @brief Write every dirty path now and wait for the write to commit.
   */
  void FlushNow();
  /**
   * @brief Final flush, then join the background thread. Idempotent.
   */
  void Stop();

  auto DirtyCount() -> size_t;

 private:
  void                      Loop();
  auto                      TakeDirty() -> std::vector<gallery_path_t>;

  std::chrono::milliseconds interval_;
  Submitter                 submit_;

  std::mutex                mtx_;
  std::condition_variable   wake_;
  std::set<gallery_path_t>  dirty_;
  size_t                    hold_depth_ = 0;
  bool                      stop_       = false;

  std::mutex                flush_mtx_;
  std::thread               thread_;
};
};  // namespace galleryup
