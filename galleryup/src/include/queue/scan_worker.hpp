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
#include <functional>
#include <optional>
#include <thread>

#include "scan/image_scanner.hpp"
#include "type/type.hpp"
#include "utils/queue/queue.hpp"

namespace galleryup {
/**
 * @brief One background thread scanning queued folders strictly one at a time.
 */
class ScanWorker {
 public:
  // Returns false when the folder should no longer be scanned
  using BeginFn    = std::function<bool(const gallery_path_t&)>;
  using CompleteFn = std::function<void(const gallery_path_t&, const ScanOutcome&)>;

  ScanWorker(ImageScanner scanner, BeginFn on_begin, CompleteFn on_complete);
  ~ScanWorker();

  ScanWorker(const ScanWorker&)            = delete;
  ScanWorker& operator=(const ScanWorker&) = delete;

  void Enqueue(const gallery_path_t& path);
  /**
   * @brief Finish the folder being scanned, drop the rest and join. Idempotent.
   */
  void Stop();

  auto Backlog() -> size_t { return queue_.size(); }

 private:
  void                                                  Loop();

  ImageScanner                                          scanner_;
  BeginFn                                               on_begin_;
  CompleteFn                                            on_complete_;
  // nullopt wakes the thread up to exit
  ConcurrentBlockingQueue<std::optional<gallery_path_t>> queue_;
  std::atomic<bool>                                     stopping_{false};
  std::thread                                           thread_;
};
};  // namespace galleryup
