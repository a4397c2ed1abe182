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

#include "queue/persistence_scheduler.hpp"

#include <iostream>

namespace galleryup {
PersistenceScheduler::PersistenceScheduler(std::chrono::milliseconds interval, Submitter submit)
    : interval_(interval), submit_(std::move(submit)), thread_([this]() { Loop(); }) {}

PersistenceScheduler::~PersistenceScheduler() { Stop(); }

void PersistenceScheduler::MarkDirty(const gallery_path_t& path) {
  std::lock_guard<std::mutex> lock(mtx_);
  dirty_.insert(path);
}

void PersistenceScheduler::Hold() {
  std::lock_guard<std::mutex> lock(mtx_);
  ++hold_depth_;
}

void PersistenceScheduler::Release() {
  bool outermost = false;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (hold_depth_ > 0) --hold_depth_;
    outermost = hold_depth_ == 0;
  }
  if (outermost) FlushNow();
}

auto PersistenceScheduler::DirtyCount() -> size_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return dirty_.size();
}

auto PersistenceScheduler::TakeDirty() -> std::vector<gallery_path_t> {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<gallery_path_t> paths(dirty_.begin(), dirty_.end());
  dirty_.clear();
  return paths;
}

void PersistenceScheduler::FlushNow() {
  std::lock_guard<std::mutex> flush_lock(flush_mtx_);
  auto                        paths = TakeDirty();
  if (paths.empty()) return;
  try {
    UpsertReport report = submit_(std::move(paths)).get();
    for (const auto& [path, reason] : report.skipped_) {
      std::cerr << "QueueManager: not persisted " << path << ": " << reason << std::endl;
    }
  } catch (const std::exception& e) {
    std::cerr << "QueueManager: persisting queue failed: " << e.what() << std::endl;
  }
}

void PersistenceScheduler::Loop() {
  std::unique_lock<std::mutex> lock(mtx_);
  while (!stop_) {
    wake_.wait_for(lock, interval_, [this] { return stop_; });
    if (stop_) break;
    if (hold_depth_ > 0 || dirty_.empty()) continue;
    lock.unlock();
    FlushNow();
    lock.lock();
  }
}

void PersistenceScheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stop_) return;
    stop_ = true;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
  FlushNow();
}
};  // namespace galleryup
