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

#include "queue/scan_worker.hpp"

#include <iostream>

namespace galleryup {
ScanWorker::ScanWorker(ImageScanner scanner, BeginFn on_begin, CompleteFn on_complete)
    : scanner_(std::move(scanner)),
      on_begin_(std::move(on_begin)),
      on_complete_(std::move(on_complete)),
      thread_([this]() { Loop(); }) {}

ScanWorker::~ScanWorker() { Stop(); }

void ScanWorker::Enqueue(const gallery_path_t& path) {
  if (stopping_.load()) return;
  queue_.push(path);
}

void ScanWorker::Stop() {
  if (stopping_.exchange(true)) return;
  queue_.push(std::nullopt);
  if (thread_.joinable()) thread_.join();
}

void ScanWorker::Loop() {
  while (true) {
    auto next = queue_.pop();
    if (!next.has_value() || stopping_.load()) return;

    const gallery_path_t& path = *next;
    try {
      if (!on_begin_(path)) continue;
      ScanOutcome outcome = scanner_.Scan(path);
      on_complete_(path, outcome);
    } catch (const std::exception& e) {
      std::cerr << "ScanWorker: scanning " << path << " failed: " << e.what() << std::endl;
      ScanOutcome failed;
      failed.code_    = ScanErrorCode::IO_ERROR;
      failed.message_ = std::string("Scan error: ") + e.what();
      try {
        on_complete_(path, failed);
      } catch (const std::exception& inner) {
        std::cerr << "ScanWorker: could not record scan failure for " << path << ": "
                  << inner.what() << std::endl;
      }
    }
  }
}
};  // namespace galleryup
