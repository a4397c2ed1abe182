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

#include "queue/upload_driver.hpp"

#include <iostream>
#include <type_traits>
#include <variant>

namespace galleryup {
UploadDriver::UploadDriver(QueueManager& manager, UploadEngine& engine, GalleryStore& store,
                           ArtifactWriter* artifacts)
    : manager_(manager), engine_(engine), store_(store), artifacts_(artifacts) {
  engine_.SetEventSink([this](const UploadEvent& event) { HandleEvent(event); });
  engine_.SetRenameSink([this](const PendingRename& rename) {
    try {
      store_.AddPendingRename(rename);
    } catch (const std::exception& e) {
      std::cerr << "UploadDriver: cannot record pending rename for gallery " << rename.gallery_id_
                << ": " << e.what() << std::endl;
    }
  });
}

UploadDriver::~UploadDriver() { Stop(); }

void UploadDriver::Start() {
  if (running_.exchange(true)) return;
  stopping_ = false;
  thread_   = std::thread([this]() { Loop(); });
}

void UploadDriver::Stop() {
  if (!running_.load() || stopping_.exchange(true)) return;
  if (auto active = manager_.GetActivePath()) manager_.StopItem(*active);
  manager_.WakeWorkers();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void UploadDriver::HandleEvent(const UploadEvent& event) {
  std::visit(
      [this](const auto& e) {
        using E = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<E, GalleryStarted>) {
          manager_.OnGalleryStarted(e.path_, e.gallery_id_);
        } else if constexpr (std::is_same_v<E, ImageProgress>) {
          manager_.OnProgress(e.path_, e.file_name_, e.gallery_kibps_);
        } else if constexpr (std::is_same_v<E, ImageCompleted>) {
          if (const auto* success = std::get_if<UploadSuccess>(&e.outcome_)) {
            manager_.OnImageUploaded(e.path_, *success);
          }
        } else if constexpr (std::is_same_v<E, EngineLog>) {
          if (!external_sink_) std::cerr << "UploadEngine: " << e.message_ << std::endl;
        }
      },
      event);
  if (external_sink_) external_sink_(event);
}

void UploadDriver::RunOne(const gallery_path_t& path) {
  auto active = manager_.BeginUpload(path);
  // Paused, removed or restarted since it was queued
  if (!active.has_value()) return;

  try {
    UploadResult result = engine_.Run(active->request_, *active->job_);
    auto         item   = manager_.FinishUpload(path, result);
    if (artifacts_ && item.has_value() && item->status_ == GalleryStatus::COMPLETED) {
      try {
        artifacts_->Write(*item, result);
      } catch (const std::exception& e) {
        std::cerr << "UploadDriver: artifact for " << path << " not written: " << e.what()
                  << std::endl;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "UploadDriver: upload of " << path << " failed: " << e.what() << std::endl;
    manager_.FailUpload(path, e.what());
  }
}

void UploadDriver::Loop() {
  while (!stopping_.load()) {
    auto path = manager_.NextWork();
    if (!path.has_value()) return;
    if (stopping_.load()) return;
    RunOne(*path);
  }
}
};  // namespace galleryup
