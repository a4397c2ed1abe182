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
#include <thread>

#include "queue/queue_manager.hpp"
#include "storage/controller/gallery_store.hpp"
#include "upload/artifact_writer.hpp"
#include "upload/upload_engine.hpp"
#include "upload/upload_types.hpp"

namespace galleryup {
/**
 * @brief The single thread that takes started galleries off the queue manager and runs them
 *        through the upload engine, one gallery at a time.
 *
 * Stop the driver before shutting the queue manager down so the last result is persisted.
 */
class UploadDriver {
 public:
  /**
   * @param artifacts may be null; otherwise written for every completed gallery
   */
  UploadDriver(QueueManager& manager, UploadEngine& engine, GalleryStore& store,
               ArtifactWriter* artifacts);
  ~UploadDriver();

  UploadDriver(const UploadDriver&)            = delete;
  UploadDriver& operator=(const UploadDriver&) = delete;

  /**
   * @brief Receives every engine event after the queue manager has applied it.
   */
  void SetEventSink(EventSink sink) { external_sink_ = std::move(sink); }

  void Start();
  /**
   * @brief Let the running gallery finish its in-flight uploads, then join. Idempotent.
   */
  void Stop();

  auto Running() const -> bool { return running_.load(); }

 private:
  void              Loop();
  void              HandleEvent(const UploadEvent& event);
  void              RunOne(const gallery_path_t& path);

  QueueManager&     manager_;
  UploadEngine&     engine_;
  GalleryStore&     store_;
  ArtifactWriter*   artifacts_;
  EventSink         external_sink_{};
  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
  std::thread       thread_;
};
};  // namespace galleryup
