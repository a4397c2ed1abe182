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
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "concurrency/thread_pool.hpp"
#include "config/app_config.hpp"
#include "gallery/side_records.hpp"
#include "upload/gallery_api_client.hpp"
#include "upload/transfer_handle.hpp"
#include "upload/transfer_slot_pool.hpp"
#include "upload/upload_job.hpp"
#include "upload/upload_types.hpp"
#include "utils/queue/queue.hpp"

namespace galleryup {
/**
 * @brief Uploads one gallery at a time. Inside a gallery a rolling window of batch_size uploads
 *        is kept in flight on a fixed worker pool, each upload on its own leased transfer slot.
 *        Failures of a pass are retried in later passes, up to max_retries of them.
 */
class UploadEngine {
 public:
  using RenameSink = std::function<void(const PendingRename&)>;

  UploadEngine(UploadConfig config, const TransferHandleFactory& factory);
  ~UploadEngine();

  UploadEngine(const UploadEngine&)            = delete;
  UploadEngine& operator=(const UploadEngine&) = delete;

  void SetEventSink(EventSink sink) { event_sink_ = std::move(sink); }
  /**
   * @brief Receives anonymous galleries whose display name still has to be set.
   */
  void SetRenameSink(RenameSink sink) { rename_sink_ = std::move(sink); }

  auto Api() -> GalleryApiClient& { return api_; }

  /**
   * @brief Upload the files of request.path_ that are not in the resumable set.
   *
   * @throw UploadError when the folder has no images or no remote gallery can be obtained
   */
  auto Run(const UploadRequest& request, UploadJob& job) -> UploadResult;

  /**
   * @brief Most frequent extension, upper case without the dot. "JPG" when names is empty.
   */
  static auto DominantExtension(const std::vector<ImageRecord>& images) -> std::string;

 private:
  struct PassContext {
    const UploadRequest&                  request_;
    UploadJob&                            job_;
    const std::string&                    gallery_name_;
    remote_id_t&                          gallery_id_;
    std::vector<UploadSuccess>&           successes_;
    uint32_t                              total_images_;
    uint32_t&                             completed_;
    std::chrono::steady_clock::time_point started_;
  };

  /**
   * @brief One bounded pass over files. Returns the failures of this pass.
   */
  auto RunPass(const std::vector<file_name_t>& files, PassContext& ctx)
      -> std::vector<UploadFailure>;
  auto UploadOne(const std::filesystem::path& file, const remote_id_t& gallery_id,
                 const gallery_path_t& gallery_path, std::chrono::steady_clock::time_point started)
      -> ImageOutcome;
  /**
   * @brief Obtain the remote gallery for a fresh upload. Anonymous creation consumes the first
   *        pending file.
   */
  auto AcquireGallery(std::vector<file_name_t>& pending, PassContext& ctx) -> remote_id_t;
  void WaitBackoff(std::chrono::milliseconds delay, const UploadJob& job) const;
  auto BackoffFor(const std::vector<UploadFailure>& failures) const -> std::chrono::milliseconds;
  void Publish(UploadEvent event);
  void Log(const gallery_path_t& path, std::string message);

  UploadConfig                         config_;
  GalleryApiClient                     api_;
  TransferSlotPool                     slots_;
  EventSink                            event_sink_{};
  RenameSink                           rename_sink_{};
  std::atomic<int64_t>                 gallery_bytes_sent_{0};
  ConcurrentBlockingQueue<ImageOutcome> completions_;
  // Declared last: joined before the slots its tasks lease are destroyed
  ThreadPool                           workers_;
};
};  // namespace galleryup
