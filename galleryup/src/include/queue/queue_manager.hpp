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

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/app_config.hpp"
#include "gallery/gallery_item.hpp"
#include "gallery/tab.hpp"
#include "queue/persistence_scheduler.hpp"
#include "queue/scan_worker.hpp"
#include "scan/image_scanner.hpp"
#include "storage/controller/gallery_store.hpp"
#include "type/gallery_status.hpp"
#include "type/type.hpp"
#include "upload/upload_job.hpp"
#include "upload/upload_types.hpp"
#include "utils/queue/queue.hpp"

namespace galleryup {
using StatusCounts   = std::array<size_t, kGalleryStatusCount>;
// Invoked with the manager's lock held, in mutation order. Must not call back into the manager.
using StatusListener = std::function<void(const gallery_path_t&, GalleryStatus)>;

/**
 * @brief The in-memory source of truth for queue items and owner of their state machine.
 *
 * All item state and the active upload share one lock. Every change is persisted through a
 * debounced batch writer; scan results are persisted before the scan is reported finished.
 */
class QueueManager {
 public:
  /**
   * @brief Defers persistence of every mutation inside the scope to one store round trip when the
   *        outermost scope ends.
   */
  class BatchScope {
   public:
    explicit BatchScope(QueueManager& manager);
    ~BatchScope();
    BatchScope(const BatchScope&)            = delete;
    BatchScope& operator=(const BatchScope&) = delete;

   private:
    QueueManager& manager_;
  };

  struct ActiveUpload {
    UploadRequest              request_{};
    std::shared_ptr<UploadJob> job_{};
  };

  QueueManager(GalleryStore& store, AppConfig config);
  ~QueueManager();

  QueueManager(const QueueManager&)            = delete;
  QueueManager& operator=(const QueueManager&) = delete;

  void SetStatusListener(StatusListener listener);

  /**
   * @brief Load persisted items. Queued and uploading items come back as ready with their
   *        resumable file set; items still validating or scanning are scanned again.
   *
   * @return number of items loaded
   */
  auto Load() -> size_t;

  /**
   * @brief Add a folder. Returns immediately; the folder is scanned in the background.
   *
   * @return false if the path is already queued
   */
  auto Add(const gallery_path_t& path, const std::string& name = "",
           const std::string& template_name = "default",
           const std::string& tab_name = std::string(kMainTabName)) -> bool;

  auto StartItem(const gallery_path_t& path) -> bool;
  auto PauseItem(const gallery_path_t& path) -> bool;
  /**
   * @brief Soft stop of the active upload. The gallery ends incomplete and can be resumed.
   */
  auto StopItem(const gallery_path_t& path) -> bool;
  auto RetryFailedUpload(const gallery_path_t& path) -> bool;
  /**
   * @brief Recount the folder's images, keeping everything uploaded so far.
   */
  auto RescanAdditive(const gallery_path_t& path) -> bool;
  /**
   * @brief Forget all upload state and scan the folder again.
   */
  auto ResetGallery(const gallery_path_t& path) -> bool;
  /**
   * @brief Remove an item. Rejected while it is uploading. Insertion orders stay dense.
   */
  auto RemoveItem(const gallery_path_t& path) -> bool;
  auto UpdateStatus(const gallery_path_t& path, GalleryStatus status) -> bool;

  void Reorder(const std::vector<gallery_path_t>& ordered_paths);
  /**
   * @brief Create a user tab in the store and make it known to Add.
   *
   * @throw StoreError as GalleryStore::CreateTab
   */
  auto CreateTab(const std::string& name, const std::string& color_hint = "") -> Tab;
  /**
   * @brief Re-read the tab names Add accepts. Needed only for tabs created on the store directly.
   */
  void RefreshTabs();
  auto MoveToTab(const std::vector<gallery_path_t>& paths, const std::string& tab_name)
      -> size_t;
  /**
   * @brief Delete a user tab; its galleries follow to reassign_to (Main when unset).
   *
   * @throw StoreError as GalleryStore::DeleteTab
   */
  auto DeleteTab(tab_id_t id, std::optional<tab_id_t> reassign_to = std::nullopt) -> int64_t;
  auto SetCustomField(const gallery_path_t& path, const std::string& key,
                      const std::string& value) -> bool;
  auto ClearByStatus(const std::vector<GalleryStatus>& statuses) -> size_t;

  auto GetItem(const gallery_path_t& path) -> std::optional<GalleryItem>;
  auto GetAllItems() -> std::vector<GalleryItem>;
  auto GetStatusCounts() -> StatusCounts;
  auto GetVersion() -> uint64_t;
  auto GetActivePath() -> std::optional<gallery_path_t>;

  // Upload driver side
  /**
   * @brief Block until a started item is waiting. nullopt once the manager shuts down.
   */
  auto NextWork() -> std::optional<gallery_path_t>;
  void WakeWorkers();
  /**
   * @brief Move a queued item to uploading and make it the active upload.
   *
   * @return nullopt if the item is no longer queued or another upload is active
   */
  auto BeginUpload(const gallery_path_t& path) -> std::optional<ActiveUpload>;
  void OnGalleryStarted(const gallery_path_t& path, const remote_id_t& gallery_id);
  void OnImageUploaded(const gallery_path_t& path, const UploadSuccess& success);
  void OnProgress(const gallery_path_t& path, const file_name_t& current_image, double kibps);
  /**
   * @brief Apply the result of the active upload and pick its final status.
   *
   * @return the item after the update
   */
  auto FinishUpload(const gallery_path_t& path, const UploadResult& result)
      -> std::optional<GalleryItem>;
  void FailUpload(const gallery_path_t& path, const std::string& message);

  /**
   * @brief Stop the scan thread, wake the upload driver and write everything pending.
   *        Idempotent.
   */
  void Shutdown();

 private:
  auto BeginScan(const gallery_path_t& path) -> bool;
  void CompleteScan(const gallery_path_t& path, const ScanOutcome& outcome);
  auto SubmitSnapshot(std::vector<gallery_path_t> paths) -> std::future<UpsertReport>;

  // Callers hold mtx_
  void SetStatusLocked(GalleryItem& item, GalleryStatus status);
  void TouchLocked(const GalleryItem& item);
  void InsertLocked(GalleryItem item, bool announce);
  void EraseLocked(const gallery_path_t& path);
  auto RenumberLocked() -> std::vector<gallery_path_t>;
  auto FindLocked(const gallery_path_t& path) -> GalleryItem*;
  void ReapDeletesLocked(bool wait);

  GalleryStore&                                   store_;
  AppConfig                                       config_;

  std::mutex                                      mtx_;
  std::unordered_map<gallery_path_t, GalleryItem> items_;
  StatusCounts                                    status_counts_{};
  uint64_t                                        version_ = 0;
  std::optional<gallery_path_t>                   active_path_{};
  std::shared_ptr<UploadJob>                      active_job_{};
  StatusListener                                  listener_{};
  // Tab names Add accepts without a store round trip
  std::set<std::string>                           tab_names_{};
  std::vector<std::future<int64_t>>               pending_deletes_{};

  // Empty string wakes the driver up to exit
  ConcurrentBlockingQueue<gallery_path_t>         work_queue_;
  std::atomic<bool>                               shut_down_{false};

  PersistenceScheduler                            persistence_;
  // Declared last: stopped before anything it calls back into
  ScanWorker                                      scan_worker_;
};
};  // namespace galleryup
