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

#include <cstdint>
#include <future>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "concurrency/thread_pool.hpp"
#include "gallery/gallery_item.hpp"
#include "gallery/side_records.hpp"
#include "gallery/tab.hpp"
#include "storage/controller/controller_types.hpp"
#include "storage/controller/db_controller.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "type/gallery_status.hpp"
#include "type/type.hpp"
#include "utils/id/id_generator.hpp"

namespace galleryup {
struct UpsertReport {
  size_t                                               upserted_ = 0;
  // (path, reason) of every row that was not written
  std::vector<std::pair<gallery_path_t, std::string>> skipped_{};
};

/**
 * @brief Durable persistence of galleries, their image records, tabs, pending renames and
 *        secondary-distribution records.
 *
 * Every write runs on one background writer thread that owns its own connection, so writes are
 * applied strictly in submission order. Reads open a fresh connection on the calling thread and
 * never wait for the writer. Synchronous write methods block until their write has committed;
 * errors thrown on the writer are rethrown to the caller.
 */
class GalleryStore {
 public:
  explicit GalleryStore(const file_path_t& db_path);
  ~GalleryStore();

  GalleryStore(const GalleryStore&)            = delete;
  GalleryStore& operator=(const GalleryStore&) = delete;

  /**
   * @brief Reserve an id for a gallery whose row does not exist yet. The id is larger than every
   *        persisted id and every id reserved before.
   */
  auto ReserveGalleryId() -> store_id_t;

  auto BatchUpsert(const std::vector<GalleryItem>& items) -> UpsertReport;
  auto BatchUpsertAsync(std::vector<GalleryItem> items) -> std::future<UpsertReport>;
  auto LoadAll() -> std::vector<GalleryItem>;

  auto DeleteByStatus(const std::vector<GalleryStatus>& statuses) -> int64_t;
  auto DeletePaths(const std::vector<gallery_path_t>& paths) -> int64_t;
  auto DeletePathsAsync(std::vector<gallery_path_t> paths) -> std::future<int64_t>;

  void UpdateInsertionOrders(const std::vector<gallery_path_t>& ordered_paths);
  auto UpdateInsertionOrdersAsync(std::vector<gallery_path_t> ordered_paths) -> std::future<void>;
  /**
   * @brief Patch one key of a gallery's custom fields. Returns false if the gallery is unknown.
   */
  auto UpdateCustomField(const gallery_path_t& path, const std::string& key,
                         const std::string& value) -> bool;

  // Tabs
  auto GetAllTabs() -> std::vector<Tab>;
  auto CreateTab(const std::string& name, const std::string& color_hint = "",
                 std::optional<int32_t> display_order = std::nullopt) -> Tab;
  void UpdateTab(tab_id_t id, const TabUpdate& update);
  /**
   * @brief Delete a user tab, moving its galleries to reassign_to (Main when unset).
   *
   * @return the number of reassigned galleries
   * @throw StoreError for system tabs, an unknown tab or an unknown destination
   */
  auto DeleteTab(tab_id_t id, std::optional<tab_id_t> reassign_to = std::nullopt) -> int64_t;
  auto MoveGalleriesToTab(const std::vector<gallery_path_t>& paths, const std::string& tab_name)
      -> int64_t;
  auto GetTabGalleryCounts() -> std::map<std::string, int64_t>;
  void ReorderTabs(const std::vector<tab_id_t>& ordered_ids);

  // Pending renames
  void AddPendingRename(const PendingRename& rename);
  auto GetPendingRenames() -> std::vector<PendingRename>;
  auto RemovePendingRename(const remote_id_t& gallery_id) -> bool;
  auto ClearPendingRenames() -> int64_t;

  // Secondary distribution
  void UpsertSecondaryUpload(const SecondaryUploadRecord& record);
  auto GetSecondaryUploads(const gallery_path_t& path) -> std::vector<SecondaryUploadRecord>;
  auto GetPendingSecondaryUploads(const std::string& host_name)
      -> std::vector<SecondaryUploadRecord>;
  auto UpdateSecondaryUploadStatus(const gallery_path_t& path, const std::string& host_name,
                                   SecondaryUploadStatus status,
                                   const std::string& error_message = "") -> bool;
  auto UpdateSecondaryUploadProgress(const gallery_path_t& path, const std::string& host_name,
                                     int64_t uploaded_bytes, int64_t total_bytes) -> bool;
  auto DeleteSecondaryUploads(const gallery_path_t& path) -> int64_t;

  /**
   * @brief Block until every write submitted before this call has committed.
   */
  void Flush();

  auto AppliedSchemaVersions() -> std::vector<int>;

 private:
  template <typename F>
  auto RunOnWriter(F&& task) {
    return writer_.SubmitTask(std::forward<F>(task));
  }

  auto WriteBatch(const std::vector<GalleryItem>& items) -> UpsertReport;
  void UpsertRow(const GalleryItem& item, store_id_t id);
  auto ResolveTabId(duckdb_connection& conn, const std::string& tab_name) -> tab_id_t;
  auto DeleteWhere(const std::string& gallery_predicate, const duckorm::BindList& params)
      -> int64_t;

  DBController                    db_;
  ConnectionGuard                 writer_conn_;
  IncrID::IDGenerator<store_id_t> id_generator_;
  // Declared last: joined before the connection it writes through is closed
  ThreadPool                      writer_;
};
};  // namespace galleryup
