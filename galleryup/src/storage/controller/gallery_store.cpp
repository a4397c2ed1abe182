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

#include "storage/controller/gallery_store.hpp"

#include <exception>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/service/gallery/gallery_service.hpp"
#include "storage/service/rename/pending_rename_service.hpp"
#include "storage/service/secondary/secondary_upload_service.hpp"
#include "storage/service/tab/tab_service.hpp"
#include "utils/clock/time_provider.hpp"

namespace galleryup {
namespace {
auto IsFinishedSecondary(SecondaryUploadStatus status) -> bool {
  return status == SecondaryUploadStatus::COMPLETED || status == SecondaryUploadStatus::FAILED ||
         status == SecondaryUploadStatus::CANCELLED;
}
}  // namespace

GalleryStore::GalleryStore(const file_path_t& db_path)
    : db_(db_path), writer_conn_(db_.GetConnectionGuard()), id_generator_(0), writer_(1) {
  GalleryService service(writer_conn_.conn_);
  id_generator_.EnsureAtLeast(service.GetMaxId());
}

GalleryStore::~GalleryStore() { writer_.Shutdown(); }

auto GalleryStore::ReserveGalleryId() -> store_id_t { return id_generator_.GenerateID(); }

auto GalleryStore::ResolveTabId(duckdb_connection& conn, const std::string& tab_name) -> tab_id_t {
  TabService tabs(conn);
  if (!tab_name.empty()) {
    if (auto tab = tabs.GetByName(tab_name)) return tab->id_;
  }
  if (auto main = tabs.GetByName(kMainTabName)) return main->id_;
  return 0;
}

void GalleryStore::UpsertRow(const GalleryItem& item, store_id_t id) {
  auto&         conn = writer_conn_.conn_;
  StoredGallery stored{item, ResolveTabId(conn, item.tab_name_)};
  stored.item_.store_id_ = id;

  GalleryService galleries(conn);
  galleries.Upsert(stored);

  ImageRecordService images(conn);
  images.ReplaceForGallery(id, item.uploaded_images_data_);
}

/**
 * @brief Validate every row, then write the valid ones in one transaction. When that transaction
 *        fails each row is retried in its own transaction so one bad row cannot sink the batch.
 */
auto GalleryStore::WriteBatch(const std::vector<GalleryItem>& items) -> UpsertReport {
  auto&          conn = writer_conn_.conn_;
  UpsertReport   report;
  GalleryService galleries(conn);

  // Later entries for the same path win
  std::unordered_map<gallery_path_t, size_t> last_index;
  for (size_t i = 0; i < items.size(); ++i) last_index[items[i].path_] = i;

  std::vector<std::pair<const GalleryItem*, store_id_t>> rows;
  std::set<store_id_t>                                   claimed;
  for (size_t i = 0; i < items.size(); ++i) {
    const GalleryItem& item = items[i];
    if (last_index[item.path_] != i) continue;
    if (item.path_.empty()) {
      report.skipped_.emplace_back(item.path_, "empty path");
      continue;
    }
    if (item.uploaded_images_ > item.total_images_ && item.total_images_ > 0) {
      report.skipped_.emplace_back(item.path_, "uploaded_images exceeds total_images");
      continue;
    }

    store_id_t id = 0;
    if (auto existing = galleries.GetIdByPath(item.path_)) {
      id = *existing;
    } else if (item.store_id_ > 0) {
      auto owner = galleries.GetPathById(item.store_id_);
      if (owner.has_value()) {
        report.skipped_.emplace_back(item.path_, "store id " + std::to_string(item.store_id_) +
                                                     " already belongs to " + *owner);
        continue;
      }
      id = item.store_id_;
    } else {
      id = ReserveGalleryId();
    }
    if (!claimed.insert(id).second) {
      report.skipped_.emplace_back(item.path_,
                                   "store id " + std::to_string(id) + " claimed twice in batch");
      continue;
    }
    rows.emplace_back(&item, id);
  }

  for (const auto& [path, reason] : report.skipped_) {
    std::cerr << "GalleryStore: skipping row '" << path << "': " << reason << std::endl;
  }

  try {
    TransactionGuard tx(conn);
    for (const auto& [item, id] : rows) UpsertRow(*item, id);
    tx.Commit();
    report.upserted_ = rows.size();
  } catch (const std::exception& batch_error) {
    std::cerr << "GalleryStore: batch write failed, retrying row by row: " << batch_error.what()
              << std::endl;
    for (const auto& [item, id] : rows) {
      try {
        TransactionGuard tx(conn);
        UpsertRow(*item, id);
        tx.Commit();
        ++report.upserted_;
      } catch (const std::exception& row_error) {
        std::cerr << "GalleryStore: skipping row '" << item->path_ << "': " << row_error.what()
                  << std::endl;
        report.skipped_.emplace_back(item->path_, row_error.what());
      }
    }
  }

  for (const auto& [item, id] : rows) id_generator_.EnsureAtLeast(id);
  return report;
}

auto GalleryStore::BatchUpsert(const std::vector<GalleryItem>& items) -> UpsertReport {
  return RunOnWriter([this, &items]() { return WriteBatch(items); }).get();
}

auto GalleryStore::BatchUpsertAsync(std::vector<GalleryItem> items) -> std::future<UpsertReport> {
  return RunOnWriter(
      [this, items = std::move(items)]() { return WriteBatch(items); });
}

auto GalleryStore::LoadAll() -> std::vector<GalleryItem> {
  auto               reader = db_.GetConnectionGuard();
  GalleryService     galleries(reader.conn_);
  ImageRecordService images(reader.conn_);
  TabService         tabs(reader.conn_);

  std::unordered_map<tab_id_t, std::string> tab_names;
  for (auto& tab : tabs.GetAllOrdered()) tab_names[tab.id_] = tab.name_;

  std::unordered_map<store_id_t, std::vector<ImageRecord>> images_by_gallery;
  for (auto& stored : images.GetAllOrdered()) {
    images_by_gallery[stored.gallery_fk_].push_back(std::move(stored.record_));
  }

  std::vector<GalleryItem> result;
  for (auto& stored : galleries.GetAllOrdered()) {
    GalleryItem& item = stored.item_;
    auto         tab  = tab_names.find(stored.tab_id_);
    item.tab_name_    = tab != tab_names.end() ? tab->second : std::string(kMainTabName);

    auto imgs = images_by_gallery.find(item.store_id_);
    if (imgs != images_by_gallery.end()) {
      item.uploaded_images_data_ = std::move(imgs->second);
      for (const auto& record : item.uploaded_images_data_) {
        item.uploaded_files_.insert(record.file_name_);
      }
    }
    result.push_back(std::move(item));
  }
  return result;
}

auto GalleryStore::DeleteWhere(const std::string& gallery_predicate,
                               const duckorm::BindList& params) -> int64_t {
  auto&            conn = writer_conn_.conn_;
  TransactionGuard tx(conn);
  duckorm::execute(conn,
                   "DELETE FROM Image WHERE gallery_fk IN (SELECT id FROM Gallery WHERE " +
                       gallery_predicate + ")",
                   params);
  duckorm::execute(conn,
                   "DELETE FROM SecondaryUpload WHERE gallery_fk IN (SELECT id FROM Gallery "
                   "WHERE " +
                       gallery_predicate + ")",
                   params);
  GalleryService galleries(conn);
  int64_t        deleted = galleries.RemoveByClause(gallery_predicate, params);
  tx.Commit();
  return deleted;
}

auto GalleryStore::DeleteByStatus(const std::vector<GalleryStatus>& statuses) -> int64_t {
  return RunOnWriter([this, statuses]() {
           int64_t deleted = 0;
           for (auto status : statuses) {
             deleted += DeleteWhere("status = ?", {std::string(StatusToString(status))});
           }
           return deleted;
         })
      .get();
}

auto GalleryStore::DeletePaths(const std::vector<gallery_path_t>& paths) -> int64_t {
  return DeletePathsAsync(paths).get();
}

auto GalleryStore::DeletePathsAsync(std::vector<gallery_path_t> paths) -> std::future<int64_t> {
  return RunOnWriter([this, paths = std::move(paths)]() {
    int64_t deleted = 0;
    for (const auto& path : paths) deleted += DeleteWhere("path = ?", {path});
    return deleted;
  });
}

void GalleryStore::UpdateInsertionOrders(const std::vector<gallery_path_t>& ordered_paths) {
  UpdateInsertionOrdersAsync(ordered_paths).get();
}

auto GalleryStore::UpdateInsertionOrdersAsync(std::vector<gallery_path_t> ordered_paths)
    -> std::future<void> {
  return RunOnWriter([this, ordered_paths = std::move(ordered_paths)]() {
    auto&            conn = writer_conn_.conn_;
    TransactionGuard tx(conn);
    for (size_t i = 0; i < ordered_paths.size(); ++i) {
      duckorm::execute(conn, "UPDATE Gallery SET insertion_order = ? WHERE path = ?",
                       {static_cast<int64_t>(i + 1), ordered_paths[i]});
    }
    tx.Commit();
  });
}

auto GalleryStore::UpdateCustomField(const gallery_path_t& path, const std::string& key,
                                     const std::string& value) -> bool {
  return RunOnWriter([this, path, key, value]() {
           auto&          conn = writer_conn_.conn_;
           GalleryService galleries(conn);
           auto           stored = galleries.GetByPath(path);
           if (!stored.has_value()) return false;
           auto fields = stored->item_.custom_fields_;
           fields[key] = value;
           duckorm::execute(conn, "UPDATE Gallery SET custom_fields = ? WHERE path = ?",
                            {CustomFieldsToJson(fields), path});
           return true;
         })
      .get();
}

auto GalleryStore::GetAllTabs() -> std::vector<Tab> {
  auto       reader = db_.GetConnectionGuard();
  TabService tabs(reader.conn_);
  return tabs.GetAllOrdered();
}

auto GalleryStore::CreateTab(const std::string& name, const std::string& color_hint,
                             std::optional<int32_t> display_order) -> Tab {
  return RunOnWriter([this, name, color_hint, display_order]() {
           auto&      conn = writer_conn_.conn_;
           TabService tabs(conn);
           if (name.empty()) {
             throw StoreError("Tab name must not be empty");
           }
           if (tabs.GetByName(name).has_value()) {
             throw StoreError("Tab already exists: " + name);
           }
           Tab tab;
           tab.id_         = tabs.NextId();
           tab.name_       = name;
           tab.type_       = TabType::USER;
           tab.color_hint_ = color_hint;
           if (display_order.has_value()) {
             tab.display_order_ = *display_order;
           } else {
             auto max_user = duckorm::query_int64(
                 conn, "SELECT MAX(display_order) FROM Tab WHERE tab_type = ?",
                 {static_cast<int64_t>(TabType::USER)});
             tab.display_order_ = static_cast<int32_t>(max_user.value_or(0) + 1);
           }
           tab.created_ts_ = TimeProvider::EpochSeconds();
           tab.updated_ts_ = tab.created_ts_;
           tabs.Insert(tab);
           return tab;
         })
      .get();
}

void GalleryStore::UpdateTab(tab_id_t id, const TabUpdate& update) {
  RunOnWriter([this, id, update]() {
    auto&      conn = writer_conn_.conn_;
    TabService tabs(conn);
    auto       tab = tabs.GetById(id);
    if (!tab.has_value()) {
      throw StoreError("Tab not found: " + std::to_string(id));
    }
    auto now = TimeProvider::EpochSeconds();
    if (update.name_.has_value() && *update.name_ != tab->name_) {
      if (tab->IsSystem()) {
        throw StoreError("System tab cannot be renamed: " + tab->name_);
      }
      if (update.name_->empty() || tabs.GetByName(*update.name_).has_value()) {
        throw StoreError("Tab name unavailable: " + *update.name_);
      }
      duckorm::execute(conn, "UPDATE Tab SET name = ?, updated_ts = ? WHERE id = ?",
                       {*update.name_, now, static_cast<int64_t>(id)});
    }
    if (update.display_order_.has_value()) {
      duckorm::execute(conn, "UPDATE Tab SET display_order = ?, updated_ts = ? WHERE id = ?",
                       {static_cast<int64_t>(*update.display_order_), now,
                        static_cast<int64_t>(id)});
    }
    if (update.color_hint_.has_value()) {
      duckorm::execute(conn, "UPDATE Tab SET color_hint = ?, updated_ts = ? WHERE id = ?",
                       {*update.color_hint_, now, static_cast<int64_t>(id)});
    }
  }).get();
}

auto GalleryStore::DeleteTab(tab_id_t id, std::optional<tab_id_t> reassign_to) -> int64_t {
  return RunOnWriter([this, id, reassign_to]() {
           auto&      conn = writer_conn_.conn_;
           TabService tabs(conn);
           auto       tab = tabs.GetById(id);
           if (!tab.has_value()) {
             throw StoreError("Tab not found: " + std::to_string(id));
           }
           if (tab->IsSystem()) {
             throw StoreError("System tab cannot be deleted: " + tab->name_);
           }
           std::optional<Tab> dest = reassign_to.has_value() ? tabs.GetById(*reassign_to)
                                                             : tabs.GetByName(kMainTabName);
           if (!dest.has_value() || dest->id_ == id) {
             throw StoreError("Invalid destination tab for galleries of " + tab->name_);
           }

           TransactionGuard tx(conn);
           int64_t          moved =
               duckorm::execute(conn, "UPDATE Gallery SET tab_id = ? WHERE tab_id = ?",
                                {static_cast<int64_t>(dest->id_), static_cast<int64_t>(id)});
           tabs.RemoveById(id);
           tx.Commit();
           return moved;
         })
      .get();
}

auto GalleryStore::MoveGalleriesToTab(const std::vector<gallery_path_t>& paths,
                                      const std::string& tab_name) -> int64_t {
  return RunOnWriter([this, paths, tab_name]() {
           auto&      conn = writer_conn_.conn_;
           TabService tabs(conn);
           auto       tab = tabs.GetByName(tab_name);
           if (!tab.has_value()) {
             throw StoreError("Tab not found: " + tab_name);
           }
           TransactionGuard tx(conn);
           int64_t          moved = 0;
           for (const auto& path : paths) {
             moved += duckorm::execute(conn, "UPDATE Gallery SET tab_id = ? WHERE path = ?",
                                       {static_cast<int64_t>(tab->id_), path});
           }
           tx.Commit();
           return moved;
         })
      .get();
}

auto GalleryStore::GetTabGalleryCounts() -> std::map<std::string, int64_t> {
  auto                                   reader = db_.GetConnectionGuard();
  static constexpr duckorm::DuckFieldDesc count_fields[] = {
      {"name", duckorm::DuckDBType::VARCHAR, 0}, {"gallery_count", duckorm::DuckDBType::INT64, 0}};
  std::map<std::string, int64_t> counts;
  auto rows = duckorm::select_by_query(
      reader.conn_, count_fields,
      "SELECT t.name, COUNT(g.id) FROM Tab t LEFT JOIN Gallery g ON g.tab_id = t.id "
      "GROUP BY t.name",
      {});
  for (auto& row : rows) {
    auto& name = std::get<std::unique_ptr<std::string>>(row[0]);
    if (name) counts[*name] = std::get<int64_t>(row[1]);
  }
  return counts;
}

void GalleryStore::ReorderTabs(const std::vector<tab_id_t>& ordered_ids) {
  RunOnWriter([this, ordered_ids]() {
    auto&            conn = writer_conn_.conn_;
    auto             now  = TimeProvider::EpochSeconds();
    TransactionGuard tx(conn);
    for (size_t i = 0; i < ordered_ids.size(); ++i) {
      duckorm::execute(conn, "UPDATE Tab SET display_order = ?, updated_ts = ? WHERE id = ?",
                       {static_cast<int64_t>(i), now, static_cast<int64_t>(ordered_ids[i])});
    }
    tx.Commit();
  }).get();
}

void GalleryStore::AddPendingRename(const PendingRename& rename) {
  RunOnWriter([this, rename]() {
    PendingRenameService renames(writer_conn_.conn_);
    PendingRename        stored = rename;
    if (stored.discovered_ts_ == 0) stored.discovered_ts_ = TimeProvider::EpochSeconds();
    renames.Upsert(stored);
  }).get();
}

auto GalleryStore::GetPendingRenames() -> std::vector<PendingRename> {
  auto                 reader = db_.GetConnectionGuard();
  PendingRenameService renames(reader.conn_);
  return renames.GetAll();
}

auto GalleryStore::RemovePendingRename(const remote_id_t& gallery_id) -> bool {
  return RunOnWriter([this, gallery_id]() {
           PendingRenameService renames(writer_conn_.conn_);
           return renames.RemoveById(gallery_id) > 0;
         })
      .get();
}

auto GalleryStore::ClearPendingRenames() -> int64_t {
  return RunOnWriter([this]() {
           PendingRenameService renames(writer_conn_.conn_);
           return renames.RemoveByClause("TRUE");
         })
      .get();
}

void GalleryStore::UpsertSecondaryUpload(const SecondaryUploadRecord& record) {
  RunOnWriter([this, record]() {
    auto&          conn = writer_conn_.conn_;
    GalleryService galleries(conn);
    auto           gallery_fk = galleries.GetIdByPath(record.gallery_path_);
    if (!gallery_fk.has_value()) {
      throw StoreError("Unknown gallery for secondary upload: " + record.gallery_path_);
    }
    StoredSecondaryUpload stored{*gallery_fk, record};
    if (stored.record_.created_ts_ == 0) stored.record_.created_ts_ = TimeProvider::EpochSeconds();
    SecondaryUploadService uploads(conn);
    uploads.Upsert(stored);
  }).get();
}

auto GalleryStore::GetSecondaryUploads(const gallery_path_t& path)
    -> std::vector<SecondaryUploadRecord> {
  auto                   reader = db_.GetConnectionGuard();
  GalleryService         galleries(reader.conn_);
  SecondaryUploadService uploads(reader.conn_);
  std::vector<SecondaryUploadRecord> result;
  auto                               gallery_fk = galleries.GetIdByPath(path);
  if (!gallery_fk.has_value()) return result;
  for (auto& stored : uploads.GetByGallery(*gallery_fk)) {
    stored.record_.gallery_path_ = path;
    result.push_back(std::move(stored.record_));
  }
  return result;
}

auto GalleryStore::GetPendingSecondaryUploads(const std::string& host_name)
    -> std::vector<SecondaryUploadRecord> {
  auto                   reader = db_.GetConnectionGuard();
  GalleryService         galleries(reader.conn_);
  SecondaryUploadService uploads(reader.conn_);
  std::vector<SecondaryUploadRecord> result;
  for (auto& stored : uploads.GetByHostAndStatus(host_name, SecondaryUploadStatus::PENDING)) {
    auto path = galleries.GetPathById(stored.gallery_fk_);
    if (!path.has_value()) continue;
    stored.record_.gallery_path_ = *path;
    result.push_back(std::move(stored.record_));
  }
  return result;
}

auto GalleryStore::UpdateSecondaryUploadStatus(const gallery_path_t& path,
                                               const std::string&    host_name,
                                               SecondaryUploadStatus status,
                                               const std::string&    error_message) -> bool {
  return RunOnWriter([this, path, host_name, status, error_message]() {
           auto&   conn     = writer_conn_.conn_;
           int64_t finished = IsFinishedSecondary(status) ? TimeProvider::EpochSeconds() : 0;
           return duckorm::execute(
                      conn,
                      "UPDATE SecondaryUpload SET status = ?, error_message = ?, finished_ts = ? "
                      "WHERE host_name = ? AND gallery_fk = (SELECT id FROM Gallery WHERE path = ?)",
                      {std::string(SecondaryStatusToString(status)), error_message, finished,
                       host_name, path}) > 0;
         })
      .get();
}

auto GalleryStore::UpdateSecondaryUploadProgress(const gallery_path_t& path,
                                                 const std::string&    host_name,
                                                 int64_t uploaded_bytes, int64_t total_bytes)
    -> bool {
  return RunOnWriter([this, path, host_name, uploaded_bytes, total_bytes]() {
           return duckorm::execute(
                      writer_conn_.conn_,
                      "UPDATE SecondaryUpload SET uploaded_bytes = ?, total_bytes = ? "
                      "WHERE host_name = ? AND gallery_fk = (SELECT id FROM Gallery WHERE path = ?)",
                      {uploaded_bytes, total_bytes, host_name, path}) > 0;
         })
      .get();
}

auto GalleryStore::DeleteSecondaryUploads(const gallery_path_t& path) -> int64_t {
  return RunOnWriter([this, path]() {
           return duckorm::execute(
               writer_conn_.conn_,
               "DELETE FROM SecondaryUpload WHERE gallery_fk = (SELECT id FROM Gallery WHERE path "
               "= ?)",
               {path});
         })
      .get();
}

void GalleryStore::Flush() {
  RunOnWriter([]() {}).get();
}

auto GalleryStore::AppliedSchemaVersions() -> std::vector<int> { return db_.AppliedVersions(); }
};  // namespace galleryup
