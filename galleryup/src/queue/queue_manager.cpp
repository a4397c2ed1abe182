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

#include "queue/queue_manager.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <set>
#include <system_error>
#include <utility>

#include "utils/clock/time_provider.hpp"

namespace galleryup {
namespace {
auto StatusIndex(GalleryStatus status) -> size_t { return static_cast<size_t>(status); }

auto FolderName(const gallery_path_t& path) -> std::string {
  std::filesystem::path folder(path);
  auto                  name = folder.filename();
  if (name.empty()) name = folder.parent_path().filename();
  return name.string();
}

auto IsBusy(GalleryStatus status) -> bool {
  return status == GalleryStatus::VALIDATING || status == GalleryStatus::SCANNING ||
         status == GalleryStatus::QUEUED || status == GalleryStatus::UPLOADING;
}

void ClearUploadState(GalleryItem& item) {
  item.gallery_id_.clear();
  item.gallery_url_.clear();
  item.uploaded_images_ = 0;
  item.uploaded_bytes_  = 0;
  item.uploaded_files_.clear();
  item.uploaded_images_data_.clear();
  item.failed_files_.clear();
  item.error_message_.clear();
  item.final_kibps_   = 0.0;
  item.finished_time_ = 0;
  item.progress_      = 0;
  item.current_image_.clear();
  item.current_kibps_ = 0.0;
}
}  // namespace

QueueManager::BatchScope::BatchScope(QueueManager& manager) : manager_(manager) {
  manager_.persistence_.Hold();
}

QueueManager::BatchScope::~BatchScope() { manager_.persistence_.Release(); }

QueueManager::QueueManager(GalleryStore& store, AppConfig config)
    : store_(store),
      config_(std::move(config)),
      persistence_(std::chrono::milliseconds(config_.queue_.persist_debounce_ms_),
                   [this](std::vector<gallery_path_t> paths) {
                     return SubmitSnapshot(std::move(paths));
                   }),
      scan_worker_(
          ImageScanner(config_.scan_), [this](const gallery_path_t& path) { return BeginScan(path); },
          [this](const gallery_path_t& path, const ScanOutcome& outcome) {
            CompleteScan(path, outcome);
          }) {
  RefreshTabs();
}

QueueManager::~QueueManager() { Shutdown(); }

void QueueManager::SetStatusListener(StatusListener listener) {
  std::lock_guard<std::mutex> lock(mtx_);
  listener_ = std::move(listener);
}

auto QueueManager::FindLocked(const gallery_path_t& path) -> GalleryItem* {
  auto it = items_.find(path);
  return it == items_.end() ? nullptr : &it->second;
}

void QueueManager::TouchLocked(const GalleryItem& item) {
  ++version_;
  persistence_.MarkDirty(item.path_);
}

void QueueManager::SetStatusLocked(GalleryItem& item, GalleryStatus status) {
  if (item.status_ == status) {
    TouchLocked(item);
    return;
  }
  --status_counts_[StatusIndex(item.status_)];
  ++status_counts_[StatusIndex(status)];
  item.status_ = status;
  TouchLocked(item);
  if (listener_) listener_(item.path_, status);
}

void QueueManager::InsertLocked(GalleryItem item, bool announce) {
  ++status_counts_[StatusIndex(item.status_)];
  ++version_;
  const gallery_path_t path   = item.path_;
  const GalleryStatus  status = item.status_;
  items_.emplace(path, std::move(item));
  if (announce) {
    persistence_.MarkDirty(path);
    if (listener_) listener_(path, status);
  }
}

void QueueManager::EraseLocked(const gallery_path_t& path) {
  auto it = items_.find(path);
  if (it == items_.end()) return;
  --status_counts_[StatusIndex(it->second.status_)];
  items_.erase(it);
  ++version_;
}

auto QueueManager::RenumberLocked() -> std::vector<gallery_path_t> {
  std::vector<GalleryItem*> ordered;
  ordered.reserve(items_.size());
  for (auto& [path, item] : items_) ordered.push_back(&item);
  std::sort(ordered.begin(), ordered.end(), [](const GalleryItem* a, const GalleryItem* b) {
    if (a->insertion_order_ != b->insertion_order_) {
      return a->insertion_order_ < b->insertion_order_;
    }
    return a->path_ < b->path_;
  });

  std::vector<gallery_path_t> paths;
  for (size_t i = 0; i < ordered.size(); ++i) {
    const auto order = static_cast<int64_t>(i + 1);
    if (ordered[i]->insertion_order_ != order) {
      ordered[i]->insertion_order_ = order;
      TouchLocked(*ordered[i]);
    }
    paths.push_back(ordered[i]->path_);
  }
  return paths;
}

void QueueManager::ReapDeletesLocked(bool wait) {
  for (auto it = pending_deletes_.begin(); it != pending_deletes_.end();) {
    if (!wait && it->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      ++it;
      continue;
    }
    try {
      it->get();
    } catch (const std::exception& e) {
      std::cerr << "QueueManager: deleting galleries failed: " << e.what() << std::endl;
    }
    it = pending_deletes_.erase(it);
  }
}

auto QueueManager::SubmitSnapshot(std::vector<gallery_path_t> paths)
    -> std::future<UpsertReport> {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<GalleryItem>    items;
  items.reserve(paths.size());
  for (const auto& path : paths) {
    // Removed since it was marked: nothing to write
    if (auto* item = FindLocked(path)) items.push_back(*item);
  }
  return store_.BatchUpsertAsync(std::move(items));
}

auto QueueManager::Load() -> size_t {
  auto                        loaded = store_.LoadAll();
  std::vector<gallery_path_t> rescan;
  size_t                      count = 0;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& item : loaded) {
      if (items_.count(item.path_) > 0) continue;
      std::error_code ec;
      if (config_.queue_.skip_missing_folders_ && item.status_ != GalleryStatus::COMPLETED &&
          !std::filesystem::exists(item.path_, ec)) {
        std::cerr << "QueueManager: skipping missing folder " << item.path_ << std::endl;
        continue;
      }

      bool changed = false;
      if (IsTransient(item.status_)) {
        item.status_ = GalleryStatus::READY;
        changed      = true;
      }
      if (item.status_ == GalleryStatus::VALIDATING || item.status_ == GalleryStatus::SCANNING) {
        rescan.push_back(item.path_);
      }
      if (item.total_images_ > 0 && item.uploaded_images_ > item.total_images_) {
        item.uploaded_images_ = item.total_images_;
        changed               = true;
      }
      const gallery_path_t path = item.path_;
      InsertLocked(std::move(item), false);
      if (changed) persistence_.MarkDirty(path);
      ++count;
    }
    RenumberLocked();
  }
  for (const auto& path : rescan) scan_worker_.Enqueue(path);
  return count;
}

auto QueueManager::Add(const gallery_path_t& path, const std::string& name,
                       const std::string& template_name, const std::string& tab_name) -> bool {
  if (path.empty() || shut_down_.load()) return false;

  std::string tab = tab_name.empty() ? std::string(kMainTabName) : tab_name;

  GalleryItem item;
  item.path_          = path;
  item.name_          = SanitizeGalleryName(name.empty() ? FolderName(path) : name);
  item.template_name_ = template_name.empty() ? "default" : template_name;
  item.tab_name_      = tab;
  item.status_        = GalleryStatus::VALIDATING;
  item.added_time_    = TimeProvider::EpochSeconds();

  std::lock_guard<std::mutex> lock(mtx_);
  if (items_.count(path) > 0) return false;
  if (tab_names_.count(item.tab_name_) == 0) item.tab_name_ = std::string(kMainTabName);
  item.store_id_        = store_.ReserveGalleryId();
  item.insertion_order_ = static_cast<int64_t>(items_.size() + 1);
  InsertLocked(std::move(item), true);
  scan_worker_.Enqueue(path);
  return true;
}

auto QueueManager::BeginScan(const gallery_path_t& path) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item) return false;
  if (item->status_ == GalleryStatus::VALIDATING) {
    SetStatusLocked(*item, GalleryStatus::SCANNING);
    return true;
  }
  return item->status_ == GalleryStatus::SCANNING;
}

void QueueManager::CompleteScan(const gallery_path_t& path, const ScanOutcome& outcome) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto*                       item = FindLocked(path);
    // Removed or reset while the scan ran
    if (!item || item->status_ != GalleryStatus::SCANNING) return;

    item->total_images_ = outcome.total_images_;
    if (!outcome.Ok()) {
      item->scan_complete_ = false;
      item->failed_files_  = outcome.failed_files_;
      item->error_message_ = outcome.message_;
      SetStatusLocked(*item, GalleryStatus::SCAN_FAILED);
    } else {
      item->total_size_    = outcome.total_size_;
      item->dimensions_    = outcome.dimensions_;
      item->scan_complete_ = true;
      item->failed_files_.clear();
      item->error_message_.clear();
      uint32_t still_present = 0;
      for (const auto& name : outcome.files_) {
        if (item->uploaded_files_.count(name) > 0) ++still_present;
      }
      item->uploaded_images_ = still_present;
      if (config_.queue_.auto_start_upload_) {
        SetStatusLocked(*item, GalleryStatus::QUEUED);
        work_queue_.push(path);
      } else {
        SetStatusLocked(*item, GalleryStatus::READY);
      }
    }
  }
  persistence_.FlushNow();
}

auto QueueManager::StartItem(const gallery_path_t& path) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item || !IsStartable(item->status_)) return false;
  item->error_message_.clear();
  SetStatusLocked(*item, GalleryStatus::QUEUED);
  work_queue_.push(path);
  return true;
}

auto QueueManager::PauseItem(const gallery_path_t& path) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item) return false;
  if (item->status_ == GalleryStatus::QUEUED) {
    SetStatusLocked(*item, GalleryStatus::PAUSED);
    return true;
  }
  if (item->status_ == GalleryStatus::UPLOADING && active_path_ == path && active_job_) {
    active_job_->RequestStop(StopKind::PAUSE);
    return true;
  }
  return false;
}

auto QueueManager::StopItem(const gallery_path_t& path) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item) return false;
  if (item->status_ == GalleryStatus::UPLOADING && active_path_ == path && active_job_) {
    active_job_->RequestStop(StopKind::STOP);
    return true;
  }
  if (item->status_ == GalleryStatus::QUEUED) {
    SetStatusLocked(*item, item->uploaded_images_ > 0 ? GalleryStatus::INCOMPLETE
                                                      : GalleryStatus::READY);
    return true;
  }
  return false;
}

auto QueueManager::RetryFailedUpload(const gallery_path_t& path) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item) return false;

  if (item->status_ == GalleryStatus::SCAN_FAILED) {
    item->failed_files_.clear();
    item->error_message_.clear();
    item->scan_complete_ = false;
    SetStatusLocked(*item, GalleryStatus::VALIDATING);
    scan_worker_.Enqueue(path);
    return true;
  }
  if (item->status_ != GalleryStatus::UPLOAD_FAILED) return false;

  item->failed_files_.clear();
  item->error_message_.clear();
  if (!item->gallery_id_.empty() && item->uploaded_images_ > 0) {
    // Partial failure: resume into the existing gallery
    SetStatusLocked(*item, GalleryStatus::INCOMPLETE);
  } else {
    ClearUploadState(*item);
    SetStatusLocked(*item, GalleryStatus::READY);
  }
  return true;
}

auto QueueManager::RescanAdditive(const gallery_path_t& path) -> bool {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto*                       item = FindLocked(path);
    if (!item || IsBusy(item->status_)) return false;
    if (item->status_ == GalleryStatus::SCAN_FAILED) {
      item->failed_files_.clear();
      item->error_message_.clear();
      SetStatusLocked(*item, GalleryStatus::VALIDATING);
      scan_worker_.Enqueue(path);
      return true;
    }
  }

  const auto files      = ImageScanner::EnumerateImages(path);
  int64_t    total_size = 0;
  for (const auto& name : files) {
    std::error_code ec;
    auto            size = std::filesystem::file_size(std::filesystem::path(path) / name, ec);
    if (!ec) total_size += static_cast<int64_t>(size);
  }

  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item || IsBusy(item->status_)) return false;

  const auto found = static_cast<uint32_t>(files.size());
  if (found == 0) {
    item->error_message_ = "No images found in " + path;
    SetStatusLocked(*item, GalleryStatus::SCAN_FAILED);
    return true;
  }

  item->total_size_ = total_size;
  if (found > item->total_images_) {
    item->total_images_ = found;
    item->failed_files_.clear();
    item->error_message_.clear();
    if (item->status_ == GalleryStatus::COMPLETED) {
      item->finished_time_ = 0;
      SetStatusLocked(*item, GalleryStatus::INCOMPLETE);
    } else if (item->status_ == GalleryStatus::UPLOAD_FAILED) {
      SetStatusLocked(*item, !item->gallery_id_.empty() && item->uploaded_images_ > 0
                                 ? GalleryStatus::INCOMPLETE
                                 : GalleryStatus::READY);
    } else {
      TouchLocked(*item);
    }
  } else if (found < item->total_images_) {
    item->total_images_    = found;
    item->uploaded_images_ = std::min(item->uploaded_images_, found);
    TouchLocked(*item);
  } else {
    item->failed_files_.clear();
    item->error_message_.clear();
    TouchLocked(*item);
  }
  return true;
}

auto QueueManager::ResetGallery(const gallery_path_t& path) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item || item->status_ == GalleryStatus::QUEUED ||
      item->status_ == GalleryStatus::UPLOADING) {
    return false;
  }
  ClearUploadState(*item);
  item->scan_complete_ = false;
  item->total_images_  = 0;
  item->total_size_    = 0;
  item->dimensions_    = {};
  SetStatusLocked(*item, GalleryStatus::SCANNING);
  scan_worker_.Enqueue(path);
  return true;
}

auto QueueManager::RemoveItem(const gallery_path_t& path) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item || item->status_ == GalleryStatus::UPLOADING || active_path_ == path) return false;

  EraseLocked(path);
  RenumberLocked();
  pending_deletes_.push_back(store_.DeletePathsAsync({path}));
  ReapDeletesLocked(false);
  return true;
}

auto QueueManager::UpdateStatus(const gallery_path_t& path, GalleryStatus status) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item) return false;
  // At most one upload is active, and only BeginUpload makes one
  if (status == GalleryStatus::UPLOADING && active_path_ != path) return false;
  const bool enqueue = status == GalleryStatus::QUEUED && item->status_ != GalleryStatus::QUEUED;
  SetStatusLocked(*item, status);
  if (enqueue) work_queue_.push(path);
  return true;
}

void QueueManager::Reorder(const std::vector<gallery_path_t>& ordered_paths) {
  std::vector<gallery_path_t> final_order;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    std::set<gallery_path_t>    listed;
    int64_t                     order = 0;
    for (const auto& path : ordered_paths) {
      auto* item = FindLocked(path);
      if (!item || !listed.insert(path).second) continue;
      item->insertion_order_ = ++order;
      TouchLocked(*item);
    }
    // Unlisted items keep their relative order after the listed ones
    std::vector<GalleryItem*> rest;
    for (auto& [path, item] : items_) {
      if (listed.count(path) == 0) rest.push_back(&item);
    }
    std::sort(rest.begin(), rest.end(), [](const GalleryItem* a, const GalleryItem* b) {
      return a->insertion_order_ < b->insertion_order_;
    });
    for (auto* item : rest) {
      item->insertion_order_ = ++order;
      TouchLocked(*item);
    }
    final_order = RenumberLocked();
  }
  try {
    store_.UpdateInsertionOrders(final_order);
  } catch (const std::exception& e) {
    std::cerr << "QueueManager: persisting order failed: " << e.what() << std::endl;
  }
}

auto QueueManager::CreateTab(const std::string& name, const std::string& color_hint) -> Tab {
  Tab tab = store_.CreateTab(name, color_hint);
  std::lock_guard<std::mutex> lock(mtx_);
  tab_names_.insert(tab.name_);
  return tab;
}

void QueueManager::RefreshTabs() {
  std::set<std::string> names;
  for (const auto& tab : store_.GetAllTabs()) names.insert(tab.name_);
  std::lock_guard<std::mutex> lock(mtx_);
  tab_names_ = std::move(names);
}

auto QueueManager::MoveToTab(const std::vector<gallery_path_t>& paths,
                             const std::string& tab_name) -> size_t {
  bool known = false;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    known = tab_names_.count(tab_name) > 0;
  }
  if (!known) {
    RefreshTabs();
    std::lock_guard<std::mutex> lock(mtx_);
    if (tab_names_.count(tab_name) == 0) throw StoreError("Tab not found: " + tab_name);
  }
  std::lock_guard<std::mutex> lock(mtx_);
  size_t                      moved = 0;
  for (const auto& path : paths) {
    auto* item = FindLocked(path);
    if (!item) continue;
    item->tab_name_ = tab_name;
    TouchLocked(*item);
    ++moved;
  }
  return moved;
}

auto QueueManager::DeleteTab(tab_id_t id, std::optional<tab_id_t> reassign_to) -> int64_t {
  std::string old_name;
  std::string new_name(kMainTabName);
  for (const auto& tab : store_.GetAllTabs()) {
    if (tab.id_ == id) old_name = tab.name_;
    if (reassign_to.has_value() && tab.id_ == *reassign_to) new_name = tab.name_;
  }
  const int64_t moved = store_.DeleteTab(id, reassign_to);

  std::lock_guard<std::mutex> lock(mtx_);
  tab_names_.erase(old_name);
  for (auto& [path, item] : items_) {
    if (item.tab_name_ != old_name) continue;
    item.tab_name_ = new_name;
    // Pending writes may still carry the old tab
    TouchLocked(item);
  }
  return moved;
}

auto QueueManager::SetCustomField(const gallery_path_t& path, const std::string& key,
                                  const std::string& value) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item) return false;
  item->custom_fields_[key] = value;
  TouchLocked(*item);
  return true;
}

auto QueueManager::ClearByStatus(const std::vector<GalleryStatus>& statuses) -> size_t {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<gallery_path_t> removed;
  for (const auto& [path, item] : items_) {
    if (active_path_ == path) continue;
    if (std::find(statuses.begin(), statuses.end(), item.status_) != statuses.end()) {
      removed.push_back(path);
    }
  }
  if (removed.empty()) return 0;
  for (const auto& path : removed) EraseLocked(path);
  RenumberLocked();
  pending_deletes_.push_back(store_.DeletePathsAsync(removed));
  ReapDeletesLocked(false);
  return removed.size();
}

auto QueueManager::GetItem(const gallery_path_t& path) -> std::optional<GalleryItem> {
  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item) return std::nullopt;
  return *item;
}

auto QueueManager::GetAllItems() -> std::vector<GalleryItem> {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<GalleryItem>    result;
  result.reserve(items_.size());
  for (const auto& [path, item] : items_) result.push_back(item);
  std::sort(result.begin(), result.end(), [](const GalleryItem& a, const GalleryItem& b) {
    return a.insertion_order_ < b.insertion_order_;
  });
  return result;
}

auto QueueManager::GetStatusCounts() -> StatusCounts {
  std::lock_guard<std::mutex> lock(mtx_);
  return status_counts_;
}

auto QueueManager::GetVersion() -> uint64_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return version_;
}

auto QueueManager::GetActivePath() -> std::optional<gallery_path_t> {
  std::lock_guard<std::mutex> lock(mtx_);
  return active_path_;
}

auto QueueManager::NextWork() -> std::optional<gallery_path_t> {
  gallery_path_t path = work_queue_.pop();
  if (path.empty()) return std::nullopt;
  return path;
}

void QueueManager::WakeWorkers() { work_queue_.push(gallery_path_t{}); }

auto QueueManager::BeginUpload(const gallery_path_t& path) -> std::optional<ActiveUpload> {
  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item || item->status_ != GalleryStatus::QUEUED || active_path_.has_value()) {
    return std::nullopt;
  }
  active_path_ = path;
  active_job_  = std::make_shared<UploadJob>();
  item->current_kibps_ = 0.0;
  SetStatusLocked(*item, GalleryStatus::UPLOADING);

  ActiveUpload upload;
  upload.job_                            = active_job_;
  upload.request_.path_                  = item->path_;
  upload.request_.name_                  = item->name_;
  upload.request_.template_name_         = item->template_name_;
  upload.request_.gallery_id_            = item->gallery_id_;
  upload.request_.uploaded_files_        = item->uploaded_files_;
  upload.request_.uploaded_images_data_  = item->uploaded_images_data_;
  return upload;
}

void QueueManager::OnGalleryStarted(const gallery_path_t& path, const remote_id_t& gallery_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item || gallery_id.empty() || item->gallery_id_ == gallery_id) return;
  item->gallery_id_  = gallery_id;
  item->gallery_url_ = config_.upload_.web_base_url_ + "/g/" + gallery_id;
  TouchLocked(*item);
}

void QueueManager::OnImageUploaded(const gallery_path_t& path, const UploadSuccess& success) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item) return;
  if (item->gallery_id_.empty() && !success.gallery_id_.empty()) {
    item->gallery_id_  = success.gallery_id_;
    item->gallery_url_ = config_.upload_.web_base_url_ + "/g/" + success.gallery_id_;
  }
  if (item->uploaded_files_.insert(success.file_name_).second) {
    item->uploaded_images_data_.push_back(success.record_);
    item->uploaded_bytes_ += success.record_.size_bytes_;
  }
  auto uploaded = static_cast<uint32_t>(item->uploaded_files_.size());
  if (item->total_images_ > 0) uploaded = std::min(uploaded, item->total_images_);
  item->uploaded_images_ = uploaded;
  item->progress_ =
      item->total_images_ > 0 ? static_cast<int>(uploaded * 100 / item->total_images_) : 0;
  item->current_image_ = success.file_name_;
  TouchLocked(*item);
}

void QueueManager::OnProgress(const gallery_path_t& path, const file_name_t& current_image,
                              double kibps) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto*                       item = FindLocked(path);
  if (!item) return;
  item->current_image_ = current_image;
  item->current_kibps_ = kibps;
  // Runtime only: nothing to persist
  ++version_;
}

auto QueueManager::FinishUpload(const gallery_path_t& path, const UploadResult& result)
    -> std::optional<GalleryItem> {
  std::optional<GalleryItem> snapshot;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    const StopKind              stop = active_job_ ? active_job_->Kind() : StopKind::NONE;
    if (active_path_ == path) {
      active_path_.reset();
      active_job_.reset();
    }
    auto* item = FindLocked(path);
    if (!item) return std::nullopt;

    if (!result.gallery_id_.empty()) {
      item->gallery_id_  = result.gallery_id_;
      item->gallery_url_ = result.gallery_url_;
    }
    item->uploaded_images_data_ = result.images_;
    item->uploaded_files_.clear();
    for (const auto& image : result.images_) item->uploaded_files_.insert(image.file_name_);
    item->total_images_    = result.total_images_;
    item->uploaded_images_ = std::min(result.successful_count_, result.total_images_);
    item->uploaded_bytes_  = result.uploaded_size_;
    item->final_kibps_     = result.kibps_;
    item->current_kibps_   = 0.0;
    item->current_image_.clear();
    item->failed_files_ = result.failures_;
    item->progress_     = item->total_images_ > 0
                              ? static_cast<int>(item->uploaded_images_ * 100 / item->total_images_)
                              : 0;

    GalleryStatus status;
    if (result.failures_.empty() && item->uploaded_images_ >= item->total_images_) {
      status               = GalleryStatus::COMPLETED;
      item->finished_time_ = result.finished_at_;
      item->error_message_.clear();
    } else if (result.soft_stopped_) {
      status = stop == StopKind::PAUSE ? GalleryStatus::PAUSED : GalleryStatus::INCOMPLETE;
    } else {
      status               = GalleryStatus::UPLOAD_FAILED;
      item->error_message_ = std::to_string(result.failures_.size()) + " file(s) failed to upload";
    }
    SetStatusLocked(*item, status);
    snapshot = *item;
  }
  if (shut_down_.load()) persistence_.FlushNow();
  return snapshot;
}

void QueueManager::FailUpload(const gallery_path_t& path, const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (active_path_ == path) {
      active_path_.reset();
      active_job_.reset();
    }
    auto* item = FindLocked(path);
    if (!item) return;
    item->error_message_ = message;
    item->current_kibps_ = 0.0;
    item->current_image_.clear();
    SetStatusLocked(*item, GalleryStatus::UPLOAD_FAILED);
  }
  if (shut_down_.load()) persistence_.FlushNow();
}

void QueueManager::Shutdown() {
  if (shut_down_.exchange(true)) return;
  scan_worker_.Stop();
  WakeWorkers();
  persistence_.Stop();
  {
    std::lock_guard<std::mutex> lock(mtx_);
    ReapDeletesLocked(true);
  }
  store_.Flush();
}
};  // namespace galleryup
