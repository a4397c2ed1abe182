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

#include "storage/service/gallery/gallery_service.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "gallery/gallery_item.hpp"
#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "type/gallery_status.hpp"

namespace galleryup {
namespace {
auto MakeStr(const std::string& value) -> std::unique_ptr<std::string> {
  return std::make_unique<std::string>(value);
}
auto TakeStr(std::unique_ptr<std::string>& value) -> std::string {
  return value ? std::move(*value) : std::string{};
}
}  // namespace

auto GalleryService::ToParams(const StoredGallery& source) -> GalleryMapperParams {
  const GalleryItem& item = source.item_;
  GalleryMapperParams p;
  p.id              = item.store_id_;
  p.path            = MakeStr(item.path_);
  p.name            = MakeStr(item.name_);
  p.status          = MakeStr(std::string(StatusToString(item.status_)));
  p.template_name   = MakeStr(item.template_name_);
  p.added_ts        = item.added_time_;
  p.finished_ts     = item.finished_time_;
  p.total_images    = item.total_images_;
  p.uploaded_images = item.uploaded_images_;
  p.total_size      = item.total_size_;
  p.uploaded_bytes  = item.uploaded_bytes_;
  p.scan_complete   = item.scan_complete_;
  p.avg_width       = item.dimensions_.avg_width_;
  p.avg_height      = item.dimensions_.avg_height_;
  p.min_width       = item.dimensions_.min_width_;
  p.min_height      = item.dimensions_.min_height_;
  p.max_width       = item.dimensions_.max_width_;
  p.max_height      = item.dimensions_.max_height_;
  p.final_kibps     = item.final_kibps_;
  p.gallery_id      = item.gallery_id_.empty() ? nullptr : MakeStr(item.gallery_id_);
  p.gallery_url     = item.gallery_url_.empty() ? nullptr : MakeStr(item.gallery_url_);
  p.insertion_order = item.insertion_order_;
  p.failed_files    = MakeStr(FailedFilesToJson(item.failed_files_));
  p.tab_id          = source.tab_id_;
  p.error_message   = MakeStr(item.error_message_);
  p.custom_fields   = MakeStr(CustomFieldsToJson(item.custom_fields_));
  return p;
}

auto GalleryService::FromParams(GalleryMapperParams&& param) -> StoredGallery {
  StoredGallery stored;
  GalleryItem&  item = stored.item_;
  item.store_id_     = param.id;
  item.path_         = TakeStr(param.path);
  item.name_         = TakeStr(param.name);
  // Unknown or legacy status strings fall back to ready so the gallery stays actionable
  item.status_ = StatusFromString(TakeStr(param.status)).value_or(GalleryStatus::READY);
  item.template_name_ = TakeStr(param.template_name);
  if (item.template_name_.empty()) item.template_name_ = "default";
  item.added_time_               = param.added_ts;
  item.finished_time_            = param.finished_ts;
  item.total_images_             = static_cast<uint32_t>(param.total_images);
  item.uploaded_images_          = static_cast<uint32_t>(param.uploaded_images);
  item.total_size_               = param.total_size;
  item.uploaded_bytes_           = param.uploaded_bytes;
  item.scan_complete_            = param.scan_complete;
  item.dimensions_.avg_width_    = param.avg_width;
  item.dimensions_.avg_height_   = param.avg_height;
  item.dimensions_.min_width_    = param.min_width;
  item.dimensions_.min_height_   = param.min_height;
  item.dimensions_.max_width_    = param.max_width;
  item.dimensions_.max_height_   = param.max_height;
  item.final_kibps_              = param.final_kibps;
  item.gallery_id_               = TakeStr(param.gallery_id);
  item.gallery_url_              = TakeStr(param.gallery_url);
  item.insertion_order_          = param.insertion_order;
  item.failed_files_             = FailedFilesFromJson(TakeStr(param.failed_files));
  item.error_message_            = TakeStr(param.error_message);
  item.custom_fields_            = CustomFieldsFromJson(TakeStr(param.custom_fields));
  stored.tab_id_                 = param.tab_id;
  return stored;
}

auto GalleryService::GetAllOrdered() -> std::vector<StoredGallery> {
  return GetByPredicate("TRUE ORDER BY insertion_order, id");
}

auto GalleryService::GetByPath(const gallery_path_t& path) -> std::optional<StoredGallery> {
  auto result = GetByPredicate("path = ?", {path});
  if (result.empty()) return std::nullopt;
  return std::move(result.front());
}

auto GalleryService::GetPathById(store_id_t id) -> std::optional<gallery_path_t> {
  auto result = GetByPredicate("id = ?", {static_cast<int64_t>(id)});
  if (result.empty()) return std::nullopt;
  return result.front().item_.path_;
}

auto GalleryService::GetIdByPath(const gallery_path_t& path) -> std::optional<store_id_t> {
  return duckorm::query_int64(conn_, "SELECT id FROM Gallery WHERE path = ?", {path});
}

auto GalleryService::GetMaxId() -> store_id_t {
  return duckorm::query_int64(conn_, "SELECT MAX(id) FROM Gallery").value_or(0);
}

auto ImageRecordService::ToParams(const StoredImage& source) -> ImageRecordMapperParams {
  const ImageRecord& r = source.record_;
  return {source.gallery_fk_,
          MakeStr(r.file_name_),
          source.ordinal_,
          r.size_bytes_,
          static_cast<int64_t>(r.width_),
          static_cast<int64_t>(r.height_),
          r.uploaded_ts_,
          MakeStr(r.url_),
          MakeStr(r.thumb_url_)};
}

auto ImageRecordService::FromParams(ImageRecordMapperParams&& param) -> StoredImage {
  StoredImage stored;
  stored.gallery_fk_          = param.gallery_fk;
  stored.ordinal_            = param.ordinal;
  stored.record_.file_name_   = TakeStr(param.file_name);
  stored.record_.size_bytes_  = param.size_bytes;
  stored.record_.width_       = static_cast<uint32_t>(param.width);
  stored.record_.height_      = static_cast<uint32_t>(param.height);
  stored.record_.uploaded_ts_ = param.uploaded_ts;
  stored.record_.url_         = TakeStr(param.url);
  stored.record_.thumb_url_   = TakeStr(param.thumb_url);
  return stored;
}

auto ImageRecordService::GetAllOrdered() -> std::vector<StoredImage> {
  return GetByPredicate("TRUE ORDER BY gallery_fk, ordinal");
}

auto ImageRecordService::GetForGallery(store_id_t gallery_fk) -> std::vector<ImageRecord> {
  std::vector<ImageRecord> records;
  for (auto& stored : GetByPredicate("gallery_fk = ? ORDER BY ordinal",
                                     {static_cast<int64_t>(gallery_fk)})) {
    records.push_back(std::move(stored.record_));
  }
  return records;
}

void ImageRecordService::ReplaceForGallery(store_id_t                      gallery_fk,
                                           const std::vector<ImageRecord>& records) {
  std::vector<ImageRecord> current = GetForGallery(gallery_fk);
  if (current == records) return;

  // Existing keys are rewritten in place, then rows no longer listed are dropped
  for (size_t i = 0; i < records.size(); ++i) {
    Upsert(StoredImage{gallery_fk, static_cast<int64_t>(i), records[i]});
  }
  std::unordered_set<file_name_t> keep;
  for (const auto& r : records) keep.insert(r.file_name_);
  for (const auto& stored : current) {
    if (!keep.contains(stored.file_name_)) {
      RemoveByClause("gallery_fk = ? AND file_name = ?",
                     {static_cast<int64_t>(gallery_fk), stored.file_name_});
    }
  }
}
};  // namespace galleryup
