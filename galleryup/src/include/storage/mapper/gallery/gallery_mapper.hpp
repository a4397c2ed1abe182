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
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"
#include "type/type.hpp"

namespace galleryup {
struct GalleryMapperParams {
  store_id_t                   id;
  std::unique_ptr<std::string> path;
  std::unique_ptr<std::string> name;
  std::unique_ptr<std::string> status;
  std::unique_ptr<std::string> template_name;
  int64_t                      added_ts;
  int64_t                      finished_ts;
  int64_t                      total_images;
  int64_t                      uploaded_images;
  int64_t                      total_size;
  int64_t                      uploaded_bytes;
  bool                         scan_complete;
  double                       avg_width;
  double                       avg_height;
  double                       min_width;
  double                       min_height;
  double                       max_width;
  double                       max_height;
  double                       final_kibps;
  std::unique_ptr<std::string> gallery_id;
  std::unique_ptr<std::string> gallery_url;
  int64_t                      insertion_order;
  std::unique_ptr<std::string> failed_files;
  int64_t                      tab_id;
  std::unique_ptr<std::string> error_message;
  std::unique_ptr<std::string> custom_fields;
};

class GalleryMapper : public MapperInterface<GalleryMapper, GalleryMapperParams, store_id_t>,
                      public FieldReflectable<GalleryMapper> {
 private:
  static constexpr uint32_t    field_count_      = 26;
  static constexpr const char* table_name_       = "Gallery";
  static constexpr const char* prime_key_clause_ = "id = ?";
  static constexpr std::array<const char*, 1>                      conflict_columns_ = {"path"};
  static constexpr std::array<duckorm::DuckFieldDesc, field_count_> field_descs_ = {
      FIELD(GalleryMapperParams, id, INT64),
      FIELD(GalleryMapperParams, path, VARCHAR),
      FIELD(GalleryMapperParams, name, VARCHAR),
      FIELD(GalleryMapperParams, status, VARCHAR),
      FIELD(GalleryMapperParams, template_name, VARCHAR),
      FIELD(GalleryMapperParams, added_ts, INT64),
      FIELD(GalleryMapperParams, finished_ts, INT64),
      FIELD(GalleryMapperParams, total_images, INT64),
      FIELD(GalleryMapperParams, uploaded_images, INT64),
      FIELD(GalleryMapperParams, total_size, INT64),
      FIELD(GalleryMapperParams, uploaded_bytes, INT64),
      FIELD(GalleryMapperParams, scan_complete, BOOLEAN),
      FIELD(GalleryMapperParams, avg_width, DOUBLE),
      FIELD(GalleryMapperParams, avg_height, DOUBLE),
      FIELD(GalleryMapperParams, min_width, DOUBLE),
      FIELD(GalleryMapperParams, min_height, DOUBLE),
      FIELD(GalleryMapperParams, max_width, DOUBLE),
      FIELD(GalleryMapperParams, max_height, DOUBLE),
      FIELD(GalleryMapperParams, final_kibps, DOUBLE),
      FIELD(GalleryMapperParams, gallery_id, VARCHAR),
      FIELD(GalleryMapperParams, gallery_url, VARCHAR),
      FIELD(GalleryMapperParams, insertion_order, INT64),
      FIELD(GalleryMapperParams, failed_files, JSON),
      FIELD(GalleryMapperParams, tab_id, INT64),
      FIELD(GalleryMapperParams, error_message, VARCHAR),
      FIELD(GalleryMapperParams, custom_fields, JSON)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> GalleryMapperParams;
  friend struct FieldReflectable<GalleryMapper>;
  using MapperInterface::MapperInterface;
};

/**
 * @brief One uploaded file of a gallery, keyed by (gallery_fk, file_name). ordinal is the index
 *        in the gallery's ordered image list.
 */
struct ImageRecordMapperParams {
  store_id_t                   gallery_fk;
  std::unique_ptr<std::string> file_name;
  int64_t                      ordinal;
  int64_t                      size_bytes;
  int64_t                      width;
  int64_t                      height;
  int64_t                      uploaded_ts;
  std::unique_ptr<std::string> url;
  std::unique_ptr<std::string> thumb_url;
};

class ImageRecordMapper
    : public MapperInterface<ImageRecordMapper, ImageRecordMapperParams, store_id_t>,
      public FieldReflectable<ImageRecordMapper> {
 private:
  static constexpr uint32_t    field_count_      = 9;
  static constexpr const char* table_name_       = "Image";
  // Images are addressed through their gallery
  static constexpr const char* prime_key_clause_ = "gallery_fk = ?";
  static constexpr std::array<const char*, 2> conflict_columns_ = {"gallery_fk", "file_name"};
  static constexpr std::array<duckorm::DuckFieldDesc, field_count_> field_descs_ = {
      FIELD(ImageRecordMapperParams, gallery_fk, INT64),
      FIELD(ImageRecordMapperParams, file_name, VARCHAR),
      FIELD(ImageRecordMapperParams, ordinal, INT64),
      FIELD(ImageRecordMapperParams, size_bytes, INT64),
      FIELD(ImageRecordMapperParams, width, INT64),
      FIELD(ImageRecordMapperParams, height, INT64),
      FIELD(ImageRecordMapperParams, uploaded_ts, INT64),
      FIELD(ImageRecordMapperParams, url, VARCHAR),
      FIELD(ImageRecordMapperParams, thumb_url, VARCHAR)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> ImageRecordMapperParams;
  friend struct FieldReflectable<ImageRecordMapper>;
  using MapperInterface::MapperInterface;
};
};  // namespace galleryup
