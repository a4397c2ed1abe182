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

#include <duckdb.h>

#include <optional>
#include <string>
#include <vector>

#include "gallery/gallery_item.hpp"
#include "storage/mapper/gallery/gallery_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace galleryup {
/**
 * @brief A gallery row as stored: the item's persisted fields plus the id of its tab. Image
 *        records live in their own table.
 */
struct StoredGallery {
  GalleryItem item_{};
  tab_id_t    tab_id_ = 0;
};

class GalleryService : public ServiceInterface<GalleryService, StoredGallery, GalleryMapperParams,
                                               GalleryMapper, store_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const StoredGallery& source) -> GalleryMapperParams;
  static auto FromParams(GalleryMapperParams&& param) -> StoredGallery;

  auto        GetAllOrdered() -> std::vector<StoredGallery>;
  auto        GetByPath(const gallery_path_t& path) -> std::optional<StoredGallery>;
  auto        GetPathById(store_id_t id) -> std::optional<gallery_path_t>;
  auto        GetIdByPath(const gallery_path_t& path) -> std::optional<store_id_t>;
  auto        GetMaxId() -> store_id_t;
};

struct StoredImage {
  store_id_t  gallery_fk_ = 0;
  int64_t     ordinal_   = 0;
  ImageRecord record_{};
};

class ImageRecordService
    : public ServiceInterface<ImageRecordService, StoredImage, ImageRecordMapperParams,
                              ImageRecordMapper, store_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const StoredImage& source) -> ImageRecordMapperParams;
  static auto FromParams(ImageRecordMapperParams&& param) -> StoredImage;

  /**
   * @brief Every image of every gallery, ordered by gallery then ordinal.
   */
  auto        GetAllOrdered() -> std::vector<StoredImage>;
  auto        GetForGallery(store_id_t gallery_fk) -> std::vector<ImageRecord>;
  /**
   * @brief Make the stored image list of a gallery equal to records, in order.
   */
  void        ReplaceForGallery(store_id_t gallery_fk, const std::vector<ImageRecord>& records);
};
};  // namespace galleryup
