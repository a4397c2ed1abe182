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

#include <string>
#include <vector>

#include "gallery/side_records.hpp"
#include "storage/mapper/secondary/secondary_upload_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace galleryup {
struct StoredSecondaryUpload {
  store_id_t            gallery_fk_ = 0;
  SecondaryUploadRecord record_{};
};

class SecondaryUploadService
    : public ServiceInterface<SecondaryUploadService, StoredSecondaryUpload,
                              SecondaryUploadMapperParams, SecondaryUploadMapper, store_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const StoredSecondaryUpload& source) -> SecondaryUploadMapperParams;
  static auto FromParams(SecondaryUploadMapperParams&& param) -> StoredSecondaryUpload;

  auto        GetByGallery(store_id_t gallery_fk) -> std::vector<StoredSecondaryUpload>;
  auto        GetByHostAndStatus(const std::string& host_name, SecondaryUploadStatus status)
      -> std::vector<StoredSecondaryUpload>;
};
};  // namespace galleryup
