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
struct SecondaryUploadMapperParams {
  store_id_t                   gallery_fk;
  std::unique_ptr<std::string> host_name;
  std::unique_ptr<std::string> status;
  int64_t                      uploaded_bytes;
  int64_t                      total_bytes;
  std::unique_ptr<std::string> download_url;
  std::unique_ptr<std::string> file_id;
  std::unique_ptr<std::string> error_message;
  int64_t                      created_ts;
  int64_t                      finished_ts;
};

class SecondaryUploadMapper
    : public MapperInterface<SecondaryUploadMapper, SecondaryUploadMapperParams, store_id_t>,
      public FieldReflectable<SecondaryUploadMapper> {
 private:
  static constexpr uint32_t                   field_count_      = 10;
  static constexpr const char*                table_name_       = "SecondaryUpload";
  static constexpr const char*                prime_key_clause_ = "gallery_fk = ?";
  static constexpr std::array<const char*, 2> conflict_columns_ = {"gallery_fk", "host_name"};
  static constexpr std::array<duckorm::DuckFieldDesc, field_count_> field_descs_ = {
      FIELD(SecondaryUploadMapperParams, gallery_fk, INT64),
      FIELD(SecondaryUploadMapperParams, host_name, VARCHAR),
      FIELD(SecondaryUploadMapperParams, status, VARCHAR),
      FIELD(SecondaryUploadMapperParams, uploaded_bytes, INT64),
      FIELD(SecondaryUploadMapperParams, total_bytes, INT64),
      FIELD(SecondaryUploadMapperParams, download_url, VARCHAR),
      FIELD(SecondaryUploadMapperParams, file_id, VARCHAR),
      FIELD(SecondaryUploadMapperParams, error_message, VARCHAR),
      FIELD(SecondaryUploadMapperParams, created_ts, INT64),
      FIELD(SecondaryUploadMapperParams, finished_ts, INT64)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> SecondaryUploadMapperParams;
  friend struct FieldReflectable<SecondaryUploadMapper>;
  using MapperInterface::MapperInterface;
};
};  // namespace galleryup
