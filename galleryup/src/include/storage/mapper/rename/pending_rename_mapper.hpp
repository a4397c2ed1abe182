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
struct PendingRenameMapperParams {
  std::unique_ptr<std::string> gallery_id;
  std::unique_ptr<std::string> intended_name;
  int64_t                      discovered_ts;
};

class PendingRenameMapper
    : public MapperInterface<PendingRenameMapper, PendingRenameMapperParams, remote_id_t>,
      public FieldReflectable<PendingRenameMapper> {
 private:
  static constexpr uint32_t                   field_count_      = 3;
  static constexpr const char*                table_name_       = "PendingRename";
  static constexpr const char*                prime_key_clause_ = "gallery_id = ?";
  static constexpr std::array<const char*, 1> conflict_columns_ = {"gallery_id"};
  static constexpr std::array<duckorm::DuckFieldDesc, field_count_> field_descs_ = {
      FIELD(PendingRenameMapperParams, gallery_id, VARCHAR),
      FIELD(PendingRenameMapperParams, intended_name, VARCHAR),
      FIELD(PendingRenameMapperParams, discovered_ts, INT64)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> PendingRenameMapperParams;
  friend struct FieldReflectable<PendingRenameMapper>;
  using MapperInterface::MapperInterface;
};
};  // namespace galleryup
