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
struct TabMapperParams {
  tab_id_t                     id;
  std::unique_ptr<std::string> name;
  int32_t                      tab_type;
  int32_t                      display_order;
  std::unique_ptr<std::string> color_hint;
  int64_t                      created_ts;
  int64_t                      updated_ts;
  bool                         is_active;
};

class TabMapper : public MapperInterface<TabMapper, TabMapperParams, tab_id_t>,
                  public FieldReflectable<TabMapper> {
 private:
  static constexpr uint32_t                    field_count_      = 8;
  static constexpr const char*                 table_name_       = "Tab";
  static constexpr const char*                 prime_key_clause_ = "id = ?";
  static constexpr std::array<const char*, 1>  conflict_columns_ = {"id"};
  static constexpr std::array<duckorm::DuckFieldDesc, field_count_> field_descs_ = {
      FIELD(TabMapperParams, id, INT64),          FIELD(TabMapperParams, name, VARCHAR),
      FIELD(TabMapperParams, tab_type, INT32),    FIELD(TabMapperParams, display_order, INT32),
      FIELD(TabMapperParams, color_hint, VARCHAR), FIELD(TabMapperParams, created_ts, INT64),
      FIELD(TabMapperParams, updated_ts, INT64),  FIELD(TabMapperParams, is_active, BOOLEAN)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> TabMapperParams;
  friend struct FieldReflectable<TabMapper>;
  using MapperInterface::MapperInterface;
};
};  // namespace galleryup
