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

#include "storage/service/tab/tab_service.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"

namespace galleryup {
auto TabService::ToParams(const Tab& source) -> TabMapperParams {
  return {source.id_,
          std::make_unique<std::string>(source.name_),
          static_cast<int32_t>(source.type_),
          source.display_order_,
          source.color_hint_.empty() ? nullptr : std::make_unique<std::string>(source.color_hint_),
          source.created_ts_,
          source.updated_ts_,
          source.is_active_};
}

auto TabService::FromParams(TabMapperParams&& param) -> Tab {
  Tab tab;
  tab.id_            = param.id;
  tab.name_          = param.name ? std::move(*param.name) : std::string{};
  tab.type_          = param.tab_type == 0 ? TabType::SYSTEM : TabType::USER;
  tab.display_order_ = param.display_order;
  tab.color_hint_    = param.color_hint ? std::move(*param.color_hint) : std::string{};
  tab.created_ts_    = param.created_ts;
  tab.updated_ts_    = param.updated_ts;
  tab.is_active_     = param.is_active;
  return tab;
}

auto TabService::GetAllOrdered() -> std::vector<Tab> {
  return GetByPredicate("TRUE ORDER BY display_order, created_ts, id");
}

auto TabService::GetById(tab_id_t id) -> std::optional<Tab> {
  auto result = GetByPredicate("id = ?", {static_cast<int64_t>(id)});
  if (result.empty()) return std::nullopt;
  return std::move(result.front());
}

auto TabService::GetByName(const std::string& name) -> std::optional<Tab> {
  auto result = GetByPredicate("name = ?", {name});
  if (result.empty()) return std::nullopt;
  return std::move(result.front());
}

auto TabService::NextId() -> tab_id_t {
  auto id = duckorm::query_int64(conn_, "SELECT nextval('tab_id_seq')");
  if (!id.has_value()) {
    throw std::runtime_error("Tab id sequence returned no value");
  }
  return *id;
}
};  // namespace galleryup
