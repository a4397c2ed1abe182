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

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <stdexcept>
#include <type_traits>
#include <variant>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace galleryup {
template <typename ID>
auto ToBindValue(const ID& id) -> duckorm::BindValue {
  if constexpr (std::is_integral_v<ID>) {
    return static_cast<int64_t>(id);
  } else {
    return std::string(id);
  }
}

template <typename Derived, typename Mappable, typename ID>
class MapperInterface {
 public:
  duckdb_connection& conn_;

  explicit MapperInterface(duckdb_connection& conn) : conn_(conn) {}

  /**
   * @brief Insert a new record into the table
   *
   * @param obj
   */
  void Insert(const Mappable& obj) {
    duckorm::insert(conn_, Derived::TableName(), &obj, Derived::FieldDesc());
  }

  /**
   * @brief Insert or, when the conflict key already exists, overwrite the non-key columns
   *
   * @param obj
   */
  void Upsert(const Mappable& obj) {
    duckorm::upsert(conn_, Derived::TableName(), &obj, Derived::FieldDesc(),
                    Derived::ConflictColumns());
  }

  /**
   * @brief Remove a record from the table by its primary key
   *
   * @param remove_id
   */
  auto Remove(const ID& remove_id) -> int64_t {
    return duckorm::remove(conn_, Derived::TableName(), Derived::PrimeKeyClause(),
                           {ToBindValue(remove_id)});
  }

  /**
   * @brief Remove records from the table by a custom SQL predicate
   */
  auto RemoveByClause(const std::string& predicate, const duckorm::BindList& params = {})
      -> int64_t {
    return duckorm::remove(conn_, Derived::TableName(), predicate.c_str(), params);
  }

  /**
   * @brief Get records from the table by a custom SQL predicate
   *
   * @param where_clause
   * @return std::vector<Mappable>
   */
  auto Get(const char* where_clause, const duckorm::BindList& params = {})
      -> std::vector<Mappable> {
    auto raw = duckorm::select(conn_, Derived::TableName(), Derived::FieldDesc(), where_clause,
                               params);
    std::vector<Mappable> result;
    result.reserve(raw.size());
    for (auto& row : raw) {
      result.emplace_back(Derived::FromRawData(std::move(row)));
    }
    return result;
  }

  auto GetByQuery(const std::string& query, const duckorm::BindList& params = {})
      -> std::vector<Mappable> {
    auto raw = duckorm::select_by_query(conn_, Derived::FieldDesc(), query, params);
    std::vector<Mappable> result;
    result.reserve(raw.size());
    for (auto& row : raw) {
      result.emplace_back(Derived::FromRawData(std::move(row)));
    }
    return result;
  }

  /**
   * @brief Update a record in the table by its primary key
   *
   * @param target_id
   * @param updated
   */
  void Update(const ID& target_id, const Mappable& updated) {
    duckorm::update(conn_, Derived::TableName(), &updated, Derived::FieldDesc(),
                    Derived::PrimeKeyClause(), {ToBindValue(target_id)});
  }
};

template <typename Derived>
struct FieldReflectable {
 public:
  using FieldArrayType  = std::span<const duckorm::DuckFieldDesc>;
  using ColumnArrayType = std::span<const char* const>;
  static constexpr FieldArrayType  FieldDesc() { return Derived::field_descs_; }
  static constexpr uint32_t        FieldCount() { return Derived::field_count_; }
  static constexpr const char*     TableName() { return Derived::table_name_; }
  static constexpr const char*     PrimeKeyClause() { return Derived::prime_key_clause_; }
  static constexpr ColumnArrayType ConflictColumns() { return Derived::conflict_columns_; }

  /**
   * @brief Move the idx-th column out of a raw row, checking that the DB returned the declared
   *        type.
   */
  template <typename T>
  static auto Take(std::vector<duckorm::VarTypes>& row, size_t idx) -> T {
    auto value = std::get_if<T>(&row[idx]);
    if (value == nullptr) {
      throw std::runtime_error(std::string("Encountering unmatching types when parsing column ") +
                               Derived::field_descs_[idx].name + " of " + Derived::table_name_);
    }
    return std::move(*value);
  }
};
};  // namespace galleryup
