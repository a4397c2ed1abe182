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

#include <cstddef>
#include <string>
#include <vector>

#include "storage/mapper/mapper_interface.hpp"

namespace galleryup {
template <typename Derived, typename InternalType, typename Mappable, typename Mapper, typename ID>
class ServiceInterface {
 protected:
  duckdb_connection& conn_;
  Mapper             mapper_;

 public:
  explicit ServiceInterface(duckdb_connection& conn) : conn_(conn), mapper_(conn) {}
  void InsertParams(const Mappable& param) { mapper_.Insert(param); }
  void UpsertParams(const Mappable& param) { mapper_.Upsert(param); }
  void Insert(const InternalType& obj) { mapper_.Insert(Derived::ToParams(obj)); }
  void Upsert(const InternalType& obj) { mapper_.Upsert(Derived::ToParams(obj)); }

  /**
   * @brief Get the objects by a SQL predicate (WHERE clause) with '?' placeholders
   *
   * @param predicate
   * @return std::vector<InternalType>
   */
  auto GetByPredicate(const std::string& predicate, const duckorm::BindList& params = {})
      -> std::vector<InternalType> {
    std::vector<Mappable>     param_results = mapper_.Get(predicate.c_str(), params);
    std::vector<InternalType> results;
    results.reserve(param_results.size());
    for (auto& param : param_results) {
      results.emplace_back(Derived::FromParams(std::move(param)));
    }
    return results;
  }

  /**
   * @brief Get the objects by a full SQL query. The selected columns must follow the mapper's
   *        field order.
   *
   * @param query
   * @return std::vector<InternalType>
   */
  auto GetByQuery(const std::string& query, const duckorm::BindList& params = {})
      -> std::vector<InternalType> {
    std::vector<Mappable>     param_results = mapper_.GetByQuery(query, params);
    std::vector<InternalType> results;
    results.reserve(param_results.size());
    for (auto& param : param_results) {
      results.emplace_back(Derived::FromParams(std::move(param)));
    }
    return results;
  }

  auto RemoveById(const ID& remove_id) -> int64_t { return mapper_.Remove(remove_id); }
  auto RemoveByClause(const std::string& clause, const duckorm::BindList& params = {})
      -> int64_t {
    return mapper_.RemoveByClause(clause, params);
  }
  void Update(const InternalType& obj, const ID& update_id) {
    mapper_.Update(update_id, Derived::ToParams(obj));
  }
};
}  // namespace galleryup
