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

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "controller_types.hpp"
#include "type/type.hpp"

namespace galleryup {
/**
 * @brief One forward step of the schema. Steps run in version order, each inside its own
 *        transaction, and are recorded in SchemaVersion once they succeed.
 */
struct SchemaMigration {
  int                                     version_;
  const char*                             description_;
  std::function<void(duckdb_connection&)> apply_;
};

class DBController {
 private:
  duckdb_database              db_ = nullptr;

  file_path_t                  db_path_;

  constexpr static const char* version_table_query_ =
      "CREATE TABLE IF NOT EXISTS SchemaVersion (version INTEGER PRIMARY KEY, applied_ts BIGINT);";

  void                         RunMigrations();

 public:
  explicit DBController(const file_path_t& db_path);
  ~DBController();

  DBController(const DBController&)            = delete;
  DBController& operator=(const DBController&) = delete;

  auto        GetConnectionGuard() -> ConnectionGuard;
  auto        AppliedVersions() -> std::vector<int>;

  static auto Migrations() -> const std::vector<SchemaMigration>&;
  static void RunScript(duckdb_connection& conn, const char* sql);
};
};  // namespace galleryup
