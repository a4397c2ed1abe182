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

#include "storage/controller/db_controller.hpp"

#include <duckdb.h>

#include <exception>
#include <iostream>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "gallery/tab.hpp"
#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "utils/clock/time_provider.hpp"

namespace galleryup {
namespace {
constexpr const char* kCoreSchema =
    "CREATE SEQUENCE IF NOT EXISTS tab_id_seq START 1;"
    "CREATE TABLE IF NOT EXISTS Tab (id BIGINT PRIMARY KEY, name VARCHAR NOT NULL UNIQUE, "
    "tab_type INTEGER, display_order INTEGER, color_hint VARCHAR, created_ts BIGINT, "
    "updated_ts BIGINT, is_active BOOLEAN DEFAULT TRUE);"
    "CREATE TABLE IF NOT EXISTS Gallery (id BIGINT PRIMARY KEY, path VARCHAR NOT NULL UNIQUE, "
    "name VARCHAR, status VARCHAR, template_name VARCHAR, added_ts BIGINT, finished_ts BIGINT, "
    "total_images BIGINT, uploaded_images BIGINT, total_size BIGINT, uploaded_bytes BIGINT, "
    "scan_complete BOOLEAN, avg_width DOUBLE, avg_height DOUBLE, min_width DOUBLE, "
    "min_height DOUBLE, max_width DOUBLE, max_height DOUBLE, final_kibps DOUBLE, "
    "gallery_id VARCHAR, gallery_url VARCHAR, insertion_order BIGINT, failed_files VARCHAR, "
    "tab_id BIGINT, error_message VARCHAR DEFAULT '', custom_fields VARCHAR DEFAULT '{}');"
    "CREATE TABLE IF NOT EXISTS Image (gallery_fk BIGINT, file_name VARCHAR, ordinal BIGINT, "
    "size_bytes BIGINT, width BIGINT, height BIGINT, uploaded_ts BIGINT, url VARCHAR, "
    "thumb_url VARCHAR, PRIMARY KEY (gallery_fk, file_name));"
    "CREATE TABLE IF NOT EXISTS PendingRename (gallery_id VARCHAR PRIMARY KEY, "
    "intended_name VARCHAR, discovered_ts BIGINT);";

constexpr const char* kDiagnosticColumns =
    "ALTER TABLE Gallery ADD COLUMN IF NOT EXISTS error_message VARCHAR DEFAULT '';"
    "ALTER TABLE Gallery ADD COLUMN IF NOT EXISTS custom_fields VARCHAR DEFAULT '{}';";

constexpr const char* kSecondaryUploadSchema =
    "CREATE TABLE IF NOT EXISTS SecondaryUpload (gallery_fk BIGINT, host_name VARCHAR, "
    "status VARCHAR, uploaded_bytes BIGINT, total_bytes BIGINT, download_url VARCHAR, "
    "file_id VARCHAR, error_message VARCHAR, created_ts BIGINT, finished_ts BIGINT, "
    "PRIMARY KEY (gallery_fk, host_name));";

void EnsureSystemTab(duckdb_connection& conn, const char* name, int32_t display_order,
                     const char* color_hint) {
  auto existing =
      duckorm::query_int64(conn, "SELECT id FROM Tab WHERE name = ?", {std::string(name)});
  if (existing.has_value()) return;
  auto now = TimeProvider::EpochSeconds();
  duckorm::execute(conn,
                   "INSERT INTO Tab (id, name, tab_type, display_order, color_hint, created_ts, "
                   "updated_ts, is_active) VALUES (nextval('tab_id_seq'), ?, ?, ?, ?, ?, ?, TRUE)",
                   {std::string(name), static_cast<int64_t>(TabType::SYSTEM),
                    static_cast<int64_t>(display_order),
                    color_hint ? duckorm::BindValue{std::string(color_hint)}
                               : duckorm::BindValue{std::monostate{}},
                    now, now});
}
}  // namespace

auto DBController::Migrations() -> const std::vector<SchemaMigration>& {
  static const std::vector<SchemaMigration> migrations = {
      {1, "core tables", [](duckdb_connection& conn) { RunScript(conn, kCoreSchema); }},
      {2, "gallery diagnostics columns",
       [](duckdb_connection& conn) { RunScript(conn, kDiagnosticColumns); }},
      {3, "secondary uploads", [](duckdb_connection& conn) { RunScript(conn, kSecondaryUploadSchema); }},
      {4, "default tabs",
       [](duckdb_connection& conn) {
         EnsureSystemTab(conn, kMainTabName, 0, nullptr);
         EnsureSystemTab(conn, kArchiveTabName, 1000, "#666666");
       }},
  };
  return migrations;
}

/**
 * @brief Open (or create) the database file and bring its schema up to date.
 *
 * @param db_path
 */
DBController::DBController(const file_path_t& db_path) : db_path_(db_path) {
  if (db_path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  std::string utf8_str = db_path_.string();
  if (duckdb_open(utf8_str.c_str(), &db_) != DuckDBSuccess) {
    throw StoreError("DB cannot be opened: " + utf8_str);
  }
  try {
    RunMigrations();
  } catch (...) {
    duckdb_close(&db_);
    throw;
  }
}

DBController::~DBController() { duckdb_close(&db_); }

/**
 * @brief Get a connection guard for the database.
 *
 * @return ConnectionGuard
 */
auto DBController::GetConnectionGuard() -> ConnectionGuard {
  duckdb_connection conn = nullptr;
  if (duckdb_connect(db_, &conn) != DuckDBSuccess) {
    throw StoreError("DB cannot be connected");
  }
  return ConnectionGuard{conn};
}

void DBController::RunScript(duckdb_connection& conn, const char* sql) {
  duckdb_result result;
  if (duckdb_query(conn, sql, &result) != DuckDBSuccess) {
    const char* err     = duckdb_result_error(&result);
    std::string message = err ? err : "unknown error";
    duckdb_destroy_result(&result);
    throw StoreError(message);
  }
  duckdb_destroy_result(&result);
}

auto DBController::AppliedVersions() -> std::vector<int> {
  auto                                  guard = GetConnectionGuard();
  static constexpr duckorm::DuckFieldDesc version_field[] = {
      {"version", duckorm::DuckDBType::INT32, 0}};
  std::vector<int> versions;
  for (auto& row : duckorm::select_by_query(
           guard.conn_, version_field, "SELECT version FROM SchemaVersion ORDER BY version", {})) {
    versions.push_back(std::get<int32_t>(row[0]));
  }
  return versions;
}

/**
 * @brief Apply every migration step that is not yet recorded. A failing step is logged and
 *        skipped; later steps still run.
 */
void DBController::RunMigrations() {
  auto guard = GetConnectionGuard();
  RunScript(guard.conn_, version_table_query_);

  std::set<int> applied;
  for (int v : AppliedVersions()) applied.insert(v);

  for (const auto& step : Migrations()) {
    if (applied.contains(step.version_)) continue;
    try {
      TransactionGuard tx(guard.conn_);
      step.apply_(guard.conn_);
      duckorm::execute(guard.conn_,
                       "INSERT INTO SchemaVersion (version, applied_ts) VALUES (?, ?)",
                       {static_cast<int64_t>(step.version_), TimeProvider::EpochSeconds()});
      tx.Commit();
    } catch (const std::exception& e) {
      std::cerr << "GalleryStore: migration v" << step.version_ << " (" << step.description_
                << ") failed, skipped: " << e.what() << std::endl;
    }
  }
}
};  // namespace galleryup
