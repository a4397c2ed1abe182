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

#include "storage/controller/controller_types.hpp"

#include <iostream>
#include <string>

namespace galleryup {
namespace {
void RunOrThrow(duckdb_connection& conn, const char* sql) {
  duckdb_result result;
  if (duckdb_query(conn, sql, &result) != DuckDBSuccess) {
    const char* err     = duckdb_result_error(&result);
    std::string message = std::string(sql) + " failed: " + (err ? err : "unknown error");
    duckdb_destroy_result(&result);
    throw StoreError(message);
  }
  duckdb_destroy_result(&result);
}
}  // namespace

ConnectionGuard::ConnectionGuard(duckdb_connection conn) : conn_(conn) {}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept : conn_(other.conn_) {
  other.conn_ = nullptr;
}

ConnectionGuard::~ConnectionGuard() {
  if (conn_) duckdb_disconnect(&conn_);
}

TransactionGuard::TransactionGuard(duckdb_connection& conn) : conn_(conn) {
  RunOrThrow(conn_, "BEGIN TRANSACTION");
  open_ = true;
}

void TransactionGuard::Commit() {
  RunOrThrow(conn_, "COMMIT");
  open_ = false;
}

TransactionGuard::~TransactionGuard() {
  if (!open_) return;
  duckdb_result result;
  if (duckdb_query(conn_, "ROLLBACK", &result) != DuckDBSuccess) {
    const char* err = duckdb_result_error(&result);
    std::cerr << "GalleryStore: rollback failed: " << (err ? err : "unknown error") << std::endl;
  }
  duckdb_destroy_result(&result);
}
};  // namespace galleryup
