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

#include "storage/mapper/duckorm/duckdb_types.hpp"

#include <duckdb.h>

#include <cstring>
#include <stdexcept>
#include <string>

namespace duckorm {
void PreparedStatement::RecycleResources() {
  if (stmt_) {
    duckdb_destroy_prepare(&stmt_);
    stmt_ = nullptr;
  }
  if (executed_) {
    duckdb_destroy_result(&result_);
    executed_ = false;
  }
}

PreparedStatement::PreparedStatement(duckdb_connection& con) : con_(con) {
  std::memset(&result_, 0, sizeof(result_));
}

PreparedStatement::PreparedStatement(duckdb_connection& con, const std::string& prepare_query)
    : con_(con) {
  std::memset(&result_, 0, sizeof(result_));
  GetStmtGuard(prepare_query);
}

PreparedStatement::~PreparedStatement() { RecycleResources(); }

auto PreparedStatement::GetStmtGuard(const std::string& prepare_query)
    -> duckdb_prepared_statement& {
  RecycleResources();
  if (duckdb_prepare(con_, prepare_query.c_str(), &stmt_) != DuckDBSuccess) {
    const char* err = duckdb_prepare_error(stmt_);
    std::string msg = "PreparedStatement failed";
    if (err && std::strlen(err) > 0) {
      msg += ": ";
      msg += err;
    }
    msg += " [" + prepare_query + "]";
    RecycleResources();
    throw std::runtime_error(msg);
  }
  prepared_ = true;
  return stmt_;
}

void PreparedStatement::Execute() {
  if (!prepared_) {
    throw std::runtime_error("PreparedStatement executed before prepare");
  }
  if (executed_) {
    duckdb_destroy_result(&result_);
    executed_ = false;
  }
  auto state = duckdb_execute_prepared(stmt_, &result_);
  executed_  = true;
  if (state != DuckDBSuccess) {
    const char* err = duckdb_result_error(&result_);
    throw std::runtime_error(err ? err : "DuckDB execution failed");
  }
}

void bind_value(duckdb_prepared_statement stmt, idx_t index, const BindValue& value) {
  duckdb_state state = DuckDBSuccess;
  if (std::holds_alternative<std::monostate>(value)) {
    state = duckdb_bind_null(stmt, index);
  } else if (auto i = std::get_if<int64_t>(&value)) {
    state = duckdb_bind_int64(stmt, index, *i);
  } else if (auto d = std::get_if<double>(&value)) {
    state = duckdb_bind_double(stmt, index, *d);
  } else if (auto b = std::get_if<bool>(&value)) {
    state = duckdb_bind_boolean(stmt, index, *b);
  } else if (auto s = std::get_if<std::string>(&value)) {
    state = duckdb_bind_varchar_length(stmt, index, s->data(), s->size());
  }
  if (state != DuckDBSuccess) {
    throw std::runtime_error("Failed to bind parameter " + std::to_string(index));
  }
}
}  // namespace duckorm
