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
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace duckorm {
enum class DuckDBType : uint8_t {
  INT32,
  INT64,
  UINT32,
  DOUBLE,
  VARCHAR,
  JSON,
  BOOLEAN,
};

/**
 * @brief RAII owner of a prepared statement and the result of its last execution.
 */
class PreparedStatement {
 private:
  void RecycleResources();

 public:
  duckdb_result             result_;
  duckdb_prepared_statement stmt_ = nullptr;
  duckdb_connection&        con_;

  bool                      prepared_ = false;
  bool                      executed_ = false;

  explicit PreparedStatement(duckdb_connection& con);
  PreparedStatement(duckdb_connection& con, const std::string& prepare_query);
  ~PreparedStatement();

  PreparedStatement(const PreparedStatement&)            = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;

  auto GetStmtGuard(const std::string& prepare_query) -> duckdb_prepared_statement&;
  /**
   * @brief Execute the statement, throwing std::runtime_error with DuckDB's message on failure.
   */
  void Execute();
};

struct DuckFieldDesc {
  const char* name;
  DuckDBType  type;
  size_t      offset;
};

#define FIELD(type, field, field_type) \
  duckorm::DuckFieldDesc { #field, duckorm::DuckDBType::field_type, offsetof(type, field) }

// A string column holding SQL NULL is read back as an empty unique_ptr
using VarTypes = std::variant<int32_t, int64_t, uint32_t, double, bool, std::unique_ptr<std::string>>;

// Values bound to the '?' placeholders of a WHERE clause or a raw statement
using BindValue = std::variant<std::monostate, int64_t, double, bool, std::string>;
using BindList  = std::vector<BindValue>;

void bind_value(duckdb_prepared_statement stmt, idx_t index, const BindValue& value);
};  // namespace duckorm
