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

#include "storage/mapper/duckorm/duckdb_orm.hpp"

#include <duckdb.h>

#include <cstdint>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace duckorm {
namespace {
void bind_field(duckdb_prepared_statement stmt, idx_t index, const void* obj,
                const DuckFieldDesc& field) {
  const char*  ptr   = reinterpret_cast<const char*>(obj) + field.offset;
  duckdb_state state = DuckDBSuccess;
  switch (field.type) {
    case DuckDBType::INT32:
      state = duckdb_bind_int32(stmt, index, *reinterpret_cast<const int32_t*>(ptr));
      break;
    case DuckDBType::INT64:
      state = duckdb_bind_int64(stmt, index, *reinterpret_cast<const int64_t*>(ptr));
      break;
    case DuckDBType::UINT32:
      state = duckdb_bind_uint32(stmt, index, *reinterpret_cast<const uint32_t*>(ptr));
      break;
    case DuckDBType::DOUBLE:
      state = duckdb_bind_double(stmt, index, *reinterpret_cast<const double*>(ptr));
      break;
    case DuckDBType::BOOLEAN:
      state = duckdb_bind_boolean(stmt, index, *reinterpret_cast<const bool*>(ptr));
      break;
    case DuckDBType::JSON:
    case DuckDBType::VARCHAR: {
      auto member_ptr = reinterpret_cast<const std::unique_ptr<std::string>*>(ptr);
      if (*member_ptr == nullptr) {
        state = duckdb_bind_null(stmt, index);
      } else {
        const std::string& value = **member_ptr;
        state = duckdb_bind_varchar_length(stmt, index, value.data(), value.size());
      }
      break;
    }
    default:
      throw std::runtime_error("Unsupported DuckFieldType in bind_field()");
  }
  if (state != DuckDBSuccess) {
    throw std::runtime_error(std::string("Failed to bind field ") + field.name);
  }
}

void bind_list(duckdb_prepared_statement stmt, idx_t first_index, const BindList& params) {
  for (size_t i = 0; i < params.size(); ++i) {
    bind_value(stmt, first_index + i, params[i]);
  }
}

auto column_list(std::span<const DuckFieldDesc> fields) -> std::string {
  std::ostringstream cols;
  for (size_t i = 0; i < fields.size(); ++i) {
    cols << fields[i].name;
    if (i < fields.size() - 1) {
      cols << ", ";
    }
  }
  return cols.str();
}

auto read_rows(duckdb_result& result, std::span<const DuckFieldDesc> sample_fields)
    -> std::vector<std::vector<VarTypes>> {
  std::vector<std::vector<VarTypes>> results;
  if (duckdb_column_count(&result) != sample_fields.size()) {
    throw std::runtime_error("Column count mismatch in select query");
  }
  idx_t row_count = duckdb_row_count(&result);
  results.resize(row_count);
  for (idx_t i = 0; i < row_count; ++i) {
    results[i].reserve(sample_fields.size());
    for (idx_t j = 0; j < sample_fields.size(); ++j) {
      switch (sample_fields[j].type) {
        case DuckDBType::INT32:
          results[i].emplace_back(duckdb_value_int32(&result, j, i));
          break;
        case DuckDBType::INT64:
          results[i].emplace_back(duckdb_value_int64(&result, j, i));
          break;
        case DuckDBType::UINT32:
          results[i].emplace_back(duckdb_value_uint32(&result, j, i));
          break;
        case DuckDBType::DOUBLE:
          results[i].emplace_back(duckdb_value_double(&result, j, i));
          break;
        case DuckDBType::BOOLEAN:
          results[i].emplace_back(duckdb_value_boolean(&result, j, i));
          break;
        case DuckDBType::VARCHAR:
        case DuckDBType::JSON: {
          if (duckdb_value_is_null(&result, j, i)) {
            results[i].emplace_back(std::unique_ptr<std::string>{});
            break;
          }
          char* value = duckdb_value_varchar(&result, j, i);
          results[i].emplace_back(std::make_unique<std::string>(value ? value : ""));
          duckdb_free(value);
          break;
        }
        default:
          throw std::runtime_error("Unsupported DuckFieldType in select()");
      }
    }
  }
  return results;
}
}  // namespace

duckdb_state insert(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields) {
  std::ostringstream sql;
  sql << "INSERT INTO " << table << " (" << column_list(fields) << ") VALUES (";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << "?";
    if (i < fields.size() - 1) {
      sql << ", ";
    }
  }
  sql << ");";

  PreparedStatement insert_pre(conn, sql.str());
  for (size_t i = 0; i < fields.size(); ++i) {
    bind_field(insert_pre.stmt_, i + 1, obj, fields[i]);
  }
  insert_pre.Execute();
  return DuckDBSuccess;
}

duckdb_state upsert(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields,
                    std::span<const char* const>   conflict_columns) {
  auto is_conflict_column = [&conflict_columns](const char* name) {
    for (const char* col : conflict_columns) {
      if (std::string(col) == name) return true;
    }
    return false;
  };

  std::ostringstream sql;
  sql << "INSERT INTO " << table << " (" << column_list(fields) << ") VALUES (";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << "?";
    if (i < fields.size() - 1) {
      sql << ", ";
    }
  }
  sql << ") ON CONFLICT (";
  for (size_t i = 0; i < conflict_columns.size(); ++i) {
    sql << conflict_columns[i];
    if (i < conflict_columns.size() - 1) {
      sql << ", ";
    }
  }
  sql << ") DO ";

  std::ostringstream set_clause;
  bool               first = true;
  for (const auto& field : fields) {
    // Indexed columns can not be reassigned by DO UPDATE
    if (is_conflict_column(field.name) || std::string(field.name) == "id") continue;
    if (!first) set_clause << ", ";
    set_clause << field.name << " = excluded." << field.name;
    first = false;
  }
  if (first) {
    sql << "NOTHING;";
  } else {
    sql << "UPDATE SET " << set_clause.str() << ";";
  }

  PreparedStatement upsert_pre(conn, sql.str());
  for (size_t i = 0; i < fields.size(); ++i) {
    bind_field(upsert_pre.stmt_, i + 1, obj, fields[i]);
  }
  upsert_pre.Execute();
  return DuckDBSuccess;
}

duckdb_state update(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields, const char* where_clause,
                    const BindList& params) {
  std::ostringstream sql;
  sql << "UPDATE " << table << " SET ";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << fields[i].name << " = ?";
    if (i < fields.size() - 1) {
      sql << ", ";
    }
  }
  sql << " WHERE " << where_clause << ";";

  PreparedStatement update_pre(conn, sql.str());
  for (size_t i = 0; i < fields.size(); ++i) {
    bind_field(update_pre.stmt_, i + 1, obj, fields[i]);
  }
  bind_list(update_pre.stmt_, fields.size() + 1, params);
  update_pre.Execute();
  return DuckDBSuccess;
}

auto remove(duckdb_connection& conn, const char* table, const char* where_clause,
            const BindList& params) -> int64_t {
  std::ostringstream sql;
  sql << "DELETE FROM " << table << " WHERE " << where_clause << ";";
  return execute(conn, sql.str(), params);
}

std::vector<std::vector<VarTypes>> select(duckdb_connection& conn, const std::string& table,
                                          std::span<const DuckFieldDesc> sample_fields,
                                          const char* where_clause, const BindList& params) {
  std::ostringstream sql;
  sql << "SELECT " << column_list(sample_fields) << " FROM " << table << " WHERE "
      << where_clause << ";";
  return select_by_query(conn, sample_fields, sql.str(), params);
}

std::vector<std::vector<VarTypes>> select_by_query(duckdb_connection&             conn,
                                                   std::span<const DuckFieldDesc> sample_fields,
                                                   const std::string& sql, const BindList& params) {
  PreparedStatement select_pre(conn, sql);
  bind_list(select_pre.stmt_, 1, params);
  select_pre.Execute();
  return read_rows(select_pre.result_, sample_fields);
}

auto execute(duckdb_connection& conn, const std::string& sql, const BindList& params)
    -> int64_t {
  PreparedStatement exec_pre(conn, sql);
  bind_list(exec_pre.stmt_, 1, params);
  exec_pre.Execute();
  return static_cast<int64_t>(duckdb_rows_changed(&exec_pre.result_));
}

auto query_int64(duckdb_connection& conn, const std::string& sql, const BindList& params)
    -> std::optional<int64_t> {
  PreparedStatement query_pre(conn, sql);
  bind_list(query_pre.stmt_, 1, params);
  query_pre.Execute();
  if (duckdb_row_count(&query_pre.result_) == 0 || duckdb_column_count(&query_pre.result_) == 0 ||
      duckdb_value_is_null(&query_pre.result_, 0, 0)) {
    return std::nullopt;
  }
  return duckdb_value_int64(&query_pre.result_, 0, 0);
}
}  // namespace duckorm
