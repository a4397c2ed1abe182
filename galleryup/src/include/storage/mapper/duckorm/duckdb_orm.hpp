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

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "duckdb_types.hpp"

namespace duckorm {
duckdb_state insert(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields);

/**
 * @brief INSERT ... ON CONFLICT (conflict_columns) DO UPDATE SET every other column. Key columns
 *        keep their stored values.
 */
duckdb_state upsert(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields,
                    std::span<const char* const>   conflict_columns);

duckdb_state update(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields, const char* where_clause,
                    const BindList& params);

/**
 * @brief Returns the number of deleted rows.
 */
auto remove(duckdb_connection& conn, const char* table, const char* where_clause,
            const BindList& params) -> int64_t;

std::vector<std::vector<VarTypes>> select(duckdb_connection& conn, const std::string& table,
                                          std::span<const DuckFieldDesc> sample_fields,
                                          const char* where_clause, const BindList& params);

/**
 * @brief Run a full query whose result columns line up with sample_fields.
 */
std::vector<std::vector<VarTypes>> select_by_query(duckdb_connection&             conn,
                                                   std::span<const DuckFieldDesc> sample_fields,
                                                   const std::string& sql, const BindList& params);

/**
 * @brief Run a statement without result rows. Returns the number of changed rows.
 */
auto execute(duckdb_connection& conn, const std::string& sql, const BindList& params = {})
    -> int64_t;

/**
 * @brief First column of the first row as an integer, nullopt when there is no row or it is NULL.
 */
auto query_int64(duckdb_connection& conn, const std::string& sql, const BindList& params = {})
    -> std::optional<int64_t>;
}  // namespace duckorm
