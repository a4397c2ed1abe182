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

#include <stdexcept>

namespace galleryup {
class StoreError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ConnectionGuard {
 public:
  duckdb_connection conn_;

  explicit ConnectionGuard(duckdb_connection conn);
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ConnectionGuard(const ConnectionGuard&)            = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
  ~ConnectionGuard();
};

/**
 * @brief Scoped transaction on a connection. Rolls back unless Commit() was reached.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(duckdb_connection& conn);
  TransactionGuard(const TransactionGuard&)            = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;
  ~TransactionGuard();

  void Commit();

 private:
  duckdb_connection& conn_;
  bool               open_ = false;
};
}  // namespace galleryup
