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

#include "storage/mapper/rename/pending_rename_mapper.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace galleryup {
auto PendingRenameMapper::FromRawData(std::vector<duckorm::VarTypes>&& data)
    -> PendingRenameMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for PendingRename");
  }
  using Str = std::unique_ptr<std::string>;
  return {Take<Str>(data, 0), Take<Str>(data, 1), Take<int64_t>(data, 2)};
}
};  // namespace galleryup
