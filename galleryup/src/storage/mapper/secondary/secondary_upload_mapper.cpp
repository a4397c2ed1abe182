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

#include "storage/mapper/secondary/secondary_upload_mapper.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace galleryup {
auto SecondaryUploadMapper::FromRawData(std::vector<duckorm::VarTypes>&& data)
    -> SecondaryUploadMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for SecondaryUpload");
  }
  using Str = std::unique_ptr<std::string>;
  return {Take<int64_t>(data, 0), Take<Str>(data, 1), Take<Str>(data, 2),
          Take<int64_t>(data, 3), Take<int64_t>(data, 4), Take<Str>(data, 5),
          Take<Str>(data, 6),     Take<Str>(data, 7), Take<int64_t>(data, 8),
          Take<int64_t>(data, 9)};
}
};  // namespace galleryup
