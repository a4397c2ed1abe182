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

#include <vector>

#include "gallery/side_records.hpp"
#include "storage/mapper/rename/pending_rename_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace galleryup {
class PendingRenameService
    : public ServiceInterface<PendingRenameService, PendingRename, PendingRenameMapperParams,
                              PendingRenameMapper, remote_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const PendingRename& source) -> PendingRenameMapperParams;
  static auto FromParams(PendingRenameMapperParams&& param) -> PendingRename;

  auto        GetAll() -> std::vector<PendingRename>;
};
};  // namespace galleryup
