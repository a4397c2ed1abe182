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

#include "storage/service/rename/pending_rename_service.hpp"

#include <memory>
#include <string>
#include <vector>

namespace galleryup {
auto PendingRenameService::ToParams(const PendingRename& source) -> PendingRenameMapperParams {
  return {std::make_unique<std::string>(source.gallery_id_),
          std::make_unique<std::string>(source.intended_name_), source.discovered_ts_};
}

auto PendingRenameService::FromParams(PendingRenameMapperParams&& param) -> PendingRename {
  return {param.gallery_id ? std::move(*param.gallery_id) : std::string{},
          param.intended_name ? std::move(*param.intended_name) : std::string{},
          param.discovered_ts};
}

auto PendingRenameService::GetAll() -> std::vector<PendingRename> {
  return GetByPredicate("TRUE ORDER BY discovered_ts, gallery_id");
}
};  // namespace galleryup
