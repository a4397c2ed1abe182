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

#include <cstdint>
#include <optional>
#include <string>

#include "type/type.hpp"

namespace galleryup {
constexpr const char* kMainTabName    = "Main";
constexpr const char* kArchiveTabName = "Archive";

enum class TabType : uint8_t { SYSTEM = 0, USER = 1 };

struct Tab {
  tab_id_t    id_            = 0;
  std::string name_{};
  TabType     type_          = TabType::USER;
  int32_t     display_order_ = 0;
  std::string color_hint_{};
  epoch_ts_t  created_ts_    = 0;
  epoch_ts_t  updated_ts_    = 0;
  bool        is_active_     = true;

  auto        IsSystem() const -> bool { return type_ == TabType::SYSTEM; }
};

struct TabUpdate {
  std::optional<std::string> name_{};
  std::optional<int32_t>     display_order_{};
  std::optional<std::string> color_hint_{};
};
};  // namespace galleryup
