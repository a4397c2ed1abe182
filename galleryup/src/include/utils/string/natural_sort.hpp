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

#include <string>
#include <string_view>
#include <vector>

namespace galleryup {
namespace natural {
/**
 * @brief Explorer-style ordering: digit runs compare by value, everything else case-insensitively.
 *        "img2.jpg" sorts before "img10.jpg".
 */
auto Less(std::string_view lhs, std::string_view rhs) -> bool;

void Sort(std::vector<std::string>& names);
};  // namespace natural
};  // namespace galleryup
