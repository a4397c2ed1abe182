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

#include "gallery/gallery_item.hpp"

#include <cctype>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace galleryup {
auto FailedFilesToJson(const std::vector<FailedFile>& failed) -> std::string {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& entry : failed) {
    arr.push_back(nlohmann::json::array({entry.file_name_, entry.reason_}));
  }
  return arr.dump();
}

auto FailedFilesFromJson(const std::string& json_text) -> std::vector<FailedFile> {
  std::vector<FailedFile> result;
  if (json_text.empty()) {
    return result;
  }
  auto parsed = nlohmann::json::parse(json_text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_array()) {
    return result;
  }
  for (const auto& entry : parsed) {
    // Both [name, reason] pairs and {"file": .., "reason": ..} objects have been written
    if (entry.is_array() && entry.size() == 2 && entry[0].is_string()) {
      result.push_back({entry[0].get<std::string>(),
                        entry[1].is_string() ? entry[1].get<std::string>() : entry[1].dump()});
    } else if (entry.is_object() && entry.contains("file")) {
      result.push_back({entry.value("file", ""), entry.value("reason", "")});
    }
  }
  return result;
}

auto CustomFieldsToJson(const std::map<std::string, std::string>& fields) -> std::string {
  nlohmann::json obj = nlohmann::json::object();
  for (const auto& [key, value] : fields) {
    obj[key] = value;
  }
  return obj.dump();
}

auto CustomFieldsFromJson(const std::string& json_text) -> std::map<std::string, std::string> {
  std::map<std::string, std::string> result;
  if (json_text.empty()) {
    return result;
  }
  auto parsed = nlohmann::json::parse(json_text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return result;
  }
  for (const auto& [key, value] : parsed.items()) {
    result[key] = value.is_string() ? value.get<std::string>() : value.dump();
  }
  return result;
}

auto SanitizeGalleryName(const std::string& name) -> std::string {
  // Letters, digits, whitespace and , . - _ ( ) survive; runs of whitespace collapse to one space
  std::string result;
  bool        pending_space = false;
  for (char c : name) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc)) {
      pending_space = !result.empty();
      continue;
    }
    bool keep = (uc < 0x80 && std::isalnum(uc)) || c == ',' || c == '.' || c == '-' || c == '_' ||
                c == '(' || c == ')';
    if (!keep) continue;
    if (pending_space) {
      result.push_back(' ');
      pending_space = false;
    }
    result.push_back(c);
  }
  return result;
}
};  // namespace galleryup
