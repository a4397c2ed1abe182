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

#include "upload/artifact_writer.hpp"

#include <fstream>
#include <stdexcept>

namespace galleryup {
namespace {
void WriteJson(const std::filesystem::path& dir, const std::string& file_name,
               const nlohmann::json& payload) {
  std::filesystem::create_directories(dir);
  const auto    target = dir / file_name;
  std::ofstream file(target, std::ios::trunc);
  if (!file.is_open()) {
    throw std::runtime_error("ArtifactWriter: cannot write " + target.string());
  }
  file << payload.dump(2);
}
}  // namespace

JsonArtifactWriter::JsonArtifactWriter(std::optional<std::filesystem::path> central_dir)
    : central_dir_(std::move(central_dir)) {}

auto JsonArtifactWriter::ArtifactFileName(const std::string& gallery_name,
                                          const remote_id_t& gallery_id) -> std::string {
  return SanitizeGalleryName(gallery_name) + "_" + gallery_id + ".json";
}

void JsonArtifactWriter::Write(const GalleryItem& item, const UploadResult& result) {
  last_written_.clear();
  if (result.gallery_id_.empty()) return;

  const std::string name = result.gallery_name_.empty() ? item.name_ : result.gallery_name_;
  nlohmann::json    payload = UploadResultToJson(result);
  payload["meta"]["template_name"] = item.template_name_;
  if (!item.custom_fields_.empty()) payload["custom_fields"] = item.custom_fields_;

  const std::string file_name = ArtifactFileName(name, result.gallery_id_);
  const auto        uploaded  = std::filesystem::path(item.path_) / ".uploaded";
  WriteJson(uploaded, file_name, payload);
  last_written_.push_back(uploaded / file_name);

  if (central_dir_.has_value()) {
    WriteJson(*central_dir_, file_name, payload);
    last_written_.push_back(*central_dir_ / file_name);
  }
}
};  // namespace galleryup
