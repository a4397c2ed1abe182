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

#include <filesystem>
#include <optional>
#include <vector>

#include "gallery/gallery_item.hpp"
#include "upload/upload_types.hpp"

namespace galleryup {
/**
 * @brief Receives the result of every finished upload run.
 */
class ArtifactWriter {
 public:
  virtual ~ArtifactWriter()                                                  = default;
  virtual void Write(const GalleryItem& item, const UploadResult& result) = 0;
};

/**
 * @brief Writes "<name>_<gallery id>.json" into "<gallery folder>/.uploaded" and, when set, into
 *        a central directory.
 */
class JsonArtifactWriter final : public ArtifactWriter {
 public:
  explicit JsonArtifactWriter(std::optional<std::filesystem::path> central_dir = std::nullopt);

  void        Write(const GalleryItem& item, const UploadResult& result) override;

  auto        LastWritten() const -> const std::vector<std::filesystem::path>& {
    return last_written_;
  }

  static auto ArtifactFileName(const std::string& gallery_name, const remote_id_t& gallery_id)
      -> std::string;

 private:
  std::optional<std::filesystem::path> central_dir_;
  std::vector<std::filesystem::path>   last_written_;
};
};  // namespace galleryup
