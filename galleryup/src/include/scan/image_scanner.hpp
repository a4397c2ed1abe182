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
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config/app_config.hpp"
#include "gallery/gallery_item.hpp"
#include "type/type.hpp"

namespace galleryup {
enum class ScanErrorCode : uint8_t {
  OK = 0,
  PATH_NOT_FOUND,
  NOT_A_DIRECTORY,
  NO_IMAGES,
  INVALID_FILES,
  IO_ERROR,
};

struct ScanOutcome {
  ScanErrorCode            code_ = ScanErrorCode::OK;
  std::string              message_{};

  // Natural filename order
  std::vector<file_name_t> files_{};
  uint32_t                 total_images_ = 0;
  int64_t                  total_size_   = 0;
  DimensionStats           dimensions_{};
  std::vector<FailedFile>  failed_files_{};

  auto                     Ok() const -> bool { return code_ == ScanErrorCode::OK; }
};

struct PixelSize {
  uint32_t width_  = 0;
  uint32_t height_ = 0;
};

/**
 * @brief Verifies a folder of images and computes the size and dimension aggregates of a
 *        gallery. Stateless apart from its configuration; safe to share between threads.
 */
class ImageScanner {
 public:
  explicit ImageScanner(ScanConfig config);

  auto        Scan(const std::filesystem::path& folder) const -> ScanOutcome;

  /**
   * @brief Supported image files directly inside folder, in natural filename order.
   */
  static auto EnumerateImages(const std::filesystem::path& folder) -> std::vector<file_name_t>;

  /**
   * @brief Check that a file is a readable image.
   *
   * @return the failure reason, or nullopt when the file is valid
   */
  auto        ValidateFile(const std::filesystem::path& file) const -> std::optional<std::string>;

  /**
   * @brief Pixel size from the image header, decoding the file when the header has none.
   */
  static auto ReadDimensions(const std::filesystem::path& file) -> std::optional<PixelSize>;

  /**
   * @brief Indices of the files whose dimensions feed the aggregates, ascending.
   *
   * @param areas pixel area per file, only consulted for small-image exclusion
   */
  static auto SampleIndices(const std::vector<file_name_t>& files, const ScanConfig& config,
                            const std::vector<uint64_t>& areas = {}) -> std::vector<size_t>;

  static auto ComputeStats(const std::vector<PixelSize>& sizes, bool exclude_outliers,
                           bool use_median) -> DimensionStats;

 private:
  ScanConfig config_;
};
};  // namespace galleryup
