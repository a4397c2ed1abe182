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

#include "scan/image_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <exiv2/exiv2.hpp>
#include <iostream>
#include <numeric>
#include <opencv2/imgcodecs.hpp>
#include <set>
#include <system_error>

#include "type/supported_file_type.hpp"
#include "utils/string/natural_sort.hpp"

namespace galleryup {
namespace {
auto ToLower(std::string text) -> std::string {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// One pattern token against c: '?', a '[...]' class ('!' or '^' negates) or a literal
auto MatchToken(const std::string& pattern, size_t p, char c, size_t& next) -> bool {
  if (pattern[p] == '?') {
    next = p + 1;
    return true;
  }
  if (pattern[p] == '[') {
    size_t     i      = p + 1;
    const bool negate = i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^');
    if (negate) ++i;
    const size_t first   = i;
    bool         matched = false;
    while (i < pattern.size() && (pattern[i] != ']' || i == first)) {
      if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
        if (pattern[i] <= c && c <= pattern[i + 2]) matched = true;
        i += 3;
      } else {
        if (pattern[i] == c) matched = true;
        ++i;
      }
    }
    if (i < pattern.size()) {
      next = i + 1;
      return matched != negate;
    }
    // Unterminated class: '[' is a literal
  }
  next = p + 1;
  return pattern[p] == c;
}

auto GlobMatch(const std::string& pattern, const std::string& text) -> bool {
  size_t p      = 0;
  size_t t      = 0;
  size_t star_p = std::string::npos;
  size_t star_t = 0;
  while (t < text.size()) {
    if (p < pattern.size() && pattern[p] == '*') {
      star_p = ++p;
      star_t = t;
      continue;
    }
    size_t next = 0;
    if (p < pattern.size() && MatchToken(pattern, p, text[t], next)) {
      p = next;
      ++t;
      continue;
    }
    if (star_p == std::string::npos) return false;
    p = star_p;
    t = ++star_t;
  }
  while (p < pattern.size() && pattern[p] == '*') ++p;
  return p == pattern.size();
}

auto MatchesAnyPattern(const std::string& file_name, const std::vector<std::string>& patterns)
    -> bool {
  const std::string lowered = ToLower(file_name);
  for (const auto& pattern : patterns) {
    if (pattern.empty()) continue;
    if (GlobMatch(ToLower(pattern), lowered)) return true;
  }
  return false;
}

auto DropOutliers(const std::vector<double>& values) -> std::vector<double> {
  std::vector<double> sorted = values;
  std::sort(sorted.begin(), sorted.end());
  const double q1    = sorted[sorted.size() / 4];
  const double q3    = sorted[3 * sorted.size() / 4];
  const double iqr   = q3 - q1;
  const double lower = q1 - 1.5 * iqr;
  const double upper = q3 + 1.5 * iqr;

  std::vector<double> kept;
  std::copy_if(values.begin(), values.end(), std::back_inserter(kept),
               [&](double v) { return v >= lower && v <= upper; });
  return kept;
}

auto Central(std::vector<double> values, bool use_median) -> double {
  if (values.empty()) return 0.0;
  if (use_median) {
    std::sort(values.begin(), values.end());
    return values[values.size() / 2];
  }
  return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}
}  // namespace

ImageScanner::ImageScanner(ScanConfig config) : config_(std::move(config)) {}

auto ImageScanner::EnumerateImages(const std::filesystem::path& folder)
    -> std::vector<file_name_t> {
  std::vector<file_name_t> files;
  std::error_code          ec;
  for (const auto& entry : std::filesystem::directory_iterator(folder, ec)) {
    if (is_supported_file(entry.path())) {
      files.push_back(entry.path().filename().string());
    }
  }
  if (ec) {
    std::cerr << "ScanWorker: cannot list " << folder.string() << ": " << ec.message()
              << std::endl;
  }
  natural::Sort(files);
  return files;
}

auto ImageScanner::ValidateFile(const std::filesystem::path& file) const
    -> std::optional<std::string> {
  std::error_code ec;
  auto            size = std::filesystem::file_size(file, ec);
  if (ec) return "cannot read file: " + ec.message();
  if (size == 0) return "empty file";

  if (config_.deep_validation_ && cv::haveImageReader(file.string())) {
    cv::Mat decoded = cv::imread(file.string(), cv::IMREAD_UNCHANGED);
    if (decoded.empty()) return "image data could not be decoded";
    return std::nullopt;
  }

  try {
    Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(file.string());
    if (!image) return "unrecognized image format";
    image->readMetadata();
  } catch (const std::exception& e) {
    return std::string("invalid image header: ") + e.what();
  }
  return std::nullopt;
}

auto ImageScanner::ReadDimensions(const std::filesystem::path& file) -> std::optional<PixelSize> {
  try {
    Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(file.string());
    if (image) {
      image->readMetadata();
      if (image->pixelWidth() > 0 && image->pixelHeight() > 0) {
        return PixelSize{static_cast<uint32_t>(image->pixelWidth()),
                         static_cast<uint32_t>(image->pixelHeight())};
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "ScanWorker: header of " << file.filename().string()
              << " unreadable, decoding instead: " << e.what() << std::endl;
  }

  cv::Mat decoded = cv::imread(file.string(), cv::IMREAD_UNCHANGED);
  if (decoded.empty()) return std::nullopt;
  return PixelSize{static_cast<uint32_t>(decoded.cols), static_cast<uint32_t>(decoded.rows)};
}

auto ImageScanner::SampleIndices(const std::vector<file_name_t>& files, const ScanConfig& config,
                                 const std::vector<uint64_t>& areas) -> std::vector<size_t> {
  if (files.empty()) return {};

  const size_t     total = files.size();
  std::set<size_t> excluded;
  if (config.exclude_first_ && total > 1) excluded.insert(0);
  if (config.exclude_last_ && total > 1) excluded.insert(total - 1);

  if (!config.exclude_patterns_.empty()) {
    for (size_t i = 0; i < total; ++i) {
      if (MatchesAnyPattern(files[i], config.exclude_patterns_)) excluded.insert(i);
    }
  }

  if (config.exclude_small_images_ && areas.size() == total) {
    const uint64_t max_area = *std::max_element(areas.begin(), areas.end());
    if (max_area > 0) {
      const double min_area =
          static_cast<double>(max_area) * config.exclude_small_threshold_ / 100.0;
      for (size_t i = 0; i < total; ++i) {
        if (static_cast<double>(areas[i]) < min_area) excluded.insert(i);
      }
    }
  }

  std::vector<size_t> available;
  for (size_t i = 0; i < total; ++i) {
    if (excluded.count(i) == 0) available.push_back(i);
  }
  // Everything excluded: fall back to the middle file
  if (available.empty()) return {total / 2};

  size_t count = 0;
  if (config.sampling_method_ == SamplingMethod::FIXED) {
    count = std::min<size_t>(config.sampling_fixed_count_, available.size());
  } else {
    auto by_percentage = static_cast<size_t>(static_cast<double>(available.size()) *
                                             config.sampling_percentage_ / 100.0);
    count = std::min<size_t>(std::max<size_t>(1, by_percentage), available.size());
  }
  if (count >= available.size()) return available;

  // First and last of the available files, the rest spread evenly in between
  std::set<size_t> sampled = {available.front(), available.back()};
  if (count > 2) {
    const size_t remaining = count - 2;
    const double step =
        static_cast<double>(available.size() - 2) / static_cast<double>(remaining + 1);
    for (size_t i = 0; i < remaining; ++i) {
      sampled.insert(available[static_cast<size_t>(static_cast<double>(i + 1) * step)]);
    }
  }
  return {sampled.begin(), sampled.end()};
}

auto ImageScanner::ComputeStats(const std::vector<PixelSize>& sizes, bool exclude_outliers,
                                bool use_median) -> DimensionStats {
  DimensionStats stats;
  if (sizes.empty()) return stats;

  std::vector<double> widths;
  std::vector<double> heights;
  for (const auto& size : sizes) {
    widths.push_back(size.width_);
    heights.push_back(size.height_);
  }

  if (exclude_outliers && sizes.size() > 4) {
    stats.avg_width_  = Central(DropOutliers(widths), use_median);
    stats.avg_height_ = Central(DropOutliers(heights), use_median);
  } else {
    stats.avg_width_  = Central(widths, use_median);
    stats.avg_height_ = Central(heights, use_median);
  }
  stats.min_width_  = *std::min_element(widths.begin(), widths.end());
  stats.max_width_  = *std::max_element(widths.begin(), widths.end());
  stats.min_height_ = *std::min_element(heights.begin(), heights.end());
  stats.max_height_ = *std::max_element(heights.begin(), heights.end());
  return stats;
}

auto ImageScanner::Scan(const std::filesystem::path& folder) const -> ScanOutcome {
  ScanOutcome     outcome;
  std::error_code ec;
  if (!std::filesystem::exists(folder, ec)) {
    outcome.code_    = ScanErrorCode::PATH_NOT_FOUND;
    outcome.message_ = "Folder does not exist: " + folder.string();
    return outcome;
  }
  if (!std::filesystem::is_directory(folder, ec)) {
    outcome.code_    = ScanErrorCode::NOT_A_DIRECTORY;
    outcome.message_ = "Not a folder: " + folder.string();
    return outcome;
  }

  outcome.files_ = EnumerateImages(folder);
  if (outcome.files_.empty()) {
    outcome.code_    = ScanErrorCode::NO_IMAGES;
    outcome.message_ = "No images found in " + folder.string();
    return outcome;
  }
  outcome.total_images_ = static_cast<uint32_t>(outcome.files_.size());

  for (const auto& name : outcome.files_) {
    const auto file = folder / name;
    if (auto reason = ValidateFile(file)) {
      outcome.failed_files_.push_back({name, *reason});
      continue;
    }
    auto size = std::filesystem::file_size(file, ec);
    if (!ec) outcome.total_size_ += static_cast<int64_t>(size);
  }

  if (!outcome.failed_files_.empty()) {
    outcome.code_    = ScanErrorCode::INVALID_FILES;
    outcome.message_ = std::to_string(outcome.failed_files_.size()) + " invalid file(s): ";
    for (size_t i = 0; i < outcome.failed_files_.size(); ++i) {
      if (i > 0) outcome.message_ += ", ";
      outcome.message_ +=
          outcome.failed_files_[i].file_name_ + " (" + outcome.failed_files_[i].reason_ + ")";
    }
    return outcome;
  }

  std::vector<uint64_t> areas;
  if (config_.exclude_small_images_) {
    for (const auto& name : outcome.files_) {
      auto dims = ReadDimensions(folder / name);
      areas.push_back(dims ? static_cast<uint64_t>(dims->width_) * dims->height_ : 0);
    }
  }

  std::vector<PixelSize> sampled;
  for (size_t index : SampleIndices(outcome.files_, config_, areas)) {
    if (auto dims = ReadDimensions(folder / outcome.files_[index])) sampled.push_back(*dims);
  }
  outcome.dimensions_ =
      ComputeStats(sampled, config_.exclude_outliers_, config_.use_median_);
  return outcome;
}
};  // namespace galleryup
