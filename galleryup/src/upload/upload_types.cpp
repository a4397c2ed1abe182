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

#include "upload/upload_types.hpp"

#include <chrono>

#include "type/supported_file_type.hpp"
#include "utils/clock/time_provider.hpp"

namespace galleryup {
auto ErrorCodeToString(UploadErrorCode code) -> std::string_view {
  switch (code) {
    case UploadErrorCode::TIMEOUT:
      return "timeout";
    case UploadErrorCode::CONNECT_FAILED:
      return "connect_failed";
    case UploadErrorCode::NETWORK_ERROR:
      return "network_error";
    case UploadErrorCode::REMOTE_ERROR:
      return "remote_error";
    case UploadErrorCode::FILE_NOT_FOUND:
      return "file_not_found";
    case UploadErrorCode::CANCELED:
      return "canceled";
  }
  return "network_error";
}

auto DeriveThumbUrl(const std::string& image_url, const file_name_t& file_name,
                    const std::string& web_base_url) -> std::string {
  static constexpr std::string_view marker = "/i/";
  auto                              pos    = image_url.find(marker);
  if (pos == std::string::npos) return {};
  std::string rest = image_url.substr(pos + marker.size());
  std::string id   = rest.substr(0, rest.find('/'));
  if (id.empty()) return {};

  std::string ext = LowerExtension(file_name);
  if (ext.empty()) ext = ".jpg";
  return web_base_url + "/u/t/" + id + ext;
}

auto UploadResultToJson(const UploadResult& result) -> nlohmann::json {
  auto to_text = [](epoch_ts_t ts) {
    return TimeProvider::TimePointToString(
        std::chrono::system_clock::time_point(std::chrono::seconds(ts)));
  };

  nlohmann::json images = nlohmann::json::array();
  for (const auto& image : result.images_) {
    images.push_back({{"original_filename", image.file_name_},
                      {"image_url", image.url_},
                      {"thumb_url", image.thumb_url_},
                      {"width", image.width_},
                      {"height", image.height_},
                      {"size_bytes", image.size_bytes_}});
  }
  nlohmann::json failures = nlohmann::json::array();
  for (const auto& failure : result.failures_) {
    failures.push_back({{"filename", failure.file_name_},
                        {"failed_at", to_text(result.finished_at_)},
                        {"reason", failure.reason_}});
  }

  nlohmann::json j;
  j["meta"]     = {{"gallery_name", result.gallery_name_},
                   {"gallery_id", result.gallery_id_},
                   {"gallery_url", result.gallery_url_},
                   {"status", result.failures_.empty() ? "completed" : "completed_with_failures"},
                   {"started_at", to_text(result.started_at_)},
                   {"finished_at", to_text(result.finished_at_)}};
  j["settings"] = {{"thumbnail_size", result.thumbnail_size_},
                   {"thumbnail_format", result.thumbnail_format_},
                   {"public_gallery", result.public_gallery_},
                   {"template_name", result.template_name_},
                   {"parallel_batch_size", result.batch_size_}};
  j["stats"]    = {{"total_images", result.total_images_},
                   {"successful_count", result.successful_count_},
                   {"failed_count", result.failed_count_},
                   {"upload_time", result.upload_time_s_},
                   {"total_size", result.total_size_},
                   {"uploaded_size", result.uploaded_size_},
                   {"avg_width", result.dimensions_.avg_width_},
                   {"avg_height", result.dimensions_.avg_height_},
                   {"max_width", result.dimensions_.max_width_},
                   {"max_height", result.dimensions_.max_height_},
                   {"min_width", result.dimensions_.min_width_},
                   {"min_height", result.dimensions_.min_height_},
                   {"extension", result.dominant_extension_},
                   {"transfer_speed_kib_s", result.kibps_}};
  j["images"]   = std::move(images);
  j["failures"] = std::move(failures);
  return j;
}
};  // namespace galleryup
