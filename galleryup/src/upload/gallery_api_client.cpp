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

#include "upload/gallery_api_client.hpp"

#include <nlohmann/json.hpp>
#include <system_error>
#include <utility>

#include "utils/clock/time_provider.hpp"

namespace galleryup {
namespace {
constexpr size_t kReplyExcerpt = 200;

auto Excerpt(const std::string& body) -> std::string {
  if (body.size() <= kReplyExcerpt) return body;
  return body.substr(0, kReplyExcerpt) + "...";
}

auto FailureFromTransfer(const TransferResponse& response, const file_name_t& file_name)
    -> UploadFailure {
  UploadFailure failure{file_name, UploadErrorCode::NETWORK_ERROR, {}};
  switch (response.status_) {
    case TransferStatus::TIMEOUT:
      failure.code_ = UploadErrorCode::TIMEOUT;
      break;
    case TransferStatus::CONNECT_FAILED:
      failure.code_ = UploadErrorCode::CONNECT_FAILED;
      break;
    default:
      break;
  }
  failure.reason_ = "Network error: " + response.error_;
  return failure;
}

auto StringField(const nlohmann::json& data, const char* key) -> std::string {
  if (!data.contains(key)) return {};
  const auto& value = data.at(key);
  if (value.is_string()) return value.get<std::string>();
  if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
  return {};
}
}  // namespace

GalleryApiClient::GalleryApiClient(UploadConfig config) : config_(std::move(config)) {}

void GalleryApiClient::SetWebSession(std::string cookie_header) {
  std::lock_guard<std::mutex> lock(session_mtx_);
  web_session_ = std::move(cookie_header);
}

auto GalleryApiClient::HasWebSession() const -> bool {
  std::lock_guard<std::mutex> lock(session_mtx_);
  return !web_session_.empty();
}

auto GalleryApiClient::GalleryUrl(const remote_id_t& gallery_id) const -> std::string {
  return config_.web_base_url_ + "/g/" + gallery_id;
}

auto GalleryApiClient::BaseRequest(const std::string& url) const -> TransferRequest {
  TransferRequest request;
  request.url_                = url;
  request.user_agent_         = config_.user_agent_;
  request.connect_timeout_ms_ = config_.connect_timeout_ms_;
  request.read_timeout_ms_    = config_.read_timeout_ms_;
  return request;
}

auto GalleryApiClient::UploadImage(TransferHandle& handle, const std::filesystem::path& file,
                                   const remote_id_t&                           gallery_id,
                                   const std::function<void(int64_t, int64_t)>& on_progress) const
    -> ImageOutcome {
  const file_name_t file_name = file.filename().string();
  std::error_code   ec;
  const auto        size = std::filesystem::file_size(file, ec);
  if (ec) {
    return UploadFailure{file_name, UploadErrorCode::FILE_NOT_FOUND,
                         "File not readable: " + ec.message()};
  }

  TransferRequest request = BaseRequest(config_.api_endpoint_);
  request.headers_.emplace_back("X-API-Key", config_.api_key_);
  request.form_.push_back({"image", {}, file});
  if (gallery_id.empty()) {
    request.form_.push_back({"create_gallery", "true", {}});
  } else {
    request.form_.push_back({"gallery_id", gallery_id, {}});
  }
  request.form_.push_back({"format", "all", {}});
  request.form_.push_back({"thumbnail_size", std::to_string(config_.thumbnail_size_), {}});
  request.form_.push_back({"thumbnail_format", std::to_string(config_.thumbnail_format_), {}});
  request.on_progress_ = on_progress;

  TransferResponse response = handle.Perform(request);
  if (response.status_ != TransferStatus::OK) {
    return FailureFromTransfer(response, file_name);
  }
  return ParseUploadReply(response, file_name, static_cast<int64_t>(size), config_.web_base_url_);
}

auto GalleryApiClient::ParseUploadReply(const TransferResponse& response,
                                        const file_name_t& file_name, int64_t size_bytes,
                                        const std::string& web_base_url) -> ImageOutcome {
  nlohmann::json reply = nlohmann::json::parse(response.body_, nullptr, false);
  if (reply.is_discarded() || !reply.is_object() || !reply.contains("status") ||
      reply.at("status") != "success" || !reply.contains("data") ||
      !reply.at("data").is_object()) {
    return UploadFailure{file_name, UploadErrorCode::REMOTE_ERROR,
                         "API error (HTTP " + std::to_string(response.http_code_) +
                             "): " + Excerpt(response.body_)};
  }

  const auto&   data = reply.at("data");
  UploadSuccess success;
  success.file_name_           = file_name;
  success.gallery_id_          = StringField(data, "gallery_id");
  success.record_.file_name_   = file_name;
  success.record_.size_bytes_  = size_bytes;
  success.record_.uploaded_ts_ = TimeProvider::EpochSeconds();
  success.record_.url_         = StringField(data, "image_url");
  success.record_.thumb_url_   = StringField(data, "thumb_url");
  if (success.record_.thumb_url_.empty()) {
    success.record_.thumb_url_ = DeriveThumbUrl(success.record_.url_, file_name, web_base_url);
  }
  return success;
}

auto GalleryApiClient::CreateNamedGallery(TransferHandle& handle, const std::string& name) const
    -> std::optional<remote_id_t> {
  std::string session;
  {
    std::lock_guard<std::mutex> lock(session_mtx_);
    session = web_session_;
  }
  if (session.empty()) return std::nullopt;

  TransferRequest request = BaseRequest(config_.web_base_url_ + "/user/gallery/add");
  request.multipart_      = false;
  request.headers_.emplace_back("Cookie", session);
  request.form_.push_back({"gallery_name", name, {}});
  request.form_.push_back({"public_gallery", config_.public_gallery_ ? "1" : "0", {}});
  request.form_.push_back({"submit_new_gallery", "Add", {}});

  TransferResponse response = handle.Perform(request);
  if (response.status_ != TransferStatus::OK) return std::nullopt;

  static constexpr std::string_view marker = "gallery/manage?id=";
  auto                              pos    = response.effective_url_.find(marker);
  if (pos == std::string::npos) return std::nullopt;
  std::string id = response.effective_url_.substr(pos + marker.size());
  id             = id.substr(0, id.find_first_of("&#"));
  if (id.empty()) return std::nullopt;
  return id;
}
};  // namespace galleryup
