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
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "config/app_config.hpp"
#include "type/type.hpp"
#include "upload/transfer_handle.hpp"
#include "upload/upload_types.hpp"

namespace galleryup {
/**
 * @brief Speaks the remote host's protocol over a leased TransferHandle: one multipart POST per
 *        image, and the web form that creates a named gallery.
 */
class GalleryApiClient {
 public:
  explicit GalleryApiClient(UploadConfig config);

  /**
   * @brief Use a logged-in web session (a Cookie header value) for named gallery creation.
   */
  void SetWebSession(std::string cookie_header);
  auto HasWebSession() const -> bool;

  /**
   * @brief Upload one file. An empty gallery_id asks the host to create a new gallery.
   */
  auto UploadImage(TransferHandle& handle, const std::filesystem::path& file,
                   const remote_id_t&                           gallery_id,
                   const std::function<void(int64_t, int64_t)>& on_progress) const -> ImageOutcome;

  /**
   * @brief Create a gallery with a display name through the web session.
   *
   * @return the new gallery id, nullopt when the host did not redirect to the gallery page
   */
  auto CreateNamedGallery(TransferHandle& handle, const std::string& name) const
      -> std::optional<remote_id_t>;

  auto GalleryUrl(const remote_id_t& gallery_id) const -> std::string;
  auto Config() const -> const UploadConfig& { return config_; }

  /**
   * @brief Turn the host's JSON reply into an outcome for file_name.
   */
  static auto ParseUploadReply(const TransferResponse& response, const file_name_t& file_name,
                               int64_t size_bytes, const std::string& web_base_url)
      -> ImageOutcome;

 private:
  auto               BaseRequest(const std::string& url) const -> TransferRequest;

  UploadConfig       config_;
  mutable std::mutex session_mtx_;
  std::string        web_session_{};
};
};  // namespace galleryup
