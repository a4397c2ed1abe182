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
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace galleryup {
enum class TransferStatus : uint8_t { OK = 0, TIMEOUT, CONNECT_FAILED, NETWORK_ERROR };

struct FormPart {
  std::string           name_{};
  std::string           value_{};
  // Non-empty: the part carries this file instead of value_
  std::filesystem::path file_{};
};

struct TransferRequest {
  std::string                                      url_{};
  std::vector<std::pair<std::string, std::string>> headers_{};
  std::vector<FormPart>                            form_{};
  // false: form_ is sent url-encoded, files are not allowed
  bool                                             multipart_ = true;
  std::string                                      user_agent_{};
  uint32_t                                         connect_timeout_ms_ = 10000;
  uint32_t                                         read_timeout_ms_    = 30000;
  // (bytes sent, bytes to send) of the request body
  std::function<void(int64_t, int64_t)>            on_progress_{};
};

struct TransferResponse {
  TransferStatus status_    = TransferStatus::OK;
  long           http_code_ = 0;
  std::string    body_{};
  // Url after redirects
  std::string    effective_url_{};
  std::string    error_{};
};

/**
 * @brief A reusable low-level transfer handle. One handle serves one upload at a time; it keeps
 *        its connections between uploads.
 */
class TransferHandle {
 public:
  virtual ~TransferHandle()                                         = default;

  virtual auto Perform(const TransferRequest& request) -> TransferResponse = 0;
  /**
   * @brief Drop per-request options. Live connections and cookies survive.
   */
  virtual void Reset()                                              = 0;
  /**
   * @brief Forget all session state (cookies).
   */
  virtual void ClearSession()                                       = 0;
};

using TransferHandleFactory = std::function<std::unique_ptr<TransferHandle>()>;
};  // namespace galleryup
