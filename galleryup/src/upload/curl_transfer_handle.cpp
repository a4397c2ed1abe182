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

#include "upload/curl_transfer_handle.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <string>

namespace galleryup {
namespace {
std::once_flag curl_init_flag;

auto WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

auto ReportProgress(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                    curl_off_t ultotal, curl_off_t ulnow) -> int {
  const auto* request = static_cast<const TransferRequest*>(clientp);
  if (request->on_progress_) {
    request->on_progress_(static_cast<int64_t>(ulnow), static_cast<int64_t>(ultotal));
  }
  return 0;
}

auto Classify(CURLcode code) -> TransferStatus {
  switch (code) {
    case CURLE_OK:
      return TransferStatus::OK;
    case CURLE_OPERATION_TIMEDOUT:
      return TransferStatus::TIMEOUT;
    case CURLE_COULDNT_CONNECT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
      return TransferStatus::CONNECT_FAILED;
    default:
      return TransferStatus::NETWORK_ERROR;
  }
}

auto UrlEncodeForm(CURL* curl, const std::vector<FormPart>& form) -> std::string {
  std::string encoded;
  for (const auto& part : form) {
    if (!encoded.empty()) encoded += '&';
    char* name  = curl_easy_escape(curl, part.name_.c_str(), static_cast<int>(part.name_.size()));
    char* value =
        curl_easy_escape(curl, part.value_.c_str(), static_cast<int>(part.value_.size()));
    encoded += name ? name : "";
    encoded += '=';
    encoded += value ? value : "";
    curl_free(name);
    curl_free(value);
  }
  return encoded;
}
}  // namespace

CurlTransferHandle::CurlTransferHandle() {
  std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  curl_ = curl_easy_init();
  if (!curl_) {
    throw std::runtime_error("CurlTransferHandle: curl_easy_init failed");
  }
  // Empty file name only switches the cookie engine on
  curl_easy_setopt(curl_, CURLOPT_COOKIEFILE, "");
}

CurlTransferHandle::~CurlTransferHandle() {
  if (curl_) curl_easy_cleanup(curl_);
}

auto CurlTransferHandle::Perform(const TransferRequest& request) -> TransferResponse {
  TransferResponse response;

  curl_easy_setopt(curl_, CURLOPT_URL, request.url_.c_str());
  curl_easy_setopt(curl_, CURLOPT_COOKIEFILE, "");
  curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
  if (!request.user_agent_.empty()) {
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, request.user_agent_.c_str());
  }
  curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout_ms_));
  // Read timeout: abort when less than one byte per second moves for that long
  curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_TIME,
                   std::max(1L, static_cast<long>((request.read_timeout_ms_ + 999) / 1000)));

  curl_slist* headers = nullptr;
  for (const auto& [name, value] : request.headers_) {
    headers = curl_slist_append(headers, (name + ": " + value).c_str());
  }
  if (headers) curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

  curl_mime* mime = nullptr;
  if (request.multipart_) {
    mime = curl_mime_init(curl_);
    for (const auto& part : request.form_) {
      curl_mimepart* field = curl_mime_addpart(mime);
      curl_mime_name(field, part.name_.c_str());
      if (!part.file_.empty()) {
        curl_mime_filedata(field, part.file_.string().c_str());
      } else {
        curl_mime_data(field, part.value_.c_str(), CURL_ZERO_TERMINATED);
      }
    }
    curl_easy_setopt(curl_, CURLOPT_MIMEPOST, mime);
  } else {
    const std::string encoded = UrlEncodeForm(curl_, request.form_);
    curl_easy_setopt(curl_, CURLOPT_COPYPOSTFIELDS, encoded.c_str());
  }

  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, WriteBody);
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body_);
  curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, ReportProgress);
  curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &request);

  CURLcode code     = curl_easy_perform(curl_);
  response.status_  = Classify(code);
  if (code != CURLE_OK) {
    response.error_ = curl_easy_strerror(code);
  }
  curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.http_code_);
  char* effective_url = nullptr;
  if (curl_easy_getinfo(curl_, CURLINFO_EFFECTIVE_URL, &effective_url) == CURLE_OK &&
      effective_url) {
    response.effective_url_ = effective_url;
  }

  // Options point at locals; detach before they go away
  curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, nullptr);
  curl_easy_setopt(curl_, CURLOPT_MIMEPOST, nullptr);
  curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, nullptr);
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, nullptr);
  if (mime) curl_mime_free(mime);
  if (headers) curl_slist_free_all(headers);
  return response;
}

void CurlTransferHandle::Reset() { curl_easy_reset(curl_); }

void CurlTransferHandle::ClearSession() { curl_easy_setopt(curl_, CURLOPT_COOKIELIST, "ALL"); }

auto CurlTransferHandle::Factory() -> TransferHandleFactory {
  return []() -> std::unique_ptr<TransferHandle> { return std::make_unique<CurlTransferHandle>(); };
}
};  // namespace galleryup
