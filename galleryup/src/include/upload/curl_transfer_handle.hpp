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

#include <curl/curl.h>

#include "upload/transfer_handle.hpp"

namespace galleryup {
/**
 * @brief TransferHandle over a libcurl easy handle with an in-memory cookie engine.
 */
class CurlTransferHandle final : public TransferHandle {
 public:
  CurlTransferHandle();
  ~CurlTransferHandle() override;

  CurlTransferHandle(const CurlTransferHandle&)            = delete;
  CurlTransferHandle& operator=(const CurlTransferHandle&) = delete;

  auto        Perform(const TransferRequest& request) -> TransferResponse override;
  void        Reset() override;
  void        ClearSession() override;

  static auto Factory() -> TransferHandleFactory;

 private:
  CURL* curl_ = nullptr;
};
};  // namespace galleryup
