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

#include "storage/service/secondary/secondary_upload_service.hpp"

#include <memory>
#include <string>
#include <vector>

namespace galleryup {
namespace {
auto OptStr(const std::string& value) -> std::unique_ptr<std::string> {
  return value.empty() ? nullptr : std::make_unique<std::string>(value);
}
auto TakeStr(std::unique_ptr<std::string>& value) -> std::string {
  return value ? std::move(*value) : std::string{};
}
}  // namespace

auto SecondaryUploadService::ToParams(const StoredSecondaryUpload& source)
    -> SecondaryUploadMapperParams {
  const auto& r = source.record_;
  return {source.gallery_fk_,
          std::make_unique<std::string>(r.host_name_),
          std::make_unique<std::string>(std::string(SecondaryStatusToString(r.status_))),
          r.uploaded_bytes_,
          r.total_bytes_,
          OptStr(r.download_url_),
          OptStr(r.file_id_),
          OptStr(r.error_message_),
          r.created_ts_,
          r.finished_ts_};
}

auto SecondaryUploadService::FromParams(SecondaryUploadMapperParams&& param)
    -> StoredSecondaryUpload {
  StoredSecondaryUpload stored;
  stored.gallery_fk_     = param.gallery_fk;
  auto& r                = stored.record_;
  r.host_name_           = TakeStr(param.host_name);
  r.status_              = SecondaryStatusFromString(TakeStr(param.status))
                               .value_or(SecondaryUploadStatus::PENDING);
  r.uploaded_bytes_      = param.uploaded_bytes;
  r.total_bytes_         = param.total_bytes;
  r.download_url_        = TakeStr(param.download_url);
  r.file_id_             = TakeStr(param.file_id);
  r.error_message_       = TakeStr(param.error_message);
  r.created_ts_          = param.created_ts;
  r.finished_ts_         = param.finished_ts;
  return stored;
}

auto SecondaryUploadService::GetByGallery(store_id_t gallery_fk)
    -> std::vector<StoredSecondaryUpload> {
  return GetByPredicate("gallery_fk = ? ORDER BY host_name", {static_cast<int64_t>(gallery_fk)});
}

auto SecondaryUploadService::GetByHostAndStatus(const std::string&    host_name,
                                                SecondaryUploadStatus status)
    -> std::vector<StoredSecondaryUpload> {
  return GetByPredicate("host_name = ? AND status = ? ORDER BY created_ts, gallery_fk",
                        {host_name, std::string(SecondaryStatusToString(status))});
}
};  // namespace galleryup
