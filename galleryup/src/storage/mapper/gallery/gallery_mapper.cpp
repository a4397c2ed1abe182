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

#include "storage/mapper/gallery/gallery_mapper.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace galleryup {
using Str = std::unique_ptr<std::string>;

auto GalleryMapper::FromRawData(std::vector<duckorm::VarTypes>&& data) -> GalleryMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for Gallery");
  }
  GalleryMapperParams p;
  p.id              = Take<int64_t>(data, 0);
  p.path            = Take<Str>(data, 1);
  p.name            = Take<Str>(data, 2);
  p.status          = Take<Str>(data, 3);
  p.template_name   = Take<Str>(data, 4);
  p.added_ts        = Take<int64_t>(data, 5);
  p.finished_ts     = Take<int64_t>(data, 6);
  p.total_images    = Take<int64_t>(data, 7);
  p.uploaded_images = Take<int64_t>(data, 8);
  p.total_size      = Take<int64_t>(data, 9);
  p.uploaded_bytes  = Take<int64_t>(data, 10);
  p.scan_complete   = Take<bool>(data, 11);
  p.avg_width       = Take<double>(data, 12);
  p.avg_height      = Take<double>(data, 13);
  p.min_width       = Take<double>(data, 14);
  p.min_height      = Take<double>(data, 15);
  p.max_width       = Take<double>(data, 16);
  p.max_height      = Take<double>(data, 17);
  p.final_kibps     = Take<double>(data, 18);
  p.gallery_id      = Take<Str>(data, 19);
  p.gallery_url     = Take<Str>(data, 20);
  p.insertion_order = Take<int64_t>(data, 21);
  p.failed_files    = Take<Str>(data, 22);
  p.tab_id          = Take<int64_t>(data, 23);
  p.error_message   = Take<Str>(data, 24);
  p.custom_fields   = Take<Str>(data, 25);
  return p;
}

auto ImageRecordMapper::FromRawData(std::vector<duckorm::VarTypes>&& data)
    -> ImageRecordMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for Image");
  }
  return {Take<int64_t>(data, 0), Take<Str>(data, 1),     Take<int64_t>(data, 2),
          Take<int64_t>(data, 3), Take<int64_t>(data, 4), Take<int64_t>(data, 5),
          Take<int64_t>(data, 6), Take<Str>(data, 7),     Take<Str>(data, 8)};
}
};  // namespace galleryup
