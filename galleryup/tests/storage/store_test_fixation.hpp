#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "gallery/gallery_item.hpp"
#include "utils/clock/time_provider.hpp"

namespace galleryup {
class GalleryStoreTests : public ::testing::Test {
 protected:
  std::filesystem::path db_path_;

  void                  SetUp() override {
    TimeProvider::Refresh();
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    db_path_ = std::filesystem::temp_directory_path() /
               (std::string("galleryup_store_") + info->name() + ".duckdb");
    RemoveDbFiles();
  }

  void TearDown() override { RemoveDbFiles(); }

  void RemoveDbFiles() {
    std::error_code ec;
    std::filesystem::remove(db_path_, ec);
    std::filesystem::remove(db_path_.string() + ".wal", ec);
  }

  static auto MakeItem(const std::string& path, GalleryStatus status = GalleryStatus::READY)
      -> GalleryItem {
    GalleryItem item;
    item.path_            = path;
    item.name_            = std::filesystem::path(path).filename().string();
    item.status_          = status;
    item.added_time_      = 1700000000;
    item.total_images_    = 3;
    item.total_size_      = 3000;
    item.scan_complete_   = true;
    item.insertion_order_ = 1;
    return item;
  }

  static auto MakeRecord(const std::string& file_name, int64_t size) -> ImageRecord {
    ImageRecord record;
    record.file_name_   = file_name;
    record.size_bytes_  = size;
    record.width_       = 800;
    record.height_      = 600;
    record.uploaded_ts_ = 1700000100;
    record.url_         = "https://imx.to/i/" + file_name;
    record.thumb_url_   = "https://imx.to/u/t/" + file_name;
    return record;
  }
};
}  // namespace galleryup
