#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <exiv2/exiv2.hpp>
#include <filesystem>
#include <functional>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <string>
#include <thread>

#include "config/app_config.hpp"
#include "queue/queue_manager.hpp"
#include "utils/clock/time_provider.hpp"

namespace galleryup {
class QueueManagerTests : public ::testing::Test {
 protected:
  std::filesystem::path root_;
  std::filesystem::path db_path_;
  AppConfig             config_;

  void                  SetUp() override {
    TimeProvider::Refresh();
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_    = std::filesystem::temp_directory_path() /
            (std::string("galleryup_queue_") + info->name());
    db_path_ = root_ / "queue.duckdb";
    std::filesystem::remove_all(root_);
    std::filesystem::create_directories(root_);

    config_.queue_.persist_debounce_ms_  = 20;
    config_.queue_.auto_start_upload_    = false;
    config_.upload_.batch_size_          = 2;
    config_.upload_.max_retries_         = 1;
    config_.upload_.retry_backoff_ms_    = 0;
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  auto MakeFolder(const std::string& name, size_t count) -> std::string {
    auto folder = root_ / name;
    std::filesystem::create_directories(folder);
    cv::Mat pixels(12, 16, CV_8UC3, cv::Scalar(90, 60, 30));
    for (size_t i = 1; i <= count; ++i) {
      auto file = folder / ("img" + std::to_string(i) + ".jpg");
      EXPECT_TRUE(cv::imwrite(file.string(), pixels)) << file;
    }
    return folder.string();
  }

  static auto WaitFor(const std::function<bool()>& condition,
                      std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (condition()) return true;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
  }

  static auto WaitForStatus(QueueManager& manager, const std::string& path, GalleryStatus status)
      -> bool {
    return WaitFor([&]() {
      auto item = manager.GetItem(path);
      return item.has_value() && item->status_ == status;
    });
  }

  static auto Success(const std::string& file_name, const std::string& gallery_id)
      -> UploadSuccess {
    UploadSuccess success;
    success.file_name_           = file_name;
    success.gallery_id_          = gallery_id;
    success.record_.file_name_   = file_name;
    success.record_.size_bytes_  = 100;
    success.record_.url_         = "https://imx.to/i/" + file_name;
    return success;
  }
};
}  // namespace galleryup
