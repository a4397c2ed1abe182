#pragma once

#include <gtest/gtest.h>

#include <exiv2/exiv2.hpp>
#include <filesystem>
#include <memory>
#include <mutex>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <string>
#include <vector>

#include "config/app_config.hpp"
#include "fake_transfer_handle.hpp"
#include "upload/upload_types.hpp"
#include "utils/clock/time_provider.hpp"

namespace galleryup {
class UploadTests : public ::testing::Test {
 protected:
  std::filesystem::path          root_;
  std::shared_ptr<FakeImageHost> host_;
  UploadConfig                   config_;

  void                           SetUp() override {
    TimeProvider::Refresh();
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_ = std::filesystem::temp_directory_path() /
            (std::string("galleryup_upload_") + info->name());
    std::filesystem::remove_all(root_);
    std::filesystem::create_directories(root_);

    host_                            = std::make_shared<FakeImageHost>();
    config_.api_key_                 = "test-key";
    config_.web_base_url_            = "https://imx.to";
    config_.batch_size_              = 4;
    config_.max_retries_             = 3;
    config_.retry_backoff_ms_        = 0;
    config_.named_gallery_creation_  = true;
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  /**
   * @brief Folder with img1.jpg .. img<count>.jpg, 8x6 pixels each.
   */
  auto MakeFolder(const std::string& name, size_t count) -> std::filesystem::path {
    auto folder = root_ / name;
    std::filesystem::create_directories(folder);
    cv::Mat pixels(6, 8, CV_8UC3, cv::Scalar(10, 20, 30));
    for (size_t i = 1; i <= count; ++i) {
      auto file = folder / ("img" + std::to_string(i) + ".jpg");
      EXPECT_TRUE(cv::imwrite(file.string(), pixels)) << file;
    }
    return folder;
  }

  static auto Names(const std::vector<ImageRecord>& images) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& image : images) names.push_back(image.file_name_);
    return names;
  }

  static auto Numbered(size_t from, size_t to) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (size_t i = from; i <= to; ++i) names.push_back("img" + std::to_string(i) + ".jpg");
    return names;
  }
};

/**
 * @brief Thread-safe event recorder for the engine's sink.
 */
class EventLog {
 public:
  auto Sink() -> EventSink {
    return [this](const UploadEvent& event) {
      std::lock_guard<std::mutex> lock(mtx_);
      events_.push_back(event);
    };
  }

  template <typename E>
  auto All() -> std::vector<E> {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<E>              result;
    for (const auto& event : events_) {
      if (const auto* e = std::get_if<E>(&event)) result.push_back(*e);
    }
    return result;
  }

 private:
  std::mutex               mtx_;
  std::vector<UploadEvent> events_;
};
}  // namespace galleryup
