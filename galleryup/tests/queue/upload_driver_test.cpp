#include "queue/upload_driver.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "queue_test_fixation.hpp"
#include "upload/fake_transfer_handle.hpp"

namespace galleryup {
class UploadDriverTests : public QueueManagerTests {
 protected:
  std::shared_ptr<FakeImageHost> host_;

  void                           SetUp() override {
    QueueManagerTests::SetUp();
    host_                                 = std::make_shared<FakeImageHost>();
    config_.upload_.api_key_              = "test-key";
    config_.upload_.named_gallery_creation_ = false;
    config_.queue_.auto_start_upload_     = true;
  }
};

TEST_F(UploadDriverTests, StartedGalleryUploadsToCompletion) {
  GalleryStore       store(db_path_);
  QueueManager       manager(store, config_);
  UploadEngine       engine(config_.upload_, FakeTransferHandle::Factory(host_));
  JsonArtifactWriter writer;
  UploadDriver       driver(manager, engine, store, &writer);

  std::mutex         mtx;
  size_t             completed_events = 0;
  driver.SetEventSink([&](const UploadEvent& event) {
    if (std::holds_alternative<ImageCompleted>(event)) {
      std::lock_guard<std::mutex> lock(mtx);
      ++completed_events;
    }
  });
  driver.Start();
  EXPECT_TRUE(driver.Running());

  auto path = MakeFolder("drive", 5);
  manager.Add(path);
  ASSERT_TRUE(WaitForStatus(manager, path, GalleryStatus::COMPLETED));

  auto item = manager.GetItem(path);
  EXPECT_EQ(item->gallery_id_, "G1");
  EXPECT_EQ(item->uploaded_images_, 5u);
  EXPECT_EQ(item->uploaded_files_.size(), 5u);
  EXPECT_GT(item->finished_time_, 0);
  EXPECT_EQ(host_->RequestCount(), 5u);
  {
    std::lock_guard<std::mutex> lock(mtx);
    EXPECT_EQ(completed_events, 5u);
  }

  // The artifact is written once the result is applied
  const auto artifact = std::filesystem::path(path) / ".uploaded" /
                        JsonArtifactWriter::ArtifactFileName("drive", "G1");
  ASSERT_TRUE(WaitFor([&]() { return std::filesystem::exists(artifact); }));

  auto renames = store.GetPendingRenames();
  ASSERT_EQ(renames.size(), 1u);
  EXPECT_EQ(renames.front().gallery_id_, "G1");
  EXPECT_EQ(renames.front().intended_name_, "drive");

  driver.Stop();
  EXPECT_FALSE(driver.Running());
}

TEST_F(UploadDriverTests, TransientFailureRecoveredOnThirdPassCompletes) {
  config_.upload_.batch_size_  = 4;
  config_.upload_.max_retries_ = 3;
  host_->failures_before_success_["img3.jpg"] = 2;

  GalleryStore store(db_path_);
  QueueManager manager(store, config_);
  UploadEngine engine(config_.upload_, FakeTransferHandle::Factory(host_));
  UploadDriver driver(manager, engine, store, nullptr);

  std::mutex                   mtx;
  std::vector<GalleryFinished> finished;
  driver.SetEventSink([&](const UploadEvent& event) {
    if (const auto* done = std::get_if<GalleryFinished>(&event)) {
      std::lock_guard<std::mutex> lock(mtx);
      finished.push_back(*done);
    }
  });
  driver.Start();

  auto path = MakeFolder("ten", 10);
  manager.Add(path);
  ASSERT_TRUE(WaitForStatus(manager, path, GalleryStatus::COMPLETED));

  auto item = manager.GetItem(path);
  EXPECT_EQ(item->total_images_, 10u);
  EXPECT_EQ(item->uploaded_images_, 10u);
  EXPECT_TRUE(item->failed_files_.empty());
  EXPECT_TRUE(item->error_message_.empty());
  EXPECT_EQ(host_->Attempts("img3.jpg"), 3);
  EXPECT_EQ(host_->Attempts("img4.jpg"), 1);
  EXPECT_LE(host_->MaxInFlight(), 4);
  {
    std::lock_guard<std::mutex> lock(mtx);
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished.front().successful_, 10u);
    EXPECT_EQ(finished.front().failed_, 0u);
  }
}

TEST_F(UploadDriverTests, FailedFilesRetriedIntoSameGallery) {
  GalleryStore store(db_path_);
  QueueManager manager(store, config_);
  UploadEngine engine(config_.upload_, FakeTransferHandle::Factory(host_));
  UploadDriver driver(manager, engine, store, nullptr);
  host_->failures_before_success_["img2.jpg"] = -1;
  driver.Start();

  auto path = MakeFolder("flaky", 4);
  manager.Add(path);
  ASSERT_TRUE(WaitForStatus(manager, path, GalleryStatus::UPLOAD_FAILED));
  auto failed = manager.GetItem(path);
  ASSERT_EQ(failed->failed_files_.size(), 1u);
  EXPECT_EQ(failed->failed_files_.front().file_name_, "img2.jpg");
  EXPECT_EQ(failed->uploaded_images_, 3u);
  ASSERT_TRUE(WaitFor([&]() { return !manager.GetActivePath().has_value(); }));

  // The driver is idle: the host can be changed safely
  host_->failures_before_success_.clear();
  ASSERT_TRUE(manager.RetryFailedUpload(path));
  EXPECT_EQ(manager.GetItem(path)->status_, GalleryStatus::INCOMPLETE);
  ASSERT_TRUE(manager.StartItem(path));
  ASSERT_TRUE(WaitForStatus(manager, path, GalleryStatus::COMPLETED));

  EXPECT_EQ(manager.GetItem(path)->gallery_id_, "G1");
  EXPECT_EQ(host_->Attempts("img1.jpg"), 1);
  EXPECT_EQ(host_->Attempts("img3.jpg"), 1);
  // max_retries is 1: two attempts in the first run, one on resume
  EXPECT_EQ(host_->Attempts("img2.jpg"), 3);
}

TEST_F(UploadDriverTests, StopLeavesGalleryResumable) {
  host_->delay_ = std::chrono::milliseconds(60);
  GalleryStore store(db_path_);
  QueueManager manager(store, config_);
  UploadEngine engine(config_.upload_, FakeTransferHandle::Factory(host_));
  UploadDriver driver(manager, engine, store, nullptr);
  driver.Start();

  auto path = MakeFolder("long", 12);
  manager.Add(path);
  ASSERT_TRUE(WaitFor([&]() {
    auto item = manager.GetItem(path);
    return item.has_value() && item->uploaded_images_ >= 1;
  }));
  driver.Stop();

  auto item = manager.GetItem(path);
  EXPECT_EQ(item->status_, GalleryStatus::INCOMPLETE);
  EXPECT_EQ(item->gallery_id_, "G1");
  EXPECT_LT(item->uploaded_images_, 12u);
  EXPECT_FALSE(manager.GetActivePath().has_value());

  manager.Shutdown();
  auto persisted = store.LoadAll();
  ASSERT_EQ(persisted.size(), 1u);
  EXPECT_EQ(persisted.front().status_, GalleryStatus::INCOMPLETE);
  EXPECT_EQ(persisted.front().uploaded_images_, item->uploaded_images_);
}
}  // namespace galleryup
