#include "upload/upload_engine.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "upload_test_fixation.hpp"

namespace galleryup {
TEST_F(UploadTests, UploadsEveryFileInEnumerationOrder) {
  auto                       folder = MakeFolder("Beach Trip", 10);
  UploadEngine               engine(config_, FakeTransferHandle::Factory(host_));
  EventLog                   log;
  std::vector<PendingRename> renames;
  engine.SetEventSink(log.Sink());
  engine.SetRenameSink([&](const PendingRename& rename) { renames.push_back(rename); });

  UploadRequest request;
  request.path_ = folder.string();
  UploadJob    job;
  UploadResult result = engine.Run(request, job);

  EXPECT_EQ(result.gallery_id_, "G1");
  EXPECT_EQ(result.gallery_url_, "https://imx.to/g/G1");
  EXPECT_EQ(result.gallery_name_, "Beach Trip");
  EXPECT_EQ(result.total_images_, 10u);
  EXPECT_EQ(result.successful_count_, 10u);
  EXPECT_EQ(result.failed_count_, 0u);
  EXPECT_FALSE(result.soft_stopped_);
  EXPECT_EQ(Names(result.images_), Numbered(1, 10));
  EXPECT_EQ(result.images_[0].thumb_url_, "https://imx.to/u/t/img1.jpg");
  EXPECT_EQ(result.images_[0].width_, 8u);
  EXPECT_DOUBLE_EQ(result.dimensions_.avg_height_, 6.0);
  EXPECT_EQ(result.dominant_extension_, "JPG");
  EXPECT_EQ(result.uploaded_size_, result.total_size_);
  EXPECT_LE(host_->MaxInFlight(), 4);

  // Anonymous creation leaves the display name to be set later
  ASSERT_EQ(renames.size(), 1u);
  EXPECT_EQ(renames.front().gallery_id_, "G1");
  EXPECT_EQ(renames.front().intended_name_, "Beach Trip");

  auto started = log.All<GalleryStarted>();
  ASSERT_EQ(started.size(), 1u);
  EXPECT_EQ(started.front().gallery_id_, "G1");
  EXPECT_EQ(log.All<ImageCompleted>().size(), 10u);
  EXPECT_FALSE(log.All<ImageProgress>().empty());
  auto finished = log.All<GalleryFinished>();
  ASSERT_EQ(finished.size(), 1u);
  EXPECT_EQ(finished.front().successful_, 10u);
}

TEST_F(UploadTests, RetryPassesRecoverTransientFailures) {
  auto folder                              = MakeFolder("retries", 10);
  host_->failures_before_success_["img3.jpg"] = 2;
  host_->failures_before_success_["img7.jpg"] = -1;
  host_->failure_status_                   = TransferStatus::CONNECT_FAILED;
  UploadEngine engine(config_, FakeTransferHandle::Factory(host_));

  UploadRequest request;
  request.path_ = folder.string();
  UploadJob    job;
  UploadResult result = engine.Run(request, job);

  EXPECT_EQ(result.successful_count_ + result.failed_count_, 10u);
  EXPECT_EQ(result.successful_count_, 9u);
  ASSERT_EQ(result.failures_.size(), 1u);
  EXPECT_EQ(result.failures_.front().file_name_, "img7.jpg");
  EXPECT_EQ(result.failures_.front().reason_.rfind("Network error: ", 0), 0u);
  EXPECT_EQ(host_->Attempts("img3.jpg"), 3);
  // One first pass and three retry passes
  EXPECT_EQ(host_->Attempts("img7.jpg"), 4);
  EXPECT_EQ(host_->Attempts("img1.jpg"), 1);

  auto expected = Numbered(1, 10);
  expected.erase(expected.begin() + 6);
  EXPECT_EQ(Names(result.images_), expected);
}

TEST_F(UploadTests, ResumeSkipsUploadedFiles) {
  auto          folder = MakeFolder("resume", 10);
  UploadEngine  engine(config_, FakeTransferHandle::Factory(host_));

  UploadRequest request;
  request.path_       = folder.string();
  request.gallery_id_ = "G1";
  for (const auto& name : Numbered(1, 4)) {
    ImageRecord record;
    record.file_name_  = name;
    record.url_        = "https://imx.to/i/old-" + name;
    record.size_bytes_ = 1;
    request.uploaded_files_.insert(name);
    request.uploaded_images_data_.push_back(record);
  }

  UploadJob    job;
  UploadResult result = engine.Run(request, job);
  EXPECT_EQ(host_->RequestCount(), 6u);
  for (const auto& name : Numbered(1, 4)) EXPECT_EQ(host_->Attempts(name), 0) << name;
  EXPECT_EQ(result.successful_count_, 10u);
  EXPECT_EQ(Names(result.images_), Numbered(1, 10));
  EXPECT_EQ(result.images_[0].url_, "https://imx.to/i/old-img1.jpg");
  EXPECT_EQ(result.images_[4].url_, "https://imx.to/i/img5");

  // Every file already uploaded: nothing is sent again
  UploadRequest again = request;
  again.uploaded_files_.clear();
  again.uploaded_images_data_ = result.images_;
  for (const auto& image : result.images_) again.uploaded_files_.insert(image.file_name_);
  UploadJob    second_job;
  UploadResult second = engine.Run(again, second_job);
  EXPECT_EQ(host_->RequestCount(), 6u);
  EXPECT_EQ(second.successful_count_, 10u);
  EXPECT_EQ(Names(second.images_), Numbered(1, 10));
}

TEST_F(UploadTests, ResumedFilesMissingOnDiskAreDropped) {
  auto          folder = MakeFolder("shrunk", 5);
  UploadEngine  engine(config_, FakeTransferHandle::Factory(host_));

  UploadRequest request;
  request.path_       = folder.string();
  request.gallery_id_ = "G1";
  for (const auto& name : {std::string("img1.jpg"), std::string("deleted.jpg")}) {
    ImageRecord record;
    record.file_name_  = name;
    record.size_bytes_ = 1;
    request.uploaded_files_.insert(name);
    request.uploaded_images_data_.push_back(record);
  }

  UploadJob    job;
  UploadResult result = engine.Run(request, job);
  EXPECT_EQ(host_->RequestCount(), 4u);
  EXPECT_EQ(result.total_images_, 5u);
  EXPECT_EQ(result.successful_count_, 5u);
  EXPECT_EQ(result.successful_count_ + result.failed_count_, result.total_images_);
  EXPECT_EQ(Names(result.images_), Numbered(1, 5));
}

TEST_F(UploadTests, SoftStopFinishesInFlightOnly) {
  auto folder    = MakeFolder("stop", 10);
  host_->delay_  = std::chrono::milliseconds(20);
  UploadEngine engine(config_, FakeTransferHandle::Factory(host_));
  UploadJob    job;
  host_->on_request_ = [&job](const std::string& file_name) {
    if (file_name == "img2.jpg") job.RequestStop(StopKind::STOP);
  };

  UploadRequest request;
  request.path_       = folder.string();
  UploadResult result = engine.Run(request, job);

  EXPECT_TRUE(result.soft_stopped_);
  EXPECT_EQ(job.Kind(), StopKind::STOP);
  // Creation upload plus at most one window
  EXPECT_LE(host_->RequestCount(), 1u + config_.batch_size_);
  EXPECT_LT(result.successful_count_, 10u);
  std::set<std::string> unique;
  for (const auto& image : result.images_) EXPECT_TRUE(unique.insert(image.file_name_).second);
}

TEST_F(UploadTests, FirstStopRequestWins) {
  UploadJob job;
  EXPECT_FALSE(job.StopRequested());
  job.RequestStop(StopKind::PAUSE);
  job.RequestStop(StopKind::STOP);
  EXPECT_TRUE(job.StopRequested());
  EXPECT_EQ(job.Kind(), StopKind::PAUSE);
}

TEST_F(UploadTests, GalleryCreationFailureAborts) {
  auto folder                                 = MakeFolder("nogallery", 3);
  host_->failures_before_success_["img1.jpg"] = -1;
  config_.max_retries_                        = 1;
  UploadEngine engine(config_, FakeTransferHandle::Factory(host_));

  UploadRequest request;
  request.path_ = folder.string();
  UploadJob job;
  EXPECT_THROW(engine.Run(request, job), UploadError);
  EXPECT_EQ(host_->Attempts("img1.jpg"), 2);
  EXPECT_EQ(host_->Attempts("img2.jpg"), 0);
}

TEST_F(UploadTests, EmptyFolderIsAnError) {
  std::filesystem::create_directories(root_ / "empty");
  UploadEngine  engine(config_, FakeTransferHandle::Factory(host_));
  UploadRequest request;
  request.path_ = (root_ / "empty").string();
  UploadJob job;
  EXPECT_THROW(engine.Run(request, job), UploadError);
}

TEST_F(UploadTests, NamedGalleryCreatedWithWebSession) {
  auto         folder = MakeFolder("Named Set", 3);
  UploadEngine engine(config_, FakeTransferHandle::Factory(host_));
  engine.Api().SetWebSession("PHPSESSID=abc");
  std::vector<PendingRename> renames;
  engine.SetRenameSink([&](const PendingRename& rename) { renames.push_back(rename); });

  UploadRequest request;
  request.path_       = folder.string();
  request.name_       = "My <Named> Set!";
  UploadJob    job;
  UploadResult result = engine.Run(request, job);

  EXPECT_EQ(result.gallery_id_, "NAMED1");
  EXPECT_EQ(result.gallery_name_, "My Named Set");
  EXPECT_EQ(result.successful_count_, 3u);
  EXPECT_TRUE(renames.empty());

  auto named = host_->NamedRequests();
  ASSERT_EQ(named.size(), 1u);
  EXPECT_FALSE(named.front().multipart_);
  ASSERT_FALSE(named.front().form_.empty());
  EXPECT_EQ(named.front().form_.front().value_, "My Named Set");
  for (const auto& upload : host_->Requests()) {
    bool has_gallery = false;
    for (const auto& part : upload.form_) {
      if (part.name_ == "gallery_id") has_gallery = part.value_ == "NAMED1";
    }
    EXPECT_TRUE(has_gallery);
  }
}

TEST_F(UploadTests, HandlesStartEveryGalleryWithFreshSession) {
  auto         folder = MakeFolder("sessions", 2);
  UploadEngine engine(config_, FakeTransferHandle::Factory(host_));
  UploadRequest request;
  request.path_ = folder.string();
  UploadJob first_job;
  engine.Run(request, first_job);
  EXPECT_EQ(host_->session_clears_.load(), 4);
  // Every lease resets its handle on release
  EXPECT_EQ(static_cast<size_t>(host_->resets_.load()), host_->RequestCount());
}

TEST_F(UploadTests, DominantExtension) {
  std::vector<ImageRecord> images(3);
  images[0].file_name_ = "a.png";
  images[1].file_name_ = "b.PNG";
  images[2].file_name_ = "c.jpg";
  EXPECT_EQ(UploadEngine::DominantExtension(images), "PNG");
  EXPECT_EQ(UploadEngine::DominantExtension({}), "JPG");
}
}  // namespace galleryup
