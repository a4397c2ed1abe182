#include "gallery/gallery_item.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "gallery/side_records.hpp"
#include "type/gallery_status.hpp"
#include "utils/string/natural_sort.hpp"

namespace galleryup {
TEST(GalleryItemTests, SanitizeGalleryName) {
  EXPECT_EQ(SanitizeGalleryName("  Beach   Trip  "), "Beach Trip");
  EXPECT_EQ(SanitizeGalleryName("a<b>c|d?e*"), "abcde");
  EXPECT_EQ(SanitizeGalleryName("Set (1), v.2 - final_cut"), "Set (1), v.2 - final_cut");
  EXPECT_EQ(SanitizeGalleryName("\tTabs\nand\rbreaks"), "Tabs and breaks");
  EXPECT_EQ(SanitizeGalleryName("***"), "");
}

TEST(GalleryItemTests, StatusNames) {
  for (size_t i = 0; i < kGalleryStatusCount; ++i) {
    auto status = static_cast<GalleryStatus>(i);
    EXPECT_EQ(StatusFromString(StatusToString(status)), status);
  }
  EXPECT_EQ(StatusToString(GalleryStatus::UPLOAD_FAILED), "upload_failed");
  // Legacy rows
  EXPECT_EQ(StatusFromString("failed"), GalleryStatus::UPLOAD_FAILED);
  EXPECT_FALSE(StatusFromString("cancelled").has_value());
}

TEST(GalleryItemTests, StatusPredicates) {
  EXPECT_TRUE(IsStartable(GalleryStatus::READY));
  EXPECT_TRUE(IsStartable(GalleryStatus::PAUSED));
  EXPECT_TRUE(IsStartable(GalleryStatus::INCOMPLETE));
  EXPECT_FALSE(IsStartable(GalleryStatus::COMPLETED));
  EXPECT_FALSE(IsStartable(GalleryStatus::SCAN_FAILED));
  EXPECT_TRUE(IsTransient(GalleryStatus::UPLOADING));
  EXPECT_TRUE(IsTerminal(GalleryStatus::UPLOAD_FAILED));
}

TEST(GalleryItemTests, FailedFilesJsonToleratesBadInput) {
  std::vector<FailedFile> failed = {{"a.jpg", "timeout"}, {"b \"q\".jpg", "bad, header"}};
  EXPECT_EQ(FailedFilesFromJson(FailedFilesToJson(failed)), failed);
  EXPECT_TRUE(FailedFilesFromJson("").empty());
  EXPECT_TRUE(FailedFilesFromJson("not json").empty());
  EXPECT_TRUE(CustomFieldsFromJson("[1,2]").empty());
}

TEST(GalleryItemTests, SecondaryStatusNames) {
  EXPECT_EQ(SecondaryStatusFromString(SecondaryStatusToString(SecondaryUploadStatus::CANCELLED)),
            SecondaryUploadStatus::CANCELLED);
  EXPECT_FALSE(SecondaryStatusFromString("unknown").has_value());
}

TEST(GalleryItemTests, NaturalOrder) {
  std::vector<std::string> names = {"img10.jpg", "IMG2.jpg", "img1.jpg", "a.jpg", "img02b.jpg"};
  natural::Sort(names);
  EXPECT_EQ(names.front(), "a.jpg");
  EXPECT_TRUE(natural::Less("img2.jpg", "img10.jpg"));
  EXPECT_FALSE(natural::Less("img10.jpg", "img2.jpg"));
  EXPECT_EQ(names.back(), "img10.jpg");
}
}  // namespace galleryup
