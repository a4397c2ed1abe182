#include "upload/artifact_writer.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <nlohmann/json.hpp>

#include "scan/image_scanner.hpp"
#include "upload_test_fixation.hpp"

namespace galleryup {
namespace {
auto ReadJson(const std::filesystem::path& file) -> nlohmann::json {
  std::ifstream in(file);
  return nlohmann::json::parse(in);
}

auto SampleResult() -> UploadResult {
  UploadResult result;
  result.gallery_id_       = "G9";
  result.gallery_name_     = "Summer: Day/1";
  result.gallery_url_      = "https://imx.to/g/G9";
  result.total_images_     = 2;
  result.successful_count_ = 1;
  result.failed_count_     = 1;
  result.started_at_       = 1700000000;
  result.finished_at_      = 1700000060;
  ImageRecord image;
  image.file_name_ = "a.jpg";
  image.url_       = "https://imx.to/i/a";
  image.width_     = 800;
  result.images_.push_back(image);
  result.failures_.push_back({"b.jpg", "Network error: timed out"});
  return result;
}
}  // namespace

TEST_F(UploadTests, ArtifactFileNameIsSanitized) {
  EXPECT_EQ(JsonArtifactWriter::ArtifactFileName("Summer: Day/1", "G9"), "Summer Day1_G9.json");
}

TEST_F(UploadTests, ArtifactWrittenBesideImagesAndCentrally) {
  auto folder  = MakeFolder("artifact", 1);
  auto central = root_ / "central";

  GalleryItem item;
  item.path_          = folder.string();
  item.template_name_ = "bbcode";
  item.custom_fields_ = {{"model", "Alice"}};

  JsonArtifactWriter writer(central);
  writer.Write(item, SampleResult());

  ASSERT_EQ(writer.LastWritten().size(), 2u);
  EXPECT_EQ(writer.LastWritten()[0], folder / ".uploaded" / "Summer Day1_G9.json");
  EXPECT_EQ(writer.LastWritten()[1], central / "Summer Day1_G9.json");

  auto payload = ReadJson(writer.LastWritten()[0]);
  EXPECT_EQ(payload["meta"]["gallery_id"], "G9");
  EXPECT_EQ(payload["meta"]["status"], "completed_with_failures");
  EXPECT_EQ(payload["meta"]["template_name"], "bbcode");
  EXPECT_EQ(payload["custom_fields"]["model"], "Alice");
  EXPECT_EQ(payload["stats"]["failed_count"], 1);
  ASSERT_EQ(payload["images"].size(), 1u);
  EXPECT_EQ(payload["images"][0]["original_filename"], "a.jpg");
  EXPECT_EQ(payload["failures"][0]["reason"], "Network error: timed out");
  EXPECT_EQ(ReadJson(writer.LastWritten()[1]), payload);

  // The artifact directory is not mistaken for an image
  EXPECT_EQ(ImageScanner::EnumerateImages(folder).size(), 1u);
}

TEST_F(UploadTests, ArtifactSkippedWithoutGallery) {
  auto        folder = MakeFolder("noartifact", 1);
  GalleryItem item;
  item.path_ = folder.string();

  UploadResult result = SampleResult();
  result.gallery_id_.clear();
  JsonArtifactWriter writer;
  writer.Write(item, result);
  EXPECT_TRUE(writer.LastWritten().empty());
  EXPECT_FALSE(std::filesystem::exists(folder / ".uploaded"));
}
}  // namespace galleryup
