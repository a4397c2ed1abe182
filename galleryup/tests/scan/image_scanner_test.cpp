#include "scan/image_scanner.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "scan_test_fixation.hpp"

namespace galleryup {
namespace {
auto NumberedFiles(size_t count) -> std::vector<file_name_t> {
  std::vector<file_name_t> files;
  for (size_t i = 1; i <= count; ++i) files.push_back("img" + std::to_string(i) + ".jpg");
  return files;
}
}  // namespace

TEST_F(ScanTests, EnumerateUsesNaturalOrderAndSkipsOtherFiles) {
  WriteImage(root_ / "img10.jpg", 4, 4);
  WriteImage(root_ / "img2.png", 4, 4);
  WriteImage(root_ / "img1.JPG", 4, 4);
  WriteBytes(root_ / "notes.txt", "not an image");
  WriteImage(root_ / "nested" / "img3.jpg", 4, 4);

  auto files = ImageScanner::EnumerateImages(root_);
  EXPECT_EQ(files, (std::vector<file_name_t>{"img1.JPG", "img2.png", "img10.jpg"}));
}

TEST_F(ScanTests, ScanReportsTotalsAndDimensions) {
  WriteImage(root_ / "a.jpg", 40, 30);
  WriteImage(root_ / "b.jpg", 60, 50);
  WriteImage(root_ / "c.png", 80, 70);

  ImageScanner scanner(ScanConfig{});
  ScanOutcome  outcome = scanner.Scan(root_);
  ASSERT_TRUE(outcome.Ok()) << outcome.message_;
  EXPECT_EQ(outcome.total_images_, 3u);
  EXPECT_EQ(outcome.files_.size(), 3u);
  EXPECT_GT(outcome.total_size_, 0);
  EXPECT_DOUBLE_EQ(outcome.dimensions_.avg_width_, 60.0);
  EXPECT_DOUBLE_EQ(outcome.dimensions_.avg_height_, 50.0);
  EXPECT_DOUBLE_EQ(outcome.dimensions_.min_width_, 40.0);
  EXPECT_DOUBLE_EQ(outcome.dimensions_.max_height_, 70.0);
}

TEST_F(ScanTests, ScanErrors) {
  ImageScanner scanner(ScanConfig{});

  EXPECT_EQ(scanner.Scan(root_ / "missing").code_, ScanErrorCode::PATH_NOT_FOUND);

  WriteBytes(root_ / "file.jpg", "x");
  EXPECT_EQ(scanner.Scan(root_ / "file.jpg").code_, ScanErrorCode::NOT_A_DIRECTORY);

  std::filesystem::create_directories(root_ / "empty");
  WriteBytes(root_ / "empty" / "readme.txt", "nothing here");
  auto empty = scanner.Scan(root_ / "empty");
  EXPECT_EQ(empty.code_, ScanErrorCode::NO_IMAGES);
  EXPECT_FALSE(empty.message_.empty());
}

TEST_F(ScanTests, InvalidFilesAreListedWithReasons) {
  auto folder = root_ / "broken";
  WriteImage(folder / "good.jpg", 16, 16);
  WriteBytes(folder / "zero.jpg", "");
  WriteBytes(folder / "garbage.png", "definitely not a png header");

  ImageScanner scanner(ScanConfig{});
  ScanOutcome  outcome = scanner.Scan(folder);
  EXPECT_EQ(outcome.code_, ScanErrorCode::INVALID_FILES);
  EXPECT_EQ(outcome.total_images_, 3u);
  ASSERT_EQ(outcome.failed_files_.size(), 2u);
  EXPECT_EQ(outcome.failed_files_[0].file_name_, "garbage.png");
  EXPECT_EQ(outcome.failed_files_[1].file_name_, "zero.jpg");
  EXPECT_EQ(outcome.failed_files_[1].reason_, "empty file");
  EXPECT_EQ(outcome.message_.rfind("2 invalid file(s): garbage.png (", 0), 0u);
}

TEST_F(ScanTests, ReadDimensionsFromHeader) {
  WriteImage(root_ / "wide.png", 120, 45);
  auto size = ImageScanner::ReadDimensions(root_ / "wide.png");
  ASSERT_TRUE(size.has_value());
  EXPECT_EQ(size->width_, 120u);
  EXPECT_EQ(size->height_, 45u);

  WriteBytes(root_ / "bad.jpg", "nope");
  EXPECT_FALSE(ImageScanner::ReadDimensions(root_ / "bad.jpg").has_value());
}

TEST_F(ScanTests, FixedSamplingSpreadsAcrossFiles) {
  ScanConfig config;
  config.sampling_fixed_count_ = 25;

  auto indices = ImageScanner::SampleIndices(NumberedFiles(100), config);
  ASSERT_EQ(indices.size(), 25u);
  EXPECT_EQ(indices.front(), 0u);
  EXPECT_EQ(indices.back(), 99u);
  for (size_t i = 1; i < indices.size(); ++i) EXPECT_LT(indices[i - 1], indices[i]);

  // Fewer files than the count: every file
  auto small = ImageScanner::SampleIndices(NumberedFiles(10), config);
  EXPECT_EQ(small.size(), 10u);
  EXPECT_TRUE(ImageScanner::SampleIndices({}, config).empty());
}

TEST_F(ScanTests, PercentageSamplingTakesAtLeastOne) {
  ScanConfig config;
  config.sampling_method_     = SamplingMethod::PERCENTAGE;
  config.sampling_percentage_ = 10;
  EXPECT_EQ(ImageScanner::SampleIndices(NumberedFiles(50), config).size(), 5u);

  config.sampling_percentage_ = 1;
  auto one                    = ImageScanner::SampleIndices(NumberedFiles(20), config);
  // A single sample still keeps both ends of the range
  EXPECT_EQ(one, (std::vector<size_t>{0, 19}));
}

TEST_F(ScanTests, ExclusionsApplyBeforeSampling) {
  std::vector<file_name_t> files = {"Cover.jpg", "p1.jpg", "p2.jpg", "promo_banner.jpg",
                                    "p3.jpg",    "back.jpg"};
  ScanConfig               config;
  config.exclude_first_    = true;
  config.exclude_last_     = true;
  config.exclude_patterns_ = {"*PROMO*", ""};

  auto indices = ImageScanner::SampleIndices(files, config);
  EXPECT_EQ(indices, (std::vector<size_t>{1, 2, 4}));

  config.exclude_patterns_ = {"*.jpg"};
  EXPECT_EQ(ImageScanner::SampleIndices(files, config), (std::vector<size_t>{3}));
}

TEST_F(ScanTests, ExclusionPatternsUseShellWildcards) {
  std::vector<file_name_t> files = {"Cover.jpg", "p1.jpg", "p2.jpg", "promo_banner.jpg",
                                    "p3.jpg",    "back.jpg"};
  ScanConfig               config;

  config.exclude_patterns_ = {"p?.jpg"};
  EXPECT_EQ(ImageScanner::SampleIndices(files, config), (std::vector<size_t>{0, 3, 5}));

  config.exclude_patterns_ = {"[!p]*"};
  EXPECT_EQ(ImageScanner::SampleIndices(files, config), (std::vector<size_t>{1, 2, 3, 4}));

  config.exclude_patterns_ = {"[a-c]*.JPG"};
  EXPECT_EQ(ImageScanner::SampleIndices(files, config), (std::vector<size_t>{1, 2, 3, 4}));

  config.exclude_patterns_ = {"*o*_*r.jpg"};
  EXPECT_EQ(ImageScanner::SampleIndices(files, config), (std::vector<size_t>{0, 1, 2, 4, 5}));

  // An unterminated class is taken literally
  config.exclude_patterns_ = {"[p"};
  EXPECT_EQ(ImageScanner::SampleIndices(files, config).size(), 6u);
}

TEST_F(ScanTests, SmallImagesExcludedByArea) {
  std::vector<file_name_t> files = {"a.jpg", "b.jpg", "c.jpg", "d.jpg"};
  ScanConfig               config;
  config.exclude_small_images_    = true;
  config.exclude_small_threshold_ = 50;

  std::vector<uint64_t> areas = {1000, 400, 900, 0};
  EXPECT_EQ(ImageScanner::SampleIndices(files, config, areas), (std::vector<size_t>{0, 2}));
  // Areas unknown: nothing excluded
  EXPECT_EQ(ImageScanner::SampleIndices(files, config).size(), 4u);
}

TEST_F(ScanTests, StatsExcludeOutliersButKeepExtremes) {
  std::vector<PixelSize> sizes = {{100, 50}, {100, 50}, {100, 50},
                                  {100, 50}, {100, 50}, {1000, 500}};
  auto plain = ImageScanner::ComputeStats(sizes, false, false);
  EXPECT_DOUBLE_EQ(plain.avg_width_, 250.0);

  auto filtered = ImageScanner::ComputeStats(sizes, true, false);
  EXPECT_DOUBLE_EQ(filtered.avg_width_, 100.0);
  EXPECT_DOUBLE_EQ(filtered.avg_height_, 50.0);
  EXPECT_DOUBLE_EQ(filtered.max_width_, 1000.0);
  EXPECT_DOUBLE_EQ(filtered.min_height_, 50.0);

  // Too few samples for outlier removal
  std::vector<PixelSize> four = {{10, 10}, {10, 10}, {10, 10}, {1000, 10}};
  EXPECT_DOUBLE_EQ(ImageScanner::ComputeStats(four, true, false).avg_width_, 257.5);
}

TEST_F(ScanTests, StatsMedian) {
  std::vector<PixelSize> sizes = {{40, 4}, {10, 1}, {30, 3}, {20, 2}};
  auto                   stats = ImageScanner::ComputeStats(sizes, false, true);
  EXPECT_DOUBLE_EQ(stats.avg_width_, 30.0);
  EXPECT_DOUBLE_EQ(stats.avg_height_, 3.0);
  EXPECT_DOUBLE_EQ(ImageScanner::ComputeStats({}, true, true).max_width_, 0.0);
}
}  // namespace galleryup
