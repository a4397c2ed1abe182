#include "storage/controller/gallery_store.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "storage/controller/controller_types.hpp"
#include "store_test_fixation.hpp"

namespace galleryup {
namespace {
auto FindByPath(const std::vector<GalleryItem>& items, const std::string& path)
    -> const GalleryItem* {
  auto it = std::find_if(items.begin(), items.end(),
                         [&](const GalleryItem& item) { return item.path_ == path; });
  return it == items.end() ? nullptr : &*it;
}

auto FindTab(const std::vector<Tab>& tabs, const std::string& name) -> const Tab* {
  auto it = std::find_if(tabs.begin(), tabs.end(), [&](const Tab& t) { return t.name_ == name; });
  return it == tabs.end() ? nullptr : &*it;
}
}  // namespace

TEST_F(GalleryStoreTests, MigrationsAppliedOnce) {
  {
    GalleryStore store(db_path_);
    EXPECT_EQ(store.AppliedSchemaVersions(), (std::vector<int>{1, 2, 3, 4}));
  }
  GalleryStore reopened(db_path_);
  EXPECT_EQ(reopened.AppliedSchemaVersions(), (std::vector<int>{1, 2, 3, 4}));
  auto tabs = reopened.GetAllTabs();
  EXPECT_EQ(std::count_if(tabs.begin(), tabs.end(),
                          [](const Tab& t) { return t.name_ == kMainTabName; }),
            1);
}

TEST_F(GalleryStoreTests, UpsertAndLoadRoundTrip) {
  GalleryStore store(db_path_);
  GalleryItem  item = MakeItem("/photos/trip");
  item.status_      = GalleryStatus::INCOMPLETE;
  item.gallery_id_  = "abc123";
  item.gallery_url_ = "https://imx.to/g/abc123";
  item.uploaded_images_data_ = {MakeRecord("b.jpg", 200), MakeRecord("a.jpg", 100)};
  item.uploaded_files_       = {"a.jpg", "b.jpg"};
  item.uploaded_images_      = 2;
  item.uploaded_bytes_       = 300;
  item.dimensions_.avg_width_ = 800.0;
  item.failed_files_  = {{"c.jpg", "Network error: timed out"}};
  item.error_message_ = "1 file(s) failed to upload";
  item.custom_fields_ = {{"model", "Alice"}, {"set", "12"}};

  auto report = store.BatchUpsert({item});
  EXPECT_EQ(report.upserted_, 1u);
  EXPECT_TRUE(report.skipped_.empty());

  auto loaded = store.LoadAll();
  ASSERT_EQ(loaded.size(), 1u);
  const auto& got = loaded.front();
  EXPECT_EQ(got.path_, "/photos/trip");
  EXPECT_EQ(got.status_, GalleryStatus::INCOMPLETE);
  EXPECT_EQ(got.gallery_id_, "abc123");
  EXPECT_EQ(got.uploaded_images_, 2u);
  EXPECT_EQ(got.uploaded_bytes_, 300);
  EXPECT_DOUBLE_EQ(got.dimensions_.avg_width_, 800.0);
  EXPECT_EQ(got.failed_files_, item.failed_files_);
  EXPECT_EQ(got.error_message_, item.error_message_);
  EXPECT_EQ(got.custom_fields_, item.custom_fields_);
  EXPECT_EQ(got.tab_name_, kMainTabName);
  EXPECT_GT(got.store_id_, 0);

  // Upload order of the records is kept
  ASSERT_EQ(got.uploaded_images_data_.size(), 2u);
  EXPECT_EQ(got.uploaded_images_data_[0].file_name_, "b.jpg");
  EXPECT_EQ(got.uploaded_images_data_[1].file_name_, "a.jpg");
  EXPECT_EQ(got.uploaded_files_.size(), 2u);
}

TEST_F(GalleryStoreTests, UpsertUpdatesExistingRowInPlace) {
  GalleryStore store(db_path_);
  GalleryItem  item = MakeItem("/photos/set");
  store.BatchUpsert({item});
  const auto first_id = store.LoadAll().front().store_id_;

  item.status_               = GalleryStatus::COMPLETED;
  item.uploaded_images_      = 1;
  item.uploaded_images_data_ = {MakeRecord("one.jpg", 10)};
  store.BatchUpsert({item});

  item.uploaded_images_data_ = {MakeRecord("two.jpg", 20)};
  store.BatchUpsert({item});

  auto loaded = store.LoadAll();
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded.front().store_id_, first_id);
  EXPECT_EQ(loaded.front().status_, GalleryStatus::COMPLETED);
  ASSERT_EQ(loaded.front().uploaded_images_data_.size(), 1u);
  EXPECT_EQ(loaded.front().uploaded_images_data_.front().file_name_, "two.jpg");
}

TEST_F(GalleryStoreTests, ImageRecordFieldsUpdateUnderSameNames) {
  GalleryStore store(db_path_);
  GalleryItem  item   = MakeItem("/photos/dims");
  ImageRecord  first  = MakeRecord("a.jpg", 10);
  ImageRecord  second = MakeRecord("b.jpg", 20);
  first.width_               = 0;
  first.height_              = 0;
  item.uploaded_images_      = 2;
  item.uploaded_images_data_ = {first, second};
  store.BatchUpsert({item});

  // Same names in the same order, only the metadata changes
  item.uploaded_images_data_[0].width_     = 640;
  item.uploaded_images_data_[0].height_    = 480;
  item.uploaded_images_data_[1].thumb_url_ = "https://imx.to/u/t/b2.jpg";
  store.BatchUpsert({item});

  auto loaded = store.LoadAll();
  ASSERT_EQ(loaded.size(), 1u);
  const auto& images = loaded.front().uploaded_images_data_;
  ASSERT_EQ(images.size(), 2u);
  EXPECT_EQ(images[0].file_name_, "a.jpg");
  EXPECT_EQ(images[0].width_, 640u);
  EXPECT_EQ(images[0].height_, 480u);
  EXPECT_EQ(images[0].size_bytes_, 10);
  EXPECT_EQ(images[1].thumb_url_, "https://imx.to/u/t/b2.jpg");
  EXPECT_EQ(images[1].width_, 800u);
}

TEST_F(GalleryStoreTests, LastEntryForPathWins) {
  GalleryStore store(db_path_);
  GalleryItem  first = MakeItem("/photos/dup", GalleryStatus::READY);
  GalleryItem  last  = MakeItem("/photos/dup", GalleryStatus::PAUSED);
  auto         report = store.BatchUpsert({first, last});
  EXPECT_EQ(report.upserted_, 1u);

  auto loaded = store.LoadAll();
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded.front().status_, GalleryStatus::PAUSED);
}

TEST_F(GalleryStoreTests, InvalidRowsSkippedOthersWritten) {
  GalleryStore store(db_path_);
  GalleryItem  good  = MakeItem("/photos/good");
  GalleryItem  over  = MakeItem("/photos/over");
  over.uploaded_images_ = 9;
  GalleryItem  empty = MakeItem("");

  auto report = store.BatchUpsert({good, over, empty});
  EXPECT_EQ(report.upserted_, 1u);
  EXPECT_EQ(report.skipped_.size(), 2u);

  auto loaded = store.LoadAll();
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded.front().path_, "/photos/good");
}

TEST_F(GalleryStoreTests, PredictiveIdCollisionSkipsRow) {
  GalleryStore store(db_path_);
  GalleryItem  owner = MakeItem("/photos/owner");
  owner.store_id_    = store.ReserveGalleryId();
  store.BatchUpsert({owner});

  GalleryItem intruder = MakeItem("/photos/intruder");
  intruder.store_id_   = owner.store_id_;
  auto report          = store.BatchUpsert({intruder});
  EXPECT_EQ(report.upserted_, 0u);
  ASSERT_EQ(report.skipped_.size(), 1u);
  EXPECT_EQ(report.skipped_.front().first, "/photos/intruder");
  EXPECT_NE(report.skipped_.front().second.find("already belongs to /photos/owner"),
            std::string::npos);

  auto loaded = store.LoadAll();
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded.front().path_, "/photos/owner");
}

TEST_F(GalleryStoreTests, ReservedIdsStayAboveLoadedIds) {
  store_id_t persisted = 0;
  {
    GalleryStore store(db_path_);
    GalleryItem  a = MakeItem("/photos/a");
    a.store_id_    = store.ReserveGalleryId();
    GalleryItem  b = MakeItem("/photos/b");
    b.store_id_    = store.ReserveGalleryId();
    EXPECT_LT(a.store_id_, b.store_id_);
    store.BatchUpsert({a, b});
    persisted = b.store_id_;
  }
  GalleryStore reopened(db_path_);
  EXPECT_GT(reopened.ReserveGalleryId(), persisted);
}

TEST_F(GalleryStoreTests, DeleteCascadesToImages) {
  GalleryStore store(db_path_);
  GalleryItem  done = MakeItem("/photos/done", GalleryStatus::COMPLETED);
  done.uploaded_images_data_ = {MakeRecord("x.jpg", 1)};
  GalleryItem  failed = MakeItem("/photos/failed", GalleryStatus::UPLOAD_FAILED);
  GalleryItem  ready  = MakeItem("/photos/ready");
  store.BatchUpsert({done, failed, ready});

  EXPECT_EQ(store.DeleteByStatus({GalleryStatus::COMPLETED, GalleryStatus::UPLOAD_FAILED}), 2);
  auto loaded = store.LoadAll();
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded.front().path_, "/photos/ready");

  // A new gallery reusing the path starts without stale image rows
  store.BatchUpsert({MakeItem("/photos/done")});
  auto again = store.LoadAll();
  auto* row  = FindByPath(again, "/photos/done");
  ASSERT_NE(row, nullptr);
  EXPECT_TRUE(row->uploaded_images_data_.empty());

  EXPECT_EQ(store.DeletePaths({"/photos/done", "/photos/missing"}), 1);
  EXPECT_EQ(store.LoadAll().size(), 1u);
}

TEST_F(GalleryStoreTests, InsertionOrdersRewrittenDense) {
  GalleryStore store(db_path_);
  GalleryItem  a = MakeItem("/photos/a");
  a.insertion_order_ = 7;
  GalleryItem  b = MakeItem("/photos/b");
  b.insertion_order_ = 3;
  GalleryItem  c = MakeItem("/photos/c");
  c.insertion_order_ = 3;
  store.BatchUpsert({a, b, c});

  store.UpdateInsertionOrders({"/photos/c", "/photos/a", "/photos/b"});
  auto loaded = store.LoadAll();
  ASSERT_EQ(loaded.size(), 3u);
  EXPECT_EQ(loaded[0].path_, "/photos/c");
  EXPECT_EQ(loaded[1].path_, "/photos/a");
  EXPECT_EQ(loaded[2].path_, "/photos/b");
  for (size_t i = 0; i < loaded.size(); ++i) {
    EXPECT_EQ(loaded[i].insertion_order_, static_cast<int64_t>(i + 1));
  }
}

TEST_F(GalleryStoreTests, CustomFieldPatchKeepsOtherKeys) {
  GalleryStore store(db_path_);
  GalleryItem  item   = MakeItem("/photos/custom");
  item.custom_fields_ = {{"model", "Alice"}};
  store.BatchUpsert({item});

  EXPECT_TRUE(store.UpdateCustomField("/photos/custom", "set", "7"));
  EXPECT_TRUE(store.UpdateCustomField("/photos/custom", "model", "Bea"));
  EXPECT_FALSE(store.UpdateCustomField("/photos/unknown", "set", "1"));

  auto loaded = store.LoadAll();
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded.front().custom_fields_.at("model"), "Bea");
  EXPECT_EQ(loaded.front().custom_fields_.at("set"), "7");
}

TEST_F(GalleryStoreTests, SystemTabsCannotBeRenamedOrDeleted) {
  GalleryStore store(db_path_);
  auto         tabs = store.GetAllTabs();
  const Tab*   main = FindTab(tabs, kMainTabName);
  const Tab*   archive = FindTab(tabs, kArchiveTabName);
  ASSERT_NE(main, nullptr);
  ASSERT_NE(archive, nullptr);
  EXPECT_TRUE(main->IsSystem());
  EXPECT_TRUE(archive->IsSystem());

  TabUpdate rename;
  rename.name_ = "Inbox";
  EXPECT_THROW(store.UpdateTab(main->id_, rename), StoreError);
  EXPECT_THROW(store.DeleteTab(main->id_), StoreError);
  EXPECT_THROW(store.DeleteTab(archive->id_), StoreError);

  // Color and order of a system tab may change
  TabUpdate recolor;
  recolor.color_hint_ = "#123456";
  EXPECT_NO_THROW(store.UpdateTab(archive->id_, recolor));
  EXPECT_EQ(FindTab(store.GetAllTabs(), kArchiveTabName)->color_hint_, "#123456");
}

TEST_F(GalleryStoreTests, CreateTabRejectsDuplicatesAndEmptyNames) {
  GalleryStore store(db_path_);
  Tab          first = store.CreateTab("Clients", "#ff0000");
  EXPECT_EQ(first.type_, TabType::USER);
  EXPECT_EQ(first.display_order_, 1);
  Tab second = store.CreateTab("Personal");
  EXPECT_EQ(second.display_order_, 2);
  EXPECT_NE(first.id_, second.id_);

  EXPECT_THROW(store.CreateTab("Clients"), StoreError);
  EXPECT_THROW(store.CreateTab(""), StoreError);

  TabUpdate taken;
  taken.name_ = "Clients";
  EXPECT_THROW(store.UpdateTab(second.id_, taken), StoreError);

  TabUpdate rename;
  rename.name_ = "Family";
  store.UpdateTab(second.id_, rename);
  EXPECT_NE(FindTab(store.GetAllTabs(), "Family"), nullptr);
}

TEST_F(GalleryStoreTests, DeleteTabReassignsGalleries) {
  GalleryStore store(db_path_);
  Tab          clients = store.CreateTab("Clients");
  Tab          other   = store.CreateTab("Other");

  GalleryItem a = MakeItem("/photos/a");
  a.tab_name_   = "Clients";
  GalleryItem b = MakeItem("/photos/b");
  b.tab_name_   = "Clients";
  GalleryItem c = MakeItem("/photos/c");
  store.BatchUpsert({a, b, c});

  auto counts = store.GetTabGalleryCounts();
  EXPECT_EQ(counts["Clients"], 2);
  EXPECT_EQ(counts[kMainTabName], 1);
  EXPECT_EQ(counts["Other"], 0);

  EXPECT_THROW(store.DeleteTab(clients.id_, clients.id_), StoreError);
  EXPECT_THROW(store.DeleteTab(clients.id_, 987654), StoreError);
  EXPECT_EQ(store.DeleteTab(clients.id_, other.id_), 2);
  EXPECT_EQ(FindTab(store.GetAllTabs(), "Clients"), nullptr);

  auto loaded = store.LoadAll();
  EXPECT_EQ(FindByPath(loaded, "/photos/a")->tab_name_, "Other");
  EXPECT_EQ(FindByPath(loaded, "/photos/b")->tab_name_, "Other");

  // Without a destination galleries go back to Main
  EXPECT_EQ(store.DeleteTab(other.id_), 2);
  loaded = store.LoadAll();
  EXPECT_EQ(FindByPath(loaded, "/photos/a")->tab_name_, kMainTabName);
  EXPECT_THROW(store.DeleteTab(other.id_), StoreError);
}

TEST_F(GalleryStoreTests, MoveGalleriesAndReorderTabs) {
  GalleryStore store(db_path_);
  Tab          work = store.CreateTab("Work");
  store.BatchUpsert({MakeItem("/photos/a"), MakeItem("/photos/b")});

  EXPECT_EQ(store.MoveGalleriesToTab({"/photos/a", "/photos/missing"}, "Work"), 1);
  EXPECT_THROW(store.MoveGalleriesToTab({"/photos/b"}, "Nope"), StoreError);
  EXPECT_EQ(FindByPath(store.LoadAll(), "/photos/a")->tab_name_, "Work");

  auto tabs     = store.GetAllTabs();
  auto archive  = FindTab(tabs, kArchiveTabName)->id_;
  auto main_tab = FindTab(tabs, kMainTabName)->id_;
  store.ReorderTabs({work.id_, main_tab, archive});
  tabs = store.GetAllTabs();
  ASSERT_EQ(tabs.size(), 3u);
  EXPECT_EQ(tabs[0].name_, "Work");
  EXPECT_EQ(tabs[1].name_, kMainTabName);
  EXPECT_EQ(tabs[2].name_, kArchiveTabName);
}

TEST_F(GalleryStoreTests, PendingRenames) {
  GalleryStore store(db_path_);
  store.AddPendingRename({"g1", "Beach Day", 0});
  store.AddPendingRename({"g2", "Forest", 1700000000});
  store.AddPendingRename({"g1", "Beach Day (2)", 0});

  auto renames = store.GetPendingRenames();
  ASSERT_EQ(renames.size(), 2u);
  auto g1 = std::find_if(renames.begin(), renames.end(),
                         [](const PendingRename& r) { return r.gallery_id_ == "g1"; });
  ASSERT_NE(g1, renames.end());
  EXPECT_EQ(g1->intended_name_, "Beach Day (2)");
  EXPECT_GT(g1->discovered_ts_, 0);

  EXPECT_TRUE(store.RemovePendingRename("g1"));
  EXPECT_FALSE(store.RemovePendingRename("g1"));
  EXPECT_EQ(store.ClearPendingRenames(), 1);
  EXPECT_TRUE(store.GetPendingRenames().empty());
}

TEST_F(GalleryStoreTests, SecondaryUploadsFollowGallery) {
  GalleryStore store(db_path_);
  SecondaryUploadRecord orphan;
  orphan.gallery_path_ = "/photos/none";
  orphan.host_name_    = "filehost";
  EXPECT_THROW(store.UpsertSecondaryUpload(orphan), StoreError);

  store.BatchUpsert({MakeItem("/photos/a")});
  SecondaryUploadRecord record;
  record.gallery_path_ = "/photos/a";
  record.host_name_    = "filehost";
  record.total_bytes_  = 5000;
  store.UpsertSecondaryUpload(record);

  auto pending = store.GetPendingSecondaryUploads("filehost");
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_EQ(pending.front().gallery_path_, "/photos/a");

  EXPECT_TRUE(store.UpdateSecondaryUploadProgress("/photos/a", "filehost", 2500, 5000));
  EXPECT_TRUE(store.UpdateSecondaryUploadStatus("/photos/a", "filehost",
                                                SecondaryUploadStatus::COMPLETED));
  EXPECT_FALSE(store.UpdateSecondaryUploadStatus("/photos/a", "otherhost",
                                                 SecondaryUploadStatus::FAILED, "boom"));
  EXPECT_TRUE(store.GetPendingSecondaryUploads("filehost").empty());

  auto all = store.GetSecondaryUploads("/photos/a");
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all.front().status_, SecondaryUploadStatus::COMPLETED);
  EXPECT_EQ(all.front().uploaded_bytes_, 2500);
  EXPECT_GT(all.front().finished_ts_, 0);

  EXPECT_EQ(store.DeleteSecondaryUploads("/photos/a"), 1);
  EXPECT_TRUE(store.GetSecondaryUploads("/photos/a").empty());
  store.UpsertSecondaryUpload(record);

  // Gone together with the gallery
  store.DeletePaths({"/photos/a"});
  store.BatchUpsert({MakeItem("/photos/a")});
  EXPECT_TRUE(store.GetSecondaryUploads("/photos/a").empty());
}

TEST_F(GalleryStoreTests, AsyncWritesKeepSubmissionOrder) {
  GalleryStore store(db_path_);
  auto         written = store.BatchUpsertAsync({MakeItem("/photos/a")});
  auto         deleted = store.DeletePathsAsync({"/photos/a"});
  EXPECT_EQ(written.get().upserted_, 1u);
  EXPECT_EQ(deleted.get(), 1);
  store.Flush();
  EXPECT_TRUE(store.LoadAll().empty());
}
}  // namespace galleryup
