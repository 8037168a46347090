#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "vidsearch_core/db/frame_store.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace vidsearch_core {

using vidsearch_tests::TestUtilities;

class FrameStoreTest : public vidsearch_tests::FrameStoreTestBase {
 protected:
  std::vector<FrameRecord> video_records(const std::string& path, int scenes = 2, int samples = 3) {
    return TestUtilities::create_test_video_records(path, scenes, samples, kDimension);
  }
};

TEST_F(FrameStoreTest, NewStoreIsEmpty) {
  auto count = frame_store_->count();
  ASSERT_TRUE(count.ok());
  EXPECT_EQ(count.value(), 0u);

  auto info = frame_store_->info();
  ASSERT_TRUE(info.ok());
  EXPECT_EQ(info.value().collection_name, "test_collection");
  EXPECT_EQ(info.value().dimension, kDimension);
  EXPECT_EQ(info.value().total_embeddings, 0u);
}

TEST_F(FrameStoreTest, InsertThenQueryFindsRecordAtZeroDistance) {
  auto records = video_records("/videos/a.mp4");
  auto inserted = frame_store_->insert(records);
  ASSERT_TRUE(inserted.ok());
  EXPECT_EQ(inserted.value().inserted, records.size());
  EXPECT_EQ(inserted.value().replaced, 0u);

  const auto& target = records[4];
  auto hits = frame_store_->query_by_vector(target.embedding, 3);
  ASSERT_TRUE(hits.ok());
  ASSERT_EQ(hits.value().size(), 3u);
  EXPECT_EQ(hits.value()[0].id, target.id);
  ASSERT_TRUE(hits.value()[0].distance.has_value());
  EXPECT_NEAR(*hits.value()[0].distance, 0.0f, 1e-5);
  EXPECT_EQ(hits.value()[0].metadata, target.metadata);
}

TEST_F(FrameStoreTest, QueryResultsAreOrderedByDistance) {
  ASSERT_TRUE(frame_store_->insert(video_records("/videos/a.mp4", 3, 3)).ok());

  auto query = TestUtilities::create_unit_vector("some query", kDimension);
  auto hits = frame_store_->query_by_vector(query, 9);
  ASSERT_TRUE(hits.ok());
  ASSERT_EQ(hits.value().size(), 9u);
  for (size_t i = 1; i < hits.value().size(); ++i) {
    EXPECT_LE(*hits.value()[i - 1].distance, *hits.value()[i].distance);
  }
  for (const auto& hit : hits.value()) {
    EXPECT_GE(*hit.similarity(), -1.0f - 1e-5f);
    EXPECT_LE(*hit.similarity(), 1.0f + 1e-5f);
  }
}

TEST_F(FrameStoreTest, QueryClampsKAndHandlesEmptyStore) {
  auto query = TestUtilities::create_unit_vector("q", kDimension);

  auto empty = frame_store_->query_by_vector(query, 5);
  ASSERT_TRUE(empty.ok());
  EXPECT_TRUE(empty.value().empty());

  ASSERT_TRUE(frame_store_->insert(video_records("/videos/a.mp4", 1, 2)).ok());
  auto clamped = frame_store_->query_by_vector(query, 50);
  ASSERT_TRUE(clamped.ok());
  EXPECT_EQ(clamped.value().size(), 2u);

  auto zero_k = frame_store_->query_by_vector(query, 0);
  ASSERT_TRUE(zero_k.ok());
  EXPECT_TRUE(zero_k.value().empty());
}

TEST_F(FrameStoreTest, QueryWithWrongDimensionFails) {
  auto hits = frame_store_->query_by_vector(std::vector<float>(kDimension + 1, 0.1f), 3);
  ASSERT_FALSE(hits.ok());
  EXPECT_EQ(hits.error().kind, ErrorKind::StoreQueryFailure);
}

TEST_F(FrameStoreTest, EmptyInsertIsEmptyInput) {
  auto inserted = frame_store_->insert({});
  ASSERT_FALSE(inserted.ok());
  EXPECT_EQ(inserted.error().kind, ErrorKind::EmptyInput);
}

TEST_F(FrameStoreTest, DimensionMismatchNamesTheRecord) {
  auto records = video_records("/videos/a.mp4", 1, 2);
  records[1].embedding.push_back(0.5f);

  auto inserted = frame_store_->insert(records);
  ASSERT_FALSE(inserted.ok());
  EXPECT_EQ(inserted.error().kind, ErrorKind::StoreWriteFailure);
  EXPECT_EQ(inserted.error().context, records[1].id);
  EXPECT_EQ(frame_store_->count().value(), 0u);
}

TEST_F(FrameStoreTest, UpsertReplacesExistingIds) {
  auto records = video_records("/videos/a.mp4");
  ASSERT_TRUE(frame_store_->insert(records).ok());

  // Same ids, new vectors and a changed path
  auto replacement = video_records("/videos/moved/a.mp4");
  auto second = frame_store_->insert(replacement);
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(second.value().inserted, 0u);
  EXPECT_EQ(second.value().replaced, records.size());
  EXPECT_EQ(second.value().replaced_from_other_video, records.size());
  EXPECT_EQ(frame_store_->count().value(), records.size());

  auto fetched = frame_store_->get({replacement[0].id});
  ASSERT_TRUE(fetched.ok());
  ASSERT_EQ(fetched.value().size(), 1u);
  EXPECT_EQ(fetched.value()[0].metadata.video_path, "/videos/moved/a.mp4");

  // The index holds the new vector only
  auto hits = frame_store_->query_by_vector(replacement[0].embedding, 10);
  ASSERT_TRUE(hits.ok());
  EXPECT_EQ(hits.value().size(), records.size());
  EXPECT_EQ(hits.value()[0].id, replacement[0].id);
  EXPECT_NEAR(*hits.value()[0].distance, 0.0f, 1e-5);
}

TEST_F(FrameStoreTest, ReinsertingSameVideoIsNotCountedAsForeignReplacement) {
  auto records = video_records("/videos/a.mp4");
  ASSERT_TRUE(frame_store_->insert(records).ok());

  auto again = frame_store_->insert(records);
  ASSERT_TRUE(again.ok());
  EXPECT_EQ(again.value().replaced, records.size());
  EXPECT_EQ(again.value().replaced_from_other_video, 0u);
}

TEST_F(FrameStoreTest, RejectPolicyLeavesPriorRecordsIntact) {
  auto reject_store = make_store(DuplicatePolicy::Reject, "reject_collection");
  auto records = video_records("/videos/a.mp4");
  ASSERT_TRUE(reject_store->insert(records).ok());

  // A batch mixing a new id with an existing one is rejected as a whole
  auto batch = TestUtilities::create_test_video_records("/videos/b.mp4", 3, 3, kDimension);
  auto second = reject_store->insert(batch);
  ASSERT_FALSE(second.ok());
  EXPECT_EQ(second.error().kind, ErrorKind::StoreWriteFailure);
  EXPECT_EQ(reject_store->count().value(), records.size());

  auto fetched = reject_store->get({records[0].id});
  ASSERT_TRUE(fetched.ok());
  ASSERT_EQ(fetched.value().size(), 1u);
  EXPECT_EQ(fetched.value()[0].metadata.video_path, "/videos/a.mp4");

  auto hits = reject_store->query_by_vector(records[0].embedding, 50);
  ASSERT_TRUE(hits.ok());
  EXPECT_EQ(hits.value().size(), records.size());
}

TEST_F(FrameStoreTest, RejectPolicyRejectsDuplicatesWithinBatch) {
  auto reject_store = make_store(DuplicatePolicy::Reject, "reject_collection");
  auto records = video_records("/videos/a.mp4", 1, 2);
  records.push_back(records[0]);

  auto inserted = reject_store->insert(records);
  ASSERT_FALSE(inserted.ok());
  EXPECT_EQ(inserted.error().context, records[0].id);
  EXPECT_EQ(reject_store->count().value(), 0u);
}

TEST_F(FrameStoreTest, CollectionsAreIsolated) {
  auto other = make_store(DuplicatePolicy::Upsert, "other_collection");
  ASSERT_TRUE(frame_store_->insert(video_records("/videos/a.mp4", 1, 2)).ok());
  ASSERT_TRUE(other->insert(video_records("/videos/a.mp4", 2, 2)).ok());

  EXPECT_EQ(frame_store_->count().value(), 2u);
  EXPECT_EQ(other->count().value(), 4u);
}

TEST_F(FrameStoreTest, QueryByMetadataFiltersAndOrders) {
  ASSERT_TRUE(frame_store_->insert(video_records("/videos/b.mp4", 2, 2)).ok());
  ASSERT_TRUE(frame_store_->insert(video_records("/videos/a.mp4", 2, 2)).ok());

  MetadataFilter by_video{{MetadataField::VideoName, std::string("a.mp4")}};
  auto hits = frame_store_->query_by_metadata(by_video, 10);
  ASSERT_TRUE(hits.ok());
  // Both videos share frame ids; upsert keeps the latest metadata for each id
  ASSERT_EQ(hits.value().size(), 4u);
  for (size_t i = 0; i < hits.value().size(); ++i) {
    EXPECT_EQ(hits.value()[i].metadata.video_name, "a.mp4");
    EXPECT_FALSE(hits.value()[i].distance.has_value());
  }
  EXPECT_EQ(hits.value()[0].metadata.scene_idx, 0);
  EXPECT_EQ(hits.value()[3].metadata.scene_idx, 1);

  MetadataFilter by_scene{{MetadataField::VideoName, std::string("a.mp4")},
                          {MetadataField::SceneIdx, int64_t{1}}};
  auto scene_hits = frame_store_->query_by_metadata(by_scene, 10);
  ASSERT_TRUE(scene_hits.ok());
  ASSERT_EQ(scene_hits.value().size(), 2u);
  EXPECT_EQ(scene_hits.value()[0].metadata.frame_idx, 0);
  EXPECT_EQ(scene_hits.value()[1].metadata.frame_idx, 1);

  auto limited = frame_store_->query_by_metadata(by_video, 1);
  ASSERT_TRUE(limited.ok());
  EXPECT_EQ(limited.value().size(), 1u);
}

TEST_F(FrameStoreTest, GetReturnsRequestOrderAndSkipsUnknown) {
  auto records = video_records("/videos/a.mp4");
  ASSERT_TRUE(frame_store_->insert(records).ok());

  auto fetched = frame_store_->get({records[3].id, "scene_9_frame_9_sample_9", records[0].id});
  ASSERT_TRUE(fetched.ok());
  ASSERT_EQ(fetched.value().size(), 2u);
  EXPECT_EQ(fetched.value()[0].id, records[3].id);
  EXPECT_EQ(fetched.value()[1].id, records[0].id);
  EXPECT_EQ(fetched.value()[0].embedding.size(), static_cast<size_t>(kDimension));
  EXPECT_FLOAT_EQ(fetched.value()[0].embedding[2], records[3].embedding[2]);

  auto all = frame_store_->get_all();
  ASSERT_TRUE(all.ok());
  EXPECT_EQ(all.value().size(), records.size());
}

TEST_F(FrameStoreTest, RemoveDeletesFromTableAndIndex) {
  auto records = video_records("/videos/a.mp4");
  ASSERT_TRUE(frame_store_->insert(records).ok());

  auto removed = frame_store_->remove({records[0].id, records[1].id, "missing_id"});
  ASSERT_TRUE(removed.ok());
  EXPECT_EQ(removed.value(), 2u);
  EXPECT_EQ(frame_store_->count().value(), records.size() - 2);

  auto hits = frame_store_->query_by_vector(records[0].embedding, 50);
  ASSERT_TRUE(hits.ok());
  EXPECT_EQ(hits.value().size(), records.size() - 2);
  for (const auto& hit : hits.value()) {
    EXPECT_NE(hit.id, records[0].id);
    EXPECT_NE(hit.id, records[1].id);
  }
}

TEST_F(FrameStoreTest, ClearEmptiesCollection) {
  ASSERT_TRUE(frame_store_->insert(video_records("/videos/a.mp4")).ok());

  auto cleared = frame_store_->clear();
  ASSERT_TRUE(cleared.ok());
  EXPECT_EQ(cleared.value(), 6u);
  EXPECT_EQ(frame_store_->count().value(), 0u);

  auto hits = frame_store_->query_by_vector(TestUtilities::create_unit_vector("x", kDimension), 5);
  ASSERT_TRUE(hits.ok());
  EXPECT_TRUE(hits.value().empty());
}

TEST_F(FrameStoreTest, ReopenedStoreRebuildsIndex) {
  auto records = video_records("/videos/a.mp4");
  ASSERT_TRUE(frame_store_->insert(records).ok());
  frame_store_.reset();

  auto reopened = make_store(DuplicatePolicy::Upsert);
  EXPECT_EQ(reopened->count().value(), records.size());
  auto hits = reopened->query_by_vector(records[2].embedding, 1);
  ASSERT_TRUE(hits.ok());
  ASSERT_EQ(hits.value().size(), 1u);
  EXPECT_EQ(hits.value()[0].id, records[2].id);
}

TEST_F(FrameStoreTest, ReopeningWithDifferentDimensionThrows) {
  StoreOptions options;
  options.collection_name = "test_collection";
  options.dimension = kDimension * 2;
  EXPECT_THROW({ FrameStore store(db_manager_, options); }, FrameStoreError);
}

TEST(DuplicatePolicyTest, ParsesKnownNames) {
  EXPECT_EQ(duplicate_policy_from_string("upsert"), DuplicatePolicy::Upsert);
  EXPECT_EQ(duplicate_policy_from_string("reject"), DuplicatePolicy::Reject);
  EXPECT_EQ(to_string(DuplicatePolicy::Reject), "reject");
  EXPECT_THROW(duplicate_policy_from_string("merge"), std::invalid_argument);
}

TEST(MetadataFieldTest, RoundTripsColumnNames) {
  EXPECT_EQ(metadata_field_from_string("scene_idx"), MetadataField::SceneIdx);
  EXPECT_EQ(to_string(MetadataField::VideoPath), "video_path");
  EXPECT_FALSE(metadata_field_from_string("embedding").has_value());
}

}  // namespace vidsearch_core
