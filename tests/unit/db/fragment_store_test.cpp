#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "ragline_core/db/fragment_store.hpp"

namespace ragline_core {

using ragline_tests::TestUtilities;

class FragmentStoreTest : public ragline_tests::DatabaseTestBase {};

TEST_F(FragmentStoreTest, SaveAndLoad_PreservesContentMetadataAndEmbedding) {
  // Arrange
  seed_document("kb1", "doc1");
  auto fragments = TestUtilities::create_test_fragments(3, "doc1", "kb1", "héllo wörld");
  fragments[1].metadata[kMetaPage] = 4;

  // Act
  fragment_store_->save_fragments(fragments);
  auto loaded = fragment_store_->load_by_document("doc1");

  // Assert
  ASSERT_EQ(loaded.size(), 3u);
  for (size_t i = 0; i < loaded.size(); ++i) {
    EXPECT_EQ(loaded[i].id, fragments[i].id);
    EXPECT_EQ(loaded[i].document_id, "doc1");
    EXPECT_EQ(loaded[i].knowledge_base_id, "kb1");
    EXPECT_EQ(loaded[i].content, fragments[i].content);
    EXPECT_EQ(loaded[i].metadata, fragments[i].metadata);
    ASSERT_TRUE(loaded[i].embedding.has_value());
    EXPECT_EQ(*loaded[i].embedding, *fragments[i].embedding);
  }
  EXPECT_EQ(loaded[1].page(), 4);
  EXPECT_EQ(loaded[0].source_document(), "notes.txt");
}

TEST_F(FragmentStoreTest, Save_FragmentWithoutEmbedding_LoadsWithoutEmbedding) {
  seed_document("kb1", "doc1");
  auto fragments = TestUtilities::create_test_fragments(1, "doc1", "kb1");
  fragments[0].embedding.reset();

  fragment_store_->save_fragments(fragments);
  auto loaded = fragment_store_->load_all();

  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_FALSE(loaded[0].embedding.has_value());
}

TEST_F(FragmentStoreTest, Save_UnknownDocument_ThrowsAndSavesNothing) {
  // Arrange: the second fragment references a document that does not exist
  seed_document("kb1", "doc1");
  auto fragments = TestUtilities::create_test_fragments(2, "doc1", "kb1");
  fragments[1].document_id = "ghost";

  // Act & Assert
  EXPECT_THROW(fragment_store_->save_fragments(fragments), FragmentStoreError);
  EXPECT_TRUE(fragment_store_->load_all().empty());
}

TEST_F(FragmentStoreTest, LoadByKnowledgeBase_FiltersScope) {
  seed_document("kb1", "doc1");
  seed_document("kb2", "doc2");
  fragment_store_->save_fragments(TestUtilities::create_test_fragments(2, "doc1", "kb1"));
  fragment_store_->save_fragments(TestUtilities::create_test_fragments(3, "doc2", "kb2"));

  EXPECT_EQ(fragment_store_->load_by_knowledge_base("kb1").size(), 2u);
  EXPECT_EQ(fragment_store_->load_by_knowledge_base("kb2").size(), 3u);
  EXPECT_EQ(fragment_store_->load_all().size(), 5u);
  EXPECT_EQ(fragment_store_->count("kb2"), 3);
}

TEST_F(FragmentStoreTest, DeleteByDocument_ReturnsRemovedCount) {
  seed_document("kb1", "doc1");
  seed_document("kb1", "doc2");
  fragment_store_->save_fragments(TestUtilities::create_test_fragments(2, "doc1", "kb1"));
  fragment_store_->save_fragments(TestUtilities::create_test_fragments(1, "doc2", "kb1"));

  EXPECT_EQ(fragment_store_->delete_by_document("doc1"), 2);
  EXPECT_EQ(fragment_store_->delete_by_document("doc1"), 0);
  EXPECT_EQ(fragment_store_->count("kb1"), 1);
}

TEST_F(FragmentStoreTest, DeleteByKnowledgeBase_ReturnsRemovedCount) {
  seed_document("kb1", "doc1");
  seed_document("kb2", "doc2");
  fragment_store_->save_fragments(TestUtilities::create_test_fragments(2, "doc1", "kb1"));
  fragment_store_->save_fragments(TestUtilities::create_test_fragments(1, "doc2", "kb2"));

  EXPECT_EQ(fragment_store_->delete_by_knowledge_base("kb1"), 2);
  EXPECT_EQ(fragment_store_->load_all().size(), 1u);
}

TEST_F(FragmentStoreTest, DeletingDocumentRow_CascadesToFragments) {
  seed_document("kb1", "doc1");
  fragment_store_->save_fragments(TestUtilities::create_test_fragments(2, "doc1", "kb1"));

  knowledge_base_store_->delete_document("doc1");

  EXPECT_TRUE(fragment_store_->load_by_document("doc1").empty());
}

TEST_F(FragmentStoreTest, SaveEmptyBatch_IsNoOp) {
  EXPECT_NO_THROW(fragment_store_->save_fragments({}));
  EXPECT_TRUE(fragment_store_->load_all().empty());
}

}  // namespace ragline_core
