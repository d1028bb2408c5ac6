#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "ragline_core/services/knowledge_base_service.hpp"
#include "ragline_core/vector/in_memory_vector_index.hpp"

namespace ragline_core {

using ragline_tests::kTestDimension;
using ragline_tests::TestUtilities;

class KnowledgeBaseServiceTest : public ragline_tests::DatabaseTestBase {
 protected:
  void SetUp() override {
    DatabaseTestBase::SetUp();
    vector_index_ = std::make_shared<InMemoryVectorIndex>(kTestDimension);
    service_ = std::make_unique<KnowledgeBaseService>(knowledge_base_store_, fragment_store_,
                                                      vector_index_,
                                                      std::make_shared<ScopeLocks>());
  }

  void TearDown() override {
    service_.reset();
    DatabaseTestBase::TearDown();
  }

  std::shared_ptr<InMemoryVectorIndex> vector_index_;
  std::unique_ptr<KnowledgeBaseService> service_;
};

TEST_F(KnowledgeBaseServiceTest, Create_TrimsNameAndAssignsId) {
  KnowledgeBase created = service_->create("  Handbook \n", std::string("HR policies"));

  EXPECT_EQ(created.name, "Handbook");
  EXPECT_EQ(created.description, std::string("HR policies"));
  EXPECT_EQ(created.id.size(), 36u);
  EXPECT_EQ(service_->get(created.id).name, "Handbook");
}

TEST_F(KnowledgeBaseServiceTest, Create_BlankName_Throws) {
  EXPECT_THROW(service_->create(""), ValidationError);
  EXPECT_THROW(service_->create("   \t"), ValidationError);
  EXPECT_TRUE(service_->list().empty());
}

TEST_F(KnowledgeBaseServiceTest, Get_Missing_ThrowsNotFound) {
  EXPECT_THROW(service_->get("missing"), NotFoundError);
}

TEST_F(KnowledgeBaseServiceTest, List_ReturnsCreatedKnowledgeBases) {
  service_->create("One");
  service_->create("Two");

  EXPECT_EQ(service_->list().size(), 2u);
}

TEST_F(KnowledgeBaseServiceTest, Remove_DropsDocumentsFragmentsAndVectors) {
  // Arrange
  KnowledgeBase doomed = service_->create("Doomed");
  KnowledgeBase kept = service_->create("Kept");
  seed_document(doomed.id, "doc1");
  seed_document(kept.id, "doc2");
  auto doomed_fragments = TestUtilities::create_test_fragments(2, "doc1", doomed.id);
  auto kept_fragments = TestUtilities::create_test_fragments(1, "doc2", kept.id);
  fragment_store_->save_fragments(doomed_fragments);
  fragment_store_->save_fragments(kept_fragments);
  vector_index_->store(doomed_fragments);
  vector_index_->store(kept_fragments);

  // Act
  service_->remove(doomed.id);

  // Assert
  EXPECT_THROW(service_->get(doomed.id), NotFoundError);
  EXPECT_FALSE(knowledge_base_store_->get_document("doc1").has_value());
  EXPECT_EQ(fragment_store_->count(doomed.id), 0);
  EXPECT_EQ(fragment_store_->count(kept.id), 1);
  EXPECT_EQ(vector_index_->size(), 1u);
}

TEST_F(KnowledgeBaseServiceTest, Remove_Missing_ThrowsNotFound) {
  EXPECT_THROW(service_->remove("missing"), NotFoundError);
}

}  // namespace ragline_core
