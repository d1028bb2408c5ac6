#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "../../common/mocks_test.hpp"
#include "ragline_core/services/query_service.hpp"
#include "ragline_core/vector/in_memory_vector_index.hpp"

namespace ragline_core {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;
using ragline_tests::kTestDimension;
using ragline_tests::MockUtilities::create_test_embedding;
using ragline_tests::MockUtilities::create_test_fragment;

class QueryServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    language_model_ = std::make_shared<NiceMock<ragline_tests::MockLanguageModel>>();
    interaction_store_ = std::make_shared<NiceMock<ragline_tests::MockInteractionStore>>();
    vector_index_ = std::make_shared<InMemoryVectorIndex>(kTestDimension);
    service_ = std::make_unique<QueryService>(language_model_, vector_index_, interaction_store_);

    ON_CALL(*language_model_, embed(_)).WillByDefault(Return(create_test_embedding(1.0f)));
  }

  // Two fragments in kb1 and one in kb2
  void seed_index() {
    vector_index_->store(
        {create_test_fragment("f-paris", "kb1", "Paris is the capital of France.",
                              create_test_embedding(1.0f), "doc-geo", "geography.txt", 3),
         create_test_fragment("f-banana", "kb1", "Bananas grow in tropical climates.",
                              create_test_embedding(2.0f), "doc-fruit", "fruit.md", 1),
         create_test_fragment("f-other", "kb2", "Paris hosts other things.",
                              create_test_embedding(1.0f), "doc-x", "x.txt", 1)});
  }

  std::shared_ptr<NiceMock<ragline_tests::MockLanguageModel>> language_model_;
  std::shared_ptr<NiceMock<ragline_tests::MockInteractionStore>> interaction_store_;
  std::shared_ptr<InMemoryVectorIndex> vector_index_;
  std::unique_ptr<QueryService> service_;
};

TEST_F(QueryServiceTest, Constructor_MissingDependency_Throws) {
  EXPECT_THROW((QueryService(nullptr, vector_index_, interaction_store_)),
               std::invalid_argument);
  EXPECT_THROW((QueryService(language_model_, nullptr, interaction_store_)),
               std::invalid_argument);
  EXPECT_THROW((QueryService(language_model_, vector_index_, nullptr)),
               std::invalid_argument);
}

TEST_F(QueryServiceTest, Constructor_NonPositiveTopK_Throws) {
  QueryOptions options;
  options.top_k = 0;
  EXPECT_THROW((QueryService(language_model_, vector_index_, interaction_store_, options)),
               std::invalid_argument);
}

TEST_F(QueryServiceTest, Execute_NoFragmentsInScope_ReturnsUnknownWithoutGenerating) {
  // Arrange
  Interaction saved;
  EXPECT_CALL(*language_model_, generate(_, _)).Times(0);
  EXPECT_CALL(*interaction_store_, save(_)).WillOnce(SaveArg<0>(&saved));

  // Act
  QueryResult result = service_->execute("kb1", "What is the capital of France?");

  // Assert
  EXPECT_EQ(result.status, InteractionStatus::UNKNOWN);
  EXPECT_EQ(result.answer, std::string(QueryService::UNKNOWN_MESSAGE));
  EXPECT_TRUE(result.citations.empty());
  EXPECT_EQ(saved.id, result.interaction_id);
  EXPECT_EQ(saved.status, InteractionStatus::UNKNOWN);
  EXPECT_EQ(saved.answer, std::string(QueryService::UNKNOWN_MESSAGE));
  EXPECT_TRUE(saved.citations.empty());
  EXPECT_EQ(saved.knowledge_base_id, "kb1");
  EXPECT_EQ(saved.question, "What is the capital of France?");
}

TEST_F(QueryServiceTest, Execute_OtherScopeOnly_ReturnsUnknown) {
  vector_index_->store({create_test_fragment("f-other", "kb2", "Paris", create_test_embedding(1.0f))});
  EXPECT_CALL(*language_model_, generate(_, _)).Times(0);

  QueryResult result = service_->execute("kb1", "Where is Paris?");

  EXPECT_EQ(result.status, InteractionStatus::UNKNOWN);
}

TEST_F(QueryServiceTest, Execute_GroundedAnswer_ReturnsAnsweredWithCitations) {
  // Arrange
  seed_index();
  Interaction saved;
  EXPECT_CALL(*language_model_, generate(_, _)).WillOnce(Return("Paris is the capital"));
  EXPECT_CALL(*interaction_store_, save(_)).WillOnce(SaveArg<0>(&saved));

  // Act
  QueryResult result = service_->execute("kb1", "What is the capital of France?");

  // Assert
  EXPECT_EQ(result.status, InteractionStatus::ANSWERED);
  EXPECT_EQ(result.answer, std::string("Paris is the capital"));
  ASSERT_EQ(result.citations.size(), 1u);
  EXPECT_EQ(result.citations[0].fragment_id, "f-paris");
  EXPECT_EQ(result.citations[0].source_document, "geography.txt");
  EXPECT_EQ(result.citations[0].page, 3);
  EXPECT_DOUBLE_EQ(result.citations[0].relevance_score, 0.0);
  EXPECT_EQ(saved.status, InteractionStatus::ANSWERED);
  EXPECT_EQ(saved.citations, result.citations);
  EXPECT_EQ(saved.id, result.interaction_id);
}

TEST_F(QueryServiceTest, Execute_CitationsFollowRetrievalOrder) {
  seed_index();
  // Both kb1 fragments contain a word of the answer; f-paris is nearer the query
  EXPECT_CALL(*language_model_, generate(_, _)).WillOnce(Return("bananas paris"));

  QueryResult result = service_->execute("kb1", "fruit and cities?");

  ASSERT_EQ(result.citations.size(), 2u);
  EXPECT_EQ(result.citations[0].fragment_id, "f-paris");
  EXPECT_EQ(result.citations[1].fragment_id, "f-banana");
}

TEST_F(QueryServiceTest, Execute_UngroundedAnswer_ReturnsUnknownWithoutCitations) {
  // Arrange
  seed_index();
  Interaction saved;
  EXPECT_CALL(*language_model_, generate(_, _))
      .WillOnce(Return("Quantum chromodynamics governs gluons"));
  EXPECT_CALL(*interaction_store_, save(_)).WillOnce(SaveArg<0>(&saved));

  // Act
  QueryResult result = service_->execute("kb1", "What binds quarks?");

  // Assert
  EXPECT_EQ(result.status, InteractionStatus::UNKNOWN);
  EXPECT_EQ(result.answer, std::string(QueryService::UNKNOWN_MESSAGE));
  EXPECT_TRUE(result.citations.empty());
  EXPECT_EQ(saved.status, InteractionStatus::UNKNOWN);
  EXPECT_EQ(saved.answer, std::string(QueryService::UNKNOWN_MESSAGE));
}

TEST_F(QueryServiceTest, Execute_PromptCarriesContextAndQuestion) {
  // Arrange
  seed_index();
  std::string prompt;
  std::string context;
  EXPECT_CALL(*language_model_, generate(_, _))
      .WillOnce(::testing::DoAll(SaveArg<0>(&prompt), SaveArg<1>(&context),
                                 Return("Paris is the capital")));

  // Act
  service_->execute("kb1", "What is the capital of France?");

  // Assert
  EXPECT_EQ(context,
            "[Chunk f-paris]: Paris is the capital of France.\n\n"
            "[Chunk f-banana]: Bananas grow in tropical climates.");
  EXPECT_THAT(prompt, HasSubstr("based ONLY on the provided context"));
  EXPECT_THAT(prompt, HasSubstr("Context:\n" + context));
  EXPECT_THAT(prompt, HasSubstr("Question: What is the capital of France?"));
  EXPECT_THAT(prompt, ::testing::Not(HasSubstr("f-other")));
}

TEST_F(QueryServiceTest, Execute_RespectsTopK) {
  // Arrange
  seed_index();
  QueryOptions options;
  options.top_k = 1;
  QueryService service(language_model_, vector_index_, interaction_store_, options);
  std::string context;
  EXPECT_CALL(*language_model_, generate(_, _))
      .WillOnce(::testing::DoAll(SaveArg<1>(&context), Return("paris")));

  // Act
  service.execute("kb1", "capital?");

  // Assert
  EXPECT_EQ(context, "[Chunk f-paris]: Paris is the capital of France.");
}

TEST_F(QueryServiceTest, Execute_SearchesScopeWithQuestionVectorAndConfiguredTopK) {
  // Arrange
  auto mock_index = std::make_shared<NiceMock<ragline_tests::MockVectorIndex>>();
  QueryOptions options;
  options.top_k = 7;
  QueryService service(language_model_, mock_index, interaction_store_, options);
  EXPECT_CALL(*mock_index, search(create_test_embedding(1.0f), "kb9", 7))
      .WillOnce(Return(std::vector<FragmentSearchResult>{}));

  // Act
  QueryResult result = service.execute("kb9", "Anything here?");

  // Assert
  EXPECT_EQ(result.status, InteractionStatus::UNKNOWN);
}

TEST_F(QueryServiceTest, Execute_IndexFailure_PropagatesWithoutRecording) {
  auto mock_index = std::make_shared<NiceMock<ragline_tests::MockVectorIndex>>();
  QueryService service(language_model_, mock_index, interaction_store_);
  EXPECT_CALL(*mock_index, search(_, _, _)).WillOnce(Throw(VectorIndexError("index corrupt")));
  EXPECT_CALL(*interaction_store_, save(_)).Times(0);

  EXPECT_THROW(service.execute("kb1", "anything"), VectorIndexError);
}

TEST_F(QueryServiceTest, Execute_EmbeddingFails_ReturnsErrorAndRecordsIt) {
  // Arrange
  Interaction saved;
  EXPECT_CALL(*language_model_, embed(_)).WillOnce(Throw(LanguageModelError("connection refused")));
  EXPECT_CALL(*language_model_, generate(_, _)).Times(0);
  EXPECT_CALL(*interaction_store_, save(_)).WillOnce(SaveArg<0>(&saved));

  // Act
  QueryResult result = service_->execute("kb1", "anything");

  // Assert
  EXPECT_EQ(result.status, InteractionStatus::ERROR);
  EXPECT_FALSE(result.answer.has_value());
  EXPECT_TRUE(result.citations.empty());
  EXPECT_FALSE(result.interaction_id.empty());
  EXPECT_EQ(saved.id, result.interaction_id);
  EXPECT_EQ(saved.status, InteractionStatus::ERROR);
  EXPECT_FALSE(saved.answer.has_value());
}

TEST_F(QueryServiceTest, Execute_GenerationFails_ReturnsError) {
  seed_index();
  Interaction saved;
  EXPECT_CALL(*language_model_, generate(_, _)).WillOnce(Throw(LanguageModelError("timed out")));
  EXPECT_CALL(*interaction_store_, save(_)).WillOnce(SaveArg<0>(&saved));

  QueryResult result = service_->execute("kb1", "What is the capital of France?");

  EXPECT_EQ(result.status, InteractionStatus::ERROR);
  EXPECT_FALSE(result.answer.has_value());
  EXPECT_EQ(saved.status, InteractionStatus::ERROR);
}

TEST_F(QueryServiceTest, Execute_ErrorStillReturnedWhenRecordingFails) {
  EXPECT_CALL(*language_model_, embed(_)).WillOnce(Throw(LanguageModelError("down")));
  EXPECT_CALL(*interaction_store_, save(_)).WillOnce(Throw(InteractionStoreError("disk full")));

  QueryResult result = service_->execute("kb1", "anything");

  EXPECT_EQ(result.status, InteractionStatus::ERROR);
}

TEST_F(QueryServiceTest, Execute_RecordingFailsOnSuccessPath_Throws) {
  EXPECT_CALL(*interaction_store_, save(_)).WillOnce(Throw(InteractionStoreError("disk full")));

  EXPECT_THROW(service_->execute("kb1", "anything"), InteractionStoreError);
}

TEST_F(QueryServiceTest, Execute_EmbeddingDimensionMismatch_Throws) {
  EXPECT_CALL(*language_model_, embed(_))
      .WillOnce(Return(std::vector<float>(kTestDimension + 2, 0.0f)));
  EXPECT_CALL(*interaction_store_, save(_)).Times(0);

  EXPECT_THROW(service_->execute("kb1", "anything"), VectorIndexError);
}

TEST_F(QueryServiceTest, Execute_EveryCallGetsDistinctInteractionId) {
  std::set<std::string> ids;
  EXPECT_CALL(*interaction_store_, save(_)).Times(5);

  for (int i = 0; i < 5; ++i) {
    ids.insert(service_->execute("kb1", "question " + std::to_string(i)).interaction_id);
  }

  EXPECT_EQ(ids.size(), 5u);
}

TEST_F(QueryServiceTest, BuildContext_SingleFragmentHasNoSeparator) {
  std::vector<Fragment> fragments = {
      create_test_fragment("only", "kb1", "the text", create_test_embedding(1.0f))};

  EXPECT_EQ(QueryService::build_context(fragments), "[Chunk only]: the text");
  EXPECT_EQ(QueryService::build_context({}), "");
}

}  // namespace ragline_core
