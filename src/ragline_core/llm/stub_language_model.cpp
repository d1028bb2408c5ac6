#include "ragline_core/llm/stub_language_model.hpp"

namespace ragline_core {

std::vector<float> StubLanguageModel::embed(const std::string & /*text*/) {
  return std::vector<float>(dimension_, 0.0f);
}

std::string StubLanguageModel::generate(const std::string & /*prompt*/,
                                        const std::string & /*context*/) {
  return STUB_RESPONSE;
}

}  // namespace ragline_core
