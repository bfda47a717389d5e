#ifndef SUGGESTION_GENERATOR_HPP
#define SUGGESTION_GENERATOR_HPP

#include "recommendation_types.hpp"

#include <string>
#include <vector>

namespace recommendation {

// Candidate-suggestion collaborator (typically a language model behind a
// remote API). Its drafts are untrusted: confidence claims are re-validated
// against analysis evidence before ranking.
class ISuggestionGenerator {
public:
  virtual ~ISuggestionGenerator() = default;

  virtual std::vector<SuggestionDraft> generate(const std::string &context,
                                                size_t max_suggestions) = 0;
};

} // namespace recommendation

#endif // SUGGESTION_GENERATOR_HPP
