#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ctxbudget/types.hpp"

namespace ctxbudget {

// Rates how much meaning survived a trim, in [0, 1]. nullopt when the scorer
// is unavailable or the inputs are degenerate.
class IRetentionScorer {
 public:
  virtual ~IRetentionScorer() = default;
  virtual std::optional<double> score(const std::vector<Message>& before, const std::vector<Message>& after) = 0;
};

using Embedder = std::function<std::vector<double>(const std::string&)>;

class EmbeddingRetentionScorer final : public IRetentionScorer {
 public:
  explicit EmbeddingRetentionScorer(Embedder embedder);

  std::optional<double> score(const std::vector<Message>& before, const std::vector<Message>& after) override;

 private:
  Embedder embedder_;
};

std::optional<double> cosine_similarity(const std::vector<double>& a, const std::vector<double>& b);

// Fills metrics.semantic_retention unless a score is already present.
void apply_retention(TrimResult& result, const std::vector<Message>& before, IRetentionScorer& scorer);

}  // namespace ctxbudget
