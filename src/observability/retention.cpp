#include "ctxbudget/retention.hpp"

#include <cmath>
#include <exception>
#include <utility>

#include "ctxbudget/metrics.hpp"

namespace ctxbudget {
namespace {

std::string aggregate(const std::vector<Message>& messages) {
  std::string out;
  for (const auto& message : messages) {
    if (message.content.empty()) {
      continue;
    }
    if (!out.empty()) {
      out.push_back('\n');
    }
    out += message.content;
  }
  return out;
}

double norm(const std::vector<double>& v) {
  double sum = 0.0;
  for (double x : v) {
    sum += x * x;
  }
  return std::sqrt(sum);
}

}  // namespace

std::optional<double> cosine_similarity(const std::vector<double>& a, const std::vector<double>& b) {
  if (a.empty() || b.empty()) {
    return std::nullopt;
  }
  const double denom = norm(a) * norm(b);
  if (denom == 0.0) {
    return std::nullopt;
  }
  double dot = 0.0;
  const std::size_t n = a.size() < b.size() ? a.size() : b.size();
  for (std::size_t i = 0; i < n; ++i) {
    dot += a[i] * b[i];
  }
  // Opposed embeddings score 0; floating error can push equal ones past 1.
  const double cosine = dot / denom;
  return round_ratio(cosine < 0.0 ? 0.0 : (cosine > 1.0 ? 1.0 : cosine));
}

EmbeddingRetentionScorer::EmbeddingRetentionScorer(Embedder embedder) : embedder_(std::move(embedder)) {}

std::optional<double> EmbeddingRetentionScorer::score(const std::vector<Message>& before,
                                                      const std::vector<Message>& after) {
  if (!embedder_) {
    return std::nullopt;
  }
  const std::string before_text = aggregate(before);
  const std::string after_text = aggregate(after);
  if (before_text.empty() || after_text.empty()) {
    return std::nullopt;
  }
  try {
    return cosine_similarity(embedder_(before_text), embedder_(after_text));
  } catch (const std::exception&) {
    // The score is optional telemetry; an embedder failure leaves it unset.
    return std::nullopt;
  }
}

void apply_retention(TrimResult& result, const std::vector<Message>& before, IRetentionScorer& scorer) {
  if (result.metrics.semantic_retention.has_value()) {
    return;
  }
  result.metrics.semantic_retention = scorer.score(before, result.messages);
}

}  // namespace ctxbudget
