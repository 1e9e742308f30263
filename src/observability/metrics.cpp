#include "ctxbudget/metrics.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace ctxbudget {
namespace {

std::string format_gauge(double value) {
  if (std::isnan(value)) {
    return "NaN";
  }
  if (std::isinf(value)) {
    return value > 0 ? "+Inf" : "-Inf";
  }
  std::ostringstream out;
  out << value;
  return out.str();
}

}  // namespace

double round_ratio(double value) { return std::round(value * 1000.0) / 1000.0; }

TrimMetrics compute_trim_metrics(std::size_t input_tokens, std::size_t output_tokens,
                                 const TokenCounterInfo& counter_info) {
  TrimMetrics metrics;
  metrics.input_tokens = input_tokens;
  metrics.output_tokens = output_tokens;
  const std::size_t denominator = input_tokens > 0 ? input_tokens : 1;
  metrics.compress_ratio =
      round_ratio(static_cast<double>(output_tokens) / static_cast<double>(denominator));
  metrics.token_counter = counter_info;
  return metrics;
}

MetricsRegistry::MetricsRegistry() { latest_.semantic_retention = std::numeric_limits<double>::quiet_NaN(); }

void MetricsRegistry::observe_trim(double compress_ratio, std::optional<double> semantic_retention) {
  const double retention = semantic_retention.has_value() && std::isfinite(*semantic_retention)
                               ? *semantic_retention
                               : std::numeric_limits<double>::quiet_NaN();
  std::lock_guard<std::mutex> lock(mutex_);
  latest_.compress_ratio = compress_ratio;
  latest_.semantic_retention = retention;
}

void MetricsRegistry::observe_trim(const TrimMetrics& metrics) {
  observe_trim(metrics.compress_ratio, metrics.semantic_retention);
}

MetricsSnapshot MetricsRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

std::string MetricsRegistry::export_prometheus() const {
  const MetricsSnapshot metrics = snapshot();
  std::ostringstream out;
  out << "# HELP compress_ratio Ratio of tokens kept after trimming.\n";
  out << "# TYPE compress_ratio gauge\n";
  out << "compress_ratio " << format_gauge(metrics.compress_ratio) << "\n";
  out << "# HELP semantic_retention Semantic retention score for trimmed context.\n";
  out << "# TYPE semantic_retention gauge\n";
  out << "semantic_retention " << format_gauge(metrics.semantic_retention) << "\n";
  return out.str();
}

}  // namespace ctxbudget
