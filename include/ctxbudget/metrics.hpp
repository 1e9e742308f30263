#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

#include "ctxbudget/types.hpp"

namespace ctxbudget {

double round_ratio(double value);

TrimMetrics compute_trim_metrics(std::size_t input_tokens, std::size_t output_tokens,
                                 const TokenCounterInfo& counter_info);

struct MetricsSnapshot {
  double compress_ratio{1.0};
  double semantic_retention{0.0};  // NaN while no score has been observed
};

// Latest trim gauges for the metrics endpoint.
class MetricsRegistry {
 public:
  MetricsRegistry();

  void observe_trim(double compress_ratio, std::optional<double> semantic_retention = std::nullopt);
  void observe_trim(const TrimMetrics& metrics);
  MetricsSnapshot snapshot() const;
  std::string export_prometheus() const;

 private:
  mutable std::mutex mutex_;
  MetricsSnapshot latest_;
};

}  // namespace ctxbudget
