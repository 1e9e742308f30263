#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

#include "ctxbudget/types.hpp"

namespace ctxbudget {

struct TrimLogRecord {
  std::string status{"success"};
  std::string model;
  std::size_t token_in{0};
  std::size_t token_out{0};
  double compress_ratio{0.0};
  std::optional<double> semantic_retention;
  double latency_ms{0.0};
  std::string error;
};

TrimLogRecord make_log_record(const std::string& model, const TrimMetrics& metrics, double latency_ms);

// One JSON object; an unset retention is written as null, never NaN.
std::string to_json(const TrimLogRecord& record);

class RequestLogger {
 public:
  explicit RequestLogger(std::ostream& sink);

  void emit(const TrimLogRecord& record);
  std::size_t emitted() const;

 private:
  std::ostream& sink_;
  mutable std::mutex mutex_;
  std::size_t emitted_{0};
};

}  // namespace ctxbudget
