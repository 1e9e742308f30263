#include "ctxbudget/request_log.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace ctxbudget {
namespace {

std::string json_escape(const std::string& input) {
  std::string out;
  out.reserve(input.size() + 2);
  for (char c : input) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  return out;
}

void write_number(std::ostringstream& out, double value) {
  if (std::isfinite(value)) {
    out << value;
  } else {
    out << "null";
  }
}

}  // namespace

TrimLogRecord make_log_record(const std::string& model, const TrimMetrics& metrics, double latency_ms) {
  TrimLogRecord record;
  record.model = model;
  record.token_in = metrics.input_tokens;
  record.token_out = metrics.output_tokens;
  record.compress_ratio = metrics.compress_ratio;
  record.semantic_retention = metrics.semantic_retention;
  record.latency_ms = latency_ms;
  return record;
}

std::string to_json(const TrimLogRecord& record) {
  std::ostringstream out;
  out << "{\"status\":\"" << json_escape(record.status) << "\"";
  out << ",\"model\":\"" << json_escape(record.model) << "\"";
  out << ",\"token_in\":" << record.token_in;
  out << ",\"token_out\":" << record.token_out;
  out << ",\"compress_ratio\":";
  write_number(out, record.compress_ratio);
  out << ",\"semantic_retention\":";
  if (record.semantic_retention.has_value()) {
    write_number(out, *record.semantic_retention);
  } else {
    out << "null";
  }
  out << ",\"latency_ms\":";
  write_number(out, record.latency_ms);
  if (!record.error.empty()) {
    out << ",\"error\":\"" << json_escape(record.error) << "\"";
  }
  out << "}";
  return out.str();
}

RequestLogger::RequestLogger(std::ostream& sink) : sink_(sink) {}

void RequestLogger::emit(const TrimLogRecord& record) {
  const std::string line = to_json(record);
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ << line << '\n';
  sink_.flush();
  ++emitted_;
}

std::size_t RequestLogger::emitted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return emitted_;
}

}  // namespace ctxbudget
