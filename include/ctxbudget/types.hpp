#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ctxbudget {

inline constexpr const char* kSystemRole = "system";
inline constexpr const char* kUserRole = "user";

struct Message {
  std::string role;
  std::string content;
};

inline bool operator==(const Message& a, const Message& b) {
  return a.role == b.role && a.content == b.content;
}

using RoleSet = std::set<std::string>;

// Half-open range [begin, end) of positions in the conversation.
struct Turn {
  std::size_t begin{0};
  std::size_t end{0};

  std::size_t size() const { return end - begin; }
};

struct TokenCounterInfo {
  std::string mode;
  std::optional<std::string> encoding;
};

struct TrimMetrics {
  std::size_t input_tokens{0};
  std::size_t output_tokens{0};
  double compress_ratio{0.0};
  TokenCounterInfo token_counter;
  std::optional<double> semantic_retention;
};

struct TrimOptions {
  int min_turns{0};
  RoleSet priority_roles;
};

struct TrimResult {
  std::vector<Message> messages;
  TrimMetrics metrics;
};

}  // namespace ctxbudget
