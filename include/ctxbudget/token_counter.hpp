#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "ctxbudget/tokenizer.hpp"
#include "ctxbudget/types.hpp"

namespace ctxbudget {

inline constexpr const char* kTokenizerMode = "tokenizer";
inline constexpr const char* kHeuristicMode = "heuristic";

std::size_t heuristic_token_count(const std::string& text);

class TokenCounter {
 public:
  TokenCounter(const std::string& model, ITokenizerRegistry& registry);

  std::size_t count(const std::string& text) const;
  TokenCounterInfo describe() const;

 private:
  std::optional<std::string> encoding_name_;
  TokenizerProfilePtr profile_;

  static std::optional<std::string> resolve_encoding_name(const std::string& model,
                                                          const ITokenizerRegistry& registry);
  static TokenizerProfilePtr load_profile(const std::optional<std::string>& name, ITokenizerRegistry& registry);
};

}  // namespace ctxbudget
