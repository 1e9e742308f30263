#include "ctxbudget/token_counter.hpp"

#include <array>
#include <exception>
#include <utility>

namespace ctxbudget {
namespace {

// Checked in order, so "gpt-4o" must come before "gpt-4".
constexpr std::array<std::pair<const char*, const char*>, 4> kModelPrefixEncodings = {{
    {"gpt-5", "o200k_base"},
    {"gpt-4o", "o200k_base"},
    {"gpt-4", "cl100k_base"},
    {"gpt-3.5", "cl100k_base"},
}};

std::string to_lower(std::string value) {
  for (char& c : value) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return value;
}

std::size_t count_code_points(const std::string& text) {
  std::size_t n = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      ++n;
    }
  }
  return n;
}

}  // namespace

std::size_t heuristic_token_count(const std::string& text) {
  const std::size_t estimate = count_code_points(text) / 4;
  return estimate == 0 ? 1 : estimate;
}

TokenCounter::TokenCounter(const std::string& model, ITokenizerRegistry& registry)
    : encoding_name_(resolve_encoding_name(model, registry)), profile_(load_profile(encoding_name_, registry)) {}

std::size_t TokenCounter::count(const std::string& text) const {
  if (profile_) {
    try {
      return profile_->count_tokens(text);
    } catch (const std::exception&) {
      return heuristic_token_count(text);
    }
  }
  return heuristic_token_count(text);
}

TokenCounterInfo TokenCounter::describe() const {
  TokenCounterInfo info;
  info.mode = profile_ ? kTokenizerMode : kHeuristicMode;
  info.encoding = encoding_name_;
  return info;
}

std::optional<std::string> TokenCounter::resolve_encoding_name(const std::string& model,
                                                               const ITokenizerRegistry& registry) {
  const std::string normalized = to_lower(model);
  for (const auto& [prefix, encoding] : kModelPrefixEncodings) {
    if (normalized.rfind(prefix, 0) == 0) {
      return std::string(encoding);
    }
  }
  try {
    return registry.encoding_for_model(model);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

TokenizerProfilePtr TokenCounter::load_profile(const std::optional<std::string>& name,
                                               ITokenizerRegistry& registry) {
  if (!name.has_value()) {
    return nullptr;
  }
  try {
    if (TokenizerProfilePtr profile = registry.resolve(*name)) {
      return profile;
    }
    TokenizerProfilePtr fallback = make_byte_level_profile(*name);
    registry.register_profile(fallback);
    return fallback;
  } catch (const std::exception&) {
    // Counting degrades to the heuristic; describe() reports it.
    return nullptr;
  }
}

}  // namespace ctxbudget
