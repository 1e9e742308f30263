#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace ctxbudget {

class ITokenizerProfile {
 public:
  virtual ~ITokenizerProfile() = default;
  virtual std::string name() const = 0;
  virtual std::size_t vocab_size() const = 0;
  virtual std::size_t count_tokens(const std::string& text) const = 0;
};

using TokenizerProfilePtr = std::shared_ptr<const ITokenizerProfile>;

// Source of tokenizer profiles. Lookups never throw: an unknown or unloadable
// profile is reported as nullptr so callers can fall back.
class ITokenizerRegistry {
 public:
  virtual ~ITokenizerRegistry() = default;
  virtual TokenizerProfilePtr resolve(const std::string& profile_name) = 0;
  virtual std::optional<std::string> encoding_for_model(const std::string& model) const = 0;
  virtual void register_profile(TokenizerProfilePtr profile) = 0;
};

// One token per byte value plus a terminal token; needs no external assets.
TokenizerProfilePtr make_byte_level_profile(const std::string& name);

bool llama_vocab_support_available();
TokenizerProfilePtr load_llama_vocab_profile(const std::string& name, const std::string& gguf_path);

}  // namespace ctxbudget
