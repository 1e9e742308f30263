#include "ctxbudget/tokenizer.hpp"

#include <memory>
#include <string>
#include <utility>

namespace ctxbudget {
namespace {

constexpr std::size_t kByteTokens = 256;

// Every byte value is its own token; the extra id is the end-of-text marker,
// which plain text never encodes to.
class ByteLevelProfile final : public ITokenizerProfile {
 public:
  explicit ByteLevelProfile(std::string name) : name_(std::move(name)) {}

  std::string name() const override { return name_; }

  std::size_t vocab_size() const override { return kByteTokens + 1; }

  std::size_t count_tokens(const std::string& text) const override { return text.size(); }

 private:
  std::string name_;
};

}  // namespace

TokenizerProfilePtr make_byte_level_profile(const std::string& name) {
  return std::make_shared<ByteLevelProfile>(name);
}

}  // namespace ctxbudget
