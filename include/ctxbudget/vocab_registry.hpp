#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "ctxbudget/tokenizer.hpp"

namespace ctxbudget {

class VocabRegistry final : public ITokenizerRegistry {
 public:
  explicit VocabRegistry(std::string vocab_dir = "");

  TokenizerProfilePtr resolve(const std::string& profile_name) override;
  std::optional<std::string> encoding_for_model(const std::string& model) const override;
  void register_profile(TokenizerProfilePtr profile) override;

  void load_aliases_from_tsv(const std::string& path);
  bool add_alias(const std::string& model, const std::string& encoding, std::string& error);
  std::size_t profile_count() const;

 private:
  std::string vocab_dir_;
  mutable std::mutex mutex_;
  std::map<std::string, TokenizerProfilePtr> profiles_;
  std::map<std::string, std::string> aliases_;

  std::string path_for(const std::string& profile_name) const;
};

}  // namespace ctxbudget
