#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ctxbudget/tokenizer.hpp"
#include "ctxbudget/types.hpp"

namespace ctxbudget {

TrimResult trim_messages(const std::vector<Message>& messages, std::int64_t target_tokens, const std::string& model,
                         ITokenizerRegistry& registry, const TrimOptions& options = {});

}  // namespace ctxbudget
