#include "ctxbudget/context_trimmer.hpp"

#include <algorithm>

#include "ctxbudget/budget_allocator.hpp"
#include "ctxbudget/metrics.hpp"
#include "ctxbudget/selector.hpp"
#include "ctxbudget/token_counter.hpp"
#include "ctxbudget/turn_grouper.hpp"

namespace ctxbudget {

TrimResult trim_messages(const std::vector<Message>& messages, std::int64_t target_tokens, const std::string& model,
                         ITokenizerRegistry& registry, const TrimOptions& options) {
  const TokenCounter counter(model, registry);

  std::vector<std::size_t> system_positions;
  std::vector<std::size_t> conversation_positions;
  std::vector<Message> system_messages;
  std::vector<Message> conversation;
  for (std::size_t i = 0; i < messages.size(); ++i) {
    if (messages[i].role == kSystemRole) {
      system_positions.push_back(i);
      system_messages.push_back(messages[i]);
    } else {
      conversation_positions.push_back(i);
      conversation.push_back(messages[i]);
    }
  }

  const BudgetAllocation allocation =
      allocate_budget(target_tokens, system_messages, options.priority_roles, counter);
  const int min_turns = std::max(0, options.min_turns);

  std::vector<std::size_t> costs;
  costs.reserve(conversation.size());
  for (const auto& message : conversation) {
    costs.push_back(counter.count(message.content));
  }

  const std::vector<Turn> turns = group_turns(conversation);
  const std::vector<std::size_t> selected = select_conversation(
      conversation, turns, costs, allocation.remaining_budget, options.priority_roles, min_turns);

  std::vector<bool> keep(messages.size(), false);
  std::size_t output_tokens = allocation.system_tokens;
  for (std::size_t idx : allocation.kept_system) {
    keep[system_positions[idx]] = true;
  }
  for (std::size_t idx : selected) {
    keep[conversation_positions[idx]] = true;
    output_tokens += costs[idx];
  }

  TrimResult result;
  std::size_t input_tokens = 0;
  for (std::size_t i = 0; i < messages.size(); ++i) {
    input_tokens += counter.count(messages[i].content);
    if (keep[i]) {
      result.messages.push_back(messages[i]);
    }
  }

  result.metrics = compute_trim_metrics(input_tokens, output_tokens, counter.describe());
  return result;
}

}  // namespace ctxbudget
