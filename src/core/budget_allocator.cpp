#include "ctxbudget/budget_allocator.hpp"

namespace ctxbudget {

BudgetAllocation allocate_budget(std::int64_t target_tokens, const std::vector<Message>& system_messages,
                                 const RoleSet& priority_roles, const TokenCounter& counter) {
  BudgetAllocation allocation;
  const std::size_t base_budget =
      target_tokens > static_cast<std::int64_t>(kBudgetFloor) ? static_cast<std::size_t>(target_tokens) : kBudgetFloor;

  for (std::size_t i = 0; i < system_messages.size(); ++i) {
    // Only the first system message is unconditional; later ones need their
    // role itself to be pinned.
    if (!allocation.kept_system.empty() && priority_roles.count(system_messages[i].role) == 0) {
      continue;
    }
    allocation.kept_system.push_back(i);
    allocation.system_tokens += counter.count(system_messages[i].content);
  }

  allocation.remaining_budget =
      allocation.system_tokens < base_budget ? base_budget - allocation.system_tokens : 0;
  return allocation;
}

}  // namespace ctxbudget
