#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "ctxbudget/token_counter.hpp"
#include "ctxbudget/types.hpp"

namespace ctxbudget {

inline constexpr std::size_t kBudgetFloor = 256;

struct BudgetAllocation {
  std::vector<std::size_t> kept_system;  // positions within the system message list
  std::size_t system_tokens{0};
  std::size_t remaining_budget{0};
};

BudgetAllocation allocate_budget(std::int64_t target_tokens, const std::vector<Message>& system_messages,
                                 const RoleSet& priority_roles, const TokenCounter& counter);

}  // namespace ctxbudget
