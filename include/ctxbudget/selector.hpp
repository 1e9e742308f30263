#pragma once

#include <cstddef>
#include <vector>

#include "ctxbudget/types.hpp"

namespace ctxbudget {

// All selectors return ascending positions into `conversation`. `costs[i]` is
// the token cost of conversation[i].

// Newest-first scan that keeps the last turn and every priority-role message
// unconditionally, then any other message that still fits the budget.
std::vector<std::size_t> select_recent_messages(const std::vector<Message>& conversation,
                                                const std::vector<Turn>& turns,
                                                const std::vector<std::size_t>& costs, std::size_t budget,
                                                const RoleSet& priority_roles);

// Newest-first scan over whole turns. A turn is kept when it fits, when fewer
// than `min_turns` turns are kept so far, or when it carries a priority role.
std::vector<std::size_t> select_recent_turns(const std::vector<Message>& conversation,
                                             const std::vector<Turn>& turns, const std::vector<std::size_t>& costs,
                                             std::size_t budget, const RoleSet& priority_roles,
                                             std::size_t min_turns);

std::vector<std::size_t> select_conversation(const std::vector<Message>& conversation,
                                             const std::vector<Turn>& turns, const std::vector<std::size_t>& costs,
                                             std::size_t budget, const RoleSet& priority_roles, int min_turns);

}  // namespace ctxbudget
