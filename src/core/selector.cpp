#include "ctxbudget/selector.hpp"

#include <algorithm>

namespace ctxbudget {
namespace {

bool turn_has_priority_role(const std::vector<Message>& conversation, const Turn& turn,
                            const RoleSet& priority_roles) {
  for (std::size_t i = turn.begin; i < turn.end; ++i) {
    if (priority_roles.count(conversation[i].role) != 0) {
      return true;
    }
  }
  return false;
}

std::size_t turn_cost(const std::vector<std::size_t>& costs, const Turn& turn) {
  std::size_t total = 0;
  for (std::size_t i = turn.begin; i < turn.end; ++i) {
    total += costs[i];
  }
  return total;
}

}  // namespace

std::vector<std::size_t> select_recent_messages(const std::vector<Message>& conversation,
                                                const std::vector<Turn>& turns,
                                                const std::vector<std::size_t>& costs, std::size_t budget,
                                                const RoleSet& priority_roles) {
  std::vector<std::size_t> kept;
  if (conversation.empty() || turns.empty()) {
    return kept;
  }

  std::vector<bool> forced(conversation.size(), false);
  for (std::size_t i = turns.back().begin; i < turns.back().end; ++i) {
    forced[i] = true;
  }
  if (!priority_roles.empty()) {
    for (std::size_t i = 0; i < conversation.size(); ++i) {
      if (priority_roles.count(conversation[i].role) != 0) {
        forced[i] = true;
      }
    }
  }

  kept.reserve(conversation.size());
  std::size_t kept_total = 0;
  for (std::size_t i = conversation.size(); i-- > 0;) {
    if (!forced[i] && kept_total + costs[i] > budget) {
      // Skip rather than stop: older forced or smaller messages may still qualify.
      continue;
    }
    kept_total += costs[i];
    kept.push_back(i);
  }

  std::reverse(kept.begin(), kept.end());
  return kept;
}

std::vector<std::size_t> select_recent_turns(const std::vector<Message>& conversation,
                                             const std::vector<Turn>& turns, const std::vector<std::size_t>& costs,
                                             std::size_t budget, const RoleSet& priority_roles,
                                             std::size_t min_turns) {
  std::vector<std::size_t> kept;
  if (conversation.empty() || turns.empty()) {
    return kept;
  }

  std::vector<std::size_t> kept_turns;
  kept_turns.reserve(turns.size());
  kept_turns.push_back(turns.size() - 1);
  std::size_t kept_total = turn_cost(costs, turns.back());
  std::size_t turns_kept = 1;

  for (std::size_t t = turns.size() - 1; t-- > 0;) {
    const Turn& turn = turns[t];
    const std::size_t cost = turn_cost(costs, turn);
    const bool fits = kept_total + cost <= budget;
    if (!fits && turns_kept >= min_turns && !turn_has_priority_role(conversation, turn, priority_roles)) {
      continue;
    }
    kept_total += cost;
    ++turns_kept;
    kept_turns.push_back(t);
  }

  kept.reserve(conversation.size());
  for (auto it = kept_turns.rbegin(); it != kept_turns.rend(); ++it) {
    for (std::size_t i = turns[*it].begin; i < turns[*it].end; ++i) {
      kept.push_back(i);
    }
  }
  return kept;
}

std::vector<std::size_t> select_conversation(const std::vector<Message>& conversation,
                                             const std::vector<Turn>& turns, const std::vector<std::size_t>& costs,
                                             std::size_t budget, const RoleSet& priority_roles, int min_turns) {
  if (min_turns > 0) {
    return select_recent_turns(conversation, turns, costs, budget, priority_roles,
                               static_cast<std::size_t>(min_turns));
  }
  return select_recent_messages(conversation, turns, costs, budget, priority_roles);
}

}  // namespace ctxbudget
