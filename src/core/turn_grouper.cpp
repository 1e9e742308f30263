#include "ctxbudget/turn_grouper.hpp"

namespace ctxbudget {

std::vector<Turn> group_turns(const std::vector<Message>& conversation) {
  std::vector<Turn> turns;
  for (std::size_t i = 0; i < conversation.size(); ++i) {
    if (conversation[i].role == kUserRole || turns.empty()) {
      turns.push_back({i, i + 1});
      continue;
    }
    turns.back().end = i + 1;
  }
  return turns;
}

}  // namespace ctxbudget
