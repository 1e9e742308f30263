#pragma once

#include <vector>

#include "ctxbudget/types.hpp"

namespace ctxbudget {

// Splits a conversation into turns. Each "user" message opens a new turn; any
// non-user prefix forms a leading turn of its own. The returned ranges are
// contiguous and cover the whole conversation.
std::vector<Turn> group_turns(const std::vector<Message>& conversation);

}  // namespace ctxbudget
