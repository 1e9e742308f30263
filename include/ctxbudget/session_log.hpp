#pragma once

#include <string>
#include <vector>

#include "ctxbudget/types.hpp"

namespace ctxbudget {

std::vector<Message> read_session_log(const std::string& path);
std::vector<Message> parse_session_log(const std::string& text);
std::string format_session_line(const Message& message);

std::string escape_field(const std::string& input);
std::string unescape_field(const std::string& input);

}  // namespace ctxbudget
