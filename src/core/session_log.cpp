#include "ctxbudget/session_log.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ctxbudget {
namespace {

// Keeps empty fields, including a trailing one after the last tab.
std::vector<std::string> split_tabs(const std::string& line) {
  std::vector<std::string> cols;
  std::size_t start = 0;
  while (true) {
    const std::size_t tab = line.find('\t', start);
    if (tab == std::string::npos) {
      cols.push_back(line.substr(start));
      break;
    }
    cols.push_back(line.substr(start, tab - start));
    start = tab + 1;
  }
  return cols;
}

}  // namespace

std::vector<Message> parse_session_log(const std::string& text) {
  std::vector<Message> messages;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const std::vector<std::string> cols = split_tabs(line);

    if (cols.size() >= 4 && cols[0] == "v1" && cols[1] == "msg") {
      messages.push_back({unescape_field(cols[2]), unescape_field(cols[3])});
      continue;
    }
    if (cols.size() == 2) {
      messages.push_back({unescape_field(cols[0]), unescape_field(cols[1])});
      continue;
    }
  }
  return messages;
}

std::vector<Message> read_session_log(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("failed to open session log: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parse_session_log(buffer.str());
}

std::string format_session_line(const Message& message) {
  return "v1\tmsg\t" + escape_field(message.role) + '\t' + escape_field(message.content);
}

std::string escape_field(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  for (char c : input) {
    if (c == '\\') {
      out += "\\\\";
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\t') {
      out += "\\t";
    } else if (c == '\r') {
      out += "\\r";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string unescape_field(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  for (std::size_t i = 0; i < input.size(); ++i) {
    if (input[i] == '\\' && i + 1 < input.size()) {
      const char next = input[i + 1];
      if (next == 'n') {
        out.push_back('\n');
        ++i;
        continue;
      }
      if (next == 't') {
        out.push_back('\t');
        ++i;
        continue;
      }
      if (next == 'r') {
        out.push_back('\r');
        ++i;
        continue;
      }
      if (next == '\\') {
        out.push_back('\\');
        ++i;
        continue;
      }
    }
    out.push_back(input[i]);
  }
  return out;
}

}  // namespace ctxbudget
