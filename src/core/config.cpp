#include "ctxbudget/config.hpp"

#include <fstream>
#include <sstream>
#include <string>

namespace ctxbudget {
namespace {

std::string trim(const std::string& value) {
  const auto start = value.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(start, end - start + 1);
}

RoleSet parse_roles(const std::string& value) {
  RoleSet roles;
  std::istringstream in(value);
  std::string role;
  while (std::getline(in, role, ',')) {
    role = trim(role);
    if (!role.empty()) {
      roles.insert(role);
    }
  }
  return roles;
}

}  // namespace

TrimOptions TrimConfig::options() const {
  TrimOptions out;
  out.min_turns = min_turns;
  out.priority_roles = priority_roles;
  return out;
}

TrimConfig TrimConfig::load_from_file(const std::string& path) {
  TrimConfig config;

  std::ifstream in(path);
  if (!in.is_open()) {
    return config;
  }

  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }

    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = trim(line.substr(0, eq));
    const std::string value = trim(line.substr(eq + 1));

    if (key == "model") {
      config.model = value;
    } else if (key == "target_tokens") {
      config.target_tokens = std::stoll(value);
    } else if (key == "min_turns") {
      config.min_turns = std::stoi(value);
    } else if (key == "priority_roles") {
      config.priority_roles = parse_roles(value);
    } else if (key == "vocab_dir") {
      config.vocab_dir = value;
    } else if (key == "aliases_file") {
      config.aliases_file = value;
    }
  }

  return config;
}

}  // namespace ctxbudget
