#pragma once

#include <cstdint>
#include <string>

#include "ctxbudget/types.hpp"

namespace ctxbudget {

struct TrimConfig {
  std::string model{"gpt-4o"};
  std::int64_t target_tokens{4096};
  int min_turns{0};
  RoleSet priority_roles;
  std::string vocab_dir{".ctxbudget/vocab"};
  std::string aliases_file{""};

  TrimOptions options() const;

  static TrimConfig load_from_file(const std::string& path);
};

}  // namespace ctxbudget
