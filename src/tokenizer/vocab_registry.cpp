#include "ctxbudget/vocab_registry.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

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

std::vector<std::string> split_tsv(const std::string& line) {
  std::vector<std::string> cols;
  std::string col;
  std::istringstream in(line);
  while (std::getline(in, col, '\t')) {
    cols.push_back(trim(col));
  }
  return cols;
}

}  // namespace

VocabRegistry::VocabRegistry(std::string vocab_dir) : vocab_dir_(std::move(vocab_dir)) {}

TokenizerProfilePtr VocabRegistry::resolve(const std::string& profile_name) {
  if (profile_name.empty()) {
    return nullptr;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = profiles_.find(profile_name);
    if (it != profiles_.end()) {
      return it->second;
    }
  }

  if (vocab_dir_.empty()) {
    return nullptr;
  }
  const std::string path = path_for(profile_name);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return nullptr;
  }

  TokenizerProfilePtr loaded = load_llama_vocab_profile(profile_name, path);
  if (!loaded) {
    return nullptr;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  // Another thread may have loaded the same vocabulary first; keep that one.
  const auto inserted = profiles_.emplace(profile_name, std::move(loaded));
  return inserted.first->second;
}

std::optional<std::string> VocabRegistry::encoding_for_model(const std::string& model) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = aliases_.find(model);
  if (it == aliases_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void VocabRegistry::register_profile(TokenizerProfilePtr profile) {
  if (!profile) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string name = profile->name();
  profiles_.emplace(name, std::move(profile));
}

void VocabRegistry::load_aliases_from_tsv(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("failed to open encoding aliases: " + path);
  }

  std::string line;
  std::string error;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }

    const std::vector<std::string> cols = split_tsv(line);
    if (cols.size() < 2 || !add_alias(cols[0], cols[1], error)) {
      continue;
    }
  }
}

bool VocabRegistry::add_alias(const std::string& model, const std::string& encoding, std::string& error) {
  if (model.empty() || encoding.empty()) {
    error = "alias requires non-empty model and encoding";
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  aliases_[model] = encoding;
  error.clear();
  return true;
}

std::size_t VocabRegistry::profile_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return profiles_.size();
}

std::string VocabRegistry::path_for(const std::string& profile_name) const {
  return vocab_dir_ + "/" + profile_name + ".gguf";
}

}  // namespace ctxbudget
