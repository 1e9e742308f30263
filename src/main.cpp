#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "ctxbudget/config.hpp"
#include "ctxbudget/context_trimmer.hpp"
#include "ctxbudget/metrics.hpp"
#include "ctxbudget/request_log.hpp"
#include "ctxbudget/session_log.hpp"
#include "ctxbudget/vocab_registry.hpp"

namespace {

void print_usage() {
  std::cerr << "usage: ctxbudget --session <log> [--config <file>] [--tokens N] [--model M]\n"
               "                 [--min-turns N] [--priority-role R]... [--metrics]\n";
}

}  // namespace

int main(int argc, char** argv) {
  try {
    std::string config_path = "ctxbudget.conf";
    std::string session_path;
    std::string model_override;
    std::string tokens_override;
    std::string min_turns_override;
    std::vector<std::string> extra_roles;
    bool show_metrics = false;

    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--session" && i + 1 < argc) {
        session_path = argv[++i];
      } else if (arg == "--tokens" && i + 1 < argc) {
        tokens_override = argv[++i];
      } else if (arg == "--model" && i + 1 < argc) {
        model_override = argv[++i];
      } else if (arg == "--min-turns" && i + 1 < argc) {
        min_turns_override = argv[++i];
      } else if (arg == "--priority-role" && i + 1 < argc) {
        extra_roles.push_back(argv[++i]);
      } else if (arg == "--metrics") {
        show_metrics = true;
      } else if (arg == "--help" || arg == "-h") {
        print_usage();
        return 0;
      } else {
        std::cerr << "unknown argument: " << arg << "\n";
        print_usage();
        return 2;
      }
    }

    if (session_path.empty()) {
      print_usage();
      return 2;
    }

    ctxbudget::TrimConfig config = ctxbudget::TrimConfig::load_from_file(config_path);
    if (!model_override.empty()) {
      config.model = model_override;
    }
    if (!tokens_override.empty()) {
      config.target_tokens = std::stoll(tokens_override);
    }
    if (!min_turns_override.empty()) {
      config.min_turns = std::stoi(min_turns_override);
    }
    config.priority_roles.insert(extra_roles.begin(), extra_roles.end());

    ctxbudget::VocabRegistry registry(config.vocab_dir);
    if (!config.aliases_file.empty()) {
      registry.load_aliases_from_tsv(config.aliases_file);
    }

    const std::vector<ctxbudget::Message> history = ctxbudget::read_session_log(session_path);

    const auto t_start = std::chrono::steady_clock::now();
    const ctxbudget::TrimResult result =
        ctxbudget::trim_messages(history, config.target_tokens, config.model, registry, config.options());
    const auto t_end = std::chrono::steady_clock::now();
    const double latency_ms =
        std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(t_end - t_start).count();

    for (const auto& message : result.messages) {
      std::cout << ctxbudget::format_session_line(message) << "\n";
    }

    ctxbudget::RequestLogger logger(std::cerr);
    logger.emit(ctxbudget::make_log_record(config.model, result.metrics, latency_ms));

    if (show_metrics) {
      ctxbudget::MetricsRegistry metrics;
      metrics.observe_trim(result.metrics);
      std::cout << metrics.export_prometheus();
    }
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "fatal: " << ex.what() << "\n";
    return 1;
  }
}
