#include "ctxbudget/tokenizer.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#if defined(CTXBUDGET_HAS_LLAMA_CPP)
#include <llama.h>
#endif

namespace ctxbudget {
namespace {

#if defined(CTXBUDGET_HAS_LLAMA_CPP)
void llama_silent_log_callback(enum ggml_log_level, const char*, void*) {}

struct ModelDeleter {
  void operator()(llama_model* model) const {
    if (model != nullptr) {
      llama_model_free(model);
    }
  }
};

void ensure_backend_init() {
  static std::once_flag once;
  std::call_once(once, []() {
    llama_backend_init();
    llama_log_set(llama_silent_log_callback, nullptr);
  });
}

class LlamaVocabProfile final : public ITokenizerProfile {
 public:
  LlamaVocabProfile(std::string name, std::unique_ptr<llama_model, ModelDeleter> model, const llama_vocab* vocab)
      : name_(std::move(name)), model_(std::move(model)), vocab_(vocab) {}

  std::string name() const override { return name_; }

  std::size_t vocab_size() const override {
    const int32_t n = llama_vocab_n_tokens(vocab_);
    return n > 0 ? static_cast<std::size_t>(n) : 0;
  }

  std::size_t count_tokens(const std::string& text) const override {
    if (text.empty()) {
      return 0;
    }
    std::vector<llama_token> tokens(text.size() + 16);
    int32_t n = llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.size()), tokens.data(),
                               static_cast<int32_t>(tokens.size()), false, false);
    if (n < 0) {
      const int32_t required = -n;
      tokens.assign(static_cast<std::size_t>(required), 0);
      n = llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.size()), tokens.data(), required, false,
                         false);
    }
    if (n < 0) {
      // Never fail a count; one token per byte is an upper bound for BPE vocabularies.
      return text.size();
    }
    return static_cast<std::size_t>(n);
  }

 private:
  std::string name_;
  std::unique_ptr<llama_model, ModelDeleter> model_;
  const llama_vocab* vocab_;
};
#endif

}  // namespace

#if defined(CTXBUDGET_HAS_LLAMA_CPP)
bool llama_vocab_support_available() { return true; }

TokenizerProfilePtr load_llama_vocab_profile(const std::string& name, const std::string& gguf_path) {
  ensure_backend_init();

  llama_model_params params = llama_model_default_params();
  params.vocab_only = true;
  params.use_mmap = true;
  params.n_gpu_layers = 0;

  std::unique_ptr<llama_model, ModelDeleter> model(llama_model_load_from_file(gguf_path.c_str(), params));
  if (!model) {
    return nullptr;
  }
  const llama_vocab* vocab = llama_model_get_vocab(model.get());
  if (vocab == nullptr) {
    return nullptr;
  }
  return std::make_shared<LlamaVocabProfile>(name, std::move(model), vocab);
}
#else
bool llama_vocab_support_available() { return false; }

TokenizerProfilePtr load_llama_vocab_profile(const std::string&, const std::string&) {
  // Built without llama.cpp headers/libs: every vocabulary is reported as not found.
  return nullptr;
}
#endif

}  // namespace ctxbudget
