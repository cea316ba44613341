#include "llama_completion.hpp"
#include "log.hpp"
#include <llama.h>
#include <mutex>
#include <stdexcept>
#include <vector>

struct LlamaCompletionService::Impl {
  llama_model* model = nullptr;
  const llama_vocab* vocab = nullptr;
  int max_tokens = 256;
  int n_ctx = 4096;
  std::mutex mu;

  Impl(const std::string& model_path, int max_new, int context_size)
    : max_tokens(max_new), n_ctx(context_size) {
    llama_backend_init();

    llama_model_params mp = llama_model_default_params();
    mp.n_gpu_layers = 0;
    model = llama_model_load_from_file(model_path.c_str(), mp);
    if (!model) {
      llama_backend_free();
      throw std::runtime_error("completion: failed to load model " + model_path);
    }
    vocab = llama_model_get_vocab(model);
  }

  ~Impl() {
    if (model) llama_model_free(model);
    llama_backend_free();
  }

  std::vector<llama_token> tokenize(const std::string& s) {
    int32_t need = -llama_tokenize(vocab, s.c_str(), (int32_t)s.size(), nullptr, 0, /*add_special*/ true, /*parse_special*/ true);
    if (need <= 0) throw std::runtime_error("completion: tokenize failed (len)");
    std::vector<llama_token> t(need);
    int32_t n = llama_tokenize(vocab, s.c_str(), (int32_t)s.size(), t.data(), (int32_t)t.size(), true, true);
    if (n < 0) throw std::runtime_error("completion: tokenize failed");
    t.resize(n);
    return t;
  }

  std::string token_to_string(llama_token tok) {
    char buf[256];
    int32_t n = llama_token_to_piece(vocab, tok, buf, (int32_t)sizeof(buf), 0, /*special*/ false);
    if (n < 0) {
      std::string s((size_t)-n, '\0');
      n = llama_token_to_piece(vocab, tok, &s[0], (int32_t)s.size(), 0, false);
      if (n < 0) throw std::runtime_error("completion: detokenize failed");
      s.resize((size_t)n);
      return s;
    }
    return std::string(buf, (size_t)n);
  }

  std::string generate(const std::string& prompt) {
    auto toks = tokenize(prompt);
    if ((int)toks.size() + max_tokens > n_ctx)
      throw std::runtime_error("completion: prompt of " + std::to_string(toks.size()) + " tokens exceeds context");

    llama_context_params cp = llama_context_default_params();
    cp.n_ctx = (uint32_t)n_ctx;
    cp.n_batch = (uint32_t)n_ctx;
    cp.embeddings = false;
    llama_context* ctx = llama_init_from_model(model, cp);
    if (!ctx) throw std::runtime_error("completion: failed to create context");

    llama_sampler* smpl = llama_sampler_chain_init(llama_sampler_chain_default_params());
    llama_sampler_chain_add(smpl, llama_sampler_init_greedy());

    struct Guard {
      llama_context* ctx;
      llama_sampler* smpl;
      ~Guard() { llama_sampler_free(smpl); llama_free(ctx); }
    } guard{ctx, smpl};

    if (llama_decode(ctx, llama_batch_get_one(toks.data(), (int32_t)toks.size())) != 0)
      throw std::runtime_error("completion: decode(prompt) failed");

    std::string out;
    for (int t = 0; t < max_tokens; ++t) {
      llama_token tok = llama_sampler_sample(smpl, ctx, -1);
      if (llama_vocab_is_eog(vocab, tok)) break;
      out += token_to_string(tok);
      if (llama_decode(ctx, llama_batch_get_one(&tok, 1)) != 0)
        throw std::runtime_error("completion: decode failed after " + std::to_string(t) + " tokens");
    }
    return out;
  }
};

LlamaCompletionService::LlamaCompletionService(const std::string& model_path, int max_tokens, int context_size)
  : impl_(new Impl(model_path, max_tokens, context_size)) {
  log_debug("completion", "loaded " + model_path);
}

LlamaCompletionService::~LlamaCompletionService() { delete impl_; }

bool LlamaCompletionService::is_available() { return impl_->model != nullptr; }

std::string LlamaCompletionService::generate(const std::string& prompt) {
  std::lock_guard<std::mutex> lock(impl_->mu);
  return impl_->generate(prompt);
}
