#pragma once
#include "completion.hpp"
#include <string>

// CompletionService over a local GGUF model. Greedy sampling, a fresh context
// per prompt; calls are serialized.
class LlamaCompletionService : public CompletionService {
public:
  LlamaCompletionService(const std::string& model_path, int max_tokens = 256, int context_size = 4096);
  ~LlamaCompletionService() override;
  LlamaCompletionService(const LlamaCompletionService&) = delete;
  LlamaCompletionService& operator=(const LlamaCompletionService&) = delete;

  bool is_available() override;
  std::string generate(const std::string& prompt) override;

private:
  struct Impl;
  Impl* impl_;
};
