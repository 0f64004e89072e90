#pragma once

#include "voxprompt/inference_engine.hpp"

namespace voxprompt {

// llama.cpp implementation of the language model seam. GGUF files only.
class LlamaBackend : public LanguageModelBackend {
public:
	// n_threads <= 0 picks from the core count
	explicit LlamaBackend(int32_t n_threads = 0);

	// use_gpu offloads every layer
	std::unique_ptr<LanguageModel> LoadModel(const std::string &path, bool use_gpu, VoxError &error) override;

private:
	int32_t n_threads_;
};

} // namespace voxprompt
