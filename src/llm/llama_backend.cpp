#include "voxprompt/llama_backend.hpp"
#include "voxprompt/logger.hpp"

#include "llama.h"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace voxprompt {

static constexpr int32_t ALL_GPU_LAYERS = 999;
static constexpr int32_t MAX_THREADS = 8;

// Route llama.cpp / ggml output through our logger
static void LlamaLogCallback(ggml_log_level level, const char *text, void *) {
	std::string message(text ? text : "");
	while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
		message.pop_back();
	}
	if (message.empty()) {
		return;
	}
	if (level == GGML_LOG_LEVEL_ERROR) {
		VOXPROMPT_LOG_ERROR("llama", message);
	} else {
		VOXPROMPT_LOG_DEBUG("llama", message);
	}
}

static void InitLlamaOnce() {
	static std::once_flag once;
	std::call_once(once, []() {
		llama_backend_init();
		llama_log_set(LlamaLogCallback, nullptr);
	});
}

// ===========================================================================
// Generation context: one sampler chain and the decode batch
// ===========================================================================

class LlamaGenerationContext : public GenerationContext {
public:
	LlamaGenerationContext(llama_context *ctx, llama_sampler *sampler, int32_t batch_capacity)
	    : ctx_(ctx), sampler_(sampler), batch_(llama_batch_init(batch_capacity, 0, 1)),
	      batch_capacity_(batch_capacity) {
		llama_memory_clear(llama_get_memory(ctx_), true);
	}

	~LlamaGenerationContext() override {
		llama_batch_free(batch_);
		llama_sampler_free(sampler_);
		llama_memory_clear(llama_get_memory(ctx_), true);
	}

	bool Decode(const std::vector<int32_t> &tokens, int32_t start_pos, VoxError &error) override {
		if (tokens.empty() || static_cast<int32_t>(tokens.size()) > batch_capacity_) {
			error.Set(ErrorCode::GENERATION_ERROR, "Invalid decode batch of " + std::to_string(tokens.size()) + " tokens");
			return false;
		}
		batch_.n_tokens = 0;
		for (size_t i = 0; i < tokens.size(); i++) {
			int32_t idx = batch_.n_tokens;
			batch_.token[idx] = tokens[i];
			batch_.pos[idx] = start_pos + static_cast<int32_t>(i);
			batch_.n_seq_id[idx] = 1;
			batch_.seq_id[idx][0] = 0;
			batch_.logits[idx] = (i + 1 == tokens.size()) ? 1 : 0;
			batch_.n_tokens++;
		}
		int result = llama_decode(ctx_, batch_);
		if (result != 0) {
			error.Set(ErrorCode::GENERATION_ERROR, "llama_decode failed with code " + std::to_string(result));
			return false;
		}
		return true;
	}

	int32_t Sample() override {
		llama_token token = llama_sampler_sample(sampler_, ctx_, -1);
		llama_sampler_accept(sampler_, token);
		return token;
	}

private:
	llama_context *ctx_;
	llama_sampler *sampler_;
	llama_batch batch_;
	int32_t batch_capacity_;
};

// ===========================================================================
// Loaded model
// ===========================================================================

class LlamaLanguageModel : public LanguageModel {
public:
	LlamaLanguageModel(llama_model *model, int32_t n_threads)
	    : model_(model), vocab_(llama_model_get_vocab(model)), context_(nullptr), context_size_(0),
	      n_threads_(n_threads) {
	}

	~LlamaLanguageModel() override {
		if (context_) {
			llama_free(context_);
		}
		llama_model_free(model_);
	}

	std::string GetChatTemplate() const override {
		std::string buffer(2048, '\0');
		int32_t length = llama_model_meta_val_str(model_, "tokenizer.chat_template", &buffer[0], buffer.size());
		if (length <= 0) {
			return std::string();
		}
		if (static_cast<size_t>(length) >= buffer.size()) {
			buffer.resize(static_cast<size_t>(length) + 1);
			length = llama_model_meta_val_str(model_, "tokenizer.chat_template", &buffer[0], buffer.size());
			if (length <= 0) {
				return std::string();
			}
		}
		buffer.resize(static_cast<size_t>(length));
		return buffer;
	}

	bool ApplyChatTemplate(const std::string &chat_template, const std::vector<ChatMessage> &messages,
	                       std::string &rendered, VoxError &error) const override {
		std::vector<llama_chat_message> chat;
		chat.reserve(messages.size());
		for (auto &message : messages) {
			chat.push_back(llama_chat_message {message.role.c_str(), message.content.c_str()});
		}

		size_t estimate = 1024;
		for (auto &message : messages) {
			estimate += message.content.size() * 2;
		}
		std::string buffer(estimate, '\0');

		// Unsupported template syntax surfaces as an exception or a negative result
		int32_t result;
		try {
			result = llama_chat_apply_template(chat_template.c_str(), chat.data(), chat.size(), true, &buffer[0],
			                                   static_cast<int32_t>(buffer.size()));
			if (result > static_cast<int32_t>(buffer.size())) {
				buffer.resize(static_cast<size_t>(result));
				result = llama_chat_apply_template(chat_template.c_str(), chat.data(), chat.size(), true, &buffer[0],
				                                   static_cast<int32_t>(buffer.size()));
			}
		} catch (const std::exception &ex) {
			error.Set(ErrorCode::GENERATION_ERROR, std::string("Chat template error: ") + ex.what());
			return false;
		}
		if (result < 0) {
			error.Set(ErrorCode::GENERATION_ERROR, "Chat template not supported by llama.cpp");
			return false;
		}
		buffer.resize(static_cast<size_t>(result));
		rendered = std::move(buffer);
		return true;
	}

	bool Tokenize(const std::string &text, std::vector<int32_t> &tokens, VoxError &error) const override {
		// The rendered template already carries the special tokens
		const bool add_special = false;
		const bool parse_special = true;
		tokens.resize(text.size() + 2);
		int32_t count = llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.size()), tokens.data(),
		                               static_cast<int32_t>(tokens.size()), add_special, parse_special);
		if (count < 0) {
			tokens.resize(static_cast<size_t>(-count));
			count = llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.size()), tokens.data(),
			                       static_cast<int32_t>(tokens.size()), add_special, parse_special);
		}
		if (count < 0) {
			error.Set(ErrorCode::GENERATION_ERROR, "Tokenization failed");
			return false;
		}
		tokens.resize(static_cast<size_t>(count));
		return true;
	}

	std::string TokenToPiece(int32_t token) const override {
		char buffer[256];
		int32_t length = llama_token_to_piece(vocab_, token, buffer, sizeof(buffer), 0, false);
		if (length < 0) {
			std::string piece(static_cast<size_t>(-length), '\0');
			length = llama_token_to_piece(vocab_, token, &piece[0], static_cast<int32_t>(piece.size()), 0, false);
			if (length < 0) {
				return std::string();
			}
			piece.resize(static_cast<size_t>(length));
			return piece;
		}
		return std::string(buffer, static_cast<size_t>(length));
	}

	bool IsEndOfGeneration(int32_t token) const override {
		return llama_vocab_is_eog(vocab_, token);
	}

	std::unique_ptr<GenerationContext> CreateContext(const SamplingParams &params, VoxError &error) override {
		if (!context_ || context_size_ != params.context_size) {
			if (context_) {
				llama_free(context_);
				context_ = nullptr;
			}
			llama_context_params ctx_params = llama_context_default_params();
			ctx_params.n_ctx = static_cast<uint32_t>(params.context_size);
			ctx_params.n_batch = static_cast<uint32_t>(params.batch_size);
			ctx_params.n_threads = n_threads_;
			ctx_params.n_threads_batch = n_threads_;
			ctx_params.no_perf = true;
			context_ = llama_init_from_model(model_, ctx_params);
			if (!context_) {
				error.Set(ErrorCode::GENERATION_ERROR, "Failed to create llama context");
				return nullptr;
			}
			context_size_ = params.context_size;
		}

		auto chain_params = llama_sampler_chain_default_params();
		chain_params.no_perf = true;
		llama_sampler *sampler = llama_sampler_chain_init(chain_params);
		llama_sampler_chain_add(sampler, llama_sampler_init_top_k(params.top_k));
		llama_sampler_chain_add(sampler, llama_sampler_init_top_p(params.top_p, 1));
		llama_sampler_chain_add(sampler, llama_sampler_init_temp(params.temperature));
		llama_sampler_chain_add(sampler, llama_sampler_init_dist(params.seed));

		return std::make_unique<LlamaGenerationContext>(context_, sampler, params.batch_size);
	}

private:
	llama_model *model_;
	const llama_vocab *vocab_;
	llama_context *context_;
	int32_t context_size_;
	int32_t n_threads_;
};

// ===========================================================================
// Backend
// ===========================================================================

LlamaBackend::LlamaBackend(int32_t n_threads) {
	if (n_threads <= 0) {
		int32_t hardware = static_cast<int32_t>(std::thread::hardware_concurrency());
		n_threads = std::max(1, std::min(MAX_THREADS, hardware));
	}
	n_threads_ = n_threads;
	InitLlamaOnce();
}

std::unique_ptr<LanguageModel> LlamaBackend::LoadModel(const std::string &path, bool use_gpu, VoxError &error) {
	llama_model_params model_params = llama_model_default_params();
	model_params.n_gpu_layers = use_gpu ? ALL_GPU_LAYERS : 0;

	llama_model *model = llama_model_load_from_file(path.c_str(), model_params);
	if (!model) {
		error.Set(ErrorCode::LOAD_ERROR, "Failed to load model: " + path);
		return nullptr;
	}
	VOXPROMPT_LOG_DEBUG("llama", "Loaded " + path + " with n_gpu_layers=" + std::to_string(model_params.n_gpu_layers) +
	                                 ", threads=" + std::to_string(n_threads_));
	return std::make_unique<LlamaLanguageModel>(model, n_threads_);
}

} // namespace voxprompt
