#pragma once

#include "voxprompt/vox_error.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voxprompt {

struct ChatMessage {
	std::string role;
	std::string content;
};

struct SamplingParams {
	int32_t top_k;
	float top_p;
	float temperature;
	uint32_t seed;
	int32_t max_tokens;
	int32_t context_size;
	int32_t batch_size;

	SamplingParams()
	    : top_k(40), top_p(0.95f), temperature(0.3f), seed(42), max_tokens(1024), context_size(2048),
	      batch_size(512) {
	}
};

// Decoding state for one generation
class GenerationContext {
public:
	virtual ~GenerationContext() = default;

	// Feed tokens at positions [start_pos, start_pos + n); logits are only
	// needed for the last one
	virtual bool Decode(const std::vector<int32_t> &tokens, int32_t start_pos, VoxError &error) = 0;
	// Sample and accept the next token
	virtual int32_t Sample() = 0;
};

// A model resident in memory
class LanguageModel {
public:
	virtual ~LanguageModel() = default;

	// Template embedded in the model file, empty when there is none
	virtual std::string GetChatTemplate() const = 0;
	virtual bool ApplyChatTemplate(const std::string &chat_template, const std::vector<ChatMessage> &messages,
	                               std::string &rendered, VoxError &error) const = 0;
	virtual bool Tokenize(const std::string &text, std::vector<int32_t> &tokens, VoxError &error) const = 0;
	// Raw bytes of a token; may end in the middle of a UTF-8 sequence
	virtual std::string TokenToPiece(int32_t token) const = 0;
	virtual bool IsEndOfGeneration(int32_t token) const = 0;

	virtual std::unique_ptr<GenerationContext> CreateContext(const SamplingParams &params, VoxError &error) = 0;
};

class LanguageModelBackend {
public:
	virtual ~LanguageModelBackend() = default;

	virtual std::unique_ptr<LanguageModel> LoadModel(const std::string &path, bool use_gpu, VoxError &error) = 0;
};

// Exclusive slot holding at most one language model, plus the chat-style
// generation loop. Load/Unload wait for the slot; Generate refuses with BUSY
// when the slot is held by anything else.
class InferenceEngine {
public:
	enum class State { UNLOADED, LOADING, LOADED, GENERATING };

	// ChatML, used when the model ships no template of its own
	static const char *FALLBACK_CHAT_TEMPLATE;

	explicit InferenceEngine(std::shared_ptr<LanguageModelBackend> backend, SamplingParams params = SamplingParams());
	~InferenceEngine();

	bool Load(const std::string &path, bool use_gpu, VoxError &error);
	void Unload();
	bool Generate(const std::string &system_prompt, const std::string &user_message, std::string &output,
	              VoxError &error);

	State GetState() const {
		return state_.load();
	}
	static const char *StateToString(State state);

	// Holds the slot across an optional unload and fn, so no Load can pick up
	// path while fn runs. Unloads first when the loaded model came from path.
	bool UnloadAndRun(const std::string &path, const std::function<bool()> &fn);

	bool IsLoaded(const std::string &path) const;
	std::string GetLoadedPath() const;

	// Drop reasoning output: keep what follows "</think>", and return nothing
	// for a "<think>" block that never closed
	static std::string StripThinking(const std::string &text);

private:
	void UnloadLocked();
	bool RunGeneration(const std::vector<ChatMessage> &messages, std::string &output, VoxError &error);

	std::shared_ptr<LanguageModelBackend> backend_;
	SamplingParams params_;

	std::mutex slot_mutex_;
	std::unique_ptr<LanguageModel> model_;
	std::string chat_template_;
	std::atomic<State> state_;

	mutable std::mutex path_mutex_;
	std::string loaded_path_;
};

} // namespace voxprompt
