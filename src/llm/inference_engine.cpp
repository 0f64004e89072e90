#include "voxprompt/inference_engine.hpp"
#include "voxprompt/logger.hpp"

#include <algorithm>
#include <sys/stat.h>

namespace voxprompt {

const char *InferenceEngine::FALLBACK_CHAT_TEMPLATE =
    "{% for message in messages %}<|im_start|>{{ message.role }}\n{{ message.content }}<|im_end|>\n{% endfor %}"
    "<|im_start|>assistant\n";

// Text markers that end an answer even when the model missed its EOG token
static const char *const STOP_SEQUENCES[] = {"<|im_end|>", "<|eot_id|>", "<|endoftext|>", "<|end|>", "</s>"};

// Bjoern Hoehrmann's UTF-8 DFA. state is 0 whenever the bytes seen so far end
// on a code point boundary.
struct Utf8Scanner {
	uint32_t state = 0;

	void Process(uint8_t byte) {
		static const uint8_t utf8d[] = {
		    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0, // 00..1f
		    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0, // 20..3f
		    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0, // 40..5f
		    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0, // 60..7f
		    1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,9,9,9,9,9,9,9,9,9,9,9,9,9,9,9,9, // 80..9f
		    7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7,7, // a0..bf
		    8,8,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2, // c0..df
		    0xa,0x3,0x3,0x3,0x3,0x3,0x3,0x3,0x3,0x3,0x3,0x3,0x3,0x4,0x3,0x3, // e0..ef
		    0xb,0x6,0x6,0x6,0x5,0x8,0x8,0x8,0x8,0x8,0x8,0x8,0x8,0x8,0x8,0x8, // f0..ff
		    0x0,0x1,0x2,0x3,0x5,0x8,0x7,0x1,0x1,0x1,0x4,0x6,0x1,0x1,0x1,0x1, // s0..s0
		    1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,0,1,1,1,1,1,0,1,0,1,1,1,1,1,1, // s1..s2
		    1,2,1,1,1,1,1,2,1,2,1,1,1,1,1,1,1,1,1,1,1,1,1,2,1,1,1,1,1,1,1,1, // s3..s4
		    1,2,1,1,1,1,1,1,1,2,1,1,1,1,1,1,1,1,1,1,1,1,1,3,1,3,1,1,1,1,1,1, // s5..s6
		    1,3,1,1,1,1,1,3,1,3,1,1,1,1,1,1,1,3,1,1,1,1,1,1,1,1,1,1,1,1,1,1, // s7..s8
		};
		uint32_t type = utf8d[byte];
		state = utf8d[256 + state * 16 + type];
	}
};

static bool FileExists(const std::string &path) {
	struct stat buffer;
	return stat(path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode);
}

static std::string Trim(const std::string &text) {
	const char *whitespace = " \t\r\n";
	size_t start = text.find_first_not_of(whitespace);
	if (start == std::string::npos) {
		return std::string();
	}
	size_t end = text.find_last_not_of(whitespace);
	return text.substr(start, end - start + 1);
}

// Resets the slot state when a scope exits
struct StateGuard {
	std::atomic<InferenceEngine::State> &state;
	InferenceEngine::State on_exit;

	~StateGuard() {
		state.store(on_exit);
	}
};

InferenceEngine::InferenceEngine(std::shared_ptr<LanguageModelBackend> backend, SamplingParams params)
    : backend_(std::move(backend)), params_(params), state_(State::UNLOADED) {
}

InferenceEngine::~InferenceEngine() {
	std::lock_guard<std::mutex> lock(slot_mutex_);
	UnloadLocked();
}

const char *InferenceEngine::StateToString(State state) {
	switch (state) {
	case State::UNLOADED:
		return "unloaded";
	case State::LOADING:
		return "loading";
	case State::LOADED:
		return "loaded";
	case State::GENERATING:
		return "generating";
	}
	return "unknown";
}

bool InferenceEngine::Load(const std::string &path, bool use_gpu, VoxError &error) {
	std::lock_guard<std::mutex> lock(slot_mutex_);

	if (!FileExists(path)) {
		error.Set(ErrorCode::FILE_NOT_FOUND, "Model file not found: " + path);
		return false;
	}

	UnloadLocked();
	state_.store(State::LOADING);
	VOXPROMPT_LOG_INFO("llm", "Loading model: " + path);

	std::unique_ptr<LanguageModel> model = backend_->LoadModel(path, use_gpu, error);
	if (!model) {
		if (!error.HasError()) {
			error.Set(ErrorCode::LOAD_ERROR, "Failed to load model: " + path);
		}
		state_.store(State::UNLOADED);
		VOXPROMPT_LOG_ERROR("llm", error.ToString());
		return false;
	}

	chat_template_ = model->GetChatTemplate();
	if (chat_template_.empty()) {
		VOXPROMPT_LOG_DEBUG("llm", "Model has no chat template, using ChatML");
		chat_template_ = FALLBACK_CHAT_TEMPLATE;
	}
	model_ = std::move(model);
	{
		std::lock_guard<std::mutex> path_lock(path_mutex_);
		loaded_path_ = path;
	}
	state_.store(State::LOADED);
	VOXPROMPT_LOG_INFO("llm", "Model loaded: " + path);
	return true;
}

void InferenceEngine::Unload() {
	std::lock_guard<std::mutex> lock(slot_mutex_);
	UnloadLocked();
}

bool InferenceEngine::UnloadAndRun(const std::string &path, const std::function<bool()> &fn) {
	std::lock_guard<std::mutex> lock(slot_mutex_);
	if (model_ && IsLoaded(path)) {
		UnloadLocked();
	}
	return fn();
}

void InferenceEngine::UnloadLocked() {
	if (!model_) {
		return;
	}
	model_.reset();
	chat_template_.clear();
	{
		std::lock_guard<std::mutex> path_lock(path_mutex_);
		VOXPROMPT_LOG_INFO("llm", "Model unloaded: " + loaded_path_);
		loaded_path_.clear();
	}
	state_.store(State::UNLOADED);
}

bool InferenceEngine::IsLoaded(const std::string &path) const {
	std::lock_guard<std::mutex> lock(path_mutex_);
	return !loaded_path_.empty() && loaded_path_ == path;
}

std::string InferenceEngine::GetLoadedPath() const {
	std::lock_guard<std::mutex> lock(path_mutex_);
	return loaded_path_;
}

bool InferenceEngine::Generate(const std::string &system_prompt, const std::string &user_message,
                               std::string &output, VoxError &error) {
	std::unique_lock<std::mutex> lock(slot_mutex_, std::try_to_lock);
	if (!lock.owns_lock()) {
		error.Set(ErrorCode::BUSY, std::string("Language model is ") + StateToString(state_.load()));
		return false;
	}
	if (!model_) {
		error.Set(ErrorCode::NOT_LOADED, "No language model loaded");
		return false;
	}

	std::vector<ChatMessage> messages;
	if (!system_prompt.empty()) {
		messages.push_back(ChatMessage {"system", system_prompt});
	}
	messages.push_back(ChatMessage {"user", user_message});

	state_.store(State::GENERATING);
	StateGuard guard {state_, State::LOADED};
	return RunGeneration(messages, output, error);
}

bool InferenceEngine::RunGeneration(const std::vector<ChatMessage> &messages, std::string &output, VoxError &error) {
	std::string prompt;
	if (!model_->ApplyChatTemplate(chat_template_, messages, prompt, error)) {
		if (chat_template_ == FALLBACK_CHAT_TEMPLATE) {
			return false;
		}
		VOXPROMPT_LOG_WARNING("llm", "Chat template failed, retrying with ChatML: " + error.ToString());
		error.Clear();
		if (!model_->ApplyChatTemplate(FALLBACK_CHAT_TEMPLATE, messages, prompt, error)) {
			return false;
		}
	}

	std::vector<int32_t> prompt_tokens;
	if (!model_->Tokenize(prompt, prompt_tokens, error)) {
		return false;
	}
	if (prompt_tokens.empty()) {
		error.Set(ErrorCode::GENERATION_ERROR, "Prompt produced no tokens");
		return false;
	}
	const int32_t prompt_length = static_cast<int32_t>(prompt_tokens.size());
	if (prompt_length >= params_.context_size) {
		error.Set(ErrorCode::GENERATION_ERROR, "Prompt too long: " + std::to_string(prompt_length) +
		                                           " tokens, context holds " + std::to_string(params_.context_size));
		return false;
	}

	std::unique_ptr<GenerationContext> context = model_->CreateContext(params_, error);
	if (!context) {
		if (!error.HasError()) {
			error.Set(ErrorCode::GENERATION_ERROR, "Failed to create generation context");
		}
		return false;
	}

	// Prompt in batch-sized chunks
	const size_t batch_size = static_cast<size_t>(std::max(params_.batch_size, 1));
	for (size_t offset = 0; offset < prompt_tokens.size(); offset += batch_size) {
		size_t end = std::min(prompt_tokens.size(), offset + batch_size);
		std::vector<int32_t> chunk(prompt_tokens.begin() + offset, prompt_tokens.begin() + end);
		if (!context->Decode(chunk, static_cast<int32_t>(offset), error)) {
			return false;
		}
	}

	const int32_t budget = std::min(params_.max_tokens, params_.context_size - prompt_length);
	std::string text;
	std::string pending;
	Utf8Scanner scanner;
	int32_t position = prompt_length;
	int32_t generated = 0;

	while (generated < budget) {
		int32_t token = context->Sample();
		if (model_->IsEndOfGeneration(token)) {
			break;
		}

		// Hold back bytes until they complete a code point
		const size_t scan_start = pending.size();
		pending += model_->TokenToPiece(token);
		size_t valid_upto = 0;
		for (size_t i = scan_start; i < pending.size(); ++i) {
			scanner.Process(static_cast<uint8_t>(pending[i]));
			if (scanner.state == 0) {
				valid_upto = i + 1;
			}
		}
		if (valid_upto > 0) {
			text.append(pending, 0, valid_upto);
			pending.erase(0, valid_upto);
		}

		generated++;
		if (generated >= budget) {
			break;
		}
		std::vector<int32_t> next(1, token);
		if (!context->Decode(next, position, error)) {
			return false;
		}
		position++;
	}
	if (!pending.empty()) {
		text += pending;
	}

	size_t stop_pos = std::string::npos;
	for (const char *stop : STOP_SEQUENCES) {
		size_t pos = text.find(stop);
		if (pos != std::string::npos && (stop_pos == std::string::npos || pos < stop_pos)) {
			stop_pos = pos;
		}
	}
	if (stop_pos != std::string::npos) {
		text.erase(stop_pos);
	}

	VOXPROMPT_LOG_DEBUG("llm", "Generated " + std::to_string(generated) + " tokens from a " +
	                               std::to_string(prompt_length) + " token prompt");
	output = StripThinking(text);
	return true;
}

std::string InferenceEngine::StripThinking(const std::string &text) {
	static const std::string OPEN_TAG = "<think>";
	static const std::string CLOSE_TAG = "</think>";

	std::string trimmed = Trim(text);
	size_t close = trimmed.find(CLOSE_TAG);
	if (close != std::string::npos) {
		return Trim(trimmed.substr(close + CLOSE_TAG.size()));
	}
	if (trimmed.compare(0, OPEN_TAG.size(), OPEN_TAG) == 0) {
		return std::string();
	}
	return trimmed;
}

} // namespace voxprompt
