#include "voxprompt/whisper_context.hpp"
#include "voxprompt/logger.hpp"

#include "whisper.h"

namespace voxprompt {

// Route whisper/ggml output to debug logging
static void WhisperLogCallback(enum ggml_log_level level, const char *text, void *user_data) {
	(void)user_data;
	std::string message(text ? text : "");
	while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
		message.pop_back();
	}
	if (message.empty()) {
		return;
	}
	if (level == GGML_LOG_LEVEL_ERROR) {
		VOXPROMPT_LOG_ERROR("whisper", message);
	} else {
		VOXPROMPT_LOG_DEBUG("whisper", message);
	}
}

static void InstallWhisperLogCallback() {
	static std::once_flag once;
	std::call_once(once, []() { whisper_log_set(WhisperLogCallback, nullptr); });
}

static std::string CacheKey(const std::string &model_path, bool use_gpu) {
	return model_path + (use_gpu ? ":gpu" : ":cpu");
}

WhisperContextHandle::WhisperContextHandle(whisper_context *ctx) : ctx_(ctx) {
}

WhisperContextHandle::~WhisperContextHandle() {
	if (ctx_) {
		whisper_free(ctx_);
		ctx_ = nullptr;
	}
}

WhisperContextCache &WhisperContextCache::GetInstance() {
	// Leaked so contexts are never freed during static destruction, where the
	// Metal backend asserts. The OS reclaims them at exit.
	static WhisperContextCache *instance = new WhisperContextCache();
	return *instance;
}

std::shared_ptr<WhisperContextHandle> WhisperContextCache::GetContext(const std::string &model_path, bool use_gpu,
                                                                      VoxError &error) {
	std::lock_guard<std::mutex> lock(mutex_);
	InstallWhisperLogCallback();

	std::string key = CacheKey(model_path, use_gpu);
	auto it = contexts_.find(key);
	if (it != contexts_.end() && it->second) {
		return it->second;
	}

	whisper_context_params cparams = whisper_context_default_params();
	cparams.use_gpu = use_gpu;

	whisper_context *ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
	if (!ctx) {
		error.Set(ErrorCode::LOAD_ERROR, "Failed to load whisper model from: " + model_path);
		return nullptr;
	}
	VOXPROMPT_LOG_INFO("whisper", "Loaded whisper model: " + key);

	auto handle = std::make_shared<WhisperContextHandle>(ctx);
	contexts_[key] = handle;
	return handle;
}

void WhisperContextCache::ClearContext(const std::string &model_path) {
	std::lock_guard<std::mutex> lock(mutex_);
	contexts_.erase(CacheKey(model_path, true));
	contexts_.erase(CacheKey(model_path, false));
}

bool WhisperRecognizer::Transcribe(const std::string &model_path, const std::vector<float> &samples,
                                   const RecognitionOptions &options, std::string &text,
                                   std::string &detected_language, VoxError &error) {
	auto handle = WhisperContextCache::GetInstance().GetContext(model_path, options.use_gpu, error);
	if (!handle) {
		return false;
	}
	std::lock_guard<std::mutex> lock(handle->GetMutex());
	whisper_context *ctx = handle->Get();

	whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

	// Set language
	if (!options.language.empty() && options.language != "auto") {
		wparams.language = options.language.c_str();
	} else {
		wparams.language = nullptr; // Auto-detect
	}

	wparams.n_threads = options.n_threads;
	wparams.print_progress = false;
	wparams.print_special = false;
	wparams.print_realtime = false;
	wparams.print_timestamps = false;
	wparams.translate = false;
	wparams.single_segment = false;
	wparams.suppress_blank = true;

	int ret = whisper_full(ctx, wparams, samples.data(), static_cast<int>(samples.size()));
	if (ret != 0) {
		error.Set(ErrorCode::TRANSCRIPTION_ERROR, "Whisper transcription failed with code: " + std::to_string(ret));
		return false;
	}

	text.clear();
	int n_segments = whisper_full_n_segments(ctx);
	for (int i = 0; i < n_segments; i++) {
		const char *segment = whisper_full_get_segment_text(ctx, i);
		std::string segment_text = segment ? segment : "";
		// Segments carry their own leading space
		size_t first = segment_text.find_first_not_of(" \t\r\n");
		if (first == std::string::npos) {
			continue;
		}
		segment_text = segment_text.substr(first, segment_text.find_last_not_of(" \t\r\n") - first + 1);
		if (!text.empty()) {
			text += " ";
		}
		text += segment_text;
	}

	const char *lang = whisper_lang_str(whisper_full_lang_id(ctx));
	detected_language = lang ? lang : "";
	return true;
}

} // namespace voxprompt
