#pragma once

#include "voxprompt/transcription_runner.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

struct whisper_context;

namespace voxprompt {

// RAII wrapper for whisper_context
class WhisperContextHandle {
public:
	explicit WhisperContextHandle(whisper_context *ctx);
	~WhisperContextHandle();

	// Non-copyable
	WhisperContextHandle(const WhisperContextHandle &) = delete;
	WhisperContextHandle &operator=(const WhisperContextHandle &) = delete;

	whisper_context *Get() const {
		return ctx_;
	}

	// A context runs one whisper_full at a time
	std::mutex &GetMutex() {
		return mutex_;
	}

private:
	whisper_context *ctx_;
	std::mutex mutex_;
};

// Loaded whisper models keyed by path and GPU flag
class WhisperContextCache {
public:
	static WhisperContextCache &GetInstance();

	// Get or create a context for the given model
	std::shared_ptr<WhisperContextHandle> GetContext(const std::string &model_path, bool use_gpu, VoxError &error);

	// Drop cached contexts for a model (both GPU and CPU variants)
	void ClearContext(const std::string &model_path);

private:
	WhisperContextCache() = default;

	std::mutex mutex_;
	std::unordered_map<std::string, std::shared_ptr<WhisperContextHandle>> contexts_;
};

// whisper.cpp recognizer: greedy decoding, segments joined with spaces
class WhisperRecognizer : public SpeechRecognizer {
public:
	bool Transcribe(const std::string &model_path, const std::vector<float> &samples, const RecognitionOptions &options,
	                std::string &text, std::string &detected_language, VoxError &error) override;
};

} // namespace voxprompt
