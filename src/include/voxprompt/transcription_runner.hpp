#pragma once

#include "voxprompt/vox_error.hpp"

#include <future>
#include <memory>
#include <string>
#include <vector>

namespace voxprompt {

class ModelCatalog;
class WorkerPool;

struct RecognitionOptions {
	std::string language; // Empty = auto-detect
	int n_threads;
	bool use_gpu;

	RecognitionOptions() : n_threads(1), use_gpu(true) {
	}
};

// Speech-to-text over 16 kHz mono samples
class SpeechRecognizer {
public:
	virtual ~SpeechRecognizer() = default;

	// text is the joined segment text, untrimmed
	virtual bool Transcribe(const std::string &model_path, const std::vector<float> &samples,
	                        const RecognitionOptions &options, std::string &text, std::string &detected_language,
	                        VoxError &error) = 0;
};

struct TranscriptionResult {
	std::string text;
	std::string language;
	double duration_secs;
	bool success;
	VoxError error;

	TranscriptionResult() : duration_secs(0.0), success(false) {
	}
};

// Resolves speech models and runs the recognizer on the inference pool
class TranscriptionRunner {
public:
	static constexpr int MAX_THREADS = 4;

	TranscriptionRunner(std::shared_ptr<SpeechRecognizer> recognizer, const ModelCatalog &catalog,
	                    WorkerPool &inference_pool);

	// samples must already be 16 kHz mono. The model file is checked before
	// anything is queued.
	std::future<TranscriptionResult> TranscribeAsync(std::vector<float> samples, const std::string &model_id,
	                                                 const std::string &language, const std::string &models_root,
	                                                 bool use_gpu = true);

	// min(hardware threads, MAX_THREADS), at least 1
	static int GetThreadCount();

private:
	TranscriptionResult Run(const std::string &model_path, const std::vector<float> &samples,
	                        const RecognitionOptions &options);

	std::shared_ptr<SpeechRecognizer> recognizer_;
	const ModelCatalog &catalog_;
	WorkerPool &inference_pool_;
};

} // namespace voxprompt
