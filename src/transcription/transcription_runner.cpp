#include "voxprompt/transcription_runner.hpp"
#include "voxprompt/logger.hpp"
#include "voxprompt/model_catalog.hpp"
#include "voxprompt/model_downloader.hpp"
#include "voxprompt/signal_processor.hpp"
#include "voxprompt/worker_pool.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace voxprompt {

constexpr int TranscriptionRunner::MAX_THREADS;

static std::string Trim(const std::string &text) {
	const char *whitespace = " \t\r\n";
	size_t start = text.find_first_not_of(whitespace);
	if (start == std::string::npos) {
		return std::string();
	}
	size_t end = text.find_last_not_of(whitespace);
	return text.substr(start, end - start + 1);
}

template <class T>
static std::future<T> ReadyFuture(T value) {
	std::promise<T> promise;
	promise.set_value(std::move(value));
	return promise.get_future();
}

TranscriptionRunner::TranscriptionRunner(std::shared_ptr<SpeechRecognizer> recognizer, const ModelCatalog &catalog,
                                         WorkerPool &inference_pool)
    : recognizer_(std::move(recognizer)), catalog_(catalog), inference_pool_(inference_pool) {
}

int TranscriptionRunner::GetThreadCount() {
	int hardware = static_cast<int>(std::thread::hardware_concurrency());
	return std::max(1, std::min(hardware, MAX_THREADS));
}

std::future<TranscriptionResult> TranscriptionRunner::TranscribeAsync(std::vector<float> samples,
                                                                      const std::string &model_id,
                                                                      const std::string &language,
                                                                      const std::string &models_root, bool use_gpu) {
	TranscriptionResult failed;
	std::string model_path;
	if (!ModelDownloader::GetModelPath(catalog_, model_id, models_root, model_path, failed.error)) {
		return ReadyFuture(std::move(failed));
	}
	if (!ModelDownloader::IsModelDownloaded(catalog_, model_id, models_root)) {
		failed.error.Set(ErrorCode::MODEL_NOT_DOWNLOADED, "Whisper model '" + model_id + "' not found. Download it first.");
		return ReadyFuture(std::move(failed));
	}

	RecognitionOptions options;
	options.language = language;
	options.n_threads = GetThreadCount();
	options.use_gpu = use_gpu;

	auto shared_samples = std::make_shared<std::vector<float>>(std::move(samples));
	return inference_pool_.Submit(
	    [this, model_path, shared_samples, options]() { return Run(model_path, *shared_samples, options); });
}

TranscriptionResult TranscriptionRunner::Run(const std::string &model_path, const std::vector<float> &samples,
                                             const RecognitionOptions &options) {
	TranscriptionResult result;
	result.duration_secs = static_cast<double>(samples.size()) / SignalProcessor::TARGET_SAMPLE_RATE;

	auto start = std::chrono::steady_clock::now();
	std::string text;
	std::string detected_language;
	if (!recognizer_->Transcribe(model_path, samples, options, text, detected_language, result.error)) {
		if (!result.error.HasError()) {
			result.error.Set(ErrorCode::TRANSCRIPTION_ERROR, "Transcription failed");
		}
		return result;
	}
	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

	result.text = Trim(text);
	result.language = detected_language.empty() ? options.language : detected_language;
	result.success = true;
	VOXPROMPT_LOG_INFO("transcription", "Transcribed " + std::to_string(samples.size()) + " samples in " +
	                                        std::to_string(elapsed.count()) + "ms");
	return result;
}

} // namespace voxprompt
