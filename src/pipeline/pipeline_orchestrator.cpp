#include "voxprompt/pipeline_orchestrator.hpp"
#include "voxprompt/capture_session.hpp"
#include "voxprompt/logger.hpp"
#include "voxprompt/signal_processor.hpp"
#include "voxprompt/worker_pool.hpp"

#include <exception>

namespace voxprompt {

template <class T>
static std::future<T> ReadyFuture(T value) {
	std::promise<T> promise;
	promise.set_value(std::move(value));
	return promise.get_future();
}

PipelineOrchestrator::PipelineOrchestrator(CaptureSession &capture, TranscriptionRunner &runner,
                                           PromptOptimizer &optimizer, WorkerPool &io_pool)
    : capture_(capture), runner_(runner), optimizer_(optimizer), io_pool_(io_pool) {
}

std::future<PipelineResult> PipelineOrchestrator::ProcessCurrentRecordingAsync(const PipelineRequest &request) {
	CapturedAudio audio = capture_.Stop();
	if (audio.samples.empty()) {
		PipelineResult result;
		result.error.Set(ErrorCode::NO_AUDIO_CAPTURED, "No audio samples captured");
		return ReadyFuture(std::move(result));
	}
	return ProcessSamplesAsync(std::move(audio.samples), audio.sample_rate, request);
}

std::future<PipelineResult> PipelineOrchestrator::ProcessSamplesAsync(std::vector<float> samples,
                                                                      uint32_t sample_rate,
                                                                      const PipelineRequest &request) {
	if (samples.empty()) {
		PipelineResult result;
		result.error.Set(ErrorCode::NO_AUDIO_CAPTURED, "No audio samples captured");
		return ReadyFuture(std::move(result));
	}
	auto shared_samples = std::make_shared<std::vector<float>>(std::move(samples));
	return io_pool_.Submit(
	    [this, shared_samples, sample_rate, request]() { return Run(*shared_samples, sample_rate, request); });
}

std::future<TranscriptionResult> PipelineOrchestrator::TranscribeSamplesAsync(std::vector<float> samples,
                                                                              uint32_t sample_rate,
                                                                              const VoxPromptConfig &settings) {
	TranscriptionResult failed;
	std::vector<float> resampled;
	if (!SignalProcessor::Resample(samples, sample_rate, resampled, failed.error)) {
		return ReadyFuture(std::move(failed));
	}
	return runner_.TranscribeAsync(std::move(resampled), settings.whisper_model, settings.language,
	                               settings.GetModelsRoot(), settings.use_gpu);
}

PipelineResult PipelineOrchestrator::Run(const std::vector<float> &samples, uint32_t sample_rate,
                                         const PipelineRequest &request) {
	const VoxPromptConfig &settings = request.settings;
	PipelineResult result;
	result.duration_secs = sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;

	std::vector<float> resampled;
	if (!SignalProcessor::Resample(samples, sample_rate, resampled, result.error)) {
		return result;
	}
	std::vector<float> trimmed = SignalProcessor::TrimSilenceCopy(resampled);
	resampled.clear();
	resampled.shrink_to_fit();

	std::string transcript;
	if (!SignalProcessor::HasSpeech(trimmed) && !settings.force_transcription) {
		VOXPROMPT_LOG_INFO("pipeline", "No speech detected, skipping transcription");
	} else if (!Transcribe(std::move(trimmed), settings, transcript, result.error)) {
		return result;
	}

	if (transcript.empty()) {
		result.error.Set(ErrorCode::NO_SPEECH_DETECTED, "No speech detected in recording");
		return result;
	}

	OptimizationResult optimized = Optimize(transcript, settings);
	result.raw_transcript = transcript;
	result.optimized_prompt = optimized.optimized_prompt;
	result.mode = optimized.mode;
	result.provider = optimized.provider;
	result.degraded = optimized.degraded;
	result.degraded_reason = optimized.degraded_reason;

	if (request.history) {
		HistoryRecord record;
		record.raw_transcript = result.raw_transcript;
		record.optimized_prompt = result.optimized_prompt;
		record.mode = result.mode;
		record.provider = result.provider;
		record.duration_secs = result.duration_secs;
		record.created_at_micros = HistoryRecord::NowMicros();

		VoxError history_error;
		std::string id;
		if (request.history->Append(record, id, history_error)) {
			result.history_id = id;
		} else {
			VOXPROMPT_LOG_WARNING("pipeline", "Failed to save history: " + history_error.ToString());
		}
	}

	result.success = true;
	return result;
}

bool PipelineOrchestrator::Transcribe(std::vector<float> samples16k, const VoxPromptConfig &settings,
                                      std::string &transcript, VoxError &error) {
	std::future<TranscriptionResult> pending = runner_.TranscribeAsync(
	    std::move(samples16k), settings.whisper_model, settings.language, settings.GetModelsRoot(), settings.use_gpu);
	TranscriptionResult transcription;
	try {
		transcription = pending.get();
	} catch (const std::exception &ex) {
		error.Set(ErrorCode::TRANSCRIPTION_ERROR, std::string("Transcription failed: ") + ex.what());
		return false;
	}
	if (!transcription.success) {
		error = transcription.error;
		return false;
	}
	transcript = transcription.text;
	return true;
}

OptimizationResult PipelineOrchestrator::Optimize(const std::string &transcript, const VoxPromptConfig &settings) {
	try {
		return optimizer_.OptimizeAsync(transcript, settings).get();
	} catch (const std::exception &ex) {
		VOXPROMPT_LOG_WARNING("pipeline", std::string("Optimizer threw, using raw transcript: ") + ex.what());
		OptimizationResult fallback;
		fallback.raw_transcript = transcript;
		fallback.optimized_prompt = transcript;
		fallback.mode = settings.prompt_mode;
		fallback.provider = std::string("local (failed: ") + ex.what() + ")";
		fallback.degraded = true;
		fallback.degraded_reason = ex.what();
		return fallback;
	}
}

} // namespace voxprompt
