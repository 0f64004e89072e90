#pragma once

#include "voxprompt/history_store.hpp"
#include "voxprompt/prompt_optimizer.hpp"
#include "voxprompt/transcription_runner.hpp"
#include "voxprompt/voxprompt_config.hpp"
#include "voxprompt/vox_error.hpp"

#include <future>
#include <memory>
#include <string>
#include <vector>

namespace voxprompt {

class CaptureSession;
class WorkerPool;

struct PipelineRequest {
	VoxPromptConfig settings;
	// Optional; history is skipped when null
	std::shared_ptr<HistoryStore> history;
};

struct PipelineResult {
	std::string raw_transcript;
	std::string optimized_prompt;
	std::string mode;
	std::string provider;
	double duration_secs;
	bool degraded;
	std::string degraded_reason;
	std::string history_id; // Empty when nothing was stored
	bool success;
	VoxError error;

	PipelineResult() : duration_secs(0.0), degraded(false), success(false) {
	}
};

// Drives stop -> resample -> trim -> transcribe -> optimize -> persist.
// Coordination runs on the I/O pool; heavy work is handed to the inference
// pool by the runner and the optimizer.
class PipelineOrchestrator {
public:
	PipelineOrchestrator(CaptureSession &capture, TranscriptionRunner &runner, PromptOptimizer &optimizer,
	                     WorkerPool &io_pool);

	// Stops the capture session on the calling thread, then processes the
	// recording asynchronously
	std::future<PipelineResult> ProcessCurrentRecordingAsync(const PipelineRequest &request);

	// Same pipeline over externally supplied mono audio
	std::future<PipelineResult> ProcessSamplesAsync(std::vector<float> samples, uint32_t sample_rate,
	                                                const PipelineRequest &request);

	// Resample and transcribe only; no trimming, no speech gate
	std::future<TranscriptionResult> TranscribeSamplesAsync(std::vector<float> samples, uint32_t sample_rate,
	                                                        const VoxPromptConfig &settings);

private:
	PipelineResult Run(const std::vector<float> &samples, uint32_t sample_rate, const PipelineRequest &request);
	bool Transcribe(std::vector<float> samples16k, const VoxPromptConfig &settings, std::string &transcript,
	                VoxError &error);
	OptimizationResult Optimize(const std::string &transcript, const VoxPromptConfig &settings);

	CaptureSession &capture_;
	TranscriptionRunner &runner_;
	PromptOptimizer &optimizer_;
	WorkerPool &io_pool_;
};

} // namespace voxprompt
