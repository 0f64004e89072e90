#pragma once

#include "voxprompt/capture_session.hpp"
#include "voxprompt/inference_engine.hpp"
#include "voxprompt/model_downloader.hpp"
#include "voxprompt/pipeline_orchestrator.hpp"
#include "voxprompt/prompt_optimizer.hpp"
#include "voxprompt/transcription_runner.hpp"
#include "voxprompt/worker_pool.hpp"

#include <memory>

namespace voxprompt {

// One instance of every service, wired to the production backends
// (SDL2 capture, libcurl, llama.cpp, whisper.cpp)
class VoxPromptRuntime {
public:
	static constexpr size_t IO_THREADS = 2;
	static constexpr size_t INFERENCE_THREADS = 1;

	// Created on first use and never destroyed: GPU backends assert when torn
	// down during static destruction
	static VoxPromptRuntime &GetInstance();

	CaptureSession &GetCapture() {
		return capture_;
	}
	InferenceEngine &GetEngine() {
		return engine_;
	}
	ModelDownloader &GetDownloader() {
		return downloader_;
	}
	TranscriptionRunner &GetRunner() {
		return runner_;
	}
	PromptOptimizer &GetOptimizer() {
		return optimizer_;
	}
	PipelineOrchestrator &GetOrchestrator() {
		return orchestrator_;
	}
	WorkerPool &GetIoPool() {
		return io_pool_;
	}

	// Drop cached speech contexts for a model file
	void EvictSpeechModel(const std::string &model_path);

private:
	VoxPromptRuntime();

	WorkerPool io_pool_;
	WorkerPool inference_pool_;
	CaptureSession capture_;
	InferenceEngine engine_;
	ModelDownloader downloader_;
	TranscriptionRunner runner_;
	PromptOptimizer optimizer_;
	PipelineOrchestrator orchestrator_;
};

} // namespace voxprompt
