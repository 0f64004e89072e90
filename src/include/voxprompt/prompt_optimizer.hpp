#pragma once

#include "voxprompt/voxprompt_config.hpp"
#include "voxprompt/vox_error.hpp"

#include <future>
#include <string>

namespace voxprompt {

class InferenceEngine;
class ModelCatalog;
class WorkerPool;

enum class PromptMode { CLEAN, TECHNICAL, FORMAL, CASUAL, CODE, VERBATIM, RAW, CUSTOM };

struct OptimizationResult {
	std::string raw_transcript;
	std::string optimized_prompt;
	std::string mode;
	std::string provider; // "local", "none", or "local (failed: <reason>)"
	bool degraded;
	std::string degraded_reason;

	OptimizationResult() : degraded(false) {
	}
};

// Rewrites a raw transcript into a prompt with the local language model.
// Never fails: a model or generation problem yields the raw transcript with
// degraded set.
class PromptOptimizer {
public:
	static constexpr const char *CUSTOM_FALLBACK_PROMPT =
	    "Clean up this voice transcript into a clear prompt. Output only the result.";

	PromptOptimizer(InferenceEngine &engine, const ModelCatalog &catalog, WorkerPool &inference_pool);

	OptimizationResult Optimize(const std::string &transcript, const VoxPromptConfig &settings);
	// Runs Optimize on the inference pool
	std::future<OptimizationResult> OptimizeAsync(const std::string &transcript, const VoxPromptConfig &settings);

	// Load settings.llm_model unless the engine already holds that file
	bool EnsureModelLoaded(const VoxPromptConfig &settings, VoxError &error);

	static bool ParsePromptMode(const std::string &name, PromptMode &mode);
	static const char *PromptModeToString(PromptMode mode);
	// Built-in system prompt; empty for RAW and CUSTOM
	static const char *GetSystemPrompt(PromptMode mode);

private:
	InferenceEngine &engine_;
	const ModelCatalog &catalog_;
	WorkerPool &inference_pool_;
};

} // namespace voxprompt
