#include "voxprompt/prompt_optimizer.hpp"
#include "voxprompt/inference_engine.hpp"
#include "voxprompt/logger.hpp"
#include "voxprompt/model_catalog.hpp"
#include "voxprompt/model_downloader.hpp"
#include "voxprompt/worker_pool.hpp"

#include <algorithm>
#include <cctype>

namespace voxprompt {

constexpr const char *PromptOptimizer::CUSTOM_FALLBACK_PROMPT;

static std::string Trim(const std::string &text) {
	const char *whitespace = " \t\r\n";
	size_t start = text.find_first_not_of(whitespace);
	if (start == std::string::npos) {
		return std::string();
	}
	size_t end = text.find_last_not_of(whitespace);
	return text.substr(start, end - start + 1);
}

PromptOptimizer::PromptOptimizer(InferenceEngine &engine, const ModelCatalog &catalog, WorkerPool &inference_pool)
    : engine_(engine), catalog_(catalog), inference_pool_(inference_pool) {
}

bool PromptOptimizer::ParsePromptMode(const std::string &name, PromptMode &mode) {
	std::string lower = name;
	std::transform(lower.begin(), lower.end(), lower.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (lower == "clean") {
		mode = PromptMode::CLEAN;
	} else if (lower == "technical") {
		mode = PromptMode::TECHNICAL;
	} else if (lower == "formal") {
		mode = PromptMode::FORMAL;
	} else if (lower == "casual") {
		mode = PromptMode::CASUAL;
	} else if (lower == "code") {
		mode = PromptMode::CODE;
	} else if (lower == "verbatim") {
		mode = PromptMode::VERBATIM;
	} else if (lower == "raw") {
		mode = PromptMode::RAW;
	} else if (lower == "custom") {
		mode = PromptMode::CUSTOM;
	} else {
		return false;
	}
	return true;
}

const char *PromptOptimizer::PromptModeToString(PromptMode mode) {
	switch (mode) {
	case PromptMode::CLEAN:
		return "clean";
	case PromptMode::TECHNICAL:
		return "technical";
	case PromptMode::FORMAL:
		return "formal";
	case PromptMode::CASUAL:
		return "casual";
	case PromptMode::CODE:
		return "code";
	case PromptMode::VERBATIM:
		return "verbatim";
	case PromptMode::RAW:
		return "raw";
	case PromptMode::CUSTOM:
		return "custom";
	}
	return "clean";
}

const char *PromptOptimizer::GetSystemPrompt(PromptMode mode) {
	switch (mode) {
	case PromptMode::CLEAN:
		return "You are a prompt optimizer. Your task is to take a rough voice transcript and transform it "
		       "into a clean, well-structured prompt for an AI assistant. "
		       "Rules:\n"
		       "- Remove filler words (um, uh, like, you know, etc.)\n"
		       "- Fix grammar and punctuation\n"
		       "- Preserve the original intent and all details\n"
		       "- Keep the same level of formality as the speaker intended\n"
		       "- Output ONLY the optimized prompt, nothing else\n"
		       "- Do not add any preamble, explanation, or commentary";
	case PromptMode::TECHNICAL:
		return "You are a technical prompt optimizer. Transform the voice transcript into a precise "
		       "technical prompt. "
		       "Rules:\n"
		       "- Remove all filler words and verbal tics\n"
		       "- Use precise technical terminology\n"
		       "- Structure with clear requirements and constraints\n"
		       "- If code is mentioned, format code-related terms properly\n"
		       "- Output ONLY the optimized prompt, nothing else";
	case PromptMode::FORMAL:
		return "You are a formal writing optimizer. Transform the voice transcript into a polished, "
		       "professional prompt. "
		       "Rules:\n"
		       "- Remove all filler words and colloquialisms\n"
		       "- Use formal, professional language\n"
		       "- Structure clearly with proper grammar\n"
		       "- Maintain a business-appropriate tone\n"
		       "- Output ONLY the optimized prompt, nothing else";
	case PromptMode::CASUAL:
		return "You are a casual prompt optimizer. Transform the voice transcript into a clean but "
		       "conversational prompt. "
		       "Rules:\n"
		       "- Remove excessive filler words but keep a natural tone\n"
		       "- Maintain the casual, friendly voice\n"
		       "- Fix obvious grammar issues but don't over-formalize\n"
		       "- Output ONLY the optimized prompt, nothing else";
	case PromptMode::CODE:
		return "You are a code-focused prompt optimizer. Transform the voice transcript into a clear "
		       "coding request. "
		       "Rules:\n"
		       "- Remove all filler words\n"
		       "- Structure as a clear coding task with language, requirements, and constraints\n"
		       "- Identify the programming language mentioned\n"
		       "- List specific requirements as bullet points if multiple are mentioned\n"
		       "- Output ONLY the optimized prompt, nothing else";
	case PromptMode::VERBATIM:
		return "You are a transcript cleaner. Minimally clean the voice transcript. "
		       "Rules:\n"
		       "- Remove only obvious filler words (um, uh, er)\n"
		       "- Fix only clear grammatical errors\n"
		       "- Keep the text as close to the original wording as possible\n"
		       "- Do not rephrase or restructure\n"
		       "- Output ONLY the cleaned transcript, nothing else";
	case PromptMode::RAW:
	case PromptMode::CUSTOM:
		return "";
	}
	return "";
}

bool PromptOptimizer::EnsureModelLoaded(const VoxPromptConfig &settings, VoxError &error) {
	std::string path;
	if (!ModelDownloader::GetModelPath(catalog_, settings.llm_model, settings.GetModelsRoot(), path, error)) {
		return false;
	}
	if (engine_.IsLoaded(path)) {
		return true;
	}
	if (!ModelDownloader::IsModelDownloaded(catalog_, settings.llm_model, settings.GetModelsRoot())) {
		error.Set(ErrorCode::MODEL_NOT_DOWNLOADED,
		          "Local LLM model '" + settings.llm_model + "' not downloaded. Download it with voxprompt_download_model.");
		return false;
	}
	return engine_.Load(path, settings.use_gpu, error);
}

OptimizationResult PromptOptimizer::Optimize(const std::string &transcript, const VoxPromptConfig &settings) {
	OptimizationResult result;

	PromptMode mode;
	if (!ParsePromptMode(settings.prompt_mode, mode)) {
		VOXPROMPT_LOG_WARNING("optimizer", "Unknown prompt mode '" + settings.prompt_mode + "', using clean");
		mode = PromptMode::CLEAN;
	}
	result.mode = PromptModeToString(mode);

	std::string text = Trim(transcript);
	if (text.empty()) {
		result.provider = "none";
		return result;
	}
	result.raw_transcript = text;

	if (mode == PromptMode::RAW) {
		result.optimized_prompt = text;
		result.provider = "none";
		return result;
	}

	std::string system_prompt;
	if (mode == PromptMode::CUSTOM) {
		system_prompt = settings.custom_system_prompt.empty() ? CUSTOM_FALLBACK_PROMPT : settings.custom_system_prompt;
	} else {
		system_prompt = GetSystemPrompt(mode);
	}

	VoxError error;
	std::string optimized;
	bool generated = EnsureModelLoaded(settings, error) && engine_.Generate(system_prompt, text, optimized, error);
	if (generated && Trim(optimized).empty()) {
		error.Set(ErrorCode::GENERATION_ERROR, "Language model returned an empty response");
		generated = false;
	}
	if (!generated) {
		std::string reason = error.message.empty() ? error.ToString() : error.message;
		VOXPROMPT_LOG_WARNING("optimizer", "LLM optimization failed, using raw transcript: " + reason);
		result.optimized_prompt = text;
		result.provider = "local (failed: " + reason + ")";
		result.degraded = true;
		result.degraded_reason = reason;
		return result;
	}

	result.optimized_prompt = Trim(optimized);
	result.provider = "local";
	return result;
}

std::future<OptimizationResult> PromptOptimizer::OptimizeAsync(const std::string &transcript,
                                                               const VoxPromptConfig &settings) {
	return inference_pool_.Submit([this, transcript, settings]() { return Optimize(transcript, settings); });
}

} // namespace voxprompt
