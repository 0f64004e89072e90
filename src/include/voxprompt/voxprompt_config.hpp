#pragma once

#include <string>

namespace voxprompt {

// Plain settings snapshot. Read fresh for every operation, never cached by
// the services it is handed to.
struct VoxPromptConfig {
	// Storage
	std::string data_path; // Root for models (<data_path>/models/<category>)

	// Capture
	std::string input_device; // Empty = system default input

	// Transcription
	std::string whisper_model; // Speech catalog id
	std::string language;      // Language hint passed to the recognizer
	bool force_transcription;  // Transcribe even when no speech was detected
	bool use_gpu;

	// Prompt optimization
	std::string prompt_mode;          // clean, technical, formal, casual, code, verbatim, raw, custom
	std::string custom_system_prompt; // Used by the "custom" mode
	std::string llm_model;            // Language catalog id

	// Boundary
	int timeout_seconds; // How long a SQL call waits for a pipeline result
	bool verbose;

	static constexpr const char *DEFAULT_INPUT_DEVICE = "";
	static constexpr const char *DEFAULT_WHISPER_MODEL = "base";
	static constexpr const char *DEFAULT_LANGUAGE = "en";
	static constexpr const char *DEFAULT_PROMPT_MODE = "clean";
	static constexpr const char *DEFAULT_CUSTOM_SYSTEM_PROMPT = "";
	static constexpr const char *DEFAULT_LLM_MODEL = "qwen3-4b-instruct-q4km";
	static constexpr bool DEFAULT_FORCE_TRANSCRIPTION = false;
	static constexpr bool DEFAULT_USE_GPU = true;
	static constexpr int DEFAULT_TIMEOUT_SECONDS = 300;
	static constexpr bool DEFAULT_VERBOSE = false;

	VoxPromptConfig();

	std::string GetModelsRoot() const;

	// Get default data path based on platform
	static std::string GetDefaultDataPath();
};

} // namespace voxprompt
