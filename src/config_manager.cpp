#include "config_manager.hpp"
#include "duckdb/common/printer.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/config.hpp"

#include "voxprompt/audio_file_loader.hpp"
#include "voxprompt/logger.hpp"

namespace duckdb {

using voxprompt::VoxPromptConfig;

static void PrinterLogSink(voxprompt::LogLevel level, const char *category, const std::string &message, void *) {
	Printer::Print(OutputStream::STREAM_STDERR, "[voxprompt] " + std::string(voxprompt::Logger::LevelToString(level)) +
	                                                " " + category + ": " + message);
}

void VoxPromptConfigManager::RegisterSettings(DatabaseInstance &db) {
	auto &config = DBConfig::GetConfig(db);

	// Storage
	config.AddExtensionOption("voxprompt_data_path", "Directory holding downloaded models (<path>/models/...)",
	                          LogicalType::VARCHAR, Value(VoxPromptConfig::GetDefaultDataPath()));

	// Capture and transcription
	config.AddExtensionOption("voxprompt_input_device", "Audio input device name (empty = system default)",
	                          LogicalType::VARCHAR, Value(VoxPromptConfig::DEFAULT_INPUT_DEVICE));

	config.AddExtensionOption("voxprompt_whisper_model", "Whisper model id (e.g., tiny, base, small, large-v3-turbo)",
	                          LogicalType::VARCHAR, Value(VoxPromptConfig::DEFAULT_WHISPER_MODEL));

	config.AddExtensionOption("voxprompt_language", "Language code passed to whisper, or 'auto' for detection",
	                          LogicalType::VARCHAR, Value(VoxPromptConfig::DEFAULT_LANGUAGE));

	config.AddExtensionOption("voxprompt_force_transcription", "Transcribe even when no speech was detected",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(VoxPromptConfig::DEFAULT_FORCE_TRANSCRIPTION));

	config.AddExtensionOption("voxprompt_use_gpu", "Use GPU acceleration if available", LogicalType::BOOLEAN,
	                          Value::BOOLEAN(VoxPromptConfig::DEFAULT_USE_GPU));

	// Prompt optimization
	config.AddExtensionOption("voxprompt_prompt_mode",
	                          "Prompt mode: clean, technical, formal, casual, code, verbatim, raw or custom",
	                          LogicalType::VARCHAR, Value(VoxPromptConfig::DEFAULT_PROMPT_MODE));

	config.AddExtensionOption("voxprompt_custom_system_prompt", "System prompt used by the 'custom' prompt mode",
	                          LogicalType::VARCHAR, Value(VoxPromptConfig::DEFAULT_CUSTOM_SYSTEM_PROMPT));

	config.AddExtensionOption("voxprompt_llm_model", "Local language model id used for prompt optimization",
	                          LogicalType::VARCHAR, Value(VoxPromptConfig::DEFAULT_LLM_MODEL));

	// Boundary
	config.AddExtensionOption("voxprompt_timeout", "Seconds a function waits for transcription or optimization",
	                          LogicalType::INTEGER, Value::INTEGER(VoxPromptConfig::DEFAULT_TIMEOUT_SECONDS));

	config.AddExtensionOption("voxprompt_verbose", "Print status messages to stderr", LogicalType::BOOLEAN,
	                          Value::BOOLEAN(VoxPromptConfig::DEFAULT_VERBOSE));
}

VoxPromptConfig VoxPromptConfigManager::GetConfig(ClientContext &context) {
	VoxPromptConfig config;
	Value val;

	if (context.TryGetCurrentSetting("voxprompt_data_path", val) && !val.IsNull()) {
		config.data_path = val.GetValue<string>();
	}
	if (context.TryGetCurrentSetting("voxprompt_input_device", val) && !val.IsNull()) {
		config.input_device = val.GetValue<string>();
	}
	if (context.TryGetCurrentSetting("voxprompt_whisper_model", val) && !val.IsNull()) {
		config.whisper_model = val.GetValue<string>();
	}
	if (context.TryGetCurrentSetting("voxprompt_language", val) && !val.IsNull()) {
		config.language = val.GetValue<string>();
	}
	if (context.TryGetCurrentSetting("voxprompt_force_transcription", val) && !val.IsNull()) {
		config.force_transcription = val.GetValue<bool>();
	}
	if (context.TryGetCurrentSetting("voxprompt_use_gpu", val) && !val.IsNull()) {
		config.use_gpu = val.GetValue<bool>();
	}
	if (context.TryGetCurrentSetting("voxprompt_prompt_mode", val) && !val.IsNull()) {
		config.prompt_mode = val.GetValue<string>();
	}
	if (context.TryGetCurrentSetting("voxprompt_custom_system_prompt", val) && !val.IsNull()) {
		config.custom_system_prompt = val.GetValue<string>();
	}
	if (context.TryGetCurrentSetting("voxprompt_llm_model", val) && !val.IsNull()) {
		config.llm_model = val.GetValue<string>();
	}
	if (context.TryGetCurrentSetting("voxprompt_timeout", val) && !val.IsNull()) {
		config.timeout_seconds = val.GetValue<int32_t>();
	}
	if (context.TryGetCurrentSetting("voxprompt_verbose", val) && !val.IsNull()) {
		config.verbose = val.GetValue<bool>();
	}

	ApplyLogging(config);
	return config;
}

void VoxPromptConfigManager::InstallLogSink() {
	voxprompt::Logger::GetInstance().SetSink(PrinterLogSink);
	voxprompt::AudioFileLoader::SetFFmpegLogging(false);
}

void VoxPromptConfigManager::ApplyLogging(const VoxPromptConfig &config) {
	voxprompt::Logger::GetInstance().SetMinLevel(config.verbose ? voxprompt::LogLevel::LOG_INFO
	                                                            : voxprompt::LogLevel::LOG_WARNING);
}

} // namespace duckdb
